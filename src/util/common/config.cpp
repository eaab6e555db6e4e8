// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace ticketlock::config {
    namespace {
        auto read_mode(const parser& cfg, options& opts)
            -> std::optional<std::string> {
            const auto mode = cfg.get_string(mode_key).value_or(all_mode);
            if(mode == all_mode) {
                opts.m_explore = true;
                opts.m_random = true;
                opts.m_stress = true;
            } else if(mode == explore_mode) {
                opts.m_explore = true;
                opts.m_random = false;
                opts.m_stress = false;
            } else if(mode == random_mode) {
                opts.m_explore = false;
                opts.m_random = true;
                opts.m_stress = false;
            } else if(mode == stress_mode) {
                opts.m_explore = false;
                opts.m_random = false;
                opts.m_stress = true;
            } else {
                return "Unknown " + std::string(mode_key) + " \"" + mode
                     + "\"";
            }
            return std::nullopt;
        }

        auto read_flag(const parser& cfg, const std::string& key, bool& flag)
            -> std::optional<std::string> {
            const auto val = cfg.get_ulong(key);
            if(!val.has_value()) {
                return std::nullopt;
            }
            if(val.value() > 1) {
                return key + " must be 0 or 1";
            }
            flag = val.value() == 1;
            return std::nullopt;
        }

        auto read_parsed(const parser& cfg)
            -> std::variant<options, std::string> {
            if(!cfg.good()) {
                return "Unable to open config file";
            }
            if(!cfg.errors().empty()) {
                return "Malformed value for " + cfg.errors().front();
            }

            auto opts = options{};

            opts.m_participant_count = cfg.get_ulong(participant_count_key)
                                           .value_or(opts.m_participant_count);
            opts.m_ticket_bound
                = cfg.get_ulong(ticket_bound_key).value_or(opts.m_ticket_bound);
            opts.m_state_limit
                = cfg.get_ulong(state_limit_key).value_or(opts.m_state_limit);
            opts.m_trial_count
                = cfg.get_ulong(trial_count_key).value_or(opts.m_trial_count);
            opts.m_step_count
                = cfg.get_ulong(step_count_key).value_or(opts.m_step_count);
            opts.m_seed = cfg.get_ulong(seed_key).value_or(opts.m_seed);
            opts.m_stress_thread_count = cfg.get_ulong(stress_thread_count_key)
                                             .value_or(opts.m_stress_thread_count);
            opts.m_stress_iterations = cfg.get_ulong(stress_iterations_key)
                                           .value_or(opts.m_stress_iterations);

            auto err = read_flag(cfg,
                                 symmetry_reduction_key,
                                 opts.m_symmetry_reduction);
            if(err.has_value()) {
                return err.value();
            }

            if(cfg.get_string(loglevel_key).has_value()) {
                const auto level = cfg.get_loglevel(loglevel_key);
                if(!level.has_value()) {
                    return "Unknown " + std::string(loglevel_key) + " \""
                         + cfg.get_string(loglevel_key).value() + "\"";
                }
                opts.m_loglevel = level.value();
            }

            err = read_mode(cfg, opts);
            if(err.has_value()) {
                return err.value();
            }

            return opts;
        }
    }

    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        const auto cfg = parser(config_file);
        return read_parsed(cfg);
    }

    auto read_options(std::istream& stream)
        -> std::variant<options, std::string> {
        const auto cfg = parser(stream);
        return read_parsed(cfg);
    }

    auto check_options(const options& opts) -> std::optional<std::string> {
        if(opts.m_participant_count < 1) {
            return "Must have at least one participant";
        }

        if(opts.m_explore && opts.m_ticket_bound < 1) {
            return std::string(ticket_bound_key) + " must be at least 1";
        }

        if(opts.m_random) {
            if(opts.m_trial_count < 1) {
                return std::string(trial_count_key) + " must be at least 1";
            }
            if(opts.m_step_count < 1) {
                return std::string(step_count_key) + " must be at least 1";
            }
        }

        if(opts.m_stress) {
            if(opts.m_stress_thread_count < 1) {
                return "Must have at least one stress thread";
            }
            if(opts.m_stress_thread_count > opts.m_participant_count) {
                return "Number of stress threads must not exceed "
                       "participant count";
            }
        }

        return std::nullopt;
    }

    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        auto opt = read_options(config_file);
        if(std::holds_alternative<options>(opt)) {
            auto& opts = std::get<options>(opt);
            auto err = check_options(opts);
            if(err.has_value()) {
                return err.value();
            }
        }
        return opt;
    }

    auto get_args(int argc, char** argv) -> std::vector<std::string> {
        auto args = std::vector<char*>(static_cast<size_t>(argc));
        std::memcpy(args.data(),
                    argv,
                    static_cast<size_t>(argc) * sizeof(argv));
        auto ret = std::vector<std::string>();
        ret.reserve(static_cast<size_t>(argc));
        for(auto* arg : args) {
            auto str = std::string(arg);
            ret.emplace_back(std::move(str));
        }
        return ret;
    }

    parser::parser(const std::string& filename) {
        std::ifstream file(filename);
        if(!file.good()) {
            m_good = false;
            return;
        }

        init(file);
    }

    parser::parser(std::istream& stream) {
        init(stream);
    }

    void parser::init(std::istream& stream) {
        std::string line;
        while(std::getline(stream, line)) {
            if(line.empty() || line[0] == '#') {
                continue;
            }
            std::istringstream line_stream(line);
            std::string key;
            if(std::getline(line_stream, key, '=')) {
                std::string value;
                if(!std::getline(line_stream, value)) {
                    m_errors.emplace_back(key);
                    continue;
                }
                auto parsed = parse_value(value);
                if(!parsed.has_value()) {
                    m_errors.emplace_back(key);
                    continue;
                }
                m_options.emplace(key, std::move(parsed.value()));
            }
        }
    }

    auto parser::good() const -> bool {
        return m_good;
    }

    auto parser::errors() const -> const std::vector<std::string>& {
        return m_errors;
    }

    auto parser::get_string(const std::string& key) const
        -> std::optional<std::string> {
        return get_val<std::string>(key);
    }

    auto parser::get_ulong(const std::string& key) const
        -> std::optional<size_t> {
        return get_val<size_t>(key);
    }

    auto parser::get_loglevel(const std::string& key) const
        -> std::optional<logging::log_level> {
        const auto val_str = get_string(key);
        if(!val_str.has_value()) {
            return std::nullopt;
        }
        return logging::parse_loglevel(val_str.value());
    }

    auto parser::get_decimal(const std::string& key) const
        -> std::optional<double> {
        return get_val<double>(key);
    }

    auto parser::find_or_env(const std::string& key) const
        -> std::optional<value_t> {
        auto upper_key = key;
        std::transform(upper_key.begin(),
                       upper_key.end(),
                       upper_key.begin(),
                       [](unsigned char c) {
                           return std::toupper(c);
                       });
        if(const auto* env_v = std::getenv(upper_key.c_str())) {
            auto value = std::string(env_v);
            return parse_value(value);
        }

        auto it = m_options.find(key);
        if(it != m_options.end()) {
            return it->second;
        }

        return std::nullopt;
    }

    auto parser::parse_value(const std::string& value)
        -> std::optional<value_t> {
        if(value.empty()) {
            return std::nullopt;
        }

        if(value[0] == '\"') {
            if(value.size() < 2 || value[value.size() - 1] != '\"') {
                return std::nullopt;
            }
            const auto unquoted = value.substr(1, value.size() - 2);
            return unquoted;
        }

        // Numbers must be consumed in full, so "12x" is rejected.
        const auto* begin = value.c_str();
        char* end{};
        if(value.find('.') == std::string::npos) {
            if(!std::isdigit(static_cast<unsigned char>(value[0]))) {
                return std::nullopt;
            }
            errno = 0;
            const auto as_int = std::strtoull(begin, &end, 10);
            if(errno != 0 || *end != '\0') {
                return std::nullopt;
            }
            return static_cast<size_t>(as_int);
        }

        errno = 0;
        const auto as_dbl = std::strtod(begin, &end);
        if(errno != 0 || end == begin || *end != '\0') {
            return std::nullopt;
        }
        return as_dbl;
    }
}
