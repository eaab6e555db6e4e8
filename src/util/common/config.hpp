// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
//               2022 MITRE Corporation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file config.hpp
 * Tools for reading checker options from a configuration file.
 */

#ifndef TICKETLOCK_SRC_UTIL_COMMON_CONFIG_H_
#define TICKETLOCK_SRC_UTIL_COMMON_CONFIG_H_

#include "logging.hpp"

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ticketlock::config {
    namespace defaults {
        static constexpr size_t participant_count{3};
        static constexpr uint64_t ticket_bound{6};
        static constexpr size_t trial_count{1000};
        static constexpr size_t step_count{200};
        static constexpr uint64_t seed{1};
        static constexpr bool symmetry_reduction{true};
        static constexpr size_t state_limit{0};
        static constexpr size_t stress_thread_count{4};
        static constexpr size_t stress_iterations{10000};

        static constexpr auto log_level = logging::log_level::warn;
    }

    static constexpr auto participant_count_key = "participant_count";
    static constexpr auto ticket_bound_key = "ticket_bound";
    static constexpr auto trial_count_key = "trial_count";
    static constexpr auto step_count_key = "step_count";
    static constexpr auto seed_key = "seed";
    static constexpr auto symmetry_reduction_key = "symmetry_reduction";
    static constexpr auto state_limit_key = "state_limit";
    static constexpr auto stress_thread_count_key = "stress_thread_count";
    static constexpr auto stress_iterations_key = "stress_iterations";
    static constexpr auto loglevel_key = "loglevel";
    static constexpr auto mode_key = "mode";

    static constexpr auto explore_mode = "explore";
    static constexpr auto random_mode = "random";
    static constexpr auto stress_mode = "stress";
    static constexpr auto all_mode = "all";

    /// Parameters for a checker run.
    struct options {
        /// Number of participants contending for the lock.
        size_t m_participant_count{defaults::participant_count};
        /// Exhaustive exploration stops issuing tickets at this value.
        uint64_t m_ticket_bound{defaults::ticket_bound};
        /// Store explored states up to participant permutation.
        bool m_symmetry_reduction{defaults::symmetry_reduction};
        /// Maximum number of explored states, zero for no limit.
        size_t m_state_limit{defaults::state_limit};
        /// Number of randomized trials.
        size_t m_trial_count{defaults::trial_count};
        /// Participant choices per randomized trial.
        size_t m_step_count{defaults::step_count};
        /// Base seed for randomized trials.
        uint64_t m_seed{defaults::seed};
        /// Number of threads contending in the stress run.
        size_t m_stress_thread_count{defaults::stress_thread_count};
        /// Lock acquisitions per thread in the stress run.
        size_t m_stress_iterations{defaults::stress_iterations};
        /// Log level of the checker.
        logging::log_level m_loglevel{defaults::log_level};
        /// Run the exhaustive explorer.
        bool m_explore{true};
        /// Run the randomized scheduler.
        bool m_random{true};
        /// Run the threaded stress test.
        bool m_stress{true};
    };

    /// Read options from the given config file without checking invariants.
    /// \param config_file the path to the config file from which to load
    ///                    options.
    /// \return options struct, or string with error message on failure.
    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Read options from a stream without checking invariants.
    /// \param stream config file contents.
    /// \return options struct, or string with error message on failure.
    auto read_options(std::istream& stream)
        -> std::variant<options, std::string>;

    /// Loads options from the given config file and check for invariants.
    /// \param config_file the path to the config file from which load options.
    /// \return valid options struct, or string with error message on failure.
    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Checks a fully populated options struct for invariants.
    /// \param opts options struct to check.
    /// \return std::nullopt if the struct satisfies all invariants. Error
    ///         string otherwise.
    auto check_options(const options& opts) -> std::optional<std::string>;

    /// Converts c-args from an executable's main function into a vector of
    /// strings.
    auto get_args(int argc, char** argv) -> std::vector<std::string>;

    /// Reads configuration parameters line-by-line from a file. Expects a file
    /// of line-separated parameters with each line in the form key=value,
    /// where the key is a lower-case string that may contain numbers and
    /// symbols. Acceptable value types:
    /// - Strings: quoted with double quotes. Ex: mode="explore"
    /// - Integers: standalone numbers. Ex: participant_count=3
    /// - Doubles: a number with a decimal point. Ex: some_double=12.4
    /// - Log levels: in the form of a string. Must be one of the log levels
    ///   enumerated in logging.hpp, in upper-case. Ex: loglevel="TRACE"
    ///
    /// Empty lines and lines starting with '#' are skipped. Config file
    /// values are overridden by environment variables named after the
    /// upper-case key. For example, trial_count=1000 in the file is
    /// overridden by TRIAL_COUNT=50. String values supplied through
    /// environment variables must be quoted, e.g. MODE='"random"'.
    class parser {
      public:
        /// Constructor.
        /// \param filename path to the config file to read.
        explicit parser(const std::string& filename);

        /// Constructor.
        /// \param stream the generic stream used to add config values.
        explicit parser(std::istream& stream);

        /// Returns false if the config file could not be opened.
        [[nodiscard]] auto good() const -> bool;

        /// Returns the given key if its value is a string.
        /// \param key key to retrieve.
        /// \return value associated with the key or std::nullopt if the value
        ///         was not a string or does not exist.
        [[nodiscard]] auto get_string(const std::string& key) const
            -> std::optional<std::string>;

        /// Return the value for the given key if its value is a long.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was not a long or doesn't exist.
        [[nodiscard]] auto get_ulong(const std::string& key) const
            -> std::optional<size_t>;

        /// Return the value for the given key if its value is a loglevel.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was not a loglevel or does not exist.
        [[nodiscard]] auto get_loglevel(const std::string& key) const
            -> std::optional<logging::log_level>;

        /// Return the value for the given key if its value is a double.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was not a double or does not exist.
        [[nodiscard]] auto get_decimal(const std::string& key) const
            -> std::optional<double>;

        /// Returns the keys of malformed lines or values, in file order.
        [[nodiscard]] auto errors() const -> const std::vector<std::string>&;

      private:
        using value_t = std::variant<std::string, size_t, double>;

        [[nodiscard]] auto find_or_env(const std::string& key) const
            -> std::optional<value_t>;

        template<typename T>
        [[nodiscard]] auto get_val(const std::string& key) const
            -> std::optional<T> {
            const auto it = find_or_env(key);
            if(it) {
                const auto* val = std::get_if<T>(&it.value());
                if(val != nullptr) {
                    return *val;
                }
            }

            return std::nullopt;
        }

        void init(std::istream& stream);

        [[nodiscard]] static auto parse_value(const std::string& val)
            -> std::optional<value_t>;

        bool m_good{true};
        std::map<std::string, value_t> m_options;
        std::vector<std::string> m_errors;
    };
}

#endif // TICKETLOCK_SRC_UTIL_COMMON_CONFIG_H_
