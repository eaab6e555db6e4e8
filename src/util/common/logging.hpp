// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
#ifndef TICKETLOCK_SRC_UTIL_COMMON_LOGGING_H_
#define TICKETLOCK_SRC_UTIL_COMMON_LOGGING_H_

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace ticketlock::logging {
    /// Discards everything written to it. Default logfile destination.
    class null_stream : public std::ostream {
      public:
        null_stream();

        template<typename T>
        auto operator<<(const T& /* unused */) -> null_stream& {
            return *this;
        }
    };

    /// Log severity. A log configured at a level prints statements at that
    /// level or above.
    enum class log_level : uint8_t {
        /// Every protocol step and state transition.
        trace,
        /// Diagnostic information.
        debug,
        /// Progress and results of checker runs.
        info,
        /// Contract violations and other caller errors.
        warn,
        /// Invariant violations.
        error,
        /// Unrecoverable conditions. Terminates the program.
        fatal
    };

    /// Thread-safe logger writing to stdout and/or a logfile stream.
    class log {
      public:
        /// Constructor.
        /// \param level minimum level to print.
        /// \param use_stdout true to print to stdout.
        /// \param logfile additional output stream. Discards output by
        ///                default.
        explicit log(log_level level,
                     bool use_stdout = true,
                     std::unique_ptr<std::ostream> logfile
                     = std::make_unique<null_stream>());

        /// Enables or disables stdout output.
        void set_stdout_enabled(bool stdout_enabled);

        /// Replaces the logfile output stream.
        void set_logfile(std::unique_ptr<std::ostream> logfile);

        /// Changes the minimum level to print.
        void set_loglevel(log_level level);

        /// Sets a component tag printed after the level in every statement.
        /// An empty tag disables it. Safe to call while other threads log.
        void set_tag(std::string tag);

        /// Flushes stdout.
        static void flush();

        template<typename... Targs>
        void trace(Targs&&... args) {
            write_log_statement(log_level::trace,
                                std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void debug(Targs&&... args) {
            write_log_statement(log_level::debug,
                                std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void info(Targs&&... args) {
            write_log_statement(log_level::info, std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void warn(Targs&&... args) {
            write_log_statement(log_level::warn, std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void error(Targs&&... args) {
            write_log_statement(log_level::error,
                                std::forward<Targs>(args)...);
        }

        /// Writes the argument list at fatal level and exits with
        /// EXIT_FAILURE.
        template<typename... Targs>
        [[noreturn]] void fatal(Targs&&... args) {
            write_log_statement(log_level::fatal,
                                std::forward<Targs>(args)...);
            flush();
            std::exit(EXIT_FAILURE);
        }

        /// Returns the current minimum level.
        [[nodiscard]] auto get_log_level() const -> log_level;

        /// Returns true if statements at the given level would be printed.
        /// Lets callers skip building expensive arguments.
        [[nodiscard]] auto enabled(log_level level) const -> bool;

      private:
        bool m_stdout{true};
        log_level m_loglevel{};
        std::string m_tag;
        mutable std::mutex m_tag_mut{};
        std::mutex m_stream_mut{};
        std::unique_ptr<std::ostream> m_logfile;

        void write_log_prefix(std::stringstream& ss, log_level level) const;

        template<typename... Targs>
        void write_log_statement(log_level level, Targs&&... args) {
            if(m_loglevel <= level) {
                std::stringstream ss;
                write_log_prefix(ss, level);
                ((ss << " " << args), ...);
                ss << "\n";
                auto formatted_statement = ss.str();
                const std::lock_guard<std::mutex> lock(m_stream_mut);
                if(m_stdout) {
                    std::cout << formatted_statement;
                }
                *m_logfile << formatted_statement;
            }
        }
    };

    /// Returns the fixed-width upper-case name of a log level.
    auto to_string(log_level level) -> std::string;

    /// \brief Parses an upper-case level name into a log level.
    ///
    /// Accepts TRACE, DEBUG, INFO, WARN, ERROR and FATAL.
    /// \param level level name.
    /// \return the log level, or std::nullopt for an unknown name.
    auto parse_loglevel(const std::string& level) -> std::optional<log_level>;
}

#endif // TICKETLOCK_SRC_UTIL_COMMON_LOGGING_H_
