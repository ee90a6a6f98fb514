// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RHIZA_SRC_COMMON_LOGGING_H_
#define RHIZA_SRC_COMMON_LOGGING_H_

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace rhiza::logging {
    /// Severity of a log statement. A log prints statements at its
    /// configured level and above.
    enum class log_level : uint8_t {
        /// Per-message detail such as pings.
        trace,
        /// Admissions and other routine ledger activity.
        debug,
        /// Genesis, key material and rewards.
        info,
        /// Rejected transactions and invalid gossip.
        warn,
        /// Failures the node cannot recover from on its own.
        error
    };

    /// Returns the five-character label printed for a level.
    auto to_string(log_level level) -> std::string;

    /// \brief Parses an upper-case level name.
    ///
    /// Accepts TRACE, DEBUG, INFO, WARN and ERROR.
    /// \return the level, or std::nullopt for any other input.
    auto parse_loglevel(const std::string& level) -> std::optional<log_level>;

    /// \brief Thread-safe line logger.
    ///
    /// Each statement is one line: a local timestamp with milliseconds,
    /// the level, the tag if one is set, then the arguments separated by
    /// spaces.
    class log {
      public:
        /// Logs to standard output.
        explicit log(log_level level);

        /// Logs to a caller-owned stream.
        /// \param level minimum level to print.
        /// \param sink destination. Must outlive the log.
        log(log_level level, std::ostream& sink);

        /// Appends to a file, creating it if needed.
        /// \param level minimum level to print.
        /// \param logfile path of the file.
        log(log_level level, const std::string& logfile);

        ~log() = default;

        log(const log&) = delete;
        auto operator=(const log&) -> log& = delete;
        log(log&&) = delete;
        auto operator=(log&&) -> log& = delete;

        void set_loglevel(log_level level);
        [[nodiscard]] auto get_log_level() const -> log_level;

        /// Sets a tag printed after the level in every statement, usually
        /// the node name. An empty tag prints nothing.
        void set_tag(std::string tag);

        /// Indicates whether statements at the given level are printed.
        [[nodiscard]] auto enabled(log_level level) const -> bool;

        /// Flushes the sink.
        void flush();

        template<typename... Targs>
        void trace(Targs&&... args) {
            write(log_level::trace, std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void debug(Targs&&... args) {
            write(log_level::debug, std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void info(Targs&&... args) {
            write(log_level::info, std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void warn(Targs&&... args) {
            write(log_level::warn, std::forward<Targs>(args)...);
        }

        template<typename... Targs>
        void error(Targs&&... args) {
            write(log_level::error, std::forward<Targs>(args)...);
        }

      private:
        log_level m_level;
        std::unique_ptr<std::ofstream> m_file;
        std::ostream* m_sink;
        mutable std::mutex m_mut;
        std::string m_tag;

        [[nodiscard]] auto prefix(log_level level) const -> std::string;

        template<typename... Targs>
        void write(log_level level, Targs&&... args) {
            if(!enabled(level)) {
                return;
            }
            std::stringstream ss;
            ss << prefix(level);
            ((ss << " " << args), ...);
            ss << "\n";
            const auto line = ss.str();
            std::unique_lock<std::mutex> l(m_mut);
            *m_sink << line;
        }
    };
}

#endif // RHIZA_SRC_COMMON_LOGGING_H_
