// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Copyright (c) 2026 The Rhiza developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>

namespace rhiza::logging {
    auto to_string(log_level level) -> std::string {
        switch(level) {
            case log_level::trace:
                return "TRACE";
            case log_level::debug:
                return "DEBUG";
            case log_level::info:
                return "INFO ";
            case log_level::warn:
                return "WARN ";
            case log_level::error:
                return "ERROR";
        }
        return "NONE ";
    }

    auto parse_loglevel(const std::string& level) -> std::optional<log_level> {
        for(auto lvl : {log_level::trace,
                        log_level::debug,
                        log_level::info,
                        log_level::warn,
                        log_level::error}) {
            auto name = to_string(lvl);
            name.erase(name.find_last_not_of(' ') + 1);
            if(name == level) {
                return lvl;
            }
        }
        return std::nullopt;
    }

    log::log(log_level level) : log(level, std::cout) {}

    log::log(log_level level, std::ostream& sink)
        : m_level(level),
          m_sink(&sink) {}

    log::log(log_level level, const std::string& logfile)
        : m_level(level),
          m_file(std::make_unique<std::ofstream>(logfile, std::ios::app)),
          m_sink(m_file.get()) {}

    void log::set_loglevel(log_level level) {
        std::unique_lock<std::mutex> l(m_mut);
        m_level = level;
    }

    auto log::get_log_level() const -> log_level {
        std::unique_lock<std::mutex> l(m_mut);
        return m_level;
    }

    void log::set_tag(std::string tag) {
        std::unique_lock<std::mutex> l(m_mut);
        m_tag = std::move(tag);
    }

    auto log::enabled(log_level level) const -> bool {
        return get_log_level() <= level;
    }

    void log::flush() {
        std::unique_lock<std::mutex> l(m_mut);
        m_sink->flush();
    }

    auto log::prefix(log_level level) const -> std::string {
        static constexpr int msec_per_sec = 1000;
        const auto now = std::chrono::system_clock::now();
        const auto now_t = std::chrono::system_clock::to_time_t(now);
        const auto msec
            = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch())
                  .count()
            % msec_per_sec;
        std::tm local_tm{};
        localtime_r(&now_t, &local_tm);

        std::stringstream ss;
        ss << std::put_time(&local_tm, "[%Y-%m-%d %H:%M:%S.")
           << std::setfill('0') << std::setw(3) << msec << "] ["
           << to_string(level) << "]";
        std::unique_lock<std::mutex> l(m_mut);
        if(!m_tag.empty()) {
            ss << " [" << m_tag << "]";
        }
        return ss.str();
    }
}
