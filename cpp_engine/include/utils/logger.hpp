/**
 * Lightweight logger shared by the engine, the intake boundary and the CLI.
 * Safe to call from concurrent request handlers; lines never interleave.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace parlay::utils {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "LOG";
    }
}

inline std::atomic<int> &min_level_storage() {
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}

inline void set_min_level(LogLevel level) { min_level_storage().store(static_cast<int>(level)); }

inline void log(LogLevel level, const std::string &message) {
    if (static_cast<int>(level) < min_level_storage().load()) {
        return;
    }
    using clock = std::chrono::system_clock;
    const auto now = clock::to_time_t(clock::now());
    std::tm tm_buf{};
#if defined(_MSC_VER)
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    std::stringstream ss;
    ss << "[" << std::put_time(&tm_buf, "%F %T") << "][" << level_to_string(level) << "] " << message << '\n';

    static std::mutex sink_mu;
    std::lock_guard<std::mutex> guard(sink_mu);
    std::cerr << ss.str() << std::flush;
}

inline void debug(const std::string &msg) { log(LogLevel::Debug, msg); }
inline void info(const std::string &msg) { log(LogLevel::Info, msg); }
inline void warn(const std::string &msg) { log(LogLevel::Warn, msg); }
inline void error(const std::string &msg) { log(LogLevel::Error, msg); }

}  // namespace parlay::utils
