#pragma once

#include <string>
#include "spdlog/spdlog.h"

namespace spcode {

    enum class LogLevel {
        Debug,
        Info,
        Warn,
        Error
    };

    /// "debug" | "info" | "warn" | "error" (case-insensitive), anything else -> Info
    LogLevel parseLogLevel(const std::string& s);

    class Logger {
    public:
        /// An empty log_file logs to stdout.
        static void init(const std::string& log_file, LogLevel level = LogLevel::Info);

        template<typename... Args>
        static void debug(fmt::format_string<Args...> fmt, Args&&... args) {
            spdlog::debug(std::move(fmt), std::forward<Args>(args)...);
        }
        template<typename... Args>
        static void info(fmt::format_string<Args...> fmt, Args&&... args) {
            spdlog::info(std::move(fmt), std::forward<Args>(args)...);
        }

        static void debug(const std::string& msg);
        static void info(const std::string& msg);
        static void warn(const std::string& msg);
        static void error(const std::string& msg);
    };

} // namespace spcode
