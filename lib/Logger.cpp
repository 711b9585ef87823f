#include "Logger.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace spcode {

    LogLevel parseLogLevel(const std::string& s) {
        std::string l = s;
        std::transform(l.begin(), l.end(), l.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (l == "debug") return LogLevel::Debug;
        if (l == "warn" || l == "warning") return LogLevel::Warn;
        if (l == "error") return LogLevel::Error;
        return LogLevel::Info;
    }

    void Logger::init(const std::string& log_file, LogLevel level) {
        try {
            // re-init replaces the previous logger of the same name
            if (auto existing = spdlog::get("spcode"); existing) {
                spdlog::drop("spcode");
            }
            std::shared_ptr<spdlog::logger> logger;
            if (log_file.empty())
                logger = spdlog::stdout_color_mt("spcode");
            else
                logger = spdlog::basic_logger_mt("spcode", log_file);
            spdlog::set_default_logger(logger);
            switch (level) {
            case LogLevel::Debug: spdlog::set_level(spdlog::level::debug); break;
            case LogLevel::Info:  spdlog::set_level(spdlog::level::info);  break;
            case LogLevel::Warn:  spdlog::set_level(spdlog::level::warn);  break;
            case LogLevel::Error: spdlog::set_level(spdlog::level::err);   break;
            }
            spdlog::flush_on(spdlog::level::info);
        }
        catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    void Logger::debug(const std::string& msg) {
        spdlog::debug(msg);
    }

    void Logger::info(const std::string& msg) {
        spdlog::info(msg);
    }

    void Logger::warn(const std::string& msg) {
        spdlog::warn(msg);
    }

    void Logger::error(const std::string& msg) {
        spdlog::error(msg);
    }

} // namespace spcode
