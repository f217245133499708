/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include <reelsync/core/logger.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <mutex>
#include <vector>

namespace reelsync {

static std::shared_ptr<spdlog::logger> s_logger;
static std::mutex s_loggerMutex;

void initLogging(const std::string& appName, spdlog::level::level_enum level,
                 const std::string& logFile) {
    std::lock_guard lock(s_loggerMutex);

    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(level);
    sinks.push_back(console_sink);

    if (!logFile.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, 1024 * 1024 * 10, 3);  // 10MB, 3 files
            file_sink->set_level(level);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log file initialization failed: " << ex.what() << std::endl;
        }
    }

    s_logger = std::make_shared<spdlog::logger>(appName, sinks.begin(), sinks.end());
    s_logger->set_level(level);
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

    spdlog::set_default_logger(s_logger);
}

std::shared_ptr<spdlog::logger> getLogger() {
    {
        std::lock_guard lock(s_loggerMutex);
        if (s_logger) {
            return s_logger;
        }
    }
    initLogging("reelsync");
    std::lock_guard lock(s_loggerMutex);
    return s_logger;
}

void setLogLevel(spdlog::level::level_enum level) {
    std::lock_guard lock(s_loggerMutex);
    if (s_logger) {
        s_logger->set_level(level);
        for (auto& sink : s_logger->sinks()) {
            sink->set_level(level);
        }
    }
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace reelsync
