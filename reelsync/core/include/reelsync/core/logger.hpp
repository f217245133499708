/**
 * @file logger.hpp
 * @brief Process-wide spdlog logger and LOG_* macros
 *
 * getLogger() installs a console-only "reelsync" logger on first use,
 * so library code and tests may log before initLogging() runs.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace reelsync {

/**
 * @brief Install the ReelSync logger
 *
 * @param appName Logger name shown in every line
 * @param level Minimum level for all sinks
 * @param logFile Rotating log file next to the console; empty for none
 */
void initLogging(const std::string& appName,
                 spdlog::level::level_enum level = spdlog::level::info,
                 const std::string& logFile = "");

std::shared_ptr<spdlog::logger> getLogger();

/// Applies to the logger and every sink
void setLogLevel(spdlog::level::level_enum level);

/// spdlog level names plus "warning"; anything else is info
spdlog::level::level_enum parseLogLevel(const std::string& name);

} // namespace reelsync

#define LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(reelsync::getLogger(), __VA_ARGS__)
#define LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(reelsync::getLogger(), __VA_ARGS__)
#define LOG_INFO(...)     SPDLOG_LOGGER_INFO(reelsync::getLogger(), __VA_ARGS__)
#define LOG_WARN(...)     SPDLOG_LOGGER_WARN(reelsync::getLogger(), __VA_ARGS__)
#define LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(reelsync::getLogger(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(reelsync::getLogger(), __VA_ARGS__)
