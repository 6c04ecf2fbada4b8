#pragma once

/// @file logging.h
/// @brief Process-wide spdlog logger for drifter
///
/// Diagnostics always go to stderr; stdout is reserved for report output.
/// The logger is created lazily on first use, so library code may log
/// before (or without) an explicit InitLogging() call.

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace drifter {

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logging configuration
struct LogConfig {
    std::string name = "drifter";
    LogLevel level = LogLevel::kInfo;

    /// Thread id is included since columns are evaluated on pool workers
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] [%t] %v";

    /// Optional rotating file copy of the stderr output
    bool enable_file = false;
    std::string file_path = "drifter.log";
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 3;
};

/// @brief Create the global logger. Only the first call (explicit or
///        through GetLogger()) takes effect.
void InitLogging(const LogConfig& config = {});

std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Change the level of the logger and all of its sinks
void SetLogLevel(LogLevel level);

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error",
///        "critical", "off"); unknown names map to kInfo
LogLevel ParseLogLevel(std::string_view name);

std::string_view LogLevelToString(LogLevel level);

void FlushLogs();

/// @brief Flush and drop the logger
void ShutdownLogging();

#define DRIFTER_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::drifter::GetLogger(), __VA_ARGS__)
#define DRIFTER_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::drifter::GetLogger(), __VA_ARGS__)
#define DRIFTER_LOG_INFO(...) SPDLOG_LOGGER_INFO(::drifter::GetLogger(), __VA_ARGS__)
#define DRIFTER_LOG_WARN(...) SPDLOG_LOGGER_WARN(::drifter::GetLogger(), __VA_ARGS__)
#define DRIFTER_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::drifter::GetLogger(), __VA_ARGS__)
#define DRIFTER_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::drifter::GetLogger(), __VA_ARGS__)

}  // namespace drifter
