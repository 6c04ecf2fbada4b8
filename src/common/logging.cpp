/// @file logging.cpp
/// @brief Global logger setup

#include "common/logging.h"

#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace drifter {

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

spdlog::level::level_enum ToSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

/// Requires g_mutex
std::shared_ptr<spdlog::logger> CreateLogger(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (config.enable_file) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, config.max_file_size, config.max_files));
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    logger->set_pattern(config.pattern);
    logger->set_level(ToSpdlog(config.level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}  // namespace

void InitLogging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        g_logger = CreateLogger(config);
    }
}

std::shared_ptr<spdlog::logger> GetLogger() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        g_logger = CreateLogger(LogConfig{});
    }
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    auto logger = GetLogger();
    logger->set_level(ToSpdlog(level));
}

LogLevel ParseLogLevel(std::string_view name) {
    if (name == "trace") {
        return LogLevel::kTrace;
    } else if (name == "debug") {
        return LogLevel::kDebug;
    } else if (name == "warn" || name == "warning") {
        return LogLevel::kWarn;
    } else if (name == "error") {
        return LogLevel::kError;
    } else if (name == "critical") {
        return LogLevel::kCritical;
    } else if (name == "off") {
        return LogLevel::kOff;
    }
    return LogLevel::kInfo;
}

std::string_view LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::kTrace: return "trace";
        case LogLevel::kDebug: return "debug";
        case LogLevel::kInfo: return "info";
        case LogLevel::kWarn: return "warn";
        case LogLevel::kError: return "error";
        case LogLevel::kCritical: return "critical";
        case LogLevel::kOff: return "off";
    }
    return "info";
}

void FlushLogs() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
    }
}

void ShutdownLogging() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
        g_logger.reset();
    }
}

}  // namespace drifter
