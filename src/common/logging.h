#pragma once

/// @file logging.h
/// @brief PromptShield logging utilities wrapping spdlog

#include <memory>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <spdlog/spdlog.h>

namespace promptshield {

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
    std::string name = "promptshield";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "promptshield.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

/// @brief Initialize the global logger with the given configuration
///
/// Only the first call takes effect; later calls are ignored until
/// ShutdownLogging() is called.
void InitLogging(const LogConfig& config = {});

/// @brief Get the global logger instance, initializing defaults if needed
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the global log level
void SetLogLevel(LogLevel level);

/// @brief Parse "trace", "debug", "info", "warn", "error", "critical", "off"
absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

// Convenience macros for logging
#define PROMPTSHIELD_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::promptshield::GetLogger(), __VA_ARGS__)
#define PROMPTSHIELD_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::promptshield::GetLogger(), __VA_ARGS__)
#define PROMPTSHIELD_LOG_INFO(...) SPDLOG_LOGGER_INFO(::promptshield::GetLogger(), __VA_ARGS__)
#define PROMPTSHIELD_LOG_WARN(...) SPDLOG_LOGGER_WARN(::promptshield::GetLogger(), __VA_ARGS__)
#define PROMPTSHIELD_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::promptshield::GetLogger(), __VA_ARGS__)
#define PROMPTSHIELD_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::promptshield::GetLogger(), __VA_ARGS__)

}  // namespace promptshield
