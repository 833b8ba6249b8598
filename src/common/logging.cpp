#include "logging.h"

#include <atomic>
#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace promptshield {

namespace {

// Read lock-free on every log call; init and shutdown serialize on the mutex
std::atomic<std::shared_ptr<spdlog::logger>> g_logger;
std::mutex g_logger_mutex;

std::shared_ptr<spdlog::logger> BuildLogger(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (always enabled)
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(config.level));
    sinks.push_back(console_sink);

    // File sink (optional)
    if (config.enable_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size,
            config.max_files
        );
        file_sink->set_level(static_cast<spdlog::level::level_enum>(config.level));
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    logger->set_level(static_cast<spdlog::level::level_enum>(config.level));
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}  // namespace

void InitLogging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger.load()) {
        return;
    }
    auto logger = BuildLogger(config);
    spdlog::set_default_logger(logger);
    g_logger.store(std::move(logger));
}

std::shared_ptr<spdlog::logger> GetLogger() {
    if (auto logger = g_logger.load()) {
        return logger;
    }
    InitLogging();
    return g_logger.load();
}

void SetLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (auto logger = g_logger.load()) {
        logger->set_level(static_cast<spdlog::level::level_enum>(level));
        for (auto& sink : logger->sinks()) {
            sink->set_level(static_cast<spdlog::level::level_enum>(level));
        }
    }
}

absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    if (lowered == "trace") return LogLevel::kTrace;
    if (lowered == "debug") return LogLevel::kDebug;
    if (lowered == "info") return LogLevel::kInfo;
    if (lowered == "warn" || lowered == "warning") return LogLevel::kWarn;
    if (lowered == "error") return LogLevel::kError;
    if (lowered == "critical") return LogLevel::kCritical;
    if (lowered == "off") return LogLevel::kOff;
    return absl::InvalidArgumentError(absl::StrCat("Unknown log level: ", absl::string_view(name.data(), name.size())));
}

void FlushLogs() {
    if (auto logger = g_logger.load()) {
        logger->flush();
    }
}

void ShutdownLogging() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (auto logger = g_logger.exchange(nullptr)) {
        logger->flush();
        spdlog::drop(logger->name());
    }
}

}  // namespace promptshield
