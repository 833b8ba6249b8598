/// @file main.cpp
/// @brief PromptShield entry point

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <iterator>
#include <optional>
#include <thread>

#include <CLI/CLI.hpp>

#include "common/logging.h"
#include "detector/policy.h"
#include "service/detection_service.h"
#include "service/http_server.h"
#include "service/server_config.h"

namespace {

std::atomic<bool> g_shutdown_requested{false};

void SignalHandler(int) {
    g_shutdown_requested.store(true);
}

void InstallSignalHandlers() {
    struct sigaction sa;
    sa.sa_handler = SignalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void PrintBanner() {
    std::cout << R"(
  ____                            _   ____  _     _      _     _
 |  _ \ _ __ ___  _ __ ___  _ __ | |_/ ___|| |__ (_) ___| | __| |
 | |_) | '__/ _ \| '_ ` _ \| '_ \| __\___ \| '_ \| |/ _ \ |/ _` |
 |  __/| | | (_) | | | | | | |_) | |_ ___) | | | | |  __/ | (_| |
 |_|   |_|  \___/|_| |_| |_| .__/ \__|____/|_| |_|_|\___|_|\__,_|
                           |_|
  Prompt Injection Detection Service
)" << std::endl;
}

/// Load the file (if any) and environment, then apply command-line overrides
std::optional<promptshield::service::ServerConfig> LoadConfig(
    const std::string& config_path, const std::string& log_level) {
    auto config_or = promptshield::service::ServerConfig::LoadWithEnv(config_path);
    if (!config_or.ok()) {
        std::cerr << "Failed to load config: " << config_or.status().message() << std::endl;
        return std::nullopt;
    }
    promptshield::service::ServerConfig config = *std::move(config_or);

    if (!log_level.empty()) {
        auto level = promptshield::ParseLogLevel(log_level);
        if (!level.ok()) {
            std::cerr << level.status().message() << std::endl;
            return std::nullopt;
        }
        config.logging.level = *level;
    }
    return config;
}

int RunServe(const std::string& config_path, const std::string& host,
             std::optional<uint16_t> port, const std::string& log_level) {
    auto config = LoadConfig(config_path, log_level);
    if (!config) {
        return 1;
    }
    if (!host.empty()) {
        config->server.host = host;
    }
    if (port) {
        config->server.port = *port;
    }

    promptshield::InitLogging(config->logging);
    PrintBanner();
    PROMPTSHIELD_LOG_INFO("PromptShield v{} starting...", promptshield::service::kServiceVersion);
    PROMPTSHIELD_LOG_INFO("Configuration:");
    PROMPTSHIELD_LOG_INFO("  Listen: {}:{}", config->server.host, config->server.port);
    PROMPTSHIELD_LOG_INFO("  Default policy: {}",
                          promptshield::detector::PolicyToString(config->detector.policy));
    PROMPTSHIELD_LOG_INFO("  API keys: {}", config->auth.enabled ? config->auth.api_keys.size() : 0);
    PROMPTSHIELD_LOG_INFO("  Max prompt length: {}", config->limits.max_prompt_length);

    auto service = promptshield::service::DetectionService::Create(*config);
    if (!service.ok()) {
        PROMPTSHIELD_LOG_ERROR("Failed to create detection service: {}", service.status().message());
        return 1;
    }

    InstallSignalHandlers();

    promptshield::service::HttpServer server(**service, config->server);
    auto status = server.Start();
    if (!status.ok()) {
        PROMPTSHIELD_LOG_ERROR("Failed to start server: {}", status.message());
        return 1;
    }

    PROMPTSHIELD_LOG_INFO("Service is running. Press Ctrl+C to stop.");
    while (!g_shutdown_requested.load() && server.IsRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    PROMPTSHIELD_LOG_INFO("Shutting down");
    server.Stop();

    const auto stats = (*service)->GetMonitor().Stats();
    PROMPTSHIELD_LOG_INFO("Final Statistics:");
    PROMPTSHIELD_LOG_INFO("  Detections: {}", stats.total_detections);
    PROMPTSHIELD_LOG_INFO("  Average risk score: {:.1f}", stats.avg_risk_score);

    promptshield::ShutdownLogging();
    return 0;
}

int RunScan(const std::string& config_path, const std::string& policy, bool sanitize,
            std::string text, const std::string& log_level) {
    auto config = LoadConfig(config_path, log_level.empty() ? "warn" : log_level);
    if (!config) {
        return 1;
    }
    promptshield::InitLogging(config->logging);

    if (text.empty()) {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    auto service = promptshield::service::DetectionService::Create(*config);
    if (!service.ok()) {
        std::cerr << "Failed to create detection service: " << service.status().message()
                  << std::endl;
        return 1;
    }

    promptshield::service::DetectRequest request;
    request.prompt = std::move(text);
    request.sanitize = sanitize;
    if (!policy.empty()) {
        request.policy = policy;
    }

    auto response = (*service)->Detect(request);
    if (!response.ok()) {
        std::cerr << response.status().message() << std::endl;
        return 1;
    }

    std::cout << response->dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
    promptshield::ShutdownLogging();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"PromptShield - prompt injection detection for LLM applications"};
    app.require_subcommand(0, 1);

    std::string config_path;
    std::string log_level;
    bool version_flag = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    // serve
    CLI::App* serve = app.add_subcommand("serve", "Run the HTTP detection API");
    std::string host;
    std::optional<uint16_t> port;
    serve->add_option("--host", host, "Listen address (overrides config)");
    serve->add_option("--port", port, "Listen port (overrides config)");

    // scan
    CLI::App* scan = app.add_subcommand("scan", "Analyze one prompt and print the verdict as JSON");
    std::string policy;
    bool sanitize = false;
    std::string text;
    scan->add_option("--policy", policy, "Policy: strict, standard or permissive");
    scan->add_flag("--sanitize", sanitize, "Include a sanitized rewrite for risky prompts");
    scan->add_option("text", text, "Prompt text (read from stdin when omitted)");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "PromptShield v" << promptshield::service::kServiceVersion << std::endl;
        return 0;
    }

    if (scan->parsed()) {
        return RunScan(config_path, policy, sanitize, std::move(text), log_level);
    }
    return RunServe(config_path, host, port, log_level);
}
