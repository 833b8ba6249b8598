#pragma once

/// @file detection_service.h
/// @brief Request handling for the detection API
///
/// Endpoints:
/// - GET  /                       Service banner
/// - GET  /health                 Health check
/// - POST /api/v1/detect          Analyze one prompt
/// - POST /api/v1/batch-detect    Analyze a JSON array of prompts
/// - GET  /api/v1/stats           Monitor aggregates and uptime
/// - GET  /api/v1/patterns        Category list, or ?category=<name> rules
///
/// All /api/v1 endpoints require an X-API-Key header matching a configured
/// key. The service is transport-independent; HttpServer binds it to a
/// socket.

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "detector/detection_engine.h"
#include "guard/monitor.h"
#include "guard/sanitizer.h"
#include "service/http_types.h"
#include "service/server_config.h"

namespace promptshield::service {

inline constexpr std::string_view kServiceName = "PromptShield";
inline constexpr std::string_view kServiceVersion = "1.0.0";
inline constexpr std::string_view kApiKeyHeader = "X-API-Key";
inline constexpr size_t kPromptPreviewLength = 50;

/// @brief Parsed body of POST /api/v1/detect
struct DetectRequest {
    std::string prompt;
    std::optional<std::string> policy;  ///< Service default when absent
    bool sanitize = false;

    /// @brief Validate and extract fields from a JSON body
    ///
    /// A missing, null or non-string prompt is the only "absent text"
    /// failure and yields InvalidArgument.
    static absl::StatusOr<DetectRequest> FromJson(const nlohmann::json& body);
};

/// @brief Wire form of a verdict, lists capped at @p max_items
nlohmann::json DetectionResultToJson(const detector::DetectionResult& result, size_t max_items);

/// @brief First @p length code points of @p text, with "..." if truncated
std::string PromptPreview(std::string_view text, size_t length = kPromptPreviewLength);

/// @brief Constant-time string equality
bool SecureCompare(std::string_view a, std::string_view b);

/// @brief Detection API
class DetectionService {
public:
    /// @brief Build one engine per policy tier from @p config
    static absl::StatusOr<std::unique_ptr<DetectionService>> Create(ServerConfig config);

    // Disable copy
    DetectionService(const DetectionService&) = delete;
    DetectionService& operator=(const DetectionService&) = delete;

    /// @brief Route and answer one request
    HttpResponse Handle(const HttpRequest& request);

    /// @brief Check the X-API-Key header
    absl::Status Authenticate(const HttpRequest& request) const;

    /// @brief Analyze one prompt and record it
    absl::StatusOr<nlohmann::json> Detect(const DetectRequest& request);

    /// @brief Analyze several prompts with the default policy
    absl::StatusOr<nlohmann::json> BatchDetect(const std::vector<std::string>& prompts);

    /// @brief Monitor aggregates plus uptime
    nlohmann::json Stats() const;

    /// @brief Category summary, or one category's rules and weight
    absl::StatusOr<nlohmann::json> Patterns(const std::optional<std::string>& category) const;

    /// @brief Engine for a policy tier
    const detector::DetectionEngine& GetEngine(detector::PolicyProfile policy) const;

    const guard::Monitor& GetMonitor() const { return monitor_; }
    const ServerConfig& GetConfig() const { return config_; }

private:
    explicit DetectionService(ServerConfig config);

    HttpResponse HandleDetect(const HttpRequest& request);
    HttpResponse HandleBatchDetect(const HttpRequest& request);
    HttpResponse HandlePatterns(const HttpRequest& request) const;

    absl::StatusOr<nlohmann::json> ParseJsonBody(const HttpRequest& request) const;

    ServerConfig config_;
    std::map<detector::PolicyProfile, std::unique_ptr<detector::DetectionEngine>> engines_;
    guard::Sanitizer sanitizer_;
    guard::Monitor monitor_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace promptshield::service
