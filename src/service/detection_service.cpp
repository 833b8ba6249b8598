/// @file detection_service.cpp
/// @brief Detection API request handling

#include "service/detection_service.h"

#include <array>
#include <cmath>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "detector/scorer.h"
#include "guard/guard_action.h"

namespace promptshield::service {

namespace {

constexpr std::string_view kApiPrefix = "/api/v1/";
constexpr std::array<detector::PolicyProfile, 3> kAllPolicies = {
    detector::PolicyProfile::kStrict, detector::PolicyProfile::kStandard,
    detector::PolicyProfile::kPermissive};

double RoundTo(double value, int digits) {
    const double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

}  // namespace

// =============================================================================
// Wire helpers
// =============================================================================

absl::StatusOr<DetectRequest> DetectRequest::FromJson(const nlohmann::json& body) {
    if (!body.is_object()) {
        return MakeError(ErrorCode::kInvalidArgument, "Request body must be a JSON object");
    }

    DetectRequest request;

    auto prompt = body.find("prompt");
    if (prompt == body.end() || !prompt->is_string()) {
        return MakeError(ErrorCode::kInvalidArgument, "'prompt' is required and must be a string");
    }
    request.prompt = prompt->get<std::string>();

    auto policy = body.find("policy");
    if (policy != body.end() && !policy->is_null()) {
        if (!policy->is_string()) {
            return MakeError(ErrorCode::kInvalidArgument, "'policy' must be a string");
        }
        request.policy = policy->get<std::string>();
    }

    auto sanitize = body.find("sanitize");
    if (sanitize != body.end() && !sanitize->is_null()) {
        if (!sanitize->is_boolean()) {
            return MakeError(ErrorCode::kInvalidArgument, "'sanitize' must be a boolean");
        }
        request.sanitize = sanitize->get<bool>();
    }

    return request;
}

nlohmann::json DetectionResultToJson(const detector::DetectionResult& result, size_t max_items) {
    nlohmann::json patterns = nlohmann::json::array();
    for (size_t i = 0; i < result.fired_patterns.size() && i < max_items; ++i) {
        patterns.push_back(result.fired_patterns[i].ToString());
    }

    nlohmann::json segments = nlohmann::json::array();
    for (size_t i = 0; i < result.flagged_segments.size() && i < max_items; ++i) {
        const auto& span = result.flagged_segments[i];
        segments.push_back({
            {"segment", span.segment},
            {"category", detector::CategoryToString(span.category)},
            {"position", span.Position()},
        });
    }

    return {
        {"safe", result.IsSafe()},
        {"threat_level", detector::ThreatLevelToString(result.threat_level)},
        {"risk_score", result.risk_score},
        {"confidence", result.confidence},
        {"explanation", result.explanation},
        {"detected_patterns", std::move(patterns)},
        {"flagged_segments", std::move(segments)},
    };
}

std::string PromptPreview(std::string_view text, size_t length) {
    size_t code_points = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            if (code_points == length) {
                return absl::StrCat(absl::string_view(text.data(), i), "...");
            }
            ++code_points;
        }
    }
    return std::string(text);
}

bool SecureCompare(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    volatile int result = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        result |= a[i] ^ b[i];
    }
    return result == 0;
}

// =============================================================================
// DetectionService
// =============================================================================

DetectionService::DetectionService(ServerConfig config)
    : config_(std::move(config)), start_time_(std::chrono::steady_clock::now()) {}

absl::StatusOr<std::unique_ptr<DetectionService>> DetectionService::Create(ServerConfig config) {
    std::unique_ptr<DetectionService> service(new DetectionService(std::move(config)));

    for (detector::PolicyProfile policy : kAllPolicies) {
        detector::EngineConfig engine_config = service->config_.detector;
        engine_config.policy = policy;
        PROMPTSHIELD_ASSIGN_OR_RETURN(service->engines_[policy],
                                      detector::CreateDetectionEngine(engine_config));
    }

    if (service->config_.auth.enabled && service->config_.auth.api_keys.empty()) {
        PROMPTSHIELD_LOG_WARN("Authentication enabled with no API keys; all API requests will be rejected");
    } else if (!service->config_.auth.enabled) {
        PROMPTSHIELD_LOG_WARN("Authentication disabled");
    }

    return service;
}

const detector::DetectionEngine& DetectionService::GetEngine(
    detector::PolicyProfile policy) const {
    return *engines_.at(policy);
}

HttpResponse DetectionService::Handle(const HttpRequest& request) {
    if (request.path == "/" || request.path == "/health") {
        if (request.method != HttpMethod::kGet) {
            return HttpResponse::MethodNotAllowed();
        }
        if (request.path == "/") {
            return HttpResponse::Ok({
                {"service", std::string(kServiceName)},
                {"status", "healthy"},
                {"version", std::string(kServiceVersion)},
            });
        }
        const double now = std::chrono::duration<double>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        return HttpResponse::Ok({
            {"status", "healthy"},
            {"detector", "ready"},
            {"timestamp", now},
        });
    }

    if (!absl::StartsWith(request.path, absl::string_view(kApiPrefix.data(), kApiPrefix.size()))) {
        return HttpResponse::NotFound();
    }

    if (auto status = Authenticate(request); !status.ok()) {
        PROMPTSHIELD_LOG_WARN("Rejected {} request: {}", request.path,
                              std::string_view(status.message().data(), status.message().size()));
        return HttpResponse::FromStatus(status);
    }

    const std::string_view endpoint = std::string_view(request.path).substr(kApiPrefix.size());
    if (endpoint == "detect") {
        return request.method == HttpMethod::kPost ? HandleDetect(request)
                                                   : HttpResponse::MethodNotAllowed();
    }
    if (endpoint == "batch-detect") {
        return request.method == HttpMethod::kPost ? HandleBatchDetect(request)
                                                   : HttpResponse::MethodNotAllowed();
    }
    if (endpoint == "stats") {
        return request.method == HttpMethod::kGet ? HttpResponse::Ok(Stats())
                                                  : HttpResponse::MethodNotAllowed();
    }
    if (endpoint == "patterns") {
        return request.method == HttpMethod::kGet ? HandlePatterns(request)
                                                  : HttpResponse::MethodNotAllowed();
    }
    return HttpResponse::NotFound();
}

absl::Status DetectionService::Authenticate(const HttpRequest& request) const {
    if (!config_.auth.enabled) {
        return absl::OkStatus();
    }

    const std::string api_key = request.GetHeader(kApiKeyHeader);
    if (api_key.empty()) {
        return MakeError(ErrorCode::kUnauthenticated, "Missing X-API-Key header");
    }

    // Compare against every key so timing does not reveal which one matched
    bool matched = false;
    for (const auto& configured : config_.auth.api_keys) {
        matched |= SecureCompare(api_key, configured);
    }
    if (!matched) {
        return MakeError(ErrorCode::kUnauthenticated, "Invalid API key");
    }
    return absl::OkStatus();
}

absl::StatusOr<nlohmann::json> DetectionService::Detect(const DetectRequest& request) {
    const auto start = std::chrono::steady_clock::now();

    const size_t length = detector::CountCodePoints(request.prompt);
    if (length == 0) {
        return MakeError(ErrorCode::kInvalidArgument, "'prompt' must not be empty");
    }
    if (length > config_.limits.max_prompt_length) {
        return MakeError(ErrorCode::kInvalidArgument,
                         absl::StrCat("'prompt' exceeds ", config_.limits.max_prompt_length,
                                      " characters"));
    }

    detector::PolicyProfile policy = config_.detector.policy;
    if (request.policy) {
        PROMPTSHIELD_ASSIGN_OR_RETURN(policy, detector::ParsePolicy(*request.policy));
    }

    const detector::DetectionResult result = GetEngine(policy).Detect(request.prompt);
    monitor_.Log(request.prompt, result);

    nlohmann::json response = DetectionResultToJson(result, config_.limits.max_listed_items);
    response["action"] = guard::GuardActionToString(guard::DecideAction(result.threat_level));
    if (request.sanitize && result.threat_level > detector::ThreatLevel::kLow) {
        response["sanitized_prompt"] = sanitizer_.Sanitize(request.prompt, result);
    } else {
        response["sanitized_prompt"] = nullptr;
    }

    const double elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    response["processing_time_ms"] = RoundTo(elapsed_ms, 2);
    return response;
}

absl::StatusOr<nlohmann::json> DetectionService::BatchDetect(
    const std::vector<std::string>& prompts) {
    if (prompts.size() > config_.limits.max_batch_size) {
        return MakeError(ErrorCode::kInvalidArgument,
                         absl::StrCat("Batch exceeds ", config_.limits.max_batch_size,
                                      " prompts"));
    }

    const auto& engine = GetEngine(config_.detector.policy);
    nlohmann::json results = nlohmann::json::array();
    for (const auto& prompt : prompts) {
        const detector::DetectionResult result = engine.Detect(prompt);
        monitor_.Log(prompt, result);
        results.push_back({
            {"prompt_preview", PromptPreview(prompt)},
            {"safe", result.IsSafe()},
            {"threat_level", detector::ThreatLevelToString(result.threat_level)},
            {"risk_score", result.risk_score},
        });
    }

    const size_t total = results.size();
    return nlohmann::json{{"results", std::move(results)}, {"total", total}};
}

nlohmann::json DetectionService::Stats() const {
    const guard::MonitorStats stats = monitor_.Stats();
    const double uptime = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_time_).count();
    return {
        {"total_detections", stats.total_detections},
        {"threat_distribution", stats.threat_distribution},
        {"avg_risk_score", stats.avg_risk_score},
        {"uptime_seconds", uptime},
    };
}

absl::StatusOr<nlohmann::json> DetectionService::Patterns(
    const std::optional<std::string>& category) const {
    const auto& engine = GetEngine(config_.detector.policy);

    if (!category) {
        nlohmann::json categories = nlohmann::json::array();
        for (detector::Category c : detector::kAllCategories) {
            categories.push_back(detector::CategoryToString(c));
        }
        return nlohmann::json{
            {"categories", std::move(categories)},
            {"total_patterns", engine.TotalRuleCount()},
        };
    }

    auto rules = engine.RulesFor(*category);
    if (!rules.ok()) {
        return MakeError(ErrorCode::kNotFound,
                         absl::StrCat("Category '", *category, "' not found"));
    }
    PROMPTSHIELD_ASSIGN_OR_RETURN(double weight, engine.WeightFor(*category));

    nlohmann::json patterns = nlohmann::json::array();
    for (size_t i = 0; i < rules->size() && i < config_.limits.max_listed_items; ++i) {
        patterns.push_back((*rules)[i].pattern);
    }
    return nlohmann::json{
        {"category", *category},
        {"patterns", std::move(patterns)},
        {"weight", weight},
    };
}

// =============================================================================
// Route handlers
// =============================================================================

absl::StatusOr<nlohmann::json> DetectionService::ParseJsonBody(const HttpRequest& request) const {
    try {
        return nlohmann::json::parse(request.body);
    } catch (const nlohmann::json::exception& e) {
        return absl::InvalidArgumentError(absl::StrCat("Invalid JSON: ", e.what()));
    }
}

HttpResponse DetectionService::HandleDetect(const HttpRequest& request) {
    auto body = ParseJsonBody(request);
    if (!body.ok()) {
        return HttpResponse::FromStatus(body.status());
    }

    auto detect_request = DetectRequest::FromJson(*body);
    if (!detect_request.ok()) {
        return HttpResponse::FromStatus(detect_request.status());
    }

    auto response = Detect(*detect_request);
    if (!response.ok()) {
        return HttpResponse::FromStatus(response.status());
    }
    return HttpResponse::Ok(*response);
}

HttpResponse DetectionService::HandleBatchDetect(const HttpRequest& request) {
    auto body = ParseJsonBody(request);
    if (!body.ok()) {
        return HttpResponse::FromStatus(body.status());
    }
    if (!body->is_array()) {
        return HttpResponse::BadRequest("Request body must be a JSON array of strings");
    }

    std::vector<std::string> prompts;
    prompts.reserve(body->size());
    for (const auto& item : *body) {
        if (!item.is_string()) {
            return HttpResponse::BadRequest("Request body must be a JSON array of strings");
        }
        prompts.push_back(item.get<std::string>());
    }

    auto response = BatchDetect(prompts);
    if (!response.ok()) {
        return HttpResponse::FromStatus(response.status());
    }
    return HttpResponse::Ok(*response);
}

HttpResponse DetectionService::HandlePatterns(const HttpRequest& request) const {
    std::optional<std::string> category;
    if (std::string value = request.GetQueryParam("category"); !value.empty()) {
        category = std::move(value);
    }

    auto response = Patterns(category);
    if (!response.ok()) {
        return HttpResponse::FromStatus(response.status());
    }
    return HttpResponse::Ok(*response);
}

}  // namespace promptshield::service
