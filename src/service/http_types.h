#pragma once

/// @file http_types.h
/// @brief Transport-independent request and response types

#include <map>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <nlohmann/json.hpp>

namespace promptshield::service {

/// @brief HTTP method enum
enum class HttpMethod {
    kGet,
    kPost,
    kOther
};

/// @brief HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::kGet;
    std::string path;
    std::map<std::string, std::string> query_params;
    std::map<std::string, std::string> headers;
    std::string body;

    /// @brief Header value by case-insensitive name, empty if absent
    std::string GetHeader(std::string_view name) const;

    /// @brief Query parameter value, empty if absent
    std::string GetQueryParam(std::string_view name) const;
};

/// @brief Serialize JSON, replacing invalid UTF-8 instead of throwing
std::string DumpJson(const nlohmann::json& body);

/// @brief HTTP response
struct HttpResponse {
    int status_code = 200;
    std::string body;
    std::string content_type = "application/json";

    static HttpResponse Ok(const nlohmann::json& body);
    static HttpResponse Error(int status_code, std::string_view message);
    static HttpResponse BadRequest(std::string_view message);
    static HttpResponse NotFound(std::string_view message = "Not found");
    static HttpResponse MethodNotAllowed();

    /// @brief Map a non-OK status to its HTTP code with {"error": message}
    static HttpResponse FromStatus(const absl::Status& status);
};

}  // namespace promptshield::service
