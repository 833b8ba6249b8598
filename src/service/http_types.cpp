#include "service/http_types.h"

#include <absl/strings/match.h>

#include "common/error.h"

namespace promptshield::service {

std::string HttpRequest::GetHeader(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (absl::EqualsIgnoreCase(key, absl::string_view(name.data(), name.size()))) {
            return value;
        }
    }
    return "";
}

std::string HttpRequest::GetQueryParam(std::string_view name) const {
    auto it = query_params.find(std::string(name));
    return it != query_params.end() ? it->second : "";
}

std::string DumpJson(const nlohmann::json& body) {
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

HttpResponse HttpResponse::Ok(const nlohmann::json& body) {
    HttpResponse resp;
    resp.status_code = 200;
    resp.body = DumpJson(body);
    return resp;
}

HttpResponse HttpResponse::Error(int status_code, std::string_view message) {
    HttpResponse resp;
    resp.status_code = status_code;
    resp.body = DumpJson(nlohmann::json{{"error", std::string(message)}});
    return resp;
}

HttpResponse HttpResponse::BadRequest(std::string_view message) {
    return Error(400, message);
}

HttpResponse HttpResponse::NotFound(std::string_view message) {
    return Error(404, message);
}

HttpResponse HttpResponse::MethodNotAllowed() {
    return Error(405, "Method not allowed");
}

HttpResponse HttpResponse::FromStatus(const absl::Status& status) {
    return Error(ToHttpStatus(status),
                 std::string_view(status.message().data(), status.message().size()));
}

}  // namespace promptshield::service
