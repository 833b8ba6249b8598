/// @file http_server.cpp
/// @brief HTTP listener implementation

#include "service/http_server.h"

#include <chrono>

#include <httplib.h>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace promptshield::service {

namespace {

HttpRequest ToServiceRequest(const httplib::Request& req) {
    HttpRequest request;
    if (req.method == "GET") {
        request.method = HttpMethod::kGet;
    } else if (req.method == "POST") {
        request.method = HttpMethod::kPost;
    } else {
        request.method = HttpMethod::kOther;
    }
    request.path = req.path;
    request.body = req.body;
    for (const auto& [name, value] : req.headers) {
        request.headers.emplace(name, value);
    }
    for (const auto& [name, value] : req.params) {
        request.query_params.emplace(name, value);
    }
    return request;
}

}  // namespace

HttpServer::HttpServer(DetectionService& service, ServerConfig::Server config)
    : service_(service), config_(std::move(config)) {}

HttpServer::~HttpServer() {
    Stop();
}

absl::Status HttpServer::Start() {
    if (running_.load()) {
        return absl::OkStatus();
    }

    server_ = std::make_unique<httplib::Server>();
    server_->set_read_timeout(config_.read_timeout_seconds, 0);
    server_->set_write_timeout(config_.write_timeout_seconds, 0);

    auto handler = [this](const httplib::Request& req, httplib::Response& res) {
        const auto start = std::chrono::steady_clock::now();
        const HttpResponse response = service_.Handle(ToServiceRequest(req));
        res.status = response.status_code;
        res.set_content(response.body, response.content_type.c_str());

        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start);
        PROMPTSHIELD_LOG_DEBUG("{} {} -> {} ({}us)", req.method, req.path,
                               response.status_code, elapsed.count());
    };

    server_->Get(".*", handler);
    server_->Post(".*", handler);
    server_->Put(".*", handler);
    server_->Delete(".*", handler);

    if (!server_->bind_to_port(config_.host.c_str(), config_.port)) {
        return MakeError(ErrorCode::kInternal,
                         absl::StrCat("Failed to bind ", config_.host, ":", config_.port));
    }

    running_.store(true);
    listen_thread_ = std::thread([this]() {
        PROMPTSHIELD_LOG_INFO("HTTP server listening on {}:{}", config_.host, config_.port);
        if (!server_->listen_after_bind()) {
            PROMPTSHIELD_LOG_ERROR("HTTP listener on {}:{} exited with an error",
                                   config_.host, config_.port);
        }
        running_.store(false);
    });

    return absl::OkStatus();
}

void HttpServer::Stop() {
    if (server_) {
        server_->stop();
    }
    if (listen_thread_.joinable()) {
        listen_thread_.join();
    }
    running_.store(false);
}

}  // namespace promptshield::service
