#pragma once

/// @file http_server.h
/// @brief cpp-httplib binding for DetectionService

#include <atomic>
#include <memory>
#include <thread>

#include <absl/status/status.h>

#include "service/detection_service.h"
#include "service/server_config.h"

namespace httplib {
class Server;
}  // namespace httplib

namespace promptshield::service {

/// @brief Serves a DetectionService over HTTP
///
/// Start() binds the socket and serves on a background thread; Stop()
/// shuts the listener down and joins it.
class HttpServer {
public:
    HttpServer(DetectionService& service, ServerConfig::Server config);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// @brief Bind and start serving
    absl::Status Start();

    /// @brief Stop serving and wait for the listener thread
    void Stop();

    bool IsRunning() const { return running_.load(); }

private:
    DetectionService& service_;
    ServerConfig::Server config_;
    std::unique_ptr<httplib::Server> server_;
    std::thread listen_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace promptshield::service
