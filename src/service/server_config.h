#pragma once

/// @file server_config.h
/// @brief Typed configuration for the detection service

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "common/logging.h"
#include "detector/policy.h"

namespace promptshield::service {

/// @brief Service configuration
///
/// YAML layout:
/// @code
///   server:   { host: 0.0.0.0, port: 8000, read_timeout_seconds: 5 }
///   auth:     { enabled: true, api_keys: [ ... ] }
///   limits:   { max_prompt_length: 10000, max_batch_size: 100, max_listed_items: 10 }
///   detector: { policy: standard, weights: { jailbreak: 1.0 },
///               custom_patterns: { jailbreak: [ ... ] } }
///   logging:  { level: info, file: { enabled: false, path: ..., max_size_mb: 10, max_files: 5 } }
/// @endcode
struct ServerConfig {
    struct Server {
        std::string host = "0.0.0.0";
        uint16_t port = 8000;
        int read_timeout_seconds = 5;
        int write_timeout_seconds = 5;
    } server;

    /// With auth enabled and no keys configured every API request is rejected
    struct Auth {
        bool enabled = true;
        std::vector<std::string> api_keys;
    } auth;

    struct Limits {
        size_t max_prompt_length = 10000;   ///< Code points
        size_t max_batch_size = 100;
        size_t max_listed_items = 10;       ///< Cap on patterns/segments in responses
    } limits;

    /// Base engine settings; the policy is the default for requests
    detector::EngineConfig detector;

    LogConfig logging;

    /// @brief Defaults for every field
    static ServerConfig Default();

    /// @brief Build from a generic configuration tree
    static absl::StatusOr<ServerConfig> FromConfig(const Config& config);

    /// @brief Load from a YAML file
    static absl::StatusOr<ServerConfig> LoadFromFile(const std::string& path);

    /// @brief Load from a YAML file (optional) with environment overrides
    /// @param path Config file path, or empty for defaults only
    /// @param env_prefix Environment variable prefix
    static absl::StatusOr<ServerConfig> LoadWithEnv(const std::string& path,
                                                    std::string_view env_prefix = "PROMPTSHIELD_");

    /// @brief Check limits and ports are usable
    absl::Status Validate() const;
};

}  // namespace promptshield::service
