/// @file server_config.cpp
/// @brief Service configuration loading

#include "service/server_config.h"

#include <limits>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace promptshield::service {

namespace {

constexpr int64_t kBytesPerMegabyte = 1024 * 1024;

absl::StatusOr<int64_t> GetInRange(const Config& config, std::string_view key,
                                    int64_t default_value, int64_t max_value) {
    const int64_t value = config.GetInt(key, default_value);
    if (value <= 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat(absl::string_view(key.data(), key.size()), " must be positive, got ", value));
    }
    if (value > max_value) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat(absl::string_view(key.data(), key.size()), " must be at most ", max_value, ", got ", value));
    }
    return value;
}

absl::StatusOr<size_t> GetPositive(const Config& config, std::string_view key,
                                   size_t default_value,
                                   int64_t max_value = std::numeric_limits<int64_t>::max()) {
    PROMPTSHIELD_ASSIGN_OR_RETURN(
        int64_t value, GetInRange(config, key, static_cast<int64_t>(default_value), max_value));
    return static_cast<size_t>(value);
}

absl::StatusOr<int> GetTimeout(const Config& config, std::string_view key, int default_value) {
    PROMPTSHIELD_ASSIGN_OR_RETURN(
        int64_t value, GetInRange(config, key, default_value, std::numeric_limits<int>::max()));
    return static_cast<int>(value);
}

}  // namespace

ServerConfig ServerConfig::Default() {
    return ServerConfig{};
}

absl::StatusOr<ServerConfig> ServerConfig::FromConfig(const Config& config) {
    ServerConfig result = Default();

    // Server section
    result.server.host = config.GetString("server.host", result.server.host);
    const int64_t port = config.GetInt("server.port", result.server.port);
    if (port <= 0 || port > std::numeric_limits<uint16_t>::max()) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("server.port out of range: ", port));
    }
    result.server.port = static_cast<uint16_t>(port);
    PROMPTSHIELD_ASSIGN_OR_RETURN(
        result.server.read_timeout_seconds,
        GetTimeout(config, "server.read_timeout_seconds", result.server.read_timeout_seconds));
    PROMPTSHIELD_ASSIGN_OR_RETURN(
        result.server.write_timeout_seconds,
        GetTimeout(config, "server.write_timeout_seconds", result.server.write_timeout_seconds));

    // Auth section
    result.auth.enabled = config.GetBool("auth.enabled", result.auth.enabled);
    result.auth.api_keys = config.GetStringList("auth.api_keys");

    // Limits section
    PROMPTSHIELD_ASSIGN_OR_RETURN(
        result.limits.max_prompt_length,
        GetPositive(config, "limits.max_prompt_length", result.limits.max_prompt_length));
    PROMPTSHIELD_ASSIGN_OR_RETURN(
        result.limits.max_batch_size,
        GetPositive(config, "limits.max_batch_size", result.limits.max_batch_size));
    PROMPTSHIELD_ASSIGN_OR_RETURN(
        result.limits.max_listed_items,
        GetPositive(config, "limits.max_listed_items", result.limits.max_listed_items));

    // Detector section
    PROMPTSHIELD_ASSIGN_OR_RETURN(
        result.detector.policy,
        detector::ParsePolicy(config.GetString("detector.policy", "standard")));
    PROMPTSHIELD_ASSIGN_OR_RETURN(result.detector.weight_overrides,
                                  config.GetDoubleMap("detector.weights"));
    result.detector.custom_patterns = config.GetStringListMap("detector.custom_patterns");

    // Logging section
    PROMPTSHIELD_ASSIGN_OR_RETURN(result.logging.level,
                                  ParseLogLevel(config.GetString("logging.level", "info")));
    result.logging.enable_file = config.GetBool("logging.file.enabled", false);
    result.logging.file_path = config.GetString("logging.file.path", result.logging.file_path);
    PROMPTSHIELD_ASSIGN_OR_RETURN(
        size_t max_size_mb,
        GetPositive(config, "logging.file.max_size_mb",
                    result.logging.max_file_size / kBytesPerMegabyte,
                    std::numeric_limits<int64_t>::max() / kBytesPerMegabyte));
    result.logging.max_file_size = max_size_mb * kBytesPerMegabyte;
    PROMPTSHIELD_ASSIGN_OR_RETURN(
        result.logging.max_files,
        GetPositive(config, "logging.file.max_files", result.logging.max_files));

    PROMPTSHIELD_RETURN_IF_ERROR(result.Validate());
    return result;
}

absl::StatusOr<ServerConfig> ServerConfig::LoadFromFile(const std::string& path) {
    PROMPTSHIELD_ASSIGN_OR_RETURN(Config config, Config::LoadFromFile(path));
    return FromConfig(config);
}

absl::StatusOr<ServerConfig> ServerConfig::LoadWithEnv(const std::string& path,
                                                       std::string_view env_prefix) {
    Config config;
    if (!path.empty()) {
        PROMPTSHIELD_ASSIGN_OR_RETURN(config, Config::LoadFromFile(path));
    }

    // Environment variables take precedence over the file
    config.Merge(Config::LoadFromEnvironment(env_prefix));
    return FromConfig(config);
}

absl::Status ServerConfig::Validate() const {
    if (server.host.empty()) {
        return MakeError(ErrorCode::kConfigurationError, "server.host must not be empty");
    }
    if (server.read_timeout_seconds <= 0 || server.write_timeout_seconds <= 0) {
        return MakeError(ErrorCode::kConfigurationError, "server timeouts must be positive");
    }
    for (const auto& key : auth.api_keys) {
        if (key.empty()) {
            return MakeError(ErrorCode::kConfigurationError, "auth.api_keys contains an empty key");
        }
    }
    return absl::OkStatus();
}

}  // namespace promptshield::service
