/// @file server_config_test.cpp
/// @brief Tests for service configuration loading

#include <cstdio>
#include <cstdlib>
#include <fstream>

#include <gtest/gtest.h>

#include "service/server_config.h"

namespace promptshield::service {
namespace {

absl::StatusOr<ServerConfig> FromYaml(const std::string& yaml) {
    auto config = Config::LoadFromString(yaml);
    if (!config.ok()) {
        return config.status();
    }
    return ServerConfig::FromConfig(*config);
}

TEST(ServerConfigTest, Defaults) {
    ServerConfig config = ServerConfig::Default();

    EXPECT_EQ(config.server.host, "0.0.0.0");
    EXPECT_EQ(config.server.port, 8000);
    EXPECT_TRUE(config.auth.enabled);
    EXPECT_TRUE(config.auth.api_keys.empty());
    EXPECT_EQ(config.limits.max_prompt_length, 10000);
    EXPECT_EQ(config.limits.max_batch_size, 100);
    EXPECT_EQ(config.limits.max_listed_items, 10);
    EXPECT_EQ(config.detector.policy, detector::PolicyProfile::kStandard);
    EXPECT_TRUE(config.Validate().ok());
}

TEST(ServerConfigTest, EmptyTreeGivesDefaults) {
    auto config = FromYaml("{}");
    ASSERT_TRUE(config.ok()) << config.status().message();
    EXPECT_EQ(config->server.port, 8000);
    EXPECT_EQ(config->logging.level, LogLevel::kInfo);
}

TEST(ServerConfigTest, FullDocument) {
    auto config = FromYaml(R"(
server:
  host: 127.0.0.1
  port: 9090
auth:
  enabled: true
  api_keys: [alpha, beta]
limits:
  max_prompt_length: 500
  max_batch_size: 10
  max_listed_items: 3
detector:
  policy: strict
  weights:
    jailbreak: 0.4
  custom_patterns:
    obfuscation:
      - 'rot47\s*:'
logging:
  level: debug
  file:
    enabled: true
    path: /tmp/ps.log
    max_size_mb: 2
    max_files: 3
)");
    ASSERT_TRUE(config.ok()) << config.status().message();

    EXPECT_EQ(config->server.host, "127.0.0.1");
    EXPECT_EQ(config->server.port, 9090);
    EXPECT_EQ(config->auth.api_keys, (std::vector<std::string>{"alpha", "beta"}));
    EXPECT_EQ(config->limits.max_prompt_length, 500);
    EXPECT_EQ(config->limits.max_batch_size, 10);
    EXPECT_EQ(config->limits.max_listed_items, 3);
    EXPECT_EQ(config->detector.policy, detector::PolicyProfile::kStrict);
    EXPECT_DOUBLE_EQ(config->detector.weight_overrides.at("jailbreak"), 0.4);
    ASSERT_EQ(config->detector.custom_patterns.at("obfuscation").size(), 1);
    EXPECT_EQ(config->logging.level, LogLevel::kDebug);
    EXPECT_TRUE(config->logging.enable_file);
    EXPECT_EQ(config->logging.file_path, "/tmp/ps.log");
    EXPECT_EQ(config->logging.max_file_size, 2u * 1024 * 1024);
    EXPECT_EQ(config->logging.max_files, 3);
}

TEST(ServerConfigTest, RejectsBadValues) {
    EXPECT_FALSE(FromYaml("server:\n  port: 70000\n").ok());
    EXPECT_FALSE(FromYaml("server:\n  port: 0\n").ok());
    EXPECT_FALSE(FromYaml("server:\n  host: ''\n").ok());
    EXPECT_FALSE(FromYaml("limits:\n  max_batch_size: 0\n").ok());
    EXPECT_FALSE(FromYaml("auth:\n  api_keys: ['']\n").ok());
    EXPECT_FALSE(FromYaml("logging:\n  level: loud\n").ok());
    EXPECT_FALSE(FromYaml("detector:\n  weights:\n    jailbreak: lots\n").ok());

    auto policy = FromYaml("detector:\n  policy: paranoid\n");
    EXPECT_EQ(policy.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ServerConfigTest, RejectsValuesThatWouldOverflow) {
    auto timeout = FromYaml("server:\n  read_timeout_seconds: 3000000000\n");
    EXPECT_EQ(timeout.status().code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_FALSE(FromYaml("server:\n  write_timeout_seconds: 4294967297\n").ok());
    EXPECT_FALSE(FromYaml("logging:\n  file:\n    max_size_mb: 9000000000000000\n").ok());

    auto largest = FromYaml("server:\n  read_timeout_seconds: 2147483647\n");
    ASSERT_TRUE(largest.ok()) << largest.status().message();
    EXPECT_EQ(largest->server.read_timeout_seconds, 2147483647);
}

TEST(ServerConfigTest, AuthWithoutKeysIsValid) {
    auto config = FromYaml("auth:\n  enabled: true\n");
    ASSERT_TRUE(config.ok());
    EXPECT_TRUE(config->auth.enabled);
    EXPECT_TRUE(config->auth.api_keys.empty());
}

TEST(ServerConfigTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "promptshield_config_test.yaml";
    {
        std::ofstream out(path);
        out << "server:\n  port: 8123\nauth:\n  api_keys: [file-key]\n";
    }

    auto config = ServerConfig::LoadFromFile(path);
    ASSERT_TRUE(config.ok()) << config.status().message();
    EXPECT_EQ(config->server.port, 8123);
    EXPECT_EQ(config->auth.api_keys, (std::vector<std::string>{"file-key"}));

    std::remove(path.c_str());
}

TEST(ServerConfigTest, MissingFileIsNotFound) {
    auto config = ServerConfig::LoadFromFile("/nonexistent/promptshield.yaml");
    EXPECT_EQ(config.status().code(), absl::StatusCode::kNotFound);
}

TEST(ServerConfigTest, EnvironmentOverridesFile) {
    const std::string path = ::testing::TempDir() + "promptshield_env_test.yaml";
    {
        std::ofstream out(path);
        out << "server:\n  port: 8123\ndetector:\n  policy: strict\n";
    }
    setenv("PSCFG_PORT", "8456", 1);
    setenv("PSCFG_POLICY", "permissive", 1);

    auto config = ServerConfig::LoadWithEnv(path, "PSCFG_");
    ASSERT_TRUE(config.ok()) << config.status().message();
    EXPECT_EQ(config->server.port, 8456);
    EXPECT_EQ(config->detector.policy, detector::PolicyProfile::kPermissive);

    unsetenv("PSCFG_PORT");
    unsetenv("PSCFG_POLICY");
    std::remove(path.c_str());
}

TEST(ServerConfigTest, EnvironmentOnly) {
    setenv("PSCFG_API_KEYS", "k1,k2", 1);

    auto config = ServerConfig::LoadWithEnv("", "PSCFG_");
    ASSERT_TRUE(config.ok()) << config.status().message();
    EXPECT_EQ(config->auth.api_keys, (std::vector<std::string>{"k1", "k2"}));
    EXPECT_EQ(config->server.port, 8000);

    unsetenv("PSCFG_API_KEYS");
}

}  // namespace
}  // namespace promptshield::service
