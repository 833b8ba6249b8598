#pragma once

/// @file config.h
/// @brief PromptShield configuration management

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

namespace promptshield {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>,
    std::unordered_map<std::string, std::string>
>;

/// @brief YAML-backed configuration with dot-notation access
///
/// Example:
/// @code
///   auto config = Config::LoadFromFile("promptshield.yaml");
///   if (config.ok()) {
///       int64_t port = config->GetInt("server.port", 8000);
///   }
/// @endcode
class Config {
public:
    /// @brief Default constructor creates empty configuration
    Config() = default;

    /// @brief Load configuration from a YAML file
    /// @param path Path to the YAML configuration file
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    /// @param yaml_content YAML content as a string
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Load configuration from environment variables with a prefix
    /// @param prefix Environment variable prefix (e.g., "PROMPTSHIELD_")
    static Config LoadFromEnvironment(std::string_view prefix = "PROMPTSHIELD_");

    /// @brief Merge another configuration into this one (other takes precedence)
    void Merge(const Config& other);

    /// @brief Get a string value
    /// @param key Configuration key (supports dot notation, e.g., "server.host")
    /// @param default_value Default value if key not found
    std::string GetString(std::string_view key, std::string_view default_value = "") const;

    /// @brief Get an integer value
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;

    /// @brief Get a double value
    double GetDouble(std::string_view key, double default_value = 0.0) const;

    /// @brief Get a boolean value
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Get a list of strings, or an empty vector if not found
    std::vector<std::string> GetStringList(std::string_view key) const;

    /// @brief Get a map of numeric values (e.g. per-category weights)
    ///
    /// Fails if the node exists but one of its values is not a number.
    absl::StatusOr<std::map<std::string, double>> GetDoubleMap(std::string_view key) const;

    /// @brief Get a map of string lists (e.g. per-category custom patterns)
    std::map<std::string, std::vector<std::string>> GetStringListMap(std::string_view key) const;

    /// @brief Check if a key exists
    bool HasKey(std::string_view key) const;

    /// @brief Set a configuration value
    void Set(std::string_view key, ConfigValue value);

private:
    YAML::Node root_;

    /// @brief Navigate to a nested node using dot notation
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

}  // namespace promptshield
