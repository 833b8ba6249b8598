#include "config.h"

#include <cstdlib>
#include <functional>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

namespace promptshield {

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    auto get_env = [&prefix](const char* suffix) -> std::optional<std::string> {
        std::string key = absl::StrCat(absl::string_view(prefix.data(), prefix.size()), suffix);
        const char* value = std::getenv(key.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };

    // Server settings
    if (auto val = get_env("HOST")) {
        config.Set("server.host", *val);
    }
    int64_t port = 0;
    if (auto val = get_env("PORT"); val && absl::SimpleAtoi(*val, &port)) {
        config.Set("server.port", port);
    }

    // Authentication
    if (auto val = get_env("API_KEYS")) {
        std::vector<std::string> keys =
            absl::StrSplit(*val, ',', absl::SkipWhitespace());
        for (auto& key : keys) {
            key = std::string(absl::StripAsciiWhitespace(key));
        }
        config.Set("auth.api_keys", keys);
    }

    // Request limits
    int64_t max_prompt_length = 0;
    if (auto val = get_env("MAX_PROMPT_LENGTH");
        val && absl::SimpleAtoi(*val, &max_prompt_length)) {
        config.Set("limits.max_prompt_length", max_prompt_length);
    }

    // Detector
    if (auto val = get_env("POLICY")) {
        config.Set("detector.policy", *val);
    }

    // Log level
    if (auto val = get_env("LOG_LEVEL")) {
        config.Set("logging.level", *val);
    }

    return config;
}

void Config::Merge(const Config& other) {
    // Deep merge YAML nodes
    std::function<void(YAML::Node, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node base, const YAML::Node& overlay) {
        if (!overlay.IsMap()) {
            return;
        }
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            YAML::Node base_child = base[key];
            if (base_child.IsMap() && kv.second.IsMap()) {
                merge_nodes(base_child, kv.second);
            } else {
                base[key] = kv.second;
            }
        }
    };

    if (!root_.IsMap() && other.root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }
    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');
    YAML::Node current(root_);

    for (const auto& part : parts) {
        if (!current.IsMap()) {
            return std::nullopt;
        }
        // Const access so lookups never insert keys
        const YAML::Node& parent = current;
        YAML::Node child = parent[part];
        if (!child) {
            return std::nullopt;
        }
        current.reset(child);
    }

    if (current.IsNull()) {
        return std::nullopt;
    }
    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->as<std::string>();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<int64_t>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<double>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<bool>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key);
    if (node && node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.as<std::string>());
            }
        }
    }
    return result;
}

absl::StatusOr<std::map<std::string, double>> Config::GetDoubleMap(
    std::string_view key) const {
    std::map<std::string, double> result;
    auto node = GetNestedNode(key);
    if (!node) {
        return result;
    }
    if (!node->IsMap()) {
        return absl::InvalidArgumentError(
            absl::StrCat("Configuration key '", absl::string_view(key.data(), key.size()), "' must be a mapping"));
    }
    for (const auto& kv : *node) {
        const std::string name = kv.first.as<std::string>();
        try {
            result[name] = kv.second.as<double>();
        } catch (const YAML::Exception&) {
            return absl::InvalidArgumentError(
                absl::StrCat("Configuration key '", absl::string_view(key.data(), key.size()), ".", name, "' must be a number"));
        }
    }
    return result;
}

std::map<std::string, std::vector<std::string>> Config::GetStringListMap(
    std::string_view key) const {
    std::map<std::string, std::vector<std::string>> result;
    auto node = GetNestedNode(key);
    if (!node || !node->IsMap()) {
        return result;
    }
    for (const auto& kv : *node) {
        auto& values = result[kv.first.as<std::string>()];
        if (kv.second.IsSequence()) {
            for (const auto& item : kv.second) {
                if (item.IsScalar()) {
                    values.push_back(item.as<std::string>());
                }
            }
        } else if (kv.second.IsScalar()) {
            values.push_back(kv.second.as<std::string>());
        }
    }
    return result;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    YAML::Node current(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node child = current[parts[i]];
        if (!child.IsMap()) {
            child = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(child);
    }

    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            current[parts.back()] = seq;
        } else if constexpr (std::is_same_v<T, std::unordered_map<std::string, std::string>>) {
            YAML::Node map(YAML::NodeType::Map);
            for (const auto& [k, v] : val) {
                map[k] = v;
            }
            current[parts.back()] = map;
        } else {
            current[parts.back()] = val;
        }
    }, value);
}

}  // namespace promptshield
