#pragma once

/// @file config.h
/// @brief Layered YAML configuration (file, then environment overlay)

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace wcopt {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// @brief Environment variable bound to a dotted configuration key
struct EnvBinding {
    /// Variable name without the prefix, e.g. "SQLITE_PATH"
    std::string variable;
    /// Dotted key the value is written to, e.g. "tabular.sqlite.path"
    std::string key;
};

/// @brief Environment bindings understood by wcopt
const std::vector<EnvBinding>& DefaultEnvBindings();

/// @brief Tree of configuration values with dot-notation lookup.
///
/// A Config is a value object: it is loaded once and handed to the
/// components that need it. Nothing in the engine reads the process
/// environment after startup.
class Config {
public:
    Config() = default;

    /// @brief Load configuration from a YAML file
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Collect the bound environment variables that are set
    /// @param prefix Variable prefix, e.g. "WCOPT_"
    /// @param bindings Variables to look for
    static Config LoadFromEnvironment(
        std::string_view prefix = "WCOPT_",
        const std::vector<EnvBinding>& bindings = DefaultEnvBindings());

    /// @brief File (optional) overlaid with the environment
    static absl::StatusOr<Config> Load(
        const std::optional<std::filesystem::path>& path,
        std::string_view env_prefix = "WCOPT_");

    /// @brief Merge another configuration into this one (other takes precedence)
    void Merge(const Config& other);

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    double GetDouble(std::string_view key, double default_value = 0.0) const;
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Get a list of strings, empty when the key is missing
    std::vector<std::string> GetStringList(std::string_view key) const;

    /// @brief Check if a key exists
    bool HasKey(std::string_view key) const;

    /// @brief Set a configuration value, creating intermediate maps
    void Set(std::string_view key, ConfigValue value);

    const YAML::Node& GetNode() const { return root_; }

    /// @brief Export configuration to JSON
    nlohmann::json ToJson() const;

private:
    YAML::Node root_;

    /// @brief Navigate to a nested node using dot notation
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

}  // namespace wcopt
