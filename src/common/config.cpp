#include "config.h"

#include <cstdlib>
#include <functional>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

namespace wcopt {

namespace {

nlohmann::json ScalarToJson(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    if (node.Tag() == "!") {
        // Quoted in the source document
        return text;
    }
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) {
        return b;
    }
    int64_t i = 0;
    if (YAML::convert<int64_t>::decode(node, i)) {
        return i;
    }
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) {
        return d;
    }
    return text;
}

nlohmann::json NodeToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& kv : node) {
                object[kv.first.as<std::string>()] = NodeToJson(kv.second);
            }
            return object;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(NodeToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Scalar:
            return ScalarToJson(node);
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return nullptr;
    }
}

}  // namespace

const std::vector<EnvBinding>& DefaultEnvBindings() {
    static const std::vector<EnvBinding> kBindings = {
        {"LOG_LEVEL", "logging.level"},
        {"LOG_FILE", "logging.file"},
        {"TABULAR_BACKEND", "tabular.backend"},
        {"SQLITE_PATH", "tabular.sqlite.path"},
        {"CLICKHOUSE_HOST", "tabular.clickhouse.host"},
        {"CLICKHOUSE_PORT", "tabular.clickhouse.port"},
        {"CLICKHOUSE_DATABASE", "tabular.clickhouse.database"},
        {"CLICKHOUSE_USER", "tabular.clickhouse.user"},
        {"CLICKHOUSE_PASSWORD", "tabular.clickhouse.password"},
        {"GRAPH_BACKEND", "graph.backend"},
        {"FALKORDB_HOST", "graph.falkordb.host"},
        {"FALKORDB_PORT", "graph.falkordb.port"},
        {"FALKORDB_GRAPH", "graph.falkordb.graph"},
        {"FALKORDB_PASSWORD", "graph.falkordb.password"},
        {"AS_OF", "engine.as_of"},
    };
    return kBindings;
}

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
            absl::StrCat("Failed to parse YAML configuration ", path.string(), ": ", e.what()));
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

Config Config::LoadFromEnvironment(std::string_view prefix,
                                   const std::vector<EnvBinding>& bindings) {
    Config config;
    for (const auto& binding : bindings) {
        const std::string name = absl::StrCat(absl::string_view(prefix.data(), prefix.size()), binding.variable);
        const char* value = std::getenv(name.c_str());
        if (value != nullptr && *value != '\0') {
            config.Set(binding.key, std::string(value));
        }
    }
    return config;
}

absl::StatusOr<Config> Config::Load(const std::optional<std::filesystem::path>& path,
                                    std::string_view env_prefix) {
    Config config;
    if (path.has_value()) {
        auto file_config = LoadFromFile(*path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config = std::move(*file_config);
    }
    config.Merge(LoadFromEnvironment(env_prefix));
    return config;
}

void Config::Merge(const Config& other) {
    if (!other.root_.IsMap()) {
        return;
    }
    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    std::function<void(YAML::Node, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node base, const YAML::Node& overlay) {
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            YAML::Node child = base[key];
            if (child.IsMap() && kv.second.IsMap()) {
                merge_nodes(child, kv.second);
            } else {
                base[key] = YAML::Clone(kv.second);
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');
    YAML::Node current;
    current.reset(root_);

    for (const auto& part : parts) {
        if (!current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& view = current;
        YAML::Node next = view[part];
        if (!next) {
            return std::nullopt;
        }
        current.reset(next);
    }

    if (!current || current.IsNull()) {
        return std::nullopt;
    }
    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->Scalar();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key);
    int64_t value = 0;
    if (node && node->IsScalar() && YAML::convert<int64_t>::decode(*node, value)) {
        return value;
    }
    return default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto node = GetNestedNode(key);
    double value = 0.0;
    if (node && node->IsScalar() && YAML::convert<double>::decode(*node, value)) {
        return value;
    }
    return default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto node = GetNestedNode(key);
    bool value = false;
    if (node && node->IsScalar() && YAML::convert<bool>::decode(*node, value)) {
        return value;
    }
    return default_value;
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key);
    if (!node) {
        return result;
    }
    if (node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.Scalar());
            }
        }
    } else if (node->IsScalar()) {
        // Comma-separated scalar, as set from the environment
        for (absl::string_view part : absl::StrSplit(node->Scalar(), ',', absl::SkipEmpty())) {
            result.emplace_back(part);
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

    YAML::Node current;
    current.reset(root_);
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
        } else {
            current[parts.back()] = val;
        }
    }, value);
}

nlohmann::json Config::ToJson() const {
    return NodeToJson(root_);
}

}  // namespace wcopt
