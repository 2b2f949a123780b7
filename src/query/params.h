#pragma once

/// @file params.h
/// @brief Typed parameter schema of the analyses and validation of JSON input

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

namespace wcopt::query {

enum class ParamType {
    kInteger,
    kNumber,
    kString,
    kArray,  ///< Array of strings
};

std::string_view ParamTypeName(ParamType type);

/// @brief One declared parameter
struct ParamSpec {
    std::string name;
    ParamType type = ParamType::kString;
    std::string description;
    nlohmann::json default_value;  ///< null when there is no fixed default
    bool required = false;
    /// Accepted values for string parameters; empty accepts anything
    std::vector<std::string> choices;
    /// Lower bound for numeric parameters
    std::optional<double> minimum;
};

/// @brief Parameters checked against a schema, defaults filled in.
///
/// Accessors return nullopt for parameters that were neither given nor
/// defaulted. Keys not named by the schema are dropped.
class Params {
public:
    Params() = default;

    /// @brief InvalidArgument on a non-object input, a missing required
    /// parameter, a type mismatch or a value outside the declared range
    static absl::StatusOr<Params> Bind(const std::vector<ParamSpec>& schema,
                                       const nlohmann::json& input);

    bool Has(std::string_view name) const;

    std::optional<int64_t> Integer(std::string_view name) const;
    std::optional<double> Number(std::string_view name) const;
    std::optional<std::string> String(std::string_view name) const;

    /// @brief Empty when absent
    std::vector<std::string> StringList(std::string_view name) const;

    /// @brief Integer parameter as a count, else the fallback
    size_t Count(std::string_view name, size_t fallback) const;

    const nlohmann::json& Values() const { return values_; }

private:
    explicit Params(nlohmann::json values) : values_(std::move(values)) {}

    const nlohmann::json* Find(std::string_view name) const;

    nlohmann::json values_ = nlohmann::json::object();
};

}  // namespace wcopt::query
