/// @file params.cpp
/// @brief Parameter validation

#include "query/params.h"

#include <algorithm>
#include <cmath>
#include <set>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/logging.h"

namespace wcopt::query {

using json = nlohmann::json;

std::string_view ParamTypeName(ParamType type) {
    switch (type) {
        case ParamType::kInteger: return "integer";
        case ParamType::kNumber: return "number";
        case ParamType::kString: return "string";
        case ParamType::kArray: return "array";
    }
    return "string";
}

namespace {

bool IsIntegral(const json& value) {
    if (value.is_number_integer()) {
        return true;
    }
    if (value.is_number_float()) {
        const double v = value.get<double>();
        return std::isfinite(v) && std::floor(v) == v;
    }
    return false;
}

absl::Status TypeMismatch(const ParamSpec& spec) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Parameter '", spec.name, "' must be of type ", std::string(ParamTypeName(spec.type))));
}

absl::StatusOr<json> Coerce(const ParamSpec& spec, const json& value) {
    switch (spec.type) {
        case ParamType::kInteger:
            if (!IsIntegral(value)) {
                return TypeMismatch(spec);
            }
            if (value.is_number_integer()) {
                return json(value.get<int64_t>());
            }
            return json(static_cast<int64_t>(value.get<double>()));
        case ParamType::kNumber:
            if (!value.is_number()) {
                return TypeMismatch(spec);
            }
            return json(value.get<double>());
        case ParamType::kString:
            if (!value.is_string()) {
                return TypeMismatch(spec);
            }
            if (!spec.choices.empty() &&
                std::find(spec.choices.begin(), spec.choices.end(),
                          value.get<std::string>()) == spec.choices.end()) {
                return absl::InvalidArgumentError(absl::StrCat(
                    "Parameter '", spec.name, "' must be one of: ",
                    absl::StrJoin(spec.choices, ", ")));
            }
            return value;
        case ParamType::kArray:
            if (!value.is_array()) {
                return TypeMismatch(spec);
            }
            for (const auto& item : value) {
                if (!item.is_string()) {
                    return absl::InvalidArgumentError(absl::StrCat(
                        "Parameter '", spec.name, "' must be an array of strings"));
                }
            }
            return value;
    }
    return TypeMismatch(spec);
}

}  // namespace

absl::StatusOr<Params> Params::Bind(const std::vector<ParamSpec>& schema, const json& input) {
    if (!input.is_null() && !input.is_object()) {
        return absl::InvalidArgumentError("Parameters must be a JSON object");
    }

    json values = json::object();
    std::set<std::string> known;
    for (const auto& spec : schema) {
        known.insert(spec.name);
        const bool given = input.is_object() && input.contains(spec.name) &&
                           !input.at(spec.name).is_null();
        if (!given) {
            if (spec.required) {
                return absl::InvalidArgumentError(
                    absl::StrCat("Missing required parameter '", spec.name, "'"));
            }
            if (!spec.default_value.is_null()) {
                values[spec.name] = spec.default_value;
            }
            continue;
        }

        auto coerced = Coerce(spec, input.at(spec.name));
        if (!coerced.ok()) {
            return coerced.status();
        }
        if (spec.minimum && coerced->is_number() && coerced->get<double>() < *spec.minimum) {
            return absl::InvalidArgumentError(absl::StrCat(
                "Parameter '", spec.name, "' must be at least ", *spec.minimum));
        }
        values[spec.name] = std::move(coerced).value();
    }

    if (input.is_object()) {
        for (const auto& [key, value] : input.items()) {
            if (known.count(key) == 0) {
                WCOPT_LOG_DEBUG("Ignoring unknown parameter '{}'", key);
            }
        }
    }
    return Params(std::move(values));
}

const json* Params::Find(std::string_view name) const {
    auto it = values_.find(std::string(name));
    if (it == values_.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

bool Params::Has(std::string_view name) const {
    return Find(name) != nullptr;
}

std::optional<int64_t> Params::Integer(std::string_view name) const {
    const json* value = Find(name);
    if (value == nullptr || !value->is_number()) {
        return std::nullopt;
    }
    return value->get<int64_t>();
}

std::optional<double> Params::Number(std::string_view name) const {
    const json* value = Find(name);
    if (value == nullptr || !value->is_number()) {
        return std::nullopt;
    }
    return value->get<double>();
}

std::optional<std::string> Params::String(std::string_view name) const {
    const json* value = Find(name);
    if (value == nullptr || !value->is_string()) {
        return std::nullopt;
    }
    return value->get<std::string>();
}

std::vector<std::string> Params::StringList(std::string_view name) const {
    const json* value = Find(name);
    if (value == nullptr || !value->is_array()) {
        return {};
    }
    return value->get<std::vector<std::string>>();
}

size_t Params::Count(std::string_view name, size_t fallback) const {
    auto value = Integer(name);
    if (!value || *value < 0) {
        return fallback;
    }
    return static_cast<size_t>(*value);
}

}  // namespace wcopt::query
