#pragma once

/// @file outcome.h
/// @brief Tagged results shared by every analysis

#include <string>
#include <variant>
#include <vector>

namespace wcopt::engine {

/// @brief Required datasets are absent or empty. Carries no metrics.
struct InsufficientData {
    std::string message;
    /// Table names of the missing categories
    std::vector<std::string> missing;
};

/// @brief Named entity (supplier, SKU) has no data
struct NotFound {
    std::string message;
};

/// @brief Analysis result: the record, or one of the two data-driven
/// non-results. Failures travel separately as absl::Status.
template <typename T>
using Outcome = std::variant<T, InsufficientData, NotFound>;

/// @brief Where a network answer came from
inline constexpr const char* kSourceGraph = "graph";
inline constexpr const char* kSourceTabular = "tabular";

}  // namespace wcopt::engine
