#pragma once

/// @file sql_gate.h
/// @brief Read-only gate in front of ad-hoc SQL

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "storage/table.h"
#include "storage/tabular_store.h"

namespace wcopt::query {

/// @brief Capped result of an ad-hoc query
struct SqlResult {
    size_t rows = 0;  ///< Rows the statement produced before capping
    std::vector<std::string> columns;
    std::vector<storage::Row> data;
};

/// @brief Screens caller-supplied SQL before handing it to the store.
///
/// A query is refused when it is empty, longer than kMaxQueryLength, or
/// contains any write keyword anywhere in its text (case-insensitive
/// substring match, so identifiers such as "created_at" are refused too).
/// The store then refuses anything it does not consider read-only.
class SqlGate {
public:
    static constexpr size_t kMaxQueryLength = 65536;  // 64 KB

    SqlGate(storage::TabularStore& store, size_t row_cap) : store_(store), row_cap_(row_cap) {}

    /// @brief Denylisted keywords, upper case
    static const std::vector<std::string>& BlockedKeywords();

    /// @brief First denylisted keyword contained in the query
    static std::optional<std::string> FindBlockedKeyword(std::string_view sql);

    /// @brief InvalidArgument for empty, write or oversized queries, checked in that order
    static absl::Status Screen(std::string_view sql);

    absl::StatusOr<SqlResult> Run(const std::string& sql);

    /// @brief Escape a value for log output only
    static std::string SanitizeForLogging(std::string_view value);

private:
    storage::TabularStore& store_;
    size_t row_cap_;
};

}  // namespace wcopt::query
