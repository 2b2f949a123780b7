#pragma once

/// @file type_inference.h
/// @brief Column type inference for tables built from untyped uploads

#include <cstdint>
#include <optional>
#include <string_view>

#include "storage/table.h"

namespace wcopt::storage {

/// @brief Storage class chosen for a column
enum class ColumnKind {
    kInteger,
    kReal,
    kText,
};

/// @brief Parse a whole-string integer; "007"-style values are not integers
std::optional<int64_t> ParseIntegerCell(std::string_view value);

/// @brief Parse a whole-string finite decimal number
std::optional<double> ParseRealCell(std::string_view value);

/// @brief True for NULL and empty/whitespace-only cells
bool IsBlankCell(const Cell& cell);

/// @brief Narrowest kind that holds every non-blank value of the column.
/// A column with no values at all is text.
ColumnKind InferColumnKind(const Table& table, size_t column);

}  // namespace wcopt::storage
