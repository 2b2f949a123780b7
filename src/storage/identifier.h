#pragma once

/// @file identifier.h
/// @brief Validation of table/column identifiers interpolated into queries
///
/// SECURITY: values always travel as bound parameters. Identifiers cannot be
/// bound, so every identifier that reaches a query string passes through
/// these checks first.

#include <string>
#include <string_view>

#include <absl/status/status.h>

namespace wcopt::storage {

/// @brief Maximum accepted identifier length
inline constexpr size_t kMaxIdentifierLength = 128;

/// @brief True when the name is [A-Za-z_][A-Za-z0-9_]* and not too long
bool IsValidIdentifier(std::string_view name);

/// @brief InvalidArgument naming the offending identifier when invalid
absl::Status ValidateIdentifier(std::string_view name, std::string_view what = "identifier");

/// @brief Double-quote an identifier that already passed validation
std::string QuoteIdentifier(std::string_view name);

/// @brief Normalize a free-form header ("Unit Cost ($)") to an identifier
/// ("unit_cost"); returns an empty string when nothing usable remains.
std::string NormalizeColumnName(std::string_view header);

}  // namespace wcopt::storage
