#include "storage/type_inference.h"

#include <cmath>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>

namespace wcopt::storage {

std::optional<int64_t> ParseIntegerCell(std::string_view value) {
    const absl::string_view stripped =
        absl::StripAsciiWhitespace(absl::string_view(value.data(), value.size()));
    value = std::string_view(stripped.data(), stripped.size());
    if (value.empty()) {
        return std::nullopt;
    }
    std::string_view digits = value;
    if (digits.front() == '-' || digits.front() == '+') {
        digits.remove_prefix(1);
    }
    // Leading zeros mark codes (zip, part numbers), not quantities
    if (digits.size() > 1 && digits.front() == '0') {
        return std::nullopt;
    }
    int64_t parsed = 0;
    if (!absl::SimpleAtoi(absl::string_view(value.data(), value.size()), &parsed)) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<double> ParseRealCell(std::string_view value) {
    const absl::string_view stripped =
        absl::StripAsciiWhitespace(absl::string_view(value.data(), value.size()));
    value = std::string_view(stripped.data(), stripped.size());
    if (value.empty()) {
        return std::nullopt;
    }
    std::string_view digits = value;
    if (digits.front() == '-' || digits.front() == '+') {
        digits.remove_prefix(1);
    }
    if (digits.size() > 1 && digits[0] == '0' && digits[1] != '.') {
        return std::nullopt;
    }
    double parsed = 0.0;
    if (!absl::SimpleAtod(absl::string_view(value.data(), value.size()), &parsed) || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

bool IsBlankCell(const Cell& cell) {
    return !cell.has_value() || absl::StripAsciiWhitespace(*cell).empty();
}

ColumnKind InferColumnKind(const Table& table, size_t column) {
    bool seen_value = false;
    bool all_integer = true;
    for (const auto& row : table.rows) {
        if (column >= row.size() || IsBlankCell(row[column])) {
            continue;
        }
        seen_value = true;
        const std::string& value = *row[column];
        if (all_integer && ParseIntegerCell(value).has_value()) {
            continue;
        }
        all_integer = false;
        if (!ParseRealCell(value).has_value()) {
            return ColumnKind::kText;
        }
    }
    if (!seen_value) {
        return ColumnKind::kText;
    }
    return all_integer ? ColumnKind::kInteger : ColumnKind::kReal;
}

}  // namespace wcopt::storage
