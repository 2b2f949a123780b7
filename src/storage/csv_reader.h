#pragma once

/// @file csv_reader.h
/// @brief RFC 4180 CSV parsing into a Table

#include <filesystem>
#include <string_view>

#include <absl/status/statusor.h>

#include "storage/table.h"

namespace wcopt::storage {

/// @brief Parse CSV text whose first record is the header.
///
/// Fields may be quoted with '"' (doubled quotes escape a quote) and may
/// then span lines. Records end with LF or CRLF. An unquoted empty field
/// is NULL, a quoted empty field is the empty string. Short records are
/// padded with NULLs; a record longer than the header is an error. A
/// leading UTF-8 byte order mark is skipped. Text that is not valid UTF-8
/// is rejected with the line it occurs on.
absl::StatusOr<Table> ParseCsv(std::string_view text);

/// @brief Read and parse a CSV file
absl::StatusOr<Table> ReadCsvFile(const std::filesystem::path& path);

}  // namespace wcopt::storage
