#pragma once

/// @file table.h
/// @brief Store-neutral row/column containers shared by every backend

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace wcopt::storage {

/// @brief One field value; nullopt is SQL NULL
using Cell = std::optional<std::string>;

/// @brief One row of cells, positionally aligned with Table::columns
using Row = std::vector<Cell>;

/// @brief Rectangular data set
struct Table {
    std::vector<std::string> columns;
    std::vector<Row> rows;

    /// @brief Position of a column, nullopt when absent
    std::optional<size_t> ColumnIndex(std::string_view name) const {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (columns[i] == name) {
                return i;
            }
        }
        return std::nullopt;
    }

    /// @brief Column name to position
    std::unordered_map<std::string, size_t> ColumnMap() const {
        std::unordered_map<std::string, size_t> map;
        for (size_t i = 0; i < columns.size(); ++i) {
            map.emplace(columns[i], i);
        }
        return map;
    }
};

/// @brief Positional bind value for '?' placeholders
struct QueryParam {
    enum class Type { kText, kInteger, kReal, kNull };

    Type type = Type::kNull;
    std::string text;
    int64_t integer = 0;
    double real = 0.0;

    static QueryParam Text(std::string v) {
        QueryParam p;
        p.type = Type::kText;
        p.text = std::move(v);
        return p;
    }
    static QueryParam Integer(int64_t v) {
        QueryParam p;
        p.type = Type::kInteger;
        p.integer = v;
        return p;
    }
    static QueryParam Real(double v) {
        QueryParam p;
        p.type = Type::kReal;
        p.real = v;
        return p;
    }
    static QueryParam Null() { return QueryParam{}; }
};

/// @brief Result of a query execution
struct QueryResult {
    Table table;
    /// Rows the statement produced before any cap was applied
    size_t total_rows = 0;
    std::chrono::milliseconds execution_time{0};
};

/// @brief Column description
struct ColumnInfo {
    std::string name;
    std::string type;
    bool nullable = true;
};

/// @brief One entry of the upload-history log
struct UploadRecord {
    int64_t id = 0;
    std::string category;
    std::string filename;
    /// ISO-8601 UTC timestamp
    std::string uploaded_at;
    size_t row_count = 0;
    std::string status = "success";
};

/// @brief Name of the upload-history table
inline constexpr std::string_view kUploadHistoryTable = "file_uploads";

}  // namespace wcopt::storage
