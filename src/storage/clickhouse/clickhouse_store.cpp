/// @file clickhouse_store.cpp
/// @brief ClickHouse tabular store implementation

#include "storage/clickhouse/clickhouse_store.h"

#include <cmath>
#include <cstdio>
#include <limits>
#include <mutex>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/string_view.h>
#include <absl/strings/strip.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <clickhouse/client.h>
#include <clickhouse/columns/nullable.h>
#include <clickhouse/columns/numeric.h>
#include <clickhouse/columns/string.h>

#include "common/error.h"
#include "common/logging.h"
#include "storage/identifier.h"
#include "storage/type_inference.h"

namespace wcopt::storage {

std::string ClickHouseLiteral(const QueryParam& param) {
    switch (param.type) {
        case QueryParam::Type::kNull:
            return "NULL";
        case QueryParam::Type::kInteger:
            return std::to_string(param.integer);
        case QueryParam::Type::kReal: {
            if (!std::isfinite(param.real)) {
                return "NULL";
            }
            char buffer[32];
            std::snprintf(buffer, sizeof(buffer), "%.17g", param.real);
            return buffer;
        }
        case QueryParam::Type::kText:
        default:
            break;
    }

    // SECURITY: comprehensive string escaping
    std::string escaped;
    escaped.reserve(param.text.size() + 10);
    escaped += "'";
    for (unsigned char c : param.text) {
        switch (c) {
            case '\'':
                escaped += "''";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\0':
                escaped += "\\0";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            case '\b':
                escaped += "\\b";
                break;
            default:
                if (c >= 32) {
                    escaped += static_cast<char>(c);
                }
                // Other control characters are skipped
                break;
        }
    }
    escaped += "'";
    return escaped;
}

absl::StatusOr<std::string> BindClickHouseParams(const std::string& sql,
                                                 const std::vector<QueryParam>& params) {
    std::string bound;
    bound.reserve(sql.size());
    size_t next = 0;
    char quote = 0;
    for (size_t i = 0; i < sql.size(); ++i) {
        char c = sql[i];
        if (quote != 0) {
            bound += c;
            if (c == '\\' && i + 1 < sql.size()) {
                bound += sql[++i];
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
            bound += c;
            continue;
        }
        if (c == '?') {
            if (next >= params.size()) {
                return absl::InvalidArgumentError("More placeholders than parameters");
            }
            bound += ClickHouseLiteral(params[next++]);
            continue;
        }
        bound += c;
    }
    if (next != params.size()) {
        return absl::InvalidArgumentError("More parameters than placeholders");
    }
    return bound;
}

namespace {

Cell ColumnValue(const clickhouse::ColumnRef& column, size_t row) {
    if (auto nullable = column->As<clickhouse::ColumnNullable>()) {
        if (nullable->IsNull(row)) {
            return std::nullopt;
        }
        return ColumnValue(nullable->Nested(), row);
    }
    if (auto str_col = column->As<clickhouse::ColumnString>()) {
        return std::string(str_col->At(row));
    }
    if (auto int64_col = column->As<clickhouse::ColumnInt64>()) {
        return std::to_string(int64_col->At(row));
    }
    if (auto uint64_col = column->As<clickhouse::ColumnUInt64>()) {
        return std::to_string(uint64_col->At(row));
    }
    if (auto int32_col = column->As<clickhouse::ColumnInt32>()) {
        return std::to_string(int32_col->At(row));
    }
    if (auto uint32_col = column->As<clickhouse::ColumnUInt32>()) {
        return std::to_string(uint32_col->At(row));
    }
    if (auto uint8_col = column->As<clickhouse::ColumnUInt8>()) {
        return std::to_string(uint8_col->At(row));
    }
    double real = 0.0;
    if (auto float64_col = column->As<clickhouse::ColumnFloat64>()) {
        real = float64_col->At(row);
    } else if (auto float32_col = column->As<clickhouse::ColumnFloat32>()) {
        real = float32_col->At(row);
    } else {
        return std::nullopt;
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.15g", real);
    return std::string(buffer);
}

const char* ClickHouseType(ColumnKind kind) {
    switch (kind) {
        case ColumnKind::kInteger:
            return "Nullable(Int64)";
        case ColumnKind::kReal:
            return "Nullable(Float64)";
        case ColumnKind::kText:
        default:
            return "Nullable(String)";
    }
}

clickhouse::ColumnRef BuildColumn(const Table& data, size_t index, ColumnKind kind) {
    auto nulls = std::make_shared<clickhouse::ColumnUInt8>();
    clickhouse::ColumnRef nested;

    auto ints = std::make_shared<clickhouse::ColumnInt64>();
    auto reals = std::make_shared<clickhouse::ColumnFloat64>();
    auto texts = std::make_shared<clickhouse::ColumnString>();

    for (const auto& row : data.rows) {
        Cell cell = index < row.size() ? row[index] : Cell{};
        bool blank = IsBlankCell(cell);
        nulls->Append(blank ? 1 : 0);
        switch (kind) {
            case ColumnKind::kInteger:
                ints->Append(blank ? 0 : ParseIntegerCell(*cell).value_or(0));
                break;
            case ColumnKind::kReal:
                reals->Append(blank ? 0.0 : ParseRealCell(*cell).value_or(0.0));
                break;
            case ColumnKind::kText:
                texts->Append(blank ? std::string() : *cell);
                break;
        }
    }

    switch (kind) {
        case ColumnKind::kInteger:
            nested = ints;
            break;
        case ColumnKind::kReal:
            nested = reals;
            break;
        case ColumnKind::kText:
        default:
            nested = texts;
            break;
    }
    return std::make_shared<clickhouse::ColumnNullable>(nested, nulls);
}

}  // namespace

// =============================================================================
// ClickHouseStore Implementation
// =============================================================================

class ClickHouseStore::Impl {
public:
    explicit Impl(ClickHouseConfig config) : config_(std::move(config)) {}

    absl::Status Connect() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (client_ != nullptr) {
            return absl::OkStatus();
        }

        try {
            clickhouse::ClientOptions options;
            options.SetHost(config_.host)
                   .SetPort(config_.port)
                   .SetUser(config_.user)
                   .SetPassword(config_.password)
                   .SetDefaultDatabase(config_.database)
                   .SetSendRetries(3)
                   .SetRetryTimeout(std::chrono::seconds(5))
                   .SetCompressionMethod(
                       config_.use_compression
                           ? clickhouse::CompressionMethod::LZ4
                           : clickhouse::CompressionMethod::None);

            client_ = std::make_unique<clickhouse::Client>(options);
            client_->Select("SELECT 1", [](const clickhouse::Block&) {});

            WCOPT_LOG_INFO("Connected to ClickHouse at {}:{}/{}",
                           config_.host, config_.port, config_.database);
            return absl::OkStatus();
        } catch (const std::exception& e) {
            client_.reset();
            return absl::UnavailableError(
                std::string("Failed to connect to ClickHouse: ") + e.what());
        }
    }

    absl::Status Disconnect() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (client_ == nullptr) {
            return absl::OkStatus();
        }
        client_.reset();
        WCOPT_LOG_INFO("Disconnected from ClickHouse");
        return absl::OkStatus();
    }

    bool IsConnected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return client_ != nullptr;
    }

    absl::StatusOr<QueryResult> Select(const std::string& sql, size_t max_rows) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (client_ == nullptr) {
            return absl::FailedPreconditionError("Not connected to ClickHouse");
        }

        QueryResult result;
        auto start_time = std::chrono::steady_clock::now();

        try {
            bool first_block = true;
            client_->Select(sql, [&](const clickhouse::Block& block) {
                if (first_block && block.GetColumnCount() > 0) {
                    for (size_t i = 0; i < block.GetColumnCount(); ++i) {
                        result.table.columns.push_back(block.GetColumnName(i));
                    }
                    first_block = false;
                }
                for (size_t row = 0; row < block.GetRowCount(); ++row) {
                    if (result.table.rows.size() < max_rows) {
                        Row row_data;
                        for (size_t col = 0; col < block.GetColumnCount(); ++col) {
                            row_data.push_back(ColumnValue(block[col], row));
                        }
                        result.table.rows.push_back(std::move(row_data));
                    }
                }
                result.total_rows += block.GetRowCount();
            });
        } catch (const std::exception& e) {
            return absl::InternalError(std::string("Query execution failed: ") + e.what());
        }

        result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        WCOPT_LOG_DEBUG("ClickHouse query executed in {}ms, {} rows",
                        result.execution_time.count(), result.total_rows);
        return result;
    }

    absl::Status Execute(const std::string& sql) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (client_ == nullptr) {
            return absl::FailedPreconditionError("Not connected to ClickHouse");
        }
        try {
            client_->Execute(sql);
            return absl::OkStatus();
        } catch (const std::exception& e) {
            return absl::InternalError(std::string("Statement failed: ") + e.what());
        }
    }

    absl::Status Insert(const std::string& table, const clickhouse::Block& block) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (client_ == nullptr) {
            return absl::FailedPreconditionError("Not connected to ClickHouse");
        }
        try {
            client_->Insert(table, block);
            return absl::OkStatus();
        } catch (const std::exception& e) {
            return absl::InternalError(std::string("Insert failed: ") + e.what());
        }
    }

private:
    ClickHouseConfig config_;
    mutable std::mutex mutex_;
    std::unique_ptr<clickhouse::Client> client_;
};

// =============================================================================
// ClickHouseStore Public Interface
// =============================================================================

ClickHouseStore::ClickHouseStore(ClickHouseConfig config)
    : config_(std::move(config)), impl_(std::make_unique<Impl>(config_)) {}

ClickHouseStore::~ClickHouseStore() = default;

absl::Status ClickHouseStore::Connect() {
    return impl_->Connect();
}

absl::Status ClickHouseStore::Disconnect() {
    return impl_->Disconnect();
}

bool ClickHouseStore::IsConnected() const {
    return impl_->IsConnected();
}

absl::StatusOr<std::vector<std::string>> ClickHouseStore::ListTables() {
    WCOPT_ASSIGN_OR_RETURN(QueryResult result, Query(
        "SELECT name FROM system.tables WHERE database = currentDatabase() ORDER BY name"));
    std::vector<std::string> tables;
    for (const auto& row : result.table.rows) {
        if (!row.empty() && row[0]) {
            tables.push_back(*row[0]);
        }
    }
    return tables;
}

absl::StatusOr<bool> ClickHouseStore::HasTable(std::string_view table) {
    WCOPT_ASSIGN_OR_RETURN(QueryResult result, Query(
        "SELECT 1 FROM system.tables WHERE database = currentDatabase() AND name = ?",
        {QueryParam::Text(std::string(table))}));
    return !result.table.rows.empty();
}

absl::StatusOr<size_t> ClickHouseStore::CountRows(std::string_view table) {
    WCOPT_RETURN_IF_ERROR(ValidateIdentifier(table, "table name"));
    WCOPT_ASSIGN_OR_RETURN(QueryResult result,
                           Query(absl::StrCat("SELECT count() FROM ", QuoteIdentifier(table))));
    if (result.table.rows.empty() || !result.table.rows[0][0]) {
        return 0;
    }
    return static_cast<size_t>(std::stoull(*result.table.rows[0][0]));
}

absl::StatusOr<std::vector<ColumnInfo>> ClickHouseStore::DescribeTable(std::string_view table) {
    WCOPT_ASSIGN_OR_RETURN(QueryResult result, Query(
        "SELECT name, type FROM system.columns "
        "WHERE database = currentDatabase() AND table = ? ORDER BY position",
        {QueryParam::Text(std::string(table))}));
    std::vector<ColumnInfo> columns;
    for (const auto& row : result.table.rows) {
        ColumnInfo info;
        info.name = row[0].value_or("");
        info.type = row[1].value_or("");
        info.nullable = absl::StartsWith(info.type, "Nullable(");
        columns.push_back(std::move(info));
    }
    return columns;
}

absl::StatusOr<QueryResult> ClickHouseStore::Query(const std::string& sql,
                                                   const std::vector<QueryParam>& params) {
    auto bound = BindClickHouseParams(sql, params);
    if (!bound.ok()) {
        return absl::InternalError(bound.status().message());
    }
    return impl_->Select(*bound, std::numeric_limits<size_t>::max());
}

absl::StatusOr<QueryResult> ClickHouseStore::QueryReadOnly(const std::string& sql,
                                                           size_t max_rows) {
    absl::string_view body = absl::StripTrailingAsciiWhitespace(sql);
    if (absl::ConsumeSuffix(&body, ";")) {
        body = absl::StripTrailingAsciiWhitespace(body);
    }
    if (body.empty()) {
        return absl::InvalidArgumentError("Query contains no statement");
    }
    if (body.find(';') != absl::string_view::npos) {
        return absl::InvalidArgumentError("Multiple statements are not allowed");
    }
    return impl_->Select(std::string(body), max_rows);
}

absl::Status ClickHouseStore::ReplaceTable(std::string_view table, const Table& data) {
    WCOPT_RETURN_IF_ERROR(ValidateIdentifier(table, "table name"));
    if (data.columns.empty()) {
        return absl::InvalidArgumentError("Cannot create a table without columns");
    }

    std::vector<std::string> definitions;
    clickhouse::Block block;
    for (size_t i = 0; i < data.columns.size(); ++i) {
        WCOPT_RETURN_IF_ERROR(ValidateIdentifier(data.columns[i], "column name"));
        ColumnKind kind = InferColumnKind(data, i);
        definitions.push_back(
            absl::StrCat(QuoteIdentifier(data.columns[i]), " ", ClickHouseType(kind)));
        block.AppendColumn(data.columns[i], BuildColumn(data, i, kind));
    }

    const std::string quoted = QuoteIdentifier(table);
    WCOPT_RETURN_IF_ERROR(impl_->Execute(absl::StrCat("DROP TABLE IF EXISTS ", quoted)));
    WCOPT_RETURN_IF_ERROR(impl_->Execute(absl::StrCat(
        "CREATE TABLE ", quoted, " (", absl::StrJoin(definitions, ", "),
        ") ENGINE = MergeTree ORDER BY tuple()")));
    if (!data.rows.empty()) {
        WCOPT_RETURN_IF_ERROR(impl_->Insert(std::string(table), block));
    }
    WCOPT_LOG_DEBUG("Replaced ClickHouse table {} with {} rows", table, data.rows.size());
    return absl::OkStatus();
}

absl::StatusOr<UploadRecord> ClickHouseStore::RecordUpload(UploadRecord record) {
    WCOPT_RETURN_IF_ERROR(impl_->Execute(absl::StrCat(
        "CREATE TABLE IF NOT EXISTS ", kUploadHistoryTable,
        " (id UInt64, file_category String, filename String, upload_timestamp String,"
        " row_count UInt64, status String) ENGINE = MergeTree ORDER BY id")));

    WCOPT_ASSIGN_OR_RETURN(QueryResult last,
                           Query(absl::StrCat("SELECT max(id) FROM ", kUploadHistoryTable)));
    int64_t next_id = 1;
    if (!last.table.rows.empty() && last.table.rows[0][0]) {
        next_id = std::stoll(*last.table.rows[0][0]) + 1;
    }
    record.id = next_id;
    if (record.uploaded_at.empty()) {
        record.uploaded_at =
            absl::FormatTime("%Y-%m-%dT%H:%M:%SZ", absl::Now(), absl::UTCTimeZone());
    }

    WCOPT_ASSIGN_OR_RETURN(std::string insert, BindClickHouseParams(
        absl::StrCat("INSERT INTO ", kUploadHistoryTable, " VALUES (?, ?, ?, ?, ?, ?)"),
        {QueryParam::Integer(record.id), QueryParam::Text(record.category),
         QueryParam::Text(record.filename), QueryParam::Text(record.uploaded_at),
         QueryParam::Integer(static_cast<int64_t>(record.row_count)),
         QueryParam::Text(record.status)}));
    WCOPT_RETURN_IF_ERROR(impl_->Execute(insert));
    return record;
}

absl::StatusOr<std::vector<UploadRecord>> ClickHouseStore::UploadHistory() {
    WCOPT_ASSIGN_OR_RETURN(bool exists, HasTable(kUploadHistoryTable));
    std::vector<UploadRecord> history;
    if (!exists) {
        return history;
    }
    WCOPT_ASSIGN_OR_RETURN(QueryResult result, Query(absl::StrCat(
        "SELECT id, file_category, filename, upload_timestamp, row_count, status FROM ",
        kUploadHistoryTable, " ORDER BY upload_timestamp DESC, id DESC")));
    for (const auto& row : result.table.rows) {
        UploadRecord record;
        record.id = row[0] ? std::stoll(*row[0]) : 0;
        record.category = row[1].value_or("");
        record.filename = row[2].value_or("");
        record.uploaded_at = row[3].value_or("");
        record.row_count = row[4] ? static_cast<size_t>(std::stoull(*row[4])) : 0;
        record.status = row[5].value_or("");
        history.push_back(std::move(record));
    }
    return history;
}

}  // namespace wcopt::storage
