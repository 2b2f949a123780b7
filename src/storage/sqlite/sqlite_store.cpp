/// @file sqlite_store.cpp
/// @brief SQLite tabular store implementation

#include "storage/sqlite/sqlite_store.h"

#include <atomic>
#include <cstdio>
#include <limits>
#include <mutex>
#include <unordered_set>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <sqlite3.h>

#include "common/error.h"
#include "common/logging.h"
#include "storage/identifier.h"
#include "storage/type_inference.h"

namespace wcopt::storage {

namespace {

std::atomic<int> g_memory_db_counter{0};

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/// @brief One open database handle, closed on every exit path
class Connection {
public:
    Connection() = default;
    ~Connection() {
        if (db_ != nullptr) {
            sqlite3_close_v2(db_);
        }
    }

    // Non-copyable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    absl::Status Open(const std::string& uri, std::chrono::milliseconds busy_timeout) {
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                    SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI;
        int rc = sqlite3_open_v2(uri.c_str(), &db_, flags, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db_ != nullptr ? sqlite3_errmsg(db_) : "sqlite open failed";
            if (db_ != nullptr) {
                sqlite3_close_v2(db_);
                db_ = nullptr;
            }
            return absl::UnavailableError(absl::StrCat("Failed to open SQLite database: ", msg));
        }
        sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count()));
        return absl::OkStatus();
    }

    absl::Status Exec(const std::string& sql) {
        char* err = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err != nullptr ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            return absl::InternalError(absl::StrCat("SQLite exec failed: ", msg));
        }
        return absl::OkStatus();
    }

    absl::StatusOr<StatementPtr> Prepare(const std::string& sql, const char** tail = nullptr) {
        sqlite3_stmt* raw = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, tail);
        StatementPtr stmt(raw);
        if (rc != SQLITE_OK) {
            return absl::InvalidArgumentError(
                absl::StrCat("SQLite prepare failed: ", sqlite3_errmsg(db_)));
        }
        return stmt;
    }

    sqlite3* get() const { return db_; }
    std::string ErrorMessage() const { return sqlite3_errmsg(db_); }

private:
    sqlite3* db_ = nullptr;
};

/// @brief Rolls back unless committed
class Transaction {
public:
    explicit Transaction(Connection& conn) : conn_(conn) {}
    ~Transaction() {
        if (active_ && !committed_) {
            absl::Status status = conn_.Exec("ROLLBACK");
            if (!status.ok()) {
                WCOPT_LOG_ERROR("SQLite rollback failed: {}", std::string(status.message()));
            }
        }
    }

    absl::Status Begin() {
        WCOPT_RETURN_IF_ERROR(conn_.Exec("BEGIN IMMEDIATE"));
        active_ = true;
        return absl::OkStatus();
    }

    absl::Status Commit() {
        WCOPT_RETURN_IF_ERROR(conn_.Exec("COMMIT"));
        committed_ = true;
        return absl::OkStatus();
    }

private:
    Connection& conn_;
    bool active_ = false;
    bool committed_ = false;
};

std::string FormatReal(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.15g", value);
    return buffer;
}

absl::Status BindParam(sqlite3_stmt* stmt, int index, const QueryParam& param) {
    int rc = SQLITE_OK;
    switch (param.type) {
        case QueryParam::Type::kText:
            rc = sqlite3_bind_text(stmt, index, param.text.data(),
                                   static_cast<int>(param.text.size()), SQLITE_TRANSIENT);
            break;
        case QueryParam::Type::kInteger:
            rc = sqlite3_bind_int64(stmt, index, param.integer);
            break;
        case QueryParam::Type::kReal:
            rc = sqlite3_bind_double(stmt, index, param.real);
            break;
        case QueryParam::Type::kNull:
            rc = sqlite3_bind_null(stmt, index);
            break;
    }
    if (rc != SQLITE_OK) {
        return absl::InternalError(absl::StrCat("Failed to bind parameter ", index));
    }
    return absl::OkStatus();
}

Cell ReadCell(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_NULL:
            return std::nullopt;
        case SQLITE_INTEGER:
            return std::to_string(sqlite3_column_int64(stmt, col));
        case SQLITE_FLOAT:
            return FormatReal(sqlite3_column_double(stmt, col));
        default: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            int len = sqlite3_column_bytes(stmt, col);
            return std::string(text != nullptr ? text : "", static_cast<size_t>(len));
        }
    }
}

/// @brief Step a prepared statement, keeping at most max_rows rows
absl::StatusOr<QueryResult> Collect(Connection& conn, sqlite3_stmt* stmt, size_t max_rows) {
    QueryResult result;
    auto start = std::chrono::steady_clock::now();

    int columns = sqlite3_column_count(stmt);
    for (int i = 0; i < columns; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        result.table.columns.emplace_back(name != nullptr ? name : "");
    }

    while (true) {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            return absl::InternalError(absl::StrCat("SQLite query failed: ", conn.ErrorMessage()));
        }
        ++result.total_rows;
        if (result.table.rows.size() >= max_rows) {
            continue;
        }
        Row row;
        row.reserve(static_cast<size_t>(columns));
        for (int i = 0; i < columns; ++i) {
            row.push_back(ReadCell(stmt, i));
        }
        result.table.rows.push_back(std::move(row));
    }

    result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

const char* SqlType(ColumnKind kind) {
    switch (kind) {
        case ColumnKind::kInteger:
            return "INTEGER";
        case ColumnKind::kReal:
            return "REAL";
        case ColumnKind::kText:
        default:
            return "TEXT";
    }
}

QueryParam CellParam(const Cell& cell, ColumnKind kind) {
    if (IsBlankCell(cell)) {
        return QueryParam::Null();
    }
    const std::string& value = *cell;
    switch (kind) {
        case ColumnKind::kInteger:
            if (auto v = ParseIntegerCell(value)) {
                return QueryParam::Integer(*v);
            }
            break;
        case ColumnKind::kReal:
            if (auto v = ParseRealCell(value)) {
                return QueryParam::Real(*v);
            }
            break;
        case ColumnKind::kText:
            break;
    }
    return QueryParam::Text(value);
}

std::string UtcNow() {
    return absl::FormatTime("%Y-%m-%dT%H:%M:%SZ", absl::Now(), absl::UTCTimeZone());
}

}  // namespace

// =============================================================================
// SqliteStore Implementation
// =============================================================================

class SqliteStore::Impl {
public:
    explicit Impl(SqliteConfig config) : config_(std::move(config)) {
        if (config_.path == ":memory:" || config_.path.empty()) {
            uri_ = absl::StrCat("file:wcopt-mem-", g_memory_db_counter.fetch_add(1),
                                "?mode=memory&cache=shared");
            in_memory_ = true;
        } else {
            uri_ = config_.path;
        }
    }

    absl::Status Connect() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connected_) {
            return absl::OkStatus();
        }

        auto anchor = std::make_unique<Connection>();
        WCOPT_RETURN_IF_ERROR(anchor->Open(uri_, config_.busy_timeout));
        if (!in_memory_ && config_.wal) {
            WCOPT_RETURN_IF_ERROR(anchor->Exec("PRAGMA journal_mode=WAL"));
        }
        // Holds shared-cache memory databases open until Disconnect()
        anchor_ = std::move(anchor);
        connected_ = true;
        WCOPT_LOG_INFO("Opened SQLite store at {}", in_memory_ ? uri_ : config_.path);
        return absl::OkStatus();
    }

    absl::Status Disconnect() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) {
            return absl::OkStatus();
        }
        anchor_.reset();
        connected_ = false;
        WCOPT_LOG_DEBUG("Closed SQLite store");
        return absl::OkStatus();
    }

    bool IsConnected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    /// @brief Open a fresh connection for one call
    absl::Status Acquire(Connection& conn) {
        if (!IsConnected()) {
            return absl::FailedPreconditionError("Not connected to SQLite");
        }
        return conn.Open(uri_, config_.busy_timeout);
    }

    absl::StatusOr<QueryResult> Query(const std::string& sql,
                                      const std::vector<QueryParam>& params,
                                      size_t max_rows) {
        Connection conn;
        WCOPT_RETURN_IF_ERROR(Acquire(conn));

        auto stmt_or = conn.Prepare(sql);
        if (!stmt_or.ok()) {
            return absl::InternalError(stmt_or.status().message());
        }
        StatementPtr stmt = std::move(*stmt_or);

        int expected = sqlite3_bind_parameter_count(stmt.get());
        if (expected != static_cast<int>(params.size())) {
            return absl::InternalError(absl::StrCat(
                "Query expects ", expected, " parameters, got ", params.size()));
        }
        for (size_t i = 0; i < params.size(); ++i) {
            WCOPT_RETURN_IF_ERROR(BindParam(stmt.get(), static_cast<int>(i + 1), params[i]));
        }

        auto result = Collect(conn, stmt.get(), max_rows);
        if (result.ok()) {
            WCOPT_LOG_DEBUG("SQLite query returned {} rows in {}ms",
                            result->total_rows, result->execution_time.count());
        }
        return result;
    }

    absl::StatusOr<QueryResult> QueryReadOnly(const std::string& sql, size_t max_rows) {
        Connection conn;
        WCOPT_RETURN_IF_ERROR(Acquire(conn));

        const char* tail = nullptr;
        WCOPT_ASSIGN_OR_RETURN(StatementPtr stmt, conn.Prepare(sql, &tail));
        if (stmt == nullptr) {
            return absl::InvalidArgumentError("Query contains no statement");
        }
        if (tail != nullptr && !absl::StripAsciiWhitespace(absl::string_view(tail)).empty() &&
            absl::StripAsciiWhitespace(absl::string_view(tail)) != ";") {
            return absl::InvalidArgumentError("Multiple statements are not allowed");
        }
        if (sqlite3_stmt_readonly(stmt.get()) == 0) {
            return absl::InvalidArgumentError("Only read-only statements are allowed");
        }
        return Collect(conn, stmt.get(), max_rows);
    }

    absl::Status ReplaceTable(std::string_view table, const Table& data) {
        WCOPT_RETURN_IF_ERROR(ValidateIdentifier(table, "table name"));
        if (data.columns.empty()) {
            return absl::InvalidArgumentError("Cannot create a table without columns");
        }
        std::unordered_set<std::string> seen;
        for (const auto& column : data.columns) {
            WCOPT_RETURN_IF_ERROR(ValidateIdentifier(column, "column name"));
            if (!seen.insert(absl::AsciiStrToLower(column)).second) {
                return absl::InvalidArgumentError(absl::StrCat("Duplicate column '", column, "'"));
            }
        }

        std::vector<ColumnKind> kinds;
        std::vector<std::string> definitions;
        for (size_t i = 0; i < data.columns.size(); ++i) {
            kinds.push_back(InferColumnKind(data, i));
            definitions.push_back(absl::StrCat(QuoteIdentifier(data.columns[i]), " ", SqlType(kinds[i])));
        }

        Connection conn;
        WCOPT_RETURN_IF_ERROR(Acquire(conn));
        Transaction txn(conn);
        WCOPT_RETURN_IF_ERROR(txn.Begin());

        const std::string quoted = QuoteIdentifier(table);
        WCOPT_RETURN_IF_ERROR(conn.Exec(absl::StrCat("DROP TABLE IF EXISTS ", quoted)));
        WCOPT_RETURN_IF_ERROR(conn.Exec(
            absl::StrCat("CREATE TABLE ", quoted, " (", absl::StrJoin(definitions, ", "), ")")));

        std::vector<std::string> placeholders(data.columns.size(), "?");
        const std::string insert_sql = absl::StrCat(
            "INSERT INTO ", quoted, " VALUES (", absl::StrJoin(placeholders, ", "), ")");
        WCOPT_ASSIGN_OR_RETURN(StatementPtr insert, conn.Prepare(insert_sql));

        for (const auto& row : data.rows) {
            sqlite3_reset(insert.get());
            sqlite3_clear_bindings(insert.get());
            for (size_t i = 0; i < data.columns.size(); ++i) {
                Cell cell = i < row.size() ? row[i] : Cell{};
                WCOPT_RETURN_IF_ERROR(
                    BindParam(insert.get(), static_cast<int>(i + 1), CellParam(cell, kinds[i])));
            }
            if (sqlite3_step(insert.get()) != SQLITE_DONE) {
                return absl::InternalError(
                    absl::StrCat("Insert into ", absl::string_view(table.data(), table.size()), " failed: ", conn.ErrorMessage()));
            }
        }
        insert.reset();

        WCOPT_RETURN_IF_ERROR(txn.Commit());
        WCOPT_LOG_DEBUG("Replaced table {} with {} rows", table, data.rows.size());
        return absl::OkStatus();
    }

    absl::StatusOr<UploadRecord> RecordUpload(UploadRecord record) {
        Connection conn;
        WCOPT_RETURN_IF_ERROR(Acquire(conn));
        WCOPT_RETURN_IF_ERROR(conn.Exec(absl::StrCat(
            "CREATE TABLE IF NOT EXISTS ", absl::string_view(kUploadHistoryTable.data(), kUploadHistoryTable.size()),
            " (id INTEGER PRIMARY KEY AUTOINCREMENT, file_category TEXT, filename TEXT,"
            " upload_timestamp TEXT, row_count INTEGER, status TEXT)")));

        if (record.uploaded_at.empty()) {
            record.uploaded_at = UtcNow();
        }

        WCOPT_ASSIGN_OR_RETURN(StatementPtr stmt, conn.Prepare(absl::StrCat(
            "INSERT INTO ", absl::string_view(kUploadHistoryTable.data(), kUploadHistoryTable.size()),
            " (file_category, filename, upload_timestamp, row_count, status) VALUES (?, ?, ?, ?, ?)")));
        const std::vector<QueryParam> params = {
            QueryParam::Text(record.category),
            QueryParam::Text(record.filename),
            QueryParam::Text(record.uploaded_at),
            QueryParam::Integer(static_cast<int64_t>(record.row_count)),
            QueryParam::Text(record.status),
        };
        for (size_t i = 0; i < params.size(); ++i) {
            WCOPT_RETURN_IF_ERROR(BindParam(stmt.get(), static_cast<int>(i + 1), params[i]));
        }
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            return absl::InternalError(
                absl::StrCat("Failed to record upload: ", conn.ErrorMessage()));
        }
        record.id = sqlite3_last_insert_rowid(conn.get());
        return record;
    }

    std::string uri() const { return uri_; }

private:
    SqliteConfig config_;
    std::string uri_;
    bool in_memory_ = false;

    mutable std::mutex mutex_;
    bool connected_ = false;
    std::unique_ptr<Connection> anchor_;
};

// =============================================================================
// SqliteStore Public Interface
// =============================================================================

SqliteStore::SqliteStore(SqliteConfig config)
    : config_(std::move(config)), impl_(std::make_unique<Impl>(config_)) {}

SqliteStore::~SqliteStore() = default;

absl::Status SqliteStore::Connect() {
    return impl_->Connect();
}

absl::Status SqliteStore::Disconnect() {
    return impl_->Disconnect();
}

bool SqliteStore::IsConnected() const {
    return impl_->IsConnected();
}

absl::StatusOr<std::vector<std::string>> SqliteStore::ListTables() {
    WCOPT_ASSIGN_OR_RETURN(QueryResult result, Query(
        "SELECT name FROM sqlite_master WHERE type = 'table' "
        "AND name NOT LIKE 'sqlite_%' ORDER BY name"));
    std::vector<std::string> tables;
    for (const auto& row : result.table.rows) {
        if (!row.empty() && row[0].has_value()) {
            tables.push_back(*row[0]);
        }
    }
    return tables;
}

absl::StatusOr<bool> SqliteStore::HasTable(std::string_view table) {
    WCOPT_ASSIGN_OR_RETURN(QueryResult result, Query(
        "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?",
        {QueryParam::Text(std::string(table))}));
    return !result.table.rows.empty();
}

absl::StatusOr<size_t> SqliteStore::CountRows(std::string_view table) {
    WCOPT_RETURN_IF_ERROR(ValidateIdentifier(table, "table name"));
    WCOPT_ASSIGN_OR_RETURN(QueryResult result,
                           Query(absl::StrCat("SELECT COUNT(*) FROM ", QuoteIdentifier(table))));
    if (result.table.rows.empty() || !result.table.rows[0][0].has_value()) {
        return 0;
    }
    return static_cast<size_t>(std::stoll(*result.table.rows[0][0]));
}

absl::StatusOr<std::vector<ColumnInfo>> SqliteStore::DescribeTable(std::string_view table) {
    WCOPT_RETURN_IF_ERROR(ValidateIdentifier(table, "table name"));
    WCOPT_ASSIGN_OR_RETURN(QueryResult result,
                           Query(absl::StrCat("PRAGMA table_info(", QuoteIdentifier(table), ")")));

    auto name_idx = result.table.ColumnIndex("name");
    auto type_idx = result.table.ColumnIndex("type");
    auto notnull_idx = result.table.ColumnIndex("notnull");
    if (!name_idx || !type_idx || !notnull_idx) {
        return absl::InternalError("Unexpected table_info layout");
    }

    std::vector<ColumnInfo> columns;
    for (const auto& row : result.table.rows) {
        ColumnInfo info;
        info.name = row[*name_idx].value_or("");
        info.type = row[*type_idx].value_or("");
        info.nullable = row[*notnull_idx].value_or("0") == "0";
        columns.push_back(std::move(info));
    }
    return columns;
}

absl::StatusOr<QueryResult> SqliteStore::Query(const std::string& sql,
                                               const std::vector<QueryParam>& params) {
    return impl_->Query(sql, params, std::numeric_limits<size_t>::max());
}

absl::StatusOr<QueryResult> SqliteStore::QueryReadOnly(const std::string& sql, size_t max_rows) {
    return impl_->QueryReadOnly(sql, max_rows);
}

absl::Status SqliteStore::ReplaceTable(std::string_view table, const Table& data) {
    return impl_->ReplaceTable(table, data);
}

absl::StatusOr<UploadRecord> SqliteStore::RecordUpload(UploadRecord record) {
    return impl_->RecordUpload(std::move(record));
}

absl::StatusOr<std::vector<UploadRecord>> SqliteStore::UploadHistory() {
    WCOPT_ASSIGN_OR_RETURN(bool exists, HasTable(kUploadHistoryTable));
    std::vector<UploadRecord> history;
    if (!exists) {
        return history;
    }

    WCOPT_ASSIGN_OR_RETURN(QueryResult result, Query(absl::StrCat(
        "SELECT id, file_category, filename, upload_timestamp, row_count, status FROM ",
        absl::string_view(kUploadHistoryTable.data(), kUploadHistoryTable.size()), " ORDER BY upload_timestamp DESC, id DESC")));
    for (const auto& row : result.table.rows) {
        UploadRecord record;
        record.id = row[0] ? std::stoll(*row[0]) : 0;
        record.category = row[1].value_or("");
        record.filename = row[2].value_or("");
        record.uploaded_at = row[3].value_or("");
        record.row_count = row[4] ? static_cast<size_t>(std::stoll(*row[4])) : 0;
        record.status = row[5].value_or("");
        history.push_back(std::move(record));
    }
    return history;
}

}  // namespace wcopt::storage
