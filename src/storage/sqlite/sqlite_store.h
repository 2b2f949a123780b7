#pragma once

/// @file sqlite_store.h
/// @brief Embedded SQLite backend of the tabular store

#include <chrono>
#include <memory>
#include <string>

#include "storage/tabular_store.h"

namespace wcopt::storage {

/// @brief SQLite store configuration
struct SqliteConfig {
    /// Database file, or ":memory:" for a database private to this store
    std::string path = "wcopt.db";

    /// How long a call waits on a locked database before failing
    std::chrono::milliseconds busy_timeout{5000};

    /// Use write-ahead logging for file databases
    bool wal = true;
};

/// @brief Tabular store backed by SQLite.
///
/// Every call opens its own connection and closes it before returning, so
/// calls are independent and may run on different threads. An in-memory
/// database is kept alive by an anchor connection held between Connect()
/// and Disconnect().
class SqliteStore : public TabularStore {
public:
    explicit SqliteStore(SqliteConfig config);
    ~SqliteStore() override;

    // Non-copyable
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    absl::Status Connect() override;
    absl::Status Disconnect() override;
    bool IsConnected() const override;
    std::string BackendName() const override { return "sqlite"; }

    absl::StatusOr<std::vector<std::string>> ListTables() override;
    absl::StatusOr<bool> HasTable(std::string_view table) override;
    absl::StatusOr<size_t> CountRows(std::string_view table) override;
    absl::StatusOr<std::vector<ColumnInfo>> DescribeTable(std::string_view table) override;

    absl::StatusOr<QueryResult> Query(const std::string& sql,
                                      const std::vector<QueryParam>& params = {}) override;
    absl::StatusOr<QueryResult> QueryReadOnly(const std::string& sql,
                                              size_t max_rows) override;

    absl::Status ReplaceTable(std::string_view table, const Table& data) override;

    absl::StatusOr<UploadRecord> RecordUpload(UploadRecord record) override;
    absl::StatusOr<std::vector<UploadRecord>> UploadHistory() override;

    const SqliteConfig& GetConfig() const { return config_; }

private:
    SqliteConfig config_;
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace wcopt::storage
