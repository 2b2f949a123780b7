#pragma once

/// @file clickhouse_store.h
/// @brief ClickHouse backend of the tabular store

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "storage/tabular_store.h"

namespace wcopt::storage {

/// @brief ClickHouse client configuration
struct ClickHouseConfig {
    std::string host = "localhost";
    uint16_t port = 9000;
    std::string database = "wcopt";
    std::string user = "default";
    std::string password;

    std::chrono::seconds connection_timeout{30};

    bool use_compression = true;
};

/// @brief Tabular store backed by a ClickHouse server.
///
/// clickhouse-cpp has no server-side prepared statements for SELECT, so
/// '?' placeholders are replaced with type-aware escaped literals.
class ClickHouseStore : public TabularStore {
public:
    explicit ClickHouseStore(ClickHouseConfig config);
    ~ClickHouseStore() override;

    // Non-copyable
    ClickHouseStore(const ClickHouseStore&) = delete;
    ClickHouseStore& operator=(const ClickHouseStore&) = delete;

    absl::Status Connect() override;
    absl::Status Disconnect() override;
    bool IsConnected() const override;
    std::string BackendName() const override { return "clickhouse"; }

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

    const ClickHouseConfig& GetConfig() const { return config_; }

private:
    ClickHouseConfig config_;
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// @brief SECURITY: render a bind value as a ClickHouse literal
std::string ClickHouseLiteral(const QueryParam& param);

/// @brief Substitute '?' placeholders outside quoted text with literals.
/// InvalidArgument when the placeholder and parameter counts differ.
absl::StatusOr<std::string> BindClickHouseParams(const std::string& sql,
                                                 const std::vector<QueryParam>& params);

}  // namespace wcopt::storage
