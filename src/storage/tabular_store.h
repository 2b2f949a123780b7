#pragma once

/// @file tabular_store.h
/// @brief Interface of the store that holds the uploaded datasets

#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "storage/table.h"

namespace wcopt::storage {

/// @brief Tabular store holding one table per dataset category.
///
/// Tables are replaced wholesale; there is no incremental mutation API.
/// Implementations must be safe to call from several threads, each call
/// acquiring and releasing its own connection resources.
class TabularStore {
public:
    virtual ~TabularStore() = default;

    virtual absl::Status Connect() = 0;
    virtual absl::Status Disconnect() = 0;
    virtual bool IsConnected() const = 0;

    /// @brief Short backend identifier ("sqlite", "clickhouse")
    virtual std::string BackendName() const = 0;

    virtual absl::StatusOr<std::vector<std::string>> ListTables() = 0;
    virtual absl::StatusOr<bool> HasTable(std::string_view table) = 0;
    virtual absl::StatusOr<size_t> CountRows(std::string_view table) = 0;
    virtual absl::StatusOr<std::vector<ColumnInfo>> DescribeTable(std::string_view table) = 0;

    /// @brief Run a read query with positional '?' parameters
    virtual absl::StatusOr<QueryResult> Query(
        const std::string& sql,
        const std::vector<QueryParam>& params = {}) = 0;

    /// @brief Run caller-supplied SQL, refusing statements that write.
    /// At most max_rows rows are materialized; total_rows counts them all.
    virtual absl::StatusOr<QueryResult> QueryReadOnly(const std::string& sql,
                                                      size_t max_rows) = 0;

    /// @brief Drop and recreate a table from the given data
    virtual absl::Status ReplaceTable(std::string_view table, const Table& data) = 0;

    /// @brief Append to the upload-history log; id and timestamp are assigned
    virtual absl::StatusOr<UploadRecord> RecordUpload(UploadRecord record) = 0;

    /// @brief Upload-history log, newest first
    virtual absl::StatusOr<std::vector<UploadRecord>> UploadHistory() = 0;
};

}  // namespace wcopt::storage
