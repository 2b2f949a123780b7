#pragma once

/// @file store_factory.h
/// @brief Store settings and construction of the configured backends

#include <memory>
#include <string>

#include <absl/status/statusor.h>

#include "common/config.h"
#include "storage/clickhouse/clickhouse_store.h"
#include "storage/falkordb/falkordb_store.h"
#include "storage/graph_store.h"
#include "storage/sqlite/sqlite_store.h"
#include "storage/tabular_store.h"

namespace wcopt::storage {

/// @brief Which backends to use and how to reach them
struct StoreSettings {
    /// "sqlite" or "clickhouse"
    std::string tabular_backend = "sqlite";
    SqliteConfig sqlite;
    ClickHouseConfig clickhouse;

    /// "memory" or "falkordb"
    std::string graph_backend = "memory";
    FalkorDbConfig falkordb;

    /// @brief Read the tabular.* and graph.* sections
    static absl::StatusOr<StoreSettings> FromConfig(const Config& config);
};

/// @brief Construct (not connect) the configured tabular store.
/// Unimplemented when the backend was not compiled in.
absl::StatusOr<std::unique_ptr<TabularStore>> CreateTabularStore(const StoreSettings& settings);

/// @brief Construct (not connect) the configured graph store
absl::StatusOr<std::unique_ptr<GraphStore>> CreateGraphStore(const StoreSettings& settings);

}  // namespace wcopt::storage
