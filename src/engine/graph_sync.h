#pragma once

/// @file graph_sync.h
/// @brief One-way mirroring of suppliers and purchase orders into the graph

#include <cstddef>
#include <vector>

#include <absl/status/statusor.h>

#include "engine/dataset_reader.h"
#include "storage/graph_store.h"
#include "storage/tabular_store.h"

namespace wcopt::engine {

/// @brief Outcome of one sync pass
struct SyncReport {
    size_t suppliers_upserted = 0;
    size_t products_merged = 0;
    size_t relationships_merged = 0;
    size_t skipped_rows = 0;  ///< Rows with an empty supplier or product id
};

/// @brief Mirrors tabular rows into the graph store with MERGE semantics.
///
/// Re-running a sync over the same rows leaves the graph unchanged. The
/// first write failure aborts the pass and is returned.
class GraphSync {
public:
    explicit GraphSync(storage::GraphStore& graph) : graph_(graph) {}

    /// @brief Upsert one Supplier node per row
    absl::StatusOr<SyncReport> SyncSuppliers(const std::vector<SupplierRecord>& suppliers);

    /// @brief Merge Product and Supplier nodes, then a SUPPLIES edge, per row
    absl::StatusOr<SyncReport> SyncPurchaseOrders(const std::vector<PurchaseOrderRecord>& orders);

    /// @brief Clear the graph and rebuild it from the suppliers and
    /// purchase_orders tables that are present
    absl::StatusOr<SyncReport> Resync(storage::TabularStore& store);

private:
    storage::GraphStore& graph_;
};

}  // namespace wcopt::engine
