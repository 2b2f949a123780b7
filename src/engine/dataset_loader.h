#pragma once

/// @file dataset_loader.h
/// @brief Validates an uploaded table and replaces its dataset

#include <optional>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>

#include "engine/graph_sync.h"
#include "storage/graph_store.h"
#include "storage/table.h"
#include "storage/tabular_store.h"

namespace wcopt::engine {

/// @brief Outcome of one upload
struct LoadReport {
    std::string category;
    std::string filename;
    size_t rows = 0;
    size_t columns = 0;
    int64_t upload_id = 0;
    std::string destination;  ///< "tabular" or "tabular + graph"
    /// Set for graph-fed categories when the graph sync ran
    std::optional<SyncReport> graph_sync;
    /// Set when the graph sync failed; the tabular write stands
    std::optional<std::string> graph_error;
};

/// @brief Loads one dataset category at a time.
///
/// Column headers are normalized to identifiers before the required-column
/// check. The table is replaced wholesale and the upload logged; suppliers
/// and purchase_orders are then mirrored into the graph when one is given.
class DatasetLoader {
public:
    DatasetLoader(storage::TabularStore& store, storage::GraphStore* graph)
        : store_(store), graph_(graph) {}

    absl::StatusOr<LoadReport> Load(std::string_view category, const std::string& filename,
                                    storage::Table table);

private:
    storage::TabularStore& store_;
    storage::GraphStore* graph_;
};

}  // namespace wcopt::engine
