#pragma once

/// @file datasets.h
/// @brief The nine dataset categories and their column contracts

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wcopt::engine {

/// @brief Dataset category; each maps to one table of the same name
enum class Dataset {
    kProducts,
    kCustomers,
    kSuppliers,
    kInventorySnapshot,
    kSalesTransactions,
    kPurchaseOrders,
    kArLedger,
    kApLedger,
    kShipments,
};

/// @brief All categories in catalog order
const std::vector<Dataset>& AllDatasets();

/// @brief Table name of a category ("inventory_snapshot", ...)
std::string_view TableName(Dataset dataset);

/// @brief Category for a table name, nullopt when not one of the nine
std::optional<Dataset> ParseDataset(std::string_view name);

/// @brief Columns an upload of this category must carry
const std::vector<std::string>& RequiredColumns(Dataset dataset);

/// @brief Columns consumed when present
const std::vector<std::string>& OptionalColumns(Dataset dataset);

/// @brief True for categories mirrored into the graph store
bool FeedsGraph(Dataset dataset);

/// @brief Comma-separated list of every table name, for error messages
std::string AllTableNames();

}  // namespace wcopt::engine
