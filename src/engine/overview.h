#pragma once

/// @file overview.h
/// @brief Dashboard, data quality and dataset inventory

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "engine/dataset_reader.h"
#include "engine/outcome.h"
#include "storage/graph_store.h"
#include "storage/table.h"
#include "storage/tabular_store.h"

namespace wcopt::engine {

// =============================================================================
// Dashboard
// =============================================================================

struct RevenueSection {
    double total_revenue = 0.0;
    double total_cost = 0.0;
    double gross_profit = 0.0;
    size_t transactions = 0;
    size_t unique_products = 0;
};

struct InventorySection {
    size_t unique_skus = 0;
    double total_units = 0.0;
    double total_value = 0.0;
    size_t stockouts = 0;
    size_t overstocked = 0;
};

struct SupplierSection {
    size_t count = 0;
    double avg_lead_time = 0.0;
    double avg_otd_rate = 0.0;
};

struct CustomerSection {
    size_t count = 0;
    double total_ytd_revenue = 0.0;
    double avg_days_to_pay = 0.0;
};

struct ReceivablesSection {
    size_t total_invoices = 0;
    size_t overdue = 0;
    double write_off_amount = 0.0;
};

struct PurchaseOrderSection {
    size_t count = 0;
    double total_qty = 0.0;
    double total_value = 0.0;
};

/// @brief One section per uploaded dataset it summarizes
struct Dashboard {
    std::optional<RevenueSection> revenue;
    std::optional<InventorySection> inventory;
    std::optional<SupplierSection> suppliers;
    std::optional<CustomerSection> customers;
    std::optional<ReceivablesSection> ar;
    std::optional<PurchaseOrderSection> purchase_orders;
};

// =============================================================================
// Data quality and dataset inventory
// =============================================================================

/// @brief max(0, 100 - 5 x columns_with_nulls - 2 x min(duplicates, 10))
int QualityScore(size_t columns_with_nulls, size_t duplicate_rows);

struct TableQuality {
    std::string table;
    size_t rows = 0;
    size_t columns = 0;
    std::map<std::string, size_t> null_counts;  ///< Only columns with nulls
    size_t duplicate_rows = 0;
    int quality_score = 100;
};

struct DataQualityReport {
    std::vector<TableQuality> tables;
};

struct UploadStatus {
    std::string category;
    std::string status;  ///< "uploaded" or "not_uploaded"
    std::optional<size_t> rows;
    std::optional<std::string> destination;
};

struct UploadListing {
    std::vector<UploadStatus> files;
};

struct SchemaInfo {
    std::string table;
    size_t rows = 0;
    std::vector<storage::ColumnInfo> columns;
    storage::Table sample;  ///< First 5 rows
};

struct TableCount {
    std::string category;
    size_t rows = 0;
    std::string status = "uploaded";
};

/// @brief Upload log when one exists, else the row counts of present tables
struct VersionHistory {
    size_t total_uploads = 0;
    std::vector<storage::UploadRecord> history;
    std::vector<TableCount> tables;
};

struct TableRefresh {
    std::string table;
    std::string status;  ///< "ok" or "not_loaded"
    std::optional<size_t> rows;
    std::optional<size_t> columns;
};

struct GraphRefresh {
    std::string backend;
    std::string status;  ///< "connected" or "unavailable"
    std::optional<storage::GraphCounts> counts;
    std::optional<std::string> error;
};

struct RefreshReport {
    std::string tabular_backend;
    std::vector<TableRefresh> tables;
    GraphRefresh graph;
};

struct ShipmentStatusSummary {
    std::string status;
    size_t count = 0;
    double total_qty = 0.0;
    double total_freight = 0.0;
    std::optional<double> avg_delay;
};

struct ShipmentTracking {
    std::vector<ShipmentStatusSummary> summary;
    /// Only filled when no status filter was given
    std::vector<ShipmentRecord> in_transit;
};

struct ProductCatalog {
    size_t total = 0;
    storage::Table products;
};

// =============================================================================
// OverviewEngine
// =============================================================================

class OverviewEngine {
public:
    OverviewEngine(storage::TabularStore& store, storage::GraphStore& graph);

    absl::StatusOr<Outcome<Dashboard>> GetDashboard();
    absl::StatusOr<Outcome<DataQualityReport>> GetDataQualityReport();
    absl::StatusOr<UploadListing> ListUploads();

    /// @brief table must be one of the dataset categories
    absl::StatusOr<Outcome<SchemaInfo>> GetSchemaInfo(const std::string& table);

    absl::StatusOr<Outcome<VersionHistory>> GetVersionHistory();
    absl::StatusOr<RefreshReport> GetRefreshReport();

    absl::StatusOr<Outcome<ShipmentTracking>> GetShipmentTracking(
        const std::optional<std::string>& status);

    /// @brief Filters are bound as query parameters
    absl::StatusOr<Outcome<ProductCatalog>> GetProductCatalog(
        const std::optional<std::string>& category, const std::optional<std::string>& abc_class);

private:
    storage::TabularStore& store_;
    storage::GraphStore& graph_;
    DatasetReader reader_;
};

}  // namespace wcopt::engine
