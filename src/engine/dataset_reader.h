#pragma once

/// @file dataset_reader.h
/// @brief Typed reads of the nine dataset tables

#include <optional>
#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/time/civil_time.h>

#include "engine/datasets.h"
#include "storage/tabular_store.h"

namespace wcopt::engine {

struct ProductRecord {
    std::string product_id;
    std::optional<std::string> product_name;
    std::optional<std::string> category;
    std::optional<double> unit_cost;
    std::optional<double> unit_price;
    std::optional<double> lead_time_days;
    std::optional<double> economic_order_qty;
    std::optional<std::string> abc_class;
    std::optional<std::string> xyz_class;
};

struct CustomerRecord {
    std::string customer_id;
    std::optional<std::string> customer_name;
    std::optional<std::string> segment;
    std::optional<double> ytd_revenue;
    std::optional<double> avg_days_to_pay;
};

struct SupplierRecord {
    std::string supplier_id;
    std::optional<std::string> supplier_name;
    std::optional<double> avg_lead_time_days;
    std::optional<double> on_time_delivery_rate;
    std::optional<double> quality_rejection_rate;
    std::optional<double> rating;
    std::optional<double> risk_score;
    std::optional<std::string> country;
    std::optional<double> contracted_payment_days;
};

/// @brief One row of the current (latest) inventory snapshot
struct InventoryRecord {
    std::string product_id;
    std::string snapshot_date;
    double qty_on_hand = 0.0;
    double reorder_point = 0.0;
    std::optional<std::string> location_id;
    std::optional<double> unit_cost;
    std::optional<double> inventory_value;
    std::optional<double> safety_stock_target;
    std::optional<std::string> stock_status;
    std::optional<double> days_of_supply;
    std::optional<double> days_since_last_movement;
};

struct SaleRecord {
    std::string product_id;
    std::optional<absl::CivilDay> transaction_date;
    double qty_sold = 0.0;
    double total_revenue = 0.0;
    std::optional<std::string> customer_id;
    std::optional<double> total_cost;
    std::optional<double> gross_profit;
};

struct PurchaseOrderRecord {
    std::string supplier_id;
    std::string product_id;
    std::optional<std::string> po_number;
    std::optional<double> qty_ordered;
    std::optional<double> total_po_value;
    std::optional<absl::CivilDay> order_date;
};

struct ArRecord {
    std::string customer_id;
    double invoice_amount = 0.0;
    std::optional<absl::CivilDay> due_date;
    std::optional<double> days_to_pay;
    std::optional<std::string> paid_date;
    std::optional<std::string> aging_bucket;
    bool is_overdue = false;
    bool dispute_flag = false;
    bool write_off_flag = false;
};

struct ApRecord {
    std::string supplier_id;
    double invoice_amount = 0.0;
    std::optional<absl::CivilDay> due_date;
    std::optional<double> actual_days_to_pay;
    std::optional<double> early_payment_discount;
};

struct ShipmentRecord {
    std::string shipment_id;
    std::string status;
    std::optional<std::string> supplier_id;
    std::optional<std::string> product_id;
    std::optional<std::string> ship_date;
    std::optional<std::string> expected_arrival_date;
    std::optional<double> qty_shipped;
    std::optional<std::string> carrier;
    std::optional<double> freight_cost;
    std::optional<double> delay_days;
};

/// @brief inventory_value, else qty_on_hand x unit_cost, else 0
double InventoryValueOf(const InventoryRecord& record);

/// @brief Explicit rating, else risk_score
std::optional<double> SupplierRatingOf(const SupplierRecord& record);

/// @brief Reads dataset tables into typed records.
///
/// Only existing columns are selected; absent optional columns read as
/// null. A table lacking a required column is a FailedPrecondition.
/// Blank required numeric cells read as 0.
class DatasetReader {
public:
    explicit DatasetReader(storage::TabularStore& store) : store_(store) {}

    /// @brief The requested columns of a table, in the requested order
    absl::StatusOr<storage::Table> ReadColumns(Dataset dataset,
                                               const std::vector<std::string>& columns,
                                               const std::string& where = "") const;

    /// @brief Every column of a table
    absl::StatusOr<storage::Table> ReadAll(Dataset dataset) const;

    absl::StatusOr<std::vector<ProductRecord>> Products() const;
    absl::StatusOr<std::vector<CustomerRecord>> Customers() const;
    absl::StatusOr<std::vector<SupplierRecord>> Suppliers() const;

    /// @brief Rows of the latest snapshot_date only
    absl::StatusOr<std::vector<InventoryRecord>> CurrentInventory() const;

    absl::StatusOr<std::vector<SaleRecord>> Sales() const;
    absl::StatusOr<std::vector<PurchaseOrderRecord>> PurchaseOrders() const;
    absl::StatusOr<std::vector<ArRecord>> ArLedger() const;
    absl::StatusOr<std::vector<ApRecord>> ApLedger() const;
    absl::StatusOr<std::vector<ShipmentRecord>> Shipments() const;

private:
    absl::StatusOr<storage::Table> ReadDataset(Dataset dataset, const std::string& where = "") const;

    storage::TabularStore& store_;
};

}  // namespace wcopt::engine
