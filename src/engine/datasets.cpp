/// @file datasets.cpp
/// @brief Dataset category table

#include "engine/datasets.h"

#include <absl/strings/str_join.h>

namespace wcopt::engine {

namespace {

struct DatasetInfo {
    Dataset dataset;
    const char* table;
    std::vector<std::string> required;
    std::vector<std::string> optional;
};

const std::vector<DatasetInfo>& Infos() {
    static const std::vector<DatasetInfo> infos = {
        {Dataset::kProducts, "products",
         {"product_id"},
         {"product_name", "category", "unit_cost", "unit_price", "lead_time_days",
          "economic_order_qty", "abc_class", "xyz_class"}},
        {Dataset::kCustomers, "customers",
         {"customer_id"},
         {"customer_name", "segment", "ytd_revenue", "avg_days_to_pay"}},
        {Dataset::kSuppliers, "suppliers",
         {"supplier_id", "supplier_name"},
         {"avg_lead_time_days", "on_time_delivery_rate", "quality_rejection_rate", "rating",
          "risk_score", "country", "contracted_payment_days"}},
        {Dataset::kInventorySnapshot, "inventory_snapshot",
         {"product_id", "snapshot_date", "qty_on_hand", "reorder_point"},
         {"location_id", "unit_cost", "inventory_value", "safety_stock_target", "stock_status",
          "days_of_supply", "days_since_last_movement"}},
        {Dataset::kSalesTransactions, "sales_transactions",
         {"product_id", "transaction_date", "qty_sold", "total_revenue"},
         {"customer_id", "total_cost", "gross_profit"}},
        {Dataset::kPurchaseOrders, "purchase_orders",
         {"supplier_id", "product_id"},
         {"po_number", "qty_ordered", "total_po_value", "order_date"}},
        {Dataset::kArLedger, "ar_ledger",
         {"customer_id", "invoice_amount", "due_date"},
         {"days_to_pay", "paid_date", "aging_bucket", "is_overdue", "dispute_flag",
          "write_off_flag"}},
        {Dataset::kApLedger, "ap_ledger",
         {"supplier_id", "invoice_amount", "due_date"},
         {"actual_days_to_pay", "early_payment_discount"}},
        {Dataset::kShipments, "shipments",
         {"shipment_id", "status"},
         {"supplier_id", "product_id", "ship_date", "expected_arrival_date", "qty_shipped",
          "carrier", "freight_cost", "delay_days"}},
    };
    return infos;
}

const DatasetInfo& Info(Dataset dataset) {
    return Infos()[static_cast<size_t>(dataset)];
}

}  // namespace

const std::vector<Dataset>& AllDatasets() {
    static const std::vector<Dataset> all = [] {
        std::vector<Dataset> v;
        for (const auto& info : Infos()) {
            v.push_back(info.dataset);
        }
        return v;
    }();
    return all;
}

std::string_view TableName(Dataset dataset) {
    return Info(dataset).table;
}

std::optional<Dataset> ParseDataset(std::string_view name) {
    for (const auto& info : Infos()) {
        if (name == info.table) {
            return info.dataset;
        }
    }
    return std::nullopt;
}

const std::vector<std::string>& RequiredColumns(Dataset dataset) {
    return Info(dataset).required;
}

const std::vector<std::string>& OptionalColumns(Dataset dataset) {
    return Info(dataset).optional;
}

bool FeedsGraph(Dataset dataset) {
    return dataset == Dataset::kSuppliers || dataset == Dataset::kPurchaseOrders;
}

std::string AllTableNames() {
    std::vector<absl::string_view> names;
    for (const auto& info : Infos()) {
        names.emplace_back(info.table);
    }
    return absl::StrJoin(names, ", ");
}

}  // namespace wcopt::engine
