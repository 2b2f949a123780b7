/// @file dataset_reader.cpp
/// @brief Typed dataset reads

#include "engine/dataset_reader.h"

#include <algorithm>
#include <unordered_set>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "engine/stats.h"
#include "storage/identifier.h"

namespace wcopt::engine {

using storage::Cell;
using storage::Row;
using storage::Table;

namespace {

/// @brief Name-based access to the cells of a read table
class RowView {
public:
    RowView(const Table& table, const Row& row) : table_(table), row_(row) {}

    const Cell& operator[](std::string_view column) const {
        static const Cell kNull;
        auto index = table_.ColumnIndex(column);
        if (!index || *index >= row_.size()) {
            return kNull;
        }
        return row_[*index];
    }

    std::string Text(std::string_view column) const { return (*this)[column].value_or(""); }
    std::optional<std::string> OptText(std::string_view column) const {
        return CellText((*this)[column]);
    }
    std::optional<double> Number(std::string_view column) const {
        return CellNumber((*this)[column]);
    }
    double NumberOr(std::string_view column, double fallback) const {
        return Number(column).value_or(fallback);
    }
    std::optional<absl::CivilDay> Day(std::string_view column) const {
        return CellDay((*this)[column]);
    }
    bool Flag(std::string_view column) const { return CellFlag((*this)[column]); }

private:
    const Table& table_;
    const Row& row_;
};

std::vector<std::string> DatasetColumns(Dataset dataset) {
    std::vector<std::string> columns = RequiredColumns(dataset);
    const auto& optional = OptionalColumns(dataset);
    columns.insert(columns.end(), optional.begin(), optional.end());
    return columns;
}

}  // namespace

double InventoryValueOf(const InventoryRecord& record) {
    if (record.inventory_value) {
        return *record.inventory_value;
    }
    if (record.unit_cost) {
        return record.qty_on_hand * *record.unit_cost;
    }
    return 0.0;
}

std::optional<double> SupplierRatingOf(const SupplierRecord& record) {
    return record.rating ? record.rating : record.risk_score;
}

absl::StatusOr<Table> DatasetReader::ReadColumns(Dataset dataset,
                                                 const std::vector<std::string>& columns,
                                                 const std::string& where) const {
    const std::string table_name(TableName(dataset));
    WCOPT_ASSIGN_OR_RETURN(auto described, store_.DescribeTable(table_name));

    std::unordered_set<std::string> existing;
    for (const auto& info : described) {
        existing.insert(info.name);
    }

    const auto& required = RequiredColumns(dataset);
    std::vector<std::string> selected;
    for (const auto& column : columns) {
        WCOPT_RETURN_IF_ERROR(storage::ValidateIdentifier(column, "column name"));
        if (existing.count(column) > 0) {
            selected.push_back(column);
        } else if (std::find(required.begin(), required.end(), column) != required.end()) {
            return absl::FailedPreconditionError(absl::StrCat(
                "Table ", table_name, " is missing required column ", column));
        }
    }

    Table result;
    result.columns = columns;
    if (selected.empty()) {
        return result;
    }

    std::vector<std::string> quoted;
    quoted.reserve(selected.size());
    for (const auto& column : selected) {
        quoted.push_back(storage::QuoteIdentifier(column));
    }
    std::string sql = absl::StrCat("SELECT ", absl::StrJoin(quoted, ", "), " FROM ",
                                   storage::QuoteIdentifier(table_name));
    if (!where.empty()) {
        absl::StrAppend(&sql, " WHERE ", where);
    }
    WCOPT_ASSIGN_OR_RETURN(storage::QueryResult queried, store_.Query(sql));

    std::vector<std::optional<size_t>> positions;
    positions.reserve(columns.size());
    for (const auto& column : columns) {
        positions.push_back(queried.table.ColumnIndex(column));
    }

    result.rows.reserve(queried.table.rows.size());
    for (auto& source : queried.table.rows) {
        Row row(columns.size());
        for (size_t i = 0; i < columns.size(); ++i) {
            if (positions[i] && *positions[i] < source.size()) {
                row[i] = std::move(source[*positions[i]]);
            }
        }
        result.rows.push_back(std::move(row));
    }
    return result;
}

absl::StatusOr<Table> DatasetReader::ReadAll(Dataset dataset) const {
    WCOPT_ASSIGN_OR_RETURN(storage::QueryResult queried, store_.Query(
        absl::StrCat("SELECT * FROM ", storage::QuoteIdentifier(TableName(dataset)))));
    return std::move(queried.table);
}

absl::StatusOr<Table> DatasetReader::ReadDataset(Dataset dataset, const std::string& where) const {
    return ReadColumns(dataset, DatasetColumns(dataset), where);
}

absl::StatusOr<std::vector<ProductRecord>> DatasetReader::Products() const {
    WCOPT_ASSIGN_OR_RETURN(Table table, ReadDataset(Dataset::kProducts));
    std::vector<ProductRecord> records;
    records.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        RowView r(table, row);
        ProductRecord rec;
        rec.product_id = r.Text("product_id");
        rec.product_name = r.OptText("product_name");
        rec.category = r.OptText("category");
        rec.unit_cost = r.Number("unit_cost");
        rec.unit_price = r.Number("unit_price");
        rec.lead_time_days = r.Number("lead_time_days");
        rec.economic_order_qty = r.Number("economic_order_qty");
        rec.abc_class = r.OptText("abc_class");
        rec.xyz_class = r.OptText("xyz_class");
        records.push_back(std::move(rec));
    }
    return records;
}

absl::StatusOr<std::vector<CustomerRecord>> DatasetReader::Customers() const {
    WCOPT_ASSIGN_OR_RETURN(Table table, ReadDataset(Dataset::kCustomers));
    std::vector<CustomerRecord> records;
    records.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        RowView r(table, row);
        CustomerRecord rec;
        rec.customer_id = r.Text("customer_id");
        rec.customer_name = r.OptText("customer_name");
        rec.segment = r.OptText("segment");
        rec.ytd_revenue = r.Number("ytd_revenue");
        rec.avg_days_to_pay = r.Number("avg_days_to_pay");
        records.push_back(std::move(rec));
    }
    return records;
}

absl::StatusOr<std::vector<SupplierRecord>> DatasetReader::Suppliers() const {
    WCOPT_ASSIGN_OR_RETURN(Table table, ReadDataset(Dataset::kSuppliers));
    std::vector<SupplierRecord> records;
    records.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        RowView r(table, row);
        SupplierRecord rec;
        rec.supplier_id = r.Text("supplier_id");
        rec.supplier_name = r.OptText("supplier_name");
        rec.avg_lead_time_days = r.Number("avg_lead_time_days");
        rec.on_time_delivery_rate = r.Number("on_time_delivery_rate");
        rec.quality_rejection_rate = r.Number("quality_rejection_rate");
        rec.rating = r.Number("rating");
        rec.risk_score = r.Number("risk_score");
        rec.country = r.OptText("country");
        rec.contracted_payment_days = r.Number("contracted_payment_days");
        records.push_back(std::move(rec));
    }
    return records;
}

absl::StatusOr<std::vector<InventoryRecord>> DatasetReader::CurrentInventory() const {
    WCOPT_ASSIGN_OR_RETURN(Table table, ReadDataset(
        Dataset::kInventorySnapshot,
        "snapshot_date = (SELECT MAX(snapshot_date) FROM inventory_snapshot)"));
    std::vector<InventoryRecord> records;
    records.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        RowView r(table, row);
        InventoryRecord rec;
        rec.product_id = r.Text("product_id");
        rec.snapshot_date = r.Text("snapshot_date");
        rec.qty_on_hand = r.NumberOr("qty_on_hand", 0.0);
        rec.reorder_point = r.NumberOr("reorder_point", 0.0);
        rec.location_id = r.OptText("location_id");
        rec.unit_cost = r.Number("unit_cost");
        rec.inventory_value = r.Number("inventory_value");
        rec.safety_stock_target = r.Number("safety_stock_target");
        rec.stock_status = r.OptText("stock_status");
        rec.days_of_supply = r.Number("days_of_supply");
        rec.days_since_last_movement = r.Number("days_since_last_movement");
        records.push_back(std::move(rec));
    }
    return records;
}

absl::StatusOr<std::vector<SaleRecord>> DatasetReader::Sales() const {
    WCOPT_ASSIGN_OR_RETURN(Table table, ReadDataset(Dataset::kSalesTransactions));
    std::vector<SaleRecord> records;
    records.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        RowView r(table, row);
        SaleRecord rec;
        rec.product_id = r.Text("product_id");
        rec.transaction_date = r.Day("transaction_date");
        rec.qty_sold = r.NumberOr("qty_sold", 0.0);
        rec.total_revenue = r.NumberOr("total_revenue", 0.0);
        rec.customer_id = r.OptText("customer_id");
        rec.total_cost = r.Number("total_cost");
        rec.gross_profit = r.Number("gross_profit");
        records.push_back(std::move(rec));
    }
    return records;
}

absl::StatusOr<std::vector<PurchaseOrderRecord>> DatasetReader::PurchaseOrders() const {
    WCOPT_ASSIGN_OR_RETURN(Table table, ReadDataset(Dataset::kPurchaseOrders));
    std::vector<PurchaseOrderRecord> records;
    records.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        RowView r(table, row);
        PurchaseOrderRecord rec;
        rec.supplier_id = r.Text("supplier_id");
        rec.product_id = r.Text("product_id");
        rec.po_number = r.OptText("po_number");
        rec.qty_ordered = r.Number("qty_ordered");
        rec.total_po_value = r.Number("total_po_value");
        rec.order_date = r.Day("order_date");
        records.push_back(std::move(rec));
    }
    return records;
}

absl::StatusOr<std::vector<ArRecord>> DatasetReader::ArLedger() const {
    WCOPT_ASSIGN_OR_RETURN(Table table, ReadDataset(Dataset::kArLedger));
    std::vector<ArRecord> records;
    records.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        RowView r(table, row);
        ArRecord rec;
        rec.customer_id = r.Text("customer_id");
        rec.invoice_amount = r.NumberOr("invoice_amount", 0.0);
        rec.due_date = r.Day("due_date");
        rec.days_to_pay = r.Number("days_to_pay");
        rec.paid_date = r.OptText("paid_date");
        rec.aging_bucket = r.OptText("aging_bucket");
        rec.is_overdue = r.Flag("is_overdue");
        rec.dispute_flag = r.Flag("dispute_flag");
        rec.write_off_flag = r.Flag("write_off_flag");
        records.push_back(std::move(rec));
    }
    return records;
}

absl::StatusOr<std::vector<ApRecord>> DatasetReader::ApLedger() const {
    WCOPT_ASSIGN_OR_RETURN(Table table, ReadDataset(Dataset::kApLedger));
    std::vector<ApRecord> records;
    records.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        RowView r(table, row);
        ApRecord rec;
        rec.supplier_id = r.Text("supplier_id");
        rec.invoice_amount = r.NumberOr("invoice_amount", 0.0);
        rec.due_date = r.Day("due_date");
        rec.actual_days_to_pay = r.Number("actual_days_to_pay");
        rec.early_payment_discount = r.Number("early_payment_discount");
        records.push_back(std::move(rec));
    }
    return records;
}

absl::StatusOr<std::vector<ShipmentRecord>> DatasetReader::Shipments() const {
    WCOPT_ASSIGN_OR_RETURN(Table table, ReadDataset(Dataset::kShipments));
    std::vector<ShipmentRecord> records;
    records.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        RowView r(table, row);
        ShipmentRecord rec;
        rec.shipment_id = r.Text("shipment_id");
        rec.status = r.Text("status");
        rec.supplier_id = r.OptText("supplier_id");
        rec.product_id = r.OptText("product_id");
        rec.ship_date = r.OptText("ship_date");
        rec.expected_arrival_date = r.OptText("expected_arrival_date");
        rec.qty_shipped = r.Number("qty_shipped");
        rec.carrier = r.OptText("carrier");
        rec.freight_cost = r.Number("freight_cost");
        rec.delay_days = r.Number("delay_days");
        records.push_back(std::move(rec));
    }
    return records;
}

}  // namespace wcopt::engine
