/// @file overview.cpp
/// @brief Dashboard, data quality and dataset inventory

#include "engine/overview.h"

#include <algorithm>
#include <set>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"
#include "engine/availability.h"
#include "engine/stats.h"
#include "storage/identifier.h"
#include "storage/type_inference.h"

namespace wcopt::engine {

namespace {

constexpr size_t kSampleRows = 5;
constexpr size_t kInTransitRows = 20;
constexpr const char* kInTransit = "In Transit";

InsufficientData NothingUploaded() {
    InsufficientData none;
    none.message = "No data uploaded yet.";
    for (Dataset dataset : AllDatasets()) {
        none.missing.emplace_back(TableName(dataset));
    }
    return none;
}

}  // namespace

int QualityScore(size_t columns_with_nulls, size_t duplicate_rows) {
    const int penalty = static_cast<int>(5 * columns_with_nulls) +
                        static_cast<int>(2 * std::min<size_t>(duplicate_rows, 10));
    return std::max(0, 100 - penalty);
}

OverviewEngine::OverviewEngine(storage::TabularStore& store, storage::GraphStore& graph)
    : store_(store), graph_(graph), reader_(store) {}

// =============================================================================
// Dashboard
// =============================================================================

absl::StatusOr<Outcome<Dashboard>> OverviewEngine::GetDashboard() {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto present, availability.Present(AllDatasets()));
    const auto has = [&present](Dataset dataset) {
        return std::find(present.begin(), present.end(), dataset) != present.end();
    };

    Dashboard dashboard;
    if (has(Dataset::kSalesTransactions)) {
        WCOPT_ASSIGN_OR_RETURN(auto sales, reader_.Sales());
        RevenueSection section;
        std::set<std::string> products;
        for (const auto& rec : sales) {
            section.total_revenue += rec.total_revenue;
            section.total_cost += rec.total_cost.value_or(0.0);
            section.gross_profit += rec.gross_profit.value_or(0.0);
            products.insert(rec.product_id);
        }
        section.total_revenue = Round(section.total_revenue, 2);
        section.total_cost = Round(section.total_cost, 2);
        section.gross_profit = Round(section.gross_profit, 2);
        section.transactions = sales.size();
        section.unique_products = products.size();
        dashboard.revenue = section;
    }
    if (has(Dataset::kInventorySnapshot)) {
        WCOPT_ASSIGN_OR_RETURN(auto inventory, reader_.CurrentInventory());
        InventorySection section;
        std::set<std::string> skus;
        for (const auto& rec : inventory) {
            skus.insert(rec.product_id);
            section.total_units += rec.qty_on_hand;
            section.total_value += InventoryValueOf(rec);
            if (rec.stock_status && absl::EqualsIgnoreCase(*rec.stock_status, "stockout")) {
                ++section.stockouts;
            }
            if (rec.stock_status && absl::EqualsIgnoreCase(*rec.stock_status, "overstock")) {
                ++section.overstocked;
            }
        }
        section.unique_skus = skus.size();
        section.total_value = Round(section.total_value, 2);
        dashboard.inventory = section;
    }
    if (has(Dataset::kSuppliers)) {
        WCOPT_ASSIGN_OR_RETURN(auto suppliers, reader_.Suppliers());
        SupplierSection section;
        section.count = suppliers.size();
        std::vector<double> lead_times;
        std::vector<double> otd_rates;
        for (const auto& rec : suppliers) {
            if (rec.avg_lead_time_days) {
                lead_times.push_back(*rec.avg_lead_time_days);
            }
            if (rec.on_time_delivery_rate) {
                otd_rates.push_back(*rec.on_time_delivery_rate);
            }
        }
        section.avg_lead_time = Round(Mean(lead_times), 1);
        section.avg_otd_rate = Round(Mean(otd_rates), 3);
        dashboard.suppliers = section;
    }
    if (has(Dataset::kCustomers)) {
        WCOPT_ASSIGN_OR_RETURN(auto customers, reader_.Customers());
        CustomerSection section;
        section.count = customers.size();
        std::vector<double> days;
        for (const auto& rec : customers) {
            section.total_ytd_revenue += rec.ytd_revenue.value_or(0.0);
            if (rec.avg_days_to_pay) {
                days.push_back(*rec.avg_days_to_pay);
            }
        }
        section.total_ytd_revenue = Round(section.total_ytd_revenue, 2);
        section.avg_days_to_pay = Round(Mean(days), 1);
        dashboard.customers = section;
    }
    if (has(Dataset::kArLedger)) {
        WCOPT_ASSIGN_OR_RETURN(auto ledger, reader_.ArLedger());
        ReceivablesSection section;
        section.total_invoices = ledger.size();
        for (const auto& rec : ledger) {
            if (rec.is_overdue) {
                ++section.overdue;
            }
            if (rec.write_off_flag) {
                section.write_off_amount += rec.invoice_amount;
            }
        }
        section.write_off_amount = Round(section.write_off_amount, 2);
        dashboard.ar = section;
    }
    if (has(Dataset::kPurchaseOrders)) {
        WCOPT_ASSIGN_OR_RETURN(auto orders, reader_.PurchaseOrders());
        PurchaseOrderSection section;
        section.count = orders.size();
        for (const auto& rec : orders) {
            section.total_qty += rec.qty_ordered.value_or(0.0);
            section.total_value += rec.total_po_value.value_or(0.0);
        }
        section.total_value = Round(section.total_value, 2);
        dashboard.purchase_orders = section;
    }

    if (!dashboard.revenue && !dashboard.inventory && !dashboard.suppliers &&
        !dashboard.customers && !dashboard.ar && !dashboard.purchase_orders) {
        return NothingUploaded();
    }
    return dashboard;
}

// =============================================================================
// Data quality and dataset inventory
// =============================================================================

absl::StatusOr<Outcome<DataQualityReport>> OverviewEngine::GetDataQualityReport() {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto present, availability.Present(AllDatasets()));
    if (present.empty()) {
        return NothingUploaded();
    }

    DataQualityReport report;
    for (Dataset dataset : present) {
        WCOPT_ASSIGN_OR_RETURN(storage::Table data, reader_.ReadAll(dataset));
        TableQuality quality;
        quality.table = std::string(TableName(dataset));
        quality.rows = data.rows.size();
        quality.columns = data.columns.size();

        std::vector<size_t> nulls(data.columns.size(), 0);
        std::set<storage::Row> seen;
        for (const auto& row : data.rows) {
            for (size_t i = 0; i < row.size() && i < nulls.size(); ++i) {
                if (storage::IsBlankCell(row[i])) {
                    ++nulls[i];
                }
            }
            if (!seen.insert(row).second) {
                ++quality.duplicate_rows;
            }
        }
        for (size_t i = 0; i < nulls.size(); ++i) {
            if (nulls[i] > 0) {
                quality.null_counts.emplace(data.columns[i], nulls[i]);
            }
        }
        quality.quality_score = QualityScore(quality.null_counts.size(), quality.duplicate_rows);
        report.tables.push_back(std::move(quality));
    }
    return report;
}

absl::StatusOr<UploadListing> OverviewEngine::ListUploads() {
    AvailabilityResolver availability(store_);
    UploadListing listing;
    for (Dataset dataset : AllDatasets()) {
        UploadStatus status;
        status.category = std::string(TableName(dataset));
        WCOPT_ASSIGN_OR_RETURN(bool available, availability.IsAvailable(dataset));
        if (available) {
            status.status = "uploaded";
            WCOPT_ASSIGN_OR_RETURN(status.rows, store_.CountRows(TableName(dataset)));
            status.destination = FeedsGraph(dataset) ? "tabular + graph" : "tabular";
        } else {
            status.status = "not_uploaded";
        }
        listing.files.push_back(std::move(status));
    }
    return listing;
}

absl::StatusOr<Outcome<SchemaInfo>> OverviewEngine::GetSchemaInfo(const std::string& table) {
    auto dataset = ParseDataset(table);
    if (!dataset) {
        return MakeError(ErrorCode::kUnknownDataset,
                         absl::StrCat("Unknown table '", table, "'. Valid tables: ",
                                      AllTableNames()));
    }
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto missing, availability.Check({*dataset}));
    if (missing) {
        return *missing;
    }

    SchemaInfo info;
    info.table = table;
    WCOPT_ASSIGN_OR_RETURN(info.rows, store_.CountRows(table));
    WCOPT_ASSIGN_OR_RETURN(info.columns, store_.DescribeTable(table));
    WCOPT_ASSIGN_OR_RETURN(storage::QueryResult sample, store_.Query(absl::StrCat(
        "SELECT * FROM ", storage::QuoteIdentifier(table), " LIMIT ", kSampleRows)));
    info.sample = std::move(sample.table);
    return info;
}

absl::StatusOr<Outcome<VersionHistory>> OverviewEngine::GetVersionHistory() {
    VersionHistory history;
    WCOPT_ASSIGN_OR_RETURN(history.history, store_.UploadHistory());
    history.total_uploads = history.history.size();
    if (!history.history.empty()) {
        return history;
    }

    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto present, availability.Present(AllDatasets()));
    if (present.empty()) {
        return NothingUploaded();
    }
    for (Dataset dataset : present) {
        TableCount count;
        count.category = std::string(TableName(dataset));
        WCOPT_ASSIGN_OR_RETURN(count.rows, store_.CountRows(TableName(dataset)));
        history.tables.push_back(std::move(count));
    }
    return history;
}

absl::StatusOr<RefreshReport> OverviewEngine::GetRefreshReport() {
    RefreshReport report;
    report.tabular_backend = store_.BackendName();

    AvailabilityResolver availability(store_);
    for (Dataset dataset : AllDatasets()) {
        TableRefresh refresh;
        refresh.table = std::string(TableName(dataset));
        WCOPT_ASSIGN_OR_RETURN(bool available, availability.IsAvailable(dataset));
        if (available) {
            refresh.status = "ok";
            WCOPT_ASSIGN_OR_RETURN(refresh.rows, store_.CountRows(refresh.table));
            WCOPT_ASSIGN_OR_RETURN(auto columns, store_.DescribeTable(refresh.table));
            refresh.columns = columns.size();
        } else {
            refresh.status = "not_loaded";
        }
        report.tables.push_back(std::move(refresh));
    }

    report.graph.backend = graph_.BackendName();
    auto counts = graph_.Counts();
    if (counts.ok()) {
        report.graph.status = "connected";
        report.graph.counts = *counts;
    } else {
        WCOPT_LOG_WARN("Graph store unavailable during refresh: {}", counts.status().ToString());
        report.graph.status = "unavailable";
        report.graph.error = std::string(counts.status().message());
    }
    return report;
}

// =============================================================================
// Shipments and catalog
// =============================================================================

absl::StatusOr<Outcome<ShipmentTracking>> OverviewEngine::GetShipmentTracking(
    const std::optional<std::string>& status) {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto missing, availability.Check({Dataset::kShipments}));
    if (missing) {
        return *missing;
    }
    WCOPT_ASSIGN_OR_RETURN(auto shipments, reader_.Shipments());

    struct Totals {
        ShipmentStatusSummary summary;
        std::vector<double> delays;
    };
    std::map<std::string, Totals> per_status;
    ShipmentTracking tracking;
    for (auto& rec : shipments) {
        if (status && rec.status != *status) {
            continue;
        }
        auto& totals = per_status[rec.status];
        totals.summary.status = rec.status;
        ++totals.summary.count;
        totals.summary.total_qty += rec.qty_shipped.value_or(0.0);
        totals.summary.total_freight += rec.freight_cost.value_or(0.0);
        if (rec.delay_days) {
            totals.delays.push_back(*rec.delay_days);
        }
        if (!status && absl::EqualsIgnoreCase(rec.status, kInTransit) &&
            tracking.in_transit.size() < kInTransitRows) {
            tracking.in_transit.push_back(std::move(rec));
        }
    }

    for (auto& [name, totals] : per_status) {
        if (!totals.delays.empty()) {
            totals.summary.avg_delay = Round(Mean(totals.delays), 1);
        }
        totals.summary.total_freight = Round(totals.summary.total_freight, 2);
        tracking.summary.push_back(std::move(totals.summary));
    }
    return tracking;
}

absl::StatusOr<Outcome<ProductCatalog>> OverviewEngine::GetProductCatalog(
    const std::optional<std::string>& category, const std::optional<std::string>& abc_class) {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto missing, availability.Check({Dataset::kProducts}));
    if (missing) {
        return *missing;
    }

    const std::string table(TableName(Dataset::kProducts));
    WCOPT_ASSIGN_OR_RETURN(auto described, store_.DescribeTable(table));
    const auto has_column = [&described](std::string_view name) {
        return std::any_of(described.begin(), described.end(),
                           [name](const storage::ColumnInfo& c) { return c.name == name; });
    };

    std::vector<std::string> clauses;
    std::vector<storage::QueryParam> params;
    const std::pair<const char*, const std::optional<std::string>*> filters[] = {
        {"category", &category},
        {"abc_class", &abc_class},
    };
    for (const auto& [column, value] : filters) {
        if (!value->has_value()) {
            continue;
        }
        if (!has_column(column)) {
            return absl::InvalidArgumentError(
                absl::StrCat("Cannot filter on ", column, ": products has no such column"));
        }
        clauses.push_back(absl::StrCat(storage::QuoteIdentifier(column), " = ?"));
        params.push_back(storage::QueryParam::Text(**value));
    }

    std::string sql = absl::StrCat("SELECT * FROM ", storage::QuoteIdentifier(table));
    if (!clauses.empty()) {
        absl::StrAppend(&sql, " WHERE ", absl::StrJoin(clauses, " AND "));
    }
    absl::StrAppend(&sql, " ORDER BY ", storage::QuoteIdentifier("product_id"));

    WCOPT_ASSIGN_OR_RETURN(storage::QueryResult result, store_.Query(sql, params));
    ProductCatalog catalog;
    catalog.total = result.table.rows.size();
    catalog.products = std::move(result.table);
    return catalog;
}

}  // namespace wcopt::engine
