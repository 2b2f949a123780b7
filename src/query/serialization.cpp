/// @file serialization.cpp
/// @brief JSON rendering of the analysis records

#include "query/serialization.h"

#include "engine/stats.h"
#include "storage/type_inference.h"

namespace wcopt::query {

using json = nlohmann::json;

json CellToJson(const storage::Cell& cell) {
    if (!cell) {
        return nullptr;
    }
    if (auto integer = storage::ParseIntegerCell(*cell)) {
        return *integer;
    }
    if (auto real = storage::ParseRealCell(*cell)) {
        return *real;
    }
    return *cell;
}

json RowToJson(const std::vector<std::string>& columns, const storage::Row& row) {
    json j = json::object();
    for (size_t i = 0; i < columns.size() && i < row.size(); ++i) {
        j[columns[i]] = CellToJson(row[i]);
    }
    return j;
}

std::string RenderJson(const json& body, int indent) {
    return body.dump(indent, ' ', false, json::error_handler_t::replace);
}

json InsufficientDataToJson(const engine::InsufficientData& insufficient) {
    return json{
        {"message", insufficient.message},
        {"missing_datasets", insufficient.missing},
    };
}

void to_json(json& j, const SqlResult& result) {
    json data = json::array();
    for (const auto& row : result.data) {
        data.push_back(RowToJson(result.columns, row));
    }
    j = json{
        {"rows", result.rows},
        {"columns", result.columns},
        {"data", std::move(data)},
    };
}

}  // namespace wcopt::query

// =============================================================================
// Storage records
// =============================================================================

namespace wcopt::storage {

using json = nlohmann::json;
using query::Opt;

void to_json(json& j, const Table& table) {
    j = json::array();
    for (const auto& row : table.rows) {
        j.push_back(query::RowToJson(table.columns, row));
    }
}

void to_json(json& j, const ColumnInfo& column) {
    j = json{{"name", column.name}, {"type", column.type}, {"nullable", column.nullable}};
}

void to_json(json& j, const UploadRecord& record) {
    j = json{
        {"id", record.id},
        {"file_category", record.category},
        {"filename", record.filename},
        {"upload_timestamp", record.uploaded_at},
        {"row_count", record.row_count},
        {"status", record.status},
    };
}

void to_json(json& j, const SupplierNode& node) {
    j = json{
        {"supplier_id", node.supplier_id},
        {"name", Opt(node.name)},
        {"lead_time", Opt(node.lead_time)},
        {"rating", Opt(node.rating)},
        {"otd_rate", Opt(node.otd_rate)},
        {"country", Opt(node.country)},
    };
}

void to_json(json& j, const SuppliesEdge& edge) {
    j = json{
        {"supplier_id", edge.supplier_id},
        {"supplier_name", Opt(edge.supplier_name)},
        {"lead_time", Opt(edge.lead_time)},
        {"product_id", edge.product_id},
    };
}

void to_json(json& j, const SoleSourcedProduct& product) {
    j = json{
        {"product_id", product.product_id},
        {"supplier_id", product.supplier_id},
        {"supplier_name", Opt(product.supplier_name)},
    };
}

void to_json(json& j, const GraphCounts& counts) {
    j = json{
        {"suppliers", counts.suppliers},
        {"products", counts.products},
        {"relationships", counts.relationships},
    };
}

}  // namespace wcopt::storage

namespace wcopt::engine {

using json = nlohmann::json;
using query::Opt;

namespace {

void AddNote(json& j, const char* key, const std::optional<std::string>& note) {
    if (note) {
        j[key] = *note;
    }
}

void AddSource(json& j, const SourcedResult& sourced) {
    j["source"] = sourced.source;
    AddNote(j, "note", sourced.note);
}

}  // namespace

// =============================================================================
// Records read from the datasets
// =============================================================================

void to_json(json& j, const SupplierRecord& record) {
    j = json{
        {"supplier_id", record.supplier_id},
        {"supplier_name", Opt(record.supplier_name)},
        {"avg_lead_time_days", Opt(record.avg_lead_time_days)},
        {"on_time_delivery_rate", Opt(record.on_time_delivery_rate)},
        {"quality_rejection_rate", Opt(record.quality_rejection_rate)},
        {"rating", Opt(SupplierRatingOf(record))},
        {"country", Opt(record.country)},
    };
}

void to_json(json& j, const ShipmentRecord& record) {
    j = json{
        {"shipment_id", record.shipment_id},
        {"status", record.status},
        {"supplier_id", Opt(record.supplier_id)},
        {"product_id", Opt(record.product_id)},
        {"ship_date", Opt(record.ship_date)},
        {"expected_arrival_date", Opt(record.expected_arrival_date)},
        {"qty_shipped", Opt(record.qty_shipped)},
        {"carrier", Opt(record.carrier)},
        {"freight_cost", Opt(record.freight_cost)},
        {"delay_days", Opt(record.delay_days)},
    };
}

// =============================================================================
// Classification
// =============================================================================

void to_json(json& j, const ParetoEntry& entry) {
    j = json{
        {"product_id", entry.product_id},
        {"value", entry.value},
        {"cum_pct", entry.cum_pct},
        {"abc_class", entry.abc_class},
    };
}

void to_json(json& j, const ParetoResult& result) {
    j = json{
        {"dimension", result.dimension},
        {"total_skus", result.total_skus},
        {"skus_driving_80pct", result.skus_driving_80pct},
        {"pct_of_skus", result.pct_of_skus},
        {"total_value", result.total_value},
        {"pareto_data", result.pareto_data},
    };
}

void to_json(json& j, const AbcXyzEntry& entry) {
    j = json{
        {"product_id", entry.product_id},
        {"product_name", Opt(entry.product_name)},
        {"revenue", entry.revenue},
        {"cum_pct", entry.cum_pct},
        {"cv", entry.cv},
        {"abc_class", entry.abc_class},
        {"xyz_class", entry.xyz_class},
        {"class", entry.abc_class + entry.xyz_class},
        {"source", entry.source},
    };
}

void to_json(json& j, const AbcXyzResult& result) {
    j = json{
        {"total_skus", result.total_skus},
        {"classification", result.classification},
        {"matrix", result.matrix},
        {"legend", result.legend},
    };
}

// =============================================================================
// Cash cycle
// =============================================================================

void to_json(json& j, const KpiSummary& summary) {
    j = json{
        {"dio", summary.dio},
        {"dso", summary.dso},
        {"dpo", summary.dpo},
        {"ccc", summary.ccc},
        {"formula", summary.formula},
        {"unit", summary.unit},
    };
    AddNote(j, "dio_note", summary.dio_note);
    AddNote(j, "dso_note", summary.dso_note);
    AddNote(j, "dpo_note", summary.dpo_note);
}

void to_json(json& j, const TrappedCashItem& item) {
    j = json{
        {"product_id", item.product_id},
        {"total_units", item.total_units},
        {"trapped_cash", item.trapped_cash},
    };
}

void to_json(json& j, const WorkingCapitalSummary& summary) {
    j = json{
        {"top_items", summary.top_items},
        {"total_cash_trapped", summary.total_cash_trapped},
    };
}

void to_json(json& j, const CarryingCost& cost) {
    j = json{
        {"total_inventory_value", cost.total_inventory_value},
        {"holding_rate", cost.holding_rate},
        {"annual_carrying_cost", cost.annual_carrying_cost},
        {"monthly_carrying_cost", cost.monthly_carrying_cost},
    };
}

void to_json(json& j, const CccLeverImpact& impact) {
    j = json{{"action", impact.action}, {"days", impact.days}, {"cash", impact.cash}};
}

void to_json(json& j, const CccSimulation& simulation) {
    j = json{
        {"annual_revenue", simulation.annual_revenue},
        {"revenue_source", simulation.revenue_source},
        {"daily_revenue", simulation.daily_revenue},
        {"total_days_saved", simulation.total_days_saved},
        {"total_cash_freed", simulation.total_cash_freed},
        {"breakdown", simulation.breakdown},
        {"current_ccc", simulation.current_ccc},
        {"projected_ccc", simulation.projected_ccc},
    };
    AddNote(j, "note", simulation.note);
}

void to_json(json& j, const AgingBucket& bucket) {
    j = json{
        {"aging_bucket", bucket.aging_bucket},
        {"invoices", bucket.invoices},
        {"total_amount", bucket.total_amount},
        {"outstanding", bucket.outstanding},
    };
}

void to_json(json& j, const FlaggedInvoices& flagged) {
    j = json{{"count", flagged.count}, {"amount", flagged.amount}};
}

void to_json(json& j, const ArAging& aging) {
    j = json{
        {"aging_buckets", aging.aging_buckets},
        {"total_outstanding", aging.total_outstanding},
        {"disputes", aging.disputes},
        {"write_offs", aging.write_offs},
    };
}

void to_json(json& j, const CustomerDso& customer) {
    j = json{
        {"customer_id", customer.customer_id},
        {"customer_name", Opt(customer.customer_name)},
        {"segment", Opt(customer.segment)},
        {"weighted_dso", customer.weighted_dso},
        {"invoices", customer.invoices},
        {"total_billed", customer.total_billed},
    };
}

void to_json(json& j, const DsoAnalysis& analysis) {
    j = json{{"overall_dso", analysis.overall_dso}, {"by_customer", analysis.by_customer}};
    AddNote(j, "note", analysis.note);
}

void to_json(json& j, const SupplierDpo& supplier) {
    j = json{
        {"supplier_id", supplier.supplier_id},
        {"supplier_name", Opt(supplier.supplier_name)},
        {"weighted_dpo", supplier.weighted_dpo},
        {"terms", Opt(supplier.terms)},
        {"invoices", supplier.invoices},
        {"total_discounts", supplier.total_discounts},
    };
}

void to_json(json& j, const DpoAnalysis& analysis) {
    j = json{{"overall_dpo", analysis.overall_dpo}, {"by_supplier", analysis.by_supplier}};
    AddNote(j, "note", analysis.note);
}

// =============================================================================
// Inventory policy
// =============================================================================

void to_json(json& j, const SafetyStockEntry& entry) {
    j = json{
        {"product_id", entry.product_id},
        {"safety_stock", entry.safety_stock},
        {"demand_std", entry.demand_std},
        {"lead_time", entry.lead_time},
        {"z_score", entry.z_score},
    };
}

void to_json(json& j, const SafetyStockReport& report) {
    j = json{
        {"formula", report.formula},
        {"service_level", report.service_level},
        {"results", report.results},
    };
}

void to_json(json& j, const EoqEntry& entry) {
    j = json{
        {"product_id", entry.product_id},
        {"eoq", entry.eoq},
        {"annual_demand", entry.annual_demand},
        {"unit_cost", entry.unit_cost},
        {"orders_per_year", entry.orders_per_year},
    };
}

void to_json(json& j, const EoqReport& report) {
    j = json{
        {"formula", report.formula},
        {"order_cost_S", report.order_cost_S},
        {"holding_pct_H", report.holding_pct_H},
        {"results", report.results},
    };
}

void to_json(json& j, const ReorderAlert& alert) {
    j = json{
        {"product_id", alert.product_id},
        {"location_id", Opt(alert.location_id)},
        {"qty_on_hand", alert.qty_on_hand},
        {"reorder_point", alert.reorder_point},
        {"safety_stock_target", Opt(alert.safety_stock_target)},
        {"stock_status", Opt(alert.stock_status)},
        {"days_of_supply", Opt(alert.days_of_supply)},
        {"severity", alert.severity},
    };
}

void to_json(json& j, const ReorderAlerts& alerts) {
    j = json{
        {"total_alerts", alerts.total_alerts},
        {"critical", alerts.critical},
        {"warning", alerts.warning},
        {"alerts", alerts.alerts},
    };
}

void to_json(json& j, const ReorderRecommendation& recommendation) {
    j = json{
        {"product_id", recommendation.product_id},
        {"qty_on_hand", recommendation.qty_on_hand},
        {"reorder_point", recommendation.reorder_point},
        {"days_of_supply", Opt(recommendation.days_of_supply)},
        {"stock_status", Opt(recommendation.stock_status)},
        {"priority", recommendation.priority},
        {"eoq", recommendation.eoq},
        {"lead_time", recommendation.lead_time},
    };
}

void to_json(json& j, const SmartReorder& reorder) {
    j = json{{"recommendations", reorder.recommendations}, {"count", reorder.count}};
}

void to_json(json& j, const TurnoverEntry& entry) {
    j = json{
        {"product_id", entry.product_id},
        {"qty_on_hand", entry.qty_on_hand},
        {"unit_cost", Opt(entry.unit_cost)},
        {"inventory_value", entry.inventory_value},
        {"total_sold", entry.total_sold},
        {"revenue", entry.revenue},
        {"turnover_ratio", entry.turnover_ratio},
    };
}

void to_json(json& j, const InventoryTurnover& turnover) {
    j = json{{"skus", turnover.skus}, {"count", turnover.count}};
}

void to_json(json& j, const AgingEntry& entry) {
    j = json{
        {"product_id", entry.product_id},
        {"qty", entry.qty},
        {"value", entry.value},
        {"days_idle", Opt(entry.days_idle)},
        {"age_bucket", entry.age_bucket},
    };
}

void to_json(json& j, const AgingBucketSummary& summary) {
    j = json{{"sku_count", summary.sku_count}, {"total_value", summary.total_value}};
}

void to_json(json& j, const InventoryAging& aging) {
    j = json{{"aging_buckets", aging.aging_buckets}, {"details", aging.details}};
}

void to_json(json& j, const DeadStockEntry& entry) {
    j = json{
        {"product_id", entry.product_id},
        {"qty", entry.qty},
        {"value_at_risk", entry.value_at_risk},
        {"last_sale_date", Opt(entry.last_sale_date)},
        {"days_idle", Opt(entry.days_idle)},
    };
}

void to_json(json& j, const DeadStock& dead) {
    j = json{
        {"days_threshold", dead.days_threshold},
        {"basis", dead.basis},
        {"items", dead.items},
        {"total_value_at_risk", dead.total_value_at_risk},
        {"dead_stock", dead.dead_stock},
        {"undated_sales", dead.undated_sales},
    };
}

void to_json(json& j, const StockRow& row) {
    j = json{
        {"product_id", row.product_id},
        {"location_id", Opt(row.location_id)},
        {"qty_on_hand", row.qty_on_hand},
        {"reorder_point", row.reorder_point},
        {"inventory_value", row.inventory_value},
        {"days_of_supply", Opt(row.days_of_supply)},
        {"stock_status", Opt(row.stock_status)},
    };
}

void to_json(json& j, const Overstock& overstock) {
    j = json{
        {"overstocked_items", overstock.overstocked_items},
        {"total_excess_value", overstock.total_excess_value},
        {"items", overstock.items},
    };
}

void to_json(json& j, const StockoutRisk& risk) {
    j = json{
        {"horizon_days", risk.horizon_days},
        {"at_risk_count", risk.at_risk_count},
        {"items", risk.items},
    };
}

// =============================================================================
// Demand
// =============================================================================

void to_json(json& j, const DemandForecast& forecast) {
    j = json{
        {"product_id", forecast.product_id},
        {"historical_days", forecast.historical_days},
        {"window", forecast.window},
        {"trend", forecast.trend},
        {"moving_average", forecast.moving_average},
        {"horizon_days", forecast.horizon_days},
        {"total_predicted", forecast.total_predicted},
    };
}

void to_json(json& j, const AnomalyReport& report) {
    json anomalies = json::array();
    for (const auto& anomaly : report.anomalies) {
        json row = query::RowToJson(report.columns, anomaly.row);
        row["z_score"] = anomaly.z_score;
        anomalies.push_back(std::move(row));
    }
    j = json{
        {"table", report.table},
        {"column", report.column},
        {"z_threshold", report.z_threshold},
        {"total_rows", report.total_rows},
        {"mean", report.mean},
        {"stddev", report.stddev},
        {"anomalies_found", report.anomalies_found},
        {"anomalies", std::move(anomalies)},
    };
}

void to_json(json& j, const RevenuePeriod& period) {
    j = json{
        {"period", period.period},
        {"revenue", period.revenue},
        {"units", period.units},
        {"skus", period.skus},
        {"growth_pct", Opt(period.growth_pct)},
    };
}

void to_json(json& j, const RevenueTrends& trends) {
    j = json{
        {"granularity", trends.granularity},
        {"periods", trends.periods},
        {"trends", trends.trends},
    };
}

void to_json(json& j, const VelocityEntry& entry) {
    j = json{
        {"product_id", entry.product_id},
        {"total_sold", entry.total_sold},
        {"sale_days", entry.sale_days},
        {"daily_velocity", entry.daily_velocity},
        {"total_revenue", entry.total_revenue},
    };
}

void to_json(json& j, const SalesVelocity& velocity) {
    j = json{{"fastest_movers", velocity.fastest_movers}, {"count", velocity.count}};
}

void to_json(json& j, const TopSkuEntry& entry) {
    j = json{
        {"product_id", entry.product_id},
        {"revenue", entry.revenue},
        {"units", entry.units},
        {"profit", Opt(entry.profit)},
    };
}

void to_json(json& j, const TopSkus& top) {
    j = json{{"top_skus", top.top_skus}, {"count", top.count}};
}

void to_json(json& j, const CustomerShare& share) {
    j = json{
        {"customer_id", share.customer_id},
        {"customer_name", share.customer_name},
        {"revenue", share.revenue},
        {"revenue_pct", share.revenue_pct},
        {"unique_products", share.unique_products},
    };
}

void to_json(json& j, const CustomerConcentration& concentration) {
    j = json{
        {"top_customers", concentration.top_customers},
        {"top_share_pct", concentration.top_share_pct},
        {"concentration_risk", concentration.concentration_risk},
    };
}

void to_json(json& j, const MonthlyDemand& month) {
    j = json{
        {"month", month.month},
        {"qty", month.qty},
        {"revenue", month.revenue},
        {"index_vs_avg", month.index_vs_avg},
    };
}

void to_json(json& j, const Seasonality& seasonality) {
    j = json{
        {"product_id", Opt(seasonality.product_id)},
        {"monthly_pattern", seasonality.monthly_pattern},
        {"peak_month", seasonality.peak_month},
        {"low_month", seasonality.low_month},
    };
}

// =============================================================================
// Suppliers
// =============================================================================

void to_json(json& j, const SupplierRisk& risk) {
    j = json{
        {"supplier_id", risk.supplier_id},
        {"supplier_name", Opt(risk.supplier_name)},
        {"risk_score", risk.risk_score},
        {"risk_level", risk.risk_level},
        {"lead_time", Opt(risk.lead_time)},
        {"otd_rate", Opt(risk.otd_rate)},
        {"qrr", Opt(risk.qrr)},
    };
}

void to_json(json& j, const SupplierRiskScores& scores) {
    j = json{{"suppliers", scores.suppliers}};
}

void to_json(json& j, const SupplierPerformance& performance) {
    j = json{{"suppliers", performance.suppliers}, {"count", performance.count}};
}

void to_json(json& j, const SupplierSpend& spend) {
    j = json{
        {"supplier_id", spend.supplier_id},
        {"supplier_name", Opt(spend.supplier_name)},
        {"orders", spend.orders},
        {"total_value", spend.total_value},
        {"value_pct", spend.value_pct},
    };
}

void to_json(json& j, const SupplierConcentration& concentration) {
    j = json{
        {"suppliers", concentration.suppliers},
        {"top3_value_pct", concentration.top3_value_pct},
        {"concentration_risk", concentration.concentration_risk},
    };
}

void to_json(json& j, const SupplierNetwork& network) {
    j = json{{"relationships", network.relationships}, {"network", network.network}};
    if (!network.suppliers.empty()) {
        j["suppliers"] = network.suppliers;
    }
    AddSource(j, network);
}

void to_json(json& j, const SingleSourceRisks& risks) {
    j = json{
        {"single_source_products", risks.single_source_products},
        {"total", risks.total},
    };
    AddSource(j, risks);
}

void to_json(json& j, const RippleEffect& ripple) {
    j = json{
        {"supplier_id", ripple.supplier_id},
        {"supplier_name", Opt(ripple.supplier_name)},
        {"impacted_products", ripple.impacted_products},
        {"count", ripple.count},
        {"severity", ripple.severity},
    };
    AddSource(j, ripple);
}

void to_json(json& j, const LeadTimeVariability& variability) {
    j = json{{"suppliers", variability.suppliers}};
    AddSource(j, variability);
}

void to_json(json& j, const AlternativeSuppliers& alternatives) {
    j = json{
        {"product_id", alternatives.product_id},
        {"current_suppliers", alternatives.current_suppliers},
        {"alternatives", alternatives.alternatives},
    };
    AddSource(j, alternatives);
}

// =============================================================================
// Overview
// =============================================================================

void to_json(json& j, const Dashboard& dashboard) {
    j = json::object();
    if (dashboard.revenue) {
        const auto& s = *dashboard.revenue;
        j["revenue"] = json{
            {"total_revenue", s.total_revenue},
            {"total_cost", s.total_cost},
            {"gross_profit", s.gross_profit},
            {"transactions", s.transactions},
            {"unique_products", s.unique_products},
        };
    }
    if (dashboard.inventory) {
        const auto& s = *dashboard.inventory;
        j["inventory"] = json{
            {"unique_skus", s.unique_skus},
            {"total_units", s.total_units},
            {"total_value", s.total_value},
            {"stockouts", s.stockouts},
            {"overstocked", s.overstocked},
        };
    }
    if (dashboard.suppliers) {
        const auto& s = *dashboard.suppliers;
        j["suppliers"] = json{
            {"count", s.count},
            {"avg_lead_time", s.avg_lead_time},
            {"avg_otd_rate", s.avg_otd_rate},
        };
    }
    if (dashboard.customers) {
        const auto& s = *dashboard.customers;
        j["customers"] = json{
            {"count", s.count},
            {"total_ytd_revenue", s.total_ytd_revenue},
            {"avg_days_to_pay", s.avg_days_to_pay},
        };
    }
    if (dashboard.ar) {
        const auto& s = *dashboard.ar;
        j["ar"] = json{
            {"total_invoices", s.total_invoices},
            {"overdue", s.overdue},
            {"write_off_amount", s.write_off_amount},
        };
    }
    if (dashboard.purchase_orders) {
        const auto& s = *dashboard.purchase_orders;
        j["purchase_orders"] = json{
            {"count", s.count},
            {"total_qty", s.total_qty},
            {"total_value", s.total_value},
        };
    }
}

void to_json(json& j, const TableQuality& quality) {
    j = json{
        {"rows", quality.rows},
        {"columns", quality.columns},
        {"null_counts", quality.null_counts},
        {"duplicate_rows", quality.duplicate_rows},
        {"quality_score", quality.quality_score},
    };
}

void to_json(json& j, const DataQualityReport& report) {
    j = json::object();
    for (const auto& table : report.tables) {
        j[table.table] = table;
    }
}

void to_json(json& j, const UploadStatus& status) {
    j = json{{"category", status.category}, {"status", status.status}};
    if (status.rows) {
        j["rows"] = *status.rows;
    }
    if (status.destination) {
        j["destination"] = *status.destination;
    }
}

void to_json(json& j, const UploadListing& listing) {
    j = json{{"files", listing.files}};
}

void to_json(json& j, const SchemaInfo& info) {
    j = json{
        {"table", info.table},
        {"rows", info.rows},
        {"columns", info.columns},
        {"sample", info.sample},
    };
}

void to_json(json& j, const TableCount& count) {
    j = json{{"category", count.category}, {"rows", count.rows}, {"status", count.status}};
}

void to_json(json& j, const VersionHistory& history) {
    if (!history.history.empty()) {
        j = json{{"total_uploads", history.total_uploads}, {"history", history.history}};
    } else {
        j = json{{"tables", history.tables}};
    }
}

void to_json(json& j, const TableRefresh& refresh) {
    j = json{
        {"status", refresh.status},
        {"rows", Opt(refresh.rows)},
        {"columns", Opt(refresh.columns)},
    };
}

void to_json(json& j, const GraphRefresh& refresh) {
    j = json{{"backend", refresh.backend}, {"status", refresh.status}};
    if (refresh.counts) {
        j["counts"] = *refresh.counts;
    }
    if (refresh.error) {
        j["error"] = *refresh.error;
    }
}

void to_json(json& j, const RefreshReport& report) {
    json tables = json::object();
    for (const auto& table : report.tables) {
        tables[table.table] = table;
    }
    j = json{
        {"tabular_backend", report.tabular_backend},
        {"tables", std::move(tables)},
        {"graph", report.graph},
    };
}

void to_json(json& j, const ShipmentStatusSummary& summary) {
    j = json{
        {"status", summary.status},
        {"count", summary.count},
        {"total_qty", summary.total_qty},
        {"total_freight", summary.total_freight},
        {"avg_delay", Opt(summary.avg_delay)},
    };
}

void to_json(json& j, const ShipmentTracking& tracking) {
    j = json{{"summary", tracking.summary}, {"in_transit", tracking.in_transit}};
}

void to_json(json& j, const ProductCatalog& catalog) {
    j = json{{"total", catalog.total}, {"products", catalog.products}};
}

// =============================================================================
// Uploads
// =============================================================================

void to_json(json& j, const SyncReport& report) {
    j = json{
        {"suppliers_upserted", report.suppliers_upserted},
        {"products_merged", report.products_merged},
        {"relationships_merged", report.relationships_merged},
        {"skipped_rows", report.skipped_rows},
    };
}

void to_json(json& j, const LoadReport& report) {
    j = json{
        {"category", report.category},
        {"filename", report.filename},
        {"rows", report.rows},
        {"columns", report.columns},
        {"upload_id", report.upload_id},
        {"destination", report.destination},
    };
    if (report.graph_sync) {
        j["graph_sync"] = *report.graph_sync;
    }
    if (report.graph_error) {
        j["graph_error"] = *report.graph_error;
    }
}

}  // namespace wcopt::engine
