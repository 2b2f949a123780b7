/// @file catalog.cpp
/// @brief Analysis dispatch and response rendering

#include "query/catalog.h"

#include <functional>
#include <map>
#include <optional>
#include <utility>
#include <variant>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "engine/cash_cycle.h"
#include "engine/classification.h"
#include "engine/demand.h"
#include "engine/inventory_policy.h"
#include "engine/outcome.h"
#include "engine/overview.h"
#include "engine/supplier_risk.h"
#include "query/serialization.h"
#include "query/sql_gate.h"

namespace wcopt::query {

using json = nlohmann::json;
using engine::Dataset;

namespace {

constexpr const char* kCallsMetric = "analysis_calls_total";
constexpr const char* kInsufficientMetric = "analysis_insufficient_data_total";
constexpr const char* kErrorsMetric = "analysis_errors_total";
constexpr const char* kFallbackMetric = "graph_fallbacks_total";
constexpr const char* kBlockedMetric = "blocked_queries_total";
constexpr const char* kLatencyMetric = "analysis_latency_ms";

// =============================================================================
// Schema builders
// =============================================================================

ParamSpec IntegerParam(std::string name, std::string description, json default_value = nullptr,
                       std::optional<double> minimum = 1.0) {
    ParamSpec spec;
    spec.name = std::move(name);
    spec.type = ParamType::kInteger;
    spec.description = std::move(description);
    spec.default_value = std::move(default_value);
    spec.minimum = minimum;
    return spec;
}

ParamSpec NumberParam(std::string name, std::string description, json default_value = nullptr,
                      std::optional<double> minimum = std::nullopt) {
    ParamSpec spec = IntegerParam(std::move(name), std::move(description),
                                  std::move(default_value), minimum);
    spec.type = ParamType::kNumber;
    return spec;
}

ParamSpec StringParam(std::string name, std::string description, json default_value = nullptr,
                      std::vector<std::string> choices = {}) {
    ParamSpec spec;
    spec.name = std::move(name);
    spec.type = ParamType::kString;
    spec.description = std::move(description);
    spec.default_value = std::move(default_value);
    spec.choices = std::move(choices);
    return spec;
}

ParamSpec SkuListParam() {
    ParamSpec spec;
    spec.name = "skus";
    spec.type = ParamType::kArray;
    spec.description = "Product ids to evaluate";
    spec.required = true;
    return spec;
}

ParamSpec Required(ParamSpec spec) {
    spec.required = true;
    return spec;
}

std::optional<int> OptionalInt(const Params& params, std::string_view name) {
    auto value = params.Integer(name);
    if (!value) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

Response ErrorResponse(const absl::Status& status) {
    if (IsClientError(status)) {
        return {400, json{{"error", std::string(status.message())}}};
    }
    WCOPT_LOG_ERROR("Analysis failed: {}", status.ToString());
    return {500, json{{"error", std::string(status.message())}}};
}

template <typename T>
Response RenderValue(const absl::StatusOr<T>& result) {
    if (!result.ok()) {
        return ErrorResponse(result.status());
    }
    return {200, json(*result)};
}

template <typename T>
Response RenderOutcome(const absl::StatusOr<engine::Outcome<T>>& result) {
    if (!result.ok()) {
        return ErrorResponse(result.status());
    }
    const auto& outcome = *result;
    if (const auto* value = std::get_if<T>(&outcome)) {
        return {200, json(*value)};
    }
    if (const auto* insufficient = std::get_if<engine::InsufficientData>(&outcome)) {
        return {200, InsufficientDataToJson(*insufficient)};
    }
    return {404, json{{"message", std::get<engine::NotFound>(outcome).message}}};
}

}  // namespace

json DescribeAnalysis(const AnalysisInfo& info) {
    json parameters = json::object();
    for (const auto& spec : info.params) {
        json param = {
            {"type", ParamTypeName(spec.type)},
            {"description", spec.description},
            {"required", spec.required},
        };
        if (!spec.default_value.is_null()) {
            param["default"] = spec.default_value;
        }
        if (!spec.choices.empty()) {
            param["enum"] = spec.choices;
        }
        if (spec.minimum) {
            param["minimum"] = *spec.minimum;
        }
        parameters[spec.name] = std::move(param);
    }

    json datasets = json::array();
    for (Dataset dataset : info.datasets) {
        datasets.push_back(std::string(engine::TableName(dataset)));
    }
    return json{
        {"name", info.name},
        {"group", info.group},
        {"description", info.description},
        {"parameters", std::move(parameters)},
        {"datasets", std::move(datasets)},
    };
}

// =============================================================================
// AnalysisCatalog::Impl
// =============================================================================

class AnalysisCatalog::Impl {
public:
    using Handler = std::function<Response(const Params&)>;

    Impl(storage::TabularStore& store, storage::GraphStore& graph,
         const engine::EngineConfig& config, MetricsRegistry& metrics)
        : metrics_(metrics),
          overview_(store, graph),
          cash_(store, config),
          classification_(store),
          inventory_(store, config),
          demand_(store, config),
          suppliers_(store, graph, config),
          sql_(store, config.query_row_cap) {
        RegisterDashboard();
        RegisterInventory();
        RegisterCashCycle();
        RegisterDemand();
        RegisterSuppliers();
        RegisterData();
    }

    const std::vector<AnalysisInfo>& List() const { return infos_; }

    const AnalysisInfo* Find(std::string_view name) const {
        auto it = index_.find(name);
        return it == index_.end() ? nullptr : &infos_[it->second];
    }

    Response Run(std::string_view name, const json& input) {
        auto it = index_.find(name);
        if (it == index_.end()) {
            return ErrorResponse(MakeError(ErrorCode::kUnknownAnalysis,
                                           absl::StrCat("Unknown analysis '", absl::string_view(name.data(), name.size()), "'")));
        }
        const AnalysisInfo& info = infos_[it->second];
        metrics_.GetCounter(LabeledName(kCallsMetric, "analysis", info.name)).Increment();
        ScopedTimer timer(metrics_.GetHistogram(absl::StrCat(kLatencyMetric, "_", info.name)));

        auto params = Params::Bind(info.params, input);
        if (!params.ok()) {
            return ErrorResponse(params.status());
        }
        WCOPT_LOG_DEBUG("Running {} with {}", info.name, RenderJson(params->Values(), -1));

        Response response = handlers_[it->second](*params);
        if (response.status_code == 200 && response.body.is_object() &&
            response.body.contains("missing_datasets")) {
            metrics_.GetCounter(LabeledName(kInsufficientMetric, "analysis", info.name))
                .Increment();
        }
        if (response.body.is_object() &&
            response.body.value("source", std::string()) == engine::kSourceTabular) {
            metrics_.GetCounter(LabeledName(kFallbackMetric, "analysis", info.name)).Increment();
        }
        if (response.status_code >= 500) {
            metrics_.GetCounter(LabeledName(kErrorsMetric, "analysis", info.name)).Increment();
        }
        return response;
    }

private:
    void Add(AnalysisInfo info, Handler handler) {
        index_.emplace(info.name, infos_.size());
        infos_.push_back(std::move(info));
        handlers_.push_back(std::move(handler));
    }

    void RegisterDashboard();
    void RegisterInventory();
    void RegisterCashCycle();
    void RegisterDemand();
    void RegisterSuppliers();
    void RegisterData();

    MetricsRegistry& metrics_;

    engine::OverviewEngine overview_;
    engine::CashCycleEngine cash_;
    engine::ClassificationEngine classification_;
    engine::InventoryPolicyEngine inventory_;
    engine::DemandEngine demand_;
    engine::SupplierEngine suppliers_;
    SqlGate sql_;

    std::vector<AnalysisInfo> infos_;
    std::vector<Handler> handlers_;
    std::map<std::string, size_t, std::less<>> index_;
};

// =============================================================================
// Dashboard
// =============================================================================

void AnalysisCatalog::Impl::RegisterDashboard() {
    Add({"get_full_dashboard", "dashboard",
         "Summary of every uploaded dataset: revenue, inventory, suppliers, customers, "
         "receivables and purchase orders",
         {},
         engine::AllDatasets()},
        [this](const Params&) { return RenderOutcome(overview_.GetDashboard()); });

    Add({"get_kpi_summary", "dashboard",
         "Working-capital KPIs: CCC = DIO + DSO - DPO",
         {},
         {Dataset::kInventorySnapshot, Dataset::kSalesTransactions, Dataset::kArLedger,
          Dataset::kApLedger}},
        [this](const Params&) { return RenderValue(cash_.GetKpiSummary()); });

    Add({"get_data_quality_report", "dashboard",
         "Null counts, duplicate rows and a quality score per uploaded table",
         {},
         engine::AllDatasets()},
        [this](const Params&) { return RenderOutcome(overview_.GetDataQualityReport()); });
}

// =============================================================================
// Inventory
// =============================================================================

void AnalysisCatalog::Impl::RegisterInventory() {
    Add({"get_reorder_alerts", "inventory",
         "SKUs on the current snapshot below 1.2x their reorder point",
         {},
         {Dataset::kInventorySnapshot}},
        [this](const Params&) { return RenderOutcome(inventory_.GetReorderAlerts()); });

    Add({"get_smart_reorder_recommendations", "inventory",
         "Priority-ranked reorder suggestions for SKUs below their reorder point",
         {IntegerParam("limit", "Maximum recommendations", 20)},
         {Dataset::kInventorySnapshot, Dataset::kProducts}},
        [this](const Params& p) {
            return RenderOutcome(inventory_.GetSmartReorder(p.Count("limit", 20)));
        });

    Add({"calculate_safety_stock", "inventory",
         "Safety stock per SKU: SS = Z x demand_std x sqrt(lead_time)",
         {SkuListParam(),
          NumberParam("service_level", "Target service level (0.90, 0.95 or 0.99)", 0.95, 0.0),
          NumberParam("lead_time_days", "Lead time override in days", nullptr, 0.0)},
         {Dataset::kSalesTransactions, Dataset::kProducts}},
        [this](const Params& p) {
            return RenderValue(inventory_.CalculateSafetyStock(
                p.StringList("skus"), p.Number("service_level").value_or(0.95),
                p.Number("lead_time_days")));
        });

    Add({"calculate_eoq", "inventory",
         "Economic order quantity per SKU: EOQ = sqrt(2DS/H)",
         {SkuListParam(),
          NumberParam("order_cost", "Cost per purchase order (S)", nullptr, 0.0),
          NumberParam("holding_cost_pct", "Annual holding cost as a share of unit cost", nullptr,
                      0.0)},
         {Dataset::kSalesTransactions, Dataset::kProducts}},
        [this](const Params& p) {
            return RenderOutcome(inventory_.CalculateEoq(
                p.StringList("skus"), p.Number("order_cost"), p.Number("holding_cost_pct")));
        });

    Add({"get_inventory_turnover", "inventory",
         "Revenue over current inventory value per SKU",
         {IntegerParam("limit", "Maximum SKUs", 50)},
         {Dataset::kInventorySnapshot, Dataset::kSalesTransactions}},
        [this](const Params& p) {
            return RenderOutcome(inventory_.GetTurnover(p.Count("limit", 50)));
        });

    Add({"get_inventory_aging", "inventory",
         "SKU count and value per idle-days bucket (0-30d, 31-60d, 61-90d, 90+d)",
         {},
         {Dataset::kInventorySnapshot}},
        [this](const Params&) { return RenderOutcome(inventory_.GetAging()); });

    Add({"get_dead_stock", "inventory",
         "Inventory with no sale for more than the given number of days",
         {IntegerParam("days", "Idle days threshold", nullptr, 0.0)},
         {Dataset::kInventorySnapshot, Dataset::kSalesTransactions}},
        [this](const Params& p) {
            return RenderOutcome(inventory_.GetDeadStock(OptionalInt(p, "days")));
        });

    Add({"get_overstock_analysis", "inventory",
         "Items flagged overstock on the current snapshot",
         {},
         {Dataset::kInventorySnapshot}},
        [this](const Params&) { return RenderOutcome(inventory_.GetOverstock()); });

    Add({"get_stockout_risk", "inventory",
         "Items whose days of supply fall short of the horizon",
         {IntegerParam("horizon_days", "Look-ahead in days")},
         {Dataset::kInventorySnapshot}},
        [this](const Params& p) {
            return RenderOutcome(inventory_.GetStockoutRisk(OptionalInt(p, "horizon_days")));
        });

    Add({"get_abc_xyz_classification", "inventory",
         "ABC by revenue share combined with XYZ by demand variability",
         {IntegerParam("limit", "Maximum SKUs listed", 100)},
         {Dataset::kSalesTransactions, Dataset::kProducts}},
        [this](const Params& p) {
            return RenderOutcome(classification_.AbcXyz(p.Count("limit", 100)));
        });
}

// =============================================================================
// Cash cycle
// =============================================================================

void AnalysisCatalog::Impl::RegisterCashCycle() {
    Add({"simulate_ccc_improvement", "cash_cycle",
         "Cash freed by reducing DIO or DSO or by extending DPO",
         {NumberParam("dio_reduction", "Days of inventory to remove", 0),
          NumberParam("dso_reduction", "Days of receivables to remove", 0),
          NumberParam("dpo_increase", "Days of payables to add", 0),
          NumberParam("annual_revenue", "Annual revenue; observed revenue when omitted")},
         {Dataset::kSalesTransactions, Dataset::kInventorySnapshot, Dataset::kArLedger,
          Dataset::kApLedger}},
        [this](const Params& p) {
            engine::CccLevers levers;
            levers.dio_reduction = p.Number("dio_reduction").value_or(0.0);
            levers.dso_reduction = p.Number("dso_reduction").value_or(0.0);
            levers.dpo_increase = p.Number("dpo_increase").value_or(0.0);
            levers.annual_revenue = p.Number("annual_revenue");
            return RenderValue(cash_.SimulateCcc(levers));
        });

    Add({"get_working_capital_summary", "cash_cycle",
         "Cash trapped in inventory per product",
         {},
         {Dataset::kInventorySnapshot}},
        [this](const Params&) { return RenderOutcome(cash_.GetWorkingCapital()); });

    Add({"get_carrying_cost_analysis", "cash_cycle",
         "Annual and monthly cost of holding the current inventory",
         {NumberParam("holding_cost_pct", "Annual carrying rate", nullptr, 0.0)},
         {Dataset::kInventorySnapshot}},
        [this](const Params& p) {
            return RenderOutcome(cash_.GetCarryingCost(p.Number("holding_cost_pct")));
        });

    Add({"get_pareto_analysis", "cash_cycle",
         "80/20 analysis of SKUs",
         {StringParam("dimension", "Value being ranked", "revenue",
                      {"revenue", "inventory_value", "quantity"})},
         {Dataset::kSalesTransactions, Dataset::kInventorySnapshot}},
        [this](const Params& p) {
            auto dimension = engine::ParseParetoDimension(p.String("dimension").value_or(""));
            if (!dimension) {
                return ErrorResponse(absl::InvalidArgumentError("Unknown Pareto dimension"));
            }
            return RenderOutcome(classification_.Pareto(*dimension));
        });

    Add({"get_ar_aging", "cash_cycle",
         "Receivables per aging bucket with disputes and write-offs",
         {},
         {Dataset::kArLedger}},
        [this](const Params&) { return RenderOutcome(cash_.GetArAging()); });

    Add({"get_dso_analysis", "cash_cycle",
         "Days sales outstanding overall and per customer",
         {},
         {Dataset::kArLedger, Dataset::kCustomers}},
        [this](const Params&) { return RenderOutcome(cash_.GetDsoAnalysis()); });

    Add({"get_dpo_analysis", "cash_cycle",
         "Days payables outstanding overall and per supplier",
         {},
         {Dataset::kApLedger, Dataset::kSuppliers}},
        [this](const Params&) { return RenderOutcome(cash_.GetDpoAnalysis()); });
}

// =============================================================================
// Demand
// =============================================================================

void AnalysisCatalog::Impl::RegisterDemand() {
    Add({"forecast_demand", "demand",
         "Moving-average demand forecast for one SKU",
         {Required(StringParam("sku", "Product id")),
          IntegerParam("horizon_days", "Days to forecast"),
          IntegerParam("window", "Moving-average window in days")},
         {Dataset::kSalesTransactions}},
        [this](const Params& p) {
            return RenderOutcome(demand_.Forecast(*p.String("sku"), OptionalInt(p, "horizon_days"),
                                                  OptionalInt(p, "window")));
        });

    Add({"detect_anomalies", "demand",
         "Rows whose value lies more than z_threshold standard deviations from the mean",
         {StringParam("table", "Dataset table", "sales_transactions"),
          StringParam("column", "Numeric column", "qty_sold"),
          NumberParam("z_threshold", "Absolute Z above which a row is flagged", nullptr, 0.0)},
         {Dataset::kSalesTransactions}},
        [this](const Params& p) {
            return RenderOutcome(demand_.DetectAnomalies(*p.String("table"), *p.String("column"),
                                                         p.Number("z_threshold")));
        });

    Add({"get_revenue_trends", "demand",
         "Revenue, units and SKUs per period with growth against the previous period",
         {StringParam("granularity", "Period length", "monthly", {"daily", "weekly", "monthly"})},
         {Dataset::kSalesTransactions}},
        [this](const Params& p) {
            auto granularity = engine::ParseGranularity(p.String("granularity").value_or(""));
            if (!granularity) {
                return ErrorResponse(absl::InvalidArgumentError("Unknown granularity"));
            }
            return RenderOutcome(demand_.GetRevenueTrends(*granularity));
        });

    Add({"get_sales_velocity", "demand",
         "Units sold per selling day per SKU",
         {IntegerParam("limit", "Maximum SKUs", 30)},
         {Dataset::kSalesTransactions}},
        [this](const Params& p) {
            return RenderOutcome(demand_.GetSalesVelocity(p.Count("limit", 30)));
        });

    Add({"get_top_skus", "demand",
         "Top SKUs by revenue",
         {IntegerParam("limit", "Maximum SKUs", 20)},
         {Dataset::kSalesTransactions}},
        [this](const Params& p) { return RenderOutcome(demand_.GetTopSkus(p.Count("limit", 20))); });

    Add({"get_customer_concentration", "demand",
         "Revenue share of the top customers",
         {IntegerParam("limit", "Number of top customers", 10)},
         {Dataset::kSalesTransactions, Dataset::kCustomers}},
        [this](const Params& p) {
            return RenderOutcome(demand_.GetCustomerConcentration(p.Count("limit", 10)));
        });

    Add({"get_seasonality_analysis", "demand",
         "Quantity and revenue per calendar month with peak and low months",
         {StringParam("sku", "Restrict to one product id")},
         {Dataset::kSalesTransactions}},
        [this](const Params& p) { return RenderOutcome(demand_.GetSeasonality(p.String("sku"))); });
}

// =============================================================================
// Suppliers
// =============================================================================

void AnalysisCatalog::Impl::RegisterSuppliers() {
    Add({"get_supplier_risk_scores", "supplier",
         "Composite risk score from lead time, on-time delivery and rejection rate",
         {},
         {Dataset::kSuppliers}},
        [this](const Params&) { return RenderOutcome(suppliers_.GetRiskScores()); });

    Add({"get_supplier_performance", "supplier",
         "Suppliers compared on delivery, lead time and rating",
         {},
         {Dataset::kSuppliers}},
        [this](const Params&) { return RenderOutcome(suppliers_.GetPerformance()); });

    Add({"get_supplier_concentration", "supplier",
         "Purchase-order value per supplier and the top-3 share",
         {},
         {Dataset::kPurchaseOrders, Dataset::kSuppliers}},
        [this](const Params&) { return RenderOutcome(suppliers_.GetConcentration()); });

    Add({"get_supplier_network", "supplier",
         "Supplier to product relationships",
         {},
         {Dataset::kPurchaseOrders, Dataset::kSuppliers}},
        [this](const Params&) { return RenderOutcome(suppliers_.GetNetwork()); });

    Add({"find_single_source_risks", "supplier",
         "Products with exactly one supplier",
         {IntegerParam("limit", "Maximum products", 50)},
         {Dataset::kPurchaseOrders}},
        [this](const Params& p) {
            return RenderOutcome(suppliers_.FindSingleSourceRisks(p.Count("limit", 50)));
        });

    Add({"ripple_effect_analysis", "supplier",
         "Products impacted if a supplier fails",
         {Required(StringParam("supplier_id", "Supplier id"))},
         {Dataset::kPurchaseOrders, Dataset::kSuppliers}},
        [this](const Params& p) {
            return RenderOutcome(suppliers_.GetRippleEffect(*p.String("supplier_id")));
        });

    Add({"get_lead_time_variability", "supplier",
         "Suppliers ordered by lead time",
         {},
         {Dataset::kSuppliers}},
        [this](const Params&) { return RenderOutcome(suppliers_.GetLeadTimeVariability()); });

    Add({"find_alternative_suppliers", "supplier",
         "Current suppliers of a product and ranked backup suppliers",
         {Required(StringParam("sku", "Product id"))},
         {Dataset::kPurchaseOrders, Dataset::kSuppliers}},
        [this](const Params& p) {
            return RenderOutcome(suppliers_.FindAlternatives(*p.String("sku")));
        });
}

// =============================================================================
// Data
// =============================================================================

void AnalysisCatalog::Impl::RegisterData() {
    Add({"list_uploads", "data", "Upload status of every dataset category", {}, {}},
        [this](const Params&) { return RenderValue(overview_.ListUploads()); });

    Add({"get_schema_info", "data",
         "Columns, row count and sample rows of a dataset table",
         {Required(StringParam("table", "Dataset table"))},
         {}},
        [this](const Params& p) {
            return RenderOutcome(overview_.GetSchemaInfo(*p.String("table")));
        });

    Add({"run_sql_query", "data",
         "Read-only SQL over the dataset tables",
         {Required(StringParam("sql", "SELECT statement"))},
         {}},
        [this](const Params& p) {
            const std::string sql = *p.String("sql");
            if (SqlGate::FindBlockedKeyword(sql)) {
                metrics_.GetCounter(kBlockedMetric).Increment();
            }
            return RenderValue(sql_.Run(sql));
        });

    Add({"get_version_history", "data", "Upload history, newest first", {}, {}},
        [this](const Params&) { return RenderOutcome(overview_.GetVersionHistory()); });

    Add({"trigger_database_refresh", "data",
         "State of every dataset table and of the graph store",
         {},
         {}},
        [this](const Params&) { return RenderValue(overview_.GetRefreshReport()); });

    Add({"get_shipment_tracking", "data",
         "Shipments per status with the in-transit list",
         {StringParam("status", "Only shipments with this status")},
         {Dataset::kShipments}},
        [this](const Params& p) {
            return RenderOutcome(overview_.GetShipmentTracking(p.String("status")));
        });

    Add({"get_product_catalog", "data",
         "Products filtered by category and ABC class",
         {StringParam("category", "Product category"), StringParam("abc_class", "ABC class")},
         {Dataset::kProducts}},
        [this](const Params& p) {
            return RenderOutcome(
                overview_.GetProductCatalog(p.String("category"), p.String("abc_class")));
        });
}

// =============================================================================
// AnalysisCatalog
// =============================================================================

AnalysisCatalog::AnalysisCatalog(storage::TabularStore& store, storage::GraphStore& graph,
                                 const engine::EngineConfig& config, MetricsRegistry& metrics)
    : impl_(std::make_unique<Impl>(store, graph, config, metrics)) {}

AnalysisCatalog::~AnalysisCatalog() = default;

const std::vector<AnalysisInfo>& AnalysisCatalog::List() const {
    return impl_->List();
}

const AnalysisInfo* AnalysisCatalog::Find(std::string_view name) const {
    return impl_->Find(name);
}

Response AnalysisCatalog::Run(std::string_view name, const json& params) {
    return impl_->Run(name, params);
}

}  // namespace wcopt::query
