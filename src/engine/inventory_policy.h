#pragma once

/// @file inventory_policy.h
/// @brief Replenishment policy (safety stock, EOQ, reorder) and stock health

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "engine/dataset_reader.h"
#include "engine/engine_config.h"
#include "engine/outcome.h"
#include "storage/tabular_store.h"

namespace wcopt::engine {

// =============================================================================
// Formulas
// =============================================================================

/// @brief Z for service levels 0.90, 0.95 and 0.99; 1.65 for anything else
double ServiceLevelZ(double service_level);

/// @brief round(z x sigma x sqrt(lead_time))
int64_t SafetyStock(double z, double sigma, double lead_time_days);

/// @brief round(sqrt(2DS/H)); 0 when H <= 0
int64_t EconomicOrderQuantity(double annual_demand, double order_cost, double holding_cost);

enum class AlertSeverity {
    kCritical,  ///< on hand below the reorder point
    kWarning,   ///< on hand below 1.2 x the reorder point
    kOk,
};

inline constexpr double kReorderWarningFactor = 1.2;

AlertSeverity ClassifySeverity(double qty_on_hand, double reorder_point);
std::string_view SeverityName(AlertSeverity severity);

/// @brief "0-30d", "31-60d", "61-90d" or "90+d"
std::string AgeBucketFor(double days_idle);

// =============================================================================
// Result records
// =============================================================================

struct SafetyStockEntry {
    std::string product_id;
    int64_t safety_stock = 0;
    double demand_std = 0.0;
    double lead_time = 0.0;
    double z_score = 0.0;
};

struct SafetyStockReport {
    std::string formula = "SS = Z x demand_std x sqrt(lead_time)";
    std::string service_level;  ///< e.g. "95%"
    std::vector<SafetyStockEntry> results;
};

struct EoqEntry {
    std::string product_id;
    int64_t eoq = 0;
    double annual_demand = 0.0;
    double unit_cost = 0.0;
    double orders_per_year = 0.0;
};

struct EoqReport {
    std::string formula = "EOQ = sqrt(2DS/H)";
    double order_cost_S = 0.0;
    double holding_pct_H = 0.0;
    std::vector<EoqEntry> results;
};

struct ReorderAlert {
    std::string product_id;
    std::optional<std::string> location_id;
    double qty_on_hand = 0.0;
    double reorder_point = 0.0;
    std::optional<double> safety_stock_target;
    std::optional<std::string> stock_status;
    std::optional<double> days_of_supply;
    std::string severity;
};

struct ReorderAlerts {
    size_t total_alerts = 0;
    size_t critical = 0;
    size_t warning = 0;
    std::vector<ReorderAlert> alerts;
};

struct ReorderRecommendation {
    std::string product_id;
    double qty_on_hand = 0.0;
    double reorder_point = 0.0;
    std::optional<double> days_of_supply;
    std::optional<std::string> stock_status;
    int priority = 3;
    double eoq = 0.0;        ///< Suggested order quantity
    double lead_time = 0.0;
};

struct SmartReorder {
    std::vector<ReorderRecommendation> recommendations;
    size_t count = 0;
};

struct TurnoverEntry {
    std::string product_id;
    double qty_on_hand = 0.0;
    std::optional<double> unit_cost;
    double inventory_value = 0.0;
    double total_sold = 0.0;
    double revenue = 0.0;
    double turnover_ratio = 0.0;
};

struct InventoryTurnover {
    std::vector<TurnoverEntry> skus;
    size_t count = 0;
};

struct AgingEntry {
    std::string product_id;
    double qty = 0.0;
    double value = 0.0;
    std::optional<double> days_idle;
    std::string age_bucket;  ///< "unknown" when no movement age was recorded
};

struct AgingBucketSummary {
    size_t sku_count = 0;
    double total_value = 0.0;
};

struct InventoryAging {
    std::map<std::string, AgingBucketSummary> aging_buckets;
    std::vector<AgingEntry> details;
};

struct DeadStockEntry {
    std::string product_id;
    double qty = 0.0;
    double value_at_risk = 0.0;
    std::optional<std::string> last_sale_date;
    std::optional<double> days_idle;  ///< nullopt when never sold
};

struct DeadStock {
    int days_threshold = 0;
    std::string basis;  ///< "last_sale" or "days_since_last_movement"
    size_t items = 0;
    double total_value_at_risk = 0.0;
    std::vector<DeadStockEntry> dead_stock;
    /// Products with sale rows, none of them dated. Their idle time is unknown,
    /// so they are listed here instead of in dead_stock.
    std::vector<std::string> undated_sales;
};

struct StockRow {
    std::string product_id;
    std::optional<std::string> location_id;
    double qty_on_hand = 0.0;
    double reorder_point = 0.0;
    double inventory_value = 0.0;
    std::optional<double> days_of_supply;
    std::optional<std::string> stock_status;
};

struct Overstock {
    size_t overstocked_items = 0;
    double total_excess_value = 0.0;
    std::vector<StockRow> items;
};

struct StockoutRisk {
    int horizon_days = 0;
    size_t at_risk_count = 0;
    std::vector<StockRow> items;
};

// =============================================================================
// InventoryPolicyEngine
// =============================================================================

/// @brief Inventory analyses over the current snapshot, sales and products.
///
/// Only rows of the latest snapshot_date are considered. Missing catalog data
/// falls back to the configured defaults.
class InventoryPolicyEngine {
public:
    InventoryPolicyEngine(storage::TabularStore& store, const EngineConfig& config);

    /// @brief At most max_batch_skus SKUs are processed
    absl::StatusOr<SafetyStockReport> CalculateSafetyStock(const std::vector<std::string>& skus,
                                                           double service_level,
                                                           std::optional<double> lead_time_days);

    /// @brief Requires sales_transactions
    absl::StatusOr<Outcome<EoqReport>> CalculateEoq(const std::vector<std::string>& skus,
                                                    std::optional<double> order_cost,
                                                    std::optional<double> holding_cost_pct);

    absl::StatusOr<Outcome<ReorderAlerts>> GetReorderAlerts();
    absl::StatusOr<Outcome<SmartReorder>> GetSmartReorder(size_t limit);
    absl::StatusOr<Outcome<InventoryTurnover>> GetTurnover(size_t limit);
    absl::StatusOr<Outcome<InventoryAging>> GetAging();

    /// @brief days defaults to the configured dead-stock threshold
    absl::StatusOr<Outcome<DeadStock>> GetDeadStock(std::optional<int> days);

    absl::StatusOr<Outcome<Overstock>> GetOverstock();
    absl::StatusOr<Outcome<StockoutRisk>> GetStockoutRisk(std::optional<int> horizon_days);

private:
    /// @brief Current inventory, or the insufficient-data record
    absl::StatusOr<std::optional<InsufficientData>> RequireInventory(
        std::vector<InventoryRecord>* inventory);

    /// @brief Products keyed by id; empty when the table is absent
    absl::StatusOr<std::map<std::string, ProductRecord>> ProductIndex();

    storage::TabularStore& store_;
    const EngineConfig& config_;
    DatasetReader reader_;
};

}  // namespace wcopt::engine
