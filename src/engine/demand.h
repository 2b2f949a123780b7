#pragma once

/// @file demand.h
/// @brief Demand forecasting, anomaly detection and sales analytics

#include <cstddef>
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
// Moving-average forecast
// =============================================================================

inline constexpr double kTrendUpFactor = 1.1;
inline constexpr double kTrendDownFactor = 0.9;

/// @brief Forecast over a chronological daily quantity series
struct MovingAverageForecast {
    int window = 0;             ///< Effective window after shrinking to the history
    double moving_average = 0.0;
    std::string trend;          ///< "increasing", "decreasing" or "stable"
};

/// @brief Mean of the last window values, trend against the window before.
/// An empty series is not valid input.
MovingAverageForecast ForecastSeries(const std::vector<double>& daily, int window);

struct DemandForecast {
    std::string product_id;
    size_t historical_days = 0;
    int window = 0;
    std::string trend;
    double moving_average = 0.0;
    int horizon_days = 0;
    double total_predicted = 0.0;
};

// =============================================================================
// Anomalies
// =============================================================================

struct Anomaly {
    double z_score = 0.0;
    storage::Row row;  ///< Aligned with AnomalyReport::columns
};

struct AnomalyReport {
    std::string table;
    std::string column;
    double z_threshold = 0.0;
    size_t total_rows = 0;
    double mean = 0.0;
    double stddev = 0.0;
    size_t anomalies_found = 0;
    std::vector<std::string> columns;
    std::vector<Anomaly> anomalies;  ///< First 50
};

// =============================================================================
// Sales analytics
// =============================================================================

enum class Granularity {
    kDaily,
    kWeekly,   ///< Weeks start on Monday
    kMonthly,
};

std::optional<Granularity> ParseGranularity(std::string_view name);
std::string_view GranularityName(Granularity granularity);

/// @brief First day of the period containing the given day
absl::CivilDay PeriodStart(absl::CivilDay day, Granularity granularity);

struct RevenuePeriod {
    std::string period;  ///< YYYY-MM-DD of the period start
    double revenue = 0.0;
    double units = 0.0;
    size_t skus = 0;
    std::optional<double> growth_pct;  ///< Absent for the first period
};

struct RevenueTrends {
    std::string granularity;
    size_t periods = 0;
    std::vector<RevenuePeriod> trends;
};

struct VelocityEntry {
    std::string product_id;
    double total_sold = 0.0;
    size_t sale_days = 0;
    double daily_velocity = 0.0;
    double total_revenue = 0.0;
};

struct SalesVelocity {
    std::vector<VelocityEntry> fastest_movers;
    size_t count = 0;
};

struct TopSkuEntry {
    std::string product_id;
    double revenue = 0.0;
    double units = 0.0;
    std::optional<double> profit;  ///< nullopt when no gross_profit was recorded
};

struct TopSkus {
    std::vector<TopSkuEntry> top_skus;
    size_t count = 0;
};

struct CustomerShare {
    std::string customer_id;
    std::string customer_name;
    double revenue = 0.0;
    double revenue_pct = 0.0;
    size_t unique_products = 0;
};

struct CustomerConcentration {
    std::vector<CustomerShare> top_customers;
    double top_share_pct = 0.0;
    std::string concentration_risk;
};

/// @brief "high" above 80 %, "medium" above 50 %, else "low"
std::string ConcentrationRisk(double share_pct);

struct MonthlyDemand {
    int month = 0;
    double qty = 0.0;
    double revenue = 0.0;
    double index_vs_avg = 0.0;
};

struct Seasonality {
    std::optional<std::string> product_id;
    std::vector<MonthlyDemand> monthly_pattern;
    int peak_month = 0;
    int low_month = 0;
};

// =============================================================================
// DemandEngine
// =============================================================================

class DemandEngine {
public:
    DemandEngine(storage::TabularStore& store, const EngineConfig& config);

    /// @brief NotFound when the SKU has no sales
    absl::StatusOr<Outcome<DemandForecast>> Forecast(const std::string& sku,
                                                     std::optional<int> horizon_days,
                                                     std::optional<int> window);

    /// @brief table must be a dataset category and column an identifier
    absl::StatusOr<Outcome<AnomalyReport>> DetectAnomalies(const std::string& table,
                                                           const std::string& column,
                                                           std::optional<double> z_threshold);

    absl::StatusOr<Outcome<RevenueTrends>> GetRevenueTrends(Granularity granularity);
    absl::StatusOr<Outcome<SalesVelocity>> GetSalesVelocity(size_t limit);
    absl::StatusOr<Outcome<TopSkus>> GetTopSkus(size_t limit);
    absl::StatusOr<Outcome<CustomerConcentration>> GetCustomerConcentration(size_t limit);

    /// @brief Restricted to one SKU when given
    absl::StatusOr<Outcome<Seasonality>> GetSeasonality(const std::optional<std::string>& sku);

private:
    /// @brief All sales, or the insufficient-data record
    absl::StatusOr<std::optional<InsufficientData>> RequireSales(std::vector<SaleRecord>* sales);

    storage::TabularStore& store_;
    const EngineConfig& config_;
    DatasetReader reader_;
};

}  // namespace wcopt::engine
