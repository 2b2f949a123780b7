/// @file demand.cpp
/// @brief Demand forecasting, anomaly detection and sales analytics

#include "engine/demand.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <unordered_map>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "engine/availability.h"
#include "engine/stats.h"
#include "storage/identifier.h"

namespace wcopt::engine {

namespace {

constexpr size_t kMaxAnomalies = 50;
constexpr double kHighConcentration = 80.0;
constexpr double kMediumConcentration = 50.0;

double SumOf(std::vector<double>::const_iterator begin, std::vector<double>::const_iterator end) {
    double sum = 0.0;
    for (auto it = begin; it != end; ++it) {
        sum += *it;
    }
    return sum;
}

}  // namespace

// =============================================================================
// Free functions
// =============================================================================

MovingAverageForecast ForecastSeries(const std::vector<double>& daily, int window) {
    MovingAverageForecast forecast;
    const int history = static_cast<int>(daily.size());
    forecast.window = std::max(1, std::min(window, history));
    forecast.trend = "stable";
    if (daily.empty()) {
        return forecast;
    }

    const auto end = daily.end();
    forecast.moving_average = SumOf(end - forecast.window, end) / forecast.window;

    if (history >= 2 * forecast.window) {
        const double previous =
            SumOf(end - 2 * forecast.window, end - forecast.window) / forecast.window;
        if (forecast.moving_average > previous * kTrendUpFactor) {
            forecast.trend = "increasing";
        } else if (forecast.moving_average < previous * kTrendDownFactor) {
            forecast.trend = "decreasing";
        }
    }
    return forecast;
}

std::optional<Granularity> ParseGranularity(std::string_view name) {
    for (auto granularity : {Granularity::kDaily, Granularity::kWeekly, Granularity::kMonthly}) {
        if (name == GranularityName(granularity)) {
            return granularity;
        }
    }
    return std::nullopt;
}

std::string_view GranularityName(Granularity granularity) {
    switch (granularity) {
        case Granularity::kDaily:
            return "daily";
        case Granularity::kWeekly:
            return "weekly";
        case Granularity::kMonthly:
            return "monthly";
    }
    return "monthly";
}

absl::CivilDay PeriodStart(absl::CivilDay day, Granularity granularity) {
    switch (granularity) {
        case Granularity::kDaily:
            return day;
        case Granularity::kWeekly:
            return absl::PrevWeekday(day + 1, absl::Weekday::monday);
        case Granularity::kMonthly:
            return absl::CivilDay(absl::CivilMonth(day));
    }
    return day;
}

std::string ConcentrationRisk(double share_pct) {
    if (share_pct > kHighConcentration) {
        return "high";
    }
    if (share_pct > kMediumConcentration) {
        return "medium";
    }
    return "low";
}

// =============================================================================
// DemandEngine
// =============================================================================

DemandEngine::DemandEngine(storage::TabularStore& store, const EngineConfig& config)
    : store_(store), config_(config), reader_(store) {}

absl::StatusOr<std::optional<InsufficientData>> DemandEngine::RequireSales(
    std::vector<SaleRecord>* sales) {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto missing, availability.Check({Dataset::kSalesTransactions}));
    if (missing) {
        return missing;
    }
    WCOPT_ASSIGN_OR_RETURN(*sales, reader_.Sales());
    return std::optional<InsufficientData>();
}

absl::StatusOr<Outcome<DemandForecast>> DemandEngine::Forecast(const std::string& sku,
                                                               std::optional<int> horizon_days,
                                                               std::optional<int> window) {
    const int horizon = horizon_days.value_or(config_.forecast_horizon_days);
    const int requested_window = window.value_or(config_.forecast_window);
    if (sku.empty()) {
        return absl::InvalidArgumentError("sku must not be empty");
    }
    if (horizon <= 0 || requested_window <= 0) {
        return absl::InvalidArgumentError("horizon_days and window must be positive");
    }

    std::vector<SaleRecord> sales;
    WCOPT_ASSIGN_OR_RETURN(auto missing, RequireSales(&sales));
    if (missing) {
        return *missing;
    }

    std::map<absl::CivilDay, double> per_day;
    for (const auto& rec : sales) {
        if (rec.product_id == sku && rec.transaction_date) {
            per_day[*rec.transaction_date] += rec.qty_sold;
        }
    }
    if (per_day.empty()) {
        return NotFound{absl::StrCat("No sales for '", sku, "'.")};
    }

    std::vector<double> daily;
    daily.reserve(per_day.size());
    for (const auto& [day, qty] : per_day) {
        daily.push_back(qty);
    }
    const MovingAverageForecast ma = ForecastSeries(daily, requested_window);

    DemandForecast forecast;
    forecast.product_id = sku;
    forecast.historical_days = daily.size();
    forecast.window = ma.window;
    forecast.trend = ma.trend;
    forecast.moving_average = Round(ma.moving_average, 2);
    forecast.horizon_days = horizon;
    forecast.total_predicted = Round(ma.moving_average * horizon);
    return forecast;
}

absl::StatusOr<Outcome<AnomalyReport>> DemandEngine::DetectAnomalies(
    const std::string& table, const std::string& column, std::optional<double> z_threshold) {
    auto dataset = ParseDataset(table);
    if (!dataset) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Unknown table '", table, "'. Must be one of: ", AllTableNames()));
    }
    WCOPT_RETURN_IF_ERROR(storage::ValidateIdentifier(column, "column name"));
    const double threshold = z_threshold.value_or(config_.anomaly_z_threshold);
    if (threshold <= 0.0) {
        return absl::InvalidArgumentError("z_threshold must be positive");
    }

    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto missing, availability.Check({*dataset}));
    if (missing) {
        return *missing;
    }
    WCOPT_ASSIGN_OR_RETURN(storage::Table data, reader_.ReadAll(*dataset));
    auto index = data.ColumnIndex(column);
    if (!index) {
        return absl::InvalidArgumentError(
            absl::StrCat("Column '", column, "' not found in ", table));
    }

    std::vector<double> values;
    values.reserve(data.rows.size());
    for (const auto& row : data.rows) {
        if (auto value = CellNumber(row[*index])) {
            values.push_back(*value);
        }
    }

    AnomalyReport report;
    report.table = table;
    report.column = column;
    report.z_threshold = threshold;
    report.total_rows = data.rows.size();
    report.columns = data.columns;
    const double mean = Mean(values);
    const double stddev = PopulationStdDev(values);
    report.mean = Round(mean, 4);
    report.stddev = Round(stddev, 4);

    if (stddev > 0.0) {
        for (auto& row : data.rows) {
            auto value = CellNumber(row[*index]);
            if (!value) {
                continue;
            }
            const double z = (*value - mean) / stddev;
            if (std::fabs(z) <= threshold) {
                continue;
            }
            ++report.anomalies_found;
            if (report.anomalies.size() < kMaxAnomalies) {
                report.anomalies.push_back({Round(z, 3), std::move(row)});
            }
        }
    }
    WCOPT_LOG_DEBUG("Anomaly scan {}.{}: {} of {} rows flagged", table, column,
                    report.anomalies_found, report.total_rows);
    return report;
}

absl::StatusOr<Outcome<RevenueTrends>> DemandEngine::GetRevenueTrends(Granularity granularity) {
    std::vector<SaleRecord> sales;
    WCOPT_ASSIGN_OR_RETURN(auto missing, RequireSales(&sales));
    if (missing) {
        return *missing;
    }

    struct Bucket {
        double revenue = 0.0;
        double units = 0.0;
        std::set<std::string> skus;
    };
    std::map<absl::CivilDay, Bucket> buckets;
    for (const auto& rec : sales) {
        if (!rec.transaction_date) {
            continue;
        }
        auto& bucket = buckets[PeriodStart(*rec.transaction_date, granularity)];
        bucket.revenue += rec.total_revenue;
        bucket.units += rec.qty_sold;
        bucket.skus.insert(rec.product_id);
    }

    RevenueTrends trends;
    trends.granularity = std::string(GranularityName(granularity));
    std::optional<double> previous;
    for (const auto& [start, bucket] : buckets) {
        RevenuePeriod period;
        period.period = FormatDay(start);
        period.revenue = Round(bucket.revenue, 2);
        period.units = bucket.units;
        period.skus = bucket.skus.size();
        if (previous) {
            period.growth_pct =
                *previous > 0.0 ? Round((bucket.revenue - *previous) / *previous * 100.0, 1) : 0.0;
        }
        previous = bucket.revenue;
        trends.trends.push_back(std::move(period));
    }
    trends.periods = trends.trends.size();
    return trends;
}

absl::StatusOr<Outcome<SalesVelocity>> DemandEngine::GetSalesVelocity(size_t limit) {
    std::vector<SaleRecord> sales;
    WCOPT_ASSIGN_OR_RETURN(auto missing, RequireSales(&sales));
    if (missing) {
        return *missing;
    }

    struct Movement {
        double sold = 0.0;
        double revenue = 0.0;
        std::set<absl::CivilDay> days;
    };
    std::map<std::string, Movement> per_product;
    for (const auto& rec : sales) {
        auto& m = per_product[rec.product_id];
        m.sold += rec.qty_sold;
        m.revenue += rec.total_revenue;
        if (rec.transaction_date) {
            m.days.insert(*rec.transaction_date);
        }
    }

    SalesVelocity velocity;
    for (const auto& [id, m] : per_product) {
        VelocityEntry entry;
        entry.product_id = id;
        entry.total_sold = m.sold;
        entry.sale_days = m.days.size();
        entry.daily_velocity =
            Round(m.sold / static_cast<double>(std::max<size_t>(entry.sale_days, 1)), 2);
        entry.total_revenue = Round(m.revenue, 2);
        velocity.fastest_movers.push_back(std::move(entry));
    }
    std::stable_sort(velocity.fastest_movers.begin(), velocity.fastest_movers.end(),
                     [](const VelocityEntry& a, const VelocityEntry& b) {
                         return a.daily_velocity > b.daily_velocity;
                     });
    if (velocity.fastest_movers.size() > limit) {
        velocity.fastest_movers.resize(limit);
    }
    velocity.count = velocity.fastest_movers.size();
    return velocity;
}

absl::StatusOr<Outcome<TopSkus>> DemandEngine::GetTopSkus(size_t limit) {
    std::vector<SaleRecord> sales;
    WCOPT_ASSIGN_OR_RETURN(auto missing, RequireSales(&sales));
    if (missing) {
        return *missing;
    }

    std::map<std::string, TopSkuEntry> per_product;
    for (const auto& rec : sales) {
        auto& entry = per_product[rec.product_id];
        entry.product_id = rec.product_id;
        entry.revenue += rec.total_revenue;
        entry.units += rec.qty_sold;
        if (rec.gross_profit) {
            entry.profit = entry.profit.value_or(0.0) + *rec.gross_profit;
        }
    }

    TopSkus top;
    for (auto& [id, entry] : per_product) {
        entry.revenue = Round(entry.revenue, 2);
        if (entry.profit) {
            entry.profit = Round(*entry.profit, 2);
        }
        top.top_skus.push_back(std::move(entry));
    }
    std::stable_sort(top.top_skus.begin(), top.top_skus.end(),
                     [](const TopSkuEntry& a, const TopSkuEntry& b) {
                         return a.revenue > b.revenue;
                     });
    if (top.top_skus.size() > limit) {
        top.top_skus.resize(limit);
    }
    top.count = top.top_skus.size();
    return top;
}

absl::StatusOr<Outcome<CustomerConcentration>> DemandEngine::GetCustomerConcentration(
    size_t limit) {
    std::vector<SaleRecord> sales;
    WCOPT_ASSIGN_OR_RETURN(auto missing, RequireSales(&sales));
    if (missing) {
        return *missing;
    }

    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(bool has_customers, availability.IsAvailable(Dataset::kCustomers));
    std::unordered_map<std::string, std::string> names;
    if (has_customers) {
        WCOPT_ASSIGN_OR_RETURN(auto customers, reader_.Customers());
        for (const auto& rec : customers) {
            if (rec.customer_name) {
                names.emplace(rec.customer_id, *rec.customer_name);
            }
        }
    }

    struct Account {
        double revenue = 0.0;
        std::set<std::string> products;
    };
    std::map<std::string, Account> accounts;
    double total = 0.0;
    for (const auto& rec : sales) {
        if (!rec.customer_id) {
            continue;
        }
        auto& account = accounts[*rec.customer_id];
        account.revenue += rec.total_revenue;
        account.products.insert(rec.product_id);
        total += rec.total_revenue;
    }

    CustomerConcentration result;
    for (const auto& [id, account] : accounts) {
        CustomerShare share;
        share.customer_id = id;
        auto name = names.find(id);
        share.customer_name = name != names.end() ? name->second : id;
        share.revenue = account.revenue;
        share.revenue_pct = Percent(account.revenue, total);
        share.unique_products = account.products.size();
        result.top_customers.push_back(std::move(share));
    }
    std::stable_sort(result.top_customers.begin(), result.top_customers.end(),
                     [](const CustomerShare& a, const CustomerShare& b) {
                         return a.revenue > b.revenue;
                     });
    if (result.top_customers.size() > limit) {
        result.top_customers.resize(limit);
    }
    for (auto& share : result.top_customers) {
        result.top_share_pct += share.revenue_pct;
        share.revenue = Round(share.revenue, 2);
        share.revenue_pct = Round(share.revenue_pct, 2);
    }
    result.concentration_risk = ConcentrationRisk(result.top_share_pct);
    result.top_share_pct = Round(result.top_share_pct, 1);
    return result;
}

absl::StatusOr<Outcome<Seasonality>> DemandEngine::GetSeasonality(
    const std::optional<std::string>& sku) {
    std::vector<SaleRecord> sales;
    WCOPT_ASSIGN_OR_RETURN(auto missing, RequireSales(&sales));
    if (missing) {
        return *missing;
    }

    std::map<int, MonthlyDemand> months;
    for (const auto& rec : sales) {
        if (!rec.transaction_date || (sku && rec.product_id != *sku)) {
            continue;
        }
        const int month = rec.transaction_date->month();
        auto& m = months[month];
        m.month = month;
        m.qty += rec.qty_sold;
        m.revenue += rec.total_revenue;
    }
    if (months.empty()) {
        return NotFound{sku ? absl::StrCat("No sales for '", *sku, "'.")
                            : std::string("No dated sales to analyse.")};
    }

    double total_qty = 0.0;
    for (const auto& [month, m] : months) {
        total_qty += m.qty;
    }
    const double average = total_qty / static_cast<double>(months.size());

    Seasonality result;
    result.product_id = sku;
    const MonthlyDemand* peak = nullptr;
    const MonthlyDemand* low = nullptr;
    for (auto& [month, m] : months) {
        m.index_vs_avg = average > 0.0 ? Round(m.qty / average, 2) : 0.0;
        if (!peak || m.qty > peak->qty) {
            peak = &m;
        }
        if (!low || m.qty < low->qty) {
            low = &m;
        }
    }
    result.peak_month = peak->month;
    result.low_month = low->month;
    for (auto& [month, m] : months) {
        m.revenue = Round(m.revenue, 2);
        result.monthly_pattern.push_back(m);
    }
    return result;
}

}  // namespace wcopt::engine
