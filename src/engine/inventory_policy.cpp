/// @file inventory_policy.cpp
/// @brief Replenishment policy and stock health analyses

#include "engine/inventory_policy.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <unordered_map>
#include <unordered_set>

#include <absl/strings/match.h>
#include <absl/strings/str_format.h>

#include "common/error.h"
#include "common/logging.h"
#include "engine/availability.h"
#include "engine/stats.h"

namespace wcopt::engine {

namespace {

constexpr double kDaysPerYear = 365.0;

const char* const kAgeBuckets[] = {"0-30d", "31-60d", "61-90d", "90+d"};
constexpr const char* kUnknownAge = "unknown";

int StatusPriority(const std::optional<std::string>& status) {
    if (status && absl::EqualsIgnoreCase(*status, "stockout")) {
        return 1;
    }
    if (status && absl::EqualsIgnoreCase(*status, "low_stock")) {
        return 2;
    }
    return 3;
}

/// @brief Orders optional values ascending with unknown values last
bool LessKnownFirst(const std::optional<double>& a, const std::optional<double>& b) {
    if (a.has_value() != b.has_value()) {
        return a.has_value();
    }
    return a && *a < *b;
}

StockRow ToStockRow(const InventoryRecord& rec) {
    StockRow row;
    row.product_id = rec.product_id;
    row.location_id = rec.location_id;
    row.qty_on_hand = rec.qty_on_hand;
    row.reorder_point = rec.reorder_point;
    row.inventory_value = Round(InventoryValueOf(rec), 2);
    row.days_of_supply = rec.days_of_supply;
    row.stock_status = rec.stock_status;
    return row;
}

}  // namespace

// =============================================================================
// Formulas
// =============================================================================

double ServiceLevelZ(double service_level) {
    static const std::pair<double, double> table[] = {
        {0.90, 1.28},
        {0.95, 1.65},
        {0.99, 2.33},
    };
    for (const auto& [level, z] : table) {
        if (std::fabs(service_level - level) < 1e-9) {
            return z;
        }
    }
    return 1.65;
}

int64_t SafetyStock(double z, double sigma, double lead_time_days) {
    if (lead_time_days <= 0.0) {
        return 0;
    }
    return std::llround(z * sigma * std::sqrt(lead_time_days));
}

int64_t EconomicOrderQuantity(double annual_demand, double order_cost, double holding_cost) {
    if (holding_cost <= 0.0 || annual_demand <= 0.0) {
        return 0;
    }
    return std::llround(std::sqrt(2.0 * annual_demand * order_cost / holding_cost));
}

AlertSeverity ClassifySeverity(double qty_on_hand, double reorder_point) {
    if (qty_on_hand < reorder_point) {
        return AlertSeverity::kCritical;
    }
    if (qty_on_hand < kReorderWarningFactor * reorder_point) {
        return AlertSeverity::kWarning;
    }
    return AlertSeverity::kOk;
}

std::string_view SeverityName(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::kCritical:
            return "critical";
        case AlertSeverity::kWarning:
            return "warning";
        case AlertSeverity::kOk:
            return "ok";
    }
    return "ok";
}

std::string AgeBucketFor(double days_idle) {
    if (days_idle <= 30.0) {
        return kAgeBuckets[0];
    }
    if (days_idle <= 60.0) {
        return kAgeBuckets[1];
    }
    if (days_idle <= 90.0) {
        return kAgeBuckets[2];
    }
    return kAgeBuckets[3];
}

// =============================================================================
// InventoryPolicyEngine
// =============================================================================

InventoryPolicyEngine::InventoryPolicyEngine(storage::TabularStore& store,
                                             const EngineConfig& config)
    : store_(store), config_(config), reader_(store) {}

absl::StatusOr<std::optional<InsufficientData>> InventoryPolicyEngine::RequireInventory(
    std::vector<InventoryRecord>* inventory) {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto missing, availability.Check({Dataset::kInventorySnapshot}));
    if (missing) {
        return missing;
    }
    WCOPT_ASSIGN_OR_RETURN(*inventory, reader_.CurrentInventory());
    return std::optional<InsufficientData>();
}

absl::StatusOr<std::map<std::string, ProductRecord>> InventoryPolicyEngine::ProductIndex() {
    std::map<std::string, ProductRecord> index;
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(bool available, availability.IsAvailable(Dataset::kProducts));
    if (!available) {
        return index;
    }
    WCOPT_ASSIGN_OR_RETURN(auto products, reader_.Products());
    for (auto& rec : products) {
        std::string id = rec.product_id;
        index.emplace(std::move(id), std::move(rec));
    }
    return index;
}

absl::StatusOr<SafetyStockReport> InventoryPolicyEngine::CalculateSafetyStock(
    const std::vector<std::string>& skus, double service_level,
    std::optional<double> lead_time_days) {
    if (service_level <= 0.0 || service_level >= 1.0) {
        return absl::InvalidArgumentError("service_level must be between 0 and 1");
    }
    if (lead_time_days && *lead_time_days <= 0.0) {
        return absl::InvalidArgumentError("lead_time_days must be positive");
    }

    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(bool has_sales, availability.IsAvailable(Dataset::kSalesTransactions));
    std::unordered_map<std::string, std::vector<double>> quantities;
    if (has_sales) {
        WCOPT_ASSIGN_OR_RETURN(auto sales, reader_.Sales());
        for (const auto& rec : sales) {
            quantities[rec.product_id].push_back(rec.qty_sold);
        }
    }
    WCOPT_ASSIGN_OR_RETURN(auto products, ProductIndex());

    SafetyStockReport report;
    report.service_level = absl::StrFormat("%.0f%%", service_level * 100.0);
    const double z = ServiceLevelZ(service_level);
    const size_t count = std::min(skus.size(), config_.max_batch_skus);
    for (size_t i = 0; i < count; ++i) {
        SafetyStockEntry entry;
        entry.product_id = skus[i];
        entry.z_score = z;

        double sigma = config_.default_demand_stddev;
        auto observed = quantities.find(skus[i]);
        if (observed != quantities.end() && observed->second.size() >= 2) {
            sigma = SampleStdDev(observed->second);
        }

        double lead_time = config_.default_lead_time_days;
        if (lead_time_days) {
            lead_time = *lead_time_days;
        } else {
            auto product = products.find(skus[i]);
            if (product != products.end() && product->second.lead_time_days &&
                *product->second.lead_time_days > 0.0) {
                lead_time = *product->second.lead_time_days;
            }
        }

        entry.safety_stock = SafetyStock(z, sigma, lead_time);
        entry.demand_std = Round(sigma, 2);
        entry.lead_time = lead_time;
        report.results.push_back(std::move(entry));
    }
    if (skus.size() > count) {
        WCOPT_LOG_DEBUG("Safety stock truncated {} SKUs to {}", skus.size(), count);
    }
    return report;
}

absl::StatusOr<Outcome<EoqReport>> InventoryPolicyEngine::CalculateEoq(
    const std::vector<std::string>& skus, std::optional<double> order_cost,
    std::optional<double> holding_cost_pct) {
    const double S = order_cost.value_or(config_.order_cost);
    const double rate = holding_cost_pct.value_or(config_.holding_cost_rate);
    if (S < 0.0 || rate < 0.0) {
        return absl::InvalidArgumentError("order_cost and holding_cost_pct must not be negative");
    }

    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto missing, availability.Check({Dataset::kSalesTransactions}));
    if (missing) {
        return *missing;
    }
    WCOPT_ASSIGN_OR_RETURN(auto sales, reader_.Sales());
    WCOPT_ASSIGN_OR_RETURN(auto products, ProductIndex());

    struct Demand {
        double quantity = 0.0;
        std::set<absl::CivilDay> days;
    };
    std::unordered_map<std::string, Demand> demand;
    for (const auto& rec : sales) {
        auto& d = demand[rec.product_id];
        d.quantity += rec.qty_sold;
        if (rec.transaction_date) {
            d.days.insert(*rec.transaction_date);
        }
    }

    EoqReport report;
    report.order_cost_S = S;
    report.holding_pct_H = rate;
    const size_t count = std::min(skus.size(), config_.max_batch_skus);
    for (size_t i = 0; i < count; ++i) {
        EoqEntry entry;
        entry.product_id = skus[i];

        double annual = 0.0;
        auto observed = demand.find(skus[i]);
        if (observed != demand.end()) {
            const double days = static_cast<double>(std::max<size_t>(observed->second.days.size(), 1));
            annual = observed->second.quantity / days * kDaysPerYear;
        }

        entry.unit_cost = config_.default_unit_cost;
        auto product = products.find(skus[i]);
        if (product != products.end() && product->second.unit_cost) {
            entry.unit_cost = *product->second.unit_cost;
        }

        entry.eoq = EconomicOrderQuantity(annual, S, entry.unit_cost * rate);
        entry.annual_demand = Round(annual);
        entry.orders_per_year =
            entry.eoq > 0 ? Round(annual / static_cast<double>(entry.eoq), 1) : 0.0;
        report.results.push_back(std::move(entry));
    }
    return report;
}

absl::StatusOr<Outcome<ReorderAlerts>> InventoryPolicyEngine::GetReorderAlerts() {
    std::vector<InventoryRecord> inventory;
    WCOPT_ASSIGN_OR_RETURN(auto missing, RequireInventory(&inventory));
    if (missing) {
        return *missing;
    }

    ReorderAlerts result;
    for (const auto& rec : inventory) {
        const AlertSeverity severity = ClassifySeverity(rec.qty_on_hand, rec.reorder_point);
        if (severity == AlertSeverity::kOk) {
            continue;
        }
        ReorderAlert alert;
        alert.product_id = rec.product_id;
        alert.location_id = rec.location_id;
        alert.qty_on_hand = rec.qty_on_hand;
        alert.reorder_point = rec.reorder_point;
        alert.safety_stock_target = rec.safety_stock_target;
        alert.stock_status = rec.stock_status;
        alert.days_of_supply = rec.days_of_supply;
        alert.severity = std::string(SeverityName(severity));
        if (severity == AlertSeverity::kCritical) {
            ++result.critical;
        } else {
            ++result.warning;
        }
        result.alerts.push_back(std::move(alert));
    }

    // Coverage ratio ascending; rows without a positive reorder point go last.
    std::sort(result.alerts.begin(), result.alerts.end(),
              [](const ReorderAlert& a, const ReorderAlert& b) {
                  const bool a_ranked = a.reorder_point > 0.0;
                  const bool b_ranked = b.reorder_point > 0.0;
                  if (a_ranked != b_ranked) {
                      return a_ranked;
                  }
                  if (a_ranked) {
                      const double ra = a.qty_on_hand / a.reorder_point;
                      const double rb = b.qty_on_hand / b.reorder_point;
                      if (ra != rb) {
                          return ra < rb;
                      }
                  }
                  return a.product_id < b.product_id;
              });
    result.total_alerts = result.alerts.size();
    return result;
}

absl::StatusOr<Outcome<SmartReorder>> InventoryPolicyEngine::GetSmartReorder(size_t limit) {
    std::vector<InventoryRecord> inventory;
    WCOPT_ASSIGN_OR_RETURN(auto missing, RequireInventory(&inventory));
    if (missing) {
        return *missing;
    }
    WCOPT_ASSIGN_OR_RETURN(auto products, ProductIndex());

    SmartReorder result;
    for (const auto& rec : inventory) {
        if (!(rec.qty_on_hand < rec.reorder_point)) {
            continue;
        }
        ReorderRecommendation rec_out;
        rec_out.product_id = rec.product_id;
        rec_out.qty_on_hand = rec.qty_on_hand;
        rec_out.reorder_point = rec.reorder_point;
        rec_out.days_of_supply = rec.days_of_supply;
        rec_out.stock_status = rec.stock_status;
        rec_out.priority = StatusPriority(rec.stock_status);
        rec_out.eoq = config_.default_order_qty;
        rec_out.lead_time = config_.default_lead_time_days;
        auto product = products.find(rec.product_id);
        if (product != products.end()) {
            rec_out.eoq = product->second.economic_order_qty.value_or(config_.default_order_qty);
            rec_out.lead_time =
                product->second.lead_time_days.value_or(config_.default_lead_time_days);
        }
        result.recommendations.push_back(std::move(rec_out));
    }

    std::stable_sort(result.recommendations.begin(), result.recommendations.end(),
                     [](const ReorderRecommendation& a, const ReorderRecommendation& b) {
                         if (a.priority != b.priority) {
                             return a.priority < b.priority;
                         }
                         if (a.days_of_supply != b.days_of_supply) {
                             return LessKnownFirst(a.days_of_supply, b.days_of_supply);
                         }
                         return a.product_id < b.product_id;
                     });
    if (result.recommendations.size() > limit) {
        result.recommendations.resize(limit);
    }
    result.count = result.recommendations.size();
    return result;
}

absl::StatusOr<Outcome<InventoryTurnover>> InventoryPolicyEngine::GetTurnover(size_t limit) {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto missing, availability.Check({Dataset::kInventorySnapshot,
                                                             Dataset::kSalesTransactions}));
    if (missing) {
        return *missing;
    }
    WCOPT_ASSIGN_OR_RETURN(auto inventory, reader_.CurrentInventory());
    WCOPT_ASSIGN_OR_RETURN(auto sales, reader_.Sales());

    struct Stock {
        double qty = 0.0;
        double value = 0.0;
        double cost_sum = 0.0;
        size_t cost_count = 0;
    };
    std::map<std::string, Stock> stock;
    for (const auto& rec : inventory) {
        auto& s = stock[rec.product_id];
        s.qty += rec.qty_on_hand;
        s.value += InventoryValueOf(rec);
        if (rec.unit_cost) {
            s.cost_sum += *rec.unit_cost;
            ++s.cost_count;
        }
    }
    std::unordered_map<std::string, std::pair<double, double>> sold;
    for (const auto& rec : sales) {
        auto& s = sold[rec.product_id];
        s.first += rec.qty_sold;
        s.second += rec.total_revenue;
    }

    InventoryTurnover result;
    for (const auto& [id, s] : stock) {
        TurnoverEntry entry;
        entry.product_id = id;
        entry.qty_on_hand = s.qty;
        if (s.cost_count > 0) {
            entry.unit_cost = Round(s.cost_sum / static_cast<double>(s.cost_count), 2);
        }
        entry.inventory_value = Round(s.value, 2);
        auto it = sold.find(id);
        if (it != sold.end()) {
            entry.total_sold = it->second.first;
            entry.revenue = Round(it->second.second, 2);
        }
        entry.turnover_ratio = s.value > 0.0 ? Round(entry.revenue / s.value, 2) : 0.0;
        result.skus.push_back(std::move(entry));
    }
    std::stable_sort(result.skus.begin(), result.skus.end(),
                     [](const TurnoverEntry& a, const TurnoverEntry& b) {
                         return a.turnover_ratio > b.turnover_ratio;
                     });
    if (result.skus.size() > limit) {
        result.skus.resize(limit);
    }
    result.count = result.skus.size();
    return result;
}

absl::StatusOr<Outcome<InventoryAging>> InventoryPolicyEngine::GetAging() {
    std::vector<InventoryRecord> inventory;
    WCOPT_ASSIGN_OR_RETURN(auto missing, RequireInventory(&inventory));
    if (missing) {
        return *missing;
    }

    std::map<std::string, AgingEntry> per_product;
    for (const auto& rec : inventory) {
        auto& entry = per_product[rec.product_id];
        entry.product_id = rec.product_id;
        entry.qty += rec.qty_on_hand;
        entry.value += InventoryValueOf(rec);
        if (rec.days_since_last_movement &&
            (!entry.days_idle || *rec.days_since_last_movement > *entry.days_idle)) {
            entry.days_idle = rec.days_since_last_movement;
        }
    }

    InventoryAging result;
    for (const char* bucket : kAgeBuckets) {
        result.aging_buckets.emplace(bucket, AgingBucketSummary{});
    }
    for (auto& [id, entry] : per_product) {
        entry.age_bucket = entry.days_idle ? AgeBucketFor(*entry.days_idle) : kUnknownAge;
        auto& bucket = result.aging_buckets[entry.age_bucket];
        ++bucket.sku_count;
        bucket.total_value += entry.value;
        entry.value = Round(entry.value, 2);
        result.details.push_back(std::move(entry));
    }
    for (auto& [name, bucket] : result.aging_buckets) {
        bucket.total_value = Round(bucket.total_value, 2);
    }
    return result;
}

absl::StatusOr<Outcome<DeadStock>> InventoryPolicyEngine::GetDeadStock(std::optional<int> days) {
    const int threshold = days.value_or(config_.dead_stock_days);
    if (threshold < 0) {
        return absl::InvalidArgumentError("days must not be negative");
    }

    std::vector<InventoryRecord> inventory;
    WCOPT_ASSIGN_OR_RETURN(auto missing, RequireInventory(&inventory));
    if (missing) {
        return *missing;
    }

    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(bool has_sales, availability.IsAvailable(Dataset::kSalesTransactions));

    DeadStock result;
    result.days_threshold = threshold;
    result.basis = has_sales ? "last_sale" : "days_since_last_movement";

    std::map<std::string, DeadStockEntry> per_product;
    std::unordered_map<std::string, double> movement_age;
    for (const auto& rec : inventory) {
        auto& entry = per_product[rec.product_id];
        entry.product_id = rec.product_id;
        entry.qty += rec.qty_on_hand;
        entry.value_at_risk += rec.unit_cost ? rec.qty_on_hand * *rec.unit_cost
                                             : rec.inventory_value.value_or(0.0);
        if (rec.days_since_last_movement) {
            auto [it, inserted] = movement_age.emplace(rec.product_id, *rec.days_since_last_movement);
            if (!inserted) {
                it->second = std::max(it->second, *rec.days_since_last_movement);
            }
        }
    }

    std::unordered_map<std::string, absl::CivilDay> last_sale;
    std::unordered_set<std::string> sold;
    if (has_sales) {
        WCOPT_ASSIGN_OR_RETURN(auto sales, reader_.Sales());
        for (const auto& rec : sales) {
            sold.insert(rec.product_id);
            if (!rec.transaction_date) {
                continue;
            }
            auto [it, inserted] = last_sale.emplace(rec.product_id, *rec.transaction_date);
            if (!inserted && *rec.transaction_date > it->second) {
                it->second = *rec.transaction_date;
            }
        }
    }

    const absl::CivilDay as_of = config_.AsOf();
    for (auto& [id, entry] : per_product) {
        bool dead = false;
        if (has_sales) {
            auto it = last_sale.find(id);
            if (it == last_sale.end()) {
                if (sold.count(id) > 0) {
                    result.undated_sales.push_back(id);
                    continue;
                }
                dead = true;
            } else {
                const double idle = static_cast<double>(as_of - it->second);
                entry.last_sale_date = FormatDay(it->second);
                entry.days_idle = idle;
                dead = idle > threshold;
            }
        } else {
            auto it = movement_age.find(id);
            if (it != movement_age.end()) {
                entry.days_idle = it->second;
                dead = it->second > threshold;
            }
        }
        if (dead) {
            result.total_value_at_risk += entry.value_at_risk;
            entry.value_at_risk = Round(entry.value_at_risk, 2);
            result.dead_stock.push_back(std::move(entry));
        }
    }

    std::stable_sort(result.dead_stock.begin(), result.dead_stock.end(),
                     [](const DeadStockEntry& a, const DeadStockEntry& b) {
                         return a.value_at_risk > b.value_at_risk;
                     });
    result.items = result.dead_stock.size();
    result.total_value_at_risk = Round(result.total_value_at_risk, 2);
    return result;
}

absl::StatusOr<Outcome<Overstock>> InventoryPolicyEngine::GetOverstock() {
    std::vector<InventoryRecord> inventory;
    WCOPT_ASSIGN_OR_RETURN(auto missing, RequireInventory(&inventory));
    if (missing) {
        return *missing;
    }

    Overstock result;
    for (const auto& rec : inventory) {
        if (!rec.stock_status || !absl::EqualsIgnoreCase(*rec.stock_status, "overstock")) {
            continue;
        }
        result.total_excess_value += InventoryValueOf(rec);
        result.items.push_back(ToStockRow(rec));
    }
    std::stable_sort(result.items.begin(), result.items.end(),
                     [](const StockRow& a, const StockRow& b) {
                         return a.inventory_value > b.inventory_value;
                     });
    result.overstocked_items = result.items.size();
    result.total_excess_value = Round(result.total_excess_value, 2);
    return result;
}

absl::StatusOr<Outcome<StockoutRisk>> InventoryPolicyEngine::GetStockoutRisk(
    std::optional<int> horizon_days) {
    const int horizon = horizon_days.value_or(config_.stockout_horizon_days);
    if (horizon <= 0) {
        return absl::InvalidArgumentError("horizon_days must be positive");
    }

    std::vector<InventoryRecord> inventory;
    WCOPT_ASSIGN_OR_RETURN(auto missing, RequireInventory(&inventory));
    if (missing) {
        return *missing;
    }

    StockoutRisk result;
    result.horizon_days = horizon;
    for (const auto& rec : inventory) {
        if (rec.days_of_supply && *rec.days_of_supply >= 0.0 && *rec.days_of_supply < horizon) {
            result.items.push_back(ToStockRow(rec));
        }
    }
    std::stable_sort(result.items.begin(), result.items.end(),
                     [](const StockRow& a, const StockRow& b) {
                         return *a.days_of_supply < *b.days_of_supply;
                     });
    result.at_risk_count = result.items.size();
    return result;
}

}  // namespace wcopt::engine
