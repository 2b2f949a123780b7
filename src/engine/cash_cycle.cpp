/// @file cash_cycle.cpp
/// @brief Cash conversion cycle metrics

#include "engine/cash_cycle.h"

#include <algorithm>
#include <map>
#include <set>
#include <unordered_map>

#include <absl/strings/str_format.h>

#include "common/error.h"
#include "common/logging.h"
#include "engine/availability.h"
#include "engine/stats.h"

namespace wcopt::engine {

namespace {

constexpr size_t kTopTrappedItems = 50;
constexpr size_t kTopDsoCustomers = 20;
constexpr double kDaysPerYear = 365.0;

/// @brief Aging buckets in report order; anything else sorts after them
int AgingBucketRank(const std::string& bucket) {
    static const std::vector<std::string> order = {"Current", "1-30 days", "31-60 days",
                                                   "61-90 days"};
    auto it = std::find(order.begin(), order.end(), bucket);
    return static_cast<int>(it - order.begin());
}

/// @brief Distinct non-null transaction dates, at least 1
size_t SalesDays(const std::vector<SaleRecord>& sales) {
    std::set<absl::CivilDay> days;
    for (const auto& rec : sales) {
        if (rec.transaction_date) {
            days.insert(*rec.transaction_date);
        }
    }
    return std::max<size_t>(days.size(), 1);
}

}  // namespace

std::optional<double> WeightedAverageDays(const std::vector<std::pair<double, double>>& rows) {
    double weighted = 0.0;
    double amount = 0.0;
    for (const auto& [days, value] : rows) {
        weighted += days * value;
        amount += value;
    }
    if (amount == 0.0) {
        return std::nullopt;
    }
    return weighted / amount;
}

double ComputeCcc(double dio, double dso, double dpo) {
    return Round(dio + dso - dpo, 1);
}

CashCycleEngine::CashCycleEngine(storage::TabularStore& store, const EngineConfig& config)
    : store_(store), config_(config), reader_(store) {}

// =============================================================================
// KPI sub-metrics
// =============================================================================

absl::StatusOr<CashCycleEngine::Metric> CashCycleEngine::Dio() {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto missing,
                           availability.Check({Dataset::kInventorySnapshot,
                                               Dataset::kSalesTransactions}));
    Metric metric;
    if (missing) {
        metric.note = "Need inventory_snapshot + sales_transactions";
        return metric;
    }

    WCOPT_ASSIGN_OR_RETURN(auto inventory, reader_.CurrentInventory());
    WCOPT_ASSIGN_OR_RETURN(auto sales, reader_.Sales());

    double inventory_value = 0.0;
    for (const auto& rec : inventory) {
        inventory_value += InventoryValueOf(rec);
    }
    double cogs = 0.0;
    for (const auto& rec : sales) {
        cogs += rec.total_cost.value_or(0.0);
    }
    const double daily_cogs = cogs / static_cast<double>(SalesDays(sales));
    if (daily_cogs > 0.0) {
        metric.value = Round(inventory_value / daily_cogs, 1);
    } else {
        metric.note = "No cost of goods sold recorded";
    }
    return metric;
}

absl::StatusOr<CashCycleEngine::Metric> CashCycleEngine::Dso() {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(bool available, availability.IsAvailable(Dataset::kArLedger));
    Metric metric;
    if (!available) {
        metric.note = "Upload ar_ledger for real DSO";
        return metric;
    }

    WCOPT_ASSIGN_OR_RETURN(auto ledger, reader_.ArLedger());
    std::vector<std::pair<double, double>> rows;
    for (const auto& rec : ledger) {
        if (rec.days_to_pay) {
            rows.emplace_back(*rec.days_to_pay, rec.invoice_amount);
        }
    }
    if (auto weighted = WeightedAverageDays(rows)) {
        metric.value = Round(*weighted, 1);
    } else {
        metric.note = "No invoiced amount with known days_to_pay";
    }
    return metric;
}

absl::StatusOr<CashCycleEngine::Metric> CashCycleEngine::Dpo() {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(bool available, availability.IsAvailable(Dataset::kApLedger));
    Metric metric;
    if (!available) {
        metric.note = "Upload ap_ledger for real DPO";
        return metric;
    }

    WCOPT_ASSIGN_OR_RETURN(auto ledger, reader_.ApLedger());
    std::vector<std::pair<double, double>> rows;
    for (const auto& rec : ledger) {
        if (rec.actual_days_to_pay) {
            rows.emplace_back(*rec.actual_days_to_pay, rec.invoice_amount);
        }
    }
    if (auto weighted = WeightedAverageDays(rows)) {
        metric.value = Round(*weighted, 1);
    } else {
        metric.note = "No invoiced amount with known actual_days_to_pay";
    }
    return metric;
}

absl::StatusOr<KpiSummary> CashCycleEngine::GetKpiSummary() {
    WCOPT_ASSIGN_OR_RETURN(Metric dio, Dio());
    WCOPT_ASSIGN_OR_RETURN(Metric dso, Dso());
    WCOPT_ASSIGN_OR_RETURN(Metric dpo, Dpo());

    KpiSummary summary;
    summary.dio = dio.value;
    summary.dso = dso.value;
    summary.dpo = dpo.value;
    summary.ccc = ComputeCcc(summary.dio, summary.dso, summary.dpo);
    summary.dio_note = std::move(dio.note);
    summary.dso_note = std::move(dso.note);
    summary.dpo_note = std::move(dpo.note);
    return summary;
}

// =============================================================================
// Inventory cash
// =============================================================================

absl::StatusOr<Outcome<WorkingCapitalSummary>> CashCycleEngine::GetWorkingCapital() {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto missing, availability.Check({Dataset::kInventorySnapshot}));
    if (missing) {
        return *missing;
    }
    WCOPT_ASSIGN_OR_RETURN(auto inventory, reader_.CurrentInventory());

    std::unordered_map<std::string, TrappedCashItem> items;
    for (const auto& rec : inventory) {
        auto& item = items[rec.product_id];
        item.product_id = rec.product_id;
        item.total_units += rec.qty_on_hand;
        item.trapped_cash += InventoryValueOf(rec);
    }

    WorkingCapitalSummary summary;
    summary.top_items.reserve(items.size());
    for (auto& [id, item] : items) {
        summary.total_cash_trapped += item.trapped_cash;
        summary.top_items.push_back(std::move(item));
    }
    std::sort(summary.top_items.begin(), summary.top_items.end(),
              [](const TrappedCashItem& a, const TrappedCashItem& b) {
                  if (a.trapped_cash != b.trapped_cash) {
                      return a.trapped_cash > b.trapped_cash;
                  }
                  return a.product_id < b.product_id;
              });
    if (summary.top_items.size() > kTopTrappedItems) {
        summary.top_items.resize(kTopTrappedItems);
    }
    for (auto& item : summary.top_items) {
        item.trapped_cash = Round(item.trapped_cash, 2);
    }
    summary.total_cash_trapped = Round(summary.total_cash_trapped, 2);
    return summary;
}

absl::StatusOr<Outcome<CarryingCost>> CashCycleEngine::GetCarryingCost(std::optional<double> rate) {
    const double holding_rate = rate.value_or(config_.holding_cost_rate);
    if (holding_rate < 0.0) {
        return absl::InvalidArgumentError("holding_cost_pct must not be negative");
    }

    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto missing, availability.Check({Dataset::kInventorySnapshot}));
    if (missing) {
        return *missing;
    }
    WCOPT_ASSIGN_OR_RETURN(auto inventory, reader_.CurrentInventory());

    double total = 0.0;
    for (const auto& rec : inventory) {
        total += InventoryValueOf(rec);
    }

    CarryingCost cost;
    cost.total_inventory_value = Round(total, 2);
    cost.holding_rate = holding_rate;
    cost.annual_carrying_cost = Round(total * holding_rate, 2);
    cost.monthly_carrying_cost = Round(total * holding_rate / 12.0, 2);
    return cost;
}

// =============================================================================
// Simulation
// =============================================================================

absl::StatusOr<CccSimulation> CashCycleEngine::SimulateCcc(const CccLevers& levers) {
    if (levers.dio_reduction < 0.0 || levers.dso_reduction < 0.0 || levers.dpo_increase < 0.0) {
        return absl::InvalidArgumentError("CCC levers must not be negative");
    }
    if (levers.annual_revenue && *levers.annual_revenue <= 0.0) {
        return absl::InvalidArgumentError("annual_revenue must be positive");
    }

    CccSimulation simulation;
    if (levers.annual_revenue) {
        simulation.annual_revenue = *levers.annual_revenue;
        simulation.revenue_source = "parameter";
    } else {
        AvailabilityResolver availability(store_);
        WCOPT_ASSIGN_OR_RETURN(bool has_sales,
                               availability.IsAvailable(Dataset::kSalesTransactions));
        double observed = 0.0;
        if (has_sales) {
            WCOPT_ASSIGN_OR_RETURN(auto sales, reader_.Sales());
            double revenue = 0.0;
            for (const auto& rec : sales) {
                revenue += rec.total_revenue;
            }
            observed = revenue / static_cast<double>(SalesDays(sales)) * kDaysPerYear;
        }
        if (observed > 0.0) {
            simulation.annual_revenue = observed;
            simulation.revenue_source = "observed";
        } else {
            simulation.annual_revenue = config_.default_annual_revenue;
            simulation.revenue_source = "default";
            simulation.note = "No sales revenue uploaded; using the configured annual revenue";
        }
    }

    const double daily = simulation.annual_revenue / kDaysPerYear;
    simulation.annual_revenue = Round(simulation.annual_revenue, 2);
    simulation.daily_revenue = Round(daily, 2);
    simulation.total_days_saved = levers.dio_reduction + levers.dso_reduction + levers.dpo_increase;
    simulation.total_cash_freed = Round(simulation.total_days_saved * daily, 2);

    const std::pair<const char*, double> actions[] = {
        {"Reduce DIO", levers.dio_reduction},
        {"Reduce DSO", levers.dso_reduction},
        {"Increase DPO", levers.dpo_increase},
    };
    for (const auto& [label, days] : actions) {
        CccLeverImpact impact;
        impact.action = absl::StrFormat("%s by %gd", label, days);
        impact.days = days;
        impact.cash = Round(days * daily, 2);
        simulation.breakdown.push_back(std::move(impact));
    }

    WCOPT_ASSIGN_OR_RETURN(KpiSummary kpis, GetKpiSummary());
    simulation.current_ccc = kpis.ccc;
    simulation.projected_ccc = Round(kpis.ccc - simulation.total_days_saved, 1);
    return simulation;
}

// =============================================================================
// Receivables and payables
// =============================================================================

absl::StatusOr<Outcome<ArAging>> CashCycleEngine::GetArAging() {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto missing, availability.Check({Dataset::kArLedger}));
    if (missing) {
        return *missing;
    }
    WCOPT_ASSIGN_OR_RETURN(auto ledger, reader_.ArLedger());

    ArAging aging;
    std::map<std::string, AgingBucket> buckets;
    for (const auto& rec : ledger) {
        const std::string name = rec.aging_bucket.value_or("Unknown");
        auto& bucket = buckets[name];
        bucket.aging_bucket = name;
        ++bucket.invoices;
        bucket.total_amount += rec.invoice_amount;
        if (!rec.paid_date) {
            bucket.outstanding += rec.invoice_amount;
            aging.total_outstanding += rec.invoice_amount;
        }
        if (rec.dispute_flag) {
            ++aging.disputes.count;
            aging.disputes.amount += rec.invoice_amount;
        }
        if (rec.write_off_flag) {
            ++aging.write_offs.count;
            aging.write_offs.amount += rec.invoice_amount;
        }
    }

    for (auto& [name, bucket] : buckets) {
        bucket.total_amount = Round(bucket.total_amount, 2);
        bucket.outstanding = Round(bucket.outstanding, 2);
        aging.aging_buckets.push_back(std::move(bucket));
    }
    std::stable_sort(aging.aging_buckets.begin(), aging.aging_buckets.end(),
                     [](const AgingBucket& a, const AgingBucket& b) {
                         return AgingBucketRank(a.aging_bucket) < AgingBucketRank(b.aging_bucket);
                     });
    aging.total_outstanding = Round(aging.total_outstanding, 2);
    aging.disputes.amount = Round(aging.disputes.amount, 2);
    aging.write_offs.amount = Round(aging.write_offs.amount, 2);
    return aging;
}

absl::StatusOr<Outcome<DsoAnalysis>> CashCycleEngine::GetDsoAnalysis() {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto missing, availability.Check({Dataset::kArLedger}));
    if (missing) {
        return *missing;
    }
    WCOPT_ASSIGN_OR_RETURN(auto ledger, reader_.ArLedger());
    WCOPT_ASSIGN_OR_RETURN(bool has_customers, availability.IsAvailable(Dataset::kCustomers));

    std::unordered_map<std::string, CustomerRecord> customers;
    if (has_customers) {
        WCOPT_ASSIGN_OR_RETURN(auto records, reader_.Customers());
        for (auto& rec : records) {
            std::string id = rec.customer_id;
            customers.emplace(std::move(id), std::move(rec));
        }
    }

    std::vector<std::pair<double, double>> overall;
    std::map<std::string, std::vector<std::pair<double, double>>> per_customer;
    for (const auto& rec : ledger) {
        if (!rec.days_to_pay) {
            continue;
        }
        overall.emplace_back(*rec.days_to_pay, rec.invoice_amount);
        per_customer[rec.customer_id].emplace_back(*rec.days_to_pay, rec.invoice_amount);
    }

    DsoAnalysis analysis;
    if (auto weighted = WeightedAverageDays(overall)) {
        analysis.overall_dso = Round(*weighted, 1);
    } else {
        analysis.note = "No invoiced amount with known days_to_pay";
    }

    for (const auto& [id, rows] : per_customer) {
        CustomerDso entry;
        entry.customer_id = id;
        entry.weighted_dso = Round(WeightedAverageDays(rows).value_or(0.0), 1);
        entry.invoices = rows.size();
        for (const auto& row : rows) {
            entry.total_billed += row.second;
        }
        entry.total_billed = Round(entry.total_billed, 2);
        auto customer = customers.find(id);
        if (customer != customers.end()) {
            entry.customer_name = customer->second.customer_name;
            entry.segment = customer->second.segment;
        }
        analysis.by_customer.push_back(std::move(entry));
    }
    std::stable_sort(analysis.by_customer.begin(), analysis.by_customer.end(),
                     [](const CustomerDso& a, const CustomerDso& b) {
                         return a.weighted_dso > b.weighted_dso;
                     });
    if (analysis.by_customer.size() > kTopDsoCustomers) {
        analysis.by_customer.resize(kTopDsoCustomers);
    }
    return analysis;
}

absl::StatusOr<Outcome<DpoAnalysis>> CashCycleEngine::GetDpoAnalysis() {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto missing, availability.Check({Dataset::kApLedger}));
    if (missing) {
        return *missing;
    }
    WCOPT_ASSIGN_OR_RETURN(auto ledger, reader_.ApLedger());
    WCOPT_ASSIGN_OR_RETURN(bool has_suppliers, availability.IsAvailable(Dataset::kSuppliers));

    std::unordered_map<std::string, SupplierRecord> suppliers;
    if (has_suppliers) {
        WCOPT_ASSIGN_OR_RETURN(auto records, reader_.Suppliers());
        for (auto& rec : records) {
            std::string id = rec.supplier_id;
            suppliers.emplace(std::move(id), std::move(rec));
        }
    }

    struct Accumulator {
        std::vector<std::pair<double, double>> rows;
        size_t invoices = 0;
        double discounts = 0.0;
    };
    std::vector<std::pair<double, double>> overall;
    std::map<std::string, Accumulator> per_supplier;
    for (const auto& rec : ledger) {
        auto& acc = per_supplier[rec.supplier_id];
        ++acc.invoices;
        acc.discounts += rec.early_payment_discount.value_or(0.0);
        if (rec.actual_days_to_pay) {
            acc.rows.emplace_back(*rec.actual_days_to_pay, rec.invoice_amount);
            overall.emplace_back(*rec.actual_days_to_pay, rec.invoice_amount);
        }
    }

    DpoAnalysis analysis;
    if (auto weighted = WeightedAverageDays(overall)) {
        analysis.overall_dpo = Round(*weighted, 1);
    } else {
        analysis.note = "No invoiced amount with known actual_days_to_pay";
    }

    for (const auto& [id, acc] : per_supplier) {
        SupplierDpo entry;
        entry.supplier_id = id;
        entry.weighted_dpo = Round(WeightedAverageDays(acc.rows).value_or(0.0), 1);
        entry.invoices = acc.invoices;
        entry.total_discounts = Round(acc.discounts, 2);
        auto supplier = suppliers.find(id);
        if (supplier != suppliers.end()) {
            entry.supplier_name = supplier->second.supplier_name;
            entry.terms = supplier->second.contracted_payment_days;
        }
        analysis.by_supplier.push_back(std::move(entry));
    }
    std::stable_sort(analysis.by_supplier.begin(), analysis.by_supplier.end(),
                     [](const SupplierDpo& a, const SupplierDpo& b) {
                         return a.weighted_dpo > b.weighted_dpo;
                     });
    WCOPT_LOG_DEBUG("DPO analysis over {} suppliers", analysis.by_supplier.size());
    return analysis;
}

}  // namespace wcopt::engine
