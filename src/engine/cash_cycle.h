#pragma once

/// @file cash_cycle.h
/// @brief Cash conversion cycle metrics and working-capital analyses

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>

#include "engine/dataset_reader.h"
#include "engine/engine_config.h"
#include "engine/outcome.h"
#include "storage/tabular_store.h"

namespace wcopt::engine {

/// @brief Amount-weighted mean of (days, amount) pairs; nullopt when the
/// amounts sum to 0
std::optional<double> WeightedAverageDays(const std::vector<std::pair<double, double>>& rows);

/// @brief round(dio + dso - dpo, 1)
double ComputeCcc(double dio, double dso, double dpo);

// =============================================================================
// Result records
// =============================================================================

/// @brief DIO, DSO, DPO and CCC. A sub-metric that cannot be computed is 0
/// and carries a note.
struct KpiSummary {
    double dio = 0.0;
    double dso = 0.0;
    double dpo = 0.0;
    double ccc = 0.0;
    std::string formula = "CCC = DIO + DSO - DPO";
    std::string unit = "days";
    std::optional<std::string> dio_note;
    std::optional<std::string> dso_note;
    std::optional<std::string> dpo_note;
};

struct TrappedCashItem {
    std::string product_id;
    double total_units = 0.0;
    double trapped_cash = 0.0;
};

struct WorkingCapitalSummary {
    std::vector<TrappedCashItem> top_items;  ///< Top 50 by trapped cash
    double total_cash_trapped = 0.0;         ///< Over every product
};

struct CarryingCost {
    double total_inventory_value = 0.0;
    double holding_rate = 0.0;
    double annual_carrying_cost = 0.0;
    double monthly_carrying_cost = 0.0;
};

/// @brief Improvement levers, in days
struct CccLevers {
    double dio_reduction = 0.0;
    double dso_reduction = 0.0;
    double dpo_increase = 0.0;
    std::optional<double> annual_revenue;
};

struct CccLeverImpact {
    std::string action;
    double days = 0.0;
    double cash = 0.0;
};

struct CccSimulation {
    double annual_revenue = 0.0;
    std::string revenue_source;  ///< "parameter", "observed" or "default"
    std::optional<std::string> note;
    double daily_revenue = 0.0;
    double total_days_saved = 0.0;
    double total_cash_freed = 0.0;
    std::vector<CccLeverImpact> breakdown;
    double current_ccc = 0.0;
    double projected_ccc = 0.0;
};

struct AgingBucket {
    std::string aging_bucket;
    size_t invoices = 0;
    double total_amount = 0.0;
    double outstanding = 0.0;  ///< Unpaid share of total_amount
};

struct FlaggedInvoices {
    size_t count = 0;
    double amount = 0.0;
};

struct ArAging {
    std::vector<AgingBucket> aging_buckets;
    double total_outstanding = 0.0;
    FlaggedInvoices disputes;
    FlaggedInvoices write_offs;
};

struct CustomerDso {
    std::string customer_id;
    std::optional<std::string> customer_name;
    std::optional<std::string> segment;
    double weighted_dso = 0.0;
    size_t invoices = 0;
    double total_billed = 0.0;
};

struct DsoAnalysis {
    double overall_dso = 0.0;
    std::optional<std::string> note;
    std::vector<CustomerDso> by_customer;  ///< Top 20 by weighted DSO
};

struct SupplierDpo {
    std::string supplier_id;
    std::optional<std::string> supplier_name;
    double weighted_dpo = 0.0;
    std::optional<double> terms;  ///< Contracted payment days
    size_t invoices = 0;
    double total_discounts = 0.0;
};

struct DpoAnalysis {
    double overall_dpo = 0.0;
    std::optional<std::string> note;
    std::vector<SupplierDpo> by_supplier;
};

// =============================================================================
// CashCycleEngine
// =============================================================================

/// @brief Working-capital metrics over the uploaded datasets.
///
/// Composite results (KPI summary, simulation) degrade per field instead of
/// failing as a whole.
class CashCycleEngine {
public:
    CashCycleEngine(storage::TabularStore& store, const EngineConfig& config);

    absl::StatusOr<KpiSummary> GetKpiSummary();

    absl::StatusOr<Outcome<WorkingCapitalSummary>> GetWorkingCapital();

    /// @brief rate defaults to the configured holding cost rate
    absl::StatusOr<Outcome<CarryingCost>> GetCarryingCost(std::optional<double> rate);

    absl::StatusOr<CccSimulation> SimulateCcc(const CccLevers& levers);

    absl::StatusOr<Outcome<ArAging>> GetArAging();
    absl::StatusOr<Outcome<DsoAnalysis>> GetDsoAnalysis();
    absl::StatusOr<Outcome<DpoAnalysis>> GetDpoAnalysis();

private:
    struct Metric {
        double value = 0.0;
        std::optional<std::string> note;
    };

    absl::StatusOr<Metric> Dio();
    absl::StatusOr<Metric> Dso();
    absl::StatusOr<Metric> Dpo();

    storage::TabularStore& store_;
    const EngineConfig& config_;
    DatasetReader reader_;
};

}  // namespace wcopt::engine
