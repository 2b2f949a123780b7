#pragma once

/// @file supplier_risk.h
/// @brief Supplier scoring and supply-network analyses with tabular fallback

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "engine/dataset_reader.h"
#include "engine/engine_config.h"
#include "engine/outcome.h"
#include "storage/graph_store.h"
#include "storage/tabular_store.h"

namespace wcopt::engine {

// =============================================================================
// Risk scoring
// =============================================================================

struct RiskWeights {
    double lead_time = 0.3;
    double on_time = 0.4;
    double quality = 0.3;
};

/// @brief Component and total scores for one supplier
struct RiskScore {
    double lead_time_score = 0.0;  ///< clamp((lead - 5) x 3, 0, 100)
    double otd_score = 0.0;        ///< max(0, (1 - otd) x 200)
    double quality_score = 0.0;    ///< rejection x 1000
    double risk_score = 0.0;       ///< Weighted sum, one decimal
    std::string risk_level;        ///< "high" > 60, "medium" > 30, else "low"
};

/// @brief Missing inputs take the defaults 14 days, 0.9 and 0.01
RiskScore ScoreSupplier(std::optional<double> lead_time_days,
                        std::optional<double> on_time_rate,
                        std::optional<double> rejection_rate,
                        const RiskWeights& weights = {});

/// @brief "high" above 10 impacted products, "medium" above 3, else "low"
std::string RippleSeverity(size_t impacted);

// =============================================================================
// Result records
// =============================================================================

struct SupplierRisk {
    std::string supplier_id;
    std::optional<std::string> supplier_name;
    double risk_score = 0.0;
    std::string risk_level;
    std::optional<double> lead_time;
    std::optional<double> otd_rate;
    std::optional<double> qrr;
};

struct SupplierRiskScores {
    std::vector<SupplierRisk> suppliers;
};

struct SupplierPerformance {
    std::vector<SupplierRecord> suppliers;  ///< On-time rate descending
    size_t count = 0;
};

struct SupplierSpend {
    std::string supplier_id;
    std::optional<std::string> supplier_name;
    size_t orders = 0;
    double total_value = 0.0;
    double value_pct = 0.0;
};

struct SupplierConcentration {
    std::vector<SupplierSpend> suppliers;
    double top3_value_pct = 0.0;
    std::string concentration_risk;
};

/// @brief Answer of a graph-backed analysis; tabular answers carry a note
struct SourcedResult {
    std::string source = kSourceGraph;
    std::optional<std::string> note;
};

struct SupplierNetwork : SourcedResult {
    size_t relationships = 0;
    std::vector<storage::SuppliesEdge> network;
    /// Supplier list when no relationships are known at all
    std::vector<storage::SupplierNode> suppliers;
};

struct SingleSourceRisks : SourcedResult {
    std::vector<storage::SoleSourcedProduct> single_source_products;
    size_t total = 0;
};

struct RippleEffect : SourcedResult {
    std::string supplier_id;
    std::optional<std::string> supplier_name;
    std::vector<std::string> impacted_products;
    size_t count = 0;
    std::string severity;
};

struct LeadTimeVariability : SourcedResult {
    std::vector<storage::SupplierNode> suppliers;  ///< Lead time descending
};

struct AlternativeSuppliers : SourcedResult {
    std::string product_id;
    std::vector<storage::SupplierNode> current_suppliers;
    std::vector<storage::SupplierNode> alternatives;
};

/// @brief Order candidates by rating desc, lead time asc, id asc; unknown
/// values rank last
void RankAlternatives(std::vector<storage::SupplierNode>* candidates);

// =============================================================================
// SupplierEngine
// =============================================================================

/// @brief Supplier analyses. Graph-backed queries answer from the tabular
/// store when the graph fails or returns nothing.
class SupplierEngine {
public:
    SupplierEngine(storage::TabularStore& store, storage::GraphStore& graph,
                   const EngineConfig& config);

    absl::StatusOr<Outcome<SupplierRiskScores>> GetRiskScores();
    absl::StatusOr<Outcome<SupplierPerformance>> GetPerformance();
    absl::StatusOr<Outcome<SupplierConcentration>> GetConcentration();

    absl::StatusOr<Outcome<SupplierNetwork>> GetNetwork();
    absl::StatusOr<Outcome<SingleSourceRisks>> FindSingleSourceRisks(size_t limit);

    /// @brief NotFound when neither store knows the supplier
    absl::StatusOr<Outcome<RippleEffect>> GetRippleEffect(const std::string& supplier_id);

    absl::StatusOr<Outcome<LeadTimeVariability>> GetLeadTimeVariability();
    absl::StatusOr<Outcome<AlternativeSuppliers>> FindAlternatives(const std::string& sku);

private:
    absl::StatusOr<std::vector<SupplierRecord>> SuppliersIfPresent();
    absl::StatusOr<std::vector<PurchaseOrderRecord>> PurchaseOrdersIfPresent();

    storage::TabularStore& store_;
    storage::GraphStore& graph_;
    const EngineConfig& config_;
    DatasetReader reader_;
};

/// @brief Graph node view of a suppliers-table row
storage::SupplierNode ToSupplierNode(const SupplierRecord& record);

}  // namespace wcopt::engine
