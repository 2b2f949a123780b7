#pragma once

/// @file classification.h
/// @brief Pareto (ABC) and demand-variability (XYZ) classification

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>

#include "engine/dataset_reader.h"
#include "engine/outcome.h"
#include "storage/tabular_store.h"

namespace wcopt::engine {

// =============================================================================
// Pure classification
// =============================================================================

/// @brief Cumulative-share limits of classes A and B, in percent
inline constexpr double kClassALimit = 80.0;
inline constexpr double kClassBLimit = 95.0;

/// @brief Coefficient-of-variation limits of classes X and Y
inline constexpr double kClassXLimit = 0.5;
inline constexpr double kClassYLimit = 1.0;

/// @brief One SKU ranked by its contribution
struct ParetoEntry {
    std::string product_id;
    double value = 0.0;
    double cum_pct = 0.0;   ///< Cumulative share up to and including this SKU
    std::string abc_class;  ///< "A", "B" or "C"
};

/// @brief Rank SKUs by value descending (ties by id ascending) and assign
/// A/B/C from the cumulative share. A zero total yields all C with cum 0.
std::vector<ParetoEntry> RankPareto(std::vector<std::pair<std::string, double>> values);

/// @brief A when cum <= 80, B when cum <= 95, else C
std::string AbcClassFor(double cum_pct);

/// @brief Sample stddev / mean; 0 when the mean is 0
double CoefficientOfVariation(const std::vector<double>& observations);

/// @brief X when cv < 0.5, Y when cv < 1.0, else Z
std::string XyzClassFor(double cv);

// =============================================================================
// Analyses
// =============================================================================

/// @brief Quantity being ranked by the Pareto analysis
enum class ParetoDimension {
    kRevenue,         ///< Σ sales total_revenue
    kInventoryValue,  ///< Σ current inventory value
    kQuantity,        ///< Σ sales qty_sold
};

std::string_view ParetoDimensionName(ParetoDimension dimension);
std::optional<ParetoDimension> ParseParetoDimension(std::string_view name);

struct ParetoResult {
    std::string dimension;
    size_t total_skus = 0;
    size_t skus_driving_80pct = 0;
    double pct_of_skus = 0.0;
    double total_value = 0.0;
    std::vector<ParetoEntry> pareto_data;  ///< First 50 ranked SKUs
};

struct AbcXyzEntry {
    std::string product_id;
    std::optional<std::string> product_name;
    double revenue = 0.0;
    double cum_pct = 0.0;
    double cv = 0.0;
    std::string abc_class;
    std::string xyz_class;
    std::string source;  ///< "products" when a class came from the catalog
};

struct AbcXyzResult {
    size_t total_skus = 0;
    std::vector<AbcXyzEntry> classification;
    std::map<std::string, size_t> matrix;  ///< "AX" -> SKU count, over all SKUs
    std::map<std::string, std::string> legend;
};

/// @brief Pareto and ABC-XYZ over the uploaded datasets
class ClassificationEngine {
public:
    explicit ClassificationEngine(storage::TabularStore& store);

    absl::StatusOr<Outcome<ParetoResult>> Pareto(ParetoDimension dimension);

    /// @brief Requires products or sales_transactions
    absl::StatusOr<Outcome<AbcXyzResult>> AbcXyz(size_t limit);

private:
    storage::TabularStore& store_;
    DatasetReader reader_;
};

}  // namespace wcopt::engine
