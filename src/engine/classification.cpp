/// @file classification.cpp
/// @brief Pareto and ABC-XYZ classification

#include "engine/classification.h"

#include <algorithm>
#include <unordered_map>

#include "common/error.h"
#include "common/logging.h"
#include "engine/availability.h"
#include "engine/stats.h"

namespace wcopt::engine {

namespace {

constexpr size_t kParetoRows = 50;

const std::map<std::string, std::string>& Legend() {
    static const std::map<std::string, std::string> legend = {
        {"A", "Top 80% revenue"}, {"B", "Next 15%"}, {"C", "Bottom 5%"},
        {"X", "Stable"},          {"Y", "Variable"}, {"Z", "Erratic"},
    };
    return legend;
}

std::vector<std::pair<std::string, double>> Totals(
    const std::unordered_map<std::string, double>& sums) {
    return {sums.begin(), sums.end()};
}

}  // namespace

// =============================================================================
// Pure classification
// =============================================================================

std::string AbcClassFor(double cum_pct) {
    if (cum_pct <= kClassALimit) {
        return "A";
    }
    if (cum_pct <= kClassBLimit) {
        return "B";
    }
    return "C";
}

std::vector<ParetoEntry> RankPareto(std::vector<std::pair<std::string, double>> values) {
    std::sort(values.begin(), values.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return a.first < b.first;
    });

    double total = 0.0;
    for (const auto& [id, value] : values) {
        total += value;
    }

    std::vector<ParetoEntry> ranked;
    ranked.reserve(values.size());
    double cumulative = 0.0;
    for (auto& [id, value] : values) {
        ParetoEntry entry;
        entry.product_id = std::move(id);
        entry.value = value;
        if (total > 0.0) {
            cumulative += value;
            entry.cum_pct = cumulative * 100.0 / total;
            entry.abc_class = AbcClassFor(entry.cum_pct);
        } else {
            entry.abc_class = "C";
        }
        ranked.push_back(std::move(entry));
    }
    return ranked;
}

double CoefficientOfVariation(const std::vector<double>& observations) {
    const double mean = Mean(observations);
    if (mean == 0.0) {
        return 0.0;
    }
    return SampleStdDev(observations) / mean;
}

std::string XyzClassFor(double cv) {
    if (cv < kClassXLimit) {
        return "X";
    }
    if (cv < kClassYLimit) {
        return "Y";
    }
    return "Z";
}

std::string_view ParetoDimensionName(ParetoDimension dimension) {
    switch (dimension) {
        case ParetoDimension::kRevenue:
            return "revenue";
        case ParetoDimension::kInventoryValue:
            return "inventory_value";
        case ParetoDimension::kQuantity:
            return "quantity";
    }
    return "revenue";
}

std::optional<ParetoDimension> ParseParetoDimension(std::string_view name) {
    for (auto dimension : {ParetoDimension::kRevenue, ParetoDimension::kInventoryValue,
                           ParetoDimension::kQuantity}) {
        if (name == ParetoDimensionName(dimension)) {
            return dimension;
        }
    }
    return std::nullopt;
}

// =============================================================================
// ClassificationEngine
// =============================================================================

ClassificationEngine::ClassificationEngine(storage::TabularStore& store)
    : store_(store), reader_(store) {}

absl::StatusOr<Outcome<ParetoResult>> ClassificationEngine::Pareto(ParetoDimension dimension) {
    const Dataset source = dimension == ParetoDimension::kInventoryValue
                               ? Dataset::kInventorySnapshot
                               : Dataset::kSalesTransactions;
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(auto missing, availability.Check({source}));
    if (missing) {
        return *missing;
    }

    std::unordered_map<std::string, double> sums;
    if (source == Dataset::kInventorySnapshot) {
        WCOPT_ASSIGN_OR_RETURN(auto inventory, reader_.CurrentInventory());
        for (const auto& rec : inventory) {
            sums[rec.product_id] += InventoryValueOf(rec);
        }
    } else {
        WCOPT_ASSIGN_OR_RETURN(auto sales, reader_.Sales());
        for (const auto& rec : sales) {
            sums[rec.product_id] +=
                dimension == ParetoDimension::kQuantity ? rec.qty_sold : rec.total_revenue;
        }
    }

    std::vector<ParetoEntry> ranked = RankPareto(Totals(sums));

    ParetoResult result;
    result.dimension = std::string(ParetoDimensionName(dimension));
    result.total_skus = ranked.size();
    for (const auto& entry : ranked) {
        result.total_value += entry.value;
        if (entry.abc_class == "A") {
            ++result.skus_driving_80pct;
        }
    }
    if (result.total_skus > 0) {
        result.pct_of_skus = Round(
            static_cast<double>(result.skus_driving_80pct) * 100.0 / result.total_skus, 1);
    }
    const size_t shown = std::min(ranked.size(), kParetoRows);
    result.pareto_data.assign(std::make_move_iterator(ranked.begin()),
                              std::make_move_iterator(ranked.begin() + shown));
    for (auto& entry : result.pareto_data) {
        entry.value = Round(entry.value, 2);
        entry.cum_pct = Round(entry.cum_pct, 2);
    }
    return result;
}

absl::StatusOr<Outcome<AbcXyzResult>> ClassificationEngine::AbcXyz(size_t limit) {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(bool has_sales, availability.IsAvailable(Dataset::kSalesTransactions));
    WCOPT_ASSIGN_OR_RETURN(bool has_products, availability.IsAvailable(Dataset::kProducts));
    if (!has_sales && !has_products) {
        return MakeInsufficientData({Dataset::kProducts, Dataset::kSalesTransactions});
    }

    std::unordered_map<std::string, double> revenue;
    std::unordered_map<std::string, std::vector<double>> quantities;
    if (has_sales) {
        WCOPT_ASSIGN_OR_RETURN(auto sales, reader_.Sales());
        for (const auto& rec : sales) {
            revenue[rec.product_id] += rec.total_revenue;
            quantities[rec.product_id].push_back(rec.qty_sold);
        }
    }

    std::unordered_map<std::string, ProductRecord> catalog;
    if (has_products) {
        WCOPT_ASSIGN_OR_RETURN(auto products, reader_.Products());
        for (auto& rec : products) {
            revenue.emplace(rec.product_id, 0.0);
            std::string id = rec.product_id;
            catalog.emplace(std::move(id), std::move(rec));
        }
    }

    std::vector<ParetoEntry> ranked = RankPareto(Totals(revenue));

    AbcXyzResult result;
    result.total_skus = ranked.size();
    result.legend = Legend();
    for (auto& ranked_entry : ranked) {
        AbcXyzEntry entry;
        entry.product_id = ranked_entry.product_id;
        entry.revenue = Round(ranked_entry.value, 2);
        entry.cum_pct = Round(ranked_entry.cum_pct, 2);
        entry.abc_class = ranked_entry.abc_class;

        auto observed = quantities.find(entry.product_id);
        entry.cv = observed == quantities.end()
                       ? 0.0
                       : CoefficientOfVariation(observed->second);
        entry.xyz_class = XyzClassFor(entry.cv);
        entry.cv = Round(entry.cv, 3);
        entry.source = "computed";

        auto product = catalog.find(entry.product_id);
        if (product != catalog.end()) {
            entry.product_name = product->second.product_name;
            if (product->second.abc_class) {
                entry.abc_class = *product->second.abc_class;
                entry.source = "products";
            }
            if (product->second.xyz_class) {
                entry.xyz_class = *product->second.xyz_class;
                entry.source = "products";
            }
        }

        ++result.matrix[entry.abc_class + entry.xyz_class];
        if (result.classification.size() < limit) {
            result.classification.push_back(std::move(entry));
        }
    }

    WCOPT_LOG_DEBUG("ABC-XYZ classified {} SKUs ({} shown)", result.total_skus,
                    result.classification.size());
    return result;
}

}  // namespace wcopt::engine
