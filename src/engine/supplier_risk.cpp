/// @file supplier_risk.cpp
/// @brief Supplier scoring and supply-network analyses

#include "engine/supplier_risk.h"

#include <algorithm>
#include <map>
#include <set>
#include <unordered_map>
#include <utility>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "engine/availability.h"
#include "engine/demand.h"
#include "engine/stats.h"

namespace wcopt::engine {

using storage::SoleSourcedProduct;
using storage::SupplierNode;
using storage::SuppliesEdge;

namespace {

constexpr double kDefaultLeadTime = 14.0;
constexpr double kDefaultOnTimeRate = 0.9;
constexpr double kDefaultRejectionRate = 0.01;

/// @brief Logs why a graph-backed query is answered from the tabular store
/// and returns the note attached to the result
std::string FallbackNote(std::string_view query, const absl::Status& graph_status) {
    if (!graph_status.ok()) {
        WCOPT_LOG_WARN("Graph query '{}' failed, answering from tabular store: {}", query,
                       graph_status.ToString());
        return absl::StrCat("Graph store unavailable (", graph_status.message(),
                            "); answered from the tabular store");
    }
    WCOPT_LOG_WARN("Graph query '{}' returned nothing, answering from tabular store", query);
    return "Graph store holds no matching data; answered from the tabular store";
}

bool OptionalGreater(const std::optional<double>& a, const std::optional<double>& b) {
    if (a.has_value() != b.has_value()) {
        return a.has_value();
    }
    return a && *a > *b;
}

bool OptionalLess(const std::optional<double>& a, const std::optional<double>& b) {
    if (a.has_value() != b.has_value()) {
        return a.has_value();
    }
    return a && *a < *b;
}

std::map<std::string, SupplierRecord> IndexSuppliers(std::vector<SupplierRecord> suppliers) {
    std::map<std::string, SupplierRecord> index;
    for (auto& rec : suppliers) {
        std::string id = rec.supplier_id;
        index.emplace(std::move(id), std::move(rec));
    }
    return index;
}

}  // namespace

// =============================================================================
// Free functions
// =============================================================================

RiskScore ScoreSupplier(std::optional<double> lead_time_days,
                        std::optional<double> on_time_rate,
                        std::optional<double> rejection_rate,
                        const RiskWeights& weights) {
    RiskScore score;
    score.lead_time_score =
        std::clamp((lead_time_days.value_or(kDefaultLeadTime) - 5.0) * 3.0, 0.0, 100.0);
    score.otd_score = std::max(0.0, (1.0 - on_time_rate.value_or(kDefaultOnTimeRate)) * 200.0);
    score.quality_score = rejection_rate.value_or(kDefaultRejectionRate) * 1000.0;
    score.risk_score = Round(weights.lead_time * score.lead_time_score +
                                 weights.on_time * score.otd_score +
                                 weights.quality * score.quality_score,
                             1);
    if (score.risk_score > 60.0) {
        score.risk_level = "high";
    } else if (score.risk_score > 30.0) {
        score.risk_level = "medium";
    } else {
        score.risk_level = "low";
    }
    return score;
}

std::string RippleSeverity(size_t impacted) {
    if (impacted > 10) {
        return "high";
    }
    if (impacted > 3) {
        return "medium";
    }
    return "low";
}

void RankAlternatives(std::vector<SupplierNode>* candidates) {
    std::sort(candidates->begin(), candidates->end(),
              [](const SupplierNode& a, const SupplierNode& b) {
                  if (a.rating != b.rating) {
                      return OptionalGreater(a.rating, b.rating);
                  }
                  if (a.lead_time != b.lead_time) {
                      return OptionalLess(a.lead_time, b.lead_time);
                  }
                  return a.supplier_id < b.supplier_id;
              });
}

SupplierNode ToSupplierNode(const SupplierRecord& record) {
    SupplierNode node;
    node.supplier_id = record.supplier_id;
    node.name = record.supplier_name;
    node.lead_time = record.avg_lead_time_days;
    node.rating = SupplierRatingOf(record);
    node.otd_rate = record.on_time_delivery_rate;
    node.country = record.country;
    return node;
}

// =============================================================================
// SupplierEngine
// =============================================================================

SupplierEngine::SupplierEngine(storage::TabularStore& store, storage::GraphStore& graph,
                               const EngineConfig& config)
    : store_(store), graph_(graph), config_(config), reader_(store) {}

absl::StatusOr<std::vector<SupplierRecord>> SupplierEngine::SuppliersIfPresent() {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(bool available, availability.IsAvailable(Dataset::kSuppliers));
    if (!available) {
        return std::vector<SupplierRecord>();
    }
    return reader_.Suppliers();
}

absl::StatusOr<std::vector<PurchaseOrderRecord>> SupplierEngine::PurchaseOrdersIfPresent() {
    AvailabilityResolver availability(store_);
    WCOPT_ASSIGN_OR_RETURN(bool available, availability.IsAvailable(Dataset::kPurchaseOrders));
    if (!available) {
        return std::vector<PurchaseOrderRecord>();
    }
    return reader_.PurchaseOrders();
}

absl::StatusOr<Outcome<SupplierRiskScores>> SupplierEngine::GetRiskScores() {
    WCOPT_ASSIGN_OR_RETURN(auto suppliers, SuppliersIfPresent());
    if (suppliers.empty()) {
        return MakeInsufficientData({Dataset::kSuppliers});
    }

    SupplierRiskScores result;
    for (const auto& rec : suppliers) {
        const RiskScore score = ScoreSupplier(rec.avg_lead_time_days, rec.on_time_delivery_rate,
                                              rec.quality_rejection_rate);
        SupplierRisk risk;
        risk.supplier_id = rec.supplier_id;
        risk.supplier_name = rec.supplier_name;
        risk.risk_score = score.risk_score;
        risk.risk_level = score.risk_level;
        risk.lead_time = rec.avg_lead_time_days;
        risk.otd_rate = rec.on_time_delivery_rate;
        risk.qrr = rec.quality_rejection_rate;
        result.suppliers.push_back(std::move(risk));
    }
    std::sort(result.suppliers.begin(), result.suppliers.end(),
              [](const SupplierRisk& a, const SupplierRisk& b) {
                  if (a.risk_score != b.risk_score) {
                      return a.risk_score > b.risk_score;
                  }
                  return a.supplier_id < b.supplier_id;
              });
    return result;
}

absl::StatusOr<Outcome<SupplierPerformance>> SupplierEngine::GetPerformance() {
    WCOPT_ASSIGN_OR_RETURN(auto suppliers, SuppliersIfPresent());
    if (suppliers.empty()) {
        return MakeInsufficientData({Dataset::kSuppliers});
    }
    std::sort(suppliers.begin(), suppliers.end(),
              [](const SupplierRecord& a, const SupplierRecord& b) {
                  if (a.on_time_delivery_rate != b.on_time_delivery_rate) {
                      return OptionalGreater(a.on_time_delivery_rate, b.on_time_delivery_rate);
                  }
                  return a.supplier_id < b.supplier_id;
              });
    SupplierPerformance result;
    result.count = suppliers.size();
    result.suppliers = std::move(suppliers);
    return result;
}

absl::StatusOr<Outcome<SupplierConcentration>> SupplierEngine::GetConcentration() {
    WCOPT_ASSIGN_OR_RETURN(auto orders, PurchaseOrdersIfPresent());
    if (orders.empty()) {
        return MakeInsufficientData({Dataset::kPurchaseOrders});
    }
    WCOPT_ASSIGN_OR_RETURN(auto supplier_rows, SuppliersIfPresent());
    const auto suppliers = IndexSuppliers(std::move(supplier_rows));

    std::map<std::string, SupplierSpend> spend;
    double total = 0.0;
    for (const auto& rec : orders) {
        auto& entry = spend[rec.supplier_id];
        entry.supplier_id = rec.supplier_id;
        ++entry.orders;
        entry.total_value += rec.total_po_value.value_or(0.0);
        total += rec.total_po_value.value_or(0.0);
    }

    SupplierConcentration result;
    for (auto& [id, entry] : spend) {
        auto supplier = suppliers.find(id);
        if (supplier != suppliers.end()) {
            entry.supplier_name = supplier->second.supplier_name;
        }
        entry.value_pct = Percent(entry.total_value, total);
        result.suppliers.push_back(std::move(entry));
    }
    std::sort(result.suppliers.begin(), result.suppliers.end(),
              [](const SupplierSpend& a, const SupplierSpend& b) {
                  if (a.total_value != b.total_value) {
                      return a.total_value > b.total_value;
                  }
                  return a.supplier_id < b.supplier_id;
              });

    double top3 = 0.0;
    for (size_t i = 0; i < result.suppliers.size() && i < 3; ++i) {
        top3 += result.suppliers[i].value_pct;
    }
    for (auto& entry : result.suppliers) {
        entry.total_value = Round(entry.total_value, 2);
        entry.value_pct = Round(entry.value_pct, 2);
    }
    result.top3_value_pct = Round(top3, 1);
    result.concentration_risk = ConcentrationRisk(top3);
    return result;
}

// =============================================================================
// Network queries
// =============================================================================

absl::StatusOr<Outcome<SupplierNetwork>> SupplierEngine::GetNetwork() {
    auto edges = graph_.Network();
    if (edges.ok() && !edges->empty()) {
        SupplierNetwork network;
        network.relationships = edges->size();
        network.network = *std::move(edges);
        return network;
    }

    WCOPT_ASSIGN_OR_RETURN(auto orders, PurchaseOrdersIfPresent());
    WCOPT_ASSIGN_OR_RETURN(auto supplier_rows, SuppliersIfPresent());
    if (orders.empty() && supplier_rows.empty()) {
        return MakeInsufficientData({Dataset::kSuppliers, Dataset::kPurchaseOrders});
    }

    SupplierNetwork network;
    network.source = kSourceTabular;
    network.note = FallbackNote("supplier network", edges.status());
    const auto suppliers = IndexSuppliers(std::move(supplier_rows));

    if (!orders.empty()) {
        std::set<std::pair<std::string, std::string>> pairs;
        for (const auto& rec : orders) {
            if (!rec.supplier_id.empty() && !rec.product_id.empty()) {
                pairs.emplace(rec.supplier_id, rec.product_id);
            }
        }
        for (const auto& [supplier_id, product_id] : pairs) {
            SuppliesEdge edge;
            edge.supplier_id = supplier_id;
            edge.product_id = product_id;
            auto supplier = suppliers.find(supplier_id);
            if (supplier != suppliers.end()) {
                edge.supplier_name = supplier->second.supplier_name;
                edge.lead_time = supplier->second.avg_lead_time_days;
            }
            network.network.push_back(std::move(edge));
        }
        std::stable_sort(network.network.begin(), network.network.end(),
                         [](const SuppliesEdge& a, const SuppliesEdge& b) {
                             return a.supplier_name.value_or(a.supplier_id) <
                                    b.supplier_name.value_or(b.supplier_id);
                         });
        network.relationships = network.network.size();
        return network;
    }

    for (const auto& [id, rec] : suppliers) {
        network.suppliers.push_back(ToSupplierNode(rec));
    }
    network.note = absl::StrCat(*network.note, "; no purchase_orders uploaded, listing suppliers");
    return network;
}

absl::StatusOr<Outcome<SingleSourceRisks>> SupplierEngine::FindSingleSourceRisks(size_t limit) {
    auto sole = graph_.SingleSourceProducts(limit);
    if (sole.ok() && !sole->empty()) {
        SingleSourceRisks risks;
        risks.single_source_products = *std::move(sole);
        risks.total = risks.single_source_products.size();
        return risks;
    }

    WCOPT_ASSIGN_OR_RETURN(auto orders, PurchaseOrdersIfPresent());
    if (orders.empty()) {
        return MakeInsufficientData({Dataset::kPurchaseOrders});
    }
    WCOPT_ASSIGN_OR_RETURN(auto supplier_rows, SuppliersIfPresent());
    const auto suppliers = IndexSuppliers(std::move(supplier_rows));

    std::map<std::string, std::set<std::string>> sources;
    for (const auto& rec : orders) {
        if (!rec.supplier_id.empty() && !rec.product_id.empty()) {
            sources[rec.product_id].insert(rec.supplier_id);
        }
    }

    SingleSourceRisks risks;
    risks.source = kSourceTabular;
    risks.note = FallbackNote("single source", sole.status());
    for (const auto& [product_id, supplier_ids] : sources) {
        if (supplier_ids.size() != 1) {
            continue;
        }
        if (risks.single_source_products.size() >= limit) {
            break;
        }
        SoleSourcedProduct product;
        product.product_id = product_id;
        product.supplier_id = *supplier_ids.begin();
        auto supplier = suppliers.find(product.supplier_id);
        if (supplier != suppliers.end()) {
            product.supplier_name = supplier->second.supplier_name;
        }
        risks.single_source_products.push_back(std::move(product));
    }
    risks.total = risks.single_source_products.size();
    return risks;
}

absl::StatusOr<Outcome<RippleEffect>> SupplierEngine::GetRippleEffect(
    const std::string& supplier_id) {
    if (supplier_id.empty()) {
        return absl::InvalidArgumentError("supplier_id must not be empty");
    }

    absl::Status graph_status;
    // A supplier node without edges may only mean the graph lags the tables
    std::optional<RippleEffect> edgeless;
    auto node = graph_.FindSupplier(supplier_id);
    if (node.ok() && node->has_value()) {
        auto products = graph_.SuppliedProducts(supplier_id);
        if (products.ok()) {
            RippleEffect ripple;
            ripple.supplier_id = supplier_id;
            ripple.supplier_name = (*node)->name;
            ripple.impacted_products = *std::move(products);
            ripple.count = ripple.impacted_products.size();
            ripple.severity = RippleSeverity(ripple.count);
            if (ripple.count > 0) {
                return ripple;
            }
            edgeless = std::move(ripple);
        } else {
            graph_status = products.status();
        }
    } else {
        graph_status = node.status();
    }

    WCOPT_ASSIGN_OR_RETURN(auto orders, PurchaseOrdersIfPresent());
    WCOPT_ASSIGN_OR_RETURN(auto supplier_rows, SuppliersIfPresent());
    if (orders.empty() && supplier_rows.empty()) {
        if (edgeless) {
            return *std::move(edgeless);
        }
        if (graph_status.ok()) {
            WCOPT_ASSIGN_OR_RETURN(auto counts, graph_.Counts());
            if (counts.suppliers > 0) {
                return NotFound{absl::StrCat("Supplier '", supplier_id, "' not found.")};
            }
        }
        return MakeInsufficientData({Dataset::kSuppliers, Dataset::kPurchaseOrders});
    }

    const auto suppliers = IndexSuppliers(std::move(supplier_rows));
    std::set<std::string> products;
    for (const auto& rec : orders) {
        if (rec.supplier_id == supplier_id && !rec.product_id.empty()) {
            products.insert(rec.product_id);
        }
    }
    auto supplier = suppliers.find(supplier_id);
    if (products.empty() && supplier == suppliers.end()) {
        return NotFound{absl::StrCat("Supplier '", supplier_id, "' not found.")};
    }

    RippleEffect ripple;
    ripple.source = kSourceTabular;
    ripple.note = FallbackNote("ripple effect", graph_status);
    ripple.supplier_id = supplier_id;
    if (supplier != suppliers.end()) {
        ripple.supplier_name = supplier->second.supplier_name;
    }
    ripple.impacted_products.assign(products.begin(), products.end());
    ripple.count = ripple.impacted_products.size();
    ripple.severity = RippleSeverity(ripple.count);
    return ripple;
}

absl::StatusOr<Outcome<LeadTimeVariability>> SupplierEngine::GetLeadTimeVariability() {
    const auto by_lead_time = [](const SupplierNode& a, const SupplierNode& b) {
        if (a.lead_time != b.lead_time) {
            return OptionalGreater(a.lead_time, b.lead_time);
        }
        return a.supplier_id < b.supplier_id;
    };

    auto nodes = graph_.Suppliers();
    if (nodes.ok() && !nodes->empty()) {
        LeadTimeVariability result;
        result.suppliers = *std::move(nodes);
        std::sort(result.suppliers.begin(), result.suppliers.end(), by_lead_time);
        return result;
    }

    WCOPT_ASSIGN_OR_RETURN(auto supplier_rows, SuppliersIfPresent());
    if (supplier_rows.empty()) {
        return MakeInsufficientData({Dataset::kSuppliers});
    }
    LeadTimeVariability result;
    result.source = kSourceTabular;
    result.note = FallbackNote("lead time variability", nodes.status());
    for (const auto& rec : supplier_rows) {
        result.suppliers.push_back(ToSupplierNode(rec));
    }
    std::sort(result.suppliers.begin(), result.suppliers.end(), by_lead_time);
    return result;
}

absl::StatusOr<Outcome<AlternativeSuppliers>> SupplierEngine::FindAlternatives(
    const std::string& sku) {
    if (sku.empty()) {
        return absl::InvalidArgumentError("sku must not be empty");
    }
    const size_t cap = config_.max_alternative_suppliers;

    const auto split = [&](std::vector<SupplierNode> all, const std::set<std::string>& current,
                           AlternativeSuppliers* result) {
        for (auto& node : all) {
            if (current.count(node.supplier_id) > 0) {
                result->current_suppliers.push_back(std::move(node));
            } else {
                result->alternatives.push_back(std::move(node));
            }
        }
        RankAlternatives(&result->alternatives);
        if (result->alternatives.size() > cap) {
            result->alternatives.resize(cap);
        }
    };

    absl::Status graph_status;
    auto nodes = graph_.Suppliers();
    if (nodes.ok() && !nodes->empty()) {
        auto linked = graph_.SuppliersOf(sku);
        // No SUPPLIES edge for the product: the graph may lag purchase_orders
        if (linked.ok() && !linked->empty()) {
            std::set<std::string> current;
            for (const auto& node : *linked) {
                current.insert(node.supplier_id);
            }
            AlternativeSuppliers result;
            result.product_id = sku;
            split(*std::move(nodes), current, &result);
            return result;
        }
        graph_status = linked.status();
    } else {
        graph_status = nodes.status();
    }

    WCOPT_ASSIGN_OR_RETURN(auto supplier_rows, SuppliersIfPresent());
    if (supplier_rows.empty()) {
        if (graph_status.ok() && nodes.ok() && !nodes->empty()) {
            AlternativeSuppliers result;
            result.product_id = sku;
            split(*std::move(nodes), {}, &result);
            return result;
        }
        return MakeInsufficientData({Dataset::kSuppliers});
    }
    WCOPT_ASSIGN_OR_RETURN(auto orders, PurchaseOrdersIfPresent());
    std::set<std::string> current;
    for (const auto& rec : orders) {
        if (rec.product_id == sku && !rec.supplier_id.empty()) {
            current.insert(rec.supplier_id);
        }
    }

    std::vector<SupplierNode> all;
    all.reserve(supplier_rows.size());
    for (const auto& rec : supplier_rows) {
        all.push_back(ToSupplierNode(rec));
    }
    std::sort(all.begin(), all.end(), [](const SupplierNode& a, const SupplierNode& b) {
        return a.supplier_id < b.supplier_id;
    });

    AlternativeSuppliers result;
    result.source = kSourceTabular;
    result.note = FallbackNote("alternative suppliers", graph_status);
    result.product_id = sku;
    split(std::move(all), current, &result);
    return result;
}

}  // namespace wcopt::engine
