#pragma once

/// @file catalog.h
/// @brief The named analyses, their parameter schemas and response rendering

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/metrics.h"
#include "engine/datasets.h"
#include "engine/engine_config.h"
#include "query/params.h"
#include "storage/graph_store.h"
#include "storage/tabular_store.h"

namespace wcopt::query {

/// @brief Catalog entry of one analysis
struct AnalysisInfo {
    std::string name;
    std::string group;  ///< "dashboard", "inventory", "cash_cycle", ...
    std::string description;
    std::vector<ParamSpec> params;
    /// Datasets the analysis reads; not all of them are required
    std::vector<engine::Dataset> datasets;
};

/// @brief HTTP-style response of one analysis call
struct Response {
    int status_code = 200;
    nlohmann::json body;
};

/// @brief Schema of an entry as JSON (name, description, parameters, datasets)
nlohmann::json DescribeAnalysis(const AnalysisInfo& info);

/// @brief Dispatches analysis calls by name.
///
/// Every call validates its parameters against the entry's schema and is
/// rendered as follows:
/// - success: 200 and the result record
/// - insufficient data: 200 and {"message", "missing_datasets"}
/// - not found: 404 and {"message"}
/// - invalid input (unknown analysis, bad parameter, blocked query): 400
/// - any other failure: 500
///
/// Calls, insufficient-data results, graph fallbacks, blocked queries and
/// latencies are recorded in the given registry.
class AnalysisCatalog {
public:
    AnalysisCatalog(storage::TabularStore& store, storage::GraphStore& graph,
                    const engine::EngineConfig& config, MetricsRegistry& metrics);
    ~AnalysisCatalog();

    // Non-copyable
    AnalysisCatalog(const AnalysisCatalog&) = delete;
    AnalysisCatalog& operator=(const AnalysisCatalog&) = delete;

    /// @brief Every analysis in catalog order
    const std::vector<AnalysisInfo>& List() const;

    /// @brief nullptr for unknown names
    const AnalysisInfo* Find(std::string_view name) const;

    Response Run(std::string_view name, const nlohmann::json& params);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace wcopt::query
