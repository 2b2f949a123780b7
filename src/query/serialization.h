#pragma once

/// @file serialization.h
/// @brief JSON rendering of the analysis records
///
/// The to_json overloads live in the namespace of the type they render so
/// that nlohmann::json finds them by argument-dependent lookup. Unset
/// optional fields render as null, except the *_note fields, which are left
/// out when there is nothing to say.

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine/cash_cycle.h"
#include "engine/classification.h"
#include "engine/dataset_loader.h"
#include "engine/demand.h"
#include "engine/graph_sync.h"
#include "engine/inventory_policy.h"
#include "engine/outcome.h"
#include "engine/overview.h"
#include "engine/supplier_risk.h"
#include "query/sql_gate.h"
#include "storage/graph_store.h"
#include "storage/table.h"

namespace wcopt::query {

/// @brief Value or null
template <typename T>
nlohmann::json Opt(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return nlohmann::json(*value);
}

/// @brief Numeric text as a number, other text as a string, NULL as null
nlohmann::json CellToJson(const storage::Cell& cell);

/// @brief Row as an object keyed by column name
nlohmann::json RowToJson(const std::vector<std::string>& columns, const storage::Row& row);

/// @brief Serializes a response body. Invalid UTF-8 in strings is replaced
/// with U+FFFD rather than failing the dump. A negative indent renders one line.
std::string RenderJson(const nlohmann::json& body, int indent = 2);

/// @brief {"message": ..., "missing_datasets": [...]}
nlohmann::json InsufficientDataToJson(const engine::InsufficientData& insufficient);

}  // namespace wcopt::query

namespace wcopt::storage {

/// @brief Array of row objects
void to_json(nlohmann::json& j, const Table& table);
void to_json(nlohmann::json& j, const ColumnInfo& column);
void to_json(nlohmann::json& j, const UploadRecord& record);
void to_json(nlohmann::json& j, const SupplierNode& node);
void to_json(nlohmann::json& j, const SuppliesEdge& edge);
void to_json(nlohmann::json& j, const SoleSourcedProduct& product);
void to_json(nlohmann::json& j, const GraphCounts& counts);

}  // namespace wcopt::storage

namespace wcopt::engine {

// Records read from the datasets
void to_json(nlohmann::json& j, const SupplierRecord& record);
void to_json(nlohmann::json& j, const ShipmentRecord& record);

// Classification
void to_json(nlohmann::json& j, const ParetoEntry& entry);
void to_json(nlohmann::json& j, const ParetoResult& result);
void to_json(nlohmann::json& j, const AbcXyzEntry& entry);
void to_json(nlohmann::json& j, const AbcXyzResult& result);

// Cash cycle
void to_json(nlohmann::json& j, const KpiSummary& summary);
void to_json(nlohmann::json& j, const TrappedCashItem& item);
void to_json(nlohmann::json& j, const WorkingCapitalSummary& summary);
void to_json(nlohmann::json& j, const CarryingCost& cost);
void to_json(nlohmann::json& j, const CccLeverImpact& impact);
void to_json(nlohmann::json& j, const CccSimulation& simulation);
void to_json(nlohmann::json& j, const AgingBucket& bucket);
void to_json(nlohmann::json& j, const FlaggedInvoices& flagged);
void to_json(nlohmann::json& j, const ArAging& aging);
void to_json(nlohmann::json& j, const CustomerDso& customer);
void to_json(nlohmann::json& j, const DsoAnalysis& analysis);
void to_json(nlohmann::json& j, const SupplierDpo& supplier);
void to_json(nlohmann::json& j, const DpoAnalysis& analysis);

// Inventory policy
void to_json(nlohmann::json& j, const SafetyStockEntry& entry);
void to_json(nlohmann::json& j, const SafetyStockReport& report);
void to_json(nlohmann::json& j, const EoqEntry& entry);
void to_json(nlohmann::json& j, const EoqReport& report);
void to_json(nlohmann::json& j, const ReorderAlert& alert);
void to_json(nlohmann::json& j, const ReorderAlerts& alerts);
void to_json(nlohmann::json& j, const ReorderRecommendation& recommendation);
void to_json(nlohmann::json& j, const SmartReorder& reorder);
void to_json(nlohmann::json& j, const TurnoverEntry& entry);
void to_json(nlohmann::json& j, const InventoryTurnover& turnover);
void to_json(nlohmann::json& j, const AgingEntry& entry);
void to_json(nlohmann::json& j, const AgingBucketSummary& summary);
void to_json(nlohmann::json& j, const InventoryAging& aging);
void to_json(nlohmann::json& j, const DeadStockEntry& entry);
void to_json(nlohmann::json& j, const DeadStock& dead);
void to_json(nlohmann::json& j, const StockRow& row);
void to_json(nlohmann::json& j, const Overstock& overstock);
void to_json(nlohmann::json& j, const StockoutRisk& risk);

// Demand
void to_json(nlohmann::json& j, const DemandForecast& forecast);
void to_json(nlohmann::json& j, const AnomalyReport& report);
void to_json(nlohmann::json& j, const RevenuePeriod& period);
void to_json(nlohmann::json& j, const RevenueTrends& trends);
void to_json(nlohmann::json& j, const VelocityEntry& entry);
void to_json(nlohmann::json& j, const SalesVelocity& velocity);
void to_json(nlohmann::json& j, const TopSkuEntry& entry);
void to_json(nlohmann::json& j, const TopSkus& top);
void to_json(nlohmann::json& j, const CustomerShare& share);
void to_json(nlohmann::json& j, const CustomerConcentration& concentration);
void to_json(nlohmann::json& j, const MonthlyDemand& month);
void to_json(nlohmann::json& j, const Seasonality& seasonality);

// Suppliers
void to_json(nlohmann::json& j, const SupplierRisk& risk);
void to_json(nlohmann::json& j, const SupplierRiskScores& scores);
void to_json(nlohmann::json& j, const SupplierPerformance& performance);
void to_json(nlohmann::json& j, const SupplierSpend& spend);
void to_json(nlohmann::json& j, const SupplierConcentration& concentration);
void to_json(nlohmann::json& j, const SupplierNetwork& network);
void to_json(nlohmann::json& j, const SingleSourceRisks& risks);
void to_json(nlohmann::json& j, const RippleEffect& ripple);
void to_json(nlohmann::json& j, const LeadTimeVariability& variability);
void to_json(nlohmann::json& j, const AlternativeSuppliers& alternatives);

// Overview
void to_json(nlohmann::json& j, const Dashboard& dashboard);
void to_json(nlohmann::json& j, const TableQuality& quality);
void to_json(nlohmann::json& j, const DataQualityReport& report);
void to_json(nlohmann::json& j, const UploadStatus& status);
void to_json(nlohmann::json& j, const UploadListing& listing);
void to_json(nlohmann::json& j, const SchemaInfo& info);
void to_json(nlohmann::json& j, const TableCount& count);
void to_json(nlohmann::json& j, const VersionHistory& history);
void to_json(nlohmann::json& j, const TableRefresh& refresh);
void to_json(nlohmann::json& j, const GraphRefresh& refresh);
void to_json(nlohmann::json& j, const RefreshReport& report);
void to_json(nlohmann::json& j, const ShipmentStatusSummary& summary);
void to_json(nlohmann::json& j, const ShipmentTracking& tracking);
void to_json(nlohmann::json& j, const ProductCatalog& catalog);

// Uploads
void to_json(nlohmann::json& j, const SyncReport& report);
void to_json(nlohmann::json& j, const LoadReport& report);

}  // namespace wcopt::engine

namespace wcopt::query {

void to_json(nlohmann::json& j, const SqlResult& result);

}  // namespace wcopt::query
