/// @file graph_sync.cpp
/// @brief Graph mirroring implementation

#include "engine/graph_sync.h"

#include <set>
#include <string>

#include "common/error.h"
#include "common/logging.h"
#include "engine/availability.h"
#include "engine/supplier_risk.h"

namespace wcopt::engine {

absl::StatusOr<SyncReport> GraphSync::SyncSuppliers(const std::vector<SupplierRecord>& suppliers) {
    SyncReport report;
    for (const auto& rec : suppliers) {
        if (rec.supplier_id.empty()) {
            ++report.skipped_rows;
            continue;
        }
        WCOPT_RETURN_IF_ERROR(graph_.UpsertSupplier(ToSupplierNode(rec)));
        ++report.suppliers_upserted;
    }
    WCOPT_LOG_INFO("Graph sync: {} suppliers upserted, {} rows skipped",
                   report.suppliers_upserted, report.skipped_rows);
    return report;
}

absl::StatusOr<SyncReport> GraphSync::SyncPurchaseOrders(
    const std::vector<PurchaseOrderRecord>& orders) {
    SyncReport report;
    std::set<std::string> products;
    std::set<std::pair<std::string, std::string>> edges;
    for (const auto& rec : orders) {
        if (rec.supplier_id.empty() || rec.product_id.empty()) {
            ++report.skipped_rows;
            continue;
        }
        WCOPT_RETURN_IF_ERROR(graph_.EnsureProduct(rec.product_id));
        WCOPT_RETURN_IF_ERROR(graph_.EnsureSupplier(rec.supplier_id));
        WCOPT_RETURN_IF_ERROR(graph_.LinkSupplies(rec.supplier_id, rec.product_id));
        products.insert(rec.product_id);
        edges.emplace(rec.supplier_id, rec.product_id);
    }
    report.products_merged = products.size();
    report.relationships_merged = edges.size();
    WCOPT_LOG_INFO("Graph sync: {} products, {} relationships merged, {} rows skipped",
                   report.products_merged, report.relationships_merged, report.skipped_rows);
    return report;
}

absl::StatusOr<SyncReport> GraphSync::Resync(storage::TabularStore& store) {
    WCOPT_RETURN_IF_ERROR(graph_.Clear());

    AvailabilityResolver availability(store);
    DatasetReader reader(store);
    SyncReport total;

    WCOPT_ASSIGN_OR_RETURN(bool has_suppliers, availability.IsAvailable(Dataset::kSuppliers));
    if (has_suppliers) {
        WCOPT_ASSIGN_OR_RETURN(auto suppliers, reader.Suppliers());
        WCOPT_ASSIGN_OR_RETURN(SyncReport report, SyncSuppliers(suppliers));
        total.suppliers_upserted = report.suppliers_upserted;
        total.skipped_rows += report.skipped_rows;
    }

    WCOPT_ASSIGN_OR_RETURN(bool has_orders, availability.IsAvailable(Dataset::kPurchaseOrders));
    if (has_orders) {
        WCOPT_ASSIGN_OR_RETURN(auto orders, reader.PurchaseOrders());
        WCOPT_ASSIGN_OR_RETURN(SyncReport report, SyncPurchaseOrders(orders));
        total.products_merged = report.products_merged;
        total.relationships_merged = report.relationships_merged;
        total.skipped_rows += report.skipped_rows;
    }
    return total;
}

}  // namespace wcopt::engine
