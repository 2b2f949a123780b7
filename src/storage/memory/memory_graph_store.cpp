/// @file memory_graph_store.cpp
/// @brief In-process graph store implementation

#include "storage/memory/memory_graph_store.h"

#include <algorithm>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace wcopt::storage {

absl::Status MemoryGraphStore::Connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = true;
    return absl::OkStatus();
}

absl::Status MemoryGraphStore::Disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
    return absl::OkStatus();
}

bool MemoryGraphStore::IsConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

absl::Status MemoryGraphStore::CheckConnected() const {
    if (!connected_) {
        return absl::FailedPreconditionError("Graph store is not connected");
    }
    return absl::OkStatus();
}

// =============================================================================
// Writes
// =============================================================================

absl::Status MemoryGraphStore::UpsertSupplier(const SupplierNode& supplier) {
    std::lock_guard<std::mutex> lock(mutex_);
    WCOPT_RETURN_IF_ERROR(CheckConnected());
    suppliers_[supplier.supplier_id] = supplier;
    return absl::OkStatus();
}

absl::Status MemoryGraphStore::EnsureSupplier(std::string_view supplier_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    WCOPT_RETURN_IF_ERROR(CheckConnected());
    if (suppliers_.find(supplier_id) == suppliers_.end()) {
        SupplierNode node;
        node.supplier_id = std::string(supplier_id);
        suppliers_.emplace(node.supplier_id, std::move(node));
    }
    return absl::OkStatus();
}

absl::Status MemoryGraphStore::EnsureProduct(std::string_view product_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    WCOPT_RETURN_IF_ERROR(CheckConnected());
    products_.emplace(product_id);
    return absl::OkStatus();
}

absl::Status MemoryGraphStore::LinkSupplies(std::string_view supplier_id,
                                            std::string_view product_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    WCOPT_RETURN_IF_ERROR(CheckConnected());
    if (suppliers_.find(supplier_id) == suppliers_.end()) {
        return absl::FailedPreconditionError(
            absl::StrCat("Supplier node '", absl::string_view(supplier_id.data(), supplier_id.size()), "' does not exist"));
    }
    if (products_.find(product_id) == products_.end()) {
        return absl::FailedPreconditionError(
            absl::StrCat("Product node '", absl::string_view(product_id.data(), product_id.size()), "' does not exist"));
    }
    edges_.emplace(std::string(supplier_id), std::string(product_id));
    return absl::OkStatus();
}

absl::Status MemoryGraphStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    WCOPT_RETURN_IF_ERROR(CheckConnected());
    suppliers_.clear();
    products_.clear();
    edges_.clear();
    WCOPT_LOG_DEBUG("Cleared memory graph");
    return absl::OkStatus();
}

// =============================================================================
// Reads
// =============================================================================

absl::StatusOr<std::vector<SuppliesEdge>> MemoryGraphStore::Network() {
    std::lock_guard<std::mutex> lock(mutex_);
    WCOPT_RETURN_IF_ERROR(CheckConnected());

    std::vector<SuppliesEdge> network;
    network.reserve(edges_.size());
    for (const auto& [supplier_id, product_id] : edges_) {
        const SupplierNode& node = suppliers_.at(supplier_id);
        network.push_back({supplier_id, node.name, node.lead_time, product_id});
    }
    std::stable_sort(network.begin(), network.end(),
                     [](const SuppliesEdge& a, const SuppliesEdge& b) {
                         return a.supplier_name.value_or("") < b.supplier_name.value_or("");
                     });
    return network;
}

absl::StatusOr<std::vector<SoleSourcedProduct>> MemoryGraphStore::SingleSourceProducts(
    size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    WCOPT_RETURN_IF_ERROR(CheckConnected());

    std::map<std::string, std::vector<std::string>> by_product;
    for (const auto& [supplier_id, product_id] : edges_) {
        by_product[product_id].push_back(supplier_id);
    }

    std::vector<SoleSourcedProduct> result;
    for (const auto& [product_id, suppliers] : by_product) {
        if (result.size() >= limit) {
            break;
        }
        if (suppliers.size() != 1) {
            continue;
        }
        result.push_back({product_id, suppliers.front(), suppliers_.at(suppliers.front()).name});
    }
    return result;
}

absl::StatusOr<std::optional<SupplierNode>> MemoryGraphStore::FindSupplier(
    std::string_view supplier_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    WCOPT_RETURN_IF_ERROR(CheckConnected());
    auto it = suppliers_.find(supplier_id);
    if (it == suppliers_.end()) {
        return std::optional<SupplierNode>();
    }
    return std::optional<SupplierNode>(it->second);
}

absl::StatusOr<std::vector<std::string>> MemoryGraphStore::SuppliedProducts(
    std::string_view supplier_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    WCOPT_RETURN_IF_ERROR(CheckConnected());
    std::vector<std::string> products;
    for (const auto& [sid, pid] : edges_) {
        if (sid == supplier_id) {
            products.push_back(pid);
        }
    }
    return products;
}

absl::StatusOr<std::vector<SupplierNode>> MemoryGraphStore::SuppliersOf(
    std::string_view product_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    WCOPT_RETURN_IF_ERROR(CheckConnected());
    std::vector<SupplierNode> suppliers;
    for (const auto& [sid, pid] : edges_) {
        if (pid == product_id) {
            suppliers.push_back(suppliers_.at(sid));
        }
    }
    return suppliers;
}

absl::StatusOr<std::vector<SupplierNode>> MemoryGraphStore::Suppliers() {
    std::lock_guard<std::mutex> lock(mutex_);
    WCOPT_RETURN_IF_ERROR(CheckConnected());
    std::vector<SupplierNode> suppliers;
    suppliers.reserve(suppliers_.size());
    for (const auto& entry : suppliers_) {
        suppliers.push_back(entry.second);
    }
    return suppliers;
}

absl::StatusOr<GraphCounts> MemoryGraphStore::Counts() {
    std::lock_guard<std::mutex> lock(mutex_);
    WCOPT_RETURN_IF_ERROR(CheckConnected());
    GraphCounts counts;
    counts.suppliers = suppliers_.size();
    counts.products = products_.size();
    counts.relationships = edges_.size();
    return counts;
}

}  // namespace wcopt::storage
