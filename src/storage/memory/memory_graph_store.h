#pragma once

/// @file memory_graph_store.h
/// @brief In-process graph store

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>

#include "storage/graph_store.h"

namespace wcopt::storage {

/// @brief Graph store held in process memory.
///
/// Used when no graph server is configured and by tests. Contents live as
/// long as the object; Disconnect() keeps them.
class MemoryGraphStore : public GraphStore {
public:
    MemoryGraphStore() = default;
    ~MemoryGraphStore() override = default;

    // Non-copyable
    MemoryGraphStore(const MemoryGraphStore&) = delete;
    MemoryGraphStore& operator=(const MemoryGraphStore&) = delete;

    absl::Status Connect() override;
    absl::Status Disconnect() override;
    bool IsConnected() const override;
    std::string BackendName() const override { return "memory"; }

    absl::Status UpsertSupplier(const SupplierNode& supplier) override;
    absl::Status EnsureSupplier(std::string_view supplier_id) override;
    absl::Status EnsureProduct(std::string_view product_id) override;
    absl::Status LinkSupplies(std::string_view supplier_id,
                              std::string_view product_id) override;
    absl::Status Clear() override;

    absl::StatusOr<std::vector<SuppliesEdge>> Network() override;
    absl::StatusOr<std::vector<SoleSourcedProduct>> SingleSourceProducts(
        size_t limit) override;
    absl::StatusOr<std::optional<SupplierNode>> FindSupplier(
        std::string_view supplier_id) override;
    absl::StatusOr<std::vector<std::string>> SuppliedProducts(
        std::string_view supplier_id) override;
    absl::StatusOr<std::vector<SupplierNode>> SuppliersOf(
        std::string_view product_id) override;
    absl::StatusOr<std::vector<SupplierNode>> Suppliers() override;
    absl::StatusOr<GraphCounts> Counts() override;

private:
    absl::Status CheckConnected() const;

    mutable std::mutex mutex_;
    bool connected_ = false;
    std::map<std::string, SupplierNode, std::less<>> suppliers_;
    std::set<std::string, std::less<>> products_;
    /// (supplier_id, product_id)
    std::set<std::pair<std::string, std::string>> edges_;
};

}  // namespace wcopt::storage
