#pragma once

/// @file graph_store.h
/// @brief Interface of the supplier -> product graph mirror

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace wcopt::storage {

/// @brief Supplier node and the properties mirrored from the suppliers table
struct SupplierNode {
    std::string supplier_id;
    std::optional<std::string> name;
    std::optional<double> lead_time;
    std::optional<double> rating;
    std::optional<double> otd_rate;
    std::optional<std::string> country;
};

/// @brief One SUPPLIES edge together with its supplier's display fields
struct SuppliesEdge {
    std::string supplier_id;
    std::optional<std::string> supplier_name;
    std::optional<double> lead_time;
    std::string product_id;
};

/// @brief Product reached by exactly one SUPPLIES edge
struct SoleSourcedProduct {
    std::string product_id;
    std::string supplier_id;
    std::optional<std::string> supplier_name;
};

/// @brief Node and relationship totals
struct GraphCounts {
    size_t suppliers = 0;
    size_t products = 0;
    size_t relationships = 0;
};

/// @brief Graph store mirroring suppliers, products and SUPPLIES edges.
///
/// All writes have MERGE semantics: repeating a write leaves the graph
/// unchanged. Edges are only created between nodes that already exist.
class GraphStore {
public:
    virtual ~GraphStore() = default;

    virtual absl::Status Connect() = 0;
    virtual absl::Status Disconnect() = 0;
    virtual bool IsConnected() const = 0;

    /// @brief Short backend identifier ("memory", "falkordb")
    virtual std::string BackendName() const = 0;

    // ==========================================================================
    // Writes
    // ==========================================================================

    /// @brief Merge a supplier node and overwrite its properties
    virtual absl::Status UpsertSupplier(const SupplierNode& supplier) = 0;

    /// @brief Merge a supplier node by id, leaving existing properties alone
    virtual absl::Status EnsureSupplier(std::string_view supplier_id) = 0;

    /// @brief Merge a product node by id
    virtual absl::Status EnsureProduct(std::string_view product_id) = 0;

    /// @brief Merge a SUPPLIES edge; FailedPrecondition when an endpoint
    /// node does not exist
    virtual absl::Status LinkSupplies(std::string_view supplier_id,
                                      std::string_view product_id) = 0;

    /// @brief Remove every node and edge
    virtual absl::Status Clear() = 0;

    // ==========================================================================
    // Reads
    // ==========================================================================

    /// @brief All SUPPLIES edges, ordered by supplier name then ids
    virtual absl::StatusOr<std::vector<SuppliesEdge>> Network() = 0;

    /// @brief Products with exactly one supplier, ordered by product id
    virtual absl::StatusOr<std::vector<SoleSourcedProduct>> SingleSourceProducts(
        size_t limit) = 0;

    /// @brief Supplier node by id
    virtual absl::StatusOr<std::optional<SupplierNode>> FindSupplier(
        std::string_view supplier_id) = 0;

    /// @brief Ids of the products a supplier supplies, ordered
    virtual absl::StatusOr<std::vector<std::string>> SuppliedProducts(
        std::string_view supplier_id) = 0;

    /// @brief Suppliers with a SUPPLIES edge to the product, ordered by id
    virtual absl::StatusOr<std::vector<SupplierNode>> SuppliersOf(
        std::string_view product_id) = 0;

    /// @brief Every supplier node, ordered by id
    virtual absl::StatusOr<std::vector<SupplierNode>> Suppliers() = 0;

    virtual absl::StatusOr<GraphCounts> Counts() = 0;
};

}  // namespace wcopt::storage
