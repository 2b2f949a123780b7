#pragma once

/// @file falkordb_store.h
/// @brief FalkorDB backend of the graph store (Redis protocol via hiredis)

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "storage/graph_store.h"

namespace wcopt::storage {

/// @brief FalkorDB connection configuration
struct FalkorDbConfig {
    std::string host = "localhost";
    uint16_t port = 6379;
    std::string password;

    /// Name of the graph key holding the supply network
    std::string graph = "supply_chain";

    std::chrono::seconds connection_timeout{5};
};

/// @brief Graph store backed by a FalkorDB server.
///
/// SECURITY: values reach Cypher only through the CYPHER parameter header,
/// rendered as escaped literals; labels and property names are fixed.
class FalkorDbStore : public GraphStore {
public:
    explicit FalkorDbStore(FalkorDbConfig config);
    ~FalkorDbStore() override;

    // Non-copyable
    FalkorDbStore(const FalkorDbStore&) = delete;
    FalkorDbStore& operator=(const FalkorDbStore&) = delete;

    absl::Status Connect() override;
    absl::Status Disconnect() override;
    bool IsConnected() const override;
    std::string BackendName() const override { return "falkordb"; }

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

    const FalkorDbConfig& GetConfig() const { return config_; }

private:
    FalkorDbConfig config_;
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// @brief Render a string as a single-quoted Cypher literal
std::string CypherStringLiteral(std::string_view value);

}  // namespace wcopt::storage
