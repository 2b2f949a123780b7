#pragma once

/// @file mock_graph_store.h
/// @brief gMock double of the graph store

#include <gmock/gmock.h>

#include "storage/graph_store.h"

namespace wcopt::test {

class MockGraphStore : public storage::GraphStore {
public:
    MOCK_METHOD(absl::Status, Connect, (), (override));
    MOCK_METHOD(absl::Status, Disconnect, (), (override));
    MOCK_METHOD(bool, IsConnected, (), (const, override));
    MOCK_METHOD(std::string, BackendName, (), (const, override));

    MOCK_METHOD(absl::Status, UpsertSupplier, (const storage::SupplierNode&), (override));
    MOCK_METHOD(absl::Status, EnsureSupplier, (std::string_view), (override));
    MOCK_METHOD(absl::Status, EnsureProduct, (std::string_view), (override));
    MOCK_METHOD(absl::Status, LinkSupplies, (std::string_view, std::string_view), (override));
    MOCK_METHOD(absl::Status, Clear, (), (override));

    MOCK_METHOD(absl::StatusOr<std::vector<storage::SuppliesEdge>>, Network, (), (override));
    MOCK_METHOD(absl::StatusOr<std::vector<storage::SoleSourcedProduct>>, SingleSourceProducts,
                (size_t), (override));
    MOCK_METHOD(absl::StatusOr<std::optional<storage::SupplierNode>>, FindSupplier,
                (std::string_view), (override));
    MOCK_METHOD(absl::StatusOr<std::vector<std::string>>, SuppliedProducts, (std::string_view),
                (override));
    MOCK_METHOD(absl::StatusOr<std::vector<storage::SupplierNode>>, SuppliersOf,
                (std::string_view), (override));
    MOCK_METHOD(absl::StatusOr<std::vector<storage::SupplierNode>>, Suppliers, (), (override));
    MOCK_METHOD(absl::StatusOr<storage::GraphCounts>, Counts, (), (override));
};

/// @brief Mock whose every call fails as an unreachable backend would
inline void FailEveryCall(::testing::NiceMock<MockGraphStore>& graph) {
    using ::testing::Return;
    const absl::Status down = absl::UnavailableError("connection refused");
    ON_CALL(graph, IsConnected()).WillByDefault(Return(false));
    ON_CALL(graph, BackendName()).WillByDefault(Return("mock"));
    ON_CALL(graph, Connect()).WillByDefault(Return(down));
    ON_CALL(graph, Disconnect()).WillByDefault(Return(absl::OkStatus()));
    ON_CALL(graph, UpsertSupplier(::testing::_)).WillByDefault(Return(down));
    ON_CALL(graph, EnsureSupplier(::testing::_)).WillByDefault(Return(down));
    ON_CALL(graph, EnsureProduct(::testing::_)).WillByDefault(Return(down));
    ON_CALL(graph, LinkSupplies(::testing::_, ::testing::_)).WillByDefault(Return(down));
    ON_CALL(graph, Clear()).WillByDefault(Return(down));
    ON_CALL(graph, Network()).WillByDefault(Return(down));
    ON_CALL(graph, SingleSourceProducts(::testing::_)).WillByDefault(Return(down));
    ON_CALL(graph, FindSupplier(::testing::_)).WillByDefault(Return(down));
    ON_CALL(graph, SuppliedProducts(::testing::_)).WillByDefault(Return(down));
    ON_CALL(graph, SuppliersOf(::testing::_)).WillByDefault(Return(down));
    ON_CALL(graph, Suppliers()).WillByDefault(Return(down));
    ON_CALL(graph, Counts()).WillByDefault(Return(down));
}

}  // namespace wcopt::test
