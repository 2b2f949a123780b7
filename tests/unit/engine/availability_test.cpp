/// @file availability_test.cpp
/// @brief Tests for the dataset availability gate

#include "engine/availability.h"

#include <gtest/gtest.h>

#include "support/store_fixture.h"

namespace wcopt::engine {
namespace {

class AvailabilityTest : public test::StoreFixture {
protected:
    void LoadSales() {
        Load("sales_transactions", {"product_id", "transaction_date", "qty_sold", "total_revenue"},
             {{"P1", "2024-06-01", "3", "30"}});
    }
};

TEST_F(AvailabilityTest, MissingTableIsUnavailable) {
    AvailabilityResolver resolver(store());
    auto available = resolver.IsAvailable(Dataset::kProducts);
    ASSERT_TRUE(available.ok());
    EXPECT_FALSE(*available);
}

TEST_F(AvailabilityTest, EmptyTableIsUnavailable) {
    Load("products", {"product_id"}, {});
    AvailabilityResolver resolver(store());
    auto available = resolver.IsAvailable(Dataset::kProducts);
    ASSERT_TRUE(available.ok());
    EXPECT_FALSE(*available);
}

TEST_F(AvailabilityTest, TableWithRowsIsAvailable) {
    LoadSales();
    AvailabilityResolver resolver(store());
    auto available = resolver.IsAvailable(Dataset::kSalesTransactions);
    ASSERT_TRUE(available.ok());
    EXPECT_TRUE(*available);
}

TEST_F(AvailabilityTest, CheckNamesEveryMissingDataset) {
    AvailabilityResolver resolver(store());
    auto check = resolver.Check({Dataset::kInventorySnapshot, Dataset::kSalesTransactions});
    ASSERT_TRUE(check.ok());
    ASSERT_TRUE(check->has_value());
    EXPECT_EQ((*check)->message,
              "Upload inventory_snapshot + sales_transactions data to enable this analysis.");
    EXPECT_EQ((*check)->missing,
              (std::vector<std::string>{"inventory_snapshot", "sales_transactions"}));
}

TEST_F(AvailabilityTest, CheckListsOnlyTheAbsentOnes) {
    LoadSales();
    AvailabilityResolver resolver(store());
    auto check = resolver.Check({Dataset::kInventorySnapshot, Dataset::kSalesTransactions});
    ASSERT_TRUE(check.ok());
    ASSERT_TRUE(check->has_value());
    EXPECT_EQ((*check)->missing, std::vector<std::string>{"inventory_snapshot"});
    EXPECT_EQ((*check)->message, "Upload inventory_snapshot data to enable this analysis.");
}

TEST_F(AvailabilityTest, CheckPassesWhenAllPresent) {
    LoadSales();
    AvailabilityResolver resolver(store());
    auto check = resolver.Check({Dataset::kSalesTransactions});
    ASSERT_TRUE(check.ok());
    EXPECT_FALSE(check->has_value());
}

TEST_F(AvailabilityTest, PresentKeepsRequestOrder) {
    LoadSales();
    Load("products", {"product_id"}, {{"P1"}});
    AvailabilityResolver resolver(store());
    auto present = resolver.Present(
        {Dataset::kSuppliers, Dataset::kSalesTransactions, Dataset::kProducts});
    ASSERT_TRUE(present.ok());
    EXPECT_EQ(*present,
              (std::vector<Dataset>{Dataset::kSalesTransactions, Dataset::kProducts}));
}

TEST_F(AvailabilityTest, StoreFailureIsNotMissingData) {
    ASSERT_TRUE(store().Disconnect().ok());
    AvailabilityResolver resolver(store());
    auto check = resolver.Check({Dataset::kProducts});
    EXPECT_EQ(check.status().code(), absl::StatusCode::kFailedPrecondition);
    ASSERT_TRUE(store().Connect().ok());
}

}  // namespace
}  // namespace wcopt::engine
