/// @file identifier_test.cpp
/// @brief Tests for SQL identifier validation and header normalization

#include <string>

#include <gtest/gtest.h>

#include "storage/identifier.h"

namespace wcopt::storage {
namespace {

TEST(IdentifierTest, ValidIdentifiers) {
    EXPECT_TRUE(IsValidIdentifier("inventory"));
    EXPECT_TRUE(IsValidIdentifier("_private"));
    EXPECT_TRUE(IsValidIdentifier("purchase_orders_2024"));
}

TEST(IdentifierTest, InvalidIdentifiers) {
    EXPECT_FALSE(IsValidIdentifier(""));
    EXPECT_FALSE(IsValidIdentifier("2024_sales"));
    EXPECT_FALSE(IsValidIdentifier("sales; DROP TABLE x"));
    EXPECT_FALSE(IsValidIdentifier("unit cost"));
    EXPECT_FALSE(IsValidIdentifier("name\"--"));
    EXPECT_FALSE(IsValidIdentifier(std::string(kMaxIdentifierLength + 1, 'a')));
}

TEST(IdentifierTest, ValidateIdentifierNamesTheOffender) {
    auto status = ValidateIdentifier("bad-name", "column name");
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(status.message().find("column name 'bad-name'"), std::string::npos);

    EXPECT_TRUE(ValidateIdentifier("qty_sold", "column name").ok());
}

TEST(IdentifierTest, QuoteIdentifier) {
    EXPECT_EQ(QuoteIdentifier("sales_transactions"), "\"sales_transactions\"");
}

TEST(IdentifierTest, NormalizeColumnName) {
    EXPECT_EQ(NormalizeColumnName("Product ID"), "product_id");
    EXPECT_EQ(NormalizeColumnName("  Unit Cost ($) "), "unit_cost");
    EXPECT_EQ(NormalizeColumnName("lead-time.days"), "lead_time_days");
    EXPECT_EQ(NormalizeColumnName("qty__sold"), "qty_sold");
    EXPECT_EQ(NormalizeColumnName("2024 Revenue"), "_2024_revenue");
    EXPECT_EQ(NormalizeColumnName("%"), "");
}

}  // namespace
}  // namespace wcopt::storage
