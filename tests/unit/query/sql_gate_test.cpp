/// @file sql_gate_test.cpp
/// @brief Tests for the read-only SQL gate

#include "query/sql_gate.h"

#include <string>

#include <absl/strings/ascii.h>
#include <gtest/gtest.h>

#include "support/store_fixture.h"

namespace wcopt::query {
namespace {

// =============================================================================
// Screening
// =============================================================================

TEST(SqlGateScreenTest, AcceptsSelect) {
    EXPECT_TRUE(SqlGate::Screen("SELECT product_id FROM products").ok());
    EXPECT_TRUE(SqlGate::Screen("  with t as (select 1 as x) select x from t").ok());
}

TEST(SqlGateScreenTest, RejectsEmptyQuery) {
    for (const char* sql : {"", "   ", "\n\t"}) {
        auto status = SqlGate::Screen(sql);
        EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
        EXPECT_EQ(status.message(), "Empty query");
    }
}

TEST(SqlGateScreenTest, RejectsOversizedQuery) {
    std::string sql = "SELECT 1 -- ";
    sql.append(SqlGate::kMaxQueryLength, 'x');
    auto status = SqlGate::Screen(sql);
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(status.message(), "Query exceeds maximum length of 65536");
}

TEST(SqlGateScreenTest, OversizedWriteIsReportedAsBlocked) {
    std::string sql = "SELECT 1; DROP TABLE products -- ";
    sql.append(SqlGate::kMaxQueryLength, 'x');
    auto status = SqlGate::Screen(sql);
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(status.message(), "Write operations blocked: DROP");
}

TEST(SqlGateScreenTest, RejectsWriteKeywordsInAnyCase) {
    auto status = SqlGate::Screen("SeLeCt * FROM products; dRoP TABLE products");
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(status.message(), "Write operations blocked: DROP");

    for (const char* sql : {"insert into t values (1)", "UPDATE t SET a = 1",
                            "delete from t", "ALTER TABLE t ADD c", "truncate t"}) {
        EXPECT_FALSE(SqlGate::Screen(sql).ok()) << sql;
    }
}

TEST(SqlGateScreenTest, SubstringMatchBlocksIdentifiers) {
    EXPECT_EQ(SqlGate::FindBlockedKeyword("SELECT created_at FROM orders"), "CREATE");
    EXPECT_EQ(SqlGate::FindBlockedKeyword("select last_update from t"), "UPDATE");
    EXPECT_EQ(SqlGate::FindBlockedKeyword("SELECT 1"), std::nullopt);
}

TEST(SqlGateScreenTest, KeywordListIsUpperCase) {
    const auto& keywords = SqlGate::BlockedKeywords();
    EXPECT_EQ(keywords.size(), 7u);
    for (const auto& keyword : keywords) {
        EXPECT_EQ(keyword, absl::AsciiStrToUpper(keyword));
    }
}

TEST(SqlGateSanitizeTest, EscapesControlAndQuoteCharacters) {
    EXPECT_EQ(SqlGate::SanitizeForLogging("it's"), "it\\'s");
    EXPECT_EQ(SqlGate::SanitizeForLogging("a\nb\tc\r"), "a\\nb\\tc\\r");
    EXPECT_EQ(SqlGate::SanitizeForLogging("back\\slash"), "back\\\\slash");
    EXPECT_EQ(SqlGate::SanitizeForLogging(std::string("x\0y", 3)), "x\\0y");
    EXPECT_EQ(SqlGate::SanitizeForLogging("bell\a"), "bell?");
    EXPECT_EQ(SqlGate::SanitizeForLogging("plain text"), "plain text");
}

// =============================================================================
// Execution
// =============================================================================

class SqlGateTest : public test::StoreFixture {
protected:
    void SetUp() override {
        StoreFixture::SetUp();
        Load("products", {"product_id", "category", "unit_cost"},
             {
                 {"P1", "Tools", "2.5"},
                 {"P2", "Tools", "4"},
                 {"P3", "Parts", std::nullopt},
             });
    }
};

TEST_F(SqlGateTest, RunsSelect) {
    SqlGate gate(store(), 100);
    auto result = gate.Run("SELECT product_id, unit_cost FROM products ORDER BY product_id");
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->rows, 3u);
    EXPECT_EQ(result->columns, (std::vector<std::string>{"product_id", "unit_cost"}));
    ASSERT_EQ(result->data.size(), 3u);
    EXPECT_EQ(result->data[0][0], "P1");
    EXPECT_FALSE(result->data[2][1].has_value());
}

TEST_F(SqlGateTest, CapsReturnedRowsButCountsAll) {
    SqlGate gate(store(), 2);
    auto result = gate.Run("SELECT * FROM products");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->rows, 3u);
    EXPECT_EQ(result->data.size(), 2u);
}

TEST_F(SqlGateTest, BlockedQueryNeverReachesStore) {
    SqlGate gate(store(), 100);
    auto result = gate.Run("DELETE FROM products");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);

    auto count = gate.Run("SELECT COUNT(*) AS n FROM products");
    ASSERT_TRUE(count.ok());
    EXPECT_EQ(count->data[0][0], "3");
}

TEST_F(SqlGateTest, StoreRefusesStatementsTheDenylistMisses) {
    SqlGate gate(store(), 100);
    auto multiple = gate.Run("SELECT 1; SELECT 2");
    ASSERT_FALSE(multiple.ok());
    EXPECT_EQ(multiple.status().code(), absl::StatusCode::kInvalidArgument);

    auto replace = gate.Run("REPLACE INTO products VALUES ('P4', 'Parts', '1')");
    ASSERT_FALSE(replace.ok());
    EXPECT_EQ(replace.status().message(), "Only read-only statements are allowed");
}

TEST_F(SqlGateTest, UnknownTableFails) {
    SqlGate gate(store(), 100);
    auto result = gate.Run("SELECT * FROM no_such_table");
    EXPECT_FALSE(result.ok());
}

}  // namespace
}  // namespace wcopt::query
