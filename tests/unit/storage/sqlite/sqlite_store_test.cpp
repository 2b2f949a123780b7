/// @file sqlite_store_test.cpp
/// @brief Tests for the SQLite tabular store

#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "storage/sqlite/sqlite_store.h"

namespace wcopt::storage {
namespace {

class SqliteStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        SqliteConfig config;
        config.path = ":memory:";
        store_ = std::make_unique<SqliteStore>(config);
        ASSERT_TRUE(store_->Connect().ok());
    }

    void TearDown() override {
        EXPECT_TRUE(store_->Disconnect().ok());
    }

    static Table Inventory() {
        Table table;
        table.columns = {"product_id", "quantity_on_hand", "unit_cost", "bin"};
        table.rows = {
            {"P1", "10", "2.5", "007"},
            {"P2", "0", "4", "A-12"},
            {"P3", std::nullopt, "1.25", std::nullopt},
        };
        return table;
    }

    std::unique_ptr<SqliteStore> store_;
};

TEST_F(SqliteStoreTest, BackendName) {
    EXPECT_EQ(store_->BackendName(), "sqlite");
    EXPECT_TRUE(store_->IsConnected());
}

TEST_F(SqliteStoreTest, ReplaceTableInfersColumnTypes) {
    ASSERT_TRUE(store_->ReplaceTable("inventory", Inventory()).ok());

    auto columns = store_->DescribeTable("inventory");
    ASSERT_TRUE(columns.ok()) << columns.status().message();
    ASSERT_EQ(columns->size(), 4);
    EXPECT_EQ((*columns)[0].type, "TEXT");
    EXPECT_EQ((*columns)[1].type, "INTEGER");
    EXPECT_EQ((*columns)[2].type, "REAL");
    EXPECT_EQ((*columns)[3].type, "TEXT");
}

TEST_F(SqliteStoreTest, LeadingZeroCodesStayText) {
    ASSERT_TRUE(store_->ReplaceTable("inventory", Inventory()).ok());

    auto result = store_->Query("SELECT bin FROM inventory WHERE product_id = ?",
                                {QueryParam::Text("P1")});
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->table.rows.size(), 1);
    EXPECT_EQ(result->table.rows[0][0], "007");
}

TEST_F(SqliteStoreTest, QueryWithParameters) {
    ASSERT_TRUE(store_->ReplaceTable("inventory", Inventory()).ok());

    auto result = store_->Query(
        "SELECT product_id, unit_cost FROM inventory WHERE unit_cost > ? ORDER BY product_id",
        {QueryParam::Real(2.0)});
    ASSERT_TRUE(result.ok()) << result.status().message();

    ASSERT_EQ(result->table.rows.size(), 2);
    EXPECT_EQ(result->table.rows[0][0], "P1");
    EXPECT_EQ(result->table.rows[0][1], "2.5");
    EXPECT_EQ(result->table.rows[1][1], "4");
    EXPECT_EQ(result->total_rows, 2);
}

TEST_F(SqliteStoreTest, NullsRoundTrip) {
    ASSERT_TRUE(store_->ReplaceTable("inventory", Inventory()).ok());

    auto result = store_->Query("SELECT quantity_on_hand FROM inventory WHERE product_id = 'P3'");
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result->table.rows[0][0].has_value());
}

TEST_F(SqliteStoreTest, ParameterCountMismatch) {
    ASSERT_TRUE(store_->ReplaceTable("inventory", Inventory()).ok());

    auto result = store_->Query("SELECT * FROM inventory WHERE product_id = ?");
    EXPECT_FALSE(result.ok());
}

TEST_F(SqliteStoreTest, ReplaceTableReplacesContents) {
    ASSERT_TRUE(store_->ReplaceTable("inventory", Inventory()).ok());

    Table smaller;
    smaller.columns = {"product_id"};
    smaller.rows = {{"Z9"}};
    ASSERT_TRUE(store_->ReplaceTable("inventory", smaller).ok());

    auto count = store_->CountRows("inventory");
    ASSERT_TRUE(count.ok());
    EXPECT_EQ(*count, 1);
    auto columns = store_->DescribeTable("inventory");
    ASSERT_TRUE(columns.ok());
    EXPECT_EQ(columns->size(), 1);
}

TEST_F(SqliteStoreTest, ReplaceTableRejectsBadIdentifiers) {
    Table table;
    table.columns = {"a"};
    EXPECT_EQ(store_->ReplaceTable("bad name", table).code(), absl::StatusCode::kInvalidArgument);

    table.columns = {"qty", "QTY"};
    EXPECT_EQ(store_->ReplaceTable("sales", table).code(), absl::StatusCode::kInvalidArgument);

    table.columns = {};
    EXPECT_EQ(store_->ReplaceTable("sales", table).code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(SqliteStoreTest, ListAndHasTables) {
    ASSERT_TRUE(store_->ReplaceTable("suppliers", Inventory()).ok());
    ASSERT_TRUE(store_->ReplaceTable("inventory", Inventory()).ok());

    auto tables = store_->ListTables();
    ASSERT_TRUE(tables.ok());
    ASSERT_EQ(tables->size(), 2);
    EXPECT_EQ((*tables)[0], "inventory");
    EXPECT_EQ((*tables)[1], "suppliers");

    EXPECT_TRUE(*store_->HasTable("inventory"));
    EXPECT_FALSE(*store_->HasTable("customers"));
}

TEST_F(SqliteStoreTest, QueryReadOnlyCapsRows) {
    ASSERT_TRUE(store_->ReplaceTable("inventory", Inventory()).ok());

    auto result = store_->QueryReadOnly("SELECT * FROM inventory", 2);
    ASSERT_TRUE(result.ok()) << result.status().message();
    EXPECT_EQ(result->table.rows.size(), 2);
    EXPECT_EQ(result->total_rows, 3);
}

TEST_F(SqliteStoreTest, QueryReadOnlyRejectsWrites) {
    ASSERT_TRUE(store_->ReplaceTable("inventory", Inventory()).ok());

    auto result = store_->QueryReadOnly("DELETE FROM inventory", 100);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);

    auto count = store_->CountRows("inventory");
    ASSERT_TRUE(count.ok());
    EXPECT_EQ(*count, 3);
}

TEST_F(SqliteStoreTest, QueryReadOnlyRejectsMultipleStatements) {
    ASSERT_TRUE(store_->ReplaceTable("inventory", Inventory()).ok());

    auto result = store_->QueryReadOnly("SELECT 1; SELECT 2", 100);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);

    EXPECT_TRUE(store_->QueryReadOnly("SELECT 1;", 100).ok());
}

TEST_F(SqliteStoreTest, UploadHistoryNewestFirst) {
    auto empty = store_->UploadHistory();
    ASSERT_TRUE(empty.ok());
    EXPECT_TRUE(empty->empty());

    UploadRecord first;
    first.category = "inventory";
    first.filename = "inventory.csv";
    first.row_count = 3;
    auto recorded = store_->RecordUpload(first);
    ASSERT_TRUE(recorded.ok()) << recorded.status().message();
    EXPECT_GT(recorded->id, 0);
    EXPECT_FALSE(recorded->uploaded_at.empty());

    UploadRecord second = first;
    second.category = "suppliers";
    second.filename = "suppliers.csv";
    second.uploaded_at = recorded->uploaded_at;
    ASSERT_TRUE(store_->RecordUpload(second).ok());

    auto history = store_->UploadHistory();
    ASSERT_TRUE(history.ok());
    ASSERT_EQ(history->size(), 2);
    EXPECT_EQ((*history)[0].category, "suppliers");
    EXPECT_EQ((*history)[1].category, "inventory");
    EXPECT_EQ((*history)[1].row_count, 3);
    EXPECT_EQ((*history)[1].status, "success");
}

TEST_F(SqliteStoreTest, SeparateMemoryStoresAreIsolated) {
    ASSERT_TRUE(store_->ReplaceTable("inventory", Inventory()).ok());

    SqliteConfig config;
    config.path = ":memory:";
    SqliteStore other(config);
    ASSERT_TRUE(other.Connect().ok());
    EXPECT_FALSE(*other.HasTable("inventory"));
    EXPECT_TRUE(other.Disconnect().ok());
}

TEST(SqliteStoreDisconnectedTest, CallsFailBeforeConnect) {
    SqliteConfig config;
    config.path = ":memory:";
    SqliteStore store(config);

    auto result = store.ListTables();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kFailedPrecondition);
}

}  // namespace
}  // namespace wcopt::storage
