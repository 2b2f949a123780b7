/// @file overview_test.cpp
/// @brief Tests for the dashboard, data quality and dataset inventory

#include "engine/overview.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "support/mock_graph_store.h"
#include "support/store_fixture.h"

namespace wcopt::engine {
namespace {

using test::Value;
using ::testing::HasSubstr;
using ::testing::NiceMock;

TEST(QualityScoreTest, Penalties) {
    EXPECT_EQ(QualityScore(0, 0), 100);
    EXPECT_EQ(QualityScore(2, 3), 84);
    EXPECT_EQ(QualityScore(0, 50), 80);
    EXPECT_EQ(QualityScore(30, 0), 0);
}

class OverviewEngineTest : public test::StoreFixture {
protected:
    void LoadSales() {
        Load("sales_transactions",
             {"product_id", "transaction_date", "qty_sold", "total_revenue", "total_cost"},
             {
                 {"P1", "2024-06-01", "2", "20", "12"},
                 {"P2", "2024-06-01", "1", "15", std::nullopt},
                 {"P1", "2024-06-02", "1", "10", "6"},
             });
    }

    void LoadInventory() {
        Load("inventory_snapshot",
             {"product_id", "snapshot_date", "qty_on_hand", "reorder_point", "unit_cost",
              "stock_status"},
             {
                 {"P1", "2024-06-30", "10", "5", "2", "normal"},
                 {"P2", "2024-06-30", "0", "5", "3", "STOCKOUT"},
                 {"P3", "2024-06-30", "90", "5", "1", "overstock"},
             });
    }

    void LoadProducts() {
        Load("products", {"product_id", "product_name", "category", "abc_class"},
             {
                 {"P3", "Gasket", "parts", "C"},
                 {"P1", "Bolt", "parts", "A"},
                 {"P2", "Drill", "tools", "A"},
                 {"P4", "Nut", "parts", "B"},
                 {"P5", "Saw", "tools", "B"},
                 {"P6", "Vice", "tools", "C"},
             });
    }

    OverviewEngine Engine() { return OverviewEngine(store(), graph_); }
};

TEST_F(OverviewEngineTest, EmptyDashboardListsEveryDataset) {
    auto outcome = Engine().GetDashboard();
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    const auto& none = Value<InsufficientData>(*outcome);
    EXPECT_EQ(none.message, "No data uploaded yet.");
    EXPECT_EQ(none.missing.size(), 9u);
    EXPECT_EQ(none.missing.front(), "products");
    EXPECT_EQ(none.missing.back(), "shipments");
}

TEST_F(OverviewEngineTest, DashboardHasOneSectionPerDataset) {
    LoadSales();
    LoadInventory();
    auto outcome = Engine().GetDashboard();
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    const auto& dashboard = Value<Dashboard>(*outcome);

    ASSERT_TRUE(dashboard.revenue.has_value());
    EXPECT_DOUBLE_EQ(dashboard.revenue->total_revenue, 45.0);
    EXPECT_DOUBLE_EQ(dashboard.revenue->total_cost, 18.0);
    EXPECT_EQ(dashboard.revenue->transactions, 3u);
    EXPECT_EQ(dashboard.revenue->unique_products, 2u);

    ASSERT_TRUE(dashboard.inventory.has_value());
    EXPECT_EQ(dashboard.inventory->unique_skus, 3u);
    EXPECT_DOUBLE_EQ(dashboard.inventory->total_units, 100.0);
    EXPECT_DOUBLE_EQ(dashboard.inventory->total_value, 110.0);
    EXPECT_EQ(dashboard.inventory->stockouts, 1u);
    EXPECT_EQ(dashboard.inventory->overstocked, 1u);

    EXPECT_FALSE(dashboard.suppliers.has_value());
    EXPECT_FALSE(dashboard.ar.has_value());
}

TEST_F(OverviewEngineTest, DataQualityCountsNullsAndDuplicates) {
    Load("customers", {"customer_id", "customer_name", "segment"},
         {
             {"C1", "Initech", "smb"},
             {"C1", "Initech", "smb"},
             {"C2", std::nullopt, " "},
         });
    auto outcome = Engine().GetDataQualityReport();
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    const auto& report = Value<DataQualityReport>(*outcome);
    ASSERT_EQ(report.tables.size(), 1u);
    const auto& quality = report.tables[0];
    EXPECT_EQ(quality.table, "customers");
    EXPECT_EQ(quality.rows, 3u);
    EXPECT_EQ(quality.duplicate_rows, 1u);
    EXPECT_EQ(quality.null_counts.at("customer_name"), 1u);
    EXPECT_EQ(quality.null_counts.at("segment"), 1u);
    EXPECT_EQ(quality.null_counts.count("customer_id"), 0u);
    EXPECT_EQ(quality.quality_score, 88);
}

TEST_F(OverviewEngineTest, ListUploadsCoversAllCategories) {
    LoadSales();
    Load("suppliers", {"supplier_id", "supplier_name"}, {{"S1", "Acme"}});
    auto listing = Engine().ListUploads();
    ASSERT_TRUE(listing.ok()) << listing.status();
    ASSERT_EQ(listing->files.size(), 9u);
    for (const auto& file : listing->files) {
        if (file.category == "sales_transactions") {
            EXPECT_EQ(file.status, "uploaded");
            EXPECT_EQ(file.rows, 3u);
            EXPECT_EQ(file.destination, "tabular");
        } else if (file.category == "suppliers") {
            EXPECT_EQ(file.destination, "tabular + graph");
        } else {
            EXPECT_EQ(file.status, "not_uploaded");
            EXPECT_FALSE(file.rows.has_value());
        }
    }
}

TEST_F(OverviewEngineTest, SchemaInfoSamplesFiveRows) {
    LoadProducts();
    auto outcome = Engine().GetSchemaInfo("products");
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    const auto& info = Value<SchemaInfo>(*outcome);
    EXPECT_EQ(info.rows, 6u);
    ASSERT_EQ(info.columns.size(), 4u);
    EXPECT_EQ(info.columns[0].name, "product_id");
    EXPECT_EQ(info.sample.rows.size(), 5u);
    EXPECT_EQ(info.sample.columns.size(), 4u);
}

TEST_F(OverviewEngineTest, SchemaInfoRejectsUnknownTable) {
    auto outcome = Engine().GetSchemaInfo("sqlite_master");
    EXPECT_EQ(outcome.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_THAT(std::string(outcome.status().message()), HasSubstr("Valid tables"));

    auto missing = Engine().GetSchemaInfo("shipments");
    ASSERT_TRUE(missing.ok());
    EXPECT_TRUE(std::holds_alternative<InsufficientData>(*missing));
}

TEST_F(OverviewEngineTest, VersionHistoryFromUploadLog) {
    storage::UploadRecord record;
    record.category = "products";
    record.filename = "products.csv";
    record.row_count = 6;
    ASSERT_TRUE(store().RecordUpload(record).ok());

    auto outcome = Engine().GetVersionHistory();
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    const auto& history = Value<VersionHistory>(*outcome);
    EXPECT_EQ(history.total_uploads, 1u);
    EXPECT_EQ(history.history[0].filename, "products.csv");
    EXPECT_TRUE(history.tables.empty());
}

TEST_F(OverviewEngineTest, VersionHistoryFallsBackToTableCounts) {
    LoadSales();
    auto outcome = Engine().GetVersionHistory();
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    const auto& history = Value<VersionHistory>(*outcome);
    EXPECT_EQ(history.total_uploads, 0u);
    ASSERT_EQ(history.tables.size(), 1u);
    EXPECT_EQ(history.tables[0].category, "sales_transactions");
    EXPECT_EQ(history.tables[0].rows, 3u);

    ASSERT_TRUE(store().Disconnect().ok());
    ASSERT_TRUE(store().Connect().ok());
    auto empty = Engine().GetVersionHistory();
    ASSERT_TRUE(empty.ok()) << empty.status();
    EXPECT_TRUE(std::holds_alternative<InsufficientData>(*empty));
}

TEST_F(OverviewEngineTest, RefreshReportWithConnectedGraph) {
    LoadSales();
    auto report = Engine().GetRefreshReport();
    ASSERT_TRUE(report.ok()) << report.status();
    EXPECT_EQ(report->tabular_backend, "sqlite");
    ASSERT_EQ(report->tables.size(), 9u);
    EXPECT_EQ(report->graph.backend, "memory");
    EXPECT_EQ(report->graph.status, "connected");
    ASSERT_TRUE(report->graph.counts.has_value());
    for (const auto& table : report->tables) {
        if (table.table == "sales_transactions") {
            EXPECT_EQ(table.status, "ok");
            EXPECT_EQ(table.columns, 5u);
        } else {
            EXPECT_EQ(table.status, "not_loaded");
        }
    }
}

TEST_F(OverviewEngineTest, RefreshReportWithUnavailableGraph) {
    NiceMock<test::MockGraphStore> graph;
    test::FailEveryCall(graph);
    OverviewEngine engine(store(), graph);
    auto report = engine.GetRefreshReport();
    ASSERT_TRUE(report.ok()) << report.status();
    EXPECT_EQ(report->graph.backend, "mock");
    EXPECT_EQ(report->graph.status, "unavailable");
    EXPECT_EQ(report->graph.error, "connection refused");
    EXPECT_FALSE(report->graph.counts.has_value());
}

TEST_F(OverviewEngineTest, ShipmentTracking) {
    Load("shipments", {"shipment_id", "status", "qty_shipped", "freight_cost", "delay_days"},
         {
             {"SH1", "In Transit", "10", "100", "2"},
             {"SH2", "Delivered", "5", "50", std::nullopt},
             {"SH3", "In Transit", "20", "25.5", "4"},
         });
    auto outcome = Engine().GetShipmentTracking(std::nullopt);
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    const auto& tracking = Value<ShipmentTracking>(*outcome);
    ASSERT_EQ(tracking.summary.size(), 2u);
    EXPECT_EQ(tracking.summary[0].status, "Delivered");
    EXPECT_FALSE(tracking.summary[0].avg_delay.has_value());
    EXPECT_EQ(tracking.summary[1].count, 2u);
    EXPECT_DOUBLE_EQ(tracking.summary[1].total_qty, 30.0);
    EXPECT_DOUBLE_EQ(tracking.summary[1].total_freight, 125.5);
    EXPECT_EQ(tracking.summary[1].avg_delay, 3.0);
    EXPECT_EQ(tracking.in_transit.size(), 2u);

    auto filtered = Engine().GetShipmentTracking(std::string("Delivered"));
    ASSERT_TRUE(filtered.ok()) << filtered.status();
    const auto& delivered = Value<ShipmentTracking>(*filtered);
    ASSERT_EQ(delivered.summary.size(), 1u);
    EXPECT_TRUE(delivered.in_transit.empty());
}

TEST_F(OverviewEngineTest, ProductCatalogFilters) {
    LoadProducts();
    auto engine = Engine();

    auto all = engine.GetProductCatalog(std::nullopt, std::nullopt);
    ASSERT_TRUE(all.ok()) << all.status();
    const auto& everything = Value<ProductCatalog>(*all);
    EXPECT_EQ(everything.total, 6u);
    EXPECT_EQ(everything.products.rows[0][0], "P1");

    auto tools = engine.GetProductCatalog(std::string("tools"), std::string("B"));
    ASSERT_TRUE(tools.ok()) << tools.status();
    const auto& filtered = Value<ProductCatalog>(*tools);
    ASSERT_EQ(filtered.total, 1u);
    EXPECT_EQ(filtered.products.rows[0][0], "P5");

    auto injected = engine.GetProductCatalog(std::string("tools' OR '1'='1"), std::nullopt);
    ASSERT_TRUE(injected.ok()) << injected.status();
    EXPECT_EQ(Value<ProductCatalog>(*injected).total, 0u);
}

TEST_F(OverviewEngineTest, ProductCatalogFilterNeedsColumn) {
    Load("products", {"product_id"}, {{"P1"}});
    auto outcome = Engine().GetProductCatalog(std::nullopt, std::string("A"));
    EXPECT_EQ(outcome.status().code(), absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace wcopt::engine
