/// @file catalog_test.cpp
/// @brief Tests for analysis dispatch, response codes and call metrics

#include "query/catalog.h"

#include <set>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/metrics.h"
#include "support/store_fixture.h"

namespace wcopt::query {
namespace {

using json = nlohmann::json;

class AnalysisCatalogTest : public test::StoreFixture {
protected:
    void SetUp() override {
        StoreFixture::SetUp();
        catalog_ = std::make_unique<AnalysisCatalog>(store(), graph_, config_, metrics_);
    }

    void LoadSuppliers() {
        Load("suppliers", {"supplier_id", "supplier_name", "avg_lead_time_days", "rating"},
             {
                 {"S1", "Acme", "20", "4.5"},
                 {"S2", "Beta", "40", "3"},
             });
        Load("purchase_orders", {"supplier_id", "product_id", "po_number", "total_po_value"},
             {
                 {"S1", "P1", "PO-1", "500"},
                 {"S2", "P2", "PO-2", "100"},
             });
    }

    int64_t Calls(std::string_view analysis) const {
        return metrics_.CounterValue(LabeledName("analysis_calls_total", "analysis", analysis));
    }

    MetricsRegistry metrics_;
    std::unique_ptr<AnalysisCatalog> catalog_;
};

TEST_F(AnalysisCatalogTest, ListsEveryAnalysisOnce) {
    const auto& analyses = catalog_->List();
    EXPECT_EQ(analyses.size(), 42u);

    std::set<std::string> names;
    for (const auto& info : analyses) {
        EXPECT_TRUE(names.insert(info.name).second) << info.name;
        EXPECT_FALSE(info.description.empty()) << info.name;
    }
    for (const char* name : {"get_full_dashboard", "calculate_safety_stock", "calculate_eoq",
                             "simulate_ccc_improvement", "forecast_demand",
                             "ripple_effect_analysis", "run_sql_query"}) {
        EXPECT_EQ(names.count(name), 1u) << name;
    }
}

TEST_F(AnalysisCatalogTest, FindByName) {
    const AnalysisInfo* info = catalog_->Find("get_pareto_analysis");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->group, "cash_cycle");
    EXPECT_EQ(catalog_->Find("get_everything"), nullptr);
}

TEST_F(AnalysisCatalogTest, DescribeListsParametersAndDatasets) {
    json described = DescribeAnalysis(*catalog_->Find("get_pareto_analysis"));
    EXPECT_EQ(described["name"], "get_pareto_analysis");
    const json& dimension = described["parameters"]["dimension"];
    EXPECT_EQ(dimension["type"], "string");
    EXPECT_EQ(dimension["default"], "revenue");
    EXPECT_EQ(dimension["enum"], json({"revenue", "inventory_value", "quantity"}));
    EXPECT_FALSE(dimension["required"].get<bool>());

    json forecast = DescribeAnalysis(*catalog_->Find("forecast_demand"));
    EXPECT_TRUE(forecast["parameters"]["sku"]["required"].get<bool>());
    EXPECT_EQ(forecast["parameters"]["window"]["minimum"], 1.0);
    EXPECT_EQ(forecast["datasets"], json::array({"sales_transactions"}));
}

TEST_F(AnalysisCatalogTest, UnknownAnalysisIsBadRequest) {
    auto response = catalog_->Run("get_everything", json::object());
    EXPECT_EQ(response.status_code, 400);
    EXPECT_EQ(response.body["error"], "Unknown analysis 'get_everything'");
    EXPECT_EQ(Calls("get_everything"), 0);
}

TEST_F(AnalysisCatalogTest, InvalidParametersAreBadRequest) {
    auto missing = catalog_->Run("forecast_demand", json::object());
    EXPECT_EQ(missing.status_code, 400);
    EXPECT_EQ(missing.body["error"], "Missing required parameter 'sku'");

    auto choice = catalog_->Run("get_revenue_trends", json{{"granularity", "hourly"}});
    EXPECT_EQ(choice.status_code, 400);

    auto range = catalog_->Run("get_top_skus", json{{"limit", 0}});
    EXPECT_EQ(range.status_code, 400);
    EXPECT_EQ(Calls("get_top_skus"), 1);
}

TEST_F(AnalysisCatalogTest, InsufficientDataIsReportedWithStatusOk) {
    auto response = catalog_->Run("get_reorder_alerts", json::object());
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.body["missing_datasets"], json::array({"inventory_snapshot"}));
    EXPECT_TRUE(response.body["message"].is_string());

    EXPECT_EQ(Calls("get_reorder_alerts"), 1);
    EXPECT_EQ(metrics_.CounterValue(LabeledName("analysis_insufficient_data_total", "analysis",
                                                "get_reorder_alerts")),
              1);
    EXPECT_EQ(metrics_.GetHistogram("analysis_latency_ms_get_reorder_alerts").Count(), 1);
}

TEST_F(AnalysisCatalogTest, NotFoundIsReportedAs404) {
    LoadSuppliers();
    auto response = catalog_->Run("ripple_effect_analysis", json{{"supplier_id", "S9"}});
    EXPECT_EQ(response.status_code, 404);
    EXPECT_EQ(response.body["message"], "Supplier 'S9' not found.");
}

TEST_F(AnalysisCatalogTest, GraphFallbackIsCounted) {
    LoadSuppliers();
    auto response = catalog_->Run("get_supplier_network", json::object());
    ASSERT_EQ(response.status_code, 200) << response.body.dump();
    EXPECT_EQ(response.body["source"], "tabular");
    EXPECT_EQ(response.body["relationships"], 2);
    EXPECT_EQ(metrics_.CounterValue(
                  LabeledName("graph_fallbacks_total", "analysis", "get_supplier_network")),
              1);
}

TEST_F(AnalysisCatalogTest, SuccessfulAnalysisRendersRecord) {
    LoadSuppliers();
    auto response = catalog_->Run("get_supplier_concentration", nullptr);
    ASSERT_EQ(response.status_code, 200);
    EXPECT_FALSE(response.body.contains("missing_datasets"));
    EXPECT_EQ(metrics_.CounterValue(LabeledName("analysis_insufficient_data_total", "analysis",
                                                "get_supplier_concentration")),
              0);
}

TEST_F(AnalysisCatalogTest, SqlQueriesAreScreenedAndCounted) {
    LoadSuppliers();
    auto ok = catalog_->Run("run_sql_query",
                            json{{"sql", "SELECT supplier_id FROM suppliers ORDER BY 1"}});
    ASSERT_EQ(ok.status_code, 200) << ok.body.dump();
    EXPECT_EQ(ok.body["rows"], 2);
    EXPECT_EQ(ok.body["columns"], json::array({"supplier_id"}));
    EXPECT_EQ(ok.body["data"][0]["supplier_id"], "S1");

    auto blocked = catalog_->Run("run_sql_query",
                                 json{{"sql", "select 1; Drop Table suppliers"}});
    EXPECT_EQ(blocked.status_code, 400);
    EXPECT_EQ(blocked.body["error"], "Write operations blocked: DROP");
    EXPECT_EQ(metrics_.CounterValue("blocked_queries_total"), 1);

    auto still_there = catalog_->Run("run_sql_query",
                                     json{{"sql", "SELECT COUNT(*) AS n FROM suppliers"}});
    ASSERT_EQ(still_there.status_code, 200);
    EXPECT_EQ(still_there.body["data"][0]["n"], 2);
    EXPECT_EQ(Calls("run_sql_query"), 3);
}

TEST_F(AnalysisCatalogTest, StoreFailureIsServerError) {
    ASSERT_TRUE(store().Disconnect().ok());
    auto response = catalog_->Run("list_uploads", json::object());
    EXPECT_EQ(response.status_code, 500);
    EXPECT_EQ(metrics_.CounterValue(
                  LabeledName("analysis_errors_total", "analysis", "list_uploads")),
              1);
    ASSERT_TRUE(store().Connect().ok());
}

TEST_F(AnalysisCatalogTest, ExportedMetricsNameTheAnalysis) {
    catalog_->Run("list_uploads", json::object());
    EXPECT_THAT(metrics_.ExportText(),
                ::testing::HasSubstr("analysis_calls_total{analysis=\"list_uploads\"}"));
}

}  // namespace
}  // namespace wcopt::query
