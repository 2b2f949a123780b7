/// @file demand_test.cpp
/// @brief Tests for forecasting, anomaly detection and sales analytics

#include "engine/demand.h"

#include <gtest/gtest.h>

#include "support/store_fixture.h"

namespace wcopt::engine {
namespace {

using test::Value;

// =============================================================================
// Free functions
// =============================================================================

TEST(ForecastSeriesTest, IncreasingTrend) {
    std::vector<double> daily;
    for (int i = 1; i <= 14; ++i) {
        daily.push_back(i);
    }
    auto forecast = ForecastSeries(daily, 7);
    EXPECT_EQ(forecast.window, 7);
    EXPECT_DOUBLE_EQ(forecast.moving_average, 11.0);
    EXPECT_EQ(forecast.trend, "increasing");
}

TEST(ForecastSeriesTest, DecreasingTrend) {
    auto forecast = ForecastSeries({10, 10, 5, 5}, 2);
    EXPECT_DOUBLE_EQ(forecast.moving_average, 5.0);
    EXPECT_EQ(forecast.trend, "decreasing");
}

TEST(ForecastSeriesTest, WindowShrinksToHistory) {
    auto forecast = ForecastSeries({3, 6, 9}, 7);
    EXPECT_EQ(forecast.window, 3);
    EXPECT_DOUBLE_EQ(forecast.moving_average, 6.0);
    EXPECT_EQ(forecast.trend, "stable");
}

TEST(ForecastSeriesTest, SmallChangeIsStable) {
    auto forecast = ForecastSeries({10, 10, 10.5, 10.5}, 2);
    EXPECT_EQ(forecast.trend, "stable");
}

TEST(GranularityTest, ParseAndName) {
    EXPECT_EQ(ParseGranularity("weekly"), Granularity::kWeekly);
    EXPECT_EQ(ParseGranularity("monthly"), Granularity::kMonthly);
    EXPECT_EQ(ParseGranularity("daily"), Granularity::kDaily);
    EXPECT_FALSE(ParseGranularity("yearly").has_value());
    EXPECT_EQ(GranularityName(Granularity::kWeekly), "weekly");
}

TEST(GranularityTest, PeriodStart) {
    EXPECT_EQ(PeriodStart(absl::CivilDay(2024, 6, 30), Granularity::kWeekly),
              absl::CivilDay(2024, 6, 24));
    EXPECT_EQ(PeriodStart(absl::CivilDay(2024, 6, 24), Granularity::kWeekly),
              absl::CivilDay(2024, 6, 24));
    EXPECT_EQ(PeriodStart(absl::CivilDay(2024, 6, 30), Granularity::kMonthly),
              absl::CivilDay(2024, 6, 1));
    EXPECT_EQ(PeriodStart(absl::CivilDay(2024, 6, 30), Granularity::kDaily),
              absl::CivilDay(2024, 6, 30));
}

TEST(ConcentrationRiskTest, Levels) {
    EXPECT_EQ(ConcentrationRisk(80.1), "high");
    EXPECT_EQ(ConcentrationRisk(80.0), "medium");
    EXPECT_EQ(ConcentrationRisk(50.0), "low");
}

// =============================================================================
// DemandEngine
// =============================================================================

class DemandEngineTest : public test::StoreFixture {
protected:
    void LoadSales() {
        Load("sales_transactions",
             {"product_id", "transaction_date", "qty_sold", "total_revenue", "customer_id",
              "gross_profit"},
             {
                 {"P1", "2024-05-10", "4", "100", "C1", "20"},
                 {"P1", "2024-06-03", "6", "150", "C1", "30"},
                 {"P1", "2024-06-04", "8", "350", "C2", std::nullopt},
                 {"P2", "2024-06-04", "1", "200", std::nullopt, std::nullopt},
                 {"P2", "2024-06-05", "1", "100", "C1", std::nullopt},
             });
    }

    DemandEngine Engine() { return DemandEngine(store(), config_); }
};

TEST_F(DemandEngineTest, ForecastAggregatesPerDay) {
    LoadSales();
    auto outcome = Engine().Forecast("P1", 10, 7);
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    const auto& forecast = Value<DemandForecast>(*outcome);
    EXPECT_EQ(forecast.historical_days, 3u);
    EXPECT_EQ(forecast.window, 3);
    EXPECT_DOUBLE_EQ(forecast.moving_average, 6.0);
    EXPECT_EQ(forecast.horizon_days, 10);
    EXPECT_DOUBLE_EQ(forecast.total_predicted, 60.0);
}

TEST_F(DemandEngineTest, ForecastUnknownSkuIsNotFound) {
    LoadSales();
    auto outcome = Engine().Forecast("P404", std::nullopt, std::nullopt);
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    EXPECT_EQ(Value<NotFound>(*outcome).message, "No sales for 'P404'.");
}

TEST_F(DemandEngineTest, ForecastNeedsSales) {
    auto outcome = Engine().Forecast("P1", std::nullopt, std::nullopt);
    ASSERT_TRUE(outcome.ok());
    EXPECT_TRUE(std::holds_alternative<InsufficientData>(*outcome));
}

TEST_F(DemandEngineTest, ForecastRejectsBadArguments) {
    auto engine = Engine();
    EXPECT_EQ(engine.Forecast("", std::nullopt, std::nullopt).status().code(),
              absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(engine.Forecast("P1", 0, std::nullopt).status().code(),
              absl::StatusCode::kInvalidArgument);
}

TEST_F(DemandEngineTest, DetectAnomaliesFlagsOutlier) {
    std::vector<storage::Row> rows;
    for (int i = 0; i < 9; ++i) {
        rows.push_back({"P" + std::to_string(i), "2024-06-01", "10", "100"});
    }
    rows.push_back({"P9", "2024-06-01", "100", "1000"});
    Load("sales_transactions", {"product_id", "transaction_date", "qty_sold", "total_revenue"},
         std::move(rows));

    auto outcome = Engine().DetectAnomalies("sales_transactions", "qty_sold", std::nullopt);
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    const auto& report = Value<AnomalyReport>(*outcome);
    EXPECT_EQ(report.total_rows, 10u);
    EXPECT_DOUBLE_EQ(report.mean, 19.0);
    EXPECT_DOUBLE_EQ(report.stddev, 27.0);
    ASSERT_EQ(report.anomalies_found, 1u);
    EXPECT_DOUBLE_EQ(report.anomalies[0].z_score, 3.0);
    ASSERT_EQ(report.columns[0], "product_id");
    EXPECT_EQ(report.anomalies[0].row[0], "P9");
}

TEST_F(DemandEngineTest, DetectAnomaliesValidatesTarget) {
    LoadSales();
    auto engine = Engine();
    EXPECT_EQ(engine.DetectAnomalies("orders", "qty_sold", std::nullopt).status().code(),
              absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(engine.DetectAnomalies("sales_transactions", "qty; drop", std::nullopt)
                  .status()
                  .code(),
              absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(engine.DetectAnomalies("sales_transactions", "margin", std::nullopt).status().code(),
              absl::StatusCode::kInvalidArgument);
}

TEST_F(DemandEngineTest, DetectAnomaliesOnFlatSeriesFindsNone) {
    Load("sales_transactions", {"product_id", "transaction_date", "qty_sold", "total_revenue"},
         {{"P1", "2024-06-01", "5", "50"}, {"P2", "2024-06-01", "5", "50"}});
    auto outcome = Engine().DetectAnomalies("sales_transactions", "qty_sold", 1.0);
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    EXPECT_EQ(Value<AnomalyReport>(*outcome).anomalies_found, 0u);
}

TEST_F(DemandEngineTest, MonthlyRevenueTrends) {
    LoadSales();
    auto outcome = Engine().GetRevenueTrends(Granularity::kMonthly);
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    const auto& trends = Value<RevenueTrends>(*outcome);
    EXPECT_EQ(trends.granularity, "monthly");
    ASSERT_EQ(trends.periods, 2u);
    EXPECT_EQ(trends.trends[0].period, "2024-05-01");
    EXPECT_FALSE(trends.trends[0].growth_pct.has_value());
    EXPECT_DOUBLE_EQ(trends.trends[1].revenue, 800.0);
    EXPECT_EQ(trends.trends[1].skus, 2u);
    EXPECT_EQ(trends.trends[1].growth_pct, 700.0);
}

TEST_F(DemandEngineTest, WeeklyRevenueTrendsStartOnMonday) {
    LoadSales();
    auto outcome = Engine().GetRevenueTrends(Granularity::kWeekly);
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    const auto& trends = Value<RevenueTrends>(*outcome);
    ASSERT_EQ(trends.periods, 2u);
    EXPECT_EQ(trends.trends[0].period, "2024-05-06");
    EXPECT_EQ(trends.trends[1].period, "2024-06-03");
}

TEST_F(DemandEngineTest, SalesVelocity) {
    LoadSales();
    auto outcome = Engine().GetSalesVelocity(10);
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    const auto& velocity = Value<SalesVelocity>(*outcome);
    ASSERT_EQ(velocity.count, 2u);
    EXPECT_EQ(velocity.fastest_movers[0].product_id, "P1");
    EXPECT_DOUBLE_EQ(velocity.fastest_movers[0].daily_velocity, 6.0);
    EXPECT_EQ(velocity.fastest_movers[1].sale_days, 2u);
}

TEST_F(DemandEngineTest, TopSkusReportProfitOnlyWhenRecorded) {
    LoadSales();
    auto outcome = Engine().GetTopSkus(10);
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    const auto& top = Value<TopSkus>(*outcome);
    ASSERT_EQ(top.count, 2u);
    EXPECT_EQ(top.top_skus[0].product_id, "P1");
    EXPECT_DOUBLE_EQ(top.top_skus[0].revenue, 600.0);
    EXPECT_EQ(top.top_skus[0].profit, 50.0);
    EXPECT_FALSE(top.top_skus[1].profit.has_value());
}

TEST_F(DemandEngineTest, CustomerConcentrationSkipsAnonymousSales) {
    LoadSales();
    Load("customers", {"customer_id", "customer_name"}, {{"C1", "Initech"}});
    auto outcome = Engine().GetCustomerConcentration(1);
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    const auto& result = Value<CustomerConcentration>(*outcome);
    ASSERT_EQ(result.top_customers.size(), 1u);
    EXPECT_EQ(result.top_customers[0].customer_id, "C1");
    EXPECT_EQ(result.top_customers[0].customer_name, "Initech");
    EXPECT_DOUBLE_EQ(result.top_customers[0].revenue, 350.0);
    EXPECT_DOUBLE_EQ(result.top_customers[0].revenue_pct, 50.0);
    EXPECT_EQ(result.top_customers[0].unique_products, 2u);
    EXPECT_DOUBLE_EQ(result.top_share_pct, 50.0);
    EXPECT_EQ(result.concentration_risk, "low");
}

TEST_F(DemandEngineTest, CustomerNameFallsBackToId) {
    LoadSales();
    Load("customers", {"customer_id", "customer_name"}, {{"C1", "Initech"}});
    auto outcome = Engine().GetCustomerConcentration(10);
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    const auto& result = Value<CustomerConcentration>(*outcome);
    ASSERT_EQ(result.top_customers.size(), 2u);
    EXPECT_EQ(result.top_customers[1].customer_id, "C2");
    EXPECT_EQ(result.top_customers[1].customer_name, "C2");
    EXPECT_DOUBLE_EQ(result.top_share_pct, 100.0);
    EXPECT_EQ(result.concentration_risk, "high");
}

TEST_F(DemandEngineTest, Seasonality) {
    LoadSales();
    auto outcome = Engine().GetSeasonality(std::nullopt);
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    const auto& seasonality = Value<Seasonality>(*outcome);
    ASSERT_EQ(seasonality.monthly_pattern.size(), 2u);
    EXPECT_EQ(seasonality.peak_month, 6);
    EXPECT_EQ(seasonality.low_month, 5);
    EXPECT_DOUBLE_EQ(seasonality.monthly_pattern[0].index_vs_avg, 0.4);
}

TEST_F(DemandEngineTest, SeasonalityForUnknownSkuIsNotFound) {
    LoadSales();
    auto outcome = Engine().GetSeasonality(std::string("P404"));
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    EXPECT_TRUE(std::holds_alternative<NotFound>(*outcome));
}

}  // namespace
}  // namespace wcopt::engine
