/// @file serialization_test.cpp
/// @brief Tests for cell conversion and response rendering

#include "query/serialization.h"

#include <string>

#include <gtest/gtest.h>

#include "common/metrics.h"
#include "query/catalog.h"
#include "support/store_fixture.h"

namespace wcopt::query {
namespace {

using json = nlohmann::json;

TEST(CellToJsonTest, NumbersTextAndNull) {
    EXPECT_TRUE(CellToJson(std::nullopt).is_null());
    EXPECT_EQ(CellToJson(std::string("42")), 42);
    EXPECT_DOUBLE_EQ(CellToJson(std::string("2.5")).get<double>(), 2.5);
    EXPECT_EQ(CellToJson(std::string("P1")), "P1");
}

TEST(RenderJsonTest, IndentsByDefault) {
    EXPECT_EQ(RenderJson(json{{"a", 1}}), "{\n  \"a\": 1\n}");
    EXPECT_EQ(RenderJson(json{{"a", 1}}, -1), "{\"a\":1}");
}

TEST(RenderJsonTest, InvalidUtf8IsReplaced) {
    json row = RowToJson({"supplier_name"}, {std::string("Caf\xE9")});
    std::string rendered;
    ASSERT_NO_THROW(rendered = RenderJson(row, -1));
    EXPECT_EQ(rendered, "{\"supplier_name\":\"Caf\xEF\xBF\xBD\"}");
}

class RenderResponseTest : public test::StoreFixture {};

TEST_F(RenderResponseTest, QueryResultWithLatin1CellRenders) {
    Load("suppliers", {"supplier_id", "supplier_name"}, {{"S1", std::string("M\xFCller GmbH")}});
    MetricsRegistry metrics;
    AnalysisCatalog catalog(store(), graph_, config_, metrics);

    auto response = catalog.Run("run_sql_query",
                                json{{"sql", "SELECT supplier_name FROM suppliers"}});
    ASSERT_EQ(response.status_code, 200);
    std::string rendered;
    ASSERT_NO_THROW(rendered = RenderJson(response.body));
    EXPECT_NE(rendered.find("M\xEF\xBF\xBDller GmbH"), std::string::npos);
}

}  // namespace
}  // namespace wcopt::query
