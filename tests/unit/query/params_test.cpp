/// @file params_test.cpp
/// @brief Tests for parameter binding against a schema

#include "query/params.h"

#include <gtest/gtest.h>

namespace wcopt::query {
namespace {

using json = nlohmann::json;

ParamSpec Spec(std::string name, ParamType type, json default_value = nullptr) {
    ParamSpec spec;
    spec.name = std::move(name);
    spec.type = type;
    spec.default_value = std::move(default_value);
    return spec;
}

class ParamsTest : public ::testing::Test {
protected:
    void SetUp() override {
        ParamSpec limit = Spec("limit", ParamType::kInteger, 20);
        limit.minimum = 1.0;
        ParamSpec level = Spec("service_level", ParamType::kNumber, 0.95);
        ParamSpec dimension = Spec("dimension", ParamType::kString, "revenue");
        dimension.choices = {"revenue", "inventory_value", "quantity"};
        ParamSpec skus = Spec("skus", ParamType::kArray);
        ParamSpec sku = Spec("sku", ParamType::kString);
        schema_ = {limit, level, dimension, skus, sku};
    }

    std::vector<ParamSpec> schema_;
};

TEST_F(ParamsTest, DefaultsFillMissingValues) {
    auto params = Params::Bind(schema_, json::object());
    ASSERT_TRUE(params.ok()) << params.status();
    EXPECT_EQ(params->Integer("limit"), 20);
    EXPECT_DOUBLE_EQ(*params->Number("service_level"), 0.95);
    EXPECT_EQ(params->String("dimension"), "revenue");
    EXPECT_FALSE(params->Has("sku"));
    EXPECT_EQ(params->String("sku"), std::nullopt);
    EXPECT_TRUE(params->StringList("skus").empty());
}

TEST_F(ParamsTest, NullInputBehavesLikeEmptyObject) {
    auto params = Params::Bind(schema_, nullptr);
    ASSERT_TRUE(params.ok());
    EXPECT_EQ(params->Count("limit", 5), 20u);
}

TEST_F(ParamsTest, ExplicitNullUsesDefault) {
    auto params = Params::Bind(schema_, json{{"limit", nullptr}});
    ASSERT_TRUE(params.ok());
    EXPECT_EQ(params->Integer("limit"), 20);
}

TEST_F(ParamsTest, GivenValuesAreKept) {
    auto params = Params::Bind(schema_, json{{"limit", 7},
                                             {"service_level", 0.99},
                                             {"dimension", "quantity"},
                                             {"skus", {"P1", "P2"}},
                                             {"sku", "P9"}});
    ASSERT_TRUE(params.ok()) << params.status();
    EXPECT_EQ(params->Count("limit", 20), 7u);
    EXPECT_DOUBLE_EQ(*params->Number("service_level"), 0.99);
    EXPECT_EQ(params->String("dimension"), "quantity");
    EXPECT_EQ(params->StringList("skus"), (std::vector<std::string>{"P1", "P2"}));
    EXPECT_EQ(params->String("sku"), "P9");
}

TEST_F(ParamsTest, WholeFloatIsAcceptedAsInteger) {
    auto params = Params::Bind(schema_, json{{"limit", 3.0}});
    ASSERT_TRUE(params.ok());
    EXPECT_EQ(params->Integer("limit"), 3);
    EXPECT_TRUE(params->Values()["limit"].is_number_integer());
}

TEST_F(ParamsTest, IntegerIsAcceptedAsNumber) {
    auto params = Params::Bind(schema_, json{{"service_level", 1}});
    ASSERT_TRUE(params.ok());
    EXPECT_DOUBLE_EQ(*params->Number("service_level"), 1.0);
}

TEST_F(ParamsTest, TypeMismatchIsRejected) {
    auto fractional = Params::Bind(schema_, json{{"limit", 2.5}});
    ASSERT_FALSE(fractional.ok());
    EXPECT_EQ(fractional.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(fractional.status().message(), "Parameter 'limit' must be of type integer");

    EXPECT_FALSE(Params::Bind(schema_, json{{"limit", "10"}}).ok());
    EXPECT_FALSE(Params::Bind(schema_, json{{"service_level", "high"}}).ok());
    EXPECT_FALSE(Params::Bind(schema_, json{{"sku", 42}}).ok());
    EXPECT_FALSE(Params::Bind(schema_, json{{"skus", "P1"}}).ok());
}

TEST_F(ParamsTest, ArrayMustHoldStrings) {
    auto params = Params::Bind(schema_, json{{"skus", {"P1", 2}}});
    ASSERT_FALSE(params.ok());
    EXPECT_EQ(params.status().message(), "Parameter 'skus' must be an array of strings");
}

TEST_F(ParamsTest, ChoicesAreEnforced) {
    auto params = Params::Bind(schema_, json{{"dimension", "margin"}});
    ASSERT_FALSE(params.ok());
    EXPECT_EQ(params.status().message(),
              "Parameter 'dimension' must be one of: revenue, inventory_value, quantity");
}

TEST_F(ParamsTest, MinimumIsEnforced) {
    auto params = Params::Bind(schema_, json{{"limit", 0}});
    ASSERT_FALSE(params.ok());
    EXPECT_EQ(params.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_TRUE(Params::Bind(schema_, json{{"limit", 1}}).ok());
}

TEST_F(ParamsTest, RequiredParameterMustBeGiven) {
    schema_[4].required = true;
    auto params = Params::Bind(schema_, json{{"limit", 5}});
    ASSERT_FALSE(params.ok());
    EXPECT_EQ(params.status().message(), "Missing required parameter 'sku'");

    auto null_given = Params::Bind(schema_, json{{"sku", nullptr}});
    EXPECT_FALSE(null_given.ok());
}

TEST_F(ParamsTest, UnknownKeysAreDropped) {
    auto params = Params::Bind(schema_, json{{"limit", 4}, {"verbose", true}});
    ASSERT_TRUE(params.ok());
    EXPECT_FALSE(params->Values().contains("verbose"));
    EXPECT_FALSE(params->Has("verbose"));
}

TEST_F(ParamsTest, NonObjectInputIsRejected) {
    auto params = Params::Bind(schema_, json::array({1, 2}));
    ASSERT_FALSE(params.ok());
    EXPECT_EQ(params.status().message(), "Parameters must be a JSON object");
    EXPECT_FALSE(Params::Bind(schema_, "limit=5").ok());
}

TEST_F(ParamsTest, CountFallsBackForMissingValues) {
    auto params = Params::Bind({Spec("limit", ParamType::kInteger)}, json::object());
    ASSERT_TRUE(params.ok());
    EXPECT_EQ(params->Count("limit", 50), 50u);
}

TEST(ParamTypeNameTest, Names) {
    EXPECT_EQ(ParamTypeName(ParamType::kInteger), "integer");
    EXPECT_EQ(ParamTypeName(ParamType::kNumber), "number");
    EXPECT_EQ(ParamTypeName(ParamType::kString), "string");
    EXPECT_EQ(ParamTypeName(ParamType::kArray), "array");
}

}  // namespace
}  // namespace wcopt::query
