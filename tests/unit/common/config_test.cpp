/// @file config_test.cpp
/// @brief Tests for wcopt configuration loading

#include <cstdlib>
#include <string>

#include <gtest/gtest.h>

#include "common/config.h"

namespace wcopt {
namespace {

TEST(ConfigTest, LoadFromString) {
    const std::string yaml_content = R"(
tabular:
  backend: sqlite
  sqlite:
    path: /var/lib/wcopt/data.db
    busy_timeout_ms: 2500
engine:
  service_level: 0.98
  excluded_categories:
    - Packaging
    - Samples
logging:
  level: debug
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok()) << result.status().message();

    Config config = std::move(*result);

    EXPECT_EQ(config.GetString("tabular.backend"), "sqlite");
    EXPECT_EQ(config.GetString("tabular.sqlite.path"), "/var/lib/wcopt/data.db");
    EXPECT_EQ(config.GetInt("tabular.sqlite.busy_timeout_ms"), 2500);
    EXPECT_DOUBLE_EQ(config.GetDouble("engine.service_level"), 0.98);
    EXPECT_EQ(config.GetString("logging.level"), "debug");

    auto categories = config.GetStringList("engine.excluded_categories");
    ASSERT_EQ(categories.size(), 2);
    EXPECT_EQ(categories[0], "Packaging");
    EXPECT_EQ(categories[1], "Samples");
}

TEST(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.GetString("nonexistent.key", "default"), "default");
    EXPECT_EQ(config.GetInt("nonexistent.key", 42), 42);
    EXPECT_EQ(config.GetDouble("nonexistent.key", 3.14), 3.14);
    EXPECT_EQ(config.GetBool("nonexistent.key", true), true);
    EXPECT_TRUE(config.GetStringList("nonexistent.key").empty());
}

TEST(ConfigTest, MistypedValueFallsBackToDefault) {
    auto result = Config::LoadFromString("engine:\n  holding_cost_pct: lots\n");
    ASSERT_TRUE(result.ok());

    EXPECT_DOUBLE_EQ(result->GetDouble("engine.holding_cost_pct", 0.25), 0.25);
    EXPECT_EQ(result->GetString("engine.holding_cost_pct"), "lots");
}

TEST(ConfigTest, SetValues) {
    Config config;

    config.Set("graph.backend", std::string("memory"));
    config.Set("graph.falkordb.port", static_cast<int64_t>(6379));
    config.Set("tabular.sqlite.wal", true);

    EXPECT_EQ(config.GetString("graph.backend"), "memory");
    EXPECT_EQ(config.GetInt("graph.falkordb.port"), 6379);
    EXPECT_EQ(config.GetBool("tabular.sqlite.wal"), true);
}

TEST(ConfigTest, HasKey) {
    auto result = Config::LoadFromString("engine:\n  as_of: 2024-06-30\n");
    ASSERT_TRUE(result.ok());

    EXPECT_TRUE(result->HasKey("engine.as_of"));
    EXPECT_FALSE(result->HasKey("engine.service_level"));
}

TEST(ConfigTest, MergeConfigs) {
    const std::string base_yaml = R"(
logging:
  level: info
engine:
  service_level: 0.95
  order_cost: 50
)";

    const std::string overlay_yaml = R"(
engine:
  order_cost: 75
  holding_cost_pct: 0.2
)";

    auto base_result = Config::LoadFromString(base_yaml);
    auto overlay_result = Config::LoadFromString(overlay_yaml);
    ASSERT_TRUE(base_result.ok());
    ASSERT_TRUE(overlay_result.ok());

    Config base = std::move(*base_result);
    base.Merge(*overlay_result);

    EXPECT_EQ(base.GetString("logging.level"), "info");
    EXPECT_DOUBLE_EQ(base.GetDouble("engine.service_level"), 0.95);
    EXPECT_EQ(base.GetInt("engine.order_cost"), 75);          // Overwritten
    EXPECT_DOUBLE_EQ(base.GetDouble("engine.holding_cost_pct"), 0.2);  // Added
}

TEST(ConfigTest, EnvironmentOverlay) {
    ::setenv("WCOPT_TEST_SQLITE_PATH", "/tmp/from-env.db", 1);
    ::setenv("WCOPT_TEST_AS_OF", "2024-01-15", 1);

    Config config = Config::LoadFromEnvironment("WCOPT_TEST_");

    EXPECT_EQ(config.GetString("tabular.sqlite.path"), "/tmp/from-env.db");
    EXPECT_EQ(config.GetString("engine.as_of"), "2024-01-15");
    EXPECT_FALSE(config.HasKey("graph.backend"));

    ::unsetenv("WCOPT_TEST_SQLITE_PATH");
    ::unsetenv("WCOPT_TEST_AS_OF");
}

TEST(ConfigTest, MissingFileIsNotFound) {
    auto result = Config::LoadFromFile("/nonexistent/wcopt.yaml");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kNotFound);
}

TEST(ConfigTest, InvalidYaml) {
    auto result = Config::LoadFromString("{ invalid yaml [");
    EXPECT_FALSE(result.ok());
}

TEST(ConfigTest, ToJson) {
    auto result = Config::LoadFromString("graph:\n  backend: memory\n  falkordb:\n    port: 6379\n");
    ASSERT_TRUE(result.ok());

    auto json = result->ToJson();
    EXPECT_EQ(json["graph"]["backend"], "memory");
    EXPECT_EQ(json["graph"]["falkordb"]["port"], 6379);
}

}  // namespace
}  // namespace wcopt
