/// @file type_inference_test.cpp
/// @brief Tests for column type inference

#include <gtest/gtest.h>

#include "storage/type_inference.h"

namespace wcopt::storage {
namespace {

Table SingleColumn(std::vector<Cell> values) {
    Table table;
    table.columns = {"value"};
    for (auto& v : values) {
        table.rows.push_back({std::move(v)});
    }
    return table;
}

TEST(TypeInferenceTest, ParseIntegerCell) {
    EXPECT_EQ(ParseIntegerCell("42"), 42);
    EXPECT_EQ(ParseIntegerCell(" -5 "), -5);
    EXPECT_EQ(ParseIntegerCell("0"), 0);
    EXPECT_FALSE(ParseIntegerCell("007").has_value());
    EXPECT_FALSE(ParseIntegerCell("4.0").has_value());
    EXPECT_FALSE(ParseIntegerCell("").has_value());
    EXPECT_FALSE(ParseIntegerCell("12a").has_value());
}

TEST(TypeInferenceTest, ParseRealCell) {
    EXPECT_DOUBLE_EQ(*ParseRealCell("3.5"), 3.5);
    EXPECT_DOUBLE_EQ(*ParseRealCell("0.25"), 0.25);
    EXPECT_DOUBLE_EQ(*ParseRealCell("-1e3"), -1000.0);
    EXPECT_FALSE(ParseRealCell("inf").has_value());
    EXPECT_FALSE(ParseRealCell("00.5").has_value());
    EXPECT_FALSE(ParseRealCell("abc").has_value());
}

TEST(TypeInferenceTest, IsBlankCell) {
    EXPECT_TRUE(IsBlankCell(std::nullopt));
    EXPECT_TRUE(IsBlankCell(std::string("")));
    EXPECT_TRUE(IsBlankCell(std::string("   ")));
    EXPECT_FALSE(IsBlankCell(std::string("0")));
}

TEST(TypeInferenceTest, InferColumnKind) {
    EXPECT_EQ(InferColumnKind(SingleColumn({"1", "2", std::nullopt}), 0), ColumnKind::kInteger);
    EXPECT_EQ(InferColumnKind(SingleColumn({"1", "2.5"}), 0), ColumnKind::kReal);
    EXPECT_EQ(InferColumnKind(SingleColumn({"1", "n/a"}), 0), ColumnKind::kText);
    EXPECT_EQ(InferColumnKind(SingleColumn({"001", "002"}), 0), ColumnKind::kText);
    EXPECT_EQ(InferColumnKind(SingleColumn({std::nullopt, ""}), 0), ColumnKind::kText);
    EXPECT_EQ(InferColumnKind(SingleColumn({}), 0), ColumnKind::kText);
}

}  // namespace
}  // namespace wcopt::storage
