/// @file csv_reader_test.cpp
/// @brief Tests for CSV parsing

#include <cstdio>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "storage/csv_reader.h"

namespace wcopt::storage {
namespace {

TEST(CsvReaderTest, ParsesHeaderAndRows) {
    auto table = ParseCsv("product_id,qty\nP1,5\nP2,7\n");
    ASSERT_TRUE(table.ok()) << table.status().message();

    ASSERT_EQ(table->columns.size(), 2);
    EXPECT_EQ(table->columns[0], "product_id");
    EXPECT_EQ(table->columns[1], "qty");
    ASSERT_EQ(table->rows.size(), 2);
    EXPECT_EQ(table->rows[1][0], "P2");
    EXPECT_EQ(table->rows[1][1], "7");
}

TEST(CsvReaderTest, QuotedFields) {
    auto table = ParseCsv("name,notes\n\"Acme, Inc.\",\"said \"\"hi\"\"\"\n");
    ASSERT_TRUE(table.ok()) << table.status().message();

    ASSERT_EQ(table->rows.size(), 1);
    EXPECT_EQ(table->rows[0][0], "Acme, Inc.");
    EXPECT_EQ(table->rows[0][1], "said \"hi\"");
}

TEST(CsvReaderTest, QuotedFieldSpansLines) {
    auto table = ParseCsv("id,address\n1,\"12 Main St\nSpringfield\"\n2,x\n");
    ASSERT_TRUE(table.ok()) << table.status().message();

    ASSERT_EQ(table->rows.size(), 2);
    EXPECT_EQ(table->rows[0][1], "12 Main St\nSpringfield");
    EXPECT_EQ(table->rows[1][0], "2");
}

TEST(CsvReaderTest, EmptyFieldsAreNullUnlessQuoted) {
    auto table = ParseCsv("a,b,c\n,\"\",x\n");
    ASSERT_TRUE(table.ok());

    ASSERT_EQ(table->rows.size(), 1);
    EXPECT_FALSE(table->rows[0][0].has_value());
    ASSERT_TRUE(table->rows[0][1].has_value());
    EXPECT_EQ(*table->rows[0][1], "");
    EXPECT_EQ(table->rows[0][2], "x");
}

TEST(CsvReaderTest, CrlfBomAndBlankLines) {
    auto table = ParseCsv("\xEF\xBB\xBFsku,qty\r\nA,1\r\n\r\nB,2\r\n");
    ASSERT_TRUE(table.ok()) << table.status().message();

    EXPECT_EQ(table->columns[0], "sku");
    ASSERT_EQ(table->rows.size(), 2);
    EXPECT_EQ(table->rows[0][1], "1");
    EXPECT_EQ(table->rows[1][0], "B");
}

TEST(CsvReaderTest, ShortRowsArePadded) {
    auto table = ParseCsv("a,b,c\n1\n");
    ASSERT_TRUE(table.ok());

    ASSERT_EQ(table->rows[0].size(), 3);
    EXPECT_EQ(table->rows[0][0], "1");
    EXPECT_FALSE(table->rows[0][2].has_value());
}

TEST(CsvReaderTest, LongRowIsRejected) {
    auto table = ParseCsv("a,b\n1,2,3\n");
    ASSERT_FALSE(table.ok());
    EXPECT_EQ(table.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(table.status().message().find("Line 2 has 3 fields"), std::string::npos);
}

TEST(CsvReaderTest, UnterminatedQuoteIsRejected) {
    auto table = ParseCsv("a,b\n\"open,2\n");
    ASSERT_FALSE(table.ok());
    EXPECT_EQ(table.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(CsvReaderTest, InvalidUtf8IsRejected) {
    auto latin1 = ParseCsv("supplier_id,supplier_name\nS1,Acme\nS2,Caf\xE9 Beta\n");
    ASSERT_FALSE(latin1.ok());
    EXPECT_EQ(latin1.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(latin1.status().message(), "Line 3 is not valid UTF-8");

    EXPECT_FALSE(ParseCsv("a\n\xC0\xAF\n").ok());          // overlong
    EXPECT_FALSE(ParseCsv("a\n\xED\xA0\x80\n").ok());      // surrogate
    EXPECT_FALSE(ParseCsv("a\n\xE2\x82").ok());            // truncated
}

TEST(CsvReaderTest, MultiByteTextIsKept) {
    auto table = ParseCsv("\xEF\xBB\xBFname\nCaf\xC3\xA9\n\xE2\x82\xAC 5\n\xF0\x9F\x93\xA6\n");
    ASSERT_TRUE(table.ok()) << table.status();
    ASSERT_EQ(table->rows.size(), 3u);
    EXPECT_EQ(table->rows[0][0], "Caf\xC3\xA9");
    EXPECT_EQ(table->rows[1][0], "\xE2\x82\xAC 5");
}

TEST(CsvReaderTest, EmptyInputHasNoHeader) {
    auto table = ParseCsv("");
    ASSERT_FALSE(table.ok());
    EXPECT_EQ(table.status().message(), "CSV input has no header row");
}

TEST(CsvReaderTest, HeaderOnly) {
    auto table = ParseCsv("a,b\n");
    ASSERT_TRUE(table.ok());
    EXPECT_EQ(table->columns.size(), 2);
    EXPECT_TRUE(table->rows.empty());
}

TEST(CsvReaderTest, ReadFile) {
    const std::string path = ::testing::TempDir() + "wcopt_csv_reader_test.csv";
    {
        std::ofstream out(path);
        out << "supplier_id,name\nS1,Acme\n";
    }

    auto table = ReadCsvFile(path);
    ASSERT_TRUE(table.ok()) << table.status().message();
    EXPECT_EQ(table->rows.size(), 1);

    std::remove(path.c_str());
}

TEST(CsvReaderTest, MissingFileIsNotFound) {
    auto table = ReadCsvFile("/nonexistent/input.csv");
    ASSERT_FALSE(table.ok());
    EXPECT_EQ(table.status().code(), absl::StatusCode::kNotFound);
}

}  // namespace
}  // namespace wcopt::storage
