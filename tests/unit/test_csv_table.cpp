#include <cmath>
#include <gtest/gtest.h>
#include <sstream>
#include <strata/csv_table.hpp>

using namespace strata;

static CsvTableResult read(const std::string& text)
{
    std::istringstream in(text);
    return read_csv_table(in);
}

TEST(CsvTable, HeaderRowNamesIndexAndColumns)
{
    auto r = read("depth,Pollen/Pinus,Pollen/Betula\n0,10,20\n5,30,40\n");
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.table.index_name(), "depth");
    ASSERT_EQ(r.table.column_count(), 2u);
    EXPECT_EQ(r.table.columns()[0], "Pollen/Pinus");
    EXPECT_EQ(r.table.columns()[1], "Pollen/Betula");
    ASSERT_EQ(r.table.row_count(), 2u);
    EXPECT_FLOAT_EQ(r.table.index()[1], 5.0f);
    EXPECT_FLOAT_EQ(r.table.column("Pollen/Betula")[1], 40.0f);
}

TEST(CsvTable, NoHeaderUsesGenericNames)
{
    auto r = read("0,1,2\n1,3,4\n");
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.table.index_name(), "y");
    ASSERT_EQ(r.table.column_count(), 2u);
    EXPECT_EQ(r.table.columns()[0], "Column 1");
    EXPECT_EQ(r.table.row_count(), 2u);
}

TEST(CsvTable, BadCellsBecomeNaN)
{
    auto r = read("depth,a,b\n0,x,2\n1,3\n");
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_TRUE(std::isnan(r.table.column("a")[0]));
    EXPECT_TRUE(std::isnan(r.table.column("b")[1]));
    EXPECT_FLOAT_EQ(r.table.column("a")[1], 3.0f);
}

TEST(CsvTable, SemicolonAndQuotes)
{
    auto r = read("\"age\";\"Herbs; misc\"\r\n100;1.5\r\n");
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.table.index_name(), "age");
    ASSERT_EQ(r.table.column_count(), 1u);
    EXPECT_EQ(r.table.columns()[0], "Herbs; misc");
    EXPECT_FLOAT_EQ(r.table.column("Herbs; misc")[0], 1.5f);
}

TEST(CsvTable, TabDelimited)
{
    auto r = read("depth\ta\tb\n0\t1\t2\n");
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.table.column_count(), 2u);
}

TEST(CsvTable, EmptyInputFails)
{
    auto r = read("");
    EXPECT_FALSE(r.ok());
}

TEST(CsvTable, SingleColumnFails)
{
    auto r = read("depth\n0\n1\n");
    EXPECT_FALSE(r.ok());
}

TEST(CsvTable, DuplicateHeaderFails)
{
    auto r = read("depth,a,a\n0,1,2\n");
    EXPECT_FALSE(r.ok());
}

TEST(CsvTable, MissingFileFails)
{
    auto r = load_csv_table("/nonexistent/strata/table.csv");
    EXPECT_FALSE(r.ok());
    EXPECT_NE(r.error.find("Cannot open"), std::string::npos);
}
