#include <gtest/gtest.h>
#include "csv_loader.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

using data::CsvLoader;

namespace {

    backtester::PriceSeries loadText(const std::string& text) {
        std::istringstream input(text);
        return CsvLoader::load(input, "test");
    }

} // namespace

TEST(CsvLoader_Load, ValidFile) {
    auto series = loadText(
        "date,open,high,low,close,volume,signal\n"
        "2024-01-01,10,11,9,10.5,1000,1\n"
        "2024-01-02,10.5,12,10,11.75,1500,0\n"
        "2024-01-03,11.75,12,8,8,2000,-1\n");

    ASSERT_EQ(series.size(), 3u);
    EXPECT_EQ(core::utils::timestampToString(series.bar(0).timestamp), "2024-01-01T00:00:00Z");
    EXPECT_DOUBLE_EQ(series.bar(1).close, 11.75);
    EXPECT_DOUBLE_EQ(series.bar(0).high, 11.0);
    EXPECT_EQ(series.bar(2).volume, 2000);
    EXPECT_EQ(series.signal(0), 1);
    EXPECT_EQ(series.signal(2), -1);
    EXPECT_FALSE(series.sizeHint(0).has_value());
}

TEST(CsvLoader_Load, HeaderCaseAndOrderFree) {
    auto series = loadText(
        "Signal,Close,Date,Volume,Low,High,Open\r\n"
        "0,20,2024-03-01T15:30:00Z,5,19,21,19.5\r\n"
        "\r\n"
        "1,21,2024-03-04T15:30:00Z,7,20,22,20\r\n");
    ASSERT_EQ(series.size(), 2u);
    EXPECT_DOUBLE_EQ(series.bar(1).close, 21.0);
    EXPECT_DOUBLE_EQ(series.bar(0).open, 19.5);
    EXPECT_EQ(series.signal(1), 1);
}

TEST(CsvLoader_Load, OptionalPositionSizeColumn) {
    auto series = loadText(
        "date,open,high,low,close,volume,signal,position_size\n"
        "2024-01-01,10,10,10,10,1,1,0.5\n"
        "2024-01-02,10,10,10,10,1,-1,\n");
    ASSERT_TRUE(series.sizeHint(0).has_value());
    EXPECT_DOUBLE_EQ(*series.sizeHint(0), 0.5);
    EXPECT_FALSE(series.sizeHint(1).has_value());
}

TEST(CsvLoader_Load, MalformedSignalValuesKept) {
    auto series = loadText(
        "date,open,high,low,close,volume,signal\n"
        "2024-01-01,10,10,10,10,1,3\n");
    EXPECT_EQ(series.signal(0), 3);
}

TEST(CsvLoader_Load, HugeSignalSaturatesAndStaysMalformed) {
    auto series = loadText(
        "date,open,high,low,close,volume,signal\n"
        "2024-01-01,10,10,10,10,1,4294967297\n"
        "2024-01-02,10,10,10,10,1,-1e12\n");
    EXPECT_EQ(series.signal(0), std::numeric_limits<int>::max());
    EXPECT_EQ(series.signal(1), std::numeric_limits<int>::min());
}

TEST(CsvLoader_Errors, MissingColumnThrows) {
    EXPECT_THROW(loadText("date,open,high,low,close,volume\n2024-01-01,1,1,1,1,1\n"),
                 core::DataLoadException);
}

TEST(CsvLoader_Errors, EmptyInputThrows) {
    EXPECT_THROW(loadText(""), core::DataLoadException);
}

TEST(CsvLoader_Errors, UnparseableFieldsThrow) {
    const std::string header = "date,open,high,low,close,volume,signal\n";
    EXPECT_THROW(loadText(header + "2024-01-01,10,10,10,abc,1,0\n"), core::DataLoadException);
    EXPECT_THROW(loadText(header + "yesterday,10,10,10,10,1,0\n"), core::DataLoadException);
    EXPECT_THROW(loadText(header + "2024-01-01,10,10,10,10,1,0.5\n"), core::DataLoadException);
    EXPECT_THROW(loadText(header + "2024-01-01,10,10,10\n"), core::DataLoadException);
}

TEST(CsvLoader_Errors, NegativeOrFractionalVolumeThrows) {
    const std::string header = "date,open,high,low,close,volume,signal\n";
    EXPECT_THROW(loadText(header + "2024-01-01,10,10,10,10,-0.4,0\n"), core::DataLoadException);
    EXPECT_THROW(loadText(header + "2024-01-01,10,10,10,10,0.6,0\n"), core::DataLoadException);
    EXPECT_THROW(loadText(header + "2024-01-01,10,10,10,10,-3,0\n"), core::DataLoadException);
    EXPECT_THROW(loadText(header + "2024-01-01,10,10,10,10,1e19,0\n"), core::DataLoadException);
    EXPECT_EQ(loadText(header + "2024-01-01,10,10,10,10,1500.0,0\n").bar(0).volume, 1500);
}

TEST(CsvLoader_Errors, ErrorNamesLine) {
    try {
        loadText("date,open,high,low,close,volume,signal\n"
                 "2024-01-01,10,10,10,10,1,0\n"
                 "2024-01-02,10,10,10,x,1,0\n");
        FAIL() << "expected DataLoadException";
    } catch (const core::DataLoadException& e) {
        EXPECT_NE(std::string(e.what()).find("Line 3"), std::string::npos) << e.what();
    }
}

TEST(CsvLoader_Errors, StructuralProblemsRaisedBySeries) {
    // Parses fine, but rows are out of order
    EXPECT_THROW(loadText("date,open,high,low,close,volume,signal\n"
                          "2024-01-02,10,10,10,10,1,0\n"
                          "2024-01-01,10,10,10,10,1,0\n"),
                 core::InvalidSeriesException);
    // Header only
    EXPECT_THROW(loadText("date,open,high,low,close,volume,signal\n"), core::InvalidSeriesException);
}

TEST(CsvLoader_LoadFile, ReadsFromDisk) {
    const std::string path = ::testing::TempDir() + "csv_loader_test_prices.csv";
    {
        std::ofstream ofs(path);
        ofs << "date,open,high,low,close,volume,signal\n"
            << "2024-01-01,5,5,5,5,100,1\n";
    }
    auto series = CsvLoader::loadFile(path);
    EXPECT_EQ(series.size(), 1u);
    std::remove(path.c_str());

    EXPECT_THROW(CsvLoader::loadFile("/nonexistent/prices.csv"), core::DataLoadException);
}
