#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>

#include "csv_loader.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include "test_helpers.hpp"

using data::CsvLoader;

namespace {

    core::PriceSeries parseText(const std::string& text) {
        std::istringstream input(text);
        return CsvLoader::parse(input, "test.csv");
    }

    std::string errorOf(const std::string& text) {
        try {
            parseText(text);
        } catch (const core::DataLoadException& e) {
            return e.what();
        }
        return "";
    }

} // namespace

TEST(CsvLoaderTest, ParsesHeaderAndRows) {
    const auto bars = parseText(
        "Date,Open,High,Low,Close,Volume\n"
        "2024-01-02,10.5,11,10,10.75,1200\n"
        "2024-01-03,10.75,12,10.5,11.5,1500\n");
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(core::utils::timestampToDate(bars[0].timestamp), "2024-01-02");
    EXPECT_DOUBLE_EQ(bars[0].open, 10.5);
    EXPECT_DOUBLE_EQ(bars[0].high, 11.0);
    EXPECT_DOUBLE_EQ(bars[0].low, 10.0);
    EXPECT_DOUBLE_EQ(bars[0].close, 10.75);
    EXPECT_EQ(bars[0].volume, 1200);
    EXPECT_DOUBLE_EQ(bars[1].close, 11.5);
}

TEST(CsvLoaderTest, HeaderOptionalAndBlankLinesSkipped) {
    const auto bars = parseText(
        "\n"
        "2024-01-02,1,1,1,1,100\r\n"
        "   \n"
        "2024-01-03,2,2,2,2,200.0,extra,columns\n");
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars[1].volume, 200);
}

TEST(CsvLoaderTest, SortsByDate) {
    const auto bars = parseText(
        "date,open,high,low,close,volume\n"
        "2024-01-05,3,3,3,3,1\n"
        "2024-01-02,1,1,1,1,1\n"
        "2024-01-03,2,2,2,2,1\n");
    ASSERT_EQ(bars.size(), 3u);
    EXPECT_DOUBLE_EQ(bars[0].close, 1.0);
    EXPECT_DOUBLE_EQ(bars[1].close, 2.0);
    EXPECT_DOUBLE_EQ(bars[2].close, 3.0);
}

TEST(CsvLoaderTest, ReportsSourceAndLine) {
    const std::string bad_number = errorOf(
        "Date,Open,High,Low,Close,Volume\n"
        "2024-01-02,1,1,1,1,100\n"
        "2024-01-03,1,1,1,12abc,100\n");
    EXPECT_NE(bad_number.find("test.csv:3"), std::string::npos) << bad_number;
    EXPECT_NE(bad_number.find("close"), std::string::npos) << bad_number;

    const std::string bad_date = errorOf("2024-13-02,1,1,1,1,100\n");
    EXPECT_NE(bad_date.find("test.csv:1"), std::string::npos) << bad_date;

    const std::string short_row = errorOf("2024-01-02,1,1,1\n");
    EXPECT_NE(short_row.find("columns"), std::string::npos) << short_row;

    EXPECT_FALSE(errorOf("2024-01-02,1,,1,1,100\n").empty());
}

TEST(CsvLoaderTest, RejectsUnrepresentableVolume) {
    for (const std::string volume : {"nan", "inf", "-inf", "1e30"}) {
        const std::string message = errorOf("2024-01-02,1,1,1,1,100\n2024-01-03,1,1,1,1," + volume + "\n");
        EXPECT_NE(message.find("test.csv:2"), std::string::npos) << volume << ": " << message;
        EXPECT_NE(message.find("volume"), std::string::npos) << volume << ": " << message;
    }

    const auto bars = parseText("2024-01-02,1,1,1,1,1500.0\n");
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_EQ(bars[0].volume, 1500);
}

TEST(CsvLoaderTest, LoadsFileAndReportsMissingFile) {
    const std::string dir = test_helpers::makeTempDir("csv");
    const std::string path = dir + "/ACME.csv";
    {
        std::ofstream out(path);
        out << "Date,Open,High,Low,Close,Volume\n2024-01-02,1,2,0.5,1.5,10\n";
    }
    const auto bars = CsvLoader::loadFile(path);
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_DOUBLE_EQ(bars[0].close, 1.5);

    EXPECT_THROW(CsvLoader::loadFile(dir + "/missing.csv"), core::DataLoadException);
}
