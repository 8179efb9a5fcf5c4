#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "../core/test_base.hpp"
#include "backsim/core/time_utils.hpp"
#include "backsim/data/candle_csv_loader.hpp"

using namespace backsim;

class CandleCsvLoaderTest : public backsim::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        test_dir = std::filesystem::temp_directory_path() / "backsim_csv_loader_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
        TestBase::TearDown();
    }

    CandleCsvLoader loader{"BTCUSD", Timeframe::DAILY};
    std::filesystem::path test_dir;
};

TEST_F(CandleCsvLoaderTest, LoadsRowsWithHeader) {
    std::istringstream input(
        "timestamp,open,high,low,close,volume\n"
        "1609459200,100,105,99,104,1200\n"
        "1609545600,104,106,101,102,900\n");

    auto result = loader.load_stream(input);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& series = result.value();
    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(series.symbol(), "BTCUSD");
    EXPECT_EQ(core::to_epoch_seconds(series[0].timestamp), 1609459200);
    EXPECT_DOUBLE_EQ(series[0].open, 100.0);
    EXPECT_DOUBLE_EQ(series[0].high, 105.0);
    EXPECT_DOUBLE_EQ(series[0].low, 99.0);
    EXPECT_DOUBLE_EQ(series[0].close, 104.0);
    EXPECT_DOUBLE_EQ(series[1].volume, 900.0);
}

TEST_F(CandleCsvLoaderTest, HeaderIsOptionalAndCommentsSkipped) {
    std::istringstream input(
        "# exported candles\n"
        "\n"
        "1609459200,100,105,99,104,1200\n");

    auto result = loader.load_stream(input);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().size(), 1u);
}

TEST_F(CandleCsvLoaderTest, ParsesTimestampFormats) {
    auto seconds = CandleCsvLoader::parse_timestamp("1609459200");
    ASSERT_TRUE(seconds.is_ok());
    EXPECT_EQ(core::to_epoch_seconds(seconds.value()), 1609459200);

    auto millis = CandleCsvLoader::parse_timestamp("1609459200000");
    ASSERT_TRUE(millis.is_ok());
    EXPECT_EQ(core::to_epoch_seconds(millis.value()), 1609459200);

    auto date = CandleCsvLoader::parse_timestamp("2021-01-01");
    ASSERT_TRUE(date.is_ok());
    EXPECT_EQ(core::to_epoch_seconds(date.value()), 1609459200);

    auto datetime = CandleCsvLoader::parse_timestamp("2021-01-01 01:00:00");
    ASSERT_TRUE(datetime.is_ok());
    EXPECT_EQ(core::to_epoch_seconds(datetime.value()), 1609459200 + 3600);

    auto iso = CandleCsvLoader::parse_timestamp("2021-01-01T01:00:00Z");
    ASSERT_TRUE(iso.is_ok());
    EXPECT_EQ(core::to_epoch_seconds(iso.value()), 1609459200 + 3600);

    EXPECT_TRUE(CandleCsvLoader::parse_timestamp("yesterday").is_error());
    EXPECT_TRUE(CandleCsvLoader::parse_timestamp("").is_error());
}

TEST_F(CandleCsvLoaderTest, ReportsLineOfMalformedNumber) {
    std::istringstream input(
        "timestamp,open,high,low,close,volume\n"
        "1609459200,100,105,99,104,1200\n"
        "1609545600,abc,106,101,102,900\n");

    auto result = loader.load_stream(input);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONVERSION_ERROR);
    EXPECT_NE(std::string(result.error()->what()).find("Line 3"), std::string::npos);
}

TEST_F(CandleCsvLoaderTest, ReportsShortRow) {
    std::istringstream input("1609459200,100,105,99\n");

    auto result = loader.load_stream(input);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONVERSION_ERROR);
    EXPECT_NE(std::string(result.error()->what()).find("Line 1"), std::string::npos);
}

TEST_F(CandleCsvLoaderTest, BadTimestampAfterDataIsAnError) {
    std::istringstream input(
        "1609459200,100,105,99,104,1200\n"
        "not-a-date,104,106,101,102,900\n");

    auto result = loader.load_stream(input);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONVERSION_ERROR);
}

TEST_F(CandleCsvLoaderTest, LoadFile) {
    std::filesystem::path path = test_dir / "candles.csv";
    {
        std::ofstream file(path);
        file << "timestamp,open,high,low,close,volume\n";
        file << "2021-01-01,100,105,99,104,1200\n";
        file << "2021-01-02,104,106,101,102,900\n";
        file << "2021-01-03,102,103,95,96,1500\n";
    }

    auto result = loader.load_file(path.string());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().size(), 3u);
    EXPECT_TRUE(result.value().validate().is_ok());
}

TEST_F(CandleCsvLoaderTest, MissingFile) {
    auto result = loader.load_file((test_dir / "missing.csv").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}
