#include <gtest/gtest.h>
#include "../backtest/test_utils.hpp"
#include "../core/test_base.hpp"
#include "backsim/indicators/indicator_set.hpp"

using namespace backsim;

class IndicatorSetTest : public backsim::testing::TestBase {
protected:
    static IndicatorSpec spec(const std::string& name, IndicatorType type, int period) {
        IndicatorSpec s;
        s.name = name;
        s.type = type;
        s.period = period;
        return s;
    }
};

TEST_F(IndicatorSetTest, UpdatesAllIndicators) {
    auto set = IndicatorSet::create(
        {spec("fast", IndicatorType::EMA, 2), spec("slow", IndicatorType::SMA, 3)});
    ASSERT_TRUE(set.is_ok()) << set.error()->what();
    IndicatorSet indicators = set.take_value();
    EXPECT_EQ(indicators.size(), 2u);

    auto candles = backsim::testing::candles_from_closes({1, 2, 3});
    indicators.update(candles[0]);
    const auto& second = indicators.update(candles[1]);
    EXPECT_TRUE(second.at("fast").ready);
    EXPECT_FALSE(second.at("slow").ready);

    const auto& third = indicators.update(candles[2]);
    EXPECT_TRUE(third.at("slow").ready);
    EXPECT_DOUBLE_EQ(third.at("slow").value, 2.0);
    EXPECT_TRUE(third.at("fast").previous_ready);
}

TEST_F(IndicatorSetTest, EmptyBeforeFirstUpdateIsWarmingUp) {
    auto set = IndicatorSet::create({spec("ema", IndicatorType::EMA, 3)});
    ASSERT_TRUE(set.is_ok());
    EXPECT_FALSE(set.value().values().at("ema").ready);
}

TEST_F(IndicatorSetTest, RejectsDuplicateNames) {
    auto set = IndicatorSet::create(
        {spec("ema", IndicatorType::EMA, 3), spec("ema", IndicatorType::EMA, 5)});
    ASSERT_TRUE(set.is_error());
    EXPECT_EQ(set.error()->code(), ErrorCode::INVALID_CONFIG);
}

TEST_F(IndicatorSetTest, RejectsInvalidSpecs) {
    auto zero_period = IndicatorSet::create({spec("ema", IndicatorType::EMA, 0)});
    ASSERT_TRUE(zero_period.is_error());
    EXPECT_EQ(zero_period.error()->code(), ErrorCode::INVALID_CONFIG);

    auto unnamed = IndicatorSet::create({spec("", IndicatorType::SMA, 3)});
    EXPECT_TRUE(unnamed.is_error());

    IndicatorSpec macd = spec("macd", IndicatorType::MACD_HISTOGRAM, 1);
    macd.fast_period = 26;
    macd.slow_period = 12;
    auto inverted = IndicatorSet::create({macd});
    ASSERT_TRUE(inverted.is_error());
    EXPECT_EQ(inverted.error()->code(), ErrorCode::INVALID_CONFIG);
}

TEST_F(IndicatorSetTest, ResetReplaysIdentically) {
    auto set = IndicatorSet::create({spec("rsi", IndicatorType::RSI, 5),
                                     spec("upper", IndicatorType::DONCHIAN_UPPER, 4)});
    ASSERT_TRUE(set.is_ok());
    IndicatorSet indicators = set.take_value();
    auto candles = backsim::testing::sine_wave_candles(30);

    std::vector<IndicatorValues> first;
    for (const auto& candle : candles) {
        first.push_back(indicators.update(candle));
    }

    indicators.reset();
    for (size_t i = 0; i < candles.size(); ++i) {
        const auto& values = indicators.update(candles[i]);
        for (const auto& name : {"rsi", "upper"}) {
            EXPECT_EQ(values.at(name).ready, first[i].at(name).ready);
            EXPECT_EQ(values.at(name).value, first[i].at(name).value);
        }
    }
}
