#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "backsim/backtest/risk_controller.hpp"
#include "test_utils.hpp"

using namespace backsim;
using namespace backsim::backtest;
using backsim::testing::day;
using backsim::testing::make_candle;

class RiskControllerTest : public backsim::testing::TestBase {
protected:
    Position make_position(PositionSide side, double entry) {
        Position position;
        position.side = side;
        position.entry_price = entry;
        position.quantity = 1.0;
        position.stop_price = risk_.stop_price(side, entry);
        position.take_profit_price = risk_.take_profit_price(side, entry);
        return position;
    }

    RiskController risk_{5.0, 10.0};
};

TEST_F(RiskControllerTest, LevelsFromEntryPrice) {
    EXPECT_DOUBLE_EQ(risk_.stop_price(PositionSide::LONG, 100.0), 95.0);
    EXPECT_DOUBLE_EQ(risk_.take_profit_price(PositionSide::LONG, 100.0), 110.0);
    EXPECT_DOUBLE_EQ(risk_.stop_price(PositionSide::SHORT, 100.0), 105.0);
    EXPECT_DOUBLE_EQ(risk_.take_profit_price(PositionSide::SHORT, 100.0), 90.0);
}

TEST_F(RiskControllerTest, LongStopLoss) {
    auto position = make_position(PositionSide::LONG, 100.0);
    auto exit = risk_.check(position, make_candle(day(1), 99, 100, 94, 96));
    ASSERT_TRUE(exit.has_value());
    EXPECT_EQ(exit->reason, ExitReason::STOP_LOSS);
    EXPECT_DOUBLE_EQ(exit->price, 95.0);
}

TEST_F(RiskControllerTest, LongTakeProfit) {
    auto position = make_position(PositionSide::LONG, 100.0);
    auto exit = risk_.check(position, make_candle(day(1), 101, 112, 100, 108));
    ASSERT_TRUE(exit.has_value());
    EXPECT_EQ(exit->reason, ExitReason::TAKE_PROFIT);
    EXPECT_DOUBLE_EQ(exit->price, 110.0);
}

TEST_F(RiskControllerTest, StopWinsWhenBothLevelsTouched) {
    auto position = make_position(PositionSide::LONG, 100.0);
    auto exit = risk_.check(position, make_candle(day(1), 100, 111, 94, 100));
    ASSERT_TRUE(exit.has_value());
    EXPECT_EQ(exit->reason, ExitReason::STOP_LOSS);

    auto short_position = make_position(PositionSide::SHORT, 100.0);
    auto short_exit = risk_.check(short_position, make_candle(day(1), 100, 106, 89, 100));
    ASSERT_TRUE(short_exit.has_value());
    EXPECT_EQ(short_exit->reason, ExitReason::STOP_LOSS);
    EXPECT_DOUBLE_EQ(short_exit->price, 105.0);
}

TEST_F(RiskControllerTest, ShortTakeProfit) {
    auto position = make_position(PositionSide::SHORT, 100.0);
    auto exit = risk_.check(position, make_candle(day(1), 95, 104, 89, 92));
    ASSERT_TRUE(exit.has_value());
    EXPECT_EQ(exit->reason, ExitReason::TAKE_PROFIT);
    EXPECT_DOUBLE_EQ(exit->price, 90.0);
}

TEST_F(RiskControllerTest, NoExitInsideRange) {
    auto position = make_position(PositionSide::LONG, 100.0);
    EXPECT_FALSE(risk_.check(position, make_candle(day(1), 100, 109, 96, 102)).has_value());

    auto short_position = make_position(PositionSide::SHORT, 100.0);
    EXPECT_FALSE(risk_.check(short_position, make_candle(day(1), 100, 104, 91, 98)).has_value());
}

TEST_F(RiskControllerTest, TouchingTheLevelTriggers) {
    auto position = make_position(PositionSide::LONG, 100.0);
    auto exit = risk_.check(position, make_candle(day(1), 96, 97, 95, 96));
    ASSERT_TRUE(exit.has_value());
    EXPECT_EQ(exit->reason, ExitReason::STOP_LOSS);
}
