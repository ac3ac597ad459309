#include <gtest/gtest.h>
#include "sentinel/market_session.hpp"
#include "fakes.hpp"

using namespace sentinel;

class MarketSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.holidays.push_back(CivilDate{2025, 7, 4});
        config_.early_closes[CivilDate{2025, 11, 28}] = 13 * 60;
        oracle_ = std::make_unique<MarketSessionOracle>(std::make_shared<StaticCalendar>(config_), config_);
    }

    static Timestamp utc(int y, unsigned mo, unsigned d, int h, int mi = 0) {
        return make_utc(CivilDate{y, mo, d}, h, mi);
    }

    MarketSessionConfig config_;
    std::unique_ptr<MarketSessionOracle> oracle_;
};

TEST_F(MarketSessionTest, RegularHoursInWinter) {
    // EST: 09:30 local is 14:30 UTC
    EXPECT_FALSE(oracle_->is_market_open(utc(2025, 1, 15, 14, 29)));
    EXPECT_TRUE(oracle_->is_market_open(utc(2025, 1, 15, 14, 30)));
    EXPECT_TRUE(oracle_->is_market_open(utc(2025, 1, 15, 20, 59)));
    EXPECT_FALSE(oracle_->is_market_open(utc(2025, 1, 15, 21, 0)));
}

TEST_F(MarketSessionTest, RegularHoursInSummer) {
    // EDT: 09:30 local is 13:30 UTC
    EXPECT_FALSE(oracle_->is_market_open(utc(2025, 7, 16, 13, 29)));
    EXPECT_TRUE(oracle_->is_market_open(utc(2025, 7, 16, 13, 30)));
    EXPECT_TRUE(oracle_->is_market_open(utc(2025, 7, 16, 19, 59)));
    EXPECT_FALSE(oracle_->is_market_open(utc(2025, 7, 16, 20, 0)));
}

TEST_F(MarketSessionTest, ClosedOnWeekendsAndHolidays) {
    EXPECT_FALSE(oracle_->is_market_open(utc(2025, 1, 18, 15)));
    EXPECT_FALSE(oracle_->is_market_open(utc(2025, 1, 19, 15)));
    EXPECT_FALSE(oracle_->is_market_open(utc(2025, 7, 4, 15)));
}

TEST_F(MarketSessionTest, EarlyCloseEndsSessionSooner) {
    EXPECT_TRUE(oracle_->is_market_open(utc(2025, 11, 28, 17, 59)));
    EXPECT_FALSE(oracle_->is_market_open(utc(2025, 11, 28, 18, 0)));
    EXPECT_EQ(oracle_->next_boundary(utc(2025, 11, 28, 15)), utc(2025, 11, 28, 18));
}

TEST_F(MarketSessionTest, NextBoundaryWhileOpenIsClose) {
    EXPECT_EQ(oracle_->next_boundary(utc(2025, 1, 15, 15)), utc(2025, 1, 15, 21));
}

TEST_F(MarketSessionTest, NextBoundaryBeforeOpenIsSameDayOpen) {
    EXPECT_EQ(oracle_->next_boundary(utc(2025, 1, 15, 12)), utc(2025, 1, 15, 14, 30));
}

TEST_F(MarketSessionTest, NextBoundarySkipsWeekend) {
    EXPECT_EQ(oracle_->next_boundary(utc(2025, 1, 10, 22)), utc(2025, 1, 13, 14, 30));
}

TEST_F(MarketSessionTest, NextBoundaryCrossesDaylightSavingStart) {
    // Friday in EST, Monday in EDT
    EXPECT_EQ(oracle_->next_boundary(utc(2025, 3, 7, 22)), utc(2025, 3, 10, 13, 30));
}

TEST_F(MarketSessionTest, NextBoundarySkipsHoliday) {
    EXPECT_EQ(oracle_->next_boundary(utc(2025, 7, 3, 21)), utc(2025, 7, 7, 13, 30));
}

TEST_F(MarketSessionTest, SessionDateIsExchangeLocal) {
    EXPECT_EQ(oracle_->session_date(utc(2025, 1, 16, 3)), (CivilDate{2025, 1, 15}));
    EXPECT_EQ(oracle_->session_date(utc(2025, 1, 16, 6)), (CivilDate{2025, 1, 16}));
}

TEST_F(MarketSessionTest, FailsClosedWhenCalendarUnavailable) {
    MarketSessionOracle oracle(std::make_shared<fakes::ThrowingCalendar>(), config_);
    Timestamp now = utc(2025, 1, 15, 15);

    EXPECT_FALSE(oracle.is_market_open(now));
    EXPECT_EQ(oracle.next_boundary(now), now + MarketSessionOracle::kCalendarRetry);
}

TEST_F(MarketSessionTest, FixedOffsetWithoutDaylightSaving) {
    MarketSessionConfig config;
    config.observe_us_dst = false;
    config.utc_offset_std = 0;
    config.open_minute = 8 * 60;
    config.close_minute = 16 * 60 + 30;
    MarketSessionOracle oracle(std::make_shared<StaticCalendar>(config), config);

    EXPECT_TRUE(oracle.is_market_open(utc(2025, 7, 16, 8)));
    EXPECT_FALSE(oracle.is_market_open(utc(2025, 7, 16, 7, 59)));
    EXPECT_FALSE(oracle.is_market_open(utc(2025, 7, 16, 16, 30)));
}

TEST(CivilDateTest, WeekdayAndRoundTrip) {
    EXPECT_EQ(weekday_of(CivilDate{2025, 1, 15}), 3u);
    EXPECT_EQ(weekday_of(CivilDate{2025, 3, 9}), 0u);
    EXPECT_EQ(civil_from_days(days_from_civil(CivilDate{2024, 2, 29})), (CivilDate{2024, 2, 29}));
    EXPECT_EQ(days_from_civil(CivilDate{1970, 1, 1}), 0);
}

TEST(CivilDateTest, ParsesDatesAndTimes) {
    EXPECT_EQ(parse_date("2025-12-24").value(), (CivilDate{2025, 12, 24}));
    EXPECT_FALSE(parse_date("2025-13-01").has_value());
    EXPECT_EQ(parse_time_of_day("09:30").value_or(-1), 570);
    EXPECT_FALSE(parse_time_of_day("25:00").has_value());
    EXPECT_FALSE(parse_time_of_day("9h30").has_value());
}
