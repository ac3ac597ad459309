#include <gtest/gtest.h>
#include "sentinel/risk_engine.hpp"
#include "fakes.hpp"

#include <random>

using namespace sentinel;

class RiskEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = make_utc(CivilDate{2025, 3, 5}, 15, 0);
        account_.id = "alpha";
        account_.starting_equity = 30000.0;
        account_.session_start_equity = 30000.0;
        account_.cash = 30000.0;
    }

    void put(const std::string& symbol, double quantity, double entry, double price) {
        account_.positions[symbol] = Position{symbol, quantity, entry, price, now_};
    }

    Admission admit(const CandidateAction& action) {
        return engine_.admit(account_, risk_, action, now_);
    }

    RiskEngine engine_;
    Account account_;
    RiskState risk_;
    Timestamp now_;
};

TEST_F(RiskEngineTest, ClampsOversizedOrderToMaxPositionSize) {
    // 20% of a $30,000 account requested, 15% allowed
    auto admission = admit(fakes::open_buy("AAPL", 60, 100.0));

    ASSERT_TRUE(admission.allowed());
    EXPECT_TRUE(admission.clamped);
    EXPECT_EQ(admission.quantity, 45.0);
    EXPECT_DOUBLE_EQ(admission.quantity * admission.price, 4500.0);
    EXPECT_EQ(admission.side, Side::Buy);
}

TEST_F(RiskEngineTest, OrderWithinLimitsIsNotClamped) {
    auto admission = admit(fakes::open_buy("AAPL", 20, 100.0));

    ASSERT_TRUE(admission.allowed());
    EXPECT_FALSE(admission.clamped);
    EXPECT_EQ(admission.quantity, 20.0);
}

TEST_F(RiskEngineTest, RejectsWhenClampRoundsBelowOneShare) {
    auto admission = admit(fakes::open_buy("BRK.A", 1, 5000.0));

    EXPECT_FALSE(admission.allowed());
    EXPECT_EQ(admission.reason, "below minimum size");
}

TEST_F(RiskEngineTest, RejectsWithoutPrice) {
    auto admission = admit(fakes::open_buy("NOPE", 10, 0.0));

    EXPECT_FALSE(admission.allowed());
    EXPECT_EQ(admission.reason, "no price for NOPE");
}

TEST_F(RiskEngineTest, UsesQuoteWhenActionHasNoReferencePrice) {
    account_.quotes["MSFT"] = 200.0;
    auto admission = admit(fakes::open_buy("MSFT", 5, 0.0));

    ASSERT_TRUE(admission.allowed());
    EXPECT_EQ(admission.price, 200.0);
}

TEST_F(RiskEngineTest, RejectsOpenBeyondTotalExposure) {
    put("A", 70, 100.0, 100.0);
    put("B", 70, 100.0, 100.0);
    put("C", 70, 100.0, 100.0);
    account_.cash = 9000.0;
    ASSERT_DOUBLE_EQ(account_.equity(), 30000.0);

    auto admission = admit(fakes::open_buy("D", 45, 100.0));

    EXPECT_FALSE(admission.allowed());
    EXPECT_EQ(admission.reason.rfind("exposure limit", 0), 0u) << admission.reason;
}

TEST_F(RiskEngineTest, StopLossExitAdmittedAtFullExposure) {
    put("X", 100, 100.0, 94.0);
    put("Y", 131, 100.0, 100.0);
    account_.cash = 7500.0;
    ASSERT_DOUBLE_EQ(account_.equity(), 30000.0);
    ASSERT_DOUBLE_EQ(account_.exposure_fraction(), 0.75);

    auto exits = engine_.protective_exits(account_);
    ASSERT_EQ(exits.size(), 1u);
    EXPECT_EQ(exits[0].symbol, "X");

    auto admission = admit(exits[0]);
    ASSERT_TRUE(admission.allowed());
    EXPECT_TRUE(admission.risk_reducing);
    EXPECT_EQ(admission.reason, "stop-loss");
    EXPECT_EQ(admission.side, Side::Sell);
    EXPECT_EQ(admission.quantity, 100.0);

    // Anything that adds exposure is still refused
    auto open = admit(fakes::open_buy("Z", 10, 100.0));
    EXPECT_FALSE(open.allowed());
}

TEST_F(RiskEngineTest, TakeProfitExitIsRiskReducing) {
    put("NVDA", -10, 100.0, 88.0);    // short, up 12%

    auto exits = engine_.protective_exits(account_);
    ASSERT_EQ(exits.size(), 1u);
    auto admission = admit(exits[0]);

    ASSERT_TRUE(admission.allowed());
    EXPECT_EQ(admission.reason, "take-profit");
    EXPECT_EQ(admission.side, Side::Buy);
    EXPECT_TRUE(admission.risk_reducing);
}

TEST_F(RiskEngineTest, CloseWithoutPositionRejected) {
    auto admission = admit(fakes::close_position("AAPL", 100.0));

    EXPECT_FALSE(admission.allowed());
    EXPECT_EQ(admission.reason, "no position to close");
}

TEST_F(RiskEngineTest, OppositeOrderReducesButNeverFlips) {
    put("AAPL", 10, 100.0, 100.0);
    CandidateAction sell = fakes::open_buy("AAPL", 25, 100.0);
    sell.side = Side::Sell;

    auto admission = admit(sell);

    ASSERT_TRUE(admission.allowed());
    EXPECT_EQ(admission.side, Side::Sell);
    EXPECT_EQ(admission.quantity, 10.0);
    EXPECT_TRUE(admission.risk_reducing);
}

TEST_F(RiskEngineTest, DayTradeLimitBlocksOpens) {
    for (int i = 0; i < 3; ++i) {
        engine_.apply_fill(account_, risk_, "T", Side::Buy, 1, 100.0, now_);
        auto fill = engine_.apply_fill(account_, risk_, "T", Side::Sell, 1, 100.0, now_);
        EXPECT_TRUE(fill.day_trade);
    }
    ASSERT_EQ(risk_.day_trades_today(), 3);

    auto admission = admit(fakes::open_buy("AAPL", 10, 100.0));
    EXPECT_FALSE(admission.allowed());
    EXPECT_EQ(admission.reason, "PDT limit");
}

TEST_F(RiskEngineTest, DayTradeLimitBlocksSameSessionCloseOnly) {
    for (int i = 0; i < 3; ++i) {
        engine_.apply_fill(account_, risk_, "T", Side::Buy, 1, 100.0, now_);
        engine_.apply_fill(account_, risk_, "T", Side::Sell, 1, 100.0, now_);
    }
    put("TODAY", 10, 100.0, 100.0);
    put("OLD", 10, 100.0, 100.0);
    account_.positions["OLD"].opened_at = now_ - std::chrono::hours(24);

    auto today = admit(fakes::close_position("TODAY"));
    EXPECT_FALSE(today.allowed());
    EXPECT_EQ(today.reason, "PDT limit");

    auto old = admit(fakes::close_position("OLD"));
    EXPECT_TRUE(old.allowed());
}

TEST_F(RiskEngineTest, KellySizingUsesEquityFraction) {
    CandidateAction action = fakes::open_buy("AAPL", 0, 100.0);
    action.kelly_fraction = 0.10;

    auto admission = admit(action);

    ASSERT_TRUE(admission.allowed());
    EXPECT_EQ(admission.quantity, 30.0);
    EXPECT_FALSE(admission.clamped);
}

TEST_F(RiskEngineTest, RiskMultiplierNeedsAggressiveSizing) {
    CandidateAction action = fakes::open_buy("AAPL", 0, 100.0);
    action.kelly_fraction = 0.10;
    account_.limits.risk_multiplier = 2.0;

    EXPECT_EQ(admit(action).quantity, 30.0);

    account_.limits.aggressive_sizing_enabled = true;
    auto aggressive = admit(action);
    ASSERT_TRUE(aggressive.allowed());
    // 2 * 10% = 20%, capped at the 15% position limit
    EXPECT_EQ(aggressive.quantity, 45.0);
    EXPECT_TRUE(aggressive.clamped);
}

TEST_F(RiskEngineTest, NonPositiveKellyTargetIsBelowMinimumSize) {
    CandidateAction action = fakes::open_buy("AAPL", 20, 100.0);
    action.kelly_fraction = 0.0;
    auto zero = admit(action);
    EXPECT_FALSE(zero.allowed());
    EXPECT_EQ(zero.reason, "below minimum size");

    action.kelly_fraction = -0.05;
    EXPECT_EQ(admit(action).reason, "below minimum size");
}

TEST_F(RiskEngineTest, KellyIgnoredWhenDisabled) {
    CandidateAction action = fakes::open_buy("AAPL", 0, 100.0);
    action.kelly_fraction = 0.10;
    account_.limits.kelly_enabled = false;

    auto admission = admit(action);
    EXPECT_FALSE(admission.allowed());
    EXPECT_EQ(admission.reason, "invalid quantity");
}

TEST_F(RiskEngineTest, ApplyFillTracksWeightedEntryAndRealizedPnl) {
    engine_.apply_fill(account_, risk_, "AAPL", Side::Buy, 10, 100.0, now_);
    engine_.apply_fill(account_, risk_, "AAPL", Side::Buy, 10, 110.0, now_);

    const auto* pos = account_.find_position("AAPL");
    ASSERT_NE(pos, nullptr);
    EXPECT_EQ(pos->quantity, 20.0);
    EXPECT_NEAR(pos->entry_price, 105.0, 1e-9);

    auto fill = engine_.apply_fill(account_, risk_, "AAPL", Side::Sell, 20, 95.0, now_);
    EXPECT_TRUE(fill.closed);
    EXPECT_NEAR(fill.realized_pnl, -200.0, 1e-9);
    EXPECT_EQ(risk_.consecutive_losses(), 1);
    EXPECT_EQ(risk_.trades_today(), 3);
    EXPECT_EQ(account_.find_position("AAPL"), nullptr);
    EXPECT_NEAR(account_.cash, 29800.0, 1e-9);

    engine_.apply_fill(account_, risk_, "MSFT", Side::Buy, 10, 100.0, now_);
    engine_.apply_fill(account_, risk_, "MSFT", Side::Sell, 10, 101.0, now_);
    EXPECT_EQ(risk_.consecutive_losses(), 0);
    EXPECT_NEAR(risk_.daily_realized_pnl(), -190.0, 1e-9);
}

TEST_F(RiskEngineTest, CircuitBreakerOnDailyLoss) {
    engine_.apply_fill(account_, risk_, "AAPL", Side::Buy, 100, 100.0, now_);
    engine_.apply_fill(account_, risk_, "AAPL", Side::Sell, 100, 90.0, now_);

    auto reason = engine_.evaluate_circuit_breaker(account_, risk_);
    ASSERT_TRUE(reason.has_value());
    EXPECT_NE(reason->find("daily loss limit"), std::string::npos);
}

TEST_F(RiskEngineTest, CircuitBreakerOnConsecutiveLosses) {
    account_.limits.max_consecutive_losses = 2;
    for (int i = 0; i < 2; ++i) {
        engine_.apply_fill(account_, risk_, "AAPL", Side::Buy, 1, 100.0, now_);
        engine_.apply_fill(account_, risk_, "AAPL", Side::Sell, 1, 99.0, now_);
    }

    auto reason = engine_.evaluate_circuit_breaker(account_, risk_);
    ASSERT_TRUE(reason.has_value());
    EXPECT_EQ(*reason, "consecutive losses: 2");
}

TEST_F(RiskEngineTest, DisabledBreakerNeverTrips) {
    account_.limits.circuit_breaker_enabled = false;
    engine_.apply_fill(account_, risk_, "AAPL", Side::Buy, 100, 100.0, now_);
    engine_.apply_fill(account_, risk_, "AAPL", Side::Sell, 100, 50.0, now_);

    EXPECT_FALSE(engine_.evaluate_circuit_breaker(account_, risk_).has_value());
}

TEST_F(RiskEngineTest, BreakerStaysOpenUntilSessionReset) {
    EXPECT_TRUE(engine_.trip(risk_, "consecutive losses: 5", now_));
    EXPECT_FALSE(engine_.trip(risk_, "daily loss limit", now_));
    EXPECT_EQ(risk_.halt_reason(), "consecutive losses: 5");

    // Recovered P&L does not close it
    engine_.apply_fill(account_, risk_, "AAPL", Side::Buy, 1, 100.0, now_);
    engine_.apply_fill(account_, risk_, "AAPL", Side::Sell, 1, 150.0, now_);
    EXPECT_FALSE(engine_.evaluate_circuit_breaker(account_, risk_).has_value());
    EXPECT_TRUE(risk_.halted());

    auto admission = admit(fakes::open_buy("MSFT", 1, 100.0));
    EXPECT_FALSE(admission.allowed());
    EXPECT_EQ(admission.reason, "account halted");

    engine_.reset_session(account_, risk_);
    EXPECT_FALSE(risk_.halted());
    EXPECT_EQ(risk_.trades_today(), 0);
    EXPECT_EQ(account_.session_start_equity, 0.0);
}

TEST_F(RiskEngineTest, ManualResetRebasesDailyLoss) {
    engine_.apply_fill(account_, risk_, "AAPL", Side::Buy, 100, 100.0, now_);
    engine_.apply_fill(account_, risk_, "AAPL", Side::Sell, 100, 90.0, now_);
    auto reason = engine_.evaluate_circuit_breaker(account_, risk_);
    ASSERT_TRUE(reason.has_value());
    engine_.trip(risk_, *reason, now_);

    EXPECT_TRUE(engine_.reset_breaker(account_, risk_));
    EXPECT_FALSE(risk_.halted());
    EXPECT_DOUBLE_EQ(account_.session_start_equity, 29000.0);
    EXPECT_FALSE(engine_.evaluate_circuit_breaker(account_, risk_).has_value());
    EXPECT_FALSE(engine_.reset_breaker(account_, risk_));
}

TEST_F(RiskEngineTest, ReconcileKeepsLocalOpenTime) {
    Timestamp opened = now_ - std::chrono::hours(30);
    put("AAPL", 10, 100.0, 100.0);
    account_.positions["AAPL"].opened_at = opened;
    account_.session_start_equity = 0.0;

    BrokerAccount broker{25000.0, 0.0, 2};
    std::vector<Position> remote{Position{"AAPL", 12, 101.0, 100.0, Timestamp{}}};
    engine_.reconcile(account_, risk_, broker, remote, PriceMap{{"AAPL", 105.0}, {"MSFT", 300.0}});

    const auto* pos = account_.find_position("AAPL");
    ASSERT_NE(pos, nullptr);
    EXPECT_EQ(pos->quantity, 12.0);
    EXPECT_EQ(pos->current_price, 105.0);
    EXPECT_EQ(pos->opened_at, opened);
    EXPECT_EQ(account_.cash, 25000.0);
    EXPECT_DOUBLE_EQ(account_.session_start_equity, 25000.0 + 12 * 105.0);
    EXPECT_EQ(account_.price_of("MSFT").value_or(0.0), 300.0);
    EXPECT_EQ(risk_.day_trades_today(), 2);
}

TEST_F(RiskEngineTest, RandomOrderFlowNeverExceedsTotalExposure) {
    account_.limits.max_day_trades = 100000;
    const std::vector<std::pair<std::string, double>> book{
        {"AAPL", 187.5}, {"MSFT", 402.1}, {"NVDA", 121.3}, {"TSLA", 248.9}, {"F", 11.2}, {"AMD", 160.0}};

    std::mt19937 rng(20250305);
    std::uniform_int_distribution<std::size_t> pick(0, book.size() - 1);
    std::uniform_int_distribution<int> kind(0, 9);
    std::uniform_int_distribution<int> size(1, 400);

    int allowed = 0;
    for (int i = 0; i < 5000; ++i) {
        const auto& [symbol, price] = book[pick(rng)];
        CandidateAction action = fakes::open_buy(symbol, size(rng), price);
        int k = kind(rng);
        if (k < 4) {
            action.side = Side::Buy;
        } else if (k < 7) {
            action.side = Side::Sell;
        } else {
            action.kind = ActionKind::Close;
            action.quantity = k == 9 ? 0.0 : action.quantity;
        }

        auto admission = admit(action);
        if (admission.allowed()) {
            ++allowed;
            ASSERT_GT(admission.quantity, 0.0);
            engine_.apply_fill(account_, risk_, symbol, admission.side, admission.quantity, admission.price, now_);
        }
        ASSERT_LE(account_.exposure_fraction(), account_.limits.max_total_exposure + 1e-9) << "step " << i;
        for (const auto& [sym, pos] : account_.positions) {
            ASSERT_LE(std::abs(pos.market_value()), account_.limits.max_position_size * account_.equity() + 1e-6)
                << sym << " at step " << i;
        }
    }
    EXPECT_GT(allowed, 100);
}
