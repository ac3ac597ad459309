#include <gtest/gtest.h>
#include "sentinel/errors.hpp"
#include "sentinel/metrics.hpp"
#include "sentinel/paper.hpp"
#include "fakes.hpp"

#include <cstdio>
#include <fstream>

using namespace sentinel;

class PaperBrokerTest : public ::testing::Test {
protected:
    void SetUp() override {
        prices_ = std::make_shared<PriceBook>();
        prices_->update("AAPL", 150.0);
        broker_ = std::make_unique<PaperBroker>(prices_, fakes::make_config({"paper"}, 100000.0));
    }

    std::string buy(double quantity, Side side = Side::Buy) {
        OrderRequest order;
        order.account_id = "paper";
        order.client_order_id = "paper-" + std::to_string(++counter_);
        order.symbol = "AAPL";
        order.side = side;
        order.quantity = quantity;
        return broker_->submit_order(order, ctx_);
    }

    const Position* position(const std::string& symbol) {
        positions_ = broker_->get_positions("paper", ctx_);
        for (const auto& pos : positions_) {
            if (pos.symbol == symbol) {
                return &pos;
            }
        }
        return nullptr;
    }

    std::shared_ptr<PriceBook> prices_;
    std::unique_ptr<PaperBroker> broker_;
    std::vector<Position> positions_;
    CallContext ctx_;
    int counter_ = 0;
};

TEST_F(PaperBrokerTest, InitialAccountState) {
    auto account = broker_->get_account("paper", ctx_);
    EXPECT_EQ(account.cash, 100000.0);
    EXPECT_EQ(account.equity, 100000.0);
    EXPECT_TRUE(broker_->get_positions("paper", ctx_).empty());
}

TEST_F(PaperBrokerTest, PlaceMarketBuyOrder) {
    EXPECT_EQ(buy(100), "paper-1");

    EXPECT_EQ(broker_->get_account("paper", ctx_).cash, 85000.0);  // 100000 - (100 * 150)
    const auto* pos = position("AAPL");
    ASSERT_NE(pos, nullptr);
    EXPECT_EQ(pos->quantity, 100.0);
    EXPECT_EQ(pos->entry_price, 150.0);
}

TEST_F(PaperBrokerTest, WeightedAveragePrice) {
    buy(100);
    prices_->update("AAPL", 160.0);
    buy(50);

    const auto* pos = position("AAPL");
    ASSERT_NE(pos, nullptr);
    EXPECT_EQ(pos->quantity, 150.0);
    // (100*150 + 50*160) / 150 = 153.33
    EXPECT_NEAR(pos->entry_price, 153.33, 0.01);
}

TEST_F(PaperBrokerTest, SellCreditsCashAndMarksToMarket) {
    buy(100);
    prices_->update("AAPL", 160.0);

    EXPECT_EQ(broker_->get_account("paper", ctx_).equity, 101000.0);

    buy(50, Side::Sell);
    auto account = broker_->get_account("paper", ctx_);
    EXPECT_EQ(account.cash, 93000.0);
    const auto* pos = position("AAPL");
    ASSERT_NE(pos, nullptr);
    EXPECT_EQ(pos->quantity, 50.0);
    EXPECT_EQ(pos->current_price, 160.0);
}

TEST_F(PaperBrokerTest, InsufficientCash) {
    EXPECT_THROW(buy(1000), AdapterError);
    EXPECT_EQ(broker_->get_account("paper", ctx_).cash, 100000.0);
}

TEST_F(PaperBrokerTest, InsufficientShares) {
    buy(100);
    EXPECT_THROW(buy(150, Side::Sell), AdapterError);

    const auto* pos = position("AAPL");
    ASSERT_NE(pos, nullptr);
    EXPECT_EQ(pos->quantity, 100.0);
}

TEST_F(PaperBrokerTest, CancelAfterFillIsRefused) {
    buy(10);
    EXPECT_THROW(broker_->cancel_order("paper", "paper-1", ctx_), AdapterError);
    EXPECT_NO_THROW(broker_->cancel_order("paper", "never-sent", ctx_));
}

TEST_F(PaperBrokerTest, UnknownAccount) {
    EXPECT_THROW(broker_->get_account("nobody", ctx_), AdapterError);
}

class ThresholdStrategyTest : public ::testing::Test {
protected:
    void SetUp() override {
        account_.id = "alpha";
        account_.cash = 30000.0;
    }

    Account account_;
    ThresholdStrategy strategy_{StrategyConfig{}};
};

TEST_F(ThresholdStrategyTest, OpensStrongCandidates) {
    std::vector<Candidate> candidates{Candidate{"AAPL", 85.0, 9.0, 100.0}, Candidate{"MSFT", 65.0, 9.0, 100.0},
                                      Candidate{"TSLA", 90.0, 7.0, 100.0}};

    auto actions = strategy_.propose(account_, candidates);

    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].symbol, "AAPL");
    EXPECT_EQ(actions[0].kind, ActionKind::Open);
    EXPECT_EQ(actions[0].side, Side::Buy);
    EXPECT_DOUBLE_EQ(actions[0].quantity, 45.0);
    ASSERT_TRUE(actions[0].kelly_fraction.has_value());
    EXPECT_DOUBLE_EQ(*actions[0].kelly_fraction, RiskCalculator::kMaxKellyFraction);
}

TEST_F(ThresholdStrategyTest, ClosesWeakOrMissingHoldings) {
    account_.positions["TSLA"] = Position{"TSLA", 10, 100.0, 101.0, Timestamp{}};
    account_.positions["NVDA"] = Position{"NVDA", 5, 100.0, 99.0, Timestamp{}};
    account_.positions["AAPL"] = Position{"AAPL", 5, 100.0, 100.0, Timestamp{}};
    std::vector<Candidate> candidates{Candidate{"TSLA", 55.0, 9.0, 101.0}, Candidate{"AAPL", 85.0, 9.0, 100.0}};

    auto actions = strategy_.propose(account_, candidates);

    ASSERT_EQ(actions.size(), 2u);
    for (const auto& action : actions) {
        EXPECT_EQ(action.kind, ActionKind::Close);
        EXPECT_EQ(action.reason, "WEAK_SIGNALS");
        EXPECT_NE(action.symbol, "AAPL");
    }
}

class FileAdaptersTest : public ::testing::Test {
protected:
    void TearDown() override {
        std::remove(candidates_path_.c_str());
        std::remove(audit_path_.c_str());
    }

    void write_candidates(const std::string& text) {
        std::ofstream out(candidates_path_);
        out << text;
    }

    std::string candidates_path_ = ::testing::TempDir() + "sentinel_candidates.json";
    std::string audit_path_ = ::testing::TempDir() + "sentinel_audit.jsonl";
    std::shared_ptr<PriceBook> prices_ = std::make_shared<PriceBook>();
    CallContext ctx_;
};

TEST_F(FileAdaptersTest, ReadsCandidatesAndUpdatesPrices) {
    FileCandidateSource source(candidates_path_, prices_);
    EXPECT_THROW(source.get_qualified_candidates(ctx_), TransientError);

    write_candidates(R"([{"symbol": "AAPL", "score": 85, "confidence": 9.1, "last_price": 187.5},
                         {"symbol": "MSFT", "score": 72}])");
    auto candidates = source.get_qualified_candidates(ctx_);

    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[1].confidence, 0.0);
    EXPECT_EQ(prices_->get("AAPL").value_or(0.0), 187.5);
    EXPECT_FALSE(prices_->get("MSFT").has_value());
}

TEST_F(FileAdaptersTest, RejectsMalformedCandidateFiles) {
    FileCandidateSource source(candidates_path_, prices_);

    write_candidates(R"([{"symbol": "AAPL", "sc)");
    EXPECT_THROW(source.get_qualified_candidates(ctx_), TransientError);

    write_candidates(R"({"symbol": "AAPL"})");
    try {
        source.get_qualified_candidates(ctx_);
        FAIL() << "expected AdapterError";
    } catch (const TransientError&) {
        FAIL() << "a non-array file is not transient";
    } catch (const AdapterError&) {
    }
}

TEST_F(FileAdaptersTest, PersistenceAppendsTypedLines) {
    {
        JsonlPersistence persistence(audit_path_);
        CycleResult cycle;
        cycle.sequence = 7;
        persistence.record_cycle(cycle, ctx_);
        persistence.record_circuit_breaker_event(BreakerEvent{"alpha", "MANUAL_STOP", StopOrigin::Dashboard, true, {}},
                                                 ctx_);
    }

    std::ifstream in(audit_path_);
    std::string line;
    std::vector<nlohmann::json> lines;
    while (std::getline(in, line)) {
        lines.push_back(nlohmann::json::parse(line));
    }
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["type"], "cycle");
    EXPECT_EQ(lines[0]["data"]["sequence"], 7);
    EXPECT_EQ(lines[1]["type"], "circuit_breaker");
    EXPECT_EQ(lines[1]["data"]["state"], "OPEN");
}

TEST_F(FileAdaptersTest, PersistenceWritesNothingPastDeadline) {
    ManualClock clock(make_utc(CivilDate{2025, 1, 15}, 15, 0));
    CallContext late{clock.now() - std::chrono::seconds(1), &clock};
    {
        JsonlPersistence persistence(audit_path_);
        CycleResult cycle;
        cycle.sequence = 8;
        EXPECT_THROW(persistence.record_cycle(cycle, late), TimeoutError);
    }

    std::ifstream in(audit_path_);
    std::string line;
    EXPECT_FALSE(std::getline(in, line));
}

TEST_F(FileAdaptersTest, LogNotifierHonoursDeadline) {
    ManualClock clock(make_utc(CivilDate{2025, 1, 15}, 15, 0));
    LogNotifier notifier;
    EXPECT_NO_THROW(notifier.notify(Severity::Info, "Backtest result", "PPO returned 6%",
                                    CallContext{clock.now() + std::chrono::seconds(5), &clock}));
    EXPECT_THROW(notifier.notify(Severity::Info, "Backtest result", "PPO returned 6%",
                                 CallContext{clock.now() - std::chrono::seconds(1), &clock}),
                 TimeoutError);
}

TEST_F(FileAdaptersTest, PersistenceRequiresWritablePath) {
    EXPECT_THROW(JsonlPersistence("/nonexistent/dir/audit.jsonl"), ConfigError);
}
