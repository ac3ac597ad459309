#include <gtest/gtest.h>
#include "sentinel/control_surface.hpp"
#include "sentinel/risk_engine.hpp"
#include "fakes.hpp"

#include <atomic>
#include <cmath>
#include <thread>

using namespace sentinel;

class ControlSurfaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto config = fakes::make_config({"alpha", "beta"});
        config.monitoring.metrics_window = 3;
        config_ = std::make_shared<const Config>(config);
        surface_ = std::make_unique<ControlSurface>(config_, tracker_, clock_, channel_);
    }

    static AccountView view(const std::string& id, int positions) {
        AccountView v;
        v.account.id = id;
        v.account.cash = 100000.0 - positions * 1000.0;
        v.account.session_start_equity = 100000.0;
        for (int i = 0; i < positions; ++i) {
            std::string symbol = "S" + std::to_string(i);
            v.account.positions[symbol] = Position{symbol, 10, 100.0, 100.0, Timestamp{}};
        }
        return v;
    }

    CycleResult cycle(std::uint64_t sequence, int filled = 0) {
        CycleResult result;
        result.sequence = sequence;
        result.mode = TradingMode::Trading;
        result.started_at = clock_.now();
        result.finished_at = clock_.now();
        AccountCycleResult slot;
        slot.account_id = "alpha";
        slot.orders_attempted = filled;
        slot.orders_filled = filled;
        slot.equity = 100000.0 + sequence;
        result.accounts.push_back(slot);
        return result;
    }

    ManualClock clock_{make_utc(CivilDate{2025, 1, 15}, 15, 0)};
    ConnectivityTracker tracker_;
    EmergencyStopChannel channel_;
    std::shared_ptr<const Config> config_;
    std::unique_ptr<ControlSurface> surface_;
};

TEST_F(ControlSurfaceTest, HealthFollowsLifecycle) {
    EXPECT_EQ(surface_->get_health().status, "STARTING");

    surface_->set_phase(ControlSurface::Phase::Running);
    surface_->publish({view("alpha", 0), view("beta", 0)}, {}, cycle(1), TradingMode::Trading);
    auto health = surface_->get_health();
    EXPECT_EQ(health.status, "OPERATIONAL");
    EXPECT_EQ(health.cycle_count, 1u);
    ASSERT_TRUE(health.last_cycle_at.has_value());
    EXPECT_EQ(health.connectivity.size(), 5u);

    surface_->set_phase(ControlSurface::Phase::Stopped);
    EXPECT_EQ(surface_->get_health().status, "STOPPED");
}

TEST_F(ControlSurfaceTest, DegradedWhenAdapterDisconnected) {
    surface_->set_phase(ControlSurface::Phase::Running);
    tracker_.record(AdapterKind::Broker, false, clock_.now(), "connection refused");

    auto health = surface_->get_health();
    EXPECT_EQ(health.status, "DEGRADED");
    EXPECT_FALSE(health.connectivity.at("broker"));
    EXPECT_TRUE(health.connectivity.at("persistence"));
}

TEST_F(ControlSurfaceTest, DegradedWhenAccountHalted) {
    RiskEngine engine;
    AccountView halted = view("beta", 0);
    engine.trip(halted.risk, "consecutive losses: 5", clock_.now());

    surface_->set_phase(ControlSurface::Phase::Running);
    surface_->publish({view("alpha", 0), halted}, {}, cycle(1), TradingMode::Trading);

    auto health = surface_->get_health();
    EXPECT_EQ(health.status, "DEGRADED");
    ASSERT_EQ(health.halted_accounts.size(), 1u);
    EXPECT_EQ(health.halted_accounts[0], "beta");
    EXPECT_TRUE(surface_->get_metrics().accounts[1].halted);
}

TEST_F(ControlSurfaceTest, EmergencyStopIsIdempotent) {
    surface_->set_phase(ControlSurface::Phase::Running);

    EXPECT_TRUE(surface_->trigger_emergency_stop("MANUAL_STOP", StopOrigin::Dashboard));
    EXPECT_FALSE(surface_->trigger_emergency_stop("again", StopOrigin::Operator));

    auto health = surface_->get_health();
    EXPECT_EQ(health.status, "EMERGENCY_STOP");
    EXPECT_TRUE(health.emergency_stop_pending);

    auto request = channel_.consume();
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->reason, "MANUAL_STOP");
    EXPECT_EQ(request->origin, StopOrigin::Dashboard);
    EXPECT_FALSE(channel_.consume().has_value());
    EXPECT_FALSE(surface_->trigger_emergency_stop("later", StopOrigin::Signal));
    EXPECT_EQ(surface_->get_health().status, "EMERGENCY_STOP");
}

TEST_F(ControlSurfaceTest, MetricsWindowIsBounded) {
    surface_->set_phase(ControlSurface::Phase::Running);
    for (std::uint64_t seq = 1; seq <= 5; ++seq) {
        surface_->publish({view("alpha", 0)}, {}, cycle(seq, 1), TradingMode::Trading);
    }

    auto metrics = surface_->get_metrics();
    EXPECT_EQ(metrics.cycle_sequence, 5u);
    EXPECT_EQ(metrics.cycles_in_window, 3u);
    EXPECT_EQ(metrics.orders_filled, 3);
    ASSERT_EQ(metrics.accounts.size(), 1u);
    EXPECT_EQ(metrics.accounts[0].samples, 2u);
    EXPECT_EQ(surface_->get_health().cycle_count, 5u);
}

TEST_F(ControlSurfaceTest, ListsLatestCandidates) {
    EXPECT_TRUE(surface_->list_candidates().empty());
    surface_->publish({}, {Candidate{"AAPL", 85.0, 9.0, 187.5}, Candidate{"MSFT", 72.0, 8.1, std::nullopt}},
                      std::nullopt, TradingMode::Trading);

    auto candidates = surface_->list_candidates();
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].symbol, "AAPL");
    EXPECT_FALSE(candidates[1].last_price.has_value());
}

TEST_F(ControlSurfaceTest, EffectiveConfigurationShowsVariableNamesOnly) {
    const auto& config = surface_->effective_configuration();
    ASSERT_EQ(config["accounts"].size(), 2u);
    EXPECT_EQ(config["accounts"][0]["api_key_env"], "KEY_alpha");
    EXPECT_FALSE(config["accounts"][0].contains("api_key"));
}

TEST_F(ControlSurfaceTest, ReadersNeverSeeTornSnapshots) {
    surface_->set_phase(ControlSurface::Phase::Running);
    std::atomic<bool> done{false};
    std::atomic<int> reads{0};
    std::atomic<int> torn{0};

    std::thread reader([&] {
        do {
            auto metrics = surface_->get_metrics();
            for (const auto& account : metrics.accounts) {
                // Each position is $1,000 of a $100,000 account
                if (std::abs(account.exposure_pct - static_cast<double>(account.open_positions)) > 1e-9 ||
                    std::abs(account.equity - 100000.0) > 1e-6) {
                    ++torn;
                }
            }
            if (!metrics.accounts.empty() &&
                metrics.accounts.front().open_positions != metrics.accounts.back().open_positions) {
                ++torn;
            }
            ++reads;
        } while (!done);
    });

    for (int i = 0; i < 2000; ++i) {
        int n = i % 20;
        surface_->publish({view("alpha", n), view("beta", n)}, {}, std::nullopt, TradingMode::Trading);
    }
    done = true;
    reader.join();

    EXPECT_EQ(torn.load(), 0);
    EXPECT_GT(reads.load(), 0);
}
