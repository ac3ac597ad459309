#pragma once

#include "adapter_call.hpp"
#include "adapters.hpp"
#include "audit_trail.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "control_surface.hpp"
#include "emergency_stop.hpp"
#include "market_session.hpp"
#include "notifier.hpp"
#include "risk_engine.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <spdlog/spdlog.h>

namespace sentinel {

struct Collaborators {
    std::shared_ptr<BrokerAdapter> broker;
    std::shared_ptr<CandidateSource> candidates;
    std::shared_ptr<PersistenceAdapter> persistence;
    std::shared_ptr<NotificationAdapter> notifications;
    std::shared_ptr<Strategy> strategy;
    std::shared_ptr<Backtester> backtester;     // optional
    std::shared_ptr<const CalendarSource> calendar;
};

// Scheduler lifecycle: Starting -> Running(mode) -> Stopping -> Stopped
struct SchedulerStarting {};
struct SchedulerRunning {
    TradingMode mode = TradingMode::Backtesting;
};
struct SchedulerStopping {
    std::string reason;
};
struct SchedulerStopped {};

using SchedulerState = std::variant<SchedulerStarting, SchedulerRunning, SchedulerStopping, SchedulerStopped>;

std::string describe(const SchedulerState& state);

struct AccountContext {
    Account account;
    RiskState risk;
    int failed_cycles = 0;      // consecutive cycles whose refresh failed
    std::string last_error;
};

// Accounts under management, created from configuration at startup and
// owned by the scheduling thread.
class AccountRegistry {
public:
    explicit AccountRegistry(const Config& config);

    std::vector<AccountContext>& all() { return accounts_; }
    const std::vector<AccountContext>& all() const { return accounts_; }
    AccountContext* find(const std::string& id);
    const AccountContext* find(const std::string& id) const;
    std::vector<AccountView> views() const;

private:
    std::vector<AccountContext> accounts_;
};

// The control loop. Owns every Account and RiskState; all mutation happens
// on the thread that calls run() / run_cycle().
class ModeScheduler {
public:
    ModeScheduler(std::shared_ptr<const Config> config, Collaborators collaborators, Clock& clock,
                  ConnectivityTracker& tracker, ControlSurface& surface, EmergencyStopChannel& channel);

    void start();

    // Runs cycles until an emergency stop or shutdown request, then shuts down.
    void run();

    // One complete cycle in the mode the market session dictates.
    CycleResult run_cycle();

    void shutdown(const std::string& reason);

    // Thread-safe. Applied at the start of the next cycle.
    void request_breaker_reset(const std::string& account_id);

    SchedulerState state() const;
    bool stopping() const { return stopping_; }
    const AccountRegistry& accounts() const { return registry_; }
    const AuditTrail& audit() const { return audit_; }

    static constexpr double kBacktestNotifyReturnPct = 5.0;
    static constexpr const char* kLiquidationReason = "EMERGENCY_STOP";

private:
    std::shared_ptr<const Config> config_;
    Collaborators collab_;
    Clock& clock_;
    ConnectivityTracker& tracker_;
    ControlSurface& surface_;
    EmergencyStopChannel& channel_;

    MarketSessionOracle oracle_;
    RiskEngine risk_;
    AdapterCaller caller_;
    Notifier notifier_;
    AuditTrail audit_;
    AccountRegistry registry_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex state_mutex_;
    SchedulerState state_ = SchedulerStarting{};

    std::mutex resets_mutex_;
    std::vector<std::string> pending_resets_;

    std::optional<TradingMode> mode_;
    std::optional<CivilDate> session_date_;
    std::vector<Candidate> last_candidates_;
    std::uint64_t sequence_ = 0;
    std::uint64_t order_counter_ = 0;
    std::uint64_t errors_total_ = 0;
    bool stopping_ = false;
    std::string stop_reason_;

    void set_state(SchedulerState state);
    TradingMode evaluate_mode(Timestamp now);
    void begin_session_if_needed(Timestamp now);
    void apply_pending_resets();
    std::vector<Candidate> fetch_candidates(CycleResult& cycle);

    void run_trading(CycleResult& cycle, const std::vector<Candidate>& candidates);
    void run_backtesting(CycleResult& cycle, const std::vector<Candidate>& candidates);

    void process_account(AccountContext& ctx, const std::vector<Candidate>& candidates, AccountCycleResult& slot);
    void refresh(AccountContext& ctx, const std::vector<Candidate>& candidates);
    bool execute(AccountContext& ctx, const CandidateAction& action, AccountCycleResult& slot);
    OrderRequest make_order(const std::string& account_id, const std::string& symbol, Side side, double quantity);

    // Submits once, cancels on timeout, then books the fill and audits it.
    // Broker failures propagate.
    FillOutcome place(AccountContext& ctx, const OrderRequest& order, double price, const std::string& reason,
                      bool risk_reducing);

    // Market-closes every position of the account, bypassing admission.
    void liquidate(AccountContext& ctx);
    void cancel_unknown(const OrderRequest& order);
    void escalate(AccountContext& ctx, const std::string& reason, StopOrigin origin);
    void summarize(const AccountContext& ctx, AccountCycleResult& slot) const;

    // Consumes a pending stop request, if any. Returns true once stopping.
    bool check_stop();
    void handle_stop(const EmergencyStopRequest& request);

    void probe_adapters();
    Timestamp next_wake(Timestamp now) const;
    DailyReport build_daily_report() const;
};

} // namespace sentinel
