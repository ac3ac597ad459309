#pragma once

#include "clock.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sentinel {

// Deadline of a single adapter attempt. Retries get a fresh context.
// Implementations that can block check expired() and give up with
// TimeoutError instead of running past the deadline.
struct CallContext {
    Timestamp deadline{};
    const Clock* clock = nullptr;

    bool expired() const { return clock != nullptr && clock->now() > deadline; }
};

struct BrokerAccount {
    double cash = 0.0;
    double equity = 0.0;
    int day_trade_count = 0;
};

// Capability interfaces consumed by the control core. Implementations throw
// TransientError for retryable failures and AdapterError for permanent ones.

class BrokerAdapter {
public:
    virtual ~BrokerAdapter() = default;

    virtual BrokerAccount get_account(const std::string& account_id, const CallContext& ctx) = 0;
    virtual std::vector<Position> get_positions(const std::string& account_id, const CallContext& ctx) = 0;
    virtual PriceMap get_prices(const std::vector<std::string>& symbols, const CallContext& ctx) = 0;

    // Returns the broker order id. Throws AdapterError when the broker
    // refuses the order.
    virtual std::string submit_order(const OrderRequest& order, const CallContext& ctx) = 0;
    virtual void cancel_order(const std::string& account_id, const std::string& client_order_id,
                              const CallContext& ctx) = 0;

    virtual void ping(const CallContext& ctx) = 0;
};

class CandidateSource {
public:
    virtual ~CandidateSource() = default;

    virtual std::vector<Candidate> get_qualified_candidates(const CallContext& ctx) = 0;
    virtual void ping(const CallContext& ctx) = 0;
};

class PersistenceAdapter {
public:
    virtual ~PersistenceAdapter() = default;

    virtual void record_cycle(const CycleResult& cycle, const CallContext& ctx) = 0;
    virtual void record_order(const OrderRecord& order, const CallContext& ctx) = 0;
    virtual void record_circuit_breaker_event(const BreakerEvent& event, const CallContext& ctx) = 0;
    virtual void record_backtest(const BacktestReport& report, const CallContext& ctx) = 0;
    virtual void record_daily_report(const DailyReport& report, const CallContext& ctx) = 0;
    virtual void ping(const CallContext& ctx) = 0;
};

class NotificationAdapter {
public:
    virtual ~NotificationAdapter() = default;

    virtual void notify(Severity severity, const std::string& title, const std::string& message,
                        const CallContext& ctx) = 0;
};

// Proposes open/close/resize intents for one account. Never sees another
// account's state.
class Strategy {
public:
    virtual ~Strategy() = default;

    virtual std::vector<CandidateAction> propose(const Account& account,
                                                 const std::vector<Candidate>& candidates) = 0;
};

class Backtester {
public:
    virtual ~Backtester() = default;

    // nullopt when the strategy produced no trades for the symbols.
    virtual std::optional<BacktestReport> run(const std::string& strategy,
                                              const std::vector<std::string>& symbols,
                                              const CallContext& ctx) = 0;
};

} // namespace sentinel
