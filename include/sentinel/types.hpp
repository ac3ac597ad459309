#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
// nlohmann/json included only in serialization files

namespace sentinel {

using Timestamp = std::chrono::system_clock::time_point;
using PriceMap = std::map<std::string, double>;

enum class Side {
    Buy,
    Sell
};

enum class OrderType {
    Market,
    Limit
};

enum class TradingMode {
    Trading,
    Backtesting
};

enum class ActionKind {
    Open,
    Close,
    Resize
};

enum class StopOrigin {
    Dashboard,
    CircuitBreaker,
    Operator,
    Signal
};

enum class Severity {
    Info,
    Warning,
    Critical
};

struct Position {
    std::string symbol;
    double quantity = 0.0;       // signed: positive long, negative short
    double entry_price = 0.0;
    double current_price = 0.0;
    Timestamp opened_at{};

    double market_value() const {
        return quantity * current_price;
    }

    double unrealized_pnl() const {
        return (current_price - entry_price) * quantity;
    }

    // Unrealized P&L as a fraction of cost basis.
    double unrealized_pnl_pct() const;
};

// Per-account limits resolved from the global and account configuration.
struct RiskLimits {
    double max_position_size = 0.15;
    double max_total_exposure = 0.75;
    double stop_loss_pct = 0.05;
    double take_profit_pct = 0.10;
    int max_day_trades = 3;
    double daily_loss_limit = 0.03;
    double risk_multiplier = 1.0;
    bool aggressive_sizing_enabled = false;
    bool kelly_enabled = true;
    bool circuit_breaker_enabled = true;
    int max_consecutive_losses = 5;
    int max_trades_per_cycle = 2;
    double min_order_quantity = 1.0;
};

struct Account {
    std::string id;
    double starting_equity = 0.0;
    double session_start_equity = 0.0;  // 0 until the first refresh of a session
    double cash = 0.0;
    std::map<std::string, Position> positions;
    PriceMap quotes;                    // last prices for held and candidate symbols
    RiskLimits limits;

    double equity() const;
    double gross_exposure() const;
    double exposure_fraction() const;
    double daily_pnl() const;
    const Position* find_position(const std::string& symbol) const;
    std::optional<double> price_of(const std::string& symbol) const;
};

struct BreakerClosed {};

struct BreakerOpen {
    std::string reason;
    Timestamp opened_at{};
};

using CircuitBreakerState = std::variant<BreakerClosed, BreakerOpen>;

class RiskEngine;

// Rolling risk bookkeeping for one account. Only the RiskEngine mutates it.
class RiskState {
public:
    int trades_today() const { return trades_today_; }
    int day_trades_today() const { return day_trades_today_; }
    int consecutive_losses() const { return consecutive_losses_; }
    double daily_realized_pnl() const { return daily_realized_pnl_; }
    const CircuitBreakerState& breaker() const { return breaker_; }

    bool halted() const {
        return std::holds_alternative<BreakerOpen>(breaker_);
    }

    std::string halt_reason() const;

private:
    friend class RiskEngine;

    int trades_today_ = 0;
    int day_trades_today_ = 0;
    int consecutive_losses_ = 0;
    double daily_realized_pnl_ = 0.0;
    CircuitBreakerState breaker_ = BreakerClosed{};
};

struct Candidate {
    std::string symbol;
    double score = 0.0;
    double confidence = 0.0;
    std::optional<double> last_price;
};

// An intent proposed by the strategy collaborator or by protective exits.
struct CandidateAction {
    std::string symbol;
    ActionKind kind = ActionKind::Open;
    Side side = Side::Buy;
    double quantity = 0.0;
    double reference_price = 0.0;
    std::optional<double> kelly_fraction;
    std::string reason;
};

struct OrderRequest {
    std::string account_id;
    std::string client_order_id;
    std::string symbol;
    Side side = Side::Buy;
    double quantity = 0.0;
    OrderType type = OrderType::Market;
    std::optional<double> limit_price;
};

struct OrderRecord {
    std::string account_id;
    std::string order_id;
    std::string client_order_id;
    std::string symbol;
    Side side = Side::Buy;
    double quantity = 0.0;
    double price = 0.0;
    double realized_pnl = 0.0;
    bool risk_reducing = false;
    std::string reason;
    Timestamp timestamp{};
};

struct BreakerEvent {
    std::string account_id;
    std::string reason;
    StopOrigin origin = StopOrigin::CircuitBreaker;
    bool opened = true;
    Timestamp timestamp{};
};

struct BacktestReport {
    std::string strategy;
    std::vector<std::string> symbols;
    double total_return_pct = 0.0;
    double sharpe_ratio = 0.0;
    double win_rate = 0.0;
    int total_trades = 0;
};

struct AccountCycleResult {
    std::string account_id;
    bool failed = false;    // the refresh step failed outright
    bool halted = false;    // circuit breaker was open, trading skipped
    bool skipped = false;   // not processed (cancellation or cycle budget)
    int orders_attempted = 0;
    int orders_filled = 0;
    int orders_rejected = 0;
    std::vector<std::string> rejections;
    std::vector<std::string> errors;
    double equity = 0.0;
    double exposure = 0.0;
    double daily_pnl = 0.0;
    std::size_t open_positions = 0;
    int trades_today = 0;
};

struct CycleResult {
    std::uint64_t sequence = 0;
    TradingMode mode = TradingMode::Backtesting;
    Timestamp started_at{};
    Timestamp finished_at{};
    bool cancelled = false;
    std::vector<AccountCycleResult> accounts;
    std::vector<BacktestReport> backtests;
    std::vector<std::string> errors;

    std::size_t accounts_processed() const;
    int orders_attempted() const;
    int orders_filled() const;
    int orders_rejected() const;
    std::size_t error_count() const;

    std::chrono::milliseconds duration() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(finished_at - started_at);
    }
};

struct EmergencyStopRequest {
    std::string reason;
    StopOrigin origin = StopOrigin::Operator;
    Timestamp requested_at{};
};

struct DailyAccountSummary {
    std::string account_id;
    double equity = 0.0;
    double daily_pnl = 0.0;
    double daily_pnl_pct = 0.0;
    int trades_today = 0;
    bool halted = false;
};

struct DailyReport {
    Timestamp generated_at{};
    std::uint64_t cycles = 0;
    std::uint64_t errors = 0;
    std::vector<DailyAccountSummary> accounts;
};

const char* to_string(Side side);
const char* to_string(TradingMode mode);
const char* to_string(ActionKind kind);
const char* to_string(StopOrigin origin);
const char* to_string(Severity severity);
std::optional<StopOrigin> parse_stop_origin(const std::string& text);

} // namespace sentinel
