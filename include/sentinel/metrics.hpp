#pragma once

#include "types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sentinel {

// Risk calculator utilities
class RiskCalculator {
public:
    // Simple period returns of a value series.
    static std::vector<double> returns_from(const std::vector<double>& values);

    static double calculate_mean(const std::vector<double>& values);
    static double calculate_volatility(const std::vector<double>& returns);

    // Ratios are per period unless periods_per_year scales them.
    static double calculate_sharpe_ratio(const std::vector<double>& returns, double periods_per_year = 1.0);
    static double calculate_sortino_ratio(const std::vector<double>& returns, double periods_per_year = 1.0);

    // Loss fraction not exceeded with the given confidence, >= 0.
    static double calculate_historical_var(const std::vector<double>& returns, double confidence = 0.95);

    // Drawdown calculations, as fractions of the running peak
    static double calculate_max_drawdown(const std::vector<double>& values);
    static double calculate_current_drawdown(const std::vector<double>& values);

    // Fraction of equity to stake, capped at kMaxKellyFraction.
    static double calculate_kelly_criterion(double win_rate, double avg_win, double avg_loss);

    static constexpr double kMaxKellyFraction = 0.25;
};

struct AccountMetrics {
    std::string account_id;
    double equity = 0.0;
    double daily_pnl = 0.0;
    double daily_pnl_pct = 0.0;
    std::size_t open_positions = 0;
    double exposure_pct = 0.0;
    int trades_today = 0;
    int day_trades_today = 0;
    int consecutive_losses = 0;
    double daily_realized_pnl = 0.0;
    bool halted = false;
    std::string halt_reason;
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double var_95 = 0.0;
    double max_drawdown = 0.0;
    std::size_t samples = 0;
};

// Account figures from current state, risk ratios from the equity series of
// the rolling cycle window (oldest first).
AccountMetrics compute_account_metrics(const Account& account, const RiskState& risk,
                                       const std::vector<double>& equity_series);

struct MetricsSnapshot {
    Timestamp generated_at{};
    std::uint64_t cycle_sequence = 0;
    std::optional<TradingMode> mode;
    std::size_t cycles_in_window = 0;
    int orders_attempted = 0;
    int orders_filled = 0;
    int orders_rejected = 0;
    std::size_t errors = 0;
    std::vector<AccountMetrics> accounts;
};

struct HealthReport {
    std::string status;
    double uptime_seconds = 0.0;
    std::map<std::string, bool> connectivity;
    std::optional<Timestamp> last_cycle_at;
    std::optional<TradingMode> mode;
    std::uint64_t cycle_count = 0;
    std::uint64_t error_count = 0;
    std::vector<std::string> halted_accounts;
    bool emergency_stop_pending = false;
};

} // namespace sentinel
