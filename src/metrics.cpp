#include "sentinel/metrics.hpp"

#include <algorithm>
#include <cmath>

namespace sentinel {

std::vector<double> RiskCalculator::returns_from(const std::vector<double>& values) {
    std::vector<double> returns;
    for (std::size_t i = 1; i < values.size(); ++i) {
        if (values[i - 1] > 0.0) {
            returns.push_back(values[i] / values[i - 1] - 1.0);
        }
    }
    return returns;
}

double RiskCalculator::calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

double RiskCalculator::calculate_volatility(const std::vector<double>& returns) {
    if (returns.size() < 2) {
        return 0.0;
    }
    double mean = calculate_mean(returns);
    double sq = 0.0;
    for (double r : returns) {
        sq += (r - mean) * (r - mean);
    }
    return std::sqrt(sq / static_cast<double>(returns.size() - 1));
}

double RiskCalculator::calculate_sharpe_ratio(const std::vector<double>& returns, double periods_per_year) {
    double vol = calculate_volatility(returns);
    if (vol <= 0.0) {
        return 0.0;
    }
    return calculate_mean(returns) / vol * std::sqrt(periods_per_year);
}

double RiskCalculator::calculate_sortino_ratio(const std::vector<double>& returns, double periods_per_year) {
    if (returns.size() < 2) {
        return 0.0;
    }
    double downside = 0.0;
    for (double r : returns) {
        if (r < 0.0) {
            downside += r * r;
        }
    }
    downside = std::sqrt(downside / static_cast<double>(returns.size()));
    if (downside <= 0.0) {
        return 0.0;
    }
    return calculate_mean(returns) / downside * std::sqrt(periods_per_year);
}

double RiskCalculator::calculate_historical_var(const std::vector<double>& returns, double confidence) {
    if (returns.size() < 2) {
        return 0.0;
    }
    std::vector<double> sorted = returns;
    std::sort(sorted.begin(), sorted.end());
    auto index = static_cast<std::size_t>(std::floor((1.0 - confidence) * static_cast<double>(sorted.size())));
    index = std::min(index, sorted.size() - 1);
    return std::max(0.0, -sorted[index]);
}

double RiskCalculator::calculate_max_drawdown(const std::vector<double>& values) {
    double peak = 0.0;
    double worst = 0.0;
    for (double v : values) {
        peak = std::max(peak, v);
        if (peak > 0.0) {
            worst = std::max(worst, (peak - v) / peak);
        }
    }
    return worst;
}

double RiskCalculator::calculate_current_drawdown(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double peak = *std::max_element(values.begin(), values.end());
    return peak > 0.0 ? (peak - values.back()) / peak : 0.0;
}

double RiskCalculator::calculate_kelly_criterion(double win_rate, double avg_win, double avg_loss) {
    if (avg_win <= 0.0 || avg_loss <= 0.0) {
        return 0.0;
    }
    double payoff = avg_win / avg_loss;
    double kelly = win_rate - (1.0 - win_rate) / payoff;
    return std::clamp(kelly, 0.0, kMaxKellyFraction);
}

AccountMetrics compute_account_metrics(const Account& account, const RiskState& risk,
                                       const std::vector<double>& equity_series) {
    AccountMetrics m;
    m.account_id = account.id;
    m.equity = account.equity();
    m.daily_pnl = account.daily_pnl();
    m.daily_pnl_pct = account.session_start_equity > 0.0 ? m.daily_pnl / account.session_start_equity * 100.0 : 0.0;
    m.open_positions = account.positions.size();
    m.exposure_pct = account.exposure_fraction() * 100.0;
    m.trades_today = risk.trades_today();
    m.day_trades_today = risk.day_trades_today();
    m.consecutive_losses = risk.consecutive_losses();
    m.daily_realized_pnl = risk.daily_realized_pnl();
    m.halted = risk.halted();
    m.halt_reason = risk.halt_reason();

    auto returns = RiskCalculator::returns_from(equity_series);
    m.samples = returns.size();
    m.sharpe_ratio = RiskCalculator::calculate_sharpe_ratio(returns);
    m.sortino_ratio = RiskCalculator::calculate_sortino_ratio(returns);
    m.var_95 = RiskCalculator::calculate_historical_var(returns);
    m.max_drawdown = RiskCalculator::calculate_max_drawdown(equity_series);
    return m;
}

} // namespace sentinel
