#include "sentinel/serialization.hpp"
#include "sentinel/clock.hpp"

#include <cmath>

namespace sentinel {

namespace {

nlohmann::json timestamp_or_null(const std::optional<Timestamp>& t) {
    return t ? nlohmann::json(format_timestamp(*t)) : nlohmann::json(nullptr);
}

nlohmann::json finite_or_null(double value) {
    return std::isfinite(value) ? nlohmann::json(value) : nlohmann::json(nullptr);
}

} // namespace

void to_json(nlohmann::json& j, const Position& position) {
    j = {
        {"symbol", position.symbol},
        {"quantity", position.quantity},
        {"entry_price", position.entry_price},
        {"current_price", position.current_price},
        {"market_value", position.market_value()},
        {"unrealized_pnl", position.unrealized_pnl()},
        {"opened_at", format_timestamp(position.opened_at)}
    };
}

void to_json(nlohmann::json& j, const Candidate& candidate) {
    j = {
        {"symbol", candidate.symbol},
        {"score", candidate.score},
        {"confidence", candidate.confidence}
    };
    if (candidate.last_price) {
        j["last_price"] = *candidate.last_price;
    }
}

void from_json(const nlohmann::json& j, Candidate& candidate) {
    j.at("symbol").get_to(candidate.symbol);
    j.at("score").get_to(candidate.score);
    candidate.confidence = j.value("confidence", 0.0);
    if (j.contains("last_price") && !j.at("last_price").is_null()) {
        candidate.last_price = j.at("last_price").get<double>();
    } else {
        candidate.last_price.reset();
    }
}

void to_json(nlohmann::json& j, const AccountCycleResult& slot) {
    j = {
        {"account_id", slot.account_id},
        {"failed", slot.failed},
        {"halted", slot.halted},
        {"skipped", slot.skipped},
        {"orders_attempted", slot.orders_attempted},
        {"orders_filled", slot.orders_filled},
        {"orders_rejected", slot.orders_rejected},
        {"rejections", slot.rejections},
        {"errors", slot.errors},
        {"equity", slot.equity},
        {"exposure", finite_or_null(slot.exposure)},
        {"daily_pnl", slot.daily_pnl},
        {"open_positions", slot.open_positions},
        {"trades_today", slot.trades_today}
    };
}

void to_json(nlohmann::json& j, const CycleResult& cycle) {
    j = {
        {"sequence", cycle.sequence},
        {"mode", to_string(cycle.mode)},
        {"started_at", format_timestamp(cycle.started_at)},
        {"finished_at", format_timestamp(cycle.finished_at)},
        {"duration_ms", cycle.duration().count()},
        {"cancelled", cycle.cancelled},
        {"accounts_processed", cycle.accounts_processed()},
        {"orders_attempted", cycle.orders_attempted()},
        {"orders_filled", cycle.orders_filled()},
        {"orders_rejected", cycle.orders_rejected()},
        {"accounts", cycle.accounts},
        {"backtests", cycle.backtests},
        {"errors", cycle.errors}
    };
}

void to_json(nlohmann::json& j, const OrderRecord& order) {
    j = {
        {"account_id", order.account_id},
        {"order_id", order.order_id},
        {"client_order_id", order.client_order_id},
        {"symbol", order.symbol},
        {"side", to_string(order.side)},
        {"quantity", order.quantity},
        {"price", order.price},
        {"realized_pnl", order.realized_pnl},
        {"risk_reducing", order.risk_reducing},
        {"reason", order.reason},
        {"timestamp", format_timestamp(order.timestamp)}
    };
}

void to_json(nlohmann::json& j, const BreakerEvent& event) {
    j = {
        {"account_id", event.account_id},
        {"reason", event.reason},
        {"origin", to_string(event.origin)},
        {"state", event.opened ? "OPEN" : "CLOSED"},
        {"timestamp", format_timestamp(event.timestamp)}
    };
}

void to_json(nlohmann::json& j, const BacktestReport& report) {
    j = {
        {"strategy", report.strategy},
        {"symbols", report.symbols},
        {"total_return_pct", report.total_return_pct},
        {"sharpe_ratio", report.sharpe_ratio},
        {"win_rate", report.win_rate},
        {"total_trades", report.total_trades}
    };
}

void to_json(nlohmann::json& j, const DailyAccountSummary& summary) {
    j = {
        {"account_id", summary.account_id},
        {"equity", summary.equity},
        {"daily_pnl", summary.daily_pnl},
        {"daily_pnl_pct", summary.daily_pnl_pct},
        {"trades_today", summary.trades_today},
        {"halted", summary.halted}
    };
}

void to_json(nlohmann::json& j, const DailyReport& report) {
    j = {
        {"generated_at", format_timestamp(report.generated_at)},
        {"cycles", report.cycles},
        {"errors", report.errors},
        {"accounts", report.accounts}
    };
}

void to_json(nlohmann::json& j, const AccountMetrics& m) {
    j = {
        {"account_id", m.account_id},
        {"equity", m.equity},
        {"daily_pnl", m.daily_pnl},
        {"daily_pnl_pct", m.daily_pnl_pct},
        {"open_positions", m.open_positions},
        {"exposure_pct", finite_or_null(m.exposure_pct)},
        {"trades_today", m.trades_today},
        {"day_trades_today", m.day_trades_today},
        {"consecutive_losses", m.consecutive_losses},
        {"daily_realized_pnl", m.daily_realized_pnl},
        {"circuit_breaker", m.halted ? "OPEN" : "CLOSED"},
        {"halt_reason", m.halt_reason},
        {"sharpe_ratio", m.sharpe_ratio},
        {"sortino_ratio", m.sortino_ratio},
        {"var_95", m.var_95},
        {"max_drawdown", m.max_drawdown},
        {"samples", m.samples}
    };
}

void to_json(nlohmann::json& j, const MetricsSnapshot& snapshot) {
    j = {
        {"generated_at", format_timestamp(snapshot.generated_at)},
        {"cycle_sequence", snapshot.cycle_sequence},
        {"mode", snapshot.mode ? nlohmann::json(to_string(*snapshot.mode)) : nlohmann::json(nullptr)},
        {"cycles_in_window", snapshot.cycles_in_window},
        {"orders_attempted", snapshot.orders_attempted},
        {"orders_filled", snapshot.orders_filled},
        {"orders_rejected", snapshot.orders_rejected},
        {"errors", snapshot.errors},
        {"accounts", snapshot.accounts}
    };
}

void to_json(nlohmann::json& j, const HealthReport& report) {
    j = {
        {"status", report.status},
        {"uptime_seconds", report.uptime_seconds},
        {"connectivity", report.connectivity},
        {"last_cycle_at", timestamp_or_null(report.last_cycle_at)},
        {"mode", report.mode ? nlohmann::json(to_string(*report.mode)) : nlohmann::json(nullptr)},
        {"cycle_count", report.cycle_count},
        {"error_count", report.error_count},
        {"halted_accounts", report.halted_accounts},
        {"emergency_stop_pending", report.emergency_stop_pending}
    };
}

} // namespace sentinel
