#include "sentinel/types.hpp"

#include <cmath>
#include <limits>

namespace sentinel {

double Position::unrealized_pnl_pct() const {
    double cost_basis = std::abs(quantity * entry_price);
    if (cost_basis <= 0.0) {
        return 0.0;
    }
    return unrealized_pnl() / cost_basis;
}

double Account::equity() const {
    double total = cash;
    for (const auto& [symbol, pos] : positions) {
        total += pos.market_value();
    }
    return total;
}

double Account::gross_exposure() const {
    double total = 0.0;
    for (const auto& [symbol, pos] : positions) {
        total += std::abs(pos.market_value());
    }
    return total;
}

double Account::exposure_fraction() const {
    double eq = equity();
    double gross = gross_exposure();
    if (eq <= 0.0) {
        return gross > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
    }
    return gross / eq;
}

double Account::daily_pnl() const {
    if (session_start_equity <= 0.0) {
        return 0.0;
    }
    return equity() - session_start_equity;
}

const Position* Account::find_position(const std::string& symbol) const {
    auto it = positions.find(symbol);
    return it != positions.end() ? &it->second : nullptr;
}

std::optional<double> Account::price_of(const std::string& symbol) const {
    if (const auto* pos = find_position(symbol); pos && pos->current_price > 0.0) {
        return pos->current_price;
    }
    auto it = quotes.find(symbol);
    if (it != quotes.end() && it->second > 0.0) {
        return it->second;
    }
    return std::nullopt;
}

std::string RiskState::halt_reason() const {
    if (const auto* open = std::get_if<BreakerOpen>(&breaker_)) {
        return open->reason;
    }
    return {};
}

std::size_t CycleResult::accounts_processed() const {
    std::size_t count = 0;
    for (const auto& slot : accounts) {
        if (!slot.skipped) {
            ++count;
        }
    }
    return count;
}

int CycleResult::orders_attempted() const {
    int total = 0;
    for (const auto& slot : accounts) {
        total += slot.orders_attempted;
    }
    return total;
}

int CycleResult::orders_filled() const {
    int total = 0;
    for (const auto& slot : accounts) {
        total += slot.orders_filled;
    }
    return total;
}

int CycleResult::orders_rejected() const {
    int total = 0;
    for (const auto& slot : accounts) {
        total += slot.orders_rejected;
    }
    return total;
}

std::size_t CycleResult::error_count() const {
    std::size_t total = errors.size();
    for (const auto& slot : accounts) {
        total += slot.errors.size();
    }
    return total;
}

const char* to_string(Side side) {
    return side == Side::Buy ? "buy" : "sell";
}

const char* to_string(TradingMode mode) {
    return mode == TradingMode::Trading ? "TRADING" : "BACKTESTING";
}

const char* to_string(ActionKind kind) {
    switch (kind) {
        case ActionKind::Open: return "open";
        case ActionKind::Close: return "close";
        case ActionKind::Resize: return "resize";
    }
    return "unknown";
}

const char* to_string(StopOrigin origin) {
    switch (origin) {
        case StopOrigin::Dashboard: return "dashboard";
        case StopOrigin::CircuitBreaker: return "circuit_breaker";
        case StopOrigin::Operator: return "operator";
        case StopOrigin::Signal: return "signal";
    }
    return "unknown";
}

const char* to_string(Severity severity) {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

std::optional<StopOrigin> parse_stop_origin(const std::string& text) {
    if (text == "dashboard") return StopOrigin::Dashboard;
    if (text == "circuit_breaker") return StopOrigin::CircuitBreaker;
    if (text == "operator") return StopOrigin::Operator;
    if (text == "signal") return StopOrigin::Signal;
    return std::nullopt;
}

} // namespace sentinel
