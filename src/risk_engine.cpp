#include "sentinel/risk_engine.hpp"
#include "sentinel/logging.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace sentinel {

namespace {

// Absorbs representation error before flooring to whole shares.
constexpr double kShareEpsilon = 1e-9;

Admission reject(std::string reason) {
    Admission admission;
    admission.verdict = Admission::Verdict::Reject;
    admission.reason = std::move(reason);
    return admission;
}

double whole_shares(double quantity) {
    return std::floor(quantity + kShareEpsilon);
}

double sign_of(double value) {
    return value < 0.0 ? -1.0 : 1.0;
}

CivilDate utc_date(Timestamp t) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
    long days = static_cast<long>(secs / 86400);
    if (secs % 86400 < 0) {
        --days;
    }
    return civil_from_days(days);
}

} // namespace

RiskEngine::RiskEngine(SessionDateFn session_date)
    : session_date_(session_date ? std::move(session_date) : SessionDateFn(utc_date)),
      logger_(make_logger("risk_engine")) {}

bool RiskEngine::same_session(Timestamp a, Timestamp b) const {
    return session_date_(a) == session_date_(b);
}

bool RiskEngine::is_protective(const Position& position, const RiskLimits& limits) {
    double pct = position.unrealized_pnl_pct();
    return pct <= -limits.stop_loss_pct || pct >= limits.take_profit_pct;
}

bool RiskEngine::adds_exposure(const Account& account, const CandidateAction& action) {
    if (action.kind == ActionKind::Close) {
        return false;
    }
    const Position* position = account.find_position(action.symbol);
    if (!position || position->quantity == 0.0) {
        return true;
    }
    double direction = action.side == Side::Buy ? 1.0 : -1.0;
    return sign_of(position->quantity) == direction;
}

Admission RiskEngine::admit(const Account& account, const RiskState& risk, const CandidateAction& action,
                            Timestamp now) const {
    const RiskLimits& limits = account.limits;

    // 1. circuit breaker
    if (risk.halted()) {
        return reject("account halted");
    }

    double price = action.reference_price > 0.0 ? action.reference_price
                                                : account.price_of(action.symbol).value_or(0.0);
    if (!(price > 0.0) || !std::isfinite(price)) {
        return reject("no price for " + action.symbol);
    }
    double equity = account.equity();
    if (!(equity > 0.0)) {
        return reject("non-positive equity");
    }

    const Position* position = account.find_position(action.symbol);
    double held = position ? position->quantity : 0.0;

    Admission admission;
    admission.verdict = Admission::Verdict::Allow;
    admission.price = price;
    admission.reason = action.reason;

    if (action.kind == ActionKind::Close) {
        if (!position) {
            return reject("no position to close");
        }
        double quantity = action.quantity > 0.0 ? std::min(action.quantity, std::abs(held)) : std::abs(held);
        admission.side = held > 0.0 ? Side::Sell : Side::Buy;
        admission.quantity = quantity;
        admission.risk_reducing = true;

        Position marked = *position;
        marked.current_price = price;
        if (is_protective(marked, limits)) {
            admission.reason = marked.unrealized_pnl_pct() <= -limits.stop_loss_pct ? "stop-loss" : "take-profit";
            return admission;
        }
        // 2. a same-session round trip is a day trade
        if (same_session(position->opened_at, now) && risk.day_trades_today() + 1 > limits.max_day_trades) {
            return reject("PDT limit");
        }
        return admission;
    }

    double requested = action.quantity;
    if (limits.kelly_enabled && action.kelly_fraction && std::isfinite(*action.kelly_fraction)) {
        double multiplier = limits.aggressive_sizing_enabled ? limits.risk_multiplier
                                                             : std::min(limits.risk_multiplier, 1.0);
        double target = multiplier * *action.kelly_fraction * equity;
        double cap = limits.max_position_size * equity;
        if (target > cap) {
            target = cap;
            admission.clamped = true;
        }
        if (!(target > 0.0)) {
            return reject("below minimum size");
        }
        requested = target / price;
    }
    if (!(requested > 0.0) || !std::isfinite(requested)) {
        return reject("invalid quantity");
    }

    double direction = action.side == Side::Buy ? 1.0 : -1.0;
    admission.side = action.side;

    // Orders against an existing position reduce it and never flip it.
    if (held != 0.0 && sign_of(held) != direction) {
        double quantity = whole_shares(std::min(requested, std::abs(held)));
        if (quantity <= 0.0 || (quantity < limits.min_order_quantity && quantity < std::abs(held))) {
            return reject("below minimum size");
        }
        if (same_session(position->opened_at, now) && risk.day_trades_today() + 1 > limits.max_day_trades) {
            return reject("PDT limit");
        }
        admission.quantity = quantity;
        admission.risk_reducing = true;
        return admission;
    }

    // 2. pattern day trader budget exhausted
    if (risk.day_trades_today() >= limits.max_day_trades) {
        return reject("PDT limit");
    }

    // 3. position size, clamped
    double quantity = whole_shares(requested);
    double room = whole_shares(limits.max_position_size * equity / price) - std::abs(held);
    if (quantity > room) {
        quantity = std::max(0.0, room);
        admission.clamped = true;
    }
    if (quantity < limits.min_order_quantity) {
        return reject("below minimum size");
    }

    // 4. total exposure
    double current = position ? std::abs(position->market_value()) : 0.0;
    double resulting = account.gross_exposure() - current + std::abs(held + direction * quantity) * price;
    if (resulting / equity > limits.max_total_exposure) {
        std::ostringstream reason;
        reason << "exposure limit (" << resulting / equity << " > " << limits.max_total_exposure << ")";
        return reject(reason.str());
    }

    admission.quantity = quantity;
    return admission;
}

std::vector<CandidateAction> RiskEngine::protective_exits(const Account& account) const {
    std::vector<CandidateAction> exits;
    for (const auto& [symbol, position] : account.positions) {
        if (!is_protective(position, account.limits)) {
            continue;
        }
        CandidateAction action;
        action.symbol = symbol;
        action.kind = ActionKind::Close;
        action.side = position.quantity > 0.0 ? Side::Sell : Side::Buy;
        action.quantity = std::abs(position.quantity);
        action.reference_price = position.current_price;
        action.reason = position.unrealized_pnl_pct() <= -account.limits.stop_loss_pct ? "stop-loss" : "take-profit";
        exits.push_back(action);
    }
    return exits;
}

std::vector<CandidateAction> RiskEngine::liquidation(const Account& account, const std::string& reason) const {
    std::vector<CandidateAction> closes;
    for (const auto& [symbol, position] : account.positions) {
        if (std::abs(position.quantity) < kShareEpsilon) {
            continue;
        }
        CandidateAction action;
        action.symbol = symbol;
        action.kind = ActionKind::Close;
        action.side = position.quantity > 0.0 ? Side::Sell : Side::Buy;
        action.quantity = std::abs(position.quantity);
        action.reference_price = position.current_price > 0.0 ? position.current_price : position.entry_price;
        action.reason = reason;
        closes.push_back(action);
    }
    return closes;
}

void RiskEngine::reconcile(Account& account, RiskState& risk, const BrokerAccount& broker,
                           const std::vector<Position>& positions, const PriceMap& prices) const {
    std::map<std::string, Position> refreshed;
    for (const auto& remote : positions) {
        if (remote.quantity == 0.0) {
            continue;
        }
        Position pos = remote;
        auto local = account.positions.find(remote.symbol);
        if (local != account.positions.end() && sign_of(local->second.quantity) == sign_of(remote.quantity)) {
            pos.opened_at = local->second.opened_at;
        }
        auto quote = prices.find(remote.symbol);
        if (quote != prices.end() && quote->second > 0.0) {
            pos.current_price = quote->second;
        }
        refreshed[pos.symbol] = pos;
    }
    account.positions = std::move(refreshed);
    account.cash = broker.cash;
    for (const auto& [symbol, price] : prices) {
        account.quotes[symbol] = price;
    }
    if (account.session_start_equity <= 0.0) {
        account.session_start_equity = account.equity();
    }
    risk.day_trades_today_ = std::max(risk.day_trades_today_, broker.day_trade_count);
}

FillOutcome RiskEngine::apply_fill(Account& account, RiskState& risk, const std::string& symbol, Side side,
                                   double quantity, double price, Timestamp now) const {
    FillOutcome outcome;
    double delta = side == Side::Buy ? quantity : -quantity;
    account.cash -= delta * price;
    account.quotes[symbol] = price;
    ++risk.trades_today_;

    auto it = account.positions.find(symbol);
    if (it == account.positions.end()) {
        account.positions[symbol] = Position{symbol, delta, price, price, now};
        return outcome;
    }

    Position& pos = it->second;
    pos.current_price = price;
    if (sign_of(pos.quantity) == sign_of(delta)) {
        // Weighted average entry
        double total = pos.quantity + delta;
        pos.entry_price = (pos.entry_price * pos.quantity + price * delta) / total;
        pos.quantity = total;
        return outcome;
    }

    double closing = std::min(std::abs(delta), std::abs(pos.quantity));
    outcome.closed = true;
    outcome.realized_pnl = (price - pos.entry_price) * closing * sign_of(pos.quantity);
    outcome.day_trade = same_session(pos.opened_at, now);

    risk.daily_realized_pnl_ += outcome.realized_pnl;
    if (outcome.realized_pnl < 0.0) {
        ++risk.consecutive_losses_;
    } else {
        risk.consecutive_losses_ = 0;
    }
    if (outcome.day_trade) {
        ++risk.day_trades_today_;
    }

    double remaining = pos.quantity + delta;
    if (std::abs(remaining) < kShareEpsilon) {
        account.positions.erase(it);
    } else if (sign_of(remaining) != sign_of(pos.quantity)) {
        pos.quantity = remaining;
        pos.entry_price = price;
        pos.opened_at = now;
    } else {
        pos.quantity = remaining;
    }
    return outcome;
}

std::optional<std::string> RiskEngine::evaluate_circuit_breaker(const Account& account,
                                                                const RiskState& risk) const {
    const RiskLimits& limits = account.limits;
    if (!limits.circuit_breaker_enabled || risk.halted()) {
        return std::nullopt;
    }
    double base = account.session_start_equity > 0.0 ? account.session_start_equity : account.equity();
    double floor = -limits.daily_loss_limit * base;
    if (risk.daily_realized_pnl() <= floor) {
        std::ostringstream reason;
        reason << "daily loss limit: realized " << risk.daily_realized_pnl() << " <= " << floor;
        return reason.str();
    }
    if (risk.consecutive_losses() >= limits.max_consecutive_losses) {
        return "consecutive losses: " + std::to_string(risk.consecutive_losses());
    }
    return std::nullopt;
}

bool RiskEngine::trip(RiskState& risk, const std::string& reason, Timestamp now) const {
    if (risk.halted()) {
        return false;
    }
    risk.breaker_ = BreakerOpen{reason, now};
    return true;
}

void RiskEngine::reset_session(Account& account, RiskState& risk) const {
    risk = RiskState{};
    account.session_start_equity = 0.0;
}

bool RiskEngine::reset_breaker(Account& account, RiskState& risk) const {
    if (!risk.halted()) {
        return false;
    }
    risk.breaker_ = BreakerClosed{};
    risk.consecutive_losses_ = 0;
    risk.daily_realized_pnl_ = 0.0;
    account.session_start_equity = account.equity();
    logger_->warn("Circuit breaker reset for account {}", account.id);
    return true;
}

} // namespace sentinel
