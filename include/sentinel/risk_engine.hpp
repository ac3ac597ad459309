#pragma once

#include "adapters.hpp"
#include "clock.hpp"
#include "types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace sentinel {

struct Admission {
    enum class Verdict {
        Allow,
        Reject
    };

    Verdict verdict = Verdict::Reject;
    Side side = Side::Buy;
    double quantity = 0.0;      // whole shares, always positive when allowed
    double price = 0.0;
    bool clamped = false;
    bool risk_reducing = false;
    std::string reason;

    bool allowed() const { return verdict == Verdict::Allow; }
};

struct FillOutcome {
    bool closed = false;        // some quantity of an existing position was closed
    bool day_trade = false;
    double realized_pnl = 0.0;
};

// Admission control between strategy intent and the broker, plus the
// per-account circuit breaker. Every operation reads and writes only the
// Account and RiskState it is handed.
class RiskEngine {
public:
    using SessionDateFn = std::function<CivilDate(Timestamp)>;

    // session_date maps a timestamp to its exchange session date; it decides
    // which closes count as day trades.
    explicit RiskEngine(SessionDateFn session_date = {});

    // Checks in order: breaker, protective exit, PDT, position size
    // (clamps), total exposure. First failure wins.
    Admission admit(const Account& account, const RiskState& risk, const CandidateAction& action,
                    Timestamp now) const;

    // Close actions for positions at or beyond stop-loss or take-profit.
    std::vector<CandidateAction> protective_exits(const Account& account) const;

    // Full close of every open position, priced at the last mark.
    std::vector<CandidateAction> liquidation(const Account& account, const std::string& reason) const;

    // Replaces local positions and cash with the broker's view. Keeps local
    // opened_at for positions that are still held.
    void reconcile(Account& account, RiskState& risk, const BrokerAccount& broker,
                   const std::vector<Position>& positions, const PriceMap& prices) const;

    FillOutcome apply_fill(Account& account, RiskState& risk, const std::string& symbol, Side side,
                           double quantity, double price, Timestamp now) const;

    // Reason to open the breaker, if any. Does not mutate.
    std::optional<std::string> evaluate_circuit_breaker(const Account& account, const RiskState& risk) const;

    // CLOSED -> OPEN. Returns false when already open.
    bool trip(RiskState& risk, const std::string& reason, Timestamp now) const;

    // New trading session: counters, P&L, streak and breaker start over.
    void reset_session(Account& account, RiskState& risk) const;

    // Manual override. Also re-bases the daily loss measurement on current
    // equity so the breaker does not re-trip on the same losses.
    bool reset_breaker(Account& account, RiskState& risk) const;

    static bool is_protective(const Position& position, const RiskLimits& limits);

    // True for opens and resizes in the direction of the held position,
    // which count against the per-cycle trade cap.
    static bool adds_exposure(const Account& account, const CandidateAction& action);

private:
    SessionDateFn session_date_;
    std::shared_ptr<spdlog::logger> logger_;

    bool same_session(Timestamp a, Timestamp b) const;
};

} // namespace sentinel
