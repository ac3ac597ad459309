#include "sentinel/metrics.hpp"
#include "sentinel/paper.hpp"

#include <algorithm>
#include <cmath>

namespace sentinel {

ThresholdStrategy::ThresholdStrategy(StrategyConfig config) : config_(config) {}

std::vector<CandidateAction> ThresholdStrategy::propose(const Account& account,
                                                        const std::vector<Candidate>& candidates) {
    std::vector<CandidateAction> actions;
    const RiskLimits& limits = account.limits;

    for (const auto& [symbol, position] : account.positions) {
        auto it = std::find_if(candidates.begin(), candidates.end(),
                               [&](const Candidate& c) { return c.symbol == symbol; });
        if (it == candidates.end() || it->score < config_.exit_score) {
            CandidateAction close;
            close.symbol = symbol;
            close.kind = ActionKind::Close;
            close.side = position.quantity > 0.0 ? Side::Sell : Side::Buy;
            close.quantity = std::abs(position.quantity);
            close.reference_price = position.current_price;
            close.reason = "WEAK_SIGNALS";
            actions.push_back(close);
        }
    }

    std::vector<Candidate> ranked = candidates;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const Candidate& a, const Candidate& b) { return a.score > b.score; });

    double equity = account.equity();
    for (const auto& candidate : ranked) {
        if (candidate.score < config_.min_score || candidate.confidence < config_.min_confidence) {
            continue;
        }
        if (account.find_position(candidate.symbol)) {
            continue;
        }
        auto price = account.price_of(candidate.symbol);
        if (!price && candidate.last_price) {
            price = candidate.last_price;
        }
        if (!price || *price <= 0.0 || equity <= 0.0) {
            continue;
        }

        CandidateAction open;
        open.symbol = candidate.symbol;
        open.kind = ActionKind::Open;
        open.side = Side::Buy;
        open.reference_price = *price;
        open.quantity = limits.max_position_size * equity / *price;
        double win_rate = std::min(candidate.confidence / 10.0, 1.0);
        double kelly = RiskCalculator::calculate_kelly_criterion(win_rate, limits.take_profit_pct, limits.stop_loss_pct);
        if (kelly > 0.0) {
            open.kelly_fraction = kelly;
        }
        open.reason = "score " + std::to_string(static_cast<int>(candidate.score));
        actions.push_back(open);
    }
    return actions;
}

} // namespace sentinel
