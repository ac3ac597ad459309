#include "sentinel/scheduler.hpp"
#include "sentinel/logging.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace sentinel {

namespace {

constexpr AdapterKind kProbedAdapters[] = {
    AdapterKind::Broker,
    AdapterKind::Candidates,
    AdapterKind::Persistence,
};

} // namespace

std::string describe(const SchedulerState& state) {
    if (std::holds_alternative<SchedulerStarting>(state)) {
        return "STARTING";
    }
    if (const auto* running = std::get_if<SchedulerRunning>(&state)) {
        return std::string("RUNNING(") + to_string(running->mode) + ")";
    }
    if (const auto* stopping = std::get_if<SchedulerStopping>(&state)) {
        return "STOPPING(" + stopping->reason + ")";
    }
    return "STOPPED";
}

AccountRegistry::AccountRegistry(const Config& config) {
    for (const auto& cfg : config.accounts) {
        AccountContext ctx;
        ctx.account.id = cfg.id;
        ctx.account.starting_equity = cfg.starting_equity;
        ctx.account.cash = cfg.starting_equity;
        ctx.account.limits = limits_for(config, cfg);
        accounts_.push_back(std::move(ctx));
    }
}

AccountContext* AccountRegistry::find(const std::string& id) {
    for (auto& ctx : accounts_) {
        if (ctx.account.id == id) {
            return &ctx;
        }
    }
    return nullptr;
}

const AccountContext* AccountRegistry::find(const std::string& id) const {
    for (const auto& ctx : accounts_) {
        if (ctx.account.id == id) {
            return &ctx;
        }
    }
    return nullptr;
}

std::vector<AccountView> AccountRegistry::views() const {
    std::vector<AccountView> views;
    views.reserve(accounts_.size());
    for (const auto& ctx : accounts_) {
        views.push_back(AccountView{ctx.account, ctx.risk});
    }
    return views;
}

ModeScheduler::ModeScheduler(std::shared_ptr<const Config> config, Collaborators collaborators, Clock& clock,
                             ConnectivityTracker& tracker, ControlSurface& surface, EmergencyStopChannel& channel)
    : config_(std::move(config)),
      collab_(std::move(collaborators)),
      clock_(clock),
      tracker_(tracker),
      surface_(surface),
      channel_(channel),
      oracle_(collab_.calendar, config_->market_session),
      risk_([this](Timestamp t) { return oracle_.session_date(t); }),
      caller_(clock, tracker, RetryPolicy::from(config_->scheduler), config_->scheduler.adapter_timeout),
      notifier_(collab_.notifications, clock, caller_, config_->monitoring.notification_cooldown),
      audit_(collab_.persistence, caller_, AuditTrail::kDefaultCapacity),
      registry_(*config_),
      logger_(make_logger("scheduler")) {
    if (!collab_.broker || !collab_.candidates || !collab_.persistence || !collab_.strategy || !collab_.calendar) {
        throw std::invalid_argument("ModeScheduler requires broker, candidates, persistence, strategy and calendar");
    }
    if (!config_->risk_management.account_isolation) {
        logger_->warn("account_isolation=false requested; accounts are always processed in isolation");
    }
}

void ModeScheduler::set_state(SchedulerState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = std::move(state);
}

SchedulerState ModeScheduler::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void ModeScheduler::start() {
    if (!std::holds_alternative<SchedulerStarting>(state())) {
        return;
    }
    TradingMode mode = evaluate_mode(clock_.now());
    surface_.set_phase(ControlSurface::Phase::Running);
    surface_.publish(registry_.views(), last_candidates_, std::nullopt, mode);
    logger_->info("Scheduler started in {} mode with {} accounts", to_string(mode), registry_.all().size());
}

void ModeScheduler::request_breaker_reset(const std::string& account_id) {
    std::lock_guard<std::mutex> lock(resets_mutex_);
    pending_resets_.push_back(account_id);
}

TradingMode ModeScheduler::evaluate_mode(Timestamp now) {
    TradingMode mode = oracle_.is_market_open(now) ? TradingMode::Trading : TradingMode::Backtesting;
    if (mode_ && *mode_ != mode) {
        logger_->info("Market session boundary: switching {} -> {}", to_string(*mode_), to_string(mode));
    }
    mode_ = mode;
    if (!stopping_) {
        set_state(SchedulerRunning{mode});
    }
    return mode;
}

void ModeScheduler::begin_session_if_needed(Timestamp now) {
    CivilDate today = oracle_.session_date(now);
    if (stopping_ || (session_date_ && *session_date_ == today)) {
        return;
    }
    if (session_date_) {
        for (auto& ctx : registry_.all()) {
            if (ctx.risk.halted()) {
                audit_.append(BreakerEvent{ctx.account.id, "session reset", StopOrigin::Operator, false, now});
            }
            risk_.reset_session(ctx.account, ctx.risk);
        }
    }
    session_date_ = today;
    logger_->info("Trading session {} started", today.to_string());
}

void ModeScheduler::apply_pending_resets() {
    std::vector<std::string> resets;
    {
        std::lock_guard<std::mutex> lock(resets_mutex_);
        resets.swap(pending_resets_);
    }
    for (const auto& id : resets) {
        if (stopping_) {
            logger_->warn("Ignoring breaker reset for {}: emergency stop in progress", id);
            continue;
        }
        auto* ctx = registry_.find(id);
        if (!ctx) {
            logger_->warn("Ignoring breaker reset for unknown account {}", id);
            continue;
        }
        if (risk_.reset_breaker(ctx->account, ctx->risk)) {
            ctx->failed_cycles = 0;
            audit_.append(BreakerEvent{id, "manual reset", StopOrigin::Operator, false, clock_.now()});
        }
    }
}

std::vector<Candidate> ModeScheduler::fetch_candidates(CycleResult& cycle) {
    try {
        auto candidates = caller_.call(AdapterKind::Candidates, "get_qualified_candidates",
                                       [this](const CallContext& ctx) {
                                           return collab_.candidates->get_qualified_candidates(ctx);
                                       });
        last_candidates_ = candidates;
        return candidates;
    } catch (const std::exception& e) {
        logger_->warn("Candidate source unavailable: {}", e.what());
        cycle.errors.push_back(std::string("candidates: ") + e.what());
        return {};
    }
}

CycleResult ModeScheduler::run_cycle() {
    CycleResult cycle;
    cycle.sequence = ++sequence_;
    cycle.started_at = clock_.now();
    cycle.mode = evaluate_mode(cycle.started_at);

    if (cycle.mode == TradingMode::Trading) {
        begin_session_if_needed(cycle.started_at);
    }
    apply_pending_resets();

    if (check_stop()) {
        cycle.cancelled = true;
    } else {
        auto candidates = fetch_candidates(cycle);
        if (cycle.mode == TradingMode::Trading) {
            run_trading(cycle, candidates);
        } else {
            run_backtesting(cycle, candidates);
        }
    }

    cycle.finished_at = clock_.now();
    errors_total_ += cycle.error_count();
    logger_->info("Cycle #{} {} finished in {} ms: {} accounts, {} orders ({} filled, {} rejected), {} errors{}",
                  cycle.sequence, to_string(cycle.mode), cycle.duration().count(), cycle.accounts_processed(),
                  cycle.orders_attempted(), cycle.orders_filled(), cycle.orders_rejected(), cycle.error_count(),
                  cycle.cancelled ? " [cancelled]" : "");

    audit_.append(cycle);
    surface_.publish(registry_.views(), last_candidates_, cycle, cycle.mode);
    audit_.flush();
    return cycle;
}

void ModeScheduler::run_trading(CycleResult& cycle, const std::vector<Candidate>& candidates) {
    for (auto& ctx : registry_.all()) {
        AccountCycleResult slot;
        slot.account_id = ctx.account.id;

        if (check_stop()) {
            cycle.cancelled = true;
            slot.skipped = true;
        } else if (clock_.now() - cycle.started_at > config_->scheduler.cycle_budget) {
            slot.skipped = true;
            slot.errors.push_back("cycle budget exceeded");
            logger_->warn("[{}] Skipped: cycle budget of {} s exceeded", ctx.account.id,
                          config_->scheduler.cycle_budget.count());
        } else {
            process_account(ctx, candidates, slot);
        }
        if (slot.skipped) {
            summarize(ctx, slot);
        }
        cycle.accounts.push_back(std::move(slot));
    }
}

void ModeScheduler::process_account(AccountContext& ctx, const std::vector<Candidate>& candidates,
                                    AccountCycleResult& slot) {
    const std::string& id = ctx.account.id;

    try {
        refresh(ctx, candidates);
        ctx.failed_cycles = 0;
    } catch (const std::exception& e) {
        slot.failed = true;
        slot.errors.push_back(std::string("refresh: ") + e.what());
        ctx.last_error = e.what();
        ++ctx.failed_cycles;
        logger_->error("[{}] Refresh failed ({} consecutive): {}", id, ctx.failed_cycles, e.what());
        if (ctx.failed_cycles >= config_->emergency.max_failed_cycles) {
            escalate(ctx, std::to_string(ctx.failed_cycles) + " consecutive failed cycles: " + e.what(),
                     StopOrigin::CircuitBreaker);
        }
        summarize(ctx, slot);
        return;
    }

    if (ctx.risk.halted()) {
        slot.halted = true;
        logger_->debug("[{}] Halted ({}), reporting only", id, ctx.risk.halt_reason());
        summarize(ctx, slot);
        return;
    }

    try {
        for (const auto& exit : risk_.protective_exits(ctx.account)) {
            execute(ctx, exit, slot);
        }

        auto actions = collab_.strategy->propose(ctx.account, candidates);
        int opened = 0;
        for (const auto& action : actions) {
            bool adds = RiskEngine::adds_exposure(ctx.account, action);
            if (adds && opened >= ctx.account.limits.max_trades_per_cycle) {
                ++slot.orders_rejected;
                slot.rejections.push_back(action.symbol + ": per-cycle trade cap");
                logger_->info("[{}] Rejected {} {}: per-cycle trade cap", id, to_string(action.kind), action.symbol);
                continue;
            }
            if (execute(ctx, action, slot) && adds) {
                ++opened;
            }
        }
    } catch (const std::exception& e) {
        slot.errors.push_back(e.what());
        ctx.last_error = e.what();
        logger_->error("[{}] Account step failed: {}", id, e.what());
    }

    if (auto reason = risk_.evaluate_circuit_breaker(ctx.account, ctx.risk)) {
        escalate(ctx, *reason, StopOrigin::CircuitBreaker);
    }
    summarize(ctx, slot);
}

void ModeScheduler::refresh(AccountContext& ctx, const std::vector<Candidate>& candidates) {
    const std::string id = ctx.account.id;
    auto broker = caller_.call(AdapterKind::Broker, "get_account", [&](const CallContext& call) {
        return collab_.broker->get_account(id, call);
    });
    auto positions = caller_.call(AdapterKind::Broker, "get_positions", [&](const CallContext& call) {
        return collab_.broker->get_positions(id, call);
    });

    std::set<std::string> wanted;
    for (const auto& pos : positions) {
        wanted.insert(pos.symbol);
    }
    for (const auto& candidate : candidates) {
        wanted.insert(candidate.symbol);
    }
    PriceMap prices;
    if (!wanted.empty()) {
        std::vector<std::string> symbols(wanted.begin(), wanted.end());
        prices = caller_.call(AdapterKind::MarketData, "get_prices", [&](const CallContext& call) {
            return collab_.broker->get_prices(symbols, call);
        });
    }
    risk_.reconcile(ctx.account, ctx.risk, broker, positions, prices);
}

bool ModeScheduler::execute(AccountContext& ctx, const CandidateAction& action, AccountCycleResult& slot) {
    const std::string& id = ctx.account.id;
    Timestamp now = clock_.now();

    Admission admission = risk_.admit(ctx.account, ctx.risk, action, now);
    if (!admission.allowed()) {
        ++slot.orders_rejected;
        slot.rejections.push_back(action.symbol + ": " + admission.reason);
        logger_->info("[{}] Rejected {} {}: {}", id, to_string(action.kind), action.symbol, admission.reason);
        return false;
    }
    if (admission.clamped) {
        logger_->info("[{}] {} clamped to {} shares by max_position_size", id, action.symbol, admission.quantity);
    }

    OrderRequest order = make_order(id, action.symbol, admission.side, admission.quantity);
    ++slot.orders_attempted;
    try {
        place(ctx, order, admission.price, admission.reason, admission.risk_reducing);
    } catch (const TimeoutError& e) {
        slot.errors.push_back("order " + order.client_order_id + " timed out: " + e.what());
        logger_->error("[{}] Order {} {} timed out: {}", id, order.client_order_id, order.symbol, e.what());
        return true;
    } catch (const AdapterError& e) {
        slot.errors.push_back("order " + order.client_order_id + " failed: " + e.what());
        logger_->error("[{}] Order {} {} failed: {}", id, order.client_order_id, order.symbol, e.what());
        return true;
    }
    ++slot.orders_filled;
    return true;
}

OrderRequest ModeScheduler::make_order(const std::string& account_id, const std::string& symbol, Side side,
                                       double quantity) {
    OrderRequest order;
    order.account_id = account_id;
    order.client_order_id = account_id + "-" + std::to_string(sequence_) + "-" + std::to_string(++order_counter_);
    order.symbol = symbol;
    order.side = side;
    order.quantity = quantity;
    order.type = OrderType::Market;
    return order;
}

FillOutcome ModeScheduler::place(AccountContext& ctx, const OrderRequest& order, double price,
                                 const std::string& reason, bool risk_reducing) {
    const std::string& id = ctx.account.id;
    std::string order_id;
    try {
        // Never retried: a repeated submission could double the position.
        order_id = caller_.call_once(AdapterKind::Broker, "submit_order", [&](const CallContext& call) {
            return collab_.broker->submit_order(order, call);
        });
    } catch (const TimeoutError&) {
        cancel_unknown(order);
        throw;
    }

    FillOutcome fill = risk_.apply_fill(ctx.account, ctx.risk, order.symbol, order.side, order.quantity, price,
                                        clock_.now());

    OrderRecord record;
    record.account_id = id;
    record.order_id = order_id;
    record.client_order_id = order.client_order_id;
    record.symbol = order.symbol;
    record.side = order.side;
    record.quantity = order.quantity;
    record.price = price;
    record.realized_pnl = fill.realized_pnl;
    record.risk_reducing = risk_reducing;
    record.reason = reason;
    record.timestamp = clock_.now();
    audit_.append(record);

    logger_->info("[{}] {} {} {} @ {:.2f}{}{}", id, to_string(order.side), order.quantity, order.symbol,
                  price, reason.empty() ? "" : " - ", reason);
    if (fill.closed) {
        logger_->info("[{}] Realized P&L on {}: {:.2f}{}", id, order.symbol, fill.realized_pnl,
                      fill.day_trade ? " (day trade)" : "");
    }
    return fill;
}

void ModeScheduler::liquidate(AccountContext& ctx) {
    const std::string& id = ctx.account.id;
    try {
        refresh(ctx, {});
    } catch (const std::exception& e) {
        logger_->error("[{}] Refresh before liquidation failed, closing last known positions: {}", id, e.what());
    }

    auto closes = risk_.liquidation(ctx.account, kLiquidationReason);
    if (closes.empty()) {
        return;
    }
    logger_->critical("[{}] Closing {} positions: {}", id, closes.size(), kLiquidationReason);
    for (const auto& close : closes) {
        OrderRequest order = make_order(id, close.symbol, close.side, close.quantity);
        try {
            place(ctx, order, close.reference_price, close.reason, true);
        } catch (const std::exception& e) {
            logger_->critical("[{}] Failed to close {} {}: {}", id, close.quantity, close.symbol, e.what());
        }
    }
}

void ModeScheduler::cancel_unknown(const OrderRequest& order) {
    try {
        caller_.call_once(AdapterKind::Broker, "cancel_order", [&](const CallContext& call) {
            collab_.broker->cancel_order(order.account_id, order.client_order_id, call);
        });
        logger_->warn("[{}] Cancelled order {} after timeout", order.account_id, order.client_order_id);
    } catch (const std::exception& e) {
        logger_->critical("[{}] Order {} state unknown, cancel failed: {}", order.account_id,
                          order.client_order_id, e.what());
    }
}

void ModeScheduler::escalate(AccountContext& ctx, const std::string& reason, StopOrigin origin) {
    Timestamp now = clock_.now();
    if (!risk_.trip(ctx.risk, reason, now)) {
        return;
    }
    const std::string& id = ctx.account.id;
    logger_->critical("[{}] Circuit breaker OPEN: {}", id, reason);
    audit_.append(BreakerEvent{id, reason, origin, true, now});
    notifier_.notify("breaker:" + id, Severity::Critical, "Circuit breaker tripped for " + id, reason);
}

void ModeScheduler::summarize(const AccountContext& ctx, AccountCycleResult& slot) const {
    slot.equity = ctx.account.equity();
    slot.exposure = ctx.account.exposure_fraction();
    slot.daily_pnl = ctx.account.daily_pnl();
    slot.open_positions = ctx.account.positions.size();
    slot.trades_today = ctx.risk.trades_today();
    if (ctx.risk.halted()) {
        slot.halted = true;
    }
}

void ModeScheduler::run_backtesting(CycleResult& cycle, const std::vector<Candidate>& candidates) {
    if (!collab_.backtester) {
        logger_->info("No backtester configured, skipping backtests");
        return;
    }

    std::vector<Candidate> ranked = candidates;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const Candidate& a, const Candidate& b) { return a.score > b.score; });
    if (ranked.size() > config_->scheduler.backtest_top_n) {
        ranked.resize(config_->scheduler.backtest_top_n);
    }
    std::vector<std::string> symbols;
    for (const auto& c : ranked) {
        symbols.push_back(c.symbol);
    }
    if (symbols.empty()) {
        logger_->info("No qualified candidates to backtest");
        return;
    }

    std::optional<BacktestReport> best;
    for (const auto& strategy : config_->scheduler.backtest_strategies) {
        if (check_stop()) {
            cycle.cancelled = true;
            break;
        }
        try {
            auto report = caller_.call(AdapterKind::Backtester, "backtest " + strategy,
                                       [&](const CallContext& call) {
                                           return collab_.backtester->run(strategy, symbols, call);
                                       });
            if (!report) {
                logger_->info("Backtest {} produced no trades", strategy);
                continue;
            }
            logger_->info("Backtest {}: return {:.2f}%, sharpe {:.2f}, win rate {:.1f}%, {} trades", strategy,
                          report->total_return_pct, report->sharpe_ratio, report->win_rate * 100.0,
                          report->total_trades);
            cycle.backtests.push_back(*report);
            audit_.append(*report);
            if (!best || report->total_return_pct > best->total_return_pct) {
                best = report;
            }
        } catch (const std::exception& e) {
            logger_->warn("Backtest {} failed: {}", strategy, e.what());
            cycle.errors.push_back("backtest " + strategy + ": " + e.what());
        }
    }

    if (best) {
        logger_->info("Best strategy: {} ({:.2f}%)", best->strategy, best->total_return_pct);
        if (best->total_return_pct > kBacktestNotifyReturnPct) {
            notifier_.notify("backtest:" + best->strategy, Severity::Info, "Backtest result",
                             best->strategy + " returned " + std::to_string(best->total_return_pct) + "%");
        }
    }
}

bool ModeScheduler::check_stop() {
    if (auto request = channel_.consume()) {
        handle_stop(*request);
    }
    return stopping_;
}

void ModeScheduler::handle_stop(const EmergencyStopRequest& request) {
    stopping_ = true;
    stop_reason_ = request.reason;
    Timestamp now = clock_.now();
    for (auto& ctx : registry_.all()) {
        if (risk_.trip(ctx.risk, "emergency stop: " + request.reason, now)) {
            audit_.append(BreakerEvent{ctx.account.id, request.reason, request.origin, true, now});
        }
    }
    logger_->critical("Emergency stop from {}: {}. {} accounts halted", to_string(request.origin), request.reason,
                      registry_.all().size());
    if (config_->emergency.liquidate_on_emergency_stop) {
        for (auto& ctx : registry_.all()) {
            liquidate(ctx);
        }
    }
    notifier_.notify_now("emergency_stop", Severity::Critical, "Emergency stop",
                         request.reason + " (" + to_string(request.origin) + ")");
    set_state(SchedulerStopping{request.reason});
    surface_.set_phase(ControlSurface::Phase::Stopping);
}

void ModeScheduler::probe_adapters() {
    Timestamp now = clock_.now();
    for (auto kind : kProbedAdapters) {
        auto obs = tracker_.get(kind);
        if (obs.seen && now - obs.observed_at < config_->monitoring.health_check_interval) {
            continue;
        }
        try {
            caller_.call_once(kind, std::string("ping ") + to_string(kind), [&](const CallContext& call) {
                switch (kind) {
                    case AdapterKind::Broker: collab_.broker->ping(call); break;
                    case AdapterKind::Candidates: collab_.candidates->ping(call); break;
                    default: collab_.persistence->ping(call); break;
                }
            });
        } catch (const std::exception& e) {
            logger_->warn("Health probe {} failed: {}", to_string(kind), e.what());
        }
    }
}

Timestamp ModeScheduler::next_wake(Timestamp now) const {
    auto interval = mode_ == TradingMode::Trading ? config_->scheduler.trading_interval
                                                  : config_->scheduler.backtest_interval;
    Timestamp wake = now + interval;
    Timestamp boundary = oracle_.next_boundary(now);
    if (boundary > now && boundary < wake) {
        wake = boundary;
    }
    return wake;
}

void ModeScheduler::run() {
    start();
    while (!check_stop()) {
        run_cycle();
        if (stopping_) {
            break;
        }
        probe_adapters();

        Timestamp deadline = next_wake(clock_.now());
        while (clock_.now() < deadline) {
            Timestamp slice = clock_.now() + config_->monitoring.health_check_interval;
            slice = std::min(slice, deadline);
            if (channel_.wait(clock_, slice)) {
                break;
            }
            probe_adapters();
        }
    }
    shutdown(stop_reason_);
}

DailyReport ModeScheduler::build_daily_report() const {
    DailyReport report;
    report.generated_at = clock_.now();
    report.cycles = sequence_;
    report.errors = errors_total_;
    for (const auto& ctx : registry_.all()) {
        DailyAccountSummary summary;
        summary.account_id = ctx.account.id;
        summary.equity = ctx.account.equity();
        summary.daily_pnl = ctx.account.daily_pnl();
        summary.daily_pnl_pct = ctx.account.session_start_equity > 0.0
                                    ? summary.daily_pnl / ctx.account.session_start_equity * 100.0
                                    : 0.0;
        summary.trades_today = ctx.risk.trades_today();
        summary.halted = ctx.risk.halted();
        report.accounts.push_back(summary);
    }
    return report;
}

void ModeScheduler::shutdown(const std::string& reason) {
    if (std::holds_alternative<SchedulerStopped>(state())) {
        return;
    }
    set_state(SchedulerStopping{reason});
    surface_.set_phase(ControlSurface::Phase::Stopping);

    DailyReport report = build_daily_report();
    logger_->info("Daily report: {} cycles, {} errors", report.cycles, report.errors);
    for (const auto& summary : report.accounts) {
        logger_->info("  {}: equity ${:.2f}, P&L ${:.2f} ({:+.2f}%), {} trades{}", summary.account_id, summary.equity,
                      summary.daily_pnl, summary.daily_pnl_pct, summary.trades_today,
                      summary.halted ? ", HALTED" : "");
    }
    audit_.append(report);

    surface_.publish(registry_.views(), last_candidates_, std::nullopt, mode_);
    audit_.flush();
    if (audit_.pending() > 0) {
        logger_->error("{} audit entries could not be persisted before shutdown", audit_.pending());
    }

    set_state(SchedulerStopped{});
    surface_.set_phase(ControlSurface::Phase::Stopped);
    logger_->info("Scheduler stopped{}{}", reason.empty() ? "" : ": ", reason);
}

} // namespace sentinel
