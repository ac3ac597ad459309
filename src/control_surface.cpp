#include "sentinel/control_surface.hpp"
#include "sentinel/logging.hpp"

namespace sentinel {

const char* to_string(ControlSurface::Phase phase) {
    switch (phase) {
        case ControlSurface::Phase::Starting: return "STARTING";
        case ControlSurface::Phase::Running: return "RUNNING";
        case ControlSurface::Phase::Stopping: return "STOPPING";
        case ControlSurface::Phase::Stopped: return "STOPPED";
    }
    return "UNKNOWN";
}

ControlSurface::ControlSurface(std::shared_ptr<const Config> config, ConnectivityTracker& tracker, Clock& clock,
                               EmergencyStopChannel& channel)
    : config_(std::move(config)),
      tracker_(tracker),
      clock_(clock),
      channel_(channel),
      effective_config_(effective_config(*config_)),
      started_at_(clock.now()),
      logger_(make_logger("control_surface")),
      snapshot_(std::make_shared<Snapshot>()) {}

void ControlSurface::publish(std::vector<AccountView> accounts, std::vector<Candidate> candidates,
                             const std::optional<CycleResult>& cycle, std::optional<TradingMode> mode) {
    if (cycle) {
        window_.push_back(*cycle);
        while (window_.size() > config_->monitoring.metrics_window) {
            window_.pop_front();
        }
        ++cycle_count_;
        error_count_ += cycle->error_count();
    }

    auto next = std::make_shared<Snapshot>();
    next->candidates = std::move(candidates);
    next->mode = mode;
    next->cycle_count = cycle_count_;
    next->error_count = error_count_;
    {
        auto previous = current();
        next->last_cycle_at = cycle ? std::optional<Timestamp>(cycle->finished_at) : previous->last_cycle_at;
    }

    MetricsSnapshot& metrics = next->metrics;
    metrics.generated_at = clock_.now();
    metrics.mode = mode;
    metrics.cycles_in_window = window_.size();
    if (!window_.empty()) {
        metrics.cycle_sequence = window_.back().sequence;
    }
    for (const auto& past : window_) {
        metrics.orders_attempted += past.orders_attempted();
        metrics.orders_filled += past.orders_filled();
        metrics.orders_rejected += past.orders_rejected();
        metrics.errors += past.error_count();
    }

    for (const auto& view : accounts) {
        std::vector<double> equity_series;
        for (const auto& past : window_) {
            for (const auto& slot : past.accounts) {
                if (slot.account_id == view.account.id && !slot.failed && !slot.skipped && slot.equity > 0.0) {
                    equity_series.push_back(slot.equity);
                }
            }
        }
        metrics.accounts.push_back(compute_account_metrics(view.account, view.risk, equity_series));
        if (view.risk.halted()) {
            next->halted_accounts.push_back(view.account.id);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_ = std::move(next);
}

void ControlSurface::set_phase(Phase phase) {
    std::lock_guard<std::mutex> lock(mutex_);
    phase_ = phase;
}

ControlSurface::Phase ControlSurface::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

std::shared_ptr<const ControlSurface::Snapshot> ControlSurface::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

HealthReport ControlSurface::get_health() const {
    auto snap = current();
    Phase phase = this->phase();

    HealthReport report;
    report.uptime_seconds = std::chrono::duration<double>(clock_.now() - started_at_).count();
    report.connectivity = tracker_.snapshot();
    report.last_cycle_at = snap->last_cycle_at;
    report.mode = snap->mode;
    report.cycle_count = snap->cycle_count;
    report.error_count = snap->error_count;
    report.halted_accounts = snap->halted_accounts;
    report.emergency_stop_pending = channel_.pending();

    if (phase == Phase::Stopped) {
        report.status = "STOPPED";
    } else if (phase == Phase::Stopping) {
        report.status = "STOPPING";
    } else if (channel_.triggered()) {
        report.status = "EMERGENCY_STOP";
    } else if (phase == Phase::Starting) {
        report.status = "STARTING";
    } else if (!tracker_.all_connected() || !snap->halted_accounts.empty()) {
        report.status = "DEGRADED";
    } else {
        report.status = "OPERATIONAL";
    }
    return report;
}

MetricsSnapshot ControlSurface::get_metrics() const {
    return current()->metrics;
}

bool ControlSurface::trigger_emergency_stop(const std::string& reason, StopOrigin origin) {
    bool accepted = channel_.trigger(EmergencyStopRequest{reason, origin, clock_.now()});
    if (accepted) {
        logger_->critical("Emergency stop requested by {}: {}", to_string(origin), reason);
    } else {
        logger_->info("Emergency stop already requested, ignoring request from {}", to_string(origin));
    }
    return accepted;
}

std::vector<Candidate> ControlSurface::list_candidates() const {
    return current()->candidates;
}

} // namespace sentinel
