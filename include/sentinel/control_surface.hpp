#pragma once

#include "adapter_call.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "emergency_stop.hpp"
#include "metrics.hpp"
#include "types.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace sentinel {

// Copy of one account's state handed over at the end of a cycle.
struct AccountView {
    Account account;
    RiskState risk;
};

// Read side for operators and the dashboard. The scheduling thread publishes
// an immutable snapshot after every cycle; readers only ever see whole
// snapshots.
class ControlSurface {
public:
    enum class Phase {
        Starting,
        Running,
        Stopping,
        Stopped
    };

    ControlSurface(std::shared_ptr<const Config> config, ConnectivityTracker& tracker, Clock& clock,
                   EmergencyStopChannel& channel);

    // Scheduling thread only.
    void publish(std::vector<AccountView> accounts, std::vector<Candidate> candidates,
                 const std::optional<CycleResult>& cycle, std::optional<TradingMode> mode);
    void set_phase(Phase phase);

    HealthReport get_health() const;
    MetricsSnapshot get_metrics() const;

    // Always acknowledged. Returns true when this call created the request.
    bool trigger_emergency_stop(const std::string& reason, StopOrigin origin);

    std::vector<Candidate> list_candidates() const;
    const nlohmann::json& effective_configuration() const { return effective_config_; }

    Phase phase() const;

private:
    struct Snapshot {
        std::vector<Candidate> candidates;
        std::vector<std::string> halted_accounts;
        std::optional<Timestamp> last_cycle_at;
        std::optional<TradingMode> mode;
        std::uint64_t cycle_count = 0;
        std::uint64_t error_count = 0;
        MetricsSnapshot metrics;
    };

    std::shared_ptr<const Config> config_;
    ConnectivityTracker& tracker_;
    Clock& clock_;
    EmergencyStopChannel& channel_;
    nlohmann::json effective_config_;
    Timestamp started_at_;
    std::shared_ptr<spdlog::logger> logger_;

    // Publisher-side state
    std::deque<CycleResult> window_;
    std::uint64_t cycle_count_ = 0;
    std::uint64_t error_count_ = 0;

    mutable std::mutex mutex_;
    std::shared_ptr<const Snapshot> snapshot_;
    Phase phase_ = Phase::Starting;

    std::shared_ptr<const Snapshot> current() const;
};

const char* to_string(ControlSurface::Phase phase);

} // namespace sentinel
