#include "sentinel/adapter_call.hpp"
#include "sentinel/logging.hpp"

namespace sentinel {

namespace {

constexpr AdapterKind kAllKinds[] = {
    AdapterKind::Broker,
    AdapterKind::Candidates,
    AdapterKind::MarketData,
    AdapterKind::Backtester,
    AdapterKind::Persistence,
    AdapterKind::Notifications,
};

} // namespace

const char* to_string(AdapterKind kind) {
    switch (kind) {
        case AdapterKind::Broker: return "broker";
        case AdapterKind::Candidates: return "candidates";
        case AdapterKind::MarketData: return "market_data";
        case AdapterKind::Backtester: return "backtester";
        case AdapterKind::Persistence: return "persistence";
        case AdapterKind::Notifications: return "notifications";
    }
    return "unknown";
}

void ConnectivityTracker::record(AdapterKind kind, bool connected, Timestamp at, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& obs = observations_[kind];
    obs.seen = true;
    obs.connected = connected;
    obs.observed_at = at;
    obs.last_error = connected ? std::string() : error;
}

ConnectivityTracker::Observation ConnectivityTracker::get(AdapterKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = observations_.find(kind);
    return it != observations_.end() ? it->second : Observation{};
}

std::map<std::string, bool> ConnectivityTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, bool> result;
    for (auto kind : kAllKinds) {
        auto it = observations_.find(kind);
        result[to_string(kind)] = it == observations_.end() || it->second.connected;
    }
    return result;
}

bool ConnectivityTracker::all_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [kind, obs] : observations_) {
        if (!obs.connected) {
            return false;
        }
    }
    return true;
}

RetryPolicy RetryPolicy::from(const SchedulerConfig& config) {
    RetryPolicy policy;
    policy.max_attempts = config.retry_max_attempts;
    policy.initial_backoff = config.retry_initial_backoff;
    policy.max_backoff = config.retry_max_backoff;
    return policy;
}

AdapterCaller::AdapterCaller(Clock& clock, ConnectivityTracker& tracker, RetryPolicy policy,
                             std::chrono::milliseconds timeout)
    : clock_(clock),
      tracker_(tracker),
      policy_(policy),
      timeout_(timeout),
      logger_(make_logger("adapter")) {}

CallContext AdapterCaller::context() const {
    return CallContext{clock_.now() + timeout_, &clock_};
}

void AdapterCaller::check_deadline(const std::string& what, const CallContext& ctx) const {
    if (clock_.now() > ctx.deadline) {
        throw TimeoutError(what + " exceeded its " + std::to_string(timeout_.count()) + " ms deadline");
    }
}

} // namespace sentinel
