#pragma once

#include "adapters.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "errors.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <spdlog/spdlog.h>

namespace sentinel {

enum class AdapterKind {
    Broker,
    Candidates,
    MarketData,
    Backtester,
    Persistence,
    Notifications
};

const char* to_string(AdapterKind kind);

// Outcome of the most recent call per adapter. Written by the scheduling
// thread, read by the control surface.
class ConnectivityTracker {
public:
    struct Observation {
        bool seen = false;
        bool connected = true;
        Timestamp observed_at{};
        std::string last_error;
    };

    void record(AdapterKind kind, bool connected, Timestamp at, const std::string& error = {});
    Observation get(AdapterKind kind) const;

    // Adapters never called yet report connected.
    std::map<std::string, bool> snapshot() const;
    bool all_connected() const;

private:
    mutable std::mutex mutex_;
    std::map<AdapterKind, Observation> observations_;
};

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{250};
    std::chrono::milliseconds max_backoff{4000};

    static RetryPolicy from(const SchedulerConfig& config);
};

// Runs adapter calls under a per-attempt deadline, retries transient
// failures with exponential backoff and keeps the connectivity tracker
// current.
class AdapterCaller {
public:
    AdapterCaller(Clock& clock, ConnectivityTracker& tracker, RetryPolicy policy,
                  std::chrono::milliseconds timeout);

    // Retries TransientError up to the policy limit, then throws AdapterError.
    template <typename Fn>
    auto call(AdapterKind kind, const std::string& what, Fn&& fn) {
        using Result = std::invoke_result_t<Fn&, const CallContext&>;
        auto delay = policy_.initial_backoff;
        for (int attempt = 1;; ++attempt) {
            try {
                return invoke_checked<Result>(kind, what, fn);
            } catch (const TransientError& e) {
                if (attempt >= policy_.max_attempts) {
                    throw AdapterError(what + " failed after " + std::to_string(attempt) +
                                       " attempts: " + e.what());
                }
                logger_->warn("{} attempt {}/{} failed: {}; retrying in {} ms",
                              what, attempt, policy_.max_attempts, e.what(), delay.count());
                clock_.sleep_for(delay);
                delay = std::min(delay * 2, policy_.max_backoff);
            }
        }
    }

    // Single attempt. Exceptions propagate with their original type.
    template <typename Fn>
    auto call_once(AdapterKind kind, const std::string& what, Fn&& fn) {
        using Result = std::invoke_result_t<Fn&, const CallContext&>;
        return invoke_checked<Result>(kind, what, fn);
    }

    CallContext context() const;
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    Clock& clock_;
    ConnectivityTracker& tracker_;
    RetryPolicy policy_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<spdlog::logger> logger_;

    void check_deadline(const std::string& what, const CallContext& ctx) const;

    template <typename Result, typename Fn>
    Result invoke_checked(AdapterKind kind, const std::string& what, Fn& fn) {
        CallContext ctx = context();
        try {
            if constexpr (std::is_void_v<Result>) {
                fn(ctx);
                check_deadline(what, ctx);
                tracker_.record(kind, true, clock_.now());
            } else {
                Result result = fn(ctx);
                check_deadline(what, ctx);
                tracker_.record(kind, true, clock_.now());
                return result;
            }
        } catch (const TransientError& e) {
            tracker_.record(kind, false, clock_.now(), e.what());
            throw;
        } catch (const AdapterError&) {
            // The service answered; the failure is in the request.
            tracker_.record(kind, true, clock_.now());
            throw;
        } catch (const std::exception& e) {
            tracker_.record(kind, false, clock_.now(), e.what());
            throw;
        }
    }
};

} // namespace sentinel
