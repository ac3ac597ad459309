#pragma once

#include "adapter_call.hpp"
#include "adapters.hpp"
#include "clock.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>

namespace sentinel {

// Debounces alerts per key: a key that was delivered within the cooldown
// window is suppressed. Failed deliveries do not start the window.
class Notifier {
public:
    enum class Outcome {
        Delivered,
        Suppressed,
        Failed
    };

    // Deliveries run as single attempts under the caller's deadline.
    Notifier(std::shared_ptr<NotificationAdapter> adapter, Clock& clock, AdapterCaller& caller,
             std::chrono::seconds cooldown);

    Outcome notify(const std::string& key, Severity severity, const std::string& title,
                   const std::string& message);

    // Bypasses the cooldown. Still records the delivery time for key.
    Outcome notify_now(const std::string& key, Severity severity, const std::string& title,
                       const std::string& message);

private:
    std::shared_ptr<NotificationAdapter> adapter_;
    Clock& clock_;
    AdapterCaller& caller_;
    std::chrono::seconds cooldown_;
    std::map<std::string, Timestamp> last_sent_;
    std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;

    Outcome deliver(const std::string& key, Severity severity, const std::string& title,
                    const std::string& message);
};

} // namespace sentinel
