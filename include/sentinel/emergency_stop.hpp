#pragma once

#include "clock.hpp"
#include "types.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>

namespace sentinel {

// Single-slot hand-off of an EmergencyStopRequest from any thread to the
// scheduling thread. Only the first trigger is kept; the request is consumed
// exactly once.
class EmergencyStopChannel {
public:
    // Always acknowledges. Returns true only for the trigger that was accepted.
    bool trigger(EmergencyStopRequest request);

    std::optional<EmergencyStopRequest> consume();

    // True once any trigger was accepted, consumed or not.
    bool triggered() const;
    bool pending() const;

    // Sleeps until deadline or until a stop is pending. Returns pending().
    bool wait(Clock& clock, Timestamp deadline);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<EmergencyStopRequest> pending_;
    bool triggered_ = false;
};

} // namespace sentinel
