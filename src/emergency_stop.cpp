#include "sentinel/emergency_stop.hpp"

namespace sentinel {

bool EmergencyStopChannel::trigger(EmergencyStopRequest request) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (triggered_) {
            return false;
        }
        triggered_ = true;
        pending_ = std::move(request);
    }
    cv_.notify_all();
    return true;
}

std::optional<EmergencyStopRequest> EmergencyStopChannel::consume() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<EmergencyStopRequest> request;
    request.swap(pending_);
    return request;
}

bool EmergencyStopChannel::triggered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return triggered_;
}

bool EmergencyStopChannel::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.has_value();
}

bool EmergencyStopChannel::wait(Clock& clock, Timestamp deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    return clock.wait_until(lock, cv_, deadline, [this] { return pending_.has_value(); });
}

} // namespace sentinel
