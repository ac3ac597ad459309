#pragma once

#include "adapter_call.hpp"
#include "adapters.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <variant>
#include <spdlog/spdlog.h>

namespace sentinel {

using AuditEntry = std::variant<CycleResult, OrderRecord, BreakerEvent, BacktestReport, DailyReport>;

// Bounded write-behind buffer in front of the persistence adapter. Entries
// are written in insertion order; a failed write stays at the head.
class AuditTrail {
public:
    AuditTrail(std::shared_ptr<PersistenceAdapter> persistence, AdapterCaller& caller, std::size_t capacity);

    void append(AuditEntry entry);

    // Writes queued entries until the first failure. Returns the number written.
    std::size_t flush();

    std::size_t pending() const { return queue_.size(); }
    std::size_t dropped() const { return dropped_; }

    static constexpr std::size_t kDefaultCapacity = 1024;

private:
    std::shared_ptr<PersistenceAdapter> persistence_;
    AdapterCaller& caller_;
    std::size_t capacity_;
    std::deque<AuditEntry> queue_;
    std::size_t dropped_ = 0;
    std::shared_ptr<spdlog::logger> logger_;

    void write(const AuditEntry& entry);
};

} // namespace sentinel
