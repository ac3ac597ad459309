#include "sentinel/audit_trail.hpp"
#include "sentinel/logging.hpp"

#include <type_traits>

namespace sentinel {

AuditTrail::AuditTrail(std::shared_ptr<PersistenceAdapter> persistence, AdapterCaller& caller,
                       std::size_t capacity)
    : persistence_(std::move(persistence)),
      caller_(caller),
      capacity_(capacity == 0 ? 1 : capacity),
      logger_(make_logger("audit")) {}

void AuditTrail::append(AuditEntry entry) {
    if (queue_.size() >= capacity_) {
        queue_.pop_front();
        ++dropped_;
        logger_->warn("Audit buffer full ({} entries), dropped oldest entry", capacity_);
    }
    queue_.push_back(std::move(entry));
}

std::size_t AuditTrail::flush() {
    std::size_t written = 0;
    while (!queue_.empty()) {
        try {
            write(queue_.front());
        } catch (const std::exception& e) {
            logger_->warn("Persistence write failed, {} entries pending: {}", queue_.size(), e.what());
            break;
        }
        queue_.pop_front();
        ++written;
    }
    return written;
}

void AuditTrail::write(const AuditEntry& entry) {
    std::visit([this](const auto& item) {
        using T = std::decay_t<decltype(item)>;
        caller_.call_once(AdapterKind::Persistence, "persistence write", [&](const CallContext& ctx) {
            if constexpr (std::is_same_v<T, CycleResult>) {
                persistence_->record_cycle(item, ctx);
            } else if constexpr (std::is_same_v<T, OrderRecord>) {
                persistence_->record_order(item, ctx);
            } else if constexpr (std::is_same_v<T, BreakerEvent>) {
                persistence_->record_circuit_breaker_event(item, ctx);
            } else if constexpr (std::is_same_v<T, BacktestReport>) {
                persistence_->record_backtest(item, ctx);
            } else {
                persistence_->record_daily_report(item, ctx);
            }
        });
    }, entry);
}

} // namespace sentinel
