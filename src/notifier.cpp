#include "sentinel/notifier.hpp"
#include "sentinel/logging.hpp"

namespace sentinel {

Notifier::Notifier(std::shared_ptr<NotificationAdapter> adapter, Clock& clock, AdapterCaller& caller,
                   std::chrono::seconds cooldown)
    : adapter_(std::move(adapter)),
      clock_(clock),
      caller_(caller),
      cooldown_(cooldown),
      logger_(make_logger("notifier")) {}

Notifier::Outcome Notifier::notify(const std::string& key, Severity severity, const std::string& title,
                                   const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_sent_.find(key);
    if (it != last_sent_.end() && clock_.now() - it->second < cooldown_) {
        logger_->debug("Suppressed notification '{}' (cooldown)", key);
        return Outcome::Suppressed;
    }
    return deliver(key, severity, title, message);
}

Notifier::Outcome Notifier::notify_now(const std::string& key, Severity severity, const std::string& title,
                                       const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    return deliver(key, severity, title, message);
}

Notifier::Outcome Notifier::deliver(const std::string& key, Severity severity, const std::string& title,
                                    const std::string& message) {
    if (!adapter_) {
        logger_->info("[{}] {}: {}", to_string(severity), title, message);
        last_sent_[key] = clock_.now();
        return Outcome::Delivered;
    }
    try {
        caller_.call_once(AdapterKind::Notifications, "notify " + key, [&](const CallContext& ctx) {
            adapter_->notify(severity, title, message, ctx);
        });
        last_sent_[key] = clock_.now();
        return Outcome::Delivered;
    } catch (const std::exception& e) {
        logger_->warn("Notification '{}' failed: {}", key, e.what());
        return Outcome::Failed;
    }
}

} // namespace sentinel
