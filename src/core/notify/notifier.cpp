#include <hookstream/core/notify/notifier.hpp>
#include <spdlog/spdlog.h>

namespace HookStream {

Notifier::Notifier(std::shared_ptr<Subscriber> subscriber)
    : subscriber_(std::move(subscriber)) {
    if (subscriber_) {
        spdlog::info("[Notifier] Publishing to '{}' subscriber", subscriber_->name());
    } else {
        spdlog::warn("[Notifier] No subscriber attached, notifications will be dropped");
    }
}

void Notifier::publish(const Notification& n) noexcept {
    bool accepted = false;

    if (subscriber_) {
        try {
            accepted = subscriber_->push(n);
            if (!accepted) {
                spdlog::warn("[Notifier] Subscriber '{}' rejected '{}' notification",
                             subscriber_->name(), n.channel());
            }
        } catch (const std::exception& e) {
            spdlog::error("[Notifier] Failed to emit '{}' notification: {}", n.channel(), e.what());
        }
    }

    if (accepted) {
        delivered_.fetch_add(1, std::memory_order_relaxed);
    } else {
        dropped_.fetch_add(1, std::memory_order_relaxed);
    }
}

} // namespace HookStream
