#pragma once

#include <hookstream/core/notify/subscriber.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace HookStream {

/**
 * @class Notifier
 * @brief Best-effort, at-most-once push of store changes to the subscriber.
 *
 * Every failure (rejected push, exception from the subscriber, no
 * subscriber) is logged and counted here and never reaches the caller.
 * Nothing is retried.
 */
class Notifier {
public:
    explicit Notifier(std::shared_ptr<Subscriber> subscriber);

    void eventAdded(const StoredEvent& e) { publish(Notification::eventAdded(e)); }
    void sessionDeleted(const std::string& sessionId) { publish(Notification::sessionDeleted(sessionId)); }
    void eventsCleared() { publish(Notification::eventsCleared()); }
    void serverOnline(uint16_t port) { publish(Notification::serverOnline(port)); }

    void publish(const Notification& n) noexcept;

    uint64_t delivered() const { return delivered_.load(std::memory_order_relaxed); }
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    std::shared_ptr<Subscriber> subscriber_;
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace HookStream
