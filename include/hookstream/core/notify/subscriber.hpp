#pragma once

#include <hookstream/core/notify/notification.hpp>

namespace HookStream {

/**
 * @brief The single consumer of live notifications (the dashboard UI).
 *
 * push() must not block the caller. A notification that cannot be accepted
 * is reported by returning false; the caller logs it and moves on.
 */
class Subscriber {
public:
    virtual ~Subscriber() = default;

    virtual bool push(const Notification& n) = 0;
    virtual const char* name() const = 0;
};

} // namespace HookStream
