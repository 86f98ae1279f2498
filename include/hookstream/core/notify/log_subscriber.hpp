#pragma once

#include <hookstream/core/notify/subscriber.hpp>

namespace HookStream {

// Used when no UI is attached: notifications only show up in the debug log.
class LogSubscriber : public Subscriber {
public:
    bool push(const Notification& n) override;
    const char* name() const override { return "log"; }
};

} // namespace HookStream
