#include <hookstream/core/notify/log_subscriber.hpp>
#include <spdlog/spdlog.h>

namespace HookStream {

bool LogSubscriber::push(const Notification& n) {
    spdlog::debug("[LogSubscriber] {} {}", n.channel(), n.body().dump());
    return true;
}

} // namespace HookStream
