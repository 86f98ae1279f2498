#include <hookstream/core/notify/channel_subscriber.hpp>

namespace HookStream {

ChannelSubscriber::ChannelSubscriber(size_t capacity) : capacity_(capacity) {}

bool ChannelSubscriber::push(const Notification& n) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || queue_.size() >= capacity_) {
            return false;
        }
        queue_.push_back(n);
    }
    not_empty_.notify_one();
    return true;
}

std::optional<Notification> ChannelSubscriber::tryPop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });

    if (queue_.empty()) {
        return std::nullopt;
    }
    Notification n = std::move(queue_.front());
    queue_.pop_front();
    return n;
}

void ChannelSubscriber::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
}

bool ChannelSubscriber::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t ChannelSubscriber::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace HookStream
