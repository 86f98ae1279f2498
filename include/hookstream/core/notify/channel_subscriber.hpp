#pragma once

#include <hookstream/core/notify/subscriber.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace HookStream {

/**
 * @class ChannelSubscriber
 * @brief Bounded FIFO channel between request handlers and one consumer.
 *
 * Producers never wait: push() fails once the channel holds `capacity`
 * notifications or has been closed. The consumer waits in tryPop().
 * After close(), queued notifications can still be drained.
 */
class ChannelSubscriber : public Subscriber {
public:
    static constexpr size_t DEFAULT_CAPACITY = 1024;

    explicit ChannelSubscriber(size_t capacity = DEFAULT_CAPACITY);
    ~ChannelSubscriber() override = default;

    bool push(const Notification& n) override;
    const char* name() const override { return "channel"; }

    /**
     * @brief Pop the oldest notification, waiting up to `timeout`
     * @return std::nullopt on timeout, or when closed and empty
     */
    std::optional<Notification> tryPop(std::chrono::milliseconds timeout);

    void close();
    bool closed() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<Notification> queue_;
    bool closed_ = false;
};

} // namespace HookStream
