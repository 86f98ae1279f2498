#pragma once

#include <hookstream/core/notify/channel_subscriber.hpp>
#include <atomic>
#include <cstdint>
#include <ostream>
#include <thread>

namespace HookStream {

/**
 * @class StreamSubscriber
 * @brief Writes notifications as JSON lines to an output stream.
 *
 * This is how the desktop shell receives live updates from the sidecar: it
 * reads the sidecar's stdout line by line. Each line has the form
 *   {"event":"new-event","payload":{"type":"event","data":{...}}}
 *
 * push() only enqueues; a dedicated writer thread owns the stream, so a
 * slow reader on the other end of the pipe never stalls a request handler.
 */
class StreamSubscriber : public Subscriber {
public:
    StreamSubscriber(std::ostream& out, size_t capacity = ChannelSubscriber::DEFAULT_CAPACITY);
    ~StreamSubscriber() noexcept override;

    void start();

    // Closes the channel, writes what is still queued, joins the writer
    void stop();

    bool push(const Notification& n) override { return channel_.push(n); }
    const char* name() const override { return "stream"; }

    uint64_t linesWritten() const {
        return lines_written_.load(std::memory_order_relaxed);
    }

    uint64_t writeFailures() const {
        return write_failures_.load(std::memory_order_relaxed);
    }

private:
    void writerLoop();

    std::ostream& out_;
    ChannelSubscriber channel_;
    std::thread writer_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> lines_written_{0};
    std::atomic<uint64_t> write_failures_{0};
};

} // namespace HookStream
