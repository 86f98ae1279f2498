#include <hookstream/core/notify/stream_subscriber.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace HookStream {

StreamSubscriber::StreamSubscriber(std::ostream& out, size_t capacity)
    : out_(out), channel_(capacity) {}

StreamSubscriber::~StreamSubscriber() noexcept {
    stop();
}

void StreamSubscriber::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    writer_ = std::thread(&StreamSubscriber::writerLoop, this);
    spdlog::info("[StreamSubscriber] Writer started (capacity: {})", channel_.capacity());
}

void StreamSubscriber::stop() {
    channel_.close();
    if (writer_.joinable()) {
        writer_.join();
    }
    if (running_.exchange(false, std::memory_order_acq_rel)) {
        spdlog::info("[StreamSubscriber] Writer stopped. Lines written: {}, write failures: {}",
                     linesWritten(), writeFailures());
    }
}

void StreamSubscriber::writerLoop() {
    constexpr auto kPollInterval = std::chrono::milliseconds(100);

    while (true) {
        auto n = channel_.tryPop(kPollInterval);
        if (!n) {
            if (channel_.closed()) break;
            continue;
        }

        std::string text;
        try {
            nlohmann::json line{{"event", n->channel()}, {"payload", n->body()}};
            text = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        } catch (const std::exception& e) {
            spdlog::error("[StreamSubscriber] Dropped '{}' notification: {}", n->channel(), e.what());
            continue;
        }

        out_ << text << '\n';
        out_.flush();

        if (!out_.good()) {
            // Reader gone (e.g. closed pipe): keep draining, log only the first failure
            if (write_failures_.fetch_add(1, std::memory_order_relaxed) == 0) {
                spdlog::error("[StreamSubscriber] Failed to write '{}' notification, "
                              "further write failures are counted only", n->channel());
            }
            out_.clear();
            continue;
        }
        lines_written_.fetch_add(1, std::memory_order_relaxed);
    }
}

} // namespace HookStream
