#pragma once

#include <hookstream/core/ingest/ingest_api.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace HookStream {

/**
 * @class HttpIngestServer
 * @brief Asynchronous HTTP/1.1 server in front of IngestApi.
 *
 * One io_context is run by a pool of worker threads; each accepted
 * connection becomes a Beast session that reads requests, hands them to
 * IngestApi on the worker that completed the read, and writes the response
 * asynchronously. IngestApi calls are synchronous, so no store lock is ever
 * held across network I/O.
 */
class HttpIngestServer {
public:
    struct Config {
        std::string host = "127.0.0.1";
        uint16_t port = 4000;
        size_t workerThreads = 1;
        size_t maxBodyBytes = 1024 * 1024;
    };

    HttpIngestServer(std::shared_ptr<IngestApi> api, Config config);
    ~HttpIngestServer() noexcept;

    HttpIngestServer(const HttpIngestServer&) = delete;
    HttpIngestServer& operator=(const HttpIngestServer&) = delete;

    /**
     * @brief Bind, listen and start the worker pool
     * @throws StartupFailure if the listener cannot be opened
     */
    void start();
    void stop();

    bool isRunning() const { return isRunning_.load(std::memory_order_acquire); }
    uint16_t port() const { return boundPort_; }

    // Context run by the worker pool; handlers posted here run on a worker
    boost::asio::io_context& ioContext() { return ioc_; }

    uint64_t totalConnectionsAccepted() const {
        return totalConnectionsAccepted_.load(std::memory_order_relaxed);
    }

private:
    void doAccept();
    void onAccept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

    std::shared_ptr<IngestApi> api_;
    Config config_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> workers_;
    std::atomic<bool> isRunning_{false};
    uint16_t boundPort_ = 0;

    std::atomic<uint64_t> totalConnectionsAccepted_{0};
};

} // namespace HookStream
