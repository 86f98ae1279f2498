#include <hookstream/core/ingest/http_server.hpp>
#include <hookstream/core/errors.hpp>
#include <spdlog/spdlog.h>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <optional>

namespace HookStream {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

namespace {

// One client connection. Keeps itself alive through the shared_ptr bound
// into every pending completion handler.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, std::shared_ptr<IngestApi> api, size_t maxBodyBytes)
        : stream_(std::move(socket)), api_(std::move(api)), maxBodyBytes_(maxBodyBytes) {}

    void run() {
        asio::dispatch(stream_.get_executor(),
                       beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
    }

private:
    void doRead() {
        parser_.emplace();
        parser_->body_limit(maxBodyBytes_);

        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return doClose();
        }
        if (ec == http::error::body_limit) {
            HttpRequest req = parser_->release();
            HttpResponse res{http::status::payload_too_large, req.version()};
            res.set(http::field::access_control_allow_origin, "*");
            res.set(http::field::content_type, "text/plain; charset=utf-8");
            res.body() = "Payload Too Large";
            res.keep_alive(false);
            res.prepare_payload();
            return sendResponse(std::move(res));
        }
        if (ec) {
            spdlog::debug("[HttpSession] Read failed: {}", ec.message());
            return;
        }

        HttpRequest req = parser_->release();
        sendResponse(api_->handle(req));
    }

    void sendResponse(HttpResponse&& res) {
        response_ = std::make_shared<HttpResponse>(std::move(res));
        http::async_write(stream_, *response_,
                          beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(),
                                                    response_->need_eof()));
    }

    void onWrite(bool close, beast::error_code ec, std::size_t) {
        if (ec) {
            spdlog::debug("[HttpSession] Write failed: {}", ec.message());
            return;
        }
        if (close) {
            return doClose();
        }
        response_.reset();
        doRead();
    }

    void doClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        if (ec) {
            spdlog::debug("[HttpSession] Shutdown failed: {}", ec.message());
        }
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<HttpResponse> response_;
    std::shared_ptr<IngestApi> api_;
    size_t maxBodyBytes_;
};

} // namespace

HttpIngestServer::HttpIngestServer(std::shared_ptr<IngestApi> api, Config config)
    : api_(std::move(api)), config_(std::move(config)), acceptor_(asio::make_strand(ioc_)) {
    if (config_.workerThreads == 0) {
        config_.workerThreads = 1;
    }
}

HttpIngestServer::~HttpIngestServer() noexcept {
    stop();
}

void HttpIngestServer::start() {
    beast::error_code ec;
    auto address = asio::ip::make_address(config_.host, ec);
    if (ec) {
        throw StartupFailure("Invalid listen address '" + config_.host + "': " + ec.message());
    }
    tcp::endpoint endpoint{address, config_.port};
    const std::string where = config_.host + ":" + std::to_string(config_.port);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        beast::error_code ignored;
        acceptor_.close(ignored);
        throw StartupFailure("Failed to bind to " + where + ": " + ec.message());
    }

    boundPort_ = acceptor_.local_endpoint().port();
    isRunning_.store(true, std::memory_order_release);
    doAccept();

    workers_.reserve(config_.workerThreads);
    for (size_t i = 0; i < config_.workerThreads; ++i) {
        workers_.emplace_back([this, i] {
            // A throwing handler must not shrink the pool: log and re-enter
            while (true) {
                try {
                    ioc_.run();
                    break;
                } catch (const std::exception& e) {
                    spdlog::error("[HttpIngestServer] Worker {} handler failed: {}", i, e.what());
                }
            }
        });
    }

    spdlog::info("[HttpIngestServer] Listening on http://{}:{} ({} worker threads)",
                 config_.host, boundPort_, config_.workerThreads);
}

void HttpIngestServer::stop() {
    if (!isRunning_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    ioc_.stop();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    // No worker is running any more, the acceptor can be closed directly
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("[HttpIngestServer] Failed to close acceptor: {}", ec.message());
    }

    spdlog::info("[HttpIngestServer] Stopped. Total connections: {}",
                 totalConnectionsAccepted_.load());
}

void HttpIngestServer::doAccept() {
    acceptor_.async_accept(asio::make_strand(ioc_),
                           beast::bind_front_handler(&HttpIngestServer::onAccept, this));
}

void HttpIngestServer::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (isRunning()) {
            spdlog::error("[HttpIngestServer] Failed to accept client connection: {}", ec.message());
        } else {
            return;
        }
    } else {
        totalConnectionsAccepted_.fetch_add(1, std::memory_order_relaxed);
        std::make_shared<HttpSession>(std::move(socket), api_, config_.maxBodyBytes)->run();
    }

    if (isRunning()) {
        doAccept();
    }
}

} // namespace HookStream
