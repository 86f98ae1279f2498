// ============================================================================
// HTTP INGEST SERVER TESTS
// ============================================================================
// Runs the real server on an ephemeral loopback port and talks to it with a
// synchronous Beast client.
// ============================================================================

#include <gtest/gtest.h>
#include <hookstream/core/ingest/http_server.hpp>
#include <hookstream/core/notify/channel_subscriber.hpp>
#include <hookstream/core/errors.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <stdexcept>
#include <string>

using namespace HookStream;
namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

namespace {

HttpResponse request(uint16_t port, http::verb method, const std::string& target,
                     const std::string& body = "") {
    asio::io_context ioc;
    tcp::socket socket(ioc);
    socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));

    HttpRequest req{method, target, 11};
    req.set(http::field::host, "127.0.0.1");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();
    http::write(socket, req);

    beast::flat_buffer buffer;
    HttpResponse res;
    http::read(socket, buffer, res);

    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

class HttpIngestServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<EventStore>();
        channel = std::make_shared<ChannelSubscriber>(64);
        api = std::make_shared<IngestApi>(store, std::make_shared<Notifier>(channel));

        HttpIngestServer::Config config;
        config.port = 0;
        config.workerThreads = 2;
        config.maxBodyBytes = 4096;
        server = std::make_unique<HttpIngestServer>(api, config);
        server->start();
    }

    void TearDown() override {
        server->stop();
    }

    std::shared_ptr<EventStore> store;
    std::shared_ptr<ChannelSubscriber> channel;
    std::shared_ptr<IngestApi> api;
    std::unique_ptr<HttpIngestServer> server;
};

} // namespace

TEST_F(HttpIngestServerTest, BindsEphemeralPort) {
    EXPECT_TRUE(server->isRunning());
    EXPECT_NE(server->port(), 0);
}

TEST_F(HttpIngestServerTest, HealthOverTheWire) {
    auto res = request(server->port(), http::verb::get, "/health");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "OK");
    EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
    EXPECT_GE(server->totalConnectionsAccepted(), 1u);
}

TEST_F(HttpIngestServerTest, IngestThenQuery) {
    auto created = request(server->port(), http::verb::post, "/events",
        R"({"source_app":"agent1","session_id":"s1","hook_event_type":"tool_use","timestamp":"T1","payload":{"k":1}})");
    EXPECT_EQ(created.result(), http::status::created);

    auto recent = request(server->port(), http::verb::get, "/events/recent");
    ASSERT_EQ(recent.result(), http::status::ok);
    auto events = nlohmann::json::parse(recent.body());
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["id"], 1);
    EXPECT_EQ(events[0]["payload"]["k"], 1);

    auto n = channel->tryPop(std::chrono::milliseconds(100));
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->type, NotificationType::EVENT);
}

TEST_F(HttpIngestServerTest, OversizedBodyIsRejected) {
    std::string huge(5000, 'x');
    auto res = request(server->port(), http::verb::post, "/events", huge);
    EXPECT_EQ(res.result(), http::status::payload_too_large);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(HttpIngestServerTest, WorkersSurviveThrowingHandler) {
    for (int i = 0; i < 4; ++i) {
        asio::post(server->ioContext(), [] { throw std::runtime_error("handler failure"); });
    }

    auto res = request(server->port(), http::verb::get, "/health");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "OK");
}

TEST_F(HttpIngestServerTest, StopIsIdempotent) {
    server->stop();
    EXPECT_FALSE(server->isRunning());
    server->stop();
    EXPECT_FALSE(server->isRunning());
}

TEST_F(HttpIngestServerTest, OccupiedPortIsStartupFailure) {
    HttpIngestServer::Config config;
    config.port = server->port();
    HttpIngestServer second(api, config);
    EXPECT_THROW(second.start(), StartupFailure);
    EXPECT_FALSE(second.isRunning());
}

TEST(HttpIngestServerConfig, InvalidHostIsStartupFailure) {
    auto store = std::make_shared<EventStore>();
    auto api = std::make_shared<IngestApi>(store, std::make_shared<Notifier>(nullptr));

    HttpIngestServer::Config config;
    config.host = "not-an-address";
    config.port = 0;
    HttpIngestServer server(api, config);
    EXPECT_THROW(server.start(), StartupFailure);
}
