#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <cstdlib>
#include <algorithm>
#include <atomic>
#include <thread>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>

#include <hookstream/core/config/loader.hpp>
#include <hookstream/core/errors.hpp>
#include <hookstream/core/storage/event_store.hpp>
#include <hookstream/core/notify/notifier.hpp>
#include <hookstream/core/notify/stream_subscriber.hpp>
#include <hookstream/core/notify/log_subscriber.hpp>
#include <hookstream/core/net/port_selector.hpp>
#include <hookstream/core/ingest/ingest_api.hpp>
#include <hookstream/core/ingest/http_server.hpp>

using namespace HookStream;

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int) {
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

// stdout carries the notification stream, so every log line goes to stderr
static void setupLogging() {
    auto logger = spdlog::stderr_color_mt("hookstream");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("HookStreamCore v1.0.0 starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    // A closed stdout pipe must surface as a failed write, not kill the process
    std::signal(SIGPIPE, SIG_IGN);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    if (argc > 1) {
        spdlog::info("Loading configuration from: {}", argv[1]);
        return ConfigLoader::loadConfig(argv[1]);
    }

    const char* defaultPath = "config/config.yaml";
    if (std::filesystem::exists(defaultPath)) {
        spdlog::info("Loading configuration from: {}", defaultPath);
        return ConfigLoader::loadConfig(defaultPath);
    }

    spdlog::warn("No configuration file found, using defaults");
    return AppConfig::AppConfiguration{};
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Order matters for destruction: the server goes first, the stream last
    std::shared_ptr<StreamSubscriber> stream;
    std::shared_ptr<Notifier> notifier;
    std::shared_ptr<EventStore> store;
    std::shared_ptr<IngestApi> api;
    std::unique_ptr<HttpIngestServer> server;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;

    std::shared_ptr<Subscriber> subscriber;
    if (config.notifier.subscriber == AppConfig::SubscriberKind::STDOUT) {
        c.stream = std::make_shared<StreamSubscriber>(std::cout, config.notifier.channel_capacity);
        subscriber = c.stream;
    } else {
        subscriber = std::make_shared<LogSubscriber>();
    }
    c.notifier = std::make_shared<Notifier>(subscriber);

    c.store = std::make_shared<EventStore>(config.storage.max_events, config.storage.recent_limit);
    c.api = std::make_shared<IngestApi>(c.store, c.notifier);

    return c;
}

static void startComponents(Components& c, const AppConfig::AppConfiguration& config) {
    spdlog::info("Starting components...");

    if (c.stream) {
        c.stream->start();
    }

    const auto& s = config.server;
    PortSelector selector(s.preferred_port, s.fallback_port_start, s.fallback_port_end, s.host);

    HttpIngestServer::Config serverConfig;
    serverConfig.host = s.host;
    serverConfig.port = selector.select();
    serverConfig.workerThreads = s.worker_threads != 0
        ? s.worker_threads
        : std::max<size_t>(1, std::thread::hardware_concurrency());
    serverConfig.maxBodyBytes = s.max_body_bytes;

    c.server = std::make_unique<HttpIngestServer>(c.api, serverConfig);
    c.server->start();

    c.notifier->serverOnline(c.server->port());
    spdlog::info("Event server started on port {}", c.server->port());
}

static void stopComponents(Components& c) {
    spdlog::info("=== SHUTDOWN SEQUENCE ===");

    // Stop in reverse order of start
    if (c.server) c.server->stop();
    if (c.stream) c.stream->stop();

    spdlog::info("Notifications delivered: {}, dropped: {}",
                 c.notifier->delivered(), c.notifier->dropped());
    spdlog::info("=== SHUTDOWN COMPLETE ===");
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    Components components;
    try {
        auto config = loadConfiguration(argc, argv);
        spdlog::set_level(spdlog::level::from_str(config.logging.level));
        spdlog::info("Configuration loaded successfully ({} {})", config.app_name, config.version);

        components = initializeComponents(config);
        startComponents(components, config);

        spdlog::info("HookStreamCore running. Press Ctrl+C to shutdown.");

        while (g_running.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
        spdlog::info("Shutdown signal received");

    } catch (const StartupFailure& e) {
        spdlog::error("Failed to start event server: {}", e.what());
        if (components.notifier) stopComponents(components);
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        if (components.notifier) stopComponents(components);
        return EXIT_FAILURE;
    }

    stopComponents(components);
    spdlog::info("HookStreamCore terminated gracefully");
    return EXIT_SUCCESS;
}
