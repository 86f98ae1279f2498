#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace HookStream {
namespace AppConfig {

    struct ServerConfig {
        std::string host = "127.0.0.1";
        uint16_t preferred_port = 4000;
        uint16_t fallback_port_start = 4001;
        uint16_t fallback_port_end = 4010;
        size_t worker_threads = 0;  // 0 = hardware concurrency
        size_t max_body_bytes = 1024 * 1024;
    };

    struct StorageConfig {
        size_t max_events = 1000;
        size_t recent_limit = 500;
    };

    enum struct SubscriberKind {
        STDOUT,
        LOG
    };

    struct NotifierConfig {
        SubscriberKind subscriber = SubscriberKind::STDOUT;
        size_t channel_capacity = 1024;
    };

    struct LoggingConfig {
        std::string level = "info";
    };

    struct AppConfiguration {
        std::string app_name = "HookStreamCore";
        std::string version = "1.0.0";
        ServerConfig server;
        StorageConfig storage;
        NotifierConfig notifier;
        LoggingConfig logging;
    };

} // namespace AppConfig
} // namespace HookStream
