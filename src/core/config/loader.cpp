#include <hookstream/core/config/loader.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <algorithm>
#include <filesystem>
#include <limits>
#include <stdexcept>

namespace HookStream {

namespace {

const char* const kLogLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};

std::string qualified(const std::string& section, const char* key) {
    return section.empty() ? std::string(key) : section + "." + key;
}

std::string readString(const YAML::Node& parent, const std::string& section,
                       const char* key, bool required, const std::string& fallback) {
    const YAML::Node node = parent[key];
    if (!node) {
        if (required) {
            throw std::runtime_error("Missing required field: " + qualified(section, key));
        }
        return fallback;
    }
    if (!node.IsScalar()) {
        throw std::runtime_error("Invalid type for field " + qualified(section, key) +
                                 ": expected a string");
    }
    return node.as<std::string>();
}

long long readInteger(const YAML::Node& parent, const std::string& section,
                      const char* key, long long fallback) {
    const YAML::Node node = parent[key];
    if (!node) {
        return fallback;
    }
    const std::string message = "Invalid type for field " + qualified(section, key) +
                                ": expected an integer";
    if (!node.IsScalar()) {
        throw std::runtime_error(message);
    }
    try {
        return node.as<long long>();
    } catch (const YAML::BadConversion&) {
        throw std::runtime_error(message);
    }
}

uint16_t readPort(const YAML::Node& parent, const std::string& section,
                  const char* key, uint16_t fallback) {
    long long value = readInteger(parent, section, key, fallback);
    if (value < 1 || value > std::numeric_limits<uint16_t>::max()) {
        throw std::runtime_error("Invalid value for field " + qualified(section, key) +
                                 ": " + std::to_string(value) + " is not a valid port");
    }
    return static_cast<uint16_t>(value);
}

size_t readCount(const YAML::Node& parent, const std::string& section,
                 const char* key, size_t fallback) {
    long long value = readInteger(parent, section, key, static_cast<long long>(fallback));
    if (value < 0) {
        throw std::runtime_error("Invalid value for field " + qualified(section, key) +
                                 ": must not be negative");
    }
    return static_cast<size_t>(value);
}

YAML::Node section(const YAML::Node& root, const char* name) {
    const YAML::Node node = root[name];
    if (node && !node.IsMap()) {
        throw std::runtime_error(std::string("Invalid type for section ") + name + ": expected a map");
    }
    return node;
}

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        throw std::runtime_error("Configuration file not found: " + filepath);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parse error in " + filepath + ": " + e.what());
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Configuration root of " + filepath + " must be a map");
    }

    AppConfig::AppConfiguration config;
    config.app_name = readString(root, "", "app_name", true, config.app_name);
    config.version = readString(root, "", "version", true, config.version);

    if (auto server = section(root, "server")) {
        auto& s = config.server;
        s.host = readString(server, "server", "host", false, s.host);
        s.preferred_port = readPort(server, "server", "preferred_port", s.preferred_port);
        s.fallback_port_start = readPort(server, "server", "fallback_port_start", s.fallback_port_start);
        s.fallback_port_end = readPort(server, "server", "fallback_port_end", s.fallback_port_end);
        s.worker_threads = readCount(server, "server", "worker_threads", s.worker_threads);
        s.max_body_bytes = readCount(server, "server", "max_body_bytes", s.max_body_bytes);
    }

    if (auto storage = section(root, "storage")) {
        auto& s = config.storage;
        s.max_events = readCount(storage, "storage", "max_events", s.max_events);
        s.recent_limit = readCount(storage, "storage", "recent_limit", s.recent_limit);
    }

    if (auto notifier = section(root, "notifier")) {
        auto& n = config.notifier;
        std::string kind = readString(notifier, "notifier", "subscriber", false, "stdout");
        if (kind == "stdout") {
            n.subscriber = AppConfig::SubscriberKind::STDOUT;
        } else if (kind == "log") {
            n.subscriber = AppConfig::SubscriberKind::LOG;
        } else {
            throw std::runtime_error("Invalid value for field notifier.subscriber: '" + kind +
                                     "' (expected stdout or log)");
        }
        n.channel_capacity = readCount(notifier, "notifier", "channel_capacity", n.channel_capacity);
    }

    if (auto logging = section(root, "logging")) {
        config.logging.level = readString(logging, "logging", "level", false, config.logging.level);
    }

    validate(config);
    spdlog::debug("[ConfigLoader] Loaded {} {} from {}", config.app_name, config.version, filepath);
    return config;
}

void ConfigLoader::validate(const AppConfig::AppConfiguration& config) {
    const auto& server = config.server;
    in_addr addr{};
    if (inet_pton(AF_INET, server.host.c_str(), &addr) != 1 || (ntohl(addr.s_addr) >> 24) != 127) {
        throw std::runtime_error("Invalid value for field server.host: '" + server.host +
                                 "' is not a loopback address");
    }
    if (server.fallback_port_start > server.fallback_port_end) {
        throw std::runtime_error("Invalid value for fields server.fallback_port_start/end: empty range");
    }
    if (server.max_body_bytes == 0) {
        throw std::runtime_error("Invalid value for field server.max_body_bytes: must be positive");
    }
    if (config.storage.max_events == 0) {
        throw std::runtime_error("Invalid value for field storage.max_events: must be positive");
    }
    if (config.storage.recent_limit > config.storage.max_events) {
        throw std::runtime_error("Invalid value for field storage.recent_limit: exceeds storage.max_events");
    }
    if (config.notifier.channel_capacity == 0) {
        throw std::runtime_error("Invalid value for field notifier.channel_capacity: must be positive");
    }
    if (std::find(std::begin(kLogLevels), std::end(kLogLevels), config.logging.level) ==
        std::end(kLogLevels)) {
        throw std::runtime_error("Invalid value for field logging.level: '" + config.logging.level + "'");
    }
}

} // namespace HookStream
