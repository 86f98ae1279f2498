#include <hookstream/core/net/port_selector.hpp>
#include <hookstream/core/errors.hpp>
#include <spdlog/spdlog.h>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace HookStream {

// Helper function to close a probe socket
static void closeSocket(int fd) {
    if (fd == -1) return;
    close(fd);
}

PortSelector::PortSelector(uint16_t preferredPort, uint16_t fallbackStart, uint16_t fallbackEnd,
                           std::string host)
    : preferredPort_(preferredPort), fallbackStart_(fallbackStart),
      fallbackEnd_(fallbackEnd), host_(std::move(host)) {
}

std::vector<uint16_t> PortSelector::candidates() const {
    std::vector<uint16_t> ports;
    ports.push_back(preferredPort_);
    if (fallbackStart_ <= fallbackEnd_) {
        for (uint32_t p = fallbackStart_; p <= fallbackEnd_; ++p) {
            ports.push_back(static_cast<uint16_t>(p));
        }
    }
    return ports;
}

uint16_t PortSelector::select() const {
    if (isPortAvailable(host_, preferredPort_)) {
        return preferredPort_;
    }

    spdlog::warn("[PortSelector] Port {} is in use, finding alternative...", preferredPort_);
    auto ports = candidates();
    for (size_t i = 1; i < ports.size(); ++i) {
        if (isPortAvailable(host_, ports[i])) {
            spdlog::info("[PortSelector] Using fallback port {}", ports[i]);
            return ports[i];
        }
        spdlog::debug("[PortSelector] Port {} is in use", ports[i]);
    }

    throw StartupFailure("No available ports found in range " + std::to_string(preferredPort_) +
                         " / " + std::to_string(fallbackStart_) + "-" +
                         std::to_string(fallbackEnd_));
}

bool PortSelector::isPortAvailable(const std::string& host, uint16_t port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        spdlog::error("[PortSelector] Failed to create probe socket");
        return false;
    }

    // Same socket options the server acceptor uses, so TIME_WAIT leftovers do not count as busy
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        spdlog::debug("[PortSelector] SO_REUSEADDR not set on probe for port {}", port);
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        spdlog::error("[PortSelector] Invalid IPv4 address '{}'", host);
        closeSocket(fd);
        return false;
    }

    bool available = bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
                     listen(fd, 1) == 0;
    closeSocket(fd);
    return available;
}

} // namespace HookStream
