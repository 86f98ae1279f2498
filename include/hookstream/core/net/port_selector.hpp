#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace HookStream {

/**
 * @class PortSelector
 * @brief Picks the loopback port the ingestion server will bind.
 *
 * Candidates are tried in the order {preferred, start, start+1, ..., end};
 * the first one that can be bound and listened on wins. The probe socket is
 * closed immediately, so the port is not held.
 */
class PortSelector {
public:
    PortSelector(uint16_t preferredPort, uint16_t fallbackStart, uint16_t fallbackEnd,
                 std::string host = "127.0.0.1");

    /**
     * @brief Probe the candidates
     * @return The first available port
     * @throws StartupFailure if none is available
     */
    uint16_t select() const;

    std::vector<uint16_t> candidates() const;

    static bool isPortAvailable(const std::string& host, uint16_t port);

private:
    uint16_t preferredPort_;
    uint16_t fallbackStart_;
    uint16_t fallbackEnd_;
    std::string host_;
};

} // namespace HookStream
