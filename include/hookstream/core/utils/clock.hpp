// ============================================================================
// WALL CLOCK FORMATTING

#pragma once

#include <chrono>
#include <string>

namespace HookStream {

class Clock {
public:
    // RFC 3339 UTC with microseconds, e.g. 2026-10-19T12:34:56.123456+00:00
    static std::string toRfc3339(std::chrono::system_clock::time_point tp);

    static std::string nowRfc3339() {
        return toRfc3339(std::chrono::system_clock::now());
    }
};

} // namespace HookStream
