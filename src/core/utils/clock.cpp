#include <hookstream/core/utils/clock.hpp>
#include <cstdio>
#include <ctime>

namespace HookStream {

std::string Clock::toRfc3339(std::chrono::system_clock::time_point tp) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count();
    std::time_t seconds = static_cast<std::time_t>(micros / 1000000);
    long fraction = static_cast<long>(micros % 1000000);
    if (fraction < 0) {
        fraction += 1000000;
        --seconds;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer),
                  "%04d-%02d-%02dT%02d:%02d:%02d.%06ld+00:00",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, fraction);
    return std::string(buffer);
}

} // namespace HookStream
