#pragma once

#include <stdexcept>
#include <string>

namespace HookStream {

/**
 * @brief The ingestion service cannot start.
 *
 * Raised when no port in the configured range can be bound, or when the
 * listener fails to bind or listen on the selected port.
 */
class StartupFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A request body that does not decode as a HookEvent.
 *
 * Carries the HTTP status the router answers with: 400 for bodies that are
 * not JSON at all, 422 for JSON of the wrong shape.
 */
class MalformedInput : public std::runtime_error {
public:
    MalformedInput(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    int status() const noexcept { return status_; }

private:
    int status_;
};

} // namespace HookStream
