#pragma once
#include <hookstream/core/events/hook_event.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace HookStream {

    enum struct NotificationType {
        EVENT,
        SESSION_DELETED,
        EVENTS_CLEARED,
        SERVER_STATUS
    };

    // Tagged message pushed to the dashboard subscriber.
    struct Notification {
        NotificationType type = NotificationType::EVENTS_CLEARED;
        std::optional<StoredEvent> event;  // EVENT only
        std::string session_id;            // SESSION_DELETED only
        uint16_t port = 0;                 // SERVER_STATUS only

        static Notification eventAdded(StoredEvent e);
        static Notification sessionDeleted(std::string sessionId);
        static Notification eventsCleared();
        static Notification serverOnline(uint16_t port);

        // Event name the desktop shell listens on, e.g. "new-event"
        const char* channel() const;

        // {"type":"event","data":{...}}, {"type":"session_deleted","sessionId":...},
        // {"type":"events_cleared"} or {"status":"online","port":...}
        nlohmann::json body() const;
    };

} // namespace HookStream
