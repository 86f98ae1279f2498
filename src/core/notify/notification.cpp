#include <hookstream/core/notify/notification.hpp>

namespace HookStream {

    Notification Notification::eventAdded(StoredEvent e) {
        Notification n;
        n.type = NotificationType::EVENT;
        n.event = std::move(e);
        return n;
    }

    Notification Notification::sessionDeleted(std::string sessionId) {
        Notification n;
        n.type = NotificationType::SESSION_DELETED;
        n.session_id = std::move(sessionId);
        return n;
    }

    Notification Notification::eventsCleared() {
        Notification n;
        n.type = NotificationType::EVENTS_CLEARED;
        return n;
    }

    Notification Notification::serverOnline(uint16_t port) {
        Notification n;
        n.type = NotificationType::SERVER_STATUS;
        n.port = port;
        return n;
    }

    const char* Notification::channel() const {
        switch (type) {
            case NotificationType::EVENT:           return "new-event";
            case NotificationType::SESSION_DELETED: return "session-deleted";
            case NotificationType::EVENTS_CLEARED:  return "events-cleared";
            case NotificationType::SERVER_STATUS:   return "server-status";
        }
        return "unknown";
    }

    nlohmann::json Notification::body() const {
        switch (type) {
            case NotificationType::EVENT:
                return nlohmann::json{
                    {"type", "event"},
                    {"data", event ? nlohmann::json(*event) : nlohmann::json::object()}
                };
            case NotificationType::SESSION_DELETED:
                return nlohmann::json{{"type", "session_deleted"}, {"sessionId", session_id}};
            case NotificationType::EVENTS_CLEARED:
                return nlohmann::json{{"type", "events_cleared"}};
            case NotificationType::SERVER_STATUS:
                return nlohmann::json{{"status", "online"}, {"port", port}};
        }
        return nlohmann::json::object();
    }

} // namespace HookStream
