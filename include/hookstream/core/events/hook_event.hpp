#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace HookStream {

    // Event as reported by an instrumentation hook. Only the types of the
    // fields are checked; empty strings are accepted.
    struct HookEvent {
        std::string source_app;
        std::string session_id;
        std::string hook_event_type;
        std::string timestamp;
        nlohmann::json payload = nlohmann::json::object();
    };

    // HookEvent as retained by the EventStore. Never mutated after append.
    struct StoredEvent {
        uint64_t id = 0;
        std::string source_app;
        std::string session_id;
        std::string hook_event_type;
        std::string timestamp;
        nlohmann::json payload = nlohmann::json::object();
        std::string created_at;
    };

    void to_json(nlohmann::json& j, const HookEvent& e);
    void to_json(nlohmann::json& j, const StoredEvent& e);
    void from_json(const nlohmann::json& j, StoredEvent& e);

    class HookEventDecoder {
    public:
        /**
         * @brief Decode an HTTP request body into a HookEvent
         * @throws MalformedInput(400) if the body is not JSON,
         *         MalformedInput(422) if it is JSON of the wrong shape
         */
        static HookEvent decode(const std::string& body);

        static HookEvent fromJson(const nlohmann::json& j);

    private:
        static std::string requireString(const nlohmann::json& j, const char* field);
    };

} // namespace HookStream
