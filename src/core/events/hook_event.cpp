#include <hookstream/core/events/hook_event.hpp>
#include <hookstream/core/errors.hpp>

namespace HookStream {

    void to_json(nlohmann::json& j, const HookEvent& e) {
        j = nlohmann::json{
            {"source_app", e.source_app},
            {"session_id", e.session_id},
            {"hook_event_type", e.hook_event_type},
            {"timestamp", e.timestamp},
            {"payload", e.payload}
        };
    }

    void to_json(nlohmann::json& j, const StoredEvent& e) {
        j = nlohmann::json{
            {"id", e.id},
            {"source_app", e.source_app},
            {"session_id", e.session_id},
            {"hook_event_type", e.hook_event_type},
            {"timestamp", e.timestamp},
            {"payload", e.payload},
            {"created_at", e.created_at}
        };
    }

    void from_json(const nlohmann::json& j, StoredEvent& e) {
        j.at("id").get_to(e.id);
        j.at("source_app").get_to(e.source_app);
        j.at("session_id").get_to(e.session_id);
        j.at("hook_event_type").get_to(e.hook_event_type);
        j.at("timestamp").get_to(e.timestamp);
        e.payload = j.value("payload", nlohmann::json::object());
        j.at("created_at").get_to(e.created_at);
    }

    HookEvent HookEventDecoder::decode(const std::string& body) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(body);
        } catch (const nlohmann::json::parse_error& e) {
            throw MalformedInput(400, std::string("Failed to parse the request body as JSON: ") + e.what());
        }
        return fromJson(j);
    }

    HookEvent HookEventDecoder::fromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw MalformedInput(422, "Expected a JSON object, got " + std::string(j.type_name()));
        }

        HookEvent e;
        e.source_app = requireString(j, "source_app");
        e.session_id = requireString(j, "session_id");
        e.hook_event_type = requireString(j, "hook_event_type");
        e.timestamp = requireString(j, "timestamp");

        auto it = j.find("payload");
        if (it != j.end()) {
            e.payload = *it;
        }
        return e;
    }

    std::string HookEventDecoder::requireString(const nlohmann::json& j, const char* field) {
        auto it = j.find(field);
        if (it == j.end()) {
            throw MalformedInput(422, std::string("missing field `") + field + "`");
        }
        if (!it->is_string()) {
            throw MalformedInput(422, std::string("invalid type for field `") + field +
                                 "`: expected a string, got " + it->type_name());
        }
        return it->get<std::string>();
    }

} // namespace HookStream
