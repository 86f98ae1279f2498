// ============================================================================
// HOOK EVENT DECODING UNIT TESTS
// ============================================================================
// Tests for the wire format accepted on POST /events and the JSON form of
// stored events
// ============================================================================

#include <gtest/gtest.h>
#include <hookstream/core/events/hook_event.hpp>
#include <hookstream/core/errors.hpp>
#include <hookstream/core/utils/clock.hpp>
#include <regex>

using namespace HookStream;

static int decodeStatus(const std::string& body) {
    try {
        HookEventDecoder::decode(body);
    } catch (const MalformedInput& e) {
        return e.status();
    }
    return 0;
}

// ============================================================================
// ACCEPTED BODIES
// ============================================================================

TEST(HookEventDecoder, DecodesCompleteEvent) {
    HookEvent e = HookEventDecoder::decode(R"({
        "source_app": "agent1",
        "session_id": "s1",
        "hook_event_type": "tool_use",
        "timestamp": "T1",
        "payload": {"tool_name": "Read", "nested": {"depth": 2}}
    })");

    EXPECT_EQ(e.source_app, "agent1");
    EXPECT_EQ(e.session_id, "s1");
    EXPECT_EQ(e.hook_event_type, "tool_use");
    EXPECT_EQ(e.timestamp, "T1");
    EXPECT_EQ(e.payload["tool_name"], "Read");
    EXPECT_EQ(e.payload["nested"]["depth"], 2);
}

TEST(HookEventDecoder, MissingPayloadDefaultsToEmptyObject) {
    HookEvent e = HookEventDecoder::decode(
        R"({"source_app":"a","session_id":"s","hook_event_type":"t","timestamp":"x"})");
    EXPECT_TRUE(e.payload.is_object());
    EXPECT_TRUE(e.payload.empty());
}

TEST(HookEventDecoder, AcceptsEmptyStringsAndExtraFields) {
    HookEvent e = HookEventDecoder::decode(
        R"({"source_app":"","session_id":"","hook_event_type":"","timestamp":"","extra":42})");
    EXPECT_EQ(e.source_app, "");
    EXPECT_EQ(e.session_id, "");
}

TEST(HookEventDecoder, PayloadMayBeAnyJsonValue) {
    HookEvent e = HookEventDecoder::decode(
        R"({"source_app":"a","session_id":"s","hook_event_type":"t","timestamp":"x","payload":[1,"two"]})");
    ASSERT_TRUE(e.payload.is_array());
    EXPECT_EQ(e.payload.size(), 2u);
}

// ============================================================================
// REJECTED BODIES
// ============================================================================

TEST(HookEventDecoder, NonJsonIsBadRequest) {
    EXPECT_EQ(decodeStatus("not json"), 400);
    EXPECT_EQ(decodeStatus(""), 400);
    EXPECT_EQ(decodeStatus(R"({"source_app": "a",)"), 400);
}

TEST(HookEventDecoder, WrongShapeIsUnprocessable) {
    EXPECT_EQ(decodeStatus("[1,2,3]"), 422);
    EXPECT_EQ(decodeStatus("\"just a string\""), 422);
    EXPECT_EQ(decodeStatus(R"({"session_id":"s","hook_event_type":"t","timestamp":"x"})"), 422);
    EXPECT_EQ(decodeStatus(R"({"source_app":7,"session_id":"s","hook_event_type":"t","timestamp":"x"})"), 422);
    EXPECT_EQ(decodeStatus(R"({"source_app":"a","session_id":null,"hook_event_type":"t","timestamp":"x"})"), 422);
}

TEST(HookEventDecoder, ErrorNamesTheField) {
    try {
        HookEventDecoder::decode(R"({"source_app":"a","session_id":"s","timestamp":"x"})");
        FAIL() << "expected MalformedInput";
    } catch (const MalformedInput& e) {
        EXPECT_NE(std::string(e.what()).find("hook_event_type"), std::string::npos);
    }
}

// ============================================================================
// STORED EVENT JSON
// ============================================================================

TEST(StoredEvent, SerializesAllFields) {
    StoredEvent e;
    e.id = 9;
    e.source_app = "agent1";
    e.session_id = "s1";
    e.hook_event_type = "stop";
    e.timestamp = "T1";
    e.payload = {{"k", "v"}};
    e.created_at = "2026-10-19T12:00:00.000000+00:00";

    nlohmann::json j = e;
    EXPECT_EQ(j["id"], 9);
    EXPECT_EQ(j["source_app"], "agent1");
    EXPECT_EQ(j["session_id"], "s1");
    EXPECT_EQ(j["hook_event_type"], "stop");
    EXPECT_EQ(j["timestamp"], "T1");
    EXPECT_EQ(j["payload"]["k"], "v");
    EXPECT_EQ(j["created_at"], "2026-10-19T12:00:00.000000+00:00");

    StoredEvent back = j.get<StoredEvent>();
    EXPECT_EQ(back.id, 9u);
    EXPECT_EQ(back.created_at, e.created_at);
}

// ============================================================================
// CLOCK
// ============================================================================

TEST(Clock, FormatsRfc3339Utc) {
    using namespace std::chrono;
    system_clock::time_point tp{seconds(1700000000) + microseconds(42)};
    EXPECT_EQ(Clock::toRfc3339(tp), "2023-11-14T22:13:20.000042+00:00");
}

TEST(Clock, NowMatchesRfc3339Shape) {
    std::regex shape(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6}\+00:00)");
    EXPECT_TRUE(std::regex_match(Clock::nowRfc3339(), shape));
}
