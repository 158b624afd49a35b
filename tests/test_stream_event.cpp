#include <catch2/catch_test_macros.hpp>
#include "stream/stream_event.hpp"

using namespace spindles;

static StreamEvent decode(const std::string& event, const std::string& data) {
    return decode_event(SSEFrame{event, data});
}

// ── Block lifecycle events ───────────────────────────────────────

TEST_CASE("decode_event: content_block_start with thinking block", "[stream_event]") {
    auto ev = decode("content_block_start",
        R"({"type":"content_block_start","index":0,"content_block":{"type":"thinking","thinking":""}})");
    auto* start = std::get_if<BlockStart>(&ev);
    REQUIRE(start != nullptr);
    REQUIRE(start->index == 0);
    REQUIRE(start->block_type == kThinkingBlockType);
}

TEST_CASE("decode_event: content_block_start with tool_use block", "[stream_event]") {
    auto ev = decode("content_block_start",
        R"({"type":"content_block_start","index":3,"content_block":{"type":"tool_use","id":"toolu_1","name":"bash","input":{}}})");
    auto* start = std::get_if<BlockStart>(&ev);
    REQUIRE(start != nullptr);
    REQUIRE(start->index == 3);
    REQUIRE(start->block_type == "tool_use");
}

TEST_CASE("decode_event: thinking_delta carries the thinking text", "[stream_event]") {
    auto ev = decode("content_block_delta",
        R"({"type":"content_block_delta","index":0,"delta":{"type":"thinking_delta","thinking":"Let me think"}})");
    auto* delta = std::get_if<BlockDelta>(&ev);
    REQUIRE(delta != nullptr);
    REQUIRE(delta->index == 0);
    REQUIRE(delta->delta_type == "thinking_delta");
    REQUIRE(delta->text == "Let me think");
}

TEST_CASE("decode_event: text, signature and input_json deltas", "[stream_event]") {
    auto text = decode("content_block_delta",
        R"({"type":"content_block_delta","index":1,"delta":{"type":"text_delta","text":"Hi"}})");
    REQUIRE(std::get<BlockDelta>(text).text == "Hi");

    auto sig = decode("content_block_delta",
        R"({"type":"content_block_delta","index":0,"delta":{"type":"signature_delta","signature":"EqQB"}})");
    REQUIRE(std::get<BlockDelta>(sig).delta_type == "signature_delta");
    REQUIRE(std::get<BlockDelta>(sig).text == "EqQB");

    auto json_delta = decode("content_block_delta",
        R"({"type":"content_block_delta","index":2,"delta":{"type":"input_json_delta","partial_json":"{\"cmd\":"}})");
    REQUIRE(std::get<BlockDelta>(json_delta).text == "{\"cmd\":");
}

TEST_CASE("decode_event: unknown delta type decodes with empty text", "[stream_event]") {
    auto ev = decode("content_block_delta",
        R"({"type":"content_block_delta","index":0,"delta":{"type":"citations_delta","citation":{}}})");
    auto* delta = std::get_if<BlockDelta>(&ev);
    REQUIRE(delta != nullptr);
    REQUIRE(delta->delta_type == "citations_delta");
    REQUIRE(delta->text.empty());
}

TEST_CASE("decode_event: content_block_stop", "[stream_event]") {
    auto ev = decode("content_block_stop", R"({"type":"content_block_stop","index":4})");
    auto* stop = std::get_if<BlockStop>(&ev);
    REQUIRE(stop != nullptr);
    REQUIRE(stop->index == 4);
}

// ── Message events ───────────────────────────────────────────────

TEST_CASE("decode_event: message_start captures the model", "[stream_event]") {
    auto ev = decode("message_start",
        R"({"type":"message_start","message":{"id":"msg_1","model":"claude-opus-4-1","content":[]}})");
    auto* start = std::get_if<MessageStart>(&ev);
    REQUIRE(start != nullptr);
    REQUIRE(start->model == "claude-opus-4-1");
}

TEST_CASE("decode_event: message_start without a model", "[stream_event]") {
    auto ev = decode("message_start", R"({"type":"message_start","message":{}})");
    auto* start = std::get_if<MessageStart>(&ev);
    REQUIRE(start != nullptr);
    REQUIRE(start->model.empty());
}

TEST_CASE("decode_event: message_stop", "[stream_event]") {
    auto ev = decode("message_stop", R"({"type":"message_stop"})");
    REQUIRE(std::holds_alternative<MessageStop>(ev));
}

// ── Event name fallback ──────────────────────────────────────────

TEST_CASE("decode_event: falls back to payload type without an event line", "[stream_event]") {
    auto ev = decode("", R"({"type":"content_block_stop","index":1})");
    auto* stop = std::get_if<BlockStop>(&ev);
    REQUIRE(stop != nullptr);
    REQUIRE(stop->index == 1);
}

TEST_CASE("decode_event: event line takes precedence over payload type", "[stream_event]") {
    auto ev = decode("ping", R"({"type":"content_block_stop","index":1})");
    auto* un = std::get_if<Unrecognized>(&ev);
    REQUIRE(un != nullptr);
    REQUIRE(un->event == "ping");
    REQUIRE_FALSE(is_decode_failure(*un));
}

// ── Ignored and malformed frames ─────────────────────────────────

TEST_CASE("decode_event: ping and message_delta are unrecognized but valid", "[stream_event]") {
    auto ping = decode("ping", R"({"type":"ping"})");
    REQUIRE(std::holds_alternative<Unrecognized>(ping));
    REQUIRE_FALSE(is_decode_failure(std::get<Unrecognized>(ping)));

    auto md = decode("message_delta", R"({"type":"message_delta","delta":{"stop_reason":"end_turn"}})");
    REQUIRE(std::holds_alternative<Unrecognized>(md));
    REQUIRE_FALSE(is_decode_failure(std::get<Unrecognized>(md)));
}

TEST_CASE("decode_event: malformed JSON never throws", "[stream_event]") {
    StreamEvent ev;
    REQUIRE_NOTHROW(ev = decode("content_block_delta", R"({"type":"content_block_delta","index":)"));
    auto* un = std::get_if<Unrecognized>(&ev);
    REQUIRE(un != nullptr);
    REQUIRE(un->event == "content_block_delta");
    REQUIRE(is_decode_failure(*un));
}

TEST_CASE("decode_event: non-object payload is malformed", "[stream_event]") {
    auto ev = decode("content_block_stop", "[1,2,3]");
    REQUIRE(is_decode_failure(std::get<Unrecognized>(ev)));

    auto done = decode("", "[DONE]");
    REQUIRE(is_decode_failure(std::get<Unrecognized>(done)));
}

TEST_CASE("decode_event: wrong shapes are reported", "[stream_event]") {
    // index as a string
    auto a = decode("content_block_stop", R"({"type":"content_block_stop","index":"0"})");
    REQUIRE(is_decode_failure(std::get<Unrecognized>(a)));

    // content_block missing
    auto b = decode("content_block_start", R"({"type":"content_block_start","index":0})");
    REQUIRE(is_decode_failure(std::get<Unrecognized>(b)));

    // delta not an object
    auto c = decode("content_block_delta", R"({"type":"content_block_delta","index":0,"delta":"x"})");
    REQUIRE(is_decode_failure(std::get<Unrecognized>(c)));

    // delta text of the wrong type
    auto d = decode("content_block_delta",
        R"({"type":"content_block_delta","index":0,"delta":{"type":"thinking_delta","thinking":42}})");
    REQUIRE(std::holds_alternative<BlockDelta>(d));
    REQUIRE(std::get<BlockDelta>(d).text.empty());
}
