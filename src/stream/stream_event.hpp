#pragma once
#include "sse.hpp"
#include <string>
#include <variant>
#include <cstdint>

namespace spindles {

// Content-block type carrying extended thinking
constexpr const char* kThinkingBlockType = "thinking";

struct BlockStart {
    int64_t index = 0;
    std::string block_type; // "thinking", "text", "tool_use", ...
};

struct BlockDelta {
    int64_t index = 0;
    std::string delta_type; // "thinking_delta", "text_delta", "signature_delta", ...
    std::string text;       // the incremental fragment for that delta type
};

struct BlockStop {
    int64_t index = 0;
};

struct MessageStart {
    std::string model;
};

struct MessageStop {};

// Anything the extractor does not act on: pings, message_delta, errors,
// malformed JSON, or a recognized name with the wrong shape.
struct Unrecognized {
    std::string event;
    std::string reason;
};

using StreamEvent = std::variant<BlockStart, BlockDelta, BlockStop,
                                 MessageStart, MessageStop, Unrecognized>;

// Decode one complete frame. Never throws.
StreamEvent decode_event(const SSEFrame& frame);

// True for frames that failed to decode (as opposed to ones that are
// well-formed but of a kind the extractor ignores)
bool is_decode_failure(const Unrecognized& ev);

} // namespace spindles
