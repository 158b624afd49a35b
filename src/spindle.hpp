#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace spindles {

// A completed extended-thinking segment, reassembled from one content block.
struct Spindle {
    std::string id;                        // <connection>-<block index>-<sequence>
    std::optional<std::string> session_id; // from the session header, if any
    std::string type = "thinking_block";
    std::string content;
    std::string signature;                 // signature_delta fragments, kept apart from content
    int64_t block_index = 0;
    std::string model = "unknown";
    std::string started_at;
    std::string completed_at;
    bool truncated = false;                // finalized without its own block-stop
};

// One line of the spindle log.
struct SpindleLogEntry {
    Spindle spindle;
    std::string captured_at;
};

} // namespace spindles
