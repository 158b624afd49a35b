#pragma once
#include "spindle.hpp"
#include <nlohmann/json.hpp>

namespace spindles {

// JSON <-> Spindle conversion shared by the logger and tests.

inline nlohmann::json spindle_to_json(const Spindle& s) {
    nlohmann::json j = {
        {"id", s.id},
        {"sessionId", nullptr},
        {"type", s.type},
        {"content", s.content},
        {"blockIndex", s.block_index},
        {"model", s.model},
        {"startedAt", s.started_at},
        {"completedAt", s.completed_at},
        {"truncated", s.truncated}
    };
    if (s.session_id) j["sessionId"] = *s.session_id;
    if (!s.signature.empty()) j["signature"] = s.signature;
    return j;
}

inline Spindle spindle_from_json(const nlohmann::json& j) {
    Spindle s;
    s.id = j.value("id", "");
    if (j.contains("sessionId") && j["sessionId"].is_string())
        s.session_id = j["sessionId"].get<std::string>();
    s.type = j.value("type", "thinking_block");
    s.content = j.value("content", "");
    s.signature = j.value("signature", "");
    s.block_index = j.value("blockIndex", int64_t{0});
    s.model = j.value("model", "unknown");
    s.started_at = j.value("startedAt", "");
    s.completed_at = j.value("completedAt", "");
    s.truncated = j.value("truncated", false);
    return s;
}

inline nlohmann::json log_entry_to_json(const SpindleLogEntry& entry) {
    return {
        {"spindle", spindle_to_json(entry.spindle)},
        {"capturedAt", entry.captured_at}
    };
}

inline SpindleLogEntry log_entry_from_json(const nlohmann::json& j) {
    SpindleLogEntry entry;
    if (j.contains("spindle") && j["spindle"].is_object())
        entry.spindle = spindle_from_json(j["spindle"]);
    entry.captured_at = j.value("capturedAt", "");
    return entry;
}

} // namespace spindles
