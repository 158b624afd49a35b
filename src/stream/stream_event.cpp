#include "stream_event.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace spindles {

namespace {

constexpr const char* kMalformedJson = "malformed JSON";
constexpr const char* kBadShape = "unexpected shape";

bool read_index(const json& payload, int64_t& index) {
    auto it = payload.find("index");
    if (it == payload.end() || !it->is_number_integer()) return false;
    index = it->get<int64_t>();
    return true;
}

// Which member of a delta object carries its text
const char* delta_text_field(const std::string& delta_type) {
    if (delta_type == "thinking_delta")   return "thinking";
    if (delta_type == "text_delta")       return "text";
    if (delta_type == "input_json_delta") return "partial_json";
    if (delta_type == "signature_delta")  return "signature";
    return nullptr;
}

StreamEvent bad_shape(const std::string& name) {
    return Unrecognized{name, kBadShape};
}

} // namespace

StreamEvent decode_event(const SSEFrame& frame) {
    json payload = json::parse(frame.data, nullptr, /*allow_exceptions=*/false);
    if (payload.is_discarded() || !payload.is_object()) {
        return Unrecognized{frame.event, kMalformedJson};
    }

    std::string name = frame.event;
    if (name.empty()) {
        auto t = payload.find("type");
        if (t != payload.end() && t->is_string()) name = t->get<std::string>();
    }

    if (name == "content_block_start") {
        BlockStart ev;
        if (!read_index(payload, ev.index)) return bad_shape(name);
        auto block = payload.find("content_block");
        if (block == payload.end() || !block->is_object()) return bad_shape(name);
        auto type = block->find("type");
        if (type == block->end() || !type->is_string()) return bad_shape(name);
        ev.block_type = type->get<std::string>();
        return ev;
    }

    if (name == "content_block_delta") {
        BlockDelta ev;
        if (!read_index(payload, ev.index)) return bad_shape(name);
        auto delta = payload.find("delta");
        if (delta == payload.end() || !delta->is_object()) return bad_shape(name);
        auto type = delta->find("type");
        if (type != delta->end() && type->is_string()) ev.delta_type = type->get<std::string>();
        if (const char* field = delta_text_field(ev.delta_type)) {
            auto text = delta->find(field);
            if (text != delta->end() && text->is_string()) ev.text = text->get<std::string>();
        }
        return ev;
    }

    if (name == "content_block_stop") {
        BlockStop ev;
        if (!read_index(payload, ev.index)) return bad_shape(name);
        return ev;
    }

    if (name == "message_start") {
        MessageStart ev;
        auto msg = payload.find("message");
        if (msg != payload.end() && msg->is_object()) {
            auto model = msg->find("model");
            if (model != msg->end() && model->is_string()) ev.model = model->get<std::string>();
        }
        return ev;
    }

    if (name == "message_stop") {
        return MessageStop{};
    }

    return Unrecognized{name, {}};
}

bool is_decode_failure(const Unrecognized& ev) {
    return !ev.reason.empty();
}

} // namespace spindles
