#include "sse.hpp"

namespace spindles {

void FrameReassembler::feed(const std::string& chunk, const SSEFrameCallback& callback) {
    feed(chunk.data(), chunk.size(), callback);
}

void FrameReassembler::feed(const char* data, size_t len, const SSEFrameCallback& callback) {
    // Compact once the consumed prefix dominates the buffer
    if (pos_ > 0 && pos_ >= buffer_.size() / 2) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
    buffer_.append(data, len);

    while (pos_ < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos_);
        if (newline == std::string::npos) {
            // Incomplete line - keep remainder in buffer
            return;
        }

        std::string line = buffer_.substr(pos_, newline - pos_);
        frame_bytes_ += newline + 1 - pos_;
        pos_ = newline + 1;

        // Remove trailing \r if present
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.empty()) {
            // Empty line = dispatch frame
            bool keep_going = true;
            if (has_data_) {
                SSEFrame frame{std::move(current_event_), std::move(current_data_)};
                keep_going = callback(frame);
            }
            current_event_.clear();
            current_data_.clear();
            has_data_ = false;
            frame_bytes_ = 0;
            if (!keep_going) break;
        } else {
            process_line(line);
        }
    }

    if (pos_ >= buffer_.size()) {
        // All data processed
        buffer_.clear();
        pos_ = 0;
    }
}

void FrameReassembler::process_line(std::string& line) {
    if (line[0] == ':') return; // comment

    size_t colon = line.find(':');
    std::string field = line.substr(0, colon);
    std::string value;
    if (colon != std::string::npos) {
        // Handle both "data: payload" (with space) and "data:payload" (without)
        size_t start = colon + 1;
        if (start < line.size() && line[start] == ' ') ++start;
        value = line.substr(start);
    }

    if (field == "event") {
        current_event_ = std::move(value);
    } else if (field == "data") {
        if (has_data_) {
            current_data_ += '\n';
        }
        current_data_ += value;
        has_data_ = true;
    }
    // Ignore other fields (id, retry, unknown)
}

size_t FrameReassembler::finish() {
    size_t dropped = pending_bytes();
    reset();
    return dropped;
}

void FrameReassembler::reset() {
    buffer_.clear();
    pos_ = 0;
    current_event_.clear();
    current_data_.clear();
    has_data_ = false;
    frame_bytes_ = 0;
}

} // namespace spindles
