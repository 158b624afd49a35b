#pragma once
#include <string>
#include <functional>
#include <cstddef>

namespace spindles {

// One complete server-sent event: optional "event:" name plus the joined
// "data:" lines, as terminated by a blank line on the wire.
struct SSEFrame {
    std::string event; // event type (e.g., "content_block_delta"), may be empty
    std::string data;  // raw JSON data
};

// Callback receives each complete frame. Return false to stop dispatching.
using SSEFrameCallback = std::function<bool(const SSEFrame& frame)>;

// Reassembles SSE frames from byte chunks split at arbitrary boundaries
// (mid-line, mid-field-name, inside "\r\n", on the delimiter itself).
// Partial lines and partially-read frames are held until the next feed().
class FrameReassembler {
public:
    // Feed raw data chunk, triggers callback for each complete frame in order
    void feed(const std::string& chunk, const SSEFrameCallback& callback);
    void feed(const char* data, size_t len, const SSEFrameCallback& callback);

    // End of stream. Drops whatever incomplete frame is buffered and returns
    // the number of bytes dropped (0 when the stream ended on a boundary).
    size_t finish();

    // Bytes belonging to the frame currently being assembled
    size_t pending_bytes() const { return buffer_.size() - pos_ + frame_bytes_; }

    // Reset parser state
    void reset();

private:
    void process_line(std::string& line);

    std::string buffer_;
    size_t pos_ = 0;           // start of the unconsumed tail in buffer_
    std::string current_event_;
    std::string current_data_;
    bool has_data_ = false;
    size_t frame_bytes_ = 0;   // consumed bytes of the unfinished frame
};

} // namespace spindles
