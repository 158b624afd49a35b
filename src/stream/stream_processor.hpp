#pragma once
#include "sse.hpp"
#include "stream_event.hpp"
#include "../spindle.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <cstdint>

namespace spindles {

// Per-request block assembler. Feeds raw response bytes through the frame
// reassembler and decoder, tracks content blocks by index, and seals a
// Spindle when a thinking block's stop event arrives.
//
// State is owned by one instance and discarded with it; nothing is shared
// across connections.
class StreamProcessor {
public:
    struct ChunkResult {
        std::vector<Spindle> spindles;  // sealed by this call, in completion order
        std::string_view forward_chunk; // always the caller's bytes, unchanged
    };

    struct Stats {
        uint64_t chunks = 0;
        uint64_t bytes = 0;
        uint64_t frames = 0;
        uint64_t undecodable = 0;
        uint64_t unrecognized = 0;
        uint64_t warnings = 0;
        uint64_t spindles = 0;
        uint64_t truncated_bytes = 0;
    };

    explicit StreamProcessor(std::string connection_id,
                             std::optional<std::string> session_id = std::nullopt,
                             bool verbose = false);

    ChunkResult process_chunk(std::string_view raw);

    // Stream ended (upstream close, client disconnect, timeout). Reports a
    // dangling partial frame and flushes still-open thinking blocks as
    // truncated spindles. The processor is spent afterwards.
    std::vector<Spindle> finish();

    const Stats& stats() const { return stats_; }
    size_t open_blocks() const { return open_.size(); }
    const std::string& model() const { return model_; }
    const std::string& connection_id() const { return connection_id_; }

private:
    struct BlockState {
        std::string type;
        std::string content;
        std::string signature;
        std::string started_at;
        uint64_t sequence = 0;
        bool retroactive = false; // opened by a delta that had no start
    };

    void on(const BlockStart& ev, std::vector<Spindle>& out);
    void on(const BlockDelta& ev, std::vector<Spindle>& out);
    void on(const BlockStop& ev, std::vector<Spindle>& out);
    void on(const MessageStart& ev, std::vector<Spindle>& out);
    void on(const MessageStop& ev, std::vector<Spindle>& out);
    void on(const Unrecognized& ev, std::vector<Spindle>& out);

    Spindle seal(int64_t index, BlockState& block, bool truncated);
    void finalize_open(std::vector<Spindle>& out, const char* reason);
    void warn(const std::string& msg);

    std::string connection_id_;
    std::optional<std::string> session_id_;
    bool verbose_;
    std::string model_ = "unknown";

    FrameReassembler reassembler_;
    std::map<int64_t, BlockState> open_;
    std::set<int64_t> sealed_; // stopped indexes; deltas for them are dropped
    uint64_t next_sequence_ = 0;
    bool finished_ = false;
    Stats stats_;
};

} // namespace spindles
