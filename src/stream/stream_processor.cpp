#include "stream_processor.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

namespace spindles {

StreamProcessor::StreamProcessor(std::string connection_id,
                                 std::optional<std::string> session_id,
                                 bool verbose)
    : connection_id_(std::move(connection_id)),
      session_id_(std::move(session_id)),
      verbose_(verbose) {}

void StreamProcessor::warn(const std::string& msg) {
    stats_.warnings++;
    std::cerr << "[stream] " << connection_id_ << ": " << msg << '\n';
}

StreamProcessor::ChunkResult StreamProcessor::process_chunk(std::string_view raw) {
    ChunkResult result;
    result.forward_chunk = raw;
    if (finished_) return result;

    stats_.chunks++;
    stats_.bytes += raw.size();

    reassembler_.feed(raw.data(), raw.size(), [&](const SSEFrame& frame) {
        stats_.frames++;
        StreamEvent event = decode_event(frame);
        std::visit([&](const auto& ev) { on(ev, result.spindles); }, event);
        return true;
    });
    return result;
}

std::vector<Spindle> StreamProcessor::finish() {
    std::vector<Spindle> out;
    if (finished_) return out;
    finished_ = true;

    size_t dropped = reassembler_.finish();
    if (dropped > 0) {
        stats_.truncated_bytes += dropped;
        warn("stream ended with " + std::to_string(dropped) +
             " bytes of an incomplete frame");
    }
    finalize_open(out, "stream ended");
    return out;
}

void StreamProcessor::on(const BlockStart& ev, std::vector<Spindle>& /*out*/) {
    sealed_.erase(ev.index); // an explicit start reopens a finished index
    auto it = open_.find(ev.index);
    if (it != open_.end()) {
        if (it->second.retroactive) {
            // Start arrived after its first delta: adopt the real type, keep the text
            it->second.type = ev.block_type;
            it->second.retroactive = false;
            return;
        }
        warn("duplicate start for block " + std::to_string(ev.index) +
             ", discarding " + std::to_string(it->second.content.size()) + " bytes");
    }

    BlockState block;
    block.type = ev.block_type;
    block.started_at = timestamp_now();
    block.sequence = next_sequence_++;
    open_[ev.index] = std::move(block);

    if (verbose_ && ev.block_type == kThinkingBlockType) {
        std::cerr << "[stream] " << connection_id_ << ": thinking block "
                  << ev.index << " started\n";
    }
}

void StreamProcessor::on(const BlockDelta& ev, std::vector<Spindle>& /*out*/) {
    auto it = open_.find(ev.index);
    if (it == open_.end()) {
        if (sealed_.count(ev.index)) {
            warn("delta for sealed block " + std::to_string(ev.index) + ", ignored");
            return;
        }
        warn("delta for block " + std::to_string(ev.index) + " before its start");
        BlockState block;
        // Thinking blocks are the only ones that stream these delta types
        if (ev.delta_type == "thinking_delta" || ev.delta_type == "signature_delta")
            block.type = kThinkingBlockType;
        block.started_at = timestamp_now();
        block.sequence = next_sequence_++;
        block.retroactive = true;
        it = open_.emplace(ev.index, std::move(block)).first;
    }

    if (ev.delta_type == "signature_delta") {
        it->second.signature += ev.text;
    } else {
        it->second.content += ev.text;
    }
}

void StreamProcessor::on(const BlockStop& ev, std::vector<Spindle>& out) {
    auto it = open_.find(ev.index);
    if (it == open_.end()) {
        warn(sealed_.count(ev.index)
                 ? "stop for sealed block " + std::to_string(ev.index) + ", ignored"
                 : "stop for block " + std::to_string(ev.index) + " with no open start");
        return;
    }

    if (it->second.type == kThinkingBlockType) {
        out.push_back(seal(ev.index, it->second, false));
        if (verbose_) {
            std::cerr << "[stream] " << connection_id_ << ": thinking block "
                      << ev.index << " complete (" << out.back().content.size()
                      << " chars)\n";
        }
    }
    sealed_.insert(ev.index);
    open_.erase(it);
}

void StreamProcessor::on(const MessageStart& ev, std::vector<Spindle>& /*out*/) {
    if (!ev.model.empty()) model_ = ev.model;
}

void StreamProcessor::on(const MessageStop& /*ev*/, std::vector<Spindle>& out) {
    finalize_open(out, "message stopped");
}

void StreamProcessor::on(const Unrecognized& ev, std::vector<Spindle>& /*out*/) {
    if (is_decode_failure(ev)) {
        stats_.undecodable++;
        if (verbose_) {
            std::cerr << "[stream] " << connection_id_ << ": skipped frame '"
                      << ev.event << "': " << ev.reason << '\n';
        }
    } else {
        stats_.unrecognized++;
        if (verbose_) {
            std::cerr << "[stream] " << connection_id_ << ": ignored event '"
                      << ev.event << "'\n";
        }
    }
}

Spindle StreamProcessor::seal(int64_t index, BlockState& block, bool truncated) {
    Spindle s;
    s.id = connection_id_ + "-" + std::to_string(index) + "-" +
           std::to_string(block.sequence);
    s.session_id = session_id_;
    s.content = std::move(block.content);
    s.signature = std::move(block.signature);
    s.block_index = index;
    s.model = model_;
    s.started_at = std::move(block.started_at);
    s.completed_at = timestamp_now();
    s.truncated = truncated;
    stats_.spindles++;
    return s;
}

void StreamProcessor::finalize_open(std::vector<Spindle>& out, const char* reason) {
    if (open_.empty()) return;

    // Completion order is unknown for blocks that never stopped; seal them in
    // the order they were opened.
    std::vector<std::pair<uint64_t, int64_t>> order;
    order.reserve(open_.size());
    for (const auto& [index, block] : open_) order.emplace_back(block.sequence, index);
    std::sort(order.begin(), order.end());

    for (const auto& entry : order) {
        int64_t index = entry.second;
        auto& block = open_[index];
        sealed_.insert(index);
        if (block.type != kThinkingBlockType) continue;
        warn(std::string(reason) + " with thinking block " + std::to_string(index) +
             " still open, flushing as truncated");
        out.push_back(seal(index, block, true));
    }
    open_.clear();
}

} // namespace spindles
