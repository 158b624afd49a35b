#pragma once
#include "spindle.hpp"
#include <string>
#include <deque>
#include <fstream>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <cstdint>

namespace spindles {

// Append-only JSONL sink for spindles. One instance per process, created at
// startup and passed by reference to every connection handler.
//
// log() only enqueues; a dedicated writer thread serializes every line, so
// entries from concurrent connections never interleave. Write failures are
// reported on stderr and counted as dropped, never thrown to the caller.
class SpindleLogger {
public:
    static constexpr size_t kPreviewChars = 100;
    static constexpr size_t kDefaultQueueCapacity = 1024;

    // Opens (creating parent directories) the log file in append mode.
    // Throws std::runtime_error if the file cannot be opened.
    SpindleLogger(std::string path, bool console_preview,
                  size_t queue_capacity = kDefaultQueueCapacity);
    ~SpindleLogger();

    SpindleLogger(const SpindleLogger&) = delete;
    SpindleLogger& operator=(const SpindleLogger&) = delete;

    // Enqueue an entry. Blocks only while the queue is full.
    void log(SpindleLogEntry entry);

    // Stamp capturedAt with the current time and enqueue.
    void log_spindle(Spindle spindle);

    // Wait until everything queued so far is written and flushed.
    void flush();

    // Flush, stop the writer and close the file. Idempotent.
    void close();

    const std::string& path() const { return path_; }
    uint64_t written() const { return written_.load(); }
    uint64_t dropped() const { return dropped_.load(); }

    // "[spindle] <id> - <first kPreviewChars chars>..."
    static std::string preview_line(const Spindle& spindle);

private:
    void writer_loop();
    void write_entry(const SpindleLogEntry& entry);

    std::string path_;
    bool console_preview_;
    size_t capacity_;
    std::ofstream file_;

    std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::condition_variable drained_;
    std::deque<SpindleLogEntry> queue_;
    uint64_t enqueued_ = 0;
    uint64_t completed_ = 0;
    bool closing_ = false;
    bool closed_ = false;
    std::thread writer_;

    std::atomic<uint64_t> written_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace spindles
