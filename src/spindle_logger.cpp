#include "spindle_logger.hpp"
#include "spindle_json.hpp"
#include "util.hpp"
#include <iostream>
#include <stdexcept>

namespace spindles {

SpindleLogger::SpindleLogger(std::string path, bool console_preview,
                             size_t queue_capacity)
    : path_(std::move(path)),
      console_preview_(console_preview),
      capacity_(queue_capacity == 0 ? 1 : queue_capacity) {
    if (!ensure_parent_dir(path_)) {
        throw std::runtime_error("Cannot create log directory for " + path_);
    }
    file_.open(path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!file_.is_open()) {
        throw std::runtime_error("Cannot open spindle log " + path_);
    }
    writer_ = std::thread([this]() { writer_loop(); });
}

SpindleLogger::~SpindleLogger() {
    close();
}

void SpindleLogger::log(SpindleLogEntry entry) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this]() { return queue_.size() < capacity_ || closing_; });
    if (closing_) {
        lock.unlock();
        dropped_++;
        std::cerr << "[logger] Log closed, dropping spindle " << entry.spindle.id << '\n';
        return;
    }
    queue_.push_back(std::move(entry));
    enqueued_++;
    not_empty_.notify_one();
}

void SpindleLogger::log_spindle(Spindle spindle) {
    SpindleLogEntry entry;
    entry.spindle = std::move(spindle);
    entry.captured_at = timestamp_now();
    log(std::move(entry));
}

void SpindleLogger::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    uint64_t target = enqueued_;
    drained_.wait(lock, [this, target]() { return completed_ >= target || closed_; });
}

void SpindleLogger::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    if (writer_.joinable()) writer_.join();

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
    closed_ = true;
    drained_.notify_all();
}

void SpindleLogger::writer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        not_empty_.wait(lock, [this]() { return !queue_.empty() || closing_; });
        if (queue_.empty() && closing_) break;

        // Drain the whole batch outside the lock
        std::deque<SpindleLogEntry> batch;
        batch.swap(queue_);
        not_full_.notify_all();
        lock.unlock();

        for (const auto& entry : batch) write_entry(entry);
        file_.flush();
        if (!file_) {
            std::cerr << "[logger] Flush failed on " << path_ << '\n';
            file_.clear();
        }

        lock.lock();
        completed_ += batch.size();
        drained_.notify_all();
    }
}

void SpindleLogger::write_entry(const SpindleLogEntry& entry) {
    std::string line;
    try {
        // Invalid UTF-8 in model output is replaced rather than failing the entry
        line = log_entry_to_json(entry).dump(-1, ' ', false,
                                             nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        dropped_++;
        std::cerr << "[logger] Cannot serialize spindle " << entry.spindle.id
                  << ": " << e.what() << '\n';
        return;
    }
    line += '\n';

    file_.write(line.data(), static_cast<std::streamsize>(line.size()));
    if (!file_) {
        dropped_++;
        std::cerr << "[logger] Write failed for spindle " << entry.spindle.id
                  << " to " << path_ << '\n';
        file_.clear();
        return;
    }
    written_++;

    if (console_preview_) {
        std::cout << preview_line(entry.spindle) << std::endl;
    }
}

std::string SpindleLogger::preview_line(const Spindle& spindle) {
    std::string preview = utf8_prefix(spindle.content, kPreviewChars);
    std::string line = "[spindle] " + spindle.id + " - " + preview;
    if (preview.size() < spindle.content.size()) line += "...";
    if (spindle.truncated) line += " (truncated)";
    return line;
}

} // namespace spindles
