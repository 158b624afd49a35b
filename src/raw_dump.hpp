#pragma once
#include <string>
#include <fstream>
#include <chrono>

namespace spindles {

// Verbatim copy of one response stream for offline replay. Best-effort:
// an open or write failure disables the dump and is reported once.
class RawDump {
public:
    // Creates <dir>/raw-<timestamp>-<connection_id>.txt. An empty dir
    // yields a disabled dump.
    RawDump(const std::string& dir, const std::string& connection_id,
            std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
    ~RawDump();

    RawDump(const RawDump&) = delete;
    RawDump& operator=(const RawDump&) = delete;

    void write(const char* data, size_t len);
    void close();

    bool active() const { return file_.is_open(); }
    const std::string& path() const { return path_; }
    size_t bytes_written() const { return bytes_; }

    static std::string file_name(const std::string& connection_id,
                                 std::chrono::system_clock::time_point now);

private:
    std::string path_;
    std::ofstream file_;
    size_t bytes_ = 0;
};

} // namespace spindles
