#include "raw_dump.hpp"
#include "util.hpp"
#include <filesystem>
#include <iostream>
#include <system_error>

namespace spindles {

std::string RawDump::file_name(const std::string& connection_id,
                               std::chrono::system_clock::time_point now) {
    return "raw-" + filename_timestamp(now) + "-" + connection_id + ".txt";
}

RawDump::RawDump(const std::string& dir, const std::string& connection_id,
                 std::chrono::system_clock::time_point now) {
    if (dir.empty()) return;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[dump] Cannot create " << dir << ": " << ec.message() << '\n';
        return;
    }

    path_ = (std::filesystem::path(dir) / file_name(connection_id, now)).string();
    file_.open(path_, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file_.is_open()) {
        std::cerr << "[dump] Cannot open " << path_ << '\n';
    }
}

RawDump::~RawDump() {
    close();
}

void RawDump::write(const char* data, size_t len) {
    if (!file_.is_open()) return;
    file_.write(data, static_cast<std::streamsize>(len));
    if (!file_) {
        std::cerr << "[dump] Write failed on " << path_ << ", disabling dump\n";
        file_.close();
        return;
    }
    bytes_ += len;
}

void RawDump::close() {
    if (file_.is_open()) file_.close();
}

} // namespace spindles
