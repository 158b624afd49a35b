#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace spindles {

struct Config {
    std::string listen_host = "127.0.0.1";
    uint16_t port = 8082;
    std::string target_url = "https://api.anthropic.com";

    std::string log_file = "logs/spindles.jsonl";
    std::string raw_dump_dir = "logs/raw-dumps";
    bool raw_dumps = true;
    bool console_preview = true;  // Echo a short preview of each spindle to stdout
    bool verbose = false;         // Per-frame diagnostics on stderr

    uint32_t upstream_timeout_seconds = 1800; // 30 minutes
    std::string session_header = "x-session-id";
    std::string health_path = "/health";
    uint32_t max_body_bytes = 50 * 1024 * 1024;
    uint32_t log_queue_capacity = 1024;

    // Load from a JSON config file + env vars. A missing file is created
    // with defaults; a malformed file falls back to defaults.
    static Config load(const std::string& path = default_path());

    // Build from already-parsed JSON (missing keys keep their defaults)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // ~/.spindles/config.json
    static std::string default_path();

    // Apply SPINDLES_* environment overrides
    void apply_env();

    // "host:port"
    std::string listen_addr() const;
};

} // namespace spindles
