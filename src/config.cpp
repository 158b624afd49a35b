#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace spindles {

nlohmann::json Config::defaults_json() {
    return {
        {"listen_host", "127.0.0.1"},
        {"port", 8082},
        {"target_url", "https://api.anthropic.com"},
        {"log_file", "logs/spindles.jsonl"},
        {"raw_dump_dir", "logs/raw-dumps"},
        {"raw_dumps", true},
        {"console_preview", true},
        {"verbose", false},
        {"upstream_timeout_seconds", 1800},
        {"session_header", "x-session-id"},
        {"health_path", "/health"},
        {"max_body_bytes", 50 * 1024 * 1024},
        {"log_queue_capacity", 1024}
    };
}

std::string Config::default_path() {
    return expand_home("~/.spindles/config.json");
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("listen_host") && j["listen_host"].is_string())
        cfg.listen_host = j["listen_host"].get<std::string>();
    if (j.contains("port") && j["port"].is_number_unsigned()) {
        auto p = j["port"].get<uint32_t>();
        if (p > 0 && p <= 65535) cfg.port = static_cast<uint16_t>(p);
    }
    if (j.contains("target_url") && j["target_url"].is_string())
        cfg.target_url = j["target_url"].get<std::string>();
    if (j.contains("log_file") && j["log_file"].is_string())
        cfg.log_file = j["log_file"].get<std::string>();
    if (j.contains("raw_dump_dir") && j["raw_dump_dir"].is_string())
        cfg.raw_dump_dir = j["raw_dump_dir"].get<std::string>();
    if (j.contains("raw_dumps") && j["raw_dumps"].is_boolean())
        cfg.raw_dumps = j["raw_dumps"].get<bool>();
    if (j.contains("console_preview") && j["console_preview"].is_boolean())
        cfg.console_preview = j["console_preview"].get<bool>();
    if (j.contains("verbose") && j["verbose"].is_boolean())
        cfg.verbose = j["verbose"].get<bool>();
    if (j.contains("upstream_timeout_seconds") && j["upstream_timeout_seconds"].is_number_unsigned() &&
        j["upstream_timeout_seconds"].get<uint64_t>() > 0)
        cfg.upstream_timeout_seconds = j["upstream_timeout_seconds"].get<uint32_t>();
    if (j.contains("session_header") && j["session_header"].is_string())
        cfg.session_header = j["session_header"].get<std::string>();
    if (j.contains("health_path") && j["health_path"].is_string())
        cfg.health_path = j["health_path"].get<std::string>();
    if (j.contains("max_body_bytes") && j["max_body_bytes"].is_number_unsigned())
        cfg.max_body_bytes = j["max_body_bytes"].get<uint32_t>();
    if (j.contains("log_queue_capacity") && j["log_queue_capacity"].is_number_unsigned())
        cfg.log_queue_capacity = j["log_queue_capacity"].get<uint32_t>();

    // Trailing slash would double up with the request path
    while (!cfg.target_url.empty() && cfg.target_url.back() == '/')
        cfg.target_url.pop_back();
    return cfg;
}

Config Config::load(const std::string& path) {
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << path << " ("
                      << e.what() << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << path << "\n";
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

static bool env_flag(const char* value) {
    std::string v = to_lower(value);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

void Config::apply_env() {
    // Environment variables always override the config file
    if (const char* v = std::getenv("SPINDLES_LISTEN"))
        listen_host = v;
    if (const char* v = std::getenv("SPINDLES_PORT")) {
        try {
            int p = std::stoi(v);
            if (p > 0 && p <= 65535) port = static_cast<uint16_t>(p);
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring invalid SPINDLES_PORT: " << v << "\n";
        }
    }
    if (const char* v = std::getenv("SPINDLES_TARGET_URL")) {
        target_url = v;
        while (!target_url.empty() && target_url.back() == '/') target_url.pop_back();
    }
    if (const char* v = std::getenv("SPINDLES_LOG_FILE"))
        log_file = v;
    if (const char* v = std::getenv("SPINDLES_RAW_DUMP_DIR"))
        raw_dump_dir = v;
    if (const char* v = std::getenv("SPINDLES_RAW_DUMPS"))
        raw_dumps = env_flag(v);
    if (const char* v = std::getenv("SPINDLES_CONSOLE"))
        console_preview = env_flag(v);
    if (const char* v = std::getenv("SPINDLES_VERBOSE"))
        verbose = env_flag(v);
    if (const char* v = std::getenv("SPINDLES_UPSTREAM_TIMEOUT")) {
        try {
            long t = std::stol(v);
            if (t > 0) upstream_timeout_seconds = static_cast<uint32_t>(t);
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring invalid SPINDLES_UPSTREAM_TIMEOUT: " << v << "\n";
        }
    }
}

std::string Config::listen_addr() const {
    return listen_host + ":" + std::to_string(port);
}

} // namespace spindles
