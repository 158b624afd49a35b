#include "config.hpp"
#include "upstream.hpp"
#include "http_server.hpp"
#include "proxy.hpp"
#include "spindle_logger.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>
#include <memory>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: spindles [options]\n"
              << "\n"
              << "Transparent proxy that records extended-thinking blocks from\n"
              << "streamed model responses as JSON Lines.\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH    Config file (default: ~/.spindles/config.json)\n"
              << "  -p, --port N         Listen port (default: 8082)\n"
              << "  --listen HOST        Listen address (default: 127.0.0.1)\n"
              << "  -t, --target URL     Upstream base URL (default: https://api.anthropic.com)\n"
              << "  -l, --log-file PATH  Spindle log (default: logs/spindles.jsonl)\n"
              << "  --no-raw-dumps       Do not save raw response streams\n"
              << "  -q, --quiet          No spindle previews on stdout\n"
              << "  -v, --verbose        Per-frame diagnostics on stderr\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  SPINDLES_LISTEN, SPINDLES_PORT, SPINDLES_TARGET_URL, SPINDLES_LOG_FILE,\n"
              << "  SPINDLES_RAW_DUMP_DIR, SPINDLES_RAW_DUMPS, SPINDLES_CONSOLE,\n"
              << "  SPINDLES_VERBOSE, SPINDLES_UPSTREAM_TIMEOUT\n";
}

static bool parse_port(const char* arg, uint16_t& port) {
    try {
        int p = std::stoi(arg);
        if (p <= 0 || p > 65535) return false;
        port = static_cast<uint16_t>(p);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char* argv[]) try {
    // First pass: the config path, so flags can override what it loads
    std::string config_path = spindles::Config::default_path();
    for (int i = 1; i < argc; i++) {
        if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        }
    }

    auto config = spindles::Config::load(config_path);

    for (int i = 1; i < argc; i++) {
        if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            ++i;
        } else if ((std::strcmp(argv[i], "-p") == 0 || std::strcmp(argv[i], "--port") == 0) && i + 1 < argc) {
            if (!parse_port(argv[++i], config.port)) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            config.listen_host = argv[++i];
        } else if ((std::strcmp(argv[i], "-t") == 0 || std::strcmp(argv[i], "--target") == 0) && i + 1 < argc) {
            config.target_url = argv[++i];
            while (!config.target_url.empty() && config.target_url.back() == '/')
                config.target_url.pop_back();
        } else if ((std::strcmp(argv[i], "-l") == 0 || std::strcmp(argv[i], "--log-file") == 0) && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--no-raw-dumps") == 0) {
            config.raw_dumps = false;
        } else if (std::strcmp(argv[i], "-q") == 0 || std::strcmp(argv[i], "--quiet") == 0) {
            config.console_preview = false;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);
#endif

    spindles::http_init();
    spindles::http_set_abort_flag(&g_shutdown);

    std::unique_ptr<spindles::SpindleLogger> logger;
    try {
        logger = std::make_unique<spindles::SpindleLogger>(
            config.log_file, config.console_preview, config.log_queue_capacity);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        spindles::http_cleanup();
        return 1;
    }

    spindles::PlatformUpstreamClient upstream;
    spindles::ProxyHandler proxy(config, *logger, upstream);
    spindles::HttpServer server(
        config.listen_addr(), config.max_body_bytes,
        [&proxy](const spindles::HttpRequest& req, spindles::ResponseWriter& out) {
            proxy.handle(req, out);
        });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        logger->close();
        spindles::http_cleanup();
        return 1;
    }

    std::cerr << "[spindles] Proxy listening on " << config.listen_host << ":"
              << server.port() << "\n"
              << "[spindles] Forwarding to: " << config.target_url << "\n"
              << "[spindles] Logging spindles to: " << config.log_file << "\n"
              << "[spindles] Health check: http://" << config.listen_host << ":"
              << server.port() << config.health_path << "\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[spindles] Shutting down, flushing spindle log...\n";
    // The abort flag is already set, so in-flight upstream reads end
    // within a second and their handler threads can be joined.
    server.stop();
    logger->close();
    std::cerr << "[spindles] " << logger->written() << " spindles written, "
              << logger->dropped() << " dropped\n";

    spindles::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
}
