#include "proxy.hpp"
#include "spindle_logger.hpp"
#include "raw_dump.hpp"
#include "stream/stream_processor.hpp"
#include "util.hpp"

#include <iostream>
#include <memory>

using json = nlohmann::json;

namespace spindles {

namespace {

const char* const kSkipRequestHeaders[] = {
    "host", "connection", "content-length", "transfer-encoding",
    "keep-alive", "proxy-connection", "upgrade", "te", "trailer",
    "accept-encoding"
};

const char* const kSkipResponseHeaders[] = {
    "connection", "transfer-encoding", "content-length", "keep-alive"
};

template <size_t N>
bool in_list(const std::string& name, const char* const (&list)[N]) {
    for (const char* skip : list) {
        if (iequals(name, skip)) return true;
    }
    return false;
}

void send_json(ResponseWriter& out, int status, const json& body) {
    out.send_response(status, {{"Content-Type", "application/json"}}, body.dump());
}

// Keeps the active-stream gauge balanced on every exit path
struct ActiveGuard {
    std::atomic<int64_t>& counter;
    explicit ActiveGuard(std::atomic<int64_t>& c) : counter(c) { counter++; }
    ~ActiveGuard() { counter--; }
};

} // namespace

std::vector<Header> filter_request_headers(const std::vector<Header>& headers) {
    std::vector<Header> out;
    out.reserve(headers.size());
    for (const auto& h : headers) {
        if (!in_list(h.first, kSkipRequestHeaders)) out.push_back(h);
    }
    return out;
}

std::vector<Header> filter_response_headers(const std::vector<Header>& headers) {
    std::vector<Header> out;
    out.reserve(headers.size());
    for (const auto& h : headers) {
        if (!in_list(h.first, kSkipResponseHeaders)) out.push_back(h);
    }
    return out;
}

bool is_event_stream(const std::string& content_type) {
    std::string ct = to_lower(content_type);
    return ct.find("text/event-stream") != std::string::npos ||
           ct.find("stream") != std::string::npos;
}

std::string build_upstream_url(const std::string& target_url, const HttpRequest& req) {
    std::string url = target_url;
    while (!url.empty() && url.back() == '/') url.pop_back();
    if (req.path.empty() || req.path[0] != '/') url += '/';
    url += req.path;
    if (!req.query.empty()) url += "?" + req.query;
    return url;
}

ProxyHandler::ProxyHandler(const Config& config, SpindleLogger& logger,
                           UpstreamClient& upstream)
    : config_(config), logger_(logger), upstream_(upstream) {}

json ProxyHandler::health() const {
    return {
        {"status", "ok"},
        {"service", "spindles-proxy"},
        {"port", config_.port},
        {"targetUrl", config_.target_url},
        {"logFile", logger_.path()},
        {"rawDumps", config_.raw_dumps ? json(config_.raw_dump_dir) : json(nullptr)},
        {"spindlesLogged", logger_.written()},
        {"activeConnections", active_.load()}
    };
}

void ProxyHandler::handle(const HttpRequest& req, ResponseWriter& out) {
    if (req.method == "GET" && req.path == config_.health_path) {
        send_json(out, 200, health());
        return;
    }
    requests_++;
    ActiveGuard guard(active_);
    forward(req, out);
}

void ProxyHandler::forward(const HttpRequest& req, ResponseWriter& out) {
    std::string connection_id = generate_id();
    std::optional<std::string> session_id;
    std::string sid = req.header(config_.session_header);
    if (!sid.empty()) session_id = sid;

    UpstreamRequest upstream_req;
    upstream_req.method = req.method;
    upstream_req.url = build_upstream_url(config_.target_url, req);
    upstream_req.headers = filter_request_headers(req.headers);
    if (req.method != "GET" && req.method != "HEAD") upstream_req.body = req.body;
    upstream_req.timeout_seconds = config_.upstream_timeout_seconds;

    std::cerr << "[proxy] " << connection_id << " " << req.method << " " << req.target
              << (session_id ? " session=" + *session_id : std::string()) << '\n';

    std::unique_ptr<UpstreamResponse> response;
    try {
        response = upstream_.open(upstream_req);
    } catch (const UpstreamError& e) {
        std::cerr << "[proxy] " << connection_id << " upstream failed: " << e.what() << '\n';
        send_json(out, e.timed_out() ? 504 : 502,
                  {{"error", "Proxy error"}, {"message", e.what()}});
        return;
    }

    std::string content_type = response->header("content-type");
    std::cerr << "[proxy] " << connection_id << " response " << response->status()
              << (content_type.empty() ? "" : " (" + content_type + ")") << '\n';

    if (is_event_stream(content_type)) {
        relay_stream(*response, out, connection_id, session_id);
    } else {
        relay_buffered(*response, out, connection_id, req.method == "HEAD");
    }
}

void ProxyHandler::relay_stream(UpstreamResponse& response, ResponseWriter& out,
                                const std::string& connection_id,
                                const std::optional<std::string>& session_id) {
    if (!out.begin_stream(static_cast<int>(response.status()),
                          filter_response_headers(response.headers()))) {
        std::cerr << "[proxy] " << connection_id << " client gone before stream\n";
        return;
    }

    StreamProcessor processor(connection_id, session_id, config_.verbose);
    std::unique_ptr<RawDump> dump;
    if (config_.raw_dumps) {
        dump = std::make_unique<RawDump>(config_.raw_dump_dir, connection_id);
        if (dump->active() && config_.verbose)
            std::cerr << "[proxy] " << connection_id << " raw stream -> " << dump->path() << '\n';
    }

    bool extracting = true;
    bool client_gone = false;
    uint64_t chunks = 0;
    std::string chunk;
    ReadStatus rs;
    while ((rs = response.next_chunk(chunk)) == ReadStatus::Data) {
        chunks++;
        // Forward first; extraction never delays or alters the client's bytes
        if (!out.write_chunk(chunk.data(), chunk.size())) {
            client_gone = true;
            break;
        }
        if (dump) dump->write(chunk.data(), chunk.size());
        if (extracting) extract(processor, chunk, extracting);
    }

    if (client_gone) {
        std::cerr << "[proxy] " << connection_id << " client disconnected after "
                  << chunks << " chunks\n";
    } else if (rs == ReadStatus::End) {
        out.end_stream();
        std::cerr << "[proxy] " << connection_id << " stream complete (" << chunks
                  << " chunks)\n";
    } else {
        // Headers are already out: close without a synthetic body
        std::cerr << "[proxy] " << connection_id << " upstream stream "
                  << read_status_name(rs) << " after " << chunks << " chunks\n";
    }

    if (extracting) {
        try {
            emit(processor.finish());
        } catch (const std::exception& e) {
            std::cerr << "[proxy] " << connection_id << " extraction error at end: "
                      << e.what() << '\n';
        }
    }
}

void ProxyHandler::relay_buffered(UpstreamResponse& response, ResponseWriter& out,
                                  const std::string& connection_id, bool head_request) {
    std::string body;
    std::string chunk;
    ReadStatus rs;
    while ((rs = response.next_chunk(chunk)) == ReadStatus::Data) {
        body += chunk;
    }
    if (rs != ReadStatus::End) {
        std::cerr << "[proxy] " << connection_id << " upstream body "
                  << read_status_name(rs) << '\n';
        send_json(out, rs == ReadStatus::TimedOut ? 504 : 502,
                  {{"error", "Proxy error"},
                   {"message", std::string("upstream body ") + read_status_name(rs)}});
        return;
    }
    if (head_request) {
        // No body follows, but the length is the upstream's, not ours
        out.send_head(static_cast<int>(response.status()),
                      filter_response_headers(response.headers()),
                      response.header("content-length"));
        return;
    }
    out.send_response(static_cast<int>(response.status()),
                      filter_response_headers(response.headers()), body);
}

void ProxyHandler::extract(StreamProcessor& processor, const std::string& chunk,
                           bool& extracting) {
    try {
        auto result = processor.process_chunk(chunk);
        if (!result.spindles.empty()) {
            if (config_.verbose) {
                std::cerr << "[proxy] " << processor.connection_id() << " captured "
                          << result.spindles.size() << " spindle(s)\n";
            }
            emit(std::move(result.spindles));
        }
    } catch (const std::exception& e) {
        extracting = false;
        std::cerr << "[proxy] " << processor.connection_id()
                  << " extraction disabled for this stream: " << e.what() << '\n';
    }
}

void ProxyHandler::emit(std::vector<Spindle> spindles) {
    for (auto& s : spindles) {
        spindles_++;
        logger_.log_spindle(std::move(s));
    }
}

} // namespace spindles
