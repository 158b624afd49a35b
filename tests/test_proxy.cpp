#include <catch2/catch_test_macros.hpp>
#include "proxy.hpp"
#include "spindle_logger.hpp"
#include "spindle_json.hpp"
#include "mock_upstream_client.hpp"
#include "stream_fixtures.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace spindles;

// Temp log + dump dir, a config pointing at it and a logger, torn down together
struct ProxyFixture {
    std::string dir;
    Config config;
    std::unique_ptr<SpindleLogger> logger;
    MockUpstreamClient upstream;

    explicit ProxyFixture(const std::string& name) {
        dir = "/tmp/spindles_test_proxy_" + name + "_" + std::to_string(getpid());
        std::filesystem::remove_all(dir);
        config.target_url = "https://api.anthropic.com";
        config.log_file = dir + "/spindles.jsonl";
        config.raw_dump_dir = dir + "/raw";
        config.raw_dumps = false;
        config.console_preview = false;
        logger = std::make_unique<SpindleLogger>(config.log_file, false);
    }

    ~ProxyFixture() {
        logger->close();
        std::filesystem::remove_all(dir);
    }

    ProxyFixture(const ProxyFixture&) = delete;
    ProxyFixture& operator=(const ProxyFixture&) = delete;

    std::vector<SpindleLogEntry> logged() {
        logger->flush();
        std::vector<SpindleLogEntry> out;
        std::ifstream f(config.log_file);
        std::string line;
        while (std::getline(f, line)) {
            out.push_back(log_entry_from_json(nlohmann::json::parse(line)));
        }
        return out;
    }
};

static HttpRequest post_messages(const std::string& body = R"({"model":"claude-sonnet-4-5","stream":true})") {
    HttpRequest req;
    req.method = "POST";
    req.target = "/v1/messages";
    req.path = "/v1/messages";
    req.headers = {
        {"Host", "localhost:8082"},
        {"Content-Type", "application/json"},
        {"x-api-key", "sk-ant-test"},
        {"anthropic-version", "2023-06-01"},
        {"Accept-Encoding", "gzip, br"},
        {"Content-Length", std::to_string(body.size())},
        {"Connection", "keep-alive"}
    };
    req.body = body;
    return req;
}

static ScriptedResponse sse_response(const std::vector<std::string>& chunks) {
    ScriptedResponse r;
    r.status = 200;
    r.headers = {
        {"Content-Type", "text/event-stream; charset=utf-8"},
        {"Transfer-Encoding", "chunked"},
        {"request-id", "req_01"},
        {"Connection", "keep-alive"}
    };
    r.chunks = chunks;
    return r;
}

// Split a string into pieces of at most n bytes
static std::vector<std::string> pieces(const std::string& s, size_t n) {
    std::vector<std::string> out;
    for (size_t i = 0; i < s.size(); i += n) out.push_back(s.substr(i, n));
    return out;
}

// ── Header and URL helpers ───────────────────────────────────────

TEST_CASE("filter_request_headers: drops hop-by-hop and encoding headers", "[proxy]") {
    auto out = filter_request_headers(post_messages().headers);
    REQUIRE(find_header(out, "host").empty());
    REQUIRE(find_header(out, "content-length").empty());
    REQUIRE(find_header(out, "connection").empty());
    REQUIRE(find_header(out, "accept-encoding").empty());
    REQUIRE(find_header(out, "x-api-key") == "sk-ant-test");
    REQUIRE(find_header(out, "anthropic-version") == "2023-06-01");
    REQUIRE(find_header(out, "content-type") == "application/json");
}

TEST_CASE("filter_request_headers: keeps order and case", "[proxy]") {
    std::vector<Header> in = {{"X-B", "1"}, {"TE", "trailers"}, {"x-a", "2"}};
    auto out = filter_request_headers(in);
    REQUIRE(out.size() == 2);
    REQUIRE(out[0].first == "X-B");
    REQUIRE(out[1].first == "x-a");
}

TEST_CASE("filter_response_headers: drops framing headers", "[proxy]") {
    auto out = filter_response_headers(sse_response({}).headers);
    REQUIRE(out.size() == 2);
    REQUIRE(find_header(out, "content-type") == "text/event-stream; charset=utf-8");
    REQUIRE(find_header(out, "request-id") == "req_01");
}

TEST_CASE("is_event_stream: content type detection", "[proxy]") {
    REQUIRE(is_event_stream("text/event-stream"));
    REQUIRE(is_event_stream("Text/Event-Stream; charset=utf-8"));
    REQUIRE(is_event_stream("application/x-ndjson-stream"));
    REQUIRE_FALSE(is_event_stream("application/json"));
    REQUIRE_FALSE(is_event_stream(""));
}

TEST_CASE("build_upstream_url: path and query", "[proxy]") {
    HttpRequest req;
    req.path = "/v1/messages";
    REQUIRE(build_upstream_url("https://api.anthropic.com", req) ==
            "https://api.anthropic.com/v1/messages");
    REQUIRE(build_upstream_url("https://api.anthropic.com/", req) ==
            "https://api.anthropic.com/v1/messages");
    req.query = "beta=true";
    REQUIRE(build_upstream_url("http://localhost:9000", req) ==
            "http://localhost:9000/v1/messages?beta=true");
}

// ── Health ───────────────────────────────────────────────────────

TEST_CASE("ProxyHandler: health endpoint answers locally", "[proxy]") {
    ProxyFixture fx("health");
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    HttpRequest req;
    req.method = "GET";
    req.target = "/health";
    req.path = "/health";
    CaptureWriter out;
    proxy.handle(req, out);

    REQUIRE(fx.upstream.call_count == 0);
    REQUIRE(out.status == 200);
    REQUIRE(out.header("content-type") == "application/json");
    auto j = nlohmann::json::parse(out.body);
    REQUIRE(j["status"] == "ok");
    REQUIRE(j["service"] == "spindles-proxy");
    REQUIRE(j["port"] == 8082);
    REQUIRE(j["targetUrl"] == "https://api.anthropic.com");
    REQUIRE(j["logFile"] == fx.config.log_file);
    REQUIRE(j["rawDumps"].is_null());
    REQUIRE(j["spindlesLogged"] == 0);
    REQUIRE(j["activeConnections"] == 0);
    REQUIRE(proxy.requests() == 0);
}

TEST_CASE("ProxyHandler: POST to the health path is proxied", "[proxy]") {
    ProxyFixture fx("health_post");
    fx.upstream.next_response.status = 404;
    fx.upstream.next_response.headers = {{"Content-Type", "application/json"}};
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    HttpRequest req = post_messages();
    req.target = req.path = "/health";
    CaptureWriter out;
    proxy.handle(req, out);

    REQUIRE(fx.upstream.call_count == 1);
    REQUIRE(out.status == 404);
}

// ── Request forwarding ───────────────────────────────────────────

TEST_CASE("ProxyHandler: forwards method, url, headers and body", "[proxy]") {
    ProxyFixture fx("forward");
    fx.config.upstream_timeout_seconds = 77;
    fx.upstream.next_response = sse_response({message_stop()});
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    HttpRequest req = post_messages();
    req.target = "/v1/messages?beta=true";
    req.query = "beta=true";
    CaptureWriter out;
    proxy.handle(req, out);

    const auto& sent = fx.upstream.last_request;
    REQUIRE(sent.method == "POST");
    REQUIRE(sent.url == "https://api.anthropic.com/v1/messages?beta=true");
    REQUIRE(sent.body == req.body);
    REQUIRE(sent.timeout_seconds == 77);
    REQUIRE(find_header(sent.headers, "x-api-key") == "sk-ant-test");
    REQUIRE(find_header(sent.headers, "accept-encoding").empty());
    REQUIRE(find_header(sent.headers, "host").empty());
    REQUIRE(proxy.requests() == 1);
}

TEST_CASE("ProxyHandler: GET requests carry no body", "[proxy]") {
    ProxyFixture fx("get");
    fx.upstream.next_response.headers = {{"Content-Type", "application/json"}};
    fx.upstream.next_response.chunks = {R"({"data":[]})"};
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    HttpRequest req;
    req.method = "GET";
    req.target = req.path = "/v1/models";
    req.body = "ignored";
    CaptureWriter out;
    proxy.handle(req, out);

    REQUIRE(fx.upstream.last_request.method == "GET");
    REQUIRE(fx.upstream.last_request.body.empty());
    REQUIRE(out.status == 200);
    REQUIRE(out.body == R"({"data":[]})");
}

// ── Streaming ────────────────────────────────────────────────────

TEST_CASE("ProxyHandler: stream bytes reach the client unchanged", "[proxy]") {
    ProxyFixture fx("transparent");
    std::string stream = thinking_then_text_stream();
    auto chunks = pieces(stream, 37);
    fx.upstream.next_response = sse_response(chunks);
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    CaptureWriter out;
    proxy.handle(post_messages(), out);

    REQUIRE(out.streamed);
    REQUIRE(out.ended);
    REQUIRE(out.status == 200);
    REQUIRE(out.body == stream);
    REQUIRE(out.chunks == chunks);
    REQUIRE(out.header("transfer-encoding").empty());
    REQUIRE(out.header("connection").empty());
    REQUIRE(out.header("request-id") == "req_01");
}

TEST_CASE("ProxyHandler: thinking blocks are logged as spindles", "[proxy]") {
    ProxyFixture fx("logged");
    fx.upstream.next_response = sse_response(pieces(thinking_then_text_stream(), 11));
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    CaptureWriter out;
    proxy.handle(post_messages(), out);

    auto entries = fx.logged();
    REQUIRE(entries.size() == 1);
    const auto& s = entries[0].spindle;
    REQUIRE(s.content == "Rayleigh scattering favours short wavelengths.");
    REQUIRE(s.signature == "EqQBCkYIBRgCKkA");
    REQUIRE(s.model == "claude-sonnet-4-5");
    REQUIRE(s.block_index == 0);
    REQUIRE_FALSE(s.truncated);
    REQUIRE_FALSE(s.session_id.has_value());
    REQUIRE_FALSE(entries[0].captured_at.empty());
    REQUIRE(proxy.spindles_captured() == 1);
    REQUIRE(proxy.health()["spindlesLogged"] == 1);
}

TEST_CASE("ProxyHandler: session header is attached to spindles", "[proxy]") {
    ProxyFixture fx("session");
    fx.upstream.next_response = sse_response({thinking_then_text_stream()});
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    HttpRequest req = post_messages();
    req.headers.push_back({"X-Session-Id", "sess-7"});
    CaptureWriter out;
    proxy.handle(req, out);

    // The session header still goes upstream
    REQUIRE(find_header(fx.upstream.last_request.headers, "x-session-id") == "sess-7");

    auto entries = fx.logged();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].spindle.session_id.has_value());
    REQUIRE(*entries[0].spindle.session_id == "sess-7");
}

TEST_CASE("ProxyHandler: each request gets its own connection id", "[proxy]") {
    ProxyFixture fx("ids");
    fx.upstream.response_queue.push_back(sse_response({thinking_then_text_stream()}));
    fx.upstream.response_queue.push_back(sse_response({thinking_then_text_stream()}));
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    CaptureWriter a, b;
    proxy.handle(post_messages(), a);
    proxy.handle(post_messages(), b);

    auto entries = fx.logged();
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].spindle.id != entries[1].spindle.id);
    REQUIRE(entries[0].spindle.content == entries[1].spindle.content);
}

TEST_CASE("ProxyHandler: stream without thinking logs nothing", "[proxy]") {
    ProxyFixture fx("nothinking");
    std::string stream = message_start("claude-haiku-4-5") + block_start(0, "text") +
                         text_delta(0, "hi") + block_stop(0) + message_stop();
    fx.upstream.next_response = sse_response({stream});
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    CaptureWriter out;
    proxy.handle(post_messages(), out);

    REQUIRE(out.body == stream);
    REQUIRE(fx.logged().empty());
}

TEST_CASE("ProxyHandler: malformed stream is still forwarded", "[proxy]") {
    ProxyFixture fx("garbage");
    std::string garbage = "event: content_block_delta\ndata: {not json\n\n\x01\x02 binary";
    fx.upstream.next_response = sse_response({garbage});
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    CaptureWriter out;
    proxy.handle(post_messages(), out);

    REQUIRE(out.body == garbage);
    REQUIRE(out.ended);
    REQUIRE(fx.logged().empty());
}

TEST_CASE("ProxyHandler: upstream cut mid-thinking logs a truncated spindle", "[proxy]") {
    ProxyFixture fx("cut");
    auto resp = sse_response({message_start("claude-sonnet-4-5") + block_start(0, "thinking") +
                              thinking_delta(0, "half a tho")});
    resp.final_status = ReadStatus::Error;
    fx.upstream.next_response = resp;
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    CaptureWriter out;
    proxy.handle(post_messages(), out);

    // Headers were already sent; the stream is closed without end_stream
    REQUIRE(out.streamed);
    REQUIRE_FALSE(out.ended);

    auto entries = fx.logged();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].spindle.content == "half a tho");
    REQUIRE(entries[0].spindle.truncated);
}

TEST_CASE("ProxyHandler: client disconnect stops the relay", "[proxy]") {
    ProxyFixture fx("disconnect");
    fx.upstream.next_response = sse_response({
        block_start(0, "thinking"), thinking_delta(0, "abc"), block_stop(0)});
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    CaptureWriter out;
    out.fail_after_chunks = 2;
    proxy.handle(post_messages(), out);

    REQUIRE(out.chunks.size() == 2);
    REQUIRE_FALSE(out.ended);
    // The open block is flushed as truncated
    auto entries = fx.logged();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].spindle.content == "abc");
    REQUIRE(entries[0].spindle.truncated);
}

TEST_CASE("ProxyHandler: raw dump receives the exact stream", "[proxy]") {
    ProxyFixture fx("dump");
    fx.config.raw_dumps = true;
    std::string stream = thinking_then_text_stream();
    fx.upstream.next_response = sse_response(pieces(stream, 64));
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    CaptureWriter out;
    proxy.handle(post_messages(), out);

    std::vector<std::filesystem::path> dumps;
    for (const auto& e : std::filesystem::directory_iterator(fx.config.raw_dump_dir))
        dumps.push_back(e.path());
    REQUIRE(dumps.size() == 1);
    REQUIRE(dumps[0].filename().string().rfind("raw-", 0) == 0);

    std::ifstream f(dumps[0], std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    REQUIRE(content == stream);
    REQUIRE(proxy.health()["rawDumps"] == fx.config.raw_dump_dir);
}

TEST_CASE("ProxyHandler: buffered responses are not dumped", "[proxy]") {
    ProxyFixture fx("nodump");
    fx.config.raw_dumps = true;
    fx.upstream.next_response.headers = {{"Content-Type", "application/json"}};
    fx.upstream.next_response.chunks = {"{}"};
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    CaptureWriter out;
    proxy.handle(post_messages(), out);

    REQUIRE_FALSE(std::filesystem::exists(fx.config.raw_dump_dir));
}

// ── Buffered responses and errors ────────────────────────────────

TEST_CASE("ProxyHandler: non-stream response relayed with status and headers", "[proxy]") {
    ProxyFixture fx("buffered");
    fx.upstream.next_response.status = 429;
    fx.upstream.next_response.headers = {
        {"Content-Type", "application/json"},
        {"Content-Length", "999"},
        {"retry-after", "30"}
    };
    fx.upstream.next_response.chunks = {R"({"type":"error",)", R"("error":{"type":"rate_limit_error"}})"};
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    CaptureWriter out;
    proxy.handle(post_messages(), out);

    REQUIRE_FALSE(out.streamed);
    REQUIRE(out.status == 429);
    REQUIRE(out.body == R"({"type":"error","error":{"type":"rate_limit_error"}})");
    REQUIRE(out.header("retry-after") == "30");
    REQUIRE(out.header("content-length").empty());
}

TEST_CASE("ProxyHandler: HEAD keeps the upstream content length", "[proxy]") {
    ProxyFixture fx("head");
    fx.upstream.next_response.headers = {
        {"Content-Type", "application/json"},
        {"Content-Length", "42"}
    };
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    HttpRequest req;
    req.method = "HEAD";
    req.target = req.path = "/v1/models";
    CaptureWriter out;
    proxy.handle(req, out);

    REQUIRE(fx.upstream.last_request.method == "HEAD");
    REQUIRE(out.head_only);
    REQUIRE(out.status == 200);
    REQUIRE(out.head_length == "42");
    REQUIRE(out.body.empty());
    REQUIRE(out.header("content-type") == "application/json");
}

TEST_CASE("ProxyHandler: connection failure answers 502", "[proxy]") {
    ProxyFixture fx("502");
    fx.upstream.fail = true;
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    CaptureWriter out;
    proxy.handle(post_messages(), out);

    REQUIRE(out.status == 502);
    auto j = nlohmann::json::parse(out.body);
    REQUIRE(j["error"] == "Proxy error");
    REQUIRE(j["message"] == "connection refused");
}

TEST_CASE("ProxyHandler: upstream timeout answers 504", "[proxy]") {
    ProxyFixture fx("504");
    fx.upstream.fail = true;
    fx.upstream.fail_timed_out = true;
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    CaptureWriter out;
    proxy.handle(post_messages(), out);
    REQUIRE(out.status == 504);
}

TEST_CASE("ProxyHandler: buffered body read failure answers 502", "[proxy]") {
    ProxyFixture fx("bodyfail");
    fx.upstream.next_response.headers = {{"Content-Type", "application/json"}};
    fx.upstream.next_response.chunks = {"{\"partial"};
    fx.upstream.next_response.final_status = ReadStatus::Error;
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    CaptureWriter out;
    proxy.handle(post_messages(), out);
    REQUIRE(out.status == 502);
    REQUIRE(nlohmann::json::parse(out.body)["error"] == "Proxy error");
}

TEST_CASE("ProxyHandler: active connections return to zero", "[proxy]") {
    ProxyFixture fx("active");
    fx.upstream.fail = true;
    ProxyHandler proxy(fx.config, *fx.logger, fx.upstream);

    CaptureWriter out;
    proxy.handle(post_messages(), out);
    REQUIRE(proxy.health()["activeConnections"] == 0);
}
