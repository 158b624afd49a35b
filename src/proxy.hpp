#pragma once
#include "config.hpp"
#include "http_server.hpp"
#include "upstream.hpp"
#include "spindle.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <atomic>
#include <cstdint>

namespace spindles {

class SpindleLogger;
class StreamProcessor;

// Request headers never forwarded upstream. The transport sets Host,
// Content-Length and Connection itself; Accept-Encoding is dropped so the
// upstream answers with an identity-encoded stream the extractor can read.
std::vector<Header> filter_request_headers(const std::vector<Header>& headers);

// Upstream response headers minus the hop-by-hop set the server re-derives.
std::vector<Header> filter_response_headers(const std::vector<Header>& headers);

// True for server-sent event responses (content type mentions "stream").
bool is_event_stream(const std::string& content_type);

// target_url + path + "?" + query
std::string build_upstream_url(const std::string& target_url, const HttpRequest& req);

// Transparent forwarding proxy. Every request gets its own StreamProcessor;
// the only shared state is the injected logger.
class ProxyHandler {
public:
    ProxyHandler(const Config& config, SpindleLogger& logger, UpstreamClient& upstream);

    void handle(const HttpRequest& req, ResponseWriter& out);

    nlohmann::json health() const;

    uint64_t requests() const { return requests_.load(); }
    uint64_t spindles_captured() const { return spindles_.load(); }

private:
    void forward(const HttpRequest& req, ResponseWriter& out);
    void relay_stream(UpstreamResponse& response, ResponseWriter& out,
                      const std::string& connection_id,
                      const std::optional<std::string>& session_id);
    void relay_buffered(UpstreamResponse& response, ResponseWriter& out,
                        const std::string& connection_id, bool head_request);
    void extract(StreamProcessor& processor, const std::string& chunk, bool& extracting);
    void emit(std::vector<Spindle> spindles);

    const Config& config_;
    SpindleLogger& logger_;
    UpstreamClient& upstream_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> spindles_{0};
    std::atomic<int64_t> active_{0};
};

} // namespace spindles
