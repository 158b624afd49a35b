#pragma once
#include <string>
#include <vector>
#include <memory>
#include <utility>
#include <atomic>
#include <stdexcept>

namespace spindles {

// Initialize transport subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup transport subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight upstream reads end promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

// Case-insensitive header lookup; empty string if absent
std::string find_header(const std::vector<Header>& headers, const std::string& name);

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

// Throws std::invalid_argument on a URL without scheme or host
ParsedUrl parse_url(const std::string& url);

// Host header value: host plus port when it is not the scheme default
std::string host_header(const ParsedUrl& url);

struct UpstreamRequest {
    std::string method = "GET";
    std::string url;                 // absolute, including path and query
    std::vector<Header> headers;     // sent as-is; Host/Content-Length/Connection are added
    std::string body;
    long timeout_seconds = 1800;     // total, connect through last body byte
};

// Transport failure before a response head was received.
class UpstreamError : public std::runtime_error {
public:
    UpstreamError(const std::string& what, bool timed_out = false)
        : std::runtime_error(what), timed_out_(timed_out) {}
    bool timed_out() const { return timed_out_; }
private:
    bool timed_out_;
};

enum class ReadStatus {
    Data,     // out holds the next chunk of body bytes
    End,      // body complete
    TimedOut, // total deadline expired mid-body
    Aborted,  // abort flag raised
    Error     // transport error mid-body
};

const char* read_status_name(ReadStatus status);

// A response whose head has been read. The body is pulled chunk by chunk;
// the caller suspends only inside next_chunk().
class UpstreamResponse {
public:
    virtual ~UpstreamResponse() = default;

    virtual long status() const = 0;
    virtual const std::vector<Header>& headers() const = 0;

    // Replaces out with the next body bytes (transfer encoding removed).
    virtual ReadStatus next_chunk(std::string& out) = 0;

    std::string header(const std::string& name) const {
        return find_header(headers(), name);
    }
};

// Abstract upstream client (injectable for testing)
class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;

    // Connect, send the request and read the response head.
    // Throws UpstreamError on failure.
    virtual std::unique_ptr<UpstreamResponse> open(const UpstreamRequest& request) = 0;
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketUpstreamClient : public UpstreamClient {
public:
    std::unique_ptr<UpstreamResponse> open(const UpstreamRequest& request) override;
};
using PlatformUpstreamClient = SocketUpstreamClient;

#else

// macOS and others: libcurl multi interface
class CurlUpstreamClient : public UpstreamClient {
public:
    std::unique_ptr<UpstreamResponse> open(const UpstreamRequest& request) override;
};
using PlatformUpstreamClient = CurlUpstreamClient;

#endif

} // namespace spindles
