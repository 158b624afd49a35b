#pragma once
#include "upstream.hpp"
#include <string>
#include <vector>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <set>
#include <atomic>
#include <thread>
#include <cstdint>

namespace spindles {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;
    std::string target;             // path + "?" + query, exactly as received
    std::string path;               // e.g. "/v1/messages"
    std::string query;              // raw query string without '?', may be empty
    std::vector<Header> headers;    // original case and order
    std::string body;

    // Case-insensitive header lookup; "" if absent.
    std::string header(const std::string& name) const;
    bool has_header(const std::string& name) const;
};

// Reason phrase for a status code ("OK", "Bad Gateway", ...)
const char* status_reason(int status);

// Writes one response back to the client. Either send_response() or send_head() once, or
// begin_stream() followed by write_chunk()* and end_stream(). Every call
// returns false once the client has gone away.
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    // Complete response with Content-Length framing.
    virtual bool send_response(int status, const std::vector<Header>& headers,
                               const std::string& body) = 0;

    // Answer to a HEAD request: headers only. content_length is the length
    // the entity would have, sent as-is; omitted when empty.
    virtual bool send_head(int status, const std::vector<Header>& headers,
                           const std::string& content_length) = 0;

    // Status line + headers; the body follows as chunked transfer encoding.
    virtual bool begin_stream(int status, const std::vector<Header>& headers) = 0;

    // One body chunk, bytes delivered unchanged.
    virtual bool write_chunk(const char* data, size_t len) = 0;

    virtual bool end_stream() = 0;

    virtual bool headers_sent() const = 0;
};

// Parse request line + header block (without the terminating blank line).
// Returns false on a malformed request line.
bool parse_request_head(const std::string& head, HttpRequest& req);

// Parse "host:port" into host and port. Port 0 requests an ephemeral port.
// Returns false if the string is malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Threaded TCP HTTP/1.1 server. The accept loop runs in a background
// thread and every accepted connection is served on its own thread, one
// request per connection (Connection: close).
class HttpServer {
public:
    using Handler = std::function<void(const HttpRequest&, ResponseWriter&)>;

    static constexpr size_t kMaxHeaderBytes = 64 * 1024;

    // listen_addr: "host:port", e.g. "127.0.0.1:8082"
    // max_body:    maximum request body size in bytes; larger bodies get 413
    HttpServer(std::string listen_addr, uint64_t max_body, Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting, shut down open client sockets and join all threads.
    void stop();

    // Port actually bound (resolves port 0 after start()).
    uint16_t port() const { return bound_port_; }

    size_t active_connections() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void handle_connection(int client_fd);
    void reap_workers(bool all);

    std::string listen_addr_;
    uint64_t    max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex workers_mutex_;
    std::list<Worker> workers_;
    std::set<int> client_fds_;
};

} // namespace spindles
