// Linux upstream transport using POSIX sockets + OpenSSL.
// Implements the same public API as upstream_curl.cpp (libcurl) with identical
// interface behaviour: http_init/cleanup are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "upstream.hpp"
#include "util.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <string>

// MSG_NOSIGNAL prevents SIGPIPE when the upstream resets the connection.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace spindles {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

namespace {

using Clock = std::chrono::steady_clock;

enum class Io { Ok, Eof, Timeout, Aborted, Error };

ReadStatus to_read_status(Io io) {
    switch (io) {
        case Io::Ok:      return ReadStatus::Data;
        case Io::Eof:     return ReadStatus::End;
        case Io::Timeout: return ReadStatus::TimedOut;
        case Io::Aborted: return ReadStatus::Aborted;
        case Io::Error:   return ReadStatus::Error;
    }
    return ReadStatus::Error;
}

std::string openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;
    Clock::time_point deadline;

    explicit Connection(Clock::time_point dl) : deadline(dl) {}
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    long seconds_left() const {
        auto left = std::chrono::duration_cast<std::chrono::seconds>(
            deadline - Clock::now()).count();
        return left > 0 ? static_cast<long>(left) : 0;
    }

    bool aborted() const {
        return g_socket_abort_flag &&
               g_socket_abort_flag->load(std::memory_order_relaxed);
    }

    // Throws UpstreamError on failure.
    void connect(const ParsedUrl& url) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0)
            throw UpstreamError("cannot resolve " + url.host + ": " + gai_strerror(gai));

        bool connected = false;
        bool timed_out = false;
        int last_errno = 0;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) { last_errno = errno; continue; }

            // Non-blocking connect so we can honour the deadline.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                // Poll in 1-second slices so the abort flag is honoured
                while (!aborted()) {
                    if (Clock::now() >= deadline) { timed_out = true; break; }
                    struct pollfd pfd{fd, POLLOUT, 0};
                    rc = ::poll(&pfd, 1, 1000);
                    if (rc < 0 && errno != EINTR) { last_errno = errno; break; }
                    if (rc <= 0) continue;
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    } else {
                        last_errno = err;
                    }
                    break;
                }
            } else {
                last_errno = errno;
            }
            if (!connected) { ::close(fd); fd = -1; }
            if (timed_out || aborted()) break;
        }
        freeaddrinfo(res);
        if (aborted()) throw UpstreamError("aborted while connecting to " + url.host);
        if (timed_out) throw UpstreamError("timed out connecting to " + url.host, true);
        if (!connected)
            throw UpstreamError("cannot connect to " + url.host + ":" + url.port +
                                (last_errno ? std::string(": ") + std::strerror(last_errno) : ""));

        // Use the remaining budget for the TLS handshake, then switch to
        // 1-second slices so abort-flag checks work during body streaming.
        if (url.tls) {
            set_socket_timeout(std::max(1L, seconds_left()));

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) throw UpstreamError("TLS context: " + openssl_error());
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) throw UpstreamError("TLS session: " + openssl_error());
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI
            SSL_set1_host(ssl, url.host.c_str());            // hostname verification

            if (SSL_connect(ssl) != 1)
                throw UpstreamError("TLS handshake with " + url.host + " failed: " +
                                    openssl_error());
        }

        // 1-second slice timeout for body I/O (enables abort-flag polling).
        set_socket_timeout(1);
    }

    // Read some bytes. Slice expiry loops back so abort and deadline are checked.
    Io read_some(char* buf, size_t len, size_t& got) {
        got = 0;
        while (true) {
            if (aborted()) return Io::Aborted;
            if (Clock::now() >= deadline) return Io::Timeout;

            if (ssl) {
                int n = SSL_read(ssl, buf, static_cast<int>(std::min(len, size_t{1} << 30)));
                if (n > 0) { got = static_cast<size_t>(n); return Io::Ok; }
                int err = SSL_get_error(ssl, n);
                if (err == SSL_ERROR_ZERO_RETURN) return Io::Eof;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                        continue; // 1-second slice expired
                    if (n == 0) return Io::Eof; // peer closed without close_notify
                }
                return Io::Error;
            } else {
                ssize_t n = ::recv(fd, buf, len, 0);
                if (n > 0) { got = static_cast<size_t>(n); return Io::Ok; }
                if (n == 0) return Io::Eof;
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                return Io::Error;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (aborted() || Clock::now() >= deadline) return false;
            ssize_t n;
            if (ssl) {
                int w = SSL_write(ssl, buf, static_cast<int>(std::min(len, size_t{1} << 30)));
                if (w <= 0) {
                    int err = SSL_get_error(ssl, w);
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
                n = w;
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

std::string build_request(const UpstreamRequest& request, const ParsedUrl& url) {
    std::string req;
    req.reserve(512 + request.body.size());
    req += request.method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + host_header(url) + "\r\n";

    for (const auto& h : request.headers) {
        if (iequals(h.first, "host") || iequals(h.first, "content-length") ||
            iequals(h.first, "connection") || iequals(h.first, "transfer-encoding"))
            continue;
        req += h.first + ": " + h.second + "\r\n";
    }
    bool body_method = request.method != "GET" && request.method != "HEAD";
    if (!request.body.empty() || body_method)
        req += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += request.body;
    return req;
}

// ── Response ───────────────────────────────────────────────────

class SocketUpstreamResponse : public UpstreamResponse {
public:
    SocketUpstreamResponse(std::unique_ptr<Connection> conn, bool head_request)
        : conn_(std::move(conn)), head_request_(head_request) {}

    // Parse status line + headers. Throws UpstreamError.
    void read_head() {
        std::string status_line;
        // Skip interim 1xx responses
        do {
            status_line = expect_line("status line");
            size_t sp1 = status_line.find(' ');
            if (status_line.rfind("HTTP/", 0) != 0 || sp1 == std::string::npos)
                throw UpstreamError("malformed status line: " + status_line);
            try { status_ = std::stol(status_line.substr(sp1 + 1, 3)); }
            catch (const std::exception&) {
                throw UpstreamError("malformed status line: " + status_line);
            }
            headers_.clear();
            read_headers();
        } while (status_ >= 100 && status_ < 200);

        std::string te = to_lower(find_header(headers_, "transfer-encoding"));
        is_chunked_ = te.find("chunked") != std::string::npos;
        std::string cl = find_header(headers_, "content-length");
        if (!is_chunked_ && !cl.empty()) {
            try {
                remaining_ = std::stoull(cl);
                use_length_ = true;
            } catch (const std::exception&) {
                use_length_ = false;
            }
        }
        if (head_request_ || status_ == 204 || status_ == 304 ||
            (use_length_ && remaining_ == 0))
            done_ = true;
    }

    long status() const override { return status_; }
    const std::vector<Header>& headers() const override { return headers_; }

    ReadStatus next_chunk(std::string& out) override {
        out.clear();
        if (done_) return ReadStatus::End;
        ReadStatus rs = is_chunked_ ? next_chunked(out) : next_plain(out);
        if (rs != ReadStatus::Data) done_ = true;
        return rs;
    }

private:
    static constexpr size_t kReadSize = 16384;

    // Read a CRLF-terminated line, using leftover_ as a look-ahead buffer.
    Io read_line(std::string& line) {
        while (true) {
            size_t pos = leftover_.find('\n');
            if (pos != std::string::npos) {
                line = leftover_.substr(0, pos);
                leftover_.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return Io::Ok;
            }
            char buf[4096];
            size_t got = 0;
            Io io = conn_->read_some(buf, sizeof(buf), got);
            if (io != Io::Ok) return io;
            leftover_.append(buf, got);
        }
    }

    std::string expect_line(const char* what) {
        std::string line;
        Io io = read_line(line);
        if (io == Io::Timeout) throw UpstreamError(std::string("timed out reading ") + what, true);
        if (io == Io::Aborted) throw UpstreamError(std::string("aborted reading ") + what);
        if (io != Io::Ok) throw UpstreamError(std::string("connection closed reading ") + what);
        return line;
    }

    void read_headers() {
        while (true) {
            std::string line = expect_line("headers");
            if (line.empty()) break; // blank line → end of headers

            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string name  = line.substr(0, colon);
            std::string value = trim(line.substr(colon + 1));
            headers_.emplace_back(std::move(name), std::move(value));
        }
    }

    // Deliver up to max bytes, leftover_ first.
    Io take(size_t max, std::string& out) {
        if (!leftover_.empty()) {
            size_t n = std::min(max, leftover_.size());
            out.assign(leftover_, 0, n);
            leftover_.erase(0, n);
            return Io::Ok;
        }
        char buf[kReadSize];
        size_t got = 0;
        Io io = conn_->read_some(buf, std::min(max, sizeof(buf)), got);
        if (io == Io::Ok) out.assign(buf, got);
        return io;
    }

    ReadStatus next_plain(std::string& out) {
        if (use_length_ && remaining_ == 0) return ReadStatus::End;
        size_t want = use_length_
            ? static_cast<size_t>(std::min<unsigned long long>(remaining_, kReadSize))
            : kReadSize;
        Io io = take(want, out);
        if (io == Io::Eof && use_length_) return ReadStatus::Error; // short body
        if (io != Io::Ok) return to_read_status(io);
        if (use_length_) remaining_ -= out.size();
        return ReadStatus::Data;
    }

    ReadStatus next_chunked(std::string& out) {
        if (chunk_left_ == 0) {
            if (after_chunk_) {
                std::string crlf;
                Io io = read_line(crlf); // trailing \r\n of previous chunk
                if (io != Io::Ok) return io == Io::Eof ? ReadStatus::Error : to_read_status(io);
                after_chunk_ = false;
            }
            std::string size_line;
            Io io = read_line(size_line);
            // The body is only complete once the zero-size chunk arrives
            if (io == Io::Eof) return ReadStatus::Error;
            if (io != Io::Ok) return to_read_status(io);
            // Chunk size is hex, may have extensions after ';'
            char* end = nullptr;
            unsigned long long size = std::strtoull(size_line.c_str(), &end, 16);
            if (end == size_line.c_str()) return ReadStatus::Error;
            if (size == 0) {
                // Trailers until blank line; best effort
                std::string trailer;
                while (read_line(trailer) == Io::Ok && !trailer.empty()) {}
                return ReadStatus::End;
            }
            chunk_left_ = size;
        }

        size_t want = static_cast<size_t>(std::min<unsigned long long>(chunk_left_, kReadSize));
        Io io = take(want, out);
        if (io == Io::Eof) return ReadStatus::Error; // closed mid-chunk
        if (io != Io::Ok) return to_read_status(io);
        chunk_left_ -= out.size();
        if (chunk_left_ == 0) after_chunk_ = true;
        return ReadStatus::Data;
    }

    std::unique_ptr<Connection> conn_;
    bool head_request_;
    long status_ = 0;
    std::vector<Header> headers_;
    std::string leftover_;
    bool is_chunked_ = false;
    bool use_length_ = false;
    unsigned long long remaining_ = 0;
    unsigned long long chunk_left_ = 0;
    bool after_chunk_ = false;
    bool done_ = false;
};

} // namespace

// ── Public API ─────────────────────────────────────────────────

std::unique_ptr<UpstreamResponse> SocketUpstreamClient::open(const UpstreamRequest& request) {
    ParsedUrl url;
    try {
        url = parse_url(request.url);
    } catch (const std::invalid_argument& e) {
        throw UpstreamError(e.what());
    }

    auto deadline = Clock::now() + std::chrono::seconds(request.timeout_seconds);
    auto conn = std::make_unique<Connection>(deadline);
    conn->connect(url);

    std::string wire = build_request(request, url);
    if (!conn->write_all(wire.data(), wire.size())) {
        if (Clock::now() >= deadline)
            throw UpstreamError("timed out sending request to " + url.host, true);
        throw UpstreamError("failed to send request to " + url.host);
    }

    auto response = std::make_unique<SocketUpstreamResponse>(
        std::move(conn), request.method == "HEAD");
    response->read_head();
    return response;
}

} // namespace spindles

#endif // __linux__
