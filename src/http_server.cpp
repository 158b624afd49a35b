#include "http_server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace spindles {

// ── HttpRequest ───────────────────────────────────────────────────────────────

std::string HttpRequest::header(const std::string& name) const {
    return find_header(headers, name);
}

bool HttpRequest::has_header(const std::string& name) const {
    for (const auto& h : headers) {
        if (iequals(h.first, name)) return true;
    }
    return false;
}

const char* status_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        case 529: return "Overloaded";
        default:  return "Unknown";
    }
}

bool parse_request_head(const std::string& head, HttpRequest& req) {
    auto rl_end = head.find("\r\n");
    std::string request_line = head.substr(0, rl_end);

    std::istringstream ss(request_line);
    std::string ver;
    if (!(ss >> req.method >> req.target >> ver)) return false;
    if (ver.rfind("HTTP/", 0) != 0 || req.target.empty()) return false;

    auto q = req.target.find('?');
    if (q != std::string::npos) {
        req.path  = req.target.substr(0, q);
        req.query = req.target.substr(q + 1);
    } else {
        req.path = req.target;
        req.query.clear();
    }

    req.headers.clear();
    if (rl_end == std::string::npos) return true;

    size_t pos = rl_end + 2;
    while (pos < head.size()) {
        auto ne = head.find("\r\n", pos);
        if (ne == std::string::npos) ne = head.size();
        std::string hline = head.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers.emplace_back(trim(hline.substr(0, col)), trim(hline.substr(col + 1)));
    }
    return true;
}

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    try {
        size_t used = 0;
        std::string digits = addr.substr(pos + 1);
        int p = std::stoi(digits, &used);
        if (used != digits.size() || p < 0 || p > 65535) return false;
        port = static_cast<uint16_t>(p);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

// ── Socket response writer ────────────────────────────────────────────────────

namespace {

bool send_all(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::send(fd, data, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

// Headers the writer derives itself for its own framing
bool is_framing_header(const std::string& name) {
    return iequals(name, "content-length") || iequals(name, "transfer-encoding") ||
           iequals(name, "connection") || iequals(name, "keep-alive");
}

class SocketResponseWriter : public ResponseWriter {
public:
    explicit SocketResponseWriter(int fd) : fd_(fd) {}

    bool send_response(int status, const std::vector<Header>& headers,
                       const std::string& body) override {
        if (sent_) return false;
        std::string head = status_head(status, headers);
        head += "Content-Length: " + std::to_string(body.size()) + "\r\n"
                "Connection: close\r\n\r\n";
        sent_ = true;
        finished_ = true;
        return write(head.data(), head.size()) && write(body.data(), body.size());
    }

    bool send_head(int status, const std::vector<Header>& headers,
                   const std::string& content_length) override {
        if (sent_) return false;
        std::string head = status_head(status, headers);
        if (!content_length.empty()) head += "Content-Length: " + content_length + "\r\n";
        head += "Connection: close\r\n\r\n";
        sent_ = true;
        finished_ = true;
        return write(head.data(), head.size());
    }

    bool begin_stream(int status, const std::vector<Header>& headers) override {
        if (sent_) return false;
        std::string head = status_head(status, headers);
        head += "Transfer-Encoding: chunked\r\nConnection: close\r\n\r\n";
        sent_ = true;
        return write(head.data(), head.size());
    }

    bool write_chunk(const char* data, size_t len) override {
        if (!sent_ || finished_) return false;
        if (len == 0) return ok_; // a zero-size chunk would end the body
        char size_line[32];
        int n = std::snprintf(size_line, sizeof(size_line), "%zx\r\n", len);
        return write(size_line, static_cast<size_t>(n)) &&
               write(data, len) &&
               write("\r\n", 2);
    }

    bool end_stream() override {
        if (!sent_ || finished_) return false;
        finished_ = true;
        return write("0\r\n\r\n", 5);
    }

    bool headers_sent() const override { return sent_; }

private:
    static std::string status_head(int status, const std::vector<Header>& headers) {
        std::string head = "HTTP/1.1 " + std::to_string(status) + " " +
                           status_reason(status) + "\r\n";
        for (const auto& h : headers) {
            if (is_framing_header(h.first)) continue;
            head += h.first + ": " + h.second + "\r\n";
        }
        return head;
    }

    bool write(const char* data, size_t len) {
        if (!ok_) return false;
        ok_ = send_all(fd_, data, len);
        return ok_;
    }

    int fd_;
    bool sent_ = false;
    bool finished_ = false;
    bool ok_ = true;
};

void send_plain_error(int fd, int status, const std::string& message) {
    SocketResponseWriter writer(fd);
    writer.send_response(status, {{"Content-Type", "text/plain"}}, message);
}

} // namespace

// ── HttpServer ────────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr, uint64_t max_body, Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        error = "Failed to create server socket";
        ::close(shutdown_pipe_[0]);
        ::close(shutdown_pipe_[1]);
        return false;
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        error = "Invalid bind address: " + host;
        ::close(server_fd_); server_fd_ = -1;
        ::close(shutdown_pipe_[0]); ::close(shutdown_pipe_[1]);
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        error = std::string("bind failed: ") + std::strerror(errno);
        ::close(server_fd_); server_fd_ = -1;
        ::close(shutdown_pipe_[0]); ::close(shutdown_pipe_[1]);
        return false;
    }

    if (::listen(server_fd_, 64) != 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
        ::close(server_fd_); server_fd_ = -1;
        ::close(shutdown_pipe_[0]); ::close(shutdown_pipe_[1]);
        return false;
    }

    struct sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0)
        bound_port_ = ntohs(bound.sin_port);
    else
        bound_port_ = port;

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0) {
        ssize_t w = ::write(shutdown_pipe_[1], &b, 1);
        (void)w; // accept loop also polls running_ every second
    }
    if (thread_.joinable()) thread_.join();

    {
        // Unblock connection threads waiting on their clients
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (int fd : client_fds_) ::shutdown(fd, SHUT_RDWR);
    }
    reap_workers(true);

    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
}

size_t HttpServer::active_connections() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return client_fds_.size();
}

void HttpServer::reap_workers(bool all) {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (all || it->done->load()) {
                auto next = std::next(it);
                finished.splice(finished.end(), workers_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& w : finished) {
        if (w.thread.joinable()) w.thread.join();
    }
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        reap_workers(false);

        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd < 0) continue;

        struct timeval tv{30, 0};  // 30s recv timeout while reading the request
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
#ifdef SO_NOSIGPIPE
        int opt = 1;
        ::setsockopt(cfd, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(workers_mutex_);
        client_fds_.insert(cfd);
        workers_.push_back({std::thread([this, cfd, done]() {
            handle_connection(cfd);
            {
                std::lock_guard<std::mutex> guard(workers_mutex_);
                client_fds_.erase(cfd);
            }
            ::close(cfd);
            done->store(true);
        }), done});
    }
}

void HttpServer::handle_connection(int fd) {
    // Read until end-of-headers (CRLFCRLF), capped at kMaxHeaderBytes.
    std::string buf;
    buf.reserve(4096);
    char tmp[16384];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > kMaxHeaderBytes) {
            send_plain_error(fd, 431, "Headers too large");
            return;
        }
    }

    auto hdr_end = buf.find("\r\n\r\n");
    std::string leftover = buf.substr(hdr_end + 4);

    HttpRequest req;
    if (!parse_request_head(buf.substr(0, hdr_end), req)) {
        send_plain_error(fd, 400, "Malformed request line");
        return;
    }

    // Read body: chunked or Content-Length.
    if (to_lower(req.header("transfer-encoding")).find("chunked") != std::string::npos) {
        std::string raw = std::move(leftover);
        size_t pos = 0;
        while (true) {
            size_t eol;
            while ((eol = raw.find("\r\n", pos)) == std::string::npos) {
                ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
                if (n <= 0) return;
                raw.append(tmp, static_cast<size_t>(n));
            }
            unsigned long long size = std::strtoull(raw.c_str() + pos, nullptr, 16);
            pos = eol + 2;
            if (size == 0) break;
            if (req.body.size() + size > max_body_) {
                send_plain_error(fd, 413, "Payload too large");
                return;
            }
            while (raw.size() < pos + size + 2) {
                ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
                if (n <= 0) return;
                raw.append(tmp, static_cast<size_t>(n));
            }
            req.body.append(raw, pos, static_cast<size_t>(size));
            pos += static_cast<size_t>(size) + 2;
        }
    } else {
        uint64_t content_len = 0;
        std::string cl = req.header("content-length");
        if (!cl.empty()) {
            try {
                content_len = std::stoull(cl);
            } catch (const std::exception&) {
                send_plain_error(fd, 400, "Invalid Content-Length");
                return;
            }
        }

        if (content_len > max_body_) {
            send_plain_error(fd, 413, "Payload too large");
            return;
        }

        req.body = std::move(leftover);
        req.body.reserve(static_cast<size_t>(content_len));
        while (req.body.size() < content_len) {
            ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
            if (n <= 0) return;
            req.body.append(tmp, static_cast<size_t>(n));
        }
        if (req.body.size() > content_len) req.body.resize(static_cast<size_t>(content_len));
    }

    // No receive deadline once the response is streaming
    struct timeval tv{0, 0};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    SocketResponseWriter writer(fd);
    try {
        handler_(req, writer);
    } catch (const std::exception& e) {
        std::cerr << "[server] Handler error for " << req.method << " " << req.path
                  << ": " << e.what() << '\n';
        if (!writer.headers_sent())
            writer.send_response(500, {{"Content-Type", "text/plain"}}, "Internal error");
    }
}

} // namespace spindles
