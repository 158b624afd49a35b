// Upstream transport for non-Linux platforms using the libcurl multi
// interface, driven from next_chunk() so the body is pulled, not pushed.
#ifndef __linux__

#include "upstream.hpp"
#include "util.hpp"

#include <curl/curl.h>
#include <string>

namespace spindles {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

namespace {

bool abort_requested() {
    return g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed);
}

// Called by curl ~once per second; return non-zero to abort the transfer.
int abort_progress_cb(void* /*clientp*/,
                      curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    return abort_requested() ? 1 : 0;
}

curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        if (iequals(h.first, "host") || iequals(h.first, "content-length") ||
            iequals(h.first, "connection") || iequals(h.first, "transfer-encoding"))
            continue;
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    // Suppress curl's automatic "Expect: 100-continue" on large bodies
    list = curl_slist_append(list, "Expect:");
    return list;
}

// ── RAII multi + easy handle ───────────────────────────────────

class CurlUpstreamResponse : public UpstreamResponse {
public:
    CurlUpstreamResponse() = default;
    ~CurlUpstreamResponse() override {
        if (multi_ && easy_) curl_multi_remove_handle(multi_, easy_);
        if (easy_) curl_easy_cleanup(easy_);
        if (multi_) curl_multi_cleanup(multi_);
        curl_slist_free_all(hlist_);
    }
    CurlUpstreamResponse(const CurlUpstreamResponse&) = delete;
    CurlUpstreamResponse& operator=(const CurlUpstreamResponse&) = delete;

    // Start the transfer and pump until the response head is complete.
    // Throws UpstreamError.
    void start(const UpstreamRequest& request) {
        body_ = request.body;
        easy_ = curl_easy_init();
        multi_ = curl_multi_init();
        if (!easy_ || !multi_) throw UpstreamError("curl initialisation failed");

        hlist_ = build_headers(request.headers);
        curl_easy_setopt(easy_, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, hlist_);
        curl_easy_setopt(easy_, CURLOPT_TIMEOUT, request.timeout_seconds);
        curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(easy_, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(easy_, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
        curl_easy_setopt(easy_, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(easy_, CURLOPT_HEADERDATA, this);
        curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);

        if (request.method == "GET") {
            curl_easy_setopt(easy_, CURLOPT_HTTPGET, 1L);
        } else if (request.method == "HEAD") {
            curl_easy_setopt(easy_, CURLOPT_NOBODY, 1L);
        } else {
            curl_easy_setopt(easy_, CURLOPT_POSTFIELDS, body_.c_str());
            curl_easy_setopt(easy_, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(body_.size()));
            if (request.method != "POST")
                curl_easy_setopt(easy_, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }

        curl_multi_add_handle(multi_, easy_);

        while (!head_done_ && !finished_) {
            if (!pump()) break;
        }
        if (!head_done_) {
            bool timed_out = finished_ && result_ == CURLE_OPERATION_TIMEDOUT;
            std::string msg = finished_ ? curl_easy_strerror(result_) : "transfer stalled";
            throw UpstreamError("upstream request failed: " + msg, timed_out);
        }
    }

    long status() const override { return status_; }
    const std::vector<Header>& headers() const override { return headers_; }

    ReadStatus next_chunk(std::string& out) override {
        out.clear();
        while (pending_.empty() && !finished_) {
            if (!pump()) return ReadStatus::Error;
        }
        if (!pending_.empty()) {
            out.swap(pending_);
            return ReadStatus::Data;
        }
        switch (result_) {
            case CURLE_OK:                  return ReadStatus::End;
            case CURLE_OPERATION_TIMEDOUT:  return ReadStatus::TimedOut;
            case CURLE_ABORTED_BY_CALLBACK: return ReadStatus::Aborted;
            default:                        return ReadStatus::Error;
        }
    }

private:
    // One round of multi work; waits up to 1s for socket activity.
    bool pump() {
        bool had_head = head_done_;
        size_t had_bytes = pending_.size();
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &running);
        if (mc != CURLM_OK) return false;

        int msgs = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &msgs)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
                finished_ = true;
                result_ = msg->data.result;
            }
        }
        if (finished_ || head_done_ != had_head || pending_.size() != had_bytes) return true;
        if (running == 0 && !finished_) {
            finished_ = true;
            result_ = CURLE_RECV_ERROR;
            return true;
        }
        mc = curl_multi_poll(multi_, nullptr, 0, 1000, nullptr);
        return mc == CURLM_OK;
    }

    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
        size_t total = size * nitems;
        auto* self = static_cast<CurlUpstreamResponse*>(userdata);
        std::string line(buffer, total);
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

        if (line.rfind("HTTP/", 0) == 0) {
            // New status line (also after interim 1xx responses)
            self->headers_.clear();
            size_t sp = line.find(' ');
            if (sp != std::string::npos) {
                try { self->status_ = std::stol(line.substr(sp + 1, 3)); }
                catch (const std::exception&) { self->status_ = 0; }
            }
        } else if (line.empty()) {
            if (self->status_ >= 200) self->head_done_ = true;
        } else {
            size_t colon = line.find(':');
            if (colon != std::string::npos) {
                self->headers_.emplace_back(line.substr(0, colon),
                                            trim(line.substr(colon + 1)));
            }
        }
        return total;
    }

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        size_t total = size * nmemb;
        auto* self = static_cast<CurlUpstreamResponse*>(userdata);
        self->pending_.append(ptr, total);
        return total;
    }

    CURL* easy_ = nullptr;
    CURLM* multi_ = nullptr;
    curl_slist* hlist_ = nullptr;
    std::string body_;

    long status_ = 0;
    std::vector<Header> headers_;
    bool head_done_ = false;
    std::string pending_;
    bool finished_ = false;
    CURLcode result_ = CURLE_OK;
};

} // namespace

// ── Public API ─────────────────────────────────────────────────

std::unique_ptr<UpstreamResponse> CurlUpstreamClient::open(const UpstreamRequest& request) {
    try {
        parse_url(request.url);
    } catch (const std::invalid_argument& e) {
        throw UpstreamError(e.what());
    }
    auto response = std::make_unique<CurlUpstreamResponse>();
    response->start(request);
    return response;
}

} // namespace spindles

#endif // !__linux__
