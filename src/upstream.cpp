#include "upstream.hpp"
#include "util.hpp"

namespace spindles {

std::string find_header(const std::vector<Header>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (iequals(h.first, name)) return h.second;
    }
    return {};
}

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result;
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::invalid_argument("invalid URL: " + url);

    std::string scheme = to_lower(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https")
        throw std::invalid_argument("unsupported URL scheme: " + url);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    if (path_start == std::string::npos) {
        result.path = "/";
    } else if (url[path_start] == '?') {
        result.path = "/" + url.substr(path_start);
    } else {
        result.path = url.substr(path_start);
    }

    size_t colon = host_port.rfind(':');
    if (colon != std::string::npos && host_port.find(']') == std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::invalid_argument("URL has no host: " + url);
    return result;
}

std::string host_header(const ParsedUrl& url) {
    bool default_port = (url.tls && url.port == "443") || (!url.tls && url.port == "80");
    return default_port ? url.host : url.host + ":" + url.port;
}

const char* read_status_name(ReadStatus status) {
    switch (status) {
        case ReadStatus::Data:     return "data";
        case ReadStatus::End:      return "end";
        case ReadStatus::TimedOut: return "timed out";
        case ReadStatus::Aborted:  return "aborted";
        case ReadStatus::Error:    return "error";
    }
    return "unknown";
}

} // namespace spindles
