#pragma once

#include <string>

namespace infra::http {

struct HttpsUrl {
    std::string host;
    std::string port = "443";
    std::string target = "/";  // path plus query
};

// Accepts "https://host[:port][/path][?query]". Throws std::invalid_argument otherwise.
HttpsUrl parse_https_url(const std::string& url);

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& value);

struct HttpsResponse {
    unsigned status = 0U;
    std::string body;
    std::string final_host;
    std::string final_target;
};

struct HttpsRequestOptions {
    int timeout_sec = 20;
    bool verify_peer = true;
    std::string user_agent = "sapan/1.0";
};

// GET following up to five redirects. Network and TLS failures throw std::runtime_error;
// HTTP error statuses are returned as-is.
HttpsResponse https_get(const HttpsUrl& url, const HttpsRequestOptions& options = {});

// Same as https_get but throws std::runtime_error on HTTP status >= 400.
std::string https_get_body(const HttpsUrl& url, const HttpsRequestOptions& options = {});

}  // namespace infra::http
