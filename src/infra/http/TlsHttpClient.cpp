#include "infra/http/TlsHttpClient.hpp"

#include <cctype>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

#include "common/Log.hpp"

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;
constexpr char kHttpsScheme[] = "https://";

std::runtime_error makeError(const HttpsUrl& url, const std::string& message) {
    std::ostringstream oss;
    oss << "HTTPS GET https://" << url.host;
    if (url.port != "443") {
        oss << ':' << url.port;
    }
    // The query may carry credentials; report the path only.
    oss << url.target.substr(0, url.target.find('?')) << " failed: " << message;
    return std::runtime_error(oss.str());
}

bool isRedirect(unsigned status) {
    return status == 301U || status == 302U || status == 303U || status == 307U || status == 308U;
}

HttpsUrl resolveRedirect(const std::string& location, const HttpsUrl& current) {
    if (location.empty()) {
        throw std::runtime_error("Redirect response missing Location header");
    }
    if (location.rfind(kHttpsScheme, 0) == 0) {
        return parse_https_url(location);
    }
    if (location.rfind("http://", 0) == 0) {
        throw std::runtime_error("Insecure redirect to HTTP is not supported");
    }

    HttpsUrl next = current;
    next.target = location.front() == '/' ? location : "/" + location;
    return next;
}

std::string sslErrorReason() {
    const unsigned long err = ::ERR_get_error();
    const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
    return reason != nullptr ? std::string{reason} : std::string{"unknown"};
}

http::response<http::string_body> performRequest(const HttpsUrl& url, const HttpsRequestOptions& options) {
    if (options.timeout_sec <= 0) {
        throw makeError(url, "timeout must be positive");
    }
    const auto timeout = std::chrono::seconds(options.timeout_sec);

    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    if (options.verify_peer) {
        beast::error_code pathEc;
        sslContext.set_default_verify_paths(pathEc);
        if (pathEc) {
            throw makeError(url, "Cannot load system CA certificates: " + pathEc.message());
        }
        sslContext.set_verify_mode(ssl::verify_peer);
    } else {
        sslContext.set_verify_mode(ssl::verify_none);
    }

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);
    if (options.verify_peer) {
        stream.set_verify_callback(ssl::host_name_verification(url.host));
    }

    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        throw makeError(url, "Failed to set SNI hostname to '" + url.host + "': " + sslErrorReason());
    }

    net::ip::tcp::resolver resolver(ioc);
    beast::error_code ec;
    const auto results = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        throw makeError(url, "DNS resolution error: " + ec.message());
    }

    auto& lowestLayer = beast::get_lowest_layer(stream);
    lowestLayer.expires_after(timeout);
    lowestLayer.connect(results, ec);
    if (ec) {
        throw makeError(url, "Connection error: " + ec.message());
    }

    lowestLayer.expires_after(timeout);
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw makeError(url, "TLS handshake error: " + ec.message());
    }

    http::request<http::empty_body> req{http::verb::get, url.target, 11};
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, options.user_agent);
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");

    lowestLayer.expires_after(timeout);
    http::write(stream, req, ec);
    if (ec) {
        throw makeError(url, "Write error: " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(64 * 1024 * 1024);
    lowestLayer.expires_after(timeout);
    http::read(stream, buffer, parser, ec);
    if (ec) {
        throw makeError(url, "Read error: " + ec.message());
    }

    stream.shutdown(ec);
    if (ec == net::error::eof || ec == ssl::error::stream_truncated) {
        ec = {};
    }
    if (ec) {
        // The response is complete at this point.
        LOG_DEBUG("TLS shutdown for " << url.host << " ended with: " << ec.message());
    }

    return parser.release();
}

}  // namespace

HttpsUrl parse_https_url(const std::string& url) {
    if (url.rfind(kHttpsScheme, 0) != 0) {
        throw std::invalid_argument("Only https:// URLs are supported: " + url);
    }

    const std::string rest = url.substr(sizeof(kHttpsScheme) - 1);
    const auto pathPos = rest.find_first_of("/?");
    std::string authority = pathPos == std::string::npos ? rest : rest.substr(0, pathPos);

    HttpsUrl parsed;
    const auto colonPos = authority.find(':');
    if (colonPos != std::string::npos) {
        parsed.port = authority.substr(colonPos + 1);
        authority.erase(colonPos);
        if (parsed.port.empty()) {
            throw std::invalid_argument("URL has an empty port: " + url);
        }
        for (char c : parsed.port) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument("URL has an invalid port: " + url);
            }
        }
    }
    if (authority.empty()) {
        throw std::invalid_argument("URL is missing a host: " + url);
    }
    parsed.host = authority;

    if (pathPos != std::string::npos) {
        parsed.target = rest.substr(pathPos);
        if (parsed.target.front() == '?') {
            parsed.target.insert(parsed.target.begin(), '/');
        }
    }
    return parsed;
}

std::string url_encode(const std::string& value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(static_cast<char>(c));
        } else {
            encoded.push_back('%');
            encoded.push_back(kHex[c >> 4]);
            encoded.push_back(kHex[c & 0x0F]);
        }
    }
    return encoded;
}

HttpsResponse https_get(const HttpsUrl& url, const HttpsRequestOptions& options) {
    if (url.host.empty()) {
        throw std::runtime_error("HTTPS GET requires a non-empty host");
    }

    HttpsUrl current = url;
    if (current.target.empty()) {
        current.target = "/";
    } else if (current.target.front() != '/') {
        current.target.insert(current.target.begin(), '/');
    }

    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        auto response = performRequest(current, options);
        const auto status = static_cast<unsigned>(response.result_int());
        if (isRedirect(status)) {
            try {
                const auto location = response.base()[http::field::location];
                current = resolveRedirect(std::string(location), current);
            } catch (const std::exception& redirectError) {
                throw makeError(current, redirectError.what());
            }
            continue;
        }

        HttpsResponse result;
        result.status = status;
        result.body = std::move(response.body());
        result.final_host = current.host;
        result.final_target = current.target;
        return result;
    }

    throw makeError(current, "Too many redirects");
}

std::string https_get_body(const HttpsUrl& url, const HttpsRequestOptions& options) {
    auto response = https_get(url, options);
    if (response.status >= 400U) {
        HttpsUrl failed = url;
        failed.host = response.final_host;
        failed.target = response.final_target;
        throw makeError(failed, "HTTP status " + std::to_string(response.status) + " received");
    }
    return std::move(response.body);
}

}  // namespace infra::http
