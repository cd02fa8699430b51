#include "wfsync/network/http_client.hpp"

#include <spdlog/spdlog.h>

#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>

namespace wfsync {
namespace network {

// ──────────────────────────────────────────────────────────
// Url
// ──────────────────────────────────────────────────────────

std::string Url::host_header() const {
    const bool default_port = (is_tls() && port == 443) || (!is_tls() && port == 80);
    return default_port ? host : host + ":" + std::to_string(port);
}

Result<Url> Url::parse(const std::string& text) {
    Url url;

    std::string rest = text;
    const auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        url.scheme = rest.substr(0, scheme_end);
        std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        rest = rest.substr(scheme_end + 3);
    }
    if (url.scheme != "http" && url.scheme != "https") {
        return Err<Url>(ErrorCode::InvalidData, "Unsupported URL scheme '" + url.scheme + "' in " + text);
    }
    url.port = url.is_tls() ? 443 : 80;

    const auto path_start = rest.find('/');
    std::string authority = rest.substr(0, path_start);
    if (path_start != std::string::npos) {
        url.base_path = rest.substr(path_start);
        while (!url.base_path.empty() && url.base_path.back() == '/') {
            url.base_path.pop_back();
        }
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        const std::string port_text = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (port_text.empty() ||
            !std::all_of(port_text.begin(), port_text.end(),
                         [](unsigned char c) { return std::isdigit(c); }) ||
            port_text.size() > 5 || std::stoi(port_text) > 65535 || std::stoi(port_text) == 0) {
            return Err<Url>(ErrorCode::InvalidData, "Invalid port in " + text);
        }
        url.port = static_cast<uint16_t>(std::stoi(port_text));
    }

    if (authority.empty()) {
        return Err<Url>(ErrorCode::InvalidData, "Missing host in " + text);
    }
    url.host = authority;
    return Ok(std::move(url));
}

// ──────────────────────────────────────────────────────────
// HttpClient
// ──────────────────────────────────────────────────────────

HttpClient::HttpClient(Url base_url, bool verify_tls)
    : base_url_(std::move(base_url)),
      ssl_context_(asio::ssl::context::tls_client) {
    if (base_url_.is_tls()) {
        ssl_context_.set_default_verify_paths();
        ssl_context_.set_verify_mode(verify_tls ? asio::ssl::verify_peer : asio::ssl::verify_none);
    }
}

Result<HttpResponse> HttpClient::send(const HttpRequest& request) {
    HttpRequest prefixed = request;
    prefixed.target = base_url_.base_path + request.target;
    const std::string wire = prefixed.serialize(base_url_.host_header());

    spdlog::debug("[HttpClient] {} {}{}", HttpMethodUtils::to_string(request.method),
                  base_url_.host_header(), prefixed.target);

    auto result = base_url_.is_tls() ? send_tls(wire) : send_plain(wire);
    if (result.is_ok()) {
        spdlog::debug("[HttpClient] <- {} ({} bytes)", result.value().status_code, result.value().body.size());
    }
    return result;
}

Result<HttpResponse> HttpClient::send_plain(const std::string& wire) {
    boost::system::error_code ec;
    tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(base_url_.host, std::to_string(base_url_.port), ec);
    if (ec) {
        return Err<HttpResponse>(ErrorCode::Transport, "Cannot resolve " + base_url_.host + ": " + ec.message());
    }

    tcp::socket socket(io_context_);
    asio::connect(socket, endpoints, ec);
    if (ec) {
        return Err<HttpResponse>(ErrorCode::Transport, "Cannot connect to " + base_url_.host_header() + ": " + ec.message());
    }

    auto result = exchange(socket, wire);

    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    return result;
}

Result<HttpResponse> HttpClient::send_tls(const std::string& wire) {
    boost::system::error_code ec;
    tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(base_url_.host, std::to_string(base_url_.port), ec);
    if (ec) {
        return Err<HttpResponse>(ErrorCode::Transport, "Cannot resolve " + base_url_.host + ": " + ec.message());
    }

    asio::ssl::stream<tcp::socket> stream(io_context_, ssl_context_);

    // SNI, most TLS front-ends refuse the handshake without it
    if (!SSL_set_tlsext_host_name(stream.native_handle(), base_url_.host.c_str())) {
        return Err<HttpResponse>(ErrorCode::Transport, "Failed to set TLS server name for " + base_url_.host);
    }
    stream.set_verify_callback(asio::ssl::host_name_verification(base_url_.host));

    asio::connect(stream.lowest_layer(), endpoints, ec);
    if (ec) {
        return Err<HttpResponse>(ErrorCode::Transport, "Cannot connect to " + base_url_.host_header() + ": " + ec.message());
    }

    stream.handshake(asio::ssl::stream_base::client, ec);
    if (ec) {
        return Err<HttpResponse>(ErrorCode::Transport, "TLS handshake with " + base_url_.host + " failed: " + ec.message());
    }

    auto result = exchange(stream, wire);

    boost::system::error_code ignored;
    stream.shutdown(ignored);
    return result;
}

template<typename Stream>
Result<HttpResponse> HttpClient::exchange(Stream& stream, const std::string& wire) {
    boost::system::error_code ec;
    asio::write(stream, asio::buffer(wire), ec);
    if (ec) {
        return Err<HttpResponse>(ErrorCode::Transport, "Write to " + base_url_.host_header() + " failed: " + ec.message());
    }

    HttpResponseParser parser;
    for (;;) {
        const size_t n = stream.read_some(asio::buffer(buffer_), ec);
        if (n > 0) {
            auto parsed = parser.parse(buffer_.data(), n);
            if (parsed.is_error()) {
                return Err<HttpResponse, Error>(parsed.error());
            }
            if (parsed.value()) {
                return Ok(parser.take_response());
            }
        }

        if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
            auto finished = parser.finish();
            if (finished.is_error()) {
                return Err<HttpResponse, Error>(finished.error());
            }
            return Ok(parser.take_response());
        }
        if (ec) {
            return Err<HttpResponse>(ErrorCode::Transport, "Read from " + base_url_.host_header() + " failed: " + ec.message());
        }
    }
}

} // namespace network
} // namespace wfsync
