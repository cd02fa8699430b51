#pragma once

#include "wfsync/core/result.hpp"
#include "wfsync/network/http_response_parser.hpp"
#include "wfsync/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <array>
#include <cstdint>
#include <string>

namespace wfsync {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief Parsed base URL of the remote service
 *
 * "https://n8n.example.com/base" -> scheme=https host=n8n.example.com
 * port=443 base_path=/base
 */
struct Url {
    std::string scheme = "http";
    std::string host;
    uint16_t port = 80;
    std::string base_path;  // no trailing slash, "" for root

    bool is_tls() const { return scheme == "https"; }

    /**
     * @brief "host" or "host:port" when the port is not the scheme default
     */
    std::string host_header() const;

    static Result<Url> parse(const std::string& text);
};

/**
 * @brief Something that can perform one HTTP exchange
 *
 * The REST client depends on this interface only, tests substitute an
 * in-memory implementation.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Send a request, block until the full response has arrived
     *
     * Any status code is a successful exchange; errors are reserved for
     * connection, TLS and framing failures.
     */
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/**
 * @brief Blocking HTTP/1.1 client over Boost.Asio (plain TCP or TLS)
 *
 * One connection per request ("Connection: close"), the response is read
 * through HttpResponseParser. Request targets are prefixed with the base
 * URL path.
 *
 * Calls are serialized by the caller; the client owns a private
 * io_context and is not safe for concurrent send().
 *
 * Timeouts are not enforced: a started call runs until the peer answers
 * or the connection fails.
 */
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(Url base_url, bool verify_tls = true);

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    Result<HttpResponse> send(const HttpRequest& request) override;

    const Url& base_url() const { return base_url_; }

private:
    Result<HttpResponse> send_plain(const std::string& wire);
    Result<HttpResponse> send_tls(const std::string& wire);

    template<typename Stream>
    Result<HttpResponse> exchange(Stream& stream, const std::string& wire);

    Url base_url_;
    asio::io_context io_context_;
    asio::ssl::context ssl_context_;
    std::array<char, 8192> buffer_{};
};

} // namespace network
} // namespace wfsync
