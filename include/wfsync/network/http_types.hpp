#pragma once

#include <strings.h>

#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wfsync {
namespace network {

/**
 * @brief Request methods the REST client issues
 *
 * DELETE_METHOD avoids clashing with a DELETE macro some headers define.
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,
    UNKNOWN
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            default: return "UNKNOWN";
        }
    }
};

/**
 * @brief Outgoing HTTP/1.1 request
 *
 * Wire format produced by serialize():
 * PUT /api/v1/workflows/42 HTTP/1.1\r\n
 * Host: n8n.local:5678\r\n
 * X-N8N-API-KEY: ...\r\n
 * Content-Length: 17\r\n
 * Connection: close\r\n
 * \r\n
 * {"name":"Flow"}
 *
 * Headers keep insertion order; Host, Content-Length and Connection are
 * added by serialize() unless already set.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string target = "/";  // origin-form: path plus optional query
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    void set_header(const std::string& name, const std::string& value) {
        for (auto& [key, existing] : headers) {
            if (strcasecmp(key.c_str(), name.c_str()) == 0) {
                existing = value;
                return;
            }
        }
        headers.emplace_back(name, value);
    }

    bool has_header(const std::string& name) const {
        for (const auto& [key, _] : headers) {
            if (strcasecmp(key.c_str(), name.c_str()) == 0) {
                return true;
            }
        }
        return false;
    }

    std::string serialize(const std::string& host_header) const {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(method) << ' ' << target << " HTTP/1.1\r\n";

        if (!has_header("Host")) {
            oss << "Host: " << host_header << "\r\n";
        }
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        if (!has_header("Content-Length") &&
            (!body.empty() || method == HttpMethod::POST || method == HttpMethod::PUT)) {
            oss << "Content-Length: " << body.size() << "\r\n";
        }
        if (!has_header("Connection")) {
            oss << "Connection: close\r\n";
        }
        oss << "\r\n" << body;
        return oss.str();
    }
};

/**
 * @brief Parsed HTTP response
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;  // names as received
    std::string body;

    /**
     * @brief Case-insensitive header lookup, "" if absent
     */
    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (strcasecmp(key.c_str(), name.c_str()) == 0) {
                return value;
            }
        }
        return "";
    }

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

} // namespace network
} // namespace wfsync
