#include "wfsync/remote/n8n_client.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace wfsync::remote {

using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
using workflow::Document;
using workflow::WorkflowSummary;

namespace {

constexpr const char* kWorkflowsPath = "/api/v1/workflows";
constexpr size_t kBodyExcerpt = 200;

Error http_error(const HttpResponse& response, const std::string& what) {
    std::string excerpt = response.body.substr(0, kBodyExcerpt);
    if (response.body.size() > kBodyExcerpt) {
        excerpt += "...";
    }
    return Error{ErrorCode::Http, what + " failed with HTTP " + std::to_string(response.status_code) +
                                      (excerpt.empty() ? std::string{} : ": " + excerpt)};
}

} // namespace

std::string id_of(const Document& document) {
    if (!document.is_object()) {
        return "";
    }
    auto it = document.find("id");
    if (it == document.end()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<long long>());
    }
    return "";
}

Result<WorkflowSummary> summary_from_document(const Document& document) {
    const std::string id = id_of(document);
    if (id.empty()) {
        return Err<WorkflowSummary>(ErrorCode::InvalidData, "Workflow entry without id");
    }

    WorkflowSummary summary;
    summary.id = id;
    if (document.contains("name") && document["name"].is_string()) {
        summary.name = document["name"].get<std::string>();
    }
    if (document.contains("active") && document["active"].is_boolean()) {
        summary.active = document["active"].get<bool>();
    }
    if (document.contains("updatedAt") && document["updatedAt"].is_string()) {
        summary.updated_at = document["updatedAt"].get<std::string>();
    }
    if (document.contains("tags") && document["tags"].is_array()) {
        for (const auto& tag : document["tags"]) {
            if (tag.is_string()) {
                summary.tags.push_back(tag.get<std::string>());
            } else if (tag.is_object() && tag.contains("name") && tag["name"].is_string()) {
                summary.tags.push_back(tag["name"].get<std::string>());
            }
        }
    }
    return Ok(std::move(summary));
}

N8nClient::N8nClient(std::unique_ptr<network::HttpTransport> transport, std::string api_key)
    : transport_(std::move(transport)), api_key_(std::move(api_key)) {}

Result<std::unique_ptr<N8nClient>> N8nClient::connect(const std::string& host, const std::string& api_key) {
    auto url = network::Url::parse(host);
    if (url.is_error()) {
        return Err<std::unique_ptr<N8nClient>, Error>(url.error());
    }
    auto transport = std::make_unique<network::HttpClient>(url.value());
    return Ok(std::make_unique<N8nClient>(std::move(transport), api_key));
}

Result<std::vector<WorkflowSummary>> N8nClient::list() {
    std::vector<WorkflowSummary> workflows;
    std::string cursor;

    do {
        std::string target = std::string(kWorkflowsPath) + "?limit=" + std::to_string(kPageSize);
        if (!cursor.empty()) {
            target += "&cursor=" + url_encode(cursor);
        }

        auto response = execute(make_request(HttpMethod::GET, target));
        if (response.is_error()) {
            return Err<std::vector<WorkflowSummary>, Error>(response.error());
        }
        if (!response.value().is_success()) {
            return Err<std::vector<WorkflowSummary>, Error>(http_error(response.value(), "Listing workflows"));
        }

        auto body = parse_body(response.value());
        if (body.is_error()) {
            return Err<std::vector<WorkflowSummary>, Error>(body.error());
        }
        const auto& page = body.value();
        if (!page.is_object() || !page.contains("data") || !page["data"].is_array()) {
            return Err<std::vector<WorkflowSummary>>(ErrorCode::InvalidData,
                                                     "Workflow listing without a data array");
        }

        for (const auto& entry : page["data"]) {
            auto summary = summary_from_document(entry);
            if (summary.is_error()) {
                spdlog::warn("[N8nClient] Skipping listing entry: {}", summary.error().message);
                continue;
            }
            workflows.push_back(std::move(summary.value()));
        }

        cursor.clear();
        if (page.contains("nextCursor") && page["nextCursor"].is_string()) {
            cursor = page["nextCursor"].get<std::string>();
        }
    } while (!cursor.empty());

    spdlog::debug("[N8nClient] Listed {} workflows", workflows.size());
    return Ok(std::move(workflows));
}

Result<std::optional<Document>> N8nClient::get(const std::string& id) {
    auto response = execute(make_request(HttpMethod::GET, std::string(kWorkflowsPath) + "/" + url_encode(id)));
    if (response.is_error()) {
        return Err<std::optional<Document>, Error>(response.error());
    }
    if (response.value().status_code == 404) {
        return Ok(std::optional<Document>{});
    }
    if (!response.value().is_success()) {
        return Err<std::optional<Document>, Error>(http_error(response.value(), "Fetching workflow " + id));
    }

    auto body = parse_body(response.value());
    if (body.is_error()) {
        return Err<std::optional<Document>, Error>(body.error());
    }
    return Ok(std::optional<Document>(std::move(body.value())));
}

Result<Document> N8nClient::create(const Document& payload) {
    auto request = make_request(HttpMethod::POST, kWorkflowsPath);
    request.body = payload.dump(-1, ' ', false, Document::error_handler_t::replace);

    auto response = execute(request);
    if (response.is_error()) {
        return Err<Document, Error>(response.error());
    }
    if (!response.value().is_success()) {
        return Err<Document, Error>(http_error(response.value(), "Creating workflow"));
    }

    auto body = parse_body(response.value());
    if (body.is_ok() && id_of(body.value()).empty()) {
        return Err<Document>(ErrorCode::InvalidData, "Created workflow has no id");
    }
    return body;
}

Result<Document> N8nClient::update(const std::string& id, const Document& payload) {
    auto request = make_request(HttpMethod::PUT, std::string(kWorkflowsPath) + "/" + url_encode(id));
    request.body = payload.dump(-1, ' ', false, Document::error_handler_t::replace);

    auto response = execute(request);
    if (response.is_error()) {
        return Err<Document, Error>(response.error());
    }
    if (response.value().status_code == 404) {
        return Err<Document>(ErrorCode::NotFound, "Workflow " + id + " does not exist on the remote");
    }
    if (!response.value().is_success()) {
        return Err<Document, Error>(http_error(response.value(), "Updating workflow " + id));
    }
    return parse_body(response.value());
}

Result<void> N8nClient::remove(const std::string& id) {
    auto response = execute(make_request(HttpMethod::DELETE_METHOD, std::string(kWorkflowsPath) + "/" + url_encode(id)));
    if (response.is_error()) {
        return Err<void, Error>(response.error());
    }
    if (response.value().status_code == 404) {
        return Err<void>(ErrorCode::NotFound, "Workflow " + id + " does not exist on the remote");
    }
    if (!response.value().is_success()) {
        return Err<void, Error>(http_error(response.value(), "Deleting workflow " + id));
    }
    return Ok();
}

Result<void> N8nClient::test_connection() {
    auto response = execute(make_request(HttpMethod::GET, std::string(kWorkflowsPath) + "?limit=1"));
    if (response.is_error()) {
        return Err<void, Error>(response.error());
    }
    if (response.value().status_code == 401 || response.value().status_code == 403) {
        return Err<void, Error>(http_error(response.value(), "Authentication (check the API key)"));
    }
    if (!response.value().is_success()) {
        return Err<void, Error>(http_error(response.value(), "Connection test"));
    }
    return Ok();
}

HttpRequest N8nClient::make_request(HttpMethod method, std::string target) const {
    HttpRequest request;
    request.method = method;
    request.target = std::move(target);
    request.set_header("X-N8N-API-KEY", api_key_);
    request.set_header("Accept", "application/json");
    if (method == HttpMethod::POST || method == HttpMethod::PUT) {
        request.set_header("Content-Type", "application/json");
    }
    return request;
}

Result<HttpResponse> N8nClient::execute(const HttpRequest& request) {
    auto response = transport_->send(request);
    if (response.is_error()) {
        spdlog::warn("[N8nClient] {} {} failed: {}", network::HttpMethodUtils::to_string(request.method),
                     request.target, response.error().message);
    }
    return response;
}

Result<Document> N8nClient::parse_body(const HttpResponse& response) {
    auto document = Document::parse(response.body, nullptr, false);
    if (document.is_discarded()) {
        return Err<Document>(ErrorCode::InvalidData, "Response body is not valid JSON");
    }
    return Ok(std::move(document));
}

std::string N8nClient::url_encode(const std::string& text) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

} // namespace wfsync::remote
