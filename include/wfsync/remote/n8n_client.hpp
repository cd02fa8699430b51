#pragma once

#include "wfsync/network/http_client.hpp"
#include "wfsync/remote/remote_api.hpp"

#include <memory>
#include <string>

namespace wfsync::remote {

/**
 * @brief RemoteApi over the n8n public REST API (v1)
 *
 * ENDPOINTS:
 * GET    /api/v1/workflows?limit=250[&cursor=..]   list (follows nextCursor)
 * GET    /api/v1/workflows/{id}                    get  (404 -> nullopt)
 * POST   /api/v1/workflows                         create
 * PUT    /api/v1/workflows/{id}                    update (404 -> NotFound)
 * DELETE /api/v1/workflows/{id}                    remove (404 -> NotFound)
 *
 * Every request carries X-N8N-API-KEY. The transport is injected so the
 * client can be exercised without a server.
 */
class N8nClient : public RemoteApi {
public:
    static constexpr int kPageSize = 250;

    N8nClient(std::unique_ptr<network::HttpTransport> transport, std::string api_key);

    /**
     * @brief Client with a real HttpClient for host ("http[s]://host[:port][/base]")
     */
    static Result<std::unique_ptr<N8nClient>> connect(const std::string& host, const std::string& api_key);

    Result<std::vector<workflow::WorkflowSummary>> list() override;
    Result<std::optional<workflow::Document>> get(const std::string& id) override;
    Result<workflow::Document> create(const workflow::Document& payload) override;
    Result<workflow::Document> update(const std::string& id, const workflow::Document& payload) override;
    Result<void> remove(const std::string& id) override;

    /**
     * @brief One cheap authenticated request; error explains why it failed
     */
    Result<void> test_connection();

private:
    network::HttpRequest make_request(network::HttpMethod method, std::string target) const;
    Result<network::HttpResponse> execute(const network::HttpRequest& request);
    static Result<workflow::Document> parse_body(const network::HttpResponse& response);
    static std::string url_encode(const std::string& text);

    std::unique_ptr<network::HttpTransport> transport_;
    std::string api_key_;
};

} // namespace wfsync::remote
