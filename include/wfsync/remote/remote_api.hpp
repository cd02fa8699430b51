#pragma once

/**
 * @file remote_api.hpp
 * @brief Contract the reconciliation core consumes from the remote service
 *
 * WHY THIS FILE EXISTS:
 * Watcher and SyncEngine never talk HTTP. They see five operations on
 * workflow records; N8nClient implements them over REST, tests implement
 * them in memory.
 *
 * ERROR CONVENTIONS:
 * - get() of an unknown id is NOT an error: it returns an empty optional,
 *   because a vanished record is a legitimate state (remote deletion)
 * - update() of an unknown id fails with ErrorCode::NotFound, which
 *   forcePush turns into create + identity migration
 * - remove() of an unknown id fails with ErrorCode::NotFound
 * - transport and HTTP failures use ErrorCode::Transport / ErrorCode::Http
 */

#include "wfsync/core/result.hpp"
#include "wfsync/workflow/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wfsync::remote {

class RemoteApi {
public:
    virtual ~RemoteApi() = default;

    /**
     * @brief Lightweight listing of every workflow (no nodes)
     */
    virtual Result<std::vector<workflow::WorkflowSummary>> list() = 0;

    /**
     * @brief Full record, or nullopt if the id does not exist
     */
    virtual Result<std::optional<workflow::Document>> get(const std::string& id) = 0;

    /**
     * @brief Create a record from a push payload, returns the stored record (with its new id)
     */
    virtual Result<workflow::Document> create(const workflow::Document& payload) = 0;

    /**
     * @brief Replace a record, returns the server's authoritative version
     */
    virtual Result<workflow::Document> update(const std::string& id, const workflow::Document& payload) = 0;

    virtual Result<void> remove(const std::string& id) = 0;
};

/**
 * @brief Listing entry from a JSON workflow object
 *
 * Accepts string or numeric ids, tags as [{"name": ...}] or ["..."].
 * InvalidData if there is no usable id.
 */
Result<workflow::WorkflowSummary> summary_from_document(const workflow::Document& document);

/**
 * @brief The "id" of a record as a string (numeric ids are converted), "" if absent
 */
std::string id_of(const workflow::Document& document);

} // namespace wfsync::remote
