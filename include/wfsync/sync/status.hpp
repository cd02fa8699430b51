#pragma once

#include "wfsync/workflow/types.hpp"

#include <optional>
#include <string>

namespace wfsync::sync {

/**
 * @brief Three-way status derivation
 *
 * PARAMETERS:
 * local  - L, canonical hash of the working file (nullopt: no file)
 * remote - R, canonical hash of the remote record (nullopt: not on remote)
 * base   - B, last synced hash (nullopt: never synced)
 *
 * RULES (first match wins):
 * 1. L, no B, no R                  -> EXIST_ONLY_LOCALLY
 *    R, no B, no L                  -> EXIST_ONLY_REMOTELY
 * 2. L == R                          -> IN_SYNC
 * 3. B set, L absent, R == B         -> DELETED_LOCALLY
 *    B set, R absent, L == B         -> DELETED_REMOTELY
 * 4. B set, L != B, R present != B   -> CONFLICT
 *    B set, L != B, R == B           -> MODIFIED_LOCALLY
 *    B set, R present != B, L == B   -> MODIFIED_REMOTELY
 * 5. anything else                   -> CONFLICT
 *
 * Pure: no I/O, no locking.
 */
workflow::SyncStatus compute_status(const std::optional<std::string>& local,
                                    const std::optional<std::string>& remote,
                                    const std::optional<std::string>& base);

} // namespace wfsync::sync
