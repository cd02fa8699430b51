#pragma once

#include "wfsync/workflow/types.hpp"

#include <string>
#include <vector>

namespace wfsync::workflow {

/**
 * @brief Strips instance- and environment-specific fields from workflows
 *
 * Two shapes come out of here:
 * - storage form: what is written to disk and what gets hashed
 * - push payload: storage form without `active` and `tags`, which the
 *   remote service mutates through separate endpoints and which a blind
 *   content push must never overwrite
 */
class WorkflowNormalizer {
public:
    /**
     * @brief Settings keys that differ between instances or executions
     */
    static const std::vector<std::string>& volatile_settings_keys();

    /**
     * @brief {name, nodes, connections, settings, tags, active}
     *
     * Missing nodes/tags become [], missing connections/settings become {}.
     * name and active are only copied when present. Anything that is not a
     * JSON object normalizes to an empty workflow.
     */
    static Document clean_for_storage(const Document& workflow);

    static Document clean_for_push(const Document& workflow);

    /**
     * @brief File content for a workflow: storage form plus its id
     *
     * The id is part of the file so identity survives renames, but it is
     * not part of the storage form and therefore never hashed.
     */
    static Document to_local_file(const Document& workflow, const std::string& workflow_id);

    /**
     * @brief `<sanitized name>.json`
     *
     * Replaces '/', '\\' and ':' with '_', collapses whitespace runs into one
     * space and trims. Pure and byte-reproducible.
     */
    static std::string filename_for(const std::string& workflow_name);

    /**
     * @brief True if the remote workflow must be skipped by the sync
     *
     * Inactive workflows are skipped unless sync_inactive is set; a tag whose
     * lower-cased name is in ignored_tags also skips the workflow.
     */
    static bool should_ignore(const WorkflowSummary& summary,
                              bool sync_inactive,
                              const std::vector<std::string>& ignored_tags);
};

} // namespace wfsync::workflow
