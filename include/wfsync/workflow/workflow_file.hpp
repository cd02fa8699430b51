#pragma once

#include "wfsync/core/result.hpp"
#include "wfsync/workflow/types.hpp"

#include <filesystem>

namespace wfsync::workflow {

/**
 * @brief Reads a JSON document from disk
 *
 * NotFound if the file is missing, InvalidData if it does not parse,
 * Io if it cannot be read.
 */
Result<Document> read_document(const std::filesystem::path& path);

/**
 * @brief Writes a JSON document (2-space indent) atomically
 *
 * The content goes to a hidden sibling temp file first and is renamed over
 * the target, so observers never see a half-written workflow.
 */
Result<void> write_document(const std::filesystem::path& path, const Document& document);

/**
 * @brief True for names the sync never looks at (leading '.')
 */
bool is_hidden_name(const std::string& filename);

/**
 * @brief True for visible `*.json` names in the sync directory
 */
bool is_workflow_filename(const std::string& filename);

} // namespace wfsync::workflow
