#pragma once

#include "wfsync/workflow/types.hpp"

#include <string>

namespace wfsync::workflow {

/**
 * @brief Deterministic content fingerprint of a normalized workflow
 *
 * Object keys are emitted in sorted order, array order is preserved (node
 * and connection order is meaningful), integral floating point values are
 * emitted as integers. The resulting text is hashed with SHA-256.
 */
class CanonicalHasher {
public:
    /**
     * @brief Stable serialization used as hash input
     */
    static std::string canonical_text(const Document& document);

    /**
     * @brief SHA-256 of canonical_text(), lower-case hex (64 chars)
     *
     * Expects an already normalized document; see WorkflowNormalizer.
     */
    static std::string hash(const Document& document);

    static std::string sha256_hex(const std::string& data);
};

} // namespace wfsync::workflow
