#pragma once

/**
 * @file digest.hpp
 * @brief SHA-256 digests over canonical JSON
 *
 * The wire format is canonical form + SHA-256 + 64 lowercase hex
 * characters, nothing else.
 */

#include "ocp/canonical_json.hpp"
#include "ocp/common.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace ocp::digest {

/**
 * Compute the digest of a value
 * @return 64 lowercase hex characters, or InvalidInput
 */
[[nodiscard]] ocp::Result<std::string> hash(const nlohmann::json& j,
                                            const canonical::CanonicalOptions& options = {});

/**
 * Compute the digest with the "sha256:" prefix used in self-describing artifacts
 */
[[nodiscard]] ocp::Result<std::string> hash_prefixed(
    const nlohmann::json& j,
    const canonical::CanonicalOptions& options = {});

/**
 * Recompute the digest of j and compare it with expected
 * @return true on match, false otherwise; InvalidInput if j cannot be canonicalized
 */
[[nodiscard]] ocp::Result<bool> verify(const nlohmann::json& j,
                                       std::string_view expected,
                                       const canonical::CanonicalOptions& options = {});

/**
 * True iff both values canonicalize to the same string.
 * A value that fails to canonicalize is never equal to anything.
 */
[[nodiscard]] bool canonically_equal(const nlohmann::json& lhs,
                                     const nlohmann::json& rhs,
                                     const canonical::CanonicalOptions& options = {});

}  // namespace ocp::digest
