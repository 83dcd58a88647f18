#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for deterministic hashing
 *
 * Rules (canon.v1):
 * - Object keys in Unicode code-point order, at every depth
 * - Arrays keep their order
 * - Numbers by value: 1.0 -> 1, 0.950 -> 0.95, -0 -> 0
 * - Strings ASCII-only, non-ASCII as \\uXXXX (lowercase hex)
 * - No whitespace
 */

#include "ocp/common.hpp"

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace ocp::canonical {

/// Default bound on container nesting
inline constexpr std::size_t kDefaultMaxDepth = 512;

struct CanonicalOptions
{
    /// Maximum container nesting; a scalar at top level has depth 0
    std::size_t max_depth = kDefaultMaxDepth;
    /// Reject stored integers that binary64 cannot represent exactly
    bool strict = false;
};

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @param options Depth bound and strictness
 * @return Canonical byte string or InvalidInput
 */
[[nodiscard]] ocp::Result<std::string> canonicalize(const nlohmann::json& j,
                                                    const CanonicalOptions& options = {});

/**
 * Validate JSON for canonical form requirements
 *
 * Runs the full canonical pass and discards the output, so it accepts
 * exactly the values canonicalize() accepts.
 * - Finite numbers only
 * - Well-formed UTF-8 in keys and strings
 * - Nesting within options.max_depth
 * @return Empty on success, error on failure
 */
[[nodiscard]] ocp::VoidResult validate_for_canonical(const nlohmann::json& j,
                                                     const CanonicalOptions& options = {});

}  // namespace ocp::canonical
