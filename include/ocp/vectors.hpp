#pragma once

/**
 * @file vectors.hpp
 * @brief Replay of cross-implementation canonicalization test vectors
 *
 * File layout (schemas/test_vectors.schema.json):
 *   { "schema_version": "canon_vectors.v1", "vectors": [
 *       { "name", "input" | "input_text", ["strict"], ["max_depth"],
 *         "canonical"?, "sha256"?, "error"? } ] }
 */

#include "ocp/canonical_json.hpp"
#include "ocp/common.hpp"

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ocp::vectors {

struct VectorOutcome
{
    std::string name;
    bool passed;
    std::string detail;  ///< Empty when passed
};

struct VectorReport
{
    std::vector<VectorOutcome> outcomes;
    std::size_t passed = 0;
    std::size_t failed = 0;

    [[nodiscard]] bool ok() const noexcept { return failed == 0; }
};

/**
 * Check a single vector
 * @param vector One element of "vectors"
 * @param defaults Options used unless the vector overrides strict/max_depth
 */
[[nodiscard]] VectorOutcome check_vector(const nlohmann::json& vector,
                                         const canonical::CanonicalOptions& defaults = {});

/**
 * Check every vector of a vector file
 * @return Report, or an error when the document has no "vectors" array
 */
[[nodiscard]] ocp::Result<VectorReport> run_vectors(
    const nlohmann::json& document,
    const canonical::CanonicalOptions& defaults = {});

}  // namespace ocp::vectors
