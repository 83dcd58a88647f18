#pragma once

/**
 * @file entry.hpp
 * @brief Semantic hash reproduction for archive entries
 *
 * An archive entry's semantic_hash covers only its hash scope; storage
 * columns (ids, state hashes, signatures) are outside it.
 */

#include "ocp/canonical_json.hpp"
#include "ocp/common.hpp"

#include <array>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace ocp::entry {

/// Members of an entry covered by its semantic hash
inline constexpr std::array<std::string_view, 6> kHashScopeFields = {
    "action_type",
    "agent_id",
    "content",
    "evidence_pointers",
    "constitutional_citation",
    "timestamp",
};

/// Member holding the recorded digest
inline constexpr std::string_view kSemanticHashField = "semantic_hash";

struct Reproduction
{
    bool matches;
    std::string recorded;    ///< semantic_hash as stored (empty when absent)
    std::string reproduced;  ///< digest recomputed from the hash scope
};

/**
 * Project an entry onto its hash scope
 * @param entry Archive entry object
 * @return Hash-scope object, or InvalidInput when entry is not an object
 */
[[nodiscard]] ocp::Result<nlohmann::json> hash_scope(const nlohmann::json& entry);

/**
 * Recompute an entry's semantic hash and compare it with the recorded one
 */
[[nodiscard]] ocp::Result<Reproduction> reproduce(
    const nlohmann::json& entry,
    const canonical::CanonicalOptions& options = {});

}  // namespace ocp::entry
