/**
 * @file digest.cpp
 * @brief SHA-256 digests over canonical JSON
 */

#include "ocp/digest.hpp"

#include "ocp/common.hpp"

namespace ocp::digest {

ocp::Result<std::string> hash(const nlohmann::json& j, const canonical::CanonicalOptions& options)
{
    auto canonical = canonical::canonicalize(j, options);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256(*canonical);
}

ocp::Result<std::string> hash_prefixed(const nlohmann::json& j,
                                       const canonical::CanonicalOptions& options)
{
    auto canonical = canonical::canonicalize(j, options);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256_prefixed(*canonical);
}

ocp::Result<bool> verify(const nlohmann::json& j,
                         std::string_view expected,
                         const canonical::CanonicalOptions& options)
{
    auto actual = hash(j, options);
    if (!actual) {
        return std::unexpected(actual.error());
    }
    return common::constant_time_equal(*actual, expected);
}

bool canonically_equal(const nlohmann::json& lhs,
                       const nlohmann::json& rhs,
                       const canonical::CanonicalOptions& options)
{
    auto left = canonical::canonicalize(lhs, options);
    auto right = canonical::canonicalize(rhs, options);
    if (!left || !right) {
        return false;
    }
    return *left == *right;
}

}  // namespace ocp::digest
