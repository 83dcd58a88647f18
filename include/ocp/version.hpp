#pragma once

/**
 * @file version.hpp
 * @brief ocp-canon version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace ocp {

/// ocp-canon version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Canonical form revision; bumped whenever any output byte may change
constexpr const char* kCanonicalFormVersion = "canon.v1";

/// Digest algorithm paired with the canonical form
constexpr const char* kHashAlgorithm = "sha256";

}  // namespace ocp
