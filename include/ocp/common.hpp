#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error/result types, SHA-256, hex digests
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace ocp {

/// Error code raised by every canonicalization failure
constexpr std::string_view kInvalidInput = "InvalidInput";

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }

    [[nodiscard]] static Error invalid_input(std::string message)
    {
        return make(std::string(kInvalidInput), std::move(message));
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace ocp

namespace ocp::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

/// Raw SHA-256 output
using Sha256Digest = std::array<std::uint8_t, 32>;

/// Length of a hex-rendered SHA-256 digest
inline constexpr std::size_t kDigestHexLength = 64;

/**
 * @brief Streaming SHA-256 (FIPS 180-4)
 *
 * finalize() leaves the hasher reset, so one instance may be reused.
 */
class Sha256
{
public:
    Sha256() noexcept;

    void update(std::span<const std::uint8_t> data) noexcept;
    void update(std::string_view data) noexcept;

    [[nodiscard]] Sha256Digest finalize() noexcept;

private:
    void reset() noexcept;
    void transform() noexcept;

    std::array<std::uint32_t, 8> m_state;
    std::array<std::uint8_t, 64> m_buffer;
    std::size_t m_buffer_len;
    std::uint64_t m_bit_count;
};

/**
 * Compute SHA-256 hash of data
 * @param data Input bytes
 * @return Hex-encoded hash string (64 lowercase characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

/**
 * Compute SHA-256 hash of data with prefix
 * @param data Input bytes
 * @return "sha256:" + hex-encoded hash
 */
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

/**
 * Render bytes as lowercase hex without separators
 */
[[nodiscard]] std::string to_hex(std::span<const std::uint8_t> bytes);

/**
 * Check for exactly 64 lowercase hex characters
 */
[[nodiscard]] bool is_digest_hex(std::string_view text) noexcept;

/**
 * Compare two byte strings without an early exit on the first mismatch
 */
[[nodiscard]] bool constant_time_equal(std::string_view lhs, std::string_view rhs) noexcept;

}  // namespace ocp::common
