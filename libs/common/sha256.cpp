/**
 * @file sha256.cpp
 * @brief SHA-256 (FIPS 180-4), standalone
 *
 * - Round helpers are constexpr, using std::rotr from <bit>
 * - Block words loaded big-endian via std::byteswap
 */

#include "ocp/common.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstring>
#include <ranges>
#include <span>

namespace ocp::common {

namespace {

constexpr std::array<std::uint32_t, 64> kRoundConstants = {{
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
}};

constexpr std::array<std::uint32_t, 8> kInitialState = {{
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
}};

constexpr std::size_t kBlockSize = 64;
constexpr std::size_t kLengthOffset = 56;

[[nodiscard]] constexpr std::uint32_t choose(std::uint32_t x, std::uint32_t y, std::uint32_t z) noexcept
{
    return (x & y) ^ (~x & z);
}

[[nodiscard]] constexpr std::uint32_t majority(std::uint32_t x, std::uint32_t y, std::uint32_t z) noexcept
{
    return (x & y) ^ (x & z) ^ (y & z);
}

[[nodiscard]] constexpr std::uint32_t big_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

[[nodiscard]] constexpr std::uint32_t big_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

[[nodiscard]] constexpr std::uint32_t small_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3U);
}

[[nodiscard]] constexpr std::uint32_t small_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10U);
}

[[nodiscard]] std::uint32_t load_be32(const std::uint8_t* p) noexcept
{
    std::uint32_t word{};
    std::memcpy(&word, p, sizeof(word));
    if constexpr (std::endian::native == std::endian::little) {
        return std::byteswap(word);
    } else {
        return word;
    }
}

constexpr char kHexDigits[] = "0123456789abcdef";

}  // namespace

Sha256::Sha256() noexcept
    : m_state{}
    , m_buffer{}
    , m_buffer_len{0}
    , m_bit_count{0}
{
    reset();
}

void Sha256::reset() noexcept
{
    m_state = kInitialState;
    m_buffer_len = 0;
    m_bit_count = 0;
}

void Sha256::update(std::span<const std::uint8_t> data) noexcept
{
    for (auto byte : data) {
        m_buffer[m_buffer_len++] = byte;
        if (m_buffer_len == kBlockSize) {
            transform();
            m_bit_count += kBlockSize * 8U;
            m_buffer_len = 0;
        }
    }
}

void Sha256::update(std::string_view data) noexcept
{
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data()),
                                         data.size()));
}

Sha256Digest Sha256::finalize() noexcept
{
    const std::uint64_t total_bits = m_bit_count + (static_cast<std::uint64_t>(m_buffer_len) * 8U);

    m_buffer[m_buffer_len++] = 0x80;
    if (m_buffer_len > kLengthOffset) {
        std::ranges::fill(std::span(m_buffer).subspan(m_buffer_len), std::uint8_t{0});
        transform();
        m_buffer_len = 0;
    }
    std::ranges::fill(std::span(m_buffer).subspan(m_buffer_len, kLengthOffset - m_buffer_len),
                      std::uint8_t{0});

    // Message length in bits, big-endian
    for (auto [i, slot] : std::views::enumerate(std::span(m_buffer).subspan(kLengthOffset))) {
        const auto shift = (7U - static_cast<std::uint64_t>(i)) * 8U;
        slot = static_cast<std::uint8_t>(total_bits >> shift);
    }
    transform();

    Sha256Digest digest{};
    for (auto [i, word] : std::views::enumerate(m_state)) {
        const auto idx = static_cast<std::size_t>(i) * 4uz;
        digest[idx + 0uz] = static_cast<std::uint8_t>(word >> 24U);
        digest[idx + 1uz] = static_cast<std::uint8_t>(word >> 16U);
        digest[idx + 2uz] = static_cast<std::uint8_t>(word >> 8U);
        digest[idx + 3uz] = static_cast<std::uint8_t>(word);
    }
    reset();
    return digest;
}

void Sha256::transform() noexcept
{
    std::array<std::uint32_t, 64> schedule{};
    for (std::size_t t = 0; t < 16; ++t) {
        schedule[t] = load_be32(&m_buffer[t * 4uz]);
    }
    for (std::size_t t = 16; t < schedule.size(); ++t) {
        schedule[t] = small_sigma1(schedule[t - 2]) + schedule[t - 7] + small_sigma0(schedule[t - 15])
                      + schedule[t - 16];
    }

    auto [a, b, c, d, e, f, g, h] = m_state;
    for (auto [t, word] : std::views::enumerate(schedule)) {
        const std::uint32_t t1 =
            h + big_sigma1(e) + choose(e, f, g) + kRoundConstants[static_cast<std::size_t>(t)] + word;
        const std::uint32_t t2 = big_sigma0(a) + majority(a, b, c);
        h = g;
        g = f;
        f = e;
        e = d + t1;
        d = c;
        c = b;
        b = a;
        a = t1 + t2;
    }

    m_state[0] += a;
    m_state[1] += b;
    m_state[2] += c;
    m_state[3] += d;
    m_state[4] += e;
    m_state[5] += f;
    m_state[6] += g;
    m_state[7] += h;
}

std::string to_hex(std::span<const std::uint8_t> bytes)
{
    std::string result;
    result.reserve(bytes.size() * 2uz);
    for (std::uint8_t byte : bytes) {
        result.push_back(kHexDigits[byte >> 4U]);
        result.push_back(kHexDigits[byte & 0x0FU]);
    }
    return result;
}

std::string sha256(std::string_view data)
{
    Sha256 hasher;
    hasher.update(data);
    return to_hex(hasher.finalize());
}

std::string sha256_prefixed(std::string_view data)
{
    return "sha256:" + sha256(data);
}

bool is_digest_hex(std::string_view text) noexcept
{
    return text.size() == kDigestHexLength && std::ranges::all_of(text, [](char c) {
               return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
           });
}

bool constant_time_equal(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    unsigned int diff = 0;
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        diff |= static_cast<unsigned char>(lhs[i]) ^ static_cast<unsigned char>(rhs[i]);
    }
    return diff == 0;
}

}  // namespace ocp::common
