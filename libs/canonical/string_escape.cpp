/**
 * @file string_escape.cpp
 * @brief UTF-8 validation and ASCII-only string escaping
 */

#include "ocp/string_escape.hpp"

#include <algorithm>
#include <cstdint>
#include <format>

namespace ocp::canonical {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

struct DecodedCodePoint
{
    std::uint32_t value;
    std::size_t length;
};

[[nodiscard]] bool is_continuation(unsigned char byte) noexcept
{
    return (byte & 0xC0U) == 0x80U;
}

/**
 * @brief Decode one scalar value starting at text[pos]
 *
 * Rejects truncated sequences, overlong forms, UTF-16 surrogates and
 * values above U+10FFFF.
 */
[[nodiscard]] ocp::Result<DecodedCodePoint> decode_utf8(std::string_view text, std::size_t pos)
{
    const auto lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80U) {
        return DecodedCodePoint{.value = lead, .length = 1};
    }

    std::size_t length = 0;
    std::uint32_t value = 0;
    std::uint32_t minimum = 0;
    if (lead >= 0xC2U && lead <= 0xDFU) {
        length = 2;
        value = lead & 0x1FU;
        minimum = 0x80;
    } else if ((lead & 0xF0U) == 0xE0U) {
        length = 3;
        value = lead & 0x0FU;
        minimum = 0x800;
    } else if (lead >= 0xF0U && lead <= 0xF4U) {
        length = 4;
        value = lead & 0x07U;
        minimum = 0x10000;
    } else {
        return std::unexpected(
            Error::invalid_input(std::format("invalid UTF-8 lead byte 0x{:02x} at offset {}", lead, pos)));
    }

    if (pos + length > text.size()) {
        return std::unexpected(
            Error::invalid_input(std::format("truncated UTF-8 sequence at offset {}", pos)));
    }
    for (std::size_t i = 1; i < length; ++i) {
        const auto byte = static_cast<unsigned char>(text[pos + i]);
        if (!is_continuation(byte)) {
            return std::unexpected(Error::invalid_input(
                std::format("invalid UTF-8 continuation byte 0x{:02x} at offset {}", byte, pos + i)));
        }
        value = (value << 6U) | (byte & 0x3FU);
    }

    if (value < minimum) {
        return std::unexpected(
            Error::invalid_input(std::format("overlong UTF-8 encoding at offset {}", pos)));
    }
    if (value >= 0xD800U && value <= 0xDFFFU) {
        return std::unexpected(Error::invalid_input(
            std::format("UTF-8 encoded surrogate U+{:04X} at offset {}", value, pos)));
    }
    if (value > 0x10FFFFU) {
        return std::unexpected(
            Error::invalid_input(std::format("code point above U+10FFFF at offset {}", pos)));
    }
    return DecodedCodePoint{.value = value, .length = length};
}

void append_unicode_escape(std::string& out, std::uint32_t code_unit)
{
    out += "\\u";
    out.push_back(kHexDigits[(code_unit >> 12U) & 0xFU]);
    out.push_back(kHexDigits[(code_unit >> 8U) & 0xFU]);
    out.push_back(kHexDigits[(code_unit >> 4U) & 0xFU]);
    out.push_back(kHexDigits[code_unit & 0xFU]);
}

}  // namespace

ocp::VoidResult escape_string(std::string_view text, std::string& out)
{
    const std::size_t rollback = out.size();
    out.reserve(out.size() + text.size() + 2);
    out.push_back('"');

    std::size_t pos = 0;
    while (pos < text.size()) {
        auto decoded = decode_utf8(text, pos);
        if (!decoded) {
            out.resize(rollback);
            return std::unexpected(decoded.error());
        }
        const std::uint32_t cp = decoded->value;
        pos += decoded->length;

        if (cp == '"') {
            out += "\\\"";
        } else if (cp == '\\') {
            out += "\\\\";
        } else if (cp >= 0x20U && cp <= 0x7EU) {
            out.push_back(static_cast<char>(cp));
        } else if (cp <= 0xFFFFU) {
            append_unicode_escape(out, cp);
        } else {
            const std::uint32_t offset = cp - 0x10000U;
            append_unicode_escape(out, 0xD800U + (offset >> 10U));
            append_unicode_escape(out, 0xDC00U + (offset & 0x3FFU));
        }
    }

    out.push_back('"');
    return {};
}

ocp::Result<std::string> quote_string(std::string_view text)
{
    std::string out;
    if (auto result = escape_string(text, out); !result) {
        return std::unexpected(result.error());
    }
    return out;
}

bool code_point_less(std::string_view lhs, std::string_view rhs) noexcept
{
    return std::ranges::lexicographical_compare(lhs, rhs, [](char a, char b) {
        return static_cast<unsigned char>(a) < static_cast<unsigned char>(b);
    });
}

}  // namespace ocp::canonical
