/**
 * @file number_format.cpp
 * @brief Canonical number rendering
 *
 * Digits come from std::to_chars in shortest scientific form, which is the
 * shortest decimal that round-trips to the same binary64. The layout then
 * follows the plain/exponent thresholds in number_format.hpp.
 */

#include "ocp/number_format.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <cmath>
#include <format>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <variant>

namespace ocp::canonical {

namespace {

struct DecimalDigits
{
    bool negative;
    std::string digits;  ///< Significant digits, no leading or trailing zeros
    int exponent;        ///< value = 0.d1d2d3... * 10^(exponent + 1)
};

[[nodiscard]] DecimalDigits shortest_digits(double value)
{
    std::array<char, 64> buffer{};
    const auto [end, ec] =
        std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, std::chars_format::scientific);
    // 64 bytes always hold a binary64 in scientific form
    std::string_view text(buffer.data(), ec == std::errc{} ? end : buffer.data());

    DecimalDigits result{.negative = false, .digits = std::string{}, .exponent = 0};
    if (!text.empty() && text.front() == '-') {
        result.negative = true;
        text.remove_prefix(1);
    }

    const auto e_pos = text.find('e');
    for (char c : text.substr(0, e_pos)) {
        if (c != '.') {
            result.digits.push_back(c);
        }
    }
    if (e_pos != std::string_view::npos) {
        auto exponent_text = text.substr(e_pos + 1);
        bool exponent_negative = false;
        if (!exponent_text.empty() && (exponent_text.front() == '+' || exponent_text.front() == '-')) {
            exponent_negative = exponent_text.front() == '-';
            exponent_text.remove_prefix(1);
        }
        int magnitude = 0;
        std::from_chars(exponent_text.data(), exponent_text.data() + exponent_text.size(), magnitude);
        result.exponent = exponent_negative ? -magnitude : magnitude;
    }
    return result;
}

}  // namespace

std::string format_double(double value)
{
    // Also covers -0.0
    if (value == 0.0) {
        return "0";
    }

    const auto [negative, digits, exponent] = shortest_digits(value);
    const auto digit_count = static_cast<int>(digits.size());
    // Position of the decimal point relative to the first digit
    const int point = exponent + 1;

    std::string out;
    out.reserve(digits.size() + 8);
    if (negative) {
        out.push_back('-');
    }

    if (exponent >= kMaxPlainExponent || exponent <= kMinPlainExponent) {
        out.push_back(digits.front());
        if (digit_count > 1) {
            out.push_back('.');
            out.append(digits, 1);
        }
        out += std::format("e{}{}", exponent < 0 ? '-' : '+', std::abs(exponent));
    } else if (digit_count <= point) {
        out += digits;
        out.append(static_cast<std::size_t>(point - digit_count), '0');
    } else if (point > 0) {
        out.append(digits, 0, static_cast<std::size_t>(point));
        out.push_back('.');
        out.append(digits, static_cast<std::size_t>(point));
    } else {
        out += "0.";
        out.append(static_cast<std::size_t>(-point), '0');
        out += digits;
    }
    return out;
}

ocp::Result<std::string> format_number(const value::NumericValue& number,
                                       const NumberFormatOptions& options)
{
    if (!number.is_finite()) {
        const double d = number.as_double();
        return std::unexpected(Error::invalid_input(
            std::format("non-finite number ({})", std::isnan(d) ? "NaN" : (d < 0 ? "-Infinity" : "Infinity"))));
    }

    if (const auto* d = std::get_if<double>(&number.storage)) {
        // Integral doubles in the safe range print as exact integers; this also folds -0.0
        if (number.is_integral() && std::fabs(*d) <= static_cast<double>(value::kMaxSafeInteger)) {
            return std::format("{}", static_cast<std::int64_t>(*d));
        }
        return format_double(*d);
    }

    if (number.is_safe_integer()) {
        return std::visit(
            [](auto v) -> std::string {
                if constexpr (std::is_same_v<decltype(v), double>) {
                    return format_double(v);
                } else {
                    return std::format("{}", v);
                }
            },
            number.storage);
    }

    if (options.strict) {
        return std::unexpected(Error::invalid_input(std::format(
            "integer {} exceeds the safe integer range (+/-{})",
            std::visit([](auto v) { return std::format("{}", v); }, number.storage),
            value::kMaxSafeInteger)));
    }
    return format_double(number.as_double());
}

}  // namespace ocp::canonical
