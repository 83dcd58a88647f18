#pragma once

/**
 * @file number_format.hpp
 * @brief Canonical number rendering
 *
 * Shortest round-trip digits of the binary64 value, laid out in plain
 * decimal unless the decimal exponent falls outside
 * (kMinPlainExponent, kMaxPlainExponent). These constants are part of the
 * wire contract and must match every cooperating implementation.
 */

#include "ocp/common.hpp"
#include "ocp/value_model.hpp"

#include <string>

namespace ocp::canonical {

/// Decimal exponents at or below this use exponent notation (1e-7)
inline constexpr int kMinPlainExponent = -7;

/// Decimal exponents at or above this use exponent notation (1e+21)
inline constexpr int kMaxPlainExponent = 21;

struct NumberFormatOptions
{
    /// Reject stored integers beyond kMaxSafeInteger instead of rounding them through binary64
    bool strict = false;
};

/**
 * Render a number in canonical form
 * @return Canonical text, or InvalidInput for NaN/Infinity (and unsafe integers when strict)
 */
[[nodiscard]] ocp::Result<std::string> format_number(const value::NumericValue& number,
                                                     const NumberFormatOptions& options = {});

/**
 * Render a finite binary64 value in canonical form
 * @pre std::isfinite(value)
 */
[[nodiscard]] std::string format_double(double value);

}  // namespace ocp::canonical
