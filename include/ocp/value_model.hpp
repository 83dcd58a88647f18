#pragma once

/**
 * @file value_model.hpp
 * @brief Closed JSON value model over nlohmann::json
 *
 * The canonical serializer never looks at nlohmann's type tags directly;
 * it drives off ValueKind and NumericValue so the six-variant model stays
 * exhaustive in one place.
 */

#include "ocp/common.hpp"

#include <cstdint>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace ocp::value {

/**
 * The six variants of a JSON value
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class ValueKind {
    kNull,
    kBool,
    kNumber,
    kString,
    kArray,
    kObject
};

/// Largest integer every binary64-based implementation represents exactly (2^53 - 1)
inline constexpr std::uint64_t kMaxSafeInteger = 9'007'199'254'740'991ULL;

/**
 * @brief Parsed numeric value with its storage form
 *
 * Integral-ness is a property of the value, not of the storage: a double
 * holding 1678886400.0 is integral.
 */
struct NumericValue
{
    std::variant<std::int64_t, std::uint64_t, double> storage;

    [[nodiscard]] bool is_finite() const noexcept;
    [[nodiscard]] bool is_integral() const noexcept;
    /// Stored as an integer whose magnitude does not exceed kMaxSafeInteger
    [[nodiscard]] bool is_safe_integer() const noexcept;
    [[nodiscard]] double as_double() const noexcept;
};

/**
 * Classify a value into the closed model
 * @return ValueKind, or InvalidInput for binary/discarded values
 */
[[nodiscard]] ocp::Result<ValueKind> classify(const nlohmann::json& j);

/**
 * Extract the numeric value of a number
 * @return NumericValue, or InvalidInput when j is not a number
 */
[[nodiscard]] ocp::Result<NumericValue> numeric_value(const nlohmann::json& j);

/// Lowercase name used in diagnostics ("object", "number", ...)
[[nodiscard]] std::string_view kind_name(ValueKind kind) noexcept;

}  // namespace ocp::value
