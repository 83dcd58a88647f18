/**
 * @file value_model.cpp
 * @brief nlohmann::json -> closed value model
 */

#include "ocp/value_model.hpp"

#include <cmath>
#include <format>
#include <variant>

namespace ocp::value {

namespace {

template <typename... Fs>
struct Overloaded : Fs...
{
    using Fs::operator()...;
};

[[nodiscard]] std::uint64_t magnitude(std::int64_t v) noexcept
{
    // Negation in unsigned arithmetic is defined for INT64_MIN
    const auto bits = static_cast<std::uint64_t>(v);
    return v < 0 ? (~bits + 1U) : bits;
}

}  // namespace

bool NumericValue::is_finite() const noexcept
{
    if (const auto* d = std::get_if<double>(&storage)) {
        return std::isfinite(*d);
    }
    return true;
}

bool NumericValue::is_integral() const noexcept
{
    if (const auto* d = std::get_if<double>(&storage)) {
        return std::isfinite(*d) && std::trunc(*d) == *d;
    }
    return true;
}

bool NumericValue::is_safe_integer() const noexcept
{
    return std::visit(Overloaded{
                          [](std::int64_t v) { return magnitude(v) <= kMaxSafeInteger; },
                          [](std::uint64_t v) { return v <= kMaxSafeInteger; },
                          [](double) { return false; },
                      },
                      storage);
}

double NumericValue::as_double() const noexcept
{
    return std::visit([](auto v) { return static_cast<double>(v); }, storage);
}

ocp::Result<ValueKind> classify(const nlohmann::json& j)
{
    using nlohmann::json;
    switch (j.type()) {
        case json::value_t::null:
            return ValueKind::kNull;
        case json::value_t::boolean:
            return ValueKind::kBool;
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
            return ValueKind::kNumber;
        case json::value_t::string:
            return ValueKind::kString;
        case json::value_t::array:
            return ValueKind::kArray;
        case json::value_t::object:
            return ValueKind::kObject;
        case json::value_t::binary:
        case json::value_t::discarded:
            break;
    }
    return std::unexpected(
        Error::invalid_input(std::format("unsupported value type '{}'", j.type_name())));
}

ocp::Result<NumericValue> numeric_value(const nlohmann::json& j)
{
    using nlohmann::json;
    switch (j.type()) {
        case json::value_t::number_integer:
            return NumericValue{.storage = j.get<std::int64_t>()};
        case json::value_t::number_unsigned:
            return NumericValue{.storage = j.get<std::uint64_t>()};
        case json::value_t::number_float:
            return NumericValue{.storage = j.get<double>()};
        default:
            break;
    }
    return std::unexpected(
        Error::invalid_input(std::format("expected a number, got '{}'", j.type_name())));
}

std::string_view kind_name(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::kNull:
            return "null";
        case ValueKind::kBool:
            return "boolean";
        case ValueKind::kNumber:
            return "number";
        case ValueKind::kString:
            return "string";
        case ValueKind::kArray:
            return "array";
        case ValueKind::kObject:
            return "object";
    }
    return "unknown";
}

}  // namespace ocp::value
