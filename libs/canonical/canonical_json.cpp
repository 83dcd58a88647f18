/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization (canon.v1)
 *
 * Single depth-first pass that appends to one output buffer. Object
 * members are collected into a fresh vector and sorted by code point; the
 * input tree is never modified.
 */

#include "ocp/canonical_json.hpp"

#include "ocp/number_format.hpp"
#include "ocp/string_escape.hpp"
#include "ocp/value_model.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <string_view>
#include <variant>
#include <vector>

namespace ocp::canonical {

namespace {

using Json = nlohmann::json;
using PathSegment = std::variant<std::string_view, std::size_t>;

class CanonicalWriter
{
public:
    CanonicalWriter(const CanonicalOptions& options, std::string& out)
        : m_options(options)
        , m_out(out)
    {}

    [[nodiscard]] ocp::VoidResult write(const Json& j, std::size_t depth)
    {
        auto kind = value::classify(j);
        if (!kind) {
            return fail(kind.error());
        }

        switch (*kind) {
            case value::ValueKind::kNull:
                m_out += "null";
                return {};
            case value::ValueKind::kBool:
                m_out += j.get<bool>() ? "true" : "false";
                return {};
            case value::ValueKind::kNumber:
                return write_number(j);
            case value::ValueKind::kString:
                return write_string(j.get_ref<const Json::string_t&>());
            case value::ValueKind::kArray:
                return write_array(j, depth + 1);
            case value::ValueKind::kObject:
                return write_object(j, depth + 1);
        }
        return fail(Error::invalid_input("unreachable value kind"));
    }

private:
    [[nodiscard]] ocp::VoidResult write_number(const Json& j)
    {
        auto number = value::numeric_value(j);
        if (!number) {
            return fail(number.error());
        }
        auto text = format_number(*number, NumberFormatOptions{.strict = m_options.strict});
        if (!text) {
            return fail(text.error());
        }
        m_out += *text;
        return {};
    }

    [[nodiscard]] ocp::VoidResult write_string(std::string_view text)
    {
        if (auto result = escape_string(text, m_out); !result) {
            return fail(result.error());
        }
        return {};
    }

    [[nodiscard]] ocp::VoidResult check_depth(std::size_t depth)
    {
        if (depth > m_options.max_depth) {
            return fail(Error::invalid_input(
                std::format("nesting depth exceeds maximum of {}", m_options.max_depth)));
        }
        return {};
    }

    [[nodiscard]] ocp::VoidResult write_array(const Json& j, std::size_t depth)
    {
        if (auto result = check_depth(depth); !result) {
            return result;
        }
        const auto& elements = j.get_ref<const Json::array_t&>();
        m_out.push_back('[');
        for (auto [i, elem] : std::views::enumerate(elements)) {
            if (i != 0) {
                m_out.push_back(',');
            }
            m_path.emplace_back(static_cast<std::size_t>(i));
            if (auto result = write(elem, depth); !result) {
                return result;
            }
            m_path.pop_back();
        }
        m_out.push_back(']');
        return {};
    }

    [[nodiscard]] ocp::VoidResult write_object(const Json& j, std::size_t depth)
    {
        if (auto result = check_depth(depth); !result) {
            return result;
        }

        const auto& members = j.get_ref<const Json::object_t&>();
        std::vector<const Json::object_t::value_type*> sorted;
        sorted.reserve(members.size());
        for (const auto& member : members) {
            sorted.push_back(&member);
        }
        std::ranges::sort(sorted, code_point_less, [](const auto* member) {
            return std::string_view(member->first);
        });

        m_out.push_back('{');
        for (auto [i, member] : std::views::enumerate(sorted)) {
            if (i != 0) {
                m_out.push_back(',');
            }
            m_path.emplace_back(std::string_view(member->first));
            if (auto result = write_string(member->first); !result) {
                return result;
            }
            m_out.push_back(':');
            if (auto result = write(member->second, depth); !result) {
                return result;
            }
            m_path.pop_back();
        }
        m_out.push_back('}');
        return {};
    }

    [[nodiscard]] std::string current_path() const
    {
        std::string path = "$";
        for (const auto& segment : m_path) {
            if (const auto* index = std::get_if<std::size_t>(&segment)) {
                path += std::format("[{}]", *index);
            } else {
                path += '.';
                path += std::get<std::string_view>(segment);
            }
        }
        return path;
    }

    [[nodiscard]] std::unexpected<Error> fail(const Error& cause) const
    {
        return std::unexpected(
            Error::make(cause.code, std::format("{} at {}", cause.message, current_path())));
    }

    const CanonicalOptions& m_options;
    std::string& m_out;
    std::vector<PathSegment> m_path;
};

}  // namespace

ocp::Result<std::string> canonicalize(const nlohmann::json& j, const CanonicalOptions& options)
{
    std::string out;
    CanonicalWriter writer(options, out);
    if (auto result = writer.write(j, 0); !result) {
        return std::unexpected(result.error());
    }
    return out;
}

ocp::VoidResult validate_for_canonical(const nlohmann::json& j, const CanonicalOptions& options)
{
    if (auto canonical = canonicalize(j, options); !canonical) {
        return std::unexpected(canonical.error());
    }
    return {};
}

}  // namespace ocp::canonical
