/**
 * @file entry.cpp
 * @brief Archive entry hash scope and semantic hash reproduction
 */

#include "ocp/entry.hpp"

#include "ocp/digest.hpp"

#include <format>
#include <utility>

namespace ocp::entry {

namespace {

using Json = nlohmann::json;

/**
 * @brief Entries store content as text; hash the JSON it encodes when it encodes any
 */
[[nodiscard]] Json decode_content(const Json& content)
{
    if (!content.is_string()) {
        return content;
    }
    // Non-throwing parse: text that is not JSON is hashed as the string itself
    Json parsed = Json::parse(content.get_ref<const Json::string_t&>(), nullptr, false);
    if (parsed.is_discarded()) {
        return content;
    }
    return parsed;
}

}  // namespace

ocp::Result<nlohmann::json> hash_scope(const nlohmann::json& entry)
{
    if (!entry.is_object()) {
        return std::unexpected(Error::invalid_input(
            std::format("archive entry must be an object, got '{}'", entry.type_name())));
    }

    Json scope = Json::object();
    for (auto field : kHashScopeFields) {
        const std::string key(field);
        auto it = entry.find(key);
        if (it == entry.end()) {
            scope[key] = (field == "evidence_pointers") ? Json::array() : Json(nullptr);
            continue;
        }
        scope[key] = (field == "content") ? decode_content(*it) : *it;
    }
    return scope;
}

ocp::Result<Reproduction> reproduce(const nlohmann::json& entry,
                                    const canonical::CanonicalOptions& options)
{
    auto scope = hash_scope(entry);
    if (!scope) {
        return std::unexpected(scope.error());
    }
    auto reproduced = digest::hash(*scope, options);
    if (!reproduced) {
        return std::unexpected(reproduced.error());
    }

    std::string recorded;
    if (auto it = entry.find(std::string(kSemanticHashField)); it != entry.end() && it->is_string()) {
        recorded = it->get<std::string>();
    }
    const bool matches = !recorded.empty() && common::constant_time_equal(recorded, *reproduced);
    return Reproduction{.matches = matches, .recorded = std::move(recorded), .reproduced = std::move(*reproduced)};
}

}  // namespace ocp::entry
