/**
 * @file vectors.cpp
 * @brief Test vector replay
 */

#include "ocp/vectors.hpp"

#include "ocp/common.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace ocp::vectors {

namespace {

using Json = nlohmann::json;

[[nodiscard]] ocp::Result<Json> vector_input(const Json& vector)
{
    if (auto it = vector.find("input"); it != vector.end()) {
        return *it;
    }
    auto it = vector.find("input_text");
    if (it == vector.end() || !it->is_string()) {
        return std::unexpected(Error::make("InvalidVector", "missing 'input' or 'input_text'"));
    }
    try {
        return Json::parse(it->get_ref<const Json::string_t&>());
    } catch (const Json::out_of_range& ex) {
        // Number literals beyond binary64 range have no finite value
        return std::unexpected(
            Error::invalid_input(std::format("input_text holds a non-finite number: {}", ex.what())));
    } catch (const Json::exception& ex) {
        return std::unexpected(
            Error::make("ParseError", std::format("input_text is not valid JSON: {}", ex.what())));
    }
}

[[nodiscard]] std::unexpected<Error> invalid_vector(std::string_view message)
{
    return std::unexpected(Error::make("InvalidVector", std::string(message)));
}

[[nodiscard]] ocp::Result<canonical::CanonicalOptions> vector_options(
    const Json& vector,
    const canonical::CanonicalOptions& defaults)
{
    auto options = defaults;
    if (auto it = vector.find("strict"); it != vector.end()) {
        if (!it->is_boolean()) {
            return invalid_vector("'strict' must be a boolean");
        }
        options.strict = it->get<bool>();
    }
    if (auto it = vector.find("max_depth"); it != vector.end()) {
        if (!it->is_number_integer() || (!it->is_number_unsigned() && it->get<std::int64_t>() < 0)) {
            return invalid_vector("'max_depth' must be a non-negative integer");
        }
        options.max_depth = it->get<std::size_t>();
    }
    return options;
}

[[nodiscard]] ocp::Result<bool> expects_error(const Json& vector)
{
    auto it = vector.find("error");
    if (it == vector.end()) {
        return false;
    }
    if (!it->is_boolean()) {
        return invalid_vector("'error' must be a boolean");
    }
    return it->get<bool>();
}

[[nodiscard]] std::string string_member(const Json& vector, std::string_view key)
{
    auto it = vector.find(std::string(key));
    if (it == vector.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

}  // namespace

VectorOutcome check_vector(const nlohmann::json& vector, const canonical::CanonicalOptions& defaults)
{
    VectorOutcome outcome{.name = string_member(vector, "name"), .passed = false, .detail = {}};
    if (outcome.name.empty()) {
        outcome.name = "<unnamed>";
    }

    auto options = vector_options(vector, defaults);
    if (!options) {
        outcome.detail = std::format("{}: {}", options.error().code, options.error().message);
        return outcome;
    }
    auto expect_error = expects_error(vector);
    if (!expect_error) {
        outcome.detail = std::format("{}: {}", expect_error.error().code, expect_error.error().message);
        return outcome;
    }

    auto input = vector_input(vector);
    if (!input && (!*expect_error || input.error().code != kInvalidInput)) {
        outcome.detail = std::format("{}: {}", input.error().code, input.error().message);
        return outcome;
    }

    auto canonical = input ? canonical::canonicalize(*input, *options)
                           : ocp::Result<std::string>(std::unexpected(input.error()));

    if (*expect_error) {
        if (canonical) {
            outcome.detail = std::format("expected {} but got {}", kInvalidInput, *canonical);
        } else if (canonical.error().code != kInvalidInput) {
            outcome.detail = std::format("expected {} but got {}", kInvalidInput, canonical.error().code);
        } else {
            outcome.passed = true;
        }
        return outcome;
    }
    if (!canonical) {
        outcome.detail = std::format("{}: {}", canonical.error().code, canonical.error().message);
        return outcome;
    }

    if (auto expected = string_member(vector, "canonical"); vector.contains("canonical") && *canonical != expected) {
        outcome.detail = std::format("canonical mismatch: expected {} got {}", expected, *canonical);
        return outcome;
    }
    if (auto expected = string_member(vector, "sha256"); vector.contains("sha256")) {
        auto actual = common::sha256(*canonical);
        if (actual != expected) {
            outcome.detail = std::format("sha256 mismatch: expected {} got {}", expected, actual);
            return outcome;
        }
    }
    outcome.passed = true;
    return outcome;
}

ocp::Result<VectorReport> run_vectors(const nlohmann::json& document,
                                      const canonical::CanonicalOptions& defaults)
{
    auto it = document.find("vectors");
    if (!document.is_object() || it == document.end() || !it->is_array()) {
        return std::unexpected(Error::make("InvalidVector", "document has no 'vectors' array"));
    }

    VectorReport report;
    for (const auto& vector : *it) {
        auto outcome = check_vector(vector, defaults);
        if (outcome.passed) {
            ++report.passed;
        } else {
            ++report.failed;
        }
        report.outcomes.push_back(std::move(outcome));
    }
    return report;
}

}  // namespace ocp::vectors
