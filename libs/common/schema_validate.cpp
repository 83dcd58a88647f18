/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "ocp/schema_validate.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace ocp::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "ocp:schema/";
constexpr std::string_view kSchemaSuffix = ".schema.json";

/**
 * @brief valijson resolves "#/definitions/..." only; rewrite draft 2019+ "$defs"
 */
void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& item : schema) {
            rewrite_defs(item);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }

    if (schema.contains("$defs") && !schema.contains("definitions")) {
        schema["definitions"] = schema["$defs"];
    }
    for (auto it = schema.begin(); it != schema.end(); ++it) {
        auto& value = it.value();
        if (it.key() == "$ref" && value.is_string()) {
            constexpr std::string_view kDefsPrefix = "#/$defs/";
            const auto& ref = value.get_ref<const std::string&>();
            if (ref.starts_with(kDefsPrefix)) {
                value = "#/definitions/" + ref.substr(kDefsPrefix.size());
            }
            continue;
        }
        rewrite_defs(value);
    }
}

[[nodiscard]] ocp::Result<nlohmann::json> load_schema(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + path.string()));
    }
    nlohmann::json schema;
    try {
        in >> schema;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed",
            std::format("Failed to parse schema JSON {}: {}", path.string(), ex.what())));
    }
    rewrite_defs(schema);
    return schema;
}

std::string describe_errors(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context) {
            pointer += "/" + part;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description);
    }
    return text;
}

}  // namespace

ocp::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto root = load_schema(schema_path);
    if (!root) {
        return std::unexpected(root.error());
    }

    const auto schema_dir = std::filesystem::path(schema_path).parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> referenced;
    const auto fetch_doc = [&schema_dir, &referenced](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        auto name = uri.substr(kSchemaUriPrefix.size());
        auto doc = load_schema(schema_dir / (name + std::string(kSchemaSuffix)));
        if (!doc) {
            return nullptr;
        }
        referenced.push_back(std::make_unique<nlohmann::json>(std::move(*doc)));
        return referenced.back().get();
    };
    // Documents are owned by `referenced`
    const auto free_doc = [](const nlohmann::json*) {};

    valijson::Schema schema;
    valijson::SchemaParser parser;
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*root);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(j);
    if (!validator.validate(schema, target, &results)) {
        auto description = describe_errors(results);
        if (description.empty()) {
            description = "Schema validation failed.";
        }
        return std::unexpected(Error::make("SchemaValidationFailed", std::move(description)));
    }
    return {};
}

}  // namespace ocp::common
