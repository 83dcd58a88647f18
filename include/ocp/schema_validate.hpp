#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "ocp/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace ocp::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * Schemas may reference siblings as "ocp:schema/<name>", resolved to
 * <schema dir>/<name>.schema.json.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] ocp::VoidResult validate_json(const nlohmann::json& j,
                                            const std::string& schema_path);

}  // namespace ocp::common
