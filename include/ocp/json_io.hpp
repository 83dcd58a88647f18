#pragma once

/**
 * @file json_io.hpp
 * @brief Reading JSON documents from disk
 */

#include "ocp/common.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace ocp::common {

/**
 * Read and parse a JSON file
 * @return Parsed document, IOError when unreadable, ParseError when malformed
 */
[[nodiscard]] ocp::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

}  // namespace ocp::common
