/**
 * @file json_io.cpp
 * @brief Reading JSON documents from disk
 */

#include "ocp/json_io.hpp"

#include <format>
#include <fstream>

namespace ocp::common {

ocp::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            "ParseError", std::format("Failed to parse JSON file {}: {}", path.string(), ex.what())));
    }
}

}  // namespace ocp::common
