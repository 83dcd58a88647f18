#pragma once

/**
 * @file string_escape.hpp
 * @brief ASCII-only JSON string escaping and code-point key ordering
 */

#include "ocp/common.hpp"

#include <string>
#include <string_view>

namespace ocp::canonical {

/**
 * Append the canonical quoted form of a UTF-8 string to out
 *
 * Printable ASCII (0x20-0x7E) is copied except '"' and '\\', which get
 * their two-character escapes. Everything else becomes \\uXXXX (lowercase
 * hex, one escape per UTF-16 code unit).
 *
 * @param text UTF-8 input
 * @param out Destination; left unchanged past its original size on error
 * @return Empty on success, InvalidInput for malformed UTF-8
 */
[[nodiscard]] ocp::VoidResult escape_string(std::string_view text, std::string& out);

/**
 * Convenience wrapper returning the quoted form
 */
[[nodiscard]] ocp::Result<std::string> quote_string(std::string_view text);

/**
 * Key ordering: Unicode code-point order, i.e. unsigned byte order of UTF-8
 */
[[nodiscard]] bool code_point_less(std::string_view lhs, std::string_view rhs) noexcept;

}  // namespace ocp::canonical
