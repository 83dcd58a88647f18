#pragma once

/**
 * @file require_cpp23.hpp
 * @brief Compile-time check for the C++23 library features ocp-canon uses
 *
 * Include early in a translation unit (the CLI entry point does) to get a
 * readable diagnostic instead of a cascade of template errors when the
 * toolchain is too old.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+ (with libstdc++ 14 or libc++ 19)
 */

#include <charconv>
#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "ocp-canon requires C++23 or later (__cplusplus >= 202302L)."
#endif

// Tool output
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "ocp-canon requires std::print/std::println (__cpp_lib_print >= 202207L)."
#endif

// Result<T> / VoidResult
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "ocp-canon requires std::expected (__cpp_lib_expected >= 202202L)."
#endif

// Shortest round-trip digits for binary64 (number formatter)
#if !defined(__cpp_lib_to_chars) || __cpp_lib_to_chars < 201'611L
    #error "ocp-canon requires floating-point std::to_chars (__cpp_lib_to_chars >= 201611L)."
#endif

// SHA-256 rotations and big-endian loads
#if !defined(__cpp_lib_bitops) || __cpp_lib_bitops < 201'907L
    #error "ocp-canon requires <bit> bit operations (__cpp_lib_bitops >= 201907L)."
#endif

#if !defined(__cpp_lib_byteswap) || __cpp_lib_byteswap < 202'110L
    #error "ocp-canon requires std::byteswap (__cpp_lib_byteswap >= 202110L)."
#endif

#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "ocp-canon requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L)."
#endif

#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "ocp-canon requires std::format (__cpp_lib_format >= 202110L)."
#endif

#define OCP_CPP23_FEATURES_VERIFIED 1
