#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test checks for arcas
 *
 * Include early in a translation unit (main.cpp does) to get a clear error
 * when the toolchain lacks a library feature arcas relies on.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "arcas requires C++23 or later (__cplusplus >= 202302L)."
#endif

// std::println for console output
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "arcas requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::expected for Result / VoidResult
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "arcas requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::views::enumerate in the SHA-256 block schedule and CLI parsing
#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "arcas requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::rotr and std::byteswap in SHA-256
#if !defined(__cpp_lib_bitops) || __cpp_lib_bitops < 201'907L
    #error "arcas requires <bit> bit operations (__cpp_lib_bitops >= 201907L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#if !defined(__cpp_lib_byteswap) || __cpp_lib_byteswap < 202'110L
    #error "arcas requires std::byteswap (__cpp_lib_byteswap >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::format with chrono specifiers for timestamps and version stamps
#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "arcas requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 202'110L
    #error "arcas requires std::ranges (__cpp_lib_ranges >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define ARCAS_CPP23_FEATURES_VERIFIED 1
