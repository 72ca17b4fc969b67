/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Resolves to std::format where the standard library ships it and to the
 * fmt library otherwise, so logging call sites can use one spelling.
 *
 * Usage:
 *   #include <gateway/compat/format.hpp>
 *   auto s = gateway::compat::format("listening on {}:{}", host, port);
 */

#pragma once

#include <version>  // For feature test macros

// Detect std::format availability
//
// 1. __cpp_lib_format feature test macro (libstdc++ 13+, libc++)
// 2. Apple Clang 15+ with libc++ (may not define __cpp_lib_format)
// 3. MSVC 19.29+ with C++20 mode
#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define GATEWAY_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define GATEWAY_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define GATEWAY_HAS_STD_FORMAT 1
#else
    #define GATEWAY_HAS_STD_FORMAT 0
#endif

#if GATEWAY_HAS_STD_FORMAT
    #include <format>
    namespace gateway::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    // Use fmt library as fallback
    #include <fmt/format.h>
    namespace gateway::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
