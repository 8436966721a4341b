/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Usage:
 *   #include <dicom_ul/compat/format.hpp>
 *   auto s = dicom_ul::compat::format("Context {} accepted", id);
 */

#pragma once

#include <version>

// Detection relies on __cpp_lib_format first; Apple Clang 15+ and MSVC
// 19.29+ ship a usable <format> without always defining the macro.
#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define DICOM_UL_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define DICOM_UL_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define DICOM_UL_HAS_STD_FORMAT 1
#else
    #define DICOM_UL_HAS_STD_FORMAT 0
#endif

#if DICOM_UL_HAS_STD_FORMAT
    #include <format>
    namespace dicom_ul::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace dicom_ul::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
