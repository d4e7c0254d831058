#pragma once

/**
 * @file platform.hpp
 * @brief Compiler detection and export macros for stackerror
 */

#include <version>

#if defined(__clang__)
    #define STACKERROR_COMPILER_CLANG 1
#elif defined(__GNUC__)
    #define STACKERROR_COMPILER_GCC 1
#endif

#if defined(_WIN32)
    #define STACKERROR_OS_WINDOWS 1
#endif

// std::source_location, used for default caller locations
#if defined(__cpp_lib_source_location)
    #define STACKERROR_HAS_SOURCE_LOCATION 1
#endif

// Error paths are cold in the TRY macros
#if defined(STACKERROR_COMPILER_GCC) || defined(STACKERROR_COMPILER_CLANG)
    #define STACKERROR_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define STACKERROR_UNLIKELY(x) (x)
#endif

#if defined(STACKERROR_OS_WINDOWS) && defined(STACKERROR_BUILDING_SHARED)
    #define STACKERROR_API __declspec(dllexport)
#elif defined(STACKERROR_OS_WINDOWS) && defined(STACKERROR_USING_SHARED)
    #define STACKERROR_API __declspec(dllimport)
#elif defined(STACKERROR_BUILDING_SHARED)
    #define STACKERROR_API __attribute__((visibility("default")))
#else
    #define STACKERROR_API
#endif
