// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// api.h - Shared library export/import macros for deep_diff

#pragma once

/// @file api.h
/// @brief Cross-platform export/import macros for the deep_diff library.
///
/// - Building deep_diff as a SHARED library:
///   CMake defines DEEP_DIFF_EXPORTS (private) and DEEP_DIFF_SHARED (public),
///   so everything marked DEEP_DIFF_API is exported.
/// - Using deep_diff as a SHARED library:
///   DEEP_DIFF_SHARED propagates through the CMake target and symbols are imported.
/// - STATIC library: DEEP_DIFF_API expands to nothing.
///
/// @code
/// class DEEP_DIFF_API DiffCollector { ... };
/// DEEP_DIFF_API DifferenceList deep_diff(const Value& a, const Value& b);
/// @endcode

#if defined(_WIN32) || defined(_WIN64)
    #ifdef DEEP_DIFF_SHARED
        #ifdef DEEP_DIFF_EXPORTS
            #define DEEP_DIFF_API __declspec(dllexport)
        #else
            #define DEEP_DIFF_API __declspec(dllimport)
        #endif
    #else
        #define DEEP_DIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(DEEP_DIFF_SHARED) && defined(DEEP_DIFF_EXPORTS)
        #define DEEP_DIFF_API __attribute__((visibility("default")))
    #else
        #define DEEP_DIFF_API
    #endif
#else
    #define DEEP_DIFF_API
#endif
