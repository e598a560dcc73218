// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Symbol visibility macros for the struct_diff library.
///
/// The build defines STRUCT_DIFF_SHARED (public) and STRUCT_DIFF_EXPORTS
/// (private) when struct_diff is built as a shared library. A static build
/// defines neither and STRUCT_DIFF_API expands to nothing.
///
/// @code
/// struct STRUCT_DIFF_API DiffRecord { ... };
/// [[nodiscard]] STRUCT_DIFF_API CompareResult compare(...);
/// @endcode

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #ifdef STRUCT_DIFF_SHARED
        #ifdef STRUCT_DIFF_EXPORTS
            #define STRUCT_DIFF_API __declspec(dllexport)
        #else
            #define STRUCT_DIFF_API __declspec(dllimport)
        #endif
    #else
        #define STRUCT_DIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(STRUCT_DIFF_SHARED) && defined(STRUCT_DIFF_EXPORTS)
        #define STRUCT_DIFF_API __attribute__((visibility("default")))
    #else
        #define STRUCT_DIFF_API
    #endif
#else
    #define STRUCT_DIFF_API
#endif

// Explicit instantiation of the BasicValue templates happens once in
// value.cpp; every other translation unit sees an extern declaration.
//   header: STRUCT_DIFF_EXTERN_TEMPLATE struct BasicValue<P>;
//   source: STRUCT_DIFF_EXPORT_TEMPLATE BasicValue<P>;
#define STRUCT_DIFF_EXTERN_TEMPLATE extern template
#ifdef _MSC_VER
    #define STRUCT_DIFF_EXPORT_TEMPLATE template struct STRUCT_DIFF_API
#else
    #define STRUCT_DIFF_EXPORT_TEMPLATE template struct
#endif
