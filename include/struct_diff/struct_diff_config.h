// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file struct_diff_config.h
/// @brief Compile-time configuration for struct_diff and immer.
///
/// Every public struct_diff header includes this file before any immer
/// header, so the immer settings below are consistent across translation
/// units. Applications that include immer directly must include a
/// struct_diff header first.
///
/// Unlike an editor state store, a comparison engine is commonly driven from
/// worker threads that share one parsed document. Thread-safe reference
/// counting therefore stays on unless STRUCT_DIFF_SINGLE_THREADED is set.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(STRUCT_DIFF_CONFIGURED)
#error "immer headers were included before struct_diff/struct_diff_config.h. " \
       "Please include struct_diff headers before any direct immer includes."
#endif

#define STRUCT_DIFF_CONFIGURED 1

// ============================================================
// Threading
// ============================================================

/// @brief Build for single-threaded use only.
///
/// When set to 1, `Value` switches to the non-atomic immer memory policy and
/// immer's own thread safety is compiled out. Documents must then never be
/// shared between threads.
#ifndef STRUCT_DIFF_SINGLE_THREADED
#define STRUCT_DIFF_SINGLE_THREADED 0
#endif

#if STRUCT_DIFF_SINGLE_THREADED && !defined(IMMER_NO_THREAD_SAFETY)
#define IMMER_NO_THREAD_SAFETY 1
#endif

// ============================================================
// Immer Settings
// ============================================================

/// @brief Disable tagged node assertions (smaller nodes, no tag checks)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Verbose Logging
//
// When STRUCT_DIFF_VERBOSE_LOG is 1 the detail::log_* helpers in value.h
// report rejected patterns, ignored configuration keys and detector
// decisions to stderr.
//
// Defaults: enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef STRUCT_DIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define STRUCT_DIFF_VERBOSE_LOG 0
#  else
#    define STRUCT_DIFF_VERBOSE_LOG 1
#  endif
#endif

/// @brief Also log every positional fallback of the identity-key detector.
///
/// Off by default even in debug builds; large documents contain many
/// arrays that legitimately have no key.
#ifndef STRUCT_DIFF_TRACE_DETECTION
#define STRUCT_DIFF_TRACE_DETECTION 0
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef STRUCT_DIFF_CONFIG_VERBOSE
#if STRUCT_DIFF_SINGLE_THREADED
#pragma message("struct_diff: single-threaded Value (non-atomic refcount)")
#else
#pragma message("struct_diff: thread-safe Value (atomic refcount)")
#endif
#if STRUCT_DIFF_VERBOSE_LOG
#pragma message("struct_diff: verbose logging ENABLED")
#endif
#endif // STRUCT_DIFF_CONFIG_VERBOSE
