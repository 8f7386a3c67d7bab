// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file deep_diff_config.h
/// @brief Compile-time configuration for deep_diff and immer.
///
/// Must be seen before any immer header so that every translation unit
/// instantiates immer containers with the same settings. All deep_diff
/// public headers include it first; users who only include deep_diff
/// headers don't need to do anything.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(DEEP_DIFF_CONFIGURED)
#error "immer headers were included before deep_diff/deep_diff_config.h. " \
       "Please include deep_diff headers before any direct immer includes."
#endif

#define DEEP_DIFF_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// Value trees are built and diffed on one thread: non-atomic refcounts,
/// no locks in the free lists.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif

/// No runtime type tags in nodes
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
// Diagnostic Logging
//
// When DEEP_DIFF_VERBOSE_LOG is 1, failed Value lookups (at/set on a
// missing key, out-of-range index or wrong kind) are reported on stderr
// together with the caller's source location.
//
// Default: enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef DEEP_DIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define DEEP_DIFF_VERBOSE_LOG 0
#  else
#    define DEEP_DIFF_VERBOSE_LOG 1
#  endif
#endif

#ifdef DEEP_DIFF_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("deep_diff: immer thread safety DISABLED (optimized for single-thread)")
#else
#pragma message("deep_diff: immer thread safety ENABLED")
#endif
#if DEEP_DIFF_VERBOSE_LOG
#pragma message("deep_diff: verbose lookup logging ENABLED")
#endif
#endif
