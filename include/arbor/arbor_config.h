// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file arbor_config.h
/// @brief Centralized configuration for arbor and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by arbor:
///   - immer: persistent vectors and boxes backing every tree
///   - tsl::robin_map: key tables of the keyed reconciler
///
/// It MUST be included before any immer header to ensure consistent settings.
/// All arbor public headers already include this file.
///
/// arbor diffs trees inside a single render cycle on one thread, so the
/// defaults below favour single-threaded performance.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(ARBOR_CONFIGURED)
#error "immer headers were included before arbor/arbor_config.h. " \
       "Please include arbor headers before any direct immer includes."
#endif

#define ARBOR_CONFIGURED 1

// ============================================================
// Immer Performance Settings
// ============================================================

/// @brief Disable thread safety for single-threaded performance
///
/// This enables:
/// - Non-atomic reference counting (faster inc/dec)
/// - Thread-unsafe free list heap (no locks)
///
/// Trees shared across threads must use thread_safe_memory_policy
/// in their traits; it names atomic policies explicitly and is not
/// affected by this macro.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif

/// @brief Disable tagged node assertions
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

// ============================================================
// Immer Debug Settings (all disabled)
// ============================================================

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_STATS
#define IMMER_DEBUG_STATS 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

#ifndef IMMER_ENABLE_DEBUG_SIZE_HEAP
#define IMMER_ENABLE_DEBUG_SIZE_HEAP 0
#endif

// ============================================================
// Immer Error Handling Settings
// ============================================================

#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

// ============================================================
// Verbose Logging
//
// When ARBOR_VERBOSE_LOG is 1:
//   - patch application failures are logged to stderr before the
//     PatchError is thrown
//   - duplicate sibling keys are reported
//
// Defaults to enabled in debug builds, disabled with NDEBUG.
// ============================================================

#ifndef ARBOR_VERBOSE_LOG
#  if defined(NDEBUG)
#    define ARBOR_VERBOSE_LOG 0
#  else
#    define ARBOR_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef ARBOR_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("arbor: Thread safety DISABLED (optimized for single-thread)")
#else
#pragma message("arbor: Thread safety ENABLED")
#endif

#if ARBOR_VERBOSE_LOG
#pragma message("arbor: Verbose logging ENABLED")
#endif
#endif // ARBOR_CONFIG_VERBOSE
