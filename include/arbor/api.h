// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// api.h - DLL export/import macros for arbor

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the arbor library.
///
/// Usage:
/// - When building arbor as a SHARED library:
///   - CMake defines ARBOR_EXPORTS (private) and ARBOR_SHARED (public)
///   - Functions/classes marked with ARBOR_API will be exported
///
/// - When using arbor as a SHARED library:
///   - Link against the arbor target (CMake propagates ARBOR_SHARED)
///   - Functions/classes marked with ARBOR_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, ARBOR_API expands to nothing
///
/// Example:
/// @code
/// class ARBOR_API PatchError : public std::runtime_error { ... };
/// ARBOR_API std::string_view patch_type_name(PatchType type);
/// @endcode

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef ARBOR_SHARED
        #ifdef ARBOR_EXPORTS
            #define ARBOR_API __declspec(dllexport)
        #else
            #define ARBOR_API __declspec(dllimport)
        #endif
    #else
        #define ARBOR_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(ARBOR_SHARED) && defined(ARBOR_EXPORTS)
        #define ARBOR_API __attribute__((visibility("default")))
    #else
        #define ARBOR_API
    #endif
#else
    #define ARBOR_API
#endif
