// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief stderr diagnostics gated by ARBOR_VERBOSE_LOG.

#pragma once

#include <arbor/arbor_config.h>
#include <arbor/tree_path.h>

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

namespace arbor {

namespace detail {

inline void log_patch_error(
    std::string_view patch_kind,
    std::string_view path,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if ARBOR_VERBOSE_LOG
    std::cerr << "[apply_patches] " << patch_kind << " at " << path << ": " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)patch_kind;
    (void)path;
    (void)reason;
    (void)loc;
#endif
}

inline void log_key_warning(
    std::string_view func,
    const TreePath& path,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if ARBOR_VERBOSE_LOG
    std::cerr << "[" << func << "] child " << index << " of " << path.to_string() << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)path;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

} // namespace arbor
