// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exceptions thrown by the patch applier.

#pragma once

#include <arbor/api.h>
#include <arbor/patch_type.h>
#include <arbor/tree_path.h>

#include <stdexcept>
#include <string>

namespace arbor {

/// A patch could not be applied to the tree it was given.
///
/// Thrown when a path does not resolve, resolves to a node of the wrong
/// kind, or the node found there does not carry the tag the patch was
/// generated against. The tree passed to apply_patches is never modified,
/// so a caller can recover by keeping the previous tree.
class ARBOR_API PatchError : public std::runtime_error {
public:
    PatchError(PatchType type, TreePath path, const std::string& reason);

    [[nodiscard]] PatchType patch_type() const noexcept { return type_; }
    [[nodiscard]] const TreePath& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

private:
    PatchType type_;
    TreePath path_;
    std::string reason_;
};

} // namespace arbor
