// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file tree_path.h
/// @brief Child-index addressing of nodes inside a tree.
///
/// A TreePath is the sequence of child indices followed from the root to
/// reach a node. The empty path is the root itself.
///
/// ```
///            <body>            []
///            /    \
///       <main>    <footer>     [0]       [1]
///       /   \      /  |  \
///  <input> <img> <a> text <nav>  [0,0] [0,1]  [1,0] [1,1] [1,2]
/// ```
///
/// Indices count the children as the diff engine sees them: node lists are
/// flattened into their parent, so a NodeList never occupies an index of
/// its own below the root.
///
/// A path is a coordinate, not a reference. It is valid against exactly
/// one snapshot of a tree; once a patch has inserted or removed siblings
/// above it, a path computed earlier may point somewhere else. Patches
/// are therefore meaningful only when applied in emission order within a
/// single application pass.

#pragma once

#include <arbor/api.h>

#include <compare>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace arbor {

class ARBOR_API TreePath {
public:
    using value_type = std::size_t;
    using const_iterator = std::vector<std::size_t>::const_iterator;
    using size_type = std::size_t;

    /// Empty path, i.e. the root node
    TreePath() = default;

    TreePath(std::initializer_list<std::size_t> init) : path_(init) {}

    explicit TreePath(std::vector<std::size_t> path) : path_(std::move(path)) {}

    // ============================================================
    // Navigation
    // ============================================================

    /// Path of the child at `index` below this path
    [[nodiscard]] TreePath traverse(std::size_t index) const;

    /// Path of the parent. The root's parent is the root.
    [[nodiscard]] TreePath backtrack() const;

    /// Remove and return the first index (descends one level).
    /// Returns std::nullopt when the path is already empty.
    std::optional<std::size_t> pluck();

    /// Last index of the path, i.e. the position among siblings
    [[nodiscard]] std::optional<std::size_t> last() const noexcept;

    // ============================================================
    // In-place building (used by the diff traversal)
    // ============================================================

    TreePath& push_back(std::size_t index) {
        path_.push_back(index);
        return *this;
    }

    void pop_back() { path_.pop_back(); }

    void reserve(std::size_t n) { path_.reserve(n); }

    // ============================================================
    // Access
    // ============================================================

    [[nodiscard]] bool is_empty() const noexcept { return path_.empty(); }
    [[nodiscard]] bool empty() const noexcept { return path_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return path_.size(); }
    [[nodiscard]] std::size_t operator[](std::size_t i) const noexcept { return path_[i]; }

    [[nodiscard]] const_iterator begin() const noexcept { return path_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return path_.end(); }

    [[nodiscard]] const std::vector<std::size_t>& indices() const noexcept { return path_; }

    /// True when `other` lies inside the subtree addressed by this path
    /// (including this path itself)
    [[nodiscard]] bool is_prefix_of(const TreePath& other) const noexcept;

    /// Render as "[0,1,2]"; the root renders as "[]"
    [[nodiscard]] std::string to_string() const;

    bool operator==(const TreePath& other) const = default;
    std::strong_ordering operator<=>(const TreePath& other) const = default;

private:
    std::vector<std::size_t> path_;
};

} // namespace arbor
