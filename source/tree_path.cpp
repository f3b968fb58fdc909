// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file tree_path.cpp
/// @brief Implementation of TreePath.

#include <arbor/tree_path.h>

#include <algorithm>

namespace arbor {

TreePath TreePath::traverse(std::size_t index) const
{
    TreePath child{path_};
    child.path_.push_back(index);
    return child;
}

TreePath TreePath::backtrack() const
{
    if (path_.empty()) {
        return {};
    }
    return TreePath{std::vector<std::size_t>(path_.begin(), path_.end() - 1)};
}

std::optional<std::size_t> TreePath::pluck()
{
    if (path_.empty()) {
        return std::nullopt;
    }
    const auto first = path_.front();
    path_.erase(path_.begin());
    return first;
}

std::optional<std::size_t> TreePath::last() const noexcept
{
    if (path_.empty()) {
        return std::nullopt;
    }
    return path_.back();
}

bool TreePath::is_prefix_of(const TreePath& other) const noexcept
{
    if (path_.size() > other.path_.size()) {
        return false;
    }
    return std::equal(path_.begin(), path_.end(), other.path_.begin());
}

std::string TreePath::to_string() const
{
    std::string result = "[";
    for (std::size_t i = 0; i < path_.size(); ++i) {
        if (i > 0) {
            result += ",";
        }
        result += std::to_string(path_[i]);
    }
    result += "]";
    return result;
}

} // namespace arbor
