// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lis.h
/// @brief Longest increasing subsequence over sibling positions.

#pragma once

#include <arbor/api.h>

#include <cstddef>
#include <span>
#include <vector>

namespace arbor {

/// Positions (indices into `values`) of a longest strictly increasing
/// subsequence of `values`, in ascending order.
///
/// O(n log n). Among subsequences of maximal length, the one returned ends
/// in the smallest possible value at every length, which makes the result
/// deterministic for a given input.
///
/// @code
/// std::vector<std::size_t> v{3, 1, 2, 0, 4};
/// longest_increasing_subsequence(v);  // {1, 2, 4} -> values 1, 2, 4
/// @endcode
[[nodiscard]] ARBOR_API std::vector<std::size_t>
longest_increasing_subsequence(std::span<const std::size_t> values);

} // namespace arbor
