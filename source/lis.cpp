// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <arbor/lis.h>

#include <algorithm>

namespace arbor {

std::vector<std::size_t> longest_increasing_subsequence(std::span<const std::size_t> values)
{
    constexpr auto npos = static_cast<std::size_t>(-1);

    // tails[k]: position of the smallest value ending an increasing run of length k+1
    std::vector<std::size_t> tails;
    std::vector<std::size_t> predecessor(values.size(), npos);
    tails.reserve(values.size());

    for (std::size_t i = 0; i < values.size(); ++i) {
        auto it = std::lower_bound(tails.begin(), tails.end(), values[i],
                                   [&](std::size_t pos, std::size_t v) { return values[pos] < v; });
        if (it != tails.begin()) {
            predecessor[i] = *(it - 1);
        }
        if (it == tails.end()) {
            tails.push_back(i);
        } else {
            *it = i;
        }
    }

    std::vector<std::size_t> result(tails.size());
    auto pos = tails.empty() ? npos : tails.back();
    for (auto k = result.size(); k > 0; --k) {
        result[k - 1] = pos;
        pos = predecessor[pos];
    }
    return result;
}

} // namespace arbor
