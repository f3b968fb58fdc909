// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file reconcile.h
/// @brief Edit script for one keyed sibling list.
///
/// reconcile_siblings() works on indices only. It is told which new child
/// matches which old child and returns the ordered list of sibling edits
/// (removals, in-place updates, moves, insertions) that turns the old list
/// into the new one. The diff engine maps each edit onto a Patch.
///
/// Every `position` in the script is the index of a sibling in the list as
/// it stands after all earlier edits of the same script were applied, so
/// the resulting patches can be applied strictly in order.
///
/// Emission order:
///   1. Remove for every unmatched old child, highest position first.
///   2. Update for every matched pair, in new order.
///   3. Placement of the children that are not part of the longest
///      increasing subsequence (the stable children), run by run in new
///      order. A run ahead of a stable child is placed with MoveBefore /
///      InsertBefore anchored at that child. The run after the last stable
///      child is placed with MoveAfter / InsertAfter anchored at it,
///      last batch first.
///   4. If no child is stable, a single Append carrying the whole new list.

#pragma once

#include <arbor/api.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace arbor {

/// Which old child (if any) a new child was paired with
struct SiblingMatch
{
    std::optional<std::size_t> old_index;
    /// Paired by position among unkeyed siblings rather than by key.
    /// Such a pair is never moved: outside the stable set it is dropped
    /// and the new child is inserted afresh.
    bool positional = false;
};

enum class SiblingEditKind : std::uint8_t {
    Remove,
    Update,
    MoveBefore,
    MoveAfter,
    InsertBefore,
    InsertAfter,
    Append,
};

struct SiblingEdit
{
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    SiblingEditKind kind = SiblingEditKind::Append;

    /// Current position of the target (Remove, Update) or of the anchor
    /// (Move*, Insert*). Unused for Append.
    std::size_t position = 0;

    /// Old index of the target (Remove, Update) or of the anchor
    std::size_t old_index = npos;

    /// New index of the target (Update) or of the anchor (Move*, Insert*)
    std::size_t new_index = npos;

    /// Move*: current positions of the moved siblings
    std::vector<std::size_t> sources;

    /// Move*, Insert*, Append: new indices of the placed children, in order
    std::vector<std::size_t> nodes;
};

struct ARBOR_API SiblingScript
{
    std::vector<SiblingEdit> edits;

    /// New indices of the children kept in place, ascending
    std::vector<std::size_t> stable;

    [[nodiscard]] std::size_t count(SiblingEditKind kind) const noexcept;
    [[nodiscard]] std::size_t move_count() const noexcept;
};

/// Compute the edit script for a sibling list.
///
/// @param matches    one entry per new child
/// @param old_count  number of old children
/// @throws std::invalid_argument if an old index is out of range or is
///         matched by more than one new child
[[nodiscard]] ARBOR_API SiblingScript
reconcile_siblings(std::span<const SiblingMatch> matches, std::size_t old_count);

} // namespace arbor
