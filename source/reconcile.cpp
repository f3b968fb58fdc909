// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <arbor/reconcile.h>
#include <arbor/lis.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace arbor {

namespace {

constexpr std::size_t npos = SiblingEdit::npos;

// Occupancy counts over a fixed coordinate space; prefix(c) is the number
// of occupied coordinates strictly before c, i.e. the current position of
// the sibling sitting at c.
class FenwickTree {
public:
    explicit FenwickTree(std::size_t size) : tree_(size + 1, 0) {}

    void add(std::size_t coord, long delta) {
        for (auto i = coord + 1; i < tree_.size(); i += i & (~i + 1)) {
            tree_[i] += delta;
        }
    }

    std::size_t prefix(std::size_t coord) const {
        long sum = 0;
        for (auto i = coord; i > 0; i -= i & (~i + 1)) {
            sum += tree_[i];
        }
        return static_cast<std::size_t>(sum);
    }

private:
    std::vector<long> tree_;
};

// Coordinate layout. Every old index i owns one block:
//   [ slots for the run placed before i ][ i ][ slots for the run placed after i ]
// Blocks are laid out in old order, so the coordinate order of the occupied
// slots is always the current sibling order.
class SlotLayout {
public:
    SlotLayout(std::vector<std::size_t> before, std::vector<std::size_t> after)
        : before_(std::move(before))
        , after_(std::move(after))
        , base_(before_.size() + 1, 0)
    {
        for (std::size_t i = 0; i < before_.size(); ++i) {
            base_[i + 1] = base_[i] + before_[i] + 1 + after_[i];
        }
    }

    std::size_t size() const { return base_.back(); }
    std::size_t own(std::size_t old_index) const { return base_[old_index] + before_[old_index]; }
    std::size_t before(std::size_t old_index, std::size_t t) const { return base_[old_index] + t; }
    std::size_t after(std::size_t old_index, std::size_t t) const { return own(old_index) + 1 + t; }

private:
    std::vector<std::size_t> before_;
    std::vector<std::size_t> after_;
    std::vector<std::size_t> base_;
};

struct Run
{
    std::size_t anchor_old = npos;
    std::vector<std::size_t> members;  // new indices
};

class ScriptBuilder {
public:
    ScriptBuilder(SiblingScript& script,
                  const std::vector<std::size_t>& new_to_old,
                  const std::vector<std::size_t>& old_to_new,
                  const SlotLayout& layout,
                  FenwickTree& occupied)
        : script_(script)
        , new_to_old_(new_to_old)
        , old_to_new_(old_to_new)
        , layout_(layout)
        , occupied_(occupied)
    {}

    void place_before(const Run& run) {
        std::vector<std::pair<std::size_t, std::size_t>> pending;  // (new index, slot)
        for (std::size_t t = 0; t < run.members.size(); ++t) {
            const auto j = run.members[t];
            const auto slot = layout_.before(run.anchor_old, t);
            if (new_to_old_[j] == npos) {
                pending.emplace_back(j, slot);
                continue;
            }
            insert(SiblingEditKind::InsertBefore, run.anchor_old, pending);
            move(SiblingEditKind::MoveBefore, run.anchor_old, j, slot);
        }
        insert(SiblingEditKind::InsertBefore, run.anchor_old, pending);
    }

    // Each batch goes directly after the anchor, so batches are placed last
    // to first.
    void place_after(const Run& run) {
        std::vector<std::pair<std::size_t, std::size_t>> pending;
        for (auto t = run.members.size(); t > 0; --t) {
            const auto j = run.members[t - 1];
            const auto slot = layout_.after(run.anchor_old, t - 1);
            if (new_to_old_[j] == npos) {
                pending.emplace_back(j, slot);
                continue;
            }
            std::reverse(pending.begin(), pending.end());
            insert(SiblingEditKind::InsertAfter, run.anchor_old, pending);
            move(SiblingEditKind::MoveAfter, run.anchor_old, j, slot);
        }
        std::reverse(pending.begin(), pending.end());
        insert(SiblingEditKind::InsertAfter, run.anchor_old, pending);
    }

private:
    SiblingEdit anchored(SiblingEditKind kind, std::size_t anchor_old) const {
        SiblingEdit edit;
        edit.kind = kind;
        edit.position = occupied_.prefix(layout_.own(anchor_old));
        edit.old_index = anchor_old;
        edit.new_index = old_to_new_[anchor_old];
        return edit;
    }

    void insert(SiblingEditKind kind, std::size_t anchor_old,
                std::vector<std::pair<std::size_t, std::size_t>>& pending) {
        if (pending.empty()) {
            return;
        }
        auto edit = anchored(kind, anchor_old);
        for (const auto& [j, slot] : pending) {
            edit.nodes.push_back(j);
            occupied_.add(slot, 1);
        }
        script_.edits.push_back(std::move(edit));
        pending.clear();
    }

    void move(SiblingEditKind kind, std::size_t anchor_old, std::size_t j, std::size_t slot) {
        const auto from = layout_.own(new_to_old_[j]);
        auto edit = anchored(kind, anchor_old);
        edit.sources.push_back(occupied_.prefix(from));
        edit.nodes.push_back(j);
        occupied_.add(from, -1);
        occupied_.add(slot, 1);
        script_.edits.push_back(std::move(edit));
    }

    SiblingScript& script_;
    const std::vector<std::size_t>& new_to_old_;
    const std::vector<std::size_t>& old_to_new_;
    const SlotLayout& layout_;
    FenwickTree& occupied_;
};

} // namespace

std::size_t SiblingScript::count(SiblingEditKind kind) const noexcept
{
    return static_cast<std::size_t>(
        std::count_if(edits.begin(), edits.end(), [kind](const SiblingEdit& e) { return e.kind == kind; }));
}

std::size_t SiblingScript::move_count() const noexcept
{
    return count(SiblingEditKind::MoveBefore) + count(SiblingEditKind::MoveAfter);
}

SiblingScript reconcile_siblings(std::span<const SiblingMatch> matches, std::size_t old_count)
{
    const auto new_count = matches.size();
    SiblingScript script;

    std::vector<std::size_t> old_to_new(old_count, npos);
    std::vector<std::size_t> matched_new;
    std::vector<std::size_t> matched_old;
    for (std::size_t j = 0; j < new_count; ++j) {
        if (!matches[j].old_index) {
            continue;
        }
        const auto i = *matches[j].old_index;
        if (i >= old_count) {
            throw std::invalid_argument("reconcile_siblings: old index " + std::to_string(i) + " out of range");
        }
        if (old_to_new[i] != npos) {
            throw std::invalid_argument("reconcile_siblings: old index " + std::to_string(i) + " matched twice");
        }
        old_to_new[i] = j;
        matched_new.push_back(j);
        matched_old.push_back(i);
    }

    std::vector<bool> is_stable(new_count, false);
    for (const auto p : longest_increasing_subsequence(matched_old)) {
        is_stable[matched_new[p]] = true;
        script.stable.push_back(matched_new[p]);
    }

    std::vector<std::size_t> new_to_old(new_count, npos);
    for (std::size_t p = 0; p < matched_new.size(); ++p) {
        const auto j = matched_new[p];
        if (is_stable[j] || !matches[j].positional) {
            new_to_old[j] = matched_old[p];
        } else {
            old_to_new[matched_old[p]] = npos;
        }
    }

    // 1. removals, back to front so earlier positions stay valid
    for (auto i = old_count; i > 0; --i) {
        if (old_to_new[i - 1] == npos) {
            SiblingEdit edit;
            edit.kind = SiblingEditKind::Remove;
            edit.position = i - 1;
            edit.old_index = i - 1;
            script.edits.push_back(std::move(edit));
        }
    }

    if (script.stable.empty()) {
        if (new_count > 0) {
            SiblingEdit edit;
            edit.kind = SiblingEditKind::Append;
            for (std::size_t j = 0; j < new_count; ++j) {
                edit.nodes.push_back(j);
            }
            script.edits.push_back(std::move(edit));
        }
        return script;
    }

    // split the new list into runs around the stable children
    std::vector<Run> runs;
    Run current;
    for (std::size_t j = 0; j < new_count; ++j) {
        if (is_stable[j]) {
            current.anchor_old = new_to_old[j];
            runs.push_back(std::move(current));
            current = Run{};
        } else {
            current.members.push_back(j);
        }
    }
    current.anchor_old = new_to_old[script.stable.back()];
    const Run trailing = std::move(current);

    std::vector<std::size_t> before(old_count, 0);
    std::vector<std::size_t> after(old_count, 0);
    for (const auto& run : runs) {
        before[run.anchor_old] = run.members.size();
    }
    after[trailing.anchor_old] = trailing.members.size();

    const SlotLayout layout{std::move(before), std::move(after)};
    FenwickTree occupied{layout.size()};
    for (std::size_t i = 0; i < old_count; ++i) {
        if (old_to_new[i] != npos) {
            occupied.add(layout.own(i), 1);
        }
    }

    // 2. in-place updates of every surviving pair
    for (std::size_t j = 0; j < new_count; ++j) {
        if (new_to_old[j] == npos) {
            continue;
        }
        SiblingEdit edit;
        edit.kind = SiblingEditKind::Update;
        edit.position = occupied.prefix(layout.own(new_to_old[j]));
        edit.old_index = new_to_old[j];
        edit.new_index = j;
        script.edits.push_back(std::move(edit));
    }

    // 3. placement
    ScriptBuilder builder{script, new_to_old, old_to_new, layout, occupied};
    for (const auto& run : runs) {
        builder.place_before(run);
    }
    builder.place_after(trailing);

    return script;
}

} // namespace arbor
