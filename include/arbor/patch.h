// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief One edit operation against a tree, addressed by TreePath.
///
/// Patches borrow their payload (nodes, attributes, leaf, tag) from the
/// trees passed to diff(). Nothing is copied, so both trees must outlive
/// every patch produced from them.
///
/// Field usage per PatchType:
/// ```
///   type               path            node_paths   nodes   attributes  leaf
///   InsertBeforeNode   anchor sibling      -          x         -        -
///   InsertAfterNode    anchor sibling      -          x         -        -
///   AppendChildren     parent              -          x         -        -
///   RemoveNode         target              -          -         -        -
///   ReplaceNode        target              -          x (1)     -        -
///   MoveBeforeNode     anchor sibling      x          -         -        -
///   MoveAfterNode      anchor sibling      x          -         -        -
///   AddAttributes      element             -          -         x        -
///   RemoveAttributes   element             -          -         x        -
///   ChangeLeaf         leaf                -          -         -        x
/// ```
/// `tag` is the tag of the element at `path` when the patch was generated,
/// or nullptr when the node there is not an element.

#pragma once

#include <arbor/node.h>
#include <arbor/patch_type.h>
#include <arbor/tree_path.h>

#include <algorithm>
#include <vector>

namespace arbor {

template <NodeTraits Traits>
struct BasicPatch
{
    using node_type      = BasicNode<Traits>;
    using attribute_type = BasicAttribute<Traits>;
    using tag_type       = typename Traits::tag_type;
    using leaf_type      = typename Traits::leaf_type;

    PatchType type = PatchType::RemoveNode;
    TreePath path;
    const tag_type* tag = nullptr;
    std::vector<TreePath> node_paths;
    std::vector<const node_type*> nodes;
    std::vector<const attribute_type*> attributes;
    const leaf_type* leaf = nullptr;

    // ============================================================
    // Factory functions
    // ============================================================

    static BasicPatch insert_before_node(const tag_type* tag, TreePath path,
                                         std::vector<const node_type*> nodes) {
        return make(PatchType::InsertBeforeNode, tag, std::move(path), std::move(nodes));
    }

    static BasicPatch insert_after_node(const tag_type* tag, TreePath path,
                                        std::vector<const node_type*> nodes) {
        return make(PatchType::InsertAfterNode, tag, std::move(path), std::move(nodes));
    }

    static BasicPatch append_children(const tag_type* tag, TreePath path,
                                      std::vector<const node_type*> nodes) {
        return make(PatchType::AppendChildren, tag, std::move(path), std::move(nodes));
    }

    static BasicPatch remove_node(const tag_type* tag, TreePath path) {
        return make(PatchType::RemoveNode, tag, std::move(path), {});
    }

    static BasicPatch replace_node(const tag_type* tag, TreePath path, const node_type* replacement) {
        return make(PatchType::ReplaceNode, tag, std::move(path), {replacement});
    }

    static BasicPatch move_before_node(const tag_type* tag, TreePath anchor,
                                       std::vector<TreePath> sources) {
        auto p = make(PatchType::MoveBeforeNode, tag, std::move(anchor), {});
        p.node_paths = std::move(sources);
        return p;
    }

    static BasicPatch move_after_node(const tag_type* tag, TreePath anchor,
                                      std::vector<TreePath> sources) {
        auto p = make(PatchType::MoveAfterNode, tag, std::move(anchor), {});
        p.node_paths = std::move(sources);
        return p;
    }

    static BasicPatch add_attributes(const tag_type* tag, TreePath path,
                                     std::vector<const attribute_type*> attrs) {
        auto p = make(PatchType::AddAttributes, tag, std::move(path), {});
        p.attributes = std::move(attrs);
        return p;
    }

    static BasicPatch remove_attributes(const tag_type* tag, TreePath path,
                                        std::vector<const attribute_type*> attrs) {
        auto p = make(PatchType::RemoveAttributes, tag, std::move(path), {});
        p.attributes = std::move(attrs);
        return p;
    }

    static BasicPatch change_leaf(TreePath path, const leaf_type* new_leaf) {
        auto p = make(PatchType::ChangeLeaf, nullptr, std::move(path), {});
        p.leaf = new_leaf;
        return p;
    }

    // ============================================================
    // Queries
    // ============================================================

    bool is_move() const noexcept {
        return type == PatchType::MoveBeforeNode || type == PatchType::MoveAfterNode;
    }

    bool is_insert() const noexcept {
        return type == PatchType::InsertBeforeNode || type == PatchType::InsertAfterNode
            || type == PatchType::AppendChildren;
    }

    /// Every path this patch reads or writes
    std::vector<TreePath> touched_paths() const {
        std::vector<TreePath> result{path};
        result.insert(result.end(), node_paths.begin(), node_paths.end());
        return result;
    }

    /// Patches compare by the values they point to, not by address
    friend bool operator==(const BasicPatch& a, const BasicPatch& b) {
        auto same_ptr_value = [](const auto* x, const auto* y) {
            return x == y || (x && y && *x == *y);
        };
        auto same_ptr_values = [&](const auto& xs, const auto& ys) {
            return std::equal(xs.begin(), xs.end(), ys.begin(), ys.end(), same_ptr_value);
        };
        return a.type == b.type
            && a.path == b.path
            && a.node_paths == b.node_paths
            && same_ptr_value(a.tag, b.tag)
            && same_ptr_value(a.leaf, b.leaf)
            && same_ptr_values(a.nodes, b.nodes)
            && same_ptr_values(a.attributes, b.attributes);
    }

private:
    static BasicPatch make(PatchType type, const tag_type* tag, TreePath path,
                           std::vector<const node_type*> nodes) {
        BasicPatch p;
        p.type = type;
        p.tag = tag;
        p.path = std::move(path);
        p.nodes = std::move(nodes);
        return p;
    }
};

} // namespace arbor
