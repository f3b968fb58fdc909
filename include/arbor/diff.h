// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff.h
/// @brief Structural diff of two trees into an ordered patch sequence.
///
/// Usage:
/// @code
/// auto patches = arbor::diff(old_tree, new_tree);
/// auto rebuilt = arbor::apply_patches(old_tree, patches);
/// // rebuilt == arbor::flatten_lists(new_tree)
/// @endcode
///
/// Patches borrow from both trees; keep them alive while the patches are
/// in use. Paths are valid only when the patches are applied in order.

#pragma once

#include <arbor/log.h>
#include <arbor/node.h>
#include <arbor/patch.h>
#include <arbor/reconcile.h>
#include <arbor/tree_path.h>

#include <tsl/robin_map.h>

#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

namespace arbor {

// ============================================================
// DiffOptions
// ============================================================

/// Extra skip / replace decisions on top of the per-node flags
template <NodeTraits Traits>
struct DiffOptions
{
    using node_type = BasicNode<Traits>;
    using predicate = std::function<bool(const node_type&, const node_type&)>;

    /// Return true to treat the (old, new) pair as unchanged without looking inside
    predicate skip;
    /// Return true to replace the old node wholesale instead of patching it
    predicate replace;
};

/// True when the pair must not be inspected: either side carries the skip
/// flag or the skip predicate says so.
template <NodeTraits Traits>
bool should_skip(const BasicNode<Traits>& old_node,
                 const BasicNode<Traits>& new_node,
                 const DiffOptions<Traits>& options = {})
{
    if (old_node.is_skip() || new_node.is_skip()) {
        return true;
    }
    return options.skip && options.skip(old_node, new_node);
}

/// True when the old node cannot be patched into the new one in place:
/// the node kinds differ, or for elements the tag, namespace, key or
/// self_closing differ, or either side carries the replace flag. The
/// replace predicate of `options` can force further replacements.
template <NodeTraits Traits>
bool should_replace(const BasicNode<Traits>& old_node,
                    const BasicNode<Traits>& new_node,
                    const DiffOptions<Traits>& options = {})
{
    if (old_node.data.index() != new_node.data.index()) {
        return true;
    }
    if (options.replace && options.replace(old_node, new_node)) {
        return true;
    }
    const auto* old_elem = old_node.as_element();
    const auto* new_elem = new_node.as_element();
    if (!old_elem) {
        return false;
    }
    return old_elem->replace
        || new_elem->replace
        || !(old_elem->tag == new_elem->tag)
        || !(old_elem->ns == new_elem->ns)
        || !(old_elem->key == new_elem->key)
        || old_elem->self_closing != new_elem->self_closing;
}

// ============================================================
// BasicPatchCollector - walks two trees in lock-step and records patches
// ============================================================

template <NodeTraits Traits>
class BasicPatchCollector {
public:
    using node_type      = BasicNode<Traits>;
    using element_type   = BasicElement<Traits>;
    using attribute_type = BasicAttribute<Traits>;
    using patch_type     = BasicPatch<Traits>;
    using options_type   = DiffOptions<Traits>;
    using key_type       = typename Traits::key_type;
    using tag_type       = typename Traits::tag_type;

    BasicPatchCollector() = default;
    explicit BasicPatchCollector(options_type options) : options_(std::move(options)) {}

    void diff(const node_type& old_node, const node_type& new_node) {
        patches_.clear();
        TreePath root;
        root.reserve(16);
        diff_node(old_node, new_node, root);
    }

    [[nodiscard]] const std::vector<patch_type>& get_patches() const { return patches_; }
    [[nodiscard]] std::vector<patch_type> take_patches() { return std::move(patches_); }
    [[nodiscard]] bool has_changes() const { return !patches_.empty(); }
    void clear() { patches_.clear(); }

private:
    using node_ptrs = std::vector<const node_type*>;

    void diff_node(const node_type& old_node, const node_type& new_node, TreePath& path) {
        if (&old_node == &new_node) [[unlikely]] {
            return;
        }
        if (should_skip(old_node, new_node, options_)) {
            return;
        }
        if (old_node == new_node) {
            return;
        }
        if (should_replace(old_node, new_node, options_)) {
            patches_.push_back(patch_type::replace_node(old_node.tag(), path, &new_node));
            return;
        }
        if (const auto* new_leaf = new_node.as_leaf()) {
            patches_.push_back(patch_type::change_leaf(path, new_leaf));
            return;
        }
        if (const auto* old_elem = old_node.as_element()) {
            diff_attributes(*old_elem, *new_node.as_element(), path);
        }
        diff_children(old_node, new_node, path);
    }

    // One AddAttributes for every name that is new or whose merged values
    // changed, then one RemoveAttributes for the names that disappeared.
    void diff_attributes(const element_type& old_elem, const element_type& new_elem, const TreePath& path) {
        const auto old_groups = group_attributes_per_name<Traits>(old_elem.attributes);
        const auto new_groups = group_attributes_per_name<Traits>(new_elem.attributes);

        auto find_group = [](const auto& groups, const auto& name) {
            return std::find_if(groups.begin(), groups.end(),
                                [&](const auto& g) { return *g.name == name; });
        };

        std::vector<const attribute_type*> added;
        for (const auto& group : new_groups) {
            auto it = find_group(old_groups, *group.name);
            if (it == old_groups.end() || !attribute_groups_equal(*it, group)) {
                added.insert(added.end(), group.attributes.begin(), group.attributes.end());
            }
        }

        std::vector<const attribute_type*> removed;
        for (const auto& group : old_groups) {
            if (find_group(new_groups, *group.name) == new_groups.end()) {
                removed.insert(removed.end(), group.attributes.begin(), group.attributes.end());
            }
        }

        if (!added.empty()) {
            patches_.push_back(patch_type::add_attributes(&old_elem.tag, path, std::move(added)));
        }
        if (!removed.empty()) {
            patches_.push_back(patch_type::remove_attributes(&old_elem.tag, path, std::move(removed)));
        }
    }

    static node_ptrs flattened_children(const node_type& node) {
        node_ptrs result;
        if (const auto* e = node.as_element()) {
            collect_flattened<Traits>(e->children, result);
        } else if (const auto* l = node.as_list()) {
            collect_flattened<Traits>(l->nodes, result);
        }
        return result;
    }

    void diff_children(const node_type& old_parent, const node_type& new_parent, TreePath& path) {
        const auto old_children = flattened_children(old_parent);
        const auto new_children = flattened_children(new_parent);

        auto has_key = [](const node_type* n) { return n->key() != nullptr; };
        if (std::any_of(old_children.begin(), old_children.end(), has_key)
            || std::any_of(new_children.begin(), new_children.end(), has_key)) {
            diff_keyed_children(old_parent, old_children, new_children, path);
        } else {
            diff_positional_children(old_parent, old_children, new_children, path);
        }
    }

    void diff_positional_children(const node_type& old_parent,
                                  const node_ptrs& old_children,
                                  const node_ptrs& new_children,
                                  TreePath& path) {
        const auto common = std::min(old_children.size(), new_children.size());
        for (std::size_t i = 0; i < common; ++i) {
            path.push_back(i);
            diff_node(*old_children[i], *new_children[i], path);
            path.pop_back();
        }

        if (new_children.size() > common) {
            patches_.push_back(patch_type::append_children(
                old_parent.tag(), path, node_ptrs(new_children.begin() + common, new_children.end())));
        }

        for (auto i = old_children.size(); i > common; --i) {
            patches_.push_back(patch_type::remove_node(old_children[i - 1]->tag(), path.traverse(i - 1)));
        }
    }

    void diff_keyed_children(const node_type& old_parent,
                             const node_ptrs& old_children,
                             const node_ptrs& new_children,
                             TreePath& path) {
        tsl::robin_map<key_type, std::size_t> old_keys;
        std::vector<std::size_t> old_unkeyed;
        old_keys.reserve(old_children.size());
        for (std::size_t i = 0; i < old_children.size(); ++i) {
            const auto* key = old_children[i]->key();
            if (!key) {
                old_unkeyed.push_back(i);
            } else if (!old_keys.try_emplace(*key, i).second) {
                detail::log_key_warning("diff", path, i,
                                        "repeats the key of an earlier old sibling and stays unmatched");
            }
        }

        tsl::robin_map<key_type, std::size_t> new_keys;
        new_keys.reserve(new_children.size());
        std::vector<SiblingMatch> matches(new_children.size());
        std::size_t next_unkeyed = 0;
        for (std::size_t j = 0; j < new_children.size(); ++j) {
            const auto* key = new_children[j]->key();
            if (!key) {
                if (next_unkeyed < old_unkeyed.size()) {
                    matches[j].old_index = old_unkeyed[next_unkeyed++];
                    matches[j].positional = true;
                }
                continue;
            }
            if (!new_keys.try_emplace(*key, j).second) {
                detail::log_key_warning("diff", path, j,
                                        "repeats the key of an earlier new sibling and is inserted afresh");
                continue;
            }
            if (auto it = old_keys.find(*key); it != old_keys.end()) {
                matches[j].old_index = it->second;
            }
        }

        const auto script = reconcile_siblings(matches, old_children.size());

        auto collect_nodes = [&](const SiblingEdit& edit) {
            node_ptrs nodes;
            nodes.reserve(edit.nodes.size());
            for (const auto j : edit.nodes) {
                nodes.push_back(new_children[j]);
            }
            return nodes;
        };
        auto collect_sources = [&](const SiblingEdit& edit) {
            std::vector<TreePath> sources;
            sources.reserve(edit.sources.size());
            for (const auto s : edit.sources) {
                sources.push_back(path.traverse(s));
            }
            return sources;
        };

        for (const auto& edit : script.edits) {
            switch (edit.kind) {
            case SiblingEditKind::Remove:
                patches_.push_back(patch_type::remove_node(old_children[edit.old_index]->tag(),
                                                           path.traverse(edit.position)));
                break;
            case SiblingEditKind::Update:
                path.push_back(edit.position);
                diff_node(*old_children[edit.old_index], *new_children[edit.new_index], path);
                path.pop_back();
                break;
            case SiblingEditKind::MoveBefore:
                patches_.push_back(patch_type::move_before_node(
                    anchor_tag(edit, old_children, new_children), path.traverse(edit.position), collect_sources(edit)));
                break;
            case SiblingEditKind::MoveAfter:
                patches_.push_back(patch_type::move_after_node(
                    anchor_tag(edit, old_children, new_children), path.traverse(edit.position), collect_sources(edit)));
                break;
            case SiblingEditKind::InsertBefore:
                patches_.push_back(patch_type::insert_before_node(
                    anchor_tag(edit, old_children, new_children), path.traverse(edit.position), collect_nodes(edit)));
                break;
            case SiblingEditKind::InsertAfter:
                patches_.push_back(patch_type::insert_after_node(
                    anchor_tag(edit, old_children, new_children), path.traverse(edit.position), collect_nodes(edit)));
                break;
            case SiblingEditKind::Append:
                patches_.push_back(patch_type::append_children(old_parent.tag(), path, collect_nodes(edit)));
                break;
            }
        }
    }

    // Tag of the anchor as it stands once its own update ran: the new node
    // if the update replaced it, the old node otherwise.
    const tag_type* anchor_tag(const SiblingEdit& edit,
                               const node_ptrs& old_children,
                               const node_ptrs& new_children) const {
        const auto& old_anchor = *old_children[edit.old_index];
        const auto& new_anchor = *new_children[edit.new_index];
        if (!should_skip(old_anchor, new_anchor, options_) && should_replace(old_anchor, new_anchor, options_)) {
            return new_anchor.tag();
        }
        return old_anchor.tag();
    }

    options_type options_;
    std::vector<patch_type> patches_;
};

// ============================================================
// Free functions
// ============================================================

/// Patches that turn `old_node` into `new_node`, rooted at the empty path
template <NodeTraits Traits>
[[nodiscard]] std::vector<BasicPatch<Traits>> diff(const BasicNode<Traits>& old_node,
                                                   const BasicNode<Traits>& new_node)
{
    BasicPatchCollector<Traits> collector;
    collector.diff(old_node, new_node);
    return collector.take_patches();
}

/// Same as diff(), consulting the skip / replace predicates of `options`
template <NodeTraits Traits>
[[nodiscard]] std::vector<BasicPatch<Traits>> diff_with_options(const BasicNode<Traits>& old_node,
                                                                const BasicNode<Traits>& new_node,
                                                                DiffOptions<Traits> options)
{
    BasicPatchCollector<Traits> collector{std::move(options)};
    collector.diff(old_node, new_node);
    return collector.take_patches();
}

} // namespace arbor
