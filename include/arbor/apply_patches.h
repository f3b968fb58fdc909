// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file apply_patches.h
/// @brief Reference interpreter for patch sequences.
///
/// apply_patches() rebuilds a tree by applying patches one after another,
/// each path resolved against the result of the previous patch. The input
/// tree is never modified: every patch copies the nodes along its path and
/// shares the rest (immer structural sharing).
///
/// Node lists are flattened before the first patch, matching the child
/// indices the diff engine produced. For any two trees built from the
/// same traits:
/// @code
/// apply_patches(old_tree, diff(old_tree, new_tree)) == flatten_lists(new_tree)
/// @endcode

#pragma once

#include <arbor/errors.h>
#include <arbor/log.h>
#include <arbor/node.h>
#include <arbor/patch.h>
#include <arbor/tree_path.h>

#include <algorithm>
#include <functional>
#include <string>
#include <vector>

namespace arbor {

namespace detail {

template <NodeTraits Traits>
class PatchApplier {
public:
    using node_type      = BasicNode<Traits>;
    using node_box       = BasicNodeBox<Traits>;
    using node_vector    = BasicNodeVector<Traits>;
    using attribute_type = BasicAttribute<Traits>;
    using patch_type     = BasicPatch<Traits>;

    explicit PatchApplier(const patch_type& patch) : patch_(patch) {}

    node_type apply(const node_type& root) const {
        switch (patch_.type) {
        case PatchType::InsertBeforeNode:
        case PatchType::InsertAfterNode:
            return update_parent(root, [&](node_vector children, std::size_t index) {
                const auto at = patch_.type == PatchType::InsertBeforeNode ? index : index + 1;
                return insert_payload(std::move(children), at);
            });
        case PatchType::RemoveNode:
            return update_parent(root, [&](node_vector children, std::size_t index) {
                return children.erase(index);
            });
        case PatchType::MoveBeforeNode:
        case PatchType::MoveAfterNode:
            return update_parent(root, [&](node_vector children, std::size_t index) {
                return move_siblings(std::move(children), index);
            });
        case PatchType::AppendChildren:
            return update_at(root, patch_.path, [&](const node_type& target) {
                check_tag(target);
                if (target.is_leaf()) {
                    fail("cannot append children to a leaf");
                }
                auto children = target.children();
                return target.with_children(insert_payload(children, children.size()));
            });
        case PatchType::ReplaceNode:
            return update_at(root, patch_.path, [&](const node_type& target) {
                check_tag(target);
                if (patch_.nodes.size() != 1 || !patch_.nodes.front()) {
                    fail("replacement must be exactly one node");
                }
                return flatten_lists(*patch_.nodes.front());
            });
        case PatchType::AddAttributes:
            return update_at(root, patch_.path, [&](const node_type& target) {
                check_tag(target);
                return add_attributes(target);
            });
        case PatchType::RemoveAttributes:
            return update_at(root, patch_.path, [&](const node_type& target) {
                check_tag(target);
                return remove_attributes(target);
            });
        case PatchType::ChangeLeaf:
            return update_at(root, patch_.path, [&](const node_type& target) {
                if (!target.is_leaf()) {
                    fail("target is not a leaf");
                }
                if (!patch_.leaf) {
                    fail("missing leaf payload");
                }
                return node_type::leaf(*patch_.leaf);
            });
        }
        fail("unknown patch type");
    }

private:
    [[noreturn]] void fail(const std::string& reason) const {
        detail::log_patch_error(patch_type_name(patch_.type), patch_.path.to_string(), reason);
        throw PatchError(patch_.type, patch_.path, reason);
    }

    void check_tag(const node_type& target) const {
        if (!patch_.tag) {
            return;
        }
        const auto* tag = target.tag();
        if (!tag || !(*tag == *patch_.tag)) {
            fail("node does not carry the expected tag");
        }
    }

    // Rebuild the spine from `node` down to `path`, replacing the node there
    // with fn(node).
    template <typename Fn>
    node_type update_at(const node_type& node, TreePath path, Fn&& fn) const {
        if (path.is_empty()) {
            return fn(node);
        }
        const auto index = path.pluck();
        if (node.is_leaf()) {
            fail("path descends into a leaf");
        }
        auto children = node.children();
        if (*index >= children.size()) {
            fail("child index " + std::to_string(*index) + " out of range (" +
                 std::to_string(children.size()) + " children)");
        }
        auto child = update_at(*children[*index], std::move(path), std::forward<Fn>(fn));
        return node.with_children(children.set(*index, node_box{std::move(child)}));
    }

    // Resolve the parent of patch_.path and hand fn its children together
    // with the last index of the path
    template <typename Fn>
    node_type update_parent(const node_type& root, Fn&& fn) const {
        const auto index = patch_.path.last();
        if (!index) {
            fail("the root has no siblings");
        }
        return update_at(root, patch_.path.backtrack(), [&](const node_type& parent) {
            if (parent.is_leaf()) {
                fail("parent is a leaf");
            }
            auto children = parent.children();
            if (*index >= children.size()) {
                fail("child index " + std::to_string(*index) + " out of range (" +
                     std::to_string(children.size()) + " children)");
            }
            check_tag(*children[*index]);
            return parent.with_children(fn(std::move(children), *index));
        });
    }

    node_vector insert_payload(node_vector children, std::size_t at) const {
        std::vector<const node_type*> flat;
        for (const auto* node : patch_.nodes) {
            if (!node) {
                fail("null node in payload");
            }
            if (const auto* l = node->as_list()) {
                collect_flattened<Traits>(l->nodes, flat);
            } else {
                flat.push_back(node);
            }
        }
        for (const auto* node : flat) {
            children = children.insert(at++, node_box{flatten_lists(*node)});
        }
        return children;
    }

    node_vector move_siblings(node_vector children, std::size_t anchor) const {
        std::vector<std::size_t> sources;
        sources.reserve(patch_.node_paths.size());
        for (const auto& source : patch_.node_paths) {
            if (!(source.backtrack() == patch_.path.backtrack()) || source.is_empty()) {
                fail("source " + source.to_string() + " is not a sibling of the anchor");
            }
            const auto index = *source.last();
            if (index >= children.size() || index == anchor ||
                std::find(sources.begin(), sources.end(), index) != sources.end()) {
                fail("invalid source " + source.to_string());
            }
            sources.push_back(index);
        }

        std::vector<node_box> moved;
        moved.reserve(sources.size());
        for (const auto index : sources) {
            moved.push_back(children[index]);
        }

        auto descending = sources;
        std::sort(descending.begin(), descending.end(), std::greater<>{});
        for (const auto index : descending) {
            children = children.erase(index);
        }

        const auto shift = static_cast<std::size_t>(
            std::count_if(sources.begin(), sources.end(), [&](std::size_t s) { return s < anchor; }));
        auto at = anchor - shift;
        if (patch_.type == PatchType::MoveAfterNode) {
            ++at;
        }
        for (auto& box : moved) {
            children = children.insert(at++, std::move(box));
        }
        return children;
    }

    node_type add_attributes(const node_type& target) const {
        const auto* elem = target.as_element();
        if (!elem) {
            fail("target is not an element");
        }
        auto has_name = [&](const attribute_type& a) {
            return std::any_of(patch_.attributes.begin(), patch_.attributes.end(),
                               [&](const attribute_type* p) { return p->name == a.name; });
        };
        auto t = typename BasicElement<Traits>::attribute_vector{}.transient();
        for (const auto& a : elem->attributes) {
            if (!has_name(a)) {
                t.push_back(a);
            }
        }
        for (const auto* a : patch_.attributes) {
            t.push_back(*a);
        }
        return target.with_attributes(t.persistent());
    }

    node_type remove_attributes(const node_type& target) const {
        const auto* elem = target.as_element();
        if (!elem) {
            fail("target is not an element");
        }
        auto t = typename BasicElement<Traits>::attribute_vector{}.transient();
        for (const auto& a : elem->attributes) {
            const bool removed = std::any_of(patch_.attributes.begin(), patch_.attributes.end(),
                                             [&](const attribute_type* p) { return p->name == a.name; });
            if (!removed) {
                t.push_back(a);
            }
        }
        return target.with_attributes(t.persistent());
    }

    const patch_type& patch_;
};

} // namespace detail

/// Apply `patches` in order to a copy of `root`.
///
/// @throws PatchError when a patch cannot be applied (unresolvable path,
///         wrong node kind, tag mismatch). `root` is left untouched.
template <NodeTraits Traits>
[[nodiscard]] BasicNode<Traits> apply_patches(const BasicNode<Traits>& root,
                                              const std::vector<BasicPatch<Traits>>& patches)
{
    auto current = flatten_lists(root);
    for (const auto& patch : patches) {
        current = detail::PatchApplier<Traits>{patch}.apply(current);
    }
    return current;
}

} // namespace arbor
