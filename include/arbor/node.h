// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file node.h
/// @brief Immutable tree nodes: elements, leaves and node lists.
///
/// A tree is built from BasicNode values. A node is one of
///   - an Element: optional namespace, tag, attributes, children, optional
///     key and the skip / replace / self_closing hints,
///   - a Leaf: an opaque payload compared by value (text, comment, ...),
///   - a NodeList: a sequence of nodes without a wrapper of its own.
///
/// All component types are supplied through a traits bundle (see
/// arbor::NodeTraits in concepts.h). Children and attribute storage use
/// immer containers, so copying a node is O(1) and subtrees are shared
/// structurally between versions of a tree.

#pragma once

#include <arbor/arbor_config.h>
#include <arbor/api.h>
#include <arbor/concepts.h>

#include <immer/box.hpp>
#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace arbor {

// ============================================================
// Memory Policy Definitions
// ============================================================

/// Single-threaded memory policy: non-atomic refcount + no locks
using unsafe_memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

/// Thread-safe memory policy: atomic refcount + spinlock.
/// Spelled out because IMMER_NO_THREAD_SAFETY makes immer's default policy
/// single-threaded.
using thread_safe_memory_policy = immer::memory_policy<
    immer::free_list_heap_policy<immer::cpp_heap>,
    immer::refcount_policy,
    immer::spinlock_policy
>;

// ============================================================
// Forward declarations and container aliases
// ============================================================

template <NodeTraits Traits>
struct BasicNode;

template <NodeTraits Traits>
using BasicNodeBox = immer::box<BasicNode<Traits>, typename Traits::memory_policy>;

template <NodeTraits Traits>
using BasicNodeVector = immer::flex_vector<BasicNodeBox<Traits>, typename Traits::memory_policy>;

// ============================================================
// BasicAttribute
// ============================================================

/// A named attribute carrying one or more values.
///
/// Several attributes with the same name may appear on one element
/// (e.g. repeated `class` or `style` declarations). The diff engine treats
/// all attributes of a name as one logical attribute whose values are the
/// concatenation of every occurrence, in order.
template <NodeTraits Traits>
struct BasicAttribute
{
    using memory_policy  = typename Traits::memory_policy;
    using namespace_type = typename Traits::namespace_type;
    using name_type      = typename Traits::attribute_name_type;
    using value_type     = typename Traits::attribute_value_type;
    using value_vector   = immer::vector<value_type, memory_policy>;

    std::optional<namespace_type> ns;
    name_type name;
    value_vector values;

    BasicAttribute(name_type n, value_type v)
        : name(std::move(n))
        , values(value_vector{}.push_back(std::move(v)))
    {}

    BasicAttribute(std::optional<namespace_type> n_s, name_type n, value_vector vs)
        : ns(std::move(n_s))
        , name(std::move(n))
        , values(std::move(vs))
    {}

    static BasicAttribute with_values(name_type n, std::initializer_list<value_type> vs) {
        auto t = value_vector{}.transient();
        for (const auto& v : vs) {
            t.push_back(v);
        }
        return BasicAttribute{std::nullopt, std::move(n), t.persistent()};
    }

    static BasicAttribute with_namespace(namespace_type n_s, name_type n, value_type v) {
        return BasicAttribute{std::move(n_s), std::move(n), value_vector{}.push_back(std::move(v))};
    }

    bool operator==(const BasicAttribute&) const = default;
};

// ============================================================
// BasicElement / BasicNodeList
// ============================================================

template <NodeTraits Traits>
struct BasicElement
{
    using memory_policy    = typename Traits::memory_policy;
    using namespace_type   = typename Traits::namespace_type;
    using tag_type         = typename Traits::tag_type;
    using key_type         = typename Traits::key_type;
    using attribute_type   = BasicAttribute<Traits>;
    using attribute_vector = immer::vector<attribute_type, memory_policy>;
    using node_vector      = BasicNodeVector<Traits>;

    std::optional<namespace_type> ns;
    tag_type tag;
    attribute_vector attributes;
    node_vector children;
    std::optional<key_type> key;

    /// Diff hint: never descend into or patch this subtree
    bool skip = false;
    /// Diff hint: always replace this subtree wholesale when it differs
    bool replace = false;
    bool self_closing = false;
};

template <NodeTraits Traits>
struct BasicNodeList
{
    using node_vector = BasicNodeVector<Traits>;

    node_vector nodes;
};

// ============================================================
// BasicNode
// ============================================================

template <NodeTraits Traits>
struct BasicNode
{
    using traits_type          = Traits;
    using memory_policy        = typename Traits::memory_policy;
    using namespace_type       = typename Traits::namespace_type;
    using tag_type             = typename Traits::tag_type;
    using leaf_type            = typename Traits::leaf_type;
    using key_type             = typename Traits::key_type;
    using attribute_name_type  = typename Traits::attribute_name_type;
    using attribute_value_type = typename Traits::attribute_value_type;
    using attribute_type       = BasicAttribute<Traits>;
    using attribute_vector     = typename BasicElement<Traits>::attribute_vector;
    using element_type         = BasicElement<Traits>;
    using node_list_type       = BasicNodeList<Traits>;
    using node_box             = BasicNodeBox<Traits>;
    using node_vector          = BasicNodeVector<Traits>;

    std::variant<element_type, leaf_type, node_list_type> data;

    BasicNode(element_type e) : data(std::in_place_index<0>, std::move(e)) {}
    BasicNode(node_list_type l) : data(std::in_place_index<2>, std::move(l)) {}

    // ============================================================
    // Factory functions
    // ============================================================

    static BasicNode element(tag_type tag,
                             std::vector<attribute_type> attrs = {},
                             std::vector<BasicNode> children = {}) {
        return element_ns(std::nullopt, std::move(tag), std::move(attrs), std::move(children));
    }

    static BasicNode element_ns(std::optional<namespace_type> ns,
                                tag_type tag,
                                std::vector<attribute_type> attrs = {},
                                std::vector<BasicNode> children = {}) {
        auto attr_t = attribute_vector{}.transient();
        for (auto& a : attrs) {
            attr_t.push_back(std::move(a));
        }
        element_type e{std::move(ns), std::move(tag), attr_t.persistent(), make_children(std::move(children)), std::nullopt};
        return BasicNode{std::move(e)};
    }

    static BasicNode leaf(leaf_type v) {
        BasicNode n{node_list_type{}};
        n.data.template emplace<1>(std::move(v));
        return n;
    }

    static BasicNode list(std::vector<BasicNode> nodes) {
        return BasicNode{node_list_type{make_children(std::move(nodes))}};
    }

    static node_vector make_children(std::vector<BasicNode> nodes) {
        auto t = node_vector{}.transient();
        for (auto& n : nodes) {
            t.push_back(node_box{std::move(n)});
        }
        return t.persistent();
    }

    // ============================================================
    // Modifiers (return a modified copy; non-elements are returned as-is
    // unless the modifier also applies to node lists)
    // ============================================================

    BasicNode with_key(key_type k) const {
        return update_element([&](element_type& e) { e.key = std::move(k); });
    }

    BasicNode with_skip(bool v = true) const {
        return update_element([&](element_type& e) { e.skip = v; });
    }

    BasicNode with_replace(bool v = true) const {
        return update_element([&](element_type& e) { e.replace = v; });
    }

    BasicNode with_self_closing(bool v = true) const {
        return update_element([&](element_type& e) { e.self_closing = v; });
    }

    BasicNode with_attributes(attribute_vector attrs) const {
        return update_element([&](element_type& e) { e.attributes = std::move(attrs); });
    }

    /// Append attributes after the existing ones
    BasicNode add_attributes(std::vector<attribute_type> attrs) const {
        return update_element([&](element_type& e) {
            auto t = e.attributes.transient();
            for (auto& a : attrs) {
                t.push_back(std::move(a));
            }
            e.attributes = t.persistent();
        });
    }

    /// Replace the children of an element or the members of a node list
    BasicNode with_children(node_vector children) const {
        if (const auto* e = std::get_if<element_type>(&data)) {
            auto copy = *e;
            copy.children = std::move(children);
            return BasicNode{std::move(copy)};
        }
        if (std::holds_alternative<node_list_type>(data)) {
            return BasicNode{node_list_type{std::move(children)}};
        }
        return *this;
    }

    /// Append children to an element or members to a node list
    BasicNode add_children(std::vector<BasicNode> nodes) const {
        auto t = children().transient();
        for (auto& n : nodes) {
            t.push_back(node_box{std::move(n)});
        }
        return with_children(t.persistent());
    }

    // ============================================================
    // Type checking and access
    // ============================================================

    bool is_element() const noexcept { return data.index() == 0; }
    bool is_leaf() const noexcept { return data.index() == 1; }
    bool is_list() const noexcept { return data.index() == 2; }

    const element_type* as_element() const noexcept { return std::get_if<0>(&data); }
    const leaf_type* as_leaf() const noexcept { return std::get_if<1>(&data); }
    const node_list_type* as_list() const noexcept { return std::get_if<2>(&data); }

    const tag_type* tag() const noexcept {
        const auto* e = as_element();
        return e ? &e->tag : nullptr;
    }

    const namespace_type* ns() const noexcept {
        const auto* e = as_element();
        return (e && e->ns) ? &*e->ns : nullptr;
    }

    const key_type* key() const noexcept {
        const auto* e = as_element();
        return (e && e->key) ? &*e->key : nullptr;
    }

    bool is_skip() const noexcept {
        const auto* e = as_element();
        return e && e->skip;
    }

    bool is_replace() const noexcept {
        const auto* e = as_element();
        return e && e->replace;
    }

    bool is_self_closing() const noexcept {
        const auto* e = as_element();
        return e && e->self_closing;
    }

    /// Attributes of an element; empty for leaves and node lists
    attribute_vector attributes() const {
        const auto* e = as_element();
        return e ? e->attributes : attribute_vector{};
    }

    /// Children of an element or members of a node list; empty for leaves
    node_vector children() const {
        if (const auto* e = as_element()) {
            return e->children;
        }
        if (const auto* l = as_list()) {
            return l->nodes;
        }
        return node_vector{};
    }

    /// Values of every attribute named `name`, concatenated in order
    std::vector<attribute_value_type> attribute_values(const attribute_name_type& name) const {
        std::vector<attribute_value_type> result;
        if (const auto* e = as_element()) {
            for (const auto& a : e->attributes) {
                if (a.name == name) {
                    result.insert(result.end(), a.values.begin(), a.values.end());
                }
            }
        }
        return result;
    }

    // ============================================================
    // Counting
    // ============================================================

    /// Number of nodes below this one. Node list wrappers are not counted.
    std::size_t descendant_node_count() const {
        std::size_t count = 0;
        for (const auto& child : children()) {
            count += child->node_count();
        }
        return count;
    }

    /// Number of nodes in this subtree including this node. A node list
    /// counts only its members.
    std::size_t node_count() const {
        return descendant_node_count() + (is_list() ? 0 : 1);
    }

private:
    template <typename Fn>
    BasicNode update_element(Fn&& fn) const {
        if (const auto* e = as_element()) {
            auto copy = *e;
            std::forward<Fn>(fn)(copy);
            return BasicNode{std::move(copy)};
        }
        return *this;
    }
};

// ============================================================
// Attribute grouping
// ============================================================

/// All attributes of one name, in order of appearance
template <NodeTraits Traits>
struct BasicAttributeGroup
{
    const typename Traits::attribute_name_type* name = nullptr;
    std::vector<const BasicAttribute<Traits>*> attributes;
};

/// Group attributes by name, keeping the order in which names first appear
template <NodeTraits Traits>
std::vector<BasicAttributeGroup<Traits>>
group_attributes_per_name(const typename BasicElement<Traits>::attribute_vector& attrs)
{
    std::vector<BasicAttributeGroup<Traits>> groups;
    for (const auto& a : attrs) {
        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const auto& g) { return *g.name == a.name; });
        if (it == groups.end()) {
            groups.push_back(BasicAttributeGroup<Traits>{&a.name, {&a}});
        } else {
            it->attributes.push_back(&a);
        }
    }
    return groups;
}

/// Collapse a group into one attribute: the namespace of the first
/// occurrence and every value in order
template <NodeTraits Traits>
BasicAttribute<Traits> merge_attribute_group(const BasicAttributeGroup<Traits>& group)
{
    using value_vector = typename BasicAttribute<Traits>::value_vector;
    auto t = value_vector{}.transient();
    for (const auto* a : group.attributes) {
        for (const auto& v : a->values) {
            t.push_back(v);
        }
    }
    return BasicAttribute<Traits>{group.attributes.front()->ns, *group.name, t.persistent()};
}

/// Merge every run of same-named attributes into one attribute per name
template <NodeTraits Traits>
typename BasicElement<Traits>::attribute_vector
merge_attributes_of_same_name(const typename BasicElement<Traits>::attribute_vector& attrs)
{
    auto t = typename BasicElement<Traits>::attribute_vector{}.transient();
    for (const auto& group : group_attributes_per_name<Traits>(attrs)) {
        t.push_back(merge_attribute_group(group));
    }
    return t.persistent();
}

template <NodeTraits Traits>
bool attribute_groups_equal(const BasicAttributeGroup<Traits>& a, const BasicAttributeGroup<Traits>& b)
{
    if (!(*a.name == *b.name) || !(a.attributes.front()->ns == b.attributes.front()->ns)) {
        return false;
    }
    auto values_of = [](const BasicAttributeGroup<Traits>& g) {
        std::vector<const typename Traits::attribute_value_type*> out;
        for (const auto* attr : g.attributes) {
            for (const auto& v : attr->values) {
                out.push_back(&v);
            }
        }
        return out;
    };
    const auto va = values_of(a);
    const auto vb = values_of(b);
    return std::equal(va.begin(), va.end(), vb.begin(), vb.end(),
                      [](const auto* x, const auto* y) { return *x == *y; });
}

/// Attribute sets compare per name: order of names does not matter, the
/// merged values of each name do
template <NodeTraits Traits>
bool attributes_equivalent(const typename BasicElement<Traits>::attribute_vector& a,
                           const typename BasicElement<Traits>::attribute_vector& b)
{
    const auto ga = group_attributes_per_name<Traits>(a);
    const auto gb = group_attributes_per_name<Traits>(b);
    if (ga.size() != gb.size()) {
        return false;
    }
    for (const auto& group : ga) {
        auto it = std::find_if(gb.begin(), gb.end(),
                               [&](const auto& other) { return *other.name == *group.name; });
        if (it == gb.end() || !attribute_groups_equal(group, *it)) {
            return false;
        }
    }
    return true;
}

// ============================================================
// Equality
// ============================================================

/// Elements compare by namespace, tag, key, self_closing, attributes and
/// children. The skip and replace hints do not take part.
template <NodeTraits Traits>
bool operator==(const BasicElement<Traits>& a, const BasicElement<Traits>& b)
{
    return a.tag == b.tag
        && a.ns == b.ns
        && a.key == b.key
        && a.self_closing == b.self_closing
        && attributes_equivalent<Traits>(a.attributes, b.attributes)
        && a.children == b.children;
}

template <NodeTraits Traits>
bool operator==(const BasicNodeList<Traits>& a, const BasicNodeList<Traits>& b)
{
    return a.nodes == b.nodes;
}

template <NodeTraits Traits>
bool operator==(const BasicNode<Traits>& a, const BasicNode<Traits>& b)
{
    return a.data == b.data;
}

// ============================================================
// Node list flattening
// ============================================================

/// Append `children` to `out` with every nested node list expanded in place
template <NodeTraits Traits>
void collect_flattened(const BasicNodeVector<Traits>& children,
                       std::vector<const BasicNode<Traits>*>& out)
{
    for (const auto& child : children) {
        if (const auto* l = child->as_list()) {
            collect_flattened<Traits>(l->nodes, out);
        } else {
            out.push_back(&child.get());
        }
    }
}

template <NodeTraits Traits>
BasicNode<Traits> flatten_lists(const BasicNode<Traits>& node);

/// Children with nested node lists expanded, recursively through the subtree
template <NodeTraits Traits>
BasicNodeVector<Traits> flatten_children(const BasicNodeVector<Traits>& children)
{
    std::vector<const BasicNode<Traits>*> flat;
    collect_flattened<Traits>(children, flat);
    auto t = BasicNodeVector<Traits>{}.transient();
    for (const auto* child : flat) {
        t.push_back(BasicNodeBox<Traits>{flatten_lists(*child)});
    }
    return t.persistent();
}

/// The tree as the diff engine and patch applier see it: node lists below
/// the given node are spliced into their parents. A node list at the top
/// stays a node list, with its own nested lists spliced into it.
template <NodeTraits Traits>
BasicNode<Traits> flatten_lists(const BasicNode<Traits>& node)
{
    if (node.is_leaf()) {
        return node;
    }
    return node.with_children(flatten_children<Traits>(node.children()));
}

} // namespace arbor
