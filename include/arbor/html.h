// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file html.h
/// @brief Ready-made instantiation for HTML-like documents.
///
/// Namespaces, tags, attribute names, attribute values and keys are all
/// std::string; a leaf is either a Text or a Comment.
///
/// @code
/// using namespace arbor::html;
/// auto old_list = element("ul", {attr("class", "todo")}, {
///     element("li", {}, {text("a")}).with_key("1"),
///     element("li", {}, {text("b")}).with_key("2"),
/// });
/// print_patches(arbor::diff(old_list, new_list));
/// @endcode

#pragma once

#include <arbor/api.h>
#include <arbor/diff.h>
#include <arbor/node.h>
#include <arbor/patch.h>

#include <string>
#include <variant>
#include <vector>

namespace arbor::html {

struct Text
{
    std::string content;

    bool operator==(const Text&) const = default;
};

struct Comment
{
    std::string content;

    bool operator==(const Comment&) const = default;
};

using Leaf = std::variant<Text, Comment>;

struct Traits
{
    using memory_policy        = unsafe_memory_policy;
    using namespace_type       = std::string;
    using tag_type             = std::string;
    using leaf_type            = Leaf;
    using attribute_name_type  = std::string;
    using attribute_value_type = std::string;
    using key_type             = std::string;
};

using Node           = BasicNode<Traits>;
using Element        = BasicElement<Traits>;
using NodeList       = BasicNodeList<Traits>;
using Attribute      = BasicAttribute<Traits>;
using Patch          = BasicPatch<Traits>;
using Options        = DiffOptions<Traits>;
using PatchCollector = BasicPatchCollector<Traits>;

// ============================================================
// Construction
// ============================================================

ARBOR_API Node text(std::string content);
ARBOR_API Node comment(std::string content);
ARBOR_API Attribute attr(std::string name, std::string value);
ARBOR_API Node element(std::string tag, std::vector<Attribute> attrs = {}, std::vector<Node> children = {});

/// Several sibling nodes without a wrapping element
ARBOR_API Node fragment(std::vector<Node> nodes);

// ============================================================
// Rendering and debugging
// ============================================================

/// Markup for a subtree. Attributes of the same name are merged into one,
/// values separated by a space.
ARBOR_API std::string to_html(const Node& node);

/// One-line description, e.g. `MoveBeforeNode [0] <li> from [1]`
ARBOR_API std::string patch_to_string(const Patch& patch);

/// Print every patch on its own line to stdout
ARBOR_API void print_patches(const std::vector<Patch>& patches);

} // namespace arbor::html

namespace arbor {

extern template struct BasicNode<html::Traits>;
extern template struct BasicAttribute<html::Traits>;
extern template class BasicPatchCollector<html::Traits>;

} // namespace arbor
