// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file html.cpp
/// @brief html construction helpers, rendering and explicit instantiations.

#include <arbor/html.h>

#include <iostream>

namespace arbor {

template struct BasicNode<html::Traits>;
template struct BasicAttribute<html::Traits>;
template class BasicPatchCollector<html::Traits>;

} // namespace arbor

namespace arbor::html {

namespace {

std::string escape(const std::string& s, bool in_attribute)
{
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"':
            if (in_attribute) {
                out += "&quot;";
            } else {
                out += c;
            }
            break;
        default: out += c; break;
        }
    }
    return out;
}

std::string qualified(const std::optional<std::string>& ns, const std::string& name)
{
    return ns ? *ns + ":" + name : name;
}

void render(const Node& node, std::string& out)
{
    if (const auto* leaf = node.as_leaf()) {
        if (const auto* t = std::get_if<Text>(leaf)) {
            out += escape(t->content, false);
        } else {
            out += "<!--" + std::get<Comment>(*leaf).content + "-->";
        }
        return;
    }
    if (const auto* list = node.as_list()) {
        for (const auto& child : list->nodes) {
            render(*child, out);
        }
        return;
    }

    const auto& elem = *node.as_element();
    const auto tag = qualified(elem.ns, elem.tag);
    out += "<" + tag;
    for (const auto& a : merge_attributes_of_same_name<Traits>(elem.attributes)) {
        out += " " + qualified(a.ns, a.name) + "=\"";
        bool first = true;
        for (const auto& v : a.values) {
            if (!first) {
                out += " ";
            }
            out += escape(v, true);
            first = false;
        }
        out += "\"";
    }
    if (elem.self_closing) {
        out += "/>";
        return;
    }
    out += ">";
    for (const auto& child : elem.children) {
        render(*child, out);
    }
    out += "</" + tag + ">";
}

std::string join_paths(const std::vector<TreePath>& paths)
{
    std::string out;
    for (std::size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += paths[i].to_string();
    }
    return out;
}

} // namespace

Node text(std::string content)
{
    return Node::leaf(Text{std::move(content)});
}

Node comment(std::string content)
{
    return Node::leaf(Comment{std::move(content)});
}

Attribute attr(std::string name, std::string value)
{
    return Attribute{std::move(name), std::move(value)};
}

Node element(std::string tag, std::vector<Attribute> attrs, std::vector<Node> children)
{
    return Node::element(std::move(tag), std::move(attrs), std::move(children));
}

Node fragment(std::vector<Node> nodes)
{
    return Node::list(std::move(nodes));
}

std::string to_html(const Node& node)
{
    std::string out;
    render(node, out);
    return out;
}

std::string patch_to_string(const Patch& patch)
{
    std::string out{patch_type_name(patch.type)};
    out += " " + patch.path.to_string();
    if (patch.tag) {
        out += " <" + *patch.tag + ">";
    }
    if (!patch.node_paths.empty()) {
        out += " from " + join_paths(patch.node_paths);
    }
    if (!patch.nodes.empty()) {
        out += ":";
        for (const auto* n : patch.nodes) {
            out += " " + to_html(*n);
        }
    }
    if (!patch.attributes.empty()) {
        out += ":";
        for (const auto* a : patch.attributes) {
            out += " " + qualified(a->ns, a->name);
            if (patch.type == PatchType::AddAttributes) {
                out += "=\"";
                for (std::size_t i = 0; i < a->values.size(); ++i) {
                    out += (i > 0 ? " " : "") + escape(a->values[i], true);
                }
                out += "\"";
            }
        }
    }
    if (patch.leaf) {
        out += ": " + to_html(Node::leaf(*patch.leaf));
    }
    return out;
}

void print_patches(const std::vector<Patch>& patches)
{
    if (patches.empty()) {
        std::cout << "  (no changes)\n";
        return;
    }
    for (const auto& p : patches) {
        std::cout << "  " << patch_to_string(p) << "\n";
    }
}

} // namespace arbor::html
