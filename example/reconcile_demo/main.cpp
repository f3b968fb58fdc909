// main.cpp
// Reconcile Demo - diffing two versions of a small document
//
// Builds a todo list, edits it the way a UI would between two renders
// (reorder, insert, delete, restyle) and prints the patch sequence the
// diff engine produces. The patches are then applied to the old tree to
// show that the result matches the new one.

#include <arbor/apply_patches.h>
#include <arbor/diff.h>
#include <arbor/errors.h>
#include <arbor/html.h>

#include <iostream>
#include <string>
#include <vector>

using namespace arbor;
using namespace arbor::html;

// ============================================================
// Document builders
// ============================================================

struct Todo
{
    std::string id;
    std::string title;
    bool done = false;
};

Node render_todo(const Todo& todo)
{
    std::vector<Attribute> attrs{attr("class", "todo")};
    if (todo.done) {
        attrs.push_back(attr("class", "done"));
    }
    return element("li", std::move(attrs), {text(todo.title)}).with_key(todo.id);
}

Node render(const std::string& heading, const std::vector<Todo>& todos, bool freeze_list = false)
{
    std::vector<Node> items;
    for (const auto& todo : todos) {
        items.push_back(render_todo(todo));
    }
    auto list = element("ul", {}, std::move(items));
    return element("section", {attr("id", "app")}, {
        element("h1", {}, {text(heading)}),
        comment("generated"),
        freeze_list ? list.with_skip() : list,
        element("footer", {}, {text(std::to_string(todos.size()) + " items")}),
    });
}

void show(const char* title, const Node& old_tree, const Node& new_tree)
{
    std::cout << "=== " << title << " ===\n";
    std::cout << "old: " << to_html(old_tree) << "\n";
    std::cout << "new: " << to_html(new_tree) << "\n";

    const auto patches = diff(old_tree, new_tree);
    print_patches(patches);

    const auto rebuilt = apply_patches(old_tree, patches);
    std::cout << "applied " << patches.size() << " patches, result "
              << (rebuilt == flatten_lists(new_tree) ? "matches" : "DIFFERS") << "\n\n";
}

// ============================================================
// Main
// ============================================================

int main()
{
    const std::vector<Todo> before{
        {"1", "buy milk"},
        {"2", "write report"},
        {"3", "call bob"},
        {"4", "fix bike"},
    };

    // Reorder, finish one item, drop one, add one
    const std::vector<Todo> after{
        {"3", "call bob", true},
        {"1", "buy milk"},
        {"5", "water plants"},
        {"4", "fix bike"},
    };

    const auto v1 = render("Todo", before);
    const auto v2 = render("Todo (4)", after);
    show("keyed list edit", v1, v2);

    // The list renders from a cache the diff should leave alone
    show("skipped subtree", render("Todo", before, true), render("Todo", after, true));

    // Patches borrow from both trees; applying them to an unrelated tree fails
    try {
        const auto patches = diff(v1, v2);
        (void)apply_patches(element("div"), patches);
    } catch (const PatchError& e) {
        std::cout << "=== stale patches ===\n" << e.what() << "\n";
    }

    return 0;
}
