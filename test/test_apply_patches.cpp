// test_apply_patches.cpp - Tests for the patch applier

#include <catch2/catch_all.hpp>
#include <arbor/apply_patches.h>
#include <arbor/diff.h>
#include <arbor/errors.h>
#include <arbor/html.h>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace arbor;
using namespace arbor::html;

namespace {

const std::string ul = "ul";
const std::string li = "li";
const std::string p  = "p";

Node item(const std::string& s) {
    return element("li", {}, {text(s)});
}

Node sample() {
    return element("ul", {attr("class", "list")}, {item("a"), item("b"), item("c")});
}

// Redirects std::cerr into a buffer for the lifetime of the guard
class CerrCapture {
public:
    CerrCapture() : previous_(std::cerr.rdbuf(buffer_.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(previous_); }

    CerrCapture(const CerrCapture&) = delete;
    CerrCapture& operator=(const CerrCapture&) = delete;

    std::string text() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

} // namespace

// ============================================================
// One case per patch kind
// ============================================================

TEST_CASE("apply structural patches", "[apply]") {
    const auto tree = sample();
    const auto x    = item("x");
    const auto y    = item("y");

    SECTION("InsertBeforeNode") {
        const auto out = apply_patches(tree, {Patch::insert_before_node(&li, TreePath{1}, {&x, &y})});
        REQUIRE(out == element("ul", {attr("class", "list")}, {item("a"), x, y, item("b"), item("c")}));
    }

    SECTION("InsertAfterNode") {
        const auto out = apply_patches(tree, {Patch::insert_after_node(&li, TreePath{2}, {&x})});
        REQUIRE(out == element("ul", {attr("class", "list")}, {item("a"), item("b"), item("c"), x}));
    }

    SECTION("AppendChildren") {
        const auto out = apply_patches(tree, {Patch::append_children(&ul, TreePath{}, {&x})});
        REQUIRE(out.children().size() == 4);
        REQUIRE(*out.children()[3] == x);
    }

    SECTION("AppendChildren below the root") {
        const auto leaf_x = text("x");
        const auto out    = apply_patches(tree, {Patch::append_children(&li, TreePath{0}, {&leaf_x})});
        REQUIRE(*out.children()[0] == element("li", {}, {text("a"), text("x")}));
    }

    SECTION("RemoveNode") {
        const auto out = apply_patches(tree, {Patch::remove_node(&li, TreePath{1})});
        REQUIRE(out == element("ul", {attr("class", "list")}, {item("a"), item("c")}));
    }

    SECTION("ReplaceNode") {
        const auto para = element("p", {}, {text("new")});
        const auto out  = apply_patches(tree, {Patch::replace_node(&li, TreePath{0}, &para)});
        REQUIRE(*out.children()[0] == para);
    }

    SECTION("ReplaceNode at the root") {
        const auto para = element("p");
        REQUIRE(apply_patches(tree, {Patch::replace_node(&ul, TreePath{}, &para)}) == para);
    }

    SECTION("MoveBeforeNode") {
        const auto out = apply_patches(tree, {Patch::move_before_node(&li, TreePath{0}, {TreePath{2}})});
        REQUIRE(out == element("ul", {attr("class", "list")}, {item("c"), item("a"), item("b")}));
    }

    SECTION("MoveAfterNode") {
        const auto out = apply_patches(tree, {Patch::move_after_node(&li, TreePath{2}, {TreePath{0}})});
        REQUIRE(out == element("ul", {attr("class", "list")}, {item("b"), item("c"), item("a")}));
    }

    SECTION("move of several sources keeps their listed order") {
        const auto out = apply_patches(tree, {Patch::move_after_node(&li, TreePath{0}, {TreePath{2}, TreePath{1}})});
        REQUIRE(out == element("ul", {attr("class", "list")}, {item("a"), item("c"), item("b")}));
    }

    SECTION("payload lists are spliced") {
        const auto pair = fragment({x, fragment({y})});
        const auto out  = apply_patches(tree, {Patch::insert_before_node(&li, TreePath{0}, {&pair})});
        REQUIRE(out.children().size() == 5);
        REQUIRE(*out.children()[0] == x);
        REQUIRE(*out.children()[1] == y);
    }
}

TEST_CASE("apply attribute and leaf patches", "[apply]") {
    const auto tree = sample();

    SECTION("AddAttributes replaces same-name attributes") {
        const auto a1  = attr("class", "big");
        const auto a2  = attr("class", "red");
        const auto id  = attr("id", "main");
        const auto out = apply_patches(tree, {Patch::add_attributes(&ul, TreePath{}, {&a1, &a2, &id})});
        REQUIRE(out.attribute_values("class") == std::vector<std::string>{"big", "red"});
        REQUIRE(out.attribute_values("id") == std::vector<std::string>{"main"});
        REQUIRE(out.attributes().size() == 3);
    }

    SECTION("RemoveAttributes removes every attribute of the name") {
        const auto doubled = tree.add_attributes({attr("class", "more"), attr("id", "x")});
        const auto cls     = attr("class", "list");
        const auto out     = apply_patches(doubled, {Patch::remove_attributes(&ul, TreePath{}, {&cls})});
        REQUIRE(out.attribute_values("class").empty());
        REQUIRE(out.attribute_values("id") == std::vector<std::string>{"x"});
    }

    SECTION("ChangeLeaf") {
        const Leaf leaf = Comment{"gone"};
        const auto out  = apply_patches(tree, {Patch::change_leaf(TreePath{1, 0}, &leaf)});
        REQUIRE(*out.children()[1] == element("li", {}, {comment("gone")}));
    }

    SECTION("patches apply in sequence") {
        const Leaf leaf = Text{"B"};
        const auto out  = apply_patches(tree, {
            Patch::remove_node(&li, TreePath{0}),
            Patch::change_leaf(TreePath{0, 0}, &leaf),
        });
        REQUIRE(out == element("ul", {attr("class", "list")}, {item("B"), item("c")}));
    }

    SECTION("an empty sequence returns an equal tree") {
        REQUIRE(apply_patches(tree, {}) == tree);
    }
}

// ============================================================
// Failures
// ============================================================

TEST_CASE("apply reports unresolvable patches", "[apply][error]") {
    const auto tree     = sample();
    const auto snapshot = sample();
    const auto x        = item("x");
    const Leaf leaf     = Text{"t"};

    auto require_error = [&](const Patch& patch, PatchType type, const TreePath& path,
                             const std::string& fragment_of_message) {
        try {
            (void)apply_patches(tree, {patch});
            FAIL("expected PatchError");
        } catch (const PatchError& e) {
            REQUIRE(e.patch_type() == type);
            REQUIRE(e.path() == path);
            REQUIRE_THAT(std::string{e.what()}, Catch::Matchers::ContainsSubstring(fragment_of_message));
            REQUIRE_THAT(std::string{e.what()}, Catch::Matchers::ContainsSubstring(std::string{patch_type_name(type)}));
        }
        REQUIRE(tree == snapshot);
    };

    SECTION("index out of range") {
        require_error(Patch::remove_node(&li, TreePath{7}), PatchType::RemoveNode, TreePath{7}, "out of range");
        require_error(Patch::change_leaf(TreePath{5, 0}, &leaf), PatchType::ChangeLeaf, TreePath{5, 0},
                      "out of range");
    }

    SECTION("tag mismatch") {
        require_error(Patch::remove_node(&p, TreePath{0}), PatchType::RemoveNode, TreePath{0}, "tag");
        require_error(Patch::append_children(&p, TreePath{}, {&x}), PatchType::AppendChildren, TreePath{},
                      "tag");
    }

    SECTION("wrong node kind") {
        require_error(Patch::change_leaf(TreePath{0}, &leaf), PatchType::ChangeLeaf, TreePath{0},
                      "not a leaf");
        require_error(Patch::append_children(nullptr, TreePath{0, 0}, {&x}), PatchType::AppendChildren,
                      TreePath{0, 0}, "leaf");
    }

    SECTION("path through a leaf") {
        require_error(Patch::change_leaf(TreePath{0, 0, 0}, &leaf), PatchType::ChangeLeaf,
                      TreePath{0, 0, 0}, "leaf");
    }

    SECTION("the root cannot be removed or given siblings") {
        require_error(Patch::remove_node(&ul, TreePath{}), PatchType::RemoveNode, TreePath{}, "root");
        require_error(Patch::insert_before_node(&ul, TreePath{}, {&x}), PatchType::InsertBeforeNode,
                      TreePath{}, "root");
    }

    SECTION("invalid move sources") {
        require_error(Patch::move_before_node(&li, TreePath{0}, {TreePath{9}}), PatchType::MoveBeforeNode,
                      TreePath{0}, "invalid source");
        require_error(Patch::move_before_node(&li, TreePath{0}, {TreePath{0}}), PatchType::MoveBeforeNode,
                      TreePath{0}, "invalid source");
        require_error(Patch::move_after_node(&li, TreePath{0}, {TreePath{1, 0}}), PatchType::MoveAfterNode,
                      TreePath{0}, "not a sibling");
    }

    SECTION("failure in the middle leaves the input intact") {
        REQUIRE_THROWS_AS(apply_patches(tree, {Patch::remove_node(&li, TreePath{0}),
                                               Patch::remove_node(&li, TreePath{2})}),
                          PatchError);
        REQUIRE(tree == snapshot);
    }
}

// ============================================================
// Diagnostics
// ============================================================

TEST_CASE("successful application writes no diagnostics", "[apply][log]") {
    const auto old_tree = element("main", {}, {
        element("ul", {}, {item("a").with_key("a"), item("b").with_key("b"), item("c").with_key("c")}),
        element("p", {attr("class", "x")}, {text("deep"), element("em", {}, {text("deeper")})}),
    });
    const auto new_tree = element("main", {}, {
        element("ul", {}, {item("c").with_key("c"), item("a").with_key("a"), item("d").with_key("d")}),
        element("p", {attr("class", "y")}, {text("deep"), element("em", {}, {text("changed")})}),
    });
    const auto patches = diff(old_tree, new_tree);
    REQUIRE_FALSE(patches.empty());

    std::string logged;
    {
        CerrCapture capture;
        const auto out = apply_patches(old_tree, patches);
        REQUIRE(out == new_tree);
        logged = capture.text();
    }
    REQUIRE(logged.empty());
}
