// test_node_list.cpp - Tests for node lists (fragments) in diff and apply

#include <catch2/catch_all.hpp>
#include <arbor/apply_patches.h>
#include <arbor/diff.h>
#include <arbor/html.h>

using namespace arbor;
using namespace arbor::html;

TEST_CASE("node lists are transparent to the diff", "[node_list]") {
    SECTION("same children grouped differently") {
        const auto old_tree = element("div", {}, {fragment({text("a"), text("b")}), text("c")});
        const auto new_tree = element("div", {}, {text("a"), fragment({text("b"), text("c")})});
        REQUIRE(diff(old_tree, new_tree).empty());
    }

    SECTION("indices count flattened children") {
        const auto old_tree = element("div", {}, {fragment({text("a"), text("b")}), text("c")});
        const auto new_tree = element("div", {}, {text("a"), text("b"), text("d")});
        const auto patches = diff(old_tree, new_tree);
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0].type == PatchType::ChangeLeaf);
        REQUIRE(patches[0].path == TreePath{2});
        REQUIRE(apply_patches(old_tree, patches) == flatten_lists(new_tree));
    }

    SECTION("appending from a nested list") {
        const auto old_tree = element("ul", {}, {element("li", {}, {text("1")})});
        const auto new_tree = element("ul", {}, {
            element("li", {}, {text("1")}),
            fragment({element("li", {}, {text("2")}), element("li", {}, {text("3")})}),
        });
        const auto patches = diff(old_tree, new_tree);
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0].type == PatchType::AppendChildren);
        REQUIRE(patches[0].nodes.size() == 2);
        REQUIRE(apply_patches(old_tree, patches) == flatten_lists(new_tree));
    }

    SECTION("keyed children spread over lists") {
        const auto old_tree = element("ul", {}, {
            fragment({element("li").with_key("1"), element("li").with_key("2")}),
            element("li").with_key("3"),
        });
        const auto new_tree = element("ul", {}, {
            element("li").with_key("3"),
            fragment({element("li").with_key("1"), element("li").with_key("2")}),
        });
        const auto patches = diff(old_tree, new_tree);
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0].type == PatchType::MoveBeforeNode);
        REQUIRE(patches[0].node_paths == std::vector<TreePath>{TreePath{2}});
        REQUIRE(apply_patches(old_tree, patches) == flatten_lists(new_tree));
    }
}

TEST_CASE("node lists at the root", "[node_list][root]") {
    SECTION("list to list") {
        const auto old_tree = fragment({text("a")});
        const auto new_tree = fragment({text("a"), element("b")});
        const auto patches = diff(old_tree, new_tree);
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0].type == PatchType::AppendChildren);
        REQUIRE(patches[0].path.is_empty());
        REQUIRE(patches[0].tag == nullptr);
        REQUIRE(apply_patches(old_tree, patches) == new_tree);
    }

    SECTION("list to element replaces the root") {
        const auto old_tree = fragment({text("a")});
        const auto new_tree = element("p", {}, {text("a")});
        const auto patches = diff(old_tree, new_tree);
        REQUIRE(patches.size() == 1);
        REQUIRE(patches[0].type == PatchType::ReplaceNode);
        REQUIRE(apply_patches(old_tree, patches) == new_tree);
    }

    SECTION("element to nested list") {
        const auto old_tree = element("p");
        const auto new_tree = fragment({fragment({text("x")}), text("y")});
        const auto patches = diff(old_tree, new_tree);
        REQUIRE(apply_patches(old_tree, patches) == fragment({text("x"), text("y")}));
    }
}
