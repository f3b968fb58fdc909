// test_properties.cpp - Randomized checks of diff and apply on generated trees

#include <catch2/catch_all.hpp>
#include <arbor/apply_patches.h>
#include <arbor/diff.h>
#include <arbor/html.h>
#include <arbor/lis.h>

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <random>
#include <string>
#include <vector>

using namespace arbor;
using namespace arbor::html;

namespace {

enum class ChildPolicy { Unkeyed, Keyed, Mixed };

class TreeGenerator {
public:
    explicit TreeGenerator(std::uint32_t seed) : rng_(seed) {}

    Node tree(int depth) { return element_node(depth, next_key_base()); }

    // Copy of `node` with random edits: changed leaves and attributes,
    // dropped, inserted and reordered children. Keys of surviving children
    // are kept so keyed matching has something to work with.
    Node mutate(const Node& node, int depth) {
        if (node.is_leaf()) {
            return chance(3) ? leaf() : node;
        }
        if (!node.is_element() || chance(12)) {
            return element_node(depth, next_key_base());
        }

        std::vector<Node> children;
        const auto old_children = flatten_children<Traits>(node.children());
        const bool keyed = std::any_of(old_children.begin(), old_children.end(),
                                       [](const auto& box) { return box->key() != nullptr; });
        for (const auto& box : old_children) {
            if (chance(6)) {
                continue;
            }
            children.push_back(mutate(*box, depth - 1));
        }
        if (depth > 0 && chance(3)) {
            const auto base  = next_key_base();
            const auto count = pick(3) + 1;
            for (std::size_t i = 0; i < count; ++i) {
                auto child = element_node(depth - 1, base);
                if (keyed && child.is_element()) {
                    child = child.with_key("n" + std::to_string(base) + "_" + std::to_string(i));
                }
                children.insert(children.begin() + static_cast<std::ptrdiff_t>(pick(children.size() + 1)),
                                child);
            }
        }
        if (chance(2)) {
            std::shuffle(children.begin(), children.end(), rng_);
        }

        const auto old_attrs = node.attributes();
        auto attrs = chance(3) ? attributes() : std::vector<Attribute>(old_attrs.begin(), old_attrs.end());
        auto result = element(*node.tag(), std::move(attrs), std::move(children));
        if (const auto* key = node.key()) {
            result = result.with_key(*key);
        }
        return result;
    }

    std::size_t pick(std::size_t n) {
        return std::uniform_int_distribution<std::size_t>{0, n - 1}(rng_);
    }

private:
    bool chance(std::size_t one_in) { return pick(one_in) == 0; }

    std::size_t next_key_base() { return key_base_++; }

    Node leaf() {
        static const char* const alphabet[] = {"a", "b", "c"};
        const auto* content = alphabet[pick(3)];
        return chance(4) ? comment(content) : text(content);
    }

    std::vector<Attribute> attributes() {
        static const char* const names[]  = {"class", "id", "title"};
        static const char* const values[] = {"x", "y"};
        std::vector<Attribute> attrs;
        const auto count = pick(3);
        for (std::size_t i = 0; i < count; ++i) {
            attrs.push_back(attr(names[pick(3)], values[pick(2)]));
        }
        return attrs;
    }

    Node element_node(int depth, std::size_t key_base) {
        static const char* const tags[] = {"div", "p", "span"};
        const auto policy = static_cast<ChildPolicy>(pick(3));

        std::vector<Node> children;
        if (depth > 0) {
            const auto count = pick(6);
            for (std::size_t i = 0; i < count; ++i) {
                Node child = chance(3) ? leaf() : element_node(depth - 1, next_key_base());
                const bool keyed = policy == ChildPolicy::Keyed || (policy == ChildPolicy::Mixed && chance(2));
                if (keyed && child.is_element()) {
                    child = child.with_key("k" + std::to_string(key_base) + "_" + std::to_string(i));
                }
                children.push_back(std::move(child));
            }
            if (children.size() > 2 && chance(5)) {
                const auto first = children.begin() + 1;
                const std::vector<Node> grouped(first, first + 2);
                children.erase(first, first + 2);
                children.insert(children.begin() + 1, fragment(grouped));
            }
        }
        return element(tags[pick(3)], attributes(), std::move(children));
    }

    std::mt19937 rng_;
    std::size_t key_base_ = 0;
};

void require_round_trip(const Node& old_tree, const Node& new_tree) {
    const auto patches = diff(old_tree, new_tree);
    INFO("old: " << to_html(old_tree));
    INFO("new: " << to_html(new_tree));
    REQUIRE(apply_patches(old_tree, patches) == flatten_lists(new_tree));
}

std::size_t count_moves(const std::vector<Patch>& patches) {
    return static_cast<std::size_t>(
        std::count_if(patches.begin(), patches.end(), [](const Patch& p) { return p.is_move(); }));
}

Node keyed_row(std::size_t k) {
    return element("li", {}, {text(std::to_string(k))}).with_key(std::to_string(k));
}

Node keyed_list(const std::vector<std::size_t>& order) {
    std::vector<Node> children;
    for (const auto k : order) {
        children.push_back(keyed_row(k));
    }
    return element("ul", {}, std::move(children));
}

} // namespace

TEST_CASE("diff of a tree with itself is empty", "[property]") {
    const auto seed = GENERATE(range(1u, 41u));
    TreeGenerator a{seed};
    TreeGenerator b{seed};
    const auto tree = a.tree(4);
    const auto copy = b.tree(4);

    REQUIRE(diff(tree, tree).empty());
    REQUIRE(diff(tree, copy).empty());
}

TEST_CASE("applying the diff reproduces the new tree", "[property]") {
    const auto seed = GENERATE(range(1u, 101u));
    TreeGenerator gen{seed};

    SECTION("unrelated trees") {
        const auto old_tree = gen.tree(3);
        const auto new_tree = gen.tree(3);
        require_round_trip(old_tree, new_tree);
    }

    SECTION("mutated tree") {
        const auto old_tree = gen.tree(4);
        const auto new_tree = gen.mutate(old_tree, 4);
        require_round_trip(old_tree, new_tree);
        require_round_trip(new_tree, old_tree);
    }

    SECTION("twice mutated tree") {
        const auto old_tree = gen.tree(3);
        const auto new_tree = gen.mutate(gen.mutate(old_tree, 3), 3);
        require_round_trip(old_tree, new_tree);
    }
}

TEST_CASE("skipped subtrees are never touched", "[property][skip]") {
    const auto seed = GENERATE(range(1u, 51u));
    TreeGenerator gen{seed};

    const auto skipped_old = gen.tree(3).with_skip();
    const auto skipped_new = gen.tree(3).with_skip();
    const auto rest_old    = gen.tree(3);
    const auto rest_new    = gen.mutate(rest_old, 3);

    const auto old_tree = element("main", {}, {skipped_old, rest_old});
    const auto new_tree = element("main", {}, {skipped_new, rest_new});

    const auto patches = diff(old_tree, new_tree);
    for (const auto& patch : patches) {
        for (const auto& touched : patch.touched_paths()) {
            REQUIRE_FALSE(TreePath{0}.is_prefix_of(touched));
        }
    }
}

TEST_CASE("keyed permutations use the minimal number of moves", "[property][keyed]") {
    const auto seed = GENERATE(range(1u, 61u));
    std::mt19937 rng{seed};
    const auto n = std::uniform_int_distribution<std::size_t>{1, 12}(rng);

    std::vector<std::size_t> identity(n);
    std::iota(identity.begin(), identity.end(), 0);
    auto permuted = identity;
    std::shuffle(permuted.begin(), permuted.end(), rng);

    const auto old_tree = keyed_list(identity);
    const auto new_tree = keyed_list(permuted);
    const auto patches  = diff(old_tree, new_tree);

    const auto stable = longest_increasing_subsequence(permuted).size();
    REQUIRE(count_moves(patches) == n - stable);
    REQUIRE(patches.size() == n - stable);
    REQUIRE(apply_patches(old_tree, patches) == new_tree);
}

TEST_CASE("swapping two keyed siblings is a single move", "[property][keyed]") {
    const auto old_tree = keyed_list({0, 1});
    const auto new_tree = keyed_list({1, 0});
    const auto patches  = diff(old_tree, new_tree);

    REQUIRE(patches.size() == 1);
    REQUIRE(patches[0].type == PatchType::MoveBeforeNode);
    REQUIRE(patches[0].path == TreePath{0});
    REQUIRE(patches[0].node_paths == std::vector<TreePath>{TreePath{1}});
    REQUIRE(apply_patches(old_tree, patches) == new_tree);
}
