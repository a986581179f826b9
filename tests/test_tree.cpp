// tests/test_tree.cpp
//
// Copyright (C) 2025 Peter Wild
//
// This file is part of Lighttree.
//
// Lighttree is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// Lighttree is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with Lighttree.  If not, see <https://www.gnu.org/licenses/>.


#include <catch2/catch.hpp>

#include "testing_utils.hpp"

using namespace lighttree;
using namespace lighttree::testing;

namespace
{
    constexpr std::string_view sample_tree_repr{
            "{}\n"
            "├── a: {}\n"
            "│   ├── a: []\n"
            "│   │   ├── AA0\n"
            "│   │   └── AA1\n"
            "│   └── b: {}\n"
            "└── c: []\n"
            "    ├── C0\n"
            "    └── C1\n" };
}

TEST_CASE("insert root", "[tree][insert]")
{
    tree t{};
    const auto root_node{ node::make("a") };

    REQUIRE(t.is_empty());
    REQUIRE_FALSE(t.insert_node(root_node).has_value());
    REQUIRE(t.root() == "a");
    REQUIRE(t.get("a").second == root_node);
    REQUIRE(t.children_ids("a").empty());
    check_tree_sanity(t);

    SECTION("a second root is refused")
    {
        REQUIRE_THROWS_AS(t.insert_node(node::make("b")), multiple_root_error);
        REQUIRE(ids_of(t.list()) == std::vector<std::string>{ "a" });
        check_tree_sanity(t);
    }

    SECTION("the root takes no key")
    {
        tree other{};
        REQUIRE_THROWS_AS(other.insert_node(node::make("b"), { .key = key_str("k") }), std::invalid_argument);
        REQUIRE(other.is_empty());
    }

    SECTION("null nodes are refused")
    {
        REQUIRE_THROWS_AS(tree{}.insert_node(nullptr), std::invalid_argument);
    }
}

TEST_CASE("insert node below", "[tree][insert]")
{
    tree t{};
    t.insert_node(node::make("root_id"));

    REQUIRE_THROWS_AS(t.insert_node(node::make("a"), { .parent_id = "what", .key = key_str("a") }), not_found_error);
    check_tree_sanity(t);

    const auto node_a{ node::make("a_id") };
    REQUIRE(t.insert_node(node_a, { .parent_id = "root_id", .key = key_str("a") }) == key_str("a"));
    REQUIRE(t.size() == 2);
    REQUIRE(t.get("a_id") == keyed_node{ key_str("a"), node_a });
    REQUIRE(t.parent_id("a_id") == "root_id");
    check_tree_sanity(t);

    SECTION("identifiers are unique")
    {
        REQUIRE_THROWS_AS(t.insert_node(node::make("a_id"), { .parent_id = "root_id", .key = key_str("b") }), duplicated_node_error);
        REQUIRE(t.size() == 2);
    }

    SECTION("keys are unique below keyed nodes")
    {
        REQUIRE_THROWS_AS(t.insert_node(node::make("other"), { .parent_id = "root_id", .key = key_str("a") }), duplicated_key_error);
        REQUIRE_FALSE(t.contains("other"));
    }

    SECTION("keyed nodes require a string key")
    {
        REQUIRE_THROWS_AS(t.insert_node(node::make("other"), { .parent_id = "root_id" }), invalid_operation_error);
        REQUIRE_THROWS_AS(t.insert_node(node::make("other"), { .parent_id = "root_id", .key = key_pos(0) }), invalid_operation_error);
        REQUIRE_FALSE(t.contains("other"));
    }

    SECTION("leaves refuse children")
    {
        t.insert_node(make_leaf("leaf", "L"), { .parent_id = "root_id", .key = key_str("l") });
        REQUIRE_THROWS_AS(t.insert_node(node::make("other"), { .parent_id = "leaf", .key = key_str("x") }), invalid_operation_error);
        check_tree_sanity(t);
    }

    SECTION("parent and child locators are exclusive")
    {
        REQUIRE_THROWS_AS(t.insert_node(node::make("other"), { .parent_id = "root_id", .child_id = "a_id" }), std::invalid_argument);
        REQUIRE_THROWS_AS(t.insert_node(node::make("other"), { .child_id = "a_id", .child_id_below = "a_id" }), std::invalid_argument);
    }
}

TEST_CASE("insert node below list nodes", "[tree][insert]")
{
    tree t{};
    t.insert_node(node::make("l", { .keyed = false }));

    REQUIRE(t.insert_node(make_leaf("x", "X"), { .parent_id = "l" }) == key_pos(0));
    REQUIRE(t.insert_node(make_leaf("y", "Y"), { .parent_id = "l" }) == key_pos(1));

    SECTION("a position inserts and shifts the following children")
    {
        REQUIRE(t.insert_node(make_leaf("z", "Z"), { .parent_id = "l", .key = key_pos(1) }) == key_pos(1));
        REQUIRE(t.children_ids("l") == std::vector<std::string>{ "x", "z", "y" });
        REQUIRE(t.get_key("y") == key_pos(2));
        check_tree_sanity(t);
    }

    SECTION("positions past the end append")
    {
        REQUIRE(t.insert_node(make_leaf("z", "Z"), { .parent_id = "l", .key = key_pos(10) }) == key_pos(2));
        REQUIRE(t.children_ids("l") == std::vector<std::string>{ "x", "y", "z" });
    }

    SECTION("negative positions and string keys are refused")
    {
        REQUIRE_THROWS_AS(t.insert_node(make_leaf("z", "Z"), { .parent_id = "l", .key = key_pos(-1) }), invalid_operation_error);
        REQUIRE_THROWS_AS(t.insert_node(make_leaf("z", "Z"), { .parent_id = "l", .key = key_str("k") }), invalid_operation_error);
        REQUIRE(t.size() == 3);
    }
}

TEST_CASE("insert node above", "[tree][insert]")
{
    SECTION("above the root")
    {
        tree t{};
        t.insert_node(node::make("initial_root"));
        REQUIRE_FALSE(t.insert_node(node::make("new_root"), { .child_id = "initial_root", .key = key_str("between") }).has_value());

        REQUIRE(t.root() == "new_root");
        REQUIRE(t.children("new_root").size() == 1);
        REQUIRE(t.get("initial_root").first == key_str("between"));
        REQUIRE(t.show() == "{}\n└── between: {}\n");
        check_tree_sanity(t);
    }

    SECTION("above a node keeps its slot")
    {
        auto t{ make_sample_tree() };
        REQUIRE(t.insert_node(node::make("new"), { .child_id = "aa0", .key = key_str("to") }) == key_pos(0));

        REQUIRE(t.contains("new"));
        REQUIRE(t.parent_id("new") == "aa");
        REQUIRE(t.parent_id("aa0") == "new");
        REQUIRE(t.get_key("aa0") == key_str("to"));
        REQUIRE(t.show() ==
                "{}\n"
                "├── a: {}\n"
                "│   ├── a: []\n"
                "│   │   ├── {}\n"
                "│   │   │   └── to: AA0\n"
                "│   │   └── AA1\n"
                "│   └── b: {}\n"
                "└── c: []\n"
                "    ├── C0\n"
                "    └── C1\n");
        check_tree_sanity(t);
    }

    SECTION("above a keyed child")
    {
        auto t{ make_sample_tree() };
        t.insert_node(node::make("wrapper", { .keyed = false }), { .child_id = "ab" });

        REQUIRE(t.get_key("wrapper") == key_str("b"));
        REQUIRE(t.get_key("ab") == key_pos(0));
        check_tree_sanity(t);
    }

    SECTION("failed insertions leave the tree untouched")
    {
        auto t{ make_sample_tree() };

        REQUIRE_THROWS_AS(t.insert_node(node::make("new"), { .child_id = "aa0" }), invalid_operation_error);
        REQUIRE_THROWS_AS(t.insert_node(make_leaf("new", "N"), { .child_id = "aa0", .key = key_str("k") }), invalid_operation_error);
        REQUIRE_THROWS_AS(t.insert_node(node::make("aa1"), { .child_id = "aa0", .key = key_str("k") }), duplicated_node_error);
        REQUIRE_THROWS_AS(t.insert_node(node::make("new"), { .child_id = "missing", .key = key_str("k") }), not_found_error);

        REQUIRE(t.show() == sample_tree_repr);
        check_tree_sanity(t);
    }
}

TEST_CASE("insert by path", "[tree][insert][path]")
{
    auto t{ make_sample_tree() };

    t.insert_node(make_leaf("ab0", "AB0"), { .parent_id = "a.b", .key = key_str("x"), .by_path = true });
    REQUIRE(t.parent_id("ab0") == "ab");

    t.insert_node(node::make("above_c1"), { .child_id = "c.1", .key = key_str("v"), .by_path = true });
    REQUIRE(t.parent_id("c1") == "above_c1");
    REQUIRE(t.get_path("c1") == "c.1.v");

    REQUIRE_THROWS_AS(t.insert_node(node::make("x"), { .parent_id = "a.z", .key = key_str("x"), .by_path = true }), not_found_error);
    check_tree_sanity(t);
}

TEST_CASE("contains and get", "[tree][query]")
{
    const auto t{ make_sample_tree() };

    REQUIRE(t.contains("aa0"));
    REQUIRE_FALSE(t.contains("yolo_id"));
    REQUIRE(t.size() == 9);

    REQUIRE_THROWS_AS(t.get("not_existing_id"), not_found_error);
    REQUIRE(t.get("ab").first == key_str("b"));
    REQUIRE(t.get("ab").second->identifier() == "ab");
    REQUIRE(t.get("aa1").first == key_pos(1));
    REQUIRE_FALSE(t.get("root").first.has_value());
}

TEST_CASE("list", "[tree][query]")
{
    const auto t{ make_sample_tree() };

    REQUIRE(ids_of(t.list({ .id_in = std::vector<std::string>{ "a", "c" } })) == std::vector<std::string>{ "a", "c" });
    REQUIRE(id_set(ids_of(t.list({ .depth_in = std::vector<std::size_t>{ 0, 2 } }))) == std::set<std::string>{ "root", "aa", "ab", "c0", "c1" });
    REQUIRE(id_set(ids_of(t.list({ .depth_in = std::vector<std::size_t>{ 3 } }))) == std::set<std::string>{ "aa0", "aa1" });
    REQUIRE(ids_of(t.list({ .filter = [](const node_key& key, const node&) { return key == key_pos(0); } }))
            == std::vector<std::string>{ "aa0", "c0" });
    REQUIRE(tree{}.list().empty());
}

TEST_CASE("parent, children and siblings", "[tree][query]")
{
    const auto t{ make_sample_tree() };

    REQUIRE_THROWS_AS(t.parent_id("root"), not_found_error);
    REQUIRE_THROWS_AS(t.parent_id("non-existing-id"), not_found_error);
    REQUIRE(t.parent_id("a") == "root");
    REQUIRE(t.parent_id("ab") == "a");
    REQUIRE(t.parent_id("c1") == "c");
    REQUIRE(t.parent("c1").second->identifier() == "c");
    REQUIRE(t.parent("c1").first == key_str("c"));

    REQUIRE(id_set(t.children_ids("root")) == std::set<std::string>{ "a", "c" });
    REQUIRE(id_set(t.children_ids("a")) == std::set<std::string>{ "aa", "ab" });
    REQUIRE(t.children_ids("c") == std::vector<std::string>{ "c0", "c1" });
    REQUIRE(t.children_ids("c1").empty());
    REQUIRE(t.children("c")[1].first == key_pos(1));
    REQUIRE_THROWS_AS(t.children_ids("non-existing-id"), not_found_error);

    REQUIRE(t.siblings_ids("root").empty());
    REQUIRE(t.siblings_ids("a") == std::vector<std::string>{ "c" });
    REQUIRE(t.siblings_ids("c") == std::vector<std::string>{ "a" });
    REQUIRE(t.siblings_ids("aa0") == std::vector<std::string>{ "aa1" });
    REQUIRE(ids_of(t.siblings("c1")) == std::vector<std::string>{ "c0" });
    REQUIRE_THROWS_AS(t.siblings_ids("non-existing-id"), not_found_error);

    SECTION("read queries are repeatable")
    {
        REQUIRE(t.children_ids("a") == t.children_ids("a"));
        REQUIRE(t.ancestors_ids("aa1") == t.ancestors_ids("aa1"));
        REQUIRE(t.leaves_ids() == t.leaves_ids());
    }
}

TEST_CASE("leaves, depth and ancestors", "[tree][query]")
{
    const auto t{ make_sample_tree() };

    REQUIRE_FALSE(t.is_leaf("root"));
    REQUIRE_FALSE(t.is_leaf("c"));
    REQUIRE(t.is_leaf("aa0"));
    REQUIRE(t.is_leaf("ab"));
    REQUIRE_THROWS_AS(t.is_leaf("non-existing-id"), not_found_error);

    REQUIRE(t.depth("root") == 0);
    REQUIRE(t.depth("a") == 1);
    REQUIRE(t.depth("aa") == 2);
    REQUIRE(t.depth("aa0") == 3);
    REQUIRE(t.depth("c1") == 2);
    REQUIRE_THROWS_AS(t.depth("non-existing-id"), not_found_error);

    REQUIRE(t.ancestors_ids("root").empty());
    REQUIRE(t.ancestors_ids("a") == std::vector<std::string>{ "root" });
    REQUIRE(t.ancestors_ids("a", false, true) == std::vector<std::string>{ "a", "root" });
    REQUIRE(t.ancestors_ids("aa") == std::vector<std::string>{ "a", "root" });
    REQUIRE(t.ancestors_ids("aa", true) == std::vector<std::string>{ "root", "a" });
    REQUIRE(t.ancestors_ids("aa", true, true) == std::vector<std::string>{ "root", "a", "aa" });
    REQUIRE(ids_of(t.ancestors("c1", true)) == std::vector<std::string>{ "root", "c" });
    REQUIRE_THROWS_AS(t.ancestors("non-existing-id"), not_found_error);

    REQUIRE(id_set(t.leaves_ids()) == std::set<std::string>{ "aa0", "aa1", "ab", "c0", "c1" });
    REQUIRE(id_set(t.leaves_ids("a")) == std::set<std::string>{ "aa0", "aa1", "ab" });
    REQUIRE(t.leaves_ids("aa0") == std::vector<std::string>{ "aa0" });
    REQUIRE(t.leaves_ids("c") == std::vector<std::string>{ "c0", "c1" });
    REQUIRE(ids_of(t.leaves("c")) == std::vector<std::string>{ "c0", "c1" });
    REQUIRE(tree{}.leaves_ids().empty());
}

TEST_CASE("path addressing", "[tree][path]")
{
    SECTION("default separator")
    {
        const auto t{ make_sample_tree() };

        REQUIRE(t.get_node_id_by_path("") == "root");
        REQUIRE(t.get_node_id_by_path("a") == "a");
        REQUIRE(t.get_node_id_by_path("a.b") == "ab");
        REQUIRE(t.get_node_id_by_path("a.a.1") == "aa1");
        REQUIRE(t.get_node_id_by_path("c.1") == "c1");

        for (const std::string path : { "a.a", "a.b", "a", "", "a.a.1" })
            REQUIRE(t.get_path(t.get_node_id_by_path(path)) == path);
    }

    SECTION("custom separator")
    {
        const auto t{ make_sample_tree("|") };

        for (const std::string path : { "a|a", "a|b", "a", "", "a|a|1" })
            REQUIRE(t.get_path(t.get_node_id_by_path(path)) == path);
    }

    SECTION("missing segments")
    {
        const auto t{ make_sample_tree() };

        REQUIRE_THROWS_AS(t.get_node_id_by_path("z"), not_found_error);
        REQUIRE_THROWS_AS(t.get_node_id_by_path("c.2"), not_found_error);
        REQUIRE_THROWS_AS(t.get_node_id_by_path("c.x"), not_found_error);
        REQUIRE_THROWS_AS(t.get_node_id_by_path("c.-1"), not_found_error);
        REQUIRE_THROWS_AS(t.get_node_id_by_path("a.a.0.x"), not_found_error);
        REQUIRE_THROWS_AS(tree{}.get_node_id_by_path(""), not_found_error);
    }

    SECTION("empty separator")
    {
        REQUIRE_THROWS_AS(tree{ "" }, std::invalid_argument);
    }
}

TEST_CASE("clone", "[tree][clone]")
{
    const auto t{ make_sample_tree() };

    SECTION("shallow clone shares nodes")
    {
        const auto copy{ t.clone() };

        REQUIRE(copy.size() == t.size());
        REQUIRE(copy.show() == t.show());
        for (const auto& [key, n] : t.list())
            REQUIRE(copy.get(n->identifier()) == keyed_node{ key, n });
        check_tree_sanity(copy);

        t.get("aa0").second->set_display("changed");
        REQUIRE(copy.get("aa0").second->line_repr().first == "changed");
        t.get("aa0").second->set_display("AA0");
    }

    SECTION("deep clone duplicates nodes")
    {
        const auto copy{ t.clone(true, true) };

        REQUIRE(copy.show() == t.show());
        for (const auto& [key, n] : copy.list())
            REQUIRE(t.get(n->identifier()).second != n);

        copy.get("aa0").second->set_display("changed");
        REQUIRE(t.get("aa0").second->line_repr().first == "AA0");
    }

    SECTION("clone from a new root")
    {
        const auto copy{ t.clone(true, false, "a") };

        REQUIRE(id_set(ids_of(copy.list())) == std::set<std::string>{ "a", "aa", "ab", "aa0", "aa1" });
        REQUIRE(copy.show() ==
                "{}\n"
                "├── a: []\n"
                "│   ├── AA0\n"
                "│   └── AA1\n"
                "└── b: {}\n");
        check_tree_sanity(copy);
    }

    SECTION("empty clone")
    {
        REQUIRE(t.clone(false).is_empty());
        REQUIRE(t.clone(false).path_separator() == t.path_separator());
        REQUIRE(tree{}.clone().is_empty());
        REQUIRE_THROWS_AS(t.clone(true, false, "missing"), not_found_error);
    }
}

TEST_CASE("subtree", "[tree][clone]")
{
    const auto t{ make_sample_tree() };
    const auto [key, st]{ t.subtree(t.get_node_id_by_path("a.a")) };

    REQUIRE(key == key_str("a"));
    REQUIRE(st.show() == "[]\n├── AA0\n└── AA1\n");
    REQUIRE(st.get("aa0").second == t.get("aa0").second);
    REQUIRE(t.size() == 9);
    check_tree_sanity(st);

    REQUIRE(t.subtree("aa", true).second.get("aa0").second != t.get("aa0").second);
    REQUIRE_THROWS_AS(t.subtree("missing"), not_found_error);
}

TEST_CASE("insert tree below", "[tree][insert]")
{
    auto t{ make_sample_tree() };
    const auto to_paste{ make_sample_tree_2() };

    REQUIRE(t.insert(to_paste, { .parent_id = "c" }) == key_pos(2));
    check_tree_sanity(t);
    check_tree_sanity(to_paste);
    REQUIRE(t.show() ==
            "{}\n"
            "├── a: {}\n"
            "│   ├── a: []\n"
            "│   │   ├── AA0\n"
            "│   │   └── AA1\n"
            "│   └── b: {}\n"
            "└── c: []\n"
            "    ├── C0\n"
            "    ├── C1\n"
            "    └── []\n"
            "        ├── {}\n"
            "        │   └── a: {}\n"
            "        └── {}\n");

    /* pasted trees are shallow copies */
    REQUIRE(t.get("broot").first == key_pos(2));
    REQUIRE_FALSE(to_paste.get("broot").first.has_value());
    REQUIRE(t.get("broot").second == to_paste.get("broot").second);

    SECTION("pasting again would duplicate nodes")
    {
        REQUIRE_THROWS_AS(t.insert(to_paste, { .parent_id = "aa0" }), duplicated_node_error);
        REQUIRE(t.size() == 13);
        check_tree_sanity(t);
    }

    SECTION("keyed parents need a free string key")
    {
        auto other{ make_sample_tree_2() };
        auto receiver{ make_sample_tree() };

        REQUIRE_THROWS_AS(receiver.insert_tree(other, { .parent_id = "a", .key = key_str("b") }), duplicated_key_error);
        REQUIRE_THROWS_AS(receiver.insert_tree(other, { .parent_id = "a" }), invalid_operation_error);
        REQUIRE(receiver.insert_tree(other, { .parent_id = "a", .key = key_str("z") }) == key_str("z"));
        REQUIRE(receiver.get_path("b1a") == "a.z.0.a");
        check_tree_sanity(receiver);
    }

    SECTION("empty trees are ignored")
    {
        REQUIRE_FALSE(t.insert_tree(tree{}, { .parent_id = "c" }).has_value());
        REQUIRE(t.size() == 13);
    }
}

TEST_CASE("insert tree at root", "[tree][insert]")
{
    tree t{};
    t.insert_tree(make_sample_tree());
    REQUIRE(t.show() == sample_tree_repr);
    check_tree_sanity(t);

    tree occupied{};
    occupied.insert_node(node::make("present_root"));
    REQUIRE_THROWS_AS(occupied.insert_tree(make_sample_tree()), multiple_root_error);
    REQUIRE(occupied.size() == 1);
    check_tree_sanity(occupied);
}

TEST_CASE("insert tree above", "[tree][insert]")
{
    SECTION("several leaves need child_id_below")
    {
        auto t{ make_sample_tree() };

        REQUIRE_THROWS_AS(t.insert_tree(make_sample_tree_2(), { .child_id = "aa0" }), ambiguous_insertion_error);
        for (const auto* nid : { "broot", "b1", "b1a", "b2" })
            REQUIRE_FALSE(t.contains(nid));
        check_tree_sanity(t);
    }

    SECTION("with child_id_below")
    {
        auto t{ make_sample_tree() };

        REQUIRE(t.insert_tree(make_sample_tree_2(), { .child_id = "aa0", .child_id_below = "b2", .key = key_str("new-key") }) == key_pos(0));
        check_tree_sanity(t);
        REQUIRE(t.show() ==
                "{}\n"
                "├── a: {}\n"
                "│   ├── a: []\n"
                "│   │   ├── []\n"
                "│   │   │   ├── {}\n"
                "│   │   │   │   └── a: {}\n"
                "│   │   │   └── {}\n"
                "│   │   │       └── new-key: AA0\n"
                "│   │   └── AA1\n"
                "│   └── b: {}\n"
                "└── c: []\n"
                "    ├── C0\n"
                "    └── C1\n");
    }

    SECTION("a single leaf receives the displaced subtree")
    {
        auto t{ make_sample_tree() };
        auto t2{ make_sample_tree_2() };
        t2.drop_node("b2");

        t.insert_tree(t2, { .child_id = "aa0", .key = key_str("some_key") });
        check_tree_sanity(t);
        check_tree_sanity(t2);
        REQUIRE(t.show() ==
                "{}\n"
                "├── a: {}\n"
                "│   ├── a: []\n"
                "│   │   ├── []\n"
                "│   │   │   └── {}\n"
                "│   │   │       └── a: {}\n"
                "│   │   │           └── some_key: AA0\n"
                "│   │   └── AA1\n"
                "│   └── b: {}\n"
                "└── c: []\n"
                "    ├── C0\n"
                "    └── C1\n");
    }

    SECTION("invalid key below the chosen leaf")
    {
        auto t{ make_sample_tree() };

        REQUIRE_THROWS_AS(t.insert_tree(make_sample_tree_2(), { .child_id = "aa0", .child_id_below = "b2" }), invalid_operation_error);
        REQUIRE_THROWS_AS(t.insert_tree(make_sample_tree_2(), { .child_id = "aa0", .child_id_below = "zz", .key = key_str("k") }), not_found_error);
        REQUIRE(t.show() == sample_tree_repr);
    }

    SECTION("child_id_below needs child_id")
    {
        auto t{ make_sample_tree() };
        REQUIRE_THROWS_AS(t.insert_tree(make_sample_tree_2(), { .parent_id = "c", .child_id_below = "b2" }), std::invalid_argument);
    }
}

TEST_CASE("merge", "[tree][merge]")
{
    SECTION("under a list node the children keep their positions")
    {
        auto t{ make_sample_tree() };
        const auto to_merge{ make_sample_tree_2() };

        t.merge(to_merge, "c");
        check_tree_sanity(t);
        check_tree_sanity(to_merge);
        REQUIRE(t.show() ==
                "{}\n"
                "├── a: {}\n"
                "│   ├── a: []\n"
                "│   │   ├── AA0\n"
                "│   │   └── AA1\n"
                "│   └── b: {}\n"
                "└── c: []\n"
                "    ├── {}\n"
                "    │   └── a: {}\n"
                "    ├── {}\n"
                "    ├── C0\n"
                "    └── C1\n");

        /* the incoming root is discarded */
        REQUIRE_FALSE(t.contains("broot"));
        REQUIRE(t.get_key("b1") == to_merge.get_key("b1"));
        REQUIRE(t.get_key("b2") == key_pos(1));
        REQUIRE(t.get_key("c0") == key_pos(2));
        REQUIRE(t.get("b1").second == to_merge.get("b1").second);

        REQUIRE_THROWS_AS(t.merge(to_merge, "c"), duplicated_node_error);
        REQUIRE_THROWS_AS(t.merge(to_merge, "aa0"), invalid_operation_error);
        check_tree_sanity(t);
    }

    SECTION("under a keyed node the keys are kept")
    {
        auto t{ make_sample_tree() };
        tree incoming{};
        incoming.insert_node(node::make("other_root"));
        incoming.insert_node(make_leaf("x", "X"), { .parent_id = "other_root", .key = key_str("x") });
        incoming.insert_node(make_leaf("y", "Y"), { .parent_id = "other_root", .key = key_str("y") });

        t.merge(incoming);
        REQUIRE(t.get("x").first == key_str("x"));
        REQUIRE(t.parent_id("y") == "root");
        REQUIRE_FALSE(t.contains("other_root"));
        check_tree_sanity(t);
    }

    SECTION("key collisions and kind mismatches are refused before any change")
    {
        auto t{ make_sample_tree() };
        tree colliding{};
        colliding.insert_node(node::make("other_root"));
        colliding.insert_node(make_leaf("x", "X"), { .parent_id = "other_root", .key = key_str("x") });
        colliding.insert_node(make_leaf("y", "Y"), { .parent_id = "other_root", .key = key_str("c") });

        REQUIRE_THROWS_AS(t.merge(colliding), duplicated_key_error);
        REQUIRE_THROWS_AS(t.merge(make_sample_tree_2(), "a"), invalid_operation_error);
        REQUIRE_THROWS_AS(t.merge(colliding, "c"), invalid_operation_error);
        REQUIRE_THROWS_AS(t.merge(colliding, "missing"), not_found_error);
        REQUIRE(t.show() == sample_tree_repr);
    }

    SECTION("on an empty tree the whole tree is taken")
    {
        tree t{};
        t.merge(make_sample_tree_2());
        check_tree_sanity(t);
        REQUIRE(t.show() ==
                "[]\n"
                "├── {}\n"
                "│   └── a: {}\n"
                "└── {}\n");
        REQUIRE(t.contains("broot"));

        tree other{};
        REQUIRE_THROWS_AS(other.merge(make_sample_tree_2(), "b1"), not_found_error);
    }
}

TEST_CASE("drop node", "[tree][drop]")
{
    SECTION("with children")
    {
        auto t{ make_sample_tree() };
        const auto [key, dropped]{ t.drop_node("aa") };

        check_tree_sanity(t);
        REQUIRE(key == key_str("a"));
        REQUIRE(dropped->identifier() == "aa");
        for (const auto* nid : { "aa", "aa0", "aa1" })
            REQUIRE_FALSE(t.contains(nid));
        REQUIRE(t.size() == 6);
        REQUIRE(t.show() ==
                "{}\n"
                "├── a: {}\n"
                "│   └── b: {}\n"
                "└── c: []\n"
                "    ├── C0\n"
                "    └── C1\n");
    }

    SECTION("list positions are renumbered")
    {
        auto t{ make_sample_tree() };
        REQUIRE(t.drop_node("c0").first == key_pos(0));
        REQUIRE(t.get_key("c1") == key_pos(0));
        check_tree_sanity(t);
    }

    SECTION("without children the children are rebased")
    {
        auto t{ make_sample_tree() };
        const auto [key, dropped]{ t.drop_node("a", false) };

        check_tree_sanity(t);
        REQUIRE(key == key_str("a"));
        REQUIRE(dropped->identifier() == "a");
        REQUIRE_FALSE(t.contains("a"));
        REQUIRE(t.get_key("aa") == key_str("a"));
        REQUIRE(t.get_key("ab") == key_str("b"));
        REQUIRE(t.show() ==
                "{}\n"
                "├── a: []\n"
                "│   ├── AA0\n"
                "│   └── AA1\n"
                "├── b: {}\n"
                "└── c: []\n"
                "    ├── C0\n"
                "    └── C1\n");
    }

    SECTION("rebased list children take the vacated position")
    {
        tree t{};
        t.insert_node(node::make("l", { .keyed = false }));
        t.insert_node(make_leaf("first", "F"), { .parent_id = "l" });
        t.insert_node(node::make("inner", { .keyed = false }), { .parent_id = "l" });
        t.insert_node(make_leaf("last", "L"), { .parent_id = "l" });
        t.insert_node(make_leaf("x", "X"), { .parent_id = "inner" });
        t.insert_node(make_leaf("y", "Y"), { .parent_id = "inner" });

        REQUIRE(t.drop_node("inner", false).first == key_pos(1));
        REQUIRE(t.children_ids("l") == std::vector<std::string>{ "first", "x", "y", "last" });
        check_tree_sanity(t);
    }

    SECTION("rebasing the root")
    {
        auto t{ make_sample_tree() };
        REQUIRE_THROWS_AS(t.drop_node("root", false), multiple_root_error);
        REQUIRE(t.show() == sample_tree_repr);

        t.drop_node("c");
        t.drop_node("root", false);
        REQUIRE(t.root() == "a");
        REQUIRE_FALSE(t.get_key("a").has_value());
        check_tree_sanity(t);

        tree single{};
        single.insert_node(node::make("alone"));
        single.drop_node("alone", false);
        REQUIRE(single.is_empty());
    }

    SECTION("rebasing between keyed and list nodes is refused")
    {
        auto t{ make_sample_tree() };
        REQUIRE_THROWS_AS(t.drop_node("aa", false), invalid_operation_error);
        REQUIRE(t.show() == sample_tree_repr);

        /* also when there is nothing to rebase */
        REQUIRE_THROWS_AS(t.drop_node("c0", false), invalid_operation_error);
        REQUIRE(t.contains("c0"));
        REQUIRE(t.show() == sample_tree_repr);
    }

    SECTION("rebased keys must not collide")
    {
        auto t{ make_sample_tree() };
        t.insert_node(node::make("ac"), { .parent_id = "a", .key = key_str("c") });

        REQUIRE_THROWS_AS(t.drop_node("a", false), duplicated_key_error);
        REQUIRE(t.contains("a"));
        check_tree_sanity(t);
    }

    SECTION("missing nodes")
    {
        auto t{ make_sample_tree() };
        REQUIRE_THROWS_AS(t.drop_node("missing"), not_found_error);
        REQUIRE_THROWS_AS(t.drop_subtree("missing"), not_found_error);
    }
}

TEST_CASE("drop subtree", "[tree][drop]")
{
    auto t{ make_sample_tree() };
    const auto [key, removed]{ t.drop_subtree("aa") };

    REQUIRE(key == key_str("a"));
    REQUIRE(id_set(ids_of(removed.list())) == std::set<std::string>{ "aa", "aa0", "aa1" });
    REQUIRE(removed.get_key("aa1") == key_pos(1));
    REQUIRE(id_set(ids_of(t.list())) == std::set<std::string>{ "root", "a", "ab", "c", "c0", "c1" });
    check_tree_sanity(t);
    check_tree_sanity(removed);
    REQUIRE(removed.show() == "[]\n├── AA0\n└── AA1\n");

    SECTION("re-inserting restores the tree")
    {
        t.insert_tree(removed, { .parent_id = "a", .key = key });
        REQUIRE(t.show() == sample_tree_repr);
        check_tree_sanity(t);
    }

    SECTION("dropping the root empties the tree")
    {
        const auto [root_key, whole]{ t.drop_subtree("root") };
        REQUIRE_FALSE(root_key.has_value());
        REQUIRE(t.is_empty());
        REQUIRE(t.size() == 0);
        REQUIRE(whole.size() == 6);
    }
}

TEST_CASE("list positions round trip", "[tree][drop]")
{
    auto t{ make_sample_tree() };
    const auto [key, removed]{ t.drop_subtree("c0") };

    REQUIRE(key == key_pos(0));
    t.insert_tree(removed, { .parent_id = "c", .key = key });
    REQUIRE(t.children_ids("c") == std::vector<std::string>{ "c0", "c1" });
    REQUIRE(t.show() == sample_tree_repr);
}
