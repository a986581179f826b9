// tests/test_show.cpp
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


#include <sstream>

#include <catch2/catch.hpp>

#include "lighttree/styles.hpp"
#include "lighttree/utf8.hpp"
#include "testing_utils.hpp"

using namespace lighttree;
using namespace lighttree::testing;

TEST_CASE("show", "[tree][show]")
{
    const auto t{ make_sample_tree() };

    REQUIRE(t.show() ==
            "{}\n"
            "├── a: {}\n"
            "│   ├── a: []\n"
            "│   │   ├── AA0\n"
            "│   │   └── AA1\n"
            "│   └── b: {}\n"
            "└── c: []\n"
            "    ├── C0\n"
            "    └── C1\n");

    SECTION("limit")
    {
        REQUIRE(t.show({ .limit = 3 }) ==
                "{}\n"
                "├── a: {}\n"
                "│   ├── a: []\n"
                "...\n"
                "(truncated, total number of nodes: 9)\n");

        REQUIRE(t.show({ .limit = 9 }) == t.show());
    }

    SECTION("subtree")
    {
        REQUIRE(t.show({ .nid = "a" }) ==
                "{}\n"
                "├── a: []\n"
                "│   ├── AA0\n"
                "│   └── AA1\n"
                "└── b: {}\n");
    }

    SECTION("reversed without keys")
    {
        REQUIRE(t.show({ .display_key = false, .reverse = true }) ==
                "{}\n"
                "├── []\n"
                "│   ├── C1\n"
                "│   └── C0\n"
                "└── {}\n"
                "    ├── {}\n"
                "    └── []\n"
                "        ├── AA1\n"
                "        └── AA0\n");
    }

    SECTION("sibling order")
    {
        const auto lists_first{ [](const keyed_node& lhs, const keyed_node& rhs)
                                {
                                    return not lhs.second->keyed() and rhs.second->keyed();
                                } };

        REQUIRE(t.show({ .order = lists_first }) ==
                "{}\n"
                "├── c: []\n"
                "│   ├── C0\n"
                "│   └── C1\n"
                "└── a: {}\n"
                "    ├── a: []\n"
                "    │   ├── AA0\n"
                "    │   └── AA1\n"
                "    └── b: {}\n");
    }

    SECTION("filter")
    {
        const auto no_list{ [](const node_key&, const node& n) { return n.keyed(); } };
        REQUIRE(t.show({ .filter = no_list }) ==
                "{}\n"
                "└── a: {}\n"
                "    └── b: {}\n");
    }

    SECTION("line styles")
    {
        REQUIRE(t.show({ .nid = "c", .line_type = "ascii" }) == "[]\n|-- C0\n+-- C1\n");
        REQUIRE(t.show({ .nid = "c", .line_type = "ascii-em" }) == "[]\n╠══ C0\n╚══ C1\n");
        REQUIRE(t.show({ .nid = "c", .line_type = "ascii-exr" }) == "[]\n├── C0\n╰── C1\n");
        REQUIRE_THROWS_AS(t.show({ .line_type = "fancy" }), std::invalid_argument);
    }

    SECTION("custom key delimiter and node representation")
    {
        const auto id_and_depth{ [](const node& n, std::size_t depth) -> node::line_repr_t
                             {
                                 return { n.identifier(), depth == 0 ? "" : "d" + std::to_string(depth) };
                             } };

        REQUIRE(t.show({ .nid = "a", .key_delimiter = " = ", .node_repr = id_and_depth }) ==
                "a\n"
                "├── a = aa" + std::string(48, ' ') + "d1\n"
                "│   ├── aa0" + std::string(47, ' ') + "d2\n"
                "│   └── aa1" + std::string(47, ' ') + "d2\n"
                "└── b = ab" + std::string(48, ' ') + "d1\n");
    }

    SECTION("missing start node")
    {
        REQUIRE_THROWS_AS(t.show({ .nid = "missing" }), not_found_error);
    }
}

TEST_CASE("show empty tree", "[tree][show]")
{
    REQUIRE(tree{}.show().empty());
}

TEST_CASE("show leaves with payload", "[tree][show]")
{
    tree t{};
    t.insert_node(node::make("r"));
    t.insert_node(node::make("n", { .accepts_children = false, .payload = scalar{ std::int64_t{ 12 } } }),
                  { .parent_id = "r", .key = key_str("num") });
    t.insert_node(node::make("s", { .accepts_children = false, .payload = scalar{ std::string{ "text" } } }),
                  { .parent_id = "r", .key = key_str("str") });

    REQUIRE(t.show() == "{}\n├── num: 12\n└── str: text\n");

    std::ostringstream os{};
    os << t;
    REQUIRE(os.str() == t.show());
}

TEST_CASE("line prefix", "[tree][show]")
{
    REQUIRE(tree::line_prefix_repr("ascii-ex", {}).empty());
    REQUIRE(tree::line_prefix_repr("ascii-ex", { true }) == "└── ");
    REQUIRE(tree::line_prefix_repr("ascii-ex", { false }) == "├── ");
    REQUIRE(tree::line_prefix_repr("ascii-ex", { true, false, true }) == "    │   └── ");
    REQUIRE(tree::line_prefix_repr("ascii-ex", { false, false, false }) == "│   │   ├── ");
    REQUIRE(tree::line_prefix_repr("ascii-emv", { false, true }) == "║   ╙── ");
    REQUIRE_THROWS_AS(tree::line_prefix_repr("unknown", { true }), std::invalid_argument);
}

TEST_CASE("line representation", "[tree][show]")
{
    SECTION("no key")
    {
        const auto line{ tree::line_repr("└──", false, ": ", "start message", "end message", 40) };
        REQUIRE(line == "└──start message             end message");
        REQUIRE(utf8::length(line) == 40);
    }

    SECTION("with key")
    {
        const auto line{ tree::line_repr("└── a", true, ": ", "start message", "end message", 40) };
        REQUIRE(line == "└── a: start message         end message");
        REQUIRE(utf8::length(line) == 40);
    }

    SECTION("no key, too long")
    {
        const auto line{ tree::line_repr("└──", false, ": ", "start message", "end message", 15) };
        REQUIRE(line == "└──start mes...");
        REQUIRE(utf8::length(line) == 15);
    }

    SECTION("with key, too long")
    {
        const auto line{ tree::line_repr("└── a", true, ": ", "start message", "end message", 15) };
        REQUIRE(line == "└── a: start...");
        REQUIRE(utf8::length(line) == 15);
    }

    SECTION("no end part is not padded")
    {
        REQUIRE(tree::line_repr("├── ", false, ": ", "short", "", 40) == "├── short");
    }
}

TEST_CASE("line styles are all known", "[tree][show]")
{
    for (const auto& style : line_styles)
    {
        REQUIRE(get_line_style(style.name).name == style.name);
        REQUIRE(utf8::length(style.box) == 4);
        REQUIRE(utf8::length(style.corner) == 4);
        REQUIRE(utf8::length(style.vertical) == 1);
    }
}
