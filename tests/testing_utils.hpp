// tests/testing_utils.hpp
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


#pragma once

#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "lighttree/tree.hpp"

namespace lighttree::testing
{
    inline node_key key_str(std::string key)
    {
        return child_key{ std::move(key) };
    }

    inline node_key key_pos(std::int64_t position)
    {
        return child_key{ position };
    }

    inline node_ptr make_leaf(std::string identifier, std::string display)
    {
        return node::make(std::move(identifier), { .accepts_children = false, .display = std::move(display) });
    }

    /*
     * root {}
     * ├── a {}
     * │   ├── aa []
     * │   │   ├── aa0
     * │   │   └── aa1
     * │   └── ab {}
     * └── c []
     *     ├── c0
     *     └── c1
     */
    inline tree make_sample_tree(std::string path_separator = ".")
    {
        tree t{ std::move(path_separator) };
        t.insert_node(node::make("root"));
        t.insert_node(node::make("a"), { .parent_id = "root", .key = key_str("a") });
        t.insert_node(node::make("aa", { .keyed = false }), { .parent_id = "a", .key = key_str("a") });
        t.insert_node(make_leaf("aa0", "AA0"), { .parent_id = "aa" });
        t.insert_node(make_leaf("aa1", "AA1"), { .parent_id = "aa" });
        t.insert_node(node::make("ab"), { .parent_id = "a", .key = key_str("b") });
        t.insert_node(node::make("c", { .keyed = false }), { .parent_id = "root", .key = key_str("c") });
        t.insert_node(make_leaf("c0", "C0"), { .parent_id = "c" });
        t.insert_node(make_leaf("c1", "C1"), { .parent_id = "c" });
        return t;
    }

    /*
     * broot []
     * ├── b1 {}
     * │   └── b1a {}
     * └── b2 {}
     */
    inline tree make_sample_tree_2()
    {
        tree t{};
        t.insert_node(node::make("broot", { .keyed = false }));
        t.insert_node(node::make("b1"), { .parent_id = "broot" });
        t.insert_node(node::make("b1a"), { .parent_id = "b1", .key = key_str("a") });
        t.insert_node(node::make("b2"), { .parent_id = "broot" });
        return t;
    }

    inline std::vector<std::string> ids_of(const std::vector<keyed_node>& nodes)
    {
        std::vector<std::string> result{};
        for (const auto& [key, n] : nodes)
            result.push_back(n->identifier());
        return result;
    }

    inline std::vector<std::string> ids_of(const expansion& nodes)
    {
        std::vector<std::string> result{};
        for (const auto& [key, n] : nodes)
            result.push_back(n->identifier());
        return result;
    }

    inline std::vector<node_key> keys_of(const expansion& nodes)
    {
        std::vector<node_key> result{};
        for (const auto& [key, n] : nodes)
            result.push_back(key);
        return result;
    }

    inline std::set<std::string> id_set(const std::vector<std::string>& ids)
    {
        return { std::ranges::begin(ids), std::ranges::end(ids) };
    }

    /* Structural consistency of a tree, checked through its public interface */
    inline void check_tree_sanity(const tree& t)
    {
        if (t.is_empty())
        {
            REQUIRE(t.size() == 0);
            return;
        }

        std::set<std::string> visited{};

        for (const auto& [key, n] : t.expand())
        {
            const auto& nid{ n->identifier() };

            REQUIRE(visited.insert(nid).second);
            REQUIRE(t.contains(nid));
            REQUIRE(t.get_key(nid) == key);

            if (nid == *t.root())
            {
                REQUIRE_FALSE(key.has_value());
                REQUIRE_THROWS_AS(t.parent_id(nid), not_found_error);
            }
            else
            {
                const auto pid{ t.parent_id(nid) };
                const auto& parent_node{ *t.get(pid).second };
                const auto siblings{ t.children_ids(pid) };

                REQUIRE(parent_node.accepts_children());
                REQUIRE(key.has_value());
                REQUIRE(std::ranges::find(siblings, nid) != std::ranges::end(siblings));

                if (parent_node.keyed())
                    REQUIRE(std::holds_alternative<std::string>(*key));
                else
                    REQUIRE(std::holds_alternative<std::int64_t>(*key));
            }

            std::int64_t position{ 0 };
            for (const auto& [ckey, child] : t.children(nid))
            {
                REQUIRE(t.parent_id(child->identifier()) == nid);
                if (not n->keyed())
                    REQUIRE(ckey == key_pos(position++));
            }

            if (not n->accepts_children())
                REQUIRE(t.is_leaf(nid));
        }

        REQUIRE(visited.size() == t.size());
    }
}
