// lighttree/json_tree.hpp
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

#include <string>
#include <string_view>

#include "tree.hpp"

namespace YAML
{
    class Node;
}

namespace lighttree
{
    /* JSON objects become keyed nodes, arrays list nodes, and every other value a
     * leaf carrying it as payload (null leaves carry no payload and display "null").
     * Nodes get anonymous identifiers. Malformed documents throw std::invalid_argument. */

    [[nodiscard]] tree tree_from_json(std::string_view json_text, std::string path_separator = ".");
    [[nodiscard]] tree tree_from_document(const YAML::Node& document, std::string path_separator = ".");

    /* keyed children are written in key order; an empty tree gives "null" */
    [[nodiscard]] std::string tree_to_json(const tree& t);

    /* Identifier-based form: root, path_separator, nodes, parent_of, children_of.
     * deserialize_tree rebuilds the exact tree, including identifiers. */

    [[nodiscard]] std::string serialize(const tree& t);
    [[nodiscard]] std::string serialize(const node& n);
    [[nodiscard]] tree deserialize_tree(std::string_view text);
    [[nodiscard]] node_ptr deserialize_node(std::string_view text);
}
