// lighttree/interactive_tree.hpp
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

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "tree.hpp"

namespace lighttree
{
    /* Browsable view of a tree. Each child of the root is reachable by name
     * (its string key, or "i<position>" below list nodes) and is itself an
     * interactive_tree over a shallow subtree. Children are built one level at a
     * time, on first access. */
    class interactive_tree
    {
    public:
        explicit interactive_tree(tree t, std::optional<std::string> path = {});

        interactive_tree(const interactive_tree&) = delete;
        interactive_tree(interactive_tree&&) = default;
        interactive_tree& operator=(const interactive_tree&) = delete;
        interactive_tree& operator=(interactive_tree&&) = default;
        ~interactive_tree() = default;

        [[nodiscard]] std::vector<std::string> attributes() const;
        [[nodiscard]] bool has_attribute(const std::string& name) const;
        [[nodiscard]] interactive_tree& operator[](const std::string& name);

        [[nodiscard]] const tree& operator()() const noexcept;
        [[nodiscard]] const std::optional<std::string>& path() const noexcept;
        [[nodiscard]] std::string show(const show_options& options = {}) const;

        [[nodiscard]] static std::string attribute_name(const node_key& key);

    private:
        void expand_children();

        tree                                                                tree_;
        std::optional<std::string>                                          path_;   /* unset for the initial tree */
        std::optional<std::vector<std::pair<std::string, std::unique_ptr<interactive_tree>>>>  children_{};
    };


    /* Inline function implementations */

    inline const tree& interactive_tree::operator()() const noexcept
    {
        return tree_;
    }

    inline const std::optional<std::string>& interactive_tree::path() const noexcept
    {
        return path_;
    }
}
