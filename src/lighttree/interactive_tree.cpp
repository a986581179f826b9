// lighttree/interactive_tree.cpp
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


#include "interactive_tree.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace lighttree
{
    namespace detail
    {
        namespace
        {
            std::vector<keyed_node> root_children_by_key(const tree& t)
            {
                if (t.is_empty())
                    return {};

                auto result{ t.children(*t.root()) };
                std::ranges::stable_sort(result, {}, &keyed_node::first);
                return result;
            }
        }
    }

    interactive_tree::interactive_tree(tree t, std::optional<std::string> path) :
            tree_{ std::move(t) },
            path_{ std::move(path) }
    {
    }

    std::string interactive_tree::attribute_name(const node_key& key)
    {
        if (key.has_value() and std::holds_alternative<std::int64_t>(*key))
            return fmt::format("i{}", std::get<std::int64_t>(*key));
        else
            return to_string(key);
    }

    std::vector<std::string> interactive_tree::attributes() const
    {
        std::vector<std::string> result{};

        for (const auto& [key, n] : detail::root_children_by_key(tree_))
            result.push_back(attribute_name(key));

        return result;
    }

    bool interactive_tree::has_attribute(const std::string& name) const
    {
        const auto names{ attributes() };
        return std::ranges::find(names, name) != std::ranges::end(names);
    }

    interactive_tree& interactive_tree::operator[](const std::string& name)
    {
        expand_children();

        const auto it{ std::ranges::find_if(*children_, [&name](const auto& child) { return child.first == name; }) };

        if (it == std::ranges::end(*children_))
            throw not_found_error{ fmt::format("interactive_tree: no attribute <{}>", name) };

        return *(it->second);
    }

    std::string interactive_tree::show(const show_options& options) const
    {
        if (path_.has_value())
            return fmt::format("<interactive_tree subpart: {}>\n{}", *path_, tree_.show(options));
        else
            return fmt::format("<interactive_tree>\n{}", tree_.show(options));
    }

    void interactive_tree::expand_children()
    {
        if (children_.has_value())
            return;

        children_.emplace();

        for (const auto& [key, n] : detail::root_children_by_key(tree_))
        {
            auto child_path{ path_.has_value() ? fmt::format("{}{}{}", *path_, tree_.path_separator(), to_string(key))
                                               : to_string(key) };

            children_->emplace_back(attribute_name(key),
                                    std::make_unique<interactive_tree>(tree_.subtree(n->identifier()).second, std::move(child_path)));
        }
    }
}
