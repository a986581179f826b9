// lighttree/tree_show.cpp
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


#include "tree.hpp"

#include <algorithm>
#include <ostream>
#include <ranges>

#include <fmt/format.h>

#include "styles.hpp"
#include "utf8.hpp"

namespace lighttree
{
    namespace detail
    {
        namespace
        {
            std::string make_prefix(const line_style& style, const std::vector<bool>& is_last_list)
            {
                std::string result{};

                if (is_last_list.empty())
                    return result;

                for (const bool is_last : is_last_list | std::views::take(is_last_list.size() - 1))
                {
                    if (is_last)
                    {
                        result += "    ";
                    }
                    else
                    {
                        result += style.vertical;
                        result += "   ";
                    }
                }

                result += is_last_list.back() ? style.corner : style.box;
                return result;
            }
        }
    }

    const line_style& get_line_style(std::string_view name)
    {
        const auto it{ std::ranges::find(line_styles, name, &line_style::name) };

        if (it == std::ranges::end(line_styles))
            throw std::invalid_argument{ fmt::format("get_line_style: unknown line type <{}>", name) };

        return *it;
    }

    std::vector<node_location> tree::nodes_with_location(const std::optional<std::string>& nid, const node_filter& filter, bool reverse,
                                                         const node_order& order) const
    {
        std::vector<node_location> result{};

        if (not nid.has_value() and is_empty())
            return result;

        const std::string start{ resolve_start(nid) };
        const auto key{ get_key(start) };

        if (filter and not filter(key, node_of(start)))
            return result;

        std::vector<bool> is_last_list{};
        collect_locations(start, key, filter, reverse, order, is_last_list, result);

        return result;
    }

    void tree::collect_locations(const std::string& nid, const node_key& key, const node_filter& filter, bool reverse,
                                 const node_order& order, std::vector<bool>& is_last_list, std::vector<node_location>& result) const
    {
        result.push_back({ .is_last_list = is_last_list, .key = key, .node = nodes_map_.at(nid) });

        auto children{ sorted_children(nid, order, reverse) };

        if (filter)
            std::erase_if(children, [&filter](const keyed_node& kn) { return not filter(kn.first, *kn.second); });

        for (std::size_t i{ 0 }; i < children.size(); ++i)
        {
            is_last_list.push_back(i + 1 == children.size());
            collect_locations(children[i].second->identifier(), children[i].first, filter, reverse, order, is_last_list, result);
            is_last_list.pop_back();
        }
    }

    std::string tree::show(const show_options& options) const
    {
        const auto& style{ get_line_style(options.line_type) };

        std::string output{};
        std::size_t line_count{ 0 };

        for (const auto& [is_last_list, key, n] : nodes_with_location(options.nid, options.filter, options.reverse, options.order))
        {
            auto prefix{ detail::make_prefix(style, is_last_list) };
            /* the start node is drawn as a root, without its key */
            const bool is_key_displayed{ options.display_key and not is_last_list.empty() and std::holds_alternative<std::string>(*key) };

            if (is_key_displayed)
                prefix += std::get<std::string>(*key);

            const auto [start, end]{ options.node_repr ? options.node_repr(*n, is_last_list.size()) : n->line_repr() };

            output += line_repr(prefix, is_key_displayed, options.key_delimiter, start, end, options.line_max_length);
            output += '\n';

            if (options.limit.has_value() and ++line_count == *options.limit)
            {
                output += fmt::format("...\n(truncated, total number of nodes: {})\n", size());
                return output;
            }
        }
        return output;
    }

    std::string tree::line_prefix_repr(std::string_view line_type, const std::vector<bool>& is_last_list)
    {
        return detail::make_prefix(get_line_style(line_type), is_last_list);
    }

    std::string tree::line_repr(std::string_view prefix, bool is_key_displayed, std::string_view key_delimiter,
                                std::string_view start, std::string_view end, std::size_t max_length)
    {
        std::string left{ prefix };

        if (is_key_displayed)
            left += key_delimiter;

        left += start;

        const auto left_length{ utf8::length(left) };
        const auto end_length{ utf8::length(end) };

        if (left_length + end_length <= max_length)
        {
            /* right align the end part */
            if (not end.empty())
            {
                left.append(max_length - left_length - end_length, ' ');
                left += end;
            }
            return left;
        }

        if (not end.empty())
        {
            left += ' ';
            left += end;
        }

        return utf8::take_first_n_chars(left, max_length > 3 ? max_length - 3 : 0) + "...";
    }

    std::ostream& operator<<(std::ostream& os, const tree& t)
    {
        return os << t.show();
    }
}
