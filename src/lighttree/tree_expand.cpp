// lighttree/tree_expand.cpp
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
#include <deque>

#include <fmt/format.h>

namespace lighttree
{
    struct expansion::iterator::state
    {
        const tree*             source;
        expand_options          options;
        std::deque<keyed_node>  queue{};
        keyed_node              current{};
        bool                    done{ false };
    };

    traversal_mode parse_traversal_mode(std::string_view name)
    {
        if (name == "depth")
            return traversal_mode::depth;
        else if (name == "width")
            return traversal_mode::width;
        else
            throw std::invalid_argument{ fmt::format("parse_traversal_mode: unknown mode <{}>, expected depth or width", name) };
    }

    expansion tree::expand(expand_options options) const
    {
        if (options.nid.has_value())
            ensure_present(*options.nid);

        return expansion{ *this, std::move(options) };
    }

    std::vector<keyed_node> tree::sorted_children(const std::string& nid, const node_order& order, bool reverse) const
    {
        auto result{ children(nid) };

        const auto less{ [&order](const keyed_node& lhs, const keyed_node& rhs)
                         {
                             return order ? order(lhs, rhs) : lhs.first < rhs.first;
                         } };

        /* equal elements keep their relative order in both directions */
        if (reverse)
            std::ranges::stable_sort(result, [&less](const keyed_node& lhs, const keyed_node& rhs) { return less(rhs, lhs); });
        else
            std::ranges::stable_sort(result, less);

        return result;
    }


    /* expansion */

    expansion::expansion(const tree& source, expand_options options) :
            source_{ &source },
            options_{ std::move(options) }
    {
    }

    expansion::iterator expansion::begin() const
    {
        auto st{ std::make_shared<iterator::state>(iterator::state{ .source = source_, .options = options_ }) };

        if (options_.nid.has_value())
            st->queue.push_back(source_->get(*options_.nid));
        else if (not source_->is_empty())
            st->queue.push_back(source_->get(*source_->root()));

        advance(*st);
        return iterator{ std::move(st) };
    }

    void expansion::advance(iterator::state& st)
    {
        const auto& opts{ st.options };

        while (not st.queue.empty())
        {
            auto item{ std::move(st.queue.front()) };
            st.queue.pop_front();

            const bool selected{ not opts.filter or opts.filter(item.first, *item.second) };

            /* filtered out nodes prune their subtree unless filter_through is set */
            if (selected or opts.filter_through)
            {
                auto children{ st.source->sorted_children(item.second->identifier(), opts.order, opts.reverse) };

                if (opts.mode == traversal_mode::depth)
                    st.queue.insert(std::ranges::begin(st.queue), std::make_move_iterator(std::ranges::begin(children)),
                                    std::make_move_iterator(std::ranges::end(children)));
                else
                    st.queue.insert(std::ranges::end(st.queue), std::make_move_iterator(std::ranges::begin(children)),
                                    std::make_move_iterator(std::ranges::end(children)));
            }

            if (selected)
            {
                st.current = std::move(item);
                return;
            }
        }
        st.done = true;
    }


    /* expansion::iterator */

    expansion::iterator::iterator(std::shared_ptr<state> st) :
            state_{ std::move(st) }
    {
    }

    const keyed_node& expansion::iterator::operator*() const
    {
        return state_->current;
    }

    const keyed_node* expansion::iterator::operator->() const
    {
        return &(state_->current);
    }

    expansion::iterator& expansion::iterator::operator++()
    {
        expansion::advance(*state_);
        return *this;
    }

    void expansion::iterator::operator++(int)
    {
        ++*this;
    }

    bool expansion::iterator::at_end() const noexcept
    {
        return state_ == nullptr or state_->done;
    }
}
