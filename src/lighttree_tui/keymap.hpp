// lighttree_tui/keymap.hpp
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

#include <climits>
#include <concepts>
#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <curses.h>

namespace lighttree::tui
{
    namespace key
    {
        namespace detail
        {
            template<int I>
            requires (I * 2 <= sizeof(std::uintmax_t))
            using double_width_int = std::conditional_t<I == 1, std::uint_least16_t,
                                        std::conditional_t<I == 2, std::uint_least32_t,
                                            std::conditional_t<I <= 4, std::uint_least64_t, std::uintmax_t>>>;

            /* A key press, optionally preceded by escape, packed into one integer */
            template<std::unsigned_integral T>
            struct input
            {
                using type = detail::double_width_int<sizeof(T)>;

                static constexpr int bit_count{ sizeof(T) * CHAR_BIT };

                static constexpr type make(T first, T second)
                {
                    return static_cast<type>(first) | (static_cast<type>(second) << bit_count);
                }

                static constexpr std::pair<T, T> unmake(type pair)
                {
                    return std::make_pair(static_cast<T>(pair & ((type{ 1 } << bit_count) - 1)), static_cast<T>(pair >> bit_count));
                }
            };
        }

        using input_t = detail::input<wint_t>::type;

        [[nodiscard]] std::string name_of(wint_t first, wint_t second);
        [[nodiscard]] std::string name_of(input_t key);
    }

    enum class actions : std::int8_t
    {
        /* Special action to act as default */

        unknown = 0,

        /* General actions */

        close_view,
        refresh,

        /* Selection of a child of the current view */

        select_prev,
        select_next,
        select_first,
        select_last,

        /* Moving between views */

        open_child,
        go_back,

        /* Page movement (selection is moved if necessary) */

        page_up,
        page_down,
    };


    namespace detail
    {
        /* forward declaration for help_bar_content in window_detail */
        struct help_bar_content;
    }

    class keymap
    {
    public:
        using map_t = std::unordered_map<key::input_t, actions>;

        keymap() = default;

        static keymap make_default();

        [[nodiscard]] std::string key_for(actions action) const;

        [[nodiscard]] map_t make_viewer_keymap() const;

        [[nodiscard]] static detail::help_bar_content make_viewer_help_bar();

    private:
        std::map<actions, std::vector<key::input_t>> map_;
    };
}
