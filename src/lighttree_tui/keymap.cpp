// lighttree_tui/keymap.cpp
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


#include "keymap.hpp"

#include <algorithm>
#include <cctype>
#include <locale>

#include "strings.hpp"
#include "window_detail.hpp"

namespace lighttree::tui::key
{
    namespace
    {
        /* Constants and modifier keys */

        constexpr input_t control_modifier{ 0x1f };
        constexpr wint_t escape{ 0x1b };
        constexpr wint_t delete_char{ 0x7f };
        constexpr wint_t carriage_return{ 0x0d };

        constexpr input_t ctrl(wint_t key)
        {
            return key & control_modifier;
        }

        constexpr input_t alt(wint_t key)
        {
            return detail::input<wint_t>::make(escape, key);
        }

        constexpr input_t f(wint_t no)
        {
            return KEY_F(no);
        }

        constexpr input_t plain(wint_t key)
        {
            return key;
        }

        [[nodiscard]] std::string short_name_of(wint_t key)
        {
            switch (key)
            {
                case KEY_UP:
                    return "▲";
                case KEY_DOWN:
                    return "▼";
                case KEY_LEFT:
                    return "◀";
                case KEY_RIGHT:
                    return "▶";

                case KEY_NPAGE:
                    return "PgDn";
                case KEY_PPAGE:
                    return "PgUp";

                case KEY_HOME:
                    return "Home";
                case KEY_END:
                    return "End";

                case KEY_ENTER:
                case carriage_return:
                    return "Enter";
                case KEY_BACKSPACE:
                case delete_char:
                    return "Bsp";

                default:
                    return "";
            }
        }
    }

    std::string name_of(wint_t first, wint_t second)
    {
        std::string result;

        if (first == escape and second != 0)
        {
            std::locale l{};
            result += "M-";
            result += ::keyname(static_cast<int>(second));
            std::for_each(result.begin(), result.end(), [&l](char& c) { c = std::toupper(c, l); });
            return result;
        }

        if (auto short_name{ short_name_of(first) }; not short_name.empty())
            return short_name;

        if (const char* name{ ::keyname(static_cast<int>(first)) }; name != nullptr)
            result += name;
        else
            result += "(unrecognised)";

        if (result == " ")
            result = "Space";

        return result;
    }

    std::string name_of(const input_t key)
    {
        const auto [first, second]{ detail::input<wint_t>::unmake(key) };
        return name_of(first, second);
    }
}

namespace lighttree::tui
{
    keymap keymap::make_default()
    {
        using namespace key;

        keymap k{};

        k.map_[actions::close_view]     = { plain('q'), ctrl('x'), f(2) };
        k.map_[actions::refresh]        = { ctrl('l') };

        k.map_[actions::select_prev]    = { KEY_UP, ctrl('p') };
        k.map_[actions::select_next]    = { KEY_DOWN, ctrl('n') };
        k.map_[actions::select_first]   = { KEY_HOME, alt('\\') };
        k.map_[actions::select_last]    = { KEY_END, alt('/') };

        k.map_[actions::open_child]     = { ctrl('m'), KEY_ENTER, KEY_RIGHT };
        k.map_[actions::go_back]        = { KEY_LEFT, KEY_BACKSPACE, plain(delete_char), ctrl('h') };

        k.map_[actions::page_up]        = { KEY_PPAGE, ctrl('y') };
        k.map_[actions::page_down]      = { KEY_NPAGE, ctrl('v') };

        return k;
    }

    keymap::map_t keymap::make_viewer_keymap() const
    {
        map_t result;

        for (const auto& [action, val]: map_)
            for (const auto input: val)
                result[input] = action;

        return result;
    }

    std::string keymap::key_for(const actions action) const
    {
        if (not map_.contains(action))
            return "";

        const auto& vec{ map_.at(action) };

        if (vec.empty())
            return "";

        return key::name_of(vec[0]);
    }

    detail::help_bar_content keymap::make_viewer_help_bar()
    {
        detail::help_bar_content bar;

        bar.entries.emplace_back(actions::close_view, strings::action_exit);
        bar.entries.emplace_back(actions::refresh, strings::action_refresh);

        bar.entries.emplace_back(actions::select_prev, strings::action_prev);
        bar.entries.emplace_back(actions::select_next, strings::action_next);

        bar.entries.emplace_back(actions::open_child, strings::action_open);
        bar.entries.emplace_back(actions::go_back, strings::action_back);

        bar.entries.emplace_back(actions::page_up, strings::action_page_up);
        bar.entries.emplace_back(actions::page_down, strings::action_page_down);

        bar.entries.emplace_back(actions::select_first, strings::action_first);
        bar.entries.emplace_back(actions::select_last, strings::action_last);

        return bar;
    }
}
