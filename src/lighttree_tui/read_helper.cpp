// lighttree_tui/read_helper.cpp
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


#include "read_helper.hpp"

namespace lighttree::tui
{
    key::input_t char_read_helper::value() const noexcept
    {
        if (second_input_ == 0)
            return input_;
        else
            return key::detail::input<wint_t>::make(input_, second_input_);
    }

    std::string char_read_helper::key_name() const
    {
        return key::name_of(input_, second_input_);
    }

    /* true if no key arrived before the read timed out */
    bool char_read_helper::is_timeout() const noexcept
    {
        return input_info_ == ERR;
    }

    /* this must always be checked before get_action is called */
    bool char_read_helper::is_resize() const noexcept
    {
        return (input_info_ == KEY_CODE_YES and input_ == KEY_RESIZE);
    }

    /* Reads another char, waiting at most for the window timeout */
    void char_read_helper::extract_char()
    {
        /* do not get new keycode if another key has been got but not acted on */
        if (carry_over_)
            carry_over_ = false;
        else
            force_extract_char();
    }

    void char_read_helper::extract_second_char()
    {
        /* extract second key if key press is alt or esc */
        if (input_ == key_escape and input_info_ == OK)
        {
            timeout(0);
            if (get_wch(&second_input_) == ERR)
                second_input_ = 0;
            timeout(100);
        }
    }

    actions char_read_helper::get_action(const keymap::map_t& keymap) const noexcept
    {
        if (const auto it{ keymap.find(value()) }; it != keymap.end())
            return it->second;

        return actions::unknown;
    }

    /* Consumes queued presses of the same key so held keys do not lag behind */
    std::size_t char_read_helper::extract_multiple_of_same_action(actions target, const keymap::map_t& keymap)
    {
        std::size_t count{ 0 };
        timeout(0);
        for (bool loop{ true }; loop;)
        {
            force_extract_char();
            if (input_info_ == ERR)
            {
                loop = false;
            }
            else if (input_ == key_escape)
            {
                unget_wch(key_escape);
                loop = false;
            }
            else if (is_resize() or get_action(keymap) != target)
            {
                loop = false;
                carry_over_ = true;
            }
            else
            {
                ++count;
            }
        }
        timeout(100);
        return count;
    }

    void char_read_helper::clear()
    {
        timeout(0);
        for (bool loop{ true }; loop;)
        {
            force_extract_char();
            if (input_info_ == ERR)
            {
                loop = false;
            }
            else if (is_resize())
            {
                loop = false;
                carry_over_ = true;
            }
        }
        timeout(100);
    }

    void char_read_helper::force_extract_char()
    {
        input_info_ = get_wch(&input_);
        second_input_ = 0;
    }
}
