// lighttree_tui/strings.hpp
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

#include <cstddef>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "lighttree/utf8.hpp"

namespace lighttree::tui::strings
{
    /* Stores a constant C style string and its utf-8 length */
    class text_string
    {
    public:
        explicit text_string(const char* c_str) noexcept;
        [[nodiscard]] const char* c_str() const noexcept;
        [[nodiscard]] std::string_view str_view() const noexcept;
        [[nodiscard]] int length() const noexcept;

    private:
        const char*         text_;
        int                 size_;
    };

    class text_fstring_result;

    template<std::size_t I>
    class text_fstring
    {
    public:
        explicit text_fstring(const char* c_str) noexcept;

        template<typename... Ts>
        requires (sizeof...(Ts) == I)
        [[nodiscard]] text_fstring_result operator()(const Ts&... args) const;

    private:
        const char*         text_;
    };

    class text_fstring_result
    {
    public:
        [[nodiscard]] const char* c_str() const noexcept;
        [[nodiscard]] std::string_view str_view() const noexcept;
        [[nodiscard]] int length() const noexcept;

        template<std::size_t>
        friend class text_fstring;
    private:
        text_fstring_result() = default;

        std::string         text_;
        int                 size_{ 0 };
    };

    /* Strings used in window (known at compile time) */

    inline const text_string program_name           { "lighttree_view" };
    inline const text_fstring<1> unbound_key        { "Unbound key {}" };
    inline const text_fstring<2> read_success       { "Loaded {} nodes from {}" };
    inline const text_string empty_document         { "Document is empty" };
    inline const text_string no_children            { "Nothing to open" };
    inline const text_string at_top                 { "Already at the top" };
    inline const text_fstring<1> opened             { "Opened {}" };
    inline const text_string top_level              { "(top level)" };

    inline const text_string action_exit            { "Exit" };
    inline const text_string action_prev            { "Previous" };
    inline const text_string action_next            { "Next" };
    inline const text_string action_open            { "Open" };
    inline const text_string action_back            { "Back" };
    inline const text_string action_page_up         { "Prev Page" };
    inline const text_string action_page_down       { "Next Page" };
    inline const text_string action_first           { "First" };
    inline const text_string action_last            { "Last" };
    inline const text_string action_refresh         { "Refresh" };

    /* Strings used outside of window */

    inline const text_fstring<1> usage              { "usage: {} [--line-type=STYLE] FILE.json" };
    inline const text_fstring<2> error_reading      { "Error reading {}: {}" };
    inline const text_fstring<1> unknown_option     { "Unknown option {}" };
    inline const text_fstring<1> received           { "Received {}" };
    inline const text_string cannot_open            { "cannot open file" };


    /* Inline function implementations for text_string */

    inline text_string::text_string(const char* c_str) noexcept :
            text_{ c_str },
            size_{ static_cast<int>(utf8::length(text_)) }
    {
    }

    inline const char* text_string::c_str() const noexcept
    {
        return text_;
    }

    inline std::string_view text_string::str_view() const noexcept
    {
        return text_;
    }

    inline int text_string::length() const noexcept
    {
        return size_;
    }


    /* Inline function implementations for text_fstring and text_fstring_result */

    template<std::size_t I>
    inline text_fstring<I>::text_fstring(const char* c_str) noexcept :
            text_{ c_str }
    {
    }

    template<std::size_t I>
    template<typename... Ts>
    requires (sizeof...(Ts) == I)
    inline text_fstring_result text_fstring<I>::operator()(const Ts&... args) const
    {
        text_fstring_result result{};
        result.text_ = fmt::vformat(text_, fmt::make_format_args(args...));
        result.size_ = static_cast<int>(utf8::length(result.text_));
        return result;
    }

    inline const char* text_fstring_result::c_str() const noexcept
    {
        return text_.c_str();
    }

    inline std::string_view text_fstring_result::str_view() const noexcept
    {
        return text_;
    }

    inline int text_fstring_result::length() const noexcept
    {
        return size_;
    }
}
