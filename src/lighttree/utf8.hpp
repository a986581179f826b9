// lighttree/utf8.hpp
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

namespace lighttree::utf8
{
    /* Free functions for strings containing utf-8 characters.
     * Invalid bytes are counted as one character each. */

    [[nodiscard]] std::size_t length(std::string_view str);
    [[nodiscard]] std::string take_first_n_chars(std::string_view str, std::size_t count);

    /* bit masks for checking for multibyte Unicode characters */
    /* source: https://en.wikipedia.org/wiki/UTF-8#Encoding */

    constexpr int mask1{ 0b1000'0000 };
    constexpr int mask2{ 0b1110'0000 };
    constexpr int mask3{ 0b1111'0000 };
    constexpr int mask4{ 0b1111'1000 };

    constexpr int test1{ 0b0000'0000 };
    constexpr int test2{ 0b1100'0000 };
    constexpr int test3{ 0b1110'0000 };
    constexpr int test4{ 0b1111'0000 };

    constexpr int mask_cont{ 0b1100'0000 };
    constexpr int test_cont{ 0b1000'0000 };
}
