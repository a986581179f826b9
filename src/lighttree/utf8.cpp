// lighttree/utf8.cpp
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


#include "utf8.hpp"

namespace lighttree::utf8
{
    namespace detail
    {
        namespace
        {
            /* number of continuation bytes announced by a leading byte */
            int continuation_count(char c)
            {
                if ((c & mask1) == test1)
                    return 0;
                else if ((c & mask2) == test2)
                    return 1;
                else if ((c & mask3) == test3)
                    return 2;
                else if ((c & mask4) == test4)
                    return 3;
                else
                    return 0; // invalid utf-8 character
            }

            /* byte length of the character starting at str[pos] */
            std::size_t char_size_at(std::string_view str, std::size_t pos)
            {
                std::size_t size{ 1 };
                for (int counter{ continuation_count(str[pos]) }; counter > 0; --counter)
                {
                    if (pos + size >= str.size() or (str[pos + size] & mask_cont) != test_cont)
                        break; // truncated character; stop before the offending byte
                    ++size;
                }
                return size;
            }
        }
    }

    std::size_t length(std::string_view str)
    {
        std::size_t len{ 0 };
        for (std::size_t pos{ 0 }; pos < str.size(); pos += detail::char_size_at(str, pos))
            ++len;
        return len;
    }

    std::string take_first_n_chars(std::string_view str, std::size_t count)
    {
        std::size_t extracted{ 0 };
        std::size_t pos{ 0 };

        for (; extracted < count and pos < str.size(); ++extracted)
            pos += detail::char_size_at(str, pos);

        return std::string{ str.substr(0, pos) };
    }
}
