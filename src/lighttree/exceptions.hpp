// lighttree/exceptions.hpp
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

#include <stdexcept>

namespace lighttree
{
    /* Malformed arguments (unknown traversal mode, empty separator, ...) are
     * reported with std::invalid_argument. */

    class not_found_error : public std::out_of_range
    {
    public:
        using std::out_of_range::out_of_range;
    };

    class multiple_root_error : public std::logic_error
    {
    public:
        using std::logic_error::logic_error;
    };

    class duplicated_node_error : public std::logic_error
    {
    public:
        using std::logic_error::logic_error;
    };

    class duplicated_key_error : public std::logic_error
    {
    public:
        using std::logic_error::logic_error;
    };

    class invalid_operation_error : public std::logic_error
    {
    public:
        using std::logic_error::logic_error;
    };

    class ambiguous_insertion_error : public std::logic_error
    {
    public:
        using std::logic_error::logic_error;
    };
}
