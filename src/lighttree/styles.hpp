// lighttree/styles.hpp
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

#include <array>
#include <string_view>

namespace lighttree
{
    /* Glyphs used to draw the branches of a rendered tree */
    struct line_style
    {
        std::string_view    name;
        std::string_view    vertical;   /* normally corresponds to "│" */
        std::string_view    box;        /* normally corresponds to "├── " */
        std::string_view    corner;     /* normally corresponds to "└── " */
    };

    inline constexpr std::array<line_style, 6> line_styles{ {
            { .name = "ascii",     .vertical = "|", .box = "|-- ", .corner = "+-- " },
            { .name = "ascii-ex",  .vertical = "│", .box = "├── ", .corner = "└── " },
            { .name = "ascii-exr", .vertical = "│", .box = "├── ", .corner = "╰── " },
            { .name = "ascii-em",  .vertical = "║", .box = "╠══ ", .corner = "╚══ " },
            { .name = "ascii-emv", .vertical = "║", .box = "╟── ", .corner = "╙── " },
            { .name = "ascii-emh", .vertical = "│", .box = "╞══ ", .corner = "╘══ " }
    } };

    /* throws std::invalid_argument for unknown names */
    [[nodiscard]] const line_style& get_line_style(std::string_view name);
}
