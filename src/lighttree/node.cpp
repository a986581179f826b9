// lighttree/node.cpp
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


#include "node.hpp"

#include <random>
#include <stdexcept>

#include <fmt/format.h>

namespace lighttree
{
    namespace detail
    {
        namespace
        {
            template<typename... Ts>
            struct overload : Ts ... { using Ts::operator()...; };

            /* random (version 4) uuid in its canonical textual form */
            std::string make_uuid4()
            {
                static thread_local std::mt19937_64 engine{ std::random_device{}() };

                const std::uint64_t hi{ (engine() & 0xFFFF'FFFF'FFFF'0FFFull) | 0x0000'0000'0000'4000ull };
                const std::uint64_t lo{ (engine() & 0x3FFF'FFFF'FFFF'FFFFull) | 0x8000'0000'0000'0000ull };

                return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                                   hi >> 32, (hi >> 16) & 0xFFFF, hi & 0xFFFF,
                                   lo >> 48, lo & 0xFFFF'FFFF'FFFFull);
            }
        }
    }

    std::string to_string(const scalar& value)
    {
        return std::visit(detail::overload{
                [](bool b) -> std::string { return b ? "true" : "false"; },
                [](std::int64_t i) -> std::string { return fmt::format("{}", i); },
                [](double d) -> std::string
                {
                    auto result{ fmt::format("{}", d) };
                    /* keep the value recognisable as floating point */
                    if (result.find_first_of(".eEn") == std::string::npos)
                        result += ".0";
                    return result;
                },
                [](const std::string& s) -> std::string { return s; }
        }, value);
    }

    node::node(std::string identifier, node_attributes attributes) :
            identifier_{ std::move(identifier) },
            attributes_{ std::move(attributes) }
    {
        if (identifier_.empty())
            throw std::invalid_argument{ "node: identifier must not be empty" };
    }

    std::shared_ptr<node> node::make_anonymous(node_attributes attributes)
    {
        return std::make_shared<node>(detail::make_uuid4(), std::move(attributes));
    }

    node::line_repr_t node::line_repr() const
    {
        if (attributes_.display.has_value())
            return { *attributes_.display, "" };
        else if (not attributes_.accepts_children)
            return { attributes_.payload.transform([](const scalar& s) { return to_string(s); }).value_or(""), "" };
        else
            return { attributes_.keyed ? "{}" : "[]", "" };
    }
}
