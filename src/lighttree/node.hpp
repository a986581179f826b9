// lighttree/node.hpp
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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace lighttree
{
    /* Value carried by leaf nodes */
    using scalar = std::variant<bool, std::int64_t, double, std::string>;

    [[nodiscard]] std::string to_string(const scalar& value);

    struct node_attributes
    {
        bool                        keyed{ true };              /* children addressed by string keys, else by position */
        bool                        accepts_children{ true };
        std::optional<std::string>  display{};
        std::optional<scalar>       payload{};
    };

    class node
    {
    public:
        /* left ("start") and right aligned ("end") parts of a rendered line */
        using line_repr_t = std::pair<std::string, std::string>;

        explicit node(std::string identifier, node_attributes attributes = {});

        [[nodiscard]] static std::shared_ptr<node> make(std::string identifier, node_attributes attributes = {});
        [[nodiscard]] static std::shared_ptr<node> make_anonymous(node_attributes attributes = {});

        [[nodiscard]] const std::string& identifier() const noexcept;
        [[nodiscard]] bool keyed() const noexcept;
        [[nodiscard]] bool accepts_children() const noexcept;
        [[nodiscard]] const std::optional<std::string>& display() const noexcept;
        [[nodiscard]] const std::optional<scalar>& payload() const noexcept;

        void set_display(std::optional<std::string> display);
        void set_payload(std::optional<scalar> payload);

        [[nodiscard]] line_repr_t line_repr() const;

    private:
        std::string         identifier_;
        node_attributes     attributes_;
    };

    using node_ptr = std::shared_ptr<node>;


    /* Inline function implementations */

    inline std::shared_ptr<node> node::make(std::string identifier, node_attributes attributes)
    {
        return std::make_shared<node>(std::move(identifier), std::move(attributes));
    }

    inline const std::string& node::identifier() const noexcept
    {
        return identifier_;
    }

    inline bool node::keyed() const noexcept
    {
        return attributes_.keyed;
    }

    inline bool node::accepts_children() const noexcept
    {
        return attributes_.accepts_children;
    }

    inline const std::optional<std::string>& node::display() const noexcept
    {
        return attributes_.display;
    }

    inline const std::optional<scalar>& node::payload() const noexcept
    {
        return attributes_.payload;
    }

    inline void node::set_display(std::optional<std::string> display)
    {
        attributes_.display = std::move(display);
    }

    inline void node::set_payload(std::optional<scalar> payload)
    {
        attributes_.payload = std::move(payload);
    }
}
