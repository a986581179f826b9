// lighttree/tree.hpp
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
#include <functional>
#include <iosfwd>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "exceptions.hpp"
#include "node.hpp"

namespace lighttree
{
    /* Address of a node under its parent: a string for keyed parents, a position
     * for list parents, and no value at all for the root. */
    using child_key = std::variant<std::string, std::int64_t>;
    using node_key = std::optional<child_key>;
    using keyed_node = std::pair<node_key, node_ptr>;

    using node_filter = std::function<bool(const node_key&, const node&)>;
    using node_order = std::function<bool(const keyed_node&, const keyed_node&)>;  /* strict weak ordering */
    using node_repr_fn = std::function<node::line_repr_t(const node&, std::size_t depth)>;

    [[nodiscard]] std::string to_string(const node_key& key);

    enum class traversal_mode : std::int8_t
    {
        depth,      /* pre-order, children are visited before siblings */
        width       /* level by level */
    };

    [[nodiscard]] traversal_mode parse_traversal_mode(std::string_view name);

    /* Locator of an insertion. Without parent_id and child_id the tree must be empty.
     * With parent_id the inserted element becomes a child of that node under key.
     * With child_id the inserted element takes the place of that node, which is
     * re-attached below it under key (for trees: below child_id_below, or below the
     * single leaf of the inserted tree). */
    struct insert_position
    {
        std::optional<std::string>  parent_id{};
        std::optional<std::string>  child_id{};
        std::optional<std::string>  child_id_below{};
        node_key                    key{};
        bool                        by_path{ false };   /* parent_id and child_id are paths */
    };

    struct list_options
    {
        std::optional<std::vector<std::string>>     id_in{};
        std::optional<std::vector<std::size_t>>     depth_in{};
        node_filter                                 filter{};
    };

    struct expand_options
    {
        std::optional<std::string>  nid{};
        traversal_mode              mode{ traversal_mode::depth };
        node_filter                 filter{};
        bool                        filter_through{ false };
        node_order                  order{};            /* defaults to ordering by key */
        bool                        reverse{ false };
    };

    struct show_options
    {
        std::optional<std::string>  nid{};
        node_filter                 filter{};
        bool                        display_key{ true };
        bool                        reverse{ false };
        node_order                  order{};            /* sibling order, defaults to ordering by key */
        std::string                 line_type{ "ascii-ex" };
        std::optional<std::size_t>  limit{};
        std::size_t                 line_max_length{ 60 };
        std::string                 key_delimiter{ ": " };
        node_repr_fn                node_repr{};        /* defaults to node::line_repr */
    };

    struct node_location
    {
        std::vector<bool>   is_last_list;   /* one entry per level below the start node */
        node_key            key;
        node_ptr            node;
    };

    class tree;

    /* Lazy sequence of (key, node) pairs produced by tree::expand.
     * Every call to begin() restarts the walk. The tree must outlive the sequence
     * and must not be modified while it is being consumed. */
    class expansion
    {
    public:
        class iterator
        {
        public:
            using value_type = keyed_node;
            using difference_type = std::ptrdiff_t;

            iterator() = default;

            [[nodiscard]] const keyed_node& operator*() const;
            [[nodiscard]] const keyed_node* operator->() const;
            iterator& operator++();
            void operator++(int);

            friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept
            {
                return it.at_end();
            }

        private:
            friend class expansion;
            struct state;

            explicit iterator(std::shared_ptr<state> st);
            [[nodiscard]] bool at_end() const noexcept;

            std::shared_ptr<state> state_{};
        };

        [[nodiscard]] iterator begin() const;
        [[nodiscard]] std::default_sentinel_t end() const noexcept;

    private:
        friend class tree;

        expansion(const tree& source, expand_options options);

        static void advance(iterator::state& st);

        const tree*     source_;
        expand_options  options_;
    };

    class tree
    {
    public:
        explicit tree(std::string path_separator = ".");

        tree(const tree&) = delete;
        tree(tree&&) = default;
        tree& operator=(const tree&) = delete;
        tree& operator=(tree&&) = default;
        ~tree() = default;

        /* Queries */

        [[nodiscard]] const std::optional<std::string>& root() const noexcept;
        [[nodiscard]] std::size_t size() const noexcept;
        [[nodiscard]] bool is_empty() const noexcept;
        [[nodiscard]] const std::string& path_separator() const noexcept;
        [[nodiscard]] bool contains(const std::string& nid) const;

        [[nodiscard]] keyed_node get(const std::string& nid) const;
        [[nodiscard]] node_key get_key(const std::string& nid) const;
        [[nodiscard]] std::vector<keyed_node> list(const list_options& options = {}) const;

        [[nodiscard]] std::string parent_id(const std::string& nid) const;
        [[nodiscard]] keyed_node parent(const std::string& nid) const;
        [[nodiscard]] std::vector<std::string> children_ids(const std::string& nid) const;
        [[nodiscard]] std::vector<keyed_node> children(const std::string& nid) const;
        [[nodiscard]] std::vector<std::string> siblings_ids(const std::string& nid) const;
        [[nodiscard]] std::vector<keyed_node> siblings(const std::string& nid) const;
        [[nodiscard]] bool is_leaf(const std::string& nid) const;
        [[nodiscard]] std::size_t depth(const std::string& nid) const;
        [[nodiscard]] std::vector<std::string> ancestors_ids(const std::string& nid, bool from_root = false, bool include_current = false) const;
        [[nodiscard]] std::vector<keyed_node> ancestors(const std::string& nid, bool from_root = false, bool include_current = false) const;
        [[nodiscard]] std::vector<std::string> leaves_ids(const std::optional<std::string>& nid = {}) const;
        [[nodiscard]] std::vector<keyed_node> leaves(const std::optional<std::string>& nid = {}) const;

        [[nodiscard]] std::string get_node_id_by_path(std::string_view path) const;
        [[nodiscard]] std::string get_path(const std::string& nid) const;

        /* Structural editing */

        node_key insert_node(node_ptr new_node, const insert_position& position = {});
        node_key insert_tree(const tree& new_tree, const insert_position& position = {});
        node_key insert(node_ptr new_node, const insert_position& position = {});
        node_key insert(const tree& new_tree, const insert_position& position = {});

        keyed_node drop_node(const std::string& nid, bool with_children = true);
        std::pair<node_key, tree> drop_subtree(const std::string& nid);

        [[nodiscard]] std::pair<node_key, tree> subtree(const std::string& nid, bool deep = false) const;
        [[nodiscard]] tree clone(bool with_nodes = true, bool deep = false, const std::optional<std::string>& new_root = {}) const;
        void merge(const tree& new_tree, const std::optional<std::string>& nid = {});

        /* Traversal and rendering */

        [[nodiscard]] expansion expand(expand_options options = {}) const;
        [[nodiscard]] std::vector<node_location> nodes_with_location(const std::optional<std::string>& nid = {},
                                                                     const node_filter& filter = {},
                                                                     bool reverse = false,
                                                                     const node_order& order = {}) const;
        [[nodiscard]] std::string show(const show_options& options = {}) const;

        [[nodiscard]] static std::string line_prefix_repr(std::string_view line_type, const std::vector<bool>& is_last_list);
        [[nodiscard]] static std::string line_repr(std::string_view prefix, bool is_key_displayed, std::string_view key_delimiter,
                                                   std::string_view start, std::string_view end, std::size_t max_length);

    private:
        friend class expansion;

        void ensure_present(const std::string& nid) const;
        [[nodiscard]] const std::string& resolve_start(const std::optional<std::string>& nid) const;
        [[nodiscard]] std::optional<std::string> resolve_locator(const std::optional<std::string>& id_or_path, bool by_path) const;
        [[nodiscard]] const node& node_of(const std::string& nid) const;
        [[nodiscard]] child_key validate_child_key(const std::string& pid, const node_key& key) const;
        void ensure_no_collision(const tree& new_tree, bool skip_root) const;
        node_key insert_tree_above(const tree& new_tree, const std::string& cid, const std::string& below, const node_key& key);
        [[nodiscard]] std::vector<keyed_node> sorted_children(const std::string& nid, const node_order& order, bool reverse) const;
        void collect_locations(const std::string& nid, const node_key& key, const node_filter& filter, bool reverse,
                               const node_order& order, std::vector<bool>& is_last_list, std::vector<node_location>& result) const;

        /* The only functions touching the indices */
        void register_root(node_ptr new_node);
        void register_child(node_ptr new_node, const std::string& pid, const child_key& key);
        void unregister_leaf(const std::string& nid);

        /* copies the subtree of src rooted at src_nid into this tree, below pid (or as root) */
        void graft(const tree& src, const std::string& src_nid, const std::optional<std::string>& pid, const node_key& key, bool deep);

        std::optional<std::string>                                              root_{};
        std::unordered_map<std::string, node_ptr>                               nodes_map_{};
        std::unordered_map<std::string, std::string>                            nodes_parent_{};
        std::unordered_map<std::string, std::map<std::string, std::string>>     nodes_children_map_{};  /* child id -> key */
        std::unordered_map<std::string, std::vector<std::string>>               nodes_children_list_{};
        std::string                                                             path_separator_;
    };

    std::ostream& operator<<(std::ostream& os, const tree& t);


    /* Inline function implementations */

    inline const std::optional<std::string>& tree::root() const noexcept
    {
        return root_;
    }

    inline std::size_t tree::size() const noexcept
    {
        return nodes_map_.size();
    }

    inline bool tree::is_empty() const noexcept
    {
        return not root_.has_value();
    }

    inline const std::string& tree::path_separator() const noexcept
    {
        return path_separator_;
    }

    inline bool tree::contains(const std::string& nid) const
    {
        return nodes_map_.contains(nid);
    }

    inline node_key tree::insert(node_ptr new_node, const insert_position& position)
    {
        return insert_node(std::move(new_node), position);
    }

    inline node_key tree::insert(const tree& new_tree, const insert_position& position)
    {
        return insert_tree(new_tree, position);
    }

    inline std::default_sentinel_t expansion::end() const noexcept
    {
        return std::default_sentinel;
    }
}
