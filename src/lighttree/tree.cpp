// lighttree/tree.cpp
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


#include "tree.hpp"

#include <algorithm>
#include <charconv>
#include <ranges>

#include <fmt/format.h>

namespace lighttree
{
    namespace detail
    {
        namespace
        {
            template<typename... Ts>
            struct overload : Ts ... { using Ts::operator()...; };

            std::vector<std::string_view> split(std::string_view str, std::string_view separator)
            {
                std::vector<std::string_view> result{};

                for (std::size_t pos{ str.find(separator) }; pos != std::string_view::npos; pos = str.find(separator))
                {
                    result.push_back(str.substr(0, pos));
                    str.remove_prefix(pos + separator.size());
                }
                result.push_back(str);

                return result;
            }

            std::optional<std::int64_t> parse_position(std::string_view str)
            {
                std::int64_t result{};
                const auto [ptr, ec]{ std::from_chars(str.data(), str.data() + str.size(), result) };

                if (ec != std::errc{} or ptr != str.data() + str.size() or result < 0)
                    return std::nullopt;
                else
                    return result;
            }
        }
    }

    std::string to_string(const node_key& key)
    {
        if (not key.has_value())
            return "";

        return std::visit(detail::overload{
                [](const std::string& s) { return s; },
                [](std::int64_t i) { return fmt::format("{}", i); }
        }, *key);
    }

    tree::tree(std::string path_separator) :
            path_separator_{ std::move(path_separator) }
    {
        if (path_separator_.empty())
            throw std::invalid_argument{ "tree: path separator must not be empty" };
    }


    /* Queries */

    keyed_node tree::get(const std::string& nid) const
    {
        return { get_key(nid), nodes_map_.at(nid) };
    }

    node_key tree::get_key(const std::string& nid) const
    {
        ensure_present(nid);

        if (nid == root_)
            return std::nullopt;

        const auto& pid{ nodes_parent_.at(nid) };

        if (node_of(pid).keyed())
            return child_key{ nodes_children_map_.at(pid).at(nid) };

        const auto& siblings{ nodes_children_list_.at(pid) };
        return child_key{ static_cast<std::int64_t>(std::ranges::find(siblings, nid) - std::ranges::begin(siblings)) };
    }

    std::vector<keyed_node> tree::list(const list_options& options) const
    {
        std::vector<keyed_node> result{};

        if (is_empty())
            return result;

        for (const auto& [key, n] : expand())
        {
            if (options.id_in.has_value() and std::ranges::find(*options.id_in, n->identifier()) == std::ranges::end(*options.id_in))
                continue;
            if (options.depth_in.has_value() and std::ranges::find(*options.depth_in, depth(n->identifier())) == std::ranges::end(*options.depth_in))
                continue;
            if (options.filter and not options.filter(key, *n))
                continue;

            result.emplace_back(key, n);
        }
        return result;
    }

    std::string tree::parent_id(const std::string& nid) const
    {
        ensure_present(nid);

        if (nid == root_)
            throw not_found_error{ fmt::format("tree: root node <{}> has no parent", nid) };

        return nodes_parent_.at(nid);
    }

    keyed_node tree::parent(const std::string& nid) const
    {
        return get(parent_id(nid));
    }

    std::vector<std::string> tree::children_ids(const std::string& nid) const
    {
        if (node_of(nid).keyed())
        {
            const auto& children{ nodes_children_map_.at(nid) };
            std::vector<std::string> result{};
            result.reserve(children.size());

            for (const auto& [cid, key] : children)
                result.push_back(cid);

            return result;
        }
        else
        {
            return nodes_children_list_.at(nid);
        }
    }

    std::vector<keyed_node> tree::children(const std::string& nid) const
    {
        std::vector<keyed_node> result{};

        if (node_of(nid).keyed())
        {
            for (const auto& [cid, key] : nodes_children_map_.at(nid))
                result.emplace_back(child_key{ key }, nodes_map_.at(cid));
        }
        else
        {
            std::int64_t position{ 0 };
            for (const auto& cid : nodes_children_list_.at(nid))
                result.emplace_back(child_key{ position++ }, nodes_map_.at(cid));
        }
        return result;
    }

    std::vector<std::string> tree::siblings_ids(const std::string& nid) const
    {
        ensure_present(nid);

        if (nid == root_)
            return {};

        auto result{ children_ids(nodes_parent_.at(nid)) };
        std::erase(result, nid);
        return result;
    }

    std::vector<keyed_node> tree::siblings(const std::string& nid) const
    {
        ensure_present(nid);

        if (nid == root_)
            return {};

        auto result{ children(nodes_parent_.at(nid)) };
        std::erase_if(result, [&nid](const keyed_node& kn) { return kn.second->identifier() == nid; });
        return result;
    }

    bool tree::is_leaf(const std::string& nid) const
    {
        if (node_of(nid).keyed())
            return nodes_children_map_.at(nid).empty();
        else
            return nodes_children_list_.at(nid).empty();
    }

    std::size_t tree::depth(const std::string& nid) const
    {
        return ancestors_ids(nid).size();
    }

    std::vector<std::string> tree::ancestors_ids(const std::string& nid, bool from_root, bool include_current) const
    {
        ensure_present(nid);

        std::vector<std::string> result{};

        if (include_current)
            result.push_back(nid);

        for (auto it{ nodes_parent_.find(nid) }; it != nodes_parent_.end(); it = nodes_parent_.find(it->second))
            result.push_back(it->second);

        if (from_root)
            std::ranges::reverse(result);

        return result;
    }

    std::vector<keyed_node> tree::ancestors(const std::string& nid, bool from_root, bool include_current) const
    {
        std::vector<keyed_node> result{};

        for (const auto& aid : ancestors_ids(nid, from_root, include_current))
            result.push_back(get(aid));

        return result;
    }

    std::vector<std::string> tree::leaves_ids(const std::optional<std::string>& nid) const
    {
        std::vector<std::string> result{};

        if (not nid.has_value() and is_empty())
            return result;

        for (const auto& [key, n] : expand({ .nid = nid }))
        {
            if (is_leaf(n->identifier()))
                result.push_back(n->identifier());
        }
        return result;
    }

    std::vector<keyed_node> tree::leaves(const std::optional<std::string>& nid) const
    {
        std::vector<keyed_node> result{};

        for (const auto& lid : leaves_ids(nid))
            result.push_back(get(lid));

        return result;
    }

    std::string tree::get_node_id_by_path(std::string_view path) const
    {
        if (is_empty())
            throw not_found_error{ fmt::format("tree: path <{}> does not exist in an empty tree", path) };

        std::string current{ *root_ };

        if (path.empty())
            return current;

        for (const auto& segment : detail::split(path, path_separator_))
        {
            std::optional<std::string> next{};

            if (node_of(current).keyed())
            {
                for (const auto& [cid, key] : nodes_children_map_.at(current))
                {
                    if (key == segment)
                        next = cid;
                }
            }
            else
            {
                const auto& children{ nodes_children_list_.at(current) };
                const auto position{ detail::parse_position(segment) };

                if (position.has_value() and static_cast<std::size_t>(*position) < children.size())
                    next = children[static_cast<std::size_t>(*position)];
            }

            if (not next.has_value())
                throw not_found_error{ fmt::format("tree: path <{}> does not exist (no <{}> below <{}>)", path, segment, current) };

            current = std::move(*next);
        }
        return current;
    }

    std::string tree::get_path(const std::string& nid) const
    {
        std::string result{};
        bool first{ true };

        for (const auto& aid : ancestors_ids(nid, true, true) | std::views::drop(1))
        {
            if (not first)
                result += path_separator_;

            result += to_string(get_key(aid));
            first = false;
        }
        return result;
    }


    /* Structural editing */

    node_key tree::insert_node(node_ptr new_node, const insert_position& position)
    {
        if (new_node == nullptr)
            throw std::invalid_argument{ "tree::insert_node: node must not be null" };
        if (position.child_id_below.has_value())
            throw std::invalid_argument{ "tree::insert_node: child_id_below only applies to tree insertion" };
        if (position.parent_id.has_value() and position.child_id.has_value())
            throw std::invalid_argument{ "tree::insert_node: parent_id and child_id are mutually exclusive" };

        const auto pid{ resolve_locator(position.parent_id, position.by_path) };
        const auto cid{ resolve_locator(position.child_id, position.by_path) };

        if (contains(new_node->identifier()))
            throw duplicated_node_error{ fmt::format("tree::insert_node: node <{}> is already present", new_node->identifier()) };

        if (cid.has_value())
        {
            tree single{ path_separator_ };
            single.register_root(std::move(new_node));
            return insert_tree_above(single, *cid, *single.root_, position.key);
        }
        else if (pid.has_value())
        {
            auto key{ validate_child_key(*pid, position.key) };
            register_child(std::move(new_node), *pid, key);
            return key;
        }
        else
        {
            if (position.key.has_value())
                throw std::invalid_argument{ "tree::insert_node: a root node has no key" };
            if (not is_empty())
                throw multiple_root_error{ fmt::format("tree::insert_node: tree already has root <{}>", *root_) };

            register_root(std::move(new_node));
            return std::nullopt;
        }
    }

    node_key tree::insert_tree(const tree& new_tree, const insert_position& position)
    {
        if (position.parent_id.has_value() and position.child_id.has_value())
            throw std::invalid_argument{ "tree::insert_tree: parent_id and child_id are mutually exclusive" };
        if (position.child_id_below.has_value() and not position.child_id.has_value())
            throw std::invalid_argument{ "tree::insert_tree: child_id_below requires child_id" };

        const auto pid{ resolve_locator(position.parent_id, position.by_path) };
        const auto cid{ resolve_locator(position.child_id, position.by_path) };

        if (new_tree.is_empty())
            return std::nullopt;

        ensure_no_collision(new_tree, false);

        if (cid.has_value())
        {
            if (position.child_id_below.has_value())
                return insert_tree_above(new_tree, *cid, *position.child_id_below, position.key);

            const auto leaves{ new_tree.leaves_ids() };
            if (leaves.size() != 1)
                throw ambiguous_insertion_error{
                        fmt::format("tree::insert_tree: inserted tree has {} leaves, child_id_below is required", leaves.size()) };

            return insert_tree_above(new_tree, *cid, leaves.front(), position.key);
        }
        else if (pid.has_value())
        {
            auto key{ validate_child_key(*pid, position.key) };
            graft(new_tree, *new_tree.root_, pid, key, false);
            return key;
        }
        else
        {
            if (position.key.has_value())
                throw std::invalid_argument{ "tree::insert_tree: a root node has no key" };
            if (not is_empty())
                throw multiple_root_error{ fmt::format("tree::insert_tree: tree already has root <{}>", *root_) };

            graft(new_tree, *new_tree.root_, std::nullopt, std::nullopt, false);
            return std::nullopt;
        }
    }

    node_key tree::insert_tree_above(const tree& new_tree, const std::string& cid, const std::string& below, const node_key& key)
    {
        /* every check happens before the target subtree is detached */
        const auto below_key{ new_tree.validate_child_key(below, key) };

        std::optional<std::string> pid{};
        if (cid != root_)
            pid = nodes_parent_.at(cid);

        auto [slot_key, detached]{ drop_subtree(cid) };

        graft(new_tree, *new_tree.root_, pid, slot_key, false);
        graft(detached, *detached.root_, below, below_key, false);

        return slot_key;
    }

    keyed_node tree::drop_node(const std::string& nid, bool with_children)
    {
        ensure_present(nid);

        const std::string id{ nid };
        auto key{ get_key(id) };
        auto dropped{ nodes_map_.at(id) };
        const auto cids{ children_ids(id) };

        if (not with_children and id != root_ and node_of(nodes_parent_.at(id)).keyed() != dropped->keyed())
            throw invalid_operation_error{
                    fmt::format("tree::drop_node: children of <{}> cannot be rebased on <{}> (keyed and list nodes differ)", id, nodes_parent_.at(id)) };

        if (with_children or cids.empty())
        {
            for (const auto& cid : cids)
                drop_node(cid, true);

            unregister_leaf(id);
            return { std::move(key), std::move(dropped) };
        }

        if (id == root_)
        {
            if (cids.size() > 1)
                throw multiple_root_error{
                        fmt::format("tree::drop_node: dropping root <{}> alone would leave {} roots", id, cids.size()) };

            auto detached{ subtree(id).second };
            drop_node(id, true);
            graft(detached, cids.front(), std::nullopt, std::nullopt, false);

            return { std::move(key), std::move(dropped) };
        }

        const std::string pid{ nodes_parent_.at(id) };

        if (dropped->keyed())
        {
            const auto& rebased{ nodes_children_map_.at(id) };

            for (const auto& [sid, skey] : nodes_children_map_.at(pid))
            {
                if (sid != id and std::ranges::any_of(rebased, [&skey](const auto& entry) { return entry.second == skey; }))
                    throw duplicated_key_error{ fmt::format("tree::drop_node: key <{}> already exists below <{}>", skey, pid) };
            }
        }

        auto detached{ subtree(id).second };
        drop_node(id, true);

        auto position{ dropped->keyed() ? std::int64_t{ 0 } : std::get<std::int64_t>(*key) };
        for (const auto& cid : cids)
        {
            if (dropped->keyed())
                graft(detached, cid, pid, detached.get_key(cid), false);
            else
                graft(detached, cid, pid, child_key{ position++ }, false);
        }

        return { std::move(key), std::move(dropped) };
    }

    std::pair<node_key, tree> tree::drop_subtree(const std::string& nid)
    {
        const std::string id{ nid };
        auto result{ subtree(id) };
        drop_node(id, true);
        return result;
    }

    std::pair<node_key, tree> tree::subtree(const std::string& nid, bool deep) const
    {
        ensure_present(nid);

        tree result{ path_separator_ };
        result.graft(*this, nid, std::nullopt, std::nullopt, deep);

        return { get_key(nid), std::move(result) };
    }

    tree tree::clone(bool with_nodes, bool deep, const std::optional<std::string>& new_root) const
    {
        tree result{ path_separator_ };

        if (not with_nodes or (is_empty() and not new_root.has_value()))
            return result;

        result.graft(*this, resolve_start(new_root), std::nullopt, std::nullopt, deep);
        return result;
    }

    void tree::merge(const tree& new_tree, const std::optional<std::string>& nid)
    {
        if (new_tree.is_empty())
            return;

        if (is_empty())
        {
            if (nid.has_value())
                throw not_found_error{ fmt::format("tree::merge: node <{}> is not present in an empty tree", *nid) };

            graft(new_tree, *new_tree.root_, std::nullopt, std::nullopt, false);
            return;
        }

        const std::string target{ resolve_start(nid) };
        const auto& target_node{ node_of(target) };
        const auto incoming{ new_tree.children(*new_tree.root_) };

        if (incoming.empty())
            return;

        if (not target_node.accepts_children())
            throw invalid_operation_error{ fmt::format("tree::merge: node <{}> does not accept children", target) };
        if (target_node.keyed() != new_tree.node_of(*new_tree.root_).keyed())
            throw invalid_operation_error{
                    fmt::format("tree::merge: children of <{}> cannot be merged on <{}> (keyed and list nodes differ)", *new_tree.root_, target) };

        ensure_no_collision(new_tree, true);

        if (target_node.keyed())
        {
            for (const auto& [key, n] : incoming)
                static_cast<void>(validate_child_key(target, key));
        }

        /* children keep their keys; list positions past the end are clamped */
        for (const auto& [key, n] : incoming)
            graft(new_tree, n->identifier(), target, validate_child_key(target, key), false);
    }


    /* Private helpers */

    void tree::ensure_present(const std::string& nid) const
    {
        if (not contains(nid))
            throw not_found_error{ fmt::format("tree: node <{}> is not present", nid) };
    }

    const std::string& tree::resolve_start(const std::optional<std::string>& nid) const
    {
        if (nid.has_value())
        {
            ensure_present(*nid);
            return *nid;
        }
        else if (is_empty())
        {
            throw not_found_error{ "tree: tree is empty" };
        }
        else
        {
            return *root_;
        }
    }

    std::optional<std::string> tree::resolve_locator(const std::optional<std::string>& id_or_path, bool by_path) const
    {
        if (not id_or_path.has_value())
            return std::nullopt;

        if (by_path)
            return get_node_id_by_path(*id_or_path);

        ensure_present(*id_or_path);
        return id_or_path;
    }

    const node& tree::node_of(const std::string& nid) const
    {
        const auto it{ nodes_map_.find(nid) };

        if (it == nodes_map_.end())
            throw not_found_error{ fmt::format("tree: node <{}> is not present", nid) };

        return *(it->second);
    }

    child_key tree::validate_child_key(const std::string& pid, const node_key& key) const
    {
        const auto& parent_node{ node_of(pid) };

        if (not parent_node.accepts_children())
            throw invalid_operation_error{ fmt::format("tree: node <{}> does not accept children", pid) };

        if (parent_node.keyed())
        {
            const auto* str_key{ key.has_value() ? std::get_if<std::string>(&*key) : nullptr };

            if (str_key == nullptr)
                throw invalid_operation_error{ fmt::format("tree: a string key is required below keyed node <{}>", pid) };

            for (const auto& [cid, existing] : nodes_children_map_.at(pid))
            {
                if (existing == *str_key)
                    throw duplicated_key_error{ fmt::format("tree: node <{}> already has a child with key <{}>", pid, *str_key) };
            }
            return *str_key;
        }

        const auto count{ static_cast<std::int64_t>(nodes_children_list_.at(pid).size()) };

        if (not key.has_value())
            return count;

        const auto* position{ std::get_if<std::int64_t>(&*key) };

        if (position == nullptr)
            throw invalid_operation_error{ fmt::format("tree: an integer position is required below list node <{}>", pid) };
        if (*position < 0)
            throw invalid_operation_error{ fmt::format("tree: invalid position {} below list node <{}>", *position, pid) };

        return std::min(*position, count);
    }

    void tree::ensure_no_collision(const tree& new_tree, bool skip_root) const
    {
        std::vector<std::string> duplicates{};

        for (const auto& [nid, n] : new_tree.nodes_map_)
        {
            if (skip_root and nid == new_tree.root_)
                continue;
            if (contains(nid))
                duplicates.push_back(nid);
        }

        if (not duplicates.empty())
        {
            std::ranges::sort(duplicates);
            throw duplicated_node_error{ fmt::format("tree: nodes already present: {}", fmt::join(duplicates, ", ")) };
        }
    }

    void tree::register_root(node_ptr new_node)
    {
        const std::string nid{ new_node->identifier() };

        if (new_node->keyed())
            nodes_children_map_.try_emplace(nid);
        else
            nodes_children_list_.try_emplace(nid);

        root_ = nid;
        nodes_map_.emplace(nid, std::move(new_node));
    }

    void tree::register_child(node_ptr new_node, const std::string& pid, const child_key& key)
    {
        const std::string nid{ new_node->identifier() };

        if (node_of(pid).keyed())
        {
            nodes_children_map_.at(pid).emplace(nid, std::get<std::string>(key));
        }
        else
        {
            auto& siblings{ nodes_children_list_.at(pid) };
            siblings.insert(std::ranges::begin(siblings) + std::get<std::int64_t>(key), nid);
        }

        if (new_node->keyed())
            nodes_children_map_.try_emplace(nid);
        else
            nodes_children_list_.try_emplace(nid);

        nodes_parent_.emplace(nid, pid);
        nodes_map_.emplace(nid, std::move(new_node));
    }

    void tree::unregister_leaf(const std::string& nid)
    {
        const std::string id{ nid };

        if (not is_leaf(id))
            throw invalid_operation_error{ fmt::format("tree: cannot drop node <{}> having children", id) };

        if (id == root_)
        {
            root_.reset();
        }
        else
        {
            const auto& pid{ nodes_parent_.at(id) };

            if (node_of(pid).keyed())
                nodes_children_map_.at(pid).erase(id);
            else
                std::erase(nodes_children_list_.at(pid), id);

            nodes_parent_.erase(id);
        }

        nodes_children_map_.erase(id);
        nodes_children_list_.erase(id);
        nodes_map_.erase(id);
    }

    void tree::graft(const tree& src, const std::string& src_nid, const std::optional<std::string>& pid, const node_key& key, bool deep)
    {
        auto n{ src.nodes_map_.at(src_nid) };

        if (deep)
            n = std::make_shared<node>(*n);

        if (pid.has_value())
            register_child(n, *pid, *key);
        else
            register_root(n);

        if (n->keyed())
        {
            for (const auto& [cid, ckey] : src.nodes_children_map_.at(src_nid))
                graft(src, cid, src_nid, child_key{ ckey }, deep);
        }
        else
        {
            std::int64_t position{ 0 };
            for (const auto& cid : src.nodes_children_list_.at(src_nid))
                graft(src, cid, src_nid, child_key{ position++ }, deep);
        }
    }
}
