// lighttree/json_tree.cpp
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


#include "json_tree.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace lighttree
{
    namespace detail
    {
        namespace
        {
            template<typename... Ts>
            struct overload : Ts ... { using Ts::operator()...; };

            template<typename T>
            std::optional<T> parse_number(const std::string& text)
            {
                T result{};
                const auto [ptr, ec]{ std::from_chars(text.data(), text.data() + text.size(), result) };

                if (ec != std::errc{} or ptr != text.data() + text.size())
                    return std::nullopt;
                else
                    return result;
            }

            /* quoted scalars carry the "!" tag and always stay strings */
            scalar scalar_from(const YAML::Node& value)
            {
                const auto& text{ value.Scalar() };

                if (value.Tag() == "!")
                    return text;
                else if (text == "true")
                    return true;
                else if (text == "false")
                    return false;
                else if (const auto i{ parse_number<std::int64_t>(text) }; i.has_value())
                    return *i;
                else if (const auto d{ parse_number<double>(text) }; d.has_value())
                    return *d;
                else
                    return text;
            }

            void emit_scalar(YAML::Emitter& out, const scalar& value)
            {
                std::visit(overload{
                        [&out](bool b) { out << b; },
                        [&out](std::int64_t i) { out << i; },
                        [&out, &value](double) { out << to_string(value); },
                        [&out](const std::string& s) { out << YAML::DoubleQuoted << s; }
                }, value);
            }

            /* JSON object keys are always quoted */
            void emit_field(YAML::Emitter& out, const std::string& name)
            {
                out << YAML::Key << YAML::DoubleQuoted << name << YAML::Value;
            }

            void fill(tree& t, const YAML::Node& value, const std::optional<std::string>& pid, const node_key& key)
            {
                switch (value.Type())
                {
                    case YAML::NodeType::Map:
                    {
                        const auto n{ node::make_anonymous({ .keyed = true }) };
                        t.insert_node(n, { .parent_id = pid, .key = key });

                        for (const auto& entry : value)
                            fill(t, entry.second, n->identifier(), child_key{ entry.first.as<std::string>() });
                        break;
                    }
                    case YAML::NodeType::Sequence:
                    {
                        const auto n{ node::make_anonymous({ .keyed = false }) };
                        t.insert_node(n, { .parent_id = pid, .key = key });

                        for (const auto& element : value)
                            fill(t, element, n->identifier(), std::nullopt);
                        break;
                    }
                    case YAML::NodeType::Scalar:
                        t.insert_node(node::make_anonymous({ .accepts_children = false, .payload = scalar_from(value) }),
                                      { .parent_id = pid, .key = key });
                        break;
                    case YAML::NodeType::Null:
                        t.insert_node(node::make_anonymous({ .accepts_children = false, .display = "null" }),
                                      { .parent_id = pid, .key = key });
                        break;
                    case YAML::NodeType::Undefined:
                        throw std::invalid_argument{ "tree_from_document: undefined document value" };
                }
            }

            void emit_value(YAML::Emitter& out, const tree& t, const std::string& nid)
            {
                const auto n{ t.get(nid).second };

                if (not n->accepts_children())
                {
                    if (n->payload().has_value())
                        emit_scalar(out, *n->payload());
                    else
                        out << YAML::Null;
                }
                else if (n->keyed())
                {
                    auto children{ t.children(nid) };
                    std::ranges::sort(children, {}, &keyed_node::first);

                    out << YAML::BeginMap;
                    for (const auto& [key, child] : children)
                    {
                        emit_field(out, to_string(key));
                        emit_value(out, t, child->identifier());
                    }
                    out << YAML::EndMap;
                }
                else
                {
                    out << YAML::BeginSeq;
                    for (const auto& cid : t.children_ids(nid))
                        emit_value(out, t, cid);
                    out << YAML::EndSeq;
                }
            }

            void emit_node_fields(YAML::Emitter& out, const node& n)
            {
                out << YAML::BeginMap;
                emit_field(out, "identifier");
                out << YAML::DoubleQuoted << n.identifier();
                emit_field(out, "keyed");
                out << n.keyed();
                emit_field(out, "accepts_children");
                out << n.accepts_children();

                if (n.display().has_value())
                {
                    emit_field(out, "display");
                    out << YAML::DoubleQuoted << *n.display();
                }

                if (n.payload().has_value())
                {
                    emit_field(out, "payload");
                    emit_scalar(out, *n.payload());
                }
                out << YAML::EndMap;
            }

            node_ptr node_from_fields(const YAML::Node& fields)
            {
                if (not fields.IsMap())
                    throw std::invalid_argument{ "deserialize: node fields must be an object" };

                node_attributes attributes{};

                if (fields["keyed"])
                    attributes.keyed = fields["keyed"].as<bool>();
                if (fields["accepts_children"])
                    attributes.accepts_children = fields["accepts_children"].as<bool>();
                if (fields["display"] and not fields["display"].IsNull())
                    attributes.display = fields["display"].as<std::string>();
                if (fields["payload"] and fields["payload"].IsScalar())
                    attributes.payload = scalar_from(fields["payload"]);

                return node::make(fields["identifier"].as<std::string>(), std::move(attributes));
            }

            void rebuild(tree& t, const YAML::Node& nodes, const YAML::Node& children_of,
                         const std::string& nid, const std::optional<std::string>& pid, const node_key& key)
            {
                const auto n{ node_from_fields(nodes[nid]) };

                if (n->identifier() != nid)
                    throw std::invalid_argument{ fmt::format("deserialize_tree: node <{}> is stored with identifier <{}>", nid, n->identifier()) };

                t.insert_node(n, { .parent_id = pid, .key = key });

                const auto children{ children_of[nid] };

                if (not children or children.IsNull())
                    return;

                if (n->keyed())
                {
                    if (not children.IsMap())
                        throw std::invalid_argument{ fmt::format("deserialize_tree: children of keyed node <{}> must be an object", nid) };

                    for (const auto& entry : children)
                        rebuild(t, nodes, children_of, entry.first.as<std::string>(), nid, child_key{ entry.second.as<std::string>() });
                }
                else
                {
                    if (not children.IsSequence())
                        throw std::invalid_argument{ fmt::format("deserialize_tree: children of list node <{}> must be an array", nid) };

                    for (const auto& element : children)
                        rebuild(t, nodes, children_of, element.as<std::string>(), nid, std::nullopt);
                }
            }

            std::string finish(const YAML::Emitter& out)
            {
                if (not out.good())
                    throw std::runtime_error{ fmt::format("json emitter: {}", out.GetLastError()) };

                return out.c_str();
            }

            void configure_json(YAML::Emitter& out)
            {
                out.SetMapFormat(YAML::Flow);
                out.SetSeqFormat(YAML::Flow);
                out.SetBoolFormat(YAML::TrueFalseBool);
                out.SetNullFormat(YAML::LowerNull);
                out.SetOutputCharset(YAML::EscapeAsJson);
            }

            YAML::Node load_document(std::string_view text, std::string_view context)
            {
                try
                {
                    return YAML::Load(std::string{ text });
                }
                catch (const YAML::Exception& e)
                {
                    throw std::invalid_argument{ fmt::format("{}: {}", context, e.what()) };
                }
            }
        }
    }

    tree tree_from_json(std::string_view json_text, std::string path_separator)
    {
        return tree_from_document(detail::load_document(json_text, "tree_from_json"), std::move(path_separator));
    }

    tree tree_from_document(const YAML::Node& document, std::string path_separator)
    {
        tree result{ std::move(path_separator) };
        detail::fill(result, document, std::nullopt, std::nullopt);
        return result;
    }

    std::string tree_to_json(const tree& t)
    {
        YAML::Emitter out{};
        detail::configure_json(out);

        if (t.is_empty())
            out << YAML::Null;
        else
            detail::emit_value(out, t, *t.root());

        return detail::finish(out);
    }

    std::string serialize(const tree& t)
    {
        YAML::Emitter out{};
        detail::configure_json(out);
        const auto all{ t.list() };

        out << YAML::BeginMap;

        detail::emit_field(out, "root");
        if (t.root().has_value())
            out << YAML::DoubleQuoted << *t.root();
        else
            out << YAML::Null;

        detail::emit_field(out, "path_separator");
        out << YAML::DoubleQuoted << t.path_separator();

        detail::emit_field(out, "nodes");
        out << YAML::BeginMap;
        for (const auto& [key, n] : all)
        {
            detail::emit_field(out, n->identifier());
            detail::emit_node_fields(out, *n);
        }
        out << YAML::EndMap;

        detail::emit_field(out, "parent_of");
        out << YAML::BeginMap;
        for (const auto& [key, n] : all)
        {
            detail::emit_field(out, n->identifier());
            if (key.has_value())
                out << YAML::DoubleQuoted << t.parent_id(n->identifier());
            else
                out << YAML::Null;
        }
        out << YAML::EndMap;

        detail::emit_field(out, "children_of");
        out << YAML::BeginMap;
        for (const auto& [key, n] : all)
        {
            detail::emit_field(out, n->identifier());

            if (n->keyed())
            {
                out << YAML::BeginMap;
                for (const auto& [ckey, child] : t.children(n->identifier()))
                {
                    detail::emit_field(out, child->identifier());
                    out << YAML::DoubleQuoted << to_string(ckey);
                }
                out << YAML::EndMap;
            }
            else
            {
                out << YAML::BeginSeq;
                for (const auto& cid : t.children_ids(n->identifier()))
                    out << YAML::DoubleQuoted << cid;
                out << YAML::EndSeq;
            }
        }
        out << YAML::EndMap;

        out << YAML::EndMap;
        return detail::finish(out);
    }

    std::string serialize(const node& n)
    {
        YAML::Emitter out{};
        detail::configure_json(out);
        detail::emit_node_fields(out, n);
        return detail::finish(out);
    }

    tree deserialize_tree(std::string_view text)
    {
        try
        {
            const auto document{ detail::load_document(text, "deserialize_tree") };

            if (not document.IsMap())
                throw std::invalid_argument{ "deserialize_tree: document must be an object" };

            tree result{ document["path_separator"] ? document["path_separator"].as<std::string>() : std::string{ "." } };
            const auto root{ document["root"] };

            if (not root or root.IsNull())
                return result;

            const auto nodes{ document["nodes"] };
            detail::rebuild(result, nodes, document["children_of"], root.as<std::string>(), std::nullopt, std::nullopt);

            if (result.size() != nodes.size())
                throw std::invalid_argument{ fmt::format("deserialize_tree: {} nodes listed but {} reachable from the root", nodes.size(), result.size()) };

            for (const auto& entry : document["parent_of"])
            {
                const auto nid{ entry.first.as<std::string>() };
                const bool consistent{ entry.second.IsNull() ? nid == result.root()
                                                             : result.contains(nid) and nid != result.root()
                                                               and result.parent_id(nid) == entry.second.as<std::string>() };
                if (not consistent)
                    throw std::invalid_argument{ fmt::format("deserialize_tree: parent of <{}> does not match children_of", nid) };
            }
            return result;
        }
        catch (const YAML::Exception& e)
        {
            throw std::invalid_argument{ fmt::format("deserialize_tree: {}", e.what()) };
        }
        catch (const std::invalid_argument&)
        {
            throw;
        }
        catch (const std::logic_error& e)
        {
            throw std::invalid_argument{ fmt::format("deserialize_tree: inconsistent tree ({})", e.what()) };
        }
    }

    node_ptr deserialize_node(std::string_view text)
    {
        try
        {
            return detail::node_from_fields(detail::load_document(text, "deserialize_node"));
        }
        catch (const YAML::Exception& e)
        {
            throw std::invalid_argument{ fmt::format("deserialize_node: {}", e.what()) };
        }
    }
}
