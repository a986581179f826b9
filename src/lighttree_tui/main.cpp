// lighttree_tui/main.cpp
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


#include <deque>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "lighttree/interactive_tree.hpp"
#include "lighttree/json_tree.hpp"
#include "lighttree/styles.hpp"
#include "window.hpp"

namespace
{
    constexpr std::string_view line_type_option{ "--line-type=" };

    std::string read_file(const std::string& filename)
    {
        std::ifstream file{ filename, std::ios::binary };

        if (not file)
            throw std::runtime_error{ std::string{ lighttree::tui::strings::cannot_open.str_view() } };

        std::ostringstream contents{};
        contents << file.rdbuf();
        return contents.str();
    }
}

int main(const int argc, const char* argv[])
{
    using namespace lighttree::tui;

    std::deque<std::string> args{ argv + 1 , argc + argv };

    std::string line_type{ "ascii-ex" };
    std::string filename{};

    for (const auto& arg : args)
    {
        if (arg.starts_with(line_type_option))
        {
            line_type = arg.substr(line_type_option.size());
        }
        else if (arg.starts_with("--") or not filename.empty())
        {
            std::cerr << strings::unknown_option(arg).str_view() << '\n';
            std::cerr << strings::usage(argv[0]).str_view() << '\n';
            return 1;
        }
        else
        {
            filename = arg;
        }
    }

    if (filename.empty())
    {
        std::cerr << strings::usage(argv[0]).str_view() << '\n';
        return 1;
    }

    std::optional<lighttree::interactive_tree> document{};

    try
    {
        static_cast<void>(lighttree::get_line_style(line_type));
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << e.what() << '\n';
        return 1;
    }

    try
    {
        document.emplace(lighttree::tree_from_json(read_file(filename)));
    }
    catch (const std::exception& e)
    {
        std::cerr << strings::error_reading(filename, e.what()).str_view() << '\n';
        return 1;
    }

    int rv{ 0 };

    {
        window win{ window::create() };
        rv = win(filename, *document, line_type);
    }

    if (rv != 0)
    {
        if (global_signal_status == SIGTERM)
            std::cout << strings::received("SIGTERM").str_view() << '\n';
        else if (global_signal_status == SIGHUP)
            std::cout << strings::received("SIGHUP").str_view() << '\n';
        else if (global_signal_status == SIGQUIT)
            std::cout << strings::received("SIGQUIT").str_view() << '\n';

        return 1;
    }

    return 0;
}
