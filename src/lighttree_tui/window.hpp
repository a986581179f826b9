// lighttree_tui/window.hpp
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

#include <csignal>
#include <cstddef>
#include <locale>
#include <string>
#include <string_view>
#include <vector>

#include "lighttree/interactive_tree.hpp"
#include "keymap.hpp"
#include "window_detail.hpp"

namespace lighttree::tui
{
    extern volatile std::sig_atomic_t global_signal_status;
    inline constexpr std::string_view lighttree_version_string{ "0.1" };

    /* Full screen browser over an interactive_tree. The content area shows the
     * rendering of the current view; its children can be selected and opened,
     * and every opened view is kept on a stack so it can be left again. */
    class window
    {
        friend class detail::window_event_loop;

    public:
        static window create();

        window(const window&) = delete;
        window(window&&) = delete;
        window& operator=(const window&) = delete;
        window& operator=(window&&) = delete;

        ~window() = default;

        int operator()(std::string filename, interactive_tree& document, std::string line_type);

    private:
        window();

        [[nodiscard]] interactive_tree& current_view();

        void open_selected();
        void go_back();
        void select(std::size_t index);
        void select_visible();

        void draw_top();
        void draw_status();
        void draw_help();
        void draw_content();

        void update_screen();
        void update_view_lines();
        void update_viewport_pos();
        void update_viewport_clamp_lower();
        void update_window_sizes();


        detail::defer_endwin                defer_endwin_;
        std::locale                         new_locale_{ "" };
        std::string                         current_filename_;
        std::string                         line_type_;
        coord                               screen_dimensions_{ .y = 0, .x = 0 };

        std::vector<interactive_tree*>      views_;                 /* opened views, the current one last   */
        std::vector<std::size_t>            saved_selections_;      /* selection of each view below the top */

        std::vector<std::string>            content_lines_;         /* rendering of the current view        */
        std::vector<std::size_t>            child_lines_;           /* content line of each child           */
        std::vector<std::string>            child_names_;           /* attribute name of each child         */
        std::size_t                         selected_{ 0 };
        std::size_t                         line_start_y_{ 0 };

        unsigned char                       help_height_{ 2 };
        bool                                term_has_color_ { false };

        detail::redraw_mask                 screen_redraw_;

        detail::sub_window                  sub_win_top_;
        detail::sub_window                  sub_win_status_;
        detail::sub_window                  sub_win_help_;
        detail::sub_window                  sub_win_content_;

        detail::status_bar_message          status_msg_;
        detail::help_bar_content            help_info_;

        keymap                              keymap_;
    };
}
