// lighttree_tui/window.cpp
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


#include "window.hpp"

#include <algorithm>
#include <concepts>
#include <functional>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "lighttree/utf8.hpp"
#include "read_helper.hpp"

namespace lighttree::tui
{
    volatile std::sig_atomic_t global_signal_status;

    namespace
    {
        void signal_handler(int signal)
        {
            global_signal_status = signal;
        }

        /* Keep the last count characters of a utf-8 string */
        std::string take_last_n_chars(const std::string& str, std::size_t count)
        {
            std::size_t chars{ 0 };
            std::size_t pos{ str.size() };

            while (pos > 0 and chars < count)
            {
                --pos;
                if ((static_cast<unsigned char>(str[pos]) & utf8::mask_cont) != utf8::test_cont)
                    ++chars;
            }
            return str.substr(pos);
        }

        /* Shorten str to width characters, replacing its start with an ellipsis */
        std::string fit_from_end(const std::string& str, int width)
        {
            const auto length{ utf8::length(str) };

            if (width <= 0)
                return "";
            if (length <= static_cast<std::size_t>(width))
                return str;
            if (width <= 3)
                return take_last_n_chars(str, static_cast<std::size_t>(width));

            return "..." + take_last_n_chars(str, static_cast<std::size_t>(width - 3));
        }
    }
}

namespace lighttree::tui::detail
{
    class window_event_loop
    {
        window*             win_;
        char_read_helper    crh_;

    public:
        explicit window_event_loop(window& window) :
                win_{ &window }
        {
        }

        char_read_helper& crh()
        {
            return crh_;
        }

        template<std::invocable<actions, bool&> F1, std::invocable<> F2>
        void operator()(const keymap::map_t& local_keymap, F1 action_handler, F2 common)
        {
            for (bool exit{ false }; not exit;)
            {
                crh_.extract_char();

                if (global_signal_status)
                    return;

                if (crh_.is_timeout())
                {
                    /* nothing was pressed: only let status messages expire */
                }
                else if (crh_.is_resize())
                {
                    /* update overall window size information */
                    win_->update_window_sizes();
                    win_->status_msg_.force_clear();
                }
                else
                {
                    crh_.extract_second_char();
                    std::invoke(action_handler, crh_.get_action(local_keymap), exit);
                }

                std::invoke(common);
            }

            crh_.clear();
            if (crh_.is_resize())
                win_->update_window_sizes();
        }
    };
}

namespace lighttree::tui
{
    static constexpr int pad_size{ 2 };


    /* Constructors and related funcs */

    window::window() :
            status_msg_{ screen_redraw_ }
    {
        std::locale::global(new_locale_);

        initscr();
        raw();          // disable keyboard interrupts
        nonl();         // disable conversion of enter to new line
        noecho();       // do not echo keyboard input
        curs_set(0);    // hide cursor
        timeout(100);

        intrflush(stdscr, false);
        keypad(stdscr, true);
        meta(stdscr, true);

        keymap_ = keymap::make_default();
        help_info_ = keymap::make_viewer_help_bar();

        update_window_sizes();

        if (has_colors() != FALSE)
        {
            term_has_color_ = true;
            start_color();
            use_default_colors();
            init_pair(1, COLOR_WHITE, COLOR_RED);
            init_pair(2, COLOR_CYAN, -1);
            bkgd(COLOR_PAIR(0) | ' ');
        }

        std::signal(SIGHUP, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGQUIT, signal_handler);
    }

    window window::create()
    {
        static bool window_exists{ false };

        if (not window_exists)
        {
            window_exists = true;
            return window{};
        }
        else
        {
            throw std::logic_error("Cannot create more than 1 main window");
        }
    }


    /* Navigation between views */

    interactive_tree& window::current_view()
    {
        if (views_.empty())
            throw std::logic_error("window has no open view");

        return *views_.back();
    }

    void window::open_selected()
    {
        using detail::redraw_mask;

        if (child_names_.empty())
        {
            status_msg_.set_warning(strings::no_children);
            return;
        }

        auto& child{ current_view()[child_names_.at(selected_)] };

        views_.push_back(&child);
        saved_selections_.push_back(selected_);
        selected_ = 0;
        line_start_y_ = 0;

        update_view_lines();
        status_msg_.set_message(strings::opened(child.path().value_or("")));
        screen_redraw_.add_mask(redraw_mask::RD_TOP, redraw_mask::RD_CONTENT);
    }

    void window::go_back()
    {
        using detail::redraw_mask;

        if (views_.size() <= 1)
        {
            status_msg_.set_message(strings::at_top);
            return;
        }

        views_.pop_back();
        selected_ = saved_selections_.back();
        saved_selections_.pop_back();
        line_start_y_ = 0;

        update_view_lines();
        update_viewport_pos();
        screen_redraw_.add_mask(redraw_mask::RD_TOP, redraw_mask::RD_CONTENT);
    }

    void window::select(std::size_t index)
    {
        using detail::redraw_mask;

        if (child_lines_.empty())
            return;

        selected_ = std::min(index, child_lines_.size() - 1);
        screen_redraw_.add_mask(redraw_mask::RD_CONTENT);
        update_viewport_pos();
    }

    /* After a page movement, select the first child drawn on screen, or else
     * the child whose subtree fills the screen. The viewport is not moved. */
    void window::select_visible()
    {
        if (child_lines_.empty())
            return;

        const std::size_t height{ sub_win_content_ ? static_cast<std::size_t>(sub_win_content_.size().y) : 0 };
        const auto first_visible{ std::ranges::lower_bound(child_lines_, line_start_y_) };

        if (first_visible != child_lines_.end() and *first_visible < line_start_y_ + height)
            selected_ = static_cast<std::size_t>(first_visible - child_lines_.begin());
        else if (first_visible != child_lines_.begin())
            selected_ = static_cast<std::size_t>(first_visible - child_lines_.begin()) - 1;
        else
            selected_ = 0;
    }


    /* Drawing functions.
     * Called via window::update_screen();
     * doupdate() must be called after calling these functions. */

    void window::draw_top()
    {
        using detail::color_type;

        if (not sub_win_top_)
            return;

        wclear(*sub_win_top_);
        sub_win_top_.set_default_color(color_type::inverse, term_has_color_);

        const std::string program_str{ fmt::format("{} {}", strings::program_name.str_view(), lighttree_version_string) };
        const std::string location_str{ current_view().path().value_or(std::string{ strings::top_level.str_view() }) };

        const int program_len{ static_cast<int>(utf8::length(program_str)) };
        const int filename_len{ static_cast<int>(utf8::length(current_filename_)) };
        const int location_len{ static_cast<int>(utf8::length(location_str)) };
        const int line_length{ sub_win_top_.size().x };

        if (line_length >= program_len + filename_len + location_len + 4 * pad_size)
        {
            /* line is wide enough to show everything */
            const int filename_x_pos{ std::max(program_len + 2 * pad_size, (line_length - filename_len) / 2) };
            mvwprintw(*sub_win_top_, 0, pad_size, "%s", program_str.c_str());
            mvwprintw(*sub_win_top_, 0, filename_x_pos, "%s", current_filename_.c_str());
            mvwprintw(*sub_win_top_, 0, line_length - location_len - pad_size, "%s", location_str.c_str());
        }
        else if (line_length >= filename_len + location_len + 3 * pad_size)
        {
            /* not enough space to show name of program */
            mvwprintw(*sub_win_top_, 0, pad_size, "%s", current_filename_.c_str());
            mvwprintw(*sub_win_top_, 0, line_length - location_len - pad_size, "%s", location_str.c_str());
        }
        else
        {
            /* only the location is shown, without its start if necessary */
            const std::string shown{ fit_from_end(location_str, line_length) };
            const int x_pos{ std::max(0, (line_length - static_cast<int>(utf8::length(shown))) / 2) };
            mvwprintw(*sub_win_top_, 0, x_pos, "%s", shown.c_str());
        }

        touchwin(*sub_win_top_);
        wnoutrefresh(*sub_win_top_);
    }

    void window::draw_status()
    {
        using detail::color_type;

        if (not sub_win_status_)
            return;

        wclear(*sub_win_status_);
        sub_win_status_.set_default_color(color_type::standard, term_has_color_);

        if (status_msg_.has_message())
        {
            const auto msg_color{ status_msg_.is_error() ? color_type::warning : color_type::inverse };
            sub_win_status_.set_color(msg_color, term_has_color_);

            const int msg_len{ status_msg_.length() };

            if (msg_len + 4 <= sub_win_status_.size().x)
            {
                /* enough space for message in window: display normally */
                const int x_pos{ std::max(0, (sub_win_status_.size().x - msg_len - 4) / 2) };
                mvwprintw(*sub_win_status_, 0, x_pos, "[ %s ]", status_msg_.c_str());
            }
            else
            {
                /* message too large: don't show brackets */
                const int x_pos{ std::max(0, (sub_win_status_.size().x - msg_len) / 2) };
                mvwprintw(*sub_win_status_, 0, x_pos, "%s", status_msg_.c_str());
            }

            sub_win_status_.unset_color(msg_color, term_has_color_);
        }

        touchwin(*sub_win_status_);
        wnoutrefresh(*sub_win_status_);
    }

    void window::draw_help()
    {
        using detail::color_type;

        if (not sub_win_help_)
            return;

        wclear(*sub_win_help_);
        sub_win_help_.set_default_color(color_type::standard, term_has_color_);

        const int size{ static_cast<int>(help_info_.entries.size()) };
        const int width{ sub_win_help_.size().x };
        const int min{ help_info_.min_width };
        const int max{ help_info_.max_width };

        const int rows{ sub_win_help_.size().y };
        const int cols{ std::max(1, std::min(width / min, (size + rows - 1) / rows)) };

        const int spacing{ (min > max) ? std::max(min, width / cols) : std::clamp(width / cols, min, max) };
        const int slack{ (min > max) ? width % spacing : 0 };

        std::vector<std::string> entry_key_names{};
        for (const auto& entry : help_info_.entries)
            entry_key_names.push_back(keymap_.key_for(entry.action));

        for (int i{ 0 }, c{ 0 }; c < cols; ++c)
        {
            /* determine the maximum width of a key in this column */
            std::size_t max_length{ 2 };
            for (int j{ i }; j < std::min(size, i + rows); ++j)
                max_length = std::max(max_length, utf8::length(entry_key_names[j]));

            for (int r{ 0 }; r < rows and i < size; ++r, ++i)
            {
                const auto& entry{ help_info_.entries.at(i) };
                const auto& entry_key{ entry_key_names.at(i) };
                const int pos{ (spacing * c) + ((slack * c) / cols) };

                /* centre key string to match the largest in column */
                const std::size_t key_length{ utf8::length(entry_key) };
                const std::size_t left{ (max_length - key_length + 1) / 2 };
                const std::string content{ std::string(left, ' ') + entry_key + std::string(max_length - key_length - left, ' ') };

                sub_win_help_.set_color(color_type::inverse, term_has_color_);
                mvwprintw(*sub_win_help_, r, pos, "%s", content.c_str());
                sub_win_help_.unset_color(color_type::inverse, term_has_color_);
                wprintw(*sub_win_help_, " %s ", entry.desc.get().c_str());
            }
        }

        touchwin(*sub_win_help_);
        wnoutrefresh(*sub_win_help_);
    }

    void window::draw_content()
    {
        using detail::color_type;

        if (not sub_win_content_)
            return;

        wclear(*sub_win_content_);
        sub_win_content_.set_default_color(color_type::standard, term_has_color_);

        const bool has_selection{ not child_lines_.empty() };

        for (int display_line{ 0 }; display_line < sub_win_content_.size().y; ++display_line)
        {
            const std::size_t line_no{ line_start_y_ + static_cast<std::size_t>(display_line) };

            if (line_no >= content_lines_.size())
                break;

            const bool is_selected{ has_selection and child_lines_[selected_] == line_no };

            if (is_selected)
                sub_win_content_.set_color(color_type::inverse, term_has_color_);

            mvwprintw(*sub_win_content_, display_line, 0, "%s", content_lines_[line_no].c_str());

            if (is_selected)
                sub_win_content_.unset_color(color_type::inverse, term_has_color_);
        }

        touchline(*sub_win_content_, 0, sub_win_content_.size().y);
        wnoutrefresh(*sub_win_content_);
    }


    /* Screen and viewport management */

    void window::update_screen()
    {
        using detail::redraw_mask;

        status_msg_.clear();

        if (screen_redraw_.has_mask(redraw_mask::RD_ALL))
            clear();

        if (screen_redraw_.has_mask(redraw_mask::RD_TOP))
            draw_top();

        if (screen_redraw_.has_mask(redraw_mask::RD_CONTENT))
            draw_content();

        if (screen_redraw_.has_mask(redraw_mask::RD_STATUS))
            draw_status();

        if (screen_redraw_.has_mask(redraw_mask::RD_HELP))
            draw_help();

        doupdate();
        screen_redraw_.clear();
    }

    /* Renders the current view for the content width and records where its children are */
    void window::update_view_lines()
    {
        using detail::redraw_mask;

        content_lines_.clear();
        child_lines_.clear();
        child_names_.clear();
        screen_redraw_.add_mask(redraw_mask::RD_CONTENT);

        const tree& view{ current_view()() };

        if (view.is_empty())
            return;

        const int width{ sub_win_content_ ? sub_win_content_.size().x - 1 : 0 };
        const std::string text{ view.show({ .line_type = line_type_, .line_max_length = static_cast<std::size_t>(std::max(width, 4)) }) };

        for (std::size_t start{ 0 }, end{ text.find('\n') }; end != std::string::npos; start = end + 1, end = text.find('\n', start))
            content_lines_.push_back(text.substr(start, end - start));

        const auto locations{ view.nodes_with_location() };

        for (std::size_t i{ 0 }; i < locations.size(); ++i)
        {
            if (locations[i].is_last_list.size() == 1)
            {
                child_lines_.push_back(i);
                child_names_.push_back(interactive_tree::attribute_name(locations[i].key));
            }
        }

        if (child_lines_.empty())
            selected_ = 0;
        else
            selected_ = std::min(selected_, child_lines_.size() - 1);
    }

    /* Move the viewport so that the selected child is shown */
    void window::update_viewport_pos()
    {
        using detail::redraw_mask;

        const std::size_t height{ sub_win_content_ ? static_cast<std::size_t>(sub_win_content_.size().y) : 0 };

        if (height != 0 and not child_lines_.empty())
        {
            const std::size_t selected_line{ child_lines_.at(selected_) };

            if (selected_line < line_start_y_)
            {
                line_start_y_ = selected_line;
                screen_redraw_.add_mask(redraw_mask::RD_CONTENT);
            }
            else if (selected_line >= line_start_y_ + height)
            {
                line_start_y_ = selected_line - (height - 1);
                screen_redraw_.add_mask(redraw_mask::RD_CONTENT);
            }
        }

        update_viewport_clamp_lower();
    }

    /* Prevent the viewport from extending beyond the lowest line if the view is taller than the viewport */
    void window::update_viewport_clamp_lower()
    {
        using detail::redraw_mask;

        const std::size_t height{ sub_win_content_ ? static_cast<std::size_t>(sub_win_content_.size().y) : 0 };
        const std::size_t max_start{ content_lines_.size() > height ? content_lines_.size() - height : 0 };

        if (line_start_y_ > max_start)
        {
            line_start_y_ = max_start;
            screen_redraw_.add_mask(redraw_mask::RD_CONTENT);
        }
    }

    void window::update_window_sizes()
    {
        using detail::sub_window;

        static constexpr int top_height{ 1 };
        static constexpr int status_height{ 1 };
        static constexpr int threshold1{ 5 };
        static constexpr int threshold2{ 2 };
        static constexpr int threshold3{ 1 };

        screen_dimensions_ = { .y = getmaxy(stdscr), .x = getmaxx(stdscr) };
        bool show_status{ true };
        bool show_top{ true };
        bool show_help{ help_height_ != 0 };

        if (screen_dimensions_.y <= threshold1)
        {
            show_help = false;
            if (screen_dimensions_.y <= threshold2)
            {
                show_top = false;
                if (screen_dimensions_.y <= threshold3)
                    show_status = false;
            }
        }

        int content_height{ screen_dimensions_.y };
        content_height -= static_cast<int>(show_top) * top_height;
        content_height -= static_cast<int>(show_status) * status_height;
        content_height -= static_cast<int>(show_help) * help_height_;

        if (show_top)
            sub_win_top_ = sub_window{ { .y = top_height, .x = screen_dimensions_.x },
                                       { .y = 0,          .x = 0 } };
        else if (sub_win_top_)
            sub_win_top_ = sub_window{};

        if (content_height > 0)
            sub_win_content_ = sub_window{ { .y = content_height, .x = screen_dimensions_.x },
                                           { .y = static_cast<int>(show_top) * top_height, .x = 0 } };
        else if (sub_win_content_)
            sub_win_content_ = sub_window{};

        if (show_status)
            sub_win_status_ = sub_window{ { .y = status_height, .x = screen_dimensions_.x },
                                          { .y = screen_dimensions_.y - status_height - (static_cast<int>(show_help) * help_height_), .x = 0 } };
        else if (sub_win_status_)
            sub_win_status_ = sub_window{};

        if (show_help)
            sub_win_help_ = sub_window{ { .y = help_height_, .x = screen_dimensions_.x },
                                        { .y = screen_dimensions_.y - help_height_, .x = 0 } };
        else if (sub_win_help_)
            sub_win_help_ = sub_window{};

        /* the rendering depends on the content width */
        if (not views_.empty())
        {
            update_view_lines();
            update_viewport_pos();
        }

        screen_redraw_.set_all();
    }


    /* Main function for window */

    int window::operator()(std::string filename, interactive_tree& document, std::string line_type)
    {
        using detail::redraw_mask;

        current_filename_ = std::move(filename);
        line_type_ = std::move(line_type);
        views_ = { &document };
        saved_selections_.clear();
        selected_ = 0;
        line_start_y_ = 0;

        update_view_lines();

        if (document().is_empty())
            status_msg_.set_warning(strings::empty_document);
        else
            status_msg_.set_message(strings::read_success(document().size(), current_filename_));

        screen_redraw_.set_all();
        update_screen();

        const auto viewer_keymap{ keymap_.make_viewer_keymap() };

        detail::window_event_loop wel{ *this };
        wel(viewer_keymap,
            [&](actions action, bool& exit)
            {
                const std::size_t page_height{ sub_win_content_ ? static_cast<std::size_t>(sub_win_content_.size().y) : 1 };

                switch (action)
                {
                    case actions::close_view:
                        exit = true;
                        break;
                    case actions::refresh:
                        screen_redraw_.set_all();
                        break;

                    /* Selection of a child: */

                    case actions::select_prev:
                        {
                            const std::size_t count{ 1 + wel.crh().extract_multiple_of_same_action(actions::select_prev, viewer_keymap) };
                            select(selected_ - std::min(selected_, count));
                        }
                        break;
                    case actions::select_next:
                        select(selected_ + 1 + wel.crh().extract_multiple_of_same_action(actions::select_next, viewer_keymap));
                        break;
                    case actions::select_first:
                        select(0);
                        break;
                    case actions::select_last:
                        select(child_lines_.empty() ? 0 : child_lines_.size() - 1);
                        break;

                    /* Moving between views: */

                    case actions::open_child:
                        open_selected();
                        break;
                    case actions::go_back:
                        go_back();
                        break;

                    /* Page Position Movement: */

                    case actions::page_up:
                        line_start_y_ -= std::min(line_start_y_, page_height);
                        select_visible();
                        screen_redraw_.add_mask(redraw_mask::RD_CONTENT);
                        break;
                    case actions::page_down:
                        line_start_y_ += page_height;
                        update_viewport_clamp_lower();
                        select_visible();
                        screen_redraw_.add_mask(redraw_mask::RD_CONTENT);
                        break;

                    /* Unbound key entered */

                    case actions::unknown:
                        status_msg_.set_warning(strings::unbound_key(wel.crh().key_name()));
                        break;
                }
            },
            [&]() { update_screen(); }
        );

        return global_signal_status != 0 ? 1 : 0;
    }
}
