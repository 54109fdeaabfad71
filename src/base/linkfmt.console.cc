/**
 * Copyright (c) 2024, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include <unistd.h>

#include "linkfmt.console.hh"

#include "config.h"
#include "fmt/color.h"
#include "opt_util.hh"

namespace linkfmt {
namespace console {

user_message
user_message::raw(const std::string& msg)
{
    user_message retval;

    retval.um_level = level::raw;
    retval.um_message = msg;
    return retval;
}

user_message
user_message::error(const std::string& msg)
{
    user_message retval;

    retval.um_level = level::error;
    retval.um_message = msg;
    return retval;
}

user_message
user_message::info(const std::string& msg)
{
    user_message retval;

    retval.um_level = level::info;
    retval.um_message = msg;
    return retval;
}

user_message
user_message::ok(const std::string& msg)
{
    user_message retval;

    retval.um_level = level::ok;
    retval.um_message = msg;
    return retval;
}

user_message
user_message::warning(const std::string& msg)
{
    user_message retval;

    retval.um_level = level::warning;
    retval.um_message = msg;
    return retval;
}

namespace {

struct styler {
    bool s_color;

    std::string operator()(fmt::text_style style, const std::string& str) const
    {
        if (!this->s_color) {
            return str;
        }

        return fmt::format(style, "{}", str);
    }
};

fmt::text_style
level_style(user_message::level lvl)
{
    switch (lvl) {
        case user_message::level::error:
            return fmt::fg(fmt::terminal_color::red) | fmt::emphasis::bold;
        case user_message::level::warning:
            return fmt::fg(fmt::terminal_color::yellow) | fmt::emphasis::bold;
        case user_message::level::info:
            return fmt::fg(fmt::terminal_color::cyan);
        case user_message::level::ok:
            return fmt::fg(fmt::terminal_color::green);
        default:
            return fmt::text_style{};
    }
}

}  // namespace

std::string
user_message::to_string(std::set<render_flags> flags) const
{
    const auto style = styler{flags.count(render_flags::color) > 0};
    const auto border = fmt::fg(fmt::terminal_color::blue);
    const auto lvl_style = level_style(this->um_level);
    std::string retval;

    if (flags.count(render_flags::prefix)) {
        switch (this->um_level) {
            case level::raw:
                break;
            case level::ok:
                retval.append(style(lvl_style, "✔")).append(" ");
                break;
            case level::info:
                retval.append(style(lvl_style, "info")).append(": ");
                break;
            case level::warning:
                retval.append(style(lvl_style, "warning")).append(": ");
                break;
            case level::error:
                retval.append(style(lvl_style, "error")).append(": ");
                break;
        }
    }

    retval.append(this->um_message).append("\n");
    if (!this->um_reason.empty()) {
        bool first_line = true;
        for (const auto& line :
             string_fragment::from_str(this->um_reason).split_lines())
        {
            if (first_line) {
                retval.append(style(border, " |"))
                    .append(" ")
                    .append(style(lvl_style, "reason"))
                    .append(": ");
                first_line = false;
            } else {
                retval.append(style(border, " |      "));
            }
            retval.append(line.rtrim("\n").to_string()).append("\n");
        }
    }
    for (const auto& snip : this->um_snippets) {
        retval.append(style(border, " --> "))
            .append(style(fmt::emphasis::bold, snip.s_location.sl_source));
        if (snip.s_location.sl_line_number > 0) {
            retval.append(":").append(
                std::to_string(snip.s_location.sl_line_number));
        }
        retval.append("\n");
        for (const auto& line :
             string_fragment::from_str(snip.s_content).split_lines())
        {
            retval.append(style(border, " | "))
                .append(line.rtrim("\r\n").to_string())
                .append("\n");
        }
    }
    for (const auto& note : this->um_notes) {
        bool first_line = true;
        for (const auto& line : string_fragment::from_str(note).split_lines()) {
            if (first_line) {
                retval.append(style(border, " ="))
                    .append(" ")
                    .append(style(fmt::emphasis::bold, "note"))
                    .append(": ");
                first_line = false;
            } else {
                retval.append("         ");
            }
            retval.append(line.rtrim("\n").to_string()).append("\n");
        }
    }
    if (!this->um_help.empty()) {
        bool first_line = true;
        for (const auto& line :
             string_fragment::from_str(this->um_help).split_lines())
        {
            if (first_line) {
                retval.append(style(border, " ="))
                    .append(" ")
                    .append(style(fmt::emphasis::bold, "help"))
                    .append(": ");
                first_line = false;
            } else {
                retval.append("         ");
            }
            retval.append(line.rtrim("\n").to_string()).append("\n");
        }
    }

    return retval;
}

static bool
get_no_color()
{
    return getenv("NO_COLOR") != nullptr;
}

static bool
get_yes_color()
{
    return getenv("YES_COLOR") != nullptr;
}

static bool
get_fd_tty(int fd)
{
    return isatty(fd);
}

bool
use_color(FILE* file)
{
    static const auto IS_NO_COLOR = get_no_color();
    static const auto IS_YES_COLOR = get_yes_color();
    static const auto IS_STDOUT_TTY = get_fd_tty(STDOUT_FILENO);
    static const auto IS_STDERR_TTY = get_fd_tty(STDERR_FILENO);

    if (IS_NO_COLOR || (file != stdout && file != stderr)) {
        return false;
    }
    if (IS_YES_COLOR) {
        return true;
    }

    return (file == stdout && IS_STDOUT_TTY)
        || (file == stderr && IS_STDERR_TTY);
}

void
print(FILE* file, const user_message& um)
{
    auto flags = std::set<user_message::render_flags>{
        user_message::render_flags::prefix,
    };

    if (use_color(file)) {
        flags.insert(user_message::render_flags::color);
    }
    fmt::print(file, "{}", um.to_string(flags));
}

void
print(FILE* file, const std::vector<user_message>& msgs)
{
    for (const auto& um : msgs) {
        print(file, um);
    }
}

}  // namespace console
}  // namespace linkfmt
