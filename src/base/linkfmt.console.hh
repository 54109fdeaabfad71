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

#ifndef linkfmt_console_hh
#define linkfmt_console_hh

#include <set>
#include <string>
#include <vector>

#include <errno.h>
#include <stdio.h>
#include <string.h>

#include "string_fragment.hh"

namespace linkfmt {
namespace console {

struct source_location {
    std::string sl_source{"unknown"};
    int32_t sl_line_number{0};
};

struct snippet {
    static snippet from(source_location loc, const std::string& content)
    {
        snippet retval;

        retval.s_location = std::move(loc);
        retval.s_content = content;
        return retval;
    }

    static snippet from(const std::string& src, const std::string& content)
    {
        return from(source_location{src}, content);
    }

    snippet& with_line(int32_t line)
    {
        this->s_location.sl_line_number = line;
        return *this;
    }

    source_location s_location;
    std::string s_content;
};

struct user_message {
    enum class level {
        raw,
        ok,
        info,
        warning,
        error,
    };

    static user_message raw(const std::string& msg);

    static user_message error(const std::string& msg);

    static user_message warning(const std::string& msg);

    static user_message info(const std::string& msg);

    static user_message ok(const std::string& msg);

    user_message() = default;
    user_message(user_message&&) = default;
    user_message(const user_message&) = default;

    user_message& operator=(user_message&&) = default;
    user_message& operator=(const user_message&) = default;

    user_message& with_reason(const std::string& reason)
    {
        this->um_reason
            = string_fragment::from_str(reason).rtrim(" \t\r\n").to_string();
        return *this;
    }

    user_message& with_errno_reason()
    {
        this->um_reason = strerror(errno);
        return *this;
    }

    user_message& with_snippet(const snippet& sn)
    {
        this->um_snippets.emplace_back(sn);
        return *this;
    }

    template<typename C>
    user_message& with_snippets(C snippets)
    {
        this->um_snippets.insert(this->um_snippets.end(),
                                 std::make_move_iterator(std::begin(snippets)),
                                 std::make_move_iterator(std::end(snippets)));
        return *this;
    }

    user_message& with_note(const std::string& note)
    {
        if (!string_fragment::from_str(note).blank()) {
            this->um_notes.emplace_back(note);
        }

        return *this;
    }

    user_message& with_help(const std::string& help)
    {
        this->um_help
            = string_fragment::from_str(help).rtrim(" \t\r\n").to_string();
        return *this;
    }

    enum class render_flags {
        prefix,
        color,
    };

    std::string to_string(std::set<render_flags> flags
                          = {render_flags::prefix}) const;

    user_message move() & { return std::move(*this); }
    user_message move() && { return std::move(*this); }

    level um_level{level::ok};
    std::string um_message;
    std::vector<snippet> um_snippets;
    std::string um_reason;
    std::vector<std::string> um_notes;
    std::string um_help;
};

/**
 * Decide whether output to the given stream should be styled.  The
 * NO_COLOR and YES_COLOR environment variables take precedence over the
 * check for a terminal.
 */
bool use_color(FILE* file);

void print(FILE* file, const user_message& um);

void print(FILE* file, const std::vector<user_message>& msgs);

}  // namespace console
}  // namespace linkfmt

#endif
