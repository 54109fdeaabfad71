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

#include "linkfmt_config.hh"

#include "config.h"
#include "fmt/format.h"
#include "pcrepp/pcre2pp.hh"

namespace linkfmt {

static const auto NAME_RE = pcre2pp::code::from_const(R"(^[A-Za-z0-9_-]+$)");
static const auto EXT_RE = pcre2pp::code::from_const(R"(^\.[^/\s]+$)");

Result<void, std::vector<console::user_message>>
validate_config(const config& cfg)
{
    std::vector<console::user_message> errors;
    const auto check_name = [&errors](const std::string& what,
                                      const std::string& name) {
        if (NAME_RE.find_in(name).ignore_error()) {
            return;
        }

        errors.emplace_back(
            console::user_message::error(
                fmt::format(FMT_STRING("invalid {} name: \"{}\""), what, name))
                .with_reason("shortcode names can only contain letters, "
                             "digits, underscores and dashes"));
    };

    for (const auto& name : cfg.c_one_liners) {
        check_name("one-liner shortcode", name);
    }
    if (!cfg.c_literal_name.empty()) {
        check_name("literal shortcode", cfg.c_literal_name);
        if (cfg.is_one_liner(cfg.c_literal_name)) {
            errors.emplace_back(
                console::user_message::error(
                    fmt::format(FMT_STRING("shortcode \"{}\" cannot be both a "
                                           "one-liner and literal"),
                                cfg.c_literal_name))
                    .with_help("remove it from the one-liner list"));
        }
    }
    if (!EXT_RE.find_in(cfg.c_extension).ignore_error()) {
        errors.emplace_back(
            console::user_message::error(
                fmt::format(FMT_STRING("invalid file extension: \"{}\""),
                            cfg.c_extension))
                .with_help("extensions start with a dot, like \".md\""));
    }

    if (!errors.empty()) {
        return Err(std::move(errors));
    }

    return Ok();
}

}  // namespace linkfmt
