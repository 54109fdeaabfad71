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

#include "linkfmt.console.hh"

#include "config.h"
#include "doctest/doctest.h"

using linkfmt::console::snippet;
using linkfmt::console::source_location;
using linkfmt::console::user_message;

TEST_CASE("user_message::plain")
{
    auto um = user_message::error("duplicate reference index [1]")
                  .with_reason("index 1 is defined twice")
                  .with_snippet(snippet::from(source_location{"doc.md", 3},
                                              "[1]: http://a"))
                  .with_snippet(snippet::from(source_location{"doc.md", 4},
                                              "[1]: http://b"))
                  .with_note("both definitions are in the document")
                  .with_help("give each definition its own index");

    CHECK(um.to_string()
          == "error: duplicate reference index [1]\n"
             " | reason: index 1 is defined twice\n"
             " --> doc.md:3\n"
             " | [1]: http://a\n"
             " --> doc.md:4\n"
             " | [1]: http://b\n"
             " = note: both definitions are in the document\n"
             " = help: give each definition its own index\n");
}

TEST_CASE("user_message::levels")
{
    CHECK(user_message::warning("unclosed").to_string()
          == "warning: unclosed\n");
    CHECK(user_message::info("formatting file a.md").to_string()
          == "info: formatting file a.md\n");
    CHECK(user_message::raw("as-is").to_string() == "as-is\n");
    CHECK(user_message::error("bad").to_string({}) == "bad\n");
}

TEST_CASE("user_message::builders")
{
    auto um = user_message::warning("reference [2] has no definition")
                  .with_note("   ")
                  .with_reason("missing\n");

    CHECK(um.um_notes.empty());
    CHECK("missing" == um.um_reason);

    errno = ENOENT;
    um.with_errno_reason();
    CHECK(um.um_reason == strerror(ENOENT));
}

TEST_CASE("user_message::color")
{
    auto str = user_message::error("bad").to_string(
        {user_message::render_flags::prefix,
         user_message::render_flags::color});

    CHECK(str.find("\x1b[") != std::string::npos);
    CHECK(str.find("bad") != std::string::npos);
}
