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

#include <string>

#include "string_fragment.hh"

#include "config.h"
#include "doctest/doctest.h"

TEST_CASE("string_fragment::startswith")
{
    std::string empty;
    auto sf = string_fragment{empty};

    CHECK_FALSE(sf.startswith("abc"));
    CHECK("{{< tab >}}"_frag.startswith("{{<"));
    CHECK("[1]: http://x"_frag.endswith("x"));
}

TEST_CASE("string_fragment::split_lines")
{
    std::string in1 = "Hello, World!";
    std::string in2 = "Hello, World!\nGoodbye, World!";
    std::string in3 = "one\n\nthree\n";

    {
        auto sf = string_fragment(in1);
        auto split = sf.split_lines();

        CHECK(1 == split.size());
        CHECK(in1 == split[0].to_string());
    }

    {
        auto sf = string_fragment::from_str_range(in1, 7, -1);
        auto split = sf.split_lines();

        CHECK(1 == split.size());
        CHECK("World!" == split[0].to_string());
    }

    {
        auto sf = string_fragment(in2);
        auto split = sf.split_lines();

        CHECK(2 == split.size());
        CHECK("Hello, World!\n" == split[0].to_string());
        CHECK("Goodbye, World!" == split[1].to_string());
    }

    {
        auto split = string_fragment(in3).split_lines();

        REQUIRE(3 == split.size());
        CHECK("\n" == split[1].to_string());
        CHECK("three\n" == split[2].to_string());
        CHECK(in3.size() == (size_t) split[2].sf_end);
    }

    {
        std::string empty;

        CHECK(string_fragment(empty).split_lines().empty());
    }
}

TEST_CASE("string_fragment::trim")
{
    CHECK("abc" == "  abc \n"_frag.trim().to_string());
    CHECK("  abc" == "  abc \r\n"_frag.rtrim(" \r\n").to_string());
    CHECK("" == " \t "_frag.trim().to_string());
    CHECK(" \t\n"_frag.blank());
    CHECK_FALSE(" x "_frag.blank());
}

TEST_CASE("string_fragment::find")
{
    auto sf = "See [here][1] and"_frag;

    CHECK(4 == sf.find('[').value());
    CHECK_FALSE(sf.find('#').has_value());
    CHECK(9 == sf.find("]["_frag).value());
    CHECK_FALSE(sf.find("]("_frag).has_value());
    CHECK(2 == sf.count('['));
}

TEST_CASE("string_fragment::sub_range")
{
    std::string line = "text {{< tab >}} more";
    auto sf = string_fragment::from_str(line).substr(5);

    CHECK("{{< tab >}} more" == sf.to_string());
    CHECK(5 == sf.sf_begin);
    CHECK("tab" == sf.sub_range(4, 7).to_string());
    CHECK("more" == sf.sub_range(12, 100).to_string());
}
