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

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "link.rewriter.hh"
#include "shortcode.parser.hh"

using linkfmt::links::assign_indexes;
using linkfmt::links::definition;
using linkfmt::links::definition_map;
using linkfmt::links::document_source;
using linkfmt::links::scope_context;
using linkfmt::shortcode::assemble;
using linkfmt::shortcode::join_lines;

namespace {

struct rewritten {
    std::unique_ptr<linkfmt::shortcode::scope_node> r_root;
    std::vector<linkfmt::console::user_message> r_warnings;
};

rewritten
rewrite(const char* text, const linkfmt::config& cfg = linkfmt::config{})
{
    auto sf = string_fragment::from_c_str(text);
    auto parse_res = linkfmt::shortcode::parse_document(sf, "doc.md", cfg);
    REQUIRE(parse_res.isOk());

    auto pr = parse_res.unwrap();
    auto src = document_source::from("doc.md", sf);
    auto rewrite_res = linkfmt::links::rewrite_tree(*pr.pr_root, src, cfg);
    REQUIRE(rewrite_res.isOk());

    return rewritten{std::move(pr.pr_root), rewrite_res.unwrap()};
}

std::string
modified(const linkfmt::shortcode::scope_node& node)
{
    return linkfmt::shortcode::join_lines(node.sn_modified_lines);
}

}  // namespace

TEST_CASE("links::assign_indexes")
{
    auto urls = std::vector<std::string>{"http://x", "http://y", "http://z"};
    auto defs = std::vector<definition>{
        {5, "http://y", 0, 1},
        {2, "http://z", 1, 2},
        {7, "http://y", 2, 3},
        {9, "http://unused", 3, 4},
    };

    auto indexes = assign_indexes(urls, defs);
    REQUIRE(indexes.size() == 3);
    CHECK(indexes[0].li_url == "http://x");
    CHECK(indexes[0].li_index == 3);
    CHECK(indexes[1].li_index == 2);
    CHECK(indexes[2].li_index == 1);
}

TEST_CASE("links::assign_indexes-no-definitions")
{
    auto indexes = assign_indexes({"http://a", "http://b"}, {});

    REQUIRE(indexes.size() == 2);
    CHECK(indexes[0].li_index == 1);
    CHECK(indexes[1].li_index == 2);
    CHECK(assign_indexes({}, {}).empty());
}

TEST_CASE("links::strip_control_chars")
{
    CHECK(linkfmt::links::strip_control_chars("a\xE2\x80\xA8" "b\x1E"
                                              "c\xE2\x80\xA9")
          == "abc");
    CHECK(linkfmt::links::strip_control_chars("caf\xC3\xA9") == "caf\xC3\xA9");
}

TEST_CASE("links::scope_context")
{
    definition_map outer_defs{{1, "http://outer/1"}, {2, "http://outer/2"}};
    definition_map inner_defs{{1, "http://inner/1"}};
    scope_context outer{&outer_defs, nullptr};
    scope_context inner{&inner_defs, &outer};

    CHECK(inner.lookup(1).value() == "http://inner/1");
    CHECK(inner.lookup(2).value() == "http://outer/2");
    CHECK_FALSE(inner.lookup(3).has_value());
    CHECK_FALSE(outer.lookup(3).has_value());
}

TEST_CASE("links::document_source")
{
    auto src = document_source::from("doc.md",
                                      string_fragment::from_const("a\r\nb\n"));

    CHECK(src.line_text(1) == "a");
    CHECK(src.line_text(2) == "b");
    CHECK(src.line_text(3).empty());
    CHECK(src.line_text(0).empty());
}

TEST_CASE("links::rewrite-inline-links")
{
    auto res = rewrite("Intro [Docs](https://docs.example.com) and "
                       "[API](https://api.example.com).\n"
                       "Again [docs](https://docs.example.com).\n");

    CHECK(res.r_warnings.empty());
    CHECK(modified(*res.r_root)
          == "Intro [Docs][1] and [API][2].\n"
             "Again [docs][1].\n"
             "\n"
             "[1]: https://docs.example.com\n"
             "[2]: https://api.example.com\n");
}

TEST_CASE("links::rewrite-mixed")
{
    auto res = rewrite("See [here][1] and [there](http://y.com)\n"
                       "[1]: http://x.com\n");

    CHECK(res.r_warnings.empty());
    CHECK(modified(*res.r_root)
          == "See [here][1] and [there][2]\n"
             "[1]: http://x.com\n"
             "[2]: http://y.com\n");
}

TEST_CASE("links::rewrite-no-trailing-newline")
{
    auto res = rewrite("Text [a](http://a.com)");

    CHECK(modified(*res.r_root) == "Text [a][1]\n\n[1]: http://a.com\n");
}

TEST_CASE("links::rewrite-skips-anchors")
{
    static const char INPUT[]
        = "See [top](#top), [q](?x=1) and [wiki](https://en.wikipedia.org/"
          "wiki/Foo_(bar)).\n";

    auto res = rewrite(INPUT);

    CHECK(modified(*res.r_root)
          == "See [top](#top), [q](?x=1) and [wiki][1].\n"
             "\n"
             "[1]: https://en.wikipedia.org/wiki/Foo_(bar)\n");
}

TEST_CASE("links::rewrite-existing-definitions")
{
    auto res = rewrite("[1]: http://a.com\n"
                       "Text [a][1] and [b](http://b.com)\n"
                       "\n"
                       "[2]: http://c.com\n"
                       "[3]: http://b.com\n");

    CHECK(res.r_warnings.empty());
    CHECK(modified(*res.r_root)
          == "Text [a][1] and [b][2]\n"
             "\n"
             "[1]: http://a.com\n"
             "[2]: http://b.com\n");
}

TEST_CASE("links::rewrite-reused-index-compacted")
{
    auto res = rewrite("See [a][3] and [b](http://b.com).\n"
                       "\n"
                       "[3]: http://a.com\n");

    CHECK(modified(*res.r_root)
          == "See [a][1] and [b][2].\n"
             "\n"
             "[1]: http://a.com\n"
             "[2]: http://b.com\n");
}

TEST_CASE("links::rewrite-keeps-indent-and-missing-newline")
{
    auto res = rewrite("Text [a](http://a.com)\n"
                       "\n"
                       "  [2]: http://b.com");

    CHECK(modified(*res.r_root) == "Text [a][1]\n\n  [1]: http://a.com");
}

TEST_CASE("links::rewrite-idempotent")
{
    static const char INPUT[] = "Intro [a][1] and [b][2].\n"
                                "\n"
                                "[1]: http://a.com\n"
                                "[2]: http://b.com\n";

    auto res = rewrite(INPUT);

    CHECK(modified(*res.r_root) == INPUT);
}

TEST_CASE("links::rewrite-duplicate-index")
{
    static const char INPUT[] = "Text [a][1]\n"
                                "\n"
                                "[1]: http://a.com\n"
                                "[1]: http://b.com\n";

    auto sf = string_fragment::from_const(INPUT);
    linkfmt::config cfg;
    auto parse_res = linkfmt::shortcode::parse_document(sf, "doc.md", cfg);
    REQUIRE(parse_res.isOk());
    auto pr = parse_res.unwrap();
    auto src = document_source::from("doc.md", sf);
    auto rewrite_res = linkfmt::links::rewrite_tree(*pr.pr_root, src, cfg);

    REQUIRE(rewrite_res.isErr());
    auto um = rewrite_res.unwrapErr();
    CHECK(um.um_level == linkfmt::console::user_message::level::error);
    CHECK(um.um_message == "duplicate reference index [1]");
    CHECK(um.um_reason
          == "index 1 is defined as both \"http://a.com\" and "
             "\"http://b.com\"");
    REQUIRE(um.um_snippets.size() == 2);
    CHECK(um.um_snippets[0].s_location.sl_line_number == 3);
    CHECK(um.um_snippets[0].s_content == "[1]: http://a.com");
    CHECK(um.um_snippets[1].s_location.sl_line_number == 4);
    CHECK(um.um_notes
          == std::vector<std::string>{"both definitions are in the document"});
}

TEST_CASE("links::rewrite-duplicate-index-in-scope")
{
    static const char INPUT[] = "[1]: http://root.com\n"
                                "{{< tab \"x\" >}}\n"
                                "[1]: http://a.com\n"
                                "[1]: http://b.com\n"
                                "{{< /tab >}}\n";

    auto sf = string_fragment::from_const(INPUT);
    linkfmt::config cfg;
    auto parse_res = linkfmt::shortcode::parse_document(sf, "doc.md", cfg);
    REQUIRE(parse_res.isOk());
    auto pr = parse_res.unwrap();
    auto src = document_source::from("doc.md", sf);
    auto rewrite_res = linkfmt::links::rewrite_tree(*pr.pr_root, src, cfg);

    REQUIRE(rewrite_res.isErr());
    auto um = rewrite_res.unwrapErr();
    CHECK(um.um_snippets[0].s_location.sl_line_number == 3);
    CHECK(um.um_snippets[1].s_location.sl_line_number == 4);
    CHECK(um.um_notes
          == std::vector<std::string>{
              "both definitions are in the {{< tab \"x\" >}} at line 2"});
}

TEST_CASE("links::rewrite-same-index-in-sibling-scopes")
{
    static const char INPUT[] = "{{< tab \"a\" >}}\n"
                                "[x][1]\n"
                                "\n"
                                "[1]: http://a.com\n"
                                "{{< /tab >}}\n"
                                "{{< tab \"b\" >}}\n"
                                "[y][1]\n"
                                "{{< /tab >}}\n";

    auto res = rewrite(INPUT);

    REQUIRE(res.r_root->sn_children.size() == 2);
    CHECK(modified(*res.r_root->sn_children[0])
          == "{{< tab \"a\" >}}\n"
             "[x][1]\n"
             "\n"
             "[1]: http://a.com\n"
             "{{< /tab >}}");
    CHECK(modified(*res.r_root->sn_children[1])
          == "{{< tab \"b\" >}}\n"
             "[y][1]\n"
             "{{< /tab >}}");

    REQUIRE(res.r_warnings.size() == 1);
    const auto& warn = res.r_warnings[0];
    CHECK(warn.um_level == linkfmt::console::user_message::level::warning);
    CHECK(warn.um_message == "reference [1] has no definition");
    REQUIRE(warn.um_snippets.size() == 1);
    CHECK(warn.um_snippets[0].s_location.sl_line_number == 7);
    CHECK(warn.um_snippets[0].s_content == "[y][1]");
}

TEST_CASE("links::rewrite-resolves-from-enclosing-scope")
{
    static const char INPUT[] = "{{< tab >}}\n"
                                "See [a][1].\n"
                                "{{< /tab >}}\n"
                                "\n"
                                "[1]: http://a.com\n";

    auto res = rewrite(INPUT);

    CHECK(res.r_warnings.empty());
    REQUIRE(res.r_root->sn_children.size() == 1);

    const auto& tab = *res.r_root->sn_children[0];
    CHECK(modified(tab)
          == "{{< tab >}}\n"
             "See [a][1].\n"
             "\n"
             "[1]: http://a.com\n"
             "{{< /tab >}}");
    CHECK(modified(*res.r_root) == "{{< tab >}}\n{{< /tab >}}\n\n");
    CHECK(tab.sn_start_line == 0);
    CHECK(tab.sn_end_line == 1);
    CHECK(tab.sn_end == 12);
}

TEST_CASE("links::rewrite-updates-child-positions")
{
    static const char INPUT[]
        = "[a](http://a.com) {{< x >}}[b](http://b.com){{< /x >}} tail\n";

    auto res = rewrite(INPUT);

    REQUIRE(res.r_root->sn_children.size() == 1);
    const auto& child = *res.r_root->sn_children[0];
    CHECK(modified(*res.r_root)
          == "[a][1] {{< x >}}[b](http://b.com){{< /x >}} tail\n"
             "\n"
             "[1]: http://a.com\n");
    CHECK(child.sn_start_line == 0);
    CHECK(child.sn_end_line == 0);
    CHECK(child.sn_start == 7);
    CHECK(child.sn_end == 43);
    CHECK(modified(child) == "{{< x >}}[b](http://b.com){{< /x >}}");
}

TEST_CASE("links::rewrite-literal")
{
    static const char INPUT[] = "{{< code-block lang=\"md\" >}}\n"
                                "[a](http://a.com)\n"
                                "[1]: http://b.com\n"
                                "[1]: http://c.com\n"
                                "{{< /code-block >}}\n";

    auto res = rewrite(INPUT);

    CHECK(res.r_warnings.empty());
    REQUIRE(res.r_root->sn_children.size() == 1);
    const auto& block = *res.r_root->sn_children[0];
    CHECK(block.sn_modified_lines == block.sn_lines);
}

TEST_CASE("links::rewrite-custom-literal")
{
    linkfmt::config cfg;
    cfg.c_literal_name = "raw";

    auto res = rewrite("{{< raw >}}\n"
                       "[a](http://a.com)\n"
                       "{{< /raw >}}\n",
                       cfg);

    const auto& block = *res.r_root->sn_children[0];
    CHECK(block.sn_modified_lines == block.sn_lines);
}

TEST_CASE("links::rewrite-definition-sharing-a-line-with-a-shortcode")
{
    static const char INPUT[]
        = "[1]: http://a.com {{< x >}}y{{< /x >}}\n"
          "[b](http://b.com)\n";

    auto res = rewrite(INPUT);

    CHECK(modified(*res.r_root)
          == "[1]: http://a.com {{< x >}}y{{< /x >}}\n"
             "[b][2]\n"
             "\n"
             "[2]: http://b.com\n");
}

TEST_CASE("links::rewrite-keeps-text-after-a-definition")
{
    SUBCASE("close marker")
    {
        static const char INPUT[] = "{{< tab >}}\n"
                                    "see [a][1]\n"
                                    "[1]: http://x.com {{< /tab >}}\n"
                                    "after\n";

        auto res = rewrite(INPUT);

        CHECK(res.r_warnings.empty());
        REQUIRE(res.r_root->sn_children.size() == 1);
        CHECK(res.r_root->sn_children[0]->sn_closed);
        CHECK(join_lines(assemble(*res.r_root)) == INPUT);
    }

    SUBCASE("one-liner shortcode")
    {
        auto res = rewrite("See [a](http://a.com)\n"
                           "[1]: http://x.com {{< partial \"footer.html\" >}}\n");

        CHECK(modified(*res.r_root)
              == "See [a][2]\n"
                 "[1]: http://x.com {{< partial \"footer.html\" >}}\n"
                 "\n"
                 "[2]: http://a.com\n");
    }

    SUBCASE("title")
    {
        static const char INPUT[] = "See [a](http://a.com) and [t][1]\n"
                                    "\n"
                                    "[1]: http://t.com \"Title\"\n";

        auto res = rewrite(INPUT);

        CHECK(res.r_warnings.empty());
        CHECK(modified(*res.r_root)
              == "See [a][2] and [t][1]\n"
                 "\n"
                 "[1]: http://t.com \"Title\"\n"
                 "\n"
                 "[2]: http://a.com\n");
    }
}

TEST_CASE("links::rewrite-skips-indexes-of-orphans")
{
    static const char INPUT[] = "Intro [a](http://a.com) [z][3]\n"
                                "{{< tab >}}\n"
                                "Tab [d][1]\n"
                                "{{< /tab >}}\n";

    auto res = rewrite(INPUT);

    CHECK(res.r_warnings.size() == 2);
    CHECK(join_lines(assemble(*res.r_root))
          == "Intro [a][2] [z][3]\n"
             "{{< tab >}}\n"
             "Tab [d][1]\n"
             "{{< /tab >}}\n"
             "\n"
             "[2]: http://a.com\n");
}

TEST_CASE("links::rewrite-crlf")
{
    SUBCASE("root")
    {
        auto res = rewrite("See [a](http://a.com)\r\nmore\r\n");

        CHECK(modified(*res.r_root)
              == "See [a][1]\r\nmore\r\n\r\n[1]: http://a.com\r\n");
    }

    SUBCASE("existing definitions")
    {
        auto res = rewrite("[x](http://x.com)\r\n\r\n[1]: http://y.com\r\n");

        CHECK(modified(*res.r_root)
              == "[x][1]\r\n\r\n[1]: http://x.com\r\n");
    }

    SUBCASE("scope")
    {
        auto res = rewrite("{{< tab >}}\r\n"
                           "[a](http://a.com)\r\n"
                           "{{< /tab >}}\r\n");

        CHECK(join_lines(assemble(*res.r_root))
              == "{{< tab >}}\r\n"
                 "[a][1]\r\n"
                 "\r\n"
                 "[1]: http://a.com\r\n"
                 "{{< /tab >}}\r\n");
    }
}
