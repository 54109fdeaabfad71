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
#include "shortcode.parser.hh"

using linkfmt::shortcode::find_markers;
using linkfmt::shortcode::marker_kind;
using linkfmt::shortcode::parse_document;

static const linkfmt::config DEFAULT_CONFIG{};

TEST_CASE("shortcode::find_markers")
{
    auto res = find_markers(string_fragment::from_const(
        R"(a {{< tab "x" >}}b{{% /tab %}} {{</ tab >}})"));

    REQUIRE(res.isOk());
    auto markers = res.unwrap();
    REQUIRE(markers.size() == 3);
    CHECK(markers[0].m_kind == marker_kind::open);
    CHECK(markers[0].m_name == "tab");
    CHECK(markers[0].m_args == "\"x\"");
    CHECK(markers[0].m_start == 2);
    CHECK(markers[0].m_end == 17);
    CHECK(markers[1].m_kind == marker_kind::close);
    CHECK(markers[1].m_start == 18);
    CHECK(markers[1].m_end == 30);
    CHECK(markers[2].m_kind == marker_kind::close);
    CHECK(markers[2].m_name == "tab");
}

TEST_CASE("shortcode::find_markers-overlap")
{
    auto res = find_markers(string_fragment::from_const("{{< a {{< /a >}}"));

    REQUIRE(res.isOk());
    auto markers = res.unwrap();
    REQUIRE(markers.size() == 1);
    CHECK(markers[0].m_kind == marker_kind::open);
    CHECK(markers[0].m_end == 16);
}

TEST_CASE("shortcode::find_markers-not-a-marker")
{
    auto res = find_markers(
        string_fragment::from_const("**Note**: `{{ .Site }}` and {{<>}}"));

    REQUIRE(res.isOk());
    CHECK(res.unwrap().empty());
}

TEST_CASE("shortcode::parse-no-shortcodes")
{
    auto res = parse_document(string_fragment::from_const("This is some text"),
                              "foo.md",
                              DEFAULT_CONFIG);

    REQUIRE(res.isOk());
    auto pr = res.unwrap();
    CHECK(pr.pr_root->is_root());
    CHECK(pr.pr_root->sn_children.empty());
    CHECK(pr.pr_root->sn_lines.size() == 1);
    CHECK(pr.pr_warnings.empty());
}

TEST_CASE("shortcode::parse-inline-backticks")
{
    auto res = parse_document(
        string_fragment::from_const("**Note**: Mention ```@zenduty``` as a "
                                    "channel under **Notify your team**"),
        "foo.md",
        DEFAULT_CONFIG);

    REQUIRE(res.isOk());
    CHECK(res.unwrap().pr_root->sn_children.empty());
}

TEST_CASE("shortcode::parse-one-liner")
{
    auto res = parse_document(
        string_fragment::from_const(
            "## Further Reading\n"
            R"({{< partial name="whats-next/whats-next.html" >}})"),
        "foo.md",
        DEFAULT_CONFIG);

    REQUIRE(res.isOk());
    auto pr = res.unwrap();
    CHECK(pr.pr_root->sn_children.empty());
    CHECK(pr.pr_root->sn_lines.size() == 2);
    CHECK(pr.pr_warnings.empty());
}

TEST_CASE("shortcode::parse-custom-one-liner")
{
    auto cfg = DEFAULT_CONFIG;
    cfg.c_one_liners = {"img"};

    auto res = parse_document(
        string_fragment::from_const("{{< img src=\"a.png\" >}}\n"
                                    "{{< partial name=\"x.html\" >}}\n"),
        "foo.md",
        cfg);

    REQUIRE(res.isOk());
    auto pr = res.unwrap();
    REQUIRE(pr.pr_root->sn_children.size() == 1);
    CHECK(pr.pr_root->sn_children[0]->sn_name == "partial");
    CHECK_FALSE(pr.pr_root->sn_children[0]->sn_closed);
    CHECK(pr.pr_warnings.size() == 1);
}

TEST_CASE("shortcode::parse-single-line-nesting")
{
    static const char INPUT[]
        = R"({{< programming-lang-wrapper langs="java,go" >}})"
          R"({{< programming-lang lang="java" >}})"
          R"({{< tabs >}}{{% tab "set_tag" %}}{{% /tab %}}{{< /tabs >}})"
          R"({{< /programming-lang >}}{{< /programming-lang-wrapper >}})";

    auto res = parse_document(
        string_fragment::from_const(INPUT), "foo.md", DEFAULT_CONFIG);

    REQUIRE(res.isOk());
    auto pr = res.unwrap();
    CHECK(pr.pr_warnings.empty());
    REQUIRE(pr.pr_root->sn_children.size() == 1);

    const auto& wrapper = *pr.pr_root->sn_children[0];
    CHECK(wrapper.sn_name == "programming-lang-wrapper");
    CHECK(wrapper.sn_args == "langs=\"java,go\"");
    CHECK(wrapper.sn_closed);
    CHECK(wrapper.is_inline());
    CHECK(wrapper.sn_start == 0);
    CHECK(wrapper.sn_end == (int) strlen(INPUT));
    REQUIRE(wrapper.sn_lines.size() == 1);
    CHECK(wrapper.sn_lines[0] == INPUT);

    REQUIRE(wrapper.sn_children.size() == 1);
    const auto& lang = *wrapper.sn_children[0];
    CHECK(lang.sn_name == "programming-lang");
    CHECK(lang.is_inline());
    CHECK(lang.sn_start == 48);

    REQUIRE(lang.sn_children.size() == 1);
    const auto& tabs = *lang.sn_children[0];
    CHECK(tabs.sn_start == 36);
    REQUIRE(tabs.sn_children.size() == 1);
    const auto& tab = *tabs.sn_children[0];
    CHECK(tab.sn_name == "tab");
    CHECK(tab.sn_start == 12);
    CHECK(tab.sn_end == 45);
    CHECK(tab.sn_lines[0] == R"({{% tab "set_tag" %}}{{% /tab %}})");
}

TEST_CASE("shortcode::parse-nested-site-region")
{
    static const char INPUT[] = R"(
Root text
{{< site-region region="us3" >}}
    Root site region
    {{< site-region region="us,us5,eu,gov" >}}Nested Region 1{{< /site-region >}}
    {{< site-region region="us3" >}}Nested Region 2{{< /site-region >}}
{{< /site-region >}}
Text after
    )";

    auto res = parse_document(
        string_fragment::from_const(INPUT), "foo.md", DEFAULT_CONFIG);

    REQUIRE(res.isOk());
    auto pr = res.unwrap();
    const auto& root = *pr.pr_root;

    CHECK(pr.pr_warnings.empty());
    CHECK(root.sn_lines.size() == 6);
    CHECK(root.sn_lines[3] == "{{< /site-region >}}\n");
    CHECK(root.sn_line_numbers == (std::vector<int>{1, 2, 3, 7, 8, 9}));
    REQUIRE(root.sn_children.size() == 1);

    const auto& outer = *root.sn_children[0];
    CHECK(outer.sn_closed);
    CHECK_FALSE(outer.is_inline());
    CHECK(outer.sn_source_line == 3);
    CHECK(outer.sn_start_line == 2);
    CHECK(outer.sn_end_line == 3);
    CHECK(outer.sn_start == 0);
    CHECK(outer.sn_end == 20);
    REQUIRE(outer.sn_lines.size() == 5);
    CHECK(outer.sn_lines[4] == "{{< /site-region >}}");
    REQUIRE(outer.sn_children.size() == 2);

    const auto& first = *outer.sn_children[0];
    CHECK(first.is_inline());
    CHECK(first.sn_start_line == 2);
    CHECK(first.sn_start == 4);
    CHECK(first.sn_args == R"(region="us,us5,eu,gov")");
    REQUIRE(first.sn_lines.size() == 1);
    CHECK(first.sn_lines[0]
          == R"({{< site-region region="us,us5,eu,gov" >}}Nested Region 1)"
             R"({{< /site-region >}})");
    CHECK(first.sn_end == 4 + (int) first.sn_lines[0].size());

    const auto& second = *outer.sn_children[1];
    CHECK(second.sn_start_line == 3);
    CHECK(second.sn_end_line == 3);
}

TEST_CASE("shortcode::parse-unknown-unclosed")
{
    static const char INPUT[] = R"(
This
{{< tab "blah" >}}
Stuff here
{{</ tab >}}
is text {{< foobar test="stuff" >}} and more
{{< tab "durp" >}}
Stuff here
{{</ tab >}})";

    auto res = parse_document(
        string_fragment::from_const(INPUT), "foo.md", DEFAULT_CONFIG);

    REQUIRE(res.isOk());
    auto pr = res.unwrap();
    REQUIRE(pr.pr_root->sn_children.size() == 2);

    const auto& foobar = *pr.pr_root->sn_children[1];
    CHECK(foobar.sn_name == "foobar");
    CHECK_FALSE(foobar.sn_closed);
    CHECK(foobar.sn_start_line == 4);
    CHECK(foobar.sn_end_line == 4);
    CHECK(foobar.sn_start == 8);
    CHECK(foobar.sn_end == (int) pr.pr_root->sn_lines[4].size());
    CHECK(foobar.sn_lines.size() == 3);
    REQUIRE(foobar.sn_children.size() == 1);
    CHECK(foobar.sn_children[0]->sn_closed);
    CHECK(foobar.sn_children[0]->sn_args == "\"durp\"");

    REQUIRE(pr.pr_warnings.size() == 1);
    const auto& warn = pr.pr_warnings[0];
    CHECK(warn.um_level == linkfmt::console::user_message::level::warning);
    CHECK(warn.um_message == "unclosed shortcode \"foobar\"");
    REQUIRE(warn.um_snippets.size() == 1);
    CHECK(warn.um_snippets[0].s_location.sl_source == "foo.md");
    CHECK(warn.um_snippets[0].s_location.sl_line_number == 6);
    CHECK(warn.um_snippets[0].s_content
          == R"(is text {{< foobar test="stuff" >}} and more)");
}

TEST_CASE("shortcode::parse-unclosed-order")
{
    auto res = parse_document(
        string_fragment::from_const("{{< a >}}\n{{< b >}}\ntext\n"),
        "foo.md",
        DEFAULT_CONFIG);

    REQUIRE(res.isOk());
    auto pr = res.unwrap();
    REQUIRE(pr.pr_warnings.size() == 2);
    CHECK(pr.pr_warnings[0].um_message == "unclosed shortcode \"a\"");
    CHECK(pr.pr_warnings[1].um_message == "unclosed shortcode \"b\"");

    const auto& a_node = *pr.pr_root->sn_children[0];
    CHECK(pr.pr_root->sn_lines.size() == 1);
    CHECK(a_node.sn_end == 10);
    CHECK(a_node.sn_lines.size() == 2);
    CHECK(a_node.sn_children[0]->sn_lines.size() == 2);
}

TEST_CASE("shortcode::parse-argument-with-arrow")
{
    static const char INPUT[] = R"(
Here is some root text
{{< tab "MySQL < 4.0" >}}
Text here
{{< /tab >}}
and after
{{< tab "foo" >}}
Stuff here
{{</ tab >}})";

    auto res = parse_document(
        string_fragment::from_const(INPUT), "foo.md", DEFAULT_CONFIG);

    REQUIRE(res.isOk());
    auto pr = res.unwrap();
    CHECK(pr.pr_warnings.empty());
    REQUIRE(pr.pr_root->sn_children.size() == 2);
    CHECK(pr.pr_root->sn_children[0]->sn_args == "\"MySQL < 4.0\"");
    CHECK(pr.pr_root->sn_children[1]->sn_start_line == 5);
}

TEST_CASE("shortcode::parse-non-ascii")
{
    static const char INPUT[] = R"(
Here is text
{{% tab "ドライバーのみ" %}}
Hello world
{{% /tab %}}
{{% tab "標準" %}}
Hello world 2
{{% /tab %}})";

    auto res = parse_document(
        string_fragment::from_const(INPUT), "foo.md", DEFAULT_CONFIG);

    REQUIRE(res.isOk());
    auto pr = res.unwrap();
    REQUIRE(pr.pr_root->sn_children.size() == 2);
    CHECK(pr.pr_root->sn_children[0]->sn_args == "\"ドライバーのみ\"");
    CHECK(pr.pr_root->sn_children[1]->sn_args == "\"標準\"");
    CHECK(pr.pr_root->sn_children[1]->sn_closed);
}

TEST_CASE("shortcode::parse-close-then-open")
{
    auto res = parse_document(
        string_fragment::from_const(
            "{{< a >}}\nx\n{{< /a >}} {{< b >}}y{{< /b >}}\n"),
        "foo.md",
        DEFAULT_CONFIG);

    REQUIRE(res.isOk());
    auto pr = res.unwrap();
    REQUIRE(pr.pr_root->sn_children.size() == 2);

    const auto& b_node = *pr.pr_root->sn_children[1];
    CHECK(b_node.sn_start_line == 1);
    CHECK(b_node.sn_end_line == 1);
    CHECK(b_node.sn_start == 11);
    CHECK(b_node.sn_end == 31);
}

TEST_CASE("shortcode::parse-mismatched-close")
{
    auto res = parse_document(
        string_fragment::from_const(
            "{{< tabs >}}\n{{< /tab >}}\n{{< /tabs >}}\nafter\n"),
        "foo.md",
        DEFAULT_CONFIG);

    REQUIRE(res.isOk());
    auto pr = res.unwrap();
    CHECK(pr.pr_warnings.empty());
    REQUIRE(pr.pr_root->sn_children.size() == 1);

    const auto& tabs = *pr.pr_root->sn_children[0];
    CHECK(tabs.sn_closed);
    CHECK(tabs.sn_lines.size() == 3);
    CHECK(tabs.sn_end_line == 1);
    CHECK(tabs.sn_end == 13);
    CHECK(pr.pr_root->sn_lines.size() == 3);
}

TEST_CASE("shortcode::parse-literal")
{
    auto res = parse_document(
        string_fragment::from_const("{{< code-block lang=\"md\" >}}\n"
                                    "{{< tab >}}\n"
                                    "{{< /code-block >}}\n"),
        "foo.md",
        DEFAULT_CONFIG);

    REQUIRE(res.isOk());
    auto pr = res.unwrap();
    CHECK(pr.pr_warnings.empty());
    REQUIRE(pr.pr_root->sn_children.size() == 1);

    const auto& block = *pr.pr_root->sn_children[0];
    CHECK(block.sn_name == "code-block");
    CHECK(block.sn_closed);
    CHECK(block.sn_children.empty());
    CHECK(block.sn_lines.size() == 3);
}

TEST_CASE("shortcode::parse-empty")
{
    auto res = parse_document(
        string_fragment::from_const(""), "empty.md", DEFAULT_CONFIG);

    REQUIRE(res.isErr());
    auto um = res.unwrapErr();
    CHECK(um.um_level == linkfmt::console::user_message::level::error);
    CHECK(um.um_message == "unable to parse document");
    REQUIRE(um.um_snippets.size() == 1);
    CHECK(um.um_snippets[0].s_location.sl_source == "empty.md");
}
