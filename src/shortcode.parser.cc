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

#include <algorithm>

#include "shortcode.parser.hh"

#include "base/linkfmt_log.hh"
#include "config.h"
#include "fmt/format.h"
#include "pcrepp/pcre2pp.hh"

namespace linkfmt::shortcode {

static const auto OPEN_RE = pcre2pp::code::from_const(
    R"(\{\{[<%]\s*([A-Za-z0-9_-]+)(.*?)\s*[%>]\}\})");
static const auto CLOSE_RE = pcre2pp::code::from_const(
    R"(\{\{[<%]\s*/\s*([A-Za-z0-9_-]+)\s*[%>]\}\})");

static console::user_message
match_error(const char* what, pcre2pp::matcher::error err)
{
    return console::user_message::error(
               fmt::format(FMT_STRING("unable to search for {}"), what))
        .with_reason(err.get_message());
}

Result<std::vector<marker>, console::user_message>
find_markers(string_fragment line)
{
    std::vector<marker> found;

    auto open_res = OPEN_RE.capture_from(line).for_each(
        [&found, &line](const pcre2pp::match_data& md) {
            found.emplace_back(marker{
                marker_kind::open,
                md[1]->to_string(),
                md[2]->trim().to_string(),
                md[0]->sf_begin - line.sf_begin,
                md[0]->sf_end - line.sf_begin,
            });
        });
    if (open_res.isErr()) {
        return Err(match_error("shortcode open markers", open_res.unwrapErr()));
    }

    auto close_res = CLOSE_RE.capture_from(line).for_each(
        [&found, &line](const pcre2pp::match_data& md) {
            found.emplace_back(marker{
                marker_kind::close,
                md[1]->to_string(),
                std::string(),
                md[0]->sf_begin - line.sf_begin,
                md[0]->sf_end - line.sf_begin,
            });
        });
    if (close_res.isErr()) {
        return Err(
            match_error("shortcode close markers", close_res.unwrapErr()));
    }

    std::stable_sort(
        found.begin(), found.end(), [](const marker& lhs, const marker& rhs) {
            return lhs.m_start < rhs.m_start;
        });

    std::vector<marker> retval;
    int consumed = 0;
    for (auto& mark : found) {
        if (mark.m_start < consumed) {
            log_debug("  dropping marker %s overlapping an earlier one at %d",
                      mark.m_name.c_str(),
                      mark.m_start);
            continue;
        }
        consumed = mark.m_end;
        retval.emplace_back(std::move(mark));
    }

    return Ok(std::move(retval));
}

namespace {

struct frame {
    scope_node* f_node;
    /** The column in the current source line where the node's row starts. */
    int f_column;
};

}  // namespace

Result<parse_result, console::user_message>
parse_document(string_fragment text,
               const std::string& source,
               const config& cfg)
{
    parse_result retval;
    auto root = std::make_unique<scope_node>(ROOT_NAME);
    std::vector<frame> stack{frame{root.get(), 0}};
    const auto lines = text.split_lines();
    int line_number = 0;

    for (const auto& line : lines) {
        line_number += 1;

        stack.back().f_node->push_line(line.to_string(), line_number);
        stack.back().f_column = 0;

        auto markers = TRY(find_markers(line));
        for (const auto& mark : markers) {
            auto* curr = stack.back().f_node;
            auto curr_column = stack.back().f_column;

            switch (mark.m_kind) {
                case marker_kind::open: {
                    if (cfg.is_one_liner(mark.m_name)) {
                        log_trace("%s:%d: one-liner shortcode %s",
                                  source.c_str(),
                                  line_number,
                                  mark.m_name.c_str());
                        break;
                    }
                    if (cfg.is_literal(curr->sn_name)) {
                        log_trace("%s:%d: ignoring %s inside %s",
                                  source.c_str(),
                                  line_number,
                                  mark.m_name.c_str(),
                                  curr->sn_name.c_str());
                        break;
                    }

                    auto child = std::make_unique<scope_node>(mark.m_name);
                    child->sn_args = mark.m_args;
                    child->sn_source_line = line_number;
                    child->sn_start_line = curr->sn_lines.size() - 1;
                    child->sn_start = mark.m_start - curr_column;
                    child->push_line(line.substr(mark.m_start).to_string(),
                                     line_number);
                    log_debug("%s:%d: open %s in %s (row %d, column %d)",
                              source.c_str(),
                              line_number,
                              mark.m_name.c_str(),
                              curr->sn_name.c_str(),
                              child->sn_start_line,
                              child->sn_start);

                    auto* child_node = curr->add_child(std::move(child));
                    stack.emplace_back(frame{child_node, mark.m_start});
                    break;
                }
                case marker_kind::close: {
                    if (curr->is_root() || curr->sn_name != mark.m_name) {
                        log_debug("%s:%d: ignoring close of %s inside %s",
                                  source.c_str(),
                                  line_number,
                                  mark.m_name.c_str(),
                                  curr->sn_name.c_str());
                        break;
                    }

                    curr->sn_lines.back().erase(mark.m_end - curr_column);
                    curr->sn_closed = true;
                    stack.pop_back();

                    auto& parent = stack.back();
                    if (curr->sn_lines.size() == 1) {
                        curr->sn_end_line = curr->sn_start_line;
                    } else {
                        parent.f_node->push_line(line.to_string(),
                                                 line_number);
                        parent.f_column = 0;
                        curr->sn_end_line = curr->sn_start_line + 1;
                        ensure(curr->sn_end_line
                               == (int) parent.f_node->sn_lines.size() - 1);
                    }
                    curr->sn_end = mark.m_end - parent.f_column;
                    log_debug("%s:%d: close %s (rows %d-%d, columns %d-%d)",
                              source.c_str(),
                              line_number,
                              curr->sn_name.c_str(),
                              curr->sn_start_line,
                              curr->sn_end_line,
                              curr->sn_start,
                              curr->sn_end);
                    break;
                }
            }
        }
    }

    if (root->sn_lines.empty()) {
        return Err(console::user_message::error("unable to parse document")
                       .with_reason("the document is empty")
                       .with_snippet(console::snippet::from(source, "")));
    }

    while (stack.size() > 1) {
        auto* node = stack.back().f_node;

        stack.pop_back();

        const auto* parent = stack.back().f_node;
        node->sn_end_line = node->sn_start_line;
        node->sn_end = parent->sn_lines[node->sn_start_line].size();
        log_warning("%s:%d: unclosed shortcode %s",
                    source.c_str(),
                    node->sn_source_line,
                    node->sn_name.c_str());
        retval.pr_warnings.emplace_back(
            console::user_message::warning(
                fmt::format(FMT_STRING("unclosed shortcode \"{}\""),
                            node->sn_name))
                .with_reason("no close marker was found before the end of "
                             "the document")
                .with_snippet(console::snippet::from(
                    console::source_location{source, node->sn_source_line},
                    lines[node->sn_source_line - 1].rtrim("\r\n").to_string()))
                .with_help(fmt::format(
                    FMT_STRING("add a \"{{{{< /{} >}}}}\" marker or declare "
                               "\"{}\" as a one-liner shortcode"),
                    node->sn_name,
                    node->sn_name)));
    }

    // warnings are reported in document order
    std::reverse(retval.pr_warnings.begin(), retval.pr_warnings.end());
    retval.pr_root = std::move(root);

    return Ok(std::move(retval));
}

}  // namespace linkfmt::shortcode
