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
#include <set>

#include <string.h>

#include "link.rewriter.hh"

#include "base/linkfmt_log.hh"
#include "config.h"
#include "fmt/format.h"
#include "pcrepp/pcre2pp.hh"

namespace linkfmt::links {

static const auto DEFINITION_RE = pcre2pp::code::from_const(
    R"(^[ \t]*\[(\d{1,9})\]:[ \t]+([^\s\x{E000}\x{E001}]+)(.*))");
static const auto REFERENCE_RE
    = pcre2pp::code::from_const(R"(\]\[(\d{1,9})\])");
static const auto INLINE_LINK_RE = pcre2pp::code::from_const(
    R"(\]\((?![#?])((?:[^\s()\x{E000}\x{E001}]|\([^\s()\x{E000}\x{E001}]*\))+)\))");

// The region of a child is replaced by U+E000, the child's position in the
// parent and U+E001 while the parent is rewritten.
static constexpr const char MASK_OPEN[] = "\xEE\x80\x80";
static constexpr const char MASK_CLOSE[] = "\xEE\x80\x81";

static const char* const CONTROL_CHARS[] = {
    "\xE2\x80\xA8",  // LINE SEPARATOR
    "\xE2\x80\xA9",  // PARAGRAPH SEPARATOR
    "\x1E",  // RECORD SEPARATOR
};

std::string
document_source::line_text(int line_number) const
{
    if (line_number < 1 || line_number > (int) this->ds_lines.size()) {
        return std::string();
    }

    return this->ds_lines[line_number - 1].rtrim("\r\n").to_string();
}

std::optional<std::string>
scope_context::lookup(int index) const
{
    for (const auto* ctx = this; ctx != nullptr; ctx = ctx->sc_parent) {
        if (ctx->sc_definitions == nullptr) {
            continue;
        }

        auto iter = ctx->sc_definitions->find(index);
        if (iter != ctx->sc_definitions->end()) {
            return iter->second;
        }
    }

    return std::nullopt;
}

std::vector<link_index>
assign_indexes(const std::vector<std::string>& urls,
               const std::vector<definition>& defs,
               const std::set<int>& reserved)
{
    std::map<std::string, int> defined_index;
    for (const auto& def : defs) {
        auto iter = defined_index.find(def.d_url);

        if (iter == defined_index.end() || def.d_index < iter->second) {
            defined_index[def.d_url] = def.d_index;
        }
    }

    std::vector<int> reused;
    for (const auto& url : urls) {
        auto iter = defined_index.find(url);

        if (iter != defined_index.end()) {
            reused.emplace_back(iter->second);
        }
    }
    std::sort(reused.begin(), reused.end());

    int next_index = 1;
    auto take_index = [&next_index, &reserved]() {
        while (reserved.count(next_index) > 0) {
            next_index += 1;
        }
        return next_index++;
    };

    std::map<int, int> compacted;
    for (const auto index : reused) {
        compacted[index] = take_index();
    }

    std::vector<link_index> retval;
    for (const auto& url : urls) {
        auto iter = defined_index.find(url);

        if (iter != defined_index.end()) {
            retval.emplace_back(link_index{url, compacted[iter->second]});
        } else {
            retval.emplace_back(link_index{url, take_index()});
        }
    }

    return retval;
}

std::string
strip_control_chars(std::string str)
{
    for (const auto* needle : CONTROL_CHARS) {
        const auto needle_len = strlen(needle);

        for (auto pos = str.find(needle); pos != std::string::npos;
             pos = str.find(needle, pos))
        {
            str.erase(pos, needle_len);
        }
    }

    return str;
}

namespace {

struct masked_text {
    void append(string_fragment sf, int line_number)
    {
        if (sf.empty()) {
            return;
        }
        if (this->mt_text.empty() || this->mt_text.back() == '\n') {
            this->mt_line_numbers.emplace_back(line_number);
        }
        this->mt_text.append(sf.data(), sf.length());
    }

    int line_number_at(int offset) const
    {
        auto row = std::count(
            this->mt_text.begin(), this->mt_text.begin() + offset, '\n');

        if (row < (ssize_t) this->mt_line_numbers.size()) {
            return this->mt_line_numbers[row];
        }

        return this->mt_line_numbers.empty() ? 0
                                             : this->mt_line_numbers.back();
    }

    std::string mt_text;
    /** The source line number of each line in mt_text. */
    std::vector<int> mt_line_numbers;
};

std::string
placeholder(size_t index)
{
    return fmt::format(FMT_STRING("{}{}{}"), MASK_OPEN, index, MASK_CLOSE);
}

string_fragment
row_fragment(const std::string& row, size_t begin, size_t end)
{
    begin = std::min(begin, row.size());
    end = std::min(std::max(end, begin), row.size());

    return string_fragment::from_str_range(row, begin, end);
}

std::string
region_text(const shortcode::scope_node& node,
            const shortcode::scope_node& child)
{
    std::string retval;

    for (auto row = child.sn_start_line;
         row <= child.sn_end_line && row < (int) node.sn_lines.size();
         row++)
    {
        const auto& line = node.sn_lines[row];
        size_t begin = row == child.sn_start_line ? child.sn_start : 0;
        size_t end = row == child.sn_end_line ? child.sn_end : line.size();
        auto sf = row_fragment(line, begin, end);

        retval.append(sf.data(), sf.length());
    }

    return retval;
}

masked_text
mask_children(const shortcode::scope_node& node)
{
    masked_text retval;
    const auto& rows = node.sn_lines;
    size_t row = 0;
    size_t col = 0;
    auto copy_until = [&](size_t end_row, size_t end_col) {
        while (row < end_row && row < rows.size()) {
            retval.append(row_fragment(rows[row], col, rows[row].size()),
                          node.sn_line_numbers[row]);
            row += 1;
            col = 0;
        }
        if (row < rows.size() && end_col > col) {
            retval.append(row_fragment(rows[row], col, end_col),
                          node.sn_line_numbers[row]);
            col = std::min(end_col, rows[row].size());
        }
    };

    for (size_t lpc = 0; lpc < node.sn_children.size(); lpc++) {
        const auto& child = *node.sn_children[lpc];

        copy_until(child.sn_start_line, child.sn_start);
        retval.append(placeholder(lpc), child.sn_source_line);
        row = child.sn_end_line;
        col = child.sn_end;
    }
    copy_until(rows.size(), 0);

    return retval;
}

void
pass_through(shortcode::scope_node& node)
{
    node.sn_modified_lines = node.sn_lines;
    for (auto& child : node.sn_children) {
        pass_through(*child);
    }
}

console::user_message
match_error(const shortcode::scope_node& node, pcre2pp::matcher::error err)
{
    return console::user_message::error(
               fmt::format(FMT_STRING("unable to search for links in the {}"),
                           node.describe()))
        .with_reason(err.get_message());
}

console::user_message
duplicate_error(const shortcode::scope_node& node,
                const document_source& src,
                const definition& first,
                const definition& second)
{
    return console::user_message::error(
               fmt::format(FMT_STRING("duplicate reference index [{}]"),
                           first.d_index))
        .with_reason(
            fmt::format(FMT_STRING("index {} is defined as both \"{}\" and \"{}\""),
                        first.d_index,
                        first.d_url,
                        second.d_url))
        .with_snippet(console::snippet::from(
            console::source_location{src.ds_name, first.d_line_number},
            src.line_text(first.d_line_number)))
        .with_snippet(console::snippet::from(
            console::source_location{src.ds_name, second.d_line_number},
            src.line_text(second.d_line_number)))
        .with_note(fmt::format(FMT_STRING("both definitions are in the {}"),
                               node.describe()))
        .with_help("give each definition in a scope its own index");
}

console::user_message
orphan_warning(const shortcode::scope_node& node,
               const document_source& src,
               int index,
               int line_number)
{
    return console::user_message::warning(
               fmt::format(FMT_STRING("reference [{}] has no definition"),
                           index))
        .with_reason(fmt::format(FMT_STRING("index {} is not defined in the {} "
                                            "or any enclosing scope"),
                                 index,
                                 node.describe()))
        .with_snippet(console::snippet::from(
            console::source_location{src.ds_name, line_number},
            src.line_text(line_number)))
        .with_help(fmt::format(
            FMT_STRING("add a \"[{}]: URL\" line to the scope"), index));
}

struct scope_definitions {
    std::vector<definition> sd_definitions;
    /**
     * The indexes of '[N]: URL' lines followed by other text.  Those lines
     * are left alone, so their indexes cannot be handed out again.
     */
    std::set<int> sd_kept_indexes;
};

Result<scope_definitions, console::user_message>
find_definitions(const shortcode::scope_node& node,
                 const std::vector<std::string>& lines,
                 const masked_text& masked,
                 const document_source& src)
{
    thread_local auto md = DEFINITION_RE.create_match_data();
    scope_definitions retval;

    for (size_t row = 0; row < lines.size(); row++) {
        auto match_res
            = DEFINITION_RE.capture_from(lines[row]).into(md).matches();

        if (match_res.is<pcre2pp::matcher::error>()) {
            return Err(
                match_error(node, match_res.get<pcre2pp::matcher::error>()));
        }
        if (!match_res.is<pcre2pp::matcher::found>()) {
            continue;
        }

        auto def = definition{
            std::stoi(md[1]->to_string()),
            md[2]->to_string(),
            (int) row,
            row < masked.mt_line_numbers.size() ? masked.mt_line_numbers[row]
                                                : 0,
        };
        if (md[3] && !md[3]->trim(" \t\r\n").empty()) {
            log_debug("%s:%d: not treating [%d] as a definition since it is "
                      "followed by other text",
                      src.ds_name.c_str(),
                      def.d_line_number,
                      def.d_index);
            retval.sd_kept_indexes.insert(def.d_index);
            continue;
        }

        auto prev_iter = std::find_if(
            retval.sd_definitions.begin(),
            retval.sd_definitions.end(),
            [&def](const definition& prev) {
                return prev.d_index == def.d_index;
            });
        if (prev_iter != retval.sd_definitions.end()) {
            return Err(duplicate_error(node, src, *prev_iter, def));
        }

        log_trace("%s:%d: definition [%d]: %s",
                  src.ds_name.c_str(),
                  def.d_line_number,
                  def.d_index,
                  def.d_url.c_str());
        retval.sd_definitions.emplace_back(std::move(def));
    }

    return Ok(std::move(retval));
}

definition_map
to_definition_map(const std::vector<definition>& defs)
{
    definition_map retval;

    for (const auto& def : defs) {
        retval[def.d_index] = def.d_url;
    }

    return retval;
}

/**
 * Collect the indexes of the references in a subtree that do not resolve
 * against the subtree's scopes or the given ancestors.  A new definition
 * with one of those indexes would capture the reference on the next run.
 */
Result<void, console::user_message>
collect_unresolved(const shortcode::scope_node& node,
                   const scope_context* ancestors,
                   const document_source& src,
                   const config& cfg,
                   std::set<int>& unresolved)
{
    if (cfg.is_literal(node.sn_name)) {
        return Ok();
    }

    const auto masked = mask_children(node);
    const auto masked_lines
        = shortcode::split_lines(string_fragment::from_str(masked.mt_text));
    const auto found = TRY(find_definitions(node, masked_lines, masked, src));
    const auto def_map = to_definition_map(found.sd_definitions);
    const auto ctx = scope_context{&def_map, ancestors};

    auto ref_res = REFERENCE_RE.capture_from(masked.mt_text)
                       .for_each([&](const pcre2pp::match_data& md) {
                           auto index = std::stoi(md[1]->to_string());

                           if (found.sd_kept_indexes.count(index) == 0
                               && !ctx.lookup(index))
                           {
                               unresolved.insert(index);
                           }
                       });
    if (ref_res.isErr()) {
        return Err(match_error(node, ref_res.unwrapErr()));
    }

    for (const auto& child : node.sn_children) {
        TRY(collect_unresolved(*child, &ctx, src, cfg, unresolved));
    }

    return Ok();
}

/**
 * @return The line ending used by the row at `near`, or by the first
 *   terminated row if that one has none.
 */
std::string
line_ending(const std::vector<std::string>& lines, size_t near)
{
    auto ending_of = [](const std::string& line) {
        auto sf = string_fragment::from_str(line);

        return sf.endswith("\r\n") ? std::string("\r\n") : std::string("\n");
    };

    if (near < lines.size() && !lines[near].empty()
        && lines[near].back() == '\n')
    {
        return ending_of(lines[near]);
    }
    for (const auto& line : lines) {
        if (!line.empty() && line.back() == '\n') {
            return ending_of(line);
        }
    }

    return "\n";
}

std::vector<std::string>
place_definitions(const shortcode::scope_node& node,
                  std::vector<std::string> lines,
                  const std::vector<definition>& defs,
                  std::vector<link_index> indexes)
{
    std::stable_sort(
        indexes.begin(),
        indexes.end(),
        [](const link_index& lhs, const link_index& rhs) {
            return lhs.li_index < rhs.li_index;
        });

    std::string indent;
    if (!defs.empty()) {
        const auto& first_line = lines[defs.front().d_row];

        indent = first_line.substr(
            0, std::min(first_line.find_first_not_of(" \t"), first_line.size()));
    }

    if (defs.empty()) {
        if (indexes.empty()) {
            return lines;
        }

        auto insert_at = lines.size();
        auto before_child = false;
        if (!node.sn_children.empty() && !node.sn_children.back()->sn_closed)
        {
            // an unclosed child captures every row after its open marker, so
            // the block has to go above that row
            insert_at = lines.size() - 1;
            before_child = true;
        } else if (!node.is_root() && node.sn_closed && lines.size() > 1) {
            // keep the block above the close marker
            insert_at -= 1;
        }

        const auto eol = line_ending(lines, insert_at > 0 ? insert_at - 1 : 0);
        std::vector<std::string> block;
        if (insert_at > 0) {
            auto& prev = lines[insert_at - 1];

            if (prev.empty() || prev.back() != '\n') {
                prev.append(eol);
            }
            if (!string_fragment::from_str(prev).blank()) {
                block.emplace_back(eol);
            }
        }
        for (const auto& li : indexes) {
            block.emplace_back(fmt::format(
                FMT_STRING("[{}]: {}{}"), li.li_index, li.li_url, eol));
        }
        if (before_child) {
            block.emplace_back(eol);
        }
        lines.insert(lines.begin() + insert_at, block.begin(), block.end());
        return lines;
    }

    std::set<int> def_rows;
    for (const auto& def : defs) {
        def_rows.insert(def.d_row);
    }

    const auto run_end = *def_rows.rbegin();
    auto run_start = run_end;
    for (auto row = run_end - 1; row >= 0; row--) {
        if (def_rows.count(row)) {
            run_start = row;
            continue;
        }
        if (!string_fragment::from_str(lines[row]).blank()) {
            break;
        }
    }

    require_lt(run_end, (int) lines.size());
    const auto eol = line_ending(lines, run_end);
    std::vector<std::string> block;
    for (const auto& li : indexes) {
        block.emplace_back(fmt::format(
            FMT_STRING("{}[{}]: {}{}"), indent, li.li_index, li.li_url, eol));
    }
    if (!block.empty() && lines[run_end].back() != '\n') {
        block.back().erase(block.back().size() - eol.size());
    }

    std::vector<std::string> retval;
    for (int row = 0; row < (int) lines.size(); row++) {
        if (row == run_start) {
            retval.insert(retval.end(), block.begin(), block.end());
        }
        if (row >= run_start && row <= run_end) {
            continue;
        }
        if (def_rows.count(row)) {
            continue;
        }
        retval.emplace_back(std::move(lines[row]));
    }

    return retval;
}

Result<std::vector<std::string>, console::user_message>
restore_children(shortcode::scope_node& node, const std::string& text)
{
    std::vector<std::string> regions;
    for (const auto& child : node.sn_children) {
        regions.emplace_back(region_text(node, *child));
    }

    std::string out;
    int row = 0;
    int col = 0;
    size_t next_child = 0;
    auto next_placeholder = placeholder(next_child);
    auto advance = [&row, &col](char ch) {
        if (ch == '\n') {
            row += 1;
            col = 0;
        } else {
            col += 1;
        }
    };

    out.reserve(text.size());
    for (size_t pos = 0; pos < text.size();) {
        if (next_child < regions.size()
            && text.compare(pos, next_placeholder.size(), next_placeholder)
                == 0)
        {
            auto& child = *node.sn_children[next_child];

            child.sn_start_line = child.sn_end_line = row;
            child.sn_start = child.sn_end = col;
            for (auto ch : regions[next_child]) {
                out.push_back(ch);
                child.sn_end_line = row;
                child.sn_end = col + 1;
                advance(ch);
            }

            pos += next_placeholder.size();
            next_child += 1;
            next_placeholder = placeholder(next_child);
            continue;
        }

        out.push_back(text[pos]);
        advance(text[pos]);
        pos += 1;
    }

    if (next_child != regions.size()) {
        return Err(
            console::user_message::error(
                fmt::format(FMT_STRING("unable to rewrite the {}"),
                            node.describe()))
                .with_reason(
                    fmt::format(FMT_STRING("the {} was lost while rewriting"),
                                node.sn_children[next_child]->describe())));
    }

    return Ok(shortcode::split_lines(string_fragment::from_str(out)));
}

}  // namespace

Result<void, console::user_message>
rewrite_scope(shortcode::scope_node& node,
              const scope_context* ancestors,
              const document_source& src,
              const config& cfg,
              std::vector<console::user_message>& warnings)
{
    if (cfg.is_literal(node.sn_name)) {
        log_debug("%s: leaving the %s as-is",
                  src.ds_name.c_str(),
                  node.describe().c_str());
        pass_through(node);
        return Ok();
    }

    const auto is_inline = !node.is_root() && node.sn_lines.size() == 1;
    const auto masked = mask_children(node);
    const auto masked_lines
        = shortcode::split_lines(string_fragment::from_str(masked.mt_text));
    const auto found = TRY(find_definitions(node, masked_lines, masked, src));
    const auto& defs = found.sd_definitions;
    const auto def_map = to_definition_map(defs);
    const auto ctx = scope_context{&def_map, ancestors};
    auto reserved = found.sd_kept_indexes;

    std::string resolved;
    int copied = 0;
    auto ref_res
        = REFERENCE_RE.capture_from(masked.mt_text)
              .for_each([&](const pcre2pp::match_data& md) {
                  auto index = std::stoi(md[1]->to_string());
                  auto line_number = masked.line_number_at(md[0]->sf_begin);

                  if (found.sd_kept_indexes.count(index) > 0) {
                      log_debug("%s:%d: [%d] refers to a line that is kept",
                                src.ds_name.c_str(),
                                line_number,
                                index);
                      return;
                  }

                  auto url = ctx.lookup(index);
                  if (!url) {
                      log_info("%s:%d: orphan reference [%d]",
                               src.ds_name.c_str(),
                               line_number,
                               index);
                      warnings.emplace_back(
                          orphan_warning(node, src, index, line_number));
                      reserved.insert(index);
                      return;
                  }
                  if (def_map.count(index) == 0) {
                      log_debug("%s:%d: [%d] resolved by an enclosing scope",
                                src.ds_name.c_str(),
                                line_number,
                                index);
                  }

                  resolved.append(
                      masked.mt_text, copied, md[0]->sf_begin - copied);
                  resolved.append("](").append(url.value()).append(")");
                  copied = md[0]->sf_end;
              });
    if (ref_res.isErr()) {
        return Err(match_error(node, ref_res.unwrapErr()));
    }
    resolved.append(masked.mt_text, copied, std::string::npos);

    std::string content;
    std::vector<link_index> indexes;
    if (is_inline) {
        content = std::move(resolved);
    } else {
        std::vector<std::string> urls;
        std::set<std::string> seen;
        std::vector<std::pair<int, int>> link_ranges;
        std::vector<std::string> link_urls;

        auto link_res = INLINE_LINK_RE.capture_from(resolved).for_each(
            [&](const pcre2pp::match_data& md) {
                auto url = md[1]->to_string();

                link_ranges.emplace_back(md[0]->sf_begin, md[0]->sf_end);
                link_urls.emplace_back(url);
                if (seen.insert(url).second) {
                    urls.emplace_back(std::move(url));
                }
            });
        if (link_res.isErr()) {
            return Err(match_error(node, link_res.unwrapErr()));
        }

        for (const auto& child : node.sn_children) {
            TRY(collect_unresolved(*child, &ctx, src, cfg, reserved));
        }
        indexes = assign_indexes(urls, defs, reserved);

        std::map<std::string, int> index_of;
        for (const auto& li : indexes) {
            index_of[li.li_url] = li.li_index;
            log_trace("%s: [%d]: %s in the %s",
                      src.ds_name.c_str(),
                      li.li_index,
                      li.li_url.c_str(),
                      node.describe().c_str());
        }

        copied = 0;
        for (size_t lpc = 0; lpc < link_ranges.size(); lpc++) {
            const auto& range = link_ranges[lpc];

            content.append(resolved, copied, range.first - copied);
            content.append(
                fmt::format(FMT_STRING("][{}]"), index_of[link_urls[lpc]]));
            copied = range.second;
        }
        content.append(resolved, copied, std::string::npos);
    }

    auto new_lines = shortcode::split_lines(
        string_fragment::from_str(strip_control_chars(std::move(content))));
    if (!is_inline) {
        new_lines = place_definitions(
            node, std::move(new_lines), defs, std::move(indexes));
    }

    node.sn_modified_lines
        = TRY(restore_children(node, shortcode::join_lines(new_lines)));
    log_debug("%s: rewrote the %s (%zu definitions, %zu rows)",
              src.ds_name.c_str(),
              node.describe().c_str(),
              defs.size(),
              node.sn_modified_lines.size());

    for (auto& child : node.sn_children) {
        TRY(rewrite_scope(*child, &ctx, src, cfg, warnings));
    }

    return Ok();
}

Result<std::vector<console::user_message>, console::user_message>
rewrite_tree(shortcode::scope_node& root,
             const document_source& src,
             const config& cfg)
{
    std::vector<console::user_message> warnings;

    TRY(rewrite_scope(root, nullptr, src, cfg, warnings));

    return Ok(std::move(warnings));
}

}  // namespace linkfmt::links
