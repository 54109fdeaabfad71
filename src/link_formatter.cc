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

#include "link_formatter.hh"

#include "base/fs_util.hh"
#include "base/linkfmt_log.hh"
#include "config.h"
#include "link.rewriter.hh"
#include "shortcode.parser.hh"
#include "shortcode.tree.hh"

namespace linkfmt {

Result<format_result, console::user_message>
format_links(string_fragment text,
             const std::string& source,
             const config& cfg)
{
    format_result retval;

    auto parse_res = TRY(shortcode::parse_document(text, source, cfg));
    const auto src = links::document_source::from(source, text);
    auto rewrite_warnings
        = TRY(links::rewrite_tree(*parse_res.pr_root, src, cfg));

    retval.fr_warnings = std::move(parse_res.pr_warnings);
    retval.fr_warnings.insert(retval.fr_warnings.end(),
                              std::make_move_iterator(rewrite_warnings.begin()),
                              std::make_move_iterator(rewrite_warnings.end()));
    retval.fr_content
        = shortcode::join_lines(shortcode::assemble(*parse_res.pr_root));
    retval.fr_changed = !(text == retval.fr_content);

    log_info("%s: formatted (changed=%d; warnings=%zu)",
             source.c_str(),
             retval.fr_changed,
             retval.fr_warnings.size());

    return Ok(std::move(retval));
}

Result<format_result, console::user_message>
format_link_file(const std::filesystem::path& path, const config& cfg)
{
    auto read_res = filesystem::read_file(path);

    if (read_res.isErr()) {
        return Err(console::user_message::error(
                       fmt::format(FMT_STRING("unable to read file: {}"), path))
                       .with_reason(read_res.unwrapErr()));
    }

    auto content = read_res.unwrap();
    return format_links(string_fragment::from_str(content), path.string(), cfg);
}

}  // namespace linkfmt
