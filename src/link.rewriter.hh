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

#ifndef linkfmt_link_rewriter_hh
#define linkfmt_link_rewriter_hh

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "base/linkfmt.console.hh"
#include "base/string_fragment.hh"
#include "linkfmt_config.hh"
#include "result.h"
#include "shortcode.tree.hh"

namespace linkfmt::links {

/**
 * The name and lines of the document being rewritten, used to quote the
 * offending lines in messages.
 */
struct document_source {
    static document_source from(std::string name, string_fragment text)
    {
        return document_source{std::move(name), text.split_lines()};
    }

    std::string line_text(int line_number) const;

    std::string ds_name;
    std::vector<string_fragment> ds_lines;
};

/** A '[N]: URL' line. */
struct definition {
    int d_index;
    std::string d_url;
    /** The row of the line in the text of the scope. */
    int d_row;
    int d_line_number;
};

using definition_map = std::map<int, std::string>;

/**
 * The original definitions of a scope and, through sc_parent, those of the
 * enclosing scopes.
 */
struct scope_context {
    const definition_map* sc_definitions{nullptr};
    const scope_context* sc_parent{nullptr};

    std::optional<std::string> lookup(int index) const;
};

struct link_index {
    std::string li_url;
    int li_index;
};

/**
 * Number the URLs linked from a scope.  A URL that was already defined
 * keeps the smallest index it was defined with, after the reused indexes
 * are compacted to 1..R, and the other URLs are numbered R+1, R+2, ...
 * Reserved indexes are skipped when numbering.
 *
 * @param urls The distinct URLs in order of appearance.
 * @param defs The original definitions in the scope.
 * @param reserved Indexes that must not be handed out, like the ones used
 *   by references that could not be resolved.
 * @return The index of each URL, in the same order as the given URLs.
 */
std::vector<link_index> assign_indexes(const std::vector<std::string>& urls,
                                       const std::vector<definition>& defs,
                                       const std::set<int>& reserved = {});

/**
 * Remove the line separator, paragraph separator and record separator
 * characters that sneak in through copy and paste.
 */
std::string strip_control_chars(std::string str);

/**
 * Rewrite the links in a single scope and store the result in its
 * sn_modified_lines.  The regions of the direct children are left alone and
 * their positions are updated to match the rewritten rows.  Warnings for
 * references that could not be resolved are appended to `warnings`.
 */
Result<void, console::user_message> rewrite_scope(
    shortcode::scope_node& node,
    const scope_context* ancestors,
    const document_source& src,
    const config& cfg,
    std::vector<console::user_message>& warnings);

/**
 * Rewrite every scope in the tree.
 *
 * @return The warnings produced while rewriting or the first fatal error.
 */
Result<std::vector<console::user_message>, console::user_message>
rewrite_tree(shortcode::scope_node& root,
             const document_source& src,
             const config& cfg);

}  // namespace linkfmt::links

#endif
