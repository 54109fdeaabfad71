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

#ifndef linkfmt_shortcode_parser_hh
#define linkfmt_shortcode_parser_hh

#include <memory>
#include <string>
#include <vector>

#include "base/linkfmt.console.hh"
#include "base/string_fragment.hh"
#include "linkfmt_config.hh"
#include "result.h"
#include "shortcode.tree.hh"

namespace linkfmt::shortcode {

enum class marker_kind {
    open,
    close,
};

/**
 * A shortcode marker found in a line, like '{{< tab "foo" >}}' or
 * '{{% /tab %}}'.  The columns are byte offsets in the line.
 */
struct marker {
    marker_kind m_kind;
    std::string m_name;
    std::string m_args;
    int m_start;
    int m_end;
};

/**
 * Find the markers in a single line, ordered by column.  Markers that
 * overlap an earlier one are dropped.
 */
Result<std::vector<marker>, console::user_message> find_markers(
    string_fragment line);

struct parse_result {
    std::unique_ptr<scope_node> pr_root;
    std::vector<console::user_message> pr_warnings;
};

/**
 * Build the scope tree for a document.
 *
 * @param text The document contents.
 * @param source The name of the document for use in messages.
 * @param cfg The one-liner and literal shortcode names.
 */
Result<parse_result, console::user_message> parse_document(
    string_fragment text, const std::string& source, const config& cfg);

}  // namespace linkfmt::shortcode

#endif
