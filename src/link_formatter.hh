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

#ifndef linkfmt_link_formatter_hh
#define linkfmt_link_formatter_hh

#include <filesystem>
#include <string>
#include <vector>

#include "base/linkfmt.console.hh"
#include "base/string_fragment.hh"
#include "linkfmt_config.hh"
#include "result.h"

namespace linkfmt {

struct format_result {
    std::string fr_content;
    std::vector<console::user_message> fr_warnings;
    bool fr_changed{false};
};

/**
 * Convert the links in a document to numbered references, scoped to the
 * shortcode regions that contain them.
 *
 * @param text The contents of the document.
 * @param source The name of the document for use in messages.
 * @param cfg The shortcode configuration.
 * @return The formatted document or the error that prevented formatting.
 */
Result<format_result, console::user_message> format_links(
    string_fragment text, const std::string& source, const config& cfg);

Result<format_result, console::user_message> format_link_file(
    const std::filesystem::path& path, const config& cfg);

}  // namespace linkfmt

#endif
