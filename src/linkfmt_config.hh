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

#ifndef linkfmt_config_hh
#define linkfmt_config_hh

#include <set>
#include <string>
#include <vector>

#include "base/linkfmt.console.hh"
#include "result.h"

namespace linkfmt {

struct config {
    /** Shortcodes that never have a close marker, like "partial". */
    std::set<std::string> c_one_liners{"partial"};
    /** The shortcode whose contents are never rewritten. */
    std::string c_literal_name{"code-block"};
    /** The extension of the files to format when given a directory. */
    std::string c_extension{".md"};

    bool is_one_liner(const std::string& name) const
    {
        return this->c_one_liners.count(name) > 0;
    }

    bool is_literal(const std::string& name) const
    {
        return this->c_literal_name == name;
    }
};

/**
 * Check that the shortcode names in the configuration can be matched by the
 * shortcode markers and that the extension looks like one.
 */
Result<void, std::vector<console::user_message>> validate_config(
    const config& cfg);

}  // namespace linkfmt

#endif
