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

#ifndef linkfmt_shortcode_tree_hh
#define linkfmt_shortcode_tree_hh

#include <memory>
#include <string>
#include <vector>

#include "base/string_fragment.hh"

namespace linkfmt::shortcode {

/**
 * The name given to the node that represents the whole document.  It cannot
 * collide with a shortcode name since those are restricted to
 * [A-Za-z0-9_-].
 */
constexpr const char* ROOT_NAME = "#root";

/**
 * A region of the document delimited by a pair of shortcode markers, or the
 * whole document for the root.
 *
 * Every line in sn_lines keeps its newline so that joining the lines
 * reproduces the captured text exactly.  The first captured line of a child
 * starts at its open marker and the last captured line of a closed child ends
 * at its close marker.
 *
 * The position of a child is relative to the rows of its parent:
 * sn_start_line/sn_start locate the open marker and sn_end_line/sn_end the
 * end of the close marker.  A closed multi-line child always occupies two
 * parent rows, the row with its open marker and the row with its close
 * marker, since the lines in between are only captured by the child.
 */
class scope_node {
public:
    explicit scope_node(std::string name);

    scope_node(const scope_node&) = delete;
    scope_node& operator=(const scope_node&) = delete;

    scope_node* add_child(std::unique_ptr<scope_node> child);

    void push_line(std::string line, int line_number);

    bool is_root() const { return this->sn_parent == nullptr; }

    /**
     * @return True if the node's open and close markers are on the same row
     *   of its parent.
     */
    bool is_inline() const
    {
        return this->sn_start_line == this->sn_end_line;
    }

    /** @return A short description of the node for use in messages. */
    std::string describe() const;

    std::string sn_name;
    std::string sn_args;
    scope_node* sn_parent{nullptr};
    std::vector<std::unique_ptr<scope_node>> sn_children;
    std::vector<std::string> sn_lines;
    std::vector<int> sn_line_numbers;
    std::vector<std::string> sn_modified_lines;
    int sn_start_line{0};
    int sn_end_line{0};
    int sn_start{0};
    int sn_end{0};
    bool sn_closed{false};
    int sn_source_line{1};
};

std::string join_lines(const std::vector<std::string>& lines);

std::vector<std::string> split_lines(string_fragment sf);

/**
 * Produce the rows of a node with all of its descendants spliced in.  The
 * node's own sn_modified_lines are used as the starting point and children
 * are spliced in reverse order so that the positions recorded on the earlier
 * children remain valid.
 */
std::vector<std::string> assemble(const scope_node& node);

}  // namespace linkfmt::shortcode

#endif
