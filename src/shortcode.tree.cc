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

#include "shortcode.tree.hh"

#include "base/linkfmt_log.hh"
#include "config.h"
#include "fmt/format.h"

namespace linkfmt::shortcode {

scope_node::scope_node(std::string name) : sn_name(std::move(name)) {}

scope_node*
scope_node::add_child(std::unique_ptr<scope_node> child)
{
    require(child->sn_parent == nullptr);

    child->sn_parent = this;
    this->sn_children.emplace_back(std::move(child));

    return this->sn_children.back().get();
}

void
scope_node::push_line(std::string line, int line_number)
{
    this->sn_lines.emplace_back(std::move(line));
    this->sn_line_numbers.emplace_back(line_number);
}

std::string
scope_node::describe() const
{
    if (this->is_root()) {
        return "document";
    }

    if (this->sn_args.empty()) {
        return fmt::format(FMT_STRING("{{{{< {} >}}}} at line {}"),
                           this->sn_name,
                           this->sn_source_line);
    }

    return fmt::format(FMT_STRING("{{{{< {} {} >}}}} at line {}"),
                       this->sn_name,
                       this->sn_args,
                       this->sn_source_line);
}

std::string
join_lines(const std::vector<std::string>& lines)
{
    std::string retval;
    size_t total = 0;

    for (const auto& line : lines) {
        total += line.size();
    }
    retval.reserve(total);
    for (const auto& line : lines) {
        retval.append(line);
    }

    return retval;
}

std::vector<std::string>
split_lines(string_fragment sf)
{
    std::vector<std::string> retval;

    for (const auto& line : sf.split_lines()) {
        retval.emplace_back(line.to_string());
    }

    return retval;
}

std::vector<std::string>
assemble(const scope_node& node)
{
    auto output = node.sn_modified_lines;

    for (auto iter = node.sn_children.rbegin();
         iter != node.sn_children.rend();
         ++iter)
    {
        const auto& child = **iter;
        auto child_output = assemble(child);

        if (child_output.empty()) {
            continue;
        }

        auto child_text = join_lines(child_output);
        auto first_row = std::min<size_t>(child.sn_start_line, output.size());
        auto last_row = std::max<size_t>(child.sn_end_line, first_row);
        std::string prefix;
        std::string suffix;

        if (first_row < output.size()) {
            const auto& row = output[first_row];

            prefix = row.substr(
                0, std::min<size_t>(std::max(child.sn_start, 0), row.size()));
        }
        if (last_row < output.size()) {
            const auto& row = output[last_row];

            suffix = row.substr(
                std::min<size_t>(std::max(child.sn_end, 0), row.size()));
        } else {
            log_debug("child %s extends past the end of %s (%d >= %zu)",
                      child.sn_name.c_str(),
                      node.sn_name.c_str(),
                      child.sn_end_line,
                      output.size());
            last_row = output.empty() ? 0 : output.size() - 1;
        }

        auto spliced = prefix + child_text + suffix;
        if (first_row < output.size()) {
            output.erase(output.begin() + first_row,
                         output.begin() + last_row + 1);
        }
        output.insert(output.begin() + first_row, std::move(spliced));
    }

    if (node.sn_children.empty()) {
        return output;
    }

    // splices can leave several lines in one row
    return split_lines(string_fragment::from_str(join_lines(output)));
}

}  // namespace linkfmt::shortcode
