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

#ifndef linkfmt_fs_util_hh
#define linkfmt_fs_util_hh

#include <filesystem>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include "auto_fd.hh"
#include "fmt/format.h"
#include "result.h"
#include "string_fragment.hh"

namespace linkfmt {
namespace filesystem {

inline int
statp(const std::filesystem::path& path, struct stat* buf)
{
    return stat(path.c_str(), buf);
}

inline int
openp(const std::filesystem::path& path, int flags, mode_t mode)
{
    return open(path.c_str(), flags, mode);
}

Result<std::filesystem::path, std::string> realpath(
    const std::filesystem::path& path);

Result<struct stat, std::string> stat_file(const std::filesystem::path& path);

Result<std::pair<std::filesystem::path, auto_fd>, std::string> open_temp_file(
    const std::filesystem::path& pattern);

Result<std::string, std::string> read_file(const std::filesystem::path& path);

/**
 * Replace the contents of a file by writing to a temporary file in the same
 * directory and renaming it over the original.  The permission bits of an
 * existing file are carried over.
 */
Result<void, std::string> write_file(const std::filesystem::path& path,
                                     const string_fragment& content);

/**
 * Recursively collect the regular files under a directory whose extension
 * is one of the given ones.  The result is sorted so that runs over the same
 * tree are reproducible.
 */
Result<std::vector<std::filesystem::path>, std::string> find_files(
    const std::filesystem::path& dir, const std::set<std::string>& exts);

}  // namespace filesystem
}  // namespace linkfmt

template<>
struct fmt::formatter<std::filesystem::path> : formatter<string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const
        -> decltype(ctx.out());
};

#endif
