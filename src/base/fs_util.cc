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
#include <fstream>

#include "fs_util.hh"

#include <limits.h>
#include <stdlib.h>

#include "config.h"
#include "linkfmt_log.hh"

namespace linkfmt {
namespace filesystem {

Result<std::filesystem::path, std::string>
realpath(const std::filesystem::path& path)
{
    char resolved[PATH_MAX];
    auto rc = ::realpath(path.c_str(), resolved);

    if (rc == nullptr) {
        return Err(std::string(strerror(errno)));
    }

    return Ok(std::filesystem::path(resolved));
}

Result<struct stat, std::string>
stat_file(const std::filesystem::path& path)
{
    struct stat retval;

    if (statp(path, &retval) == 0) {
        return Ok(retval);
    }

    return Err(fmt::format(FMT_STRING("failed to find file: {} -- {}"),
                           path.string(),
                           strerror(errno)));
}

Result<std::pair<std::filesystem::path, auto_fd>, std::string>
open_temp_file(const std::filesystem::path& pattern)
{
    auto pattern_str = pattern.string();
    std::vector<char> pattern_copy(pattern_str.begin(), pattern_str.end());
    int fd;

    pattern_copy.push_back('\0');
#if HAVE_MKOSTEMP
    fd = mkostemp(pattern_copy.data(), O_CLOEXEC);
#else
    fd = mkstemp(pattern_copy.data());
    if (fd != -1) {
        fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
#endif
    if (fd == -1) {
        return Err(
            fmt::format(FMT_STRING("unable to create temporary file: {} -- {}"),
                        pattern.string(),
                        strerror(errno)));
    }

    return Ok(std::make_pair(std::filesystem::path(pattern_copy.data()),
                             auto_fd(fd)));
}

Result<std::string, std::string>
read_file(const std::filesystem::path& path)
{
    try {
        std::ifstream file_stream(path, std::ios::in | std::ios::binary);

        if (!file_stream) {
            return Err(std::string(strerror(errno)));
        }

        std::string retval;
        retval.assign((std::istreambuf_iterator<char>(file_stream)),
                      std::istreambuf_iterator<char>());
        if (file_stream.bad()) {
            return Err(std::string("read failed"));
        }
        return Ok(retval);
    } catch (const std::exception& e) {
        return Err(std::string(e.what()));
    }
}

Result<void, std::string>
write_file(const std::filesystem::path& path, const string_fragment& content)
{
    auto tmp_pattern = path;
    tmp_pattern += ".XXXXXX";

    auto tmp_pair = TRY(open_temp_file(tmp_pattern));
    auto write_res = tmp_pair.second.write_fully(content);
    if (write_res.isErr()) {
        std::error_code ec;

        std::filesystem::remove(tmp_pair.first, ec);
        return Err(fmt::format(FMT_STRING("unable to write file {}: {}"),
                               tmp_pair.first.string(),
                               write_res.unwrapErr()));
    }

    mode_t mode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
    struct stat st;
    if (statp(path, &st) == 0) {
        mode = st.st_mode & 07777;
    }
    log_perror(fchmod(tmp_pair.second.get(), mode));

    std::error_code ec;
    std::filesystem::rename(tmp_pair.first, path, ec);
    if (ec) {
        std::error_code rm_ec;

        std::filesystem::remove(tmp_pair.first, rm_ec);
        return Err(
            fmt::format(FMT_STRING("unable to move temporary file {}: {}"),
                        tmp_pair.first.string(),
                        ec.message()));
    }

    log_debug("wrote file: %s", path.c_str());
    return Ok();
}

Result<std::vector<std::filesystem::path>, std::string>
find_files(const std::filesystem::path& dir, const std::set<std::string>& exts)
{
    std::vector<std::filesystem::path> retval;
    std::error_code ec;

    auto iter = std::filesystem::recursive_directory_iterator(dir, ec);
    if (ec) {
        return Err(fmt::format(FMT_STRING("unable to read directory {}: {}"),
                               dir.string(),
                               ec.message()));
    }

    for (const auto end = std::filesystem::recursive_directory_iterator();
         iter != end;
         iter.increment(ec))
    {
        if (ec) {
            return Err(
                fmt::format(FMT_STRING("unable to read directory {}: {}"),
                            dir.string(),
                            ec.message()));
        }
        std::error_code type_ec;
        if (!iter->is_regular_file(type_ec)) {
            continue;
        }
        if (exts.count(iter->path().extension().string()) == 0) {
            continue;
        }

        retval.emplace_back(iter->path());
    }
    if (ec) {
        return Err(fmt::format(FMT_STRING("unable to read directory {}: {}"),
                               dir.string(),
                               ec.message()));
    }

    std::sort(retval.begin(), retval.end());
    log_debug("found %zu files under %s", retval.size(), dir.c_str());
    return Ok(std::move(retval));
}

}  // namespace filesystem
}  // namespace linkfmt

auto
fmt::formatter<std::filesystem::path>::format(const std::filesystem::path& p,
                                              format_context& ctx) const
    -> decltype(ctx.out())
{
    return formatter<string_view>::format(p.native(), ctx);
}
