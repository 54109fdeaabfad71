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

#include <filesystem>
#include <fstream>

#include "fs_util.hh"

#include <sys/stat.h>
#include <unistd.h>

#include "config.h"
#include "doctest/doctest.h"

namespace {

struct temp_dir {
    temp_dir()
    {
        auto pattern = std::filesystem::temp_directory_path()
            / "linkfmt-fs-test.XXXXXX";
        auto pattern_str = pattern.string();

        REQUIRE(mkdtemp(pattern_str.data()) != nullptr);
        this->td_path = pattern_str;
    }

    ~temp_dir()
    {
        std::error_code ec;

        std::filesystem::remove_all(this->td_path, ec);
    }

    void touch(const std::filesystem::path& rel, const std::string& content)
    {
        auto full = this->td_path / rel;

        std::filesystem::create_directories(full.parent_path());
        std::ofstream out(full);
        out << content;
    }

    std::filesystem::path td_path;
};

}  // namespace

TEST_CASE("fs_util::read_write")
{
    temp_dir td;
    auto path = td.td_path / "doc.md";

    td.touch("doc.md", "before\n");
    chmod(path.c_str(), 0640);

    auto write_res = linkfmt::filesystem::write_file(path, "after\n"_frag);
    REQUIRE(write_res.isOk());

    auto read_res = linkfmt::filesystem::read_file(path);
    REQUIRE(read_res.isOk());
    CHECK("after\n" == read_res.unwrap());

    struct stat st;
    REQUIRE(stat(path.c_str(), &st) == 0);
    CHECK(0640 == (st.st_mode & 07777));

    // the temporary file was renamed over the original
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(td.td_path)) {
        (void) entry;
        count += 1;
    }
    CHECK(1 == count);
}

TEST_CASE("fs_util::read_missing")
{
    temp_dir td;
    auto read_res = linkfmt::filesystem::read_file(td.td_path / "nope.md");

    CHECK(read_res.isErr());
}

TEST_CASE("fs_util::write_missing_dir")
{
    temp_dir td;
    auto write_res = linkfmt::filesystem::write_file(
        td.td_path / "missing" / "doc.md", "text"_frag);

    CHECK(write_res.isErr());
}

TEST_CASE("fs_util::find_files")
{
    temp_dir td;

    td.touch("b.md", "b");
    td.touch("a.md", "a");
    td.touch("notes.txt", "n");
    td.touch("sub/c.md", "c");
    td.touch("sub/deeper/d.md", "d");

    auto find_res = linkfmt::filesystem::find_files(td.td_path, {".md"});
    REQUIRE(find_res.isOk());

    auto paths = find_res.unwrap();
    REQUIRE(4 == paths.size());
    CHECK(td.td_path / "a.md" == paths[0]);
    CHECK(td.td_path / "b.md" == paths[1]);
    CHECK(td.td_path / "sub/c.md" == paths[2]);
    CHECK(td.td_path / "sub/deeper/d.md" == paths[3]);
}

TEST_CASE("fs_util::find_files_missing")
{
    auto find_res = linkfmt::filesystem::find_files(
        "/this/directory/does/not/exist", {".md"});

    CHECK(find_res.isErr());
}
