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
#include <string>

#include <stdio.h>
#include <stdlib.h>
#include <sys/wait.h>

#include "base/fs_util.hh"
#include "config.h"
#include "fmt/format.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

namespace {

struct run_result {
    int rr_status;
    std::string rr_output;
};

/** Run linkfmt with the given arguments and capture its stdout. */
run_result
run_linkfmt(const std::string& args, const char* redirect = "2>&1")
{
    auto cmd = fmt::format(FMT_STRING("'{}' {} {}"), LINKFMT_BIN, args, redirect);
    run_result retval{-1, {}};
    auto* pipe = popen(cmd.c_str(), "r");

    REQUIRE(pipe != nullptr);

    char buffer[1024];
    size_t rc;
    while ((rc = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        retval.rr_output.append(buffer, rc);
    }

    auto status = pclose(pipe);
    REQUIRE(WIFEXITED(status));
    retval.rr_status = WEXITSTATUS(status);

    return retval;
}

struct work_dir {
    work_dir()
    {
        auto pattern = std::filesystem::temp_directory_path()
            / "linkfmt-driver-test.XXXXXX";
        auto pattern_str = pattern.string();

        REQUIRE(mkdtemp(pattern_str.data()) != nullptr);
        this->wd_path = pattern_str;
    }

    ~work_dir()
    {
        std::error_code ec;

        std::filesystem::remove_all(this->wd_path, ec);
    }

    std::filesystem::path add(const std::string& name,
                              const std::string& content)
    {
        auto retval = this->wd_path / name;

        std::filesystem::create_directories(retval.parent_path());
        auto write_res = linkfmt::filesystem::write_file(
            retval, string_fragment::from_str(content));
        REQUIRE(write_res.isOk());

        return retval;
    }

    std::filesystem::path add_datafile(const char* name)
    {
        return this->add(name, datafile(name));
    }

    static std::string datafile(const char* name)
    {
        auto read_res = linkfmt::filesystem::read_file(
            std::filesystem::path(TEST_SRC_DIR) / "datafiles" / name);
        REQUIRE(read_res.isOk());

        return read_res.unwrap();
    }

    static std::string contents(const std::filesystem::path& path)
    {
        auto read_res = linkfmt::filesystem::read_file(path);
        REQUIRE(read_res.isOk());

        return read_res.unwrap();
    }

    std::filesystem::path wd_path;
};

}  // namespace

TEST_CASE("linkfmt::write")
{
    work_dir wd;
    auto path = wd.add_datafile("scoped_links.md");

    auto rr = run_linkfmt(fmt::format(FMT_STRING("-f '{}'"), path.string()));
    CHECK(rr.rr_status == 0);
    CHECK(work_dir::contents(path)
          == work_dir::datafile("scoped_links.expected.md"));

    rr = run_linkfmt(fmt::format(FMT_STRING("--check -f '{}'"), path.string()));
    CHECK(rr.rr_status == 0);
}

TEST_CASE("linkfmt::dry-run")
{
    work_dir wd;
    auto path = wd.add_datafile("scoped_links.md");

    auto rr = run_linkfmt(
        fmt::format(FMT_STRING("--dry-run --file '{}'"), path.string()),
        "2>/dev/null");
    CHECK(rr.rr_status == 0);
    CHECK(rr.rr_output == work_dir::datafile("scoped_links.expected.md"));
    CHECK(work_dir::contents(path) == work_dir::datafile("scoped_links.md"));
}

TEST_CASE("linkfmt::check")
{
    work_dir wd;
    auto path = wd.add_datafile("scoped_links.md");

    auto rr = run_linkfmt(fmt::format(FMT_STRING("--check -f '{}'"), path.string()));
    CHECK(rr.rr_status == 1);
    CHECK(rr.rr_output.find("file would be reformatted") != std::string::npos);
    CHECK(work_dir::contents(path) == work_dir::datafile("scoped_links.md"));
}

TEST_CASE("linkfmt::duplicate-index")
{
    work_dir wd;
    auto bad_path = wd.add_datafile("duplicate_index.md");
    auto good_path = wd.add_datafile("scoped_links.md");

    auto rr = run_linkfmt(fmt::format(FMT_STRING("-d '{}'"), wd.wd_path.string()));
    CHECK(rr.rr_status == 1);
    CHECK(rr.rr_output.find("duplicate reference index [1]")
          != std::string::npos);
    CHECK(work_dir::contents(bad_path)
          == work_dir::datafile("duplicate_index.md"));
    CHECK(work_dir::contents(good_path)
          == work_dir::datafile("scoped_links.expected.md"));
}

TEST_CASE("linkfmt::directory-extension")
{
    work_dir wd;
    auto md_path = wd.add("docs/a.md", "See [a](http://a.com)\n");
    auto txt_path = wd.add("docs/nested/b.txt", "See [b](http://b.com)\n");

    auto rr = run_linkfmt(
        fmt::format(FMT_STRING("-v -d '{}'"), wd.wd_path.string()));
    CHECK(rr.rr_status == 0);
    CHECK(rr.rr_output.find("formatting file") != std::string::npos);
    CHECK(work_dir::contents(md_path)
          == "See [a][1]\n\n[1]: http://a.com\n");
    CHECK(work_dir::contents(txt_path) == "See [b](http://b.com)\n");

    rr = run_linkfmt(fmt::format(
        FMT_STRING("--ext .txt -d '{}'"), wd.wd_path.string()));
    CHECK(rr.rr_status == 0);
    CHECK(work_dir::contents(txt_path)
          == "See [b][1]\n\n[1]: http://b.com\n");
}

TEST_CASE("linkfmt::one-liner")
{
    work_dir wd;
    auto path = wd.add("doc.md", "{{< img src=\"a.png\" >}}\ntext\n");

    auto rr = run_linkfmt(fmt::format(FMT_STRING("-f '{}'"), path.string()));
    CHECK(rr.rr_status == 0);
    CHECK(rr.rr_output.find("unclosed shortcode \"img\"")
          != std::string::npos);

    rr = run_linkfmt(
        fmt::format(FMT_STRING("-q -f '{}'"), path.string()));
    CHECK(rr.rr_status == 0);
    CHECK(rr.rr_output.empty());

    rr = run_linkfmt(
        fmt::format(FMT_STRING("--one-liner img -f '{}'"), path.string()));
    CHECK(rr.rr_status == 0);
    CHECK(rr.rr_output.empty());
}

TEST_CASE("linkfmt::bad-arguments")
{
    work_dir wd;
    auto path = wd.add_datafile("scoped_links.md");

    auto rr = run_linkfmt(fmt::format(FMT_STRING("-f '{}' -d '{}'"),
                                      path.string(),
                                      wd.wd_path.string()));
    CHECK(rr.rr_status != 0);
    CHECK(rr.rr_output.find("invalid command-line arguments")
          != std::string::npos);
    CHECK(work_dir::contents(path) == work_dir::datafile("scoped_links.md"));

    rr = run_linkfmt("");
    CHECK(rr.rr_status != 0);

    rr = run_linkfmt(fmt::format(FMT_STRING("--dry-run --check -f '{}'"),
                                 path.string()));
    CHECK(rr.rr_status != 0);

    rr = run_linkfmt(fmt::format(FMT_STRING("--literal 'a b' -f '{}'"),
                                 path.string()));
    CHECK(rr.rr_status == 1);
    CHECK(rr.rr_output.find("invalid literal shortcode name")
          != std::string::npos);
}

TEST_CASE("linkfmt::version")
{
    auto rr = run_linkfmt("--version");

    CHECK(rr.rr_status == 0);
    CHECK(rr.rr_output.find(PACKAGE_NAME) != std::string::npos);
}
