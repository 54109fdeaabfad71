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
#include <set>
#include <string>
#include <vector>

#include <stdio.h>
#include <stdlib.h>

#include "CLI/CLI.hpp"
#include "base/fs_util.hh"
#include "base/linkfmt.console.hh"
#include "base/linkfmt_log.hh"
#include "base/opt_util.hh"
#include "config.h"
#include "fmt/format.h"
#include "link_formatter.hh"
#include "linkfmt_config.hh"

namespace {

enum class run_mode {
    write,
    dry_run,
    check,
};

enum class file_status {
    unchanged,
    changed,
    failed,
};

struct run_options {
    std::string ro_file;
    std::string ro_directory;
    std::string ro_log_path;
    run_mode ro_mode{run_mode::write};
    int ro_verbosity{1};
};

file_status
format_file(const std::filesystem::path& path,
            const run_options& opts,
            const linkfmt::config& cfg)
{
    if (opts.ro_verbosity > 1) {
        linkfmt::console::print(
            stderr,
            linkfmt::console::user_message::info(
                fmt::format(FMT_STRING("formatting file {}"), path)));
    }

    auto format_res = linkfmt::format_link_file(path, cfg);
    if (format_res.isErr()) {
        log_error("%s: unable to format", path.c_str());
        linkfmt::console::print(stderr, format_res.unwrapErr());
        return file_status::failed;
    }

    auto result = format_res.unwrap();
    if (opts.ro_verbosity > 0) {
        linkfmt::console::print(stderr, result.fr_warnings);
    }

    switch (opts.ro_mode) {
        case run_mode::dry_run:
            fmt::print(stdout, FMT_STRING("{}"), result.fr_content);
            break;
        case run_mode::check:
            if (result.fr_changed) {
                linkfmt::console::print(
                    stderr,
                    linkfmt::console::user_message::warning(fmt::format(
                        FMT_STRING("file would be reformatted: {}"), path)));
            }
            break;
        case run_mode::write: {
            if (!result.fr_changed) {
                log_debug("%s: no changes", path.c_str());
                break;
            }

            auto write_res = linkfmt::filesystem::write_file(
                path, string_fragment::from_str(result.fr_content));
            if (write_res.isErr()) {
                linkfmt::console::print(
                    stderr,
                    linkfmt::console::user_message::error(fmt::format(
                        FMT_STRING("unable to write file: {}"), path))
                        .with_reason(write_res.unwrapErr()));
                return file_status::failed;
            }
            log_info("%s: rewritten", path.c_str());
            break;
        }
    }

    return result.fr_changed ? file_status::changed : file_status::unchanged;
}

}  // namespace

int
main(int argc, char* argv[])
{
    run_options opts;
    linkfmt::config cfg;
    std::vector<std::string> one_liners(cfg.c_one_liners.begin(),
                                        cfg.c_one_liners.end());
    bool dry_run = false;
    bool check = false;

    log_install_handlers();
    log_argv(argc, argv);

    CLI::App app{"Convert the links in markdown documents to references"};

    auto* input_group = app.add_option_group("input", "The documents to format");
    input_group->add_option("-f,--file", opts.ro_file, "Format the given file")
        ->type_name("FILE")
        ->check(CLI::ExistingFile);
    input_group
        ->add_option("-d,--directory",
                     opts.ro_directory,
                     "Format the matching files under the given directory")
        ->type_name("DIR")
        ->check(CLI::ExistingDirectory);
    input_group->require_option(1);

    auto* dry_run_flag = app.add_flag(
        "--dry-run", dry_run, "Print the formatted documents to stdout");
    auto* check_flag = app.add_flag(
        "--check",
        check,
        "Do not write anything, exit with 1 if a document would change");
    dry_run_flag->excludes(check_flag);

    app.add_option(
           "--log", opts.ro_log_path, "Write debug messages to the given file")
        ->type_name("FILE");
    app.add_flag("-q{0},-v{2}", opts.ro_verbosity, "Control the verbosity");
    app.add_option("--one-liner",
                   one_liners,
                   "A shortcode that does not have a close marker")
        ->type_name("NAME")
        ->capture_default_str();
    app.add_option("--literal",
                   cfg.c_literal_name,
                   "The shortcode whose contents are left as-is")
        ->type_name("NAME")
        ->capture_default_str();
    app.add_option("--ext",
                   cfg.c_extension,
                   "The extension of the files to format in a directory")
        ->type_name("EXT")
        ->capture_default_str();
    app.set_config("--config", "", "Read the options from an INI or TOML file");
    app.set_version_flag("-V,--version");
    app.footer(fmt::format(FMT_STRING("Version: {}"), VCS_PACKAGE_STRING));

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp& e) {
        fmt::print(FMT_STRING("{}\n"), app.help());
        return EXIT_SUCCESS;
    } catch (const CLI::CallForVersion& e) {
        fmt::print(FMT_STRING("{}\n"), VCS_PACKAGE_STRING);
        return EXIT_SUCCESS;
    } catch (const CLI::ParseError& e) {
        linkfmt::console::print(
            stderr,
            linkfmt::console::user_message::error(
                "invalid command-line arguments")
                .with_reason(e.what())
                .with_help(fmt::format(FMT_STRING("run \"{} --help\" for usage"),
                                       PACKAGE_NAME)));
        return e.get_exit_code();
    }

    if (!opts.ro_log_path.empty()) {
        linkfmt_log_file = make_optional_from_nullable(
            fopen(opts.ro_log_path.c_str(), "ae"));
        if (!linkfmt_log_file) {
            linkfmt::console::print(
                stderr,
                linkfmt::console::user_message::error(
                    fmt::format(FMT_STRING("unable to open log file: {}"),
                                opts.ro_log_path))
                    .with_errno_reason());
            return EXIT_FAILURE;
        }
        linkfmt_log_level = linkfmt_log_level_t::TRACE;
    }
    log_host_info();

    if (dry_run) {
        opts.ro_mode = run_mode::dry_run;
    } else if (check) {
        opts.ro_mode = run_mode::check;
    }
    cfg.c_one_liners = std::set<std::string>(one_liners.begin(),
                                             one_liners.end());

    auto validate_res = linkfmt::validate_config(cfg);
    if (validate_res.isErr()) {
        linkfmt::console::print(stderr, validate_res.unwrapErr());
        return EXIT_FAILURE;
    }

    std::vector<std::filesystem::path> paths;
    if (!opts.ro_file.empty()) {
        paths.emplace_back(opts.ro_file);
    } else {
        auto find_res = linkfmt::filesystem::find_files(
            opts.ro_directory, {cfg.c_extension});
        if (find_res.isErr()) {
            linkfmt::console::print(
                stderr,
                linkfmt::console::user_message::error(
                    fmt::format(FMT_STRING("unable to search directory: {}"),
                                opts.ro_directory))
                    .with_reason(find_res.unwrapErr()));
            return EXIT_FAILURE;
        }
        paths = find_res.unwrap();
    }

    size_t failed = 0;
    size_t changed = 0;
    for (const auto& path : paths) {
        switch (format_file(path, opts, cfg)) {
            case file_status::unchanged:
                break;
            case file_status::changed:
                changed += 1;
                break;
            case file_status::failed:
                failed += 1;
                break;
        }
    }

    log_info("formatted %zu files (changed=%zu; failed=%zu)",
             paths.size(),
             changed,
             failed);
    if (opts.ro_verbosity > 1) {
        linkfmt::console::print(
            stderr,
            linkfmt::console::user_message::ok(
                fmt::format(FMT_STRING("{} file(s) checked, {} changed, {} "
                                       "failed"),
                            paths.size(),
                            changed,
                            failed)));
    }

    if (failed > 0) {
        return EXIT_FAILURE;
    }
    if (opts.ro_mode == run_mode::check && changed > 0) {
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
