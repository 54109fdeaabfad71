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
 *
 * @file auto_fd.cc
 */

#include <unistd.h>

#include "auto_fd.hh"

#include "linkfmt_log.hh"

auto_fd::auto_fd(int fd) : af_fd(fd)
{
    require(fd >= -1);
}

auto_fd::auto_fd(auto_fd&& af) noexcept : af_fd(af.release()) {}

auto_fd::~auto_fd()
{
    this->reset();
}

void
auto_fd::reset(int fd)
{
    require(fd >= -1);

    if (this->af_fd != fd) {
        if (this->af_fd != -1) {
            switch (this->af_fd) {
                case STDIN_FILENO:
                case STDOUT_FILENO:
                case STDERR_FILENO:
                    break;
                default:
                    close(this->af_fd);
                    break;
            }
        }
        this->af_fd = fd;
    }
}

auto_fd&
auto_fd::operator=(int fd)
{
    require(fd >= -1);

    this->reset(fd);
    return *this;
}

Result<void, std::string>
auto_fd::write_fully(string_fragment sf)
{
    while (!sf.empty()) {
        auto rc = write(this->af_fd, sf.data(), sf.length());

        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err(
                fmt::format(FMT_STRING("failed to write {} bytes to FD {} -- {}"),
                            sf.length(),
                            this->af_fd,
                            strerror(errno)));
        }

        sf = sf.substr(rc);
    }

    return Ok();
}
