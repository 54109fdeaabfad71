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

#ifndef linkfmt_string_fragment_hh
#define linkfmt_string_fragment_hh

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <string.h>
#include <sys/types.h>

#include "fmt/format.h"

/**
 * A non-owning view of a byte range within a larger string.  The range is
 * kept as a pair of offsets into the original string so that the position
 * of a fragment within its document can always be recovered.
 */
struct string_fragment {
    using iterator = const char*;

    static constexpr string_fragment invalid()
    {
        string_fragment retval;

        retval.invalidate();
        return retval;
    }

    static string_fragment from_string_view(std::string_view str)
    {
        return string_fragment{str.data(), 0, (int) str.size()};
    }

    static string_fragment from_c_str(const char* str)
    {
        return string_fragment{str, 0, str != nullptr ? (int) strlen(str) : 0};
    }

    template<typename T, std::size_t N>
    static constexpr string_fragment from_const(const T (&str)[N])
    {
        return string_fragment{str, 0, (int) N - 1};
    }

    static string_fragment from_str(const std::string& str)
    {
        return string_fragment{str.c_str(), 0, (int) str.size()};
    }

    static string_fragment from_substr(const std::string& str,
                                       size_t offset,
                                       size_t length)
    {
        return string_fragment{
            str.c_str(), (int) offset, (int) (offset + length)};
    }

    static string_fragment from_str_range(const std::string& str,
                                          size_t begin,
                                          size_t end)
    {
        return string_fragment{str.c_str(), (int) begin, (int) end};
    }

    static string_fragment from_bytes(const char* bytes, size_t len)
    {
        return string_fragment{bytes, 0, (int) len};
    }

    static string_fragment from_bytes(const unsigned char* bytes, size_t len)
    {
        return string_fragment{(const char*) bytes, 0, (int) len};
    }

    static string_fragment from_byte_range(const char* bytes,
                                           size_t begin,
                                           size_t end)
    {
        return string_fragment{bytes, (int) begin, (int) end};
    }

    constexpr string_fragment() : sf_string(nullptr), sf_begin(0), sf_end(0) {}

    explicit constexpr string_fragment(const char* str,
                                       int begin = 0,
                                       int end = -1)
        : sf_string(str), sf_begin(begin),
          sf_end(end == -1
                     ? static_cast<int>(std::string::traits_type::length(str))
                     : end)
    {
    }

    string_fragment(const std::string& str)
        : sf_string(str.c_str()), sf_begin(0), sf_end(str.length())
    {
    }

    constexpr bool is_valid() const
    {
        return this->sf_begin != -1 && this->sf_begin <= this->sf_end;
    }

    constexpr int length() const { return this->sf_end - this->sf_begin; }

    constexpr const char* data() const
    {
        return &this->sf_string[this->sf_begin];
    }

    const unsigned char* udata() const
    {
        return (const unsigned char*) &this->sf_string[this->sf_begin];
    }

    constexpr char front() const { return this->sf_string[this->sf_begin]; }

    constexpr char back() const { return this->sf_string[this->sf_end - 1]; }

    iterator begin() const { return &this->sf_string[this->sf_begin]; }

    iterator end() const { return &this->sf_string[this->sf_end]; }

    constexpr bool empty() const { return !this->is_valid() || length() == 0; }

    constexpr const char& operator[](size_t index) const
    {
        return this->sf_string[sf_begin + index];
    }

    bool operator==(const std::string& str) const
    {
        if (this->length() != (int) str.length()) {
            return false;
        }

        return memcmp(
                   &this->sf_string[this->sf_begin], str.c_str(), str.length())
            == 0;
    }

    bool operator==(const string_fragment& sf) const
    {
        if (this->length() != sf.length()) {
            return false;
        }

        return memcmp(this->data(), sf.data(), sf.length()) == 0;
    }

    bool operator!=(const string_fragment& rhs) const
    {
        return !(*this == rhs);
    }

    template<std::size_t N>
    bool operator==(const char (&str)[N]) const
    {
        return (N - 1) == (size_t) this->length()
            && strncmp(this->data(), str, N - 1) == 0;
    }

    bool startswith(const char* prefix) const
    {
        const auto* iter = this->begin();

        while (*prefix != '\0' && iter < this->end() && *prefix == *iter) {
            prefix += 1;
            iter += 1;
        }

        return *prefix == '\0';
    }

    bool endswith(const char* suffix) const
    {
        int suffix_len = strlen(suffix);

        if (suffix_len > this->length()) {
            return false;
        }

        const auto* curr = this->end() - suffix_len;
        while (*suffix != '\0' && *curr == *suffix) {
            suffix += 1;
            curr += 1;
        }

        return *suffix == '\0';
    }

    constexpr string_fragment substr(int begin) const
    {
        return string_fragment{
            this->sf_string, this->sf_begin + begin, this->sf_end};
    }

    string_fragment sub_range(int begin, int end) const
    {
        if (this->sf_begin + begin > this->sf_end) {
            begin = this->sf_end - this->sf_begin;
        }
        if (this->sf_begin + end > this->sf_end) {
            end = this->sf_end - this->sf_begin;
        }
        return string_fragment{
            this->sf_string, this->sf_begin + begin, this->sf_begin + end};
    }

    constexpr size_t count(char ch) const
    {
        size_t retval = 0;

        for (int lpc = this->sf_begin; lpc < this->sf_end; lpc++) {
            if (this->sf_string[lpc] == ch) {
                retval += 1;
            }
        }

        return retval;
    }

    std::optional<int> find(char ch) const
    {
        for (int lpc = this->sf_begin; lpc < this->sf_end; lpc++) {
            if (this->sf_string[lpc] == ch) {
                return lpc - this->sf_begin;
            }
        }

        return std::nullopt;
    }

    std::optional<int> find(string_fragment needle) const;

    template<typename P>
    string_fragment skip(P predicate) const
    {
        int offset = 0;
        while (offset < this->length() && predicate(this->data()[offset])) {
            offset += 1;
        }

        return string_fragment{
            this->sf_string,
            this->sf_begin + offset,
            this->sf_end,
        };
    }

    /**
     * Split the fragment into lines.  Each line keeps its terminating
     * newline, so joining the result reproduces the fragment exactly.  An
     * empty fragment produces no lines.
     */
    std::vector<string_fragment> split_lines() const;

    string_fragment trim(const char* tokens) const;
    string_fragment rtrim(const char* tokens) const;
    string_fragment trim() const;

    bool blank() const;

    std::string to_string() const
    {
        return {this->data(), (size_t) this->length()};
    }

    std::string_view to_string_view() const
    {
        return std::string_view{
            this->data(),
            static_cast<std::string_view::size_type>(this->length())};
    }

    constexpr void invalidate()
    {
        this->sf_begin = -1;
        this->sf_end = -1;
    }

    const char* sf_string;
    int sf_begin;
    int sf_end;
};

inline bool
operator==(const std::string& left, const string_fragment& right)
{
    return right == left;
}

inline string_fragment
operator"" _frag(const char* str, std::size_t len)
{
    return string_fragment::from_byte_range(str, 0, len);
}

namespace fmt {
template<>
struct formatter<string_fragment> : formatter<string_view> {
    template<typename FormatContext>
    auto format(const string_fragment& sf, FormatContext& ctx) const
    {
        return formatter<string_view>::format(
            string_view{sf.data(), (size_t) sf.length()}, ctx);
    }
};
}  // namespace fmt

#endif
