// Copyright 2016-2017 Henrik Steffen Gaßmann
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//		http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#include <cstddef>
#include <cstdint>

#include <string_view>

namespace farlib::utf
{
namespace detail
{
// Unicode constants
constexpr char32_t CODE_POINT_MAX = 0x10FFFF;
constexpr char32_t ERROR_CHAR = 0xFFFFFFFF;

// high surrogates: 0xd800 - 0xdbff
// low surrogates:  0xdc00 - 0xdfff
constexpr char16_t SURROGATE_LEAD_MIN = 0xD800;
constexpr char16_t SURROGATE_TRAIL_MAX = 0xDFFF;

// the number of code units of the sequence introduced by the given lead unit
// (0 for trail units and bytes which never appear in utf-8)
constexpr std::uint8_t lead_char_class[] = {
        1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, //
        1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, //
        1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, //
        1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, //
        1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, //
        1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, //
        1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, //
        1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, //
        0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, //
        0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, //
        0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, //
        0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, //
        2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, //
        2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, //
        3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, //
        4, 4, 4, 4, 4, 4, 4, 4, 0, 0, 0, 0, 0, 0, 0, 0, //
};

constexpr auto sequence_length(char leadUnit) noexcept -> std::size_t
{
    return lead_char_class[static_cast<unsigned char>(leadUnit)];
}

constexpr auto is_trail(char codeUnit) noexcept -> bool
{
    return static_cast<unsigned char>(codeUnit) >> 6 == 0x2;
}

constexpr auto is_surrogate(char32_t cp) noexcept -> bool
{
    return SURROGATE_LEAD_MIN <= cp && cp <= SURROGATE_TRAIL_MAX;
}

constexpr auto is_code_point_valid(char32_t cp) noexcept -> bool
{
    return cp <= CODE_POINT_MAX && !is_surrogate(cp);
}

constexpr auto encoded_utf8_size(char32_t cp) noexcept -> std::size_t
{
    constexpr std::size_t encoded_utf8_size_map[] = {1, 2, 3, 4, 0};

    return encoded_utf8_size_map[0U + (cp >= 0x80) + (cp >= 0x800)
                                 + (cp >= 0x10000) + (cp > CODE_POINT_MAX)];
}

// decodes the sequence at src, yields ERROR_CHAR if a trail unit is missing
template <int seq_length>
constexpr auto get_sequence(char const *src) noexcept -> char32_t
{
    static_assert(0 < seq_length && seq_length < 5,
                  "utf8 sequences are 1 to 4 bytes long");

    if constexpr (seq_length == 1)
    {
        return static_cast<char32_t>(static_cast<unsigned char>(src[0]));
    }
    else
    {
        auto cp = static_cast<char32_t>(static_cast<unsigned char>(src[0])
                                        & (0x7F >> seq_length));
        for (int i = 1; i < seq_length; ++i)
        {
            char const tmp = src[i];
            if (!is_trail(tmp)) [[unlikely]]
            {
                return ERROR_CHAR;
            }
            cp = (cp << 6)
                 | static_cast<char32_t>(static_cast<unsigned char>(tmp)
                                         & 0x3F);
        }
        return cp;
    }
}
} // namespace detail

//! Returns the offset of the first code unit which doesn't start a well
//! formed utf-8 sequence or -1 if the whole string is valid.
//! Overlong encodings, surrogates and code points beyond U+10FFFF are
//! rejected.
auto find_invalid(std::string_view src) noexcept -> std::ptrdiff_t;

inline auto is_valid(std::string_view src) noexcept -> bool
{
    return find_invalid(src) == -1;
}
} // namespace farlib::utf
