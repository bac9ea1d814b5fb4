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
#include "utf.hpp"

using namespace farlib::utf::detail;

namespace farlib::utf
{
auto find_invalid(std::string_view src) noexcept -> std::ptrdiff_t
{
    auto const origSize = src.size();
    while (!src.empty())
    {
        auto const seqLength = sequence_length(src.front());
        if (seqLength == 0 || seqLength > src.size())
        {
            return static_cast<std::ptrdiff_t>(origSize - src.size());
        }

        char32_t cp = ERROR_CHAR;
        switch (seqLength)
        {
        case 1: cp = get_sequence<1>(src.data()); break;
        case 2: cp = get_sequence<2>(src.data()); break;
        case 3: cp = get_sequence<3>(src.data()); break;
        case 4: cp = get_sequence<4>(src.data()); break;
        default: break;
        }

        if (cp == ERROR_CHAR || !is_code_point_valid(cp)
            || seqLength != encoded_utf8_size(cp))
        {
            return static_cast<std::ptrdiff_t>(origSize - src.size());
        }
        src.remove_prefix(seqLength);
    }
    return -1;
}
} // namespace farlib::utf
