//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#include "src/detail/pct_decode.hpp"

namespace boost {
namespace webparams {
namespace detail {

std::string
pct_decode(
    urls::pct_string_view s,
    bool plus_is_space)
{
    std::string result;
    core::string_view sv(s);
    result.reserve(s.decoded_size());
    auto it = sv.data();
    auto const end = it + sv.size();
    while(it != end)
    {
        if(*it == '+' && plus_is_space)
        {
            result.push_back(' ');
            ++it;
            continue;
        }
        if(*it != '%')
        {
            result.push_back(*it++);
            continue;
        }
        ++it;
        // pct_string_view can never have invalid pct-encodings
        auto d0 = grammar::hexdig_value(*it++);
        auto d1 = grammar::hexdig_value(*it++);
        result.push_back(static_cast<char>(d0 * 16 + d1));
    }
    return result;
}

} // detail
} // webparams
} // boost
