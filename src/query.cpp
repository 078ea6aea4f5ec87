//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#include <boost/webparams/query.hpp>
#include "src/detail/pct_decode.hpp"
#include <boost/url/encode.hpp>
#include <boost/url/parse_path.hpp>
#include <boost/url/parse_query.hpp>
#include <boost/url/rfc/pchars.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>
#include <algorithm>

namespace boost {
namespace webparams {

std::string
encode_params(param_list const& params)
{
    std::string s;
    for(auto const& p : params)
    {
        if(! s.empty())
            s.push_back('&');
        s.append(urls::encode(
            p.first, urls::unreserved_chars));
        s.push_back('=');
        s.append(urls::encode(
            p.second, urls::unreserved_chars));
    }
    return s;
}

system::result<param_list>
parse_params(
    core::string_view s,
    bool plus_is_space)
{
    param_list v;
    if(s.empty())
        return v;
    auto rv = urls::parse_query(s);
    if(! rv)
        return rv.error();
    for(auto const& p : *rv)
    {
        // "a=1&&b=2"
        if( p.key.empty() &&
            ! p.has_value)
            continue;
        v.emplace_back(
            detail::pct_decode(p.key, plus_is_space),
            detail::pct_decode(p.value, plus_is_space));
    }
    return v;
}

std::string
encode_suffix(segment_list const& segments)
{
    std::string s;
    for(std::size_t i = 0; i < segments.size(); ++i)
    {
        if(i > 0)
            s.push_back('/');
        s.append(urls::encode(
            segments[i], urls::pchars));
    }
    return s;
}

system::result<segment_list>
parse_suffix(core::string_view path)
{
    segment_list v;
    if(path.empty())
        return v;
    auto rv = urls::parse_path(path);
    if(! rv)
        return rv.error();
    for(auto seg : *rv)
        v.push_back(detail::pct_decode(seg, false));
    return v;
}

param_list
remove_prefixed_param(
    core::string_view prefix,
    param_list params)
{
    params.erase(
        std::remove_if(
            params.begin(), params.end(),
            [prefix](auto const& p)
            {
                return core::string_view(
                    p.first).starts_with(prefix);
            }),
        params.end());
    return params;
}

} // webparams
} // boost
