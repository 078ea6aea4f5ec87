//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#include <boost/webparams/codec.hpp>
#include <charconv>

namespace boost {
namespace webparams {

namespace detail {

std::string
format_int(std::int64_t v)
{
    char buf[24];
    auto const r = std::to_chars(
        buf, buf + sizeof(buf), v);
    return std::string(buf, r.ptr);
}

system::result<std::int64_t>
parse_int(
    core::string_view s,
    std::int64_t min,
    std::int64_t max) noexcept
{
    std::int64_t v = 0;
    auto const first = s.data();
    auto const last = first + s.size();
    auto const r = std::from_chars(first, last, v);
    if( r.ec != std::errc() ||
        r.ptr != last ||
        v < min ||
        v > max)
        return BOOST_WEBPARAMS_ERR(
            error::invalid_parameter_value);
    return v;
}

std::string
format_float(double v)
{
    // large enough for the longest
    // shortest-form fixed notation
    char buf[400];
    auto const r = std::to_chars(
        buf, buf + sizeof(buf), v,
        std::chars_format::fixed);
    if(r.ec != std::errc())
    {
        auto const r2 = std::to_chars(
            buf, buf + sizeof(buf), v);
        return std::string(buf, r2.ptr);
    }
    return std::string(buf, r.ptr);
}

system::result<double>
parse_float(core::string_view s) noexcept
{
    double v = 0;
    auto const first = s.data();
    auto const last = first + s.size();
    auto const r = std::from_chars(first, last, v);
    if( r.ec != std::errc() ||
        r.ptr != last)
        return BOOST_WEBPARAMS_ERR(
            error::invalid_parameter_value);
    return v;
}

} // detail

std::string
regexp_codec::
to_string(std::string const& v) const
{
    if(! rewrite_on_encode_)
        return v;
    auto s = rewrite(*p_, v, templ_);
    if(! s)
        return v;
    return std::move(*s);
}

system::result<std::string>
regexp_codec::
from_string(core::string_view s) const
{
    auto r = rewrite(*p_, s, templ_);
    if(! r)
        return BOOST_WEBPARAMS_ERR(
            error::regexp_mismatch);
    return std::move(*r);
}

} // webparams
} // boost
