//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_DETAIL_PCT_DECODE_HPP
#define BOOST_WEBPARAMS_DETAIL_PCT_DECODE_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/url/pct_string_view.hpp>
#include <boost/url/grammar/hexdig_chars.hpp>
#include <string>

namespace boost {
namespace webparams {
namespace detail {

// decode all percent escapes, and
// optionally '+' as a space
std::string
pct_decode(
    urls::pct_string_view s,
    bool plus_is_space);

} // detail
} // webparams
} // boost

#endif
