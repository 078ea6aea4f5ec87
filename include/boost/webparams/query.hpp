//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_QUERY_HPP
#define BOOST_WEBPARAMS_QUERY_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/webparams/types.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>

namespace boost {
namespace webparams {

/** Return pairs as a query string

    Keys and values are percent-encoded except
    for unreserved characters, and the pairs are
    joined as `k=v&k=v`.
*/
BOOST_WEBPARAMS_DECL
std::string
encode_params(param_list const& params);

/** Parse a query string or a form body

    Keys and values are percent-decoded. Pairs
    keep the order in which they appear.

    @param s The string, without the leading `?`.

    @param plus_is_space If true, `+` decodes to
    a space, as in `application/x-www-form-urlencoded`.

    @return The pairs, or the error if `s` is
    not a valid query.
*/
BOOST_WEBPARAMS_DECL
system::result<param_list>
parse_params(
    core::string_view s,
    bool plus_is_space = true);

/** Return path segments as an encoded relative path

    Each segment is percent-encoded, including
    any `/` it contains.
*/
BOOST_WEBPARAMS_DECL
std::string
encode_suffix(segment_list const& segments);

/** Parse an encoded path into decoded segments

    A leading `/` is ignored.
*/
BOOST_WEBPARAMS_DECL
system::result<segment_list>
parse_suffix(core::string_view path);

/** Remove every pair whose key starts with a prefix
*/
BOOST_WEBPARAMS_DECL
param_list
remove_prefixed_param(
    core::string_view prefix,
    param_list params);

} // webparams
} // boost

#endif
