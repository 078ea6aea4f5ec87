//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_RECONSTRUCT_HPP
#define BOOST_WEBPARAMS_RECONSTRUCT_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/webparams/config.hpp>
#include <boost/webparams/decoder.hpp>
#include <boost/webparams/error.hpp>
#include <boost/webparams/rule.hpp>
#include <boost/webparams/types.hpp>
#include <utility>

namespace boost {
namespace webparams {

/** Decode a value from its wire form

    The first failure aborts the whole decoding.
    Path segments left over after the rule has
    been decoded are an error. When the config has
    `reject_unknown_parameters` set, pairs left
    over are an error too.

    @par Example
    @code
    auto rv = reconstruct( opt( int_( "x" ) ), { { "x", "abc" } } );
    // rv.error().code() == error::invalid_parameter_value
    @endcode

    @return The value, or the @ref param_error
    describing the first failure.

    @param rule The shape of the value.

    @param params The GET or POST pairs, in any
    order. Keys may repeat.

    @param files The uploaded files.

    @param segments The path segments following
    the path of the service.

    @param cfg The decoding options.
*/
template<param_rule Rule>
decode_result<typename Rule::value_type>
reconstruct(
    Rule const& rule,
    param_list params,
    file_list files = {},
    segment_list segments = {},
    reconstruct_config const& cfg = {})
{
    decoder d(
        std::move(params),
        std::move(files),
        std::move(segments),
        cfg);
    auto rv = rule.decode(d, name_generator());
    if(! rv)
        return rv;
    if(d.has_segments())
    {
        auto s = d.next_segment();
        return param_error(
            BOOST_WEBPARAMS_ERR(
                error::unexpected_suffix),
            {}, std::move(*s));
    }
    if( cfg.reject_unknown_parameters &&
        ! d.remaining().empty())
    {
        auto const& p = d.remaining().front();
        return param_error(
            BOOST_WEBPARAMS_ERR(
                error::unexpected_parameter),
            p.first, p.second);
    }
    return rv;
}

} // webparams
} // boost

#endif
