//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_CONSTRUCT_HPP
#define BOOST_WEBPARAMS_CONSTRUCT_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/webparams/encoder.hpp>
#include <boost/webparams/query.hpp>
#include <boost/webparams/rule.hpp>
#include <boost/webparams/types.hpp>
#include <boost/optional.hpp>
#include <cstdint>
#include <string>
#include <utility>

namespace boost {
namespace webparams {

/** The wire form of a parameter value
*/
struct constructed_params
{
    /** The path segments

        Present if and only if the shape takes
        a path suffix. The list may be empty.
    */
    boost::optional<segment_list> suffix;

    /// The key/value pairs, in encoding order
    param_list params;
};

/** Return the wire form of a value

    The pairs are emitted in a depth first walk of
    the shape. The same shape and value always give
    the same output.

    @par Example
    @code
    auto r = construct( list( "l", prod( int_( "a" ), string( "b" ) ) ),
        std::vector< std::pair< int, std::string > >{ { 1, "x" }, { 2, "y" } } );
    // r.params == { { "l.0.a", "1" }, { "l.0.b", "x" }, { "l.1.a", "2" }, { "l.1.b", "y" } }
    @endcode

    @throws std::invalid_argument if the value
    holds a file.
*/
template<param_rule Rule>
constructed_params
construct(
    Rule const& rule,
    typename Rule::value_type const& v)
{
    static_assert(
        Rule::suffix_type != suffix_kind::end,
        "the rest of the path can only be taken inside a suffix");

    encoder e;
    rule.encode(v, e, name_generator());
    constructed_params r;
    r.params = std::move(e.params());
    if(Rule::suffix_type == suffix_kind::with)
        r.suffix.emplace(std::move(e.suffix()));
    return r;
}

/** Return the pairs of a value as a query string

    The suffix, if any, is not included.

    @see @ref encode_params.
*/
template<param_rule Rule>
std::string
construct_params_string(
    Rule const& rule,
    typename Rule::value_type const& v)
{
    return encode_params(construct(rule, v).params);
}

/** Return the names of the parameters of a rule

    The result mirrors the structure of the value
    type; each leaf holds the key of one field.

    @par Example
    @code
    auto n = make_param_names( prod( int_( "a" ), opt( string( "b" ) ) ) );
    // n.first.str() == "a", n.second.str() == "b"
    @endcode
*/
template<param_rule Rule>
typename Rule::names_type
make_param_names(Rule const& rule)
{
    return rule.names(name_generator());
}

/** Return true if the rule takes a path suffix
*/
template<param_rule Rule>
bool
contains_suffix(Rule const& rule) noexcept
{
    return contains_suffix(*rule.shape());
}

/** Return the fingerprint of the shape of a rule

    @see @ref fingerprint(param_shape const&).
*/
template<param_rule Rule>
std::uint64_t
fingerprint(Rule const& rule) noexcept
{
    return fingerprint(*rule.shape());
}

} // webparams
} // boost

#endif
