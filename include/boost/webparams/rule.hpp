//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_RULE_HPP
#define BOOST_WEBPARAMS_RULE_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/webparams/decoder.hpp>
#include <boost/webparams/encoder.hpp>
#include <boost/webparams/error.hpp>
#include <boost/webparams/name_generator.hpp>
#include <boost/webparams/shape.hpp>
#include <concepts>
#include <cstddef>

namespace boost {
namespace webparams {

/** How a parameter shape relates to the path suffix
*/
enum class suffix_kind
{
    /// The shape only uses keys
    none,

    /// The shape reads the path suffix
    with,

    /** The shape consumes the rest of the path

        Such a shape must be wrapped by @ref suffix
        or @ref suffix_prod before it can be used.
    */
    end
};

/** Concept for a parameter rule

    A rule describes a parameter shape and converts
    values of that shape to and from the wire
    representation.

    @par Members
    @li `value_type`: the type of the values.
    @li `names_type`: the names given to form helpers.
    @li `suffix_type`: a @ref suffix_kind.
    @li `is_one`: true if the rule may be made optional.
    @li `is_single_key`: true if the rule may be repeated
        with @ref set.
    @li `shape()`: the @ref param_shape of the rule.
    @li `anonymous_count()`: how many anonymous keys
        the rule numbers in its naming scope.
*/
template<class R>
concept param_rule = requires(
    R const& r,
    encoder& e,
    decoder& d,
    name_generator const& g,
    typename R::value_type const& v)
{
    typename R::names_type;
    { R::suffix_type } -> std::convertible_to<suffix_kind>;
    { R::is_one } -> std::convertible_to<bool>;
    { R::is_single_key } -> std::convertible_to<bool>;
    { r.shape() } -> std::convertible_to<shape_ptr>;
    { r.anonymous_count() } -> std::convertible_to<std::size_t>;
    r.encode(v, e, g);
    { r.decode(d, g) } -> std::same_as<
        decode_result<typename R::value_type>>;
    { r.names(g) } -> std::same_as<typename R::names_type>;
};

} // webparams
} // boost

#endif
