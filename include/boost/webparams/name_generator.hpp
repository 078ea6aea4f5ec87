//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_NAME_GENERATOR_HPP
#define BOOST_WEBPARAMS_NAME_GENERATOR_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <string>

namespace boost {
namespace webparams {

/** Reserved prefix of sum discriminator keys
*/
constexpr core::string_view sum_key_prefix = "__sum.";

/** Reserved key holding the state of an auxiliary service
*/
constexpr core::string_view state_key = "__state";

/** Return a short alphanumeric code for a number

    The code is the base-36 representation of `n`
    using digits and lowercase letters.
*/
BOOST_WEBPARAMS_DECL
std::string
make_code(std::size_t n);

/** Produces the keys of parameters while a shape is walked

    A name generator is a position in a parameter
    shape. Named leaves get the current prefix
    prepended to their name. Anonymous fields, such
    as sum discriminators, are numbered in pre-order
    starting at the base of the current naming scope,
    so the key of a node depends only on the shape
    and never on the value being encoded.

    Generators are small values. Combinators derive
    a new generator for each child instead of
    mutating a shared one.
*/
class name_generator
{
    std::string prefix_;
    std::size_t base_ = 0;
    bool suffix_ = false;

public:
    /// Construct the generator for the root of a shape
    name_generator() = default;

    /// Return the key of a named field
    BOOST_WEBPARAMS_DECL
    std::string
    key(core::string_view name) const;

    /** Return the key of an anonymous field

        @param offset The pre-order number of the
        field relative to the current base.
    */
    BOOST_WEBPARAMS_DECL
    std::string
    anonymous(std::size_t offset) const;

    /// Return a generator whose base is advanced by `n`
    BOOST_WEBPARAMS_DECL
    name_generator
    advance(std::size_t n) const;

    /** Return the generator for one element of a list

        Keys are prefixed by `<list>.<index>.` and
        anonymous numbering restarts at zero.
    */
    BOOST_WEBPARAMS_DECL
    name_generator
    nest(
        core::string_view list,
        std::size_t index) const;

    /// Return a generator which prepends `prefix` to keys
    BOOST_WEBPARAMS_DECL
    name_generator
    prefixed(core::string_view prefix) const;

    /// Return a generator whose leaves use path segments
    BOOST_WEBPARAMS_DECL
    name_generator
    suffix_mode() const;

    /// Return true if leaves use path segments
    bool
    in_suffix() const noexcept
    {
        return suffix_;
    }

    /// Return the current key prefix
    std::string const&
    prefix() const noexcept
    {
        return prefix_;
    }

    /// Return the current anonymous base
    std::size_t
    base() const noexcept
    {
        return base_;
    }
};

} // webparams
} // boost

#endif
