//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_PARAM_NAME_HPP
#define BOOST_WEBPARAMS_PARAM_NAME_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/webparams/name_generator.hpp>
#include <cstddef>
#include <string>
#include <utility>

namespace boost {
namespace webparams {

/// Exactly one value is expected under the name
struct one_tag {};

/// Zero or one value is expected under the name
struct opt_tag {};

/// Any number of values are expected under the name
struct set_tag {};

/** The name of a parameter, as used by form widgets

    The name is tagged with the type of the value and
    with how many values the service expects, so that
    form helpers can only be used with fields of the
    right type.

    @tparam T The value type.

    @tparam Card One of @ref one_tag, @ref opt_tag
    or @ref set_tag.
*/
template<class T, class Card = one_tag>
class param_name
{
    std::string s_;

public:
    using value_type = T;
    using cardinality = Card;

    explicit
    param_name(std::string s) noexcept
        : s_(std::move(s))
    {
    }

    /// Return the key
    std::string const&
    str() const noexcept
    {
        return s_;
    }
};

/** Return the key of a parameter name
*/
template<class T, class Card>
std::string const&
to_string(param_name<T, Card> const& n) noexcept
{
    return n.str();
}

/** The names of a parameter which takes no parameters
*/
struct unit_names
{
};

/** The names of a binary sum

    A form for a sum must send the discriminator
    key with @ref first_value or @ref second_value
    together with the fields of that alternative.
*/
template<class First, class Second>
struct sum_names
{
    std::string discriminator;
    First first;
    Second second;

    static
    char const*
    first_value() noexcept
    {
        return "1";
    }

    static
    char const*
    second_value() noexcept
    {
        return "2";
    }
};

/** The names of a list of parameters

    The names of each element depend on its index.
*/
template<class Rule>
class list_names
{
    Rule inner_;
    std::string name_;
    name_generator gen_;

public:
    using element_names = typename Rule::names_type;

    list_names(
        Rule inner,
        std::string name,
        name_generator gen)
        : inner_(std::move(inner))
        , name_(std::move(name))
        , gen_(std::move(gen))
    {
    }

    /// Return the names of the element at index `i`
    element_names
    at(std::size_t i) const
    {
        return inner_.names(gen_.nest(name_, i));
    }

    /** Invoke a function for each element of a range

        The function is called with the names of
        each element and the element itself:

        @code
        void( element_names const&, Element const& );
        @endcode
    */
    template<class Range, class F>
    void
    each(Range const& r, F&& f) const
    {
        std::size_t i = 0;
        for(auto const& e : r)
            f(at(i++), e);
    }
};

} // webparams
} // boost

#endif
