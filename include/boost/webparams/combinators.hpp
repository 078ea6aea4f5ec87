//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_COMBINATORS_HPP
#define BOOST_WEBPARAMS_COMBINATORS_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/webparams/param_name.hpp>
#include <boost/webparams/rule.hpp>
#include <boost/webparams/types.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional.hpp>
#include <boost/variant2.hpp>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace boost {
namespace webparams {

/** Rule for a pair of parameters

    Both sides are required, and their keys must
    not overlap. The second side may end with a
    rule consuming the rest of the path suffix.

    @par Value Type
    @code
    using value_type = std::pair< First::value_type, Second::value_type >;
    @endcode

    @see @ref prod.
*/
template<param_rule First, param_rule Second>
class prod_rule
{
    static_assert(
        First::suffix_type == suffix_kind::none,
        "the first element of a product cannot take a suffix");
    static_assert(
        Second::suffix_type != suffix_kind::with,
        "a suffix must be the outermost parameter");

    First first_;
    Second second_;
    shape_ptr shape_;

public:
    using value_type = std::pair<
        typename First::value_type,
        typename Second::value_type>;
    using names_type = std::pair<
        typename First::names_type,
        typename Second::names_type>;
    static constexpr suffix_kind suffix_type = Second::suffix_type;
    static constexpr bool is_one = false;
    static constexpr bool is_single_key = false;

    prod_rule(
        First first,
        Second second)
        : first_(std::move(first))
        , second_(std::move(second))
    {
        detail::check_disjoint(
            *first_.shape(), *second_.shape());
        shape_ = make_shape(param_shape::product_node{
            first_.shape(), second_.shape() });
    }

    shape_ptr const&
    shape() const noexcept
    {
        return shape_;
    }

    std::size_t
    anonymous_count() const noexcept
    {
        return
            first_.anonymous_count() +
            second_.anonymous_count();
    }

    void
    encode(
        value_type const& v,
        encoder& e,
        name_generator const& g) const
    {
        first_.encode(v.first, e, g);
        second_.encode(v.second, e,
            g.advance(first_.anonymous_count()));
    }

    decode_result<value_type>
    decode(
        decoder& d,
        name_generator const& g) const
    {
        auto r1 = first_.decode(d, g);
        if(! r1)
            return r1.error();
        auto r2 = second_.decode(d,
            g.advance(first_.anonymous_count()));
        if(! r2)
            return r2.error();
        return value_type(
            std::move(*r1),
            std::move(*r2));
    }

    names_type
    names(name_generator const& g) const
    {
        return names_type(
            first_.names(g),
            second_.names(g.advance(
                first_.anonymous_count())));
    }
};

/** Takes two parameters

    @par Example
    @code
    // handler receives std::pair< int, std::string >
    auto p = prod( int_( "myvalue" ), string( "mystring" ) );
    @endcode

    @throws system::system_error with
    @ref error::invalid_param_shape if the
    keys of both sides can collide.
*/
template<param_rule First, param_rule Second>
prod_rule<First, Second>
prod(
    First first,
    Second second)
{
    return prod_rule<First, Second>(
        std::move(first), std::move(second));
}

//------------------------------------------------

/** Rule for one parameter out of two

    The encoded form carries a discriminator key,
    @ref sum_key_prefix followed by the number of
    the sum in its naming scope, whose value is
    `1` or `2`. Decoding reads the discriminator
    and only looks at the selected alternative.

    @par Value Type
    @code
    using value_type = binsum< First::value_type, Second::value_type >;
    @endcode

    @see @ref sum.
*/
template<param_rule First, param_rule Second>
class sum_rule
{
    static_assert(
        First::suffix_type == suffix_kind::none &&
        Second::suffix_type == suffix_kind::none,
        "a sum cannot take a suffix");

    First first_;
    Second second_;
    shape_ptr shape_;

public:
    using value_type = binsum<
        typename First::value_type,
        typename Second::value_type>;
    using names_type = sum_names<
        typename First::names_type,
        typename Second::names_type>;
    static constexpr suffix_kind suffix_type = suffix_kind::none;
    static constexpr bool is_one = false;
    static constexpr bool is_single_key = false;

    sum_rule(
        First first,
        Second second)
        : first_(std::move(first))
        , second_(std::move(second))
        , shape_(make_shape(param_shape::sum_node{
            first_.shape(), second_.shape() }))
    {
    }

    shape_ptr const&
    shape() const noexcept
    {
        return shape_;
    }

    std::size_t
    anonymous_count() const noexcept
    {
        return 1 +
            first_.anonymous_count() +
            second_.anonymous_count();
    }

    void
    encode(
        value_type const& v,
        encoder& e,
        name_generator const& g) const
    {
        if(v.index() == 0)
        {
            e.emit(g.anonymous(0), "1");
            first_.encode(
                variant2::get<0>(v), e, g.advance(1));
            return;
        }
        e.emit(g.anonymous(0), "2");
        second_.encode(
            variant2::get<1>(v), e, g.advance(
                1 + first_.anonymous_count()));
    }

    decode_result<value_type>
    decode(
        decoder& d,
        name_generator const& g) const
    {
        std::string key = g.anonymous(0);
        auto s = d.take(key);
        if(! s)
            return param_error(
                BOOST_WEBPARAMS_ERR(
                    error::ambiguous_sum),
                std::move(key));
        if(*s == "1")
        {
            auto r = first_.decode(d, g.advance(1));
            if(! r)
                return r.error();
            return value_type(
                variant2::in_place_index_t<0>(),
                std::move(*r));
        }
        if(*s == "2")
        {
            auto r = second_.decode(d, g.advance(
                1 + first_.anonymous_count()));
            if(! r)
                return r.error();
            return value_type(
                variant2::in_place_index_t<1>(),
                std::move(*r));
        }
        return param_error(
            BOOST_WEBPARAMS_ERR(
                error::ambiguous_sum),
            std::move(key),
            std::move(*s));
    }

    names_type
    names(name_generator const& g) const
    {
        return names_type{
            g.anonymous(0),
            first_.names(g.advance(1)),
            second_.names(g.advance(
                1 + first_.anonymous_count())) };
    }
};

/** Takes either one parameter or another

    Both alternatives may use the same keys.
*/
template<param_rule First, param_rule Second>
sum_rule<First, Second>
sum(
    First first,
    Second second)
{
    return sum_rule<First, Second>(
        std::move(first), std::move(second));
}

//------------------------------------------------

/** Rule for an optional parameter

    The value is absent when none of the keys of
    the inner rule are present. A value which is
    present but malformed is an error.

    @par Value Type
    @code
    using value_type = boost::optional< Rule::value_type >;
    @endcode

    @see @ref opt.
*/
template<param_rule Rule>
class opt_rule
{
    static_assert(Rule::is_one,
        "only a single parameter can be optional");

    Rule inner_;
    shape_ptr shape_;

public:
    using value_type = boost::optional<
        typename Rule::value_type>;
    using names_type = param_name<
        typename Rule::value_type, opt_tag>;
    static constexpr suffix_kind suffix_type = suffix_kind::none;
    static constexpr bool is_one = false;
    static constexpr bool is_single_key = false;

    explicit
    opt_rule(Rule inner)
        : inner_(std::move(inner))
        , shape_(make_shape(param_shape::option_node{
            inner_.shape() }))
    {
    }

    shape_ptr const&
    shape() const noexcept
    {
        return shape_;
    }

    std::size_t
    anonymous_count() const noexcept
    {
        return 0;
    }

    void
    encode(
        value_type const& v,
        encoder& e,
        name_generator const& g) const
    {
        if(v)
            inner_.encode(*v, e, g);
    }

    decode_result<value_type>
    decode(
        decoder& d,
        name_generator const& g) const
    {
        if(! inner_.present(d, g))
            return value_type();
        auto r = inner_.decode(d, g);
        if(! r)
            return r.error();
        return value_type(std::move(*r));
    }

    names_type
    names(name_generator const& g) const
    {
        return names_type(inner_.names(g).str());
    }
};

/** Makes a parameter optional
*/
template<param_rule Rule>
opt_rule<Rule>
opt(Rule inner)
{
    return opt_rule<Rule>(std::move(inner));
}

//------------------------------------------------

/** Rule for any number of values under one key

    Values are decoded in the order their pairs
    appear in the request.

    @par Value Type
    @code
    using value_type = std::vector< Rule::value_type >;
    @endcode

    @see @ref set.
*/
template<param_rule Rule>
class set_rule
{
    static_assert(Rule::is_single_key,
        "only a single key parameter can be repeated");

    Rule inner_;
    shape_ptr shape_;

public:
    using value_type = std::vector<
        typename Rule::value_type>;
    using names_type = param_name<
        typename Rule::value_type, set_tag>;
    static constexpr suffix_kind suffix_type = suffix_kind::none;
    static constexpr bool is_one = false;
    static constexpr bool is_single_key = false;

    explicit
    set_rule(Rule inner)
        : inner_(std::move(inner))
        , shape_(make_shape(param_shape::set_node{
            inner_.shape() }))
    {
    }

    shape_ptr const&
    shape() const noexcept
    {
        return shape_;
    }

    std::size_t
    anonymous_count() const noexcept
    {
        return 0;
    }

    void
    encode(
        value_type const& v,
        encoder& e,
        name_generator const& g) const
    {
        for(auto const& x : v)
            inner_.encode(x, e, g);
    }

    decode_result<value_type>
    decode(
        decoder& d,
        name_generator const& g) const
    {
        value_type v;
        while(inner_.present(d, g))
        {
            auto r = inner_.decode(d, g);
            if(! r)
                return r.error();
            v.push_back(std::move(*r));
        }
        return v;
    }

    names_type
    names(name_generator const& g) const
    {
        return names_type(inner_.names(g).str());
    }
};

/** Takes any number of parameters with the same name

    For example `set( int_, "i" )` matches the
    parameter string `i=4&i=22&i=111` and gives
    the service handler the integers 4, 22 and 111.

    @param make A function returning a rule for
    one value when called with `name`.
*/
template<class MakeRule>
auto
set(
    MakeRule make,
    core::string_view name) ->
        set_rule<std::decay_t<decltype(make(name))>>
{
    return set_rule<std::decay_t<decltype(make(name))>>(
        make(name));
}

/** Takes any number of values of a single key rule

    @par Example
    @code
    auto p = set( regexp( make_pattern( "[a-z]+" ), "$0", "tag" ) );
    @endcode
*/
template<param_rule Rule>
set_rule<Rule>
set(Rule inner)
{
    return set_rule<Rule>(std::move(inner));
}

//------------------------------------------------

/** Rule for a list of parameter groups

    Element `i` uses the keys of the inner rule
    prefixed by `<name>.<i>.`, which keeps the
    fields of each element together. Elements are
    decoded in increasing index order.

    @par Value Type
    @code
    using value_type = std::vector< Rule::value_type >;
    @endcode

    @see @ref list.
*/
template<param_rule Rule>
class list_rule
{
    static_assert(
        Rule::suffix_type == suffix_kind::none,
        "a list cannot take a suffix");

    std::string name_;
    Rule inner_;
    shape_ptr shape_;

public:
    using value_type = std::vector<
        typename Rule::value_type>;
    using names_type = list_names<Rule>;
    static constexpr suffix_kind suffix_type = suffix_kind::none;
    static constexpr bool is_one = false;
    static constexpr bool is_single_key = false;

    list_rule(
        core::string_view name,
        Rule inner)
        : name_(name)
        , inner_(std::move(inner))
    {
        detail::check_name(name);
        shape_ = make_shape(param_shape::list_node{
            name_, inner_.shape() });
    }

    shape_ptr const&
    shape() const noexcept
    {
        return shape_;
    }

    std::size_t
    anonymous_count() const noexcept
    {
        return 0;
    }

    void
    encode(
        value_type const& v,
        encoder& e,
        name_generator const& g) const
    {
        for(std::size_t i = 0; i < v.size(); ++i)
            inner_.encode(v[i], e, g.nest(name_, i));
    }

    decode_result<value_type>
    decode(
        decoder& d,
        name_generator const& g) const
    {
        std::string key = g.key(name_);
        auto const indices = d.list_indices(key + ".");
        if(indices.size() > d.config().max_list_size)
            return param_error(
                BOOST_WEBPARAMS_ERR(
                    error::list_too_long),
                std::move(key));
        value_type v;
        v.reserve(indices.size());
        for(auto i : indices)
        {
            auto r = inner_.decode(d, g.nest(name_, i));
            if(! r)
                return r.error();
            v.push_back(std::move(*r));
        }
        return v;
    }

    names_type
    names(name_generator const& g) const
    {
        return names_type(inner_, name_, g);
    }
};

/** Takes a list of parameters

    @par Example
    @code
    // handler receives std::vector< std::pair< int, std::string > >
    auto p = list( "l", prod( int_( "a" ), string( "b" ) ) );
    @endcode
*/
template<param_rule Rule>
list_rule<Rule>
list(
    core::string_view name,
    Rule inner)
{
    return list_rule<Rule>(name, std::move(inner));
}

//------------------------------------------------

/** Rule prepending a prefix to every key

    @see @ref add_prefix.
*/
template<param_rule Rule>
class prefix_rule
{
    std::string prefix_;
    Rule inner_;
    shape_ptr shape_;

public:
    using value_type = typename Rule::value_type;
    using names_type = typename Rule::names_type;
    static constexpr suffix_kind suffix_type = Rule::suffix_type;
    static constexpr bool is_one = Rule::is_one;
    static constexpr bool is_single_key = Rule::is_single_key;

    prefix_rule(
        core::string_view prefix,
        Rule inner)
        : prefix_(prefix)
        , inner_(std::move(inner))
    {
        detail::check_prefix(prefix_, *inner_.shape());
        shape_ = make_shape(param_shape::prefix_node{
            prefix_, inner_.shape() });
    }

    shape_ptr const&
    shape() const noexcept
    {
        return shape_;
    }

    std::size_t
    anonymous_count() const noexcept
    {
        return inner_.anonymous_count();
    }

    void
    encode(
        value_type const& v,
        encoder& e,
        name_generator const& g) const
    {
        inner_.encode(v, e, g.prefixed(prefix_));
    }

    decode_result<value_type>
    decode(
        decoder& d,
        name_generator const& g) const
    {
        return inner_.decode(d, g.prefixed(prefix_));
    }

    bool
    present(
        decoder const& d,
        name_generator const& g) const
        requires Rule::is_one
    {
        return inner_.present(d, g.prefixed(prefix_));
    }

    names_type
    names(name_generator const& g) const
    {
        return inner_.names(g.prefixed(prefix_));
    }
};

/** Prefix the keys of every parameter

    @par Example
    @code
    // keys are "p.a" and "p.b"
    auto p = add_prefix( "p.", prod( int_( "a" ), int_( "b" ) ) );
    @endcode
*/
template<param_rule Rule>
prefix_rule<Rule>
add_prefix(
    core::string_view prefix,
    Rule inner)
{
    return prefix_rule<Rule>(prefix, std::move(inner));
}

} // webparams
} // boost

#endif
