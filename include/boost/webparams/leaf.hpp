//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_LEAF_HPP
#define BOOST_WEBPARAMS_LEAF_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/webparams/detail/except.hpp>
#include <boost/webparams/codec.hpp>
#include <boost/webparams/param_name.hpp>
#include <boost/webparams/pattern.hpp>
#include <boost/webparams/rule.hpp>
#include <boost/webparams/types.hpp>
#include <boost/core/detail/string_view.hpp>
#include <string>
#include <utility>

namespace boost {
namespace webparams {

/** Rule for a service which takes no parameters

    @par Value Type
    @code
    using value_type = unit_value;
    @endcode

    @see @ref unit.
*/
struct unit_rule
{
    using value_type = unit_value;
    using names_type = unit_names;
    static constexpr suffix_kind suffix_type = suffix_kind::none;
    static constexpr bool is_one = false;
    static constexpr bool is_single_key = false;

    shape_ptr const&
    shape() const
    {
        static shape_ptr const s =
            make_shape(param_shape::unit_node{});
        return s;
    }

    std::size_t
    anonymous_count() const noexcept
    {
        return 0;
    }

    void
    encode(
        value_type const&,
        encoder&,
        name_generator const&) const noexcept
    {
    }

    decode_result<value_type>
    decode(
        decoder&,
        name_generator const&) const noexcept
    {
        return value_type();
    }

    names_type
    names(name_generator const&) const noexcept
    {
        return {};
    }
};

/// Used for services that don't take parameters
BOOST_INLINE_CONSTEXPR unit_rule unit{};

//------------------------------------------------

/** Rule taking every remaining parameter

    The value is the list of pairs, as received.

    @par Value Type
    @code
    using value_type = param_list;
    @endcode

    @see @ref any.
*/
struct any_rule
{
    using value_type = param_list;
    using names_type = unit_names;
    static constexpr suffix_kind suffix_type = suffix_kind::none;
    static constexpr bool is_one = false;
    static constexpr bool is_single_key = false;

    shape_ptr const&
    shape() const
    {
        static shape_ptr const s =
            make_shape(param_shape::any_node{});
        return s;
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
        name_generator const&) const
    {
        for(auto const& p : v)
            e.emit(p.first, p.second);
    }

    decode_result<value_type>
    decode(
        decoder& d,
        name_generator const&) const
    {
        return d.take_all();
    }

    names_type
    names(name_generator const&) const noexcept
    {
        return {};
    }
};

/** Takes any parameters

    The service answers to every request and
    receives all of its parameters.
*/
BOOST_INLINE_CONSTEXPR any_rule any{};

//------------------------------------------------

/** Rule for one named value converted by a codec

    Within a suffix, the value is read from the
    next path segment instead of a key.

    @par Value Type
    @code
    using value_type = typename Codec::value_type;
    @endcode
*/
template<class Codec>
class scalar_rule
{
    std::string name_;
    Codec codec_;
    shape_ptr shape_;

public:
    using value_type = typename Codec::value_type;
    using names_type = param_name<value_type>;
    static constexpr suffix_kind suffix_type = suffix_kind::none;
    static constexpr bool is_one = true;
    static constexpr bool is_single_key = true;

    explicit
    scalar_rule(
        core::string_view name,
        Codec codec = {})
        : name_(name)
        , codec_(std::move(codec))
    {
        detail::check_name(name);
        shape_ = make_shape(param_shape::leaf_node{
            Codec::kind, name_ });
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
        if(g.in_suffix())
            e.emit_segment(codec_.to_string(v));
        else
            e.emit(g.key(name_), codec_.to_string(v));
    }

    decode_result<value_type>
    decode(
        decoder& d,
        name_generator const& g) const
    {
        std::string key = g.key(name_);
        auto s = g.in_suffix() ?
            d.next_segment() : d.take(key);
        if(! s)
            return param_error(
                BOOST_WEBPARAMS_ERR(
                    error::missing_parameter),
                std::move(key));
        auto rv = codec_.from_string(*s);
        if(! rv)
            return param_error(
                rv.error(),
                std::move(key),
                std::move(*s));
        return std::move(*rv);
    }

    bool
    present(
        decoder const& d,
        name_generator const& g) const
    {
        return d.contains(g.key(name_));
    }

    names_type
    names(name_generator const& g) const
    {
        return names_type(g.key(name_));
    }
};

/// Takes an integer labeled `name`
inline
scalar_rule<int_codec>
int_(core::string_view name)
{
    return scalar_rule<int_codec>(name);
}

/// Takes a 32 bits integer labeled `name`
inline
scalar_rule<int32_codec>
int32(core::string_view name)
{
    return scalar_rule<int32_codec>(name);
}

/// Takes a 64 bits integer labeled `name`
inline
scalar_rule<int64_codec>
int64(core::string_view name)
{
    return scalar_rule<int64_codec>(name);
}

/// Takes a floating point number labeled `name`
inline
scalar_rule<float_codec>
float_(core::string_view name)
{
    return scalar_rule<float_codec>(name);
}

/// Takes a string labeled `name`
inline
scalar_rule<string_codec>
string(core::string_view name)
{
    return scalar_rule<string_codec>(name);
}

/** Takes a value of a user defined type

    `of_string` and `to_string` convert from
    and to the string sent on the wire. See
    @ref user_codec for the requirements.

    @par Example
    @code
    auto p = user_type(
        []( core::string_view s ) { return color_from_string( s ); },
        []( color c ) { return to_string( c ); },
        "color" );
    @endcode
*/
template<class OfString, class ToString>
scalar_rule<user_codec<OfString, ToString>>
user_type(
    OfString of_string,
    ToString to_string,
    core::string_view name)
{
    return scalar_rule<user_codec<OfString, ToString>>(
        name, user_codec<OfString, ToString>(
            std::move(of_string), std::move(to_string)));
}

/** Takes a string matching a regular expression

    The value received by the service is the
    string rewritten according to `templ`.

    @par Example
    @code
    // myparam=[hello] is received as "(hello)"
    auto p = regexp( make_pattern( "\\[(.*)\\]" ), "($1)", "myparam" );
    @endcode

    @see @ref rewrite.
*/
inline
scalar_rule<regexp_codec>
regexp(
    pattern_ptr p,
    core::string_view templ,
    core::string_view name)
{
    return scalar_rule<regexp_codec>(
        name, regexp_codec(std::move(p), templ));
}

//------------------------------------------------

/** Rule for a boolean, such as a checkbox

    `true` is sent as the key with the value `on`,
    and `false` is sent as nothing at all, so the
    value is `true` exactly when the key is present.
    A checkbox is already optional, so this rule
    cannot be wrapped in @ref opt.

    @see @ref bool_.
*/
class bool_rule
{
    std::string name_;
    shape_ptr shape_;

public:
    using value_type = bool;
    using names_type = param_name<bool>;
    static constexpr suffix_kind suffix_type = suffix_kind::none;
    static constexpr bool is_one = false;
    static constexpr bool is_single_key = false;

    explicit
    bool_rule(core::string_view name)
        : name_(name)
    {
        detail::check_name(name);
        shape_ = make_shape(param_shape::leaf_node{
            param_kind::bool_, name_ });
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
        bool v,
        encoder& e,
        name_generator const& g) const
    {
        if(v)
            e.emit(g.key(name_), "on");
    }

    decode_result<bool>
    decode(
        decoder& d,
        name_generator const& g) const
    {
        return d.take(g.key(name_)).has_value();
    }

    bool
    present(
        decoder const& d,
        name_generator const& g) const
    {
        return d.contains(g.key(name_));
    }

    names_type
    names(name_generator const& g) const
    {
        return names_type(g.key(name_));
    }
};

/// Takes a boolean labeled `name`
inline
bool_rule
bool_(core::string_view name)
{
    return bool_rule(name);
}

//------------------------------------------------

/** Rule for an uploaded file

    Files only exist in POST requests; encoding
    a file into a URL is not possible.

    @see @ref file.
*/
class file_rule
{
    std::string name_;
    shape_ptr shape_;

public:
    using value_type = file_info;
    using names_type = param_name<file_info>;
    static constexpr suffix_kind suffix_type = suffix_kind::none;
    static constexpr bool is_one = true;
    static constexpr bool is_single_key = true;

    explicit
    file_rule(core::string_view name)
        : name_(name)
    {
        detail::check_name(name);
        shape_ = make_shape(param_shape::leaf_node{
            param_kind::file, name_ });
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

    /** Throws `std::invalid_argument`
    */
    void
    encode(
        file_info const&,
        encoder&,
        name_generator const&) const
    {
        detail::throw_invalid_argument(
            "file parameters cannot be encoded");
    }

    decode_result<file_info>
    decode(
        decoder& d,
        name_generator const& g) const
    {
        std::string key = g.key(name_);
        auto f = d.take_file(key);
        if(! f)
            return param_error(
                BOOST_WEBPARAMS_ERR(
                    error::file_field_error),
                std::move(key));
        return std::move(*f);
    }

    bool
    present(
        decoder const& d,
        name_generator const& g) const
    {
        return d.contains_file(g.key(name_));
    }

    names_type
    names(name_generator const& g) const
    {
        return names_type(g.key(name_));
    }
};

/// Takes a file labeled `name`
inline
file_rule
file(core::string_view name)
{
    return file_rule(name);
}

} // webparams
} // boost

#endif
