//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_CODEC_HPP
#define BOOST_WEBPARAMS_CODEC_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/webparams/error.hpp>
#include <boost/webparams/pattern.hpp>
#include <boost/webparams/shape.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <cstdint>
#include <exception>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>

namespace boost {
namespace webparams {

namespace detail {

BOOST_WEBPARAMS_DECL
std::string
format_int(std::int64_t v);

BOOST_WEBPARAMS_DECL
system::result<std::int64_t>
parse_int(
    core::string_view s,
    std::int64_t min,
    std::int64_t max) noexcept;

// fixed notation, shortest exact representation
BOOST_WEBPARAMS_DECL
std::string
format_float(double v);

BOOST_WEBPARAMS_DECL
system::result<double>
parse_float(core::string_view s) noexcept;

template<class T>
system::result<T>
parse_integral(core::string_view s) noexcept
{
    auto rv = parse_int(s,
        (std::numeric_limits<T>::min)(),
        (std::numeric_limits<T>::max)());
    if(! rv)
        return rv.error();
    return static_cast<T>(*rv);
}

template<class R>
struct unwrap_result
{
    using type = R;
    static constexpr bool is_result = false;
};

template<class U>
struct unwrap_result<system::result<U>>
{
    using type = U;
    static constexpr bool is_result = true;
};

} // detail

/** Converts parameter values to and from strings

    A codec is a value type with these members:

    @code
    using value_type = ...;
    static constexpr param_kind kind = ...;
    std::string to_string( value_type const& ) const;
    system::result< value_type > from_string( core::string_view ) const;
    @endcode
*/

struct int_codec
{
    using value_type = int;
    static constexpr param_kind kind = param_kind::int_;

    std::string
    to_string(int v) const
    {
        return detail::format_int(v);
    }

    system::result<int>
    from_string(core::string_view s) const noexcept
    {
        return detail::parse_integral<int>(s);
    }
};

struct int32_codec
{
    using value_type = std::int32_t;
    static constexpr param_kind kind = param_kind::int32;

    std::string
    to_string(std::int32_t v) const
    {
        return detail::format_int(v);
    }

    system::result<std::int32_t>
    from_string(core::string_view s) const noexcept
    {
        return detail::parse_integral<std::int32_t>(s);
    }
};

struct int64_codec
{
    using value_type = std::int64_t;
    static constexpr param_kind kind = param_kind::int64;

    std::string
    to_string(std::int64_t v) const
    {
        return detail::format_int(v);
    }

    system::result<std::int64_t>
    from_string(core::string_view s) const noexcept
    {
        return detail::parse_integral<std::int64_t>(s);
    }
};

struct float_codec
{
    using value_type = double;
    static constexpr param_kind kind = param_kind::float_;

    std::string
    to_string(double v) const
    {
        return detail::format_float(v);
    }

    system::result<double>
    from_string(core::string_view s) const noexcept
    {
        return detail::parse_float(s);
    }
};

struct string_codec
{
    using value_type = std::string;
    static constexpr param_kind kind = param_kind::string;

    std::string
    to_string(std::string const& v) const
    {
        return v;
    }

    system::result<std::string>
    from_string(core::string_view s) const
    {
        return std::string(s);
    }
};

/** A codec built from a pair of user functions

    `OfString` is invoked with a `core::string_view`.
    It either returns `system::result<T>`, or returns
    `T` and reports failure by throwing an exception
    derived from `std::exception`. Exceptions of any
    other type are not a decoding failure and
    propagate to the caller.
*/
template<class OfString, class ToString>
class user_codec
{
    using result_traits = detail::unwrap_result<
        std::decay_t<std::invoke_result_t<
            OfString const&, core::string_view>>>;

    OfString of_;
    ToString to_;

public:
    using value_type = typename result_traits::type;
    static constexpr param_kind kind = param_kind::user;

    user_codec(
        OfString of,
        ToString to)
        : of_(std::move(of))
        , to_(std::move(to))
    {
    }

    std::string
    to_string(value_type const& v) const
    {
        return std::string(to_(v));
    }

    system::result<value_type>
    from_string(core::string_view s) const
    {
        if constexpr(result_traits::is_result)
        {
            auto rv = of_(s);
            if(! rv)
                return BOOST_WEBPARAMS_ERR(
                    error::invalid_parameter_value);
            return std::move(*rv);
        }
        else
        {
            try
            {
                return value_type(of_(s));
            }
            catch(std::exception const&)
            {
                return BOOST_WEBPARAMS_ERR(
                    error::invalid_parameter_value);
            }
        }
    }
};

/** A string codec validated by a regular expression

    Decoding rewrites the value using the template,
    see @ref rewrite. Encoding emits the value as is,
    unless `rewrite_on_encode` is set, in which case
    a matching value is rewritten first.
*/
class regexp_codec
{
    pattern_ptr p_;
    std::string templ_;
    bool rewrite_on_encode_;

public:
    using value_type = std::string;
    static constexpr param_kind kind = param_kind::regexp;

    regexp_codec(
        pattern_ptr p,
        core::string_view templ,
        bool rewrite_on_encode = false)
        : p_(std::move(p))
        , templ_(templ)
        , rewrite_on_encode_(rewrite_on_encode)
    {
    }

    BOOST_WEBPARAMS_DECL
    std::string
    to_string(std::string const& v) const;

    BOOST_WEBPARAMS_DECL
    system::result<std::string>
    from_string(core::string_view s) const;
};

} // webparams
} // boost

#endif
