//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_COORDINATES_HPP
#define BOOST_WEBPARAMS_COORDINATES_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/webparams/codec.hpp>
#include <boost/webparams/param_name.hpp>
#include <boost/webparams/rule.hpp>
#include <boost/webparams/types.hpp>
#include <boost/core/detail/string_view.hpp>
#include <string>
#include <type_traits>
#include <utility>

namespace boost {
namespace webparams {

/** Codec placeholder for coordinates without a value
*/
struct no_companion
{
};

namespace detail {

template<class Codec>
struct coordinates_value
{
    using type = std::pair<
        typename Codec::value_type,
        image_coordinates>;
};

template<>
struct coordinates_value<no_companion>
{
    using type = image_coordinates;
};

template<class Codec>
constexpr param_kind companion_kind() noexcept
{
    if constexpr(std::is_same_v<Codec, no_companion>)
        return param_kind::unit;
    else
        return Codec::kind;
}

} // detail

/** Rule for the data sent by an image input

    A browser sends the point where the image was
    clicked as `name.x` and `name.y`. When the input
    carries a value, it is sent under `name` and the
    codec converts it.

    @par Value Type
    @code
    // Codec is no_companion
    using value_type = image_coordinates;

    // otherwise
    using value_type = std::pair< typename Codec::value_type, image_coordinates >;
    @endcode
*/
template<class Codec = no_companion>
class coordinates_rule
{
    static constexpr bool has_value =
        ! std::is_same_v<Codec, no_companion>;

    std::string name_;
    Codec codec_;
    shape_ptr shape_;

    std::string
    x_key(name_generator const& g) const
    {
        return g.key(name_) + ".x";
    }

    std::string
    y_key(name_generator const& g) const
    {
        return g.key(name_) + ".y";
    }

    static
    decode_result<int>
    take_int(
        decoder& d,
        std::string key)
    {
        auto s = d.take(key);
        if(! s)
            return param_error(
                BOOST_WEBPARAMS_ERR(
                    error::missing_parameter),
                std::move(key));
        auto rv = detail::parse_integral<int>(*s);
        if(! rv)
            return param_error(
                rv.error(),
                std::move(key),
                std::move(*s));
        return *rv;
    }

public:
    using value_type =
        typename detail::coordinates_value<Codec>::type;
    using names_type = param_name<value_type>;
    static constexpr suffix_kind suffix_type = suffix_kind::none;
    static constexpr bool is_one = true;
    static constexpr bool is_single_key = false;

    explicit
    coordinates_rule(
        core::string_view name,
        Codec codec = {})
        : name_(name)
        , codec_(std::move(codec))
    {
        detail::check_name(name);
        shape_ = make_shape(param_shape::coordinates_node{
            name_, detail::companion_kind<Codec>() });
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
        image_coordinates const* c;
        if constexpr(has_value)
        {
            e.emit(g.key(name_), codec_.to_string(v.first));
            c = &v.second;
        }
        else
        {
            c = &v;
        }
        e.emit(x_key(g), detail::format_int(c->abscissa));
        e.emit(y_key(g), detail::format_int(c->ordinate));
    }

    decode_result<value_type>
    decode(
        decoder& d,
        name_generator const& g) const
    {
        auto x = take_int(d, x_key(g));
        if(! x)
            return x.error();
        auto y = take_int(d, y_key(g));
        if(! y)
            return y.error();
        image_coordinates c{ *x, *y };
        if constexpr(has_value)
        {
            std::string key = g.key(name_);
            auto s = d.take(key);
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
            return value_type(std::move(*rv), c);
        }
        else
        {
            return c;
        }
    }

    bool
    present(
        decoder const& d,
        name_generator const& g) const
    {
        if( d.contains(x_key(g)) ||
            d.contains(y_key(g)))
            return true;
        return has_value &&
            d.contains(g.key(name_));
    }

    names_type
    names(name_generator const& g) const
    {
        return names_type(g.key(name_));
    }
};

/// Takes the coordinates of a click on an image input
inline
coordinates_rule<>
coordinates(core::string_view name)
{
    return coordinates_rule<>(name);
}

/// Takes the coordinates with a string value
inline
coordinates_rule<string_codec>
string_coordinates(core::string_view name)
{
    return coordinates_rule<string_codec>(name);
}

/// Takes the coordinates with an integer value
inline
coordinates_rule<int_codec>
int_coordinates(core::string_view name)
{
    return coordinates_rule<int_codec>(name);
}

/// Takes the coordinates with a 32 bits integer value
inline
coordinates_rule<int32_codec>
int32_coordinates(core::string_view name)
{
    return coordinates_rule<int32_codec>(name);
}

/// Takes the coordinates with a 64 bits integer value
inline
coordinates_rule<int64_codec>
int64_coordinates(core::string_view name)
{
    return coordinates_rule<int64_codec>(name);
}

/// Takes the coordinates with a floating point value
inline
coordinates_rule<float_codec>
float_coordinates(core::string_view name)
{
    return coordinates_rule<float_codec>(name);
}

/// Takes the coordinates with a value of a user defined type
template<class OfString, class ToString>
coordinates_rule<user_codec<OfString, ToString>>
user_type_coordinates(
    OfString of_string,
    ToString to_string,
    core::string_view name)
{
    return coordinates_rule<user_codec<OfString, ToString>>(
        name, user_codec<OfString, ToString>(
            std::move(of_string), std::move(to_string)));
}

} // webparams
} // boost

#endif
