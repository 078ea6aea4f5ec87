//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_SUFFIX_HPP
#define BOOST_WEBPARAMS_SUFFIX_HPP

#include <boost/webparams/detail/config.hpp>
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

/** Rule reading its parameters from the path suffix

    Each leaf of the inner rule takes one path
    segment, in order. The inner rule may end with
    one of the `all_suffix` rules, which takes the
    segments that are left.

    @see @ref suffix.
*/
template<param_rule Rule>
class suffix_rule
{
    static_assert(
        Rule::suffix_type != suffix_kind::with,
        "a suffix cannot contain another suffix");

    Rule inner_;
    shape_ptr shape_;

public:
    using value_type = typename Rule::value_type;
    using names_type = typename Rule::names_type;
    static constexpr suffix_kind suffix_type = suffix_kind::with;
    static constexpr bool is_one = false;
    static constexpr bool is_single_key = false;

    explicit
    suffix_rule(Rule inner)
        : inner_(std::move(inner))
    {
        detail::check_suffix(*inner_.shape());
        shape_ = make_shape(param_shape::suffix_node{
            inner_.shape() });
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
        inner_.encode(v, e, g.suffix_mode());
    }

    decode_result<value_type>
    decode(
        decoder& d,
        name_generator const& g) const
    {
        return inner_.decode(d, g.suffix_mode());
    }

    names_type
    names(name_generator const& g) const
    {
        return inner_.names(g);
    }
};

/** Takes parameters from the path suffix

    The service answers to every URL which starts
    with its path, and the remaining segments are
    decoded into the value.

    @par Example
    @code
    // "/blog/2024/hello" gives std::pair< int, std::string >( 2024, "hello" )
    auto p = suffix( prod( int_( "year" ), string( "slug" ) ) );
    @endcode

    @throws system::system_error with
    @ref error::invalid_param_shape if the inner
    rule cannot be read from path segments.
*/
template<param_rule Rule>
suffix_rule<Rule>
suffix(Rule inner)
{
    return suffix_rule<Rule>(std::move(inner));
}

//------------------------------------------------

/** Rule for a suffix followed by regular parameters

    @par Value Type
    @code
    using value_type = std::pair< Suffix::value_type, Rule::value_type >;
    @endcode

    @see @ref suffix_prod.
*/
template<param_rule Suffix, param_rule Rule>
class suffix_prod_rule
{
    static_assert(
        Suffix::suffix_type == suffix_kind::with,
        "the first element must be a suffix");
    static_assert(
        Rule::suffix_type == suffix_kind::none,
        "only one suffix is allowed");

    Suffix suffix_;
    Rule rule_;
    shape_ptr shape_;

public:
    using value_type = std::pair<
        typename Suffix::value_type,
        typename Rule::value_type>;
    using names_type = std::pair<
        typename Suffix::names_type,
        typename Rule::names_type>;
    static constexpr suffix_kind suffix_type = suffix_kind::with;
    static constexpr bool is_one = false;
    static constexpr bool is_single_key = false;

    suffix_prod_rule(
        Suffix s,
        Rule r)
        : suffix_(std::move(s))
        , rule_(std::move(r))
    {
        detail::check_disjoint(
            *suffix_.shape(), *rule_.shape());
        shape_ = make_shape(param_shape::product_node{
            suffix_.shape(), rule_.shape() });
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
            suffix_.anonymous_count() +
            rule_.anonymous_count();
    }

    void
    encode(
        value_type const& v,
        encoder& e,
        name_generator const& g) const
    {
        suffix_.encode(v.first, e, g);
        rule_.encode(v.second, e,
            g.advance(suffix_.anonymous_count()));
    }

    decode_result<value_type>
    decode(
        decoder& d,
        name_generator const& g) const
    {
        auto r1 = suffix_.decode(d, g);
        if(! r1)
            return r1.error();
        auto r2 = rule_.decode(d,
            g.advance(suffix_.anonymous_count()));
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
            suffix_.names(g),
            rule_.names(g.advance(
                suffix_.anonymous_count())));
    }
};

/** Takes a path suffix and regular parameters

    @par Example
    @code
    // "/wiki/Main_Page?action=edit"
    auto p = suffix_prod(
        suffix( all_suffix_string( "page" ) ),
        string( "action" ) );
    @endcode
*/
template<param_rule Suffix, param_rule Rule>
suffix_prod_rule<Suffix, Rule>
suffix_prod(
    Suffix s,
    Rule r)
{
    return suffix_prod_rule<Suffix, Rule>(
        std::move(s), std::move(r));
}

//------------------------------------------------

/** Rule taking every remaining path segment

    @par Value Type
    @code
    using value_type = segment_list;
    @endcode

    @see @ref all_suffix.
*/
class all_suffix_rule
{
    std::string name_;
    shape_ptr shape_;

public:
    using value_type = segment_list;
    using names_type = param_name<segment_list>;
    static constexpr suffix_kind suffix_type = suffix_kind::end;
    static constexpr bool is_one = false;
    static constexpr bool is_single_key = false;

    explicit
    all_suffix_rule(core::string_view name)
        : name_(name)
    {
        detail::check_name(name);
        shape_ = make_shape(param_shape::leaf_node{
            param_kind::all_suffix, name_ });
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
        name_generator const&) const
    {
        for(auto const& s : v)
            e.emit_segment(s);
    }

    decode_result<value_type>
    decode(
        decoder& d,
        name_generator const&) const
    {
        return d.take_segments();
    }

    names_type
    names(name_generator const& g) const
    {
        return names_type(g.key(name_));
    }
};

/** Takes the rest of the path as a list of segments

    Must appear inside @ref suffix, last.
*/
inline
all_suffix_rule
all_suffix(core::string_view name)
{
    return all_suffix_rule(name);
}

//------------------------------------------------

/** Rule taking the rest of the path as one string

    The remaining segments are joined with `/`
    and converted by the codec. Encoding splits
    the string back on `/`.
*/
template<class Codec, param_kind Kind>
class all_suffix_value_rule
{
    std::string name_;
    Codec codec_;
    shape_ptr shape_;

public:
    using value_type = typename Codec::value_type;
    using names_type = param_name<value_type>;
    static constexpr suffix_kind suffix_type = suffix_kind::end;
    static constexpr bool is_one = false;
    static constexpr bool is_single_key = false;

    explicit
    all_suffix_value_rule(
        core::string_view name,
        Codec codec = {})
        : name_(name)
        , codec_(std::move(codec))
    {
        detail::check_name(name);
        shape_ = make_shape(param_shape::leaf_node{
            Kind, name_ });
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
        name_generator const&) const
    {
        std::string const s = codec_.to_string(v);
        std::size_t pos = 0;
        for(;;)
        {
            auto const n = s.find('/', pos);
            if(n == std::string::npos)
            {
                e.emit_segment(s.substr(pos));
                break;
            }
            e.emit_segment(s.substr(pos, n - pos));
            pos = n + 1;
        }
    }

    decode_result<value_type>
    decode(
        decoder& d,
        name_generator const& g) const
    {
        std::string s;
        auto const segs = d.take_segments();
        for(std::size_t i = 0; i < segs.size(); ++i)
        {
            if(i > 0)
                s.push_back('/');
            s.append(segs[i]);
        }
        auto rv = codec_.from_string(s);
        if(! rv)
            return param_error(
                rv.error(),
                g.key(name_),
                std::move(s));
        return std::move(*rv);
    }

    names_type
    names(name_generator const& g) const
    {
        return names_type(g.key(name_));
    }
};

/** Takes the rest of the path as one string
*/
inline
all_suffix_value_rule<string_codec, param_kind::all_suffix_string>
all_suffix_string(core::string_view name)
{
    return all_suffix_value_rule<
        string_codec, param_kind::all_suffix_string>(name);
}

/** Takes the rest of the path as a user defined type

    @see @ref user_type.
*/
template<class OfString, class ToString>
all_suffix_value_rule<
    user_codec<OfString, ToString>,
    param_kind::all_suffix_user>
all_suffix_user(
    OfString of_string,
    ToString to_string,
    core::string_view name)
{
    return all_suffix_value_rule<
        user_codec<OfString, ToString>,
        param_kind::all_suffix_user>(
            name, user_codec<OfString, ToString>(
                std::move(of_string), std::move(to_string)));
}

/** Takes the rest of the path, checked by a regular expression

    Unlike @ref regexp, a value which matches the
    pattern is also rewritten when it is encoded.
*/
inline
all_suffix_value_rule<regexp_codec, param_kind::all_suffix_regexp>
all_suffix_regexp(
    pattern_ptr p,
    core::string_view templ,
    core::string_view name)
{
    return all_suffix_value_rule<
        regexp_codec, param_kind::all_suffix_regexp>(
            name, regexp_codec(std::move(p), templ, true));
}

} // webparams
} // boost

#endif
