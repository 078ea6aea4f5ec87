//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_SERVER_SERVICE_HPP
#define BOOST_WEBPARAMS_SERVER_SERVICE_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/webparams/detail/except.hpp>
#include <boost/webparams/construct.hpp>
#include <boost/webparams/leaf.hpp>
#include <boost/webparams/name_generator.hpp>
#include <boost/webparams/query.hpp>
#include <boost/webparams/rule.hpp>
#include <boost/webparams/types.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional.hpp>
#include <string>
#include <utility>

namespace boost {
namespace webparams {

/** The request methods a service answers to
*/
enum class method_kind
{
    get,
    post
};

namespace detail {

// returns a code never returned before
// by this process, for auxiliary states
BOOST_WEBPARAMS_DECL
std::string
make_state();

// throws invalid_param_shape
BOOST_WEBPARAMS_DECL
segment_list
parse_service_path(core::string_view path);

} // detail

/** A typed entry point of a web application

    A service is a path together with the shape
    of the parameters it takes. GET parameters come
    from the query string and, when the GET rule
    has a suffix, from the path segments following
    the path. POST parameters come from the form
    body and the uploaded files.

    An auxiliary service is a copy of another
    service distinguished by a state, sent in the
    reserved key @ref state_key.

    @tparam Get The rule of the GET parameters.

    @tparam Post The rule of the POST parameters,
    @ref unit_rule for a GET service.
*/
template<param_rule Get, param_rule Post = unit_rule>
class service
{
    static_assert(
        Get::suffix_type != suffix_kind::end,
        "the rest of the path can only be taken inside a suffix");
    static_assert(
        Post::suffix_type == suffix_kind::none,
        "POST parameters cannot take a suffix");

    segment_list path_;
    Get get_;
    Post post_;
    method_kind method_;
    boost::optional<std::string> state_;

public:
    using get_rule = Get;
    using post_rule = Post;

    service(
        segment_list path,
        Get get,
        Post post,
        method_kind method)
        : path_(std::move(path))
        , get_(std::move(get))
        , post_(std::move(post))
        , method_(method)
    {
    }

    /// Return the path segments
    segment_list const&
    path() const noexcept
    {
        return path_;
    }

    /// Return the rule of the GET parameters
    Get const&
    get_params() const noexcept
    {
        return get_;
    }

    /// Return the rule of the POST parameters
    Post const&
    post_params() const noexcept
    {
        return post_;
    }

    /// Return the method
    method_kind
    method() const noexcept
    {
        return method_;
    }

    /// Return the state of an auxiliary service
    boost::optional<std::string> const&
    state() const noexcept
    {
        return state_;
    }

    /// Return a copy of this service with a state
    service
    with_state(std::string state) const
    {
        service s(*this);
        s.state_ = std::move(state);
        return s;
    }
};

/** Return a GET service

    @param path The path, such as `"blog/archive"`.

    @param get The rule of the query parameters.

    @throws system::system_error with
    @ref error::invalid_param_shape if the
    path is not valid.
*/
template<param_rule Get>
service<Get>
make_service(
    core::string_view path,
    Get get)
{
    return service<Get>(
        detail::parse_service_path(path),
        std::move(get), unit, method_kind::get);
}

/** Return a POST service attached to a GET service

    The POST service has the path and the GET
    parameters of `fallback`.
*/
template<param_rule Get, param_rule Post>
service<Get, Post>
make_post_service(
    service<Get> const& fallback,
    Post post)
{
    service<Get, Post> s(
        fallback.path(),
        fallback.get_params(),
        std::move(post),
        method_kind::post);
    if(fallback.state())
        return s.with_state(*fallback.state());
    return s;
}

/** Return an auxiliary service

    The service has the path, the method and the
    parameters of `fallback`, and a new state.
    Each call returns a distinct service.
*/
template<param_rule Get, param_rule Post>
service<Get, Post>
make_auxiliary_service(
    service<Get, Post> const& fallback)
{
    return fallback.with_state(
        detail::make_state());
}

/** Return the URI of a GET service called with a value

    The URI is the absolute path of the service,
    followed by the suffix and the query string.

    @par Example
    @code
    auto s = make_service( "blog", suffix( prod( int_( "year" ), string( "slug" ) ) ) );
    make_uri( s, { 2024, "hello world" } ); // "/blog/2024/hello%20world"
    @endcode
*/
template<param_rule Get, param_rule Post>
std::string
make_uri(
    service<Get, Post> const& s,
    typename Get::value_type const& v)
{
    auto c = construct(s.get_params(), v);
    if( s.state() &&
        s.method() == method_kind::get)
        c.params.emplace_back(
            std::string(state_key), *s.state());
    std::string u = "/";
    u.append(encode_suffix(s.path()));
    if(c.suffix && ! c.suffix->empty())
    {
        if(! s.path().empty())
            u.push_back('/');
        u.append(encode_suffix(*c.suffix));
    }
    if(! c.params.empty())
    {
        u.push_back('?');
        u.append(encode_params(c.params));
    }
    return u;
}

/** Return the form body of a POST service called with a value
*/
template<param_rule Get, param_rule Post>
std::string
make_post_body(
    service<Get, Post> const& s,
    typename Post::value_type const& v)
{
    auto c = construct(s.post_params(), v);
    if( s.state() &&
        s.method() == method_kind::post)
        c.params.emplace_back(
            std::string(state_key), *s.state());
    return encode_params(c.params);
}

} // webparams
} // boost

#endif
