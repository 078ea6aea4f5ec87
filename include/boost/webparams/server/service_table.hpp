//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_SERVER_SERVICE_TABLE_HPP
#define BOOST_WEBPARAMS_SERVER_SERVICE_TABLE_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/webparams/server/detail/service_table_base.hpp>
#include <boost/webparams/server/service.hpp>
#include <boost/webparams/construct.hpp>
#include <boost/webparams/reconstruct.hpp>
#include <boost/webparams/shape.hpp>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace boost {
namespace webparams {

/** A set of services and their handlers

    Incoming requests are dispatched to the first
    service whose path matches and whose parameters
    decode. Auxiliary services named by the state
    in the request are tried before the others,
    then services are tried in registration order.

    @par Example
    @code
    service_table< std::string > t;
    t.add( make_service( "hello", string( "who" ) ),
        []( request const&, std::string const& who, unit_value )
        {
            return "Hello, " + who;
        });
    auto rv = t.dispatch( parse_request_target( "/hello?who=world" ).value() );
    @endcode

    @tparam R The type returned by handlers.
*/
template<class R>
class service_table
    : public detail::service_table_base
{
    static_assert(! std::is_void<R>::value,
        "handlers must return a value");

    struct handler
    {
        virtual ~handler() = default;

        virtual
        decode_result<R>
        invoke(
            request const& req,
            segment_list suffix,
            param_list get,
            reconstruct_config const& cfg) const = 0;
    };

    template<class Get, class Post, class H>
    struct handler_impl : handler
    {
        service<Get, Post> s;
        H h;

        handler_impl(
            service<Get, Post> s_,
            H h_)
            : s(std::move(s_))
            , h(std::move(h_))
        {
        }

        decode_result<R>
        invoke(
            request const& req,
            segment_list suffix,
            param_list get,
            reconstruct_config const& cfg) const override
        {
            auto gv = reconstruct(
                s.get_params(),
                std::move(get),
                {},
                std::move(suffix),
                cfg);
            if(! gv)
                return gv.error();
            param_list post;
            file_list files;
            if(s.method() == method_kind::post)
            {
                post = req.post_params;
                files = req.files;
                auto it = post.begin();
                while(it != post.end())
                {
                    if(it->first == state_key)
                        it = post.erase(it);
                    else
                        ++it;
                }
            }
            auto pv = reconstruct(
                s.post_params(),
                std::move(post),
                std::move(files),
                {},
                cfg);
            if(! pv)
                return pv.error();
            return R(h(req, *gv, *pv));
        }
    };

    std::vector<std::unique_ptr<handler>> handlers_;

public:
    /// Constructor
    explicit
    service_table(
        service_table_config cfg = {})
        : service_table_base(std::move(cfg))
    {
    }

    /** Register a service

        The handler is invoked as

        @code
        R( request const&, Get::value_type const&, Post::value_type const& );
        @endcode

        @throws system::system_error with
        @ref error::invalid_param_shape if a service
        with the same path, method, state and
        parameter shapes is already registered.
    */
    template<class Get, class Post, class H>
    void
    add(
        service<Get, Post> const& s,
        H h)
    {
        service_info si;
        si.path = s.path();
        si.state = s.state();
        si.method = s.method();
        si.suffix = contains_suffix(s.get_params());
        si.get_fingerprint = fingerprint(s.get_params());
        si.post_fingerprint = fingerprint(s.post_params());
        si.description = describe(*s.get_params().shape());
        if(s.method() == method_kind::post)
        {
            si.description += " / ";
            si.description += describe(*s.post_params().shape());
        }
        // infos_ and handlers_ must stay the same size
        auto p = std::make_unique<
            handler_impl<Get, Post, H>>(s, std::move(h));
        handlers_.reserve(handlers_.size() + 1);
        insert(std::move(si));
        handlers_.push_back(std::move(p));
    }

    /** Dispatch a request to its service

        @return The value returned by the handler,
        @ref error::no_such_service if no service
        has the path and method of the request, or
        else the error of the last service tried.
    */
    decode_result<R>
    dispatch(request const& req) const
    {
        param_list get = req.get_params;
        auto const v = candidates(req, get);
        if(v.empty())
        {
            param_error e(
                BOOST_WEBPARAMS_ERR(
                    error::no_such_service));
            log_unanswered(req, e);
            return e;
        }
        param_error last;
        for(auto i : v)
        {
            auto const& p = info(i).path;
            segment_list suffix(
                req.path.begin() + p.size(),
                req.path.end());
            auto rv = handlers_[i]->invoke(
                req, std::move(suffix), get,
                decode_config());
            if(rv)
                return rv;
            log_rejected(i, rv.error());
            last = std::move(rv.error());
        }
        log_unanswered(req, last);
        return last;
    }
};

} // webparams
} // boost

#endif
