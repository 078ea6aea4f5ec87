//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#include <boost/webparams/server/service_table.hpp>
#include <boost/webparams/detail/except.hpp>
#include <boost/webparams/query.hpp>
#include "src/detail/pct_decode.hpp"
#include <boost/url/parse.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace boost {
namespace webparams {

namespace {

char const*
method_string(method_kind m) noexcept
{
    return m == method_kind::post ? "POST" : "GET";
}

std::string
join_path(segment_list const& path)
{
    return "/" + encode_suffix(path);
}

// true if `path` starts with `prefix`
bool
path_matches(
    segment_list const& prefix,
    segment_list const& path,
    bool suffix) noexcept
{
    if(path.size() < prefix.size())
        return false;
    if(! suffix && path.size() != prefix.size())
        return false;
    return std::equal(
        prefix.begin(), prefix.end(), path.begin());
}

// remove the state pair, returning its value
boost::optional<std::string>
take_state(param_list& params)
{
    auto it = std::find_if(
        params.begin(), params.end(),
        [](auto const& p)
        {
            return p.first == state_key;
        });
    if(it == params.end())
        return boost::none;
    boost::optional<std::string> s(
        std::move(it->second));
    params.erase(it);
    return s;
}

} // (anon)

namespace detail {

service_table_base::
service_table_base(
    service_table_config cfg)
    : cfg_(std::move(cfg))
{
    if(! cfg_.logger)
        cfg_.logger = spdlog::default_logger();
}

service_table_base::
~service_table_base() = default;

void
service_table_base::
insert(service_info info)
{
    for(auto const& x : infos_)
    {
        if( x.path == info.path &&
            x.method == info.method &&
            x.state == info.state &&
            x.get_fingerprint == info.get_fingerprint &&
            x.post_fingerprint == info.post_fingerprint)
            throw_system_error(
                error::invalid_param_shape,
                "service already registered");
    }
    cfg_.logger->debug(
        "service {} {}{} registered, parameters {}",
        method_string(info.method),
        join_path(info.path),
        info.suffix ? "/..." : "",
        info.description);
    infos_.push_back(std::move(info));
}

std::vector<std::size_t>
service_table_base::
candidates(
    request const& req,
    param_list& params) const
{
    boost::optional<std::string> state;
    if(req.method == method_kind::post)
    {
        auto post = req.post_params;
        state = take_state(post);
    }
    else
    {
        state = take_state(params);
    }

    std::vector<std::size_t> v;
    if(state)
    {
        for(std::size_t i = 0; i < infos_.size(); ++i)
        {
            auto const& x = infos_[i];
            if( x.state == state &&
                x.method == req.method &&
                path_matches(x.path, req.path, x.suffix))
                v.push_back(i);
        }
    }
    for(std::size_t i = 0; i < infos_.size(); ++i)
    {
        auto const& x = infos_[i];
        if( ! x.state &&
            x.method == req.method &&
            path_matches(x.path, req.path, x.suffix))
            v.push_back(i);
    }
    return v;
}

void
service_table_base::
log_rejected(
    std::size_t i,
    param_error const& e) const
{
    auto const& x = infos_[i];
    cfg_.logger->debug(
        "service {} {} rejected the request: {}",
        method_string(x.method),
        join_path(x.path),
        e.message());
}

void
service_table_base::
log_unanswered(
    request const& req,
    param_error const& e) const
{
    cfg_.logger->info(
        "no service for {} {}: {}",
        method_string(req.method),
        join_path(req.path),
        e.message());
}

} // detail

system::result<request>
parse_request_target(core::string_view target)
{
    auto rv = urls::parse_origin_form(target);
    if(! rv)
        return rv.error();
    request req;
    for(auto seg : rv->encoded_segments())
        req.path.push_back(
            detail::pct_decode(seg, false));
    if(rv->has_query())
    {
        auto q = parse_params(
            rv->encoded_query(), true);
        if(! q)
            return q.error();
        req.get_params = std::move(*q);
    }
    return req;
}

} // webparams
} // boost
