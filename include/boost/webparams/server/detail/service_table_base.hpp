//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_SERVER_DETAIL_SERVICE_TABLE_BASE_HPP
#define BOOST_WEBPARAMS_SERVER_DETAIL_SERVICE_TABLE_BASE_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/webparams/config.hpp>
#include <boost/webparams/error.hpp>
#include <boost/webparams/server/service.hpp>
#include <boost/webparams/types.hpp>
#include <boost/optional.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace spdlog {
class logger;
} // spdlog

namespace boost {
namespace webparams {

/** A request, as seen by the service table
*/
struct request
{
    method_kind method = method_kind::get;

    /// The decoded path segments
    segment_list path;

    /// The query string pairs
    param_list get_params;

    /// The form body pairs
    param_list post_params;

    /// The uploaded files
    file_list files;
};

/** Options for a service table
*/
struct service_table_config
{
    /** Decoding options used for dispatch

        Unknown parameters are rejected, so that
        a request only reaches the service whose
        shape accounts for all of its pairs.
    */
    reconstruct_config reconstruct = { true, 1000 };

    /** The logger used for diagnostics

        When null, the spdlog default logger is used.
    */
    std::shared_ptr<spdlog::logger> logger;
};

namespace detail {

class BOOST_WEBPARAMS_SYMBOL_VISIBLE
    service_table_base
{
protected:
    struct service_info
    {
        segment_list path;
        boost::optional<std::string> state;
        std::string description;
        std::uint64_t get_fingerprint = 0;
        std::uint64_t post_fingerprint = 0;
        method_kind method = method_kind::get;
        bool suffix = false;
    };

    BOOST_WEBPARAMS_DECL
    explicit
    service_table_base(
        service_table_config cfg);

    BOOST_WEBPARAMS_DECL
    ~service_table_base();

    // throws invalid_param_shape on a duplicate
    BOOST_WEBPARAMS_DECL
    void
    insert(service_info info);

    // indices of the services which can answer,
    // auxiliary services first. Removes the state
    // pair from `params`.
    BOOST_WEBPARAMS_DECL
    std::vector<std::size_t>
    candidates(
        request const& req,
        param_list& params) const;

    BOOST_WEBPARAMS_DECL
    void
    log_rejected(
        std::size_t i,
        param_error const& e) const;

    BOOST_WEBPARAMS_DECL
    void
    log_unanswered(
        request const& req,
        param_error const& e) const;

    service_info const&
    info(std::size_t i) const noexcept
    {
        return infos_[i];
    }

    reconstruct_config const&
    decode_config() const noexcept
    {
        return cfg_.reconstruct;
    }

public:
    /// Return the number of registered services
    std::size_t
    size() const noexcept
    {
        return infos_.size();
    }

private:
    service_table_config cfg_;
    std::vector<service_info> infos_;
};

} // detail

/** Parse an origin-form request target

    Fills the path and the GET pairs of a
    request, for example from `/blog/2024?x=1`.
*/
BOOST_WEBPARAMS_DECL
system::result<request>
parse_request_target(core::string_view target);

} // webparams
} // boost

#endif
