//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_ENCODER_HPP
#define BOOST_WEBPARAMS_ENCODER_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/webparams/types.hpp>
#include <string>
#include <utility>

namespace boost {
namespace webparams {

/** Output of a parameter encoding

    Parameter combinators append key/value pairs
    and path segments in the order they are visited.
*/
class encoder
{
    param_list params_;
    segment_list suffix_;

public:
    /// Append a key/value pair
    void
    emit(
        std::string key,
        std::string value)
    {
        params_.emplace_back(
            std::move(key),
            std::move(value));
    }

    /// Append a path segment
    void
    emit_segment(std::string s)
    {
        suffix_.push_back(std::move(s));
    }

    /// Return the pairs emitted so far
    param_list&
    params() noexcept
    {
        return params_;
    }

    /// Return the path segments emitted so far
    segment_list&
    suffix() noexcept
    {
        return suffix_;
    }
};

} // webparams
} // boost

#endif
