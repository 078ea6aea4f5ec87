//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_TYPES_HPP
#define BOOST_WEBPARAMS_TYPES_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/variant2.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace boost {
namespace webparams {

/** A flat, ordered sequence of key/value pairs

    This is the wire representation of GET and POST
    parameters. Keys may repeat.
*/
using param_list = std::vector<
    std::pair<std::string, std::string>>;

/** Path segments following the prefix of a service
*/
using segment_list = std::vector<std::string>;

/** Metadata of an uploaded file
*/
struct file_info
{
    /// Where the server stored the upload
    std::string tmp_filename;

    /// Size of the stored file in bytes
    std::uint64_t filesize = 0;

    /// Filename as sent by the client, possibly with a path
    std::string raw_original_filename;

    /// Filename as sent by the client, without any path
    std::string original_basename;

    /// Media type sent by the client, if any
    std::string content_type;

    friend
    bool
    operator==(
        file_info const&,
        file_info const&) = default;
};

/** Uploaded files keyed by parameter name
*/
using file_list = std::vector<
    std::pair<std::string, file_info>>;

/** The point where an image input was clicked
*/
struct image_coordinates
{
    int abscissa = 0;
    int ordinate = 0;

    friend
    bool
    operator==(
        image_coordinates const&,
        image_coordinates const&) = default;
};

/** The value of a parameter which takes no parameters
*/
using unit_value = variant2::monostate;

/** The value of a binary sum of parameters

    Index 0 holds the first alternative and index 1
    the second. When both alternatives have the same
    type, use `variant2::in_place_index` to choose.
*/
template<class T1, class T2>
using binsum = variant2::variant<T1, T2>;

/** Return a sum holding its first alternative
*/
template<class T2, class T1>
binsum<T1, T2>
inj1(T1 v)
{
    return binsum<T1, T2>(
        variant2::in_place_index_t<0>(),
        std::move(v));
}

/** Return a sum holding its second alternative
*/
template<class T1, class T2>
binsum<T1, T2>
inj2(T2 v)
{
    return binsum<T1, T2>(
        variant2::in_place_index_t<1>(),
        std::move(v));
}

} // webparams
} // boost

#endif
