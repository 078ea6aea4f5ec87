//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_CONFIG_HPP
#define BOOST_WEBPARAMS_CONFIG_HPP

#include <boost/webparams/detail/config.hpp>
#include <cstddef>

namespace boost {
namespace webparams {

/** Decoding configuration settings.

    @see @ref reconstruct,
         @ref decoder.
*/
struct reconstruct_config
{
    /** Reject parameters the shape does not claim.

        When set, pairs left over after a successful
        decode cause @ref error::unexpected_parameter.
    */
    bool reject_unknown_parameters = false;

    /** Maximum number of elements in one list.

        A list with more distinct indices fails with
        @ref error::list_too_long.
    */
    std::size_t max_list_size = 1000;
};

} // webparams
} // boost

#endif
