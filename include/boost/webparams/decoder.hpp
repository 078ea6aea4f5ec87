//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_DECODER_HPP
#define BOOST_WEBPARAMS_DECODER_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/webparams/config.hpp>
#include <boost/webparams/types.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace boost {
namespace webparams {

/** The working state of a parameter decoding

    The decoder owns a private copy of the incoming
    pairs, files and path segments. Parameter
    combinators remove what they recognize, so that
    sibling subtrees never see entries which were
    already claimed.
*/
class decoder
{
    param_list params_;
    file_list files_;
    segment_list segments_;
    std::size_t pos_ = 0;
    reconstruct_config cfg_;

public:
    BOOST_WEBPARAMS_DECL
    decoder(
        param_list params,
        file_list files,
        segment_list segments,
        reconstruct_config const& cfg = {});

    /// Return the configuration
    reconstruct_config const&
    config() const noexcept
    {
        return cfg_;
    }

    /// Return true if a pair with the key remains
    BOOST_WEBPARAMS_DECL
    bool
    contains(core::string_view key) const noexcept;

    /** Remove the first pair with the key

        @return The value, or an empty optional
        if no pair has the key.
    */
    BOOST_WEBPARAMS_DECL
    boost::optional<std::string>
    take(core::string_view key);

    /// Return true if a file with the key remains
    BOOST_WEBPARAMS_DECL
    bool
    contains_file(core::string_view key) const noexcept;

    /// Remove the first file with the key
    BOOST_WEBPARAMS_DECL
    boost::optional<file_info>
    take_file(core::string_view key);

    /** Return the list indices present under a prefix

        A remaining key `<prefix><i>.<rest>`, where
        `<i>` is a decimal number without leading
        zeros, contributes the index `i`. The result
        is sorted and has no duplicates.

        @param prefix The list key followed by a dot.
    */
    BOOST_WEBPARAMS_DECL
    std::vector<std::size_t>
    list_indices(core::string_view prefix) const;

    /// Remove and return every remaining pair
    BOOST_WEBPARAMS_DECL
    param_list
    take_all();

    /// Remove and return the next path segment
    BOOST_WEBPARAMS_DECL
    boost::optional<std::string>
    next_segment();

    /// Remove and return every remaining path segment
    BOOST_WEBPARAMS_DECL
    segment_list
    take_segments();

    /// Return true if path segments remain
    bool
    has_segments() const noexcept
    {
        return pos_ < segments_.size();
    }

    /// Return the pairs not claimed so far
    param_list const&
    remaining() const noexcept
    {
        return params_;
    }
};

} // webparams
} // boost

#endif
