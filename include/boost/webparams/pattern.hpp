//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_PATTERN_HPP
#define BOOST_WEBPARAMS_PATTERN_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace boost {
namespace webparams {

/** A compiled regular expression

    Regular expression parameters use this interface
    so that the engine can be replaced. The library
    provides an implementation based on RE2, returned
    by @ref make_pattern.
*/
class BOOST_WEBPARAMS_SYMBOL_VISIBLE
    pattern
{
public:
    virtual ~pattern() = default;

    /** Search for a match.

        @param s The subject string.

        @param pos The offset in `s` where the search starts.

        @param anchored If true, the match must start at `pos`.

        @param groups On success, holds one view into `s` per
        group, the whole match first. Groups which did not
        participate hold a default constructed view.

        @return true if a match was found.
    */
    virtual
    bool
    search(
        core::string_view s,
        std::size_t pos,
        bool anchored,
        std::vector<core::string_view>& groups) const = 0;
};

/// A shared, immutable pattern
using pattern_ptr = std::shared_ptr<pattern const>;

/** Compile a regular expression using RE2

    @throws system::system_error with
    @ref error::invalid_param_shape if the
    expression does not compile.
*/
BOOST_WEBPARAMS_DECL
pattern_ptr
make_pattern(core::string_view regex);

/** Rewrite a string matching a pattern

    The pattern must match at the start of `s`.
    Every non-overlapping match in `s` is then
    replaced by `templ`, where `$0` to `$9` stand
    for the groups of the match and `$$` stands
    for a dollar sign.

    @return The rewritten string, or an empty
    optional if `s` does not match.
*/
BOOST_WEBPARAMS_DECL
boost::optional<std::string>
rewrite(
    pattern const& p,
    core::string_view s,
    core::string_view templ);

} // webparams
} // boost

#endif
