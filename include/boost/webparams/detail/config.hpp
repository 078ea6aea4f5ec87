//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_DETAIL_CONFIG_HPP
#define BOOST_WEBPARAMS_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <boost/assert/source_location.hpp>
#include <stdint.h>

namespace boost {

namespace webparams {

//------------------------------------------------

# if (defined(BOOST_WEBPARAMS_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(BOOST_WEBPARAMS_STATIC_LINK)
#  if defined(BOOST_WEBPARAMS_SOURCE)
#   define BOOST_WEBPARAMS_DECL        BOOST_SYMBOL_EXPORT
#   define BOOST_WEBPARAMS_BUILD_DLL
#  else
#   define BOOST_WEBPARAMS_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  BOOST_WEBPARAMS_DECL
#  define BOOST_WEBPARAMS_DECL
# endif

#if defined(__MINGW32__)
    #define BOOST_WEBPARAMS_SYMBOL_VISIBLE BOOST_WEBPARAMS_DECL
#else
    #define BOOST_WEBPARAMS_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

//-----------------------------------------------

// Add source location to error codes
#ifdef BOOST_WEBPARAMS_NO_SOURCE_LOCATION
# define BOOST_WEBPARAMS_ERR(ev) (::boost::system::error_code(ev))
#else
# define BOOST_WEBPARAMS_ERR(ev) ( \
    ::boost::system::error_code( (ev), [] { \
    static constexpr auto loc((BOOST_CURRENT_LOCATION)); \
    return &loc; }()))
#endif

} // webparams

// lift grammar into our namespace
namespace urls {
namespace grammar {}
}
namespace webparams {
namespace grammar = ::boost::urls::grammar;
} // webparams

} // boost

#endif
