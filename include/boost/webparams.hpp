//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_HPP
#define BOOST_WEBPARAMS_HPP

#include <boost/webparams/codec.hpp>
#include <boost/webparams/combinators.hpp>
#include <boost/webparams/config.hpp>
#include <boost/webparams/construct.hpp>
#include <boost/webparams/coordinates.hpp>
#include <boost/webparams/decoder.hpp>
#include <boost/webparams/encoder.hpp>
#include <boost/webparams/error.hpp>
#include <boost/webparams/leaf.hpp>
#include <boost/webparams/name_generator.hpp>
#include <boost/webparams/param_name.hpp>
#include <boost/webparams/pattern.hpp>
#include <boost/webparams/query.hpp>
#include <boost/webparams/reconstruct.hpp>
#include <boost/webparams/rule.hpp>
#include <boost/webparams/shape.hpp>
#include <boost/webparams/suffix.hpp>
#include <boost/webparams/types.hpp>

#include <boost/webparams/server/service.hpp>
#include <boost/webparams/server/service_table.hpp>

#endif
