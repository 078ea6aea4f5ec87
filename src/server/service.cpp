//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#include <boost/webparams/server/service.hpp>
#include <boost/webparams/error.hpp>
#include <atomic>

namespace boost {
namespace webparams {
namespace detail {

std::string
make_state()
{
    static std::atomic<std::size_t> counter{ 0 };
    return make_code(counter++);
}

segment_list
parse_service_path(core::string_view path)
{
    if(path.starts_with('/'))
        path.remove_prefix(1);
    auto rv = parse_suffix(path);
    if(! rv)
        throw_system_error(
            error::invalid_param_shape,
            "invalid service path");
    return std::move(*rv);
}

} // detail
} // webparams
} // boost
