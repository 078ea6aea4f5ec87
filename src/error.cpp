//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#include <boost/webparams/error.hpp>
#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>

namespace boost {
namespace webparams {

namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "boost.webparams";
}

std::string
error_cat_type::
message(int code) const
{
    return message(code, nullptr, 0);
}

char const*
error_cat_type::
message(
    int code,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(code))
    {
    case error::missing_parameter: return "missing parameter";
    case error::invalid_parameter_value: return "invalid parameter value";
    case error::regexp_mismatch: return "value does not match the regular expression";
    case error::ambiguous_sum: return "missing or unknown sum discriminator";
    case error::file_field_error: return "missing or malformed file parameter";
    case error::unexpected_parameter: return "unexpected parameter";
    case error::unexpected_suffix: return "unexpected path suffix";
    case error::list_too_long: return "list too long";
    case error::invalid_param_shape: return "invalid parameter shape";
    case error::no_such_service: return "no such service";
    default:
        return "unknown";
    }
}

//-----------------------------------------------

const char*
condition_cat_type::
name() const noexcept
{
    return "boost.webparams";
}

std::string
condition_cat_type::
message(int code) const
{
    return message(code, nullptr, 0);
}

char const*
condition_cat_type::
message(
    int code,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<condition>(code))
    {
    case condition::wrong_parameters: return "wrong parameters";
    case condition::invalid_value: return "invalid value";
    default:
        return "unknown";
    }
}

bool
condition_cat_type::
equivalent(
    system::error_code const& ec,
    int code) const noexcept
{
    if(ec.category() != error_cat)
        return false;
    switch(static_cast<condition>(code))
    {
    case condition::wrong_parameters:
        switch(static_cast<error>(ec.value()))
        {
        case error::missing_parameter:
        case error::invalid_parameter_value:
        case error::regexp_mismatch:
        case error::ambiguous_sum:
        case error::file_field_error:
        case error::unexpected_parameter:
        case error::unexpected_suffix:
        case error::list_too_long:
            return true;
        default:
            return false;
        }

    case condition::invalid_value:
        return
            ec == error::invalid_parameter_value ||
            ec == error::regexp_mismatch;

    default:
        return false;
    }
}

//-----------------------------------------------

// msvc 14.0 has a bug that warns about inability
// to use constexpr construction here, even though
// there's no constexpr construction
#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( push )
# pragma warning( disable : 4592 )
#endif

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
constinit condition_cat_type condition_cat;
#else
error_cat_type error_cat;
condition_cat_type condition_cat;
#endif

#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( pop )
#endif

} // detail

//-----------------------------------------------

std::string
param_error::
message() const
{
    std::string s = ec_.message();
    if(! name_.empty())
    {
        s.append(": ");
        s.append(name_);
    }
    if(! value_.empty())
    {
        s.append("=\"");
        s.append(value_);
        s.push_back('"');
    }
    return s;
}

void
throw_exception_from_error(
    param_error const& e,
    source_location const& loc)
{
    throw_exception(
        system::system_error(
            e.code(), e.message()), loc);
}

} // webparams
} // boost
