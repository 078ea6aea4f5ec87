//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_ERROR_HPP
#define BOOST_WEBPARAMS_ERROR_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>
#include <string>

namespace boost {
namespace webparams {

/** Error codes returned by the parameter library
*/
enum class error
{
    /**
     * A required parameter is absent
     */
    missing_parameter = 1,

    /**
     * A present value could not be converted
     */
    invalid_parameter_value,

    /**
     * A value does not match its regular expression
     */
    regexp_mismatch,

    /**
     * The sum discriminator is absent or unknown
     */
    ambiguous_sum,

    /**
     * A file parameter is absent or malformed
     */
    file_field_error,

    /**
     * A parameter was not claimed by the shape
     */
    unexpected_parameter,

    /**
     * Path segments remain after the suffix was decoded
     */
    unexpected_suffix,

    /**
     * A list has more elements than allowed
     */
    list_too_long,

    /**
     * Combinators were composed incorrectly
     */
    invalid_param_shape,

    /**
     * No registered service matches the path
     */
    no_such_service
};

//------------------------------------------------

/** Error conditions corresponding to sets of error codes.
*/
enum class condition
{
    /**
     * The request parameters do not fit the service
     */
    wrong_parameters = 1,

    /**
     * A parameter was present but its value was rejected
     */
    invalid_value
};

//------------------------------------------------

/** Describes why a parameter could not be decoded.

    The error code is accompanied by the full key
    of the parameter involved and, when a value was
    present, the raw value as received.
*/
class param_error
{
    system::error_code ec_;
    std::string name_;
    std::string value_;

public:
    param_error() = default;

    param_error(
        system::error_code ec,
        std::string name = {},
        std::string value = {}) noexcept
        : ec_(ec)
        , name_(std::move(name))
        , value_(std::move(value))
    {
    }

    /// Return the error code
    system::error_code const&
    code() const noexcept
    {
        return ec_;
    }

    /// Return the key of the parameter involved
    std::string const&
    name() const noexcept
    {
        return name_;
    }

    /// Return the raw value, or an empty string
    std::string const&
    value() const noexcept
    {
        return value_;
    }

    /// Return a human readable description
    BOOST_WEBPARAMS_DECL
    std::string
    message() const;
};

/** The result of decoding parameters
*/
template<class T>
using decode_result = system::result<T, param_error>;

/** Throw the exception for a failed @ref decode_result

    This is found by argument-dependent lookup
    when `value()` is called on a failed result.
*/
BOOST_WEBPARAMS_DECL
BOOST_NORETURN
void
throw_exception_from_error(
    param_error const& e,
    source_location const& loc);

} // webparams
} // boost

#include <boost/webparams/impl/error.hpp>

#endif
