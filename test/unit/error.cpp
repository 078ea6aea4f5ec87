//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

// Test that header file is self-contained.
#include <boost/webparams/error.hpp>

#include <boost/system/system_error.hpp>
#include <cstring>
#include <memory>

#include "test_suite.hpp"

namespace boost {
namespace webparams {

struct error_test
{
    void
    check(error e)
    {
        auto const ec = make_error_code(e);
        BOOST_TEST_EQ(std::strcmp(ec.category().name(),
            "boost.webparams"), 0);
        BOOST_TEST(! ec.message().empty());
        BOOST_TEST(ec.message() != "unknown");
        BOOST_TEST(std::addressof(ec.category()) ==
            std::addressof(make_error_code(e).category()));
    }

    void
    check(condition c, error e)
    {
        system::error_code ec = e;
        BOOST_TEST(ec == c);
    }

    void
    check_not(condition c, error e)
    {
        system::error_code ec = e;
        BOOST_TEST(ec != c);
    }

    void
    testCodes()
    {
        check(error::missing_parameter);
        check(error::invalid_parameter_value);
        check(error::regexp_mismatch);
        check(error::ambiguous_sum);
        check(error::file_field_error);
        check(error::unexpected_parameter);
        check(error::unexpected_suffix);
        check(error::list_too_long);
        check(error::invalid_param_shape);
        check(error::no_such_service);
    }

    void
    testConditions()
    {
        check(condition::wrong_parameters, error::missing_parameter);
        check(condition::wrong_parameters, error::invalid_parameter_value);
        check(condition::wrong_parameters, error::regexp_mismatch);
        check(condition::wrong_parameters, error::ambiguous_sum);
        check(condition::wrong_parameters, error::file_field_error);
        check(condition::wrong_parameters, error::unexpected_parameter);
        check(condition::wrong_parameters, error::unexpected_suffix);
        check(condition::wrong_parameters, error::list_too_long);
        check_not(condition::wrong_parameters, error::invalid_param_shape);
        check_not(condition::wrong_parameters, error::no_such_service);

        check(condition::invalid_value, error::invalid_parameter_value);
        check(condition::invalid_value, error::regexp_mismatch);
        check_not(condition::invalid_value, error::missing_parameter);
        check_not(condition::invalid_value, error::ambiguous_sum);
    }

    void
    testSourceLocation()
    {
        system::error_code ec = BOOST_WEBPARAMS_ERR(
            error::missing_parameter);
        BOOST_TEST(ec == error::missing_parameter);
#ifndef BOOST_WEBPARAMS_NO_SOURCE_LOCATION
        BOOST_TEST(ec.has_location());
#endif
    }

    void
    testParamError()
    {
        {
            param_error e;
            BOOST_TEST(! e.code());
            BOOST_TEST(e.name().empty());
            BOOST_TEST(e.value().empty());
        }
        {
            param_error e(error::missing_parameter, "age");
            BOOST_TEST_EQ(e.message(), "missing parameter: age");
        }
        {
            param_error e(error::invalid_parameter_value, "age", "abc");
            BOOST_TEST(e.code() == condition::invalid_value);
            BOOST_TEST_EQ(e.name(), "age");
            BOOST_TEST_EQ(e.value(), "abc");
            BOOST_TEST_EQ(e.message(),
                "invalid parameter value: age=\"abc\"");
        }
    }

    void
    testResult()
    {
        decode_result<int> r1 = 42;
        BOOST_TEST_EQ(r1.value(), 42);

        decode_result<int> r2 = param_error(
            error::ambiguous_sum, "__sum.0");
        BOOST_TEST(r2.has_error());
        BOOST_TEST_THROWS(r2.value(), system::system_error);
    }

    void
    run()
    {
        testCodes();
        testConditions();
        testSourceLocation();
        testParamError();
        testResult();
    }
};

TEST_SUITE(
    error_test,
    "boost.webparams.error");

} // webparams
} // boost
