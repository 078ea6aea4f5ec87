//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

// Test that header file is self-contained.
#include <boost/webparams/shape.hpp>

#include <boost/webparams/combinators.hpp>
#include <boost/webparams/construct.hpp>
#include <boost/webparams/coordinates.hpp>
#include <boost/webparams/leaf.hpp>
#include <boost/webparams/suffix.hpp>

#include "test_suite.hpp"

namespace boost {
namespace webparams {

struct shape_test
{
    void
    testKind()
    {
        BOOST_TEST(int_("a").shape()->kind() == param_kind::int_);
        BOOST_TEST(unit.shape()->kind() == param_kind::unit);
        BOOST_TEST(coordinates("c").shape()->kind() ==
            param_kind::coordinates);
        BOOST_TEST(prod(int_("a"), int_("b")).shape()->kind() ==
            param_kind::product);
        BOOST_TEST(all_suffix_string("s").shape()->kind() ==
            param_kind::all_suffix_string);
        BOOST_TEST_EQ(to_string(param_kind::float_), "float");
        BOOST_TEST_EQ(to_string(param_kind::option), "opt");
    }

    void
    testDescribe()
    {
        BOOST_TEST_EQ(describe(*unit.shape()), "unit");
        BOOST_TEST_EQ(describe(*prod(int_("a"), string("b")).shape()),
            "prod(int(\"a\"), string(\"b\"))");
        BOOST_TEST_EQ(describe(*list("l", prod(int_("a"), string("b"))).shape()),
            "list(\"l\", prod(int(\"a\"), string(\"b\")))");
        BOOST_TEST_EQ(describe(*opt(int_coordinates("c")).shape()),
            "opt(int_coordinates(\"c\"))");
        BOOST_TEST_EQ(describe(*sum(coordinates("c"), bool_("b")).shape()),
            "sum(coordinates(\"c\"), bool(\"b\"))");
        BOOST_TEST_EQ(describe(*add_prefix("p.", set(int_, "i")).shape()),
            "prefix(\"p.\", set(int(\"i\")))");
        BOOST_TEST_EQ(describe(*suffix(all_suffix("r")).shape()),
            "suffix(all_suffix(\"r\"))");
    }

    void
    testFingerprint()
    {
        auto const f = [](auto const& rule)
        {
            return fingerprint(rule);
        };

        // same shape, same fingerprint
        BOOST_TEST_EQ(
            f(list("l", prod(int_("a"), opt(string("b"))))),
            f(list("l", prod(int_("a"), opt(string("b"))))));
        BOOST_TEST_EQ(f(unit), f(unit));

        // names matter
        BOOST_TEST_NE(f(int_("a")), f(int_("b")));
        BOOST_TEST_NE(f(list("l", int_("a"))), f(list("m", int_("a"))));

        // kinds matter
        BOOST_TEST_NE(f(int_("a")), f(int32("a")));
        BOOST_TEST_NE(f(int_("a")), f(opt(int_("a"))));
        BOOST_TEST_NE(f(int_("a")), f(set(int_, "a")));
        BOOST_TEST_NE(
            f(prod(int_("a"), int_("b"))),
            f(sum(int_("a"), int_("b"))));
        BOOST_TEST_NE(f(coordinates("c")), f(int_coordinates("c")));
        BOOST_TEST_NE(f(unit), f(any));

        // structure matters
        BOOST_TEST_NE(
            f(prod(int_("a"), int_("b"))),
            f(prod(int_("b"), int_("a"))));
        BOOST_TEST_NE(
            f(prod(prod(int_("a"), int_("b")), int_("c"))),
            f(prod(int_("a"), prod(int_("b"), int_("c")))));
        BOOST_TEST_NE(
            f(add_prefix("ab", int_("c"))),
            f(add_prefix("a", int_("bc"))));
    }

    void
    testSharing()
    {
        // a rule shares the shapes of its parts
        auto const a = int_("a");
        auto const p = prod(a, string("b"));
        auto const& n = variant2::get<
            param_shape::product_node>(p.shape()->node());
        BOOST_TEST(n.first == a.shape());
    }

    void
    run()
    {
        testKind();
        testDescribe();
        testFingerprint();
        testSharing();
    }
};

TEST_SUITE(
    shape_test,
    "boost.webparams.shape");

} // webparams
} // boost
