//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

// Test that header file is self-contained.
#include <boost/webparams/query.hpp>

#include <boost/webparams/combinators.hpp>
#include <boost/webparams/construct.hpp>
#include <boost/webparams/leaf.hpp>
#include <boost/webparams/reconstruct.hpp>

#include "test_suite.hpp"

namespace boost {
namespace webparams {

struct query_test
{
    void
    testEncodeParams()
    {
        BOOST_TEST_EQ(encode_params({}), "");
        BOOST_TEST_EQ(encode_params({ { "a", "1" } }), "a=1");
        BOOST_TEST_EQ(encode_params({
            { "a b", "x&y" }, { "k", "\xc3\xa9" }, { "e", "" } }),
            "a%20b=x%26y&k=%C3%A9&e=");
        BOOST_TEST_EQ(encode_params({ { "l.0.a", "1+1=2" } }),
            "l.0.a=1%2B1%3D2");
    }

    void
    testParseParams()
    {
        BOOST_TEST(parse_params("").value().empty());
        BOOST_TEST((parse_params("a=1&b=x+y&c=%41").value() == param_list{
            { "a", "1" }, { "b", "x y" }, { "c", "A" } }));
        BOOST_TEST((parse_params("b=x+y", false).value() == param_list{
            { "b", "x+y" } }));
        BOOST_TEST((parse_params("a&b=").value() == param_list{
            { "a", "" }, { "b", "" } }));
        BOOST_TEST((parse_params("a=1&&a=2").value() == param_list{
            { "a", "1" }, { "a", "2" } }));
        BOOST_TEST(parse_params("a=%zz").has_error());
    }

    void
    testParamsRoundTrip()
    {
        param_list const v = {
            { "__sum.0", "2" }, { "s", "a b&c=d%" }, { "s", "" } };
        BOOST_TEST(parse_params(encode_params(v)).value() == v);

        auto const p = prod(int_("n"), set(string, "s"));
        auto const x = std::make_pair(3, std::vector<std::string>{
            "hello world", "+", "\xe2\x82\xac" });
        auto const q = construct_params_string(p, x);
        BOOST_TEST(reconstruct(p, parse_params(q).value()).value() == x);
    }

    void
    testSuffix()
    {
        BOOST_TEST_EQ(encode_suffix({}), "");
        BOOST_TEST_EQ(encode_suffix({ "a b", "c/d", "" }), "a%20b/c%2Fd/");
        BOOST_TEST_EQ(encode_suffix({ "x:y@z" }), "x:y@z");

        BOOST_TEST(parse_suffix("").value().empty());
        BOOST_TEST((parse_suffix("a%20b/c%2Fd/").value() ==
            segment_list{ "a b", "c/d", "" }));
        BOOST_TEST((parse_suffix("/x/y").value() ==
            segment_list{ "x", "y" }));
        BOOST_TEST((parse_suffix("a+b").value() ==
            segment_list{ "a+b" }));
        BOOST_TEST(parse_suffix("a%2").has_error());
    }

    void
    testRemovePrefixed()
    {
        param_list const v = {
            { "p.a", "1" }, { "q", "2" }, { "p.b", "3" }, { "p", "4" } };
        BOOST_TEST((remove_prefixed_param("p.", v) == param_list{
            { "q", "2" }, { "p", "4" } }));
        BOOST_TEST(remove_prefixed_param("", v).empty());
        BOOST_TEST(remove_prefixed_param("z", v) == v);
    }

    void
    run()
    {
        testEncodeParams();
        testParseParams();
        testParamsRoundTrip();
        testSuffix();
        testRemovePrefixed();
    }
};

TEST_SUITE(
    query_test,
    "boost.webparams.query");

} // webparams
} // boost
