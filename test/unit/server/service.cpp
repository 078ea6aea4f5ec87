//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

// Test that header file is self-contained.
#include <boost/webparams/server/service.hpp>

#include <boost/webparams/combinators.hpp>
#include <boost/webparams/leaf.hpp>
#include <boost/webparams/suffix.hpp>
#include <boost/system/system_error.hpp>

#include "test_suite.hpp"

namespace boost {
namespace webparams {

struct service_test
{
    void
    testMakeService()
    {
        auto const s = make_service("/blog/archive", int_("page"));
        BOOST_TEST((s.path() == segment_list{ "blog", "archive" }));
        BOOST_TEST(s.method() == method_kind::get);
        BOOST_TEST(! s.state());

        BOOST_TEST(make_service("", unit).path().empty());
        BOOST_TEST_THROWS(make_service("a%zz", unit),
            system::system_error);
    }

    void
    testMakeUri()
    {
        auto const s = make_service("blog", int_("page"));
        BOOST_TEST_EQ(make_uri(s, 3), "/blog?page=3");

        auto const s2 = make_service("blog",
            suffix(prod(int_("year"), string("slug"))));
        BOOST_TEST_EQ(make_uri(s2, { 2024, "hello world" }),
            "/blog/2024/hello%20world");

        auto const s3 = make_service("",
            suffix_prod(suffix(all_suffix_string("page")), opt(string("q"))));
        BOOST_TEST_EQ(make_uri(s3, { "a/b", boost::none }), "/a/b");
        BOOST_TEST_EQ(make_uri(s3, { "a", std::string("x y") }),
            "/a?q=x%20y");

        BOOST_TEST_EQ(make_uri(make_service("", unit), {}), "/");
        BOOST_TEST_EQ(make_uri(make_service("a%20b", unit), {}), "/a%20b");
    }

    void
    testPostService()
    {
        auto const get = make_service("form", unit);
        auto const post = make_post_service(get,
            prod(string("name"), bool_("agree")));
        BOOST_TEST(post.method() == method_kind::post);
        BOOST_TEST(post.path() == get.path());
        BOOST_TEST_EQ(make_uri(post, {}), "/form");
        BOOST_TEST_EQ(make_post_body(post, { "Jo Doe", true }),
            "name=Jo%20Doe&agree=on");
    }

    void
    testAuxiliary()
    {
        auto const s = make_service("cart", int_("item"));
        auto const a1 = make_auxiliary_service(s);
        auto const a2 = make_auxiliary_service(s);
        BOOST_TEST(a1.state().has_value());
        BOOST_TEST(a2.state().has_value());
        BOOST_TEST(*a1.state() != *a2.state());
        BOOST_TEST(a1.path() == s.path());
        BOOST_TEST_EQ(make_uri(a1, 5),
            "/cart?item=5&__state=" + *a1.state());

        // the state of a POST service goes in the body
        auto const p = make_auxiliary_service(
            make_post_service(s, int_("qty")));
        BOOST_TEST_EQ(make_uri(p, 1), "/cart?item=1");
        BOOST_TEST_EQ(make_post_body(p, 2),
            "qty=2&__state=" + *p.state());
    }

    void
    run()
    {
        testMakeService();
        testMakeUri();
        testPostService();
        testAuxiliary();
    }
};

TEST_SUITE(
    service_test,
    "boost.webparams.server.service");

} // webparams
} // boost
