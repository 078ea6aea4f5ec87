//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

// Test that header file is self-contained.
#include <boost/webparams/combinators.hpp>

#include <boost/webparams/construct.hpp>
#include <boost/webparams/coordinates.hpp>
#include <boost/webparams/leaf.hpp>
#include <boost/webparams/reconstruct.hpp>
#include <boost/system/system_error.hpp>
#include <algorithm>

#include "test_suite.hpp"

namespace boost {
namespace webparams {

struct combinators_test
{
    using int_string = std::pair<int, std::string>;

    static
    reconstruct_config
    strict()
    {
        reconstruct_config cfg;
        cfg.reject_unknown_parameters = true;
        return cfg;
    }

    void
    testProd()
    {
        auto const p = prod(int_("myvalue"), string("mystring"));
        auto c = construct(p, int_string(3, "x"));
        BOOST_TEST((c.params == param_list{
            { "myvalue", "3" }, { "mystring", "x" } }));

        // input order does not matter
        auto rv = reconstruct(p,
            { { "mystring", "y" }, { "myvalue", "7" } });
        BOOST_TEST(rv.value() == int_string(7, "y"));

        rv = reconstruct(p, { { "myvalue", "7" } });
        BOOST_TEST(rv.error().code() == error::missing_parameter);
        BOOST_TEST_EQ(rv.error().name(), "mystring");
    }

    void
    testProdDisjoint()
    {
        BOOST_TEST_THROWS(prod(int_("a"), string("a")),
            system::system_error);
        BOOST_TEST_THROWS(prod(int_("a"), prod(int_("b"), int_("a"))),
            system::system_error);
        BOOST_TEST_THROWS(prod(int_("l"), list("l", int_("a"))),
            system::system_error);
        BOOST_TEST_THROWS(prod(int_("l.0.a"), list("l", int_("a"))),
            system::system_error);
        BOOST_TEST_THROWS(prod(coordinates("c"), int_("c.x")),
            system::system_error);
        try
        {
            prod(int_("a"), int_("a"));
            BOOST_ERROR("exception expected");
        }
        catch(system::system_error const& e)
        {
            BOOST_TEST(e.code() == error::invalid_param_shape);
        }

        // these do not collide
        prod(int_("l"), list("ll", int_("a")));
        prod(int_("ab"), int_("a"));
        prod(add_prefix("p.", int_("a")), int_("a"));
    }

    void
    testKeyConsumption()
    {
        // the first side claims its key
        // before the second side runs
        auto const p = prod(int_("a"), any);
        auto rv = reconstruct(p,
            { { "b", "2" }, { "a", "1" }, { "a", "5" } });
        BOOST_TEST_EQ(rv.value().first, 1);
        BOOST_TEST((rv.value().second == param_list{
            { "b", "2" }, { "a", "5" } }));

        auto const p2 = prod(int_("a"), list("l", int_("a")));
        auto rv2 = reconstruct(p2,
            { { "l.0.a", "3" }, { "a", "1" } });
        BOOST_TEST_EQ(rv2.value().first, 1);
        BOOST_TEST(rv2.value().second == std::vector<int>{ 3 });
    }

    void
    testSum()
    {
        auto const p = sum(int_("a"), string("b"));
        using value = binsum<int, std::string>;

        auto c = construct(p, inj1<std::string>(5));
        BOOST_TEST((c.params == param_list{
            { "__sum.0", "1" }, { "a", "5" } }));
        c = construct(p, inj2<int>(std::string("x")));
        BOOST_TEST((c.params == param_list{
            { "__sum.0", "2" }, { "b", "x" } }));

        BOOST_TEST(reconstruct(p,
            { { "__sum.0", "2" }, { "b", "hi" } }).value() ==
            value(inj2<int>(std::string("hi"))));

        auto rv = reconstruct(p, { { "a", "1" } });
        BOOST_TEST(rv.error().code() == error::ambiguous_sum);
        BOOST_TEST_EQ(rv.error().name(), "__sum.0");

        rv = reconstruct(p, { { "__sum.0", "3" }, { "a", "1" } });
        BOOST_TEST(rv.error().code() == error::ambiguous_sum);
        BOOST_TEST_EQ(rv.error().value(), "3");

        // the selected side is missing
        rv = reconstruct(p, { { "__sum.0", "1" }, { "b", "x" } });
        BOOST_TEST(rv.error().code() == error::missing_parameter);
    }

    void
    testSumDiscriminator()
    {
        // only the selected side is read
        auto const p = sum(int_("a"), int_("b"));
        auto rv = reconstruct(p,
            { { "__sum.0", "1" }, { "a", "1" }, { "b", "oops" } });
        BOOST_TEST_EQ(rv.value().index(), 0u);
        BOOST_TEST_EQ(variant2::get<0>(rv.value()), 1);

        // the other side remains
        rv = reconstruct(p,
            { { "__sum.0", "1" }, { "a", "1" }, { "b", "oops" } },
            {}, {}, strict());
        BOOST_TEST(rv.error().code() == error::unexpected_parameter);
        BOOST_TEST_EQ(rv.error().name(), "b");

        // both sides may use the same keys
        auto const p2 = sum(int_("a"), string("a"));
        auto rv2 = reconstruct(p2,
            { { "__sum.0", "2" }, { "a", "x" } });
        BOOST_TEST_EQ(variant2::get<1>(rv2.value()), "x");
    }

    void
    testNestedSums()
    {
        auto const p = prod(
            sum(int_("a"), int_("b")),
            sum(int_("c"), int_("d")));
        using S = binsum<int, int>;
        auto const v = std::make_pair(
            S(variant2::in_place_index_t<1>(), 2),
            S(variant2::in_place_index_t<0>(), 3));
        auto c = construct(p, v);
        BOOST_TEST((c.params == param_list{
            { "__sum.0", "2" }, { "b", "2" },
            { "__sum.1", "1" }, { "c", "3" } }));
        BOOST_TEST(reconstruct(p, c.params).value() == v);

        auto const p2 = sum(
            sum(int_("a"), int_("b")),
            sum(int_("c"), int_("d")));
        using S2 = binsum<S, S>;
        S2 const v2(variant2::in_place_index_t<1>(),
            S(variant2::in_place_index_t<0>(), 9));
        auto c2 = construct(p2, v2);
        BOOST_TEST((c2.params == param_list{
            { "__sum.0", "2" }, { "__sum.2", "1" }, { "c", "9" } }));
        BOOST_TEST(reconstruct(p2, c2.params).value() == v2);
    }

    void
    testOpt()
    {
        auto const p = opt(int_("x"));
        BOOST_TEST(construct(p, boost::none).params.empty());
        BOOST_TEST((construct(p, boost::optional<int>(4)).params ==
            param_list{ { "x", "4" } }));

        BOOST_TEST(! reconstruct(p, {}).value());
        BOOST_TEST_EQ(*reconstruct(p, { { "x", "4" } }).value(), 4);

        // present but malformed is not absent
        auto rv = reconstruct(p, { { "x", "abc" } });
        BOOST_TEST(rv.error().code() == error::invalid_parameter_value);

        // regexp mismatch is an error too
        auto const p2 = opt(regexp(make_pattern("[0-9]+"), "$0", "r"));
        BOOST_TEST(reconstruct(p2, { { "r", "x" } }).error().code() ==
            error::regexp_mismatch);
    }

    void
    testOptCoordinates()
    {
        auto const p = opt(int_coordinates("img"));
        BOOST_TEST(! reconstruct(p, {}).value());

        auto rv = reconstruct(p,
            { { "img.x", "1" }, { "img.y", "2" }, { "img", "5" } });
        BOOST_TEST_EQ(rv.value()->first, 5);
        BOOST_TEST(rv.value()->second == image_coordinates{ 1, 2 });

        // partially present
        rv = reconstruct(p, { { "img.x", "1" } });
        BOOST_TEST(rv.error().code() == error::missing_parameter);
        BOOST_TEST_EQ(rv.error().name(), "img.y");
    }

    void
    testSet()
    {
        auto const p = set(int_, "i");
        auto c = construct(p, std::vector<int>{ 4, 22, 111 });
        BOOST_TEST((c.params == param_list{
            { "i", "4" }, { "i", "22" }, { "i", "111" } }));

        auto rv = reconstruct(p,
            { { "i", "22" }, { "j", "0" }, { "i", "4" }, { "i", "111" } });
        auto v = rv.value();
        std::sort(v.begin(), v.end());
        BOOST_TEST((v == std::vector<int>{ 4, 22, 111 }));

        // order of appearance
        BOOST_TEST((rv.value() == std::vector<int>{ 22, 4, 111 }));

        BOOST_TEST(reconstruct(p, {}).value().empty());

        rv = reconstruct(p, { { "i", "1" }, { "i", "x" } });
        BOOST_TEST(rv.error().code() == error::invalid_parameter_value);
        BOOST_TEST_EQ(rv.error().value(), "x");

        auto const p2 = set(file("f"));
        file_info f1;
        f1.tmp_filename = "a";
        file_info f2;
        f2.tmp_filename = "b";
        auto rv2 = reconstruct(p2, {}, { { "f", f1 }, { "f", f2 } });
        BOOST_TEST_EQ(rv2.value().size(), 2u);
        BOOST_TEST(rv2.value()[1] == f2);
    }

    void
    testList()
    {
        auto const p = list("l", prod(int_("a"), string("b")));
        std::vector<int_string> const v = { { 1, "x" }, { 2, "y" } };
        auto c = construct(p, v);
        BOOST_TEST((c.params == param_list{
            { "l.0.a", "1" }, { "l.0.b", "x" },
            { "l.1.a", "2" }, { "l.1.b", "y" } }));
        BOOST_TEST(reconstruct(p, c.params).value() == v);

        // index order, not input order
        auto rv = reconstruct(p, {
            { "l.10.b", "z" }, { "l.2.a", "2" }, { "l.10.a", "10" },
            { "l.2.b", "y" } });
        BOOST_TEST((rv.value() == std::vector<int_string>{
            { 2, "y" }, { 10, "z" } }));

        BOOST_TEST(reconstruct(p, {}).value().empty());

        // an element is incomplete
        rv = reconstruct(p, { { "l.0.a", "1" } });
        BOOST_TEST(rv.error().code() == error::missing_parameter);
        BOOST_TEST_EQ(rv.error().name(), "l.0.b");
    }

    void
    testListIndices()
    {
        auto const p = list("l", int_("a"));

        // not canonical
        auto rv = reconstruct(p, { { "l.01.a", "1" } }, {}, {}, strict());
        BOOST_TEST(rv.error().code() == error::unexpected_parameter);
        BOOST_TEST_EQ(rv.error().name(), "l.01.a");

        rv = reconstruct(p, { { "l.x.a", "1" }, { "l.0.a", "4" } });
        BOOST_TEST((rv.value() == std::vector<int>{ 4 }));

        reconstruct_config cfg;
        cfg.max_list_size = 2;
        rv = reconstruct(p, {
            { "l.0.a", "1" }, { "l.1.a", "1" }, { "l.2.a", "1" } },
            {}, {}, cfg);
        BOOST_TEST(rv.error().code() == error::list_too_long);
        BOOST_TEST_EQ(rv.error().name(), "l");
    }

    void
    testNestedLists()
    {
        auto const p = list("l", prod(
            sum(int_("a"), string("a")),
            list("m", int_("n"))));
        using S = binsum<int, std::string>;
        using E = std::pair<S, std::vector<int>>;
        std::vector<E> const v = {
            { S(variant2::in_place_index_t<0>(), 1), { 5, 6 } },
            { S(variant2::in_place_index_t<1>(), "s"), {} } };
        auto c = construct(p, v);
        BOOST_TEST((c.params == param_list{
            { "l.0.__sum.0", "1" }, { "l.0.a", "1" },
            { "l.0.m.0.n", "5" }, { "l.0.m.1.n", "6" },
            { "l.1.__sum.0", "2" }, { "l.1.a", "s" } }));
        BOOST_TEST(reconstruct(p, c.params, {}, {}, strict()).value() == v);
    }

    void
    testAddPrefix()
    {
        auto const p = add_prefix("p.", prod(int_("a"), int_("b")));
        auto c = construct(p, std::make_pair(1, 2));
        BOOST_TEST((c.params == param_list{
            { "p.a", "1" }, { "p.b", "2" } }));
        BOOST_TEST(reconstruct(p, c.params).value() ==
            std::make_pair(1, 2));

        auto const p2 = opt(add_prefix("q_", int_("a")));
        BOOST_TEST_EQ(*reconstruct(p2, { { "q_a", "3" } }).value(), 3);
        BOOST_TEST(! reconstruct(p2, { { "a", "3" } }).value());

        auto const p3 = add_prefix("s.", sum(int_("a"), int_("b")));
        BOOST_TEST((construct(p3, binsum<int, int>(
            variant2::in_place_index_t<0>(), 1)).params == param_list{
                { "s.__sum.0", "1" }, { "s.a", "1" } }));

        // prefixed keys cannot be reserved
        BOOST_TEST_THROWS(add_prefix("__sum.", int_("0")),
            system::system_error);
        BOOST_TEST_THROWS(add_prefix("__", int_("state")),
            system::system_error);
        BOOST_TEST_THROWS(add_prefix("_", list("_sum", int_("a"))),
            system::system_error);
        BOOST_TEST((construct(add_prefix("__", int_("x")), 1).params ==
            param_list{ { "__x", "1" } }));
    }

    void
    testNames()
    {
        auto const n = make_param_names(prod(int_("a"), opt(string("b"))));
        BOOST_TEST_EQ(n.first.str(), "a");
        BOOST_TEST_EQ(n.second.str(), "b");

        auto const s = make_param_names(prod(
            sum(int_("a"), int_("b")), sum(int_("c"), int_("d"))));
        BOOST_TEST_EQ(s.second.discriminator, "__sum.1");
        BOOST_TEST_EQ(s.second.first.str(), "c");
        BOOST_TEST_EQ(s.first.first_value(), std::string("1"));
        BOOST_TEST_EQ(s.first.second_value(), std::string("2"));

        auto const l = make_param_names(
            list("l", prod(int_("a"), string("b"))));
        BOOST_TEST_EQ(l.at(3).second.str(), "l.3.b");
        std::vector<std::string> keys;
        l.each(std::vector<int>{ 7, 8 },
            [&keys](auto const& names, int)
            {
                keys.push_back(names.first.str());
            });
        BOOST_TEST((keys == std::vector<std::string>{ "l.0.a", "l.1.a" }));

        auto const st = make_param_names(set(int_, "i"));
        BOOST_TEST_EQ(to_string(st), "i");
    }

    void
    testRoundTrip()
    {
        auto const p = prod(
            prod(int_("i"), opt(float_("f"))),
            prod(set(string, "s"),
                 list("l", sum(bool_("b"), int64("n")))));
        using L = binsum<bool, std::int64_t>;
        using V = std::decay_t<decltype(p)>::value_type;
        V const v(
            { 7, 2.5 },
            { { "x", "y z", "" },
              { L(variant2::in_place_index_t<0>(), true),
                L(variant2::in_place_index_t<1>(), -3) } });
        BOOST_TEST(reconstruct(p, construct(p, v).params,
            {}, {}, strict()).value() == v);

        V const v2(
            { -1, boost::none },
            { {}, {} });
        BOOST_TEST(reconstruct(p, construct(p, v2).params,
            {}, {}, strict()).value() == v2);
    }

    void
    run()
    {
        testProd();
        testProdDisjoint();
        testKeyConsumption();
        testSum();
        testSumDiscriminator();
        testNestedSums();
        testOpt();
        testOptCoordinates();
        testSet();
        testList();
        testListIndices();
        testNestedLists();
        testAddPrefix();
        testNames();
        testRoundTrip();
    }
};

TEST_SUITE(
    combinators_test,
    "boost.webparams.combinators");

} // webparams
} // boost
