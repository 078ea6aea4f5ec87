//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#ifndef BOOST_WEBPARAMS_SHAPE_HPP
#define BOOST_WEBPARAMS_SHAPE_HPP

#include <boost/webparams/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/variant2.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace boost {
namespace webparams {

/** The kind of a node in a parameter shape
*/
enum class param_kind : unsigned char
{
    unit,
    int_,
    int32,
    int64,
    float_,
    string,
    bool_,
    file,
    user,
    regexp,
    coordinates,
    product,
    sum,
    option,
    set,
    list,
    suffix,
    all_suffix,
    all_suffix_string,
    all_suffix_user,
    all_suffix_regexp,
    any,
    prefix
};

/** Return the name of a kind
*/
BOOST_WEBPARAMS_DECL
core::string_view
to_string(param_kind k) noexcept;

class param_shape;

/// A shared, immutable shape
using shape_ptr = std::shared_ptr<param_shape const>;

/** The description of a parameter shape

    Every parameter combinator builds one node of
    this tree when it is constructed. The tree holds
    names and kinds only; it is what the library
    inspects to validate combinations, compute
    fingerprints, and render diagnostics.
*/
class param_shape
{
public:
    struct unit_node
    {
    };

    struct any_node
    {
    };

    /// A single named value
    struct leaf_node
    {
        param_kind kind;
        std::string name;
    };

    /// Image input coordinates, with an optional companion value
    struct coordinates_node
    {
        std::string name;

        // param_kind::unit when there is no companion
        param_kind companion;
    };

    struct product_node
    {
        shape_ptr first;
        shape_ptr second;
    };

    struct sum_node
    {
        shape_ptr first;
        shape_ptr second;
    };

    struct option_node
    {
        shape_ptr inner;
    };

    struct set_node
    {
        shape_ptr inner;
    };

    struct list_node
    {
        std::string name;
        shape_ptr inner;
    };

    struct suffix_node
    {
        shape_ptr inner;
    };

    struct prefix_node
    {
        std::string prefix;
        shape_ptr inner;
    };

    using node_type = variant2::variant<
        unit_node,
        any_node,
        leaf_node,
        coordinates_node,
        product_node,
        sum_node,
        option_node,
        set_node,
        list_node,
        suffix_node,
        prefix_node>;

    explicit
    param_shape(node_type n) noexcept
        : node_(std::move(n))
    {
    }

    /// Return the node
    node_type const&
    node() const noexcept
    {
        return node_;
    }

    /// Return the kind of the node
    BOOST_WEBPARAMS_DECL
    param_kind
    kind() const noexcept;

private:
    node_type node_;
};

/** Return a new shape holding the node
*/
inline
shape_ptr
make_shape(param_shape::node_type n)
{
    return std::make_shared<
        param_shape const>(std::move(n));
}

/** Return the structural fingerprint of a shape

    The fingerprint depends only on the kinds and
    names of the nodes. Two shapes which accept the
    same parameters have the same fingerprint.
*/
BOOST_WEBPARAMS_DECL
std::uint64_t
fingerprint(param_shape const& s) noexcept;

/** Return true if the shape takes a path suffix
*/
BOOST_WEBPARAMS_DECL
bool
contains_suffix(param_shape const& s) noexcept;

/** Return a readable rendition of a shape

    @par Example
    @code
    list("l", prod(int("a"), string("b")))
    @endcode
*/
BOOST_WEBPARAMS_DECL
std::string
describe(param_shape const& s);

namespace detail {

// throws invalid_param_shape
BOOST_WEBPARAMS_DECL
void
check_name(core::string_view name);

// throws invalid_param_shape if a key of the
// prefixed shape is reserved
BOOST_WEBPARAMS_DECL
void
check_prefix(
    core::string_view prefix,
    param_shape const& inner);

// throws invalid_param_shape if keys of both
// sides of a product could collide
BOOST_WEBPARAMS_DECL
void
check_disjoint(
    param_shape const& first,
    param_shape const& second);

// throws invalid_param_shape if the shape
// cannot be read from path segments
BOOST_WEBPARAMS_DECL
void
check_suffix(param_shape const& s);

} // detail

} // webparams
} // boost

#endif
