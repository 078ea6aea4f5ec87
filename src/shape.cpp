//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#include <boost/webparams/shape.hpp>
#include <boost/webparams/error.hpp>
#include <boost/webparams/name_generator.hpp>
#include <boost/webparams/detail/except.hpp>
#include <vector>

namespace boost {
namespace webparams {

core::string_view
to_string(param_kind k) noexcept
{
    switch(k)
    {
    case param_kind::unit: return "unit";
    case param_kind::int_: return "int";
    case param_kind::int32: return "int32";
    case param_kind::int64: return "int64";
    case param_kind::float_: return "float";
    case param_kind::string: return "string";
    case param_kind::bool_: return "bool";
    case param_kind::file: return "file";
    case param_kind::user: return "user_type";
    case param_kind::regexp: return "regexp";
    case param_kind::coordinates: return "coordinates";
    case param_kind::product: return "prod";
    case param_kind::sum: return "sum";
    case param_kind::option: return "opt";
    case param_kind::set: return "set";
    case param_kind::list: return "list";
    case param_kind::suffix: return "suffix";
    case param_kind::all_suffix: return "all_suffix";
    case param_kind::all_suffix_string: return "all_suffix_string";
    case param_kind::all_suffix_user: return "all_suffix_user";
    case param_kind::all_suffix_regexp: return "all_suffix_regexp";
    case param_kind::any: return "any";
    case param_kind::prefix: return "prefix";
    default:
        return "?";
    }
}

namespace {

struct kind_of
{
    param_kind operator()(param_shape::unit_node const&) const noexcept { return param_kind::unit; }
    param_kind operator()(param_shape::any_node const&) const noexcept { return param_kind::any; }
    param_kind operator()(param_shape::leaf_node const& n) const noexcept { return n.kind; }
    param_kind operator()(param_shape::coordinates_node const&) const noexcept { return param_kind::coordinates; }
    param_kind operator()(param_shape::product_node const&) const noexcept { return param_kind::product; }
    param_kind operator()(param_shape::sum_node const&) const noexcept { return param_kind::sum; }
    param_kind operator()(param_shape::option_node const&) const noexcept { return param_kind::option; }
    param_kind operator()(param_shape::set_node const&) const noexcept { return param_kind::set; }
    param_kind operator()(param_shape::list_node const&) const noexcept { return param_kind::list; }
    param_kind operator()(param_shape::suffix_node const&) const noexcept { return param_kind::suffix; }
    param_kind operator()(param_shape::prefix_node const&) const noexcept { return param_kind::prefix; }
};

//------------------------------------------------

// FNV-1a, fed with the pre-order
// sequence of kinds and names
class hasher
{
    static constexpr std::uint64_t basis = 14695981039346656037ULL;
    static constexpr std::uint64_t prime = 1099511628211ULL;

    std::uint64_t h_ = basis;

    void
    byte(unsigned char c) noexcept
    {
        h_ ^= c;
        h_ *= prime;
    }

    void
    str(core::string_view s) noexcept
    {
        for(unsigned char c : s)
            byte(c);
        byte(0);
    }

public:
    std::uint64_t
    value() const noexcept
    {
        return h_;
    }

    void
    operator()(param_shape const& s) noexcept
    {
        byte(static_cast<unsigned char>(s.kind()));
        variant2::visit(*this, s.node());
    }

    void operator()(param_shape::unit_node const&) noexcept {}
    void operator()(param_shape::any_node const&) noexcept {}

    void
    operator()(param_shape::leaf_node const& n) noexcept
    {
        str(n.name);
    }

    void
    operator()(param_shape::coordinates_node const& n) noexcept
    {
        byte(static_cast<unsigned char>(n.companion));
        str(n.name);
    }

    void
    operator()(param_shape::product_node const& n) noexcept
    {
        (*this)(*n.first);
        (*this)(*n.second);
    }

    void
    operator()(param_shape::sum_node const& n) noexcept
    {
        (*this)(*n.first);
        (*this)(*n.second);
    }

    void
    operator()(param_shape::option_node const& n) noexcept
    {
        (*this)(*n.inner);
    }

    void
    operator()(param_shape::set_node const& n) noexcept
    {
        (*this)(*n.inner);
    }

    void
    operator()(param_shape::list_node const& n) noexcept
    {
        str(n.name);
        (*this)(*n.inner);
    }

    void
    operator()(param_shape::suffix_node const& n) noexcept
    {
        (*this)(*n.inner);
    }

    void
    operator()(param_shape::prefix_node const& n) noexcept
    {
        str(n.prefix);
        (*this)(*n.inner);
    }
};

//------------------------------------------------

struct has_suffix
{
    bool operator()(param_shape::unit_node const&) const noexcept { return false; }
    bool operator()(param_shape::any_node const&) const noexcept { return false; }
    bool operator()(param_shape::leaf_node const&) const noexcept { return false; }
    bool operator()(param_shape::coordinates_node const&) const noexcept { return false; }
    bool operator()(param_shape::suffix_node const&) const noexcept { return true; }

    bool
    operator()(param_shape::product_node const& n) const noexcept
    {
        return
            contains_suffix(*n.first) ||
            contains_suffix(*n.second);
    }

    bool
    operator()(param_shape::sum_node const& n) const noexcept
    {
        return
            contains_suffix(*n.first) ||
            contains_suffix(*n.second);
    }

    bool
    operator()(param_shape::option_node const& n) const noexcept
    {
        return contains_suffix(*n.inner);
    }

    bool
    operator()(param_shape::set_node const& n) const noexcept
    {
        return contains_suffix(*n.inner);
    }

    bool
    operator()(param_shape::list_node const& n) const noexcept
    {
        return contains_suffix(*n.inner);
    }

    bool
    operator()(param_shape::prefix_node const& n) const noexcept
    {
        return contains_suffix(*n.inner);
    }
};

//------------------------------------------------

struct describer
{
    std::string& out;

    void
    quoted(core::string_view s)
    {
        out.push_back('"');
        out.append(s.data(), s.size());
        out.push_back('"');
    }

    void
    call(
        core::string_view f,
        param_shape const& a)
    {
        out.append(f.data(), f.size());
        out.push_back('(');
        variant2::visit(*this, a.node());
        out.push_back(')');
    }

    void
    call(
        core::string_view f,
        param_shape const& a,
        param_shape const& b)
    {
        out.append(f.data(), f.size());
        out.push_back('(');
        variant2::visit(*this, a.node());
        out.append(", ");
        variant2::visit(*this, b.node());
        out.push_back(')');
    }

    void
    operator()(param_shape::unit_node const&)
    {
        out.append("unit");
    }

    void
    operator()(param_shape::any_node const&)
    {
        out.append("any");
    }

    void
    operator()(param_shape::leaf_node const& n)
    {
        auto const f = to_string(n.kind);
        out.append(f.data(), f.size());
        out.push_back('(');
        quoted(n.name);
        out.push_back(')');
    }

    void
    operator()(param_shape::coordinates_node const& n)
    {
        if(n.companion != param_kind::unit)
        {
            auto const f = to_string(n.companion);
            out.append(f.data(), f.size());
            out.push_back('_');
        }
        out.append("coordinates(");
        quoted(n.name);
        out.push_back(')');
    }

    void
    operator()(param_shape::product_node const& n)
    {
        call("prod", *n.first, *n.second);
    }

    void
    operator()(param_shape::sum_node const& n)
    {
        call("sum", *n.first, *n.second);
    }

    void
    operator()(param_shape::option_node const& n)
    {
        call("opt", *n.inner);
    }

    void
    operator()(param_shape::set_node const& n)
    {
        call("set", *n.inner);
    }

    void
    operator()(param_shape::list_node const& n)
    {
        out.append("list(");
        quoted(n.name);
        out.append(", ");
        variant2::visit(*this, n.inner->node());
        out.push_back(')');
    }

    void
    operator()(param_shape::suffix_node const& n)
    {
        call("suffix", *n.inner);
    }

    void
    operator()(param_shape::prefix_node const& n)
    {
        out.append("prefix(");
        quoted(n.prefix);
        out.append(", ");
        variant2::visit(*this, n.inner->node());
        out.push_back(')');
    }
};

//------------------------------------------------

// A key claimed by a shape. When `prefix`
// is set, every key starting with `name.`
// is claimed as well.
struct claim
{
    std::string name;
    bool prefix;
};

struct collector
{
    std::vector<claim>& v;
    std::string pre;

    void
    add(core::string_view name, bool prefix)
    {
        std::string s = pre;
        s.append(name.data(), name.size());
        v.push_back({ std::move(s), prefix });
    }

    void operator()(param_shape::unit_node const&) {}
    void operator()(param_shape::any_node const&) {}

    void
    operator()(param_shape::leaf_node const& n)
    {
        add(n.name, false);
    }

    void
    operator()(param_shape::coordinates_node const& n)
    {
        add(n.name, false);
        add(n.name, true);
    }

    void
    operator()(param_shape::product_node const& n)
    {
        variant2::visit(*this, n.first->node());
        variant2::visit(*this, n.second->node());
    }

    void
    operator()(param_shape::sum_node const& n)
    {
        // both alternatives may use the same keys
        variant2::visit(*this, n.first->node());
        variant2::visit(*this, n.second->node());
    }

    void
    operator()(param_shape::option_node const& n)
    {
        variant2::visit(*this, n.inner->node());
    }

    void
    operator()(param_shape::set_node const& n)
    {
        variant2::visit(*this, n.inner->node());
    }

    void
    operator()(param_shape::list_node const& n)
    {
        add(n.name, false);
        add(n.name, true);
    }

    // suffix leaves read path segments, not keys
    void operator()(param_shape::suffix_node const&) {}

    void
    operator()(param_shape::prefix_node const& n)
    {
        collector c{ v, pre + n.prefix };
        variant2::visit(c, n.inner->node());
    }
};

bool
covers(
    claim const& c,
    core::string_view key) noexcept
{
    return
        c.prefix &&
        key.size() > c.name.size() &&
        key.starts_with(c.name) &&
        key[c.name.size()] == '.';
}

bool
collide(
    claim const& a,
    claim const& b) noexcept
{
    if(a.name == b.name)
        return true;
    return
        covers(a, b.name) ||
        covers(b, a.name);
}

//------------------------------------------------

struct suffix_checker
{
    void
    fail()
    {
        detail::throw_system_error(
            error::invalid_param_shape,
            "parameter cannot be read from the path suffix");
    }

    void operator()(param_shape::unit_node const&) {}
    void operator()(param_shape::any_node const&) { fail(); }

    void
    operator()(param_shape::leaf_node const& n)
    {
        switch(n.kind)
        {
        case param_kind::bool_:
        case param_kind::file:
            fail();
            break;
        default:
            break;
        }
    }

    void operator()(param_shape::coordinates_node const&) { fail(); }

    void
    operator()(param_shape::product_node const& n)
    {
        variant2::visit(*this, n.first->node());
        variant2::visit(*this, n.second->node());
    }

    void operator()(param_shape::sum_node const&) { fail(); }
    void operator()(param_shape::option_node const&) { fail(); }
    void operator()(param_shape::set_node const&) { fail(); }
    void operator()(param_shape::list_node const&) { fail(); }
    void operator()(param_shape::suffix_node const&) { fail(); }

    void
    operator()(param_shape::prefix_node const& n)
    {
        variant2::visit(*this, n.inner->node());
    }
};

} // (anon)

param_kind
param_shape::
kind() const noexcept
{
    return variant2::visit(kind_of{}, node_);
}

std::uint64_t
fingerprint(param_shape const& s) noexcept
{
    hasher h;
    h(s);
    return h.value();
}

bool
contains_suffix(param_shape const& s) noexcept
{
    return variant2::visit(has_suffix{}, s.node());
}

std::string
describe(param_shape const& s)
{
    std::string out;
    describer d{ out };
    variant2::visit(d, s.node());
    return out;
}

namespace detail {

void
check_name(core::string_view name)
{
    if(name.empty())
        throw_system_error(
            error::invalid_param_shape,
            "empty parameter name");
    if( name.starts_with(sum_key_prefix) ||
        name == state_key)
        throw_system_error(
            error::invalid_param_shape,
            "reserved parameter name");
}

void
check_prefix(
    core::string_view prefix,
    param_shape const& inner)
{
    std::vector<claim> v;
    collector c{ v, std::string(prefix) };
    variant2::visit(c, inner.node());
    for(auto& x : v)
    {
        if(x.prefix)
            x.name.push_back('.');
        core::string_view const k = x.name;
        if( k.starts_with(sum_key_prefix) ||
            k == state_key)
            throw_system_error(
                error::invalid_param_shape,
                "reserved parameter name");
    }
}

void
check_disjoint(
    param_shape const& first,
    param_shape const& second)
{
    std::vector<claim> a;
    std::vector<claim> b;
    {
        collector c{ a, {} };
        variant2::visit(c, first.node());
    }
    {
        collector c{ b, {} };
        variant2::visit(c, second.node());
    }
    for(auto const& x : a)
        for(auto const& y : b)
            if(collide(x, y))
                throw_system_error(
                    error::invalid_param_shape,
                    "parameter names are not disjoint");
}

void
check_suffix(param_shape const& s)
{
    suffix_checker c;
    variant2::visit(c, s.node());
}

} // detail

} // webparams
} // boost
