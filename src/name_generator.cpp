//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#include <boost/webparams/name_generator.hpp>
#include <algorithm>

namespace boost {
namespace webparams {

std::string
make_code(std::size_t n)
{
    constexpr char digits[] =
        "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string s;
    do
    {
        s.push_back(digits[n % 36]);
        n /= 36;
    }
    while(n != 0);
    std::reverse(s.begin(), s.end());
    return s;
}

std::string
name_generator::
key(core::string_view name) const
{
    std::string s;
    s.reserve(prefix_.size() + name.size());
    s.append(prefix_);
    s.append(name.data(), name.size());
    return s;
}

std::string
name_generator::
anonymous(std::size_t offset) const
{
    std::string s = prefix_;
    s.append(sum_key_prefix.data(), sum_key_prefix.size());
    s.append(make_code(base_ + offset));
    return s;
}

name_generator
name_generator::
advance(std::size_t n) const
{
    name_generator g(*this);
    g.base_ += n;
    return g;
}

name_generator
name_generator::
nest(
    core::string_view list,
    std::size_t index) const
{
    name_generator g;
    g.prefix_ = prefix_;
    g.prefix_.append(list.data(), list.size());
    g.prefix_.push_back('.');
    g.prefix_.append(std::to_string(index));
    g.prefix_.push_back('.');
    g.suffix_ = suffix_;
    return g;
}

name_generator
name_generator::
prefixed(core::string_view prefix) const
{
    name_generator g(*this);
    g.prefix_.append(prefix.data(), prefix.size());
    return g;
}

name_generator
name_generator::
suffix_mode() const
{
    name_generator g(*this);
    g.suffix_ = true;
    return g;
}

} // webparams
} // boost
