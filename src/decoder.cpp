//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#include <boost/webparams/decoder.hpp>
#include <algorithm>
#include <iterator>
#include <limits>

namespace boost {
namespace webparams {

namespace {

// parse a canonical decimal index ending
// at the first dot, or return false
bool
parse_index(
    core::string_view s,
    std::size_t& index) noexcept
{
    auto const dot = s.find('.');
    if( dot == core::string_view::npos ||
        dot == 0)
        return false;
    if(s[0] == '0' && dot != 1)
        return false;
    std::size_t v = 0;
    for(std::size_t i = 0; i < dot; ++i)
    {
        char const c = s[i];
        if(c < '0' || c > '9')
            return false;
        std::size_t const d = c - '0';
        if(v > ((std::numeric_limits<
                std::size_t>::max)() - d) / 10)
            return false;
        v = v * 10 + d;
    }
    index = v;
    return true;
}

} // (anon)

decoder::
decoder(
    param_list params,
    file_list files,
    segment_list segments,
    reconstruct_config const& cfg)
    : params_(std::move(params))
    , files_(std::move(files))
    , segments_(std::move(segments))
    , cfg_(cfg)
{
}

bool
decoder::
contains(core::string_view key) const noexcept
{
    return std::any_of(
        params_.begin(), params_.end(),
        [key](auto const& p)
        {
            return p.first == key;
        });
}

boost::optional<std::string>
decoder::
take(core::string_view key)
{
    auto it = std::find_if(
        params_.begin(), params_.end(),
        [key](auto const& p)
        {
            return p.first == key;
        });
    if(it == params_.end())
        return boost::none;
    std::string v = std::move(it->second);
    params_.erase(it);
    return v;
}

bool
decoder::
contains_file(core::string_view key) const noexcept
{
    return std::any_of(
        files_.begin(), files_.end(),
        [key](auto const& f)
        {
            return f.first == key;
        });
}

boost::optional<file_info>
decoder::
take_file(core::string_view key)
{
    auto it = std::find_if(
        files_.begin(), files_.end(),
        [key](auto const& f)
        {
            return f.first == key;
        });
    if(it == files_.end())
        return boost::none;
    file_info v = std::move(it->second);
    files_.erase(it);
    return v;
}

std::vector<std::size_t>
decoder::
list_indices(core::string_view prefix) const
{
    std::vector<std::size_t> v;
    auto const visit =
        [&](core::string_view key)
        {
            if(! key.starts_with(prefix))
                return;
            std::size_t i;
            if(parse_index(
                key.substr(prefix.size()), i))
                v.push_back(i);
        };
    for(auto const& p : params_)
        visit(p.first);
    for(auto const& f : files_)
        visit(f.first);
    std::sort(v.begin(), v.end());
    v.erase(std::unique(
        v.begin(), v.end()), v.end());
    return v;
}

param_list
decoder::
take_all()
{
    param_list v;
    v.swap(params_);
    return v;
}

boost::optional<std::string>
decoder::
next_segment()
{
    if(pos_ >= segments_.size())
        return boost::none;
    return std::move(segments_[pos_++]);
}

segment_list
decoder::
take_segments()
{
    segment_list v(
        std::make_move_iterator(
            segments_.begin() + pos_),
        std::make_move_iterator(
            segments_.end()));
    pos_ = segments_.size();
    return v;
}

} // webparams
} // boost
