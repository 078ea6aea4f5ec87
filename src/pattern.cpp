//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/webparams
//

#include <boost/webparams/pattern.hpp>
#include <boost/webparams/error.hpp>
#include <boost/webparams/detail/except.hpp>

#include <re2/re2.h>

namespace boost {
namespace webparams {

namespace {

class re2_pattern
    : public pattern
{
    re2::RE2 re_;

public:
    explicit
    re2_pattern(core::string_view s)
        : re_(re2::StringPiece(s.data(), s.size()),
            re2::RE2::Quiet)
    {
    }

    bool
    ok() const noexcept
    {
        return re_.ok();
    }

    bool
    search(
        core::string_view s,
        std::size_t pos,
        bool anchored,
        std::vector<core::string_view>& groups) const override
    {
        auto const n =
            re_.NumberOfCapturingGroups() + 1;
        std::vector<re2::StringPiece> sub(n);
        if(! re_.Match(
            re2::StringPiece(s.data(), s.size()),
            pos,
            s.size(),
            anchored ?
                re2::RE2::ANCHOR_START :
                re2::RE2::UNANCHORED,
            sub.data(),
            n))
            return false;
        groups.assign(n, core::string_view());
        for(int i = 0; i < n; ++i)
        {
            if(sub[i].data() != nullptr)
                groups[i] = core::string_view(
                    sub[i].data(), sub[i].size());
        }
        return true;
    }
};

void
expand(
    std::string& out,
    core::string_view templ,
    std::vector<core::string_view> const& groups)
{
    auto it = templ.begin();
    auto const end = templ.end();
    while(it != end)
    {
        if(*it != '$' || it + 1 == end)
        {
            out.push_back(*it++);
            continue;
        }
        char const c = it[1];
        if(c == '$')
        {
            out.push_back('$');
            it += 2;
            continue;
        }
        if(c < '0' || c > '9')
        {
            out.push_back(*it++);
            continue;
        }
        std::size_t const i = c - '0';
        if(i < groups.size())
            out.append(
                groups[i].data(),
                groups[i].size());
        it += 2;
    }
}

} // (anon)

pattern_ptr
make_pattern(core::string_view regex)
{
    auto p = std::make_shared<re2_pattern>(regex);
    if(! p->ok())
        detail::throw_system_error(
            error::invalid_param_shape,
            "invalid regular expression");
    return p;
}

boost::optional<std::string>
rewrite(
    pattern const& p,
    core::string_view s,
    core::string_view templ)
{
    std::vector<core::string_view> groups;
    if(! p.search(s, 0, true, groups))
        return boost::none;

    std::string out;
    std::size_t pos = 0;
    while(pos <= s.size() &&
        p.search(s, pos, false, groups))
    {
        auto const m = groups[0];
        std::size_t const start =
            m.data() - s.data();
        out.append(s.data() + pos, start - pos);
        expand(out, templ, groups);
        if(! m.empty())
        {
            pos = start + m.size();
            continue;
        }
        // step over the empty match
        if(start < s.size())
            out.push_back(s[start]);
        pos = start + 1;
    }
    if(pos < s.size())
        out.append(s.data() + pos, s.size() - pos);
    return out;
}

} // webparams
} // boost
