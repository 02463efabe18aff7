////////////////////////////////////////////////////////////////////////////////
//
// media/name_format.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/error.hpp>
#include <cuesplit/stddef.hpp>
#include <cuesplit/string.hpp>

#include "media/name_format.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace cuesplit {
namespace media {
namespace {

constexpr auto substitute = '_';

constexpr bool is_control(char const c) noexcept
{
    return static_cast<uchar>(c) < 0x20 || c == 0x7f;
}

constexpr bool is_illegal_in_value(char const c) noexcept
{
    switch (c) {
    case '\\':
    case '/':
    case ':':
    case '*':
    case '?':
    case '\"':
    case '<':
    case '>':
    case '|':
        return true;
    default:
        return is_control(c);
    }
}

constexpr bool is_illegal_in_literal(char const c) noexcept
{
    return (c != '/') && is_illegal_in_value(c);
}


void finish_segment(std::string& out, std::size_t const start)
{
    auto const pos = out.find_last_not_of(" .");
    auto const keep = (pos == std::string::npos || pos < start)
                    ? start
                    : pos + 1;

    if (keep != out.size()) {
        out.resize(keep);
        out += substitute;
    }
    else if (out.size() == start) {
        out += substitute;
    }
}

}     // namespace <unnamed>


name_format::field name_format::find_field_(std::string_view const name) noexcept
{
    static constexpr std::pair<std::string_view, field> const fields[] = {
        { "artist",   field::artist   },
        { "album",    field::album    },
        { "title",    field::title    },
        { "year",     field::year     },
        { "genre",    field::genre    },
        { "no",       field::number   },
        { "dir-name", field::dir_name },
        { "ext",      field::ext      },
    };

    for (auto const& [key, value] : fields) {
        if (stricmpeq(key, name)) {
            return value;
        }
    }
    return field::none;
}

void name_format::compile(std::string_view const s)
{
    if (trim(s).empty()) {
        raise(errc::template_error, "template is empty");
    }
    if (s.front() == '/') {
        raise(errc::template_error,
              "template must produce a relative path: \"%.*s\"",
              static_cast<int>(s.size()), s.data());
    }

    std::vector<token> tokens;
    auto pos = 0_sz;
    while (pos < s.size()) {
        auto const open = s.find_first_of("<>", pos);
        if (open != pos) {
            auto const end = std::min(open, s.size());
            tokens.push_back({field::none, std::string{s.substr(pos, end - pos)}});
            pos = end;
            continue;
        }

        if (s[open] == '>') {
            raise(errc::template_error, "unmatched '>' at offset %zu", open);
        }

        auto const close = s.find('>', open + 1);
        if (close == s.npos) {
            raise(errc::template_error,
                  "unterminated placeholder at offset %zu", open);
        }

        auto const name = s.substr(open + 1, close - open - 1);
        if (name.empty()) {
            raise(errc::template_error, "empty placeholder at offset %zu", open);
        }

        auto const key = find_field_(name);
        if (key == field::none) {
            raise(errc::template_error, "unknown placeholder <%.*s>",
                  static_cast<int>(name.size()), name.data());
        }

        tokens.push_back({key, {}});
        pos = close + 1;
    }

    tokens_ = std::move(tokens);
}

std::string name_format::operator()(name_fields const& f) const
{
    auto append_value = [](std::string& out, std::string_view const value) {
        for (auto const c : value) {
            out += is_illegal_in_value(c) ? substitute : c;
        }
    };

    std::string out;
    auto segment = 0_sz;

    for (auto const& t : tokens_) {
        switch (t.key) {
        case field::none:
            for (auto const c : t.text) {
                if (c == '/') {
                    finish_segment(out, segment);
                    out += '/';
                    segment = out.size();
                }
                else {
                    out += is_illegal_in_literal(c) ? substitute : c;
                }
            }
            break;
        case field::artist:
            append_value(out, f.artist);
            break;
        case field::album:
            append_value(out, f.album);
            break;
        case field::title:
            append_value(out, f.title);
            break;
        case field::year:
            append_value(out, f.year);
            break;
        case field::genre:
            append_value(out, f.genre);
            break;
        case field::number:
            {
                char buf[16];
                std::snprintf(buf, sizeof(buf), "%0*u",
                              static_cast<int>(f.number_width), f.number);
                out += buf;
            }
            break;
        case field::dir_name:
            append_value(out, f.dir_name);
            break;
        case field::ext:
            append_value(out, f.ext);
            break;
        }
    }

    finish_segment(out, segment);
    return out;
}


uint digit_count(uint n) noexcept
{
    auto digits = 1u;
    while (n >= 10) {
        n /= 10;
        ++digits;
    }
    return digits;
}

std::string extract_year(std::string_view const date)
{
    std::string_view best;
    for (auto pos = 0_sz; pos < date.size();) {
        if (!ascii_isdigit(date[pos])) {
            ++pos;
            continue;
        }

        auto end = pos;
        while (end < date.size() && ascii_isdigit(date[end])) {
            ++end;
        }
        if (end - pos > best.size()) {
            best = date.substr(pos, end - pos);
        }
        pos = end;
    }

    return std::string{best.empty() ? trim(date) : best};
}

std::string sanitize_component(std::string_view const s)
{
    std::string out;
    out.reserve(s.size());
    for (auto const c : s) {
        out += is_illegal_in_value(c) ? substitute : c;
    }
    finish_segment(out, 0);
    return out;
}

}}    // namespace cuesplit::media
