////////////////////////////////////////////////////////////////////////////////
//
// media/timecode.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/error.hpp>
#include <cuesplit/stddef.hpp>
#include <cuesplit/string.hpp>

#include "media/timecode.hpp"

#include <chrono>
#include <cinttypes>
#include <cstdio>
#include <limits>
#include <string>
#include <string_view>


namespace cuesplit {
namespace cue {
namespace {

bool read_field(std::string_view& text, uint64& value) noexcept
{
    auto const end = std::min(text.find(':'), text.size());
    if (end == 0 || end > 9) {
        return false;
    }

    value = 0;
    for (auto const c : text.substr(0, end)) {
        if (!ascii_isdigit(c)) {
            return false;
        }
        value = (value * 10) + static_cast<uint64>(c - '0');
    }

    text.remove_prefix(end);
    return true;
}

bool read_separator(std::string_view& text) noexcept
{
    if (!text.empty() && text.front() == ':') {
        text.remove_prefix(1);
        return true;
    }
    return false;
}

}     // namespace <unnamed>


frames parse_timecode(std::string_view text)
{
    auto const original = text;

    uint64 mm, ss, ff;
    if (!read_field(text, mm) || !read_separator(text) ||
        !read_field(text, ss) || !read_separator(text) ||
        !read_field(text, ff) || !text.empty()) {
        raise(errc::parse_error, "invalid time syntax: \"%.*s\"",
              static_cast<int>(original.size()), original.data());
    }
    if (ss >= 60) {
        raise(errc::parse_error, "seconds out of range: \"%.*s\"",
              static_cast<int>(original.size()), original.data());
    }
    if (ff >= frames_per_second) {
        raise(errc::parse_error, "frame out of range: \"%.*s\"",
              static_cast<int>(original.size()), original.data());
    }

    return std::chrono::minutes{mm}
         + std::chrono::seconds{ss}
         + frames{ff};
}

std::string format_timecode(frames const f)
{
    auto const total = f.count();
    auto const ff = total % frames_per_second;
    auto const ss = (total / frames_per_second) % 60;
    auto const mm = (total / frames_per_second) / 60;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02" PRIu64 ":%02" PRIu64 ":%02" PRIu64,
                  mm, ss, ff);
    return buf;
}

std::string format_seconds(frames const f)
{
    using microseconds = std::chrono::duration<uint64, std::micro>;

    // 1/75 s is not a whole number of microseconds; round to nearest.
    auto const us = (f.count() * microseconds::period::den
                  + frames_per_second / 2) / frames_per_second;

    auto const sec = us / microseconds::period::den;
    auto rem = us % microseconds::period::den;

    char buf[48];
    if (rem == 0) {
        std::snprintf(buf, sizeof(buf), "%" PRIu64, sec);
        return buf;
    }

    auto digits = 6;
    while (rem % 10 == 0) {
        rem /= 10;
        --digits;
    }
    std::snprintf(buf, sizeof(buf), "%" PRIu64 ".%0*" PRIu64,
                  sec, digits, rem);
    return buf;
}

}}    // namespace cuesplit::cue
