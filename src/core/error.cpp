////////////////////////////////////////////////////////////////////////////////
//
// core/error.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/error.hpp>
#include <cuesplit/scope_guard.hpp>
#include <cuesplit/stddef.hpp>

#include <cerrno>
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <string>
#include <system_error>


namespace cuesplit {
namespace {

std::string vformat(char const* const format, va_list ap1)
{
    va_list ap2;
    va_copy(ap2, ap1);
    CUESPLIT_SCOPE_EXIT { va_end(ap2); };

    auto const ret = std::vsnprintf(nullptr, 0, format, ap1);
    if (ret < 0) {
        raise(errc::invalid_argument);
    }

    std::string buf(static_cast<std::size_t>(ret) + 1, '\0');
    std::vsnprintf(&buf[0], buf.size(), format, ap2);
    buf.pop_back();
    return buf;
}

}     // namespace <unnamed>


char const* error_message(errc const e) noexcept
{
    switch (e) {
    case errc::failure:
        return "unspecified error";
    case errc::invalid_argument:
        return "function received invalid argument(s)";
    case errc::parse_error:
        return "cue sheet parse error";
    case errc::template_error:
        return "invalid template";
    case errc::config_error:
        return "invalid configuration";
    case errc::file_not_found:
        return "file not found";
    case errc::filesystem_error:
        return "filesystem error";
    case errc::encode_error:
        return "encoder failed";
    case errc::timed_out:
        return "timed out";
    case errc::cancelled:
        return "cancelled";
    }
    return "unknown error";
}

std::string error::compose_(errc const e, std::string const& detail,
                            std::size_t const ln)
{
    std::string msg{error_message(e)};
    if (ln != 0) {
        msg += ": line ";
        msg += std::to_string(ln);
    }
    if (!detail.empty()) {
        msg += ": ";
        msg += detail;
    }
    return msg;
}

void raise(errc const e)
{
    throw error{e, {}};
}

void raise(errc const e, char const* const format, ...)
{
    va_list ap;
    va_start(ap, format);
    CUESPLIT_SCOPE_EXIT { va_end(ap); };

    throw error{e, vformat(format, ap)};
}

void raise_at_line(errc const e, std::size_t const ln,
                   char const* const format, ...)
{
    va_list ap;
    va_start(ap, format);
    CUESPLIT_SCOPE_EXIT { va_end(ap); };

    throw error{e, vformat(format, ap), ln};
}

void raise_system_error(int const ev)
{
    throw std::system_error{ev, std::system_category()};
}

void raise_current_system_error()
{
    raise_system_error(errno);
}

}     // namespace cuesplit
