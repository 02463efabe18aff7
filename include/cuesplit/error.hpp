////////////////////////////////////////////////////////////////////////////////
//
// cuesplit/error.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_B626FA49_53D1_4207_B6B1_1C50BD3D0DF4
#define CUESPLIT_INCLUDED_B626FA49_53D1_4207_B6B1_1C50BD3D0DF4


#include <cuesplit/stddef.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>


namespace cuesplit {

enum class errc : uint32 {
    failure = 1,
    invalid_argument,
    parse_error,
    template_error,
    config_error,
    file_not_found,
    filesystem_error,
    encode_error,
    timed_out,
    cancelled,
};

char const* error_message(errc) noexcept;


class error :
    public std::runtime_error
{
public:
    error(errc const e, std::string detail, std::size_t const ln = 0) :
        std::runtime_error{error::compose_(e, detail, ln)},
        detail_{std::move(detail)},
        line_{ln},
        code_{e}
    {}

    errc code() const noexcept
    { return code_; }

    // The message without the category prefix and line number.
    std::string const& detail() const noexcept
    { return detail_; }

    // 1-based line of the offending input, zero when not tied to a line.
    std::size_t line() const noexcept
    { return line_; }

private:
    static std::string compose_(errc, std::string const&, std::size_t);

    std::string detail_;
    std::size_t line_;
    errc code_;
};


[[noreturn]]
void raise(errc);
[[noreturn]] CUESPLIT_PRINTF_FORMAT(2, 3)
void raise(errc, char const*, ...);
[[noreturn]] CUESPLIT_PRINTF_FORMAT(3, 4)
void raise_at_line(errc, std::size_t, char const*, ...);

[[noreturn]] void raise_system_error(int);
[[noreturn]] void raise_current_system_error();

}     // namespace cuesplit


#endif  // CUESPLIT_INCLUDED_B626FA49_53D1_4207_B6B1_1C50BD3D0DF4
