////////////////////////////////////////////////////////////////////////////////
//
// cuesplit/string.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_42AC81E2_C0CD_4231_B78B_2954D53E4DAA
#define CUESPLIT_INCLUDED_42AC81E2_C0CD_4231_B78B_2954D53E4DAA


#include <cuesplit/stddef.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>

#if defined(CUESPLIT_HAS_POSIX)
# include <strings.h>
#else
# include <cctype>
#endif


namespace cuesplit {

constexpr char ascii_tolower(char const c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

constexpr bool ascii_isdigit(char const c) noexcept
{
    return (c >= '0' && c <= '9');
}

constexpr bool ascii_isalnum(char const c) noexcept
{
    return ascii_isdigit(c)
        || (c >= 'a' && c <= 'z')
        || (c >= 'A' && c <= 'Z');
}


CUESPLIT_READONLY
inline int stricmp(char const* s1, char const* s2, std::size_t n) noexcept
{
#if defined(CUESPLIT_HAS_POSIX)
    return ::strncasecmp(s1, s2, n);
#else
    if (n == 0) {
        return 0;
    }

    int c1, c2;
    do {
        c1 = ascii_tolower(*s1++);
        c2 = ascii_tolower(*s2++);
    }
    while (c1 != 0 && c1 == c2 && --n != 0);
    return c1 - c2;
#endif
}

CUESPLIT_READONLY
inline bool stricmpeq(std::string_view const s1,
                      std::string_view const s2) noexcept
{
    return (s1.size() == s2.size())
        && (stricmp(s1.data(), s2.data(), s1.size()) == 0);
}


constexpr std::string_view trim_left(std::string_view s,
                                     std::string_view const ws = " \t")
{
    s.remove_prefix(std::min(s.find_first_not_of(ws), s.size()));
    return s;
}

constexpr std::string_view trim_right(std::string_view s,
                                      std::string_view const ws = " \t")
{
    auto const pos = s.find_last_not_of(ws);
    s.remove_suffix(s.size() - ((pos == s.npos) ? 0 : pos + 1));
    return s;
}

constexpr std::string_view trim(std::string_view const s,
                                std::string_view const ws = " \t")
{
    return trim_right(trim_left(s, ws), ws);
}


namespace aux {

template<typename Delim>
class token_iterator_
{
public:
    using iterator_category = std::forward_iterator_tag;
    using difference_type   = std::ptrdiff_t;
    using value_type        = std::string_view;
    using reference         = std::string_view const&;
    using pointer           = std::string_view const*;

    token_iterator_() = default;

    token_iterator_(std::string_view const s, Delim const d) noexcept :
        input_(s),
        delim_(d)
    {
        ++(*this);
    }

    token_iterator_& operator++() noexcept
    {
        auto const end = input_.find_first_not_of(delim_, token_.size());
        input_.remove_prefix(std::min(end, input_.size()));
        token_ = input_.substr(0, input_.find_first_of(delim_));
        return *this;
    }

    token_iterator_ operator++(int) noexcept
    {
        auto tmp = *this;
        return (++(*this), tmp);
    }

    reference operator*() const noexcept
    { return token_; }

    pointer operator->() const noexcept
    { return &token_; }

    friend bool operator==(token_iterator_ const& x,
                           token_iterator_ const& y) noexcept
    { return (x.input_ == y.input_); }

    friend bool operator!=(token_iterator_ const& x,
                           token_iterator_ const& y) noexcept
    { return !(x == y); }

private:
    std::string_view input_;
    std::string_view token_;
    Delim delim_{};
};

template<typename Iterator>
struct token_range_
{
    Iterator first;
    Iterator last;

    Iterator begin() const noexcept { return first; }
    Iterator end()   const noexcept { return last; }
};

}     // namespace aux

template<typename Delim>
inline auto tokenize(std::string_view const str, Delim const delim) noexcept
{
    using iterator = aux::token_iterator_<Delim>;
    return aux::token_range_<iterator>{iterator{str, delim}, iterator{}};
}

}     // namespace cuesplit


#endif  // CUESPLIT_INCLUDED_42AC81E2_C0CD_4231_B78B_2954D53E4DAA
