////////////////////////////////////////////////////////////////////////////////
//
// cuesplit/stddef.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_EBBA7BBC_B666_4D84_8799_E8D0985F17D3
#define CUESPLIT_INCLUDED_EBBA7BBC_B666_4D84_8799_E8D0985F17D3


#include <cuesplit/aux/features.hpp>

#include <cstdint>


namespace cuesplit {

using uchar   = unsigned char;
using uint    = unsigned int;
using ullong  = unsigned long long;

using int32   = ::std::int32_t;
using int64   = ::std::int64_t;

using uint8   = ::std::uint8_t;
using uint32  = ::std::uint32_t;
using uint64  = ::std::uint64_t;


inline namespace literals {

CUESPLIT_INLINE constexpr auto operator"" _sz(ullong const x) noexcept
{
    return static_cast<decltype(sizeof(x))>(x);
}

}}    // inline namespace cuesplit::literals


#endif  // CUESPLIT_INCLUDED_EBBA7BBC_B666_4D84_8799_E8D0985F17D3
