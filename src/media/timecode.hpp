////////////////////////////////////////////////////////////////////////////////
//
// media/timecode.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_1CE196B7_BD4B_4229_87E4_8FF8E5600DF4
#define CUESPLIT_INCLUDED_1CE196B7_BD4B_4229_87E4_8FF8E5600DF4


#include <cuesplit/stddef.hpp>

#include <chrono>
#include <ratio>
#include <string>
#include <string_view>


namespace cuesplit {
namespace cue {

// Compact disc audio frames; 75 per second.
using frames = std::chrono::duration<uint64, std::ratio<1, 75>>;

constexpr auto frames_per_second = frames::period::den;


// Parses "MM:SS:FF". Throws errc::parse_error on malformed text, seconds
// >= 60 or frames >= 75.
frames parse_timecode(std::string_view);

// Formats as "MM:SS:FF"; minutes are widened past two digits when needed.
std::string format_timecode(frames);

// Decimal seconds with at most microsecond precision, as accepted by the
// encoder's -ss and -t options.
std::string format_seconds(frames);

}}    // namespace cuesplit::cue


#endif  // CUESPLIT_INCLUDED_1CE196B7_BD4B_4229_87E4_8FF8E5600DF4
