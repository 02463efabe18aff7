////////////////////////////////////////////////////////////////////////////////
//
// media/tags.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_995A379C_4CE1_42EA_9590_3136444A2126
#define CUESPLIT_INCLUDED_995A379C_4CE1_42EA_9590_3136444A2126


#include <cuesplit/stddef.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace cuesplit {
namespace cue {
    struct file_section;
    struct sheet;
    struct track;
}


namespace tags {

using namespace ::std::literals;

constexpr auto album        = "ALBUM"sv;
constexpr auto album_artist = "ALBUM_ARTIST"sv;
constexpr auto artist       = "ARTIST"sv;
constexpr auto performer    = "PERFORMER"sv;
constexpr auto songwriter   = "SONGWRITER"sv;
constexpr auto genre        = "GENRE"sv;
constexpr auto date         = "DATE"sv;
constexpr auto title        = "TITLE"sv;
constexpr auto isrc         = "ISRC"sv;
constexpr auto track_number = "TRACKNUMBER"sv;
constexpr auto track_total  = "TRACKTOTAL"sv;


// Ordered key/value pairs. Keys compare case-insensitively.
using tag_list = std::vector<std::pair<std::string, std::string>>;

// Replaces the value of an existing key in place, or appends a new entry.
// Empty values are ignored.
void assign(tag_list&, std::string_view, std::string_view);

// The tags written for one track, from the least to the most specific scope.
tag_list collect(cue::sheet const&, cue::file_section const&,
                 cue::track const&);

}}    // namespace cuesplit::tags


#endif  // CUESPLIT_INCLUDED_995A379C_4CE1_42EA_9590_3136444A2126
