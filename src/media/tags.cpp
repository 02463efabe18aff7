////////////////////////////////////////////////////////////////////////////////
//
// media/tags.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/stddef.hpp>
#include <cuesplit/string.hpp>

#include "media/cue_sheet.hpp"
#include "media/tags.hpp"

#include <algorithm>
#include <string>
#include <string_view>


namespace cuesplit {
namespace tags {
namespace {

void assign_all(tag_list& tags, cue::remarks const& remarks)
{
    for (auto const& [key, value] : remarks) {
        tags::assign(tags, key, value);
    }
}

template<typename T>
std::string const& first_non_empty(T const& x, T const& y) noexcept
{
    return !x.empty() ? x : y;
}

}     // namespace <unnamed>


void assign(tag_list& tags, std::string_view const key,
            std::string_view const value)
{
    if (value.empty()) {
        return;
    }

    auto const it = std::find_if(tags.begin(), tags.end(),
        [&](auto const& x) { return stricmpeq(x.first, key); });
    if (it != tags.end()) {
        it->second = value;
    }
    else {
        tags.emplace_back(key, value);
    }
}

tag_list collect(cue::sheet const& sheet, cue::file_section const& file,
                 cue::track const& track)
{
    tag_list tags;
    assign_all(tags, sheet.remarks);
    assign_all(tags, file.remarks);

    auto const& album_artist = first_non_empty(file.performer, sheet.performer);

    tags::assign(tags, album,      first_non_empty(file.title, sheet.title));
    tags::assign(tags, artist,     track.performer);
    tags::assign(tags, performer,  track.performer);
    tags::assign(tags, tags::album_artist, album_artist);
    tags::assign(tags, songwriter, track.songwriter);
    tags::assign(tags, genre,      sheet.genre);
    tags::assign(tags, date,       sheet.date);

    assign_all(tags, track.remarks);

    tags::assign(tags, title,        track.title);
    tags::assign(tags, isrc,         track.isrc);
    tags::assign(tags, track_number, std::to_string(track.number));
    tags::assign(tags, track_total,  std::to_string(sheet.track_count()));
    return tags;
}

}}    // namespace cuesplit::tags
