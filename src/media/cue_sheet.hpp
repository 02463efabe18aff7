////////////////////////////////////////////////////////////////////////////////
//
// media/cue_sheet.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_F8C6863D_7DB9_4122_AD06_730036796D2E
#define CUESPLIT_INCLUDED_F8C6863D_7DB9_4122_AD06_730036796D2E


#include <cuesplit/stddef.hpp>

#include "media/timecode.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace cuesplit {
namespace cue {

// REM entries, ordered by key.
using remarks = std::map<std::string, std::string>;


struct track
{
    uint number{};
    std::string title;
    std::string performer;
    std::string songwriter;
    std::string isrc;
    cue::remarks remarks;

    cue::frames start{};
    std::optional<cue::frames> pregap;
    std::optional<cue::frames> end;

    std::optional<cue::frames> length() const
    {
        if (end) {
            return *end - start;
        }
        return std::nullopt;
    }
};


struct file_section
{
    std::string path;
    std::string type;
    std::string title;
    std::string performer;
    std::string songwriter;
    cue::remarks remarks;
    std::vector<cue::track> tracks;
};


struct sheet
{
    std::string title;
    std::string performer;
    std::string songwriter;
    std::string genre;
    std::string date;
    std::string catalog;
    cue::remarks remarks;
    std::vector<cue::file_section> files;

    std::size_t track_count() const noexcept;
    uint max_track_number() const noexcept;
};


// Parses UTF-8 cue sheet text. The end of every track but the last one of
// each file section is resolved from the start of its successor. Throws
// errc::parse_error with the offending line on the first structural error.
cue::sheet parse(std::string_view);

// Returns a copy of the sheet in which the last track of the given file
// section ends at the supplied audio file length.
cue::sheet with_file_length(cue::sheet, std::size_t, cue::frames);

}}    // namespace cuesplit::cue


#endif  // CUESPLIT_INCLUDED_F8C6863D_7DB9_4122_AD06_730036796D2E
