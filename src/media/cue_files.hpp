////////////////////////////////////////////////////////////////////////////////
//
// media/cue_files.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_4D0B5F0C_0E39_4E0B_9C55_7E7C3F04A0D1
#define CUESPLIT_INCLUDED_4D0B5F0C_0E39_4E0B_9C55_7E7C3F04A0D1


#include <cuesplit/stddef.hpp>

#include "media/cue_sheet.hpp"

#include <string>
#include <string_view>
#include <vector>


namespace cuesplit {
namespace cue {

// Reads, decodes and parses a cue sheet file.
cue::sheet load(std::string const&, std::string_view encoding = {});

// A regular file is returned as is; a directory is searched recursively for
// files with a ".cue" extension, sorted by path. Throws errc::file_not_found
// when nothing is found.
std::vector<std::string> find_cue_sheets(std::string const&);

bool is_cue_sheet(std::string const&);

}}    // namespace cuesplit::cue


#endif  // CUESPLIT_INCLUDED_4D0B5F0C_0E39_4E0B_9C55_7E7C3F04A0D1
