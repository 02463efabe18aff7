////////////////////////////////////////////////////////////////////////////////
//
// core/text_codec.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_33B6B76F_EB65_4319_9A60_F92282BA412B
#define CUESPLIT_INCLUDED_33B6B76F_EB65_4319_9A60_F92282BA412B


#include <cuesplit/stddef.hpp>

#include <string>
#include <string_view>


namespace cuesplit {

// Converts raw text to UTF-8. A byte order mark wins over the named encoding;
// without either, valid UTF-8 is kept and anything else is decoded with the
// locale's codec. Throws errc::config_error for an unknown encoding name.
std::string decode_text(std::string_view bytes, std::string_view encoding = {});

bool is_known_encoding(std::string_view) noexcept;

}     // namespace cuesplit


#endif  // CUESPLIT_INCLUDED_33B6B76F_EB65_4319_9A60_F92282BA412B
