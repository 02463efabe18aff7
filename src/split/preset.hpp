////////////////////////////////////////////////////////////////////////////////
//
// split/preset.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_2F7D1E4A_90B3_4C27_8C1E_5A3B9D0E6F21
#define CUESPLIT_INCLUDED_2F7D1E4A_90B3_4C27_8C1E_5A3B9D0E6F21


#include <cuesplit/stddef.hpp>

#include <string>
#include <string_view>
#include <vector>


namespace cuesplit {
namespace split {

struct preset
{
    std::string_view name;
    std::string_view ext;
    std::vector<std::string> args;
};

constexpr char const default_preset[] = "flac";

// Every preset, in listing order.
std::vector<preset> const& presets();

// Throws errc::config_error for an unknown name.
preset const& find_preset(std::string_view);

// One line per preset: the name followed by its encoder arguments.
std::string describe_presets();

}}    // namespace cuesplit::split


#endif  // CUESPLIT_INCLUDED_2F7D1E4A_90B3_4C27_8C1E_5A3B9D0E6F21
