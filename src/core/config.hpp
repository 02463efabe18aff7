////////////////////////////////////////////////////////////////////////////////
//
// core/config.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_E793B5F7_F72C_48B8_9D8E_6B54DC864B50
#define CUESPLIT_INCLUDED_E793B5F7_F72C_48B8_9D8E_6B54DC864B50


#include <cuesplit/stddef.hpp>

#include <optional>
#include <string>


namespace cuesplit {
namespace config {

template<typename T>
struct entry;

template<>
struct entry<std::string>
{
    std::optional<std::string> load() const;
    void store(std::string const&) const;

    char const* key;
};

template<>
struct entry<int>
{
    // Throws errc::config_error when the stored value is not an integer.
    std::optional<int> load() const;
    void store(int) const;

    char const* key;
};


// Reads settings from the given INI file instead of the per-user
// "cuesplit/cuesplit.conf".
void use_file(std::string);

std::string file_name();

}   // namespace config


namespace split {
namespace settings {

extern config::entry<std::string> const name_format;
extern config::entry<std::string> const preset;
extern config::entry<int>         const jobs;
extern config::entry<std::string> const out_dir;
extern config::entry<std::string> const encoder_program;
extern config::entry<int>         const encoder_timeout;

}}}   // namespace cuesplit::split::settings


#endif  // CUESPLIT_INCLUDED_E793B5F7_F72C_48B8_9D8E_6B54DC864B50
