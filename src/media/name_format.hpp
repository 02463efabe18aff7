////////////////////////////////////////////////////////////////////////////////
//
// media/name_format.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_6A2EA3F0_3C99_4FED_8681_7E6756ABB1AF
#define CUESPLIT_INCLUDED_6A2EA3F0_3C99_4FED_8681_7E6756ABB1AF


#include <cuesplit/stddef.hpp>

#include <string>
#include <string_view>
#include <vector>


namespace cuesplit {
namespace media {

constexpr char const default_name_format[] =
    "<year> - <album>/<no>. <title>.<ext>";

constexpr char const name_format_help[] =
    "Templates control the names of the generated files.\n"
    "Placeholders inside angle brackets are replaced with track metadata:\n"
    "  <artist>    track performer\n"
    "  <album>     album title\n"
    "  <title>     track title\n"
    "  <no>        track number, padded with zeroes to the widest number\n"
    "  <year>      release year taken from the cue sheet date\n"
    "  <genre>     album genre\n"
    "  <dir-name>  name of the directory containing the cue sheet\n"
    "  <ext>       file extension without the leading dot\n"
    "Placeholder names are case-insensitive; any other name is an error.\n"
    "A '/' in the template starts a sub-directory. Characters that are not\n"
    "allowed in file names are replaced with '_'.\n";


struct name_fields
{
    std::string artist;
    std::string album;
    std::string title;
    std::string year;
    std::string genre;
    std::string dir_name;
    std::string ext;
    uint number{};
    uint number_width{1};
};


class name_format
{
public:
    name_format() = default;

    explicit name_format(std::string_view const s)
    {
        compile(s);
    }

    // Validates the whole template; throws errc::template_error.
    void compile(std::string_view);

    // Renders a relative path. Pure: depends only on the template and fields.
    std::string operator()(name_fields const&) const;

private:
    enum class field : uint8 {
        none,
        artist,
        album,
        title,
        year,
        genre,
        number,
        dir_name,
        ext,
    };

    struct token
    {
        field key;
        std::string text;
    };

    static field find_field_(std::string_view) noexcept;

    std::vector<token> tokens_;
};


// Number of decimal digits in a track number.
uint digit_count(uint) noexcept;

// The longest run of digits in a cue sheet date, or the date itself when it
// holds none.
std::string extract_year(std::string_view);

// Replaces characters that cannot appear in a file name component.
std::string sanitize_component(std::string_view);

}}    // namespace cuesplit::media


#endif  // CUESPLIT_INCLUDED_6A2EA3F0_3C99_4FED_8681_7E6756ABB1AF
