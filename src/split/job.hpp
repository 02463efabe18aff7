////////////////////////////////////////////////////////////////////////////////
//
// split/job.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_7A9D3C61_4B0E_4E85_9F12_D86B2C0A47E3
#define CUESPLIT_INCLUDED_7A9D3C61_4B0E_4E85_9F12_D86B2C0A47E3


#include <cuesplit/stddef.hpp>

#include "media/cue_sheet.hpp"
#include "media/name_format.hpp"
#include "media/tags.hpp"
#include "media/timecode.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace cuesplit {
namespace split {

struct preset;


enum class overwrite_policy : uint8 {
    fail,
    overwrite,
    skip,
};

char const* to_string(overwrite_policy) noexcept;


struct encoder_config
{
    std::string program{"ffmpeg"};
    std::vector<std::string> codec_args;
    std::string ext;
    overwrite_policy overwrite{overwrite_policy::fail};
    std::optional<std::chrono::milliseconds> timeout;

    // Copy PCM sources that already have the output extension instead of
    // encoding them again.
    bool stream_copy{false};

    static encoder_config from_preset(split::preset const&);
};


struct output_spec
{
    std::string path;
    tags::tag_list tags;
};


struct encode_job
{
    uint number{};
    std::string title;
    std::string source;
    cue::frames start{};
    std::optional<cue::frames> duration;
    output_spec output;
    bool stream_copy{false};
    std::vector<std::string> args;
};


// Builds one job per track. Source files are resolved against the cue
// sheet's directory and rendered names against the output directory.
// Throws errc::file_not_found for a missing source file and
// errc::config_error when two tracks share an output path.
std::vector<encode_job> plan_jobs(cue::sheet const&,
                                  std::string const& cue_path,
                                  media::name_format const&,
                                  encoder_config const&,
                                  std::string const& out_dir);

media::name_fields make_name_fields(cue::sheet const&,
                                    cue::file_section const&,
                                    cue::track const&,
                                    std::string const& cue_path,
                                    std::string const& ext);

std::vector<std::string> make_encoder_args(encode_job const&,
                                           encoder_config const&);

// True when the source can be cut without decoding: stream copy is enabled,
// the source is a WAV file and the output extension is wav as well.
bool can_stream_copy(std::string const& source, encoder_config const&);

void check_unique_outputs(std::vector<encode_job> const&);

// Throws errc::config_error unless the extension is non-empty and
// alphanumeric.
void validate_extension(std::string_view);

std::string default_out_dir(std::string const& cue_path);

}}    // namespace cuesplit::split


#endif  // CUESPLIT_INCLUDED_7A9D3C61_4B0E_4E85_9F12_D86B2C0A47E3
