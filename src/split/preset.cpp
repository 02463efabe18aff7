////////////////////////////////////////////////////////////////////////////////
//
// split/preset.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/error.hpp>
#include <cuesplit/stddef.hpp>
#include <cuesplit/string.hpp>

#include "split/preset.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>


namespace cuesplit {
namespace split {
namespace {

std::vector<preset> make_presets()
{
    auto flac = [](char const* const level) {
        return std::vector<std::string>{
            "-f", "flac", "-c:a", "flac", "-compression_level", level};
    };
    auto bitrate = [](char const* const format, char const* const codec,
                      char const* const rate) {
        return std::vector<std::string>{
            "-f", format, "-c:a", codec, "-b:a", rate};
    };
    auto quality = [](char const* const q) {
        return std::vector<std::string>{
            "-f", "oga", "-c:a", "libvorbis", "-q", q};
    };

    auto fdk_ultra = bitrate("mp4", "libfdk_aac", "256k");
    fdk_ultra.insert(fdk_ultra.end(), {"-cutoff", "18000"});

    return {
        { "wav",              "wav",  {"-f", "wav"} },
        { "flac",             "flac", flac("8") },
        { "flac-comp10",      "flac", flac("10") },
        { "libopus-low",      "ogg",  bitrate("oga", "libopus", "48k") },
        { "libopus",          "ogg",  bitrate("oga", "libopus", "128k") },
        { "libopus-high",     "ogg",  bitrate("oga", "libopus", "192k") },
        { "libopus-ultra",    "ogg",  bitrate("oga", "libopus", "256k") },
        { "libmp3lame-low",   "mp3",  bitrate("mp3", "libmp3lame", "64k") },
        { "libmp3lame",       "mp3",  bitrate("mp3", "libmp3lame", "128k") },
        { "libmp3lame-high",  "mp3",  bitrate("mp3", "libmp3lame", "224k") },
        { "libmp3lame-ultra", "mp3",  bitrate("mp3", "libmp3lame", "320k") },
        { "libfdk-aac-low",   "m4a",  bitrate("mp4", "libfdk_aac", "64k") },
        { "libfdk-aac",       "m4a",  bitrate("mp4", "libfdk_aac", "128k") },
        { "libfdk-aac-high",  "m4a",  bitrate("mp4", "libfdk_aac", "192k") },
        { "libfdk-aac-ultra", "m4a",  std::move(fdk_ultra) },
        { "libvorbis-low",    "ogg",  quality("2.0") },
        { "libvorbis",        "ogg",  quality("5.0") },
        { "libvorbis-high",   "ogg",  quality("6.5") },
        { "libvorbis-ultra",  "ogg",  quality("8.0") },
    };
}

}     // namespace <unnamed>


std::vector<preset> const& presets()
{
    static auto const table = make_presets();
    return table;
}

preset const& find_preset(std::string_view const name)
{
    auto const& table = presets();
    auto const it = std::find_if(table.begin(), table.end(),
        [&](auto const& x) { return stricmpeq(x.name, name); });
    if (it == table.end()) {
        raise(errc::config_error, "unknown preset: \"%.*s\"",
              static_cast<int>(name.size()), name.data());
    }
    return *it;
}

std::string describe_presets()
{
    auto const& table = presets();
    auto width = std::size_t{0};
    for (auto const& x : table) {
        width = std::max(width, x.name.size());
    }

    std::string ret;
    for (auto const& x : table) {
        ret.append(x.name.data(), x.name.size());
        ret.append(width - x.name.size() + 2, ' ');
        for (auto const& arg : x.args) {
            ret += arg;
            ret += ' ';
        }
        ret.pop_back();
        ret += '\n';
    }
    return ret;
}

}}    // namespace cuesplit::split
