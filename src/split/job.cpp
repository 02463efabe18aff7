////////////////////////////////////////////////////////////////////////////////
//
// split/job.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/error.hpp>
#include <cuesplit/stddef.hpp>
#include <cuesplit/string.hpp>

#include "core/filesystem.hpp"
#include "core/logging.hpp"
#include "core/qstring.hpp"
#include "media/cue_sheet.hpp"
#include "media/name_format.hpp"
#include "media/tags.hpp"
#include "media/timecode.hpp"
#include "split/job.hpp"
#include "split/preset.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>


namespace cuesplit {
namespace split {
namespace {

std::string cue_directory(std::string const& cue_path)
{
    auto dir = fs::parent_path(cue_path);
    return dir.empty() ? std::string{"."} : dir;
}

std::string directory_name(std::string const& cue_path)
{
    auto const dir = cue_directory(cue_path);
    try {
        return fs::filename(fs::canonical(dir));
    }
    catch (std::system_error const& ex) {
        qCDebug(lcSplit) << "cannot resolve" << dir.c_str() << ":" << ex.what();
        return fs::filename(fs::absolute(dir));
    }
}

void check_source(std::string const& source, std::string const& cue_path)
{
    if (!fs::is_regular_file(source)) {
        raise(errc::file_not_found, "'%s' referenced by '%s' does not exist",
              source.c_str(), cue_path.c_str());
    }
}

}     // namespace <unnamed>


char const* to_string(overwrite_policy const policy) noexcept
{
    switch (policy) {
    case overwrite_policy::fail:      return "fail";
    case overwrite_policy::overwrite: return "overwrite";
    case overwrite_policy::skip:      return "skip";
    }
    CUESPLIT_UNREACHABLE();
}


encoder_config encoder_config::from_preset(split::preset const& p)
{
    encoder_config config;
    config.codec_args = p.args;
    config.ext = std::string{p.ext};
    config.stream_copy = true;
    return config;
}


std::string default_out_dir(std::string const& cue_path)
{
    return fs::join(cue_directory(cue_path), "split");
}

void validate_extension(std::string_view const ext)
{
    if (ext.empty()) {
        raise(errc::config_error, "the output extension must not be empty");
    }
    if (!std::all_of(ext.begin(), ext.end(), ascii_isalnum)) {
        raise(errc::config_error,
              "the output extension must be alphanumeric: \"%.*s\"",
              static_cast<int>(ext.size()), ext.data());
    }
}

media::name_fields make_name_fields(cue::sheet const& sheet,
                                    cue::file_section const& file,
                                    cue::track const& track,
                                    std::string const& cue_path,
                                    std::string const& ext)
{
    media::name_fields fields;
    fields.artist   = track.performer;
    fields.album    = !file.title.empty() ? file.title : sheet.title;
    fields.title    = track.title;
    fields.year     = media::extract_year(sheet.date);
    fields.genre    = sheet.genre;
    fields.dir_name = directory_name(cue_path);
    fields.ext      = ext;
    fields.number   = track.number;
    fields.number_width = media::digit_count(sheet.max_track_number());
    return fields;
}

std::vector<std::string> make_encoder_args(encode_job const& job,
                                           encoder_config const& config)
{
    std::vector<std::string> args{
        "-hide_banner", "-nostdin", "-loglevel", "error",
        (config.overwrite == overwrite_policy::overwrite) ? "-y" : "-n",
        "-i", job.source,
        "-ss", cue::format_seconds(job.start),
    };
    if (job.duration) {
        args.insert(args.end(), {"-t", cue::format_seconds(*job.duration)});
    }
    for (auto const& [key, value] : job.output.tags) {
        args.push_back("-metadata");
        args.push_back(key + '=' + value);
    }
    if (job.stream_copy) {
        args.insert(args.end(), {"-c", "copy"});
    }
    else {
        args.insert(args.end(), config.codec_args.begin(),
                                config.codec_args.end());
    }
    args.push_back(job.output.path);
    return args;
}

bool can_stream_copy(std::string const& source, encoder_config const& config)
{
    auto const ext = fs::extension(source);
    return config.stream_copy
        && stricmpeq(ext, config.ext)
        && stricmpeq(ext, "wav");
}

void check_unique_outputs(std::vector<encode_job> const& jobs)
{
    std::map<std::string_view, uint> seen;
    for (auto const& job : jobs) {
        auto const [pos, inserted] = seen.emplace(job.output.path, job.number);
        if (!inserted) {
            raise(errc::config_error,
                  "tracks %02u and %02u would both be written to '%s'",
                  pos->second, job.number, job.output.path.c_str());
        }
    }
}

std::vector<encode_job> plan_jobs(cue::sheet const& sheet,
                                  std::string const& cue_path,
                                  media::name_format const& format,
                                  encoder_config const& config,
                                  std::string const& out_dir)
{
    validate_extension(config.ext);

    auto const cue_dir = cue_directory(cue_path);

    std::vector<encode_job> jobs;
    jobs.reserve(sheet.track_count());

    for (auto const& file : sheet.files) {
        if (file.tracks.empty()) {
            continue;
        }

        auto const source = fs::join(cue_dir, file.path);
        check_source(source, cue_path);

        auto const copy = can_stream_copy(source, config);
        if (copy) {
            qCDebug(lcSplit) << "copying tracks of" << to_qstring(source)
                             << "without encoding";
        }

        for (auto const& track : file.tracks) {
            auto const fields = make_name_fields(sheet, file, track,
                                                 cue_path, config.ext);
            encode_job job;
            job.number = track.number;
            job.title = track.title;
            job.source = source;
            job.start = track.start;
            job.duration = track.length();
            job.output.path = fs::join(out_dir, format(fields));
            job.output.tags = tags::collect(sheet, file, track);
            job.stream_copy = copy;
            job.args = make_encoder_args(job, config);

            qCDebug(lcSplit).noquote()
                << "track" << track.number << ":" << to_qstring(config.program)
                << to_qstringlist(job.args).join(QLatin1Char(' '));
            jobs.push_back(std::move(job));
        }
    }

    check_unique_outputs(jobs);
    return jobs;
}

}}    // namespace cuesplit::split
