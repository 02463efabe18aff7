////////////////////////////////////////////////////////////////////////////////
//
// tests/job_test.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/error.hpp>
#include <cuesplit/scope_guard.hpp>

#include "core/filesystem.hpp"
#include "core/qstring.hpp"
#include "media/cue_sheet.hpp"
#include "media/name_format.hpp"
#include "split/job.hpp"
#include "split/preset.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <iterator>
#include <string>
#include <vector>

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QTemporaryDir>

#include <gtest/gtest.h>


using namespace ::cuesplit;
using namespace ::std::chrono_literals;


namespace {

char const two_tracks[] = R"(REM DATE 1998
TITLE "Nightfall in Middle-Earth"
PERFORMER "Blind Guardian"
FILE "image.wav" WAVE
  TRACK 01 AUDIO
    TITLE "War of Wrath"
    INDEX 01 00:00:00
  TRACK 02 AUDIO
    TITLE "Into the Storm"
    INDEX 00 01:48:00
    INDEX 01 01:50:37)";

class job_test :
    public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tmp.isValid());
        root = to_std_string(tmp.path());
        cue_path = fs::join(root, "album.cue");
        touch(fs::join(root, "image.wav"));
    }

    static void touch(std::string const& path)
    {
        QFile f{to_qstring(path)};
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    }

    std::vector<split::encode_job> plan(char const* const text,
                                        char const* const format = "<no>. <title>.<ext>")
    {
        auto const sheet = cue::parse(text);
        return split::plan_jobs(sheet, cue_path, media::name_format{format},
                                config, fs::join(root, "out"));
    }

    QTemporaryDir tmp;
    std::string root;
    std::string cue_path;
    split::encoder_config config =
        split::encoder_config::from_preset(split::find_preset("flac"));
};

errc error_code_of(std::function<void()> const& f)
{
    try {
        f();
    }
    catch (error const& ex) {
        return ex.code();
    }
    return errc{};
}

}     // namespace <unnamed>


TEST_F(job_test, one_job_per_track)
{
    auto const jobs = plan(two_tracks);
    ASSERT_EQ(jobs.size(), 2);

    EXPECT_EQ(jobs[0].number, 1);
    EXPECT_EQ(jobs[0].title, "War of Wrath");
    EXPECT_EQ(jobs[0].source, fs::join(root, "image.wav"));
    EXPECT_EQ(jobs[0].start, 0s);
    EXPECT_EQ(*jobs[0].duration, cue::parse_timecode("01:50:37"));
    EXPECT_EQ(jobs[0].output.path, fs::join(root, "out/1. War of Wrath.flac"));

    EXPECT_EQ(jobs[1].number, 2);
    EXPECT_EQ(jobs[1].start, cue::parse_timecode("01:50:37"));
    EXPECT_FALSE(jobs[1].duration.has_value());
    EXPECT_EQ(jobs[1].output.path, fs::join(root, "out/2. Into the Storm.flac"));
}

TEST_F(job_test, encoder_arguments)
{
    auto const jobs = plan(two_tracks);
    auto const source = fs::join(root, "image.wav");

    std::vector<std::string> const expected{
        "-hide_banner", "-nostdin", "-loglevel", "error", "-n",
        "-i", source,
        "-ss", "0",
        "-t", "110.493333",
        "-metadata", "ALBUM=Nightfall in Middle-Earth",
        "-metadata", "ARTIST=Blind Guardian",
        "-metadata", "PERFORMER=Blind Guardian",
        "-metadata", "ALBUM_ARTIST=Blind Guardian",
        "-metadata", "DATE=1998",
        "-metadata", "TITLE=War of Wrath",
        "-metadata", "TRACKNUMBER=1",
        "-metadata", "TRACKTOTAL=2",
        "-f", "flac", "-c:a", "flac", "-compression_level", "8",
        jobs[0].output.path,
    };
    EXPECT_EQ(jobs[0].args, expected);
}

TEST_F(job_test, last_track_runs_to_end_of_file)
{
    auto const jobs = plan(two_tracks);
    auto const& args = jobs[1].args;

    EXPECT_EQ(std::find(args.begin(), args.end(), "-t"), args.end());
    auto const ss = std::find(args.begin(), args.end(), "-ss");
    ASSERT_NE(ss, args.end());
    EXPECT_EQ(*std::next(ss), "110.493333");
}

TEST_F(job_test, known_file_length_sets_duration)
{
    auto const sheet = cue::with_file_length(cue::parse(two_tracks), 0,
                                             cue::parse_timecode("05:00:00"));
    auto const jobs = split::plan_jobs(sheet, cue_path,
                                       media::name_format{"<no>.<ext>"},
                                       config, root);
    ASSERT_TRUE(jobs[1].duration.has_value());
    EXPECT_EQ(split::make_encoder_args(jobs[1], config)[9], "-t");
}

TEST_F(job_test, overwrite_flag)
{
    config.overwrite = split::overwrite_policy::overwrite;
    EXPECT_EQ(plan(two_tracks)[0].args[4], "-y");

    config.overwrite = split::overwrite_policy::skip;
    EXPECT_EQ(plan(two_tracks)[0].args[4], "-n");
}

TEST_F(job_test, raw_encoder_arguments)
{
    config.codec_args = {"-c:a", "alac"};
    config.ext = "m4a";

    auto const jobs = plan(two_tracks);
    auto const& args = jobs[0].args;
    ASSERT_GE(args.size(), 3);
    EXPECT_EQ(args[args.size() - 3], "-c:a");
    EXPECT_EQ(args[args.size() - 2], "alac");
    EXPECT_EQ(args.back(), fs::join(root, "out/1. War of Wrath.m4a"));
}

TEST_F(job_test, pcm_source_is_copied_to_the_same_format)
{
    config = split::encoder_config::from_preset(split::find_preset("wav"));

    auto const jobs = plan(two_tracks);
    ASSERT_EQ(jobs.size(), 2);
    for (auto const& job : jobs) {
        EXPECT_TRUE(job.stream_copy);
        auto const& args = job.args;
        ASSERT_GE(args.size(), 3);
        EXPECT_EQ(args[args.size() - 3], "-c");
        EXPECT_EQ(args[args.size() - 2], "copy");
        EXPECT_EQ(std::find(args.begin(), args.end(), "-f"), args.end());
    }
    EXPECT_EQ(jobs[0].args[9], "-t");
}

TEST_F(job_test, stream_copy_needs_matching_pcm_source)
{
    auto const wav = fs::join(root, "image.wav");
    auto const flac = fs::join(root, "image.FLAC");

    config = split::encoder_config::from_preset(split::find_preset("wav"));
    EXPECT_TRUE(split::can_stream_copy(wav, config));
    EXPECT_TRUE(split::can_stream_copy(fs::join(root, "image.WAV"), config));

    config.stream_copy = false;
    EXPECT_FALSE(split::can_stream_copy(wav, config));
    EXPECT_FALSE(plan(two_tracks)[0].stream_copy);

    config = split::encoder_config::from_preset(split::find_preset("flac"));
    EXPECT_FALSE(split::can_stream_copy(wav, config));
    EXPECT_FALSE(split::can_stream_copy(flac, config));

    config = split::encoder_config{};
    config.codec_args = {"-c:a", "pcm_s16le"};
    config.ext = "wav";
    EXPECT_FALSE(split::can_stream_copy(wav, config));
}

TEST_F(job_test, padded_numbers_and_directories)
{
    auto const jobs = plan(two_tracks, "<year> - <album>/<no> <title>.<ext>");
    EXPECT_EQ(jobs[1].output.path,
              fs::join(root, "out/1998 - Nightfall in Middle-Earth/2 Into the Storm.flac"));
}

TEST_F(job_test, missing_source_file)
{
    char const text[] = R"(FILE "missing.wav" WAVE
  TRACK 01 AUDIO
    INDEX 01 00:00:00)";

    EXPECT_EQ(error_code_of([&]{ plan(text); }), errc::file_not_found);
}

TEST_F(job_test, duplicate_outputs)
{
    EXPECT_EQ(error_code_of([&]{ plan(two_tracks, "<album>.<ext>"); }),
              errc::config_error);
    EXPECT_EQ(error_code_of([&]{ plan(two_tracks, "<no>.<ext>"); }), errc{});
}

TEST_F(job_test, invalid_extension)
{
    config.ext = "fl ac";
    EXPECT_EQ(error_code_of([&]{ plan(two_tracks); }), errc::config_error);

    EXPECT_EQ(error_code_of([]{ split::validate_extension(""); }),
              errc::config_error);
    EXPECT_EQ(error_code_of([]{ split::validate_extension(".flac"); }),
              errc::config_error);
    EXPECT_EQ(error_code_of([]{ split::validate_extension("mp3"); }), errc{});
}

TEST_F(job_test, name_fields)
{
    auto const sheet = cue::parse(two_tracks);
    auto const& file = sheet.files[0];
    auto const f = split::make_name_fields(sheet, file, file.tracks[1],
                                           cue_path, "ogg");

    EXPECT_EQ(f.artist, "Blind Guardian");
    EXPECT_EQ(f.album, "Nightfall in Middle-Earth");
    EXPECT_EQ(f.title, "Into the Storm");
    EXPECT_EQ(f.year, "1998");
    EXPECT_EQ(f.dir_name, fs::filename(root));
    EXPECT_EQ(f.ext, "ogg");
    EXPECT_EQ(f.number, 2);
    EXPECT_EQ(f.number_width, 1);
}

TEST_F(job_test, dir_name_of_relative_cue_path)
{
    auto const sheet = cue::parse(two_tracks);
    auto const& file = sheet.files[0];
    auto const expected = fs::filename(fs::canonical(root));

    fs::create_directories(fs::join(root, "sub"));
    auto f = split::make_name_fields(sheet, file, file.tracks[0],
                                     fs::join(root, "sub/../album.cue"), "flac");
    EXPECT_EQ(f.dir_name, expected);

    auto const previous = QDir::currentPath();
    ASSERT_TRUE(QDir::setCurrent(tmp.path()));
    CUESPLIT_SCOPE_EXIT { QDir::setCurrent(previous); };

    f = split::make_name_fields(sheet, file, file.tracks[0], "./album.cue",
                                "flac");
    EXPECT_EQ(f.dir_name, expected);

    f = split::make_name_fields(sheet, file, file.tracks[0], "album.cue",
                                "flac");
    EXPECT_EQ(f.dir_name, expected);
}

TEST(job_planning_test, default_out_dir)
{
    EXPECT_EQ(split::default_out_dir("/music/album.cue"), "/music/split");
    EXPECT_EQ(split::default_out_dir("album.cue"), "./split");
}
