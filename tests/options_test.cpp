////////////////////////////////////////////////////////////////////////////////
//
// tests/options_test.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/error.hpp>

#include "app/options.hpp"
#include "core/filesystem.hpp"
#include "core/qstring.hpp"
#include "media/name_format.hpp"
#include "split/job.hpp"
#include "split/preset.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <QtCore/QFile>
#include <QtCore/QStringList>
#include <QtCore/QTemporaryDir>

#include <gtest/gtest.h>


using namespace ::cuesplit;
using namespace ::std::chrono_literals;


namespace {

class options_test :
    public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tmp.isValid());
        config_path = fs::join(to_std_string(tmp.path()), "cuesplit.conf");
    }

    void write_config(char const* const content)
    {
        QFile f{to_qstring(config_path)};
        ASSERT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
        f.write(content);
    }

    app::options parse(QStringList args) const
    {
        args.prepend(to_qstring(config_path));
        args.prepend(QStringLiteral("--config"));
        args.prepend(QStringLiteral("cuesplit"));
        return app::parse_options(args);
    }

    errc error_code_of(QStringList const& args) const
    {
        try {
            parse(args);
        }
        catch (error const& ex) {
            return ex.code();
        }
        return errc{};
    }

    QTemporaryDir tmp;
    std::string config_path;
};

}     // namespace <unnamed>


TEST_F(options_test, defaults)
{
    auto const opts = parse({"album.cue"});
    EXPECT_EQ(opts.action, app::action::split);
    EXPECT_EQ(opts.path, "album.cue");
    EXPECT_EQ(opts.jobs, 0);
    EXPECT_FALSE(opts.dry_run);
    EXPECT_FALSE(opts.verbose);
    EXPECT_EQ(opts.name_format, media::default_name_format);
    EXPECT_EQ(opts.out_dir, "");
    EXPECT_EQ(opts.encoding, "");

    auto const& enc = opts.encoder;
    EXPECT_EQ(enc.program, "ffmpeg");
    EXPECT_EQ(enc.ext, "flac");
    EXPECT_EQ(enc.codec_args, split::find_preset("flac").args);
    EXPECT_EQ(enc.overwrite, split::overwrite_policy::fail);
    EXPECT_FALSE(enc.timeout.has_value());
    EXPECT_TRUE(enc.stream_copy);
}

TEST_F(options_test, stream_copy)
{
    EXPECT_FALSE(parse({"--no-copy", "album.cue"}).encoder.stream_copy);
    EXPECT_TRUE(parse({"-p", "wav", "album.cue"}).encoder.stream_copy);
    EXPECT_FALSE(parse({"--ext", "wav", "album.cue", "--",
                        "-c:a", "pcm_s24le"}).encoder.stream_copy);
}

TEST_F(options_test, explicit_options)
{
    auto const opts = parse({
        "-j", "4", "--dry", "-f", "-t", "<no>.<ext>", "-o", "/out",
        "-p", "libmp3lame-high", "--ffmpeg", "/opt/ffmpeg", "--timeout", "90",
        "--encoding", "windows-1251", "-v", "rips",
    });

    EXPECT_EQ(opts.path, "rips");
    EXPECT_EQ(opts.jobs, 4);
    EXPECT_TRUE(opts.dry_run);
    EXPECT_TRUE(opts.verbose);
    EXPECT_EQ(opts.name_format, "<no>.<ext>");
    EXPECT_EQ(opts.out_dir, "/out");
    EXPECT_EQ(opts.encoding, "windows-1251");
    EXPECT_EQ(opts.encoder.program, "/opt/ffmpeg");
    EXPECT_EQ(opts.encoder.ext, "mp3");
    EXPECT_EQ(opts.encoder.overwrite, split::overwrite_policy::overwrite);
    EXPECT_EQ(*opts.encoder.timeout, 90s);
}

TEST_F(options_test, no_overwrite)
{
    auto const opts = parse({"-n", "album.cue"});
    EXPECT_EQ(opts.encoder.overwrite, split::overwrite_policy::skip);
}

TEST_F(options_test, raw_encoder_arguments)
{
    auto const opts = parse({"--ext", "m4a", "album.cue", "--",
                             "-c:a", "alac", "-f", "ipod"});
    EXPECT_EQ(opts.path, "album.cue");
    EXPECT_EQ(opts.encoder.ext, "m4a");
    EXPECT_EQ(opts.encoder.codec_args,
              (std::vector<std::string>{"-c:a", "alac", "-f", "ipod"}));
}

TEST_F(options_test, settings_fill_in_defaults)
{
    write_config("[split]\n"
                 "template=<artist> - <title>.<ext>\n"
                 "preset=wav\n"
                 "jobs=2\n"
                 "[encoder]\n"
                 "program=/usr/bin/ffmpeg\n"
                 "timeout=30\n");

    auto const opts = parse({"album.cue"});
    EXPECT_EQ(opts.name_format, "<artist> - <title>.<ext>");
    EXPECT_EQ(opts.encoder.ext, "wav");
    EXPECT_EQ(opts.jobs, 2);
    EXPECT_EQ(opts.encoder.program, "/usr/bin/ffmpeg");
    EXPECT_EQ(*opts.encoder.timeout, 30s);

    auto const overridden = parse({"-j", "6", "-p", "flac", "album.cue"});
    EXPECT_EQ(overridden.jobs, 6);
    EXPECT_EQ(overridden.encoder.ext, "flac");
}

TEST_F(options_test, informational_actions)
{
    EXPECT_EQ(parse({"--list-presets"}).action, app::action::list_presets);
    EXPECT_EQ(parse({"--template-help"}).action, app::action::template_help);
    EXPECT_EQ(parse({"--help"}).action, app::action::show_help);
    EXPECT_FALSE(parse({"--help"}).help_text.empty());
}

TEST_F(options_test, invalid_combinations)
{
    EXPECT_EQ(error_code_of({"-f", "-n", "a.cue"}), errc::config_error);
    EXPECT_EQ(error_code_of({"-p", "flac", "a.cue", "--", "-c:a", "alac"}),
              errc::config_error);
    EXPECT_EQ(error_code_of({"a.cue", "--", "-c:a", "alac"}),
              errc::config_error);
    EXPECT_EQ(error_code_of({"-e", "m4a", "a.cue"}), errc::config_error);
    EXPECT_EQ(error_code_of({"-e", "m 4a", "a.cue", "--", "-c:a", "alac"}),
              errc::config_error);
    EXPECT_EQ(error_code_of({"-p", "no-such-preset", "a.cue"}),
              errc::config_error);
    EXPECT_EQ(error_code_of({"-j", "0", "a.cue"}), errc::config_error);
    EXPECT_EQ(error_code_of({"--timeout", "-5", "a.cue"}), errc::config_error);
    EXPECT_EQ(error_code_of({"--encoding", "no-such-charset", "a.cue"}),
              errc::config_error);
    EXPECT_EQ(error_code_of({"--no-such-option", "a.cue"}), errc::config_error);
    EXPECT_EQ(error_code_of({}), errc::config_error);
    EXPECT_EQ(error_code_of({"a.cue", "b.cue"}), errc::config_error);
}
