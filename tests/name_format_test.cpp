////////////////////////////////////////////////////////////////////////////////
//
// tests/name_format_test.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/error.hpp>

#include "media/name_format.hpp"

#include <algorithm>
#include <string>

#include <gtest/gtest.h>


using namespace ::cuesplit;


namespace {

media::name_fields nightfall()
{
    media::name_fields f;
    f.artist = "Blind Guardian";
    f.album = "Nightfall in Middle-Earth";
    f.title = "Nightfall";
    f.year = "1998";
    f.genre = "Power Metal";
    f.dir_name = "rips";
    f.ext = "flac";
    f.number = 3;
    f.number_width = 2;
    return f;
}

errc compile_error(char const* const s)
{
    try {
        media::name_format{s};
    }
    catch (error const& ex) {
        return ex.code();
    }
    return errc{};
}

}     // namespace <unnamed>


TEST(name_format_test, basic)
{
    media::name_format const fmt{"<no>. <title>.<ext>"};
    EXPECT_EQ(fmt(nightfall()), "03. Nightfall.flac");
}

TEST(name_format_test, default_template)
{
    media::name_format const fmt{media::default_name_format};
    EXPECT_EQ(fmt(nightfall()),
              "1998 - Nightfall in Middle-Earth/03. Nightfall.flac");
}

TEST(name_format_test, every_placeholder)
{
    media::name_format const fmt{
        "<dir-name>/<genre>/<artist>/<year>/<album>/<no> <title>.<ext>"};
    EXPECT_EQ(fmt(nightfall()),
              "rips/Power Metal/Blind Guardian/1998/"
              "Nightfall in Middle-Earth/03 Nightfall.flac");
}

TEST(name_format_test, placeholders_are_case_insensitive)
{
    media::name_format const fmt{"<NO> - <Title>.<EXT>"};
    EXPECT_EQ(fmt(nightfall()), "03 - Nightfall.flac");
}

TEST(name_format_test, number_padding)
{
    media::name_format const fmt{"<no>"};
    auto f = nightfall();

    f.number_width = 1;
    EXPECT_EQ(fmt(f), "3");

    f.number_width = 3;
    EXPECT_EQ(fmt(f), "003");

    f.number = 12;
    f.number_width = media::digit_count(12);
    EXPECT_EQ(fmt(f), "12");
}

TEST(name_format_test, values_never_add_directories)
{
    media::name_format const fmt{"<artist>/<title>.<ext>"};
    auto f = nightfall();
    f.artist = "AC/DC";
    f.title = "What? Where: \"Here\" <now> | \\back*";

    auto const path = fmt(f);
    EXPECT_EQ(path, "AC_DC/What_ Where_ _Here_ _now_ _ _back_.flac");
    EXPECT_EQ(std::count(path.begin(), path.end(), '/'), 1);
}

TEST(name_format_test, control_characters_in_values)
{
    media::name_format const fmt{"<title>"};
    auto f = nightfall();
    f.title = "tab\there\x01";
    EXPECT_EQ(fmt(f), "tab_here_");
}

TEST(name_format_test, illegal_characters_in_literals)
{
    media::name_format const fmt{"a:b*c?d\"e|f\\g/<title>"};
    EXPECT_EQ(fmt(nightfall()), "a_b_c_d_e_f_g/Nightfall");
}

TEST(name_format_test, trailing_spaces_and_periods)
{
    media::name_format const fmt{"<album>/<title>"};
    auto f = nightfall();
    f.album = "Greatest Hits Vol. ";
    f.title = "Outro...";
    EXPECT_EQ(fmt(f), "Greatest Hits Vol_/Outro_");
}

TEST(name_format_test, empty_values)
{
    media::name_format const fmt{"<year> - <album>/<genre>/<no>. <title>.<ext>"};
    auto f = nightfall();
    f.year.clear();
    f.genre.clear();
    f.title.clear();
    EXPECT_EQ(fmt(f), " - Nightfall in Middle-Earth/_/03. .flac");
}

TEST(name_format_test, dot_segments_are_neutralized)
{
    media::name_format const fmt{"<album>/<title>"};
    auto f = nightfall();
    f.album = "..";
    f.title = ".";
    EXPECT_EQ(fmt(f), "_/_");
}

TEST(name_format_test, unused_fields_are_not_needed)
{
    media::name_format const fmt{"<no>.<ext>"};
    media::name_fields f;
    f.number = 7;
    f.ext = "wav";
    EXPECT_EQ(fmt(f), "7.wav");
}

TEST(name_format_test, rendering_is_pure)
{
    media::name_format const fmt{media::default_name_format};
    auto const f = nightfall();
    EXPECT_EQ(fmt(f), fmt(f));
}

TEST(name_format_test, compile_errors)
{
    EXPECT_EQ(compile_error(""), errc::template_error);
    EXPECT_EQ(compile_error("   "), errc::template_error);
    EXPECT_EQ(compile_error("/abs/<title>"), errc::template_error);
    EXPECT_EQ(compile_error("<title"), errc::template_error);
    EXPECT_EQ(compile_error("title>"), errc::template_error);
    EXPECT_EQ(compile_error("<>"), errc::template_error);
    EXPECT_EQ(compile_error("<composer>"), errc::template_error);
    EXPECT_EQ(compile_error("<no>. <title>.<ext>"), errc{});
}

TEST(name_format_test, failed_compile_keeps_previous_template)
{
    media::name_format fmt{"<title>"};
    EXPECT_THROW(fmt.compile("<nope>"), error);
    EXPECT_EQ(fmt(nightfall()), "Nightfall");
}

TEST(name_format_test, extract_year)
{
    EXPECT_EQ(media::extract_year("1998"), "1998");
    EXPECT_EQ(media::extract_year("1998-04-28"), "1998");
    EXPECT_EQ(media::extract_year("28/04/1998"), "1998");
    EXPECT_EQ(media::extract_year(" unknown "), "unknown");
    EXPECT_EQ(media::extract_year(""), "");
}

TEST(name_format_test, sanitize_component)
{
    EXPECT_EQ(media::sanitize_component("AC/DC"), "AC_DC");
    EXPECT_EQ(media::sanitize_component("name. "), "name_");
    EXPECT_EQ(media::sanitize_component(""), "_");
}
