////////////////////////////////////////////////////////////////////////////////
//
// media/cue_sheet.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/error.hpp>
#include <cuesplit/stddef.hpp>
#include <cuesplit/string.hpp>

#include "media/cue_sheet.hpp"
#include "media/timecode.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace cuesplit {
namespace cue {
namespace {

constexpr auto max_track_number = 99u;
constexpr auto max_index_number = 99u;

constexpr char const utf8_bom[] = "\xEF\xBB\xBF";


auto read_token(std::string_view& line) noexcept
{
    auto const pos = line.find_first_of(" \t");
    auto const ret = line.substr(0, pos);

    line = trim_left(line.substr(std::min(pos, line.size())));
    return ret;
}

std::optional<uint> parse_number(std::string_view const text) noexcept
{
    if (text.empty() || text.size() > 9) {
        return std::nullopt;
    }

    uint number = 0;
    for (auto const c : text) {
        if (!ascii_isdigit(c)) {
            return std::nullopt;
        }
        number = (number * 10) + static_cast<uint>(c - '0');
    }
    return number;
}


class parser
{
public:
    explicit parser(std::string_view);

    cue::sheet sheet;

private:
    template<typename... Args>
    [[noreturn]] void fail(char const* const format, Args const... args) const
    {
        raise_at_line(errc::parse_error, line_, format, args...);
    }

    std::string read_string(std::string_view&) const;
    std::string read_value(std::string_view) const;
    void expect_end(std::string_view) const;

    void parse_line(std::string_view);
    void on_file(std::string_view, std::string_view);
    void on_track(uint);
    void on_index(uint, cue::frames);
    void on_text(std::string_view, std::string_view);
    void on_remark(std::string_view, std::string_view);
    void on_track_only(std::string_view);

    void commit_track();
    void resolve_ends();

    cue::remarks& current_remarks() noexcept;

    struct {
        cue::track data;
        std::size_t line{};
        std::optional<uint> last_index;
        bool have_start{};
        bool active{};

        void reset(uint const number, std::size_t const ln)
        {
            data = cue::track{};
            data.number = number;
            line = ln;
            last_index.reset();
            have_start = false;
            active = true;
        }
    }
    current_track;

    std::optional<cue::frames> last_index_offset;
    uint last_track_number{};
    std::size_t line_{};
};


parser::parser(std::string_view text)
{
    if (text.substr(0, 3) == utf8_bom) {
        text.remove_prefix(3);
    }

    while (!text.empty()) {
        ++line_;

        auto const eol = std::min(text.find_first_of("\r\n"), text.size());
        auto const line = trim(text.substr(0, eol));

        text.remove_prefix(eol);
        if (text.substr(0, 2) == "\r\n") {
            text.remove_prefix(2);
        }
        else if (!text.empty()) {
            text.remove_prefix(1);
        }

        if (line.empty()) {
            continue;
        }

        try {
            parse_line(line);
        }
        catch (error const& ex) {
            if (ex.line() != 0) {
                throw;
            }
            throw error{ex.code(), ex.detail(), line_};
        }
    }

    if (current_track.active) {
        commit_track();
    }
    if (sheet.track_count() == 0) {
        raise(errc::parse_error, "cue sheet does not contain any track");
    }
    resolve_ends();
}

std::string parser::read_string(std::string_view& line) const
{
    if (line.empty() || line.front() != '\"') {
        return std::string{read_token(line)};
    }

    std::string ret;
    for (auto i = 1_sz; i < line.size(); ++i) {
        auto c = line[i];
        if (c == '\"') {
            line = trim_left(line.substr(i + 1));
            return ret;
        }
        if (c == '\\') {
            if (++i == line.size()) {
                break;
            }
            switch (c = line[i]) {
            case 'n': c = '\n'; break;
            case 't': c = '\t'; break;
            case 'r': c = '\r'; break;
            }
        }
        ret += c;
    }
    fail("unterminated quoted string");
}

std::string parser::read_value(std::string_view line) const
{
    line = trim(line);
    if (!line.empty() && line.front() == '\"') {
        auto ret = read_string(line);
        expect_end(line);
        return ret;
    }
    return std::string{line};
}

void parser::expect_end(std::string_view const line) const
{
    if (!trim(line).empty()) {
        fail("too many values in line");
    }
}

void parser::parse_line(std::string_view line)
{
    auto const cmd = read_token(line);

    if (stricmpeq(cmd, "PERFORMER") ||
        stricmpeq(cmd, "TITLE")     ||
        stricmpeq(cmd, "SONGWRITER")) {
        on_text(cmd, read_value(line));
    }
    else if (stricmpeq(cmd, "REM")) {
        if (!line.empty()) {
            auto const key = read_string(line);
            on_remark(key, read_value(line));
        }
    }
    else if (stricmpeq(cmd, "GENRE")) {
        sheet.genre = read_value(line);
    }
    else if (stricmpeq(cmd, "DATE")) {
        sheet.date = read_value(line);
    }
    else if (stricmpeq(cmd, "FILE")) {
        auto const path = read_string(line);
        on_file(path, read_token(line));
    }
    else if (stricmpeq(cmd, "TRACK")) {
        auto const number = parse_number(read_token(line));
        if (!number || *number < 1 || *number > max_track_number) {
            fail("invalid track number");
        }
        on_track(*number);
    }
    else if (stricmpeq(cmd, "INDEX")) {
        auto const number = parse_number(read_token(line));
        if (!number || *number > max_index_number) {
            fail("invalid index number");
        }
        auto const offset = parse_timecode(read_token(line));
        expect_end(line);
        on_index(*number, offset);
    }
    else if (stricmpeq(cmd, "ISRC")    ||
             stricmpeq(cmd, "FLAGS")   ||
             stricmpeq(cmd, "PREGAP")  ||
             stricmpeq(cmd, "POSTGAP")) {
        on_track_only(cmd);
        if (stricmpeq(cmd, "ISRC")) {
            current_track.data.isrc = read_value(line);
        }
        else if (!stricmpeq(cmd, "FLAGS")) {
            parse_timecode(read_token(line));
            expect_end(line);
        }
    }
    else if (stricmpeq(cmd, "CATALOG")) {
        sheet.catalog = read_value(line);
    }
    else if (stricmpeq(cmd, "CDTEXTFILE")) {
        // ignore
    }
    else {
        fail("unknown command: \"%.*s\"",
             static_cast<int>(cmd.size()), cmd.data());
    }
}

void parser::on_file(std::string_view const path, std::string_view const type)
{
    if (path.empty()) {
        fail("missing file name");
    }

    // A track whose INDEX 01 lies in the next file keeps going there; its
    // pre-gap stays at the end of the previous file.
    auto carried = false;
    if (current_track.active) {
        if (current_track.have_start) {
            commit_track();
        }
        else {
            current_track.data.pregap.reset();
            carried = true;
        }
    }

    auto& file = sheet.files.emplace_back();
    file.path = path;
    file.type = type;
    last_index_offset.reset();

    if (carried) {
        current_track.last_index.reset();
    }
}

void parser::on_track(uint const number)
{
    if (sheet.files.empty()) {
        fail("TRACK cannot appear before FILE");
    }
    if (number == last_track_number) {
        fail("duplicate track number %u", number);
    }
    if (number < last_track_number) {
        fail("track number %u follows track %u", number, last_track_number);
    }
    if (current_track.active) {
        commit_track();
    }
    last_track_number = number;
    current_track.reset(number, line_);
}

void parser::on_index(uint const number, cue::frames const offset)
{
    if (sheet.files.empty()) {
        fail("INDEX cannot appear before FILE");
    }
    if (!current_track.active) {
        fail("INDEX cannot appear before TRACK");
    }

    if (current_track.last_index && *current_track.last_index >= number) {
        fail("index %02u out of order", number);
    }
    if (last_index_offset && *last_index_offset > offset) {
        fail("index %02u at %s precedes the previous index at %s", number,
             format_timecode(offset).c_str(),
             format_timecode(*last_index_offset).c_str());
    }
    current_track.last_index = number;
    last_index_offset = offset;

    if (number == 0) {
        current_track.data.pregap = offset;
    }
    else if (number == 1) {
        auto const& tracks = sheet.files.back().tracks;
        if (!tracks.empty() && tracks.back().start == offset) {
            fail("track %02u would be empty: track %02u starts at the same "
                 "position %s", tracks.back().number,
                 current_track.data.number, format_timecode(offset).c_str());
        }
        current_track.data.start = offset;
        current_track.have_start = true;
    }
}

void parser::on_text(std::string_view const cmd, std::string_view const value)
{
    auto assign = [&](auto& target) {
        if (stricmpeq(cmd, "PERFORMER")) {
            target.performer = value;
        }
        else if (stricmpeq(cmd, "TITLE")) {
            target.title = value;
        }
        else {
            target.songwriter = value;
        }
    };

    if (current_track.active) {
        assign(current_track.data);
    }
    else if (!sheet.files.empty()) {
        assign(sheet.files.back());
    }
    else {
        assign(sheet);
    }
}

void parser::on_remark(std::string_view const key, std::string_view const value)
{
    if (!current_track.active && sheet.files.empty()) {
        if (stricmpeq(key, "DATE")) {
            sheet.date = value;
            return;
        }
        if (stricmpeq(key, "GENRE")) {
            sheet.genre = value;
            return;
        }
    }
    current_remarks().insert_or_assign(std::string{key}, std::string{value});
}

void parser::on_track_only(std::string_view const cmd)
{
    if (!current_track.active) {
        fail("%.*s must appear within a TRACK",
             static_cast<int>(cmd.size()), cmd.data());
    }
}

cue::remarks& parser::current_remarks() noexcept
{
    if (current_track.active) {
        return current_track.data.remarks;
    }
    if (!sheet.files.empty()) {
        return sheet.files.back().remarks;
    }
    return sheet.remarks;
}

void parser::commit_track()
{
    CUESPLIT_ASSERT(current_track.active);
    if (!current_track.have_start) {
        raise_at_line(errc::parse_error, current_track.line,
                      "track %02u has no INDEX 01", current_track.data.number);
    }

    auto& file = sheet.files.back();
    auto& t = current_track.data;

    auto inherit = [](std::string& value, std::string const& from_file,
                      std::string const& from_sheet) {
        if (value.empty()) {
            value = !from_file.empty() ? from_file : from_sheet;
        }
    };
    inherit(t.performer,  file.performer,  sheet.performer);
    inherit(t.title,      file.title,      sheet.title);
    inherit(t.songwriter, file.songwriter, sheet.songwriter);

    file.tracks.push_back(std::move(t));
    current_track.active = false;
}

void parser::resolve_ends()
{
    for (auto& file : sheet.files) {
        auto resolved = file.tracks;
        for (auto i = 0_sz; i + 1 < resolved.size(); ++i) {
            resolved[i].end = file.tracks[i + 1].start;
        }
        file.tracks = std::move(resolved);
    }
}

}     // namespace <unnamed>


std::size_t sheet::track_count() const noexcept
{
    auto n = 0_sz;
    for (auto const& file : files) {
        n += file.tracks.size();
    }
    return n;
}

uint sheet::max_track_number() const noexcept
{
    auto n = 0u;
    for (auto const& file : files) {
        for (auto const& t : file.tracks) {
            n = std::max(n, t.number);
        }
    }
    return n;
}


cue::sheet parse(std::string_view const text)
{
    return std::move(cue::parser{text}.sheet);
}

cue::sheet with_file_length(cue::sheet s, std::size_t const index,
                            cue::frames const length)
{
    if (index >= s.files.size()) {
        raise(errc::invalid_argument, "file section %zu does not exist", index);
    }

    auto& tracks = s.files[index].tracks;
    if (!tracks.empty()) {
        auto& last = tracks.back();
        if (length < last.start) {
            raise(errc::invalid_argument,
                  "file length %s is shorter than the start of track %02u",
                  format_timecode(length).c_str(), last.number);
        }
        last.end = length;
    }
    return s;
}

}}    // namespace cuesplit::cue
