////////////////////////////////////////////////////////////////////////////////
//
// media/cue_files.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/error.hpp>
#include <cuesplit/stddef.hpp>
#include <cuesplit/string.hpp>

#include "core/filesystem.hpp"
#include "core/logging.hpp"
#include "core/qstring.hpp"
#include "core/text_codec.hpp"
#include "media/cue_files.hpp"
#include "media/cue_sheet.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <QtCore/QByteArray>
#include <QtCore/QFile>


namespace cuesplit {
namespace cue {
namespace {

class directory_scanner
{
public:
    explicit directory_scanner(std::vector<std::string>& paths) noexcept :
        paths_{paths}
    {}

    void scan(std::string const& directory)
    {
        try {
            if (!visited_.insert(fs::canonical(directory)).second) {
                qCDebug(lcCue) << "already scanned" << to_qstring(directory);
                return;
            }
            for (auto&& path : fs::directory_range{directory}) {
                visit(path);
            }
        }
        catch (std::system_error const& ex) {
            qCWarning(lcCue) << "skipping" << to_qstring(directory) << ":"
                             << ex.what();
        }
    }

private:
    void visit(std::string const& path)
    {
        auto type = fs::file_type::none;
        try {
            type = fs::status(path);
        }
        catch (std::system_error const& ex) {
            qCWarning(lcCue) << "skipping" << to_qstring(path) << ":"
                             << ex.what();
            return;
        }

        if (type == fs::file_type::regular && is_cue_sheet(path)) {
            paths_.push_back(path);
        }
        else if (type == fs::file_type::directory) {
            scan(path);
        }
    }

    std::vector<std::string>& paths_;
    std::set<std::string> visited_;
};

}     // namespace <unnamed>


bool is_cue_sheet(std::string const& path)
{
    return stricmpeq(fs::extension(path), "cue");
}

cue::sheet load(std::string const& path, std::string_view const encoding)
{
    QFile file{to_qstring(path)};
    if (!file.open(QIODevice::ReadOnly)) {
        auto const code = file.exists() ? errc::filesystem_error
                                        : errc::file_not_found;
        raise(code, "cannot open '%s': %s", path.c_str(),
              qUtf8Printable(file.errorString()));
    }

    auto const bytes = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        raise(errc::filesystem_error, "cannot read '%s': %s", path.c_str(),
              qUtf8Printable(file.errorString()));
    }

    qCDebug(lcCue) << "loaded" << bytes.size() << "bytes from" << file.fileName();
    auto const text = decode_text(
        std::string_view{bytes.constData(), static_cast<std::size_t>(bytes.size())},
        encoding);
    return cue::parse(text);
}

std::vector<std::string> find_cue_sheets(std::string const& path)
{
    std::vector<std::string> paths;
    switch (fs::status(path)) {
    case fs::file_type::not_found:
        raise(errc::file_not_found, "'%s' does not exist", path.c_str());
    case fs::file_type::directory:
        directory_scanner{paths}.scan(path);
        break;
    default:
        paths.push_back(path);
        break;
    }

    if (paths.empty()) {
        raise(errc::file_not_found, "no cue sheets found in '%s'", path.c_str());
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

}}    // namespace cuesplit::cue
