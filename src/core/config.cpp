////////////////////////////////////////////////////////////////////////////////
//
// core/config.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/error.hpp>
#include <cuesplit/stddef.hpp>

#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/qstring.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include <QtCore/QSettings>
#include <QtCore/QString>
#include <QtCore/QVariant>


namespace cuesplit {
namespace config {
namespace {

std::mutex settings_mutex;
std::string settings_file;

std::unique_ptr<QSettings> open_settings()
{
    std::lock_guard<std::mutex> const lock{settings_mutex};
    if (!settings_file.empty()) {
        return std::make_unique<QSettings>(to_qstring(settings_file),
                                           QSettings::IniFormat);
    }
    return std::make_unique<QSettings>(QSettings::NativeFormat,
                                       QSettings::UserScope,
                                       QStringLiteral("cuesplit"),
                                       QStringLiteral("cuesplit"));
}

std::optional<QVariant> find_value(char const* const key)
{
    auto const settings = open_settings();
    auto const value = settings->value(QString::fromLatin1(key));
    if (!value.isValid()) {
        return std::nullopt;
    }
    qCDebug(lcApp) << "setting" << key << "=" << value.toString();
    return value;
}

void store_value(char const* const key, QVariant const& value)
{
    auto const settings = open_settings();
    settings->setValue(QString::fromLatin1(key), value);
    settings->sync();
    if (settings->status() != QSettings::NoError) {
        raise(errc::config_error, "cannot write setting '%s' to '%s'", key,
              qUtf8Printable(settings->fileName()));
    }
}

}     // namespace <unnamed>


std::optional<std::string> entry<std::string>::load() const
{
    if (auto const value = find_value(key)) {
        return value->toString().toStdString();
    }
    return std::nullopt;
}

void entry<std::string>::store(std::string const& value) const
{
    store_value(key, to_qstring(value));
}

std::optional<int> entry<int>::load() const
{
    if (auto const value = find_value(key)) {
        auto ok = false;
        auto const ret = value->toString().trimmed().toInt(&ok);
        if (!ok) {
            raise(errc::config_error, "setting '%s' is not an integer: \"%s\"",
                  key, qUtf8Printable(value->toString()));
        }
        return ret;
    }
    return std::nullopt;
}

void entry<int>::store(int const value) const
{
    store_value(key, value);
}


void use_file(std::string path)
{
    std::lock_guard<std::mutex> const lock{settings_mutex};
    settings_file = std::move(path);
}

std::string file_name()
{
    return open_settings()->fileName().toStdString();
}

}   // namespace config


namespace split {
namespace settings {

config::entry<std::string> const name_format{"split/template"};
config::entry<std::string> const preset{"split/preset"};
config::entry<int>         const jobs{"split/jobs"};
config::entry<std::string> const out_dir{"split/out_dir"};
config::entry<std::string> const encoder_program{"encoder/program"};
config::entry<int>         const encoder_timeout{"encoder/timeout"};

}}}   // namespace cuesplit::split::settings
