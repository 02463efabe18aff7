////////////////////////////////////////////////////////////////////////////////
//
// core/text_codec.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/error.hpp>
#include <cuesplit/stddef.hpp>

#include "core/logging.hpp"
#include "core/text_codec.hpp"

#include <string>
#include <string_view>

#include <QtCore/QByteArray>
#include <QtCore/QChar>
#include <QtCore/QString>
#include <QtCore/QTextCodec>


namespace cuesplit {
namespace {

QTextCodec* find_codec(std::string_view const name) noexcept
{
    return QTextCodec::codecForName(
        QByteArray(name.data(), static_cast<int>(name.size())));
}

bool is_valid_utf8(QByteArray const& data)
{
    QTextCodec::ConverterState state;
    auto const utf8 = QTextCodec::codecForMib(106);
    utf8->toUnicode(data.constData(), data.size(), &state);
    return (state.invalidChars == 0);
}

}     // namespace <unnamed>


bool is_known_encoding(std::string_view const name) noexcept
{
    return find_codec(name) != nullptr;
}

std::string decode_text(std::string_view const bytes,
                        std::string_view const encoding)
{
    auto const data = QByteArray(bytes.data(), static_cast<int>(bytes.size()));

    auto codec = QTextCodec::codecForUtfText(data, nullptr);
    if (codec == nullptr && !encoding.empty()) {
        codec = find_codec(encoding);
        if (codec == nullptr) {
            raise(errc::config_error, "unknown text encoding: \"%.*s\"",
                  static_cast<int>(encoding.size()), encoding.data());
        }
    }
    if (codec == nullptr) {
        codec = is_valid_utf8(data) ? QTextCodec::codecForMib(106)
                                    : QTextCodec::codecForLocale();
    }

    qCDebug(lcCue) << "decoding cue sheet as" << codec->name();
    auto text = codec->toUnicode(data);
    if (text.startsWith(QChar::ByteOrderMark)) {
        text.remove(0, 1);
    }
    return text.toStdString();
}

}     // namespace cuesplit
