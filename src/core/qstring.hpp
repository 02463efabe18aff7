////////////////////////////////////////////////////////////////////////////////
//
// core/qstring.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_77E32D7B_6833_4205_B2BC_185518141053
#define CUESPLIT_INCLUDED_77E32D7B_6833_4205_B2BC_185518141053


#include <cuesplit/stddef.hpp>

#include <string>
#include <string_view>
#include <vector>

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringList>


namespace cuesplit {

inline auto to_std_string(QString const& s)
{
    return s.toStdString();
}

inline auto to_std_string(QByteArray const& s)
{
    return std::string(s.constData(), static_cast<std::size_t>(s.size()));
}

inline auto to_std_strings(QStringList const& list)
{
    std::vector<std::string> ret;
    ret.reserve(static_cast<std::size_t>(list.size()));
    for (auto const& s : list) {
        ret.push_back(s.toStdString());
    }
    return ret;
}


inline auto to_qstring(std::string_view const s)
{ return QString::fromUtf8(s.data(), static_cast<int>(s.size())); }

inline auto to_qstring(char const* const s)
{ return QString::fromUtf8(s); }

inline auto to_qstringlist(std::vector<std::string> const& v)
{
    QStringList ret;
    ret.reserve(static_cast<int>(v.size()));
    for (auto const& s : v) {
        ret.push_back(to_qstring(s));
    }
    return ret;
}

}     // namespace cuesplit


#endif  // CUESPLIT_INCLUDED_77E32D7B_6833_4205_B2BC_185518141053
