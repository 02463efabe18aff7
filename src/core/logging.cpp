////////////////////////////////////////////////////////////////////////////////
//
// core/logging.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include "core/logging.hpp"

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>
#include <QtCore/QtGlobal>


Q_LOGGING_CATEGORY(lcCue,   "cuesplit.cue",   QtInfoMsg)
Q_LOGGING_CATEGORY(lcSplit, "cuesplit.split", QtInfoMsg)
Q_LOGGING_CATEGORY(lcApp,   "cuesplit.app",   QtInfoMsg)


namespace cuesplit {
namespace logging {

void setup(bool const verbose)
{
    qSetMessagePattern(QStringLiteral(
        "cuesplit: %{if-debug}debug%{endif}%{if-info}info%{endif}"
        "%{if-warning}warning%{endif}%{if-critical}error%{endif}"
        "%{if-fatal}fatal%{endif}: %{message}"));

    if (verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("cuesplit.*.debug=true"));
    }
}

}}    // namespace cuesplit::logging
