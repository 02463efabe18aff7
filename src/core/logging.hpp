////////////////////////////////////////////////////////////////////////////////
//
// core/logging.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_805EB561_32F3_402E_9493_3E2A61A8FFB6
#define CUESPLIT_INCLUDED_805EB561_32F3_402E_9493_3E2A61A8FFB6


#include <QtCore/QLoggingCategory>


Q_DECLARE_LOGGING_CATEGORY(lcCue)
Q_DECLARE_LOGGING_CATEGORY(lcSplit)
Q_DECLARE_LOGGING_CATEGORY(lcApp)


namespace cuesplit {
namespace logging {

// Routes Qt messages to standard error; debug output is only enabled when
// verbose is set.
void setup(bool verbose);

}}    // namespace cuesplit::logging


#endif  // CUESPLIT_INCLUDED_805EB561_32F3_402E_9493_3E2A61A8FFB6
