////////////////////////////////////////////////////////////////////////////////
//
// app/application.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_E26A4D83_5B17_49C0_A3F9_C7081D2B6E54
#define CUESPLIT_INCLUDED_E26A4D83_5B17_49C0_A3F9_C7081D2B6E54


#include <cuesplit/stddef.hpp>

#include <atomic>
#include <cstdio>


namespace cuesplit {
namespace split {
    class process_launcher;
}


namespace app {

struct options;

enum exit_code : int {
    exit_success = 0,
    exit_failure = 1,
    exit_fatal   = 2,
};


// Plans every track of every cue sheet before anything is encoded, then runs
// the encoder. Fatal errors are thrown; per-track failures only affect the
// returned exit code.
exit_code run(options const&, split::process_launcher&,
              std::atomic<bool> const& cancel, std::FILE* out);

}}    // namespace cuesplit::app


#endif  // CUESPLIT_INCLUDED_E26A4D83_5B17_49C0_A3F9_C7081D2B6E54
