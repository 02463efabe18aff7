////////////////////////////////////////////////////////////////////////////////
//
// core/qt_process.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_8E4C0B37_1F52_4A96_B7D8_3C6A9E51F0B2
#define CUESPLIT_INCLUDED_8E4C0B37_1F52_4A96_B7D8_3C6A9E51F0B2


#include <cuesplit/stddef.hpp>

#include "split/process.hpp"

#include <atomic>
#include <cstddef>


namespace cuesplit {

// Starts encoder processes with QProcess. Each call owns its own QProcess,
// so calls from worker threads do not share any Qt object.
class qt_process_launcher final :
    public split::process_launcher
{
public:
    static constexpr auto default_tail_lines = 8_sz;

    explicit qt_process_launcher(std::size_t tail = default_tail_lines) noexcept :
        tail_lines_{tail}
    {}

    split::process_result run(split::process_request const&,
                              std::atomic<bool> const&) override;

private:
    std::size_t tail_lines_;
};

}     // namespace cuesplit


#endif  // CUESPLIT_INCLUDED_8E4C0B37_1F52_4A96_B7D8_3C6A9E51F0B2
