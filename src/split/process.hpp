////////////////////////////////////////////////////////////////////////////////
//
// split/process.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_C51A8E02_6D7F_4F38_A1B4_0E9D27C3B865
#define CUESPLIT_INCLUDED_C51A8E02_6D7F_4F38_A1B4_0E9D27C3B865


#include <cuesplit/stddef.hpp>

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>


namespace cuesplit {
namespace split {

struct process_request
{
    std::string program;
    std::vector<std::string> args;
    std::optional<std::chrono::milliseconds> timeout;
};


enum class process_status : uint8 {
    exited,
    failed_to_start,
    crashed,
    timed_out,
    cancelled,
};


struct process_result
{
    process_status status{process_status::exited};
    int exit_code{};
    std::string error_tail;

    bool succeeded() const noexcept
    { return status == process_status::exited && exit_code == 0; }
};


class process_launcher
{
public:
    virtual ~process_launcher() = default;

    // Runs the program to completion. Must kill the process and return
    // process_status::cancelled soon after the flag is raised. Safe to call
    // from several threads at once.
    virtual process_result run(process_request const&,
                               std::atomic<bool> const& cancel) = 0;
};

}}    // namespace cuesplit::split


#endif  // CUESPLIT_INCLUDED_C51A8E02_6D7F_4F38_A1B4_0E9D27C3B865
