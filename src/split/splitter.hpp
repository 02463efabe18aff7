////////////////////////////////////////////////////////////////////////////////
//
// split/splitter.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_0B3E6F94_8C25_4D1A_B07E_51A9C4D2E8F6
#define CUESPLIT_INCLUDED_0B3E6F94_8C25_4D1A_B07E_51A9C4D2E8F6


#include <cuesplit/stddef.hpp>

#include "split/job.hpp"
#include "split/process.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>


namespace cuesplit {
namespace split {

enum class job_status : uint8 {
    succeeded,
    skipped,
    filesystem_error,
    encode_error,
    timed_out,
    cancelled,
};

char const* to_string(job_status) noexcept;


struct job_outcome
{
    uint number{};
    job_status status{job_status::cancelled};
    std::string path;
    std::string message;

    bool ok() const noexcept
    { return status == job_status::succeeded || status == job_status::skipped; }
};


struct run_options
{
    // Zero selects one worker per available processing unit.
    std::size_t workers{0};

    // Raised from outside to stop the run; may be null.
    std::atomic<bool> const* cancel{nullptr};

    // Called once per job as soon as its outcome is known. Calls are
    // serialized but may come from any worker thread.
    std::function<void(encode_job const&, job_outcome const&)> on_finished;
};


struct run_summary
{
    std::size_t succeeded{};
    std::size_t skipped{};
    std::size_t failed{};
    std::size_t cancelled{};

    bool ok() const noexcept
    { return failed == 0 && cancelled == 0; }
};


std::size_t default_worker_count() noexcept;

// Runs every job on a pool of worker threads and returns the outcomes in
// job order. A failing job never stops the others.
std::vector<job_outcome> run_jobs(std::vector<encode_job> const&,
                                  encoder_config const&,
                                  process_launcher&,
                                  run_options const& = {});

run_summary summarize(std::vector<job_outcome> const&) noexcept;

}}    // namespace cuesplit::split


#endif  // CUESPLIT_INCLUDED_0B3E6F94_8C25_4D1A_B07E_51A9C4D2E8F6
