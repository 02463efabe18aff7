////////////////////////////////////////////////////////////////////////////////
//
// split/splitter.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/scope_guard.hpp>
#include <cuesplit/stddef.hpp>

#include "core/filesystem.hpp"
#include "core/logging.hpp"
#include "split/job.hpp"
#include "split/process.hpp"
#include "split/splitter.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>


namespace cuesplit {
namespace split {
namespace {

class job_runner
{
public:
    job_runner(std::vector<encode_job> const& jobs,
               encoder_config const& config,
               process_launcher& launcher,
               run_options const& opts) :
        jobs_{jobs},
        config_{config},
        launcher_{launcher},
        opts_{opts},
        cancel_{opts.cancel ? *opts.cancel : never_},
        outcomes_(jobs.size())
    {}

    std::vector<job_outcome> run(std::size_t const workers)
    {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        {
            CUESPLIT_SCOPE_EXIT {
                for (auto&& t : threads) {
                    t.join();
                }
            };
            for (auto i = 0_sz; i != workers; ++i) {
                threads.emplace_back([this, i]{ work(i); });
            }
        }
        return std::move(outcomes_);
    }

private:
    void work(std::size_t const id)
    {
        qCDebug(lcSplit) << "worker" << id << "started";
        for (;;) {
            auto const i = cursor_.fetch_add(1, std::memory_order_relaxed);
            if (i >= jobs_.size()) {
                break;
            }

            outcomes_[i] = execute(jobs_[i]);
            if (opts_.on_finished) {
                std::lock_guard<std::mutex> const lock{notify_mutex_};
                opts_.on_finished(jobs_[i], outcomes_[i]);
            }
        }
        qCDebug(lcSplit) << "worker" << id << "finished";
    }

    job_outcome execute(encode_job const& job) const
    {
        job_outcome outcome;
        outcome.number = job.number;
        outcome.path = job.output.path;

        if (cancel_.load(std::memory_order_relaxed)) {
            outcome.status = job_status::cancelled;
            outcome.message = "not started";
            return outcome;
        }

        try {
            fs::create_directories(fs::parent_path(job.output.path));
            if (config_.overwrite == overwrite_policy::skip &&
                    fs::exists(job.output.path)) {
                outcome.status = job_status::skipped;
                outcome.message = "output exists";
                return outcome;
            }
        }
        catch (std::system_error const& ex) {
            outcome.status = job_status::filesystem_error;
            outcome.message = ex.what();
            return outcome;
        }

        try {
            auto const result = launcher_.run(
                process_request{config_.program, job.args, config_.timeout},
                cancel_);
            fill(outcome, result);
        }
        catch (std::exception const& ex) {
            outcome.status = job_status::encode_error;
            outcome.message = ex.what();
        }
        return outcome;
    }

    void fill(job_outcome& outcome, process_result const& result) const
    {
        outcome.message = result.error_tail;

        // An interrupt also reaches the encoder, which then dies on its own.
        if (!result.succeeded() && cancel_.load(std::memory_order_relaxed)) {
            outcome.status = job_status::cancelled;
            if (outcome.message.empty()) {
                outcome.message = "interrupted";
            }
            return;
        }

        switch (result.status) {
        case process_status::exited:
            if (result.exit_code == 0) {
                outcome.status = job_status::succeeded;
            }
            else {
                outcome.status = job_status::encode_error;
                if (outcome.message.empty()) {
                    outcome.message = "encoder exited with status "
                                    + std::to_string(result.exit_code);
                }
            }
            break;
        case process_status::failed_to_start:
        case process_status::crashed:
            outcome.status = job_status::encode_error;
            break;
        case process_status::timed_out:
            outcome.status = job_status::timed_out;
            break;
        case process_status::cancelled:
            outcome.status = job_status::cancelled;
            break;
        }
    }

    std::vector<encode_job> const& jobs_;
    encoder_config const& config_;
    process_launcher& launcher_;
    run_options const& opts_;
    std::atomic<bool> const never_{false};
    std::atomic<bool> const& cancel_;

    std::atomic<std::size_t> cursor_{0};
    std::mutex notify_mutex_;
    std::vector<job_outcome> outcomes_;
};

}     // namespace <unnamed>


char const* to_string(job_status const status) noexcept
{
    switch (status) {
    case job_status::succeeded:        return "ok";
    case job_status::skipped:          return "skipped";
    case job_status::filesystem_error: return "filesystem error";
    case job_status::encode_error:     return "encode error";
    case job_status::timed_out:        return "timed out";
    case job_status::cancelled:        return "cancelled";
    }
    CUESPLIT_UNREACHABLE();
}

std::size_t default_worker_count() noexcept
{
    return std::max(1u, std::thread::hardware_concurrency());
}

std::vector<job_outcome> run_jobs(std::vector<encode_job> const& jobs,
                                  encoder_config const& config,
                                  process_launcher& launcher,
                                  run_options const& opts)
{
    if (jobs.empty()) {
        return {};
    }

    auto workers = (opts.workers != 0) ? opts.workers : default_worker_count();
    workers = std::min(workers, jobs.size());

    qCDebug(lcSplit) << "running" << jobs.size() << "jobs on" << workers
                     << "workers";
    return job_runner{jobs, config, launcher, opts}.run(workers);
}

run_summary summarize(std::vector<job_outcome> const& outcomes) noexcept
{
    run_summary summary;
    for (auto const& x : outcomes) {
        switch (x.status) {
        case job_status::succeeded: ++summary.succeeded; break;
        case job_status::skipped:   ++summary.skipped;   break;
        case job_status::cancelled: ++summary.cancelled; break;
        default:                    ++summary.failed;    break;
        }
    }
    return summary;
}

}}    // namespace cuesplit::split
