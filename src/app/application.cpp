////////////////////////////////////////////////////////////////////////////////
//
// app/application.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/stddef.hpp>
#include <cuesplit/string.hpp>

#include "app/application.hpp"
#include "app/options.hpp"
#include "core/logging.hpp"
#include "core/qstring.hpp"
#include "media/cue_files.hpp"
#include "media/cue_sheet.hpp"
#include "media/name_format.hpp"
#include "split/job.hpp"
#include "split/splitter.hpp"

#include <atomic>
#include <cstdio>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>


namespace cuesplit {
namespace app {
namespace {

std::string quote(std::string const& arg)
{
    if (!arg.empty() && arg.find_first_of(" \t\"'\\$") == std::string::npos) {
        return arg;
    }

    std::string ret{"'"};
    for (auto const c : arg) {
        if (c == '\'') {
            ret += "'\\''";
        }
        else {
            ret += c;
        }
    }
    ret += '\'';
    return ret;
}

void print_plan(std::FILE* const out, split::encode_job const& job,
                split::encoder_config const& config)
{
    std::fprintf(out, "%02u. %s\n    %s", job.number, job.output.path.c_str(),
                 quote(config.program).c_str());
    for (auto const& arg : job.args) {
        std::fprintf(out, " %s", quote(arg).c_str());
    }
    std::fputc('\n', out);
}

void print_outcome(std::FILE* const out, split::encode_job const& job,
                   split::job_outcome const& outcome)
{
    std::fprintf(out, "[%s] %02u. %s\n", split::to_string(outcome.status),
                 job.number, outcome.path.c_str());
    if (!outcome.ok() || outcome.status == split::job_status::skipped) {
        for (auto const line : tokenize(outcome.message, '\n')) {
            std::fprintf(out, "    %.*s\n", static_cast<int>(line.size()),
                         line.data());
        }
    }
    std::fflush(out);
}

}     // namespace <unnamed>


exit_code run(options const& opts, split::process_launcher& launcher,
              std::atomic<bool> const& cancel, std::FILE* const out)
{
    media::name_format const format{opts.name_format};
    auto const paths = cue::find_cue_sheets(opts.path);

    std::vector<split::encode_job> jobs;
    for (auto const& path : paths) {
        qCInfo(lcApp) << "reading" << to_qstring(path);
        auto const sheet = cue::load(path, opts.encoding);
        auto const out_dir = !opts.out_dir.empty()
                           ? opts.out_dir
                           : split::default_out_dir(path);

        auto planned = split::plan_jobs(sheet, path, format, opts.encoder,
                                        out_dir);
        jobs.insert(jobs.end(), std::make_move_iterator(planned.begin()),
                                std::make_move_iterator(planned.end()));
    }
    split::check_unique_outputs(jobs);
    qCInfo(lcApp) << jobs.size() << "tracks planned, existing outputs:"
                  << split::to_string(opts.encoder.overwrite);

    if (opts.dry_run) {
        for (auto const& job : jobs) {
            print_plan(out, job, opts.encoder);
        }
        std::fprintf(out, "%zu tracks planned, nothing encoded\n", jobs.size());
        return exit_success;
    }

    split::run_options run_opts;
    run_opts.workers = opts.jobs;
    run_opts.cancel = &cancel;
    run_opts.on_finished = [out](auto const& job, auto const& outcome) {
        print_outcome(out, job, outcome);
    };

    auto const outcomes = split::run_jobs(jobs, opts.encoder, launcher,
                                          run_opts);
    auto const summary = split::summarize(outcomes);
    std::fprintf(out, "%zu succeeded, %zu skipped, %zu failed, %zu cancelled\n",
                 summary.succeeded, summary.skipped, summary.failed,
                 summary.cancelled);
    return summary.ok() ? exit_success : exit_failure;
}

}}    // namespace cuesplit::app
