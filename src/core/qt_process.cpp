////////////////////////////////////////////////////////////////////////////////
//
// core/qt_process.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/stddef.hpp>
#include <cuesplit/string.hpp>

#include "core/logging.hpp"
#include "core/qstring.hpp"
#include "core/qt_process.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <QtCore/QByteArray>
#include <QtCore/QProcess>


namespace cuesplit {
namespace {

using namespace ::std::chrono_literals;

constexpr auto start_timeout = 30s;
constexpr auto poll_interval = 100ms;
constexpr auto max_buffered_error = 64 * 1024;

std::string last_lines(QByteArray const& bytes, std::size_t const count)
{
    auto const text = std::string_view{
        bytes.constData(), static_cast<std::size_t>(bytes.size())};

    std::vector<std::string_view> lines;
    for (auto const line : tokenize(text, '\n')) {
        auto const trimmed = trim(line, " \t\r");
        if (!trimmed.empty()) {
            lines.push_back(trimmed);
        }
    }

    auto first = lines.size() > count ? lines.size() - count : 0_sz;
    std::string ret;
    for (; first != lines.size(); ++first) {
        if (!ret.empty()) {
            ret += '\n';
        }
        ret.append(lines[first].data(), lines[first].size());
    }
    return ret;
}

void collect_error(QProcess& proc, QByteArray& error)
{
    error += proc.readAllStandardError();
    if (error.size() > max_buffered_error) {
        error.remove(0, error.size() - max_buffered_error);
    }
}

void stop(QProcess& proc)
{
    proc.kill();
    proc.waitForFinished(static_cast<int>(
        std::chrono::milliseconds{start_timeout}.count()));
}

}     // namespace <unnamed>


split::process_result qt_process_launcher::run(
    split::process_request const& request,
    std::atomic<bool> const& cancel)
{
    split::process_result result;

    QProcess proc;
    proc.setProgram(to_qstring(request.program));
    proc.setArguments(to_qstringlist(request.args));
    proc.setProcessChannelMode(QProcess::SeparateChannels);
    proc.setStandardOutputFile(QProcess::nullDevice());
    proc.start(QIODevice::ReadOnly);

    if (!proc.waitForStarted(static_cast<int>(
            std::chrono::milliseconds{start_timeout}.count()))) {
        result.status = split::process_status::failed_to_start;
        result.error_tail = to_std_string(proc.errorString());
        qCDebug(lcSplit) << "cannot start" << proc.program() << ":"
                         << proc.errorString();
        return result;
    }

    auto const started = std::chrono::steady_clock::now();
    QByteArray error;

    while (!proc.waitForFinished(static_cast<int>(poll_interval.count()))) {
        collect_error(proc, error);
        if (proc.state() == QProcess::NotRunning) {
            break;
        }

        if (cancel.load(std::memory_order_relaxed)) {
            stop(proc);
            result.status = split::process_status::cancelled;
            break;
        }
        if (request.timeout &&
                std::chrono::steady_clock::now() - started >= *request.timeout) {
            stop(proc);
            result.status = split::process_status::timed_out;
            break;
        }
    }
    collect_error(proc, error);
    result.error_tail = last_lines(error, tail_lines_);

    if (result.status == split::process_status::exited) {
        if (proc.exitStatus() == QProcess::CrashExit) {
            result.status = split::process_status::crashed;
            if (result.error_tail.empty()) {
                result.error_tail = to_std_string(proc.errorString());
            }
        }
        else {
            result.exit_code = proc.exitCode();
        }
        if (!result.succeeded() && cancel.load(std::memory_order_relaxed)) {
            result.status = split::process_status::cancelled;
        }
    }
    return result;
}

}     // namespace cuesplit
