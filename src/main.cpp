////////////////////////////////////////////////////////////////////////////////
//
// main.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/error.hpp>
#include <cuesplit/stddef.hpp>

#include "app/application.hpp"
#include "app/options.hpp"
#include "core/logging.hpp"
#include "core/qt_process.hpp"
#include "media/name_format.hpp"
#include "split/preset.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <exception>

#include <QtCore/QCoreApplication>
#include <QtCore/QString>


namespace {

std::atomic<bool> cancel_requested{false};

extern "C" void on_signal(int)
{
    cancel_requested.store(true, std::memory_order_relaxed);
}

}     // namespace <unnamed>


int main(int argc, char** argv)
{
    using namespace ::cuesplit;

    QCoreApplication app{argc, argv};
    QCoreApplication::setApplicationName(QStringLiteral("cuesplit"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));
    logging::setup(false);

    std::signal(SIGINT,  on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        auto const opts = app::parse_options(QCoreApplication::arguments());
        if (opts.verbose) {
            logging::setup(true);
        }

        switch (opts.action) {
        case app::action::show_help:
            std::fputs(opts.help_text.c_str(), stdout);
            return app::exit_success;
        case app::action::show_version:
            std::printf("cuesplit %s\n",
                        qUtf8Printable(QCoreApplication::applicationVersion()));
            return app::exit_success;
        case app::action::template_help:
            std::printf("Default template: %s\n\n%s",
                        media::default_name_format, media::name_format_help);
            return app::exit_success;
        case app::action::list_presets:
            std::fputs(split::describe_presets().c_str(), stdout);
            return app::exit_success;
        case app::action::split:
            break;
        }

        qt_process_launcher launcher;
        return app::run(opts, launcher, cancel_requested, stdout);
    }
    catch (error const& ex) {
        qCCritical(lcApp, "%s", ex.what());
    }
    catch (std::exception const& ex) {
        qCCritical(lcApp, "%s", ex.what());
    }
    return app::exit_fatal;
}
