////////////////////////////////////////////////////////////////////////////////
//
// app/options.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/error.hpp>
#include <cuesplit/stddef.hpp>

#include "app/options.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/qstring.hpp"
#include "core/text_codec.hpp"
#include "split/job.hpp"
#include "split/preset.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include <QtCore/QCommandLineOption>
#include <QtCore/QCommandLineParser>
#include <QtCore/QString>
#include <QtCore/QStringList>


namespace cuesplit {
namespace app {
namespace {

struct option_set
{
    QCommandLineOption jobs{
        {"j", "jobs"},
        "Maximum number of parallel encoder processes.", "N"};
    QCommandLineOption dry{
        "dry",
        "Parse and plan every track, but do not run the encoder."};
    QCommandLineOption force{
        {"f", "force"},
        "Overwrite existing output files."};
    QCommandLineOption no_overwrite{
        {"n", "no-overwrite"},
        "Skip tracks whose output file already exists."};
    QCommandLineOption name_format{
        {"t", "template"},
        "Output file name template.", "TEMPLATE"};
    QCommandLineOption out_dir{
        {"o", "out-dir"},
        "Output directory; defaults to 'split' beside the cue sheet.", "DIR"};
    QCommandLineOption preset{
        {"p", "preset"},
        "Encoder preset; see --list-presets.", "PRESET"};
    QCommandLineOption no_copy{
        "no-copy",
        "Always encode, even when the source already has the output format."};
    QCommandLineOption ext{
        {"e", "ext"},
        "Output file extension; required with raw encoder arguments.", "EXT"};
    QCommandLineOption ffmpeg{
        "ffmpeg",
        "Path of the encoder executable.", "PATH"};
    QCommandLineOption encoding{
        "encoding",
        "Text encoding of the cue sheet.", "NAME"};
    QCommandLineOption timeout{
        "timeout",
        "Kill an encoder process after this many seconds.", "SECONDS"};
    QCommandLineOption config{
        "config",
        "Read settings from this file.", "FILE"};
    QCommandLineOption template_help{
        "template-help",
        "Describe the template syntax and exit."};
    QCommandLineOption list_presets{
        "list-presets",
        "List the encoder presets and exit."};
    QCommandLineOption verbose{
        {"v", "verbose"},
        "Print debug messages."};
};

int positive_integer(QString const& text, char const* const what)
{
    auto ok = false;
    auto const n = text.toInt(&ok);
    if (!ok || n <= 0) {
        raise(errc::config_error, "%s must be a positive integer: \"%s\"",
              what, qUtf8Printable(text));
    }
    return n;
}

std::string string_option(QCommandLineParser const& parser,
                          QCommandLineOption const& option,
                          config::entry<std::string> const& entry,
                          std::string fallback)
{
    if (parser.isSet(option)) {
        return to_std_string(parser.value(option));
    }
    if (auto value = entry.load()) {
        return std::move(*value);
    }
    return fallback;
}

std::optional<int> integer_option(QCommandLineParser const& parser,
                                  QCommandLineOption const& option,
                                  config::entry<int> const& entry,
                                  char const* const what)
{
    if (parser.isSet(option)) {
        return positive_integer(parser.value(option), what);
    }
    if (auto const value = entry.load()) {
        if (*value <= 0) {
            raise(errc::config_error, "%s must be a positive integer: %d",
                  what, *value);
        }
        return value;
    }
    return std::nullopt;
}

}     // namespace <unnamed>


options parse_options(QStringList const& arguments)
{
    QStringList own = arguments;
    QStringList raw;
    auto const separator = arguments.indexOf(QStringLiteral("--"));
    if (separator >= 0) {
        own = arguments.mid(0, separator);
        raw = arguments.mid(separator + 1);
    }

    option_set const o;
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Splits audio images into tracks as described by cue sheets."));
    auto const help = parser.addHelpOption();
    auto const version = parser.addVersionOption();
    parser.addOptions({
        o.jobs, o.dry, o.force, o.no_overwrite, o.name_format, o.out_dir,
        o.preset, o.no_copy, o.ext, o.ffmpeg, o.encoding, o.timeout, o.config,
        o.template_help, o.list_presets, o.verbose,
    });
    parser.addPositionalArgument(QStringLiteral("path"),
        QStringLiteral("A cue sheet, or a directory searched for cue sheets."));
    parser.addPositionalArgument(QStringLiteral("-- args"),
        QStringLiteral("Raw encoder arguments replacing the preset."),
        QStringLiteral("[-- <encoder args>...]"));

    if (!parser.parse(own)) {
        raise(errc::config_error, "%s", qUtf8Printable(parser.errorText()));
    }

    options opts;
    opts.verbose = parser.isSet(o.verbose);
    opts.help_text = to_std_string(parser.helpText());

    if (parser.isSet(help)) {
        opts.action = action::show_help;
        return opts;
    }
    if (parser.isSet(version)) {
        opts.action = action::show_version;
        return opts;
    }
    if (parser.isSet(o.template_help)) {
        opts.action = action::template_help;
        return opts;
    }
    if (parser.isSet(o.list_presets)) {
        opts.action = action::list_presets;
        return opts;
    }

    auto const positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        raise(errc::config_error, "missing the cue sheet path");
    }
    if (positional.size() > 1) {
        raise(errc::config_error, "unexpected argument: \"%s\"",
              qUtf8Printable(positional[1]));
    }
    opts.path = to_std_string(positional.front());

    if (parser.isSet(o.config)) {
        config::use_file(to_std_string(parser.value(o.config)));
    }

    if (parser.isSet(o.force) && parser.isSet(o.no_overwrite)) {
        raise(errc::config_error,
              "--force and --no-overwrite cannot be combined");
    }

    auto& encoder = opts.encoder;
    if (!raw.isEmpty()) {
        if (parser.isSet(o.preset)) {
            raise(errc::config_error,
                  "--preset cannot be combined with raw encoder arguments");
        }
        if (!parser.isSet(o.ext)) {
            raise(errc::config_error,
                  "--ext is required with raw encoder arguments");
        }
        encoder.codec_args = to_std_strings(raw);
        encoder.ext = to_std_string(parser.value(o.ext));
    }
    else {
        if (parser.isSet(o.ext)) {
            raise(errc::config_error,
                  "--ext is only valid with raw encoder arguments");
        }
        auto const name = string_option(parser, o.preset,
                                        split::settings::preset,
                                        split::default_preset);
        encoder = split::encoder_config::from_preset(split::find_preset(name));
        encoder.stream_copy = !parser.isSet(o.no_copy);
    }
    split::validate_extension(encoder.ext);

    encoder.program = string_option(parser, o.ffmpeg,
                                    split::settings::encoder_program,
                                    encoder.program);
    encoder.overwrite = parser.isSet(o.force)        ? split::overwrite_policy::overwrite
                      : parser.isSet(o.no_overwrite) ? split::overwrite_policy::skip
                      :                                split::overwrite_policy::fail;

    if (auto const seconds = integer_option(parser, o.timeout,
                                            split::settings::encoder_timeout,
                                            "timeout")) {
        encoder.timeout = std::chrono::seconds{*seconds};
    }
    if (auto const n = integer_option(parser, o.jobs, split::settings::jobs,
                                      "jobs")) {
        opts.jobs = static_cast<std::size_t>(*n);
    }

    opts.dry_run = parser.isSet(o.dry);
    opts.name_format = string_option(parser, o.name_format,
                                     split::settings::name_format,
                                     opts.name_format);
    opts.out_dir = string_option(parser, o.out_dir, split::settings::out_dir,
                                 {});
    opts.encoding = to_std_string(parser.value(o.encoding));
    if (!opts.encoding.empty() && !is_known_encoding(opts.encoding)) {
        raise(errc::config_error, "unknown text encoding: \"%s\"",
              opts.encoding.c_str());
    }

    qCDebug(lcApp) << "settings file:" << to_qstring(config::file_name());
    return opts;
}

}}    // namespace cuesplit::app
