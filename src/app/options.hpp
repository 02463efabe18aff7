////////////////////////////////////////////////////////////////////////////////
//
// app/options.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_9C2B7E15_3A48_4F6D_8E01_B4D57A6C93F8
#define CUESPLIT_INCLUDED_9C2B7E15_3A48_4F6D_8E01_B4D57A6C93F8


#include <cuesplit/stddef.hpp>

#include "media/name_format.hpp"
#include "split/job.hpp"

#include <cstddef>
#include <string>

#include <QtCore/QStringList>


namespace cuesplit {
namespace app {

enum class action : uint8 {
    split,
    show_help,
    show_version,
    template_help,
    list_presets,
};


struct options
{
    app::action action{action::split};
    std::string help_text;

    std::string path;
    std::size_t jobs{0};
    bool dry_run{false};
    bool verbose{false};
    std::string name_format{media::default_name_format};
    std::string out_dir;
    std::string encoding;
    split::encoder_config encoder;
};


// Parses the full argument list, program name included. Everything after
// the first "--" is passed to the encoder verbatim. Settings fill in the
// options that are not given. Throws errc::config_error.
options parse_options(QStringList const&);

}}    // namespace cuesplit::app


#endif  // CUESPLIT_INCLUDED_9C2B7E15_3A48_4F6D_8E01_B4D57A6C93F8
