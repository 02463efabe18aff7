////////////////////////////////////////////////////////////////////////////////
//
// core/filesystem.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <cuesplit/error.hpp>
#include <cuesplit/stddef.hpp>

#include "core/filesystem.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>


namespace cuesplit {
namespace fs {
namespace {

constexpr bool is_current_or_parent_directory(char const* const p) noexcept
{
    return p[0] == '.' && (p[1] == '\0' || (p[1] == '.' && p[2] == '\0'));
}

}     // namespace <unnamed>


std::string extension(std::string const& p)
{
    auto const name = fs::filename(p);
    auto const pos = name.rfind('.');
    if (pos != std::string::npos && pos != 0) {
        return name.substr(pos + 1);
    }
    return {};
}

std::string parent_path(std::string const& p)
{
    auto const pos = p.rfind('/');
    if (pos == std::string::npos) {
        return {};
    }
    if (pos == 0) {
        return (p.size() > 1) ? "/" : "";
    }

    auto end = pos;
    for (; end > 1 && p[end - 1] == '/'; --end) {}
    return p.substr(0, end);
}

std::string filename(std::string const& p)
{
    auto const pos = p.rfind('/');
    if (pos == std::string::npos) {
        return p;
    }
    return p.substr(pos + 1);
}

std::string join(std::string_view const lhs, std::string_view const rhs)
{
    if (lhs.empty() || is_absolute(rhs)) {
        return std::string{rhs};
    }

    std::string ret{lhs};
    if (!rhs.empty()) {
        if (ret.back() != '/') {
            ret += '/';
        }
        ret += rhs;
    }
    return ret;
}

std::string absolute(std::string const& p)
{
    if (is_absolute(p)) {
        return p;
    }

    char buf[PATH_MAX];
    if (::getcwd(buf, sizeof(buf)) == nullptr) {
        raise_current_system_error();
    }
    return fs::join(buf, p);
}

std::string canonical(std::string const& p)
{
    char buf[PATH_MAX];
    if (::realpath(p.c_str(), buf) == nullptr) {
        raise_current_system_error();
    }
    return buf;
}


directory_range::iterator& directory_range::iterator::operator++()
{
    auto const handle = static_cast<::DIR*>(range_->handle_);
    while (auto entry = (errno = 0, ::readdir(handle))) {
        if (!is_current_or_parent_directory(entry->d_name)) {
            entry_ = fs::join(range_->root_, entry->d_name);
            return *this;
        }
    }

    auto const ev = errno;
    range_ = nullptr;
    if (CUESPLIT_UNLIKELY(ev != 0)) {
        raise_system_error(ev);
    }
    return *this;
}

directory_range::directory_range(std::string p) :
    root_{std::move(p)},
    iter_{this}
{
    handle_ = ::opendir(root_.c_str());
    if (CUESPLIT_UNLIKELY(handle_ == nullptr)) {
        raise_current_system_error();
    }

    try {
        ++iter_;
    }
    catch (...) {
        ::closedir(static_cast<::DIR*>(handle_));
        throw;
    }
}

directory_range::~directory_range()
{
    ::closedir(static_cast<::DIR*>(handle_));
}


bool create_directory(std::string const& p)
{
    auto const created = (::mkdir(p.c_str(), 0777) == 0);
    if (!created) {
        auto const ev = errno;
        if (ev != EEXIST || !fs::is_directory(p)) {
            raise_system_error(ev);
        }
    }
    return created;
}

void create_directories(std::string const& p)
{
    if (p.empty() || fs::is_directory(p)) {
        return;
    }
    fs::create_directories(fs::parent_path(p));
    fs::create_directory(p);
}

file_type status(std::string const& p)
{
    struct ::stat st;
    if (::stat(p.c_str(), &st) != 0) {
        switch (auto const ev = errno) {
        case ENOTDIR:
        case ENOENT:
            return file_type::not_found;
        default:
            raise_system_error(ev);
        }
    }

    return S_ISREG(st.st_mode) ? file_type::regular
         : S_ISDIR(st.st_mode) ? file_type::directory
         : S_ISLNK(st.st_mode) ? file_type::symlink
         :                       file_type::other;
}

}}    // namespace cuesplit::fs
