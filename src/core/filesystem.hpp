////////////////////////////////////////////////////////////////////////////////
//
// core/filesystem.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_56F06C55_2B8A_4C6D_9963_D0D275BCFA42
#define CUESPLIT_INCLUDED_56F06C55_2B8A_4C6D_9963_D0D275BCFA42


#include <cuesplit/stddef.hpp>

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>


namespace cuesplit {
namespace fs {

enum class file_type {
    not_found = -1,
    none      = 0,
    regular   = 1,
    directory = 2,
    symlink   = 3,
    other     = 4,
};


class directory_range
{
public:
    class iterator
    {
    public:
        using value_type        = std::string;
        using reference         = std::string const&;
        using pointer           = std::string const*;
        using iterator_category = std::input_iterator_tag;
        using difference_type   = std::ptrdiff_t;

        iterator& operator++();

        reference operator*() const noexcept
        { return entry_; }

        pointer operator->() const noexcept
        { return std::addressof(**this); }

        friend bool operator==(iterator const& x, iterator const& y) noexcept
        { return (x.range_ == y.range_); }

        friend bool operator!=(iterator const& x, iterator const& y) noexcept
        { return !(x == y); }

    private:
        friend class directory_range;

        explicit iterator(directory_range const* const p) noexcept :
            range_{p}
        {}

        directory_range const* range_{nullptr};
        std::string entry_;
    };

    explicit directory_range(std::string);
    ~directory_range();

    directory_range(directory_range const&) = delete;
    directory_range& operator=(directory_range const&) = delete;

    auto begin() const noexcept { return iter_; }
    auto end()   const noexcept { return iterator{nullptr}; }

private:
    void* handle_;
    std::string root_;
    iterator iter_;
};


// Creates every missing directory along the path. Throws std::system_error.
void create_directories(std::string const&);
bool create_directory(std::string const&);

file_type status(std::string const&);
std::string extension(std::string const&);
std::string parent_path(std::string const&);
std::string filename(std::string const&);
std::string absolute(std::string const&);

// Resolves symbolic links and dot segments. Throws std::system_error when
// the path does not exist.
std::string canonical(std::string const&);

// Appends a relative path; an absolute right-hand side replaces the left.
std::string join(std::string_view, std::string_view);

inline bool is_absolute(std::string_view const p) noexcept
{ return !p.empty() && p.front() == '/'; }

inline bool exists(std::string const& p)
{ return (fs::status(p) != fs::file_type::not_found); }

inline bool is_directory(std::string const& p)
{ return (fs::status(p) == fs::file_type::directory); }

inline bool is_regular_file(std::string const& p)
{ return (fs::status(p) == fs::file_type::regular); }

}}    // namespace cuesplit::fs


#endif  // CUESPLIT_INCLUDED_56F06C55_2B8A_4C6D_9963_D0D275BCFA42
