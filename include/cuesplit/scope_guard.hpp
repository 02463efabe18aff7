////////////////////////////////////////////////////////////////////////////////
//
// cuesplit/scope_guard.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CUESPLIT_INCLUDED_58BC6E81_E66A_4A9E_A8F8_5CE1B6B05D4F
#define CUESPLIT_INCLUDED_58BC6E81_E66A_4A9E_A8F8_5CE1B6B05D4F


#include <cuesplit/stddef.hpp>

#include <type_traits>
#include <utility>


namespace cuesplit {

template<typename F>
class scope_guard
{
public:
    static_assert(std::is_nothrow_move_constructible_v<F>, "");

    scope_guard(scope_guard const&) = delete;
    scope_guard& operator=(scope_guard&&) = delete;
    scope_guard& operator=(scope_guard const&) = delete;

    explicit scope_guard(F&& f) noexcept :
        func_(std::move(f))
    {}

    scope_guard(scope_guard&& x) noexcept :
        func_(std::move(x.func_)),
        dismissed_(std::exchange(x.dismissed_, true))
    {}

    ~scope_guard()
    {
        if (!dismissed_) {
            func_();
        }
    }

    void dismiss() noexcept
    {
        dismissed_ = true;
    }

private:
    F func_;
    bool dismissed_{false};
};


namespace aux {

enum class scope_exit {};

template<typename F>
CUESPLIT_INLINE auto operator+(aux::scope_exit, F&& f) noexcept
{ return scope_guard<std::decay_t<F>>(std::forward<F>(f)); }

}}    // namespace cuesplit::aux


#define CUESPLIT_SCOPE_EXIT                                                 \
    [[maybe_unused]] auto const& CUESPLIT_PP_ANON(cuesplit_scope_exit_) =   \
        ::cuesplit::aux::scope_exit() + [&]() noexcept


#endif  // CUESPLIT_INCLUDED_58BC6E81_E66A_4A9E_A8F8_5CE1B6B05D4F
