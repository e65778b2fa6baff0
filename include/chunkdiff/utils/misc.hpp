#pragma once

#include <concepts>
#include <exception>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <boost/config.hpp>
#include <boost/predef/compiler.h>
#include <boost/preprocessor/cat.hpp>

namespace chunkdiff::utils
{

template <typename T, typename... Ts>
concept none_of = (!std::same_as<T, Ts> && ...);

template <typename T>
concept integer = std::integral<T>
                  && none_of<std::remove_cv_t<T>,
                             bool,
                             char,
                             wchar_t,
                             char8_t,
                             char16_t,
                             char32_t>;

template <typename T>
concept unsigned_integer = integer<T> && !std::is_signed_v<T>;

template <typename T>
constexpr auto div_ceil(T dividend, T divisor) -> T
{
    return dividend / divisor + (dividend % divisor != 0);
}
template <typename T, typename U>
constexpr auto div_ceil(T dividend, U divisor) -> std::common_type_t<T, U>
{
    using common_t = std::common_type_t<T, U>;
    return utils::div_ceil(static_cast<common_t>(dividend),
                           static_cast<common_t>(divisor));
}

template <unsigned_integer T, unsigned_integer U>
constexpr auto round_up(T value, U multiple) noexcept
        -> std::common_type_t<T, U>
{
    return utils::div_ceil(value, multiple) * multiple;
}

template <typename Fn>
struct scope_guard
{
    BOOST_FORCEINLINE scope_guard(Fn &&fn)
        : mFn(std::forward<Fn>(fn))
    {
    }
    BOOST_FORCEINLINE ~scope_guard() noexcept
    {
        mFn();
    }

private:
    Fn mFn;
};

enum class on_exit_scope
{
};

template <typename Fn>
BOOST_FORCEINLINE auto operator+(on_exit_scope, Fn &&fn) -> scope_guard<Fn>
{
    return scope_guard<Fn>{std::forward<Fn>(fn)};
}

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define CHUNKDIFF_ANONYMOUS_VAR(id) BOOST_PP_CAT(id, __LINE__)
#define CHUNKDIFF_SCOPE_EXIT                                                   \
    auto CHUNKDIFF_ANONYMOUS_VAR(_scope_exit_guard_)                           \
            = ::chunkdiff::utils::on_exit_scope{} + [&]()

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace chunkdiff::utils
