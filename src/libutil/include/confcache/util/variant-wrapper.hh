#pragma once
///@file

#include <type_traits>
#include <variant>

namespace confcache {

/**
 * Visitor built from a set of lambdas, for `std::visit` over a wrapper's
 * `raw` field.
 */
template<class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};

template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace confcache

#define FORCE_DEFAULT_CONSTRUCTORS(CLASS_NAME)            \
    CLASS_NAME(CLASS_NAME &&) = default;                  \
    CLASS_NAME & operator=(CLASS_NAME &&) = default;      \
    CLASS_NAME(const CLASS_NAME &) = default;             \
    CLASS_NAME(CLASS_NAME &) = default;                   \
    CLASS_NAME & operator=(const CLASS_NAME &) = default; \
    CLASS_NAME & operator=(CLASS_NAME &) = default;

/**
 * Forwarding constructor for wrapper types. All arguments go to the
 * construction of the `raw` field, whose type must be named `Raw`, and
 * the copy and move operations are defaulted.
 */
#define MAKE_WRAPPER_CONSTRUCTOR(CLASS_NAME)                                                               \
    FORCE_DEFAULT_CONSTRUCTORS(CLASS_NAME)                                                                 \
    template<typename... Args>                                                                             \
        requires(                                                                                          \
            !(sizeof...(Args) == 1 && (std::is_same_v<std::remove_cvref_t<Args>, CLASS_NAME> && ...))      \
            && std::is_constructible_v<Raw, Args...>)                                                      \
    CLASS_NAME(Args &&... arg)                                                                             \
        : raw(std::forward<Args>(arg)...)                                                                  \
    {                                                                                                      \
    }
