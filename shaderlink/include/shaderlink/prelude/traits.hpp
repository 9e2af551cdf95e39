#pragma once

#include <type_traits>
#include <concepts>

namespace sl::traits {

template <typename T>
constexpr bool AlwaysFalse = false;

template <typename T>
concept Enum = std::is_enum_v<T>;

template <typename T, typename... Ts>
struct OneOfHelper;
template <typename T, typename First, typename... Last>
struct OneOfHelper<T, First, Last...> final {
    static constexpr bool value = std::is_same_v<T, First> || OneOfHelper<T, Last...>::value;
};
template <typename T>
struct OneOfHelper<T> final {
    static constexpr bool value = false;
};
template <typename T, typename... Ts>
constexpr bool one_of_v = OneOfHelper<T, Ts...>::value;
template <typename T, typename... Ts>
concept OneOf = one_of_v<T, Ts...>;

}
