#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>

namespace sl {

template <typename... Ts>
struct TypeList final {
    static constexpr size_t size = sizeof...(Ts);
};

template <typename T, typename... Ts>
constexpr auto type_push_back(TypeList<Ts...>) -> TypeList<Ts..., T>;

// Calls `func(std::type_identity<T>{}, index)` for every `T` in the list, in order.
template <typename Func, typename... Ts>
constexpr auto for_each_type(TypeList<Ts...>, Func&& func) -> void {
    [&]<size_t... Is>(std::index_sequence<Is...>) {
        (func(std::type_identity<Ts>{}, Is), ...);
    }(std::index_sequence_for<Ts...>{});
}

}
