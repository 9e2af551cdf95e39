#pragma once

#include <utility>
#include <cctype>
#include <string>
#include <string_view>

namespace sl {

template <typename... Ts>
struct FunctorsHelper final : Ts... {
    FunctorsHelper(Ts&&... ts) : Ts(std::forward<Ts>(ts))... {}
    using Ts::operator()...;
};
template <typename... Ts>
FunctorsHelper(Ts...) -> FunctorsHelper<Ts...>;

// "rt_dir_lights" -> "RtDirLights"
inline auto snake_to_pascal(std::string_view snake) -> std::string {
    std::string result{};
    result.reserve(snake.size());
    auto upper_next = true;
    for (auto ch : snake) {
        if (ch == '_') {
            upper_next = true;
        } else if (upper_next) {
            result.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
            upper_next = false;
        } else {
            result.push_back(ch);
        }
    }
    return result;
}

}
