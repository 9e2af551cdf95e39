#pragma once

#include <utility>
#include <variant>

namespace sl {

template <typename T, typename E>
struct Expected final {
    Expected(T const& value) : data_(std::in_place_index<0>, value) {}
    Expected(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
    Expected(E const& error) : data_(std::in_place_index<1>, error) {}
    Expected(E&& error) : data_(std::in_place_index<1>, std::move(error)) {}

    auto has_value() const -> bool { return data_.index() == 0; }
    explicit operator bool() const { return has_value(); }

    auto value() & -> T& { return std::get<0>(data_); }
    auto value() const& -> T const& { return std::get<0>(data_); }
    auto value() && -> T&& { return std::move(std::get<0>(data_)); }

    auto error() & -> E& { return std::get<1>(data_); }
    auto error() const& -> E const& { return std::get<1>(data_); }
    auto error() && -> E&& { return std::move(std::get<1>(data_)); }

private:
    std::variant<T, E> data_;
};

}
