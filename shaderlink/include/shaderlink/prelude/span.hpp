#pragma once

#include <cstddef>
#include <iterator>
#include <initializer_list>

namespace sl {

template <typename T>
struct Span final {
    Span() : data_(nullptr), size_(0) {}

    Span(T* data, size_t size) : data_(data), size_(size) {}

    Span(T* begin, T* end) : data_(begin), size_(end - begin) {}

    template <typename R> requires requires (R& r) { std::data(r); std::size(r); }
    Span(R& range) : data_(std::data(range)), size_(std::size(range)) {}

    auto size() const -> size_t { return size_; }
    auto data() const -> T* { return data_; }
    auto empty() const -> bool { return size_ == 0; }

    auto operator[](size_t index) const -> T& { return data_[index]; }

    auto begin() const -> T* { return data_; }
    auto end() const -> T* { return data_ + size_; }

    auto subspan(size_t offset, size_t count) const -> Span {
        return Span{data_ + offset, count};
    }

private:
    T* data_;
    size_t size_;
};

}
