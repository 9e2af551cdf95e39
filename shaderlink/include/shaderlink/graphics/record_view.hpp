#pragma once

#include <cstddef>
#include <cstring>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "gpu_layout.hpp"
#include "../prelude/span.hpp"

namespace sl::gfx {

// Reads fields out of raw bytes using only a layout description, the way a shader does.
struct GpuRecordView final {
    GpuRecordView(GpuStructLayout const& layout, Span<std::byte const> bytes);

    auto layout() const -> GpuStructLayout const& { return *layout_; }
    auto bytes() const -> Span<std::byte const> { return bytes_; }

    // Bytes of one element of the field, including trailing padding.
    auto field_bytes(std::string_view name, size_t element = 0) const -> Span<std::byte const>;

    template <typename T>
    auto read(std::string_view name, size_t element = 0) const -> T {
        auto const& field = checked_field(name, element);
        check_type<T>(field);
        T value{};
        std::memcpy(&value, bytes_.data() + field.offset + element * field.stride, copy_size<T>(field));
        return value;
    }

private:
    auto checked_field(std::string_view name, size_t element) const -> GpuField const&;

    template <typename T>
    auto check_type(GpuField const& field) const -> void {
        using Traits = GpuTypeTraits<T>;
        if (
            field.base_type != Traits::base_type || field.columns != Traits::columns || field.rows != Traits::rows
            || (Traits::base_type == GpuBaseType::record && field.type_name != Traits::type_name)
        ) {
            throw LayoutError{fmt::format(
                "field '{}.{}' is '{}', cannot be read as '{}'", layout_->name, field.name, field.type_name, Traits::type_name
            )};
        }
    }

    template <typename T>
    static auto copy_size(GpuField const& field) -> size_t {
        return field.data_size < sizeof(T) ? field.data_size : sizeof(T);
    }

    GpuStructLayout const* layout_;
    Span<std::byte const> bytes_;
};

// A tightly packed array of records, as bound to a buffer slot.
struct GpuBufferView final {
    GpuBufferView(GpuStructLayout const& layout, Span<std::byte const> bytes);

    auto size() const -> size_t;
    auto operator[](size_t index) const -> GpuRecordView;

private:
    GpuStructLayout const* layout_;
    Span<std::byte const> bytes_;
};

template <typename T>
auto as_bytes(T const& record) -> Span<std::byte const> {
    return Span<std::byte const>{reinterpret_cast<std::byte const*>(&record), sizeof(T)};
}

template <typename T>
auto as_bytes(std::vector<T> const& records) -> Span<std::byte const> {
    return Span<std::byte const>{reinterpret_cast<std::byte const*>(records.data()), records.size() * sizeof(T)};
}

}
