#pragma once

#include <array>
#include <cstddef>
#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gpu_types.hpp"
#include "../prelude/math.hpp"
#include "../prelude/template_utils.hpp"
#include "../utils/serde.hpp"

namespace sl::gfx {

// A record whose layout is described by `SHADERLINK_GPU_STRUCT_BEGIN/END`.
template <typename S>
concept GpuStruct = requires { typename S::GpuFieldList; };

template <typename Type, typename FieldAccessor, size_t array_size>
struct TGpuFieldMetadata final {
    using ValueType = Type;
    using Accessor = FieldAccessor;
    static constexpr size_t count = array_size;
};

template <typename S>
constexpr auto gpu_struct_size() -> size_t;
template <typename S>
constexpr auto gpu_struct_alignment() -> size_t;

template <GpuStruct S>
struct GpuTypeTraits<S> final {
    using Storage = S;
    static constexpr std::string_view type_name = S::gpu_type_name;
    static constexpr GpuBaseType base_type = GpuBaseType::record;
    static constexpr uint32_t columns = 1;
    static constexpr uint32_t rows = 1;
    static constexpr size_t data_size = gpu_struct_size<S>();
    static constexpr size_t size = gpu_struct_size<S>();
    static constexpr size_t alignment = gpu_struct_alignment<S>();
};

// Compile-time description of one field, derived only from the declared field list.
struct GpuFieldInfo final {
    std::string_view name;
    std::string_view type_name;
    GpuBaseType base_type = GpuBaseType::float32;
    uint32_t columns = 1;
    uint32_t rows = 1;
    size_t offset = 0;
    // Size of one element in the GPU layout, `data_size` bytes of which are meaningful.
    size_t size = 0;
    size_t data_size = 0;
    size_t alignment = 0;
    // 0 for a plain field.
    size_t array_size = 0;
    size_t stride = 0;
    size_t cpu_offset = 0;
};

template <GpuStruct S>
constexpr auto gpu_field_infos() -> std::array<GpuFieldInfo, S::GpuFieldList::size> {
    std::array<GpuFieldInfo, S::GpuFieldList::size> fields{};
    size_t offset = 0;
    for_each_type(typename S::GpuFieldList{}, [&fields, &offset](auto meta_id, size_t index) {
        using Meta = typename decltype(meta_id)::type;
        using Traits = GpuTypeTraits<typename Meta::ValueType>;
        offset = aligned_size(offset, Traits::alignment);
        auto stride = aligned_size(Traits::size, Traits::alignment);
        fields[index] = GpuFieldInfo{
            .name = Meta::Accessor::field_name,
            .type_name = Traits::type_name,
            .base_type = Traits::base_type,
            .columns = Traits::columns,
            .rows = Traits::rows,
            .offset = offset,
            .size = Traits::size,
            .data_size = Traits::data_size,
            .alignment = Traits::alignment,
            .array_size = Meta::count,
            .stride = stride,
            .cpu_offset = Meta::Accessor::cpu_offset(),
        };
        offset += Meta::count == 0 ? Traits::size : stride * Meta::count;
    });
    return fields;
}

// Records always start on a 16-byte boundary.
template <typename S>
constexpr auto gpu_struct_alignment() -> size_t {
    size_t alignment = 16;
    for (auto const& field : gpu_field_infos<S>()) {
        alignment = alignment < field.alignment ? field.alignment : alignment;
    }
    return alignment;
}

template <typename S>
constexpr auto gpu_struct_size() -> size_t {
    size_t end = 0;
    for (auto const& field : gpu_field_infos<S>()) {
        end = field.offset + (field.array_size == 0 ? field.size : field.stride * field.array_size);
    }
    return aligned_size(end, gpu_struct_alignment<S>());
}

// True when the C++ compiler placed every field where the GPU layout rules put it.
template <GpuStruct S>
constexpr auto cpu_layout_matches() -> bool {
    if (sizeof(S) != gpu_struct_size<S>() || alignof(S) != gpu_struct_alignment<S>()) {
        return false;
    }
    for (auto const& field : gpu_field_infos<S>()) {
        if (field.cpu_offset != field.offset) { return false; }
    }
    return true;
}

// A 3-component field that is followed by another field leaves its trailing 4 bytes unused,
// so the next field starts on a 16-byte boundary.
template <GpuStruct S>
constexpr auto vec3_fields_padded() -> bool {
    auto fields = gpu_field_infos<S>();
    for (size_t i = 0; i + 1 < fields.size(); i++) {
        if (fields[i].columns == 3 && fields[i].rows == 1 && fields[i + 1].offset % 16 != 0) {
            return false;
        }
    }
    return true;
}

#define SHADERLINK_VERIFY_GPU_STRUCT(ty) \
    static_assert(::sl::gfx::cpu_layout_matches<ty>(), "C++ layout of '" #ty "' diverges from its GPU layout"); \
    static_assert(::sl::gfx::vec3_fields_padded<ty>(), "a 3-component field of '" #ty "' is not padded to 16 bytes"); \
    static_assert(sizeof(ty) % 16 == 0, "size of '" #ty "' is not a multiple of 16 bytes")


struct GpuField final {
    std::string name;
    std::string type_name;
    GpuBaseType base_type = GpuBaseType::float32;
    uint32_t columns = 1;
    uint32_t rows = 1;
    size_t offset = 0;
    size_t size = 0;
    size_t data_size = 0;
    size_t alignment = 0;
    size_t array_size = 0;
    size_t stride = 0;

    auto is_array() const -> bool { return array_size != 0; }
    // Bytes covered by the field including all array elements.
    auto extent() const -> size_t { return array_size == 0 ? size : stride * array_size; }

    static auto to_value(serde::Value& v, GpuField const& o) -> void;
    static auto from_value(serde::Value const& v, GpuField& o) -> void;
};

struct GpuStructLayout final {
    auto find(std::string_view field_name) const -> GpuField const*;

    static auto to_value(serde::Value& v, GpuStructLayout const& o) -> void;
    static auto from_value(serde::Value const& v, GpuStructLayout& o) -> void;

    std::string name;
    size_t size = 0;
    size_t alignment = 0;
    std::vector<GpuField> fields;
};

template <GpuStruct S>
auto gpu_struct_layout_of() -> GpuStructLayout {
    GpuStructLayout layout{
        .name = std::string{S::gpu_type_name},
        .size = gpu_struct_size<S>(),
        .alignment = gpu_struct_alignment<S>(),
    };
    for (auto const& info : gpu_field_infos<S>()) {
        layout.fields.push_back(GpuField{
            .name = std::string{info.name},
            .type_name = std::string{info.type_name},
            .base_type = info.base_type,
            .columns = info.columns,
            .rows = info.rows,
            .offset = info.offset,
            .size = info.size,
            .data_size = info.data_size,
            .alignment = info.alignment,
            .array_size = info.array_size,
            .stride = info.stride,
        });
    }
    return layout;
}


struct LayoutError final : std::exception {
    LayoutError() noexcept = default;
    LayoutError(std::string const& str) noexcept : error_(str) {}
    LayoutError(std::string&& str) noexcept : error_(std::move(str)) {}

    auto what() const noexcept -> char const* override { return error_.c_str(); }

private:
    std::string error_;
};

struct LayoutMismatch final {
    std::string record;
    // Empty when the mismatch concerns the whole record.
    std::string field;
    std::string description;
};

// Compares the producer's description of a record with the consumer's, field by field.
auto verify_layout(GpuStructLayout const& producer, GpuStructLayout const& consumer) -> std::vector<LayoutMismatch>;

// Logs every mismatch at critical level and throws `LayoutError` if there is any.
auto ensure_layout_compatible(GpuStructLayout const& producer, GpuStructLayout const& consumer) -> void;

auto layouts_to_value(std::vector<GpuStructLayout> const& layouts) -> serde::Value;
auto layouts_from_value(serde::Value const& v) -> std::vector<GpuStructLayout>;


#define SHADERLINK_GPU_STRUCT_BEGIN(nm) struct alignas(16) nm final { \
    using XSelf = nm; \
    static constexpr std::string_view gpu_type_name{#nm}; \
    template <size_t index, typename XDummy = void> struct XFieldsTuple { using type = typename XFieldsTuple<index - 1, XDummy>::type; }; \
    template <typename XDummy> struct XFieldsTuple<__LINE__, XDummy> { using type = ::sl::TypeList<>; }; \
    static auto gpu_layout() -> ::sl::gfx::GpuStructLayout const& { \
        static const auto layout = ::sl::gfx::gpu_struct_layout_of<nm>(); \
        return layout; \
    }

#define SHADERLINK_GPU_FIELD(ty, nm) alignas(::sl::gfx::GpuTypeTraits<ty>::alignment) ::sl::gfx::GpuStorage<ty> nm; \
    struct XField_##nm final { \
        static constexpr std::string_view field_name{#nm}; \
        static constexpr auto cpu_offset() -> size_t { return offsetof(XSelf, nm); } \
    }; \
    template <typename XDummy> struct XFieldsTuple<__LINE__, XDummy> { \
        using type = decltype(::sl::type_push_back<::sl::gfx::TGpuFieldMetadata<ty, XField_##nm, 0>>(typename XFieldsTuple<__LINE__ - 1, XDummy>::type{})); \
    };

#define SHADERLINK_GPU_FIELD_ARRAY(ty, nm, n) alignas(::sl::gfx::GpuTypeTraits<ty>::alignment) ::sl::gfx::GpuStorage<ty> nm[n]; \
    struct XField_##nm final { \
        static constexpr std::string_view field_name{#nm}; \
        static constexpr auto cpu_offset() -> size_t { return offsetof(XSelf, nm); } \
    }; \
    template <typename XDummy> struct XFieldsTuple<__LINE__, XDummy> { \
        using type = decltype(::sl::type_push_back<::sl::gfx::TGpuFieldMetadata<ty, XField_##nm, n>>(typename XFieldsTuple<__LINE__ - 1, XDummy>::type{})); \
    };

#define SHADERLINK_GPU_STRUCT_END() using GpuFieldList = XFieldsTuple<__LINE__ - 1>::type; };

}
