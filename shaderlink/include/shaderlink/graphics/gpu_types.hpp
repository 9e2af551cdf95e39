#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "../math/math.hpp"

namespace sl::gfx {

enum class GpuBaseType : uint8_t {
    float32,
    int32,
    uint32,
    record,
};

// A 3-component vector occupies a whole 16-byte slot on the GPU side. Deriving from the glm type
// keeps arithmetic and conversions working while the trailing 4 bytes become padding.
template <typename T, size_t padded_size>
struct alignas(padded_size) GpuPadded final : T {
    using T::T;

    GpuPadded() = default;
    GpuPadded(T const& value) : T(value) {}

    auto operator=(T const& value) -> GpuPadded& {
        T::operator=(value);
        return *this;
    }

    auto value() const -> T const& { return *this; }
};

using GpuFloat3 = GpuPadded<float3, 16>;
using GpuInt3 = GpuPadded<int3, 16>;
using GpuUint3 = GpuPadded<uint3, 16>;

template <typename T>
struct GpuTypeTraits;

#define SHADERLINK_GPU_BASIC_TYPE(ty, base, cols, rows_, sz, align, storage) \
    template <> \
    struct GpuTypeTraits<ty> final { \
        using Storage = storage; \
        static constexpr std::string_view type_name{#ty}; \
        static constexpr GpuBaseType base_type = GpuBaseType::base; \
        static constexpr uint32_t columns = cols; \
        static constexpr uint32_t rows = rows_; \
        static constexpr size_t data_size = sizeof(ty); \
        static constexpr size_t size = sz; \
        static constexpr size_t alignment = align; \
    };
SHADERLINK_GPU_BASIC_TYPE(float, float32, 1, 1, 4, 4, float)
SHADERLINK_GPU_BASIC_TYPE(float2, float32, 2, 1, 8, 8, float2)
SHADERLINK_GPU_BASIC_TYPE(float3, float32, 3, 1, 16, 16, GpuFloat3)
SHADERLINK_GPU_BASIC_TYPE(float4, float32, 4, 1, 16, 16, float4)
SHADERLINK_GPU_BASIC_TYPE(int, int32, 1, 1, 4, 4, int)
SHADERLINK_GPU_BASIC_TYPE(int2, int32, 2, 1, 8, 8, int2)
SHADERLINK_GPU_BASIC_TYPE(int3, int32, 3, 1, 16, 16, GpuInt3)
SHADERLINK_GPU_BASIC_TYPE(int4, int32, 4, 1, 16, 16, int4)
SHADERLINK_GPU_BASIC_TYPE(uint, uint32, 1, 1, 4, 4, uint)
SHADERLINK_GPU_BASIC_TYPE(uint2, uint32, 2, 1, 8, 8, uint2)
SHADERLINK_GPU_BASIC_TYPE(uint3, uint32, 3, 1, 16, 16, GpuUint3)
SHADERLINK_GPU_BASIC_TYPE(uint4, uint32, 4, 1, 16, 16, uint4)
SHADERLINK_GPU_BASIC_TYPE(float4x4, float32, 4, 4, 64, 16, float4x4)
#undef SHADERLINK_GPU_BASIC_TYPE

template <typename T>
using GpuStorage = typename GpuTypeTraits<T>::Storage;

}
