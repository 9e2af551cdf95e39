#pragma once

#include "../graphics/gpu_layout.hpp"

namespace sl::contract {

// Inverse-transpose of the model matrix's upper 3x3, stored as three 4-wide rows.
// Row `i` holds column `i` of the matrix in `xyz`, `w` is written as 0 and never read.
SHADERLINK_GPU_STRUCT_BEGIN(NormalMatrixPack)
    SHADERLINK_GPU_FIELD(float4, row0)
    SHADERLINK_GPU_FIELD(float4, row1)
    SHADERLINK_GPU_FIELD(float4, row2)

    static auto from_model(float4x4 const& model) -> NormalMatrixPack;
    static auto pack(float3x3 const& normal_matrix) -> NormalMatrixPack;

    auto unpack() const -> float3x3;
    auto transform(float3 const& normal) const -> float3;
SHADERLINK_GPU_STRUCT_END()
SHADERLINK_VERIFY_GPU_STRUCT(NormalMatrixPack);

auto normal_matrix_of(float4x4 const& model) -> float3x3;

}
