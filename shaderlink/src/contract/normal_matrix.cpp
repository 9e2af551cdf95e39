#include <shaderlink/contract/normal_matrix.hpp>

namespace sl::contract {

auto normal_matrix_of(float4x4 const& model) -> float3x3 {
    return math::transpose(math::inverse(float3x3{model}));
}

auto NormalMatrixPack::pack(float3x3 const& normal_matrix) -> NormalMatrixPack {
    NormalMatrixPack packed{};
    packed.row0 = float4{normal_matrix[0], 0.0f};
    packed.row1 = float4{normal_matrix[1], 0.0f};
    packed.row2 = float4{normal_matrix[2], 0.0f};
    return packed;
}

auto NormalMatrixPack::from_model(float4x4 const& model) -> NormalMatrixPack {
    return pack(normal_matrix_of(model));
}

auto NormalMatrixPack::unpack() const -> float3x3 {
    return float3x3{float3{row0}, float3{row1}, float3{row2}};
}

auto NormalMatrixPack::transform(float3 const& normal) const -> float3 {
    return float3{row0} * normal.x + float3{row1} * normal.y + float3{row2} * normal.z;
}

}
