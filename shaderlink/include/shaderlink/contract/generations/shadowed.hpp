#pragma once

#include "../normal_matrix.hpp"

// Shadow-mapped forward shading, adds a light record and the packed normal matrix.
namespace sl::contract::shadowed {

enum class BufferIndex : uint32_t {
    mesh_vertices = 0,
    uniforms = 1,
    light_params = 2,
};

enum class VertexAttribute : uint32_t {
    position = 0,
    normal = 1,
    texcoord = 2,
};

enum class TextureIndex : uint32_t {
    base_color = 0,
    shadow_map = 1,
};

SHADERLINK_GPU_STRUCT_BEGIN(DrawUniforms)
    SHADERLINK_GPU_FIELD(float4x4, projection_matrix)
    SHADERLINK_GPU_FIELD(float4x4, view_matrix)
    SHADERLINK_GPU_FIELD(float4x4, model_matrix)
    SHADERLINK_GPU_FIELD(float4x4, light_view_proj_matrix)
    SHADERLINK_GPU_FIELD(NormalMatrixPack, normal_matrix)
    SHADERLINK_GPU_FIELD(float4, base_color)
SHADERLINK_GPU_STRUCT_END()
SHADERLINK_VERIFY_GPU_STRUCT(DrawUniforms);

SHADERLINK_GPU_STRUCT_BEGIN(LightParams)
    // Direction the light travels, normalized.
    SHADERLINK_GPU_FIELD(float3, light_direction)
    SHADERLINK_GPU_FIELD(float3, light_color)
    SHADERLINK_GPU_FIELD(float, ambient_intensity)
    SHADERLINK_GPU_FIELD(float3, camera_position)
    SHADERLINK_GPU_FIELD(float, shadow_bias)
SHADERLINK_GPU_STRUCT_END()
SHADERLINK_VERIFY_GPU_STRUCT(LightParams);

}
