#pragma once

#include "../normal_matrix.hpp"
#include "../texture_slot.hpp"

// Single-bounce ray tracing with one directional light. The raster path keeps the
// records of the shadowed generation under its own names here.
namespace sl::contract::ray_traced {

enum class BufferIndex : uint32_t {
    mesh_vertices = 0,
    uniforms = 1,
    light_params = 2,
    rt_frame = 3,
    rt_accel = 4,
    rt_vertices = 5,
    rt_indices = 6,
    rt_instances = 7,
};

enum class VertexAttribute : uint32_t {
    position = 0,
    normal = 1,
    texcoord = 2,
};

enum class TextureIndex : uint32_t {
    base_color = 0,
    shadow_map = 1,
    rt_output = 2,
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
    SHADERLINK_GPU_FIELD(float3, light_direction)
    SHADERLINK_GPU_FIELD(float3, light_color)
    SHADERLINK_GPU_FIELD(float, ambient_intensity)
    SHADERLINK_GPU_FIELD(float3, camera_position)
    SHADERLINK_GPU_FIELD(float, shadow_bias)
SHADERLINK_GPU_STRUCT_END()
SHADERLINK_VERIFY_GPU_STRUCT(LightParams);

SHADERLINK_GPU_STRUCT_BEGIN(FrameUniforms)
    SHADERLINK_GPU_FIELD(float4x4, inv_view_proj)
    SHADERLINK_GPU_FIELD(float3, camera_position)
    SHADERLINK_GPU_FIELD(uint, frame_index)
    SHADERLINK_GPU_FIELD(uint2, image_size)
    SHADERLINK_GPU_FIELD(float3, light_direction)
    SHADERLINK_GPU_FIELD(float, light_intensity)
    SHADERLINK_GPU_FIELD(float3, light_color)
    SHADERLINK_GPU_FIELD(float, ambient_intensity)
SHADERLINK_GPU_STRUCT_END()
SHADERLINK_VERIFY_GPU_STRUCT(FrameUniforms);

// Entry `i` describes instance `i` of the acceleration structure.
SHADERLINK_GPU_STRUCT_BEGIN(InstanceInfo)
    SHADERLINK_GPU_FIELD(uint, base_index)
    SHADERLINK_GPU_FIELD(uint, base_vertex)
    SHADERLINK_GPU_FIELD(uint, index_count)
    SHADERLINK_GPU_FIELD(uint, buffer_index)
    SHADERLINK_GPU_FIELD(float4x4, model_matrix)
    SHADERLINK_GPU_FIELD(float4, base_color)
    SHADERLINK_GPU_FIELD(uint, base_color_texture)
SHADERLINK_GPU_STRUCT_END()
SHADERLINK_VERIFY_GPU_STRUCT(InstanceInfo);

}
