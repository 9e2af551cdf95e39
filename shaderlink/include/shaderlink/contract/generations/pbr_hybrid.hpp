#pragma once

#include "../normal_matrix.hpp"
#include "../texture_slot.hpp"

// PBR materials with five texture channels and spherical-harmonics ambient.
// Slots only append to the multi_light numbering. New textures go behind the material table.
namespace sl::contract::pbr_hybrid {

enum class BufferIndex : uint32_t {
    mesh_vertices = 0,
    uniforms = 1,
    rt_frame = 2,
    rt_accel = 3,
    rt_vertices = 4,
    rt_indices = 5,
    rt_instances = 6,
    rt_uvs = 7,
    rt_dir_lights = 8,
    rt_point_lights = 9,
    rt_area_lights = 10,
    light_params = 11,
    rt_normals = 12,
    rt_tangents = 13,
};

enum class VertexAttribute : uint32_t {
    position = 0,
    normal = 1,
    texcoord = 2,
    tangent = 3,
};

enum class TextureIndex : uint32_t {
    output = 0,
    history_color = 1,
    history_depth = 2,
    history_shadow = 3,
    material_textures = 4,
    shadow_map = material_textures + material_texture_table_size,
    environment = shadow_map + 1,
};

inline constexpr uint32_t sh_coefficient_count = 9;

SHADERLINK_GPU_STRUCT_BEGIN(DrawUniforms)
    SHADERLINK_GPU_FIELD(float4x4, projection_matrix)
    SHADERLINK_GPU_FIELD(float4x4, view_matrix)
    SHADERLINK_GPU_FIELD(float4x4, model_matrix)
    SHADERLINK_GPU_FIELD(float4x4, light_view_proj_matrix)
    SHADERLINK_GPU_FIELD(NormalMatrixPack, normal_matrix)
    SHADERLINK_GPU_FIELD(float4, tint)
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
    SHADERLINK_GPU_FIELD(float4x4, prev_view_proj)
    SHADERLINK_GPU_FIELD(float3, camera_position)
    SHADERLINK_GPU_FIELD(uint, frame_index)
    SHADERLINK_GPU_FIELD(float3, prev_camera_position)
    SHADERLINK_GPU_FIELD(uint, reset_history)
    SHADERLINK_GPU_FIELD(uint2, image_size)
    SHADERLINK_GPU_FIELD(float, ambient_intensity)
    SHADERLINK_GPU_FIELD(float, history_weight)
    SHADERLINK_GPU_FIELD(float, history_clamp)
    SHADERLINK_GPU_FIELD(uint, samples_per_pixel)
    SHADERLINK_GPU_FIELD(uint, dir_light_count)
    SHADERLINK_GPU_FIELD(uint, point_light_count)
    SHADERLINK_GPU_FIELD(uint, area_light_count)
    SHADERLINK_GPU_FIELD(uint, area_light_samples)
    SHADERLINK_GPU_FIELD(uint, texture_count)
    SHADERLINK_GPU_FIELD(float, denoise_sigma)
    SHADERLINK_GPU_FIELD(float, atrous_step)
    SHADERLINK_GPU_FIELD(float, camera_motion)
    SHADERLINK_GPU_FIELD(float, exposure)
    SHADERLINK_GPU_FIELD(float, shadow_consistency)
    SHADERLINK_GPU_FIELD(float, environment_intensity)
    // L2 irradiance coefficients, rgb in xyz.
    SHADERLINK_GPU_FIELD_ARRAY(float4, sh_coefficients, sh_coefficient_count)
SHADERLINK_GPU_STRUCT_END()
SHADERLINK_VERIFY_GPU_STRUCT(FrameUniforms);

SHADERLINK_GPU_STRUCT_BEGIN(DirectionalLight)
    SHADERLINK_GPU_FIELD(float3, direction)
    SHADERLINK_GPU_FIELD(float, intensity)
    SHADERLINK_GPU_FIELD(float3, color)
SHADERLINK_GPU_STRUCT_END()
SHADERLINK_VERIFY_GPU_STRUCT(DirectionalLight);

SHADERLINK_GPU_STRUCT_BEGIN(PointLight)
    SHADERLINK_GPU_FIELD(float3, position)
    SHADERLINK_GPU_FIELD(float, intensity)
    SHADERLINK_GPU_FIELD(float3, color)
    SHADERLINK_GPU_FIELD(float, radius)
SHADERLINK_GPU_STRUCT_END()
SHADERLINK_VERIFY_GPU_STRUCT(PointLight);

SHADERLINK_GPU_STRUCT_BEGIN(AreaLight)
    SHADERLINK_GPU_FIELD(float3, position)
    SHADERLINK_GPU_FIELD(float, intensity)
    SHADERLINK_GPU_FIELD(float3, u)
    SHADERLINK_GPU_FIELD(float3, v)
    SHADERLINK_GPU_FIELD(float3, color)
SHADERLINK_GPU_STRUCT_END()
SHADERLINK_VERIFY_GPU_STRUCT(AreaLight);

SHADERLINK_GPU_STRUCT_BEGIN(InstanceInfo)
    SHADERLINK_GPU_FIELD(uint, base_index)
    SHADERLINK_GPU_FIELD(uint, base_vertex)
    SHADERLINK_GPU_FIELD(uint, index_count)
    SHADERLINK_GPU_FIELD(uint, buffer_index)
    SHADERLINK_GPU_FIELD(float4x4, model_matrix)
    SHADERLINK_GPU_FIELD(float4, base_color)
    SHADERLINK_GPU_FIELD(float, metallic)
    SHADERLINK_GPU_FIELD(float, roughness)
    SHADERLINK_GPU_FIELD(float3, emissive_factor)
    SHADERLINK_GPU_FIELD(float, occlusion_strength)
    // Indices into the material texture table, `invalid_texture_index` when unbound.
    SHADERLINK_GPU_FIELD(uint, base_color_texture)
    SHADERLINK_GPU_FIELD(uint, normal_texture)
    SHADERLINK_GPU_FIELD(uint, metallic_roughness_texture)
    SHADERLINK_GPU_FIELD(uint, emissive_texture)
    SHADERLINK_GPU_FIELD(uint, occlusion_texture)
SHADERLINK_GPU_STRUCT_END()
SHADERLINK_VERIFY_GPU_STRUCT(InstanceInfo);

}
