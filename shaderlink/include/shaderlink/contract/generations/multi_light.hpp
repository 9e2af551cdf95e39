#pragma once

#include "../binding_slots.hpp"
#include "../normal_matrix.hpp"
#include "../texture_slot.hpp"

#include <array>

// Counted directional/point/area lights, temporal accumulation and denoising.
// Drops the raster light record, which renumbers every buffer slot after `uniforms`.
namespace sl::contract::multi_light {

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
};

enum class VertexAttribute : uint32_t {
    position = 0,
    normal = 1,
    texcoord = 2,
};

enum class TextureIndex : uint32_t {
    output = 0,
    history_color = 1,
    history_depth = 2,
    history_shadow = 3,
    // First of `material_texture_table_size` consecutive slots.
    material_textures = 4,
};

SHADERLINK_GPU_STRUCT_BEGIN(DrawUniforms)
    SHADERLINK_GPU_FIELD(float4x4, projection_matrix)
    SHADERLINK_GPU_FIELD(float4x4, view_matrix)
    SHADERLINK_GPU_FIELD(float4x4, model_matrix)
    SHADERLINK_GPU_FIELD(NormalMatrixPack, normal_matrix)
    SHADERLINK_GPU_FIELD(float4, base_color)
SHADERLINK_GPU_STRUCT_END()
SHADERLINK_VERIFY_GPU_STRUCT(DrawUniforms);

SHADERLINK_GPU_STRUCT_BEGIN(FrameUniforms)
    SHADERLINK_GPU_FIELD(float4x4, inv_view_proj)
    SHADERLINK_GPU_FIELD(float4x4, prev_view_proj)
    SHADERLINK_GPU_FIELD(float3, camera_position)
    // Frames accumulated since the last history reset.
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

// Rectangle spanned by `u` and `v` from the corner at `position`.
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
    SHADERLINK_GPU_FIELD(float3, base_color)
    SHADERLINK_GPU_FIELD(float, metallic)
    SHADERLINK_GPU_FIELD(float, roughness)
    SHADERLINK_GPU_FIELD(float, base_alpha)
    SHADERLINK_GPU_FIELD(uint, base_color_texture)
SHADERLINK_GPU_STRUCT_END()
SHADERLINK_VERIFY_GPU_STRUCT(InstanceInfo);

// Slots that the ray_traced generation used for a different role.
inline constexpr std::array<SlotMigrationNote, 9> migration_from_ray_traced{
    SlotMigrationNote{SlotNamespace::buffer, 2, "light_params", "rt_frame", "raster light record removed, lights are counted buffers now"},
    SlotMigrationNote{SlotNamespace::buffer, 3, "rt_frame", "rt_accel", "shifted down by the removal of light_params"},
    SlotMigrationNote{SlotNamespace::buffer, 4, "rt_accel", "rt_vertices", "shifted down by the removal of light_params"},
    SlotMigrationNote{SlotNamespace::buffer, 5, "rt_vertices", "rt_indices", "shifted down by the removal of light_params"},
    SlotMigrationNote{SlotNamespace::buffer, 6, "rt_indices", "rt_instances", "shifted down by the removal of light_params"},
    SlotMigrationNote{SlotNamespace::buffer, 7, "rt_instances", "rt_uvs", "new uv stream takes the last shifted slot"},
    SlotMigrationNote{SlotNamespace::texture, 0, "base_color", "output", "material textures moved into the bindless table at material_textures"},
    SlotMigrationNote{SlotNamespace::texture, 1, "shadow_map", "history_color", "shadow mapping replaced by traced shadows"},
    SlotMigrationNote{SlotNamespace::texture, 2, "rt_output", "history_depth", "output moved to slot 0"},
};

}
