#pragma once

#include "../../graphics/gpu_layout.hpp"

// Plain forward shading.
namespace sl::contract::forward {

enum class BufferIndex : uint32_t {
    mesh_vertices = 0,
    uniforms = 1,
};

enum class VertexAttribute : uint32_t {
    position = 0,
    normal = 1,
    texcoord = 2,
};

enum class TextureIndex : uint32_t {
    base_color = 0,
};

SHADERLINK_GPU_STRUCT_BEGIN(DrawUniforms)
    SHADERLINK_GPU_FIELD(float4x4, projection_matrix)
    SHADERLINK_GPU_FIELD(float4x4, model_view_matrix)
SHADERLINK_GPU_STRUCT_END()
SHADERLINK_VERIFY_GPU_STRUCT(DrawUniforms);

}
