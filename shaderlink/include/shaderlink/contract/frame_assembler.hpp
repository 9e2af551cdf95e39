#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "generations/pbr_hybrid.hpp"
#include "../prelude/expected.hpp"
#include "../runtime/capacity.hpp"

namespace sl::contract {

// Identifies a source texture on the producer side.
using TextureHandle = uint64_t;

// Material textures referenced by a frame's instances, in first-use order.
struct TextureTable final {
    explicit TextureTable(uint32_t capacity);

    // Slot of `texture` in the table, or `invalid_texture_index` (with a warning) when the
    // table is full. Repeated textures share one slot.
    auto index_of(TextureHandle texture) -> uint32_t;
    auto index_of(std::optional<TextureHandle> const& texture) -> uint32_t;

    auto size() const -> uint32_t { return static_cast<uint32_t>(textures_.size()); }
    auto capacity() const -> uint32_t { return capacity_; }
    auto textures() const -> std::vector<TextureHandle> const& { return textures_; }
    auto clear() -> void;

private:
    uint32_t capacity_;
    std::vector<TextureHandle> textures_;
    std::unordered_map<TextureHandle, uint32_t> indices_;
};

struct CameraState final {
    float4x4 view{1.0f};
    float4x4 projection{1.0f};
    float3 position{0.0f};
    uint2 image_size{1, 1};
};

struct EnvironmentState final {
    float ambient_intensity = 0.12f;
    float environment_intensity = 1.0f;
    std::array<float3, pbr_hybrid::sh_coefficient_count> sh_coefficients{};
};

struct AccumulationSettings final {
    float history_weight = 0.2f;
    float history_clamp = 2.5f;
    uint32_t samples_per_pixel = 2;
    uint32_t area_light_samples = 2;
    float denoise_sigma = 6.0f;
    float atrous_step = 1.0f;
    float exposure = 1.7f;
    float shadow_consistency = 0.0f;
};

struct DirectionalLightDesc final {
    float3 direction{0.0f, -1.0f, 0.0f};
    float intensity = 1.0f;
    float3 color{1.0f};
};

struct PointLightDesc final {
    float3 position{0.0f};
    float intensity = 1.0f;
    float3 color{1.0f};
    float radius = 1.0f;
};

struct AreaLightDesc final {
    float3 position{0.0f};
    float intensity = 1.0f;
    float3 u{1.0f, 0.0f, 0.0f};
    float3 v{0.0f, 0.0f, 1.0f};
    float3 color{1.0f};
};

struct MaterialDesc final {
    float4 base_color{1.0f};
    float metallic = 0.0f;
    float roughness = 1.0f;
    float3 emissive_factor{0.0f};
    float occlusion_strength = 1.0f;
    std::optional<TextureHandle> base_color_texture;
    std::optional<TextureHandle> normal_texture;
    std::optional<TextureHandle> metallic_roughness_texture;
    std::optional<TextureHandle> emissive_texture;
    std::optional<TextureHandle> occlusion_texture;
};

// One acceleration-structure instance, listed in instance order.
struct InstanceDesc final {
    uint32_t base_index = 0;
    uint32_t base_vertex = 0;
    uint32_t index_count = 0;
    uint32_t buffer_index = 0;
    float4x4 model_matrix{1.0f};
    MaterialDesc material;
};

struct FrameInput final {
    CameraState camera;
    EnvironmentState environment;
    AccumulationSettings accumulation;
    std::vector<DirectionalLightDesc> directional_lights;
    std::vector<PointLightDesc> point_lights;
    std::vector<AreaLightDesc> area_lights;
    std::vector<InstanceDesc> instances;
    // Seconds since the previous frame.
    float delta_time = 1.0f / 60.0f;
    // Any change of scene content invalidates accumulated history.
    uint64_t scene_revision = 0;
};

struct AssemblerLimits final {
    uint32_t max_directional_lights = 4;
    uint32_t max_point_lights = 8;
    uint32_t max_area_lights = 4;
    uint32_t max_instances = 1024;
    uint32_t max_textures = 32;
    rt::CapacityPolicy capacity_policy = rt::CapacityPolicy::clamp;
};

// Everything the accelerator reads for one frame, in binding order.
struct AssembledFrame final {
    pbr_hybrid::FrameUniforms frame{};
    std::vector<pbr_hybrid::DirectionalLight> directional_lights;
    std::vector<pbr_hybrid::PointLight> point_lights;
    std::vector<pbr_hybrid::AreaLight> area_lights;
    std::vector<pbr_hybrid::InstanceInfo> instances;
    std::vector<TextureHandle> textures;
};

// Builds the per-frame records of the pbr_hybrid generation and carries the temporal
// state (previous view, accumulated frame count) from one frame to the next.
struct FrameAssembler final {
    explicit FrameAssembler(AssemblerLimits const& limits = {});

    auto assemble(FrameInput const& input) -> Expected<AssembledFrame, rt::CapacityError>;

    // Forces the next frame to start accumulation from scratch.
    auto reset_history() -> void;

    auto limits() const -> AssemblerLimits const& { return limits_; }

private:
    AssemblerLimits limits_;
    TextureTable texture_table_;
    bool has_last_view_ = false;
    float4x4 last_view_proj_{1.0f};
    float3 last_camera_position_{0.0f};
    uint2 last_image_size_{0, 0};
    uint64_t last_scene_revision_ = 0;
    uint32_t frame_index_ = 0;
};

}
