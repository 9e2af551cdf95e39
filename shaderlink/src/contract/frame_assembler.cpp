#include <shaderlink/contract/frame_assembler.hpp>

#include <algorithm>

#include <magic_enum.hpp>

#include <shaderlink/runtime/logger.hpp>

namespace sl::contract {

TextureTable::TextureTable(uint32_t capacity) : capacity_(capacity) {
    textures_.reserve(capacity);
}

auto TextureTable::index_of(TextureHandle texture) -> uint32_t {
    if (auto it = indices_.find(texture); it != indices_.end()) {
        return it->second;
    }
    if (textures_.size() >= capacity_) {
        log::warn("producer", "texture table is full ({} textures), texture {} is left unbound", capacity_, texture);
        return invalid_texture_index;
    }
    auto index = static_cast<uint32_t>(textures_.size());
    textures_.push_back(texture);
    indices_.emplace(texture, index);
    return index;
}

auto TextureTable::index_of(std::optional<TextureHandle> const& texture) -> uint32_t {
    return texture.has_value() ? index_of(texture.value()) : invalid_texture_index;
}

auto TextureTable::clear() -> void {
    textures_.clear();
    indices_.clear();
}


namespace {

auto count_within(
    rt::CapacityKind kind, size_t requested, uint32_t capacity, rt::CapacityPolicy policy
) -> Expected<size_t, rt::CapacityError> {
    if (requested <= capacity) {
        return requested;
    }
    if (policy == rt::CapacityPolicy::reject) {
        return rt::CapacityError{.kind = kind, .requested = requested, .capacity = capacity};
    }
    log::warn("producer", "{} {} exceed capacity {}, the rest are dropped", requested, magic_enum::enum_name(kind), capacity);
    return static_cast<size_t>(capacity);
}

auto to_record(DirectionalLightDesc const& desc) -> pbr_hybrid::DirectionalLight {
    pbr_hybrid::DirectionalLight light{};
    light.direction = math::normalize(desc.direction);
    light.intensity = desc.intensity;
    light.color = desc.color;
    return light;
}

auto to_record(PointLightDesc const& desc) -> pbr_hybrid::PointLight {
    pbr_hybrid::PointLight light{};
    light.position = desc.position;
    light.intensity = desc.intensity;
    light.color = desc.color;
    light.radius = desc.radius;
    return light;
}

auto to_record(AreaLightDesc const& desc) -> pbr_hybrid::AreaLight {
    pbr_hybrid::AreaLight light{};
    light.position = desc.position;
    light.intensity = desc.intensity;
    light.u = desc.u;
    light.v = desc.v;
    light.color = desc.color;
    return light;
}

template <typename Desc, typename Record>
auto write_records(std::vector<Desc> const& descs, size_t count, std::vector<Record>& records) -> void {
    records.reserve(count);
    for (size_t i = 0; i < count; i++) {
        records.push_back(to_record(descs[i]));
    }
}

}

FrameAssembler::FrameAssembler(AssemblerLimits const& limits)
    : limits_(limits)
    , texture_table_(limits.max_textures)
{}

auto FrameAssembler::reset_history() -> void {
    has_last_view_ = false;
}

auto FrameAssembler::assemble(FrameInput const& input) -> Expected<AssembledFrame, rt::CapacityError> {
    auto policy = limits_.capacity_policy;
    auto num_dir = count_within(
        rt::CapacityKind::directional_lights, input.directional_lights.size(), limits_.max_directional_lights, policy
    );
    if (!num_dir) { return num_dir.error(); }
    auto num_point = count_within(rt::CapacityKind::point_lights, input.point_lights.size(), limits_.max_point_lights, policy);
    if (!num_point) { return num_point.error(); }
    auto num_area = count_within(rt::CapacityKind::area_lights, input.area_lights.size(), limits_.max_area_lights, policy);
    if (!num_area) { return num_area.error(); }
    auto num_instances = count_within(rt::CapacityKind::instances, input.instances.size(), limits_.max_instances, policy);
    if (!num_instances) { return num_instances.error(); }

    AssembledFrame result{};

    write_records(input.directional_lights, num_dir.value(), result.directional_lights);
    write_records(input.point_lights, num_point.value(), result.point_lights);
    write_records(input.area_lights, num_area.value(), result.area_lights);

    texture_table_.clear();
    result.instances.reserve(num_instances.value());
    for (size_t i = 0; i < num_instances.value(); i++) {
        auto const& desc = input.instances[i];
        auto const& material = desc.material;
        pbr_hybrid::InstanceInfo info{};
        info.base_index = desc.base_index;
        info.base_vertex = desc.base_vertex;
        info.index_count = desc.index_count;
        info.buffer_index = desc.buffer_index;
        info.model_matrix = desc.model_matrix;
        info.base_color = material.base_color;
        info.metallic = material.metallic;
        info.roughness = material.roughness;
        info.emissive_factor = material.emissive_factor;
        info.occlusion_strength = material.occlusion_strength;
        info.base_color_texture = texture_table_.index_of(material.base_color_texture);
        info.normal_texture = texture_table_.index_of(material.normal_texture);
        info.metallic_roughness_texture = texture_table_.index_of(material.metallic_roughness_texture);
        info.emissive_texture = texture_table_.index_of(material.emissive_texture);
        info.occlusion_texture = texture_table_.index_of(material.occlusion_texture);
        result.instances.push_back(info);
    }
    SHADERLINK_ASSERT(texture_table_.size() <= limits_.max_textures);
    result.textures = texture_table_.textures();

    auto const& camera = input.camera;
    auto view_proj = camera.projection * camera.view;
    auto reset = !has_last_view_
        || camera.image_size != last_image_size_
        || input.scene_revision != last_scene_revision_;
    auto prev_view_proj = has_last_view_ ? last_view_proj_ : view_proj;
    auto prev_camera_position = has_last_view_ ? last_camera_position_ : camera.position;
    auto camera_speed = math::distance(camera.position, prev_camera_position) / std::max(input.delta_time, 0.0001f);
    if (reset) {
        frame_index_ = 0;
    }

    auto& frame = result.frame;
    frame.inv_view_proj = math::inverse(view_proj);
    frame.prev_view_proj = prev_view_proj;
    frame.camera_position = camera.position;
    frame.frame_index = frame_index_;
    frame.prev_camera_position = prev_camera_position;
    frame.reset_history = reset ? 1u : 0u;
    frame.image_size = camera.image_size;
    frame.ambient_intensity = input.environment.ambient_intensity;
    frame.history_weight = input.accumulation.history_weight;
    frame.history_clamp = input.accumulation.history_clamp;
    frame.samples_per_pixel = input.accumulation.samples_per_pixel;
    frame.dir_light_count = static_cast<uint32_t>(result.directional_lights.size());
    frame.point_light_count = static_cast<uint32_t>(result.point_lights.size());
    frame.area_light_count = static_cast<uint32_t>(result.area_lights.size());
    frame.area_light_samples = input.accumulation.area_light_samples;
    frame.texture_count = texture_table_.size();
    frame.denoise_sigma = input.accumulation.denoise_sigma;
    frame.atrous_step = input.accumulation.atrous_step;
    frame.camera_motion = math::saturate(camera_speed / 2.5f);
    frame.exposure = input.accumulation.exposure;
    frame.shadow_consistency = input.accumulation.shadow_consistency;
    frame.environment_intensity = input.environment.environment_intensity;
    for (uint32_t i = 0; i < pbr_hybrid::sh_coefficient_count; i++) {
        frame.sh_coefficients[i] = float4{input.environment.sh_coefficients[i], 0.0f};
    }

    has_last_view_ = true;
    last_view_proj_ = view_proj;
    last_camera_position_ = camera.position;
    last_image_size_ = camera.image_size;
    last_scene_revision_ = input.scene_revision;
    ++frame_index_;

    log::debug(
        "producer", "frame {} assembled: {} instances, {} textures, lights {}/{}/{}",
        frame.frame_index, result.instances.size(), result.textures.size(),
        frame.dir_light_count, frame.point_light_count, frame.area_light_count
    );
    return result;
}

}
