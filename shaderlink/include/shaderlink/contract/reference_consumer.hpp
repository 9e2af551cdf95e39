#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "../graphics/record_view.hpp"

namespace sl::contract {

// Buffers bound for one frame of the pbr_hybrid generation.
struct ConsumerBindings final {
    Span<std::byte const> frame;
    Span<std::byte const> directional_lights;
    Span<std::byte const> point_lights;
    Span<std::byte const> area_lights;
    Span<std::byte const> instances;
};

struct TextureFetch final {
    uint32_t instance = 0;
    std::string channel;
    uint32_t texture_index = 0;
};

struct LightRead final {
    std::string kind;
    uint32_t index = 0;
    float intensity = 0.0f;
};

struct InstanceShading final {
    uint32_t instance = 0;
    // Factor-only shading, no channel of the instance has a texture bound.
    bool flat_material = true;
    float4 base_color{1.0f};
};

struct ConsumerTrace final {
    std::vector<LightRead> lights;
    std::vector<TextureFetch> fetches;
    std::vector<InstanceShading> instances;
    // Contract violations seen by the consumer, an empty list for a well-formed frame.
    std::vector<std::string> violations;

    auto lights_of(std::string_view kind) const -> size_t;
};

// Walks a frame the way the shading kernels do, through layout descriptions only: lights
// are bounded by the counts in FrameUniforms and texture slots are tested against the
// sentinel before any fetch.
struct ReferenceConsumer final {
    // Uses the layouts the consumer was compiled against. They are checked against the
    // producer's layouts, a mismatch throws `LayoutError`.
    explicit ReferenceConsumer(std::vector<gfx::GpuStructLayout> consumer_layouts);
    ReferenceConsumer();

    auto consume(ConsumerBindings const& bindings) const -> ConsumerTrace;

private:
    auto layout(std::string_view name) const -> gfx::GpuStructLayout const&;

    auto read_lights(
        std::string_view kind, std::string_view record, Span<std::byte const> bytes, uint32_t count, ConsumerTrace& trace
    ) const -> void;

    std::vector<gfx::GpuStructLayout> layouts_;
};

}
