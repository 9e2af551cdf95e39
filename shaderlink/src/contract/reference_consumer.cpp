#include <shaderlink/contract/reference_consumer.hpp>

#include <algorithm>
#include <array>

#include <fmt/format.h>

#include <shaderlink/contract/contracts.hpp>
#include <shaderlink/contract/texture_slot.hpp>
#include <shaderlink/runtime/logger.hpp>

namespace sl::contract {

namespace {

constexpr std::array<std::string_view, 5> texture_channels{
    "base_color_texture",
    "normal_texture",
    "metallic_roughness_texture",
    "emissive_texture",
    "occlusion_texture",
};

}

auto ConsumerTrace::lights_of(std::string_view kind) const -> size_t {
    return static_cast<size_t>(
        std::count_if(lights.begin(), lights.end(), [kind](LightRead const& read) { return read.kind == kind; })
    );
}

ReferenceConsumer::ReferenceConsumer(std::vector<gfx::GpuStructLayout> consumer_layouts)
    : layouts_(std::move(consumer_layouts))
{
    for (auto const& producer : record_layouts(Generation::pbr_hybrid)) {
        auto it = std::find_if(layouts_.begin(), layouts_.end(), [&producer](gfx::GpuStructLayout const& consumer) {
            return consumer.name == producer.name;
        });
        if (it == layouts_.end()) {
            log::critical("contract", "consumer has no layout for record '{}'", producer.name);
            throw gfx::LayoutError{fmt::format("consumer has no layout for record '{}'", producer.name)};
        }
        gfx::ensure_layout_compatible(producer, *it);
    }
}

ReferenceConsumer::ReferenceConsumer() : ReferenceConsumer(record_layouts(Generation::pbr_hybrid)) {}

auto ReferenceConsumer::layout(std::string_view name) const -> gfx::GpuStructLayout const& {
    auto it = std::find_if(layouts_.begin(), layouts_.end(), [name](gfx::GpuStructLayout const& layout) {
        return layout.name == name;
    });
    SHADERLINK_ASSERT_MSG(it != layouts_.end(), fmt::format("consumer has no layout for record '{}'", name));
    return *it;
}

auto ReferenceConsumer::read_lights(
    std::string_view kind, std::string_view record, Span<std::byte const> bytes, uint32_t count, ConsumerTrace& trace
) const -> void {
    gfx::GpuBufferView buffer{layout(record), bytes};
    if (count > buffer.size()) {
        trace.violations.push_back(fmt::format(
            "{} light count is {} but only {} records are bound", kind, count, buffer.size()
        ));
        count = static_cast<uint32_t>(buffer.size());
    }
    for (uint32_t i = 0; i < count; i++) {
        trace.lights.push_back(LightRead{
            .kind = std::string{kind},
            .index = i,
            .intensity = buffer[i].read<float>("intensity"),
        });
    }
}

auto ReferenceConsumer::consume(ConsumerBindings const& bindings) const -> ConsumerTrace {
    ConsumerTrace trace{};
    gfx::GpuRecordView frame{layout("FrameUniforms"), bindings.frame};

    read_lights("directional", "DirectionalLight", bindings.directional_lights, frame.read<uint>("dir_light_count"), trace);
    read_lights("point", "PointLight", bindings.point_lights, frame.read<uint>("point_light_count"), trace);
    read_lights("area", "AreaLight", bindings.area_lights, frame.read<uint>("area_light_count"), trace);

    auto texture_count = frame.read<uint>("texture_count");
    gfx::GpuBufferView instances{layout("InstanceInfo"), bindings.instances};
    for (uint32_t i = 0; i < instances.size(); i++) {
        auto instance = instances[i];
        InstanceShading shading{.instance = i, .flat_material = true, .base_color = instance.read<float4>("base_color")};
        for (auto channel : texture_channels) {
            auto index = instance.read<uint>(channel);
            if (!has_texture(index)) { continue; }
            if (index >= texture_count) {
                trace.violations.push_back(fmt::format(
                    "instance {} {} is {} but only {} textures are bound", i, channel, index, texture_count
                ));
                continue;
            }
            shading.flat_material = false;
            trace.fetches.push_back(TextureFetch{.instance = i, .channel = std::string{channel}, .texture_index = index});
        }
        trace.instances.push_back(shading);
    }

    for (auto const& violation : trace.violations) {
        log::error("contract", "{}", violation);
    }
    return trace;
}

}
