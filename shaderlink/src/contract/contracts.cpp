#include <shaderlink/contract/contracts.hpp>

#include <array>

#include <magic_enum.hpp>

#include <shaderlink/contract/generations/forward.hpp>
#include <shaderlink/contract/generations/shadowed.hpp>
#include <shaderlink/contract/generations/ray_traced.hpp>
#include <shaderlink/contract/generations/multi_light.hpp>
#include <shaderlink/contract/generations/pbr_hybrid.hpp>
#include <shaderlink/runtime/logger.hpp>

namespace sl::contract {

namespace {

template <typename... Records>
auto layouts_of() -> std::vector<gfx::GpuStructLayout> {
    return {Records::gpu_layout()...};
}

}

auto slot_table(Generation generation) -> SlotTable const& {
    static const std::array<SlotTable, magic_enum::enum_count<Generation>()> tables{
        SlotTable::from_enums<forward::BufferIndex, forward::VertexAttribute, forward::TextureIndex>("forward"),
        SlotTable::from_enums<shadowed::BufferIndex, shadowed::VertexAttribute, shadowed::TextureIndex>("shadowed"),
        SlotTable::from_enums<ray_traced::BufferIndex, ray_traced::VertexAttribute, ray_traced::TextureIndex>("ray_traced"),
        SlotTable::from_enums<multi_light::BufferIndex, multi_light::VertexAttribute, multi_light::TextureIndex>("multi_light"),
        SlotTable::from_enums<pbr_hybrid::BufferIndex, pbr_hybrid::VertexAttribute, pbr_hybrid::TextureIndex>("pbr_hybrid"),
    };
    return tables[static_cast<size_t>(generation)];
}

auto record_layouts(Generation generation) -> std::vector<gfx::GpuStructLayout> const& {
    static const std::array<std::vector<gfx::GpuStructLayout>, magic_enum::enum_count<Generation>()> layouts{
        layouts_of<forward::DrawUniforms>(),
        layouts_of<NormalMatrixPack, shadowed::DrawUniforms, shadowed::LightParams>(),
        layouts_of<
            NormalMatrixPack, ray_traced::DrawUniforms, ray_traced::LightParams,
            ray_traced::FrameUniforms, ray_traced::InstanceInfo
        >(),
        layouts_of<
            NormalMatrixPack, multi_light::DrawUniforms, multi_light::FrameUniforms,
            multi_light::DirectionalLight, multi_light::PointLight, multi_light::AreaLight,
            multi_light::InstanceInfo
        >(),
        layouts_of<
            NormalMatrixPack, pbr_hybrid::DrawUniforms, pbr_hybrid::LightParams, pbr_hybrid::FrameUniforms,
            pbr_hybrid::DirectionalLight, pbr_hybrid::PointLight, pbr_hybrid::AreaLight,
            pbr_hybrid::InstanceInfo
        >(),
    };
    return layouts[static_cast<size_t>(generation)];
}

auto migration_notes(Generation to) -> Span<SlotMigrationNote const> {
    if (to == Generation::multi_light) {
        return Span<SlotMigrationNote const>{multi_light::migration_from_ray_traced};
    }
    return {};
}

auto verify_registry() -> bool {
    auto ok = true;
    for (auto generation : magic_enum::enum_values<Generation>()) {
        auto const& table = slot_table(generation);
        for (auto const& issue : table.validate()) {
            log::error("contract", "{}", issue.description);
            ok = false;
        }
        if (generation == Generation::forward) { continue; }

        auto previous = static_cast<Generation>(static_cast<uint8_t>(generation) - 1);
        for (auto const& issue : check_slot_migration(slot_table(previous), table, migration_notes(generation))) {
            log::error("contract", "{}", issue.description);
            ok = false;
        }
    }
    return ok;
}

}
