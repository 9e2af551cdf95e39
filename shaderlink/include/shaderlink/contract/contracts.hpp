#pragma once

#include <string_view>
#include <vector>

#include "binding_slots.hpp"
#include "../graphics/gpu_layout.hpp"

namespace sl::contract {

// Renderer generations, oldest first. Each one is an independent contract.
enum class Generation : uint8_t {
    forward,
    shadowed,
    ray_traced,
    multi_light,
    pbr_hybrid,
};

auto slot_table(Generation generation) -> SlotTable const&;

// Every record of a generation, nested records before the records that contain them.
auto record_layouts(Generation generation) -> std::vector<gfx::GpuStructLayout> const&;

// Notes for the transition from the generation right before `to`.
auto migration_notes(Generation to) -> Span<SlotMigrationNote const>;

// Checks duplicate slots inside each generation and undocumented slot reuse between
// consecutive generations, logging every issue. Returns false if anything was found.
auto verify_registry() -> bool;

}
