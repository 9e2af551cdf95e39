#pragma once

#include <cstdint>

namespace sl::contract {

// Texture index meaning "no texture bound", the consumer must test it before any fetch.
inline constexpr uint32_t invalid_texture_index = 0xFFFFFFFFu;

// Slots reserved for the material texture table, starting at its `material_textures` slot.
inline constexpr uint32_t material_texture_table_size = 32;

constexpr auto has_texture(uint32_t index) -> bool {
    return index != invalid_texture_index;
}

}
