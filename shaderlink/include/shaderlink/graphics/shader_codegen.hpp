#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gpu_layout.hpp"

namespace sl::gfx {

enum class ShaderLanguage : uint8_t {
    hlsl,
    msl,
};

// Name of the field's element type in `language`. 3-component vectors map to a 12-byte
// type in both languages, the 4 trailing bytes are emitted as explicit padding.
auto shader_type_name(GpuField const& field, ShaderLanguage language) -> std::string;

// Struct definition whose members land on exactly the offsets of `layout`.
auto generate_record_definition(GpuStructLayout const& layout, ShaderLanguage language) -> std::string;

// `enum name : uint { nameRole = slot, ... };`
auto generate_enum_definition(
    std::string_view name, std::vector<std::pair<std::string, uint32_t>> const& values, ShaderLanguage language
) -> std::string;

}
