#pragma once

#include <string>

#include "contracts.hpp"
#include "../graphics/shader_codegen.hpp"
#include "../utils/serde.hpp"

namespace sl::contract {

// Shader header of a generation: slot enums, the texture sentinel and every record.
auto generate_shader_source(Generation generation, gfx::ShaderLanguage language) -> std::string;

// Machine-readable description of a generation's slots and record layouts.
auto contract_description(Generation generation) -> serde::Value;

}
