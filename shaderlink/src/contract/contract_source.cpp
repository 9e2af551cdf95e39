#include <shaderlink/contract/contract_source.hpp>

#include <cctype>

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <shaderlink/contract/texture_slot.hpp>

namespace sl::contract {

namespace {

auto enum_values_of(SlotTable const& table, SlotNamespace space) -> std::vector<std::pair<std::string, uint32_t>> {
    std::vector<std::pair<std::string, uint32_t>> values{};
    for (auto const& entry : table.entries_in(space)) {
        values.emplace_back(entry.role, entry.slot);
    }
    return values;
}

auto upper_case(std::string_view str) -> std::string {
    std::string result{str};
    for (auto& ch : result) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return result;
}

// HLSL matrix constructors take rows, Metal takes columns.
auto unpack_normal_matrix_source(gfx::ShaderLanguage language) -> std::string {
    if (language == gfx::ShaderLanguage::msl) {
        return
            "// rowN.xyz holds column N of the normal matrix, w is unused.\n"
            "inline float3x3 unpack_normal_matrix(NormalMatrixPack m) {\n"
            "    return float3x3(m.row0.xyz, m.row1.xyz, m.row2.xyz);\n"
            "}\n";
    }
    return
        "// rowN.xyz holds column N of the normal matrix, w is unused.\n"
        "float3x3 unpack_normal_matrix(NormalMatrixPack m) {\n"
        "    return transpose(float3x3(m.row0.xyz, m.row1.xyz, m.row2.xyz));\n"
        "}\n";
}

}

auto generate_shader_source(Generation generation, gfx::ShaderLanguage language) -> std::string {
    auto const& table = slot_table(generation);
    auto guard = fmt::format("SHADERLINK_{}_{}", upper_case(table.generation), upper_case(magic_enum::enum_name(language)));

    std::string source = fmt::format(
        "// Generated by shaderlink-gen for the '{}' generation, do not edit.\n#ifndef {}\n#define {}\n\n",
        table.generation, guard, guard
    );
    if (language == gfx::ShaderLanguage::msl) {
        source += "#include <metal_stdlib>\nusing namespace metal;\n\n";
        source += fmt::format("constant uint invalid_texture_index = 0x{:X}u;\n\n", invalid_texture_index);
    } else {
        source += fmt::format("static const uint invalid_texture_index = 0x{:X}u;\n\n", invalid_texture_index);
    }

    source += gfx::generate_enum_definition("BufferIndex", enum_values_of(table, SlotNamespace::buffer), language);
    source += "\n";
    source += gfx::generate_enum_definition("VertexAttribute", enum_values_of(table, SlotNamespace::vertex_attribute), language);
    source += "\n";
    source += gfx::generate_enum_definition("TextureIndex", enum_values_of(table, SlotNamespace::texture), language);

    auto has_normal_matrix = false;
    for (auto const& layout : record_layouts(generation)) {
        source += "\n";
        source += gfx::generate_record_definition(layout, language);
        has_normal_matrix |= layout.name == "NormalMatrixPack";
    }
    if (has_normal_matrix) {
        source += "\n";
        source += unpack_normal_matrix_source(language);
    }

    source += fmt::format("\n#endif // {}\n", guard);
    return source;
}

auto contract_description(Generation generation) -> serde::Value {
    auto const& table = slot_table(generation);
    auto v = gfx::layouts_to_value(record_layouts(generation));
    serde::to_value(v["generation"], table.generation);
    serde::to_value(v["invalid_texture_index"], invalid_texture_index);

    auto& slots = v["slots"];
    for (auto space : magic_enum::enum_values<SlotNamespace>()) {
        auto& space_slots = slots[magic_enum::enum_name(space)];
        space_slots = serde::Value::Table{};
        for (auto const& entry : table.entries_in(space)) {
            serde::to_value(space_slots[entry.role], entry.slot);
        }
    }
    return v;
}

}
