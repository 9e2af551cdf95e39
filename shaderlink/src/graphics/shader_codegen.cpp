#include <shaderlink/graphics/shader_codegen.hpp>

#include <fmt/format.h>

#include <shaderlink/prelude/misc.hpp>

namespace sl::gfx {

namespace {

auto base_type_name(GpuBaseType base_type) -> char const* {
    switch (base_type) {
        case GpuBaseType::float32: return "float";
        case GpuBaseType::int32: return "int";
        case GpuBaseType::uint32: return "uint";
        default: return "unknown";
    }
}

auto padding_members(size_t from, size_t to, uint32_t& pad_index) -> std::string {
    if (from % 4 != 0 || to % 4 != 0) {
        throw LayoutError{fmt::format("padding from byte {} to byte {} is not made of 4-byte words", from, to)};
    }
    // One scalar per word, arrays would get a 16-byte stride in an HLSL constant buffer.
    std::string members{};
    for (auto offset = from; offset < to; offset += 4) {
        members += fmt::format("    uint _pad{};\n", pad_index++);
    }
    return members;
}

}

auto shader_type_name(GpuField const& field, ShaderLanguage language) -> std::string {
    if (field.base_type == GpuBaseType::record) {
        return field.type_name;
    }
    auto base = base_type_name(field.base_type);
    if (field.rows > 1) {
        return fmt::format("{}{}x{}", base, field.columns, field.rows);
    }
    if (field.columns == 1) {
        return base;
    }
    if (field.columns == 3 && language == ShaderLanguage::msl) {
        return fmt::format("packed_{}3", base);
    }
    return fmt::format("{}{}", base, field.columns);
}

auto generate_record_definition(GpuStructLayout const& layout, ShaderLanguage language) -> std::string {
    std::string members{};
    size_t cursor = 0;
    uint32_t pad_index = 0;
    for (auto const& field : layout.fields) {
        if (field.offset < cursor) {
            throw LayoutError{fmt::format("field '{}.{}' overlaps the previous field", layout.name, field.name)};
        }
        members += padding_members(cursor, field.offset, pad_index);

        auto type_name = shader_type_name(field, language);
        if (field.is_array()) {
            if (field.columns == 3 && field.rows == 1) {
                throw LayoutError{fmt::format(
                    "array '{}.{}' of 3-component vectors has no common stride in HLSL and MSL", layout.name, field.name
                )};
            }
            members += fmt::format("    {} {}[{}];\n", type_name, field.name, field.array_size);
            cursor = field.offset + field.stride * field.array_size;
        } else {
            members += fmt::format("    {} {};\n", type_name, field.name);
            cursor = field.offset + field.data_size;
        }
    }
    members += padding_members(cursor, layout.size, pad_index);

    return fmt::format("struct {} {{\n{}}};\n", layout.name, members);
}

auto generate_enum_definition(
    std::string_view name, std::vector<std::pair<std::string, uint32_t>> const& values, ShaderLanguage language
) -> std::string {
    std::string enumerators{};
    for (auto const& [role, slot] : values) {
        enumerators += fmt::format("    {}{} = {},\n", name, snake_to_pascal(role), slot);
    }
    auto underlying = language == ShaderLanguage::msl ? "uint32_t" : "uint";
    return fmt::format("enum {} : {} {{\n{}}};\n", name, underlying, enumerators);
}

}
