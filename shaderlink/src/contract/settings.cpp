#include <shaderlink/contract/settings.hpp>

#include <fstream>

#include <fmt/format.h>

#include <shaderlink/runtime/logger.hpp>

namespace sl::contract {

namespace {

auto read_all_from_file(std::ifstream& fin) -> std::string {
    fin.seekg(0, std::ios::end);
    auto length = fin.tellg();
    fin.seekg(0, std::ios::beg);
    std::string res(static_cast<size_t>(length), '\0');
    fin.read(res.data(), length);
    while (!res.empty() && res.back() == '\0') { res.pop_back(); }
    return res;
}

}

auto ContractSettings::validate() const -> void {
    if (max_frames_in_flight == 0) {
        throw SettingsError{"max_frames_in_flight must be at least 1"};
    }
    if (ring_size <= max_frames_in_flight) {
        throw SettingsError{fmt::format(
            "ring_size ({}) must exceed max_frames_in_flight ({})", ring_size, max_frames_in_flight
        )};
    }
    if (max_draws_per_frame == 0 || max_instances == 0) {
        throw SettingsError{"max_draws_per_frame and max_instances must be at least 1"};
    }
    if (max_textures > material_texture_table_size) {
        throw SettingsError{fmt::format(
            "max_textures ({}) exceeds the {} slots of the material texture table", max_textures, material_texture_table_size
        )};
    }
}

auto ContractSettings::assembler_limits() const -> AssemblerLimits {
    return AssemblerLimits{
        .max_directional_lights = max_directional_lights,
        .max_point_lights = max_point_lights,
        .max_area_lights = max_area_lights,
        .max_instances = max_instances,
        .max_textures = max_textures,
        .capacity_policy = capacity_policy,
    };
}

auto ContractSettings::make_frame_assembler() const -> FrameAssembler {
    return FrameAssembler{assembler_limits()};
}

auto ContractSettings::to_value(serde::Value& v, ContractSettings const& o) -> void {
    v = serde::Value::Table{};
    serde::to_value(v["generation"], o.generation);
    serde::to_value(v["shader_language"], o.shader_language);
    serde::to_value(v["output_dir"], o.output_dir);
    serde::to_value(v["max_frames_in_flight"], o.max_frames_in_flight);
    serde::to_value(v["ring_size"], o.ring_size);
    serde::to_value(v["max_draws_per_frame"], o.max_draws_per_frame);
    serde::to_value(v["max_directional_lights"], o.max_directional_lights);
    serde::to_value(v["max_point_lights"], o.max_point_lights);
    serde::to_value(v["max_area_lights"], o.max_area_lights);
    serde::to_value(v["max_instances"], o.max_instances);
    serde::to_value(v["max_textures"], o.max_textures);
    serde::to_value(v["capacity_policy"], o.capacity_policy);
}

auto ContractSettings::from_value(serde::Value const& v, ContractSettings& o) -> void {
    if (!v.is_table()) {
        throw SettingsError{"settings must be a table"};
    }
    ContractSettings defaults{};
    o.generation = v.value("generation", defaults.generation);
    o.shader_language = v.value("shader_language", defaults.shader_language);
    o.output_dir = v.value("output_dir", defaults.output_dir);
    o.max_frames_in_flight = v.value("max_frames_in_flight", defaults.max_frames_in_flight);
    o.ring_size = v.value("ring_size", defaults.ring_size);
    o.max_draws_per_frame = v.value("max_draws_per_frame", defaults.max_draws_per_frame);
    o.max_directional_lights = v.value("max_directional_lights", defaults.max_directional_lights);
    o.max_point_lights = v.value("max_point_lights", defaults.max_point_lights);
    o.max_area_lights = v.value("max_area_lights", defaults.max_area_lights);
    o.max_instances = v.value("max_instances", defaults.max_instances);
    o.max_textures = v.value("max_textures", defaults.max_textures);
    o.capacity_policy = v.value("capacity_policy", defaults.capacity_policy);
}

auto parse_settings(std::string_view text, std::string_view format) -> ContractSettings {
    serde::Value value{};
    if (format == "json") {
        value = serde::Value::from_json(text);
    } else if (format == "toml") {
        value = serde::Value::from_toml(text);
    } else {
        throw SettingsError{fmt::format("unknown settings format '{}'", format)};
    }
    auto settings = value.get<ContractSettings>();
    settings.validate();
    return settings;
}

auto load_settings(std::filesystem::path const& path) -> ContractSettings {
    std::string text{};
    {
        std::ifstream fin(path);
        if (!fin) {
            throw SettingsError{fmt::format("settings file '{}' not found", path.string())};
        }
        text = read_all_from_file(fin);
    }

    auto extension = path.extension().string();
    auto format = extension == ".json" ? "json" : "toml";
    auto settings = parse_settings(text, format);
    log::info("general", "settings loaded from '{}', generation '{}'", path.string(), magic_enum::enum_name(settings.generation));
    return settings;
}

}
