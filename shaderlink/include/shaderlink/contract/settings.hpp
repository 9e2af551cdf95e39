#pragma once

#include <exception>
#include <filesystem>
#include <string>
#include <string_view>

#include "contracts.hpp"
#include "frame_assembler.hpp"
#include "../graphics/shader_codegen.hpp"
#include "../runtime/capacity.hpp"
#include "../runtime/uniform_arena.hpp"
#include "../utils/serde.hpp"

namespace sl::contract {

struct SettingsError final : std::exception {
    SettingsError() noexcept = default;
    SettingsError(std::string const& str) noexcept : error_(str) {}
    SettingsError(std::string&& str) noexcept : error_(std::move(str)) {}

    auto what() const noexcept -> char const* override { return error_.c_str(); }

private:
    std::string error_;
};

struct ContractSettings final {
    Generation generation = Generation::pbr_hybrid;
    gfx::ShaderLanguage shader_language = gfx::ShaderLanguage::hlsl;
    std::string output_dir = "generated";

    uint32_t max_frames_in_flight = 2;
    uint32_t ring_size = 3;
    uint32_t max_draws_per_frame = 256;

    uint32_t max_directional_lights = 4;
    uint32_t max_point_lights = 8;
    uint32_t max_area_lights = 4;
    uint32_t max_instances = 1024;
    uint32_t max_textures = 32;
    rt::CapacityPolicy capacity_policy = rt::CapacityPolicy::clamp;

    // Throws `SettingsError` for values no contract can be built with.
    auto validate() const -> void;

    auto assembler_limits() const -> AssemblerLimits;
    auto make_frame_assembler() const -> FrameAssembler;

    template <typename T>
    auto make_frame_ring() const -> rt::FrameRing<T> {
        return rt::FrameRing<T>{ring_size, max_frames_in_flight};
    }
    // One block of `max_draws_per_frame` records per ring slot.
    template <typename T>
    auto make_uniform_arena() const -> rt::UniformArena<T> {
        return rt::UniformArena<T>{ring_size, max_draws_per_frame};
    }

    static auto to_value(serde::Value& v, ContractSettings const& o) -> void;
    static auto from_value(serde::Value const& v, ContractSettings& o) -> void;
};

// Parses JSON or TOML depending on `format`, "json" or "toml".
auto parse_settings(std::string_view text, std::string_view format) -> ContractSettings;

// Picks the format from the file extension.
auto load_settings(std::filesystem::path const& path) -> ContractSettings;

}
