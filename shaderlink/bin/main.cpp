#include <filesystem>
#include <fstream>
#include <optional>
#include <string_view>

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <shaderlink/contract/contract_source.hpp>
#include <shaderlink/contract/settings.hpp>
#include <shaderlink/runtime/logger.hpp>

namespace {

struct CommandLine final {
    std::filesystem::path config_path;
    std::optional<std::string_view> generation;
    std::optional<std::string_view> output_dir;
    std::optional<std::string_view> language;
};

auto print_usage() -> void {
    sl::log::info(
        "general",
        "usage: shaderlink-gen <config.toml|config.json> [-generation <name>] [-out <dir>] [-lang hlsl|msl]"
    );
}

auto parse_command_line(int argc, char** argv) -> std::optional<CommandLine> {
    if (argc < 2) { return {}; }

    CommandLine cmd{};
    cmd.config_path = argv[1];
    for (int i = 2; i < argc; i++) {
        std::string_view arg{argv[i]};
        if (i + 1 >= argc) {
            sl::log::error("general", "option '{}' needs a value", arg);
            return {};
        }
        if (arg == "-generation") {
            cmd.generation = argv[++i];
        } else if (arg == "-out") {
            cmd.output_dir = argv[++i];
        } else if (arg == "-lang") {
            cmd.language = argv[++i];
        } else {
            sl::log::error("general", "unknown option '{}'", arg);
            return {};
        }
    }
    return cmd;
}

template <typename E>
auto enum_from_arg(std::string_view arg, E& value) -> bool {
    auto e = magic_enum::enum_cast<E>(arg);
    if (!e.has_value()) {
        sl::log::error("general", "'{}' is not a valid {}", arg, magic_enum::enum_type_name<E>());
        return false;
    }
    value = e.value();
    return true;
}

auto write_file(std::filesystem::path const& path, std::string const& content) -> bool {
    std::ofstream fout(path, std::ios::binary);
    if (!fout) {
        sl::log::error("general", "failed to open '{}' for writing", path.string());
        return false;
    }
    fout << content;
    return static_cast<bool>(fout);
}

auto run(CommandLine const& cmd) -> int {
    auto settings = sl::contract::load_settings(cmd.config_path);
    if (cmd.generation && !enum_from_arg(cmd.generation.value(), settings.generation)) { return 1; }
    if (cmd.language && !enum_from_arg(cmd.language.value(), settings.shader_language)) { return 1; }
    if (cmd.output_dir) { settings.output_dir = std::string{cmd.output_dir.value()}; }

    if (!sl::contract::verify_registry()) {
        sl::log::critical("contract", "binding slot registry is inconsistent, nothing generated");
        return 2;
    }

    auto generation_name = magic_enum::enum_name(settings.generation);
    std::filesystem::path output_dir{settings.output_dir};
    std::filesystem::create_directories(output_dir);

    auto extension = settings.shader_language == sl::gfx::ShaderLanguage::msl ? ".metal" : ".hlsl";
    auto source_path = output_dir / fmt::format("{}{}", generation_name, extension);
    auto layout_path = output_dir / fmt::format("{}_layout.json", generation_name);

    auto source = sl::contract::generate_shader_source(settings.generation, settings.shader_language);
    auto description = sl::contract::contract_description(settings.generation).to_json(4);
    if (!write_file(source_path, source) || !write_file(layout_path, description)) { return 3; }

    sl::log::info("general", "wrote '{}' and '{}'", source_path.string(), layout_path.string());
    return 0;
}

}

int main(int argc, char** argv) {
    auto cmd = parse_command_line(argc, argv);
    if (!cmd) {
        print_usage();
        return 1;
    }

    try {
        return run(cmd.value());
    } catch (std::exception const& e) {
        sl::log::critical("general", "{}", e.what());
        return 1;
    }
}
