#include <shaderlink/runtime/capacity.hpp>

#include <fmt/format.h>
#include <magic_enum.hpp>

namespace sl::rt {

auto CapacityError::message() const -> std::string {
    return fmt::format("{} {} requested but capacity is {}", requested, magic_enum::enum_name(kind), capacity);
}

}
