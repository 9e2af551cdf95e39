#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sl::rt {

enum class CapacityKind : uint8_t {
    directional_lights,
    point_lights,
    area_lights,
    instances,
    textures,
    draws,
};

// What the producer does when a frame holds more records than a buffer can take.
enum class CapacityPolicy : uint8_t {
    // Keep the first `capacity` records and log a warning.
    clamp,
    // Fail the frame with a `CapacityError`.
    reject,
};

struct CapacityError final {
    CapacityKind kind = CapacityKind::instances;
    size_t requested = 0;
    size_t capacity = 0;

    auto message() const -> std::string;
};

}
