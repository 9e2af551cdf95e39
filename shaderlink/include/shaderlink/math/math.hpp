#pragma once

#include <cstdint>

#define GLM_FORCE_DEPTH_ZERO_TO_ONE
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace sl {

using float1 = float;
using float2 = glm::vec2;
using float3 = glm::vec3;
using float4 = glm::vec4;

using int1 = int;
using int2 = glm::ivec2;
using int3 = glm::ivec3;
using int4 = glm::ivec4;

using uint = uint32_t;
using uint1 = uint32_t;
using uint2 = glm::uvec2;
using uint3 = glm::uvec3;
using uint4 = glm::uvec4;

using float3x3 = glm::mat3;
using float4x4 = glm::mat4;

namespace math {

using namespace glm;

template <typename T>
constexpr auto saturate(T const& v) -> T {
    return glm::clamp(v, T(0.0f), T(1.0f));
}

} // namespace math

} // namespace sl
