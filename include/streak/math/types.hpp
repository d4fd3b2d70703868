#pragma once

/// @file types.hpp
/// @brief Vector and matrix aliases for streak_math

#define GLM_FORCE_RADIANS
#define GLM_FORCE_DEPTH_ZERO_TO_ONE

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/packing.hpp>

namespace streak_math {

using Vec2 = glm::vec2;
using Vec3 = glm::vec3;
using Vec4 = glm::vec4;
using IVec2 = glm::ivec2;
using UVec2 = glm::uvec2;
using Mat4 = glm::mat4;

// =============================================================================
// Constants
// =============================================================================

namespace consts {
    inline constexpr float PI = 3.14159265358979323846f;
    inline constexpr float TAU = 2.0f * PI;
    inline constexpr float EPSILON = 1e-6f;
}

namespace vec2 {
    inline constexpr Vec2 ZERO = Vec2(0.0f, 0.0f);
    inline constexpr Vec2 X = Vec2(1.0f, 0.0f);
    inline constexpr Vec2 Y = Vec2(0.0f, 1.0f);
}

namespace vec4 {
    inline constexpr Vec4 ZERO = Vec4(0.0f, 0.0f, 0.0f, 0.0f);
    inline constexpr Vec4 BLACK = Vec4(0.0f, 0.0f, 0.0f, 1.0f);
}

} // namespace streak_math
