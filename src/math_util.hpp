#pragma once
#include <ecs/modules/transform.hpp>
#include <cmath>
#include <algorithm>

namespace toolbox::math {

/**
 * @brief Rounds a value to the nearest multiple of step.
 * @details A step of zero (or less) disables quantization.
 */
inline float quantize(float value, float step) {
    if (step <= 0.0f) return value;
    return std::round(value / step) * step;
}

inline ecs::Vec3 add(const ecs::Vec3& a, const ecs::Vec3& b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
inline ecs::Vec3 sub(const ecs::Vec3& a, const ecs::Vec3& b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
inline ecs::Vec3 scale(const ecs::Vec3& v, float s)          { return {v.x * s, v.y * s, v.z * s}; }

inline ecs::Vec3 cross(const ecs::Vec3& a, const ecs::Vec3& b) {
    return {a.y * b.z - a.z * b.y,
            a.z * b.x - a.x * b.z,
            a.x * b.y - a.y * b.x};
}

inline float length(const ecs::Vec3& v) {
    return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
}

/**
 * @brief Returns v scaled to unit length, or zero if v is degenerate.
 */
inline ecs::Vec3 normalize(const ecs::Vec3& v) {
    float len = length(v);
    if (len < 0.0001f) return {0, 0, 0};
    return scale(v, 1.0f / len);
}

} // namespace toolbox::math
