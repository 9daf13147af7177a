#pragma once

#include "phalanx/core/vec2.hpp"
#include <algorithm>

namespace phalanx::core {

// Proportional pursuit: the correction shrinks with the remaining gap so a
// member settles into its slot instead of orbiting it.
inline Vec2 pursue_slot(const Vec2& position, const Vec2& slot, double gain, double max_force) noexcept {
    Vec2 force = (slot - position) * gain;
    const double magnitude = force.length();
    if (magnitude > max_force && magnitude > 0.0) {
        force *= max_force / magnitude;
    }
    return force;
}

// Full-strength pull toward a target, zero once there.
inline Vec2 seek(const Vec2& position, const Vec2& target, double strength) noexcept {
    const Vec2 delta = target - position;
    const double dist = delta.length();
    if (dist < 1e-6) {
        return {};
    }
    return delta * (strength / dist);
}

// 0 at twice the break distance, 1 at the break distance.
inline double proximity_ratio(double distance, double break_distance) noexcept {
    if (break_distance <= 0.0) return 0.0;
    return std::clamp((2.0 * break_distance - distance) / break_distance, 0.0, 1.0);
}

} // namespace phalanx::core
