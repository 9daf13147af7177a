#include "phalanx/core/pattern.hpp"
#include <cmath>

namespace phalanx::core {

bool PatternMetadata::is_valid() const noexcept {
    return enemy_count > 0 &&
           std::isfinite(break_distance) && break_distance > 0.0 &&
           std::isfinite(move_speed) && move_speed >= 0.0 &&
           std::isfinite(rotation_speed);
}

bool PatternDefinition::is_valid() const noexcept {
    if (!meta.is_valid() || slots.empty()) return false;
    if (!std::isfinite(radius) || radius <= 0.0) return false;
    if (!std::isfinite(spawn_weight) || spawn_weight <= 0.0) return false;
    if (!std::isfinite(pulse_amplitude) || !std::isfinite(pulse_frequency)) return false;

    for (const auto& slot : slots) {
        if (!slot.offset.is_finite()) return false;
    }
    return true;
}

std::vector<SlotDescriptor> PatternDefinition::slot_positions(
    const Vec2& center, double rotation, double time) const {

    // Breathing effect
    const double pulse = 1.0 + std::sin(time * pulse_frequency) * pulse_amplitude;
    const double r = radius * pulse;

    std::vector<SlotDescriptor> positions;
    positions.reserve(slots.size());

    for (const auto& slot : slots) {
        SlotDescriptor desc;
        desc.position = center + slot.offset.rotated(rotation) * r;
        desc.type = slot.type;
        desc.is_leader = slot.is_leader;
        positions.push_back(std::move(desc));
    }

    return positions;
}

} // namespace phalanx::core
