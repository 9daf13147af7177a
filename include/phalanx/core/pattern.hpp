#pragma once

#include "phalanx/core/vec2.hpp"
#include <string>
#include <vector>

namespace phalanx::core {

// Static per-pattern tuning handed to the formation director.
struct PatternMetadata {
    std::string id;
    std::string name;
    int enemy_count = 0;
    double break_distance = 0.0;
    double move_speed = 0.0;
    double rotation_speed = 0.0;

    bool is_valid() const noexcept;
};

struct SlotDescriptor {
    Vec2 position;
    std::string type;
    bool is_leader = false;
};

// Slot offset in units of the pattern radius, before rotation.
struct SlotTemplate {
    Vec2 offset;
    bool is_leader = false;
    std::string type;
};

struct PatternDefinition {
    PatternMetadata meta;
    double radius = 50.0;
    int min_wave = 1;
    double spawn_weight = 1.0;
    double pulse_amplitude = 0.0;  // fraction of radius
    double pulse_frequency = 0.0;  // radians per second
    std::vector<SlotTemplate> slots;

    bool is_valid() const noexcept;

    std::vector<SlotDescriptor> slot_positions(const Vec2& center, double rotation, double time) const;
};

} // namespace phalanx::core
