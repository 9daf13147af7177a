#include "phalanx/adapters/pattern_library.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <numbers>

namespace phalanx::adapters {

namespace {

core::PatternDefinition make_pattern(std::string id, std::string name, int enemy_count,
                                     double radius, double rotation_speed, double move_speed,
                                     double break_distance, double spawn_weight) {
    core::PatternDefinition def;
    def.meta.id = std::move(id);
    def.meta.name = std::move(name);
    def.meta.enemy_count = enemy_count;
    def.meta.rotation_speed = rotation_speed;
    def.meta.move_speed = move_speed;
    def.meta.break_distance = break_distance;
    def.radius = radius;
    def.min_wave = 1;
    def.spawn_weight = spawn_weight;
    return def;
}

} // namespace

PatternLibrary::PatternLibrary(std::vector<core::PatternDefinition> patterns) {
    for (auto& pattern : patterns) {
        add(std::move(pattern));
    }
}

std::vector<core::PatternDefinition> PatternLibrary::builtin_patterns() {
    std::vector<core::PatternDefinition> patterns;

    // Cube corners projected to 2D, back face shrunk for depth
    auto cubic = make_pattern("cubic_swarm", "Cubic Swarm", 8, 60.0, 0.3, 80.0, 150.0, 2.0);
    cubic.pulse_amplitude = 0.1;
    cubic.pulse_frequency = 2.0;
    for (double scale : {1.0, 0.7}) {
        cubic.slots.push_back({{scale, scale}});
        cubic.slots.push_back({{-scale, scale}});
        cubic.slots.push_back({{scale, -scale}});
        cubic.slots.push_back({{-scale, -scale}});
    }
    patterns.push_back(std::move(cubic));

    // Leader apex ahead of a diamond base
    auto pyramid = make_pattern("pyramid_squadron", "Pyramid Squadron", 5, 50.0, 0.2, 100.0, 120.0, 3.0);
    pyramid.pulse_amplitude = 0.05;
    pyramid.pulse_frequency = 1.5;
    pyramid.slots.push_back({{0.0, -0.5}, true});
    for (int i = 0; i < 4; ++i) {
        pyramid.slots.push_back({core::Vec2::from_angle(i * std::numbers::pi / 2.0)});
    }
    patterns.push_back(std::move(pyramid));

    auto ring = make_pattern("octahedron_ring", "Octahedron Ring", 6, 55.0, 0.4, 90.0, 140.0, 1.5);
    ring.pulse_amplitude = 10.0 / 55.0;
    ring.pulse_frequency = 2.0;
    for (int i = 0; i < 6; ++i) {
        ring.slots.push_back({core::Vec2::from_angle(i * std::numbers::pi / 3.0)});
    }
    patterns.push_back(std::move(ring));

    // V with the leader at the tip, wings trailing at 45 degrees
    auto wedge = make_pattern("line_wedge", "Line Wedge", 3, 40.0, 0.0, 140.0, 100.0, 4.0);
    const double wing = std::numbers::pi / 4.0;
    wedge.slots.push_back({{0.0, 0.0}, true, "fast"});
    wedge.slots.push_back({core::Vec2::from_angle(wing, -1.0), false, "fast"});
    wedge.slots.push_back({core::Vec2::from_angle(-wing, -1.0), false, "fast"});
    patterns.push_back(std::move(wedge));

    return patterns;
}

PatternLibrary PatternLibrary::with_builtin_patterns() {
    return PatternLibrary(builtin_patterns());
}

bool PatternLibrary::add(core::PatternDefinition pattern) {
    if (!pattern.is_valid()) {
        spdlog::error("Refusing invalid formation pattern '{}'", pattern.meta.id);
        return false;
    }

    auto id = pattern.meta.id;
    auto [it, inserted] = patterns_.insert_or_assign(id, std::move(pattern));
    if (inserted) {
        order_.push_back(id);
    } else {
        spdlog::debug("Replaced formation pattern '{}'", id);
    }
    return true;
}

std::vector<const core::PatternDefinition*> PatternLibrary::available(int progression) const {
    std::vector<const core::PatternDefinition*> result;
    for (const auto& id : order_) {
        const auto& def = patterns_.at(id);
        if (progression >= def.min_wave) {
            result.push_back(&def);
        }
    }
    return result;
}

std::optional<std::string> PatternLibrary::select_pattern(int progression, std::mt19937_64& rng) {
    auto candidates = available(progression);
    if (candidates.empty()) {
        return std::nullopt;
    }

    double total_weight = 0.0;
    for (auto def : candidates) {
        total_weight += def->spawn_weight;
    }

    std::uniform_real_distribution<double> dist(0.0, total_weight);
    double roll = dist(rng);

    for (auto def : candidates) {
        roll -= def->spawn_weight;
        if (roll <= 0.0) {
            return def->meta.id;
        }
    }

    return candidates.back()->meta.id;
}

std::optional<core::PatternMetadata> PatternLibrary::metadata(const std::string& pattern_id) const {
    if (auto def = get(pattern_id)) {
        return def->meta;
    }
    return std::nullopt;
}

std::vector<core::SlotDescriptor> PatternLibrary::slots(
    const std::string& pattern_id,
    const core::Vec2& center,
    double rotation,
    double time
) const {
    if (auto def = get(pattern_id)) {
        return def->slot_positions(center, rotation, time);
    }
    return {};
}

const core::PatternDefinition* PatternLibrary::get(const std::string& pattern_id) const {
    auto it = patterns_.find(pattern_id);
    return it != patterns_.end() ? &it->second : nullptr;
}

} // namespace phalanx::adapters
