#include "phalanx/formation_director.hpp"
#include "phalanx/core/steering.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace phalanx {

FormationDirector::FormationDirector(DirectorConfig config,
                                     ports::IPatternProvider& patterns,
                                     ports::IAgentPopulation& population,
                                     ports::IFormationEventSink& events,
                                     core::MetricsCollector& metrics)
    : config_(std::move(config))
    , patterns_(patterns)
    , population_(population)
    , events_(events)
    , metrics_(metrics)
    , rng_(config_.seed) {
}

void FormationDirector::update(double dt, const core::Vec2& target, int progression) {
    if (!enabled_) return;

    if (!std::isfinite(dt) || dt < 0.0 || !target.is_finite()) {
        spdlog::warn("Skipping formation update with invalid input (dt={})", dt);
        return;
    }

    sweep_inactive();

    spawn_timer_ += dt;
    if (spawn_timer_ >= config_.spawn_interval && active_count() < config_.max_formations) {
        try_spawn(target, progression);
        spawn_timer_ = 0.0;
    }

    for (auto& formation : formations_) {
        if (formation.active) {
            update_formation(formation, dt, target);
        }
    }
}

std::optional<core::FormationId> FormationDirector::try_spawn(const core::Vec2& target, int progression) {
    if (active_count() >= config_.max_formations) {
        spdlog::debug("Formation ceiling of {} reached", config_.max_formations);
        return std::nullopt;
    }

    if (active_count() > 0 && population_saturated()) {
        auto census = population_.census();
        spdlog::debug("Population {}/{} too dense for another formation", census.alive, census.cap);
        metrics_.record_spawn_suppressed();
        return std::nullopt;
    }

    auto pattern_id = patterns_.select_pattern(progression, rng_);
    if (!pattern_id) {
        spdlog::debug("No formation pattern available at wave {}", progression);
        return std::nullopt;
    }

    auto meta = patterns_.metadata(*pattern_id);
    if (!meta || !meta->is_valid()) {
        spdlog::warn("Pattern '{}' has missing or malformed metadata, skipping spawn", *pattern_id);
        metrics_.record_invalid_pattern();
        return std::nullopt;
    }

    core::Formation formation;
    formation.id = uuid_gen_();
    formation.pattern = *meta;
    formation.state = core::FormationState::Spawning;
    formation.center = spawn_position(target, formation.rotation);

    populate(formation);

    if (formation.members.size() < formation.min_viable_size()) {
        release_members(formation);
        formation.active = false;
        formation.state = core::FormationState::Inactive;
        formation.break_reason = core::BreakReason::EmptySpawn;
        metrics_.record_formation_broken(core::BreakReason::EmptySpawn);
        spdlog::warn("Formation '{}' recruited {}/{} members, below the viable {}, dropped",
                     meta->id, formation.members.size(), meta->enemy_count,
                     formation.min_viable_size());
        return std::nullopt;
    }

    formation.active = true;
    formation.state = core::FormationState::Active;

    ports::FormationFormedEvent event;
    event.formation_id = formation.id;
    event.center = formation.center;
    event.members = formation.member_ids();
    event.pattern_id = formation.pattern_id();

    spdlog::info("Spawned formation {} '{}' with {}/{} members at wave {}",
                 boost::uuids::to_string(formation.id), meta->name,
                 formation.members.size(), meta->enemy_count, progression);

    auto id = formation.id;
    formations_.push_back(std::move(formation));
    metrics_.record_formation_spawned();
    events_.on_formation_formed(event);
    return id;
}

void FormationDirector::reset() {
    for (auto& formation : formations_) {
        if (formation.active) {
            break_formation(formation, core::BreakReason::Reset);
        }
    }

    formations_.clear();
    spawn_timer_ = 0.0;
    rng_.seed(config_.seed);
}

const core::Formation* FormationDirector::find(const core::FormationId& id) const {
    auto it = std::ranges::find_if(formations_,
        [&](const auto& f) { return f.id == id; });
    return it != formations_.end() ? &*it : nullptr;
}

std::size_t FormationDirector::active_count() const {
    return std::ranges::count_if(formations_, [](const auto& f) { return f.active; });
}

DirectorStats FormationDirector::debug_stats() const {
    DirectorStats stats;
    stats.active_formations = active_count();
    for (const auto& formation : formations_) {
        if (formation.active) {
            stats.total_members += formation.members.size();
        }
    }
    stats.next_spawn_in = std::max(0.0, config_.spawn_interval - spawn_timer_);
    return stats;
}

bool FormationDirector::population_saturated() const {
    auto census = population_.census();
    if (census.cap == 0) return true;
    return static_cast<double>(census.alive) > config_.population_gate * static_cast<double>(census.cap);
}

core::Vec2 FormationDirector::spawn_position(const core::Vec2& target, double& initial_angle) {
    // Always outside the visible play area around the target
    const double half_diagonal = 0.5 * std::hypot(config_.viewport_width, config_.viewport_height);
    const double min_distance = std::max(config_.spawn_min_distance, half_diagonal + config_.offscreen_margin);
    const double spread = std::max(0.0, config_.spawn_max_distance - config_.spawn_min_distance);

    std::uniform_real_distribution<double> distance_dist(min_distance, min_distance + spread);
    std::uniform_real_distribution<double> angle_dist(0.0, 2.0 * std::numbers::pi);

    const double distance = spread > 0.0 ? distance_dist(rng_) : min_distance;
    initial_angle = angle_dist(rng_);

    return target + core::Vec2::from_angle(initial_angle, distance);
}

void FormationDirector::populate(core::Formation& formation) {
    auto slots = patterns_.slots(formation.pattern_id(), formation.center, formation.rotation, formation.time);
    const auto wanted = std::min(slots.size(), static_cast<std::size_t>(formation.pattern.enemy_count));

    for (std::size_t i = 0; i < wanted; ++i) {
        const auto& slot = slots[i];

        auto agent_id = population_.recruit(slot.position);
        if (!agent_id) continue;

        auto agent = population_.find(*agent_id);
        if (!agent) continue;

        core::FormationMarker marker{formation.id, i, slot.is_leader};
        if (core::assign_formation(*agent, marker)) {
            spdlog::debug("Agent {} left its constellation to join formation {}",
                          boost::uuids::to_string(agent->id), boost::uuids::to_string(formation.id));
        }

        formation.members.push_back({agent->id, i, slot.is_leader, slot.position});
    }
}

void FormationDirector::update_formation(core::Formation& formation, double dt, const core::Vec2& target) {
    const auto& pattern = formation.pattern;

    formation.time += dt;

    const core::Vec2 to_target = target - formation.center;
    const double distance = to_target.length();

    // Formations speed up and spin faster as they close in
    const double ratio = core::proximity_ratio(distance, pattern.break_distance);
    formation.rotation += pattern.rotation_speed * (1.0 + ratio * config_.rotation_boost) * dt;

    if (distance <= pattern.break_distance) {
        break_formation(formation, core::BreakReason::TargetReached);
        return;
    }

    const double speed_boost = 1.0 + ratio * config_.speed_boost;
    const double move_amount = std::min(pattern.move_speed * speed_boost * dt, distance);
    formation.center += to_target * (move_amount / distance);

    steer_members(formation);
    prune_members(formation);

    if (!formation.is_viable()) {
        break_formation(formation, core::BreakReason::Collapsed);
    }
}

void FormationDirector::steer_members(core::Formation& formation) {
    auto slots = patterns_.slots(formation.pattern_id(), formation.center, formation.rotation, formation.time);

    for (auto& member : formation.members) {
        auto agent = population_.find(member.agent_id);
        if (!agent || agent->is_dead || !is_member(*agent, formation)) continue;

        // Members without a fresh slot keep chasing their last one
        if (member.slot_index < slots.size()) {
            member.last_slot = slots[member.slot_index].position;
        }

        auto force = core::pursue_slot(agent->position, member.last_slot,
                                       config_.steering_gain, config_.max_steering_force);
        if (!agent->forces.add_force(core::ForceSource::Formation, force.x, force.y)) {
            metrics_.record_rejected_force();
        }
    }
}

void FormationDirector::prune_members(core::Formation& formation) {
    for (std::size_t i = formation.members.size(); i-- > 0;) {
        auto agent = population_.find(formation.members[i].agent_id);
        if (!agent || agent->is_dead || !is_member(*agent, formation)) {
            formation.remove_member_at(i);
        }
    }
}

void FormationDirector::break_formation(core::Formation& formation, core::BreakReason reason) {
    if (formation.state == core::FormationState::Inactive) return;

    formation.active = false;
    formation.state = core::FormationState::Breaking;
    formation.break_reason = reason;

    // Only members that still exist are reported as released
    prune_members(formation);
    release_members(formation);

    ports::FormationBrokenEvent event;
    event.formation_id = formation.id;
    event.center = formation.center;
    event.members = formation.member_ids();
    event.reason = reason;

    formation.state = core::FormationState::Inactive;
    metrics_.record_formation_broken(reason);

    spdlog::info("Formation {} '{}' broken ({}), {} members released",
                 boost::uuids::to_string(formation.id), formation.pattern.name,
                 core::to_string(reason), formation.members.size());

    events_.on_formation_broken(event);
}

void FormationDirector::sweep_inactive() {
    for (std::size_t i = formations_.size(); i-- > 0;) {
        if (!formations_[i].active) {
            if (i != formations_.size() - 1) {
                formations_[i] = std::move(formations_.back());
            }
            formations_.pop_back();
        }
    }
}

void FormationDirector::release_members(core::Formation& formation) {
    for (const auto& member : formation.members) {
        auto agent = population_.find(member.agent_id);
        if (agent && !agent->is_dead && is_member(*agent, formation)) {
            core::clear_membership(*agent);
        }
    }
}

bool FormationDirector::is_member(const core::Agent& agent, const core::Formation& formation) const {
    auto marker = agent.formation();
    return marker && marker->formation_id == formation.id;
}

} // namespace phalanx
