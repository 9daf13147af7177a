#pragma once

#include "phalanx/core/formation.hpp"
#include "phalanx/core/metrics.hpp"
#include "phalanx/ports/event_sink.hpp"
#include "phalanx/ports/pattern_provider.hpp"
#include "phalanx/ports/population.hpp"
#include <optional>
#include <random>
#include <vector>

namespace phalanx {

struct DirectorConfig {
    double spawn_interval = 5.0;       // seconds between spawn attempts
    std::size_t max_formations = 3;    // concurrently active
    double population_gate = 0.8;      // fraction of the population cap

    double spawn_min_distance = 400.0;
    double spawn_max_distance = 600.0;
    double viewport_width = 800.0;
    double viewport_height = 600.0;
    double offscreen_margin = 50.0;

    double steering_gain = 4.0;
    double max_steering_force = 400.0;

    // Extra rotation and speed at full proximity (breakDistance).
    double rotation_boost = 1.0;
    double speed_boost = 0.5;

    uint64_t seed = 42;
};

struct DirectorStats {
    std::size_t active_formations = 0;
    std::size_t total_members = 0;
    double next_spawn_in = 0.0;
};

// Spawns, steers and dissolves formations. Runs once per tick before any
// agent computes its net force.
class FormationDirector {
public:
    FormationDirector(DirectorConfig config,
                      ports::IPatternProvider& patterns,
                      ports::IAgentPopulation& population,
                      ports::IFormationEventSink& events,
                      core::MetricsCollector& metrics);

    void update(double dt, const core::Vec2& target, int progression);

    // Immediate spawn attempt, subject to the ceiling, the population gate
    // and pattern validation.
    std::optional<core::FormationId> try_spawn(const core::Vec2& target, int progression);

    // Breaks every active formation, then forgets all of them.
    void reset();

    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool is_enabled() const { return enabled_; }

    const std::vector<core::Formation>& formations() const { return formations_; }
    const core::Formation* find(const core::FormationId& id) const;
    std::size_t active_count() const;
    DirectorStats debug_stats() const;

    const DirectorConfig& config() const { return config_; }

private:
    DirectorConfig config_;
    ports::IPatternProvider& patterns_;
    ports::IAgentPopulation& population_;
    ports::IFormationEventSink& events_;
    core::MetricsCollector& metrics_;

    std::vector<core::Formation> formations_;
    double spawn_timer_ = 0.0;
    bool enabled_ = true;

    std::mt19937_64 rng_;
    boost::uuids::random_generator uuid_gen_;

    bool population_saturated() const;
    core::Vec2 spawn_position(const core::Vec2& target, double& initial_angle);
    void populate(core::Formation& formation);

    void update_formation(core::Formation& formation, double dt, const core::Vec2& target);
    void steer_members(core::Formation& formation);
    void prune_members(core::Formation& formation);
    void release_members(core::Formation& formation);
    void break_formation(core::Formation& formation, core::BreakReason reason);
    void sweep_inactive();

    bool is_member(const core::Agent& agent, const core::Formation& formation) const;
};

} // namespace phalanx
