#pragma once

#include "phalanx/core/formation.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace phalanx::core {

struct MetricsSnapshot {
    uint64_t formations_spawned = 0;
    uint64_t formations_broken = 0;
    uint64_t broken_target_reached = 0;
    uint64_t broken_collapsed = 0;
    uint64_t broken_reset = 0;
    uint64_t empty_spawns = 0;
    uint64_t spawns_suppressed = 0;      // population gate
    uint64_t invalid_pattern_skips = 0;
    uint64_t rejected_forces = 0;
    uint64_t membership_conflicts = 0;
    Tick ticks = 0;
    std::chrono::milliseconds wall_time{0};
};

struct TickTrace {
    Tick tick;
    std::size_t alive_agents;
    std::size_t managed_agents;
    std::size_t active_formations;
};

class MetricsCollector {
public:
    MetricsCollector() = default;

    void record_formation_spawned() { ++snapshot_.formations_spawned; }
    void record_formation_broken(BreakReason reason);
    void record_spawn_suppressed() { ++snapshot_.spawns_suppressed; }
    void record_invalid_pattern() { ++snapshot_.invalid_pattern_skips; }
    void record_rejected_force() { ++snapshot_.rejected_forces; }
    void record_membership_conflict() { ++snapshot_.membership_conflicts; }
    void set_ticks(Tick ticks) { snapshot_.ticks = ticks; }

    void record_tick_trace(const TickTrace& trace);

    MetricsSnapshot get_snapshot() const { return snapshot_; }
    const std::vector<TickTrace>& get_traces() const { return traces_; }

    void reset();

    void start_timer() { start_time_ = std::chrono::steady_clock::now(); }
    void stop_timer() {
        auto end_time = std::chrono::steady_clock::now();
        snapshot_.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time_);
    }

private:
    MetricsSnapshot snapshot_;
    std::vector<TickTrace> traces_;
    std::chrono::steady_clock::time_point start_time_;
};

void emit_metrics_json(const std::filesystem::path& path, const MetricsSnapshot& metrics);
void emit_trace_csv(const std::filesystem::path& path, const std::vector<TickTrace>& traces);

} // namespace phalanx::core
