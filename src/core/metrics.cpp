#include "phalanx/core/metrics.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace phalanx::core {

void MetricsCollector::record_formation_broken(BreakReason reason) {
    switch (reason) {
        case BreakReason::TargetReached:
            ++snapshot_.broken_target_reached;
            break;
        case BreakReason::Collapsed:
            ++snapshot_.broken_collapsed;
            break;
        case BreakReason::Reset:
            ++snapshot_.broken_reset;
            break;
        case BreakReason::EmptySpawn:
            // never went active
            ++snapshot_.empty_spawns;
            return;
        case BreakReason::None:
            return;
    }
    ++snapshot_.formations_broken;
}

void MetricsCollector::record_tick_trace(const TickTrace& trace) {
    traces_.push_back(trace);
}

void MetricsCollector::reset() {
    snapshot_ = MetricsSnapshot{};
    traces_.clear();
}

void emit_metrics_json(const std::filesystem::path& path, const MetricsSnapshot& metrics) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open metrics file: " + path.string());
    }

    file << "{\n";
    file << "  \"ticks\": " << metrics.ticks << ",\n";
    file << "  \"formations_spawned\": " << metrics.formations_spawned << ",\n";
    file << "  \"formations_broken\": " << metrics.formations_broken << ",\n";
    file << "  \"broken_target_reached\": " << metrics.broken_target_reached << ",\n";
    file << "  \"broken_collapsed\": " << metrics.broken_collapsed << ",\n";
    file << "  \"broken_reset\": " << metrics.broken_reset << ",\n";
    file << "  \"empty_spawns\": " << metrics.empty_spawns << ",\n";
    file << "  \"spawns_suppressed\": " << metrics.spawns_suppressed << ",\n";
    file << "  \"invalid_pattern_skips\": " << metrics.invalid_pattern_skips << ",\n";
    file << "  \"rejected_forces\": " << metrics.rejected_forces << ",\n";
    file << "  \"membership_conflicts\": " << metrics.membership_conflicts << ",\n";
    file << "  \"wall_time_ms\": " << metrics.wall_time.count() << ",\n";

    double completion_rate = metrics.formations_broken > 0 ?
        static_cast<double>(metrics.broken_target_reached) / metrics.formations_broken : 0.0;
    file << "  \"completion_rate\": " << std::fixed << std::setprecision(4) << completion_rate << "\n";
    file << "}\n";
}

void emit_trace_csv(const std::filesystem::path& path, const std::vector<TickTrace>& traces) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open trace file: " + path.string());
    }

    file << "tick,alive_agents,managed_agents,active_formations\n";

    for (const auto& trace : traces) {
        file << trace.tick << ","
             << trace.alive_agents << ","
             << trace.managed_agents << ","
             << trace.active_formations << "\n";
    }
}

} // namespace phalanx::core
