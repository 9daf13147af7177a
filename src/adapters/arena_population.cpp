#include "phalanx/adapters/arena_population.hpp"
#include <spdlog/spdlog.h>

namespace phalanx::adapters {

std::optional<core::AgentId> ArenaPopulation::recruit(const core::Vec2& position) {
    auto id = arena_.spawn(position, agent_radius_);
    if (!id) {
        spdlog::debug("Arena at capacity ({}), cannot recruit formation member", arena_.capacity());
    }
    return id;
}

core::Agent* ArenaPopulation::find(const core::AgentId& id) {
    return arena_.find(id);
}

phalanx::ports::PopulationCensus ArenaPopulation::census() const {
    return {arena_.alive_count(), arena_.capacity()};
}

} // namespace phalanx::adapters
