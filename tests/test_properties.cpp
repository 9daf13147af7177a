#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "phalanx/simulation.hpp"
#include <algorithm>
#include <unordered_map>

using namespace phalanx;
using namespace phalanx::core;

namespace {

SimulationConfig property_config(uint64_t seed) {
    SimulationConfig config;
    config.seed = seed;
    config.max_ticks = 1200;
    config.population_cap = 40;
    config.director.spawn_interval = 2.0;
    return config;
}

} // namespace

TEST_CASE("Property: arbitration matches membership every tick", "[properties]") {
    auto seed = GENERATE(1u, 17u, 4242u, 987654u);

    Simulation sim(property_config(seed));
    REQUIRE(sim.initialize());

    for (int tick = 0; tick < 1200; ++tick) {
        sim.step();

        for (const auto& agent : sim.get_arena().agents()) {
            INFO("Seed " << seed << ", tick " << tick);
            const auto& forces = agent.forces;

            if (agent.is_managed()) {
                REQUIRE(forces.is_managed());
                REQUIRE(forces.local_weight() == ForceArbiter::kDefaultManagedLocalWeight);
            } else {
                REQUIRE(!forces.is_managed());
                REQUIRE(forces.local_weight() == 1.0);
            }

            REQUIRE(forces.weight(ForceSource::Formation) == (agent.formation() ? 1.0 : 0.0));
            REQUIRE(forces.weight(ForceSource::Constellation) == 0.0);
            REQUIRE(forces.weight(ForceSource::Collision) == 1.0);
            REQUIRE(forces.weight(ForceSource::External) == 1.0);

            REQUIRE(forces.last_net_force().is_finite());
            REQUIRE(agent.position.is_finite());
        }
    }
}

TEST_CASE("Property: formation membership stays consistent", "[properties]") {
    auto seed = GENERATE(3u, 99u, 31337u);

    Simulation sim(property_config(seed));
    REQUIRE(sim.initialize());

    uint64_t max_active = 0;
    for (int tick = 0; tick < 1200; ++tick) {
        sim.step();
        INFO("Seed " << seed << ", tick " << tick);

        const auto* director = sim.get_director();
        REQUIRE(director != nullptr);
        REQUIRE(director->active_count() <= director->config().max_formations);
        max_active = std::max<uint64_t>(max_active, director->active_count());

        std::unordered_map<AgentId, int, IdHash> claims;
        for (const auto& formation : director->formations()) {
            if (!formation.active) continue;
            for (const auto& member : formation.members) {
                ++claims[member.agent_id];
            }
        }
        for (const auto& [id, count] : claims) {
            REQUIRE(count == 1);
        }

        // Every marker points at a live formation
        for (const auto& agent : sim.get_arena().agents()) {
            if (auto marker = agent.formation()) {
                auto formation = director->find(marker->formation_id);
                REQUIRE(formation != nullptr);
                REQUIRE(formation->active);
            }
        }
    }

    REQUIRE(max_active > 0);
}

TEST_CASE("Property: population never exceeds the cap", "[properties]") {
    auto seed = GENERATE(5u, 2024u);

    auto config = property_config(seed);
    config.population_cap = 12;
    Simulation sim(config);
    REQUIRE(sim.initialize());

    for (int tick = 0; tick < 900; ++tick) {
        sim.step();
        REQUIRE(sim.get_arena().alive_count() <= 12);
    }

    auto metrics = sim.get_metrics();
    REQUIRE(metrics.formations_spawned + metrics.empty_spawns + metrics.spawns_suppressed > 0);
}
