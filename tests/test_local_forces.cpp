#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "phalanx/core/local_forces.hpp"
#include "phalanx/core/steering.hpp"

using namespace phalanx::core;
using Catch::Matchers::WithinAbs;

namespace {

Agent make_agent(const Vec2& position) {
    static boost::uuids::random_generator gen;
    Agent agent;
    agent.id = gen();
    agent.position = position;
    return agent;
}

} // namespace

TEST_CASE("Local force producer", "[local_forces]") {
    LocalForceProducer producer;
    const double dt = 1.0 / 60.0;

    SECTION("Overlapping agents push apart") {
        std::vector<Agent> agents{make_agent({0.0, 0.0}), make_agent({10.0, 0.0})};
        producer.rebuild_grid(agents);

        auto a = producer.compute(agents[0], agents, dt);
        auto b = producer.compute(agents[1], agents, dt);

        REQUIRE(a.collision.x < 0.0);
        REQUIRE(b.collision.x > 0.0);
        REQUIRE_THAT(a.collision.y, WithinAbs(0.0, 1e-12));
        REQUIRE(a.local.x < 0.0);
        REQUIRE(b.local.x > 0.0);
    }

    SECTION("Distant agents do not interact") {
        std::vector<Agent> agents{make_agent({0.0, 0.0}), make_agent({500.0, 500.0})};
        producer.rebuild_grid(agents);

        auto forces = producer.compute(agents[0], agents, dt);
        REQUIRE(forces.local == Vec2{});
        REQUIRE(forces.collision == Vec2{});
    }

    SECTION("Dead agents are ignored") {
        std::vector<Agent> agents{make_agent({0.0, 0.0}), make_agent({10.0, 0.0})};
        agents[1].is_dead = true;
        producer.rebuild_grid(agents);

        auto forces = producer.compute(agents[0], agents, dt);
        REQUIRE(forces.local == Vec2{});
        REQUIRE(forces.collision == Vec2{});
    }

    SECTION("Same group members collide softly") {
        boost::uuids::random_generator gen;
        const auto formation_id = gen();

        std::vector<Agent> strangers{make_agent({0.0, 0.0}), make_agent({10.0, 0.0})};
        std::vector<Agent> squad = strangers;
        assign_formation(squad[0], {formation_id, 0, false});
        assign_formation(squad[1], {formation_id, 1, false});

        producer.rebuild_grid(strangers);
        auto apart = producer.compute(strangers[0], strangers, dt);
        producer.rebuild_grid(squad);
        auto together = producer.compute(squad[0], squad, dt);

        REQUIRE(together.collision.length() < apart.collision.length());
        REQUIRE_THAT(together.collision.length() / apart.collision.length(),
                     WithinAbs(200.0 / 500.0, 1e-9));
        REQUIRE(together.local.length() < apart.local.length());
    }

    SECTION("Managed agents get no flocking") {
        // Inside the neighbor radius, outside the separation radius
        std::vector<Agent> agents{make_agent({0.0, 0.0}), make_agent({50.0, 0.0})};
        agents[1].velocity = {0.0, 30.0};
        producer.rebuild_grid(agents);

        auto unmanaged = producer.compute(agents[0], agents, dt);
        REQUIRE(unmanaged.local.x > 0.0);
        REQUIRE(unmanaged.local.y > 0.0);

        boost::uuids::random_generator gen;
        assign_formation(agents[0], {gen(), 0, false});
        auto managed = producer.compute(agents[0], agents, dt);
        REQUIRE(managed.local == Vec2{});
    }

    SECTION("Apply deposits into the arbiters") {
        std::vector<Agent> agents{make_agent({0.0, 0.0}), make_agent({10.0, 0.0})};
        REQUIRE(producer.apply(agents, dt) == 0);

        REQUIRE(agents[0].forces.force(ForceSource::Local).x < 0.0);
        REQUIRE(agents[0].forces.force(ForceSource::Collision).x < 0.0);
        REQUIRE(agents[1].forces.force(ForceSource::Collision).x > 0.0);
        REQUIRE(agents[0].forces.force(ForceSource::Formation) == Vec2{});
    }
}

TEST_CASE("Steering helpers", "[local_forces]") {
    SECTION("Slot pursuit is proportional and clamped") {
        auto short_gap = pursue_slot({0.0, 0.0}, {10.0, 0.0}, 4.0, 400.0);
        REQUIRE_THAT(short_gap.x, WithinAbs(40.0, 1e-12));

        auto long_gap = pursue_slot({0.0, 0.0}, {0.0, 1000.0}, 4.0, 400.0);
        REQUIRE_THAT(long_gap.length(), WithinAbs(400.0, 1e-9));
        REQUIRE(long_gap.y > 0.0);

        REQUIRE(pursue_slot({5.0, 5.0}, {5.0, 5.0}, 4.0, 400.0) == Vec2{});
    }

    SECTION("Seek has constant strength") {
        auto pull = seek({0.0, 0.0}, {300.0, 400.0}, 120.0);
        REQUIRE_THAT(pull.length(), WithinAbs(120.0, 1e-9));
        REQUIRE(seek({1.0, 1.0}, {1.0, 1.0}, 120.0) == Vec2{});
    }

    SECTION("Proximity ratio") {
        REQUIRE(proximity_ratio(300.0, 100.0) == 0.0);
        REQUIRE(proximity_ratio(200.0, 100.0) == 0.0);
        REQUIRE_THAT(proximity_ratio(150.0, 100.0), WithinAbs(0.5, 1e-12));
        REQUIRE(proximity_ratio(100.0, 100.0) == 1.0);
        REQUIRE(proximity_ratio(10.0, 100.0) == 1.0);
        REQUIRE(proximity_ratio(10.0, 0.0) == 0.0);
    }
}
