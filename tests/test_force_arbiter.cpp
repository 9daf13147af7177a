#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "phalanx/core/force_arbiter.hpp"
#include <limits>

using namespace phalanx::core;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();

} // namespace

TEST_CASE("Force accumulation", "[force_arbiter]") {
    ForceArbiter arbiter;

    SECTION("Contributions to one source add up") {
        REQUIRE(arbiter.add_force(ForceSource::Local, 1.0, 2.0));
        REQUIRE(arbiter.add_force(ForceSource::Local, 3.0, -1.0));
        REQUIRE(arbiter.force(ForceSource::Local) == Vec2{4.0, 1.0});
    }

    SECTION("Non-finite components are rejected") {
        REQUIRE(arbiter.add_force(ForceSource::Local, 5.0, 5.0));
        REQUIRE(!arbiter.add_force(ForceSource::Local, kNaN, 1.0));
        REQUIRE(!arbiter.add_force(ForceSource::Collision, 1.0, kInf));
        REQUIRE(!arbiter.add_force(ForceSource::External, -kInf, kNaN));

        REQUIRE(arbiter.force(ForceSource::Local) == Vec2{5.0, 5.0});
        REQUIRE(arbiter.force(ForceSource::Collision) == Vec2{});
        REQUIRE(arbiter.force(ForceSource::External) == Vec2{});
        REQUIRE(arbiter.compute_net_force().is_finite());
    }

    SECTION("NaN on a named source leaves it untouched") {
        REQUIRE(!arbiter.add_force("local", kNaN, 5.0));
        REQUIRE(arbiter.force(ForceSource::Local) == Vec2{});
    }

    SECTION("Sources by name") {
        REQUIRE(arbiter.add_force("formation", 2.0, 0.0));
        REQUIRE(arbiter.force(ForceSource::Formation) == Vec2{2.0, 0.0});

        REQUIRE(!arbiter.add_force("gravity", 1.0, 1.0));
        REQUIRE(!arbiter.add_force("", 1.0, 1.0));
        for (auto source : kAllForceSources) {
            if (source != ForceSource::Formation) {
                REQUIRE(arbiter.force(source) == Vec2{});
            }
        }
    }

    SECTION("Source names round-trip") {
        for (auto source : kAllForceSources) {
            auto parsed = parse_force_source(to_string(source));
            REQUIRE(parsed.has_value());
            REQUIRE(*parsed == source);
        }
        REQUIRE(!parse_force_source("Local").has_value());
    }

    SECTION("Reset clears forces and net, keeps weights") {
        arbiter.update_weights({true, false});
        arbiter.add_force(ForceSource::Formation, 10.0, 0.0);
        arbiter.compute_net_force();

        arbiter.reset();
        for (auto source : kAllForceSources) {
            REQUIRE(arbiter.force(source) == Vec2{});
        }
        REQUIRE(arbiter.last_net_force() == Vec2{});
        REQUIRE(arbiter.weight(ForceSource::Formation) == 1.0);
    }
}

TEST_CASE("Weight arbitration", "[force_arbiter]") {
    ForceArbiter arbiter;

    SECTION("Unmanaged agents use local forces at full weight") {
        arbiter.update_weights({false, false});
        REQUIRE(!arbiter.is_managed());
        REQUIRE(arbiter.local_weight() == 1.0);
        REQUIRE(arbiter.weight(ForceSource::Formation) == 0.0);
        REQUIRE(arbiter.weight(ForceSource::Constellation) == 0.0);

        arbiter.add_force(ForceSource::Local, 10.0, 0.0);
        arbiter.add_force(ForceSource::Formation, 0.0, 50.0);
        auto net = arbiter.compute_net_force();
        REQUIRE_THAT(net.x, WithinAbs(10.0, 1e-12));
        REQUIRE_THAT(net.y, WithinAbs(0.0, 1e-12));
    }

    SECTION("Formation members keep local forces at the managed floor") {
        arbiter.update_weights({true, false});
        REQUIRE(arbiter.is_managed());
        REQUIRE_THAT(arbiter.local_weight(), WithinRel(0.8, 1e-12));
        REQUIRE(arbiter.weight(ForceSource::Formation) == 1.0);
        REQUIRE(arbiter.weight(ForceSource::Constellation) == 0.0);

        arbiter.add_force(ForceSource::Local, 10.0, 0.0);
        arbiter.add_force(ForceSource::Formation, 0.0, 20.0);
        arbiter.add_force(ForceSource::Constellation, 100.0, 100.0);
        auto net = arbiter.compute_net_force();
        REQUIRE_THAT(net.x, WithinRel(8.0, 1e-12));
        REQUIRE_THAT(net.y, WithinRel(20.0, 1e-12));
    }

    SECTION("Managed agents scale a lone local force by the floor") {
        arbiter.update_weights({false, true});
        arbiter.add_force(ForceSource::Local, 30.0, -40.0);
        auto net = arbiter.compute_net_force();
        REQUIRE_THAT(net.length(), WithinRel(50.0 * 0.8, 1e-12));
    }

    SECTION("Constellation members") {
        arbiter.update_weights({false, true});
        REQUIRE(arbiter.is_managed());
        REQUIRE_THAT(arbiter.local_weight(), WithinRel(0.8, 1e-12));
        REQUIRE(arbiter.weight(ForceSource::Formation) == 0.0);
        REQUIRE(arbiter.weight(ForceSource::Constellation) == 1.0);
    }

    SECTION("Formation wins when both memberships are reported") {
        REQUIRE(arbiter.update_weights({true, true}));
        REQUIRE(arbiter.weight(ForceSource::Formation) == 1.0);
        REQUIRE(arbiter.weight(ForceSource::Constellation) == 0.0);

        REQUIRE(!arbiter.update_weights({true, false}));
        REQUIRE(!arbiter.update_weights({false, false}));
    }

    SECTION("Updating weights is idempotent") {
        arbiter.update_weights({false, true});
        arbiter.update_weights({false, true});
        REQUIRE(arbiter.weight(ForceSource::Constellation) == 1.0);
        REQUIRE(arbiter.weight(ForceSource::Formation) == 0.0);

        arbiter.add_force(ForceSource::Constellation, 3.0, 4.0);
        auto first = arbiter.compute_net_force();
        auto second = arbiter.compute_net_force();
        REQUIRE(first == second);
    }

    SECTION("Leaving a structure restores full local weight") {
        arbiter.update_weights({true, false});
        arbiter.update_weights({false, false});
        REQUIRE(arbiter.local_weight() == 1.0);
        REQUIRE(!arbiter.is_managed());
    }

    SECTION("Safety forces are never suppressed") {
        for (MembershipFlags flags : {MembershipFlags{false, false}, MembershipFlags{true, false},
                                      MembershipFlags{false, true}, MembershipFlags{true, true}}) {
            arbiter.reset();
            arbiter.update_weights(flags);
            arbiter.add_force(ForceSource::Collision, 7.0, 0.0);
            arbiter.add_force(ForceSource::External, 0.0, -3.0);

            auto net = arbiter.compute_net_force();
            REQUIRE_THAT(net.x, WithinAbs(7.0, 1e-12));
            REQUIRE_THAT(net.y, WithinAbs(-3.0, 1e-12));
        }
    }
}

TEST_CASE("Managed local weight configuration", "[force_arbiter]") {
    SECTION("Custom floor") {
        ForceArbiter arbiter(0.5);
        arbiter.update_weights({true, false});
        REQUIRE(arbiter.local_weight() == 0.5);
    }

    SECTION("Out of range falls back to the default") {
        for (double bad : {0.0, 1.0, -0.2, 1.5, kNaN}) {
            ForceArbiter arbiter(bad);
            REQUIRE(arbiter.managed_local_weight() == ForceArbiter::kDefaultManagedLocalWeight);
        }
    }
}

TEST_CASE("Force summary", "[force_arbiter]") {
    ForceArbiter arbiter;
    arbiter.update_weights({true, false});
    arbiter.add_force(ForceSource::Local, 1.0, 0.0);
    arbiter.add_force(ForceSource::Formation, 0.0, 2.0);
    auto net = arbiter.compute_net_force();

    auto summary = arbiter.summary();
    REQUIRE(summary.is_managed);
    REQUIRE(summary.net_force == net);
    REQUIRE(summary[ForceSource::Local].force == Vec2{1.0, 0.0});
    REQUIRE_THAT(summary[ForceSource::Local].weight, WithinRel(0.8, 1e-12));
    REQUIRE(summary[ForceSource::Formation].active);
    REQUIRE(!summary[ForceSource::Constellation].active);
    REQUIRE(summary[ForceSource::Collision].weight == 1.0);
    REQUIRE(summary[ForceSource::External].weight == 1.0);
}

TEST_CASE("Debug history", "[force_arbiter]") {
    ForceArbiter arbiter;

    SECTION("Disabled by default") {
        arbiter.compute_net_force();
        REQUIRE(!arbiter.debug_enabled());
        REQUIRE(arbiter.history().empty());
    }

    SECTION("Records one frame per computation, capped") {
        arbiter.enable_debug();
        for (int i = 0; i < 100; ++i) {
            arbiter.reset();
            arbiter.add_force(ForceSource::Local, static_cast<double>(i), 0.0);
            arbiter.compute_net_force();
        }

        REQUIRE(arbiter.history().size() == ForceArbiter::kMaxHistoryFrames);
        REQUIRE(arbiter.history().back().net_force == Vec2{99.0, 0.0});
        REQUIRE(arbiter.history().front().net_force == Vec2{40.0, 0.0});

        arbiter.disable_debug();
        REQUIRE(arbiter.history().empty());
    }
}
