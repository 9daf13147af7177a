#pragma once

#include "phalanx/core/vec2.hpp"
#include <array>
#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <string_view>

namespace phalanx::core {

enum class ForceSource : std::size_t {
    Local = 0,      // separation, alignment, cohesion from neighbors
    Formation,      // managed structure steering
    Constellation,  // emergent structure spring
    Collision,      // hard overlap separation
    External        // gravity wells, knockback, wind
};

inline constexpr std::size_t kForceSourceCount = 5;

inline constexpr std::array<ForceSource, kForceSourceCount> kAllForceSources = {
    ForceSource::Local,
    ForceSource::Formation,
    ForceSource::Constellation,
    ForceSource::Collision,
    ForceSource::External
};

std::string_view to_string(ForceSource source) noexcept;
std::optional<ForceSource> parse_force_source(std::string_view name) noexcept;

// Group membership as seen by the arbiter. Built from an Agent's tagged
// membership, or reported directly by integrations that track the two
// structures independently.
struct MembershipFlags {
    bool in_formation = false;
    bool in_constellation = false;
};

struct SourceBreakdown {
    Vec2 force;
    double weight = 0.0;
    bool active = false;
};

struct ForceBreakdown {
    Vec2 net_force;
    std::array<SourceBreakdown, kForceSourceCount> sources{};
    bool is_managed = false;

    const SourceBreakdown& operator[](ForceSource source) const noexcept {
        return sources[static_cast<std::size_t>(source)];
    }
};

struct ForceFrame {
    std::chrono::steady_clock::time_point timestamp;
    std::array<Vec2, kForceSourceCount> forces{};
    Vec2 net_force;
};

class ForceArbiter {
public:
    static constexpr double kDefaultManagedLocalWeight = 0.8;
    static constexpr std::size_t kMaxHistoryFrames = 60;

    explicit ForceArbiter(double managed_local_weight = kDefaultManagedLocalWeight);

    // Rejected contributions (unknown source, non-finite component) leave the
    // accumulator untouched and return false.
    bool add_force(ForceSource source, double fx, double fy);
    bool add_force(std::string_view source, double fx, double fy);

    // Returns true if both memberships were reported at once. Formation wins.
    bool update_weights(const MembershipFlags& membership);

    Vec2 compute_net_force();
    void reset() noexcept;

    const Vec2& force(ForceSource source) const noexcept {
        return forces_[index(source)];
    }

    double weight(ForceSource source) const noexcept {
        return weights_[index(source)];
    }

    bool is_managed() const noexcept {
        return weight(ForceSource::Formation) > 0.0 || weight(ForceSource::Constellation) > 0.0;
    }

    double local_weight() const noexcept {
        return is_managed() ? managed_local_weight_ : weights_[index(ForceSource::Local)];
    }

    double managed_local_weight() const noexcept { return managed_local_weight_; }
    const Vec2& last_net_force() const noexcept { return net_force_; }

    ForceBreakdown summary() const;

    void enable_debug();
    void disable_debug();
    bool debug_enabled() const noexcept { return debug_enabled_; }
    const std::deque<ForceFrame>& history() const noexcept { return history_; }

private:
    static constexpr std::size_t index(ForceSource source) noexcept {
        return static_cast<std::size_t>(source);
    }

    double effective_weight(ForceSource source) const noexcept;
    void record_frame();

    std::array<Vec2, kForceSourceCount> forces_{};
    std::array<double, kForceSourceCount> weights_{1.0, 0.0, 0.0, 1.0, 1.0};
    double managed_local_weight_;
    Vec2 net_force_;

    bool debug_enabled_ = false;
    std::deque<ForceFrame> history_;
};

} // namespace phalanx::core
