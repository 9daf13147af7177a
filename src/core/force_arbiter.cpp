#include "phalanx/core/force_arbiter.hpp"
#include <spdlog/spdlog.h>

namespace phalanx::core {

namespace {

constexpr std::array<std::string_view, kForceSourceCount> kSourceNames = {
    "local", "formation", "constellation", "collision", "external"
};

} // namespace

std::string_view to_string(ForceSource source) noexcept {
    auto i = static_cast<std::size_t>(source);
    return i < kSourceNames.size() ? kSourceNames[i] : std::string_view{"unknown"};
}

std::optional<ForceSource> parse_force_source(std::string_view name) noexcept {
    for (std::size_t i = 0; i < kSourceNames.size(); ++i) {
        if (kSourceNames[i] == name) {
            return static_cast<ForceSource>(i);
        }
    }
    return std::nullopt;
}

ForceArbiter::ForceArbiter(double managed_local_weight)
    : managed_local_weight_(managed_local_weight) {
    if (!(managed_local_weight_ > 0.0 && managed_local_weight_ < 1.0)) {
        spdlog::warn("Managed local weight {} outside (0, 1), using {}",
                     managed_local_weight, kDefaultManagedLocalWeight);
        managed_local_weight_ = kDefaultManagedLocalWeight;
    }
}

bool ForceArbiter::add_force(ForceSource source, double fx, double fy) {
    if (index(source) >= kForceSourceCount) {
        spdlog::debug("Rejected force from unknown source #{}", index(source));
        return false;
    }

    if (!std::isfinite(fx) || !std::isfinite(fy)) {
        spdlog::debug("Rejected non-finite force from {}: fx={}, fy={}", to_string(source), fx, fy);
        return false;
    }

    forces_[index(source)] += Vec2{fx, fy};
    return true;
}

bool ForceArbiter::add_force(std::string_view source, double fx, double fy) {
    auto parsed = parse_force_source(source);
    if (!parsed) {
        spdlog::debug("Rejected force from unknown source '{}'", source);
        return false;
    }
    return add_force(*parsed, fx, fy);
}

bool ForceArbiter::update_weights(const MembershipFlags& membership) {
    weights_[index(ForceSource::Formation)] = membership.in_formation ? 1.0 : 0.0;
    weights_[index(ForceSource::Constellation)] =
        (membership.in_constellation && !membership.in_formation) ? 1.0 : 0.0;

    if (membership.in_formation && membership.in_constellation) {
        spdlog::warn("Agent reported in both a formation and a constellation; formation wins");
        weights_[index(ForceSource::Constellation)] = 0.0;
        return true;
    }
    return false;
}

double ForceArbiter::effective_weight(ForceSource source) const noexcept {
    switch (source) {
        case ForceSource::Local:
            return local_weight();
        case ForceSource::Collision:
        case ForceSource::External:
            return 1.0;
        default:
            return weights_[index(source)];
    }
}

Vec2 ForceArbiter::compute_net_force() {
    Vec2 net;
    for (auto source : kAllForceSources) {
        net += forces_[index(source)] * effective_weight(source);
    }
    net_force_ = net;

    if (debug_enabled_) {
        record_frame();
    }

    return net;
}

void ForceArbiter::reset() noexcept {
    forces_.fill(Vec2{});
    net_force_ = Vec2{};
}

ForceBreakdown ForceArbiter::summary() const {
    ForceBreakdown breakdown;
    breakdown.net_force = net_force_;
    breakdown.is_managed = is_managed();

    for (auto source : kAllForceSources) {
        auto& entry = breakdown.sources[index(source)];
        entry.force = forces_[index(source)];
        entry.weight = effective_weight(source);
        entry.active = entry.weight > 0.0;
    }
    return breakdown;
}

void ForceArbiter::enable_debug() {
    debug_enabled_ = true;
    history_.clear();
}

void ForceArbiter::disable_debug() {
    debug_enabled_ = false;
    history_.clear();
}

void ForceArbiter::record_frame() {
    ForceFrame frame;
    frame.timestamp = std::chrono::steady_clock::now();
    frame.forces = forces_;
    frame.net_force = net_force_;

    history_.push_back(frame);
    while (history_.size() > kMaxHistoryFrames) {
        history_.pop_front();
    }
}

} // namespace phalanx::core
