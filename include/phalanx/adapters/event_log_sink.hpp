#pragma once

#include "phalanx/ports/event_sink.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <deque>

namespace phalanx::adapters {

// Logs formation events and keeps the most recent ones for inspection.
class EventLogSink : public phalanx::ports::IFormationEventSink {
public:
    explicit EventLogSink(std::size_t history_limit = 64) : history_limit_(history_limit) {}
    ~EventLogSink() override = default;

    void on_formation_formed(const phalanx::ports::FormationFormedEvent& event) override;
    void on_formation_broken(const phalanx::ports::FormationBrokenEvent& event) override;

    uint64_t formed_count() const { return formed_count_; }
    uint64_t broken_count() const { return broken_count_; }

    const std::deque<phalanx::ports::FormationFormedEvent>& formed() const { return formed_; }
    const std::deque<phalanx::ports::FormationBrokenEvent>& broken() const { return broken_; }

    void clear();

private:
    std::size_t history_limit_;
    uint64_t formed_count_ = 0;
    uint64_t broken_count_ = 0;
    std::deque<phalanx::ports::FormationFormedEvent> formed_;
    std::deque<phalanx::ports::FormationBrokenEvent> broken_;
};

} // namespace phalanx::adapters
