#include "phalanx/adapters/event_log_sink.hpp"

namespace phalanx::adapters {

void EventLogSink::on_formation_formed(const phalanx::ports::FormationFormedEvent& event) {
    ++formed_count_;
    spdlog::debug("formation-formed id={} pattern={} center=({:.1f}, {:.1f}) members={}",
                  boost::uuids::to_string(event.formation_id), event.pattern_id,
                  event.center.x, event.center.y, event.members.size());

    formed_.push_back(event);
    if (formed_.size() > history_limit_) {
        formed_.pop_front();
    }
}

void EventLogSink::on_formation_broken(const phalanx::ports::FormationBrokenEvent& event) {
    ++broken_count_;
    spdlog::debug("formation-broken id={} reason={} center=({:.1f}, {:.1f}) members={}",
                  boost::uuids::to_string(event.formation_id), core::to_string(event.reason),
                  event.center.x, event.center.y, event.members.size());

    broken_.push_back(event);
    if (broken_.size() > history_limit_) {
        broken_.pop_front();
    }
}

void EventLogSink::clear() {
    formed_count_ = 0;
    broken_count_ = 0;
    formed_.clear();
    broken_.clear();
}

} // namespace phalanx::adapters
