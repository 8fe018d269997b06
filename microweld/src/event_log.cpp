#include "microweld/event_log.h"
#include "microweld/errors.h"

namespace microweld {
namespace core {

namespace {

// Clears the replay flag however the replay ends
class ReplayGuard {
public:
    explicit ReplayGuard(bool& flag) : m_flag(flag) { m_flag = true; }
    ~ReplayGuard() { m_flag = false; }

    ReplayGuard(const ReplayGuard&) = delete;
    ReplayGuard& operator=(const ReplayGuard&) = delete;

private:
    bool& m_flag;
};

} // namespace

EventLog::EventLog() = default;
EventLog::~EventLog() = default;

void EventLog::record(const PathEvent& event) {
    if (m_replaying) {
        throw SequenceError("Cannot record events while the log is being replayed");
    }

    m_tracker.accept(event);
    m_events.push_back(event);
}

void EventLog::replay(const std::vector<EventSubscriber*>& consumers) const {
    if (m_replaying) {
        throw SequenceError("Event log replay is already in progress");
    }
    ReplayGuard guard(m_replaying);

    for (const PathEvent& event : m_events) {
        EventKind kind = kindOf(event);
        for (EventSubscriber* consumer : consumers) {
            if (consumer && maskContains(consumer->subscribedEvents(), kind)) {
                consumer->handle(event);
            }
        }
    }
}

void EventLog::clear() {
    if (m_replaying) {
        throw SequenceError("Cannot clear the event log during a replay");
    }
    m_events.clear();
    m_tracker.reset();
}

EventLogStatistics EventLog::statistics() const {
    EventLogStatistics stats;
    stats.totalEvents = m_events.size();
    for (const PathEvent& event : m_events) {
        stats.eventsByKind[kindOf(event)]++;
    }
    return stats;
}

OffsetSubscriber::OffsetSubscriber(EventSubscriber& target, const CenteringOffset& offset)
    : m_target(target), m_offset(offset) {}

EventMask OffsetSubscriber::subscribedEvents() const {
    return m_target.subscribedEvents();
}

void OffsetSubscriber::handle(const PathEvent& event) {
    if (const PointAdded* point = std::get_if<PointAdded>(&event)) {
        PointAdded shifted = *point;
        shifted.x += m_offset.dx;
        shifted.y += m_offset.dy;
        m_target.handle(shifted);
        return;
    }
    m_target.handle(event);
}

} // namespace core
} // namespace microweld
