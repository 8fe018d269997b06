#ifndef MICROWELD_EVENT_LOG_H
#define MICROWELD_EVENT_LOG_H

#include "microweld/events.h"
#include <map>
#include <vector>

namespace microweld {
namespace core {

/**
 * Recording statistics for one event log
 */
struct EventLogStatistics {
    size_t totalEvents = 0;
    std::map<EventKind, size_t> eventsByKind;
};

/**
 * Ordered in-memory record of the point stream. Recorded once in the first
 * pass and replayed any number of times afterwards.
 *
 * Recording validates the event order; recording while a replay is running
 * is rejected.
 */
class EventLog : public EventSubscriber {
public:
    EventLog();
    ~EventLog() override;

    /**
     * Append an event to the log
     * @param event The event to append
     * @throws SequenceError if the event breaks path ordering or a replay is running
     */
    void record(const PathEvent& event);

    /**
     * Deliver every recorded event, in order, to each consumer whose
     * subscription includes the event kind
     * @param consumers Consumers to deliver to (not owned)
     */
    void replay(const std::vector<EventSubscriber*>& consumers) const;

    void clear();

    size_t size() const { return m_events.size(); }
    bool empty() const { return m_events.empty(); }

    const std::vector<PathEvent>& events() const { return m_events; }

    // True when the last recorded path has been completed
    bool isBalanced() const { return !m_tracker.inPath(); }

    EventLogStatistics statistics() const;

    // EventSubscriber: records everything it is handed
    EventMask subscribedEvents() const override { return kAllEvents; }
    void handle(const PathEvent& event) override { record(event); }

private:
    std::vector<PathEvent> m_events;
    SequenceTracker m_tracker;
    mutable bool m_replaying = false;
};

/**
 * Forwards events to another consumer, translating every PointAdded by a
 * fixed offset
 */
class OffsetSubscriber : public EventSubscriber {
public:
    OffsetSubscriber(EventSubscriber& target, const CenteringOffset& offset);

    EventMask subscribedEvents() const override;
    void handle(const PathEvent& event) override;

private:
    EventSubscriber& m_target;
    CenteringOffset m_offset;
};

} // namespace core
} // namespace microweld

#endif // MICROWELD_EVENT_LOG_H
