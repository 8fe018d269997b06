#ifndef MICROWELD_EVENTS_H
#define MICROWELD_EVENTS_H

#include "microweld/geometry.h"
#include <string>
#include <variant>
#include <vector>

namespace microweld {
namespace core {

struct PathStart {
    std::string id;
    OperationClass operationClass = OperationClass::NORMAL;
    std::string pauseMessage;
};

struct PointAdded {
    double x = 0.0;
    double y = 0.0;
    OperationClass operationClass = OperationClass::NORMAL;
    int pass = 0;
};

struct PathComplete {
    std::string id;
};

/**
 * One entry of the point stream. For every path the stream reads
 * PathStart, PointAdded*, PathComplete.
 */
using PathEvent = std::variant<PathStart, PointAdded, PathComplete>;

enum class EventKind : unsigned {
    PATH_START = 1u << 0,
    POINT_ADDED = 1u << 1,
    PATH_COMPLETE = 1u << 2
};

// Bit set of EventKind values
using EventMask = unsigned;

const EventMask kAllEvents = static_cast<EventMask>(EventKind::PATH_START) |
                             static_cast<EventMask>(EventKind::POINT_ADDED) |
                             static_cast<EventMask>(EventKind::PATH_COMPLETE);

EventKind kindOf(const PathEvent& event);

std::string eventKindToString(EventKind kind);

inline bool maskContains(EventMask mask, EventKind kind) {
    return (mask & static_cast<EventMask>(kind)) != 0;
}

/**
 * Consumer of the point stream
 */
class EventSubscriber {
public:
    virtual ~EventSubscriber() = default;

    // Event kinds this subscriber wants delivered
    virtual EventMask subscribedEvents() const = 0;

    virtual void handle(const PathEvent& event) = 0;
};

/**
 * Checks that events arrive as PathStart, PointAdded*, PathComplete.
 * Violations throw SequenceError.
 */
class SequenceTracker {
public:
    void accept(const PathEvent& event);

    bool inPath() const { return m_inPath; }
    const std::string& openPathId() const { return m_openPathId; }

    void reset();

private:
    bool m_inPath = false;
    std::string m_openPathId;
};

/**
 * Fans events out to the subscribers registered for one run, in
 * registration order.
 */
class EventPublisher {
public:
    // The publisher does not own subscribers; they must outlive it
    void subscribe(EventSubscriber& subscriber);

    void publish(const PathEvent& event);

    size_t subscriberCount() const { return m_subscribers.size(); }

private:
    std::vector<EventSubscriber*> m_subscribers;
};

/**
 * Converts paths into their event sequence. Path ids must already be unique.
 */
std::vector<PathEvent> pathToEvents(const Path& path);

} // namespace core
} // namespace microweld

#endif // MICROWELD_EVENTS_H
