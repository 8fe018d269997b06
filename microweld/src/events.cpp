#include "microweld/events.h"
#include "microweld/errors.h"

namespace microweld {
namespace core {

namespace {

struct KindVisitor {
    EventKind operator()(const PathStart&) const { return EventKind::PATH_START; }
    EventKind operator()(const PointAdded&) const { return EventKind::POINT_ADDED; }
    EventKind operator()(const PathComplete&) const { return EventKind::PATH_COMPLETE; }
};

struct SequenceVisitor {
    bool& inPath;
    std::string& openPathId;

    void operator()(const PathStart& e) const {
        if (inPath) {
            throw SequenceError("PathStart for '" + e.id + "' while path '" +
                                openPathId + "' is still open");
        }
        inPath = true;
        openPathId = e.id;
    }

    void operator()(const PointAdded& e) const {
        if (!inPath) {
            throw SequenceError("PointAdded (" + std::to_string(e.x) + ", " +
                                std::to_string(e.y) + ") outside of an open path");
        }
    }

    void operator()(const PathComplete& e) const {
        if (!inPath) {
            throw SequenceError("PathComplete for '" + e.id + "' without a matching PathStart");
        }
        if (e.id != openPathId) {
            throw SequenceError("PathComplete for '" + e.id + "' while path '" +
                                openPathId + "' is open");
        }
        inPath = false;
        openPathId.clear();
    }
};

} // namespace

EventKind kindOf(const PathEvent& event) {
    return std::visit(KindVisitor{}, event);
}

std::string eventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::PATH_START:    return "path_start";
        case EventKind::POINT_ADDED:   return "point_added";
        case EventKind::PATH_COMPLETE: return "path_complete";
    }
    return "unknown";
}

void SequenceTracker::accept(const PathEvent& event) {
    std::visit(SequenceVisitor{m_inPath, m_openPathId}, event);
}

void SequenceTracker::reset() {
    m_inPath = false;
    m_openPathId.clear();
}

void EventPublisher::subscribe(EventSubscriber& subscriber) {
    m_subscribers.push_back(&subscriber);
}

void EventPublisher::publish(const PathEvent& event) {
    EventKind kind = kindOf(event);
    for (EventSubscriber* subscriber : m_subscribers) {
        if (maskContains(subscriber->subscribedEvents(), kind)) {
            subscriber->handle(event);
        }
    }
}

std::vector<PathEvent> pathToEvents(const Path& path) {
    std::vector<PathEvent> events;
    events.reserve(path.size() + 2);

    events.emplace_back(PathStart{path.getId(), path.getOperationClass(), path.getPauseMessage()});
    for (size_t i = 0; i < path.size(); i++) {
        const WeldPoint& point = path.getPoint(i);
        events.emplace_back(PointAdded{point.position.x, point.position.y, path.classOf(i), point.pass});
    }
    events.emplace_back(PathComplete{path.getId()});

    return events;
}

} // namespace core
} // namespace microweld
