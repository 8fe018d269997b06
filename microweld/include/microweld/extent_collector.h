#ifndef MICROWELD_EXTENT_COLLECTOR_H
#define MICROWELD_EXTENT_COLLECTOR_H

#include "microweld/events.h"

namespace microweld {
namespace core {

/**
 * First-pass consumer folding every PointAdded into a bounding box.
 * Coordinates are taken as they come; NaN and infinity are not filtered.
 */
class ExtentCollector : public EventSubscriber {
public:
    ExtentCollector();

    EventMask subscribedEvents() const override;
    void handle(const PathEvent& event) override;

    /**
     * Current bounds. Safe to call any number of times; returns a zero box
     * with hasBounds == false when no point was observed.
     */
    BoundingBox finalize() const;

    size_t pointCount() const { return m_pointCount; }

    void reset();

private:
    double m_minX;
    double m_minY;
    double m_maxX;
    double m_maxY;
    size_t m_pointCount;
};

} // namespace core
} // namespace microweld

#endif // MICROWELD_EXTENT_COLLECTOR_H
