#include "microweld/extent_collector.h"

#include <algorithm>

namespace microweld {
namespace core {

ExtentCollector::ExtentCollector() { reset(); }

EventMask ExtentCollector::subscribedEvents() const {
  return static_cast<EventMask>(EventKind::POINT_ADDED);
}

void ExtentCollector::handle(const PathEvent& event) {
  const PointAdded* point = std::get_if<PointAdded>(&event);
  if (!point) return;

  if (m_pointCount == 0) {
    m_minX = m_maxX = point->x;
    m_minY = m_maxY = point->y;
  } else {
    m_minX = std::min(m_minX, point->x);
    m_minY = std::min(m_minY, point->y);
    m_maxX = std::max(m_maxX, point->x);
    m_maxY = std::max(m_maxY, point->y);
  }
  m_pointCount++;
}

BoundingBox ExtentCollector::finalize() const {
  BoundingBox box;
  if (m_pointCount == 0) {
    return box;
  }

  box.minX = m_minX;
  box.minY = m_minY;
  box.maxX = m_maxX;
  box.maxY = m_maxY;
  box.hasBounds = true;
  return box;
}

void ExtentCollector::reset() {
  m_minX = m_minY = 0.0;
  m_maxX = m_maxY = 0.0;
  m_pointCount = 0;
}

}  // namespace core
}  // namespace microweld
