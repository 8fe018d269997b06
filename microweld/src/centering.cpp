#include "microweld/centering.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace microweld {
namespace core {

CenteringOffset Centering::calculateOffset(const BoundingBox &bounds,
                                           double surfaceWidth,
                                           double surfaceHeight) {
  if (!bounds.hasBounds) {
    return CenteringOffset(0.0, 0.0);
  }

  Point2D patternCenter = bounds.center();
  CenteringOffset offset(surfaceWidth / 2.0 - patternCenter.x,
                         surfaceHeight / 2.0 - patternCenter.y);

  // Advisory only: the offset is returned either way
  if (bounds.width() > surfaceWidth || bounds.height() > surfaceHeight) {
    std::cerr << "Warning: Pattern (" << bounds.width() << " x "
              << bounds.height() << " mm) is larger than the work surface ("
              << surfaceWidth << " x " << surfaceHeight << " mm)" << std::endl;
  } else if (!fitsSurface(applyOffset(bounds, offset), surfaceWidth,
                          surfaceHeight)) {
    std::cerr << "Warning: Centered pattern exceeds the work surface bounds"
              << std::endl;
  }

  return offset;
}

BoundingBox Centering::applyOffset(const BoundingBox &bounds,
                                   const CenteringOffset &offset) {
  BoundingBox moved = bounds;
  if (!bounds.hasBounds) return moved;

  moved.minX += offset.dx;
  moved.maxX += offset.dx;
  moved.minY += offset.dy;
  moved.maxY += offset.dy;
  return moved;
}

bool Centering::fitsSurface(const BoundingBox &bounds, double surfaceWidth,
                            double surfaceHeight) {
  if (!bounds.hasBounds) return true;

  return bounds.minX >= 0.0 && bounds.maxX <= surfaceWidth &&
         bounds.minY >= 0.0 && bounds.maxY <= surfaceHeight;
}

BoundingBox Centering::getBounds(const std::vector<Path> &paths) {
  BoundingBox box;

  for (const auto &path : paths) {
    for (const auto &point : path.getPoints()) {
      const Point2D &p = point.position;
      if (!box.hasBounds) {
        box.minX = box.maxX = p.x;
        box.minY = box.maxY = p.y;
        box.hasBounds = true;
        continue;
      }
      box.minX = std::min(box.minX, p.x);
      box.minY = std::min(box.minY, p.y);
      box.maxX = std::max(box.maxX, p.x);
      box.maxY = std::max(box.maxY, p.y);
    }
  }

  return box;
}

std::string Centering::formatCenteringInfo(const BoundingBox &bounds,
                                           const CenteringOffset &offset,
                                           double surfaceWidth,
                                           double surfaceHeight) {
  std::stringstream ss;
  ss << std::fixed << std::setprecision(3);

  if (!bounds.hasBounds) {
    ss << "No points, nothing to center";
    return ss.str();
  }

  BoundingBox centered = applyOffset(bounds, offset);

  ss << "Pattern bounds: X(" << bounds.minX << " to " << bounds.maxX << "), Y("
     << bounds.minY << " to " << bounds.maxY << ")" << std::endl;
  ss << "Pattern size: " << bounds.width() << " x " << bounds.height() << " mm"
     << std::endl;
  ss << "Surface: " << surfaceWidth << " x " << surfaceHeight << " mm"
     << std::endl;
  ss << "Centering offset: (" << std::showpos << offset.dx << ", " << offset.dy
     << std::noshowpos << ")" << std::endl;
  ss << "Centered bounds: X(" << centered.minX << " to " << centered.maxX
     << "), Y(" << centered.minY << " to " << centered.maxY << ")";

  if (!fitsSurface(centered, surfaceWidth, surfaceHeight)) {
    ss << std::endl << "Centered pattern exceeds the work surface";
  }

  return ss.str();
}

}  // namespace core
}  // namespace microweld
