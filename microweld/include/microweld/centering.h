#ifndef MICROWELD_CENTERING_H
#define MICROWELD_CENTERING_H

#include "microweld/geometry.h"
#include <string>
#include <vector>

namespace microweld {
namespace core {

/**
 * Computes where a pattern lands on the work surface
 */
class Centering {
public:
    /**
     * Offset that moves the pattern center onto the surface center
     *
     * @param bounds Bounds of the whole pattern
     * @param surfaceWidth Work surface width (mm)
     * @param surfaceHeight Work surface depth (mm)
     * @return surface center minus pattern center, or (0, 0) without bounds
     */
    static CenteringOffset calculateOffset(const BoundingBox& bounds,
                                           double surfaceWidth,
                                           double surfaceHeight);

    // Translate a box by an offset
    static BoundingBox applyOffset(const BoundingBox& bounds,
                                   const CenteringOffset& offset);

    // Whether the box lies within [0, width] x [0, height]
    static bool fitsSurface(const BoundingBox& bounds,
                            double surfaceWidth, double surfaceHeight);

    // Bounds of a set of paths, hasBounds == false if they contain no points
    static BoundingBox getBounds(const std::vector<Path>& paths);

    /**
     * Format bounds and offset into a human-readable summary
     */
    static std::string formatCenteringInfo(const BoundingBox& bounds,
                                           const CenteringOffset& offset,
                                           double surfaceWidth,
                                           double surfaceHeight);
};

} // namespace core
} // namespace microweld

#endif // MICROWELD_CENTERING_H
