#ifndef MICROWELD_SVG_LOADER_H
#define MICROWELD_SVG_LOADER_H

#include "microweld/geometry.h"
#include "microweld/vectorizer.h"
#include <cstdint>
#include <string>
#include <vector>

// Forward declarations for NanoSVG types
struct NSVGimage;
struct NSVGshape;

namespace microweld {
namespace core {

/**
 * Structure to hold SVG shape information
 */
struct SVGShapeInfo {
    std::string id;
    uint32_t strokeColor;   // 0xRRGGBB
    bool hasStroke;
    OperationClass operationClass;
    int pathCount;
};

/**
 * Reads weld paths from an SVG file. Every visible sub-path becomes one
 * weld path; its stroke colour (fill when there is no stroke) selects the
 * operation class.
 */
class SVGLoader {
public:
    SVGLoader();
    ~SVGLoader();

    SVGLoader(const SVGLoader&) = delete;
    SVGLoader& operator=(const SVGLoader&) = delete;

    // Parse an SVG file and load it into memory
    bool loadFromFile(const std::string& filename, const std::string& units = "mm", float dpi = 96.0f);

    // Get the dimensions of the loaded SVG
    bool getDimensions(float& width, float& height) const;

    // Get all shape information from the loaded SVG
    std::vector<SVGShapeInfo> getShapeInfo() const;

    int getShapeCount() const;

    /**
     * Vectorize every visible shape
     * @param vectorizer Spacing used for the curves
     * @return One path per sub-path, in document order
     */
    std::vector<Path> toPaths(const Vectorizer& vectorizer) const;

    // Free the memory used by the SVG image
    void freeImage();

private:
    NSVGimage* m_image;

    SVGShapeInfo extractShapeInfo(NSVGshape* shape) const;
};

} // namespace core
} // namespace microweld

#endif // MICROWELD_SVG_LOADER_H
