#include "microweld/svg_loader.h"
#include "microweld/path_builder.h"
#include "microweld/utils.h"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <iostream>

#define NANOSVG_IMPLEMENTATION
#include <nanosvg.h>

namespace microweld {
namespace core {

namespace {

// NanoSVG stores colours as 0xAABBGGRR
uint32_t toRGB(unsigned int abgr) {
    uint32_t r = abgr & 0xFF;
    uint32_t g = (abgr >> 8) & 0xFF;
    uint32_t b = (abgr >> 16) & 0xFF;
    return (r << 16) | (g << 8) | b;
}

} // namespace

SVGLoader::SVGLoader() : m_image(nullptr) {}

SVGLoader::~SVGLoader() {
    freeImage();
}

bool SVGLoader::loadFromFile(const std::string& filename, const std::string& units, float dpi) {
    // Free any previously loaded image
    freeImage();

    m_image = nsvgParseFromFile(filename.c_str(), units.c_str(), dpi);
    if (!m_image) {
        std::cerr << "Error: Could not parse SVG file: " << filename << std::endl;
        return false;
    }

    return true;
}

bool SVGLoader::getDimensions(float& width, float& height) const {
    if (!m_image) {
        return false;
    }

    width = m_image->width;
    height = m_image->height;

    return true;
}

std::vector<SVGShapeInfo> SVGLoader::getShapeInfo() const {
    std::vector<SVGShapeInfo> shapeInfoList;

    if (!m_image) {
        return shapeInfoList;
    }

    for (NSVGshape* shape = m_image->shapes; shape != nullptr; shape = shape->next) {
        shapeInfoList.push_back(extractShapeInfo(shape));
    }

    return shapeInfoList;
}

int SVGLoader::getShapeCount() const {
    if (!m_image) {
        return 0;
    }

    int count = 0;
    for (NSVGshape* shape = m_image->shapes; shape != nullptr; shape = shape->next) {
        count++;
    }

    return count;
}

std::vector<Path> SVGLoader::toPaths(const Vectorizer& vectorizer) const {
    std::vector<Path> paths;

    if (!m_image) {
        return paths;
    }

    for (NSVGshape* shape = m_image->shapes; shape != nullptr; shape = shape->next) {
        if (!(shape->flags & NSVG_FLAGS_VISIBLE)) {
            continue;
        }

        SVGShapeInfo info = extractShapeInfo(shape);

        for (NSVGpath* svgPath = shape->paths; svgPath != nullptr; svgPath = svgPath->next) {
            if (svgPath->npts < 1) continue;

            PathBuilder builder(vectorizer, info.id, info.operationClass);
            const float* p = svgPath->pts;
            builder.moveTo(Point2D(p[0], p[1]));

            // NanoSVG flattens every command into cubic segments
            for (int i = 0; i < svgPath->npts - 1; i += 3) {
                const float* seg = &svgPath->pts[i * 2];
                builder.cubicTo(Point2D(seg[2], seg[3]),
                                Point2D(seg[4], seg[5]),
                                Point2D(seg[6], seg[7]));
            }

            if (svgPath->closed) {
                builder.close();
            }

            paths.push_back(builder.build());
        }
    }

    return paths;
}

void SVGLoader::freeImage() {
    if (m_image) {
        nsvgDelete(m_image);
        m_image = nullptr;
    }
}

SVGShapeInfo SVGLoader::extractShapeInfo(NSVGshape* shape) const {
    SVGShapeInfo info;

    info.id = shape->id;
    info.hasStroke = shape->stroke.type == NSVG_PAINT_COLOR;

    if (info.hasStroke) {
        info.strokeColor = toRGB(shape->stroke.color);
    } else if (shape->fill.type == NSVG_PAINT_COLOR) {
        info.strokeColor = toRGB(shape->fill.color);
    } else {
        info.strokeColor = 0x000000;
    }
    info.operationClass = Utils::classifyColor(info.strokeColor);

    info.pathCount = 0;
    for (NSVGpath* path = shape->paths; path != nullptr; path = path->next) {
        info.pathCount++;
    }

    return info;
}

} // namespace core
} // namespace microweld
