#ifndef MICROWELD_PATH_BUILDER_H
#define MICROWELD_PATH_BUILDER_H

#include "microweld/geometry.h"
#include "microweld/vectorizer.h"
#include <optional>
#include <string>
#include <vector>

namespace microweld {
namespace core {

/**
 * Vertex of a CAD polyline. The bulge describes the segment that starts at
 * this vertex.
 */
struct PolylineVertex {
    Point2D position;
    double bulge = 0.0;

    PolylineVertex() = default;
    PolylineVertex(const Point2D& p, double b = 0.0) : position(p), bulge(b) {}
};

/**
 * Assembles one weld path from drawing commands. Segment boundaries are
 * joined without duplicate points.
 */
class PathBuilder {
public:
    PathBuilder(const Vectorizer& vectorizer, const std::string& id,
                OperationClass opClass = OperationClass::NORMAL);

    PathBuilder& setPauseMessage(const std::string& message);

    // Start a new sub-path at p
    PathBuilder& moveTo(const Point2D& p);

    PathBuilder& lineTo(const Point2D& p);

    PathBuilder& quadTo(const Point2D& control, const Point2D& p);

    PathBuilder& cubicTo(const Point2D& control1, const Point2D& control2, const Point2D& p);

    // "T": control point reflected from the previous quadratic segment
    PathBuilder& smoothQuadTo(const Point2D& p);

    // "S": first control point reflected from the previous cubic segment
    PathBuilder& smoothCubicTo(const Point2D& control2, const Point2D& p);

    PathBuilder& arcTo(double rx, double ry, double xAxisRotation,
                       bool largeArc, bool sweep, const Point2D& p);

    PathBuilder& bulgeTo(const Point2D& p, double bulge);

    /**
     * Append a circular arc given by its center. A line joins the current
     * point to the arc start. Non-positive radii fall back to the center point.
     */
    PathBuilder& arc(const Point2D& center, double radius, double startAngle, double endAngle);

    PathBuilder& circle(const Point2D& center, double radius);

    // Return to the start of the current sub-path
    PathBuilder& close();

    const Point2D& currentPoint() const { return m_current; }

    Path build() const;

    /**
     * Convert a CAD polyline (LWPOLYLINE style) into a path
     * @param vectorizer Spacing source
     * @param id Path identifier
     * @param opClass Operation class for every point
     * @param vertices Polyline vertices with per-segment bulges
     * @param closed Whether the last vertex connects back to the first
     */
    static Path polyline(const Vectorizer& vectorizer, const std::string& id,
                         OperationClass opClass, const std::vector<PolylineVertex>& vertices,
                         bool closed);

private:
    const Vectorizer& m_vectorizer;
    Path m_path;
    Point2D m_current;
    Point2D m_subpathStart;
    bool m_hasCurrent = false;
    std::optional<Point2D> m_lastQuadControl;
    std::optional<Point2D> m_lastCubicControl;

    void append(const Point2D& p);
    void appendAll(const std::vector<Point2D>& points);
    void ensureCurrent();
};

} // namespace core
} // namespace microweld

#endif // MICROWELD_PATH_BUILDER_H
