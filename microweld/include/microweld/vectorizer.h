#ifndef MICROWELD_VECTORIZER_H
#define MICROWELD_VECTORIZER_H

#include "microweld/geometry.h"
#include <optional>
#include <vector>

namespace microweld {
namespace core {

/**
 * Configuration for vectorization
 */
struct VectorizerConfig {
    // Target distance between consecutive weld points (mm)
    double dotSpacing = 2.0;
};

/**
 * Turns geometric primitives into weld points at a target spacing.
 *
 * Standalone primitives (line, arc, circle, bulge arc) return their start and
 * end points. Path continuations (Bezier curves and elliptical arcs) start at
 * the current pen position and do not repeat it. Endpoints are always the
 * exact input coordinates.
 */
class Vectorizer {
public:
    Vectorizer();
    explicit Vectorizer(const VectorizerConfig& config);
    ~Vectorizer();

    /**
     * Set configuration options
     * @param config New configuration; dotSpacing must be positive
     * @throws GeometryError if dotSpacing is not positive
     */
    void setConfig(const VectorizerConfig& config);

    const VectorizerConfig& getConfig() const;

    double dotSpacing() const { return m_config.dotSpacing; }

    /**
     * Vectorize a straight line. Lines shorter than the spacing collapse to
     * their midpoint; longer lines are split into ceil(length / spacing)
     * equal intervals.
     */
    std::vector<Point2D> line(const Point2D& start, const Point2D& end) const;

    /**
     * Vectorize a circular arc swept counter-clockwise from startAngle to
     * endAngle (degrees)
     * @throws GeometryError if radius is not positive
     */
    std::vector<Point2D> arc(const Point2D& center, double radius,
                             double startAngle, double endAngle) const;

    // Full circle; the last point equals the first
    std::vector<Point2D> circle(const Point2D& center, double radius) const;

    // Quadratic Bezier continuation from p0
    std::vector<Point2D> quadraticBezier(const Point2D& p0, const Point2D& control,
                                         const Point2D& p1) const;

    // Cubic Bezier continuation from p0
    std::vector<Point2D> cubicBezier(const Point2D& p0, const Point2D& control1,
                                     const Point2D& control2, const Point2D& p1) const;

    /**
     * SVG elliptical arc continuation from p0 (the 7-parameter "A" command).
     * Degenerate radii or coincident endpoints fall back to the single
     * point p1.
     */
    std::vector<Point2D> ellipticalArc(const Point2D& p0, double rx, double ry,
                                       double xAxisRotation, bool largeArc, bool sweep,
                                       const Point2D& p1) const;

    /**
     * CAD bulge arc from start to end, bulge = tan(includedAngle / 4).
     * Positive bulges bow to the left of the chord direction. Points are
     * generated directly on the arc so neighbouring polyline segments share
     * exact endpoints.
     */
    std::vector<Point2D> bulgeArc(const Point2D& start, const Point2D& end, double bulge) const;

    /**
     * First control point of a smooth ("S"/"T") curve: the reflection of the
     * previous control point through the current position, or the current
     * position when there is no previous curve segment.
     */
    static Point2D reflectControlPoint(const Point2D& current,
                                       const std::optional<Point2D>& previousControl);

    // Control polygon estimate: (sum of legs + chord) / 2
    static double estimateBezierLength(const std::vector<Point2D>& controlPolygon);

    // Numerical integration of sqrt(rx^2 sin^2 t + ry^2 cos^2 t) over the sweep
    static double ellipticalArcLength(double rx, double ry, double startAngle, double sweepAngle);

private:
    VectorizerConfig m_config;

    Point2D evaluateQuadratic(const Point2D& p0, const Point2D& c,
                              const Point2D& p1, double t) const;

    Point2D evaluateCubic(const Point2D& p0, const Point2D& c1,
                          const Point2D& c2, const Point2D& p1, double t) const;
};

} // namespace core
} // namespace microweld

#endif // MICROWELD_VECTORIZER_H
