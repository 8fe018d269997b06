#include "microweld/vectorizer.h"
#include "microweld/errors.h"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace microweld {
namespace core {

namespace {

const double kPi = 3.14159265358979323846;

double toRadians(double degrees) {
    return degrees * kPi / 180.0;
}

// Signed angle from u to v
double angleBetween(double ux, double uy, double vx, double vy) {
    double dot = ux * vx + uy * vy;
    double det = ux * vy - uy * vx;
    return std::atan2(det, dot);
}

} // namespace

Vectorizer::Vectorizer() = default;

Vectorizer::Vectorizer(const VectorizerConfig& config) {
    setConfig(config);
}

Vectorizer::~Vectorizer() = default;

void Vectorizer::setConfig(const VectorizerConfig& config) {
    if (!(config.dotSpacing > 0.0)) {
        throw GeometryError("Dot spacing must be positive, got " +
                            std::to_string(config.dotSpacing));
    }
    m_config = config;
}

const VectorizerConfig& Vectorizer::getConfig() const {
    return m_config;
}

std::vector<Point2D> Vectorizer::line(const Point2D& start, const Point2D& end) const {
    double length = start.distanceTo(end);

    // Short lines become a single dot instead of two overlapping ones
    if (length < m_config.dotSpacing) {
        return { Point2D((start.x + end.x) / 2.0, (start.y + end.y) / 2.0) };
    }

    size_t intervals = static_cast<size_t>(std::ceil(length / m_config.dotSpacing));

    std::vector<Point2D> points;
    points.reserve(intervals + 1);
    points.push_back(start);
    for (size_t i = 1; i < intervals; i++) {
        double t = static_cast<double>(i) / intervals;
        points.push_back(start + (end - start) * t);
    }
    points.push_back(end);

    return points;
}

std::vector<Point2D> Vectorizer::arc(const Point2D& center, double radius,
                                     double startAngle, double endAngle) const {
    if (!(radius > 0.0)) {
        throw GeometryError("Arc radius must be positive, got " + std::to_string(radius));
    }

    // Counter-clockwise sweep in (0, 360]
    double sweep = std::fmod(endAngle - startAngle, 360.0);
    if (sweep <= 0.0) {
        sweep += 360.0;
    }

    double arcLength = radius * toRadians(sweep);
    long segments = std::max(2L, std::lround(arcLength / m_config.dotSpacing));

    std::vector<Point2D> points;
    points.reserve(segments + 1);
    for (long i = 0; i <= segments; i++) {
        double angle = toRadians(startAngle + sweep * i / segments);
        points.emplace_back(center.x + radius * std::cos(angle),
                            center.y + radius * std::sin(angle));
    }

    if (sweep >= 360.0) {
        points.back() = points.front();
    }

    return points;
}

std::vector<Point2D> Vectorizer::circle(const Point2D& center, double radius) const {
    return arc(center, radius, 0.0, 360.0);
}

Point2D Vectorizer::evaluateQuadratic(const Point2D& p0, const Point2D& c,
                                      const Point2D& p1, double t) const {
    double u = 1.0 - t;
    return p0 * (u * u) + c * (2.0 * u * t) + p1 * (t * t);
}

Point2D Vectorizer::evaluateCubic(const Point2D& p0, const Point2D& c1,
                                  const Point2D& c2, const Point2D& p1, double t) const {
    double u = 1.0 - t;
    double uu = u * u;
    double tt = t * t;

    // Cubic bezier formula
    return p0 * (uu * u) + c1 * (3.0 * uu * t) + c2 * (3.0 * u * tt) + p1 * (tt * t);
}

double Vectorizer::estimateBezierLength(const std::vector<Point2D>& controlPolygon) {
    if (controlPolygon.size() < 2) {
        return 0.0;
    }

    double legs = 0.0;
    for (size_t i = 1; i < controlPolygon.size(); i++) {
        legs += controlPolygon[i - 1].distanceTo(controlPolygon[i]);
    }
    double chord = controlPolygon.front().distanceTo(controlPolygon.back());

    return (legs + chord) / 2.0;
}

std::vector<Point2D> Vectorizer::quadraticBezier(const Point2D& p0, const Point2D& control,
                                                 const Point2D& p1) const {
    double estimatedLength = estimateBezierLength({p0, control, p1});
    long segments = std::max(1L, std::lround(estimatedLength / m_config.dotSpacing));

    std::vector<Point2D> points;
    points.reserve(segments);
    for (long i = 1; i < segments; i++) {
        points.push_back(evaluateQuadratic(p0, control, p1, static_cast<double>(i) / segments));
    }
    points.push_back(p1);

    return points;
}

std::vector<Point2D> Vectorizer::cubicBezier(const Point2D& p0, const Point2D& control1,
                                             const Point2D& control2, const Point2D& p1) const {
    double estimatedLength = estimateBezierLength({p0, control1, control2, p1});
    long segments = std::max(1L, std::lround(estimatedLength / m_config.dotSpacing));

    std::vector<Point2D> points;
    points.reserve(segments);
    for (long i = 1; i < segments; i++) {
        points.push_back(evaluateCubic(p0, control1, control2, p1,
                                       static_cast<double>(i) / segments));
    }
    points.push_back(p1);

    return points;
}

Point2D Vectorizer::reflectControlPoint(const Point2D& current,
                                        const std::optional<Point2D>& previousControl) {
    if (!previousControl) {
        return current;
    }
    return current * 2.0 - *previousControl;
}

double Vectorizer::ellipticalArcLength(double rx, double ry, double startAngle, double sweepAngle) {
    if (rx == ry) {
        return rx * std::fabs(sweepAngle);
    }

    int samples = std::max(10, static_cast<int>(std::fabs(sweepAngle) * 20));
    double dt = sweepAngle / samples;

    // Midpoint rule over the swept parameter range
    double length = 0.0;
    for (int i = 0; i < samples; i++) {
        double t = startAngle + (i + 0.5) * dt;
        double s = std::sin(t);
        double c = std::cos(t);
        length += std::sqrt(rx * rx * s * s + ry * ry * c * c) * std::fabs(dt);
    }

    return length;
}

std::vector<Point2D> Vectorizer::ellipticalArc(const Point2D& p0, double rx, double ry,
                                               double xAxisRotation, bool largeArc, bool sweep,
                                               const Point2D& p1) const {
    if (rx == 0.0 || ry == 0.0 || p0 == p1) {
        return { p1 };
    }

    rx = std::fabs(rx);
    ry = std::fabs(ry);

    double phi = toRadians(xAxisRotation);
    double cosPhi = std::cos(phi);
    double sinPhi = std::sin(phi);

    // Midpoint of the chord in the ellipse's own frame
    double dx = (p0.x - p1.x) / 2.0;
    double dy = (p0.y - p1.y) / 2.0;
    double x1p = cosPhi * dx + sinPhi * dy;
    double y1p = -sinPhi * dx + cosPhi * dy;

    // Scale radii up when they cannot reach the endpoint
    double lambda = (x1p * x1p) / (rx * rx) + (y1p * y1p) / (ry * ry);
    if (lambda > 1.0) {
        double scale = std::sqrt(lambda);
        rx *= scale;
        ry *= scale;
    }

    double numerator = rx * rx * ry * ry - rx * rx * y1p * y1p - ry * ry * x1p * x1p;
    double denominator = rx * rx * y1p * y1p + ry * ry * x1p * x1p;
    if (denominator <= 0.0) {
        std::cerr << "Warning: Elliptical arc could not be parameterized, using a straight segment" << std::endl;
        return { p1 };
    }

    double sign = (largeArc == sweep) ? -1.0 : 1.0;
    double coefficient = sign * std::sqrt(std::max(0.0, numerator) / denominator);

    double cxp = coefficient * rx * y1p / ry;
    double cyp = -coefficient * ry * x1p / rx;

    double cx = cosPhi * cxp - sinPhi * cyp + (p0.x + p1.x) / 2.0;
    double cy = sinPhi * cxp + cosPhi * cyp + (p0.y + p1.y) / 2.0;

    double ux = (x1p - cxp) / rx;
    double uy = (y1p - cyp) / ry;
    double vx = (-x1p - cxp) / rx;
    double vy = (-y1p - cyp) / ry;

    double theta1 = angleBetween(1.0, 0.0, ux, uy);
    double deltaTheta = angleBetween(ux, uy, vx, vy);

    if (!sweep && deltaTheta > 0.0) {
        deltaTheta -= 2.0 * kPi;
    } else if (sweep && deltaTheta < 0.0) {
        deltaTheta += 2.0 * kPi;
    }

    double arcLength = ellipticalArcLength(rx, ry, theta1, deltaTheta);
    long segments = std::max(1L, std::lround(arcLength / m_config.dotSpacing));

    std::vector<Point2D> points;
    points.reserve(segments);
    for (long i = 1; i < segments; i++) {
        double angle = theta1 + deltaTheta * i / segments;
        double localX = rx * std::cos(angle);
        double localY = ry * std::sin(angle);
        points.emplace_back(cx + localX * cosPhi - localY * sinPhi,
                            cy + localX * sinPhi + localY * cosPhi);
    }
    points.push_back(p1);

    return points;
}

std::vector<Point2D> Vectorizer::bulgeArc(const Point2D& start, const Point2D& end,
                                          double bulge) const {
    double chord = start.distanceTo(end);
    if (chord < 1e-10) {
        return { start };
    }

    double includedAngle = 4.0 * std::atan(bulge);
    if (std::fabs(includedAngle) < 1e-10) {
        return { start, end };
    }

    double halfAngle = std::fabs(includedAngle) / 2.0;
    double sinHalf = std::sin(halfAngle);
    if (std::fabs(sinHalf) < 1e-10) {
        return { start, end };
    }

    double radius = chord / (2.0 * sinHalf);
    double arcLength = radius * std::fabs(includedAngle);
    size_t segments = std::max<size_t>(2, static_cast<size_t>(std::ceil(arcLength / m_config.dotSpacing)));

    // Center sits on the chord normal; negative for major arcs (|bulge| > 1)
    double offset = radius * std::cos(halfAngle);
    Point2D mid((start.x + end.x) / 2.0, (start.y + end.y) / 2.0);
    Point2D direction = (end - start) * (1.0 / chord);
    Point2D leftNormal(-direction.y, direction.x);
    double side = bulge > 0.0 ? -1.0 : 1.0;
    Point2D center = mid + leftNormal * (side * offset);

    double startAngle = std::atan2(start.y - center.y, start.x - center.x);
    double sweepAngle = -includedAngle;

    std::vector<Point2D> points;
    points.reserve(segments + 1);
    points.push_back(start);
    for (size_t i = 1; i < segments; i++) {
        double angle = startAngle + sweepAngle * i / segments;
        points.emplace_back(center.x + radius * std::cos(angle),
                            center.y + radius * std::sin(angle));
    }
    points.push_back(end);

    return points;
}

} // namespace core
} // namespace microweld
