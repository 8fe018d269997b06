#include "microweld/path_builder.h"
#include "microweld/errors.h"

#include <cmath>
#include <iostream>

namespace microweld {
namespace core {

PathBuilder::PathBuilder(const Vectorizer& vectorizer, const std::string& id,
                         OperationClass opClass)
    : m_vectorizer(vectorizer), m_path(id, opClass) {}

PathBuilder& PathBuilder::setPauseMessage(const std::string& message) {
    m_path.setPauseMessage(message);
    return *this;
}

void PathBuilder::append(const Point2D& p) {
    if (!m_path.empty() && m_path.getPoints().back().position == p) {
        return;
    }
    m_path.addPoint(p);
}

void PathBuilder::appendAll(const std::vector<Point2D>& points) {
    for (const auto& p : points) {
        append(p);
    }
}

void PathBuilder::ensureCurrent() {
    if (!m_hasCurrent) {
        moveTo(m_current);
    }
}

PathBuilder& PathBuilder::moveTo(const Point2D& p) {
    m_current = p;
    m_subpathStart = p;
    m_hasCurrent = true;
    m_lastQuadControl.reset();
    m_lastCubicControl.reset();
    append(p);
    return *this;
}

PathBuilder& PathBuilder::lineTo(const Point2D& p) {
    if (!m_hasCurrent) {
        return moveTo(p);
    }

    std::vector<Point2D> points = m_vectorizer.line(m_current, p);
    if (points.size() == 1) {
        // Shorter than the spacing: only the end point is new
        append(p);
    } else {
        appendAll(points);
    }

    m_current = p;
    m_lastQuadControl.reset();
    m_lastCubicControl.reset();
    return *this;
}

PathBuilder& PathBuilder::quadTo(const Point2D& control, const Point2D& p) {
    ensureCurrent();
    appendAll(m_vectorizer.quadraticBezier(m_current, control, p));
    m_current = p;
    m_lastQuadControl = control;
    m_lastCubicControl.reset();
    return *this;
}

PathBuilder& PathBuilder::cubicTo(const Point2D& control1, const Point2D& control2,
                                  const Point2D& p) {
    ensureCurrent();
    appendAll(m_vectorizer.cubicBezier(m_current, control1, control2, p));
    m_current = p;
    m_lastCubicControl = control2;
    m_lastQuadControl.reset();
    return *this;
}

PathBuilder& PathBuilder::smoothQuadTo(const Point2D& p) {
    ensureCurrent();
    Point2D control = Vectorizer::reflectControlPoint(m_current, m_lastQuadControl);
    return quadTo(control, p);
}

PathBuilder& PathBuilder::smoothCubicTo(const Point2D& control2, const Point2D& p) {
    ensureCurrent();
    Point2D control1 = Vectorizer::reflectControlPoint(m_current, m_lastCubicControl);
    return cubicTo(control1, control2, p);
}

PathBuilder& PathBuilder::arcTo(double rx, double ry, double xAxisRotation,
                                bool largeArc, bool sweep, const Point2D& p) {
    ensureCurrent();
    appendAll(m_vectorizer.ellipticalArc(m_current, rx, ry, xAxisRotation, largeArc, sweep, p));
    m_current = p;
    m_lastQuadControl.reset();
    m_lastCubicControl.reset();
    return *this;
}

PathBuilder& PathBuilder::bulgeTo(const Point2D& p, double bulge) {
    if (!m_hasCurrent) {
        return moveTo(p);
    }

    appendAll(m_vectorizer.bulgeArc(m_current, p, bulge));
    m_current = p;
    m_lastQuadControl.reset();
    m_lastCubicControl.reset();
    return *this;
}

PathBuilder& PathBuilder::arc(const Point2D& center, double radius,
                              double startAngle, double endAngle) {
    std::vector<Point2D> points;
    try {
        points = m_vectorizer.arc(center, radius, startAngle, endAngle);
    } catch (const GeometryError& e) {
        std::cerr << "Warning: " << e.what() << " in path '" << m_path.getId()
                  << "', using the center point" << std::endl;
        points = { center };
    }

    if (!m_hasCurrent) {
        moveTo(points.front());
    } else if (m_current != points.front()) {
        lineTo(points.front());
    }
    appendAll(points);
    m_current = points.back();
    m_lastQuadControl.reset();
    m_lastCubicControl.reset();
    return *this;
}

PathBuilder& PathBuilder::circle(const Point2D& center, double radius) {
    return arc(center, radius, 0.0, 360.0);
}

PathBuilder& PathBuilder::close() {
    if (m_hasCurrent && m_current != m_subpathStart) {
        lineTo(m_subpathStart);
    }
    m_current = m_subpathStart;
    m_lastQuadControl.reset();
    m_lastCubicControl.reset();
    return *this;
}

Path PathBuilder::build() const {
    return m_path;
}

Path PathBuilder::polyline(const Vectorizer& vectorizer, const std::string& id,
                           OperationClass opClass, const std::vector<PolylineVertex>& vertices,
                           bool closed) {
    PathBuilder builder(vectorizer, id, opClass);
    if (vertices.empty()) {
        return builder.build();
    }

    builder.moveTo(vertices.front().position);

    size_t segmentCount = closed ? vertices.size() : vertices.size() - 1;
    for (size_t i = 0; i < segmentCount; i++) {
        const PolylineVertex& from = vertices[i];
        const Point2D& to = vertices[(i + 1) % vertices.size()].position;

        if (std::fabs(from.bulge) < 1e-10) {
            builder.lineTo(to);
        } else {
            builder.bulgeTo(to, from.bulge);
        }
    }

    return builder.build();
}

} // namespace core
} // namespace microweld
