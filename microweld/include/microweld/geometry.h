#ifndef MICROWELD_GEOMETRY_H
#define MICROWELD_GEOMETRY_H

#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace microweld {
namespace core {

/**
 * Operation class of a weld point. Selects the height and dwell used when
 * the point is emitted.
 */
enum class OperationClass {
    NORMAL,
    FRANGIBLE,
    STOP,
    PIPETTE
};

// "normal", "frangible", "stop", "pipette"
std::string operationClassToString(OperationClass opClass);

// Parses the names above (case-insensitive). Returns false for unknown names.
bool operationClassFromString(const std::string& name, OperationClass& opClass);

/**
 * Represents a 2D point with x and y coordinates
 */
struct Point2D {
    double x;
    double y;

    Point2D(double _x = 0, double _y = 0) : x(_x), y(_y) {}

    // Calculate distance to another point
    double distanceTo(const Point2D& other) const {
        double dx = x - other.x;
        double dy = y - other.y;
        return std::sqrt(dx*dx + dy*dy);
    }

    Point2D operator+(const Point2D& other) const {
        return Point2D(x + other.x, y + other.y);
    }

    Point2D operator-(const Point2D& other) const {
        return Point2D(x - other.x, y - other.y);
    }

    Point2D operator*(double scalar) const {
        return Point2D(x * scalar, y * scalar);
    }

    bool operator==(const Point2D& other) const {
        const double epsilon = 1e-6;
        return std::fabs(x - other.x) < epsilon && std::fabs(y - other.y) < epsilon;
    }

    bool operator!=(const Point2D& other) const {
        return !(*this == other);
    }
};

/**
 * A point of a weld path. The operation class is inherited from the owning
 * path unless overridden here.
 */
struct WeldPoint {
    Point2D position;
    std::optional<OperationClass> classOverride;
    int pass = 0;  // Welding pass, 0 is the first

    WeldPoint() = default;
    WeldPoint(const Point2D& p) : position(p) {}
    WeldPoint(const Point2D& p, OperationClass opClass) : position(p), classOverride(opClass) {}
};

/**
 * An ordered sequence of weld points sharing one operation class
 */
class Path {
public:
    Path() = default;
    Path(const std::string& id, OperationClass opClass) : m_id(id), m_class(opClass) {}
    Path(const std::string& id, OperationClass opClass, const std::vector<Point2D>& points);

    const std::string& getId() const { return m_id; }
    void setId(const std::string& id) { m_id = id; }

    OperationClass getOperationClass() const { return m_class; }
    void setOperationClass(OperationClass opClass) { m_class = opClass; }

    // Only meaningful for STOP and PIPETTE paths
    const std::string& getPauseMessage() const { return m_pauseMessage; }
    void setPauseMessage(const std::string& message) { m_pauseMessage = message; }

    void addPoint(const Point2D& point) {
        m_points.emplace_back(point);
    }

    void addPoint(const WeldPoint& point) {
        m_points.push_back(point);
    }

    const std::vector<WeldPoint>& getPoints() const {
        return m_points;
    }

    const WeldPoint& getPoint(size_t index) const {
        return m_points.at(index);
    }

    // Operation class of a point after applying the path default
    OperationClass classOf(size_t index) const;

    size_t size() const {
        return m_points.size();
    }

    bool empty() const {
        return m_points.empty();
    }

    // Calculate the total length of the path
    double length() const;

private:
    std::string m_id;
    OperationClass m_class = OperationClass::NORMAL;
    std::string m_pauseMessage;
    std::vector<WeldPoint> m_points;
};

/**
 * Axis-aligned bounds of everything observed. Only meaningful when
 * hasBounds is set.
 */
struct BoundingBox {
    double minX = 0.0;
    double minY = 0.0;
    double maxX = 0.0;
    double maxY = 0.0;
    bool hasBounds = false;

    double width() const { return maxX - minX; }
    double height() const { return maxY - minY; }
    Point2D center() const { return Point2D((minX + maxX) / 2.0, (minY + maxY) / 2.0); }
};

/**
 * Translation applied to every coordinate in the emission pass
 */
struct CenteringOffset {
    double dx = 0.0;
    double dy = 0.0;

    CenteringOffset() = default;
    CenteringOffset(double _dx, double _dy) : dx(_dx), dy(_dy) {}
};

} // namespace core
} // namespace microweld

#endif // MICROWELD_GEOMETRY_H
