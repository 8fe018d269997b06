#include "microweld/geometry.h"
#include <algorithm>
#include <cctype>

namespace microweld {
namespace core {

std::string operationClassToString(OperationClass opClass) {
    switch (opClass) {
        case OperationClass::NORMAL:    return "normal";
        case OperationClass::FRANGIBLE: return "frangible";
        case OperationClass::STOP:      return "stop";
        case OperationClass::PIPETTE:   return "pipette";
    }
    return "normal";
}

bool operationClassFromString(const std::string& name, OperationClass& opClass) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "normal") opClass = OperationClass::NORMAL;
    else if (lower == "frangible") opClass = OperationClass::FRANGIBLE;
    else if (lower == "stop") opClass = OperationClass::STOP;
    else if (lower == "pipette") opClass = OperationClass::PIPETTE;
    else return false;

    return true;
}

Path::Path(const std::string& id, OperationClass opClass, const std::vector<Point2D>& points)
    : m_id(id), m_class(opClass) {
    m_points.reserve(points.size());
    for (const auto& point : points) {
        m_points.emplace_back(point);
    }
}

OperationClass Path::classOf(size_t index) const {
    const WeldPoint& point = m_points.at(index);
    return point.classOverride ? *point.classOverride : m_class;
}

double Path::length() const {
    if (m_points.size() < 2) {
        return 0.0;
    }

    double totalLength = 0.0;
    for (size_t i = 1; i < m_points.size(); ++i) {
        totalLength += m_points[i-1].position.distanceTo(m_points[i].position);
    }

    return totalLength;
}

} // namespace core
} // namespace microweld
