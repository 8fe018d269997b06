#include "microweld/weld_planner.h"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace microweld {
namespace core {

PointDeduplicator::PointDeduplicator(double precision)
    : m_precision(precision), m_rejected(0) {}

bool PointDeduplicator::accept(const Point2D& position, OperationClass opClass) {
    auto key = std::make_tuple(std::llround(position.x / m_precision),
                               std::llround(position.y / m_precision),
                               static_cast<int>(opClass));
    if (!m_seen.insert(key).second) {
        m_rejected++;
        return false;
    }
    return true;
}

void PointDeduplicator::clear() {
    m_seen.clear();
    m_rejected = 0;
}

WeldPlanner::WeldPlanner(const WeldConfig& config) : m_config(config) {}

int WeldPlanner::passCount(double initialSpacing, double finalSpacing) {
    if (initialSpacing <= 0 || finalSpacing <= 0 || initialSpacing <= finalSpacing) {
        return 1;
    }

    int passes = 1 + static_cast<int>(std::lround(std::log2(initialSpacing / finalSpacing)));
    return std::min(std::max(passes, 1), kMaxWeldPasses);
}

std::vector<WeldPoint> WeldPlanner::orderByPass(const std::vector<WeldPoint>& points, int passes) {
    if (passes <= 1) {
        return points;
    }

    std::vector<WeldPoint> ordered;
    ordered.reserve(points.size());

    // First pass: every 2^(passes-1)th point
    size_t step = size_t(1) << (passes - 1);
    for (size_t i = 0; i < points.size(); i += step) {
        ordered.push_back(points[i]);
        ordered.back().pass = 0;
    }

    // Later passes land halfway between the points already welded
    for (int pass = 1; pass < passes; pass++) {
        step = size_t(1) << (passes - 1 - pass);
        for (size_t i = step; i < points.size(); i += step * 2) {
            ordered.push_back(points[i]);
            ordered.back().pass = pass;
        }
    }

    return ordered;
}

int WeldPlanner::passesFor(const Path& path) const {
    OperationClass opClass = path.getOperationClass();
    if (opClass != OperationClass::NORMAL && opClass != OperationClass::FRANGIBLE) {
        return 1;
    }

    // Pauses keep their place in the drawing order
    for (size_t i = 0; i < path.size(); i++) {
        OperationClass pointClass = path.classOf(i);
        if (pointClass == OperationClass::STOP || pointClass == OperationClass::PIPETTE) {
            return 1;
        }
    }

    OperationParams params = m_config.operationParams(opClass);
    return passCount(params.initialDotSpacing, m_config.getDotSpacing());
}

std::vector<Path> WeldPlanner::plan(const std::vector<Path>& paths, WeldPlanStatistics& stats) const {
    std::vector<Path> planned;
    PointDeduplicator deduplicator;
    stats = WeldPlanStatistics();

    for (const auto& path : paths) {
        Path unique(path.getId(), path.getOperationClass());
        unique.setPauseMessage(path.getPauseMessage());

        for (size_t i = 0; i < path.size(); i++) {
            const WeldPoint& point = path.getPoint(i);
            if (deduplicator.accept(point.position, path.classOf(i))) {
                unique.addPoint(point);
            }
        }

        if (unique.empty()) {
            std::cerr << "Warning: Every weld of path '" << path.getId()
                      << "' repeats an earlier weld, skipping it" << std::endl;
            stats.emptiedPaths++;
            continue;
        }

        int passes = passesFor(unique);
        if (passes > 1) {
            Path sequenced(unique.getId(), unique.getOperationClass());
            sequenced.setPauseMessage(unique.getPauseMessage());
            for (const auto& point : orderByPass(unique.getPoints(), passes)) {
                sequenced.addPoint(point);
            }
            planned.push_back(std::move(sequenced));
            stats.multipassPaths++;
        } else {
            planned.push_back(std::move(unique));
        }
    }

    stats.duplicatePoints = deduplicator.rejectedCount();
    return planned;
}

} // namespace core
} // namespace microweld
