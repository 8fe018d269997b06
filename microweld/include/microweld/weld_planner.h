#ifndef MICROWELD_WELD_PLANNER_H
#define MICROWELD_WELD_PLANNER_H

#include "microweld/config.h"
#include "microweld/geometry.h"
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace microweld {
namespace core {

// Grid used to decide that two welds hit the same spot (mm)
const double kDuplicatePrecision = 0.1;

// Upper bound on the number of welding passes per path
const int kMaxWeldPasses = 8;

/**
 * Remembers every weld position of a run and rejects repeats. Positions are
 * compared after rounding to the precision grid, per operation class.
 */
class PointDeduplicator {
public:
    explicit PointDeduplicator(double precision = kDuplicatePrecision);

    /**
     * @return true the first time a rounded position is seen for this class
     */
    bool accept(const Point2D& position, OperationClass opClass);

    void clear();

    size_t rejectedCount() const { return m_rejected; }

private:
    double m_precision;
    std::set<std::tuple<long long, long long, int>> m_seen;
    size_t m_rejected;
};

struct WeldPlanStatistics {
    size_t duplicatePoints = 0;   // Welds dropped because the spot was already welded
    size_t emptiedPaths = 0;      // Paths left without points after deduplication
    size_t multipassPaths = 0;    // Paths split into more than one pass
};

/**
 * Turns prepared paths into the welds that are actually made: repeated spots
 * are dropped across the whole run, then weld paths are reordered coarse to
 * fine so each pass lets the plastic cool before its neighbours are welded.
 */
class WeldPlanner {
public:
    explicit WeldPlanner(const WeldConfig& config);

    /**
     * Number of passes that halve the spacing from the first pass down to
     * the final dot spacing
     *
     * @param initialSpacing Spacing of the first pass (mm), 0 disables passes
     * @param finalSpacing Spacing of the finished weld line (mm)
     * @return 1 + round(log2(initial / final)), clamped to [1, kMaxWeldPasses]
     */
    static int passCount(double initialSpacing, double finalSpacing);

    /**
     * Reorder points into passes. The first pass takes every
     * 2^(passes-1)th point, each later pass fills the gaps halfway between
     * the points already welded.
     */
    static std::vector<WeldPoint> orderByPass(const std::vector<WeldPoint>& points, int passes);

    /**
     * Deduplicate and sequence a run. Paths whose points were all welded
     * before are dropped with a warning.
     */
    std::vector<Path> plan(const std::vector<Path>& paths, WeldPlanStatistics& stats) const;

private:
    WeldConfig m_config;

    int passesFor(const Path& path) const;
};

} // namespace core
} // namespace microweld

#endif // MICROWELD_WELD_PLANNER_H
