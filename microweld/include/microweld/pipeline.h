#ifndef MICROWELD_PIPELINE_H
#define MICROWELD_PIPELINE_H

#include "microweld/config.h"
#include "microweld/errors.h"
#include "microweld/gcode_emitter.h"
#include "microweld/geometry.h"
#include "microweld/weld_planner.h"
#include <iosfwd>
#include <string>
#include <vector>

namespace microweld {
namespace core {

class EventLog;

/**
 * Outcome of one conversion run
 */
struct ConversionResult {
    bool success = false;
    ErrorKind errorKind = ErrorKind::NONE;
    std::string message;

    BoundingBox bounds;          // Pattern bounds before centering
    CenteringOffset offset;      // Offset applied in the emission pass
    EmitterStatistics statistics;
    size_t eventCount = 0;       // Events recorded in the first pass
    size_t droppedPaths = 0;     // Empty paths skipped
    WeldPlanStatistics plan;     // Deduplication and pass sequencing
};

/**
 * Runs one conversion: record the point stream and its extents, center it
 * on the bed, then replay it into a fresh G-code emitter.
 *
 * Every run builds its own publisher, log and consumers; nothing is shared
 * between runs.
 */
class ConversionPipeline {
public:
    explicit ConversionPipeline(const WeldConfig& config,
                                const EmitterOptions& options = EmitterOptions());
    ~ConversionPipeline();

    /**
     * Convert paths to a G-code file
     * @param paths Vectorized paths in input order
     * @param outputFile Path to the output G-code file
     * @return The run outcome; failures carry the error kind and message
     */
    ConversionResult convert(const std::vector<Path>& paths,
                             const std::string& outputFile) const;

    /**
     * Convert paths to G-code held in a string
     * @param paths Vectorized paths in input order
     * @param output Receives the G-code; left empty on failure
     */
    ConversionResult convertToString(const std::vector<Path>& paths,
                                     std::string& output) const;

    /**
     * Drop empty paths and make ids unique: an empty id becomes
     * "path_<n>" (1-based input position), a repeated id gets "_2", "_3", ...
     * @param paths Input paths
     * @param dropped Receives the number of empty paths removed
     */
    static std::vector<Path> preparePaths(const std::vector<Path>& paths, size_t& dropped);

    /**
     * Prepare the paths and plan the welds that are actually made: repeated
     * spots removed, weld paths ordered pass by pass
     * @param paths Input paths
     * @param dropped Receives the number of empty paths removed
     * @param stats Receives the deduplication and pass statistics
     */
    std::vector<Path> planPaths(const std::vector<Path>& paths, size_t& dropped,
                                WeldPlanStatistics& stats) const;

    /**
     * Replay a recorded log into an emitter through the centering offset.
     * The emitter must already be open; it is finished on return.
     */
    static void emit(const EventLog& log, const CenteringOffset& offset,
                     GCodeEmitter& emitter);

    const WeldConfig& getConfig() const { return m_config; }

private:
    WeldConfig m_config;
    EmitterOptions m_options;

    ConversionResult run(const std::vector<Path>& paths,
                         const std::string* outputFile,
                         std::ostream* out) const;
};

} // namespace core
} // namespace microweld

#endif // MICROWELD_PIPELINE_H
