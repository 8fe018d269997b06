#ifndef MICROWELD_GCODE_EMITTER_H
#define MICROWELD_GCODE_EMITTER_H

#include "microweld/config.h"
#include "microweld/events.h"
#include <iosfwd>
#include <memory>
#include <string>

namespace microweld {
namespace core {

// Longest output file name the printer firmware accepts, extension included
const size_t kMaxGCodeFilenameLength = 31;

const char* const kDefaultStopMessage = "Manual intervention required";
const char* const kDefaultPipetteMessage = "Pipette filling required";

/**
 * Structure to hold additional G-code emission options
 */
struct EmitterOptions {
    std::string comments;         // Additional comment line for the header
    bool includeHeaderComments;   // Whether to write the descriptive banner

    EmitterOptions() :
        comments(""),
        includeHeaderComments(true)
    {}
};

struct EmitterStatistics {
    size_t pathsProcessed = 0;
    size_t pointsProcessed = 0;
};

/**
 * Second-pass consumer turning the offset-corrected point stream into
 * G-code. One emitter produces exactly one artifact.
 *
 * Lifecycle: open() writes the header, handle() consumes events, finish()
 * writes the footer and closes the output. Nothing is written from the
 * destructor; an emitter dropped before finish() leaves its file without
 * footer.
 */
class GCodeEmitter : public EventSubscriber {
public:
    enum class State {
        UNINITIALIZED,
        HEADER_WRITTEN,
        IDLE,
        IN_PATH,
        FINALIZED
    };

    explicit GCodeEmitter(const WeldConfig& config,
                          const EmitterOptions& options = EmitterOptions());
    ~GCodeEmitter() override;

    GCodeEmitter(const GCodeEmitter&) = delete;
    GCodeEmitter& operator=(const GCodeEmitter&) = delete;

    /**
     * Check an output path against the file name length limit
     * @param outputFile Path of the G-code file; only the last component is checked
     * @throws FilenameError if the name is longer than kMaxGCodeFilenameLength
     */
    static void validateFilename(const std::string& outputFile);

    /**
     * Validate the file name, create the file and write the header
     * @param outputFile Path to the output G-code file
     * @throws FilenameError before the file is created, IoError if it cannot be written
     */
    void open(const std::string& outputFile);

    /**
     * Write to a caller-owned stream instead of a file
     * @param out Destination stream, must outlive the emitter
     * @param outputName Name shown in the header banner
     */
    void open(std::ostream& out, const std::string& outputName);

    /**
     * Write statistics and footer, flush, and close the output. Calling it
     * again after it succeeded is a no-op.
     * @throws SequenceError if the emitter was never opened or a path is still open
     */
    void finish();

    EventMask subscribedEvents() const override { return kAllEvents; }
    void handle(const PathEvent& event) override;

    State state() const { return m_state; }
    EmitterStatistics statistics() const { return m_stats; }

private:
    struct Dispatch;

    WeldConfig m_config;
    EmitterOptions m_options;

    std::unique_ptr<std::ofstream> m_file;
    std::ostream* m_out;
    std::string m_outputName;

    State m_state;
    SequenceTracker m_tracker;

    OperationClass m_currentClass;
    std::string m_currentPathId;
    std::string m_currentPauseMessage;
    int m_currentPass;
    bool m_firstPointInPath;
    bool m_firstPointEver;
    EmitterStatistics m_stats;

    void writeHeader();
    void writeHeating();
    void writeUserPause();
    void writeCompressionOffset();
    void writePassCooling(int pass);
    void writeOperation(OperationClass opClass);
    void writeFooter();

    void onPathStart(const PathStart& event);
    void onPointAdded(const PointAdded& event);
    void onPathComplete(const PathComplete& event);

    std::string pauseMessageFor(OperationClass opClass) const;

    // Throws IoError if the output stream went bad
    void checkStream(const std::string& context) const;
};

std::string emitterStateToString(GCodeEmitter::State state);

} // namespace core
} // namespace microweld

#endif // MICROWELD_GCODE_EMITTER_H
