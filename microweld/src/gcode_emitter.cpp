#include "microweld/gcode_emitter.h"

#include <cmath>
#include <fstream>
#include <iostream>

#include "microweld/errors.h"
#include "microweld/utils.h"

namespace microweld {
namespace core {

namespace {

// Fixed shallow dwell used for pipette points
const double kPipetteHeight = 0.05;
const long kPipetteDwellMs = 500;

// Height the nozzle is raised to once the sequence is done
const double kFinalRaiseHeight = 10.0;

std::string z(double value) { return Utils::formatNumber(value, 3); }

std::string feed(double value) { return Utils::formatCompact(value, 1); }

std::string temp(double value) { return Utils::formatCompact(value, 1); }

}  // namespace

struct GCodeEmitter::Dispatch {
  GCodeEmitter &emitter;

  void operator()(const PathStart &e) const { emitter.onPathStart(e); }
  void operator()(const PointAdded &e) const { emitter.onPointAdded(e); }
  void operator()(const PathComplete &e) const { emitter.onPathComplete(e); }
};

GCodeEmitter::GCodeEmitter(const WeldConfig &config,
                           const EmitterOptions &options)
    : m_config(config),
      m_options(options),
      m_out(nullptr),
      m_state(State::UNINITIALIZED),
      m_currentClass(OperationClass::NORMAL),
      m_currentPass(0),
      m_firstPointInPath(false),
      m_firstPointEver(true) {}

GCodeEmitter::~GCodeEmitter() = default;

void GCodeEmitter::validateFilename(const std::string &outputFile) {
  std::string fileName = Utils::getFileName(outputFile);
  if (fileName.length() > kMaxGCodeFilenameLength) {
    throw FilenameError(fileName, fileName.length(), kMaxGCodeFilenameLength);
  }
}

void GCodeEmitter::open(const std::string &outputFile) {
  if (m_state != State::UNINITIALIZED) {
    throw SequenceError("G-code emitter is already open");
  }

  // Fail before the file exists
  validateFilename(outputFile);

  auto file = std::make_unique<std::ofstream>(outputFile);
  if (!file->is_open()) {
    throw IoError("Could not open file for writing: " + outputFile);
  }

  m_file = std::move(file);
  m_out = m_file.get();
  m_outputName = Utils::getFileName(outputFile);

  writeHeader();
  m_state = State::HEADER_WRITTEN;
}

void GCodeEmitter::open(std::ostream &out, const std::string &outputName) {
  if (m_state != State::UNINITIALIZED) {
    throw SequenceError("G-code emitter is already open");
  }

  m_out = &out;
  m_outputName = outputName;

  writeHeader();
  m_state = State::HEADER_WRITTEN;
}

void GCodeEmitter::finish() {
  switch (m_state) {
    case State::FINALIZED:
      return;
    case State::UNINITIALIZED:
      throw SequenceError("finish() called before the G-code output was opened");
    case State::IN_PATH:
      throw SequenceError("finish() called while path '" + m_currentPathId +
                          "' is still open");
    case State::HEADER_WRITTEN:
    case State::IDLE:
      break;
  }

  // A failing footer write must not be retried into a half-written file
  m_state = State::FINALIZED;

  writeFooter();
  m_out->flush();
  checkStream("flushing the output");

  if (m_file) {
    m_file->close();
    if (m_file->fail()) {
      throw IoError("Failed to close G-code file: " + m_outputName);
    }
  }
}

void GCodeEmitter::handle(const PathEvent &event) {
  if (m_state == State::UNINITIALIZED) {
    throw SequenceError("Event " + eventKindToString(kindOf(event)) +
                        " received before the G-code output was opened");
  }
  if (m_state == State::FINALIZED) {
    throw SequenceError("Event " + eventKindToString(kindOf(event)) +
                        " received after the G-code output was finalized");
  }

  m_tracker.accept(event);
  std::visit(Dispatch{*this}, event);
  checkStream("writing " + eventKindToString(kindOf(event)));
}

void GCodeEmitter::onPathStart(const PathStart &event) {
  m_currentPathId = event.id;
  m_currentClass = event.operationClass;
  m_currentPauseMessage = event.pauseMessage;
  m_currentPass = 0;
  m_firstPointInPath = true;

  *m_out << "; Starting path: " << event.id << " ("
         << operationClassToString(event.operationClass) << ")" << std::endl;

  m_state = State::IN_PATH;
}

void GCodeEmitter::onPointAdded(const PointAdded &event) {
  std::string xy = "X" + Utils::formatNumber(event.x, 3) + " Y" +
                   Utils::formatNumber(event.y, 3);
  std::string zSpeed = feed(m_config.getZSpeed());
  std::string xySpeed = feed(m_config.getXYSpeed());

  if (event.pass > m_currentPass) {
    writePassCooling(event.pass);
    m_currentPass = event.pass;
  }

  if (m_firstPointEver) {
    writeCompressionOffset();
    *m_out << "G1 Z" << z(m_config.getMoveHeight()) << " F" << zSpeed
           << " ; Move to high travel height" << std::endl;
    *m_out << "G1 " << xy << " F" << xySpeed << " ; Move to start of welding"
           << std::endl;
    m_firstPointEver = false;
    m_firstPointInPath = false;
  } else if (m_firstPointInPath) {
    *m_out << "G1 " << xy << " F" << xySpeed << " ; Move to start of path"
           << std::endl;
    m_firstPointInPath = false;
  } else {
    *m_out << "G1 " << xy << " F" << xySpeed << " ; Move to next point"
           << std::endl;
  }

  writeOperation(event.operationClass);
  m_stats.pointsProcessed++;
}

void GCodeEmitter::onPathComplete(const PathComplete &event) {
  *m_out << "; Completed path: " << event.id << std::endl << std::endl;

  m_stats.pathsProcessed++;
  m_currentPathId.clear();
  m_currentPauseMessage.clear();
  m_state = State::IDLE;
}

void GCodeEmitter::writeHeader() {
  if (m_options.includeHeaderComments) {
    *m_out << "; Generated by MicroWeld" << std::endl;
    *m_out << "; Plastic welding G-code" << std::endl;
    *m_out << "; Output file: " << m_outputName << std::endl;
    *m_out << "; Bed size: " << Utils::formatCompact(m_config.getBedSizeX())
           << " x " << Utils::formatCompact(m_config.getBedSizeY()) << " mm"
           << std::endl;
    *m_out << "; Bed temperature: " << temp(m_config.getBedTemperature())
           << "C" << std::endl;
    *m_out << "; Nozzle temperature: " << temp(m_config.getNozzleTemperature())
           << "C" << std::endl;

    // Include any additional comments
    if (!m_options.comments.empty()) {
      *m_out << "; " << m_options.comments << std::endl;
    }

    *m_out << std::endl;
  }

  // Printer initialization
  *m_out << "G90 ; Absolute positioning" << std::endl;
  *m_out << "M83 ; Relative extrusion" << std::endl;
  *m_out << "G28 ; Home all axes" << std::endl << std::endl;

  writeHeating();

  if (m_config.getIncludeUserPause()) {
    writeUserPause();
  }

  checkStream("writing the header");
}

void GCodeEmitter::writeHeating() {
  if (m_config.getEnableHeating()) {
    std::string bed = temp(m_config.getBedTemperature());
    std::string nozzle = temp(m_config.getNozzleTemperature());

    *m_out << "M140 S" << bed << " ; Set bed temperature" << std::endl;
    *m_out << "M190 S" << bed << " ; Wait for bed temperature" << std::endl;
    *m_out << "M104 S" << nozzle << " ; Set nozzle temperature" << std::endl;
    *m_out << "M109 S" << nozzle << " ; Wait for nozzle temperature"
           << std::endl
           << std::endl;
  }

  // Bed leveling after heating so Z=0 is measured on the expanded bed
  if (m_config.getEnableBedLeveling()) {
    *m_out << "G29 ; Auto bed leveling" << std::endl << std::endl;
  } else {
    *m_out << "; Bed leveling disabled" << std::endl << std::endl;
  }

  if (m_config.getUseChamberHeating()) {
    *m_out << "M141 S" << temp(m_config.getChamberTemperature())
           << " ; Set chamber temperature" << std::endl
           << std::endl;
  }
}

void GCodeEmitter::writeUserPause() {
  const std::string &message = m_config.getUserPauseMessage();

  *m_out << "M117 " << message << std::endl;
  *m_out << "M0 ; Pause - " << message << std::endl;
  *m_out << "M117 Starting welding sequence..." << std::endl << std::endl;
}

void GCodeEmitter::writeCompressionOffset() {
  double offset = m_config.getWeldCompressionOffset();
  if (offset == 0.0) return;

  std::string zSpeed = feed(m_config.getZSpeed());

  *m_out << "G1 Z0 F" << zSpeed << " ; Move to Z=0 for relative offset"
         << std::endl;
  *m_out << "G92 Z" << z(offset) << " ; Set Z offset for weld compression"
         << std::endl;
  *m_out << "G1 Z" << z(m_config.getMoveHeight()) << " F" << zSpeed
         << " ; Return to travel height" << std::endl;
}

void GCodeEmitter::writePassCooling(int pass) {
  if (m_currentClass != OperationClass::NORMAL &&
      m_currentClass != OperationClass::FRANGIBLE) {
    return;
  }

  *m_out << "; Pass " << pass + 1 << " of path " << m_currentPathId
         << std::endl;

  long coolingMs =
      std::lround(m_config.operationParams(m_currentClass).coolingSeconds * 1000.0);
  if (coolingMs > 0) {
    *m_out << "G4 P" << coolingMs << " ; Cool before pass " << pass + 1
           << std::endl;
  }
}

void GCodeEmitter::writeOperation(OperationClass opClass) {
  std::string zSpeed = feed(m_config.getZSpeed());
  std::string lowTravel = z(m_config.getLowTravelHeight());

  switch (opClass) {
    case OperationClass::NORMAL:
    case OperationClass::FRANGIBLE: {
      OperationParams params = m_config.operationParams(opClass);
      long dwellMs = std::lround(params.durationSeconds * 1000.0);
      const char *label =
          opClass == OperationClass::NORMAL ? "weld" : "frangible weld";

      *m_out << "G1 Z" << z(params.height) << " F" << zSpeed << " ; Lower to "
             << label << " height" << std::endl;
      *m_out << "G4 P" << dwellMs << " ; Dwell " << dwellMs << " ms"
             << std::endl;
      *m_out << "G1 Z" << lowTravel << " F" << zSpeed
             << " ; Raise to low travel height" << std::endl;
      break;
    }
    case OperationClass::STOP:
      *m_out << "M117 " << pauseMessageFor(opClass) << std::endl;
      *m_out << "M0 ; Pause for user interaction" << std::endl;
      break;
    case OperationClass::PIPETTE:
      *m_out << "; Pipette operation point" << std::endl;
      *m_out << "M117 " << pauseMessageFor(opClass) << std::endl;
      *m_out << "G1 Z" << z(kPipetteHeight) << " F" << zSpeed
             << " ; Lower for pipette" << std::endl;
      *m_out << "G4 P" << kPipetteDwellMs << " ; Brief pause" << std::endl;
      *m_out << "G1 Z" << lowTravel << " F" << zSpeed
             << " ; Raise to low travel height" << std::endl;
      break;
  }
}

void GCodeEmitter::writeFooter() {
  *m_out << "; End of welding sequence" << std::endl;
  *m_out << "; Total paths processed: " << m_stats.pathsProcessed << std::endl;
  *m_out << "; Total points processed: " << m_stats.pointsProcessed
         << std::endl
         << std::endl;

  *m_out << "G1 Z" << z(kFinalRaiseHeight) << " F"
         << feed(m_config.getZSpeed()) << " ; Raise nozzle" << std::endl;
  *m_out << "G28 X Y ; Home X and Y axes" << std::endl;

  if (m_config.getEnableCooldown()) {
    std::string cooldown = temp(m_config.getCooldownTemperature());
    *m_out << "M104 S" << cooldown << " ; Cool nozzle" << std::endl;
    *m_out << "M140 S" << cooldown << " ; Cool bed" << std::endl;
  }

  if (m_config.getUseChamberHeating()) {
    *m_out << "M141 S0 ; Turn off chamber heating" << std::endl;
  }

  *m_out << "M107 ; Turn off part cooling fan" << std::endl;
  *m_out << "M84 ; Disable steppers" << std::endl;
  *m_out << "; End of G-code" << std::endl;

  checkStream("writing the footer");
}

std::string GCodeEmitter::pauseMessageFor(OperationClass opClass) const {
  // The path message only applies to points of the path's own class
  if (opClass == m_currentClass && !m_currentPauseMessage.empty()) {
    return m_currentPauseMessage;
  }
  return opClass == OperationClass::PIPETTE ? kDefaultPipetteMessage
                                            : kDefaultStopMessage;
}

void GCodeEmitter::checkStream(const std::string &context) const {
  if (m_out && m_out->fail()) {
    throw IoError("I/O failure " + context + " for " + m_outputName);
  }
}

std::string emitterStateToString(GCodeEmitter::State state) {
  switch (state) {
    case GCodeEmitter::State::UNINITIALIZED: return "uninitialized";
    case GCodeEmitter::State::HEADER_WRITTEN: return "header_written";
    case GCodeEmitter::State::IDLE: return "idle";
    case GCodeEmitter::State::IN_PATH: return "in_path";
    case GCodeEmitter::State::FINALIZED: return "finalized";
  }
  return "unknown";
}

}  // namespace core
}  // namespace microweld
