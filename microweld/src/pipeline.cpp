#include "microweld/pipeline.h"

#include <iostream>
#include <set>
#include <sstream>

#include "microweld/centering.h"
#include "microweld/event_log.h"
#include "microweld/extent_collector.h"

namespace microweld {
namespace core {

ConversionPipeline::ConversionPipeline(const WeldConfig &config,
                                       const EmitterOptions &options)
    : m_config(config), m_options(options) {}

ConversionPipeline::~ConversionPipeline() = default;

ConversionResult ConversionPipeline::convert(
    const std::vector<Path> &paths, const std::string &outputFile) const {
  return run(paths, &outputFile, nullptr);
}

ConversionResult ConversionPipeline::convertToString(
    const std::vector<Path> &paths, std::string &output) const {
  std::ostringstream ss;
  ConversionResult result = run(paths, nullptr, &ss);
  output = result.success ? ss.str() : std::string();
  return result;
}

std::vector<Path> ConversionPipeline::preparePaths(
    const std::vector<Path> &paths, size_t &dropped) {
  std::vector<Path> prepared;
  std::set<std::string> usedIds;
  dropped = 0;

  for (size_t i = 0; i < paths.size(); i++) {
    if (paths[i].empty()) {
      std::cerr << "Warning: Skipping empty path '"
                << (paths[i].getId().empty() ? "(unnamed)" : paths[i].getId())
                << "'" << std::endl;
      dropped++;
      continue;
    }

    Path path = paths[i];
    std::string baseId =
        path.getId().empty() ? "path_" + std::to_string(i + 1) : path.getId();

    std::string id = baseId;
    for (int suffix = 2; usedIds.count(id) > 0; suffix++) {
      id = baseId + "_" + std::to_string(suffix);
    }

    usedIds.insert(id);
    path.setId(id);
    prepared.push_back(std::move(path));
  }

  return prepared;
}

std::vector<Path> ConversionPipeline::planPaths(
    const std::vector<Path> &paths, size_t &dropped,
    WeldPlanStatistics &stats) const {
  WeldPlanner planner(m_config);
  return planner.plan(preparePaths(paths, dropped), stats);
}

void ConversionPipeline::emit(const EventLog &log,
                              const CenteringOffset &offset,
                              GCodeEmitter &emitter) {
  OffsetSubscriber centered(emitter, offset);
  log.replay({&centered});
  emitter.finish();
}

ConversionResult ConversionPipeline::run(const std::vector<Path> &paths,
                                         const std::string *outputFile,
                                         std::ostream *out) const {
  ConversionResult result;

  try {
    std::vector<std::string> configErrors;
    if (!m_config.validate(configErrors)) {
      std::string message = "Invalid configuration:";
      for (const auto &error : configErrors) {
        message += " " + error + ";";
      }
      throw ConfigError(message);
    }

    if (outputFile) {
      GCodeEmitter::validateFilename(*outputFile);
    }

    std::vector<Path> prepared =
        planPaths(paths, result.droppedPaths, result.plan);

    // Pass 1: record the stream and collect its extents
    EventLog log;
    ExtentCollector extents;
    EventPublisher publisher;
    publisher.subscribe(log);
    publisher.subscribe(extents);

    for (const auto &path : prepared) {
      for (const auto &event : pathToEvents(path)) {
        publisher.publish(event);
      }
    }

    result.eventCount = log.size();
    result.bounds = extents.finalize();
    if (!result.bounds.hasBounds) {
      throw GeometryError("Nothing to weld: the input contains no points");
    }

    result.offset = Centering::calculateOffset(
        result.bounds, m_config.getBedSizeX(), m_config.getBedSizeY());

    // Pass 2: replay the centered stream into the emitter
    GCodeEmitter emitter(m_config, m_options);
    if (outputFile) {
      emitter.open(*outputFile);
    } else {
      emitter.open(*out, "memory");
    }

    emit(log, result.offset, emitter);

    result.statistics = emitter.statistics();
    result.success = true;
  } catch (const Error &e) {
    result.success = false;
    result.errorKind = e.kind();
    result.message = e.what();
  } catch (const std::ios_base::failure &e) {
    result.success = false;
    result.errorKind = ErrorKind::IO_FAILURE;
    result.message = e.what();
  }

  return result;
}

}  // namespace core
}  // namespace microweld
