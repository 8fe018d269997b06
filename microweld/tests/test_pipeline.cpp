#include "microweld/pipeline.h"
#include "microweld/event_log.h"
#include "microweld/events.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>

using namespace microweld::core;

namespace {

size_t countOccurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        count++;
    }
    return count;
}

Path triangle(const std::string& id = "tri", double shift = 0.0) {
    return Path(id, OperationClass::NORMAL,
                {Point2D(shift, 0), Point2D(shift + 10, 0), Point2D(shift + 10, 10)});
}

WeldConfig singlePassConfig() {
    WeldConfig config;
    OperationParams normal = config.getNormalWeld();
    normal.initialDotSpacing = 0.0;
    config.setNormalWeld(normal);
    return config;
}

} // namespace

TEST(PipelineTest, EndToEndCentersOnBed) {
    ConversionPipeline pipeline(singlePassConfig());
    std::string gcode;
    ConversionResult result = pipeline.convertToString({triangle()}, gcode);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.errorKind, ErrorKind::NONE);
    EXPECT_DOUBLE_EQ(result.offset.dx, 120.0);
    EXPECT_DOUBLE_EQ(result.offset.dy, 105.0);
    EXPECT_DOUBLE_EQ(result.bounds.minX, 0.0);
    EXPECT_DOUBLE_EQ(result.bounds.maxY, 10.0);
    EXPECT_EQ(result.eventCount, 5u);
    EXPECT_EQ(result.statistics.pathsProcessed, 1u);
    EXPECT_EQ(result.statistics.pointsProcessed, 3u);

    EXPECT_EQ(countOccurrences(gcode, "G4 P"), 3u);
    EXPECT_NE(gcode.find("G1 X120.000 Y105.000 F3000 ; Move to start of welding"),
              std::string::npos);
    EXPECT_NE(gcode.find("G1 X130.000 Y105.000"), std::string::npos);
    EXPECT_NE(gcode.find("G1 X130.000 Y115.000"), std::string::npos);

    size_t g92 = gcode.find("G92 Z0.300");
    size_t firstMove = gcode.find("G1 X120.000");
    ASSERT_NE(g92, std::string::npos);
    EXPECT_LT(g92, firstMove);

    EXPECT_EQ(countOccurrences(gcode, "G28 X Y"), 1u);
    EXPECT_GT(gcode.find("G28 X Y"), gcode.find("; Completed path: tri"));
}

TEST(PipelineTest, IdsAreMadeUniqueAndEmptyPathsDropped) {
    std::vector<Path> paths;
    paths.push_back(triangle("a"));
    paths.push_back(Path("empty", OperationClass::NORMAL));
    paths.push_back(triangle("a", 20.0));
    paths.push_back(triangle("", 40.0));

    size_t dropped = 0;
    std::vector<Path> prepared = ConversionPipeline::preparePaths(paths, dropped);

    EXPECT_EQ(dropped, 1u);
    ASSERT_EQ(prepared.size(), 3u);
    EXPECT_EQ(prepared[0].getId(), "a");
    EXPECT_EQ(prepared[1].getId(), "a_2");
    EXPECT_EQ(prepared[2].getId(), "path_4");

    ConversionPipeline pipeline{WeldConfig()};
    std::string gcode;
    ConversionResult result = pipeline.convertToString(paths, gcode);
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.droppedPaths, 1u);
    EXPECT_NE(gcode.find("; Starting path: a_2 (normal)"), std::string::npos);
    EXPECT_EQ(gcode.find("empty"), std::string::npos);
}

TEST(PipelineTest, NothingToWeldIsDegenerateGeometry) {
    ConversionPipeline pipeline{WeldConfig()};
    std::string gcode = "stale";

    ConversionResult result = pipeline.convertToString({}, gcode);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::DEGENERATE_GEOMETRY);
    EXPECT_TRUE(gcode.empty());

    std::vector<Path> onlyEmpty = {Path("a", OperationClass::NORMAL)};
    result = pipeline.convertToString(onlyEmpty, gcode);
    EXPECT_EQ(result.errorKind, ErrorKind::DEGENERATE_GEOMETRY);
}

TEST(PipelineTest, LongFilenameFailsBeforeWriting) {
    std::string path = ::testing::TempDir() + "a_very_long_output_file_name_for_firmware.gcode";
    std::remove(path.c_str());

    ConversionPipeline pipeline{WeldConfig()};
    ConversionResult result = pipeline.convert({triangle()}, path);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::FILENAME_TOO_LONG);
    std::ifstream in(path);
    EXPECT_FALSE(in.good());
}

TEST(PipelineTest, InvalidConfigIsReported) {
    WeldConfig config;
    config.setDotSpacing(0.0);
    config.setXYSpeed(-1.0);

    ConversionPipeline pipeline(config);
    std::string gcode;
    ConversionResult result = pipeline.convertToString({triangle()}, gcode);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::INVALID_CONFIG);
    EXPECT_NE(result.message.find("Invalid configuration"), std::string::npos);
}

TEST(PipelineTest, ReplayingOneLogTwiceGivesIdenticalOutput) {
    EventLog log;
    for (const auto& event : pathToEvents(triangle())) {
        log.record(event);
    }
    CenteringOffset offset(120.0, 105.0);

    std::ostringstream first;
    GCodeEmitter firstEmitter{WeldConfig()};
    firstEmitter.open(first, "job.gcode");
    ConversionPipeline::emit(log, offset, firstEmitter);

    std::ostringstream second;
    GCodeEmitter secondEmitter{WeldConfig()};
    secondEmitter.open(second, "job.gcode");
    ConversionPipeline::emit(log, offset, secondEmitter);

    EXPECT_FALSE(first.str().empty());
    EXPECT_EQ(first.str(), second.str());
    EXPECT_EQ(secondEmitter.state(), GCodeEmitter::State::FINALIZED);
}

TEST(PipelineTest, ConvertWritesFile) {
    std::string path = ::testing::TempDir() + "pipeline_out.gcode";
    std::remove(path.c_str());

    ConversionPipeline pipeline{WeldConfig()};
    ConversionResult result = pipeline.convert({triangle()}, path);
    ASSERT_TRUE(result.success) << result.message;

    std::ifstream in(path);
    ASSERT_TRUE(in.good());
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("; Output file: pipeline_out.gcode"), std::string::npos);
    EXPECT_NE(content.str().find("; End of G-code"), std::string::npos);

    in.close();
    std::remove(path.c_str());
}

TEST(PipelineTest, UnwritableOutputIsAnIoFailure) {
    ConversionPipeline pipeline{WeldConfig()};
    ConversionResult result = pipeline.convert({triangle()}, "/nonexistent-dir/out.gcode");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorKind, ErrorKind::IO_FAILURE);
}

TEST(PipelineTest, RepeatedSpotsAreWeldedOnce) {
    // Second path shares its first corner with the end of the first one
    std::vector<Path> paths;
    paths.push_back(Path("a", OperationClass::NORMAL, {Point2D(0, 0), Point2D(10, 0)}));
    paths.push_back(Path("b", OperationClass::NORMAL, {Point2D(10.04, 0.03), Point2D(10, 10)}));
    paths.push_back(Path("c", OperationClass::NORMAL, {Point2D(0, 0), Point2D(10, 10)}));

    ConversionPipeline pipeline(singlePassConfig());
    std::string gcode;
    ConversionResult result = pipeline.convertToString(paths, gcode);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.plan.duplicatePoints, 3u);
    EXPECT_EQ(result.plan.emptiedPaths, 1u);
    EXPECT_EQ(result.statistics.pathsProcessed, 2u);
    EXPECT_EQ(result.statistics.pointsProcessed, 3u);
    EXPECT_EQ(gcode.find("; Starting path: c"), std::string::npos);
}

TEST(PipelineTest, WeldPathsAreSequencedInPasses) {
    WeldConfig config;
    config.setDotSpacing(1.0);
    config.setNormalWeld(OperationParams{0.1, 1.0, 4.0, 2.0});

    std::vector<Point2D> line;
    for (int i = 0; i <= 8; i++) {
        line.push_back(Point2D(i, 0));
    }

    ConversionPipeline pipeline(config);
    std::string gcode;
    ConversionResult result = pipeline.convertToString({Path("row", OperationClass::NORMAL, line)}, gcode);

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.plan.multipassPaths, 1u);
    EXPECT_EQ(result.statistics.pointsProcessed, 9u);

    // Pattern spans x 0..8, centered on 125
    size_t first = gcode.find("G1 X121.000");
    size_t coarseEnd = gcode.find("G1 X129.000");
    size_t pass2 = gcode.find("G4 P2000 ; Cool before pass 2");
    size_t fill = gcode.find("G1 X123.000");
    size_t pass3 = gcode.find("G4 P2000 ; Cool before pass 3");
    size_t finest = gcode.find("G1 X122.000");

    ASSERT_NE(pass3, std::string::npos);
    EXPECT_LT(first, coarseEnd);
    EXPECT_LT(coarseEnd, pass2);
    EXPECT_LT(pass2, fill);
    EXPECT_LT(fill, pass3);
    EXPECT_LT(pass3, finest);
    EXPECT_EQ(countOccurrences(gcode, "; Cool before pass"), 2u);
}
