#include "microweld/centering.h"
#include "microweld/config.h"
#include "microweld/pipeline.h"
#include "microweld/svg_loader.h"
#include "microweld/utils.h"
#include "microweld/vectorizer.h"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace microweld::core;

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " <svg_file> [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --output <file>         Output G-code file, at most 31 characters (default: input.gcode)" << std::endl;
    std::cout << "  --config <file>         Configuration file (default: microweld.cfg)" << std::endl;
    std::cout << "  --spacing <mm>          Override the weld dot spacing" << std::endl;
    std::cout << "  --no-pause              Skip the plastic sheet insertion pause" << std::endl;
    std::cout << "  --csv <file>            Also save the weld points as CSV" << std::endl;
    std::cout << "  --preview <file>        Also write an SVG preview of the centered pattern" << std::endl;
    std::cout << "  --units <units>         Units for SVG parsing [mm, cm, in, px] (default: mm)" << std::endl;
    std::cout << "  --dpi <value>           DPI for unit conversion (default: 96)" << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    // Parse command line arguments
    std::string svgFile = argv[1];
    std::string outputFile = Utils::replaceExtension(svgFile, "gcode");
    std::string configFile = "microweld.cfg";
    std::string csvFile;
    std::string previewFile;
    std::string units = "mm";
    float dpi = 96.0f;
    double spacingOverride = 0.0;
    bool noPause = false;

    try {
        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--output" && i + 1 < argc) {
                outputFile = argv[++i];
            }
            else if (arg == "--config" && i + 1 < argc) {
                configFile = argv[++i];
            }
            else if (arg == "--spacing" && i + 1 < argc) {
                spacingOverride = std::stod(argv[++i]);
            }
            else if (arg == "--no-pause") {
                noPause = true;
            }
            else if (arg == "--csv" && i + 1 < argc) {
                csvFile = argv[++i];
            }
            else if (arg == "--preview" && i + 1 < argc) {
                previewFile = argv[++i];
            }
            else if (arg == "--units" && i + 1 < argc) {
                units = argv[++i];
            }
            else if (arg == "--dpi" && i + 1 < argc) {
                dpi = std::stof(argv[++i]);
            }
            else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::invalid_argument&) {
        std::cerr << "Error: Expected a number in the command line options." << std::endl;
        printUsage(argv[0]);
        return 1;
    } catch (const std::out_of_range&) {
        std::cerr << "Error: Number out of range in the command line options." << std::endl;
        return 1;
    }

    // Load configuration
    WeldConfig config;
    if (WeldConfig::isFirstRun(configFile)) {
        std::cout << "No configuration file found at " << configFile
                  << ", using defaults (run weld_config_wizard to create one)." << std::endl;
    } else if (!config.loadFromFile(configFile)) {
        std::cerr << "Error: Failed to load configuration from: " << configFile << std::endl;
        return 1;
    } else {
        std::cout << "Configuration loaded from: " << configFile << std::endl;
    }

    if (spacingOverride != 0.0) {
        config.setDotSpacing(spacingOverride);
    }
    if (noPause) {
        config.setIncludeUserPause(false);
    }

    std::vector<std::string> configErrors;
    if (!config.validate(configErrors)) {
        std::cerr << "Error: Invalid configuration:" << std::endl;
        for (const auto& error : configErrors) {
            std::cerr << "  " << error << std::endl;
        }
        return 1;
    }

    // Fail on the file name before doing any work
    try {
        GCodeEmitter::validateFilename(outputFile);
    } catch (const FilenameError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Parse SVG file
    std::cout << "Parsing SVG file: " << svgFile << std::endl;
    SVGLoader loader;
    if (!loader.loadFromFile(svgFile, units, dpi)) {
        std::cerr << "Error: Failed to parse SVG file." << std::endl;
        return 1;
    }

    float width, height;
    if (loader.getDimensions(width, height)) {
        std::cout << "SVG Dimensions: " << width << " x " << height << " " << units << std::endl;
    }

    VectorizerConfig vectorizerConfig;
    vectorizerConfig.dotSpacing = config.getDotSpacing();
    Vectorizer vectorizer(vectorizerConfig);

    std::cout << "Dot spacing: " << Utils::formatCompact(vectorizer.dotSpacing()) << " mm" << std::endl;

    int shapeCount = loader.getShapeCount();
    if (shapeCount == 0) {
        std::cerr << "Error: No shapes found in " << svgFile << std::endl;
        return 1;
    }

    std::vector<SVGShapeInfo> shapeInfoList = loader.getShapeInfo();
    std::cout << "\nFound " << shapeCount << " shapes:" << std::endl;
    for (size_t i = 0; i < shapeInfoList.size(); i++) {
        const auto& info = shapeInfoList[i];
        std::cout << "  Shape " << i << ": "
                  << (info.id.empty() ? "(unnamed)" : info.id)
                  << ", colour " << Utils::colorToHex(info.strokeColor)
                  << ", " << operationClassToString(info.operationClass)
                  << ", " << info.pathCount << " path(s)" << std::endl;
    }

    std::vector<Path> paths = loader.toPaths(vectorizer);
    loader.freeImage();

    // Convert
    std::cout << "\nGenerating G-code: " << outputFile << std::endl;
    ConversionPipeline pipeline(config);
    ConversionResult result = pipeline.convert(paths, outputFile);

    if (!result.success) {
        std::cerr << "Error: " << result.message << " (" << errorKindToString(result.errorKind) << ")" << std::endl;
        return 1;
    }

    std::cout << Centering::formatCenteringInfo(result.bounds, result.offset,
                                                config.getBedSizeX(), config.getBedSizeY())
              << std::endl;
    std::cout << "Paths welded: " << result.statistics.pathsProcessed << std::endl;
    std::cout << "Weld points: " << result.statistics.pointsProcessed << std::endl;
    if (result.droppedPaths > 0) {
        std::cout << "Empty paths skipped: " << result.droppedPaths << std::endl;
    }
    if (result.plan.duplicatePoints > 0) {
        std::cout << "Repeated welds removed: " << result.plan.duplicatePoints << std::endl;
    }
    if (result.plan.multipassPaths > 0) {
        std::cout << "Paths welded in several passes: " << result.plan.multipassPaths << std::endl;
    }
    std::cout << "G-code file created successfully." << std::endl;

    if (!csvFile.empty() || !previewFile.empty()) {
        size_t dropped = 0;
        std::vector<Path> prepared = ConversionPipeline::preparePaths(paths, dropped);

        if (!csvFile.empty()) {
            // Welds in the order they are made
            WeldPlanStatistics planStats;
            std::vector<Path> planned = pipeline.planPaths(paths, dropped, planStats);

            std::cout << "Saving weld points to: " << csvFile << std::endl;
            if (!Utils::savePathsToCSV(planned, csvFile)) {
                return 1;
            }
        }

        if (!previewFile.empty() &&
            !Utils::generateBedPreview(prepared, result.offset, config, previewFile)) {
            return 1;
        }
    }

    return 0;
}
