#include "microweld/utils.h"
#include "microweld/centering.h"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace microweld {
namespace core {

bool Utils::savePathsToCSV(const std::vector<Path>& paths, const std::string& filename) {
    std::ofstream outFile(filename);
    if (!outFile.is_open()) {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    outFile << "# Vectorized weld paths" << std::endl;
    outFile << "# Format: path_id,class,point_index,x,y" << std::endl;

    for (const auto& path : paths) {
        const auto& points = path.getPoints();
        outFile << "# Path " << path.getId() << " (" << points.size() << " points)" << std::endl;

        for (size_t pointIndex = 0; pointIndex < points.size(); pointIndex++) {
            outFile << path.getId() << ","
                    << operationClassToString(path.classOf(pointIndex)) << ","
                    << pointIndex << ","
                    << formatNumber(points[pointIndex].position.x) << ","
                    << formatNumber(points[pointIndex].position.y) << std::endl;
        }

        outFile << std::endl; // Empty line between paths
    }

    outFile.close();
    if (outFile.fail()) {
        std::cerr << "Error: Failed writing CSV file: " << filename << std::endl;
        return false;
    }
    return true;
}

bool Utils::generateBedPreview(const std::vector<Path>& paths,
                               const CenteringOffset& offset,
                               const WeldConfig& config,
                               const std::string& outputFile) {
    double bedWidth = config.getBedSizeX();
    double bedHeight = config.getBedSizeY();

    std::ofstream vizFile(outputFile);
    if (!vizFile.is_open()) {
        std::cerr << "Error: Could not open file for writing: " << outputFile << std::endl;
        return false;
    }

    double margin = std::max(bedWidth, bedHeight) * 0.05;
    double dotRadius = std::max(0.2, config.getDotSpacing() * 0.25);

    vizFile << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"no\"?>" << std::endl;
    vizFile << "<svg width=\"" << bedWidth + 2 * margin << "mm\" height=\"" << bedHeight + 2 * margin
            << "mm\" viewBox=\"" << -margin << " " << -margin << " "
            << bedWidth + 2 * margin << " " << bedHeight + 2 * margin
            << "\" xmlns=\"http://www.w3.org/2000/svg\">" << std::endl;

    vizFile << "  <title>MicroWeld bed preview</title>" << std::endl;

    // Draw bed outline
    vizFile << "  <!-- Bed -->" << std::endl;
    vizFile << "  <rect x=\"0\" y=\"0\" width=\"" << bedWidth << "\" height=\"" << bedHeight
            << "\" fill=\"#f0f0f0\" stroke=\"#888888\" stroke-width=\"0.5\" />" << std::endl;
    vizFile << "  <text x=\"" << bedWidth / 2 << "\" y=\"" << -margin * 0.3
            << "\" font-family=\"Arial\" font-size=\"6\" text-anchor=\"middle\">"
            << "Bed (" << bedWidth << " x " << bedHeight << " mm)</text>" << std::endl;

    // Bed center cross
    vizFile << "  <line x1=\"" << bedWidth / 2 - 5 << "\" y1=\"" << bedHeight / 2
            << "\" x2=\"" << bedWidth / 2 + 5 << "\" y2=\"" << bedHeight / 2
            << "\" stroke=\"#bbbbbb\" stroke-width=\"0.3\" />" << std::endl;
    vizFile << "  <line x1=\"" << bedWidth / 2 << "\" y1=\"" << bedHeight / 2 - 5
            << "\" x2=\"" << bedWidth / 2 << "\" y2=\"" << bedHeight / 2 + 5
            << "\" stroke=\"#bbbbbb\" stroke-width=\"0.3\" />" << std::endl;

    // Centered pattern bounds
    BoundingBox bounds = Centering::applyOffset(Centering::getBounds(paths), offset);
    if (bounds.hasBounds) {
        vizFile << "  <!-- Pattern bounds -->" << std::endl;
        vizFile << "  <rect x=\"" << bounds.minX << "\" y=\"" << bounds.minY
                << "\" width=\"" << bounds.width() << "\" height=\"" << bounds.height()
                << "\" fill=\"none\" stroke=\"#444444\" stroke-width=\"0.3\" stroke-dasharray=\"2,1\" />"
                << std::endl;
    }

    // Weld points
    vizFile << "  <!-- Weld points -->" << std::endl;
    for (const auto& path : paths) {
        const auto& points = path.getPoints();
        if (points.empty()) continue;

        vizFile << "  <g id=\"" << path.getId() << "\">" << std::endl;
        vizFile << "    <polyline fill=\"none\" stroke=\"#cccccc\" stroke-width=\"0.2\" points=\"";
        for (const auto& point : points) {
            vizFile << point.position.x + offset.dx << "," << point.position.y + offset.dy << " ";
        }
        vizFile << "\" />" << std::endl;

        for (size_t i = 0; i < points.size(); i++) {
            vizFile << "    <circle cx=\"" << points[i].position.x + offset.dx
                    << "\" cy=\"" << points[i].position.y + offset.dy
                    << "\" r=\"" << dotRadius << "\" fill=\"" << classColor(path.classOf(i))
                    << "\" />" << std::endl;
        }
        vizFile << "  </g>" << std::endl;
    }

    // Legend
    vizFile << "  <!-- Legend -->" << std::endl;
    vizFile << "  <g font-family=\"Arial\" font-size=\"4\" transform=\"translate(2, "
            << bedHeight - 20 << ")\">" << std::endl;
    const OperationClass classes[] = {OperationClass::NORMAL, OperationClass::FRANGIBLE,
                                      OperationClass::STOP, OperationClass::PIPETTE};
    double y = 0;
    for (OperationClass opClass : classes) {
        vizFile << "    <circle cx=\"2\" cy=\"" << y << "\" r=\"1.2\" fill=\"" << classColor(opClass)
                << "\" />" << std::endl;
        vizFile << "    <text x=\"5\" y=\"" << y + 1.4 << "\">" << operationClassToString(opClass)
                << "</text>" << std::endl;
        y += 5;
    }
    vizFile << "  </g>" << std::endl;

    vizFile << "</svg>" << std::endl;
    vizFile.close();
    if (vizFile.fail()) {
        std::cerr << "Error: Failed writing preview file: " << outputFile << std::endl;
        return false;
    }

    std::cout << "Bed preview saved to: " << outputFile << std::endl;
    return true;
}

std::string Utils::classColor(OperationClass opClass) {
    switch (opClass) {
        case OperationClass::NORMAL: return "#000000";
        case OperationClass::FRANGIBLE: return "#0000ff";
        case OperationClass::STOP: return "#ff0000";
        case OperationClass::PIPETTE: return "#ff00ff";
    }
    return "#000000";
}

std::string Utils::colorToHex(uint32_t rgb) {
    std::stringstream ss;
    ss << "#" << std::hex << std::setfill('0') << std::setw(6) << (rgb & 0xFFFFFF);
    return ss.str();
}

OperationClass Utils::classifyColor(uint32_t rgb) {
    switch (rgb & 0xFFFFFF) {
        case 0xFF0000:
            return OperationClass::STOP;
        case 0x0000FF:
            return OperationClass::FRANGIBLE;
        case 0xFF00FF: // magenta
        case 0xFF69B4: // hot pink
        case 0xFFC0CB: // pink
            return OperationClass::PIPETTE;
        default:
            return OperationClass::NORMAL;
    }
}

std::string Utils::formatNumber(double value, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string Utils::formatCompact(double value, int maxPrecision) {
    std::string text = formatNumber(value, maxPrecision);
    if (text.find('.') != std::string::npos) {
        size_t last = text.find_last_not_of('0');
        if (text[last] == '.') {
            --last;
        }
        text.erase(last + 1);
    }
    if (text == "-0") {
        text = "0";
    }
    return text;
}

std::string Utils::getFileExtension(const std::string& path) {
    std::string fileName = getFileName(path);
    size_t pos = fileName.find_last_of('.');
    if (pos == std::string::npos) {
        return "";
    }
    return fileName.substr(pos + 1);
}

std::string Utils::getFileName(const std::string& path) {
    size_t lastSeparator = path.find_last_of("/\\");
    return (lastSeparator == std::string::npos) ? path : path.substr(lastSeparator + 1);
}

std::string Utils::getBaseName(const std::string& path) {
    std::string fileName = getFileName(path);

    // Remove extension
    size_t lastDot = fileName.find_last_of('.');
    if (lastDot != std::string::npos) {
        fileName = fileName.substr(0, lastDot);
    }

    return fileName;
}

std::string Utils::replaceExtension(const std::string& path, const std::string& newExtension) {
    size_t lastSeparator = path.find_last_of("/\\");
    size_t lastDot = path.find_last_of('.');

    if (lastDot == std::string::npos ||
        (lastSeparator != std::string::npos && lastDot < lastSeparator)) {
        return path + "." + newExtension;
    }

    return path.substr(0, lastDot + 1) + newExtension;
}

} // namespace core
} // namespace microweld
