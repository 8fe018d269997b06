#ifndef MICROWELD_UTILS_H
#define MICROWELD_UTILS_H

#include <cstdint>
#include <string>
#include <vector>
#include "microweld/geometry.h"
#include "microweld/config.h"

namespace microweld {
namespace core {

class Utils {
public:
    // Save vectorized paths to a CSV file (path_id,class,point_index,x,y)
    static bool savePathsToCSV(const std::vector<Path>& paths, const std::string& filename);

    // Generate an SVG showing the weld points as they land on the bed after centering
    static bool generateBedPreview(const std::vector<Path>& paths,
                                   const CenteringOffset& offset,
                                   const WeldConfig& config,
                                   const std::string& outputFile);

    // Preview colour used for an operation class
    static std::string classColor(OperationClass opClass);

    // Convert a 0xRRGGBB color value to a "#rrggbb" string
    static std::string colorToHex(uint32_t rgb);

    /**
     * Operation class selected by a stroke colour: red is STOP, blue is
     * FRANGIBLE, magenta and the pinks are PIPETTE, anything else NORMAL
     * @param rgb Colour as 0xRRGGBB
     */
    static OperationClass classifyColor(uint32_t rgb);

    // Format a number with a specific precision
    static std::string formatNumber(double value, int precision = 3);

    // Format a number with at most maxPrecision decimals, dropping trailing zeros
    static std::string formatCompact(double value, int maxPrecision = 3);

    // Get the file extension from a path
    static std::string getFileExtension(const std::string& path);

    // Get the last path component (directory removed, extension kept)
    static std::string getFileName(const std::string& path);

    // Get the filename without directory and extension
    static std::string getBaseName(const std::string& path);

    // Generate a filename with a different extension
    static std::string replaceExtension(const std::string& path, const std::string& newExtension);
};

} // namespace core
} // namespace microweld

#endif // MICROWELD_UTILS_H
