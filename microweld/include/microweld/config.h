#ifndef MICROWELD_CONFIG_H
#define MICROWELD_CONFIG_H

#include "microweld/geometry.h"
#include <string>
#include <vector>

namespace microweld {
namespace core {

/**
 * Height, dwell and pass plan used for one weld operation
 */
struct OperationParams {
    double height;                   // Z height during the dwell (mm)
    double durationSeconds;          // Dwell duration (s)
    double initialDotSpacing = 0.0;  // Dot spacing of the first pass, 0 for a single pass (mm)
    double coolingSeconds = 0.0;     // Pause before each later pass (s)
};

/**
 * Configuration for the welding machine and the conversion run
 */
class WeldConfig {
public:
    WeldConfig();
    ~WeldConfig();

    /**
     * Initialize with default values
     */
    void setDefaults();

    /**
     * Load configuration from file
     * @param filename Path to the config file
     * @return True if loaded successfully
     */
    bool loadFromFile(const std::string& filename);

    /**
     * Save configuration to file
     * @param filename Path where to save the config
     * @return True if saved successfully
     */
    bool saveToFile(const std::string& filename) const;

    /**
     * Check if this is the first run (no config file exists)
     * @param filename Path to the config file
     * @return True if the config file doesn't exist
     */
    static bool isFirstRun(const std::string& filename);

    /**
     * Range-check every value
     * @param errors Receives one message per invalid value
     * @return True if the configuration is usable
     */
    bool validate(std::vector<std::string>& errors) const;

    /**
     * Height and dwell for a timed operation class. STOP and PIPETTE have
     * no configured parameters and are rejected with ConfigError.
     */
    OperationParams operationParams(OperationClass opClass) const;

    // Printer
    double getBedSizeX() const { return m_bedSizeX; }
    void setBedSizeX(double size) { m_bedSizeX = size; }

    double getBedSizeY() const { return m_bedSizeY; }
    void setBedSizeY(double size) { m_bedSizeY = size; }

    bool getEnableBedLeveling() const { return m_enableBedLeveling; }
    void setEnableBedLeveling(bool enable) { m_enableBedLeveling = enable; }

    // Temperatures
    bool getEnableHeating() const { return m_enableHeating; }
    void setEnableHeating(bool enable) { m_enableHeating = enable; }

    double getBedTemperature() const { return m_bedTemperature; }
    void setBedTemperature(double temp) { m_bedTemperature = temp; }

    double getNozzleTemperature() const { return m_nozzleTemperature; }
    void setNozzleTemperature(double temp) { m_nozzleTemperature = temp; }

    bool getUseChamberHeating() const { return m_useChamberHeating; }
    void setUseChamberHeating(bool use) { m_useChamberHeating = use; }

    double getChamberTemperature() const { return m_chamberTemperature; }
    void setChamberTemperature(double temp) { m_chamberTemperature = temp; }

    bool getEnableCooldown() const { return m_enableCooldown; }
    void setEnableCooldown(bool enable) { m_enableCooldown = enable; }

    double getCooldownTemperature() const { return m_cooldownTemperature; }
    void setCooldownTemperature(double temp) { m_cooldownTemperature = temp; }

    // Movement
    double getMoveHeight() const { return m_moveHeight; }
    void setMoveHeight(double height) { m_moveHeight = height; }

    double getLowTravelHeight() const { return m_lowTravelHeight; }
    void setLowTravelHeight(double height) { m_lowTravelHeight = height; }

    double getXYSpeed() const { return m_xySpeed; }
    void setXYSpeed(double speed) { m_xySpeed = speed; }

    double getZSpeed() const { return m_zSpeed; }
    void setZSpeed(double speed) { m_zSpeed = speed; }

    double getWeldCompressionOffset() const { return m_weldCompressionOffset; }
    void setWeldCompressionOffset(double offset) { m_weldCompressionOffset = offset; }

    // Welds
    OperationParams getNormalWeld() const { return m_normalWeld; }
    void setNormalWeld(const OperationParams& params) { m_normalWeld = params; }

    OperationParams getFrangibleWeld() const { return m_frangibleWeld; }
    void setFrangibleWeld(const OperationParams& params) { m_frangibleWeld = params; }

    // Geometry
    double getDotSpacing() const { return m_dotSpacing; }
    void setDotSpacing(double spacing) { m_dotSpacing = spacing; }

    // Output
    bool getIncludeUserPause() const { return m_includeUserPause; }
    void setIncludeUserPause(bool include) { m_includeUserPause = include; }

    const std::string& getUserPauseMessage() const { return m_userPauseMessage; }
    void setUserPauseMessage(const std::string& message) { m_userPauseMessage = message; }

private:
    // Printer properties
    double m_bedSizeX;              // Work surface width (mm)
    double m_bedSizeY;              // Work surface depth (mm)
    bool m_enableBedLeveling;       // Emit G29 in the header

    // Temperatures (Celsius)
    bool m_enableHeating;
    double m_bedTemperature;
    double m_nozzleTemperature;
    bool m_useChamberHeating;
    double m_chamberTemperature;
    bool m_enableCooldown;
    double m_cooldownTemperature;

    // Movement
    double m_moveHeight;            // High travel height (mm)
    double m_lowTravelHeight;       // Travel height between weld points (mm)
    double m_xySpeed;               // Feed rate for X/Y movement (mm/min)
    double m_zSpeed;                // Feed rate for Z movement (mm/min)
    double m_weldCompressionOffset; // One-time Z origin shift (mm)

    OperationParams m_normalWeld;
    OperationParams m_frangibleWeld;

    double m_dotSpacing;            // Target spacing between weld points (mm)

    bool m_includeUserPause;
    std::string m_userPauseMessage;

    // Helper methods for parsing
    bool parseLine(const std::string& line, std::string& key, std::string& value) const;
    static bool parseBool(const std::string& value, bool& result);
    static std::string trim(const std::string& str);
};

} // namespace core
} // namespace microweld

#endif // MICROWELD_CONFIG_H
