#include "microweld/config.h"
#include "microweld/errors.h"
#include <fstream>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace microweld {
namespace core {

WeldConfig::WeldConfig() {
    setDefaults();
}

WeldConfig::~WeldConfig() = default;

void WeldConfig::setDefaults() {
    // Printer properties
    m_bedSizeX = 250.0;
    m_bedSizeY = 220.0;
    m_enableBedLeveling = false;

    // Temperatures
    m_enableHeating = true;
    m_bedTemperature = 35.0;
    m_nozzleTemperature = 160.0;
    m_useChamberHeating = false;
    m_chamberTemperature = 35.0;
    m_enableCooldown = false;
    m_cooldownTemperature = 50.0;

    // Movement
    m_moveHeight = 5.0;
    m_lowTravelHeight = 0.2;
    m_xySpeed = 3000.0;
    m_zSpeed = 600.0;
    m_weldCompressionOffset = 0.3;

    // Welds
    m_normalWeld = OperationParams{0.1, 1.0, 3.6, 2.0};
    m_frangibleWeld = OperationParams{0.15, 0.5, 3.6, 1.5};

    m_dotSpacing = 2.0;

    // Output
    m_includeUserPause = true;
    m_userPauseMessage = "Insert plastic sheets...";
}

bool WeldConfig::isFirstRun(const std::string& filename) {
    std::ifstream file(filename);
    return !file.good();
}

bool WeldConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file: " << filename << std::endl;
        return false;
    }

    std::string line;
    std::string section;
    int lineNumber = 0;

    // First set defaults, then override with values from file
    setDefaults();

    while (std::getline(file, line)) {
        ++lineNumber;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header
        if (line[0] == '[' && line[line.length() - 1] == ']') {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        std::string key, value;
        if (!parseLine(line, key, value)) {
            std::cerr << "Warning: Ignoring malformed line " << lineNumber
                      << " in " << filename << std::endl;
            continue;
        }

        bool ok = true;
        try {
            if (section == "printer") {
                if (key == "bed_size_x") m_bedSizeX = std::stod(value);
                else if (key == "bed_size_y") m_bedSizeY = std::stod(value);
                else if (key == "enable_bed_leveling") ok = parseBool(value, m_enableBedLeveling);
            }
            else if (section == "temperatures") {
                if (key == "enable_heating") ok = parseBool(value, m_enableHeating);
                else if (key == "bed_temperature") m_bedTemperature = std::stod(value);
                else if (key == "nozzle_temperature") m_nozzleTemperature = std::stod(value);
                else if (key == "use_chamber_heating") ok = parseBool(value, m_useChamberHeating);
                else if (key == "chamber_temperature") m_chamberTemperature = std::stod(value);
                else if (key == "enable_cooldown") ok = parseBool(value, m_enableCooldown);
                else if (key == "cooldown_temperature") m_cooldownTemperature = std::stod(value);
            }
            else if (section == "movement") {
                if (key == "move_height") m_moveHeight = std::stod(value);
                else if (key == "low_travel_height") m_lowTravelHeight = std::stod(value);
                else if (key == "xy_speed") m_xySpeed = std::stod(value);
                else if (key == "z_speed") m_zSpeed = std::stod(value);
                else if (key == "weld_compression_offset") m_weldCompressionOffset = std::stod(value);
            }
            else if (section == "normal_welds") {
                if (key == "weld_height") m_normalWeld.height = std::stod(value);
                else if (key == "weld_time") m_normalWeld.durationSeconds = std::stod(value);
                else if (key == "initial_dot_spacing") m_normalWeld.initialDotSpacing = std::stod(value);
                else if (key == "cooling_time_between_passes") m_normalWeld.coolingSeconds = std::stod(value);
            }
            else if (section == "frangible_welds") {
                if (key == "weld_height") m_frangibleWeld.height = std::stod(value);
                else if (key == "weld_time") m_frangibleWeld.durationSeconds = std::stod(value);
                else if (key == "initial_dot_spacing") m_frangibleWeld.initialDotSpacing = std::stod(value);
                else if (key == "cooling_time_between_passes") m_frangibleWeld.coolingSeconds = std::stod(value);
            }
            else if (section == "geometry") {
                if (key == "dot_spacing") m_dotSpacing = std::stod(value);
            }
            else if (section == "output") {
                if (key == "include_user_pause") ok = parseBool(value, m_includeUserPause);
                else if (key == "user_pause_message") m_userPauseMessage = value;
            }
        } catch (const std::invalid_argument&) {
            ok = false;
        } catch (const std::out_of_range&) {
            ok = false;
        }

        if (!ok) {
            std::cerr << "Error: Invalid value '" << value << "' for " << section << "."
                      << key << " (" << filename << ":" << lineNumber << ")" << std::endl;
            return false;
        }
    }

    return true;
}

bool WeldConfig::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file for writing: " << filename << std::endl;
        return false;
    }

    const char* yes = "true";
    const char* no = "false";

    // Write file header
    file << "# MicroWeld Configuration File" << std::endl;
    file << "# Automatically generated" << std::endl << std::endl;

    file << "[printer]" << std::endl;
    file << "bed_size_x=" << m_bedSizeX << std::endl;
    file << "bed_size_y=" << m_bedSizeY << std::endl;
    file << "enable_bed_leveling=" << (m_enableBedLeveling ? yes : no) << std::endl << std::endl;

    file << "[temperatures]" << std::endl;
    file << "enable_heating=" << (m_enableHeating ? yes : no) << std::endl;
    file << "bed_temperature=" << m_bedTemperature << std::endl;
    file << "nozzle_temperature=" << m_nozzleTemperature << std::endl;
    file << "use_chamber_heating=" << (m_useChamberHeating ? yes : no) << std::endl;
    file << "chamber_temperature=" << m_chamberTemperature << std::endl;
    file << "enable_cooldown=" << (m_enableCooldown ? yes : no) << std::endl;
    file << "cooldown_temperature=" << m_cooldownTemperature << std::endl << std::endl;

    file << "[movement]" << std::endl;
    file << "move_height=" << m_moveHeight << std::endl;
    file << "low_travel_height=" << m_lowTravelHeight << std::endl;
    file << "xy_speed=" << m_xySpeed << std::endl;
    file << "z_speed=" << m_zSpeed << std::endl;
    file << "weld_compression_offset=" << m_weldCompressionOffset << std::endl << std::endl;

    file << "[normal_welds]" << std::endl;
    file << "weld_height=" << m_normalWeld.height << std::endl;
    file << "weld_time=" << m_normalWeld.durationSeconds << std::endl;
    file << "initial_dot_spacing=" << m_normalWeld.initialDotSpacing << std::endl;
    file << "cooling_time_between_passes=" << m_normalWeld.coolingSeconds << std::endl << std::endl;

    file << "[frangible_welds]" << std::endl;
    file << "weld_height=" << m_frangibleWeld.height << std::endl;
    file << "weld_time=" << m_frangibleWeld.durationSeconds << std::endl;
    file << "initial_dot_spacing=" << m_frangibleWeld.initialDotSpacing << std::endl;
    file << "cooling_time_between_passes=" << m_frangibleWeld.coolingSeconds << std::endl << std::endl;

    file << "[geometry]" << std::endl;
    file << "dot_spacing=" << m_dotSpacing << std::endl << std::endl;

    file << "[output]" << std::endl;
    file << "include_user_pause=" << (m_includeUserPause ? yes : no) << std::endl;
    file << "user_pause_message=" << m_userPauseMessage << std::endl;

    file.close();
    if (file.fail()) {
        std::cerr << "Error: Failed writing config file: " << filename << std::endl;
        return false;
    }
    return true;
}

bool WeldConfig::validate(std::vector<std::string>& errors) const {
    errors.clear();

    if (m_bedSizeX <= 0 || m_bedSizeY <= 0) {
        errors.push_back("bed_size_x and bed_size_y must be positive");
    }
    if (m_bedTemperature < 0 || m_bedTemperature > 150) {
        errors.push_back("bed_temperature must be between 0 and 150 C");
    }
    if (m_nozzleTemperature < 0 || m_nozzleTemperature > 300) {
        errors.push_back("nozzle_temperature must be between 0 and 300 C");
    }
    if (m_useChamberHeating && (m_chamberTemperature < 0 || m_chamberTemperature > 150)) {
        errors.push_back("chamber_temperature must be between 0 and 150 C");
    }
    if (m_enableCooldown && (m_cooldownTemperature < 0 || m_cooldownTemperature > 300)) {
        errors.push_back("cooldown_temperature must be between 0 and 300 C");
    }
    if (m_moveHeight < 0) {
        errors.push_back("move_height must not be negative");
    }
    if (m_lowTravelHeight < 0) {
        errors.push_back("low_travel_height must not be negative");
    }
    if (m_xySpeed <= 0 || m_zSpeed <= 0) {
        errors.push_back("xy_speed and z_speed must be positive");
    }
    if (m_weldCompressionOffset < 0) {
        errors.push_back("weld_compression_offset must not be negative");
    }
    if (m_normalWeld.height < 0 || m_normalWeld.durationSeconds < 0) {
        errors.push_back("normal_welds weld_height and weld_time must not be negative");
    }
    if (m_frangibleWeld.height < 0 || m_frangibleWeld.durationSeconds < 0) {
        errors.push_back("frangible_welds weld_height and weld_time must not be negative");
    }
    if (m_normalWeld.initialDotSpacing < 0 || m_normalWeld.coolingSeconds < 0 ||
        m_frangibleWeld.initialDotSpacing < 0 || m_frangibleWeld.coolingSeconds < 0) {
        errors.push_back("initial_dot_spacing and cooling_time_between_passes must not be negative");
    }
    if (m_dotSpacing <= 0) {
        errors.push_back("dot_spacing must be positive");
    }

    return errors.empty();
}

OperationParams WeldConfig::operationParams(OperationClass opClass) const {
    switch (opClass) {
        case OperationClass::NORMAL:
            return m_normalWeld;
        case OperationClass::FRANGIBLE:
            return m_frangibleWeld;
        case OperationClass::STOP:
        case OperationClass::PIPETTE:
            break;
    }
    throw ConfigError("No weld parameters are configured for operation class '" +
                      operationClassToString(opClass) + "'");
}

bool WeldConfig::parseLine(const std::string& line, std::string& key, std::string& value) const {
    size_t pos = line.find('=');
    if (pos == std::string::npos) {
        return false;
    }

    key = trim(line.substr(0, pos));
    value = trim(line.substr(pos + 1));

    return !key.empty();
}

bool WeldConfig::parseBool(const std::string& value, bool& result) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        result = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        result = false;
        return true;
    }
    return false;
}

std::string WeldConfig::trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char c) {
        return std::isspace(c);
    });

    auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace core
} // namespace microweld
