#include "microweld/config.h"
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace microweld::core;

// Helper function to get numeric input with validation; empty input keeps the default
template<typename T>
T getNumericInput(const std::string& prompt, T defaultValue, T minValue, T maxValue) {
    T value;
    while (true) {
        std::string input;
        std::cout << prompt << " [" << defaultValue << "]: ";
        if (!std::getline(std::cin, input) || input.empty()) {
            return defaultValue;
        }

        std::istringstream ss(input);
        if (ss >> value) {
            if (value >= minValue && value <= maxValue) {
                break;
            } else {
                std::cout << "Error: Value must be between " << minValue << " and " << maxValue << std::endl;
            }
        } else {
            std::cout << "Error: Invalid input. Please enter a number." << std::endl;
        }
    }

    return value;
}

// Helper function to get yes/no input
bool getYesNoInput(const std::string& prompt, bool defaultValue) {
    std::string input;
    std::string defaultStr = defaultValue ? "Y/n" : "y/N";

    std::cout << prompt << " [" << defaultStr << "]: ";
    std::getline(std::cin, input);

    if (input.empty()) {
        return defaultValue;
    }

    return (input[0] == 'Y' || input[0] == 'y');
}

// Helper function to get string input with default value
std::string getStringInput(const std::string& prompt, const std::string& defaultValue) {
    std::string input;

    std::cout << prompt << " [" << defaultValue << "]: ";
    std::getline(std::cin, input);

    if (input.empty()) {
        return defaultValue;
    }

    return input;
}

void runConfigWizard(WeldConfig& config) {
    std::cout << "\n====================================" << std::endl;
    std::cout << "MicroWeld Configuration Wizard" << std::endl;
    std::cout << "====================================" << std::endl;
    std::cout << "This wizard will help you set up your welding configuration." << std::endl;
    std::cout << "Press Enter to accept default values shown in brackets." << std::endl;
    std::cout << "------------------------------------" << std::endl;

    // Printer settings
    std::cout << "\n--- Printer Settings ---" << std::endl;
    config.setBedSizeX(getNumericInput<double>("Bed width (mm)", config.getBedSizeX(), 10.0, 1000.0));
    config.setBedSizeY(getNumericInput<double>("Bed depth (mm)", config.getBedSizeY(), 10.0, 1000.0));
    config.setEnableBedLeveling(getYesNoInput("Run auto bed leveling (G29)?", config.getEnableBedLeveling()));

    // Temperatures
    std::cout << "\n--- Temperatures ---" << std::endl;
    config.setEnableHeating(getYesNoInput("Heat bed and nozzle before welding?", config.getEnableHeating()));
    if (config.getEnableHeating()) {
        config.setBedTemperature(getNumericInput<double>("Bed temperature (C)", config.getBedTemperature(), 0.0, 150.0));
        config.setNozzleTemperature(getNumericInput<double>("Nozzle temperature (C)", config.getNozzleTemperature(), 0.0, 300.0));
    }
    config.setUseChamberHeating(getYesNoInput("Use chamber heating?", config.getUseChamberHeating()));
    if (config.getUseChamberHeating()) {
        config.setChamberTemperature(getNumericInput<double>("Chamber temperature (C)", config.getChamberTemperature(), 0.0, 150.0));
    }
    config.setEnableCooldown(getYesNoInput("Cool down heaters at the end?", config.getEnableCooldown()));
    if (config.getEnableCooldown()) {
        config.setCooldownTemperature(getNumericInput<double>("Cooldown temperature (C)", config.getCooldownTemperature(), 0.0, 300.0));
    }

    // Movement
    std::cout << "\n--- Movement ---" << std::endl;
    config.setMoveHeight(getNumericInput<double>("High travel height (mm)", config.getMoveHeight(), 0.0, 50.0));
    config.setLowTravelHeight(getNumericInput<double>("Low travel height between welds (mm)", config.getLowTravelHeight(), 0.0, 10.0));
    config.setXYSpeed(getNumericInput<double>("XY speed (mm/min)", config.getXYSpeed(), 1.0, 20000.0));
    config.setZSpeed(getNumericInput<double>("Z speed (mm/min)", config.getZSpeed(), 1.0, 5000.0));
    config.setWeldCompressionOffset(getNumericInput<double>("Weld compression offset (mm)", config.getWeldCompressionOffset(), 0.0, 5.0));

    // Welds
    std::cout << "\n--- Welds ---" << std::endl;
    OperationParams normal = config.getNormalWeld();
    normal.height = getNumericInput<double>("Normal weld height (mm)", normal.height, 0.0, 5.0);
    normal.durationSeconds = getNumericInput<double>("Normal weld time (s)", normal.durationSeconds, 0.0, 60.0);
    normal.initialDotSpacing = getNumericInput<double>("Normal first pass dot spacing, 0 for one pass (mm)", normal.initialDotSpacing, 0.0, 50.0);
    normal.coolingSeconds = getNumericInput<double>("Normal cooling time between passes (s)", normal.coolingSeconds, 0.0, 60.0);
    config.setNormalWeld(normal);

    OperationParams frangible = config.getFrangibleWeld();
    frangible.height = getNumericInput<double>("Frangible weld height (mm)", frangible.height, 0.0, 5.0);
    frangible.durationSeconds = getNumericInput<double>("Frangible weld time (s)", frangible.durationSeconds, 0.0, 60.0);
    frangible.initialDotSpacing = getNumericInput<double>("Frangible first pass dot spacing, 0 for one pass (mm)", frangible.initialDotSpacing, 0.0, 50.0);
    frangible.coolingSeconds = getNumericInput<double>("Frangible cooling time between passes (s)", frangible.coolingSeconds, 0.0, 60.0);
    config.setFrangibleWeld(frangible);

    config.setDotSpacing(getNumericInput<double>("Dot spacing (mm)", config.getDotSpacing(), 0.05, 50.0));

    // Output
    std::cout << "\n--- Output ---" << std::endl;
    config.setIncludeUserPause(getYesNoInput("Pause for plastic sheet insertion?", config.getIncludeUserPause()));
    if (config.getIncludeUserPause()) {
        config.setUserPauseMessage(getStringInput("Pause message", config.getUserPauseMessage()));
    }

    std::cout << "\nConfiguration complete!" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string configFile = "microweld.cfg";

    // Check for custom config file path
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        }
    }

    WeldConfig config;

    // Check if this is the first run
    bool firstRun = WeldConfig::isFirstRun(configFile);

    if (firstRun) {
        std::cout << "No configuration file found. Starting setup wizard..." << std::endl;
        runConfigWizard(config);

        if (config.saveToFile(configFile)) {
            std::cout << "Configuration saved to: " << configFile << std::endl;
        } else {
            std::cerr << "Error: Failed to save configuration." << std::endl;
            return 1;
        }
    } else {
        // Load existing configuration
        if (!config.loadFromFile(configFile)) {
            std::cerr << "Error: Failed to load configuration from: " << configFile << std::endl;
            return 1;
        }

        std::cout << "Configuration loaded from: " << configFile << std::endl;

        // Ask if the user wants to modify the configuration
        if (getYesNoInput("Would you like to modify the configuration?", false)) {
            runConfigWizard(config);

            if (config.saveToFile(configFile)) {
                std::cout << "Configuration updated and saved to: " << configFile << std::endl;
            } else {
                std::cerr << "Error: Failed to save configuration." << std::endl;
                return 1;
            }
        }
    }

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        std::cerr << "Warning: The configuration has invalid values:" << std::endl;
        for (const auto& error : errors) {
            std::cerr << "  " << error << std::endl;
        }
    }

    // Display the current configuration
    std::cout << "\n====================================" << std::endl;
    std::cout << "Current Configuration" << std::endl;
    std::cout << "====================================" << std::endl;
    std::cout << "Printer:" << std::endl;
    std::cout << "  Bed Size: " << config.getBedSizeX() << " x " << config.getBedSizeY() << " mm" << std::endl;
    std::cout << "  Bed Leveling: " << (config.getEnableBedLeveling() ? "on" : "off") << std::endl;
    std::cout << "Temperatures:" << std::endl;
    if (config.getEnableHeating()) {
        std::cout << "  Bed / Nozzle: " << config.getBedTemperature() << " / "
                  << config.getNozzleTemperature() << " C" << std::endl;
    } else {
        std::cout << "  Heating: off" << std::endl;
    }
    if (config.getUseChamberHeating()) {
        std::cout << "  Chamber: " << config.getChamberTemperature() << " C" << std::endl;
    }
    std::cout << "Movement:" << std::endl;
    std::cout << "  Travel Heights: " << config.getMoveHeight() << " / " << config.getLowTravelHeight() << " mm" << std::endl;
    std::cout << "  Speeds (XY / Z): " << config.getXYSpeed() << " / " << config.getZSpeed() << " mm/min" << std::endl;
    std::cout << "  Compression Offset: " << config.getWeldCompressionOffset() << " mm" << std::endl;
    std::cout << "Welds:" << std::endl;
    std::cout << "  Normal: " << config.getNormalWeld().height << " mm for "
              << config.getNormalWeld().durationSeconds << " s, first pass spacing "
              << config.getNormalWeld().initialDotSpacing << " mm, cooling "
              << config.getNormalWeld().coolingSeconds << " s" << std::endl;
    std::cout << "  Frangible: " << config.getFrangibleWeld().height << " mm for "
              << config.getFrangibleWeld().durationSeconds << " s, first pass spacing "
              << config.getFrangibleWeld().initialDotSpacing << " mm, cooling "
              << config.getFrangibleWeld().coolingSeconds << " s" << std::endl;
    std::cout << "  Dot Spacing: " << config.getDotSpacing() << " mm" << std::endl;

    return 0;
}
