#include "microweld/config.h"
#include "microweld/errors.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using namespace microweld::core;

namespace {

std::string tempPath(const std::string& name) {
    return ::testing::TempDir() + name;
}

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

} // namespace

TEST(WeldConfigTest, Defaults) {
    WeldConfig config;

    EXPECT_DOUBLE_EQ(config.getBedSizeX(), 250.0);
    EXPECT_DOUBLE_EQ(config.getBedSizeY(), 220.0);
    EXPECT_FALSE(config.getEnableBedLeveling());
    EXPECT_TRUE(config.getEnableHeating());
    EXPECT_DOUBLE_EQ(config.getBedTemperature(), 35.0);
    EXPECT_DOUBLE_EQ(config.getNozzleTemperature(), 160.0);
    EXPECT_FALSE(config.getUseChamberHeating());
    EXPECT_FALSE(config.getEnableCooldown());
    EXPECT_DOUBLE_EQ(config.getMoveHeight(), 5.0);
    EXPECT_DOUBLE_EQ(config.getLowTravelHeight(), 0.2);
    EXPECT_DOUBLE_EQ(config.getXYSpeed(), 3000.0);
    EXPECT_DOUBLE_EQ(config.getZSpeed(), 600.0);
    EXPECT_DOUBLE_EQ(config.getWeldCompressionOffset(), 0.3);
    EXPECT_DOUBLE_EQ(config.getDotSpacing(), 2.0);
    EXPECT_TRUE(config.getIncludeUserPause());
    EXPECT_EQ(config.getUserPauseMessage(), "Insert plastic sheets...");

    std::vector<std::string> errors;
    EXPECT_TRUE(config.validate(errors));
    EXPECT_TRUE(errors.empty());
}

TEST(WeldConfigTest, OperationParamsComeFromOneRecord) {
    WeldConfig config;

    OperationParams normal = config.operationParams(OperationClass::NORMAL);
    EXPECT_DOUBLE_EQ(normal.height, 0.1);
    EXPECT_DOUBLE_EQ(normal.durationSeconds, 1.0);

    OperationParams frangible = config.operationParams(OperationClass::FRANGIBLE);
    EXPECT_DOUBLE_EQ(frangible.height, 0.15);
    EXPECT_DOUBLE_EQ(frangible.durationSeconds, 0.5);

    config.setFrangibleWeld(OperationParams{0.35, 0.2});
    EXPECT_DOUBLE_EQ(config.operationParams(OperationClass::FRANGIBLE).height, 0.35);
    EXPECT_DOUBLE_EQ(config.getFrangibleWeld().height, 0.35);

    EXPECT_THROW(config.operationParams(OperationClass::STOP), ConfigError);
    EXPECT_THROW(config.operationParams(OperationClass::PIPETTE), ConfigError);
}

TEST(WeldConfigTest, LoadOverridesDefaults) {
    std::string path = tempPath("microweld_load.cfg");
    writeFile(path,
              "# comment\n"
              "; another comment\n"
              "\n"
              "[printer]\n"
              "bed_size_x = 300\n"
              "enable_bed_leveling=yes\n"
              "[temperatures]\n"
              "enable_heating=false\n"
              "use_chamber_heating=true\n"
              "chamber_temperature=45\n"
              "[movement]\n"
              "weld_compression_offset=0\n"
              "[frangible_welds]\n"
              "weld_height=0.2\n"
              "weld_time=0.75\n"
              "initial_dot_spacing=6\n"
              "cooling_time_between_passes=0.5\n"
              "[geometry]\n"
              "dot_spacing=1.5\n"
              "[output]\n"
              "user_pause_message=Load the film\n"
              "unknown_key=ignored\n");

    WeldConfig config;
    ASSERT_TRUE(config.loadFromFile(path));

    EXPECT_DOUBLE_EQ(config.getBedSizeX(), 300.0);
    EXPECT_DOUBLE_EQ(config.getBedSizeY(), 220.0);
    EXPECT_TRUE(config.getEnableBedLeveling());
    EXPECT_FALSE(config.getEnableHeating());
    EXPECT_TRUE(config.getUseChamberHeating());
    EXPECT_DOUBLE_EQ(config.getChamberTemperature(), 45.0);
    EXPECT_DOUBLE_EQ(config.getWeldCompressionOffset(), 0.0);
    EXPECT_DOUBLE_EQ(config.getFrangibleWeld().height, 0.2);
    EXPECT_DOUBLE_EQ(config.getFrangibleWeld().durationSeconds, 0.75);
    EXPECT_DOUBLE_EQ(config.getFrangibleWeld().initialDotSpacing, 6.0);
    EXPECT_DOUBLE_EQ(config.getFrangibleWeld().coolingSeconds, 0.5);
    EXPECT_DOUBLE_EQ(config.getNormalWeld().initialDotSpacing, 3.6);
    EXPECT_DOUBLE_EQ(config.getDotSpacing(), 1.5);
    EXPECT_EQ(config.getUserPauseMessage(), "Load the film");

    std::remove(path.c_str());
}

TEST(WeldConfigTest, SaveAndReload) {
    std::string path = tempPath("microweld_save.cfg");

    WeldConfig saved;
    saved.setBedSizeY(180.0);
    saved.setEnableCooldown(true);
    saved.setCooldownTemperature(40.0);
    saved.setNormalWeld(OperationParams{0.12, 1.5, 8.0, 3.0});
    saved.setIncludeUserPause(false);
    ASSERT_TRUE(saved.saveToFile(path));
    EXPECT_FALSE(WeldConfig::isFirstRun(path));

    WeldConfig loaded;
    ASSERT_TRUE(loaded.loadFromFile(path));
    EXPECT_DOUBLE_EQ(loaded.getBedSizeY(), 180.0);
    EXPECT_TRUE(loaded.getEnableCooldown());
    EXPECT_DOUBLE_EQ(loaded.getCooldownTemperature(), 40.0);
    EXPECT_DOUBLE_EQ(loaded.getNormalWeld().height, 0.12);
    EXPECT_DOUBLE_EQ(loaded.getNormalWeld().durationSeconds, 1.5);
    EXPECT_DOUBLE_EQ(loaded.getNormalWeld().initialDotSpacing, 8.0);
    EXPECT_DOUBLE_EQ(loaded.getNormalWeld().coolingSeconds, 3.0);
    EXPECT_FALSE(loaded.getIncludeUserPause());

    std::remove(path.c_str());
}

TEST(WeldConfigTest, MissingFile) {
    std::string path = tempPath("microweld_missing.cfg");
    std::remove(path.c_str());

    EXPECT_TRUE(WeldConfig::isFirstRun(path));

    WeldConfig config;
    EXPECT_FALSE(config.loadFromFile(path));
}

TEST(WeldConfigTest, InvalidValuesFailToLoad) {
    std::string path = tempPath("microweld_invalid.cfg");

    writeFile(path, "[geometry]\ndot_spacing=wide\n");
    WeldConfig config;
    EXPECT_FALSE(config.loadFromFile(path));

    writeFile(path, "[output]\ninclude_user_pause=maybe\n");
    EXPECT_FALSE(config.loadFromFile(path));

    std::remove(path.c_str());
}

TEST(WeldConfigTest, ValidateReportsEachProblem) {
    WeldConfig config;
    config.setBedTemperature(200.0);
    config.setNozzleTemperature(-5.0);
    config.setDotSpacing(0.0);
    config.setZSpeed(0.0);

    std::vector<std::string> errors;
    EXPECT_FALSE(config.validate(errors));
    EXPECT_EQ(errors.size(), 4u);
}

TEST(WeldConfigTest, NegativePassSettingsAreRejected) {
    WeldConfig config;
    OperationParams normal = config.getNormalWeld();
    normal.coolingSeconds = -1.0;
    config.setNormalWeld(normal);

    std::vector<std::string> errors;
    EXPECT_FALSE(config.validate(errors));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("cooling_time_between_passes"), std::string::npos);
}
