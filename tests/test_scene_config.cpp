#include <gtest/gtest.h>
#include <fstream>
#include <limits>
#include <string>

#include "SceneConfig.hpp"

using namespace skyline;

namespace {

std::string writeConfig(const char* name, const std::string& contents) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << contents;
    return path;
}

} // namespace

TEST(SceneConfig, MissingFileKeepsDefaults) {
    SceneConfig config;
    EXPECT_FALSE(config.loadFromFile("/nonexistent/skyline.json"));
    EXPECT_EQ(config.buildingCount, 50);
    EXPECT_EQ(config.chunkCount, 3);
    EXPECT_FLOAT_EQ(config.chunkLength, 1000.0f);
}

TEST(SceneConfig, EmptyFileIsRejected) {
    SceneConfig config;
    std::string path = writeConfig("skyline_empty.json", "");
    EXPECT_FALSE(config.loadFromFile(path.c_str()));
    EXPECT_EQ(config.buildingCount, 50);
}

TEST(SceneConfig, ReadsNestedKeys) {
    std::string path = writeConfig("skyline_values.json", R"({
        "buildings": { "building_count": 12, "min_height": 40.5, "fin_chance": 0.5 },
        "chunks": { "chunk_length": 600, "chunk_count": 4 },
        "fog": { "fog_enabled": false, "fog_density": 0.002 },
        "lighting": { "sun_position": [1.0, 2.0, -3.0] },
        "performance": { "resize_debounce_ms": 250, "fps_sample_interval": 30 },
        "seed": 1234567
    })");

    SceneConfig config;
    ASSERT_TRUE(config.loadFromFile(path.c_str()));
    EXPECT_EQ(config.buildingCount, 12);
    EXPECT_FLOAT_EQ(config.minHeight, 40.5f);
    EXPECT_FLOAT_EQ(config.finChance, 0.5f);
    EXPECT_FLOAT_EQ(config.chunkLength, 600.0f);
    EXPECT_EQ(config.chunkCount, 4);
    EXPECT_FALSE(config.fogEnabled);
    EXPECT_FLOAT_EQ(config.fogDensity, 0.002f);
    EXPECT_FLOAT_EQ(config.sunPosition.x, 1.0f);
    EXPECT_FLOAT_EQ(config.sunPosition.y, 2.0f);
    EXPECT_FLOAT_EQ(config.sunPosition.z, -3.0f);
    EXPECT_DOUBLE_EQ(config.resizeDebounceMs, 250.0);
    EXPECT_EQ(config.fpsSampleInterval, 30);
    EXPECT_EQ(config.seed, 1234567u);

    // Keys absent from the file keep their defaults
    EXPECT_FLOAT_EQ(config.maxHeight, 400.0f);
    EXPECT_EQ(config.mobileBuildingCount, 25);
}

TEST(SceneConfig, ReadsHexColors) {
    std::string path = writeConfig("skyline_colors.json", R"({
        "fog_color": "#ff0080",
        "structure_colors": ["#000000", "#ffffff"],
        "cool_window_colors": ["nonsense"],
        "beacon_color": "#00ff00"
    })");

    SceneConfig config;
    const size_t defaultCool = config.coolWindowColors.size();
    ASSERT_TRUE(config.loadFromFile(path.c_str()));

    EXPECT_FLOAT_EQ(config.fogColor.r, 1.0f);
    EXPECT_FLOAT_EQ(config.fogColor.g, 0.0f);
    EXPECT_NEAR(config.fogColor.b, 128.0f / 255.0f, 1e-6f);

    ASSERT_EQ(config.structureColors.size(), 2u);
    EXPECT_FLOAT_EQ(config.structureColors[1].g, 1.0f);

    // A list with no valid colors leaves the palette untouched
    EXPECT_EQ(config.coolWindowColors.size(), defaultCool);

    EXPECT_FLOAT_EQ(config.beaconColor.g, 1.0f);
    EXPECT_FLOAT_EQ(config.beaconColor.r, 0.0f);
}

TEST(SceneConfig, NormalizeSwapsInvertedRanges) {
    SceneConfig config;
    config.minHeight = 300.0f;
    config.maxHeight = 100.0f;
    config.minWidth = 90.0f;
    config.maxWidth = 20.0f;

    EXPECT_EQ(config.normalize(), 2);
    EXPECT_FLOAT_EQ(config.minHeight, 100.0f);
    EXPECT_FLOAT_EQ(config.maxHeight, 300.0f);
    EXPECT_FLOAT_EQ(config.minWidth, 20.0f);
    EXPECT_FLOAT_EQ(config.maxWidth, 90.0f);
}

TEST(SceneConfig, NormalizeClampsNonPositiveSizes) {
    SceneConfig config;
    config.chunkCount = 0;
    config.chunkLength = -10.0f;
    config.fpsSampleInterval = 0;
    config.minPixelRatio = 0.0f;

    EXPECT_GE(config.normalize(), 4);
    EXPECT_EQ(config.chunkCount, 1);
    EXPECT_FLOAT_EQ(config.chunkLength, 1.0f);
    EXPECT_EQ(config.fpsSampleInterval, 1);
    EXPECT_FLOAT_EQ(config.minPixelRatio, 0.25f);
}

TEST(SceneConfig, NormalizeCapsTravelAtOneChunk) {
    SceneConfig config;
    config.chunkLength = 800.0f;
    config.travelPerFrame = 3.0e10f;

    EXPECT_EQ(config.normalize(), 1);
    EXPECT_FLOAT_EQ(config.travelPerFrame, 800.0f);
}

TEST(SceneConfig, NormalizeClampsNaN) {
    SceneConfig config;
    config.travelPerFrame = std::numeric_limits<float>::quiet_NaN();
    config.chunkLength = std::numeric_limits<float>::quiet_NaN();

    EXPECT_EQ(config.normalize(), 2);
    EXPECT_FLOAT_EQ(config.chunkLength, 1.0f);
    EXPECT_FLOAT_EQ(config.travelPerFrame, 0.0f);
}

TEST(SceneConfig, DefaultsNeedNoCorrection) {
    SceneConfig config;
    EXPECT_EQ(config.normalize(), 0);
}

TEST(SceneConfig, LoadNormalizesValues) {
    std::string path = writeConfig("skyline_inverted.json", R"({ "min_depth": 90, "max_depth": 10 })");
    SceneConfig config;
    ASSERT_TRUE(config.loadFromFile(path.c_str()));
    EXPECT_FLOAT_EQ(config.minDepth, 10.0f);
    EXPECT_FLOAT_EQ(config.maxDepth, 90.0f);
}

TEST(SceneConfig, UnchangedFileIsNotReloaded) {
    std::string path = writeConfig("skyline_reload.json", R"({ "building_count": 7 })");
    SceneConfig config;
    ASSERT_TRUE(config.loadFromFile(path.c_str()));
    EXPECT_FALSE(config.checkAndReload(path.c_str()));
    EXPECT_EQ(config.buildingCount, 7);
}
