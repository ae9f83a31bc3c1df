#include <gtest/gtest.h>
#include <cmath>

#include "ChunkBuilder.hpp"
#include "SceneRandom.hpp"
#include "TestDoubles.hpp"

using namespace skyline;

TEST(ChunkBuilder, BuildingCountFollowsTier) {
    SceneConfig config = testing::smallConfig();
    SceneRandom rng(21);

    Chunk desktop = buildChunk(0, DeviceTier::Desktop, config, rng);
    Chunk mobile = buildChunk(0, DeviceTier::Mobile, config, rng);
    EXPECT_EQ(desktop.buildings.size(), static_cast<size_t>(config.buildingCount));
    EXPECT_EQ(mobile.buildings.size(), static_cast<size_t>(config.mobileBuildingCount));
}

TEST(ChunkBuilder, MobileTexturesAreSmaller) {
    SceneConfig config = testing::smallConfig();
    SceneRandom rng(22);

    Chunk mobile = buildChunk(0, DeviceTier::Mobile, config, rng);
    for (const auto& building : mobile.buildings) {
        for (const auto& block : building.blocks) {
            EXPECT_EQ(block.texture.width, 128);
        }
    }
}

TEST(ChunkBuilder, StartingOffsetFollowsSlot) {
    SceneConfig config = testing::smallConfig();
    config.buildingCount = 0;
    SceneRandom rng(23);
    for (int slot = 0; slot < 4; ++slot) {
        Chunk chunk = buildChunk(slot, DeviceTier::Desktop, config, rng);
        EXPECT_EQ(chunk.slot, slot);
        EXPECT_FLOAT_EQ(chunk.offset, -slot * config.chunkLength);
    }
}

TEST(ChunkBuilder, PlacementKeepsLaneClearAndStaysInSpan) {
    SceneConfig config = testing::smallConfig();
    config.buildingCount = 40;
    SceneRandom rng(24);
    Chunk chunk = buildChunk(1, DeviceTier::Desktop, config, rng);

    for (const auto& building : chunk.buildings) {
        EXPECT_GE(std::fabs(building.origin.x), config.laneHalfWidth);
        EXPECT_LE(std::fabs(building.origin.x), config.lateralSpread + config.laneHalfWidth);
        EXPECT_LE(building.origin.z, 0.0f);
        EXPECT_GT(building.origin.z, -config.chunkLength);
        EXPECT_FLOAT_EQ(building.origin.y, 0.0f);
    }
}

TEST(ChunkBuilder, SizesStayInConfiguredRanges) {
    SceneConfig config = testing::smallConfig();
    config.buildingCount = 40;
    config.landmarkChance = 0.5f;
    SceneRandom rng(25);
    Chunk chunk = buildChunk(0, DeviceTier::Desktop, config, rng);

    bool sawLandmark = false;
    for (const auto& building : chunk.buildings) {
        EXPECT_GE(building.footprint.x, config.minWidth);
        EXPECT_LE(building.footprint.x, config.maxWidth);
        EXPECT_GE(building.footprint.y, config.minDepth);
        EXPECT_LE(building.footprint.y, config.maxDepth);
        EXPECT_GE(building.totalHeight, config.minHeight);
        EXPECT_LE(building.totalHeight, config.maxHeight + config.landmarkExtraHeight);
        if (building.totalHeight > config.maxHeight) sawLandmark = true;
    }
    EXPECT_TRUE(sawLandmark);
}

TEST(ChunkBuilder, GroundOverlapsNeighbours) {
    SceneConfig config = testing::smallConfig();
    config.buildingCount = 0;
    SceneRandom rng(26);
    Chunk chunk = buildChunk(0, DeviceTier::Desktop, config, rng);

    EXPECT_FLOAT_EQ(chunk.ground.size.z, config.chunkLength + 2.0f * config.seamOverlap);
    EXPECT_FLOAT_EQ(chunk.ground.position.z, -config.chunkLength * 0.5f);
    EXPECT_FLOAT_EQ(chunk.ground.size.x, config.groundWidth);
    EXPECT_FLOAT_EQ(chunk.roadLine.size.z, chunk.ground.size.z);
    EXPECT_EQ(chunk.ground.color, config.groundColor);
    EXPECT_EQ(chunk.roadLine.color, config.roadLineColor);
}

TEST(ChunkBuilder, InvertedRangesStillBounded) {
    SceneConfig config = testing::smallConfig();
    config.minHeight = 300.0f;
    config.maxHeight = 100.0f;
    config.landmarkChance = 0.0f;
    SceneRandom rng(27);

    Chunk chunk = buildChunk(0, DeviceTier::Desktop, config, rng);
    for (const auto& building : chunk.buildings) {
        EXPECT_GE(building.totalHeight, 100.0f);
        EXPECT_LE(building.totalHeight, 300.0f);
    }
}

TEST(ChunkBuilder, CountsBlocksAndTextureBytes) {
    SceneConfig config = testing::smallConfig();
    SceneRandom rng(28);
    Chunk chunk = buildChunk(0, DeviceTier::Mobile, config, rng);

    size_t blocks = 0;
    size_t bytes = 0;
    for (const auto& building : chunk.buildings) {
        blocks += building.blocks.size();
        for (const auto& block : building.blocks) {
            bytes += block.texture.pixels.size();
        }
    }
    EXPECT_EQ(chunk.blockCount(), blocks);
    EXPECT_EQ(chunk.textureBytes(), bytes);
    EXPECT_GT(bytes, 0u);
}
