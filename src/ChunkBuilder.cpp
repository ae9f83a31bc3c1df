#include "ChunkBuilder.hpp"
#include "SceneConfig.hpp"
#include "SceneRandom.hpp"

#include <cmath>
#include <cstdio>

namespace skyline {

size_t Chunk::blockCount() const {
    size_t count = 0;
    for (const auto& building : buildings) {
        count += building.blocks.size();
    }
    return count;
}

size_t Chunk::textureBytes() const {
    size_t bytes = 0;
    for (const auto& building : buildings) {
        for (const auto& block : building.blocks) {
            bytes += block.texture.byteSize();
        }
    }
    return bytes;
}

void Chunk::releaseTexturePixels() {
    for (auto& building : buildings) {
        for (auto& block : building.blocks) {
            std::vector<uint8_t>().swap(block.texture.pixels);
        }
    }
}

Chunk buildChunk(int slot, DeviceTier tier, const SceneConfig& config, SceneRandom& rng) {
    Chunk chunk;
    chunk.slot = slot;
    chunk.offset = -static_cast<float>(slot) * config.chunkLength;

    const bool mobile = tier == DeviceTier::Mobile;
    const int count = mobile ? config.mobileBuildingCount : config.buildingCount;
    BuildingGenerator generator(config, mobile ? config.mobileTextureScale : 1.0f);

    chunk.buildings.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        // Keep the central road lane clear
        float x = rng.range(-config.lateralSpread, config.lateralSpread);
        if (std::fabs(x) < config.laneHalfWidth) {
            x += x < 0.0f ? -config.laneHalfWidth : config.laneHalfWidth;
        }
        // (-L, 0]
        float z = -rng.next() * config.chunkLength;

        glm::vec2 footprint(rng.range(config.minWidth, config.maxWidth),
                            rng.range(config.minDepth, config.maxDepth));
        float height = rng.range(config.minHeight, config.maxHeight);
        if (rng.chance(config.landmarkChance)) {
            height += config.landmarkExtraHeight;
        }

        chunk.buildings.push_back(generator.generate(glm::vec3(x, 0.0f, z), footprint, height, rng));
    }

    // Ground and centre line overlap the neighbours slightly to hide the seam
    const float span = config.chunkLength + 2.0f * config.seamOverlap;
    const float centerZ = -config.chunkLength * 0.5f;

    chunk.ground.position = glm::vec3(0.0f, -0.1f, centerZ);
    chunk.ground.size = glm::vec3(config.groundWidth, 0.1f, span);
    chunk.ground.color = config.groundColor;

    chunk.roadLine.position = glm::vec3(0.0f, 0.0f, centerZ);
    chunk.roadLine.size = glm::vec3(2.0f, 0.1f, span);
    chunk.roadLine.color = config.roadLineColor;

    printf("  Chunk %d: %zu buildings, %zu blocks, %.1f MB of window textures\n",
           slot, chunk.buildings.size(), chunk.blockCount(),
           static_cast<double>(chunk.textureBytes()) / (1024.0 * 1024.0));

    return chunk;
}

}
