#pragma once

#include "BuildingGenerator.hpp"
#include "PerformanceMonitor.hpp"

#include <vector>

namespace skyline {

struct SceneConfig;
class SceneRandom;

// One longitudinal segment of the city. Geometry is chunk-local and spans
// z in (-chunkLength, 0]; the world span is [offset, offset - chunkLength).
struct Chunk {
    int slot = 0;
    float offset = 0.0f;
    std::vector<Building> buildings;
    BuildingPart ground;
    BuildingPart roadLine;

    size_t blockCount() const;
    size_t textureBytes() const;

    // Free every block's pixel buffer; dimensions and floor rows remain
    void releaseTexturePixels();
};

// Populate a fresh chunk for `slot`. Building count and texture resolution
// follow the device tier.
Chunk buildChunk(int slot, DeviceTier tier, const SceneConfig& config, SceneRandom& rng);

}
