#pragma once

#include "WindowTexture.hpp"

#include <vector>
#include <glm/glm.hpp>

namespace skyline {

struct SceneConfig;
class SceneRandom;

enum class BuildingStyle {
    SimpleBox,
    Setback,
    TwinTower,
    Tapered,
    LShaped
};

struct BuildingPart {
    glm::vec3 position;  // Bottom-center, relative to building origin
    glm::vec3 size;
    glm::vec3 color;
};

// A textured massing volume. Every block owns its own facade texture.
struct MassingBlock {
    glm::vec3 position;  // Bottom-center, relative to building origin
    glm::vec3 size;
    WindowTexture texture;
};

struct Building {
    glm::vec3 origin;           // Chunk-local ground position
    glm::vec2 footprint;        // Width (x), depth (z)
    float totalHeight = 0.0f;
    BuildingStyle style = BuildingStyle::SimpleBox;
    glm::vec3 color;            // Shared by every block
    std::vector<MassingBlock> blocks;
    std::vector<BuildingPart> roofItems;   // Mechanical boxes and antenna poles
    std::vector<glm::vec3> beacons;        // Red roof lights, relative to origin
    std::vector<BuildingPart> fins;        // Vertical ribs on the front facade
};

class BuildingGenerator {
public:
    BuildingGenerator(const SceneConfig& config, float textureScale);
    ~BuildingGenerator() = default;

    // Style drawn by weight
    Building generate(const glm::vec3& origin, const glm::vec2& footprint, float totalHeight,
                      SceneRandom& rng) const;

    // Explicit style
    Building generate(const glm::vec3& origin, const glm::vec2& footprint, float totalHeight,
                      BuildingStyle style, SceneRandom& rng) const;

    static BuildingStyle pickStyle(SceneRandom& rng);

    float getTextureScale() const { return textureScale_; }

private:
    void addBlock(Building& building, const glm::vec3& position, const glm::vec3& size, SceneRandom& rng) const;
    void addRoofClutter(Building& building, const MassingBlock& roof, SceneRandom& rng) const;
    void addFins(Building& building, const MassingBlock& facade, SceneRandom& rng) const;
    void addBeacon(Building& building) const;

    const SceneConfig& config_;
    float textureScale_;
};

const char* buildingStyleName(BuildingStyle style);

}
