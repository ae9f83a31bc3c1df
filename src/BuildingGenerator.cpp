#include "BuildingGenerator.hpp"
#include "SceneConfig.hpp"
#include "SceneRandom.hpp"

#include <utility>

namespace skyline {

namespace {

struct StyleWeight {
    BuildingStyle style;
    float weight;
};

const StyleWeight kStyleWeights[] = {
    { BuildingStyle::Setback,   0.30f },
    { BuildingStyle::TwinTower, 0.20f },
    { BuildingStyle::Tapered,   0.15f },
    { BuildingStyle::LShaped,   0.10f },
    { BuildingStyle::SimpleBox, 0.25f },
};

const float kBeaconRadius = 1.0f;
const float kFinThickness = 0.6f;
const float kFinDepth = 1.2f;

} // namespace

const char* buildingStyleName(BuildingStyle style) {
    switch (style) {
        case BuildingStyle::SimpleBox: return "simple-box";
        case BuildingStyle::Setback: return "setback";
        case BuildingStyle::TwinTower: return "twin-tower";
        case BuildingStyle::Tapered: return "tapered";
        case BuildingStyle::LShaped: return "L-shaped";
    }
    return "unknown";
}

BuildingGenerator::BuildingGenerator(const SceneConfig& config, float textureScale)
    : config_(config)
    , textureScale_(textureScale)
{
}

BuildingStyle BuildingGenerator::pickStyle(SceneRandom& rng) {
    float roll = rng.next();
    float cumulative = 0.0f;
    for (const auto& entry : kStyleWeights) {
        cumulative += entry.weight;
        if (roll < cumulative) return entry.style;
    }
    return BuildingStyle::SimpleBox;
}

Building BuildingGenerator::generate(const glm::vec3& origin, const glm::vec2& footprint, float totalHeight,
                                     SceneRandom& rng) const {
    BuildingStyle style = pickStyle(rng);
    return generate(origin, footprint, totalHeight, style, rng);
}

Building BuildingGenerator::generate(const glm::vec3& origin, const glm::vec2& footprint, float totalHeight,
                                     BuildingStyle style, SceneRandom& rng) const {
    Building building;
    building.origin = origin;
    building.footprint = footprint;
    building.totalHeight = totalHeight;
    building.style = style;
    building.color = config_.structureColors.empty()
        ? config_.wallColor
        : config_.structureColors[rng.pick(config_.structureColors.size())];

    const float w = footprint.x;
    const float d = footprint.y;
    const float h = totalHeight;

    switch (style) {
        case BuildingStyle::SimpleBox:
            addBlock(building, glm::vec3(0.0f), glm::vec3(w, h, d), rng);
            addRoofClutter(building, building.blocks[0], rng);
            if (rng.chance(config_.finChance)) addFins(building, building.blocks[0], rng);
            break;

        case BuildingStyle::Setback: {
            const float lowerHeight = h * 0.6f;
            addBlock(building, glm::vec3(0.0f), glm::vec3(w, lowerHeight, d), rng);
            addBlock(building, glm::vec3(0.0f, lowerHeight, 0.0f), glm::vec3(w * 0.7f, h * 0.4f, d * 0.7f), rng);
            addRoofClutter(building, building.blocks[1], rng);
            if (rng.chance(config_.finChance)) addFins(building, building.blocks[0], rng);
            break;
        }

        case BuildingStyle::TwinTower:
            // Left tower at full height, right tower slightly shorter, low bridge between
            addBlock(building, glm::vec3(-w * 0.25f, 0.0f, 0.0f), glm::vec3(w * 0.45f, h, d), rng);
            addBlock(building, glm::vec3(w * 0.25f, 0.0f, 0.0f), glm::vec3(w * 0.45f, h * 0.9f, d), rng);
            addBlock(building, glm::vec3(0.0f), glm::vec3(w * 0.2f, h * 0.3f, d * 0.8f), rng);
            addRoofClutter(building, building.blocks[0], rng);
            addRoofClutter(building, building.blocks[1], rng);
            break;

        case BuildingStyle::Tapered: {
            const float heights[] = { 0.5f, 0.3f, 0.2f };
            const float scales[] = { 1.0f, 0.75f, 0.5f };
            float base = 0.0f;
            for (int i = 0; i < 3; ++i) {
                addBlock(building, glm::vec3(0.0f, base, 0.0f),
                         glm::vec3(w * scales[i], h * heights[i], d * scales[i]), rng);
                base += h * heights[i];
            }
            addRoofClutter(building, building.blocks[2], rng);
            break;
        }

        case BuildingStyle::LShaped:
            // Main block on the left 60%, wing on the right 40% covering the front half
            addBlock(building, glm::vec3(-w * 0.2f, 0.0f, 0.0f), glm::vec3(w * 0.6f, h, d), rng);
            addBlock(building, glm::vec3(w * 0.3f, 0.0f, d * 0.25f), glm::vec3(w * 0.4f, h * 0.6f, d * 0.5f), rng);
            addRoofClutter(building, building.blocks[0], rng);
            break;
    }

    if (totalHeight > config_.beaconHeightThreshold) {
        addBeacon(building);
    }

    return building;
}

void BuildingGenerator::addBlock(Building& building, const glm::vec3& position, const glm::vec3& size,
                                 SceneRandom& rng) const {
    MassingBlock block;
    block.position = position;
    block.size = size;
    block.texture = synthesizeWindowTexture(size.x, size.y, config_, textureScale_, rng);
    building.blocks.push_back(std::move(block));
}

void BuildingGenerator::addRoofClutter(Building& building, const MassingBlock& roof, SceneRandom& rng) const {
    const float top = roof.position.y + roof.size.y;
    const float halfW = roof.size.x * 0.5f;
    const float halfD = roof.size.z * 0.5f;

    int itemCount = rng.rangeInt(2, 4);
    for (int i = 0; i < itemCount; ++i) {
        BuildingPart item;
        item.color = config_.roofClutterColor;

        if (rng.chance(0.5f)) {
            // Mechanical box (AC unit, water tank housing)
            item.size = glm::vec3(rng.range(2.0f, 5.0f), rng.range(2.0f, 4.0f), rng.range(2.0f, 5.0f));
            item.position = glm::vec3(
                roof.position.x + rng.range(-halfW + item.size.x, halfW - item.size.x),
                top,
                roof.position.z + rng.range(-halfD + item.size.z, halfD - item.size.z));
            building.roofItems.push_back(item);
        } else {
            // Antenna pole with a beacon at the tip
            float poleHeight = rng.range(5.0f, 20.0f);
            float radius = rng.range(0.2f, 0.5f);
            item.size = glm::vec3(radius * 2.0f, poleHeight, radius * 2.0f);
            item.position = glm::vec3(
                roof.position.x + rng.range(-halfW + 2.0f, halfW - 2.0f),
                top,
                roof.position.z + rng.range(-halfD + 2.0f, halfD - 2.0f));
            building.roofItems.push_back(item);
            building.beacons.push_back(item.position + glm::vec3(0.0f, poleHeight, 0.0f));
        }
    }
}

void BuildingGenerator::addFins(Building& building, const MassingBlock& facade, SceneRandom& rng) const {
    int finCount = rng.rangeInt(3, 6);
    const float spacing = facade.size.x / static_cast<float>(finCount + 1);
    const float frontZ = facade.position.z + facade.size.z * 0.5f + kFinDepth * 0.5f;

    for (int i = 0; i < finCount; ++i) {
        BuildingPart fin;
        fin.position = glm::vec3(
            facade.position.x - facade.size.x * 0.5f + spacing * static_cast<float>(i + 1),
            facade.position.y,
            frontZ);
        fin.size = glm::vec3(kFinThickness, facade.size.y, kFinDepth);
        fin.color = building.color * 0.8f;
        building.fins.push_back(fin);
    }
}

void BuildingGenerator::addBeacon(Building& building) const {
    // Tallest roof point of the massing
    const MassingBlock* tallest = nullptr;
    for (const auto& block : building.blocks) {
        if (!tallest || block.position.y + block.size.y > tallest->position.y + tallest->size.y) {
            tallest = &block;
        }
    }
    if (!tallest) return;

    building.beacons.push_back(glm::vec3(
        tallest->position.x,
        tallest->position.y + tallest->size.y + kBeaconRadius,
        tallest->position.z));
}

}
