#include <gtest/gtest.h>

#include "ChunkBuilder.hpp"
#include "ChunkMesh.hpp"
#include "SceneRandom.hpp"
#include "TestDoubles.hpp"

using namespace skyline;

namespace {

float surfaceOf(const ChunkMesh& mesh, uint32_t vertex) {
    return mesh.vertices[vertex * kFloatsPerVertex + 8];
}

glm::vec3 normalOf(const ChunkMesh& mesh, uint32_t vertex) {
    const float* v = &mesh.vertices[vertex * kFloatsPerVertex + 9];
    return glm::vec3(v[0], v[1], v[2]);
}

glm::vec3 positionOf(const ChunkMesh& mesh, uint32_t vertex) {
    const float* v = &mesh.vertices[vertex * kFloatsPerVertex];
    return glm::vec3(v[0], v[1], v[2]);
}

} // namespace

TEST(ChunkMesh, BoxLayout) {
    ChunkMesh mesh;
    appendBox(mesh, glm::vec3(10.0f, 0.0f, -5.0f), glm::vec3(4.0f, 6.0f, 2.0f), glm::vec3(0.5f), SurfaceKind::Facade);

    ASSERT_EQ(mesh.vertexCount(), kVerticesPerBox);
    ASSERT_EQ(mesh.indices.size(), static_cast<size_t>(kIndicesPerBox));

    for (uint32_t v = 0; v < mesh.vertexCount(); ++v) {
        glm::vec3 p = positionOf(mesh, v);
        EXPECT_GE(p.x, 8.0f);
        EXPECT_LE(p.x, 12.0f);
        EXPECT_GE(p.y, 0.0f);
        EXPECT_LE(p.y, 6.0f);
        EXPECT_GE(p.z, -6.0f);
        EXPECT_LE(p.z, -4.0f);
    }
}

TEST(ChunkMesh, CapsAreNeverTextured) {
    ChunkMesh mesh;
    appendBox(mesh, glm::vec3(0.0f), glm::vec3(1.0f), glm::vec3(1.0f), SurfaceKind::Facade);

    for (uint32_t v = 0; v < mesh.vertexCount(); ++v) {
        const bool cap = normalOf(mesh, v).y != 0.0f;
        EXPECT_FLOAT_EQ(surfaceOf(mesh, v), cap ? 0.0f : 1.0f);
    }
}

TEST(ChunkMesh, BeaconIsEmissiveOnEveryFace) {
    ChunkMesh mesh;
    appendBox(mesh, glm::vec3(0.0f), glm::vec3(2.0f), glm::vec3(1.0f, 0.0f, 0.0f), SurfaceKind::Beacon);
    for (uint32_t v = 0; v < mesh.vertexCount(); ++v) {
        EXPECT_FLOAT_EQ(surfaceOf(mesh, v), 2.0f);
    }
}

TEST(ChunkMesh, TrianglesWindCounterClockwiseFromOutside) {
    ChunkMesh mesh;
    appendBox(mesh, glm::vec3(0.0f), glm::vec3(2.0f, 3.0f, 4.0f), glm::vec3(1.0f), SurfaceKind::Plain);

    for (size_t i = 0; i < mesh.indices.size(); i += 3) {
        glm::vec3 a = positionOf(mesh, mesh.indices[i]);
        glm::vec3 b = positionOf(mesh, mesh.indices[i + 1]);
        glm::vec3 c = positionOf(mesh, mesh.indices[i + 2]);
        glm::vec3 faceNormal = glm::cross(b - a, c - a);
        EXPECT_GT(glm::dot(faceNormal, normalOf(mesh, mesh.indices[i])), 0.0f) << "triangle " << i / 3;
    }
}

TEST(ChunkMesh, ChunkRangesCoverEveryPart) {
    SceneConfig config = testing::smallConfig();
    config.beaconHeightThreshold = 0.0f;
    SceneRandom rng(40);
    Chunk chunk = buildChunk(0, DeviceTier::Mobile, config, rng);

    ChunkMesh mesh = buildChunkMesh(chunk, config.beaconColor);

    size_t plainBoxes = 2;
    size_t beaconBoxes = 0;
    for (const auto& building : chunk.buildings) {
        plainBoxes += building.roofItems.size() + building.fins.size();
        beaconBoxes += building.beacons.size();
    }

    ASSERT_EQ(mesh.facades.size(), chunk.blockCount());
    for (size_t i = 0; i < mesh.facades.size(); ++i) {
        EXPECT_EQ(mesh.facades[i].textureIndex, i);
        EXPECT_EQ(mesh.facades[i].range.firstIndex, i * kIndicesPerBox);
        EXPECT_EQ(mesh.facades[i].range.indexCount, kIndicesPerBox);
    }

    EXPECT_EQ(mesh.plain.firstIndex, chunk.blockCount() * kIndicesPerBox);
    EXPECT_EQ(mesh.plain.indexCount, plainBoxes * kIndicesPerBox);
    EXPECT_EQ(mesh.beacons.firstIndex, mesh.plain.firstIndex + mesh.plain.indexCount);
    EXPECT_EQ(mesh.beacons.indexCount, beaconBoxes * kIndicesPerBox);
    EXPECT_GT(beaconBoxes, 0u);

    EXPECT_EQ(mesh.indices.size(), mesh.beacons.firstIndex + mesh.beacons.indexCount);
    EXPECT_EQ(mesh.vertexCount(), (chunk.blockCount() + plainBoxes + beaconBoxes) * kVerticesPerBox);
    for (uint32_t index : mesh.indices) {
        ASSERT_LT(index, mesh.vertexCount());
    }
}

TEST(ChunkMesh, BeaconsUseConfiguredColor) {
    SceneConfig config = testing::smallConfig();
    config.beaconHeightThreshold = 0.0f;
    SceneRandom rng(41);
    Chunk chunk = buildChunk(0, DeviceTier::Mobile, config, rng);

    const glm::vec3 color(0.0f, 1.0f, 0.5f);
    ChunkMesh mesh = buildChunkMesh(chunk, color);
    ASSERT_GT(mesh.beacons.indexCount, 0u);

    const uint32_t first = mesh.indices[mesh.beacons.firstIndex];
    const float* v = &mesh.vertices[first * kFloatsPerVertex + 3];
    EXPECT_FLOAT_EQ(v[0], color.r);
    EXPECT_FLOAT_EQ(v[1], color.g);
    EXPECT_FLOAT_EQ(v[2], color.b);
}

TEST(ChunkMesh, GeometryIsChunkLocal) {
    SceneConfig config = testing::smallConfig();
    SceneRandom rng(42);
    Chunk chunk = buildChunk(2, DeviceTier::Mobile, config, rng);
    ASSERT_FLOAT_EQ(chunk.offset, -2.0f * config.chunkLength);

    ChunkMesh mesh = buildChunkMesh(chunk, config.beaconColor);
    const float margin = config.seamOverlap + config.maxDepth;
    for (uint32_t v = 0; v < mesh.vertexCount(); ++v) {
        float z = positionOf(mesh, v).z;
        ASSERT_LE(z, margin);
        ASSERT_GE(z, -config.chunkLength - margin);
    }
}
