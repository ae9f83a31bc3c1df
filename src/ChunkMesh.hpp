#pragma once

#include <cstdint>
#include <vector>
#include <glm/glm.hpp>

namespace skyline {

struct Chunk;

// Per-vertex surface kind, stored in the vertex's fourth attribute
enum class SurfaceKind {
    Plain = 0,    // Vertex color only (ground, roofs, clutter, fins)
    Facade = 1,   // Window texture mapped across the face
    Beacon = 2    // Unlit emissive
};

// Vertex format: position (vec3), color (vec3), uv (vec2), surface (float), normal (vec3) = 12 floats
constexpr uint32_t kFloatsPerVertex = 12;
constexpr uint32_t kVerticesPerBox = 24;
constexpr uint32_t kIndicesPerBox = 36;

struct MeshRange {
    uint32_t firstIndex = 0;
    uint32_t indexCount = 0;
};

// One massing block: its box plus the index of its window texture in
// chunk order (buildings first to last, blocks in order)
struct FacadeDraw {
    MeshRange range;
    uint32_t textureIndex = 0;
};

// Chunk-local geometry, ready for one vertex and one index buffer
struct ChunkMesh {
    std::vector<float> vertices;
    std::vector<uint32_t> indices;
    std::vector<FacadeDraw> facades;
    MeshRange plain;      // Ground, road line, roof clutter, fins
    MeshRange beacons;

    uint32_t vertexCount() const { return static_cast<uint32_t>(vertices.size() / kFloatsPerVertex); }
};

// Axis-aligned box with its bottom-center at `base`
void appendBox(ChunkMesh& mesh, const glm::vec3& base, const glm::vec3& size, const glm::vec3& color,
               SurfaceKind sides);

ChunkMesh buildChunkMesh(const Chunk& chunk, const glm::vec3& beaconColor);

}
