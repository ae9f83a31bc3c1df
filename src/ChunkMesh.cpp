#include "ChunkMesh.hpp"
#include "ChunkBuilder.hpp"

namespace skyline {

namespace {

const float kBeaconSize = 2.0f;

} // namespace

void appendBox(ChunkMesh& mesh, const glm::vec3& base, const glm::vec3& size, const glm::vec3& color,
               SurfaceKind sides) {
    const float x = base.x, y = base.y, z = base.z;
    const float w = size.x, h = size.y, d = size.z;
    const uint32_t vertexOffset = mesh.vertexCount();

    // Side faces carry the full facade texture (v = 0 at the top); caps never do
    const float side = static_cast<float>(sides);
    const float cap = sides == SurfaceKind::Beacon ? side : static_cast<float>(SurfaceKind::Plain);

    struct Face {
        glm::vec3 corners[4];
        glm::vec3 normal;
        float surface;
    };
    const Face faces[6] = {
        // Front (+Z)
        { { {x-w/2, y, z+d/2}, {x+w/2, y, z+d/2}, {x+w/2, y+h, z+d/2}, {x-w/2, y+h, z+d/2} }, {0, 0, 1}, side },
        // Back (-Z)
        { { {x+w/2, y, z-d/2}, {x-w/2, y, z-d/2}, {x-w/2, y+h, z-d/2}, {x+w/2, y+h, z-d/2} }, {0, 0, -1}, side },
        // Left (-X)
        { { {x-w/2, y, z-d/2}, {x-w/2, y, z+d/2}, {x-w/2, y+h, z+d/2}, {x-w/2, y+h, z-d/2} }, {-1, 0, 0}, side },
        // Right (+X)
        { { {x+w/2, y, z+d/2}, {x+w/2, y, z-d/2}, {x+w/2, y+h, z-d/2}, {x+w/2, y+h, z+d/2} }, {1, 0, 0}, side },
        // Top
        { { {x-w/2, y+h, z+d/2}, {x+w/2, y+h, z+d/2}, {x+w/2, y+h, z-d/2}, {x-w/2, y+h, z-d/2} }, {0, 1, 0}, cap },
        // Bottom
        { { {x-w/2, y, z-d/2}, {x+w/2, y, z-d/2}, {x+w/2, y, z+d/2}, {x-w/2, y, z+d/2} }, {0, -1, 0}, cap },
    };
    const glm::vec2 uvs[4] = { {0.0f, 1.0f}, {1.0f, 1.0f}, {1.0f, 0.0f}, {0.0f, 0.0f} };

    for (const auto& face : faces) {
        for (int c = 0; c < 4; ++c) {
            const glm::vec3& p = face.corners[c];
            const float vertex[kFloatsPerVertex] = {
                p.x, p.y, p.z,
                color.r, color.g, color.b,
                uvs[c].x, uvs[c].y,
                face.surface,
                face.normal.x, face.normal.y, face.normal.z,
            };
            mesh.vertices.insert(mesh.vertices.end(), vertex, vertex + kFloatsPerVertex);
        }
    }

    // Two triangles per face, four consecutive vertices each
    for (uint32_t f = 0; f < 6; ++f) {
        const uint32_t v = vertexOffset + f * 4;
        const uint32_t quad[6] = { v, v + 1, v + 2, v + 2, v + 3, v };
        mesh.indices.insert(mesh.indices.end(), quad, quad + 6);
    }
}

ChunkMesh buildChunkMesh(const Chunk& chunk, const glm::vec3& beaconColor) {
    ChunkMesh mesh;

    // Textured massing blocks, one draw each
    uint32_t textureIndex = 0;
    for (const auto& building : chunk.buildings) {
        for (const auto& block : building.blocks) {
            FacadeDraw draw;
            draw.range.firstIndex = static_cast<uint32_t>(mesh.indices.size());
            appendBox(mesh, building.origin + block.position, block.size, building.color, SurfaceKind::Facade);
            draw.range.indexCount = kIndicesPerBox;
            draw.textureIndex = textureIndex++;
            mesh.facades.push_back(draw);
        }
    }

    // Everything untextured shares one draw
    mesh.plain.firstIndex = static_cast<uint32_t>(mesh.indices.size());
    appendBox(mesh, chunk.ground.position, chunk.ground.size, chunk.ground.color, SurfaceKind::Plain);
    appendBox(mesh, chunk.roadLine.position, chunk.roadLine.size, chunk.roadLine.color, SurfaceKind::Plain);
    for (const auto& building : chunk.buildings) {
        for (const auto& item : building.roofItems) {
            appendBox(mesh, building.origin + item.position, item.size, item.color, SurfaceKind::Plain);
        }
        for (const auto& fin : building.fins) {
            appendBox(mesh, building.origin + fin.position, fin.size, fin.color, SurfaceKind::Plain);
        }
    }
    mesh.plain.indexCount = static_cast<uint32_t>(mesh.indices.size()) - mesh.plain.firstIndex;

    mesh.beacons.firstIndex = static_cast<uint32_t>(mesh.indices.size());
    for (const auto& building : chunk.buildings) {
        for (const auto& beacon : building.beacons) {
            glm::vec3 base = building.origin + beacon - glm::vec3(0.0f, kBeaconSize * 0.5f, 0.0f);
            appendBox(mesh, base, glm::vec3(kBeaconSize), beaconColor, SurfaceKind::Beacon);
        }
    }
    mesh.beacons.indexCount = static_cast<uint32_t>(mesh.indices.size()) - mesh.beacons.firstIndex;

    return mesh;
}

}
