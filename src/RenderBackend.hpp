#pragma once

#include <cstdint>
#include <vector>
#include <glm/glm.hpp>

namespace skyline {

struct SceneConfig;
struct Chunk;

struct LightRig {
    glm::vec3 ambientColor;
    float ambientIntensity = 0.0f;
    glm::vec3 sunColor;
    float sunIntensity = 0.0f;
    glm::vec3 sunDirection;          // Normalized, pointing toward the sun
    glm::vec3 hemisphereSkyColor;
    glm::vec3 hemisphereGroundColor;
    float hemisphereIntensity = 0.0f;
};

struct FogSettings {
    bool enabled = false;
    glm::vec3 color;
    float density = 0.0f;            // Exponential-squared
};

// Everything a back end needs to draw one frame
struct FrameState {
    glm::mat4 view;
    glm::mat4 projection;            // OpenGL clip conventions; back ends flip as needed
    glm::vec3 cameraPosition;
    LightRig lights;
    FogSettings fog;
    std::vector<float> chunkOffsets; // Indexed by chunk slot
    float pixelRatio = 1.0f;
    uint64_t frameIndex = 0;
};

// Turns frame descriptions into pixels. Chunk geometry is uploaded once in
// chunk-local space and placed each frame through FrameState::chunkOffsets.
class RenderBackend {
public:
    virtual ~RenderBackend() = default;

    // Logical size in window units; the drawing surface is size * pixelRatio.
    // Returns false when the environment cannot render.
    virtual bool initialize(const SceneConfig& config, int width, int height, float pixelRatio) = 0;

    virtual bool uploadChunk(const Chunk& chunk) = 0;

    virtual void resize(int width, int height, float pixelRatio) = 0;
    virtual void setPixelRatio(float pixelRatio) = 0;

    virtual void drawFrame(const FrameState& frame) = 0;

    // Must be safe after a failed or partial initialize, and when called twice
    virtual void shutdown() = 0;
};

}
