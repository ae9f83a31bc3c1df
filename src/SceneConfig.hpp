#pragma once

#include <cstdint>
#include <vector>
#include <glm/glm.hpp>

namespace skyline {

// ============================================================================
// SCENE CONFIGURATION
// ============================================================================
// Every tunable of the flythrough in one place. Defaults reproduce the dusk
// city look; a JSON file can override any key (see skyline.json).

struct SceneConfig {
    // ========================================================================
    // BUILDINGS
    // ========================================================================
    int buildingCount = 50;                 // Buildings per chunk (desktop)
    int mobileBuildingCount = 25;           // Buildings per chunk (mobile tier)
    float minHeight = 80.0f;
    float maxHeight = 400.0f;
    float minWidth = 30.0f;
    float maxWidth = 80.0f;
    float minDepth = 30.0f;
    float maxDepth = 80.0f;
    float landmarkChance = 0.1f;            // Probability of an outsized tower
    float landmarkExtraHeight = 200.0f;     // Added on top of the sampled height
    float beaconHeightThreshold = 250.0f;   // Roof beacon above this total height
    float finChance = 0.25f;                // Vertical fins on box/setback styles

    // ========================================================================
    // CHUNKS
    // ========================================================================
    float chunkLength = 1000.0f;            // Longitudinal size of one segment
    int chunkCount = 3;                     // K live segments in the pool
    float laneHalfWidth = 50.0f;            // Central road lane kept clear
    float lateralSpread = 400.0f;           // Building origins placed in +-spread
    float groundWidth = 800.0f;
    float seamOverlap = 2.0f;               // Ground overlap past each chunk edge

    // ========================================================================
    // PALETTES
    // ========================================================================
    std::vector<glm::vec3> structureColors = {
        glm::vec3(0x3a, 0x3a, 0x45) / 255.0f,
        glm::vec3(0x2a, 0x2a, 0x35) / 255.0f,
        glm::vec3(0x1a, 0x1a, 0x25) / 255.0f,
        glm::vec3(0x20, 0x20, 0x30) / 255.0f,
        glm::vec3(0x40, 0x35, 0x30) / 255.0f,
    };
    std::vector<glm::vec3> warmWindowColors = {
        glm::vec3(0xff, 0x99, 0x66) / 255.0f,
        glm::vec3(0xff, 0xcc, 0xaa) / 255.0f,
        glm::vec3(0xff, 0xeb, 0xcd) / 255.0f,
    };
    std::vector<glm::vec3> coolWindowColors = {
        glm::vec3(0x55, 0x66, 0x88) / 255.0f,
        glm::vec3(0x2a, 0x2a, 0x40) / 255.0f,
    };
    glm::vec3 wallColor = glm::vec3(0x15, 0x15, 0x15) / 255.0f;
    glm::vec3 darkWindowColor = glm::vec3(0x1a, 0x1a, 0x25) / 255.0f;
    glm::vec3 groundColor = glm::vec3(0x1a, 0x1a, 0x20) / 255.0f;
    glm::vec3 roadLineColor = glm::vec3(0x66, 0x66, 0x66) / 255.0f;
    glm::vec3 roofClutterColor = glm::vec3(0x55, 0x55, 0x55) / 255.0f;
    glm::vec3 beaconColor = glm::vec3(1.0f, 0.0f, 0.0f);

    // ========================================================================
    // FOG
    // ========================================================================
    bool fogEnabled = true;
    glm::vec3 fogColor = glm::vec3(0x2d, 0x1b, 0x4e) / 255.0f;
    float fogDensity = 0.0012f;             // Exponential-squared density

    // ========================================================================
    // CAMERA
    // ========================================================================
    float fovDegrees = 60.0f;
    float nearPlane = 0.1f;
    float farPlane = 2000.0f;
    float cameraHeight = 150.0f;
    float cameraLookDrop = 20.0f;           // Target sits this far below eye height
    float cameraLookDistance = 100.0f;      // ... and this far ahead
    float travelPerFrame = 2.0f;            // Forward motion along -Z each frame

    // ========================================================================
    // LIGHTING
    // ========================================================================
    glm::vec3 ambientColor = glm::vec3(0x4a, 0x3a, 0x6a) / 255.0f;
    float ambientIntensity = 0.6f;
    glm::vec3 sunColor = glm::vec3(0xff, 0xaa, 0x33) / 255.0f;
    float sunIntensity = 1.5f;
    glm::vec3 sunPosition = glm::vec3(-100.0f, 50.0f, -100.0f);
    glm::vec3 hemisphereSkyColor = glm::vec3(0xff, 0x66, 0x66) / 255.0f;
    glm::vec3 hemisphereGroundColor = glm::vec3(0x11, 0x11, 0x22) / 255.0f;
    float hemisphereIntensity = 0.4f;

    // ========================================================================
    // SKY
    // ========================================================================
    glm::vec3 skyTopColor = glm::vec3(0x1a, 0x05, 0x33) / 255.0f;
    glm::vec3 skyMiddleColor = glm::vec3(0xff, 0x6b, 0x35) / 255.0f;
    glm::vec3 skyBottomColor = glm::vec3(0xff, 0xb3, 0x47) / 255.0f;
    float skyOffset = 20.0f;
    float skyExponent = 0.8f;
    glm::vec3 sunGlowPosition = glm::vec3(-150.0f, 40.0f, -200.0f);
    glm::vec3 sunGlowColor = glm::vec3(0xff, 0x7b, 0x00) / 255.0f;
    float sunGlowIntensity = 1.5f;

    // ========================================================================
    // RENDERING
    // ========================================================================
    float exposure = 1.1f;                  // ACES tone mapping exposure
    float emissiveIntensity = 0.5f;         // Window texture self-light strength

    // ========================================================================
    // PERFORMANCE
    // ========================================================================
    float mobilePixelRatioCap = 1.5f;
    float desktopPixelRatioCap = 2.0f;
    float targetFps = 60.0f;
    int fpsSampleInterval = 60;             // Quality check every N frames
    double fpsWindowMs = 1000.0;            // FPS estimate refresh window
    float pixelRatioStep = 0.25f;           // Decrement per quality reduction
    float minPixelRatio = 1.0f;
    float mobileTextureScale = 0.5f;
    int mobileWidthThreshold = 768;
    double resizeDebounceMs = 100.0;

    // ========================================================================
    // RANDOMNESS
    // ========================================================================
    uint32_t seed = 0;                      // 0 = seed from the wall clock

    // ========================================================================
    // METHODS
    // ========================================================================
    // Load configuration from JSON file (keys absent from the file keep their value)
    bool loadFromFile(const char* path);

    // Check if file has been modified and reload if needed
    // Returns true if config was reloaded
    bool checkAndReload(const char* path);

    // Swap inverted ranges and clamp sizes into their valid range.
    // Returns the number of fields that had to be corrected.
    int normalize();

private:
    long lastModTime_ = 0;
};

} // namespace skyline
