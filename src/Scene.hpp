#pragma once

#include "ChunkPool.hpp"
#include "PerformanceMonitor.hpp"
#include "QualityController.hpp"
#include "RenderBackend.hpp"
#include "SceneConfig.hpp"
#include "SceneRandom.hpp"

#include <cstdint>
#include <memory>
#include <glm/glm.hpp>

namespace skyline {

class HostContainer;

enum class SceneState {
    Uninitialized,
    Running,
    Paused,
    Fallback,   // Nothing can be rendered; the container shows a gradient
    Disposed
};

const char* sceneStateName(SceneState state);

// One flythrough instance. Owns the camera, light rig, fog, chunk pool and
// the performance loop; borrows the back end and the container from the host.
class SceneContext {
public:
    SceneContext() = default;
    ~SceneContext();

    SceneContext(const SceneContext&) = delete;
    SceneContext& operator=(const SceneContext&) = delete;

    // Never throws. Falls back to a static gradient when the back end
    // cannot initialize; check getState() afterwards.
    void initScene(RenderBackend& backend, HostContainer& container, const SceneConfig& config);

    // Release everything. Safe after a failed init and when called twice.
    void disposeScene();

    // One update-then-draw step. Returns false when nothing was drawn
    // (paused, fallback, disposed).
    bool frame(double nowMs);

    // Debounced: the resize is applied once the debounce period passes with
    // no newer event
    void notifyResize(double nowMs);

    // Apply a pending resize if it is due. Returns true if one was applied.
    bool pump(double nowMs);

    void setVisible(bool visible, double nowMs);

    SceneState getState() const { return state_; }
    bool isRunning() const { return state_ == SceneState::Running; }
    DeviceTier getDeviceTier() const { return tier_; }
    float getPixelRatio() const { return pixelRatio_; }
    float getAspect() const { return aspect_; }
    float getFps() const { return fps_ ? fps_->getFps() : 0.0f; }
    uint32_t getSeed() const { return seed_; }
    uint64_t getFrameCount() const { return frameCount_; }
    const glm::vec3& getCameraPosition() const { return cameraPosition_; }
    const ChunkPool& getPool() const { return pool_; }
    const SceneConfig& getConfig() const { return config_; }
    const LightRig& getLights() const { return lights_; }
    const FogSettings& getFog() const { return fog_; }
    bool hasPendingResize() const { return resizePending_; }

    glm::mat4 viewMatrix() const;
    glm::mat4 projectionMatrix() const;

private:
    void applyFallback(const char* reason);
    void applyResize();
    void setupLights();
    FrameState buildFrameState() const;

    SceneConfig config_;
    SceneState state_ = SceneState::Uninitialized;
    RenderBackend* backend_ = nullptr;
    HostContainer* container_ = nullptr;

    DeviceTier tier_ = DeviceTier::Desktop;
    float pixelRatio_ = 1.0f;
    float aspect_ = 1.0f;
    uint32_t seed_ = 0;

    std::unique_ptr<SceneRandom> rng_;
    ChunkPool pool_;
    std::unique_ptr<FpsMeter> fps_;
    std::unique_ptr<QualityController> quality_;

    glm::vec3 cameraPosition_ = glm::vec3(0.0f);
    LightRig lights_;
    FogSettings fog_;

    bool resizePending_ = false;
    double lastResizeMs_ = 0.0;
    uint64_t frameCount_ = 0;
};

}
