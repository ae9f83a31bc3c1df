#include "Scene.hpp"
#include "HostContainer.hpp"

#include <chrono>
#include <cstdio>
#include <glm/gtc/matrix_transform.hpp>

namespace skyline {

const char* sceneStateName(SceneState state) {
    switch (state) {
        case SceneState::Uninitialized: return "uninitialized";
        case SceneState::Running: return "running";
        case SceneState::Paused: return "paused";
        case SceneState::Fallback: return "fallback";
        case SceneState::Disposed: return "disposed";
    }
    return "unknown";
}

SceneContext::~SceneContext() {
    disposeScene();
}

void SceneContext::initScene(RenderBackend& backend, HostContainer& container, const SceneConfig& config) {
    config_ = config;
    config_.normalize();
    container_ = &container;
    state_ = SceneState::Uninitialized;

    tier_ = classifyDevice(container.deviceInfo(), config_.mobileWidthThreshold);
    pixelRatio_ = optimalPixelRatio(tier_, container.devicePixelRatio(), config_);

    const int width = container.width();
    const int height = container.height();
    aspect_ = height > 0 ? static_cast<float>(width) / static_cast<float>(height) : 1.0f;

    printf("Scene: %dx%d, %s tier, pixel ratio %.2f\n", width, height, deviceTierName(tier_), pixelRatio_);

    backend_ = &backend;
    if (!backend_->initialize(config_, width, height, pixelRatio_)) {
        applyFallback("render back end unavailable");
        return;
    }

    seed_ = config_.seed;
    if (seed_ == 0) {
        seed_ = static_cast<uint32_t>(std::chrono::system_clock::now().time_since_epoch().count());
    }
    printf("Scene seed: %u\n", seed_);
    rng_ = std::make_unique<SceneRandom>(seed_);

    pool_.initialize(tier_, config_, *rng_);
    for (int slot = 0; slot < pool_.size(); ++slot) {
        if (!backend_->uploadChunk(pool_.chunkForSlot(slot))) {
            applyFallback("chunk upload failed");
            return;
        }
    }
    pool_.releaseTexturePixels();

    fps_ = std::make_unique<FpsMeter>(config_.targetFps, config_.fpsWindowMs);
    quality_ = std::make_unique<QualityController>(config_, pixelRatio_);

    cameraPosition_ = glm::vec3(0.0f, config_.cameraHeight, 0.0f);
    setupLights();

    resizePending_ = false;
    frameCount_ = 0;
    state_ = SceneState::Running;
}

void SceneContext::applyFallback(const char* reason) {
    if (backend_) {
        backend_->shutdown();
        backend_ = nullptr;
    }
    pool_.clear();
    rng_.reset();

    GradientBackground background = fallbackGradient();
    if (container_) {
        container_->setBackground(background);
    }
    fprintf(stderr, "Warning: %s, showing %s\n", reason, background.describe().c_str());
    state_ = SceneState::Fallback;
}

void SceneContext::setupLights() {
    lights_.ambientColor = config_.ambientColor;
    lights_.ambientIntensity = config_.ambientIntensity;
    lights_.sunColor = config_.sunColor;
    lights_.sunIntensity = config_.sunIntensity;
    lights_.sunDirection = glm::length(config_.sunPosition) > 0.0f
        ? glm::normalize(config_.sunPosition)
        : glm::vec3(0.0f, 1.0f, 0.0f);
    lights_.hemisphereSkyColor = config_.hemisphereSkyColor;
    lights_.hemisphereGroundColor = config_.hemisphereGroundColor;
    lights_.hemisphereIntensity = config_.hemisphereIntensity;

    fog_.enabled = config_.fogEnabled;
    fog_.color = config_.fogColor;
    fog_.density = config_.fogDensity;
}

void SceneContext::disposeScene() {
    if (state_ == SceneState::Disposed) {
        return;
    }

    if (backend_) {
        backend_->shutdown();
        backend_ = nullptr;
    }
    pool_.clear();
    quality_.reset();
    fps_.reset();
    rng_.reset();
    container_ = nullptr;
    resizePending_ = false;

    state_ = SceneState::Disposed;
}

bool SceneContext::frame(double nowMs) {
    if (state_ != SceneState::Running) {
        return false;
    }

    pump(nowMs);

    // Travel, then recycle whatever fell behind the camera. The camera
    // follows the pool so a rebase moves both together.
    pool_.advance(config_.travelPerFrame);
    cameraPosition_.z = pool_.travelPosition();

    float fps = fps_->tick(nowMs);
    if (quality_->onFrame(fps)) {
        pixelRatio_ = quality_->getPixelRatio();
        backend_->setPixelRatio(pixelRatio_);
    }

    backend_->drawFrame(buildFrameState());
    frameCount_++;
    return true;
}

void SceneContext::notifyResize(double nowMs) {
    if (state_ == SceneState::Disposed || state_ == SceneState::Uninitialized) {
        return;
    }
    resizePending_ = true;
    lastResizeMs_ = nowMs;
}

bool SceneContext::pump(double nowMs) {
    if (!resizePending_ || nowMs - lastResizeMs_ < config_.resizeDebounceMs) {
        return false;
    }
    resizePending_ = false;
    applyResize();
    return true;
}

void SceneContext::applyResize() {
    if (!container_ || !backend_ || !quality_) {
        return;
    }

    const int width = container_->width();
    const int height = container_->height();
    if (width <= 0 || height <= 0) {
        return;
    }
    aspect_ = static_cast<float>(width) / static_cast<float>(height);

    // Re-clamp for the tier, keeping any reduction the quality loop made
    float optimal = optimalPixelRatio(tier_, container_->devicePixelRatio(), config_);
    quality_->clampTo(optimal);
    pixelRatio_ = quality_->getPixelRatio();

    printf("Resize: %dx%d, pixel ratio %.2f\n", width, height, pixelRatio_);
    backend_->resize(width, height, pixelRatio_);
}

void SceneContext::setVisible(bool visible, double nowMs) {
    if (visible && state_ == SceneState::Paused) {
        // The hidden stretch must not count as one very slow frame
        fps_->restart(nowMs);
        state_ = SceneState::Running;
    } else if (!visible && state_ == SceneState::Running) {
        state_ = SceneState::Paused;
    }
}

glm::mat4 SceneContext::viewMatrix() const {
    glm::vec3 target = cameraPosition_ + glm::vec3(0.0f, -config_.cameraLookDrop, -config_.cameraLookDistance);
    return glm::lookAt(cameraPosition_, target, glm::vec3(0.0f, 1.0f, 0.0f));
}

glm::mat4 SceneContext::projectionMatrix() const {
    return glm::perspective(glm::radians(config_.fovDegrees), aspect_, config_.nearPlane, config_.farPlane);
}

FrameState SceneContext::buildFrameState() const {
    FrameState frameState;
    frameState.view = viewMatrix();
    frameState.projection = projectionMatrix();
    frameState.cameraPosition = cameraPosition_;
    frameState.lights = lights_;
    frameState.fog = fog_;
    frameState.chunkOffsets.resize(static_cast<size_t>(pool_.size()));
    pool_.forEachChunk([&frameState](const Chunk& chunk) {
        frameState.chunkOffsets[static_cast<size_t>(chunk.slot)] = chunk.offset;
    });
    frameState.pixelRatio = pixelRatio_;
    frameState.frameIndex = frameCount_;
    return frameState;
}

}
