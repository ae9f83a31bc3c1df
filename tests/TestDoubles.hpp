#pragma once

#include "HostContainer.hpp"
#include "RenderBackend.hpp"
#include "SceneConfig.hpp"
#include "ChunkBuilder.hpp"

#include <vector>

namespace skyline {
namespace testing {

// Small city so generation stays quick
inline SceneConfig smallConfig() {
    SceneConfig config;
    config.buildingCount = 4;
    config.mobileBuildingCount = 2;
    config.seed = 42;
    return config;
}

// Records every call; initialize and upload results are scripted
class RecordingBackend : public RenderBackend {
public:
    bool initializeResult = true;
    bool uploadResult = true;
    bool recordFrames = true;  // Long runs only count draws

    int initializeCalls = 0;
    int shutdownCalls = 0;
    int resizeCalls = 0;
    int pixelRatioCalls = 0;
    int drawCalls = 0;
    std::vector<int> uploadedSlots;
    std::vector<FrameState> frames;

    int lastWidth = 0;
    int lastHeight = 0;
    float lastPixelRatio = 0.0f;

    bool initialize(const SceneConfig&, int width, int height, float pixelRatio) override {
        initializeCalls++;
        lastWidth = width;
        lastHeight = height;
        lastPixelRatio = pixelRatio;
        return initializeResult;
    }

    bool uploadChunk(const Chunk& chunk) override {
        uploadedSlots.push_back(chunk.slot);
        return uploadResult;
    }

    void resize(int width, int height, float pixelRatio) override {
        resizeCalls++;
        lastWidth = width;
        lastHeight = height;
        lastPixelRatio = pixelRatio;
    }

    void setPixelRatio(float pixelRatio) override {
        pixelRatioCalls++;
        lastPixelRatio = pixelRatio;
    }

    void drawFrame(const FrameState& frame) override {
        drawCalls++;
        if (recordFrames) frames.push_back(frame);
    }

    void shutdown() override { shutdownCalls++; }
};

class FakeContainer : public HostContainer {
public:
    int w = 1280;
    int h = 720;
    float ratio = 1.0f;
    DeviceInfo info;
    int backgroundCalls = 0;
    GradientBackground background;

    FakeContainer() {
        info.viewportWidth = 1920;
        info.userAgent = "Linux";
    }

    int width() const override { return w; }
    int height() const override { return h; }
    float devicePixelRatio() const override { return ratio; }
    DeviceInfo deviceInfo() const override { return info; }

    void setBackground(const GradientBackground& bg) override {
        backgroundCalls++;
        background = bg;
    }
};

}
}
