#include <gtest/gtest.h>
#include <glm/gtc/matrix_transform.hpp>

#include "Scene.hpp"
#include "TestDoubles.hpp"

using namespace skyline;
using skyline::testing::FakeContainer;
using skyline::testing::RecordingBackend;

namespace {

SceneConfig sceneConfig() {
    SceneConfig config = skyline::testing::smallConfig();
    config.buildingCount = 1;
    config.mobileBuildingCount = 1;
    return config;
}

} // namespace

TEST(Scene, StartsRunningWithEveryChunkUploaded) {
    RecordingBackend backend;
    FakeContainer container;
    SceneContext scene;
    scene.initScene(backend, container, sceneConfig());

    EXPECT_EQ(scene.getState(), SceneState::Running);
    EXPECT_EQ(backend.initializeCalls, 1);
    EXPECT_EQ(backend.lastWidth, 1280);
    EXPECT_EQ(backend.lastHeight, 720);
    EXPECT_EQ(backend.uploadedSlots, (std::vector<int>{ 0, 1, 2 }));
    EXPECT_EQ(container.backgroundCalls, 0);
    EXPECT_FLOAT_EQ(scene.getAspect(), 1280.0f / 720.0f);
    EXPECT_EQ(scene.getSeed(), 42u);
}

TEST(Scene, FallsBackWhenBackendUnavailable) {
    RecordingBackend backend;
    backend.initializeResult = false;
    FakeContainer container;
    SceneContext scene;

    EXPECT_NO_THROW(scene.initScene(backend, container, sceneConfig()));
    EXPECT_EQ(scene.getState(), SceneState::Fallback);
    EXPECT_EQ(container.backgroundCalls, 1);
    EXPECT_FALSE(container.background.rasterize(8, 8).empty());
    EXPECT_TRUE(backend.uploadedSlots.empty());
    EXPECT_EQ(backend.shutdownCalls, 1);

    EXPECT_FALSE(scene.frame(16.0));
    EXPECT_TRUE(backend.frames.empty());

    scene.disposeScene();
    EXPECT_EQ(scene.getState(), SceneState::Disposed);
    EXPECT_EQ(backend.shutdownCalls, 1);
}

TEST(Scene, FallsBackWhenChunkUploadFails) {
    RecordingBackend backend;
    backend.uploadResult = false;
    FakeContainer container;
    SceneContext scene;
    scene.initScene(backend, container, sceneConfig());

    EXPECT_EQ(scene.getState(), SceneState::Fallback);
    EXPECT_EQ(container.backgroundCalls, 1);
    EXPECT_TRUE(scene.getPool().empty());
}

TEST(Scene, DesktopPixelRatioIsCapped) {
    RecordingBackend backend;
    FakeContainer container;
    container.ratio = 3.0f;
    SceneContext scene;
    scene.initScene(backend, container, sceneConfig());

    EXPECT_EQ(scene.getDeviceTier(), DeviceTier::Desktop);
    EXPECT_FLOAT_EQ(scene.getPixelRatio(), 2.0f);
    EXPECT_FLOAT_EQ(backend.lastPixelRatio, 2.0f);
}

TEST(Scene, NarrowContainerUsesMobileTier) {
    RecordingBackend backend;
    FakeContainer container;
    container.ratio = 3.0f;
    container.info.viewportWidth = 390;
    SceneContext scene;
    scene.initScene(backend, container, sceneConfig());

    EXPECT_EQ(scene.getDeviceTier(), DeviceTier::Mobile);
    EXPECT_FLOAT_EQ(scene.getPixelRatio(), 1.5f);
}

TEST(Scene, FrameMovesCameraAndDraws) {
    RecordingBackend backend;
    FakeContainer container;
    SceneConfig config = sceneConfig();
    SceneContext scene;
    scene.initScene(backend, container, config);

    const float startZ = scene.getCameraPosition().z;
    EXPECT_TRUE(scene.frame(0.0));
    EXPECT_TRUE(scene.frame(16.0));

    ASSERT_EQ(backend.frames.size(), 2u);
    EXPECT_FLOAT_EQ(scene.getCameraPosition().z, startZ - 2.0f * config.travelPerFrame);
    EXPECT_FLOAT_EQ(scene.getCameraPosition().y, config.cameraHeight);

    const FrameState& frame = backend.frames.back();
    EXPECT_EQ(frame.chunkOffsets.size(), 3u);
    EXPECT_EQ(frame.frameIndex, 1u);
    EXPECT_EQ(frame.cameraPosition, scene.getCameraPosition());
    EXPECT_TRUE(frame.fog.enabled);
    EXPECT_NEAR(glm::length(frame.lights.sunDirection), 1.0f, 1e-5f);
}

TEST(Scene, FramesRecycleChunksAhead) {
    RecordingBackend backend;
    FakeContainer container;
    SceneConfig config = sceneConfig();
    config.travelPerFrame = 500.0f;
    SceneContext scene;
    scene.initScene(backend, container, config);

    scene.frame(0.0);
    scene.frame(16.0);

    const FrameState& frame = backend.frames.back();
    EXPECT_FLOAT_EQ(frame.chunkOffsets[0], -3000.0f);
    EXPECT_FLOAT_EQ(frame.chunkOffsets[1], -1000.0f);
    EXPECT_FLOAT_EQ(frame.chunkOffsets[2], -2000.0f);
    EXPECT_EQ(scene.getPool().order(), (std::vector<int>{ 1, 2, 0 }));
}

TEST(Scene, CameraStaysInsideNearestChunkOverLongFlights) {
    RecordingBackend backend;
    backend.recordFrames = false;
    FakeContainer container;
    SceneConfig config = sceneConfig();
    config.travelPerFrame = 1.7f;
    SceneContext scene;
    scene.initScene(backend, container, config);
    ASSERT_TRUE(scene.isRunning());

    const ChunkPool& pool = scene.getPool();
    const float length = pool.getChunkLength();
    for (int i = 0; i < 1000000; ++i) {
        ASSERT_TRUE(scene.frame(i * 16.0));
        const float z = scene.getCameraPosition().z;
        const float nearEdge = pool.chunkAt(0).offset;
        ASSERT_LE(z, nearEdge) << "frame " << i;
        ASSERT_GT(z, nearEdge - length) << "frame " << i;
    }

    EXPECT_EQ(backend.drawCalls, 1000000);
    EXPECT_GT(pool.getRebaseCount(), 0);
    EXPECT_GT(scene.getCameraPosition().z, -(ChunkPool::kRebaseDistance + length));
    // 1.7 million units of travel
    EXPECT_NEAR(static_cast<double>(pool.getRecycleCount()), 1700.0, 2.0);
}

TEST(Scene, FacadeRastersAreReleasedAfterUpload) {
    RecordingBackend backend;
    FakeContainer container;
    SceneConfig config = sceneConfig();
    config.buildingCount = 3;
    SceneContext scene;
    scene.initScene(backend, container, config);
    ASSERT_TRUE(scene.isRunning());

    size_t blocks = 0;
    scene.getPool().forEachChunk([&blocks](const Chunk& chunk) {
        EXPECT_EQ(chunk.textureBytes(), 0u);
        blocks += chunk.blockCount();
    });
    EXPECT_GT(blocks, 0u);
}

TEST(Scene, ResizeIsDebounced) {
    RecordingBackend backend;
    FakeContainer container;
    SceneContext scene;
    scene.initScene(backend, container, sceneConfig());

    container.w = 800;
    container.h = 800;
    scene.notifyResize(0.0);
    scene.notifyResize(50.0);
    EXPECT_TRUE(scene.hasPendingResize());

    EXPECT_FALSE(scene.pump(120.0));
    EXPECT_EQ(backend.resizeCalls, 0);

    EXPECT_TRUE(scene.pump(150.0));
    EXPECT_EQ(backend.resizeCalls, 1);
    EXPECT_EQ(backend.lastWidth, 800);
    EXPECT_EQ(backend.lastHeight, 800);
    EXPECT_FLOAT_EQ(scene.getAspect(), 1.0f);

    EXPECT_FALSE(scene.pump(1000.0));
    EXPECT_EQ(backend.resizeCalls, 1);
}

TEST(Scene, FrameAppliesDueResize) {
    RecordingBackend backend;
    FakeContainer container;
    SceneContext scene;
    scene.initScene(backend, container, sceneConfig());

    container.w = 640;
    container.h = 480;
    scene.notifyResize(0.0);
    scene.frame(50.0);
    EXPECT_EQ(backend.resizeCalls, 0);
    scene.frame(200.0);
    EXPECT_EQ(backend.resizeCalls, 1);
    EXPECT_FLOAT_EQ(scene.getAspect(), 640.0f / 480.0f);
}

TEST(Scene, ResizeReclampsWithoutUndoingReductions) {
    RecordingBackend backend;
    FakeContainer container;
    container.ratio = 2.0f;
    SceneContext scene;
    scene.initScene(backend, container, sceneConfig());
    ASSERT_FLOAT_EQ(scene.getPixelRatio(), 2.0f);

    // Moved to a lower density display
    container.ratio = 1.25f;
    scene.notifyResize(0.0);
    scene.pump(500.0);
    EXPECT_FLOAT_EQ(scene.getPixelRatio(), 1.25f);

    // Back to a high density display: the ratio stays where it was
    container.ratio = 2.0f;
    scene.notifyResize(600.0);
    scene.pump(1000.0);
    EXPECT_FLOAT_EQ(scene.getPixelRatio(), 1.25f);
}

TEST(Scene, ZeroSizedContainerKeepsAspect) {
    RecordingBackend backend;
    FakeContainer container;
    SceneContext scene;
    scene.initScene(backend, container, sceneConfig());
    const float aspect = scene.getAspect();

    container.w = 0;
    container.h = 0;
    scene.notifyResize(0.0);
    scene.pump(500.0);
    EXPECT_FLOAT_EQ(scene.getAspect(), aspect);
    EXPECT_EQ(backend.resizeCalls, 0);
}

TEST(Scene, SlowFramesLowerPixelRatio) {
    RecordingBackend backend;
    FakeContainer container;
    container.ratio = 2.0f;
    SceneContext scene;
    scene.initScene(backend, container, sceneConfig());

    // 10 fps
    for (int i = 0; i < 60; ++i) {
        scene.frame(i * 100.0);
    }
    EXPECT_FLOAT_EQ(scene.getPixelRatio(), 1.75f);
    EXPECT_EQ(backend.pixelRatioCalls, 1);
    EXPECT_FLOAT_EQ(backend.frames.back().pixelRatio, 1.75f);
}

TEST(Scene, HiddenSceneDoesNotDraw) {
    RecordingBackend backend;
    FakeContainer container;
    SceneContext scene;
    scene.initScene(backend, container, sceneConfig());

    scene.frame(0.0);
    scene.setVisible(false, 16.0);
    EXPECT_EQ(scene.getState(), SceneState::Paused);

    const glm::vec3 camera = scene.getCameraPosition();
    EXPECT_FALSE(scene.frame(32.0));
    EXPECT_FALSE(scene.frame(48.0));
    EXPECT_EQ(backend.frames.size(), 1u);
    EXPECT_EQ(scene.getCameraPosition(), camera);

    scene.setVisible(true, 60000.0);
    EXPECT_EQ(scene.getState(), SceneState::Running);
    EXPECT_TRUE(scene.frame(60016.0));
    EXPECT_EQ(backend.frames.size(), 2u);

    // The hidden minute does not register as a slow frame
    EXPECT_FLOAT_EQ(scene.getFps(), 60.0f);
}

TEST(Scene, VisibilityDoesNotRevive) {
    RecordingBackend backend;
    backend.initializeResult = false;
    FakeContainer container;
    SceneContext scene;
    scene.initScene(backend, container, sceneConfig());

    scene.setVisible(false, 0.0);
    scene.setVisible(true, 10.0);
    EXPECT_EQ(scene.getState(), SceneState::Fallback);
}

TEST(Scene, DisposeIsIdempotent) {
    RecordingBackend backend;
    FakeContainer container;
    SceneContext scene;
    scene.initScene(backend, container, sceneConfig());

    scene.disposeScene();
    EXPECT_EQ(scene.getState(), SceneState::Disposed);
    EXPECT_EQ(backend.shutdownCalls, 1);
    EXPECT_TRUE(scene.getPool().empty());

    scene.disposeScene();
    EXPECT_EQ(backend.shutdownCalls, 1);

    EXPECT_FALSE(scene.frame(100.0));
    scene.notifyResize(100.0);
    EXPECT_FALSE(scene.hasPendingResize());
}

TEST(Scene, DisposeBeforeInitIsSafe) {
    SceneContext scene;
    EXPECT_NO_THROW(scene.disposeScene());
    EXPECT_EQ(scene.getState(), SceneState::Disposed);
}

TEST(Scene, CanRestartAfterDispose) {
    RecordingBackend backend;
    FakeContainer container;
    SceneContext scene;
    scene.initScene(backend, container, sceneConfig());
    scene.disposeScene();

    scene.initScene(backend, container, sceneConfig());
    EXPECT_EQ(scene.getState(), SceneState::Running);
    EXPECT_EQ(backend.initializeCalls, 2);
    EXPECT_TRUE(scene.frame(0.0));
}

TEST(Scene, SameSeedSameCity) {
    RecordingBackend backendA;
    RecordingBackend backendB;
    FakeContainer container;
    SceneContext a;
    SceneContext b;
    a.initScene(backendA, container, sceneConfig());
    b.initScene(backendB, container, sceneConfig());

    for (int slot = 0; slot < a.getPool().size(); ++slot) {
        const Chunk& ca = a.getPool().chunkForSlot(slot);
        const Chunk& cb = b.getPool().chunkForSlot(slot);
        ASSERT_EQ(ca.buildings.size(), cb.buildings.size());
        for (size_t i = 0; i < ca.buildings.size(); ++i) {
            EXPECT_EQ(ca.buildings[i].origin, cb.buildings[i].origin);
            EXPECT_EQ(ca.buildings[i].style, cb.buildings[i].style);
        }
    }
}

TEST(Scene, ProjectionFollowsConfig) {
    RecordingBackend backend;
    FakeContainer container;
    container.w = 1000;
    container.h = 500;
    SceneConfig config = sceneConfig();
    SceneContext scene;
    scene.initScene(backend, container, config);

    glm::mat4 expected = glm::perspective(glm::radians(config.fovDegrees), 2.0f, config.nearPlane, config.farPlane);
    glm::mat4 actual = scene.projectionMatrix();
    for (int c = 0; c < 4; ++c) {
        for (int r = 0; r < 4; ++r) {
            EXPECT_FLOAT_EQ(actual[c][r], expected[c][r]);
        }
    }

    // Camera looks ahead along -Z and slightly down
    glm::vec4 ahead = scene.viewMatrix() * glm::vec4(0.0f, config.cameraHeight - 20.0f, -100.0f, 1.0f);
    EXPECT_NEAR(ahead.x, 0.0f, 1e-3f);
    EXPECT_NEAR(ahead.y, 0.0f, 1e-3f);
    EXPECT_LT(ahead.z, 0.0f);
}
