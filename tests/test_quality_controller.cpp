#include <gtest/gtest.h>
#include <limits>

#include "QualityController.hpp"
#include "SceneConfig.hpp"
#include "SceneRandom.hpp"

using namespace skyline;

namespace {

// Feed one full sampling interval at a constant fps; returns whether the
// last frame lowered the ratio
bool runInterval(QualityController& controller, float fps, int interval) {
    bool reduced = false;
    for (int i = 0; i < interval; ++i) {
        reduced = controller.onFrame(fps);
    }
    return reduced;
}

} // namespace

TEST(QualityController, ChecksOnlyAtSamplingInterval) {
    SceneConfig config;
    QualityController controller(config, 2.0f);

    for (int i = 1; i < config.fpsSampleInterval; ++i) {
        EXPECT_FALSE(controller.onFrame(10.0f));
    }
    EXPECT_TRUE(controller.onFrame(10.0f));
    EXPECT_FLOAT_EQ(controller.getPixelRatio(), 1.75f);
}

TEST(QualityController, ThresholdIsEightyPercentOfTarget) {
    SceneConfig config;
    QualityController controller(config, 2.0f);

    // 48 is exactly 80% of 60
    EXPECT_FALSE(runInterval(controller, 48.0f, config.fpsSampleInterval));
    EXPECT_FALSE(runInterval(controller, 59.0f, config.fpsSampleInterval));
    EXPECT_FLOAT_EQ(controller.getPixelRatio(), 2.0f);

    EXPECT_TRUE(runInterval(controller, 47.9f, config.fpsSampleInterval));
    EXPECT_FLOAT_EQ(controller.getPixelRatio(), 1.75f);
}

TEST(QualityController, FloorsAtMinimum) {
    SceneConfig config;
    QualityController controller(config, 2.0f);

    for (int i = 0; i < 10; ++i) {
        runInterval(controller, 5.0f, config.fpsSampleInterval);
    }
    EXPECT_FLOAT_EQ(controller.getPixelRatio(), 1.0f);
    EXPECT_EQ(controller.getReductionCount(), 4);
    EXPECT_FALSE(runInterval(controller, 5.0f, config.fpsSampleInterval));
}

TEST(QualityController, NeverRecovers) {
    SceneConfig config;
    QualityController controller(config, 2.0f);
    runInterval(controller, 20.0f, config.fpsSampleInterval);
    ASSERT_FLOAT_EQ(controller.getPixelRatio(), 1.75f);

    for (int i = 0; i < 5; ++i) {
        runInterval(controller, 120.0f, config.fpsSampleInterval);
    }
    EXPECT_FLOAT_EQ(controller.getPixelRatio(), 1.75f);
}

TEST(QualityController, RatioIsNonIncreasingForAnySamples) {
    SceneConfig config;
    config.fpsSampleInterval = 7;
    SceneRandom rng(50);

    for (int run = 0; run < 20; ++run) {
        QualityController controller(config, 2.0f);
        float previous = controller.getPixelRatio();
        for (int frame = 0; frame < 500; ++frame) {
            controller.onFrame(rng.range(0.0f, 120.0f));
            ASSERT_LE(controller.getPixelRatio(), previous);
            ASSERT_GE(controller.getPixelRatio(), config.minPixelRatio);
            previous = controller.getPixelRatio();
        }
    }
}

TEST(QualityController, StartingBelowMinimumIsLeftAlone) {
    SceneConfig config;
    QualityController controller(config, 0.8f);
    EXPECT_FALSE(runInterval(controller, 1.0f, config.fpsSampleInterval));
    EXPECT_FLOAT_EQ(controller.getPixelRatio(), 0.8f);
}

TEST(QualityController, ClampOnlyLowers) {
    SceneConfig config;
    QualityController controller(config, 1.5f);

    controller.clampTo(2.0f);
    EXPECT_FLOAT_EQ(controller.getPixelRatio(), 1.5f);

    controller.clampTo(std::numeric_limits<float>::quiet_NaN());
    EXPECT_FLOAT_EQ(controller.getPixelRatio(), 1.5f);

    controller.clampTo(1.25f);
    EXPECT_FLOAT_EQ(controller.getPixelRatio(), 1.25f);
}

TEST(QualityController, FrameCounterWrapsAtInterval) {
    SceneConfig config;
    config.fpsSampleInterval = 7;
    QualityController controller(config, 2.0f);

    int samples = 0;
    for (int i = 1; i <= 7 * 100000; ++i) {
        if (controller.onFrame(60.0f)) samples++;
        ASSERT_LT(controller.getFramesSinceSample(), config.fpsSampleInterval);
        ASSERT_EQ(controller.getFramesSinceSample(), i % 7);
    }
    EXPECT_EQ(samples, 0);

    // Sampling stays on the interval boundary after many wraps
    for (int i = 1; i < 7; ++i) {
        EXPECT_FALSE(controller.onFrame(10.0f));
    }
    EXPECT_TRUE(controller.onFrame(10.0f));
}
