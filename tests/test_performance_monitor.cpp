#include <gtest/gtest.h>
#include <limits>

#include "PerformanceMonitor.hpp"
#include "SceneConfig.hpp"

using namespace skyline;

namespace {

DeviceInfo device(int width, bool touch, const char* agent) {
    DeviceInfo info;
    info.viewportWidth = width;
    info.hasTouch = touch;
    info.userAgent = agent;
    return info;
}

} // namespace

TEST(DeviceClassification, NarrowViewportIsMobile) {
    EXPECT_EQ(classifyDevice(device(600, false, "Linux"), 768), DeviceTier::Mobile);
    EXPECT_EQ(classifyDevice(device(767, false, "Linux"), 768), DeviceTier::Mobile);
    EXPECT_EQ(classifyDevice(device(768, false, "Linux"), 768), DeviceTier::Desktop);
}

TEST(DeviceClassification, TouchWithHandheldAgentIsMobile) {
    EXPECT_EQ(classifyDevice(device(1024, true, "Mozilla/5.0 (iPad; CPU OS 17_0)"), 768), DeviceTier::Mobile);
    EXPECT_EQ(classifyDevice(device(1920, true, "mozilla/5.0 (linux; android 14)"), 768), DeviceTier::Mobile);
}

TEST(DeviceClassification, AgentAloneIsNotEnough) {
    EXPECT_EQ(classifyDevice(device(1920, false, "iPhone"), 768), DeviceTier::Desktop);
    EXPECT_EQ(classifyDevice(device(1920, true, "Windows NT 10.0"), 768), DeviceTier::Desktop);
    EXPECT_EQ(classifyDevice(device(1920, true, ""), 768), DeviceTier::Desktop);
}

TEST(PixelRatio, CappedPerTier) {
    SceneConfig config;
    EXPECT_FLOAT_EQ(optimalPixelRatio(DeviceTier::Desktop, 3.0f, config), 2.0f);
    EXPECT_FLOAT_EQ(optimalPixelRatio(DeviceTier::Mobile, 3.0f, config), 1.5f);
    EXPECT_FLOAT_EQ(optimalPixelRatio(DeviceTier::Desktop, 1.25f, config), 1.25f);
    EXPECT_FLOAT_EQ(optimalPixelRatio(DeviceTier::Mobile, 1.0f, config), 1.0f);
}

TEST(PixelRatio, InvalidNativeRatioCountsAsOne) {
    SceneConfig config;
    EXPECT_FLOAT_EQ(optimalPixelRatio(DeviceTier::Desktop, 0.0f, config), 1.0f);
    EXPECT_FLOAT_EQ(optimalPixelRatio(DeviceTier::Desktop, -2.0f, config), 1.0f);
    EXPECT_FLOAT_EQ(optimalPixelRatio(DeviceTier::Desktop, std::numeric_limits<float>::quiet_NaN(), config), 1.0f);
    EXPECT_FLOAT_EQ(optimalPixelRatio(DeviceTier::Mobile, std::numeric_limits<float>::infinity(), config), 1.0f);
}

TEST(FpsMeter, KeepsInitialEstimateUntilFirstWindow) {
    FpsMeter meter(60.0f, 1000.0);
    for (int i = 0; i < 30; ++i) {
        EXPECT_FLOAT_EQ(meter.tick(i * 20.0), 60.0f);
    }
}

TEST(FpsMeter, EstimatesFramesPerSecondAtWindowBoundary) {
    FpsMeter meter(60.0f, 1000.0);
    // 51 frames from t=0 to t=1000
    float fps = 0.0f;
    for (int i = 0; i <= 50; ++i) {
        fps = meter.tick(i * 20.0);
    }
    EXPECT_FLOAT_EQ(fps, 51.0f);
    EXPECT_EQ(meter.getFramesInWindow(), 0);
}

TEST(FpsMeter, EstimateIsStaleBetweenWindows) {
    FpsMeter meter(60.0f, 1000.0);
    for (int i = 0; i <= 10; ++i) {
        meter.tick(i * 100.0);
    }
    ASSERT_FLOAT_EQ(meter.getFps(), 11.0f);

    // Fast frames inside the next window do not change the reading yet
    for (int i = 1; i < 50; ++i) {
        EXPECT_FLOAT_EQ(meter.tick(1000.0 + i * 10.0), 11.0f);
    }
    EXPECT_FLOAT_EQ(meter.tick(2000.0), 50.0f);
}

TEST(FpsMeter, RestartDropsPartialWindow) {
    FpsMeter meter(60.0f, 1000.0);
    meter.tick(0.0);
    meter.tick(10.0);
    meter.restart(50000.0);
    EXPECT_EQ(meter.getFramesInWindow(), 0);
    EXPECT_FLOAT_EQ(meter.getFps(), 60.0f);

    // Without the restart the long gap would read as one very slow window
    for (int i = 1; i <= 60; ++i) {
        meter.tick(50000.0 + i * (1000.0 / 60.0));
    }
    EXPECT_FLOAT_EQ(meter.getFps(), 60.0f);
}

TEST(DeviceTierName, Names) {
    EXPECT_STREQ(deviceTierName(DeviceTier::Desktop), "desktop");
    EXPECT_STREQ(deviceTierName(DeviceTier::Mobile), "mobile");
}
