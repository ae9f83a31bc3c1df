#pragma once

#include <string>

namespace skyline {

struct SceneConfig;

enum class DeviceTier {
    Desktop,
    Mobile
};

// What the host knows about the display it runs on
struct DeviceInfo {
    int viewportWidth = 0;
    bool hasTouch = false;
    std::string userAgent;
};

// Mobile when the viewport is narrow, or when a touch device reports a
// handheld user agent.
DeviceTier classifyDevice(const DeviceInfo& info, int mobileWidthThreshold);

// min(native, tier cap). Non-finite or non-positive native ratios count as 1.
float optimalPixelRatio(DeviceTier tier, float nativeRatio, const SceneConfig& config);

const char* deviceTierName(DeviceTier tier);

// Frames-per-second estimate refreshed once per window. Between window
// boundaries the last estimate is returned unchanged.
class FpsMeter {
public:
    FpsMeter(float initialFps, double windowMs);

    // Count one frame at time `nowMs` and return the current estimate
    float tick(double nowMs);

    // Start a new window at `nowMs` without touching the estimate
    void restart(double nowMs);

    float getFps() const { return fps_; }
    int getFramesInWindow() const { return frames_; }

private:
    float fps_;
    double windowMs_;
    double windowStart_ = 0.0;
    bool started_ = false;
    int frames_ = 0;
};

}
