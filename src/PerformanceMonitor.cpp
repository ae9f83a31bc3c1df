#include "PerformanceMonitor.hpp"
#include "SceneConfig.hpp"

#include <algorithm>
#include <cmath>
#include <regex>

namespace skyline {

DeviceTier classifyDevice(const DeviceInfo& info, int mobileWidthThreshold) {
    if (info.viewportWidth < mobileWidthThreshold) {
        return DeviceTier::Mobile;
    }

    static const std::regex handheld("Android|iPhone|iPad|iPod|webOS|BlackBerry|IEMobile|Opera Mini",
                                     std::regex::icase);
    if (info.hasTouch && std::regex_search(info.userAgent, handheld)) {
        return DeviceTier::Mobile;
    }
    return DeviceTier::Desktop;
}

float optimalPixelRatio(DeviceTier tier, float nativeRatio, const SceneConfig& config) {
    if (!std::isfinite(nativeRatio) || nativeRatio <= 0.0f) {
        nativeRatio = 1.0f;
    }
    float cap = tier == DeviceTier::Mobile ? config.mobilePixelRatioCap : config.desktopPixelRatioCap;
    return std::min(nativeRatio, cap);
}

const char* deviceTierName(DeviceTier tier) {
    return tier == DeviceTier::Mobile ? "mobile" : "desktop";
}

FpsMeter::FpsMeter(float initialFps, double windowMs)
    : fps_(initialFps)
    , windowMs_(windowMs)
{
}

float FpsMeter::tick(double nowMs) {
    if (!started_) {
        restart(nowMs);
    }

    frames_++;
    double elapsed = nowMs - windowStart_;
    if (elapsed >= windowMs_ && elapsed > 0.0) {
        fps_ = static_cast<float>(std::round(frames_ * 1000.0 / elapsed));
        windowStart_ = nowMs;
        frames_ = 0;
    }
    return fps_;
}

void FpsMeter::restart(double nowMs) {
    windowStart_ = nowMs;
    frames_ = 0;
    started_ = true;
}

}
