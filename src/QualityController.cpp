#include "QualityController.hpp"
#include "SceneConfig.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace skyline {

QualityController::QualityController(const SceneConfig& config, float initialRatio)
    : targetFps_(config.targetFps)
    , sampleInterval_(std::max(config.fpsSampleInterval, 1))
    , step_(config.pixelRatioStep)
    , minRatio_(config.minPixelRatio)
    , pixelRatio_(initialRatio)
{
}

bool QualityController::onFrame(float fps) {
    if (++frameCount_ < sampleInterval_) {
        return false;
    }
    frameCount_ = 0;

    if (!(fps < targetFps_ * 0.8f)) {
        return false;
    }

    float reduced = std::max(minRatio_, pixelRatio_ - step_);
    if (reduced >= pixelRatio_) {
        return false;
    }

    printf("Quality: %.0f fps below target %.0f, pixel ratio %.2f -> %.2f\n",
           fps, targetFps_, pixelRatio_, reduced);
    pixelRatio_ = reduced;
    reductions_++;
    return true;
}

void QualityController::clampTo(float ratio) {
    if (std::isfinite(ratio) && ratio < pixelRatio_) {
        pixelRatio_ = ratio;
    }
}

}
