#pragma once

namespace skyline {

struct SceneConfig;

// Lowers the render pixel ratio when the frame rate stays below 80% of the
// target. Reductions are one-way; the ratio never climbs back.
class QualityController {
public:
    QualityController(const SceneConfig& config, float initialRatio);

    // Count one frame. Every sampling interval the fps estimate is checked.
    // Returns true if the ratio was lowered on this frame.
    bool onFrame(float fps);

    // Explicit ratio from a resize; never raises the current ratio
    void clampTo(float ratio);

    float getPixelRatio() const { return pixelRatio_; }
    int getReductionCount() const { return reductions_; }
    int getFramesSinceSample() const { return frameCount_; }

private:
    float targetFps_;
    int sampleInterval_;
    float step_;
    float minRatio_;

    float pixelRatio_;
    int frameCount_ = 0;  // Wraps at sampleInterval_
    int reductions_ = 0;
};

}
