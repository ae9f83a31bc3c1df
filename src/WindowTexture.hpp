#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace skyline {

struct SceneConfig;
class SceneRandom;

enum class WindowStyle {
    Office,      // Small tall windows, regular gaps
    Slit,        // Long horizontal ribbon windows
    CurtainWall  // Near-continuous glass, tiny mullions
};

enum class ColorTheme {
    Warm,
    Cool,
    Mixed
};

// Facade raster of lit/unlit windows. The emissive mask is the same image.
struct WindowTexture {
    int width = 0;
    int height = 0;
    WindowStyle style = WindowStyle::Office;
    ColorTheme theme = ColorTheme::Warm;
    int columns = 0;
    int rows = 0;
    std::vector<bool> activeFloors;  // One entry per row, top row first
    int litWindows = 0;
    std::vector<uint8_t> pixels;     // RGBA8, row-major, width * height * 4

    const std::vector<uint8_t>& emissiveMask() const { return pixels; }
    std::size_t byteSize() const { return pixels.size(); }
};

// Raster limits. The width follows the texture scale, the height follows the
// facade aspect ratio; both are clamped.
constexpr int kWindowTextureBaseWidth = 256;
constexpr int kWindowTextureMinSize = 16;
constexpr int kWindowTextureMaxWidth = 512;
constexpr int kWindowTextureMaxHeight = 1024;

// Floor/window lighting odds
constexpr float kActiveFloorChance = 0.4f;
constexpr float kActiveFloorLitChance = 0.65f;
constexpr float kIdleFloorLitChance = 0.05f;

WindowTexture synthesizeWindowTexture(float facadeWidth, float facadeHeight,
                                      const SceneConfig& config, float textureScale,
                                      SceneRandom& rng);

const char* windowStyleName(WindowStyle style);

}
