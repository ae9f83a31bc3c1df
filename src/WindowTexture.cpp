#include "WindowTexture.hpp"
#include "SceneConfig.hpp"
#include "SceneRandom.hpp"

#include <algorithm>
#include <cmath>

namespace skyline {

namespace {

struct WindowPreset {
    WindowStyle style;
    int cellWidth;
    int cellHeight;
    int gapX;
    int gapY;
    float weight;
};

const WindowPreset kPresets[] = {
    { WindowStyle::Office,      6, 10, 4, 6, 0.4f },
    { WindowStyle::Slit,       20,  8, 4, 8, 0.3f },
    { WindowStyle::CurtainWall, 12, 12, 2, 2, 0.3f },
};

const WindowPreset& pickPreset(SceneRandom& rng) {
    float roll = rng.next();
    float cumulative = 0.0f;
    for (const auto& preset : kPresets) {
        cumulative += preset.weight;
        if (roll < cumulative) return preset;
    }
    return kPresets[2];
}

uint8_t toByte(float v) {
    return static_cast<uint8_t>(std::lround(std::min(std::max(v, 0.0f), 1.0f) * 255.0f));
}

void fillRect(WindowTexture& tex, int x0, int y0, int w, int h, const glm::vec3& color) {
    const int x1 = std::min(x0 + w, tex.width);
    const int y1 = std::min(y0 + h, tex.height);
    const uint8_t r = toByte(color.r), g = toByte(color.g), b = toByte(color.b);
    for (int y = std::max(y0, 0); y < y1; ++y) {
        uint8_t* row = tex.pixels.data() + static_cast<size_t>(y) * tex.width * 4;
        for (int x = std::max(x0, 0); x < x1; ++x) {
            row[x * 4 + 0] = r;
            row[x * 4 + 1] = g;
            row[x * 4 + 2] = b;
            row[x * 4 + 3] = 255;
        }
    }
}

const glm::vec3& pickLitColor(ColorTheme theme, const SceneConfig& config, SceneRandom& rng) {
    const std::vector<glm::vec3>* palette = &config.warmWindowColors;
    if (theme == ColorTheme::Cool) {
        palette = &config.coolWindowColors;
    } else if (theme == ColorTheme::Mixed && rng.chance(0.5f)) {
        palette = &config.coolWindowColors;
    }
    if (palette->empty()) palette = &config.warmWindowColors;
    if (palette->empty()) return config.wallColor;
    return (*palette)[rng.pick(palette->size())];
}

} // namespace

const char* windowStyleName(WindowStyle style) {
    switch (style) {
        case WindowStyle::Office: return "office";
        case WindowStyle::Slit: return "slit";
        case WindowStyle::CurtainWall: return "curtain-wall";
    }
    return "unknown";
}

WindowTexture synthesizeWindowTexture(float facadeWidth, float facadeHeight,
                                      const SceneConfig& config, float textureScale,
                                      SceneRandom& rng) {
    WindowTexture tex;

    // Degenerate facades fall back to a square raster
    float aspect = 1.0f;
    if (std::isfinite(facadeWidth) && std::isfinite(facadeHeight) && facadeWidth > 0.0f && facadeHeight > 0.0f) {
        aspect = facadeHeight / facadeWidth;
    }
    if (!std::isfinite(textureScale) || textureScale <= 0.0f) textureScale = 1.0f;

    float scaledWidth = std::round(kWindowTextureBaseWidth * textureScale);
    tex.width = static_cast<int>(std::min(std::max(scaledWidth, static_cast<float>(kWindowTextureMinSize)),
                                          static_cast<float>(kWindowTextureMaxWidth)));
    float scaledHeight = std::round(static_cast<float>(tex.width) * aspect);
    if (!std::isfinite(scaledHeight)) scaledHeight = static_cast<float>(kWindowTextureMaxHeight);
    tex.height = static_cast<int>(std::min(std::max(scaledHeight, static_cast<float>(kWindowTextureMinSize)),
                                           static_cast<float>(kWindowTextureMaxHeight)));

    tex.pixels.assign(static_cast<size_t>(tex.width) * tex.height * 4, 0);
    fillRect(tex, 0, 0, tex.width, tex.height, config.wallColor);

    const WindowPreset& preset = pickPreset(rng);
    tex.style = preset.style;
    tex.theme = static_cast<ColorTheme>(rng.pick(3));

    const int strideX = preset.cellWidth + preset.gapX;
    const int strideY = preset.cellHeight + preset.gapY;
    tex.columns = tex.width / strideX;
    tex.rows = tex.height / strideY;
    tex.activeFloors.resize(static_cast<size_t>(tex.rows));

    for (int row = 0; row < tex.rows; ++row) {
        const bool active = rng.chance(kActiveFloorChance);
        tex.activeFloors[static_cast<size_t>(row)] = active;
        const float litChance = active ? kActiveFloorLitChance : kIdleFloorLitChance;

        for (int col = 0; col < tex.columns; ++col) {
            const int x = col * strideX + preset.gapX / 2;
            const int y = row * strideY + preset.gapY / 2;
            if (rng.chance(litChance)) {
                fillRect(tex, x, y, preset.cellWidth, preset.cellHeight, pickLitColor(tex.theme, config, rng));
                tex.litWindows++;
            } else {
                fillRect(tex, x, y, preset.cellWidth, preset.cellHeight, config.darkWindowColor);
            }
        }
    }

    return tex;
}

}
