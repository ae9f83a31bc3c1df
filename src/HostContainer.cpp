#include "HostContainer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace skyline {

namespace {

uint8_t toByte(float v) {
    return static_cast<uint8_t>(std::lround(std::min(std::max(v, 0.0f), 1.0f) * 255.0f));
}

} // namespace

std::vector<uint8_t> GradientBackground::rasterize(int width, int height) const {
    if (width <= 0 || height <= 0) {
        return {};
    }

    std::vector<uint8_t> pixels(static_cast<size_t>(width) * height * 4);
    const float cx = static_cast<float>(width) * 0.5f;
    const float cy = static_cast<float>(height) * 0.5f;

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            // Ellipse fitted to the surface, reaching 1 at the corners
            float dx = (static_cast<float>(x) + 0.5f - cx) / cx;
            float dy = (static_cast<float>(y) + 0.5f - cy) / cy;
            float t = std::min(std::sqrt(dx * dx + dy * dy) / std::sqrt(2.0f), 1.0f);
            glm::vec3 color = glm::mix(innerColor, outerColor, t);

            uint8_t* px = pixels.data() + (static_cast<size_t>(y) * width + x) * 4;
            px[0] = toByte(color.r);
            px[1] = toByte(color.g);
            px[2] = toByte(color.b);
            px[3] = 255;
        }
    }
    return pixels;
}

std::string GradientBackground::describe() const {
    char buffer[128];
    snprintf(buffer, sizeof(buffer), "radial-gradient(ellipse at center, rgb(%d,%d,%d) 0%%, rgb(%d,%d,%d) 100%%)",
             toByte(innerColor.r), toByte(innerColor.g), toByte(innerColor.b),
             toByte(outerColor.r), toByte(outerColor.g), toByte(outerColor.b));
    return buffer;
}

GradientBackground fallbackGradient() {
    GradientBackground background;
    background.innerColor = glm::vec3(26.0f, 5.0f, 51.0f) / 255.0f;
    background.outerColor = glm::vec3(5.0f, 5.0f, 16.0f) / 255.0f;
    return background;
}

}
