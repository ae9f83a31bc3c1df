#pragma once

#include "PerformanceMonitor.hpp"

#include <cstdint>
#include <string>
#include <vector>
#include <glm/glm.hpp>

namespace skyline {

// Static radial backdrop shown when nothing can be rendered
struct GradientBackground {
    glm::vec3 innerColor;
    glm::vec3 outerColor;

    // RGBA8 raster; the centre takes innerColor and the corners outerColor
    std::vector<uint8_t> rasterize(int width, int height) const;

    // CSS-style description, used for logging
    std::string describe() const;
};

// The dusk palette fallback: rgb(26,5,51) at the centre to rgb(5,5,16)
GradientBackground fallbackGradient();

// Whatever the scene is displayed in: supplies size, pixel density and
// device hints, and can show a static background.
class HostContainer {
public:
    virtual ~HostContainer() = default;

    // Logical size
    virtual int width() const = 0;
    virtual int height() const = 0;
    virtual float devicePixelRatio() const = 0;
    virtual DeviceInfo deviceInfo() const = 0;

    virtual void setBackground(const GradientBackground& background) = 0;
};

}
