#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

namespace skyline {

// Seeded source threaded through every generation call. The same seed
// always reproduces the same city.
class SceneRandom {
public:
    explicit SceneRandom(uint32_t seed) : rng_(seed), unit_(0.0f, 1.0f) {}

    // Uniform in [0, 1)
    float next() { return unit_(rng_); }

    // Uniform in [min, max); min > max is sampled the same way and stays bounded
    float range(float min, float max) { return min + next() * (max - min); }

    // Integer in [min, max] inclusive
    int rangeInt(int min, int max) {
        if (max <= min) return min;
        return min + static_cast<int>(next() * static_cast<float>(max - min + 1)) % (max - min + 1);
    }

    bool chance(float probability) { return next() < probability; }

    // Index into a container of `count` elements (count must be > 0)
    size_t pick(size_t count) {
        size_t index = static_cast<size_t>(next() * static_cast<float>(count));
        return index < count ? index : count - 1;
    }

private:
    std::mt19937 rng_;
    std::uniform_real_distribution<float> unit_;
};

} // namespace skyline
