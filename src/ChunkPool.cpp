#include "ChunkPool.hpp"
#include "SceneConfig.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace skyline {

namespace {
constexpr double kRecycleCountLimit = 1.0e18;
}

void ChunkPool::initialize(DeviceTier tier, const SceneConfig& config, SceneRandom& rng) {
    clear();
    chunkLength_ = config.chunkLength;

    printf("Building %d chunks (%s tier)...\n", config.chunkCount, deviceTierName(tier));
    chunks_.reserve(static_cast<size_t>(config.chunkCount));
    for (int slot = 0; slot < config.chunkCount; ++slot) {
        chunks_.push_back(buildChunk(slot, tier, config, rng));
    }
}

void ChunkPool::clear() {
    chunks_.clear();
    nearest_ = 0;
    counter_ = 0.0f;
    recycled_ = 0;
    rebases_ = 0;
}

int ChunkPool::advance(float distance) {
    if (chunks_.empty() || !(chunkLength_ > 0.0f) || !std::isfinite(distance) || distance < 0.0f) {
        return 0;
    }

    const int count = size();
    const double length = chunkLength_;
    const double travelled = static_cast<double>(counter_) + distance;

    double events = std::floor(travelled / length);
    counter_ = static_cast<float>(std::fmod(travelled, length));
    if (counter_ >= chunkLength_) {
        // Remainder rounded up to a full length in float
        counter_ = 0.0f;
        events += 1.0;
    }
    if (events < 1.0) {
        return 0;
    }

    // Whole laps move every chunk by the same multiple of K lengths; the
    // remaining events recycle one chunk each. The chunk `extra` places
    // behind the current nearest one becomes the new nearest.
    const double ring = static_cast<double>(count) * length;
    const int extra = static_cast<int>(std::fmod(events, static_cast<double>(count)));
    const double laps = (events - extra) / count;
    const double nearestOffset = static_cast<double>(chunkAt(extra).offset) - laps * ring;

    if (nearestOffset < -static_cast<double>(kRebaseDistance)) {
        nearest_ = (nearest_ + extra) % count;
        rebase();
    } else {
        for (auto& chunk : chunks_) {
            chunk.offset = static_cast<float>(chunk.offset - laps * ring);
        }
        for (int i = 0; i < extra; ++i) {
            Chunk& chunk = chunks_[static_cast<size_t>(nearest_)];
            chunk.offset = static_cast<float>(chunk.offset - ring);
            nearest_ = (nearest_ + 1) % count;
        }
    }

    recycled_ = static_cast<int64_t>(std::min(static_cast<double>(recycled_) + events, kRecycleCountLimit));
    return static_cast<int>(std::min(events, static_cast<double>(std::numeric_limits<int>::max())));
}

void ChunkPool::rebase() {
    for (int i = 0; i < size(); ++i) {
        chunks_[static_cast<size_t>((nearest_ + i) % size())].offset = -static_cast<float>(i) * chunkLength_;
    }
    rebases_++;
}

float ChunkPool::travelPosition() const {
    if (chunks_.empty()) {
        return 0.0f;
    }
    return chunkAt(0).offset - counter_;
}

void ChunkPool::releaseTexturePixels() {
    size_t released = 0;
    for (auto& chunk : chunks_) {
        released += chunk.textureBytes();
        chunk.releaseTexturePixels();
    }
    if (released > 0) {
        printf("Released %.1f MB of facade rasters\n", static_cast<double>(released) / (1024.0 * 1024.0));
    }
}

const Chunk& ChunkPool::chunkAt(int orderIndex) const {
    const int count = static_cast<int>(chunks_.size());
    return chunks_[static_cast<size_t>((nearest_ + orderIndex) % count)];
}

std::vector<int> ChunkPool::order() const {
    std::vector<int> slots;
    slots.reserve(chunks_.size());
    for (int i = 0; i < size(); ++i) {
        slots.push_back(chunkAt(i).slot);
    }
    return slots;
}

void ChunkPool::forEachChunk(const std::function<void(const Chunk&)>& fn) const {
    for (const auto& chunk : chunks_) {
        fn(chunk);
    }
}

}
