#pragma once

#include "ChunkBuilder.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace skyline {

// Fixed ring of K chunks. When the camera has travelled one chunk length
// past the nearest chunk, that chunk jumps K lengths ahead and becomes the
// farthest. Chunks are never rebuilt, only moved.
//
// Once the nearest chunk has moved past kRebaseDistance the whole ring is
// shifted back so the nearest chunk sits at offset 0 again. World positions
// derived from the pool (the camera included) stay near the origin.
class ChunkPool {
public:
    static constexpr float kRebaseDistance = 65536.0f;

    ChunkPool() = default;

    // Build K chunks; slot i starts at offset -i * chunkLength
    void initialize(DeviceTier tier, const SceneConfig& config, SceneRandom& rng);
    void clear();

    // Accumulate forward travel. Returns the number of chunks recycled,
    // saturated at INT_MAX. Negative or non-finite distances are ignored.
    int advance(float distance);

    // Drop the facade rasters once the back end holds its own copy.
    // Texture dimensions and window metadata are kept.
    void releaseTexturePixels();

    bool empty() const { return chunks_.empty(); }
    int size() const { return static_cast<int>(chunks_.size()); }

    // orderIndex 0 is the nearest chunk
    const Chunk& chunkAt(int orderIndex) const;
    const Chunk& chunkForSlot(int slot) const { return chunks_[static_cast<size_t>(slot)]; }

    // Slot ids, nearest first
    std::vector<int> order() const;

    float travelCounter() const { return counter_; }
    float getChunkLength() const { return chunkLength_; }
    int64_t getRecycleCount() const { return recycled_; }
    int getRebaseCount() const { return rebases_; }

    // Camera z relative to the pool: the nearest chunk's near edge minus
    // the travel since it became nearest
    float travelPosition() const;

    void forEachChunk(const std::function<void(const Chunk&)>& fn) const;

private:
    void rebase();

    std::vector<Chunk> chunks_;
    int nearest_ = 0;
    float counter_ = 0.0f;
    float chunkLength_ = 0.0f;
    int64_t recycled_ = 0;
    int rebases_ = 0;
};

}
