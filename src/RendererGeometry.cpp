#include "Renderer.hpp"
#include "ChunkBuilder.hpp"
#include "ChunkMesh.hpp"
#include <vulkan/vulkan.h>
#include <vector>
#include <cstring>
#include <cstdio>
#include <utility>

namespace skyline {

bool Renderer::uploadChunk(const Chunk& chunk) {
    if (!device_) return false;

    ChunkMesh mesh = buildChunkMesh(chunk, config_.beaconColor);

    ChunkGpu gpu;
    gpu.slot = chunk.slot;
    if (!createChunkBuffers(gpu, mesh) || !createChunkTextures(gpu, chunk)) {
        fprintf(stderr, "Failed to upload chunk %d\n", chunk.slot);
        destroyChunk(gpu);
        return false;
    }

    gpu.facadeDraws.reserve(mesh.facades.size());
    for (const auto& facade : mesh.facades) {
        MeshDraw draw;
        draw.firstIndex = facade.range.firstIndex;
        draw.indexCount = facade.range.indexCount;
        draw.textureIndex = facade.textureIndex;
        gpu.facadeDraws.push_back(draw);
    }
    gpu.plainDraw.firstIndex = mesh.plain.firstIndex;
    gpu.plainDraw.indexCount = mesh.plain.indexCount;
    gpu.beaconDraw.firstIndex = mesh.beacons.firstIndex;
    gpu.beaconDraw.indexCount = mesh.beacons.indexCount;

    // Re-uploading a slot replaces its previous geometry
    for (auto& existing : chunks_) {
        if (existing.slot == chunk.slot) {
            vkDeviceWaitIdle(device_);
            destroyChunk(existing);
            existing = std::move(gpu);
            return true;
        }
    }
    chunks_.push_back(std::move(gpu));
    return true;
}

bool Renderer::createChunkBuffers(ChunkGpu& gpu, const ChunkMesh& mesh) {
    if (mesh.vertices.empty() || mesh.indices.empty()) return false;
    if (!uploadToBuffer(gpu.vertexBuffer, mesh.vertices.data(), sizeof(float) * mesh.vertices.size(),
                        VK_BUFFER_USAGE_VERTEX_BUFFER_BIT)) {
        return false;
    }
    return uploadToBuffer(gpu.indexBuffer, mesh.indices.data(), sizeof(uint32_t) * mesh.indices.size(),
                          VK_BUFFER_USAGE_INDEX_BUFFER_BIT);
}

bool Renderer::createChunkTextures(ChunkGpu& gpu, const Chunk& chunk) {
    // Same order as buildChunkMesh assigns texture indices
    std::vector<const WindowTexture*> sources;
    for (const auto& building : chunk.buildings) {
        for (const auto& block : building.blocks) {
            sources.push_back(&block.texture);
        }
    }
    if (sources.empty()) return true;

    gpu.textures.resize(sources.size());
    if (!uploadTexturePixels(sources, gpu.textures)) return false;
    return allocateTextureSets(gpu);
}

// All textures of a batch go through one staging buffer and one submit
bool Renderer::uploadTexturePixels(const std::vector<const WindowTexture*>& sources, std::vector<GpuTexture>& targets) {
    VkDeviceSize totalSize = 0;
    for (const WindowTexture* tex : sources) {
        if (tex->width <= 0 || tex->height <= 0 || tex->byteSize() != (size_t)tex->width * tex->height * 4) {
            fprintf(stderr, "Malformed window texture %dx%d\n", tex->width, tex->height);
            return false;
        }
        totalSize += tex->byteSize();
    }

    for (size_t i = 0; i < sources.size(); ++i) {
        if (!createImage((uint32_t)sources[i]->width, (uint32_t)sources[i]->height, VK_FORMAT_R8G8B8A8_UNORM,
                         VK_IMAGE_USAGE_SAMPLED_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT,
                         targets[i].image, targets[i].memory)) {
            return false;
        }
    }

    BufferWithMemory staging;
    if (!createBuffer(staging, totalSize, VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                      VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT, true)) {
        return false;
    }
    {
        uint8_t* dst = static_cast<uint8_t*>(staging.mapped);
        for (const WindowTexture* tex : sources) {
            std::memcpy(dst, tex->pixels.data(), tex->byteSize());
            dst += tex->byteSize();
        }
    }

    VkCommandBufferAllocateInfo cai{ VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO };
    cai.commandPool = commandPool_; cai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY; cai.commandBufferCount = 1;
    VkCommandBuffer cmd;
    if (vkAllocateCommandBuffers(device_, &cai, &cmd) != VK_SUCCESS) {
        destroyBuffer(staging);
        return false;
    }
    VkCommandBufferBeginInfo cbi{ VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO };
    cbi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT; vkBeginCommandBuffer(cmd, &cbi);

    VkDeviceSize offset = 0;
    for (size_t i = 0; i < sources.size(); ++i) {
        const WindowTexture* tex = sources[i];

        VkImageMemoryBarrier barrier{ VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER };
        barrier.oldLayout = VK_IMAGE_LAYOUT_UNDEFINED; barrier.newLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
        barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED; barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.image = targets[i].image;
        barrier.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT; barrier.subresourceRange.levelCount = 1; barrier.subresourceRange.layerCount = 1;
        barrier.srcAccessMask = 0; barrier.dstAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
        vkCmdPipelineBarrier(cmd, VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT, 0, 0, nullptr, 0, nullptr, 1, &barrier);

        VkBufferImageCopy region{};
        region.bufferOffset = offset;
        region.imageSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT; region.imageSubresource.mipLevel = 0;
        region.imageSubresource.baseArrayLayer = 0; region.imageSubresource.layerCount = 1;
        region.imageExtent = { (uint32_t)tex->width, (uint32_t)tex->height, 1 };
        vkCmdCopyBufferToImage(cmd, staging.buffer, targets[i].image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);

        barrier.oldLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL; barrier.newLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
        barrier.srcAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT; barrier.dstAccessMask = VK_ACCESS_SHADER_READ_BIT;
        vkCmdPipelineBarrier(cmd, VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT, 0, 0, nullptr, 0, nullptr, 1, &barrier);

        offset += tex->byteSize();
    }

    vkEndCommandBuffer(cmd);
    VkSubmitInfo submit{ VK_STRUCTURE_TYPE_SUBMIT_INFO }; submit.commandBufferCount = 1; submit.pCommandBuffers = &cmd;
    bool ok = vkQueueSubmit(graphicsQueue_, 1, &submit, VK_NULL_HANDLE) == VK_SUCCESS;
    if (ok) ok = vkQueueWaitIdle(graphicsQueue_) == VK_SUCCESS;
    vkFreeCommandBuffers(device_, commandPool_, 1, &cmd);
    destroyBuffer(staging);
    if (!ok) return false;

    for (auto& target : targets) {
        if (!createImageView(target.image, VK_FORMAT_R8G8B8A8_UNORM, VK_IMAGE_ASPECT_COLOR_BIT, target.view)) return false;
    }
    return true;
}

bool Renderer::allocateTextureSets(ChunkGpu& gpu) {
    const uint32_t count = (uint32_t)gpu.textures.size();

    VkDescriptorPoolSize size{};
    size.type = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER; size.descriptorCount = count;
    VkDescriptorPoolCreateInfo pci{ VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO };
    pci.maxSets = count; pci.poolSizeCount = 1; pci.pPoolSizes = &size;
    if (vkCreateDescriptorPool(device_, &pci, nullptr, &gpu.descriptorPool) != VK_SUCCESS) return false;

    std::vector<VkDescriptorSetLayout> layouts(count, textureSetLayout_);
    std::vector<VkDescriptorSet> sets(count, VK_NULL_HANDLE);
    VkDescriptorSetAllocateInfo ai{ VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO };
    ai.descriptorPool = gpu.descriptorPool;
    ai.descriptorSetCount = count;
    ai.pSetLayouts = layouts.data();
    if (vkAllocateDescriptorSets(device_, &ai, sets.data()) != VK_SUCCESS) return false;

    std::vector<VkDescriptorImageInfo> infos(count);
    std::vector<VkWriteDescriptorSet> writes(count);
    for (uint32_t i = 0; i < count; ++i) {
        gpu.textures[i].descriptorSet = sets[i];
        infos[i].imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
        infos[i].imageView = gpu.textures[i].view;
        infos[i].sampler = textureSampler_;
        writes[i] = VkWriteDescriptorSet{ VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET };
        writes[i].dstSet = sets[i]; writes[i].dstBinding = 0;
        writes[i].descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER; writes[i].descriptorCount = 1;
        writes[i].pImageInfo = &infos[i];
    }
    vkUpdateDescriptorSets(device_, count, writes.data(), 0, nullptr);
    return true;
}

void Renderer::destroyTexture(GpuTexture& texture) {
    if (texture.view) vkDestroyImageView(device_, texture.view, nullptr);
    if (texture.image) vkDestroyImage(device_, texture.image, nullptr);
    if (texture.memory) vkFreeMemory(device_, texture.memory, nullptr);
    texture = GpuTexture{};
}

void Renderer::destroyChunk(ChunkGpu& gpu) {
    destroyBuffer(gpu.vertexBuffer);
    destroyBuffer(gpu.indexBuffer);
    // Destroying the pool releases every set allocated from it
    if (gpu.descriptorPool) vkDestroyDescriptorPool(device_, gpu.descriptorPool, nullptr);
    gpu.descriptorPool = VK_NULL_HANDLE;
    for (auto& texture : gpu.textures) destroyTexture(texture);
    gpu.textures.clear();
    gpu.facadeDraws.clear();
}

void Renderer::drawChunk(VkCommandBuffer cmd, const ChunkGpu& gpu, float offset, bool beacons) {
    ChunkPushConstants push{ { 0.0f, 0.0f, offset, 0.0f } };
    vkCmdPushConstants(cmd, cityLayout_, VK_SHADER_STAGE_VERTEX_BIT, 0, sizeof(push), &push);

    VkDeviceSize offs = 0;
    vkCmdBindVertexBuffers(cmd, 0, 1, &gpu.vertexBuffer.buffer, &offs);
    vkCmdBindIndexBuffer(cmd, gpu.indexBuffer.buffer, 0, VK_INDEX_TYPE_UINT32);

    if (beacons) {
        if (gpu.beaconDraw.indexCount > 0) {
            vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, cityLayout_, 1, 1, &blankTexture_.descriptorSet, 0, nullptr);
            vkCmdDrawIndexed(cmd, gpu.beaconDraw.indexCount, 1, gpu.beaconDraw.firstIndex, 0, 0);
        }
        return;
    }

    for (const auto& draw : gpu.facadeDraws) {
        if (draw.textureIndex >= gpu.textures.size()) continue;
        vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, cityLayout_, 1, 1, &gpu.textures[draw.textureIndex].descriptorSet, 0, nullptr);
        vkCmdDrawIndexed(cmd, draw.indexCount, 1, draw.firstIndex, 0, 0);
    }
    if (gpu.plainDraw.indexCount > 0) {
        vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, cityLayout_, 1, 1, &blankTexture_.descriptorSet, 0, nullptr);
        vkCmdDrawIndexed(cmd, gpu.plainDraw.indexCount, 1, gpu.plainDraw.firstIndex, 0, 0);
    }
}

}
