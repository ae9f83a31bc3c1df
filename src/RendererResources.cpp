#include "Renderer.hpp"
#include "WindowTexture.hpp"
#include <vulkan/vulkan.h>
#include <vector>
#include <cstring>
#include <cstdio>

namespace skyline {

bool Renderer::createBuffer(BufferWithMemory& buffer, VkDeviceSize size, VkBufferUsageFlags usage,
                            VkMemoryPropertyFlags properties, bool map) {
    buffer = BufferWithMemory{};
    if (size == 0) return false;

    VkBufferCreateInfo bi{ VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO };
    bi.size = size;
    bi.usage = usage;
    bi.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    if (vkCreateBuffer(device_, &bi, nullptr, &buffer.buffer) != VK_SUCCESS) {
        buffer.buffer = VK_NULL_HANDLE;
        return false;
    }

    VkMemoryRequirements req{};
    vkGetBufferMemoryRequirements(device_, buffer.buffer, &req);
    VkMemoryAllocateInfo ai{ VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO };
    ai.allocationSize = req.size;
    ai.memoryTypeIndex = findMemoryType(req.memoryTypeBits, properties);

    // Any failure past this point releases whatever was created
    bool ok = ai.memoryTypeIndex != UINT32_MAX &&
              vkAllocateMemory(device_, &ai, nullptr, &buffer.memory) == VK_SUCCESS &&
              vkBindBufferMemory(device_, buffer.buffer, buffer.memory, 0) == VK_SUCCESS;
    if (ok && map && vkMapMemory(device_, buffer.memory, 0, size, 0, &buffer.mapped) != VK_SUCCESS) {
        buffer.mapped = nullptr;
        ok = false;
    }
    if (!ok) {
        fprintf(stderr, "Failed to create %llu byte buffer\n", static_cast<unsigned long long>(size));
        destroyBuffer(buffer);
    }
    return ok;
}

void Renderer::destroyBuffer(BufferWithMemory& buffer) {
    if (buffer.mapped) {
        vkUnmapMemory(device_, buffer.memory);
        buffer.mapped = nullptr;
    }
    if (buffer.buffer) {
        vkDestroyBuffer(device_, buffer.buffer, nullptr);
        buffer.buffer = VK_NULL_HANDLE;
    }
    if (buffer.memory) {
        vkFreeMemory(device_, buffer.memory, nullptr);
        buffer.memory = VK_NULL_HANDLE;
    }
}

// Host-visible buffer filled once, unmapped afterwards
bool Renderer::uploadToBuffer(BufferWithMemory& buffer, const void* data, VkDeviceSize size, VkBufferUsageFlags usage) {
    if (!createBuffer(buffer, size, usage, VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT, true)) {
        return false;
    }
    std::memcpy(buffer.mapped, data, (size_t)size);
    vkUnmapMemory(device_, buffer.memory);
    buffer.mapped = nullptr;
    return true;
}

bool Renderer::createImage(uint32_t width, uint32_t height, VkFormat format, VkImageUsageFlags usage,
                           VkImage& image, VkDeviceMemory& memory) {
    VkImageCreateInfo ci{ VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO };
    ci.imageType = VK_IMAGE_TYPE_2D;
    ci.format = format;
    ci.extent = { width, height, 1 };
    ci.mipLevels = 1;
    ci.arrayLayers = 1;
    ci.samples = VK_SAMPLE_COUNT_1_BIT;
    ci.tiling = VK_IMAGE_TILING_OPTIMAL;
    ci.usage = usage;
    ci.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    ci.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    if (vkCreateImage(device_, &ci, nullptr, &image) != VK_SUCCESS) {
        image = VK_NULL_HANDLE;
        return false;
    }

    memory = VK_NULL_HANDLE;
    VkMemoryRequirements req{};
    vkGetImageMemoryRequirements(device_, image, &req);
    VkMemoryAllocateInfo ai{ VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO };
    ai.allocationSize = req.size;
    ai.memoryTypeIndex = findMemoryType(req.memoryTypeBits, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);

    bool ok = ai.memoryTypeIndex != UINT32_MAX &&
              vkAllocateMemory(device_, &ai, nullptr, &memory) == VK_SUCCESS &&
              vkBindImageMemory(device_, image, memory, 0) == VK_SUCCESS;
    if (!ok) {
        fprintf(stderr, "Failed to allocate %ux%u image\n", width, height);
        if (memory) vkFreeMemory(device_, memory, nullptr);
        vkDestroyImage(device_, image, nullptr);
        image = VK_NULL_HANDLE;
        memory = VK_NULL_HANDLE;
    }
    return ok;
}

bool Renderer::createImageView(VkImage image, VkFormat format, VkImageAspectFlags aspect, VkImageView& view) {
    VkImageViewCreateInfo ci{ VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO };
    ci.image = image;
    ci.viewType = VK_IMAGE_VIEW_TYPE_2D;
    ci.format = format;
    ci.subresourceRange.aspectMask = aspect;
    ci.subresourceRange.levelCount = 1;
    ci.subresourceRange.layerCount = 1;
    return vkCreateImageView(device_, &ci, nullptr, &view) == VK_SUCCESS;
}

bool Renderer::createFullscreenQuad() {
    // For TRIANGLE_STRIP, order matters: BL, BR, TL, TR creates two triangles covering the screen
    const float quadVertices[] = {
        -1.0f, -1.0f,
         1.0f, -1.0f,
        -1.0f,  1.0f,
         1.0f,  1.0f
    };
    return uploadToBuffer(fullscreenQuad_, quadVertices, sizeof(quadVertices), VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
}

bool Renderer::createUniformBuffers() {
    return createBuffer(uniformBuffer_, sizeof(UniformBufferObject), VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT,
                        VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT, true);
}

// Frame UBO set, the present set and the blank texture set
bool Renderer::createDescriptorPoolAndSets() {
    VkDescriptorPoolSize sizes[2]{};
    sizes[0].type = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER; sizes[0].descriptorCount = 1;
    sizes[1].type = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER; sizes[1].descriptorCount = 2;

    VkDescriptorPoolCreateInfo pci{ VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO };
    pci.maxSets = 3; pci.poolSizeCount = 2; pci.pPoolSizes = sizes;
    if (vkCreateDescriptorPool(device_, &pci, nullptr, &descriptorPool_) != VK_SUCCESS) return false;

    VkDescriptorSetLayout layouts[] = { frameSetLayout_, textureSetLayout_, textureSetLayout_ };
    VkDescriptorSet sets[3] = {};
    VkDescriptorSetAllocateInfo ai{ VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO };
    ai.descriptorPool = descriptorPool_;
    ai.descriptorSetCount = 3;
    ai.pSetLayouts = layouts;
    if (vkAllocateDescriptorSets(device_, &ai, sets) != VK_SUCCESS) return false;
    frameDescriptorSet_ = sets[0];
    presentDescriptorSet_ = sets[1];
    blankTexture_.descriptorSet = sets[2];

    VkDescriptorBufferInfo bi{}; bi.buffer = uniformBuffer_.buffer; bi.offset = 0; bi.range = sizeof(UniformBufferObject);
    VkDescriptorImageInfo blankInfo{};
    blankInfo.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
    blankInfo.imageView = blankTexture_.view;
    blankInfo.sampler = textureSampler_;

    VkWriteDescriptorSet writes[2]{};
    writes[0].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    writes[0].dstSet = frameDescriptorSet_; writes[0].dstBinding = 0; writes[0].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER; writes[0].descriptorCount = 1; writes[0].pBufferInfo = &bi;
    writes[1].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    writes[1].dstSet = blankTexture_.descriptorSet; writes[1].dstBinding = 0; writes[1].descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER; writes[1].descriptorCount = 1; writes[1].pImageInfo = &blankInfo;
    vkUpdateDescriptorSets(device_, 2, writes, 0, nullptr);

    updatePresentDescriptor();
    return true;
}

void Renderer::updatePresentDescriptor() {
    if (!presentDescriptorSet_ || !hdrColorView_) return;
    VkDescriptorImageInfo hdrInfo{};
    hdrInfo.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
    hdrInfo.imageView = hdrColorView_;
    hdrInfo.sampler = presentSampler_;
    VkWriteDescriptorSet write{ VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET };
    write.dstSet = presentDescriptorSet_; write.dstBinding = 0;
    write.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER; write.descriptorCount = 1;
    write.pImageInfo = &hdrInfo;
    vkUpdateDescriptorSets(device_, 1, &write, 0, nullptr);
}

bool Renderer::createSamplers() {
    VkSamplerCreateInfo info{ VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO };
    info.addressModeU = info.addressModeV = info.addressModeW = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    info.borderColor = VK_BORDER_COLOR_INT_OPAQUE_BLACK;
    info.compareOp = VK_COMPARE_OP_ALWAYS;
    info.mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST;

    // Window cells stay crisp up close and blend together far away
    info.magFilter = VK_FILTER_NEAREST;
    info.minFilter = VK_FILTER_LINEAR;
    info.anisotropyEnable = facadeAnisotropy_ > 1.0f ? VK_TRUE : VK_FALSE;
    info.maxAnisotropy = facadeAnisotropy_;
    if (vkCreateSampler(device_, &info, nullptr, &textureSampler_) != VK_SUCCESS) return false;

    // HDR image is resampled to the swapchain size when the pixel ratio differs
    info.magFilter = VK_FILTER_LINEAR;
    info.anisotropyEnable = VK_FALSE;
    info.maxAnisotropy = 1.0f;
    return vkCreateSampler(device_, &info, nullptr, &presentSampler_) == VK_SUCCESS;
}

bool Renderer::createBlankTexture() {
    // 1x1 white stand-in for draws that carry no window texture
    WindowTexture blank;
    blank.width = 1;
    blank.height = 1;
    blank.pixels = { 255, 255, 255, 255 };
    std::vector<const WindowTexture*> sources{ &blank };
    std::vector<GpuTexture> targets(1);
    if (!uploadTexturePixels(sources, targets)) {
        destroyTexture(targets[0]);
        return false;
    }
    blankTexture_ = targets[0];
    return true;
}

bool Renderer::createCommandPoolAndBuffers() {
    VkCommandPoolCreateInfo pci{ VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO };
    pci.queueFamilyIndex = graphicsQueueFamily_;
    pci.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    if (vkCreateCommandPool(device_, &pci, nullptr, &commandPool_) != VK_SUCCESS) return false;
    commandBuffers_.resize(framebuffers_.size());
    VkCommandBufferAllocateInfo ai{ VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO };
    ai.commandPool = commandPool_; ai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY; ai.commandBufferCount = (uint32_t)commandBuffers_.size();
    return vkAllocateCommandBuffers(device_, &ai, commandBuffers_.data()) == VK_SUCCESS;
}

bool Renderer::createSyncObjects() {
    VkSemaphoreCreateInfo si{ VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO };
    VkFenceCreateInfo fi{ VK_STRUCTURE_TYPE_FENCE_CREATE_INFO }; fi.flags = VK_FENCE_CREATE_SIGNALED_BIT;
    return vkCreateSemaphore(device_, &si, nullptr, &imageAvailableSemaphore_) == VK_SUCCESS &&
           vkCreateSemaphore(device_, &si, nullptr, &renderFinishedSemaphore_) == VK_SUCCESS &&
           vkCreateFence(device_, &fi, nullptr, &inFlightFence_) == VK_SUCCESS;
}

}
