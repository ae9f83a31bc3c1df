#include "Renderer.hpp"

#define GLFW_INCLUDE_NONE
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <vulkan/vulkan.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <vector>
#include <glm/glm.hpp>

namespace skyline {

namespace {

// Maps OpenGL clip space (y up, z in [-w, w]) onto Vulkan's (y down, z in [0, w])
const glm::mat4 kClipCorrection(
    1.0f,  0.0f, 0.0f, 0.0f,
    0.0f, -1.0f, 0.0f, 0.0f,
    0.0f,  0.0f, 0.5f, 0.0f,
    0.0f,  0.0f, 0.5f, 1.0f);

void copyVec4(float* dst, const glm::vec3& v, float w) {
    dst[0] = v.x; dst[1] = v.y; dst[2] = v.z; dst[3] = w;
}

glm::vec3 safeNormalize(const glm::vec3& v) {
    float len = glm::length(v);
    return len > 0.0f ? v / len : glm::vec3(0.0f, 1.0f, 0.0f);
}

} // namespace

Renderer::Renderer(GLFWwindow* window)
    : window_(window)
{
}

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::initialize(const SceneConfig& config, int width, int height, float pixelRatio) {
    config_ = config;
    logicalWidth_ = width;
    logicalHeight_ = height;
    pixelRatio_ = pixelRatio;

    if (!window_ || !glfwVulkanSupported()) {
        fprintf(stderr, "Vulkan is not available\n");
        return false;
    }

    if (!createInstance()) return false;
    if (!createSurface()) return false;
    if (!pickPhysicalDevice()) return false;
    if (!createDevice()) return false;
    if (!createSwapchain()) return false;
    if (!createImageViews()) return false;
    if (!createRenderPasses()) return false;
    if (!createFramebuffers()) return false;
    if (!createCommandPoolAndBuffers()) return false;

    // HDR target before the present descriptor that samples it
    if (!createRenderTarget()) return false;

    if (!createDescriptorSetLayouts()) return false;
    if (!createPipelineLayouts()) return false;
    if (!createSkyPipeline()) return false;
    if (!createCityPipelines()) return false;
    if (!createPresentPipeline()) return false;

    if (!createSamplers()) return false;
    if (!createBlankTexture()) return false;
    if (!createFullscreenQuad()) return false;
    if (!createUniformBuffers()) return false;
    if (!createDescriptorPoolAndSets()) return false;
    if (!createSyncObjects()) return false;

    printf("Renderer: swapchain %ux%u (%s), render target %ux%u\n",
           swapchainExtent_.width, swapchainExtent_.height, swapchainIsSrgb_ ? "sRGB" : "UNORM",
           renderExtent_.width, renderExtent_.height);
    return true;
}

void Renderer::shutdown() {
    if (device_ != VK_NULL_HANDLE) {
        vkDeviceWaitIdle(device_);

        for (auto& chunk : chunks_) destroyChunk(chunk);
        chunks_.clear();

        destroyTexture(blankTexture_);
        destroyBuffer(fullscreenQuad_);
        destroyBuffer(uniformBuffer_);
        if (descriptorPool_) vkDestroyDescriptorPool(device_, descriptorPool_, nullptr);
        descriptorPool_ = VK_NULL_HANDLE;
        frameDescriptorSet_ = VK_NULL_HANDLE;
        presentDescriptorSet_ = VK_NULL_HANDLE;
        if (textureSampler_) vkDestroySampler(device_, textureSampler_, nullptr);
        textureSampler_ = VK_NULL_HANDLE;
        if (presentSampler_) vkDestroySampler(device_, presentSampler_, nullptr);
        presentSampler_ = VK_NULL_HANDLE;

        VkPipeline pipelines[] = { skyPipeline_, cityPipeline_, beaconPipeline_, presentPipeline_ };
        for (VkPipeline p : pipelines) if (p) vkDestroyPipeline(device_, p, nullptr);
        skyPipeline_ = cityPipeline_ = beaconPipeline_ = presentPipeline_ = VK_NULL_HANDLE;
        VkPipelineLayout layouts[] = { skyLayout_, cityLayout_, presentLayout_ };
        for (VkPipelineLayout l : layouts) if (l) vkDestroyPipelineLayout(device_, l, nullptr);
        skyLayout_ = cityLayout_ = presentLayout_ = VK_NULL_HANDLE;
        if (frameSetLayout_) vkDestroyDescriptorSetLayout(device_, frameSetLayout_, nullptr);
        frameSetLayout_ = VK_NULL_HANDLE;
        if (textureSetLayout_) vkDestroyDescriptorSetLayout(device_, textureSetLayout_, nullptr);
        textureSetLayout_ = VK_NULL_HANDLE;

        destroyRenderTarget();
        cleanupSwapchain();
        if (hdrRenderPass_) vkDestroyRenderPass(device_, hdrRenderPass_, nullptr);
        hdrRenderPass_ = VK_NULL_HANDLE;
        if (renderPass_) vkDestroyRenderPass(device_, renderPass_, nullptr);
        renderPass_ = VK_NULL_HANDLE;

        if (imageAvailableSemaphore_) vkDestroySemaphore(device_, imageAvailableSemaphore_, nullptr);
        imageAvailableSemaphore_ = VK_NULL_HANDLE;
        if (renderFinishedSemaphore_) vkDestroySemaphore(device_, renderFinishedSemaphore_, nullptr);
        renderFinishedSemaphore_ = VK_NULL_HANDLE;
        if (inFlightFence_) vkDestroyFence(device_, inFlightFence_, nullptr);
        inFlightFence_ = VK_NULL_HANDLE;
        if (commandPool_) vkDestroyCommandPool(device_, commandPool_, nullptr);
        commandPool_ = VK_NULL_HANDLE;
        commandBuffers_.clear();

        vkDestroyDevice(device_, nullptr);
        device_ = VK_NULL_HANDLE;
    }
    if (surface_) {
        vkDestroySurfaceKHR(instance_, surface_, nullptr);
        surface_ = VK_NULL_HANDLE;
    }
    if (instance_) {
        vkDestroyInstance(instance_, nullptr);
        instance_ = VK_NULL_HANDLE;
    }
    physicalDevice_ = VK_NULL_HANDLE;
    graphicsQueue_ = presentQueue_ = VK_NULL_HANDLE;
}

void Renderer::waitIdle() {
    if (device_) vkDeviceWaitIdle(device_);
}

void Renderer::resize(int width, int height, float pixelRatio) {
    logicalWidth_ = width;
    logicalHeight_ = height;
    pixelRatio_ = pixelRatio;
    renderTargetDirty_ = true;
    swapchainDirty_ = true;
}

void Renderer::setPixelRatio(float pixelRatio) {
    if (pixelRatio == pixelRatio_) return;
    pixelRatio_ = pixelRatio;
    renderTargetDirty_ = true;
}

bool Renderer::createRenderTarget() {
    // Drawing buffer is the logical size scaled by the pixel ratio
    renderExtent_.width = (uint32_t)std::max(1L, std::lround(logicalWidth_ * pixelRatio_));
    renderExtent_.height = (uint32_t)std::max(1L, std::lround(logicalHeight_ * pixelRatio_));

    if (!createImage(renderExtent_.width, renderExtent_.height, VK_FORMAT_R16G16B16A16_SFLOAT,
                     VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_SAMPLED_BIT,
                     hdrColorImage_, hdrColorMemory_)) return false;
    if (!createImageView(hdrColorImage_, VK_FORMAT_R16G16B16A16_SFLOAT, VK_IMAGE_ASPECT_COLOR_BIT, hdrColorView_)) return false;

    if (!createImage(renderExtent_.width, renderExtent_.height, depthFormat_,
                     VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT, depthImage_, depthImageMemory_)) return false;
    VkImageAspectFlags depthAspect = VK_IMAGE_ASPECT_DEPTH_BIT;
    if (depthFormat_ == VK_FORMAT_D32_SFLOAT_S8_UINT || depthFormat_ == VK_FORMAT_D24_UNORM_S8_UINT) {
        depthAspect |= VK_IMAGE_ASPECT_STENCIL_BIT;
    }
    if (!createImageView(depthImage_, depthFormat_, depthAspect, depthImageView_)) return false;

    std::array<VkImageView, 2> attachments{ hdrColorView_, depthImageView_ };
    VkFramebufferCreateInfo fbInfo{ VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO };
    fbInfo.renderPass = hdrRenderPass_;
    fbInfo.attachmentCount = (uint32_t)attachments.size();
    fbInfo.pAttachments = attachments.data();
    fbInfo.width = renderExtent_.width;
    fbInfo.height = renderExtent_.height;
    fbInfo.layers = 1;
    return vkCreateFramebuffer(device_, &fbInfo, nullptr, &hdrFramebuffer_) == VK_SUCCESS;
}

void Renderer::destroyRenderTarget() {
    if (hdrFramebuffer_) vkDestroyFramebuffer(device_, hdrFramebuffer_, nullptr);
    hdrFramebuffer_ = VK_NULL_HANDLE;
    if (hdrColorView_) vkDestroyImageView(device_, hdrColorView_, nullptr);
    hdrColorView_ = VK_NULL_HANDLE;
    if (hdrColorImage_) vkDestroyImage(device_, hdrColorImage_, nullptr);
    hdrColorImage_ = VK_NULL_HANDLE;
    if (hdrColorMemory_) vkFreeMemory(device_, hdrColorMemory_, nullptr);
    hdrColorMemory_ = VK_NULL_HANDLE;
    if (depthImageView_) vkDestroyImageView(device_, depthImageView_, nullptr);
    depthImageView_ = VK_NULL_HANDLE;
    if (depthImage_) vkDestroyImage(device_, depthImage_, nullptr);
    depthImage_ = VK_NULL_HANDLE;
    if (depthImageMemory_) vkFreeMemory(device_, depthImageMemory_, nullptr);
    depthImageMemory_ = VK_NULL_HANDLE;
}

bool Renderer::rebuildRenderTarget() {
    vkDeviceWaitIdle(device_);
    destroyRenderTarget();
    if (!createRenderTarget()) {
        destroyRenderTarget();
        return false;
    }
    updatePresentDescriptor();
    renderTargetDirty_ = false;
    printf("Render target %ux%u (pixel ratio %.2f)\n", renderExtent_.width, renderExtent_.height, pixelRatio_);
    return true;
}

void Renderer::updateUniforms(const FrameState& frame) {
    UniformBufferObject ubo{};

    glm::mat4 proj = kClipCorrection * frame.projection;
    glm::mat4 invViewProj = glm::inverse(proj * frame.view);
    std::memcpy(ubo.view, &frame.view[0][0], sizeof(float) * 16);
    std::memcpy(ubo.proj, &proj[0][0], sizeof(float) * 16);
    std::memcpy(ubo.invViewProj, &invViewProj[0][0], sizeof(float) * 16);

    copyVec4(ubo.cameraPos, frame.cameraPosition, 1.0f);
    copyVec4(ubo.fogColorDensity, frame.fog.color, frame.fog.enabled ? frame.fog.density : 0.0f);

    const LightRig& lights = frame.lights;
    copyVec4(ubo.ambient, lights.ambientColor, lights.ambientIntensity);
    copyVec4(ubo.sunColor, lights.sunColor, lights.sunIntensity);
    copyVec4(ubo.sunDirection, lights.sunDirection, 0.0f);
    copyVec4(ubo.hemisphereSky, lights.hemisphereSkyColor, lights.hemisphereIntensity);
    copyVec4(ubo.hemisphereGround, lights.hemisphereGroundColor, config_.emissiveIntensity);

    copyVec4(ubo.skyTop, config_.skyTopColor, config_.skyOffset);
    copyVec4(ubo.skyMiddle, config_.skyMiddleColor, config_.skyExponent);
    copyVec4(ubo.skyBottom, config_.skyBottomColor, config_.sunGlowIntensity);
    copyVec4(ubo.sunGlowColor, config_.sunGlowColor, 0.0f);
    copyVec4(ubo.sunGlowDirection, safeNormalize(config_.sunGlowPosition), 0.0f);
    copyVec4(ubo.beaconColor, config_.beaconColor, 0.0f);

    std::memcpy(uniformBuffer_.mapped, &ubo, sizeof(ubo));
}

void Renderer::drawFrame(const FrameState& frame) {
    if (!device_) return;

    if (swapchainDirty_ && !recreateSwapchain()) {
        return;  // Minimized; retry next frame
    }
    if (renderTargetDirty_ && !rebuildRenderTarget()) {
        fprintf(stderr, "Failed to rebuild render target, skipping frame\n");
        return;
    }

    vkWaitForFences(device_, 1, &inFlightFence_, VK_TRUE, UINT64_MAX);

    uint32_t imageIndex = 0;
    VkResult acquireRes = vkAcquireNextImageKHR(device_, swapchain_, UINT64_MAX, imageAvailableSemaphore_, VK_NULL_HANDLE, &imageIndex);
    if (acquireRes == VK_ERROR_OUT_OF_DATE_KHR) { swapchainDirty_ = true; return; }
    if (acquireRes != VK_SUCCESS && acquireRes != VK_SUBOPTIMAL_KHR) {
        fprintf(stderr, "Failed to acquire swapchain image (%d)\n", (int)acquireRes);
        return;
    }
    if (imageIndex >= commandBuffers_.size()) return;

    // Only reset once work is certain to be submitted
    vkResetFences(device_, 1, &inFlightFence_);

    updateUniforms(frame);

    vkResetCommandBuffer(commandBuffers_[imageIndex], 0);
    recordCommandBuffer(commandBuffers_[imageIndex], imageIndex, frame);

    VkPipelineStageFlags waitStages[] = { VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT };
    VkSubmitInfo submitInfo{ VK_STRUCTURE_TYPE_SUBMIT_INFO };
    submitInfo.waitSemaphoreCount = 1;
    submitInfo.pWaitSemaphores = &imageAvailableSemaphore_;
    submitInfo.pWaitDstStageMask = waitStages;
    submitInfo.commandBufferCount = 1;
    submitInfo.pCommandBuffers = &commandBuffers_[imageIndex];
    submitInfo.signalSemaphoreCount = 1;
    submitInfo.pSignalSemaphores = &renderFinishedSemaphore_;
    if (vkQueueSubmit(graphicsQueue_, 1, &submitInfo, inFlightFence_) != VK_SUCCESS) {
        fprintf(stderr, "Failed to submit frame %llu\n", (unsigned long long)frame.frameIndex);
        return;
    }

    VkPresentInfoKHR presentInfo{ VK_STRUCTURE_TYPE_PRESENT_INFO_KHR };
    presentInfo.waitSemaphoreCount = 1;
    presentInfo.pWaitSemaphores = &renderFinishedSemaphore_;
    presentInfo.swapchainCount = 1;
    presentInfo.pSwapchains = &swapchain_;
    presentInfo.pImageIndices = &imageIndex;

    VkResult presentRes = vkQueuePresentKHR(presentQueue_, &presentInfo);
    if (presentRes == VK_ERROR_OUT_OF_DATE_KHR || presentRes == VK_SUBOPTIMAL_KHR) {
        swapchainDirty_ = true;
    }
}

void Renderer::recordCommandBuffer(VkCommandBuffer cmd, uint32_t imageIndex, const FrameState& frame) {
    VkCommandBufferBeginInfo bi{ VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO };
    vkBeginCommandBuffer(cmd, &bi);

    // Step 1: sky, city and beacons into the HDR target
    std::array<VkClearValue,2> clears{};
    clears[0].color = { {frame.fog.color.x, frame.fog.color.y, frame.fog.color.z, 1.0f} };
    clears[1].depthStencil = {1.0f, 0};
    VkRenderPassBeginInfo hdrRP{ VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO };
    hdrRP.renderPass = hdrRenderPass_;
    hdrRP.framebuffer = hdrFramebuffer_;
    hdrRP.renderArea.extent = renderExtent_;
    hdrRP.clearValueCount = (uint32_t)clears.size(); hdrRP.pClearValues = clears.data();
    vkCmdBeginRenderPass(cmd, &hdrRP, VK_SUBPASS_CONTENTS_INLINE);

    VkViewport viewport{ 0, 0, (float)renderExtent_.width, (float)renderExtent_.height, 0, 1 };
    VkRect2D scissor{ {0,0}, renderExtent_ };
    vkCmdSetViewport(cmd, 0, 1, &viewport);
    vkCmdSetScissor(cmd, 0, 1, &scissor);

    VkDeviceSize offs = 0;
    vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, skyPipeline_);
    vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, skyLayout_, 0, 1, &frameDescriptorSet_, 0, nullptr);
    vkCmdBindVertexBuffers(cmd, 0, 1, &fullscreenQuad_.buffer, &offs);
    vkCmdDraw(cmd, 4, 1, 0, 0);

    vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, cityPipeline_);
    vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, cityLayout_, 0, 1, &frameDescriptorSet_, 0, nullptr);
    for (const auto& chunk : chunks_) {
        if (chunk.slot < 0 || (size_t)chunk.slot >= frame.chunkOffsets.size()) continue;
        drawChunk(cmd, chunk, frame.chunkOffsets[(size_t)chunk.slot], false);
    }

    vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, beaconPipeline_);
    vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, cityLayout_, 0, 1, &frameDescriptorSet_, 0, nullptr);
    for (const auto& chunk : chunks_) {
        if (chunk.slot < 0 || (size_t)chunk.slot >= frame.chunkOffsets.size()) continue;
        drawChunk(cmd, chunk, frame.chunkOffsets[(size_t)chunk.slot], true);
    }

    vkCmdEndRenderPass(cmd);
    // HDR image is now in SHADER_READ_ONLY_OPTIMAL layout (via render pass finalLayout)

    // Step 2: tone map into the swapchain
    VkRenderPassBeginInfo swapRP{ VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO };
    swapRP.renderPass = renderPass_;
    swapRP.framebuffer = framebuffers_[imageIndex];
    swapRP.renderArea.extent = swapchainExtent_;
    vkCmdBeginRenderPass(cmd, &swapRP, VK_SUBPASS_CONTENTS_INLINE);

    VkViewport presentViewport{ 0, 0, (float)swapchainExtent_.width, (float)swapchainExtent_.height, 0, 1 };
    VkRect2D presentScissor{ {0,0}, swapchainExtent_ };
    vkCmdSetViewport(cmd, 0, 1, &presentViewport);
    vkCmdSetScissor(cmd, 0, 1, &presentScissor);

    PresentPushConstants push{ config_.exposure, swapchainIsSrgb_ ? 0.0f : 1.0f };
    vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, presentPipeline_);
    vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, presentLayout_, 0, 1, &presentDescriptorSet_, 0, nullptr);
    vkCmdPushConstants(cmd, presentLayout_, VK_SHADER_STAGE_FRAGMENT_BIT, 0, sizeof(push), &push);
    vkCmdBindVertexBuffers(cmd, 0, 1, &fullscreenQuad_.buffer, &offs);
    vkCmdDraw(cmd, 4, 1, 0, 0);

    vkCmdEndRenderPass(cmd);

    vkEndCommandBuffer(cmd);
}

}
