#include "Renderer.hpp"
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <vulkan/vulkan.h>
#include <algorithm>
#include <cstdio>
#include <vector>

namespace skyline {

bool Renderer::createSwapchain() {
    VkSurfaceCapabilitiesKHR caps{}; vkGetPhysicalDeviceSurfaceCapabilitiesKHR(physicalDevice_, surface_, &caps);
    uint32_t fmtCount=0; vkGetPhysicalDeviceSurfaceFormatsKHR(physicalDevice_, surface_, &fmtCount, nullptr);
    if (!fmtCount) return false;
    std::vector<VkSurfaceFormatKHR> fmts(fmtCount); vkGetPhysicalDeviceSurfaceFormatsKHR(physicalDevice_, surface_, &fmtCount, fmts.data());

    // An sRGB surface encodes for us; otherwise the present shader applies gamma
    VkSurfaceFormatKHR fmt = fmts[0];
    for (const auto& candidate : fmts) {
        if (candidate.format == VK_FORMAT_B8G8R8A8_SRGB && candidate.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) {
            fmt = candidate;
            break;
        }
    }
    swapchainFormat_ = fmt.format;
    swapchainIsSrgb_ = fmt.format == VK_FORMAT_B8G8R8A8_SRGB || fmt.format == VK_FORMAT_R8G8B8A8_SRGB;

    if (caps.currentExtent.width != UINT32_MAX) {
        swapchainExtent_ = caps.currentExtent;
    } else {
        int fbWidth = 0, fbHeight = 0;
        glfwGetFramebufferSize(window_, &fbWidth, &fbHeight);
        swapchainExtent_.width = std::max(caps.minImageExtent.width, std::min(caps.maxImageExtent.width, (uint32_t)std::max(fbWidth, 0)));
        swapchainExtent_.height = std::max(caps.minImageExtent.height, std::min(caps.maxImageExtent.height, (uint32_t)std::max(fbHeight, 0)));
    }
    // Minimized: nothing to present into until the window comes back
    if (swapchainExtent_.width == 0 || swapchainExtent_.height == 0) return false;

    uint32_t imageCount = caps.minImageCount + 1; if (caps.maxImageCount && imageCount > caps.maxImageCount) imageCount = caps.maxImageCount;
    VkSwapchainCreateInfoKHR ci{ VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR };
    ci.surface = surface_;
    ci.minImageCount = imageCount;
    ci.imageFormat = fmt.format;
    ci.imageColorSpace = fmt.colorSpace;
    ci.imageExtent = swapchainExtent_;
    ci.imageArrayLayers = 1;
    ci.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    const uint32_t queueFamilies[] = { graphicsQueueFamily_, presentQueueFamily_ };
    if (graphicsQueueFamily_ != presentQueueFamily_) {
        ci.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
        ci.queueFamilyIndexCount = 2;
        ci.pQueueFamilyIndices = queueFamilies;
    } else {
        ci.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    }
    ci.preTransform = caps.currentTransform;
    ci.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    ci.presentMode = VK_PRESENT_MODE_FIFO_KHR;
    ci.clipped = VK_TRUE;
    ci.oldSwapchain = VK_NULL_HANDLE;
    if (vkCreateSwapchainKHR(device_, &ci, nullptr, &swapchain_) != VK_SUCCESS) return false;
    uint32_t count = 0; vkGetSwapchainImagesKHR(device_, swapchain_, &count, nullptr);
    swapchainImages_.resize(count); vkGetSwapchainImagesKHR(device_, swapchain_, &count, swapchainImages_.data());
    return true;
}

bool Renderer::createImageViews() {
    swapchainImageViews_.assign(swapchainImages_.size(), VK_NULL_HANDLE);
    for (size_t i = 0; i < swapchainImages_.size(); ++i) {
        if (!createImageView(swapchainImages_[i], swapchainFormat_, VK_IMAGE_ASPECT_COLOR_BIT, swapchainImageViews_[i])) {
            return false;
        }
    }
    return true;
}

bool Renderer::createFramebuffers() {
    framebuffers_.assign(swapchainImageViews_.size(), VK_NULL_HANDLE);
    for (size_t i = 0; i < swapchainImageViews_.size(); ++i) {
        VkFramebufferCreateInfo ci{ VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO };
        ci.renderPass = renderPass_;
        ci.attachmentCount = 1; ci.pAttachments = &swapchainImageViews_[i];
        ci.width = swapchainExtent_.width; ci.height = swapchainExtent_.height; ci.layers = 1;
        if (vkCreateFramebuffer(device_, &ci, nullptr, &framebuffers_[i]) != VK_SUCCESS) return false;
    }
    return true;
}

void Renderer::cleanupSwapchain() {
    for (auto fb : framebuffers_) if (fb) vkDestroyFramebuffer(device_, fb, nullptr);
    framebuffers_.clear();
    for (auto iv : swapchainImageViews_) if (iv) vkDestroyImageView(device_, iv, nullptr);
    swapchainImageViews_.clear();
    swapchainImages_.clear();
    if (swapchain_) vkDestroySwapchainKHR(device_, swapchain_, nullptr);
    swapchain_ = VK_NULL_HANDLE;
}

bool Renderer::recreateSwapchain() {
    vkDeviceWaitIdle(device_);

    cleanupSwapchain();
    if (!createSwapchain()) return false;
    if (!createImageViews()) return false;
    if (!createFramebuffers()) return false;

    // One command buffer per swapchain image
    if (commandBuffers_.size() != framebuffers_.size()) {
        if (!commandBuffers_.empty()) {
            vkFreeCommandBuffers(device_, commandPool_, (uint32_t)commandBuffers_.size(), commandBuffers_.data());
        }
        commandBuffers_.resize(framebuffers_.size());
        VkCommandBufferAllocateInfo ai{ VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO };
        ai.commandPool = commandPool_; ai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY; ai.commandBufferCount = (uint32_t)commandBuffers_.size();
        if (vkAllocateCommandBuffers(device_, &ai, commandBuffers_.data()) != VK_SUCCESS) {
            commandBuffers_.clear();
            return false;
        }
    }

    swapchainDirty_ = false;
    printf("Swapchain %ux%u\n", swapchainExtent_.width, swapchainExtent_.height);
    return true;
}

}
