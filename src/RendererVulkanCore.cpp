#include "Renderer.hpp"
#define GLFW_INCLUDE_NONE
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <vulkan/vulkan.h>
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <vector>

namespace skyline {

namespace {

// Upper bound for facade sampling; street-level views hit the towers at grazing angles
const float kMaxFacadeAnisotropy = 8.0f;

struct QueueFamilies {
    uint32_t graphics = UINT32_MAX;
    uint32_t present = UINT32_MAX;
    bool complete() const { return graphics != UINT32_MAX && present != UINT32_MAX; }
};

QueueFamilies findQueueFamilies(VkPhysicalDevice device, VkSurfaceKHR surface) {
    uint32_t count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(device, &count, nullptr);
    std::vector<VkQueueFamilyProperties> families(count);
    vkGetPhysicalDeviceQueueFamilyProperties(device, &count, families.data());

    QueueFamilies found;
    for (uint32_t i = 0; i < count; ++i) {
        VkBool32 presentSupport = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(device, i, surface, &presentSupport);
        const bool graphics = (families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0;

        // One family doing both is the common case and avoids concurrent sharing
        if (graphics && presentSupport) {
            found.graphics = found.present = i;
            return found;
        }
        if (graphics && found.graphics == UINT32_MAX) found.graphics = i;
        if (presentSupport && found.present == UINT32_MAX) found.present = i;
    }
    return found;
}

bool hasSwapchainSupport(VkPhysicalDevice device, VkSurfaceKHR surface) {
    uint32_t extCount = 0;
    vkEnumerateDeviceExtensionProperties(device, nullptr, &extCount, nullptr);
    std::vector<VkExtensionProperties> extensions(extCount);
    vkEnumerateDeviceExtensionProperties(device, nullptr, &extCount, extensions.data());
    bool swapchain = false;
    for (const auto& ext : extensions) {
        if (std::strcmp(ext.extensionName, VK_KHR_SWAPCHAIN_EXTENSION_NAME) == 0) swapchain = true;
    }
    if (!swapchain) return false;

    uint32_t formatCount = 0, modeCount = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(device, surface, &formatCount, nullptr);
    vkGetPhysicalDeviceSurfacePresentModesKHR(device, surface, &modeCount, nullptr);
    return formatCount > 0 && modeCount > 0;
}

int deviceScore(const VkPhysicalDeviceProperties& props) {
    switch (props.deviceType) {
        case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU: return 3;
        case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU: return 2;
        case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU: return 1;
        default: return 0;
    }
}

} // namespace

bool Renderer::createInstance() {
    VkApplicationInfo app{ VK_STRUCTURE_TYPE_APPLICATION_INFO };
    app.pApplicationName = "Skyline";
    app.applicationVersion = VK_MAKE_VERSION(1, 0, 0);
    app.pEngineName = "skyline";
    app.apiVersion = VK_API_VERSION_1_2;

    uint32_t extCount = 0;
    const char** required = glfwGetRequiredInstanceExtensions(&extCount);
    if (!required) {
        fprintf(stderr, "No Vulkan surface extensions available\n");
        return false;
    }
    std::vector<const char*> extensions(required, required + extCount);
#if defined(__APPLE__)
    extensions.push_back("VK_KHR_portability_enumeration");
#endif

    VkInstanceCreateInfo ci{ VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO };
    ci.pApplicationInfo = &app;
    ci.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
    ci.ppEnabledExtensionNames = extensions.data();
#if defined(__APPLE__)
    ci.flags |= VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR;
#endif
    VkResult result = vkCreateInstance(&ci, nullptr, &instance_);
    if (result != VK_SUCCESS) {
        fprintf(stderr, "vkCreateInstance failed (%d)\n", static_cast<int>(result));
        return false;
    }
    return true;
}

bool Renderer::createSurface() {
    return glfwCreateWindowSurface(instance_, window_, nullptr, &surface_) == VK_SUCCESS;
}

bool Renderer::pickPhysicalDevice() {
    uint32_t count = 0;
    vkEnumeratePhysicalDevices(instance_, &count, nullptr);
    if (count == 0) {
        fprintf(stderr, "No Vulkan devices found\n");
        return false;
    }
    std::vector<VkPhysicalDevice> devices(count);
    vkEnumeratePhysicalDevices(instance_, &count, devices.data());

    int bestScore = -1;
    for (VkPhysicalDevice device : devices) {
        QueueFamilies families = findQueueFamilies(device, surface_);
        if (!families.complete() || !hasSwapchainSupport(device, surface_)) continue;

        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties(device, &props);
        int score = deviceScore(props);
        if (score > bestScore) {
            bestScore = score;
            physicalDevice_ = device;
            graphicsQueueFamily_ = families.graphics;
            presentQueueFamily_ = families.present;
        }
    }
    if (physicalDevice_ == VK_NULL_HANDLE) {
        fprintf(stderr, "No Vulkan device can present to this window\n");
        return false;
    }

    VkPhysicalDeviceProperties props;
    vkGetPhysicalDeviceProperties(physicalDevice_, &props);
    VkPhysicalDeviceFeatures features;
    vkGetPhysicalDeviceFeatures(physicalDevice_, &features);
    facadeAnisotropy_ = features.samplerAnisotropy
        ? std::min(kMaxFacadeAnisotropy, props.limits.maxSamplerAnisotropy)
        : 1.0f;

    printf("GPU: %s (anisotropy %.0fx)\n", props.deviceName, facadeAnisotropy_);
    return true;
}

bool Renderer::createDevice() {
    float priority = 1.0f;
    std::vector<VkDeviceQueueCreateInfo> queues;
    const uint32_t families[] = { graphicsQueueFamily_, presentQueueFamily_ };
    const uint32_t familyCount = graphicsQueueFamily_ == presentQueueFamily_ ? 1 : 2;
    for (uint32_t i = 0; i < familyCount; ++i) {
        VkDeviceQueueCreateInfo q{ VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO };
        q.queueFamilyIndex = families[i];
        q.queueCount = 1;
        q.pQueuePriorities = &priority;
        queues.push_back(q);
    }

    VkPhysicalDeviceFeatures enabled{};
    enabled.samplerAnisotropy = facadeAnisotropy_ > 1.0f ? VK_TRUE : VK_FALSE;

    std::vector<const char*> exts = { VK_KHR_SWAPCHAIN_EXTENSION_NAME };
#if defined(__APPLE__)
    exts.push_back("VK_KHR_portability_subset");
#endif
    VkDeviceCreateInfo ci{ VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO };
    ci.queueCreateInfoCount = static_cast<uint32_t>(queues.size());
    ci.pQueueCreateInfos = queues.data();
    ci.pEnabledFeatures = &enabled;
    ci.enabledExtensionCount = static_cast<uint32_t>(exts.size());
    ci.ppEnabledExtensionNames = exts.data();
    if (vkCreateDevice(physicalDevice_, &ci, nullptr, &device_) != VK_SUCCESS) return false;

    vkGetDeviceQueue(device_, graphicsQueueFamily_, 0, &graphicsQueue_);
    vkGetDeviceQueue(device_, presentQueueFamily_, 0, &presentQueue_);
    return true;
}

uint32_t Renderer::findMemoryType(uint32_t typeFilter, VkMemoryPropertyFlags properties) {
    VkPhysicalDeviceMemoryProperties memProps;
    vkGetPhysicalDeviceMemoryProperties(physicalDevice_, &memProps);
    for (uint32_t i = 0; i < memProps.memoryTypeCount; ++i) {
        if ((typeFilter & (1u << i)) && (memProps.memoryTypes[i].propertyFlags & properties) == properties) {
            return i;
        }
    }
    return UINT32_MAX;
}

// First depth format usable as an optimal-tiling attachment
VkFormat Renderer::findDepthFormat() {
    const VkFormat candidates[] = { VK_FORMAT_D32_SFLOAT, VK_FORMAT_D32_SFLOAT_S8_UINT, VK_FORMAT_D24_UNORM_S8_UINT };
    for (VkFormat format : candidates) {
        VkFormatProperties props;
        vkGetPhysicalDeviceFormatProperties(physicalDevice_, format, &props);
        if (props.optimalTilingFeatures & VK_FORMAT_FEATURE_DEPTH_STENCIL_ATTACHMENT_BIT) {
            return format;
        }
    }
    return VK_FORMAT_UNDEFINED;
}

}
