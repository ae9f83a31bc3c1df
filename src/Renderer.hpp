#pragma once

#include "RenderBackend.hpp"
#include "SceneConfig.hpp"

#include <vulkan/vulkan.h>
#include <vector>
#include <string>
#include <cstdint>
#include <glm/glm.hpp>

struct GLFWwindow;

namespace skyline {

struct ChunkMesh;
struct WindowTexture;

// std140 layout, mirrored by shaders/scene_common.glsl
struct UniformBufferObject {
    float view[16];
    float proj[16];
    float invViewProj[16];
    float cameraPos[4];
    float fogColorDensity[4];
    float ambient[4];
    float sunColor[4];
    float sunDirection[4];
    float hemisphereSky[4];
    float hemisphereGround[4];   // a = emissive intensity
    float skyTop[4];             // a = sky offset
    float skyMiddle[4];          // a = sky exponent
    float skyBottom[4];          // a = sun glow intensity
    float sunGlowColor[4];
    float sunGlowDirection[4];
    float beaconColor[4];
};

struct ChunkPushConstants {
    float offset[4];
};

struct PresentPushConstants {
    float exposure;
    float encodeGamma;
};

// Vulkan back end. Renders sky, city and beacons into an HDR target sized
// to the logical window size times the pixel ratio, then tone maps into
// the swapchain.
class Renderer : public RenderBackend {
public:
    explicit Renderer(GLFWwindow* window);
    ~Renderer() override;

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    bool initialize(const SceneConfig& config, int width, int height, float pixelRatio) override;
    bool uploadChunk(const Chunk& chunk) override;
    void resize(int width, int height, float pixelRatio) override;
    void setPixelRatio(float pixelRatio) override;
    void drawFrame(const FrameState& frame) override;
    void shutdown() override;

    void waitIdle();

    VkExtent2D getRenderExtent() const { return renderExtent_; }

private:
    struct BufferWithMemory {
        VkBuffer buffer = VK_NULL_HANDLE;
        VkDeviceMemory memory = VK_NULL_HANDLE;
        void* mapped = nullptr;
    };

    struct GpuTexture {
        VkImage image = VK_NULL_HANDLE;
        VkDeviceMemory memory = VK_NULL_HANDLE;
        VkImageView view = VK_NULL_HANDLE;
        VkDescriptorSet descriptorSet = VK_NULL_HANDLE;
    };

    struct MeshDraw {
        uint32_t firstIndex = 0;
        uint32_t indexCount = 0;
        uint32_t textureIndex = 0;
    };

    // GPU copy of one chunk, created once and placed by push constant
    struct ChunkGpu {
        int slot = 0;
        BufferWithMemory vertexBuffer;
        BufferWithMemory indexBuffer;
        std::vector<MeshDraw> facadeDraws;
        MeshDraw plainDraw;
        MeshDraw beaconDraw;
        std::vector<GpuTexture> textures;
        VkDescriptorPool descriptorPool = VK_NULL_HANDLE;
    };

    // Vulkan core
    bool createInstance();
    bool createSurface();
    bool pickPhysicalDevice();
    bool createDevice();
    uint32_t findMemoryType(uint32_t typeFilter, VkMemoryPropertyFlags properties);
    VkFormat findDepthFormat();

    // Swapchain
    bool createSwapchain();
    bool createImageViews();
    bool createFramebuffers();
    void cleanupSwapchain();
    bool recreateSwapchain();

    // Render target (HDR color + depth at logical size * pixel ratio)
    bool createRenderPasses();
    bool createRenderTarget();
    void destroyRenderTarget();
    bool rebuildRenderTarget();

    // Pipelines
    bool createDescriptorSetLayouts();
    bool createPipelineLayouts();
    bool createSkyPipeline();
    bool createCityPipelines();
    bool createPresentPipeline();
    VkShaderModule loadShader(const std::string& name);

    // Resources
    bool createBuffer(BufferWithMemory& buffer, VkDeviceSize size, VkBufferUsageFlags usage,
                      VkMemoryPropertyFlags properties, bool map = false);
    void destroyBuffer(BufferWithMemory& buffer);
    bool uploadToBuffer(BufferWithMemory& buffer, const void* data, VkDeviceSize size, VkBufferUsageFlags usage);
    bool createImage(uint32_t width, uint32_t height, VkFormat format, VkImageUsageFlags usage,
                     VkImage& image, VkDeviceMemory& memory);
    bool createImageView(VkImage image, VkFormat format, VkImageAspectFlags aspect, VkImageView& view);
    bool createFullscreenQuad();
    bool createUniformBuffers();
    bool createDescriptorPoolAndSets();
    bool createSamplers();
    bool createBlankTexture();
    bool createCommandPoolAndBuffers();
    bool createSyncObjects();
    void updatePresentDescriptor();

    // Chunk geometry and window textures
    bool createChunkBuffers(ChunkGpu& gpu, const ChunkMesh& mesh);
    bool createChunkTextures(ChunkGpu& gpu, const Chunk& chunk);
    bool uploadTexturePixels(const std::vector<const WindowTexture*>& sources, std::vector<GpuTexture>& targets);
    bool allocateTextureSets(ChunkGpu& gpu);
    void destroyChunk(ChunkGpu& gpu);
    void destroyTexture(GpuTexture& texture);

    void updateUniforms(const FrameState& frame);
    void recordCommandBuffer(VkCommandBuffer cmd, uint32_t imageIndex, const FrameState& frame);
    void drawChunk(VkCommandBuffer cmd, const ChunkGpu& gpu, float offset, bool beacons);

private:
    GLFWwindow* window_ = nullptr;
    SceneConfig config_;

    VkInstance instance_ = VK_NULL_HANDLE;
    VkSurfaceKHR surface_ = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice_ = VK_NULL_HANDLE;
    VkDevice device_ = VK_NULL_HANDLE;
    VkQueue graphicsQueue_ = VK_NULL_HANDLE;
    VkQueue presentQueue_ = VK_NULL_HANDLE;
    uint32_t graphicsQueueFamily_ = 0;
    uint32_t presentQueueFamily_ = 0;
    float facadeAnisotropy_ = 1.0f;

    VkSwapchainKHR swapchain_ = VK_NULL_HANDLE;
    VkFormat swapchainFormat_ = VK_FORMAT_B8G8R8A8_UNORM;
    bool swapchainIsSrgb_ = false;
    VkExtent2D swapchainExtent_ {0, 0};
    std::vector<VkImage> swapchainImages_;
    std::vector<VkImageView> swapchainImageViews_;
    std::vector<VkFramebuffer> framebuffers_;

    // Present pass writes the swapchain; the HDR pass writes the offscreen target
    VkRenderPass renderPass_ = VK_NULL_HANDLE;
    VkRenderPass hdrRenderPass_ = VK_NULL_HANDLE;
    VkFormat depthFormat_ = VK_FORMAT_UNDEFINED;

    VkImage hdrColorImage_ = VK_NULL_HANDLE;
    VkDeviceMemory hdrColorMemory_ = VK_NULL_HANDLE;
    VkImageView hdrColorView_ = VK_NULL_HANDLE;
    VkImage depthImage_ = VK_NULL_HANDLE;
    VkDeviceMemory depthImageMemory_ = VK_NULL_HANDLE;
    VkImageView depthImageView_ = VK_NULL_HANDLE;
    VkFramebuffer hdrFramebuffer_ = VK_NULL_HANDLE;
    VkExtent2D renderExtent_ {0, 0};
    bool renderTargetDirty_ = false;
    bool swapchainDirty_ = false;

    VkDescriptorSetLayout frameSetLayout_ = VK_NULL_HANDLE;     // UBO
    VkDescriptorSetLayout textureSetLayout_ = VK_NULL_HANDLE;   // Window texture / HDR image
    VkPipelineLayout skyLayout_ = VK_NULL_HANDLE;
    VkPipelineLayout cityLayout_ = VK_NULL_HANDLE;
    VkPipelineLayout presentLayout_ = VK_NULL_HANDLE;
    VkPipeline skyPipeline_ = VK_NULL_HANDLE;
    VkPipeline cityPipeline_ = VK_NULL_HANDLE;
    VkPipeline beaconPipeline_ = VK_NULL_HANDLE;
    VkPipeline presentPipeline_ = VK_NULL_HANDLE;

    VkCommandPool commandPool_ = VK_NULL_HANDLE;
    std::vector<VkCommandBuffer> commandBuffers_;
    VkSemaphore imageAvailableSemaphore_ = VK_NULL_HANDLE;
    VkSemaphore renderFinishedSemaphore_ = VK_NULL_HANDLE;
    VkFence inFlightFence_ = VK_NULL_HANDLE;

    BufferWithMemory fullscreenQuad_;
    BufferWithMemory uniformBuffer_;
    VkDescriptorPool descriptorPool_ = VK_NULL_HANDLE;
    VkDescriptorSet frameDescriptorSet_ = VK_NULL_HANDLE;
    VkDescriptorSet presentDescriptorSet_ = VK_NULL_HANDLE;
    VkSampler textureSampler_ = VK_NULL_HANDLE;
    VkSampler presentSampler_ = VK_NULL_HANDLE;
    GpuTexture blankTexture_;

    std::vector<ChunkGpu> chunks_;

    int logicalWidth_ = 0;
    int logicalHeight_ = 0;
    float pixelRatio_ = 1.0f;
};

}
