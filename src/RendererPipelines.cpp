#include "Renderer.hpp"
#include "ChunkMesh.hpp"
#include <vulkan/vulkan.h>
#include <vector>
#include <array>
#include <string>
#include <cstdio>

namespace skyline {

static std::vector<char> readFile(const std::string& path) {
    FILE* f = fopen(path.c_str(), "rb");
    if (!f) return {};
    fseek(f, 0, SEEK_END); long len = ftell(f); fseek(f, 0, SEEK_SET);
    if (len <= 0) { fclose(f); return {}; }
    std::vector<char> data((size_t)len);
    size_t got = fread(data.data(), 1, data.size(), f); fclose(f);
    if (got != data.size()) return {};
    return data;
}

namespace {

// Fixed-function state shared by every pipeline. Viewport and scissor are
// dynamic so the pipelines survive render target and swapchain resizes.
struct PipelineStates {
    VkPipelineInputAssemblyStateCreateInfo ia{ VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO };
    VkPipelineViewportStateCreateInfo vp{ VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO };
    VkPipelineRasterizationStateCreateInfo rs{ VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO };
    VkPipelineMultisampleStateCreateInfo ms{ VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO };
    VkPipelineDepthStencilStateCreateInfo ds{ VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO };
    VkPipelineColorBlendAttachmentState cbAtt{};
    VkPipelineColorBlendStateCreateInfo cb{ VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO };
    std::array<VkDynamicState, 2> dynamicStates{ VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR };
    VkPipelineDynamicStateCreateInfo dyn{ VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO };

    PipelineStates(VkPrimitiveTopology topology, VkCullModeFlags cull, bool depth) {
        ia.topology = topology;
        vp.viewportCount = 1; vp.scissorCount = 1;
        rs.polygonMode = VK_POLYGON_MODE_FILL; rs.cullMode = cull; rs.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE; rs.lineWidth = 1.0f;
        ms.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;
        ds.depthTestEnable = depth ? VK_TRUE : VK_FALSE;
        ds.depthWriteEnable = depth ? VK_TRUE : VK_FALSE;
        ds.depthCompareOp = VK_COMPARE_OP_LESS;
        cbAtt.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
        cbAtt.blendEnable = VK_FALSE;
        cb.attachmentCount = 1; cb.pAttachments = &cbAtt;
        dyn.dynamicStateCount = (uint32_t)dynamicStates.size(); dyn.pDynamicStates = dynamicStates.data();
    }

    PipelineStates(const PipelineStates&) = delete;
    PipelineStates& operator=(const PipelineStates&) = delete;

    void apply(VkGraphicsPipelineCreateInfo& pci) const {
        pci.pInputAssemblyState = &ia;
        pci.pViewportState = &vp;
        pci.pRasterizationState = &rs;
        pci.pMultisampleState = &ms;
        pci.pDepthStencilState = &ds;
        pci.pColorBlendState = &cb;
        pci.pDynamicState = &dyn;
    }
};

// Fullscreen quad: vec2 position
struct QuadInput {
    VkVertexInputBindingDescription binding{};
    VkVertexInputAttributeDescription attr{};
    VkPipelineVertexInputStateCreateInfo vi{ VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO };

    QuadInput() {
        binding.binding = 0; binding.stride = sizeof(float) * 2; binding.inputRate = VK_VERTEX_INPUT_RATE_VERTEX;
        attr.location = 0; attr.binding = 0; attr.format = VK_FORMAT_R32G32_SFLOAT; attr.offset = 0;
        vi.vertexBindingDescriptionCount = 1; vi.pVertexBindingDescriptions = &binding;
        vi.vertexAttributeDescriptionCount = 1; vi.pVertexAttributeDescriptions = &attr;
    }

    QuadInput(const QuadInput&) = delete;
    QuadInput& operator=(const QuadInput&) = delete;
};

VkPipelineShaderStageCreateInfo shaderStage(VkShaderStageFlagBits stage, VkShaderModule module) {
    VkPipelineShaderStageCreateInfo s{ VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO };
    s.stage = stage; s.module = module; s.pName = "main";
    return s;
}

} // namespace

VkShaderModule Renderer::loadShader(const std::string& name) {
    std::string path = std::string(SKYLINE_SHADER_DIR) + "/" + name + ".spv";
    auto code = readFile(path);
    if (code.empty()) {
        fprintf(stderr, "Missing shader: %s\n", path.c_str());
        return VK_NULL_HANDLE;
    }
    VkShaderModuleCreateInfo ci{ VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO };
    ci.codeSize = code.size();
    ci.pCode = reinterpret_cast<const uint32_t*>(code.data());
    VkShaderModule m = VK_NULL_HANDLE;
    if (vkCreateShaderModule(device_, &ci, nullptr, &m) != VK_SUCCESS) return VK_NULL_HANDLE;
    return m;
}

bool Renderer::createRenderPasses() {
    // Present pass: tone-mapped result into the swapchain image
    VkAttachmentDescription color{};
    color.format = swapchainFormat_;
    color.samples = VK_SAMPLE_COUNT_1_BIT;
    color.loadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    color.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    color.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    color.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    color.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    color.finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

    VkAttachmentReference colorRef{0, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL};

    VkSubpassDescription sub{};
    sub.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    sub.colorAttachmentCount = 1;
    sub.pColorAttachments = &colorRef;

    VkSubpassDependency acquire{};
    acquire.srcSubpass = VK_SUBPASS_EXTERNAL;
    acquire.dstSubpass = 0;
    acquire.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    acquire.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    acquire.srcAccessMask = 0;
    acquire.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

    VkRenderPassCreateInfo ci{ VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO };
    ci.attachmentCount = 1; ci.pAttachments = &color;
    ci.subpassCount = 1; ci.pSubpasses = &sub;
    ci.dependencyCount = 1; ci.pDependencies = &acquire;
    if (vkCreateRenderPass(device_, &ci, nullptr, &renderPass_) != VK_SUCCESS) return false;

    // HDR pass: sky, city and beacons into RGBA16F, left readable for the present pass
    depthFormat_ = findDepthFormat();
    if (depthFormat_ == VK_FORMAT_UNDEFINED) return false;

    VkAttachmentDescription hdrColor{};
    hdrColor.format = VK_FORMAT_R16G16B16A16_SFLOAT;
    hdrColor.samples = VK_SAMPLE_COUNT_1_BIT;
    hdrColor.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
    hdrColor.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    hdrColor.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    hdrColor.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    hdrColor.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;  // Cleared every frame
    hdrColor.finalLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;

    VkAttachmentDescription depth{};
    depth.format = depthFormat_;
    depth.samples = VK_SAMPLE_COUNT_1_BIT;
    depth.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
    depth.storeOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    depth.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    depth.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    depth.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    depth.finalLayout = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;

    VkAttachmentReference hdrColorRef{0, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL};
    VkAttachmentReference depthRef{1, VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL};

    VkSubpassDescription hdrSub{};
    hdrSub.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    hdrSub.colorAttachmentCount = 1;
    hdrSub.pColorAttachments = &hdrColorRef;
    hdrSub.pDepthStencilAttachment = &depthRef;

    // Previous frame's present pass must finish sampling before we overwrite
    std::array<VkSubpassDependency, 2> deps{};
    deps[0].srcSubpass = VK_SUBPASS_EXTERNAL;
    deps[0].dstSubpass = 0;
    deps[0].srcStageMask = VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT;
    deps[0].srcAccessMask = VK_ACCESS_SHADER_READ_BIT;
    deps[0].dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT | VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT | VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT;
    deps[0].dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT | VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_READ_BIT | VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;
    deps[1].srcSubpass = 0;
    deps[1].dstSubpass = VK_SUBPASS_EXTERNAL;
    deps[1].srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    deps[1].srcAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
    deps[1].dstStageMask = VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT;
    deps[1].dstAccessMask = VK_ACCESS_SHADER_READ_BIT;

    std::array<VkAttachmentDescription, 2> atts{ hdrColor, depth };
    VkRenderPassCreateInfo hci{ VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO };
    hci.attachmentCount = (uint32_t)atts.size(); hci.pAttachments = atts.data();
    hci.subpassCount = 1; hci.pSubpasses = &hdrSub;
    hci.dependencyCount = (uint32_t)deps.size(); hci.pDependencies = deps.data();
    return vkCreateRenderPass(device_, &hci, nullptr, &hdrRenderPass_) == VK_SUCCESS;
}

bool Renderer::createDescriptorSetLayouts() {
    VkDescriptorSetLayoutBinding ubo{};
    ubo.binding = 0; ubo.descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER; ubo.descriptorCount = 1;
    ubo.stageFlags = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;
    VkDescriptorSetLayoutCreateInfo ci{ VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO };
    ci.bindingCount = 1; ci.pBindings = &ubo;
    if (vkCreateDescriptorSetLayout(device_, &ci, nullptr, &frameSetLayout_) != VK_SUCCESS) return false;

    // One sampled image: a window texture for the city, the HDR image for present
    VkDescriptorSetLayoutBinding tex{};
    tex.binding = 0; tex.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER; tex.descriptorCount = 1;
    tex.stageFlags = VK_SHADER_STAGE_FRAGMENT_BIT;
    VkDescriptorSetLayoutCreateInfo tci{ VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO };
    tci.bindingCount = 1; tci.pBindings = &tex;
    return vkCreateDescriptorSetLayout(device_, &tci, nullptr, &textureSetLayout_) == VK_SUCCESS;
}

bool Renderer::createPipelineLayouts() {
    VkPipelineLayoutCreateInfo sky{ VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO };
    sky.setLayoutCount = 1; sky.pSetLayouts = &frameSetLayout_;
    if (vkCreatePipelineLayout(device_, &sky, nullptr, &skyLayout_) != VK_SUCCESS) return false;

    VkDescriptorSetLayout citySets[] = { frameSetLayout_, textureSetLayout_ };
    VkPushConstantRange chunkPush{};
    chunkPush.stageFlags = VK_SHADER_STAGE_VERTEX_BIT;
    chunkPush.offset = 0;
    chunkPush.size = sizeof(ChunkPushConstants);
    VkPipelineLayoutCreateInfo city{ VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO };
    city.setLayoutCount = 2; city.pSetLayouts = citySets;
    city.pushConstantRangeCount = 1; city.pPushConstantRanges = &chunkPush;
    if (vkCreatePipelineLayout(device_, &city, nullptr, &cityLayout_) != VK_SUCCESS) return false;

    VkPushConstantRange presentPush{};
    presentPush.stageFlags = VK_SHADER_STAGE_FRAGMENT_BIT;
    presentPush.offset = 0;
    presentPush.size = sizeof(PresentPushConstants);
    VkPipelineLayoutCreateInfo present{ VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO };
    present.setLayoutCount = 1; present.pSetLayouts = &textureSetLayout_;
    present.pushConstantRangeCount = 1; present.pPushConstantRanges = &presentPush;
    return vkCreatePipelineLayout(device_, &present, nullptr, &presentLayout_) == VK_SUCCESS;
}

bool Renderer::createSkyPipeline() {
    VkShaderModule vert = loadShader("sky.vert");
    VkShaderModule frag = loadShader("sky.frag");
    if (!vert || !frag) {
        if (vert) vkDestroyShaderModule(device_, vert, nullptr);
        if (frag) vkDestroyShaderModule(device_, frag, nullptr);
        return false;
    }
    VkPipelineShaderStageCreateInfo stages[2] = {
        shaderStage(VK_SHADER_STAGE_VERTEX_BIT, vert), shaderStage(VK_SHADER_STAGE_FRAGMENT_BIT, frag) };

    // Drawn first at the far plane, never touches depth
    QuadInput input;
    PipelineStates states(VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP, VK_CULL_MODE_NONE, false);

    VkGraphicsPipelineCreateInfo pci{ VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO };
    pci.stageCount = 2; pci.pStages = stages;
    pci.pVertexInputState = &input.vi;
    states.apply(pci);
    pci.layout = skyLayout_;
    pci.renderPass = hdrRenderPass_;
    pci.subpass = 0;
    bool ok = (vkCreateGraphicsPipelines(device_, VK_NULL_HANDLE, 1, &pci, nullptr, &skyPipeline_) == VK_SUCCESS);
    vkDestroyShaderModule(device_, vert, nullptr);
    vkDestroyShaderModule(device_, frag, nullptr);
    return ok;
}

bool Renderer::createCityPipelines() {
    VkShaderModule vert = loadShader("city.vert");
    VkShaderModule frag = loadShader("city.frag");
    VkShaderModule beaconFrag = loadShader("beacon.frag");
    if (!vert || !frag || !beaconFrag) {
        if (vert) vkDestroyShaderModule(device_, vert, nullptr);
        if (frag) vkDestroyShaderModule(device_, frag, nullptr);
        if (beaconFrag) vkDestroyShaderModule(device_, beaconFrag, nullptr);
        return false;
    }

    // Vertex format: position (vec3), color (vec3), uv (vec2), surface (float), normal (vec3) = 12 floats
    VkVertexInputBindingDescription binding{}; binding.binding = 0; binding.stride = sizeof(float) * kFloatsPerVertex; binding.inputRate = VK_VERTEX_INPUT_RATE_VERTEX;
    VkVertexInputAttributeDescription attrs[5]{};
    attrs[0].location = 0; attrs[0].binding = 0; attrs[0].format = VK_FORMAT_R32G32B32_SFLOAT; attrs[0].offset = 0;
    attrs[1].location = 1; attrs[1].binding = 0; attrs[1].format = VK_FORMAT_R32G32B32_SFLOAT; attrs[1].offset = sizeof(float)*3;
    attrs[2].location = 2; attrs[2].binding = 0; attrs[2].format = VK_FORMAT_R32G32_SFLOAT; attrs[2].offset = sizeof(float)*6;
    attrs[3].location = 3; attrs[3].binding = 0; attrs[3].format = VK_FORMAT_R32_SFLOAT; attrs[3].offset = sizeof(float)*8;
    attrs[4].location = 4; attrs[4].binding = 0; attrs[4].format = VK_FORMAT_R32G32B32_SFLOAT; attrs[4].offset = sizeof(float)*9;
    VkPipelineVertexInputStateCreateInfo vi{ VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO };
    vi.vertexBindingDescriptionCount = 1; vi.pVertexBindingDescriptions = &binding;
    vi.vertexAttributeDescriptionCount = 5; vi.pVertexAttributeDescriptions = attrs;

    PipelineStates states(VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST, VK_CULL_MODE_BACK_BIT, true);

    VkPipelineShaderStageCreateInfo stages[2] = {
        shaderStage(VK_SHADER_STAGE_VERTEX_BIT, vert), shaderStage(VK_SHADER_STAGE_FRAGMENT_BIT, frag) };

    VkGraphicsPipelineCreateInfo pci{ VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO };
    pci.stageCount = 2; pci.pStages = stages;
    pci.pVertexInputState = &vi;
    states.apply(pci);
    pci.layout = cityLayout_;
    pci.renderPass = hdrRenderPass_;
    pci.subpass = 0;
    bool ok = (vkCreateGraphicsPipelines(device_, VK_NULL_HANDLE, 1, &pci, nullptr, &cityPipeline_) == VK_SUCCESS);

    // Beacons share the vertex stage and layout, unlit fragment
    if (ok) {
        stages[1] = shaderStage(VK_SHADER_STAGE_FRAGMENT_BIT, beaconFrag);
        ok = (vkCreateGraphicsPipelines(device_, VK_NULL_HANDLE, 1, &pci, nullptr, &beaconPipeline_) == VK_SUCCESS);
    }

    vkDestroyShaderModule(device_, vert, nullptr);
    vkDestroyShaderModule(device_, frag, nullptr);
    vkDestroyShaderModule(device_, beaconFrag, nullptr);
    return ok;
}

bool Renderer::createPresentPipeline() {
    VkShaderModule vert = loadShader("present.vert");
    VkShaderModule frag = loadShader("present.frag");
    if (!vert || !frag) {
        if (vert) vkDestroyShaderModule(device_, vert, nullptr);
        if (frag) vkDestroyShaderModule(device_, frag, nullptr);
        return false;
    }
    VkPipelineShaderStageCreateInfo stages[2] = {
        shaderStage(VK_SHADER_STAGE_VERTEX_BIT, vert), shaderStage(VK_SHADER_STAGE_FRAGMENT_BIT, frag) };

    QuadInput input;
    PipelineStates states(VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP, VK_CULL_MODE_NONE, false);

    VkGraphicsPipelineCreateInfo pci{ VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO };
    pci.stageCount = 2; pci.pStages = stages;
    pci.pVertexInputState = &input.vi;
    states.apply(pci);
    pci.layout = presentLayout_;
    pci.renderPass = renderPass_; // Render to swapchain
    pci.subpass = 0;
    bool ok = (vkCreateGraphicsPipelines(device_, VK_NULL_HANDLE, 1, &pci, nullptr, &presentPipeline_) == VK_SUCCESS);
    vkDestroyShaderModule(device_, vert, nullptr);
    vkDestroyShaderModule(device_, frag, nullptr);
    return ok;
}

}
