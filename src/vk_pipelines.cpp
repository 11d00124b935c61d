#include "vk_pipelines.h"
#include "vk_frame.h"
#include "vk_log.h"

#include <array>
#include <cstring>
#include <fstream>
#include <vulkan/vk_enum_string_helper.h>

namespace vkg {

std::vector<std::byte> read_binary_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    if (!f) throw std::runtime_error("Failed to open file: " + path);
    const auto size = static_cast<size_t>(f.tellg());
    std::vector<std::byte> data(size);
    f.seekg(0);
    f.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
    return data;
}

VkShaderModule create_shader_module(VkDevice device, std::span<const std::byte> code) {
    REQUIRE_TRUE(!code.empty() && code.size() % 4 == 0, "SPIR-V size must be a non-zero multiple of 4 (got " + std::to_string(code.size()) + ")");
    std::vector<uint32_t> words(code.size() / 4);
    std::memcpy(words.data(), code.data(), code.size());

    const VkShaderModuleCreateInfo ci{.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO, .pNext = nullptr, .flags = 0u, .codeSize = code.size(), .pCode = words.data()};
    VkShaderModule module{};
    VK_CHECK(vkCreateShaderModule(device, &ci, nullptr, &module));
    return module;
}

VkShaderModule load_shader_module(VkDevice device, const std::string& path) {
    const auto bytes = read_binary_file(path);
    VkShaderModule m = create_shader_module(device, bytes);
    log::get()->debug("Loaded shader module {}", path);
    return m;
}

// ============================================================================
// Fixed-function state helpers
// ============================================================================
VkPipelineShaderStageCreateInfo shader_stage_info(VkShaderStageFlagBits stage, VkShaderModule module) {
    VkPipelineShaderStageCreateInfo info{};
    info.sType  = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    info.stage  = stage;
    info.module = module;
    info.pName  = "main";
    return info;
}

VkPipelineVertexInputStateCreateInfo vertex_input_state(const VertexInputDescription& desc) {
    VkPipelineVertexInputStateCreateInfo info{};
    info.sType                           = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
    info.flags                           = desc.flags;
    info.vertexBindingDescriptionCount   = static_cast<uint32_t>(desc.bindings.size());
    info.pVertexBindingDescriptions      = desc.bindings.data();
    info.vertexAttributeDescriptionCount = static_cast<uint32_t>(desc.attributes.size());
    info.pVertexAttributeDescriptions    = desc.attributes.data();
    return info;
}

VkPipelineInputAssemblyStateCreateInfo input_assembly_state(VkPrimitiveTopology topology) {
    VkPipelineInputAssemblyStateCreateInfo info{};
    info.sType                  = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    info.topology               = topology;
    info.primitiveRestartEnable = VK_FALSE;
    return info;
}

VkPipelineRasterizationStateCreateInfo rasterization_state(VkPolygonMode polygon_mode) {
    VkPipelineRasterizationStateCreateInfo info{};
    info.sType       = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    info.polygonMode = polygon_mode;
    info.cullMode    = VK_CULL_MODE_NONE;
    info.frontFace   = VK_FRONT_FACE_CLOCKWISE;
    info.lineWidth   = 1.0f;
    return info;
}

VkPipelineMultisampleStateCreateInfo multisample_state() {
    VkPipelineMultisampleStateCreateInfo info{};
    info.sType                = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    info.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;
    info.minSampleShading     = 1.0f;
    return info;
}

VkPipelineDepthStencilStateCreateInfo depth_stencil_state(bool depth_test, bool depth_write, VkCompareOp compare_op) {
    VkPipelineDepthStencilStateCreateInfo info{};
    info.sType                 = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
    info.depthTestEnable       = depth_test ? VK_TRUE : VK_FALSE;
    info.depthWriteEnable      = depth_write ? VK_TRUE : VK_FALSE;
    info.depthCompareOp        = depth_test ? compare_op : VK_COMPARE_OP_ALWAYS;
    info.depthBoundsTestEnable = VK_FALSE;
    info.stencilTestEnable     = VK_FALSE;
    info.minDepthBounds        = 0.0f;
    info.maxDepthBounds        = 1.0f;
    return info;
}

VkPipelineColorBlendAttachmentState color_blend_attachment_state() {
    VkPipelineColorBlendAttachmentState s{};
    s.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
    s.blendEnable    = VK_FALSE;
    return s;
}

// ============================================================================
// PipelineBuilder
// ============================================================================
PipelineBuilder PipelineBuilder::defaults(VkExtent2D extent) {
    PipelineBuilder b{};
    b.input_assembly         = input_assembly_state(VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST);
    b.viewport               = VkViewport{0.0f, 0.0f, static_cast<float>(extent.width), static_cast<float>(extent.height), 0.0f, 1.0f};
    b.scissor                = VkRect2D{{0, 0}, extent};
    b.rasterizer             = rasterization_state(VK_POLYGON_MODE_FILL);
    b.color_blend_attachment = color_blend_attachment_state();
    b.multisampling          = multisample_state();
    b.depth_stencil          = depth_stencil_state(true, true, VK_COMPARE_OP_LESS_OR_EQUAL);
    return b;
}

PipelineBuilder& PipelineBuilder::set_shaders(VkShaderModule vertex, VkShaderModule fragment) {
    shader_stages.clear();
    shader_stages.push_back(shader_stage_info(VK_SHADER_STAGE_VERTEX_BIT, vertex));
    shader_stages.push_back(shader_stage_info(VK_SHADER_STAGE_FRAGMENT_BIT, fragment));
    return *this;
}

PipelineBuilder& PipelineBuilder::set_vertex_input(const VertexInputDescription& desc) {
    vertex_description = desc;
    return *this;
}

PipelineBuilder& PipelineBuilder::set_layout(VkPipelineLayout layout) {
    pipeline_layout = layout;
    return *this;
}

VkPipeline PipelineBuilder::build(VkDevice device, VkRenderPass render_pass) const {
    const VkPipelineVertexInputStateCreateInfo vertex_input = vertex_input_state(vertex_description);

    VkPipelineViewportStateCreateInfo viewport_state{};
    viewport_state.sType         = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    viewport_state.viewportCount = 1u;
    viewport_state.pViewports    = &viewport;
    viewport_state.scissorCount  = 1u;
    viewport_state.pScissors     = &scissor;

    VkPipelineColorBlendStateCreateInfo color_blend{};
    color_blend.sType           = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    color_blend.logicOpEnable   = VK_FALSE;
    color_blend.logicOp         = VK_LOGIC_OP_COPY;
    color_blend.attachmentCount = 1u;
    color_blend.pAttachments    = &color_blend_attachment;

    VkGraphicsPipelineCreateInfo pci{};
    pci.sType               = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    pci.stageCount          = static_cast<uint32_t>(shader_stages.size());
    pci.pStages             = shader_stages.data();
    pci.pVertexInputState   = &vertex_input;
    pci.pInputAssemblyState = &input_assembly;
    pci.pViewportState      = &viewport_state;
    pci.pRasterizationState = &rasterizer;
    pci.pMultisampleState   = &multisampling;
    pci.pDepthStencilState  = &depth_stencil;
    pci.pColorBlendState    = &color_blend;
    pci.layout              = pipeline_layout;
    pci.renderPass          = render_pass;
    pci.subpass             = 0u;
    pci.basePipelineHandle  = VK_NULL_HANDLE;

    VkPipeline pipeline{};
    if (const VkResult res = vkCreateGraphicsPipelines(device, VK_NULL_HANDLE, 1u, &pci, nullptr, &pipeline); res != VK_SUCCESS) {
        log::get()->error("Failed to create graphics pipeline: {}", string_VkResult(res));
        return VK_NULL_HANDLE;
    }
    return pipeline;
}

// ============================================================================
// PipelineSet
// ============================================================================
void PipelineSet::create_layouts(VkDevice device, VkDescriptorSetLayout global, VkDescriptorSetLayout object, VkDescriptorSetLayout texture) {
    const VkPushConstantRange push{.stageFlags = VK_SHADER_STAGE_VERTEX_BIT, .offset = 0u, .size = sizeof(MeshPushConstants)};

    const std::array<VkDescriptorSetLayout, 2> mesh_sets{global, object};
    VkPipelineLayoutCreateInfo lci{};
    lci.sType                  = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    lci.setLayoutCount         = static_cast<uint32_t>(mesh_sets.size());
    lci.pSetLayouts            = mesh_sets.data();
    lci.pushConstantRangeCount = 1u;
    lci.pPushConstantRanges    = &push;
    VK_CHECK(vkCreatePipelineLayout(device, &lci, nullptr, &mesh_layout));

    const std::array<VkDescriptorSetLayout, 3> textured_sets{global, object, texture};
    lci.setLayoutCount = static_cast<uint32_t>(textured_sets.size());
    lci.pSetLayouts    = textured_sets.data();
    VK_CHECK(vkCreatePipelineLayout(device, &lci, nullptr, &textured_layout));
}

void PipelineSet::build(VkDevice device, VkRenderPass render_pass, VkExtent2D extent, const std::string& shader_dir) {
    const std::string dir = shader_dir + "/";
    PipelineBuilder base  = PipelineBuilder::defaults(extent);
    base.set_layout(mesh_layout);

    // Flat / interpolated color triangles: positions come from gl_VertexIndex.
    // Both share the mesh layout so the draw loop can bind sets 0-1 uniformly.
    auto build_optional = [&](const char* vert, const char* frag, const char* what) -> VkPipeline {
        try {
            ScopedShaderModule vs(device, load_shader_module(device, dir + vert));
            ScopedShaderModule fs(device, load_shader_module(device, dir + frag));
            PipelineBuilder b = base;
            VkPipeline p      = b.set_shaders(vs.get(), fs.get()).build(device, render_pass);
            if (p == VK_NULL_HANDLE) log::get()->error("Failed to create {} pipeline", what);
            else log::get()->info("Created {} pipeline", what);
            return p;
        } catch (const std::exception& ex) {
            log::get()->error("Skipping {} pipeline: {}", what, ex.what());
            return VK_NULL_HANDLE;
        }
    };
    red_triangle = build_optional("triangle.vert.spv", "triangle.frag.spv", "red triangle");
    rgb_triangle = build_optional("colored_triangle.vert.spv", "colored_triangle.frag.spv", "rgb triangle");

    ScopedShaderModule mesh_vs(device, load_shader_module(device, dir + "tri_mesh.vert.spv"));
    ScopedShaderModule lit_fs(device, load_shader_module(device, dir + "default_lit.frag.spv"));
    ScopedShaderModule tex_fs(device, load_shader_module(device, dir + "textured_lit.frag.spv"));

    PipelineBuilder mesh_builder = base;
    mesh_builder.set_vertex_input(Vertex::input_description()).set_shaders(mesh_vs.get(), lit_fs.get());
    mesh = mesh_builder.build(device, render_pass);
    REQUIRE_TRUE(mesh != VK_NULL_HANDLE, "mesh pipeline creation failed");
    log::get()->info("Created mesh pipeline");

    PipelineBuilder textured_builder = mesh_builder;
    textured_builder.set_shaders(mesh_vs.get(), tex_fs.get()).set_layout(textured_layout);
    textured_mesh = textured_builder.build(device, render_pass);
    REQUIRE_TRUE(textured_mesh != VK_NULL_HANDLE, "textured mesh pipeline creation failed");
    log::get()->info("Created textured mesh pipeline");
}

void PipelineSet::destroy_pipelines(VkDevice device) {
    IF_NOT_NULL_DO_AND_SET(red_triangle, vkDestroyPipeline(device, red_triangle, nullptr), VK_NULL_HANDLE);
    IF_NOT_NULL_DO_AND_SET(rgb_triangle, vkDestroyPipeline(device, rgb_triangle, nullptr), VK_NULL_HANDLE);
    IF_NOT_NULL_DO_AND_SET(mesh, vkDestroyPipeline(device, mesh, nullptr), VK_NULL_HANDLE);
    IF_NOT_NULL_DO_AND_SET(textured_mesh, vkDestroyPipeline(device, textured_mesh, nullptr), VK_NULL_HANDLE);
}

} // namespace vkg
