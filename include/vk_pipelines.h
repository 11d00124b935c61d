// ============================================================================
// vkguide renderer - Pipeline Builder
// Value-type assembler for render-pass graphics pipelines with static
// viewport / scissor. Variations are produced by copying a configured
// builder and changing shaders, vertex input or layout before build().
// PipelineSet owns the four draw-style pipelines.
// ============================================================================
#ifndef VKGUIDE_VK_PIPELINES_H
#define VKGUIDE_VK_PIPELINES_H

#include "vk_mesh.h"
#include "vk_types.h"
#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace vkg {

// ----------------------------------------------------------------------------
// Shader modules
// ----------------------------------------------------------------------------

// Read a whole file. Throws std::runtime_error if it cannot be opened.
std::vector<std::byte> read_binary_file(const std::string& path);

// SPIR-V words from raw bytes. Throws if code.size() is not a multiple of 4.
VkShaderModule create_shader_module(VkDevice device, std::span<const std::byte> code);
VkShaderModule load_shader_module(VkDevice device, const std::string& path);

// Destroys the module on scope exit.
class ScopedShaderModule {
public:
    ScopedShaderModule(VkDevice device, VkShaderModule module) : device_(device), module_(module) {}
    ~ScopedShaderModule() { IF_NOT_NULL_DO(module_, vkDestroyShaderModule(device_, module_, nullptr)); }
    ScopedShaderModule(const ScopedShaderModule&)            = delete;
    ScopedShaderModule& operator=(const ScopedShaderModule&) = delete;

    [[nodiscard]] VkShaderModule get() const { return module_; }

private:
    VkDevice device_{};
    VkShaderModule module_{};
};

// ----------------------------------------------------------------------------
// Fixed-function state helpers
// ----------------------------------------------------------------------------
VkPipelineShaderStageCreateInfo shader_stage_info(VkShaderStageFlagBits stage, VkShaderModule module);
// Points into 'desc'; keep it alive until the pipeline is built.
VkPipelineVertexInputStateCreateInfo vertex_input_state(const VertexInputDescription& desc);
VkPipelineInputAssemblyStateCreateInfo input_assembly_state(VkPrimitiveTopology topology);
VkPipelineRasterizationStateCreateInfo rasterization_state(VkPolygonMode polygon_mode);
VkPipelineMultisampleStateCreateInfo multisample_state();
VkPipelineDepthStencilStateCreateInfo depth_stencil_state(bool depth_test, bool depth_write, VkCompareOp compare_op);
VkPipelineColorBlendAttachmentState color_blend_attachment_state();

// ----------------------------------------------------------------------------
// PipelineBuilder
// ----------------------------------------------------------------------------
struct PipelineBuilder {
    std::vector<VkPipelineShaderStageCreateInfo> shader_stages;
    VertexInputDescription vertex_description;  // Empty = no vertex buffers
    VkPipelineInputAssemblyStateCreateInfo input_assembly{};
    VkViewport viewport{};
    VkRect2D scissor{};
    VkPipelineRasterizationStateCreateInfo rasterizer{};
    VkPipelineColorBlendAttachmentState color_blend_attachment{};
    VkPipelineMultisampleStateCreateInfo multisampling{};
    VkPipelineDepthStencilStateCreateInfo depth_stencil{};
    VkPipelineLayout pipeline_layout{};

    // Triangle list, full-extent viewport, fill / no cull / clockwise front,
    // one sample, depth test+write LESS_OR_EQUAL, RGBA write without blending.
    static PipelineBuilder defaults(VkExtent2D extent);

    PipelineBuilder& set_shaders(VkShaderModule vertex, VkShaderModule fragment);
    PipelineBuilder& set_vertex_input(const VertexInputDescription& desc);
    PipelineBuilder& set_layout(VkPipelineLayout layout);

    // VK_NULL_HANDLE (logged) when vkCreateGraphicsPipelines fails.
    [[nodiscard]] VkPipeline build(VkDevice device, VkRenderPass render_pass) const;
};

// ----------------------------------------------------------------------------
// PipelineSet
// Layouts persist for the whole run (the caller queues them for deletion);
// pipelines bake the swapchain extent and are rebuilt on every recreation.
// ----------------------------------------------------------------------------
class PipelineSet {
public:
    // mesh layout: sets {global, object} + MeshPushConstants (vertex)
    // textured layout: sets {global, object, texture} + MeshPushConstants
    void create_layouts(VkDevice device, VkDescriptorSetLayout global, VkDescriptorSetLayout object, VkDescriptorSetLayout texture);

    // Build all four pipelines from '<shader_dir>/*.spv'. Throws when the lit
    // or textured pipeline cannot be built; the triangle pipelines are
    // optional and stay null on failure.
    void build(VkDevice device, VkRenderPass render_pass, VkExtent2D extent, const std::string& shader_dir);

    void destroy_pipelines(VkDevice device);

    VkPipeline red_triangle{};
    VkPipeline rgb_triangle{};
    VkPipeline mesh{};
    VkPipeline textured_mesh{};

    VkPipelineLayout mesh_layout{};
    VkPipelineLayout textured_layout{};
};

} // namespace vkg

#endif // VKGUIDE_VK_PIPELINES_H
