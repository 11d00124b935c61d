// ============================================================================
// vkguide renderer - vk_draw.cpp
// Command recording for one frame: per-frame uniform / storage writes, the
// main render pass, the renderable walk driven by plan_draws(), and the UI.
// ============================================================================
#include "vk_engine.h"
#include "vk_log.h"
#include "vk_ui.h"

#include <algorithm>
#include <array>
#include <cmath>

namespace vkg {

GPUCameraData VulkanEngine::make_camera_data() const {
    const VkExtent2D extent = swapchain_.extent();
    const float aspect      = extent.height > 0 ? static_cast<float>(extent.width) / static_cast<float>(extent.height) : 1.0f;
    GPUCameraData cam{};
    cam.view     = camera_.view_matrix();
    cam.proj     = camera_.proj_matrix(aspect);
    cam.viewproj = mul(cam.proj, cam.view);
    return cam;
}

// Camera + scene blocks go to this slot's offsets of the shared uniform
// buffer; object transforms go to this slot's storage buffer in draw order.
// Returns the number of renderables that fit.
uint32_t VulkanEngine::write_frame_data(FrameData& frame) {
    if (!scene_.sorted()) scene_.sort_for_drawing();
    const uint32_t slot = current_slot();

    const GPUCameraData cam = make_camera_data();
    allocator_.write(scene_parameter_buffer_, &cam, sizeof(cam), static_cast<size_t>(uniform_layout_.camera_offset(slot)));

    const float framed               = static_cast<float>(state_.frame_number) / 120.0f;
    scene_parameters_.ambient_color  = float4{std::sin(framed), 0.0f, std::cos(framed), 1.0f};
    allocator_.write(scene_parameter_buffer_, &scene_parameters_, sizeof(scene_parameters_), static_cast<size_t>(uniform_layout_.scene_offset(slot)));

    const std::span<const RenderObject> objects = scene_.renderables();
    const auto count = static_cast<uint32_t>(std::min<size_t>(objects.size(), config_.max_objects));
    if (count < objects.size() && !state_.object_overflow_logged) {
        log::get()->warn("{} renderables exceed the {} object capacity; the rest are not drawn", objects.size(), config_.max_objects);
        state_.object_overflow_logged = true;
    }

    auto* data = static_cast<GPUObjectData*>(allocator_.map(frame.object_buffer));
    for (uint32_t i = 0; i < count; ++i) data[i].model = objects[i].transform;
    allocator_.unmap(frame.object_buffer);
    return count;
}

void VulkanEngine::record_frame(VkCommandBuffer cmd, FrameData& frame, uint32_t image_index) {
    const uint32_t object_count = write_frame_data(frame);
    if (ui_) ui_->new_frame();

    // Clear color pulses blue with a 120*pi frame period.
    const float flash = std::abs(std::sin(static_cast<float>(state_.frame_number) / 120.0f));
    std::array<VkClearValue, 2> clear_values{};
    clear_values[0].color        = {{0.0f, 0.0f, flash, 1.0f}};
    clear_values[1].depthStencil = {1.0f, 0u};

    VkRenderPassBeginInfo rpbi{};
    rpbi.sType             = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    rpbi.renderPass        = swapchain_.render_pass();
    rpbi.framebuffer       = swapchain_.framebuffer(image_index);
    rpbi.renderArea        = {{0, 0}, swapchain_.extent()};
    rpbi.clearValueCount   = static_cast<uint32_t>(clear_values.size());
    rpbi.pClearValues      = clear_values.data();
    vkCmdBeginRenderPass(cmd, &rpbi, VK_SUBPASS_CONTENTS_INLINE);

    draw_objects(cmd, frame, object_count);
    if (ui_) ui_->render(cmd);

    vkCmdEndRenderPass(cmd);
}

// Sets 0 and 1 (and 2 for textured materials) are bound together with the
// pipeline whenever the material changes; the vertex buffer only when the
// mesh changes. firstInstance carries the object index to gl_BaseInstance.
void VulkanEngine::draw_objects(VkCommandBuffer cmd, FrameData& frame, uint32_t object_count) {
    const std::span<const RenderObject> objects = scene_.renderables().first(object_count);
    const DrawPlan plan                         = plan_draws(objects);

    const uint32_t slot = current_slot();
    const std::array<uint32_t, 2> dynamic_offsets{
        static_cast<uint32_t>(uniform_layout_.camera_offset(slot)),
        static_cast<uint32_t>(uniform_layout_.scene_offset(slot)),
    };
    const float4x4 viewproj = make_camera_data().viewproj;

    DrawStats stats{};
    for (const DrawCommand& dc : plan.commands) {
        const RenderObject& obj  = *dc.object;
        const Material& material = *obj.material;

        if (dc.bind_pipeline) {
            vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, material.pipeline);
            vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, material.layout, 0u, 1u, &frame.global_descriptor, static_cast<uint32_t>(dynamic_offsets.size()), dynamic_offsets.data());
            vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, material.layout, 1u, 1u, &frame.object_descriptor, 0u, nullptr);
            if (material.texture_set != VK_NULL_HANDLE) {
                vkCmdBindDescriptorSets(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, material.layout, 2u, 1u, &material.texture_set, 0u, nullptr);
            }
        }

        MeshPushConstants constants{};
        constants.render_matrix = mul(viewproj, obj.transform);
        vkCmdPushConstants(cmd, material.layout, VK_SHADER_STAGE_VERTEX_BIT, 0u, sizeof(MeshPushConstants), &constants);

        if (dc.bind_vertex_buffer) {
            const VkDeviceSize offset = 0;
            vkCmdBindVertexBuffers(cmd, 0u, 1u, &obj.mesh->vertex_buffer.buffer, &offset);
        }

        vkCmdDraw(cmd, obj.mesh->vertex_count(), 1u, 0u, dc.first_instance);
        ++stats.draws;
        stats.triangles += obj.mesh->vertex_count() / 3u;
    }
    stats.pipeline_binds      = plan.pipeline_binds;
    stats.vertex_buffer_binds = plan.vertex_buffer_binds;
    stats.texture_binds       = plan.texture_binds;
    stats_                    = stats;
}

} // namespace vkg
