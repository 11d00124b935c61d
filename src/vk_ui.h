// ============================================================================
// vkguide renderer - ImGui / UI System Wrapper (engine private)
// Owns the ImGui descriptor pool and the SDL3 + Vulkan backends. Draws inside
// the main render pass, after the scene, so it needs no layout transitions of
// its own.
// ============================================================================
#ifndef VKGUIDE_VK_UI_H
#define VKGUIDE_VK_UI_H

#include "vk_types.h"
#include <SDL3/SDL.h>
#include <functional>
#include <vector>

namespace vkg {

struct DeviceContext;

class UiSystem {
public:
    using PanelFn = std::function<void()>;

    // Create the ImGui context and backends. Throws on failure after releasing
    // whatever was created.
    void init(const DeviceContext& ctx, VkRenderPass render_pass, uint32_t min_image_count, uint32_t image_count);

    // Release all ImGui/Vulkan backend resources. Device must be idle.
    void shutdown();

    void process_event(const SDL_Event& e) const;

    // True while an ImGui widget has keyboard focus.
    [[nodiscard]] bool wants_keyboard() const;

    // Start a new ImGui frame & invoke registered panels.
    void new_frame() const;

    // Finalize the frame and record its draw data. Must be inside the render pass.
    void render(VkCommandBuffer cmd) const;

    // Register an ImGui panel callback executed every frame.
    void add_panel(PanelFn fn) { panels_.push_back(std::move(fn)); }

    // Update backend min image count after swapchain recreation.
    void set_min_image_count(uint32_t count);

    // Rebuild the Vulkan backend's pipeline against a new render pass. The
    // ImGui context, fonts and panels survive. Device must be idle.
    void set_render_pass(VkRenderPass render_pass);

    [[nodiscard]] bool initialized() const { return initialized_; }
    [[nodiscard]] VkRenderPass render_pass() const { return render_pass_; }

private:
    [[nodiscard]] bool init_vulkan_backend() const;

    const DeviceContext* ctx_{nullptr};
    VkDevice device_{VK_NULL_HANDLE};
    VkRenderPass render_pass_{VK_NULL_HANDLE};
    uint32_t min_image_count_{0};
    uint32_t image_count_{0};
    VkDescriptorPool pool_{VK_NULL_HANDLE}; // ImGui descriptor pool
    bool initialized_{false};
    std::vector<PanelFn> panels_;
};

} // namespace vkg

#endif // VKGUIDE_VK_UI_H
