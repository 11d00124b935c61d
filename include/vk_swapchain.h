// ============================================================================
// vkguide renderer - Swapchain & Target Manager
// Chooses surface format / present mode / extent / image count, creates the
// swapchain through vk-bootstrap together with its image views, a shared
// depth target and one framebuffer per swapchain image. The render pass is
// created once and survives recreation while the color format is unchanged.
// ============================================================================
#ifndef VKGUIDE_VK_SWAPCHAIN_H
#define VKGUIDE_VK_SWAPCHAIN_H

#include "vk_allocator.h"
#include <array>
#include <span>
#include <vector>

namespace vkg {

struct DeviceContext;

// Sentinel in VkSurfaceCapabilitiesKHR::currentExtent meaning "window decides".
inline constexpr uint32_t kExtentFromWindow = 0xFFFFFFFFu;

// Depth format used by every depth target / pipeline.
inline constexpr VkFormat kDepthFormat = VK_FORMAT_D32_SFLOAT;

// ----------------------------------------------------------------------------
// Pure selection helpers (no Vulkan calls)
// ----------------------------------------------------------------------------

// Prefer B8G8R8A8_SRGB + SRGB_NONLINEAR, else the first listed format.
// 'formats' must not be empty.
VkSurfaceFormatKHR choose_surface_format(std::span<const VkSurfaceFormatKHR> formats);

// vsync off -> IMMEDIATE if listed; triple_buffer -> MAILBOX if listed;
// otherwise FIFO, which every implementation supports.
VkPresentModeKHR choose_present_mode(std::span<const VkPresentModeKHR> modes, bool vsync, bool triple_buffer);

// currentExtent unless it is the sentinel, then clamp the window size into
// [minImageExtent, maxImageExtent].
VkExtent2D choose_extent(const VkSurfaceCapabilitiesKHR& caps, uint32_t window_width, uint32_t window_height);

// minImageCount + 1, capped at maxImageCount when that is non-zero.
uint32_t choose_image_count(const VkSurfaceCapabilitiesKHR& caps);

struct SwapchainSupport {
    VkSurfaceCapabilitiesKHR capabilities{};
    std::vector<VkSurfaceFormatKHR> formats;
    std::vector<VkPresentModeKHR> present_modes;
};

SwapchainSupport query_swapchain_support(VkPhysicalDevice physical, VkSurfaceKHR surface);

// EXTERNAL -> subpass 0: [0] color attachment output, [1] early|late
// fragment tests with depth writes made available to the next clear.
std::array<VkSubpassDependency, 2> render_pass_dependencies();

// Single subpass: color clear -> store -> PRESENT_SRC, depth clear -> store,
// with external dependencies for color output and early/late fragment tests.
VkRenderPass create_render_pass(VkDevice device, VkFormat color_format, VkFormat depth_format);

// ----------------------------------------------------------------------------
// SwapchainManager
// ----------------------------------------------------------------------------
class SwapchainManager {
public:
    void init(const DeviceContext& ctx, const ResourceAllocator& allocator);

    // Build swapchain + targets for the given window size (pixels). Passes the
    // current swapchain as oldSwapchain when one exists.
    void create(uint32_t window_width, uint32_t window_height, bool vsync, bool triple_buffer);

    // Wait for device idle, drop targets, create again with the new size.
    void recreate(uint32_t window_width, uint32_t window_height, bool vsync, bool triple_buffer);

    // Release framebuffers, depth, views, swapchain and the render pass.
    void destroy();

    [[nodiscard]] VkSwapchainKHR swapchain() const { return swapchain_; }
    [[nodiscard]] VkFormat format() const { return format_; }
    [[nodiscard]] VkExtent2D extent() const { return extent_; }
    [[nodiscard]] VkPresentModeKHR present_mode() const { return present_mode_; }
    [[nodiscard]] VkRenderPass render_pass() const { return render_pass_; }
    [[nodiscard]] uint32_t image_count() const { return static_cast<uint32_t>(images_.size()); }
    [[nodiscard]] uint32_t min_image_count() const { return min_image_count_; }
    [[nodiscard]] VkFramebuffer framebuffer(uint32_t image_index) const { return framebuffers_.at(image_index); }
    [[nodiscard]] uint64_t generation() const { return generation_; }

private:
    void destroy_targets();

    const DeviceContext* ctx_{nullptr};
    ResourceAllocator allocator_{};

    VkSwapchainKHR swapchain_{};
    VkFormat format_{VK_FORMAT_UNDEFINED};
    VkExtent2D extent_{};
    VkPresentModeKHR present_mode_{VK_PRESENT_MODE_FIFO_KHR};
    uint32_t min_image_count_{0};
    std::vector<VkImage> images_;
    std::vector<VkImageView> image_views_;
    AllocatedImage depth_image_{};
    VkImageView depth_view_{};
    std::vector<VkFramebuffer> framebuffers_;
    VkRenderPass render_pass_{};
    uint64_t generation_{0};  // Bumped on every successful create()
};

} // namespace vkg

#endif // VKGUIDE_VK_SWAPCHAIN_H
