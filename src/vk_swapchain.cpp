#include "vk_swapchain.h"
#include "vk_context.h"
#include "vk_log.h"

#include "VkBootstrap.h"
#include <algorithm>
#include <array>

namespace vkg {

VkSurfaceFormatKHR choose_surface_format(std::span<const VkSurfaceFormatKHR> formats) {
    REQUIRE_TRUE(!formats.empty(), "surface reports no formats");
    for (const auto& f : formats) {
        if (f.format == VK_FORMAT_B8G8R8A8_SRGB && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) return f;
    }
    return formats.front();
}

VkPresentModeKHR choose_present_mode(std::span<const VkPresentModeKHR> modes, bool vsync, bool triple_buffer) {
    auto has = [&](VkPresentModeKHR m) { return std::ranges::find(modes, m) != modes.end(); };
    if (!vsync && has(VK_PRESENT_MODE_IMMEDIATE_KHR)) return VK_PRESENT_MODE_IMMEDIATE_KHR;
    if (triple_buffer && has(VK_PRESENT_MODE_MAILBOX_KHR)) return VK_PRESENT_MODE_MAILBOX_KHR;
    return VK_PRESENT_MODE_FIFO_KHR;
}

VkExtent2D choose_extent(const VkSurfaceCapabilitiesKHR& caps, uint32_t window_width, uint32_t window_height) {
    if (caps.currentExtent.width != kExtentFromWindow) return caps.currentExtent;
    return VkExtent2D{
        std::clamp(window_width, caps.minImageExtent.width, caps.maxImageExtent.width),
        std::clamp(window_height, caps.minImageExtent.height, caps.maxImageExtent.height),
    };
}

uint32_t choose_image_count(const VkSurfaceCapabilitiesKHR& caps) {
    uint32_t count = caps.minImageCount + 1;
    if (caps.maxImageCount > 0 && count > caps.maxImageCount) count = caps.maxImageCount;
    return count;
}

SwapchainSupport query_swapchain_support(VkPhysicalDevice physical, VkSurfaceKHR surface) {
    SwapchainSupport s{};
    VK_CHECK(vkGetPhysicalDeviceSurfaceCapabilitiesKHR(physical, surface, &s.capabilities));
    uint32_t n = 0;
    VK_CHECK(vkGetPhysicalDeviceSurfaceFormatsKHR(physical, surface, &n, nullptr));
    s.formats.resize(n);
    VK_CHECK(vkGetPhysicalDeviceSurfaceFormatsKHR(physical, surface, &n, s.formats.data()));
    n = 0;
    VK_CHECK(vkGetPhysicalDeviceSurfacePresentModesKHR(physical, surface, &n, nullptr));
    s.present_modes.resize(n);
    VK_CHECK(vkGetPhysicalDeviceSurfacePresentModesKHR(physical, surface, &n, s.present_modes.data()));
    return s;
}

// Color writes wait for the acquired image. Depth load-op clears wait for
// the previous frame's depth writes on the shared depth image, which must be
// made available before the clear.
std::array<VkSubpassDependency, 2> render_pass_dependencies() {
    return {{
        {.srcSubpass      = VK_SUBPASS_EXTERNAL,
            .dstSubpass      = 0u,
            .srcStageMask    = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT,
            .dstStageMask    = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT,
            .srcAccessMask   = 0u,
            .dstAccessMask   = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT,
            .dependencyFlags = 0u},
        {.srcSubpass      = VK_SUBPASS_EXTERNAL,
            .dstSubpass      = 0u,
            .srcStageMask    = VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT | VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT,
            .dstStageMask    = VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT | VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT,
            .srcAccessMask   = VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT,
            .dstAccessMask   = VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_READ_BIT | VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT,
            .dependencyFlags = 0u},
    }};
}

VkRenderPass create_render_pass(VkDevice device, VkFormat color_format, VkFormat depth_format) {
    const std::array<VkAttachmentDescription, 2> attachments{{
        {.flags          = 0u,
            .format         = color_format,
            .samples        = VK_SAMPLE_COUNT_1_BIT,
            .loadOp         = VK_ATTACHMENT_LOAD_OP_CLEAR,
            .storeOp        = VK_ATTACHMENT_STORE_OP_STORE,
            .stencilLoadOp  = VK_ATTACHMENT_LOAD_OP_DONT_CARE,
            .stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE,
            .initialLayout  = VK_IMAGE_LAYOUT_UNDEFINED,
            .finalLayout    = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR},
        {.flags          = 0u,
            .format         = depth_format,
            .samples        = VK_SAMPLE_COUNT_1_BIT,
            .loadOp         = VK_ATTACHMENT_LOAD_OP_CLEAR,
            .storeOp        = VK_ATTACHMENT_STORE_OP_STORE,
            .stencilLoadOp  = VK_ATTACHMENT_LOAD_OP_CLEAR,
            .stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE,
            .initialLayout  = VK_IMAGE_LAYOUT_UNDEFINED,
            .finalLayout    = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL},
    }};
    const VkAttachmentReference color_ref{0u, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL};
    const VkAttachmentReference depth_ref{1u, VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL};

    VkSubpassDescription subpass{};
    subpass.pipelineBindPoint       = VK_PIPELINE_BIND_POINT_GRAPHICS;
    subpass.colorAttachmentCount    = 1u;
    subpass.pColorAttachments       = &color_ref;
    subpass.pDepthStencilAttachment = &depth_ref;

    const std::array<VkSubpassDependency, 2> deps = render_pass_dependencies();

    const VkRenderPassCreateInfo rpci{.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO,
        .pNext                               = nullptr,
        .flags                               = 0u,
        .attachmentCount                     = static_cast<uint32_t>(attachments.size()),
        .pAttachments                        = attachments.data(),
        .subpassCount                        = 1u,
        .pSubpasses                          = &subpass,
        .dependencyCount                     = static_cast<uint32_t>(deps.size()),
        .pDependencies                       = deps.data()};
    VkRenderPass rp{};
    VK_CHECK(vkCreateRenderPass(device, &rpci, nullptr, &rp));
    return rp;
}

// ============================================================================
// SwapchainManager
// ============================================================================
void SwapchainManager::init(const DeviceContext& ctx, const ResourceAllocator& allocator) {
    ctx_       = &ctx;
    allocator_ = allocator;
}

void SwapchainManager::create(uint32_t window_width, uint32_t window_height, bool vsync, bool triple_buffer) {
    REQUIRE_TRUE(ctx_ != nullptr && ctx_->surface != VK_NULL_HANDLE, "SwapchainManager needs a context with a surface");
    const VkDevice device = ctx_->device;

    const SwapchainSupport support = query_swapchain_support(ctx_->physical, ctx_->surface);
    const VkSurfaceFormatKHR surface_format = choose_surface_format(support.formats);
    const VkPresentModeKHR mode             = choose_present_mode(support.present_modes, vsync, triple_buffer);
    const VkExtent2D extent                 = choose_extent(support.capabilities, window_width, window_height);
    const uint32_t image_count              = choose_image_count(support.capabilities);

    auto sc_ret = vkb::SwapchainBuilder(ctx_->physical, device, ctx_->surface)
                      .set_desired_format(surface_format)
                      .set_desired_present_mode(mode)
                      .set_desired_extent(extent.width, extent.height)
                      .set_desired_min_image_count(image_count)
                      .add_image_usage_flags(VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT)
                      .set_old_swapchain(swapchain_)
                      .build();
    REQUIRE_TRUE(sc_ret.has_value(), "Failed to create swapchain: " + sc_ret.error().message());
    vkb::Swapchain sc = sc_ret.value();

    // The retired swapchain may be destroyed once its replacement exists.
    IF_NOT_NULL_DO_AND_SET(swapchain_, vkDestroySwapchainKHR(device, swapchain_, nullptr), VK_NULL_HANDLE);

    swapchain_       = sc.swapchain;
    extent_          = sc.extent;
    present_mode_    = sc.present_mode;
    min_image_count_ = image_count;
    images_          = sc.get_images().value();
    image_views_     = sc.get_image_views().value();

    if (render_pass_ == VK_NULL_HANDLE || sc.image_format != format_) {
        IF_NOT_NULL_DO_AND_SET(render_pass_, vkDestroyRenderPass(device, render_pass_, nullptr), VK_NULL_HANDLE);
        render_pass_ = create_render_pass(device, sc.image_format, kDepthFormat);
        log::get()->info("Created render pass");
    }
    format_ = sc.image_format;

    // Depth target (D32_SFLOAT), shared by every framebuffer
    const VkImageCreateInfo dimg{.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO,
        .pNext                          = nullptr,
        .flags                          = 0u,
        .imageType                      = VK_IMAGE_TYPE_2D,
        .format                         = kDepthFormat,
        .extent                         = {extent_.width, extent_.height, 1u},
        .mipLevels                      = 1u,
        .arrayLayers                    = 1u,
        .samples                        = VK_SAMPLE_COUNT_1_BIT,
        .tiling                         = VK_IMAGE_TILING_OPTIMAL,
        .usage                          = VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT,
        .sharingMode                    = VK_SHARING_MODE_EXCLUSIVE,
        .queueFamilyIndexCount          = 0u,
        .pQueueFamilyIndices            = nullptr,
        .initialLayout                  = VK_IMAGE_LAYOUT_UNDEFINED};
    depth_image_ = allocator_.create_image(dimg, MemoryResidency::GpuOnly);
    const VkImageViewCreateInfo dview{.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO,
        .pNext                               = nullptr,
        .flags                               = 0u,
        .image                               = depth_image_.image,
        .viewType                            = VK_IMAGE_VIEW_TYPE_2D,
        .format                              = kDepthFormat,
        .components                          = {VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY},
        .subresourceRange                    = {VK_IMAGE_ASPECT_DEPTH_BIT, 0u, 1u, 0u, 1u}};
    VK_CHECK(vkCreateImageView(device, &dview, nullptr, &depth_view_));

    framebuffers_.assign(image_views_.size(), VK_NULL_HANDLE);
    for (size_t i = 0; i < image_views_.size(); ++i) {
        const std::array<VkImageView, 2> views{image_views_[i], depth_view_};
        const VkFramebufferCreateInfo fci{.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO,
            .pNext                               = nullptr,
            .flags                               = 0u,
            .renderPass                          = render_pass_,
            .attachmentCount                     = static_cast<uint32_t>(views.size()),
            .pAttachments                        = views.data(),
            .width                               = extent_.width,
            .height                              = extent_.height,
            .layers                              = 1u};
        VK_CHECK(vkCreateFramebuffer(device, &fci, nullptr, &framebuffers_[i]));
    }

    ++generation_;
    log::get()->info("Created swapchain {}x{} with {} images", extent_.width, extent_.height, images_.size());
}

void SwapchainManager::recreate(uint32_t window_width, uint32_t window_height, bool vsync, bool triple_buffer) {
    if (ctx_ == nullptr || ctx_->device == VK_NULL_HANDLE) return;
    VK_CHECK(vkDeviceWaitIdle(ctx_->device));
    destroy_targets();
    create(window_width, window_height, vsync, triple_buffer);
}

void SwapchainManager::destroy_targets() {
    const VkDevice device = ctx_->device;
    for (auto& fb : framebuffers_) IF_NOT_NULL_DO_AND_SET(fb, vkDestroyFramebuffer(device, fb, nullptr), VK_NULL_HANDLE);
    framebuffers_.clear();
    IF_NOT_NULL_DO_AND_SET(depth_view_, vkDestroyImageView(device, depth_view_, nullptr), VK_NULL_HANDLE);
    allocator_.destroy_image(depth_image_);
    for (auto& v : image_views_) IF_NOT_NULL_DO_AND_SET(v, vkDestroyImageView(device, v, nullptr), VK_NULL_HANDLE);
    image_views_.clear();
    images_.clear();
}

void SwapchainManager::destroy() {
    if (ctx_ == nullptr || ctx_->device == VK_NULL_HANDLE) return;
    destroy_targets();
    IF_NOT_NULL_DO_AND_SET(swapchain_, vkDestroySwapchainKHR(ctx_->device, swapchain_, nullptr), VK_NULL_HANDLE);
    IF_NOT_NULL_DO_AND_SET(render_pass_, vkDestroyRenderPass(ctx_->device, render_pass_, nullptr), VK_NULL_HANDLE);
    format_ = VK_FORMAT_UNDEFINED;
    extent_ = {};
}

} // namespace vkg
