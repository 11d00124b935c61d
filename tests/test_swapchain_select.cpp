#include "vk_swapchain.h"

#include <array>
#include <gtest/gtest.h>

using namespace vkg;

TEST(ChooseSurfaceFormat, PrefersSrgbBgra) {
    const std::array<VkSurfaceFormatKHR, 3> formats{{
        {VK_FORMAT_R8G8B8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
        {VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
        {VK_FORMAT_B8G8R8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
    }};
    const auto f = choose_surface_format(formats);
    EXPECT_EQ(f.format, VK_FORMAT_B8G8R8A8_SRGB);
    EXPECT_EQ(f.colorSpace, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR);
}

TEST(ChooseSurfaceFormat, FallsBackToFirst) {
    const std::array<VkSurfaceFormatKHR, 2> formats{{
        {VK_FORMAT_R8G8B8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
        {VK_FORMAT_B8G8R8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
    }};
    EXPECT_EQ(choose_surface_format(formats).format, VK_FORMAT_R8G8B8A8_UNORM);
}

TEST(ChooseSurfaceFormat, EmptyListThrows) {
    EXPECT_THROW(choose_surface_format({}), std::runtime_error);
}

TEST(ChoosePresentMode, VsyncDefaultsToFifo) {
    const std::array modes{VK_PRESENT_MODE_IMMEDIATE_KHR, VK_PRESENT_MODE_MAILBOX_KHR, VK_PRESENT_MODE_FIFO_KHR};
    EXPECT_EQ(choose_present_mode(modes, true, false), VK_PRESENT_MODE_FIFO_KHR);
}

TEST(ChoosePresentMode, TripleBufferPicksMailboxWhenListed) {
    const std::array with_mailbox{VK_PRESENT_MODE_MAILBOX_KHR, VK_PRESENT_MODE_FIFO_KHR};
    const std::array fifo_only{VK_PRESENT_MODE_FIFO_KHR};
    EXPECT_EQ(choose_present_mode(with_mailbox, true, true), VK_PRESENT_MODE_MAILBOX_KHR);
    EXPECT_EQ(choose_present_mode(fifo_only, true, true), VK_PRESENT_MODE_FIFO_KHR);
}

TEST(ChoosePresentMode, NoVsyncPrefersImmediate) {
    const std::array modes{VK_PRESENT_MODE_FIFO_KHR, VK_PRESENT_MODE_IMMEDIATE_KHR};
    const std::array fifo_only{VK_PRESENT_MODE_FIFO_KHR};
    EXPECT_EQ(choose_present_mode(modes, false, false), VK_PRESENT_MODE_IMMEDIATE_KHR);
    EXPECT_EQ(choose_present_mode(fifo_only, false, false), VK_PRESENT_MODE_FIFO_KHR);
}

TEST(ChooseExtent, UsesCurrentExtentWhenDefined) {
    VkSurfaceCapabilitiesKHR caps{};
    caps.currentExtent = {800, 600};
    const auto e       = choose_extent(caps, 1600, 900);
    EXPECT_EQ(e.width, 800u);
    EXPECT_EQ(e.height, 600u);
}

TEST(ChooseExtent, ClampsWindowSizeWhenSentinel) {
    VkSurfaceCapabilitiesKHR caps{};
    caps.currentExtent  = {kExtentFromWindow, kExtentFromWindow};
    caps.minImageExtent = {64, 64};
    caps.maxImageExtent = {1024, 768};

    auto e = choose_extent(caps, 1600, 900);
    EXPECT_EQ(e.width, 1024u);
    EXPECT_EQ(e.height, 768u);

    e = choose_extent(caps, 10, 500);
    EXPECT_EQ(e.width, 64u);
    EXPECT_EQ(e.height, 500u);
}

TEST(ChooseImageCount, OneMoreThanMinimum) {
    VkSurfaceCapabilitiesKHR caps{};
    caps.minImageCount = 2;
    caps.maxImageCount = 0; // unbounded
    EXPECT_EQ(choose_image_count(caps), 3u);
}

TEST(ChooseImageCount, CappedByMaximum) {
    VkSurfaceCapabilitiesKHR caps{};
    caps.minImageCount = 3;
    caps.maxImageCount = 3;
    EXPECT_EQ(choose_image_count(caps), 3u);
}

TEST(RenderPassDependencies, ColorWaitsForAcquiredImage) {
    const auto deps = render_pass_dependencies();
    EXPECT_EQ(deps[0].srcSubpass, VK_SUBPASS_EXTERNAL);
    EXPECT_EQ(deps[0].dstSubpass, 0u);
    EXPECT_EQ(deps[0].srcStageMask, static_cast<VkPipelineStageFlags>(VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT));
    EXPECT_EQ(deps[0].dstAccessMask, static_cast<VkAccessFlags>(VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT));
}

TEST(RenderPassDependencies, DepthClearWaitsForPreviousDepthWrites) {
    // Both in-flight frames share one depth image: the next frame's clear is a
    // write after the previous frame's fragment-test writes.
    const auto deps                    = render_pass_dependencies();
    const VkPipelineStageFlags tests   = VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT | VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT;
    EXPECT_EQ(deps[1].srcSubpass, VK_SUBPASS_EXTERNAL);
    EXPECT_EQ(deps[1].srcStageMask, tests);
    EXPECT_EQ(deps[1].dstStageMask, tests);
    EXPECT_EQ(deps[1].srcAccessMask, static_cast<VkAccessFlags>(VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT));
    EXPECT_EQ(deps[1].dstAccessMask, static_cast<VkAccessFlags>(VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_READ_BIT | VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT));
}
