#include "vk_engine.h"
#include "vk_log.h"
#include "vk_swapchain.h"
#include "vk_ui.h"

#include <cstdint>
#include <gtest/gtest.h>

using namespace vkg;

namespace {

// Engine without its own overlay so the test owns the only ImGui context.
class UiOverlayTest : public ::testing::Test {
protected:
    void SetUp() override {
        EngineConfig config{};
        config.hidden_window      = true;
        config.enable_ui          = false;
        config.load_default_scene = false;
        config.validation         = false;
        config.asset_dir          = "/nonexistent";
        engine_.configure(config);
        engine_.configure_window(320, 240, "ui overlay test");
        try {
            engine_.init();
        } catch (const std::exception& e) {
            vkg::log::get()->warn("Engine init failed: {}", e.what());
            engine_.cleanup();
            GTEST_SKIP() << "Vulkan presentation unavailable: " << e.what();
        }
    }

    void TearDown() override {
        if (engine_.context().device != VK_NULL_HANDLE) (void)vkDeviceWaitIdle(engine_.context().device);
        ui_.shutdown();
        if (other_pass_ != VK_NULL_HANDLE) vkDestroyRenderPass(engine_.context().device, other_pass_, nullptr);
        engine_.cleanup();
    }

    VulkanEngine engine_;
    UiSystem ui_;
    VkRenderPass other_pass_{VK_NULL_HANDLE};
};

} // namespace

TEST_F(UiOverlayTest, BackendFollowsRenderPassChange) {
    const SwapchainManager& sc = engine_.swapchain();
    ui_.init(engine_.context(), sc.render_pass(), sc.min_image_count(), sc.image_count());
    ASSERT_TRUE(ui_.initialized());
    EXPECT_EQ(ui_.render_pass(), sc.render_pass());

    const VkFormat other_format = sc.format() == VK_FORMAT_B8G8R8A8_UNORM ? VK_FORMAT_R8G8B8A8_UNORM : VK_FORMAT_B8G8R8A8_UNORM;
    other_pass_                 = create_render_pass(engine_.context().device, other_format, kDepthFormat);
    ASSERT_NE(other_pass_, VkRenderPass{VK_NULL_HANDLE});

    ASSERT_EQ(vkDeviceWaitIdle(engine_.context().device), VK_SUCCESS);
    ui_.set_render_pass(other_pass_);
    EXPECT_TRUE(ui_.initialized());
    EXPECT_EQ(ui_.render_pass(), other_pass_);

    // Same pass again is a no-op.
    ui_.set_render_pass(other_pass_);
    EXPECT_TRUE(ui_.initialized());
    EXPECT_EQ(ui_.render_pass(), other_pass_);
}

TEST(UiSystemState, RenderPassIsRecordedBeforeInit) {
    UiSystem ui;
    EXPECT_FALSE(ui.initialized());
    EXPECT_EQ(ui.render_pass(), VkRenderPass{VK_NULL_HANDLE});
    const auto pass = reinterpret_cast<VkRenderPass>(uintptr_t{0x1234});
    ui.set_render_pass(pass);
    EXPECT_FALSE(ui.initialized());
    EXPECT_EQ(ui.render_pass(), pass);
    ui.shutdown();
    EXPECT_FALSE(ui.initialized());
}
