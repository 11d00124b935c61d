#include "vk_engine.h"
#include "vk_log.h"

#include <SDL3/SDL.h>
#include <gtest/gtest.h>

using namespace vkg;

namespace {

// Hidden window, no UI, empty scene except what the test adds. Skips when
// SDL cannot open a video driver or no Vulkan device supports presentation.
class EngineFramesTest : public ::testing::Test {
protected:
    void SetUp() override {
        EngineConfig config{};
        config.hidden_window      = true;
        config.enable_ui          = false;
        config.load_default_scene = false;
        config.validation         = false;
        config.asset_dir          = "/nonexistent";
        engine_.configure(config);
        engine_.configure_window(320, 240, "engine frames test");
        try {
            engine_.init();
        } catch (const std::exception& e) {
            vkg::log::get()->warn("Engine init failed: {}", e.what());
            engine_.cleanup();
            GTEST_SKIP() << "Vulkan presentation unavailable: " << e.what();
        }
    }

    void TearDown() override { engine_.cleanup(); }

    uint32_t add_triangle() {
        Mesh* mesh         = engine_.scene().get_mesh("triangle");
        Material* material = engine_.scene().get_material("defaultmesh");
        EXPECT_NE(mesh, nullptr);
        EXPECT_NE(material, nullptr);
        return engine_.scene().add_renderable(mesh, material, make_identity());
    }

    VulkanEngine engine_;
};

} // namespace

TEST_F(EngineFramesTest, TriangleMeshIsAlwaysUploaded) {
    const Mesh* mesh = engine_.scene().get_mesh("triangle");
    ASSERT_NE(mesh, nullptr);
    EXPECT_TRUE(mesh->vertex_buffer.valid());
    EXPECT_EQ(mesh->vertex_count(), 3u);
    EXPECT_EQ(engine_.scene().get_mesh("monkey"), nullptr);
}

TEST_F(EngineFramesTest, FrameCounterAdvancesEveryFrame) {
    add_triangle();
    try {
        engine_.render_frames(10);
    } catch (const VulkanError& e) {
        if (e.is_timeout()) GTEST_SKIP() << "GPU too slow: " << e.what();
        throw;
    }
    EXPECT_EQ(engine_.frame_number(), 10u);
}

TEST_F(EngineFramesTest, BothSlotFencesSignalAfterIdle) {
    add_triangle();
    try {
        engine_.render_frames(10);
    } catch (const VulkanError& e) {
        if (e.is_timeout()) GTEST_SKIP() << "GPU too slow: " << e.what();
        throw;
    }
    ASSERT_EQ(vkDeviceWaitIdle(engine_.context().device), VK_SUCCESS);
    for (uint32_t slot = 0; slot < FRAME_OVERLAP; ++slot) EXPECT_TRUE(engine_.frame_fence_signaled(slot)) << "slot " << slot;
}

TEST_F(EngineFramesTest, SingleRenderableDrawsWithOneBindEach) {
    add_triangle();
    if (!engine_.render_frame()) GTEST_SKIP() << "frame skipped (swapchain out of date)";
    const DrawStats& stats = engine_.draw_stats();
    EXPECT_EQ(stats.draws, 1u);
    EXPECT_EQ(stats.pipeline_binds, 1u);
    EXPECT_EQ(stats.vertex_buffer_binds, 1u);
    EXPECT_EQ(stats.triangles, 1u);
}

TEST_F(EngineFramesTest, TexturedAndUntexturedObjectsRenderTogether) {
    CpuImage checker{};
    checker.width  = 8;
    checker.height = 8;
    checker.pixels.resize(8u * 8u * 4u);
    for (size_t i = 0; i < checker.pixels.size(); ++i) checker.pixels[i] = std::byte{static_cast<unsigned char>((i / 4) % 2 ? 0xff : 0x20)};

    Mesh& quad         = engine_.upload_mesh("quad", make_triangle_vertices());
    Texture& texture   = engine_.upload_texture("checker", checker);
    Material& textured = engine_.create_textured_material("checkered", "checker");
    EXPECT_TRUE(texture.image.valid());
    EXPECT_NE(textured.texture_set, VkDescriptorSet{VK_NULL_HANDLE});

    add_triangle();
    engine_.scene().add_renderable(&quad, &textured, make_translation(make_float3(1.0f, 0.0f, 0.0f)));

    try {
        engine_.render_frames(10);
    } catch (const VulkanError& e) {
        if (e.is_timeout()) GTEST_SKIP() << "GPU too slow: " << e.what();
        throw;
    }
    EXPECT_EQ(engine_.frame_number(), 10u);
    ASSERT_EQ(vkDeviceWaitIdle(engine_.context().device), VK_SUCCESS);
    for (uint32_t slot = 0; slot < FRAME_OVERLAP; ++slot) EXPECT_TRUE(engine_.frame_fence_signaled(slot)) << "slot " << slot;

    const DrawStats& stats = engine_.draw_stats();
    if (stats.draws == 0u) GTEST_SKIP() << "last frame skipped (swapchain out of date)";
    EXPECT_EQ(stats.draws, 2u);
    EXPECT_EQ(stats.pipeline_binds, 2u);
    EXPECT_EQ(stats.vertex_buffer_binds, 2u);
    EXPECT_EQ(stats.texture_binds, 1u);
}

TEST_F(EngineFramesTest, UniformLayoutFollowsDeviceAlignment) {
    const FrameUniformLayout& layout = engine_.uniform_layout();
    const VkDeviceSize alignment     = engine_.context().min_uniform_alignment;
    EXPECT_EQ(layout.camera_stride % alignment, 0u);
    EXPECT_EQ(layout.scene_offset(0) % alignment, 0u);
    EXPECT_GE(layout.camera_stride, sizeof(GPUCameraData));
}

TEST_F(EngineFramesTest, CleanupTwiceIsSafe) {
    engine_.cleanup();
    EXPECT_NO_THROW(engine_.cleanup());
}

namespace {

SDL_Event pixel_size_event(int width, int height) {
    SDL_Event e{};
    e.type         = SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED;
    e.window.data1 = width;
    e.window.data2 = height;
    return e;
}

} // namespace

TEST(EngineEvents, PixelSizeChangeRestoresMinimizedWindow) {
    VulkanEngine engine;
    engine.state_.minimized = true;
    engine.handle_event(pixel_size_event(800, 600));
    EXPECT_FALSE(engine.state_.minimized);
    EXPECT_TRUE(engine.state_.resize_requested);
}

TEST(EngineEvents, ZeroPixelSizeCountsAsMinimized) {
    VulkanEngine engine;
    engine.handle_event(pixel_size_event(800, 0));
    EXPECT_TRUE(engine.state_.minimized);
    EXPECT_TRUE(engine.state_.resize_requested);
}

TEST(EngineEvents, MinimizeAndRestoreToggleState) {
    VulkanEngine engine;
    SDL_Event e{};
    e.type = SDL_EVENT_WINDOW_MINIMIZED;
    engine.handle_event(e);
    EXPECT_TRUE(engine.state_.minimized);
    e.type = SDL_EVENT_WINDOW_RESTORED;
    engine.handle_event(e);
    EXPECT_FALSE(engine.state_.minimized);
    EXPECT_FALSE(engine.state_.resize_requested);
}

TEST(EngineEvents, QuitStopsTheLoop) {
    VulkanEngine engine;
    engine.state_.running = true;
    SDL_Event e{};
    e.type = SDL_EVENT_QUIT;
    engine.handle_event(e);
    EXPECT_FALSE(engine.state_.running);
}
