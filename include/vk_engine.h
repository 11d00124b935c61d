// ============================================================================
// vkguide renderer - Frame Manager / Draw Loop
// VulkanEngine owns the device context, the swapchain targets, FRAME_OVERLAP
// in-flight frame slots, the pipelines, the scene table and the optional
// ImGui overlay. Each frame runs WaitPrevious -> Acquire -> Record -> Submit
// -> Present on the slot frame_number % FRAME_OVERLAP.
//
// Typical use:
//   VulkanEngine engine;
//   engine.configure_window(1600, 900, "Vulkan Engine");
//   engine.init(); engine.run(); engine.cleanup();
// ============================================================================
#ifndef VKGUIDE_VK_ENGINE_H
#define VKGUIDE_VK_ENGINE_H

#include "vk_camera.h"
#include "vk_config.h"
#include "vk_context.h"
#include "vk_deletion.h"
#include "vk_descriptors.h"
#include "vk_frame.h"
#include "vk_pipelines.h"
#include "vk_scene.h"
#include "vk_swapchain.h"
#include "vk_upload.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vkg {

class UiSystem;

// Sampled texture plus the set-2 descriptor that binds it.
struct Texture {
    AllocatedImage image{};
    VkImageView view{};
    VkDescriptorSet descriptor{};
};

class VulkanEngine {
public:
    VulkanEngine();
    ~VulkanEngine();
    VulkanEngine(const VulkanEngine&)            = delete;
    VulkanEngine& operator=(const VulkanEngine&) = delete;

    // Must be called before init().
    void configure_window(int width, int height, const char* title);
    void configure(const EngineConfig& config);
    [[nodiscard]] const EngineConfig& config() const { return config_; }

    // Window, device, swapchain, frames, descriptors, pipelines, meshes, scene
    // and UI. Throws on any failure; cleanup() is still safe afterwards.
    void init();

    // Event + frame loop until the window is closed (blocking call).
    void run();

    // One full frame. Returns false when the frame was skipped (swapchain out
    // of date or window minimized); frame_number advances either way.
    bool render_frame();

    // Step mode for tests and tools: pump events and render 'count' frames.
    void render_frames(uint32_t count);

    // Wait idle and destroy everything (safe to call multiple times).
    void cleanup();

    // Apply one SDL event to the engine: quit, minimize / restore, resize,
    // hero keys and camera input.
    void handle_event(const SDL_Event& e);

    // --- Scene helpers ---
    // Upload vertices to a GPU-only buffer and register the mesh under 'name'.
    Mesh& upload_mesh(const std::string& name, std::vector<Vertex> vertices);
    // Upload RGBA8 pixels, create view + set-2 descriptor, register as 'name'.
    Texture& upload_texture(const std::string& name, const CpuImage& image);
    // Material using the textured pipeline bound to a previously uploaded texture.
    Material& create_textured_material(const std::string& name, const std::string& texture);

    // Space: defaultmesh -> redtriangle -> rgbtriangle (missing ones skipped).
    void cycle_hero_material();
    // M: flip the hero between the monkey and the triangle mesh.
    void toggle_hero_mesh();

    // --- Introspection ---
    [[nodiscard]] uint64_t frame_number() const { return state_.frame_number; }
    [[nodiscard]] bool frame_fence_signaled(uint32_t slot) const;
    [[nodiscard]] const DrawStats& draw_stats() const { return stats_; }
    [[nodiscard]] SceneTable& scene() { return scene_; }
    [[nodiscard]] FlyCamera& camera() { return camera_; }
    [[nodiscard]] const DeviceContext& context() const { return ctx_; }
    [[nodiscard]] const SwapchainManager& swapchain() const { return swapchain_; }
    [[nodiscard]] const UploadContext& uploader() const { return upload_; }
    [[nodiscard]] const FrameUniformLayout& uniform_layout() const { return uniform_layout_; }

    // Mutable engine-wide state. Public for debug readability.
    struct {
        bool initialized{false};            // Becomes true after init()
        bool running{false};                // Main loop active flag
        bool resize_requested{false};       // Swapchain recreation flag
        bool minimized{false};              // Window minimized state
        uint64_t frame_number{0};           // Absolute frame counter
        double time_sec{0.0};               // Total accumulated time
        double dt_sec{0.0};                 // Time elapsed since previous frame
        double title_accumulator{0.0};      // Seconds since last title update
        uint32_t selected_shader{0};        // Index into the hero material cycle
        uint32_t selected_mesh{0};          // 0 = monkey, 1 = triangle
        std::optional<uint32_t> hero;       // Renderable id of the hero object
        bool object_overflow_logged{false}; // max_objects warning issued
        std::chrono::steady_clock::time_point last_tick{};
    } state_;

private: // --- Setup (vk_engine.cpp) ---
    void init_window();
    void init_commands();
    void init_sync_structures();
    void init_descriptors();
    void init_pipelines();
    void register_materials();
    void load_meshes();
    void load_images();
    void init_scene();
    void init_imgui();
    void recreate_swapchain();
    void pump_events();
    void advance_time();
    void update_window_title();

private: // --- Per-frame recording (vk_draw.cpp) ---
    FrameData& current_frame() { return frames_[state_.frame_number % FRAME_OVERLAP]; }
    [[nodiscard]] uint32_t current_slot() const { return static_cast<uint32_t>(state_.frame_number % FRAME_OVERLAP); }
    [[nodiscard]] GPUCameraData make_camera_data() const;
    void record_frame(VkCommandBuffer cmd, FrameData& frame, uint32_t image_index);
    uint32_t write_frame_data(FrameData& frame);
    void draw_objects(VkCommandBuffer cmd, FrameData& frame, uint32_t object_count);

private:
    EngineConfig config_{};
    SDL_Window* window_{nullptr};
    bool sdl_initialized_{false};
    DeviceContext ctx_{};
    ResourceAllocator allocator_{};
    SwapchainManager swapchain_{};
    UploadContext upload_{};
    DeletionQueue deletion_{};           // Engine-lifetime objects, flushed after idle

    FrameData frames_[FRAME_OVERLAP]{};
    FrameUniformLayout uniform_layout_{};
    AllocatedBuffer scene_parameter_buffer_{}; // [cam 0..N-1][scene 0..N-1]
    GPUSceneData scene_parameters_{};

    DescriptorAllocator descriptor_allocator_{};
    VkDescriptorSetLayout global_set_layout_{};
    VkDescriptorSetLayout object_set_layout_{};
    VkDescriptorSetLayout texture_set_layout_{};
    VkSampler default_sampler_{};

    PipelineSet pipelines_{};
    SceneTable scene_{};
    std::unordered_map<std::string, Texture> textures_;
    FlyCamera camera_{};
    DrawStats stats_{};

    std::unique_ptr<UiSystem> ui_;
};

} // namespace vkg

#endif // VKGUIDE_VK_ENGINE_H
