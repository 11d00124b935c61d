// ============================================================================
// vkguide renderer - Engine configuration
// Plain settings struct consumed by VulkanEngine::init(). Defaults come from
// compile-time paths baked in by the build; a handful of VKG_* environment
// variables may override them. No command-line parsing lives here.
// ============================================================================
#ifndef VKGUIDE_VK_CONFIG_H
#define VKGUIDE_VK_CONFIG_H

#include <cstdint>
#include <string>

#ifndef SHADER_OUTPUT_DIR
#define SHADER_OUTPUT_DIR "shaders"
#endif
#ifndef VKG_ASSET_DIR
#define VKG_ASSET_DIR "assets"
#endif

namespace vkg {

struct EngineConfig {
    std::string name = "Vulkan Engine";        // Window / application title
    int width{1600};                           // Initial window width (logical units)
    int height{900};                           // Initial window height (logical units)
    bool vsync{true};                          // FIFO/MAILBOX when true, IMMEDIATE preferred when false
    bool triple_buffer{false};                 // Prefer MAILBOX when vsync is on
#ifdef NDEBUG
    bool validation{false};                    // Request Khronos validation layer
#else
    bool validation{true};
#endif
    bool enable_ui{true};                      // Create the ImGui overlay
    bool load_default_scene{true};             // Load monkey/triangle grid/empire on init
    bool hidden_window{false};                 // Create the SDL window hidden (tests)
    std::string asset_dir = VKG_ASSET_DIR;     // OBJ / image assets
    std::string shader_dir = SHADER_OUTPUT_DIR; // Compiled *.spv files
    uint64_t frame_timeout_ns{1'000'000'000};  // Fence wait + acquire timeout
    uint64_t upload_timeout_ns{10'000'000'000}; // immediate_submit fence timeout
    uint32_t max_objects{10'000};              // Capacity of each per-frame object buffer
    std::string log_level = "info";            // spdlog level name

    // Override fields from VKG_VSYNC, VKG_VALIDATION, VKG_LOG_LEVEL,
    // VKG_ASSET_DIR and VKG_SHADER_DIR when they are set.
    void apply_environment();
};

// "1", "true", "on", "yes" (any case) -> true; "0", "false", "off", "no" -> false.
// Anything else leaves 'out' untouched and returns false.
bool parse_bool_flag(const std::string& text, bool& out);

} // namespace vkg

#endif // VKGUIDE_VK_CONFIG_H
