// ============================================================================
// vkguide renderer - Device / Context Bootstrap
// Instance, debug messenger, surface, physical + logical device, queues and the
// VMA allocator, built through vk-bootstrap. A null window yields a headless
// context (no surface, no present support) for upload tests and tools.
// ============================================================================
#ifndef VKGUIDE_VK_CONTEXT_H
#define VKGUIDE_VK_CONTEXT_H

#include "vk_types.h"
#include <SDL3/SDL.h>
#include <string>

namespace vkg {

struct EngineConfig;

// Vulkan version requested from the instance and the device and handed to
// VMA and the ImGui backend. VkPhysicalDeviceVulkan11Features needs 1.2.
inline constexpr uint32_t kVulkanApiVersion = VK_API_VERSION_1_2;

struct DeviceContext {
    VkInstance instance{};                       // Vulkan instance
    VkDebugUtilsMessengerEXT debug_messenger{};  // Debug messenger (validation only)
    SDL_Window* window{nullptr};                 // Borrowed; owned by the engine
    VkSurfaceKHR surface{};                      // Presentation surface (null when headless)
    VkPhysicalDevice physical{};                 // Chosen physical device
    VkDevice device{};                           // Logical device
    VkQueue graphics_queue{};                    // Graphics queue
    VkQueue present_queue{};                     // Present queue (same as graphics)
    uint32_t graphics_queue_family{};            // Graphics queue family index
    uint32_t present_queue_family{};             // Present queue family index
    VmaAllocator allocator{};                    // VMA allocator
    VkDeviceSize min_uniform_alignment{0};       // minUniformBufferOffsetAlignment
    std::string device_name;                     // For logs / HUD

    [[nodiscard]] bool headless() const { return surface == VK_NULL_HANDLE; }
};

// Build every device-level object. Throws VulkanError / std::runtime_error on
// any failure; objects created before the failure are released first.
DeviceContext create_device_context(const EngineConfig& config, SDL_Window* window);

// Reverse of create_device_context. Safe on a partially filled context.
void destroy_device_context(DeviceContext& ctx);

} // namespace vkg

#endif // VKGUIDE_VK_CONTEXT_H
