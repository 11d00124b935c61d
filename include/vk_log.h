// ============================================================================
// vkguide renderer - Logging
// Thin spdlog setup: one colored stdout logger shared by every engine module,
// plus the debug-utils callback that forwards validation messages into it.
// ============================================================================
#ifndef VKGUIDE_VK_LOG_H
#define VKGUIDE_VK_LOG_H

#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>
#include <vulkan/vulkan.h>

namespace vkg {
struct EngineConfig;
}

namespace vkg::log {

// Create (or reuse) the "vkguide" logger and apply config.log_level.
void init(const EngineConfig& config);

// Logger used by the engine. Lazily created with default settings if init()
// has not run yet (unit tests).
std::shared_ptr<spdlog::logger> get();

// Map a level name ("trace", "debug", "info", "warn", "error", "critical",
// "off") to spdlog. Unknown names resolve to info.
spdlog::level::level_enum level_from_name(std::string_view name);

// VK_EXT_debug_utils callback routing validation output into get().
VKAPI_ATTR VkBool32 VKAPI_CALL debug_callback(VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT type, const VkDebugUtilsMessengerCallbackDataEXT* data, void* user_data);

} // namespace vkg::log

#endif // VKGUIDE_VK_LOG_H
