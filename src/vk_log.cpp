#include "vk_log.h"
#include "vk_config.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace vkg::log {

namespace {
constexpr const char* kLoggerName = "vkguide";
}

std::shared_ptr<spdlog::logger> get() {
    if (auto existing = spdlog::get(kLoggerName)) return existing;
    auto logger = spdlog::stdout_color_mt(kLoggerName);
    logger->set_pattern("%^[%H:%M:%S.%e] [%l]%$ %v");
    return logger;
}

void init(const EngineConfig& config) {
    auto logger = get();
    logger->set_level(level_from_name(config.log_level));
    logger->flush_on(spdlog::level::warn);
}

spdlog::level::level_enum level_from_name(std::string_view name) {
    // from_str maps unknown names to off; only an explicit "off" disables logging.
    const spdlog::level::level_enum level = spdlog::level::from_str(std::string(name));
    if (level == spdlog::level::off && name != "off") return spdlog::level::info;
    return level;
}

VKAPI_ATTR VkBool32 VKAPI_CALL debug_callback(VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT type, const VkDebugUtilsMessengerCallbackDataEXT* data, void*) {
    const char* kind = (type & VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT) ? "validation"
                     : (type & VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT) ? "performance"
                                                                                 : "general";
    const char* msg = (data && data->pMessage) ? data->pMessage : "(null)";
    auto logger = get();
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) logger->error("[vk:{}] {}", kind, msg);
    else if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) logger->warn("[vk:{}] {}", kind, msg);
    else if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT) logger->debug("[vk:{}] {}", kind, msg);
    else logger->trace("[vk:{}] {}", kind, msg);
    return VK_FALSE;
}

} // namespace vkg::log
