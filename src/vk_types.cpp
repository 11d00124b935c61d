#include "vk_types.h"

#include <vulkan/vk_enum_string_helper.h>

namespace vkg {

VulkanError::VulkanError(VkResult result, const std::string& what_failed)
    : std::runtime_error(std::string("Vulkan error ") + string_VkResult(result) + " (" + std::to_string(result) + ") at " + what_failed), result_(result) {}

} // namespace vkg
