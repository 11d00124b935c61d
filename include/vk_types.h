// ============================================================================
// vkguide renderer - Shared Vulkan types & error helpers
// Small POD handle pairs used across the engine (buffers, images), the frame
// overlap constant, and the VK_CHECK / REQUIRE_TRUE error macros. Every
// failing Vulkan call surfaces as a vkg::VulkanError carrying its VkResult so
// callers can tell a timed-out wait apart from a lost device.
// ============================================================================
#ifndef VKGUIDE_VK_TYPES_H
#define VKGUIDE_VK_TYPES_H

#include "vk_mem_alloc.h"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vulkan/vulkan.h>

namespace vkg {

// Number of frames-in-flight (double buffering for CPU frame overlap)
inline constexpr unsigned int FRAME_OVERLAP = 2;

// GPU buffer + its VMA backing. allocation is non-null iff buffer is non-null.
struct AllocatedBuffer {
    VkBuffer buffer{VK_NULL_HANDLE};     // Vulkan buffer handle
    VmaAllocation allocation{nullptr};   // VMA allocation handle

    [[nodiscard]] bool valid() const { return buffer != VK_NULL_HANDLE; }
};

// GPU image + its VMA backing. Same ownership rule as AllocatedBuffer.
struct AllocatedImage {
    VkImage image{VK_NULL_HANDLE};       // Vulkan image handle
    VmaAllocation allocation{nullptr};   // VMA allocation handle

    [[nodiscard]] bool valid() const { return image != VK_NULL_HANDLE; }
};

// ----------------------------------------------------------------------------
// VulkanError
// Thrown by VK_CHECK. Keeps the raw VkResult so the frame loop can separate
// timeouts (VK_TIMEOUT / VK_NOT_READY) from device loss.
// ----------------------------------------------------------------------------
class VulkanError : public std::runtime_error {
public:
    VulkanError(VkResult result, const std::string& what_failed);

    [[nodiscard]] VkResult result() const noexcept { return result_; }
    [[nodiscard]] bool is_timeout() const noexcept { return result_ == VK_TIMEOUT || result_ == VK_NOT_READY; }
    [[nodiscard]] bool is_device_lost() const noexcept { return result_ == VK_ERROR_DEVICE_LOST; }
    [[nodiscard]] bool is_out_of_date() const noexcept { return result_ == VK_ERROR_OUT_OF_DATE_KHR; }

private:
    VkResult result_;
};

} // namespace vkg

// ============================================================================
// Utility Macros
// VK_CHECK               : Throws vkg::VulkanError on non-success VkResult.
// IF_NOT_NULL_DO         : Execute statement if pointer / handle non-null.
// IF_NOT_NULL_DO_AND_SET : Execute statement then overwrite handle with value.
// REQUIRE_TRUE           : Runtime check that throws with message.
// ============================================================================
#ifndef VK_CHECK
#define VK_CHECK(x) do { VkResult _vk_check_res = (x); if (_vk_check_res != VK_SUCCESS) { throw ::vkg::VulkanError(_vk_check_res, #x); } } while (false)
#endif
#ifndef IF_NOT_NULL_DO
#define IF_NOT_NULL_DO(ptr, stmt) do { if ((ptr) != nullptr) { stmt; } } while (false)
#endif
#ifndef IF_NOT_NULL_DO_AND_SET
#define IF_NOT_NULL_DO_AND_SET(ptr, stmt, val) do { if ((ptr) != nullptr) { stmt; (ptr) = (val); } } while (false)
#endif
#ifndef REQUIRE_TRUE
#define REQUIRE_TRUE(expr, msg) do { if (!(expr)) { throw std::runtime_error(std::string("Check failed: ") + #expr + " | " + (msg)); } } while (false)
#endif

#endif // VKGUIDE_VK_TYPES_H
