// ============================================================================
// vkguide renderer - Mesh / Texture Upload Pipeline
// Synchronous staging uploads: data goes into a CPU-visible staging buffer,
// a one-shot command buffer copies it into GPU-only memory, and the call
// blocks on a dedicated fence before the staging buffer is released.
// The command pool is separate from the per-frame pools.
// ============================================================================
#ifndef VKGUIDE_VK_UPLOAD_H
#define VKGUIDE_VK_UPLOAD_H

#include "vk_allocator.h"
#include "vk_mesh.h"
#include <cstddef>
#include <functional>
#include <vector>

namespace vkg {

struct DeviceContext;

class UploadContext {
public:
    void init(const DeviceContext& ctx, const ResourceAllocator& allocator, uint64_t timeout_ns);
    void destroy();

    // Begin a one-time command buffer, let 'record' fill it, submit it to the
    // graphics queue and wait on the upload fence. A wait that exceeds the
    // timeout throws VulkanError with is_timeout() set, after the graphics
    // queue has been drained so the caller may release what the copy used.
    void immediate_submit(const std::function<void(VkCommandBuffer)>& record) const;

    // Copy 'size' bytes into a new GPU-only buffer with 'usage | TRANSFER_DST'.
    [[nodiscard]] AllocatedBuffer upload_buffer(const void* data, size_t size, VkBufferUsageFlags usage) const;

    // RGBA8 pixels into a new sampled image left in SHADER_READ_ONLY_OPTIMAL.
    [[nodiscard]] AllocatedImage upload_image(const CpuImage& image, VkFormat format) const;

    // Copy a GPU buffer (needs TRANSFER_SRC usage) back to host memory.
    [[nodiscard]] std::vector<std::byte> read_back_buffer(VkBuffer buffer, size_t size) const;

    [[nodiscard]] uint64_t submit_count() const { return submit_count_; }
    [[nodiscard]] uint64_t timeout_ns() const { return timeout_ns_; }
    void set_timeout_ns(uint64_t timeout_ns) { timeout_ns_ = timeout_ns; }

private:
    const DeviceContext* ctx_{nullptr};
    ResourceAllocator allocator_{};
    uint64_t timeout_ns_{0};
    VkCommandPool pool_{};
    VkCommandBuffer cmd_{};
    VkFence fence_{};
    mutable uint64_t submit_count_{0};
};

} // namespace vkg

#endif // VKGUIDE_VK_UPLOAD_H
