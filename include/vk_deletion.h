// ============================================================================
// vkguide renderer - Deferred Deletion Queues
// Records GPU handles at creation time and destroys them all at once when the
// device is known to be idle. One typed list per engine-lifetime handle kind
// so flush() can release them in dependency order: allocator-backed memory
// first, then the plain API objects, each list newest-first. Pipelines and
// swapchain targets are rebuilt on resize and owned by their managers.
// ============================================================================
#ifndef VKGUIDE_VK_DELETION_H
#define VKGUIDE_VK_DELETION_H

#include "vk_types.h"
#include <cstddef>
#include <vector>

namespace vkg {

// ----------------------------------------------------------------------------
// DeletionDispatch
// Destroy entry points used by flush(). Defaults to the real Vulkan / VMA
// functions; tests swap in counters.
// ----------------------------------------------------------------------------
struct DeletionDispatch {
    void (*destroy_buffer)(VmaAllocator, VkBuffer, VmaAllocation){vmaDestroyBuffer};
    void (*destroy_image)(VmaAllocator, VkImage, VmaAllocation){vmaDestroyImage};
    PFN_vkDestroyImageView destroy_image_view{vkDestroyImageView};
    PFN_vkDestroyPipelineLayout destroy_pipeline_layout{vkDestroyPipelineLayout};
    PFN_vkDestroyDescriptorSetLayout destroy_descriptor_set_layout{vkDestroyDescriptorSetLayout};
    PFN_vkDestroyDescriptorPool destroy_descriptor_pool{vkDestroyDescriptorPool};
    PFN_vkDestroySampler destroy_sampler{vkDestroySampler};
    PFN_vkDestroyFence destroy_fence{vkDestroyFence};
    PFN_vkDestroySemaphore destroy_semaphore{vkDestroySemaphore};
    PFN_vkDestroyCommandPool destroy_command_pool{vkDestroyCommandPool};
};

class DeletionQueue {
public:
    DeletionQueue() = default;
    explicit DeletionQueue(const DeletionDispatch& dispatch) : dispatch_(dispatch) {}

    // Null handles are ignored.
    void push(const AllocatedBuffer& buffer);
    void push(const AllocatedImage& image);
    void push(VkImageView view);
    void push(VkPipelineLayout layout);
    void push(VkDescriptorSetLayout layout);
    void push(VkDescriptorPool pool);
    void push(VkSampler sampler);
    void push(VkFence fence);
    void push(VkSemaphore semaphore);
    void push(VkCommandPool pool);

    // Destroy every recorded handle exactly once and clear all lists. Must only
    // be called when no submitted command buffer can still reference them.
    void flush(VkDevice device, VmaAllocator allocator);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const { return size() == 0; }

private:
    DeletionDispatch dispatch_{};
    std::vector<AllocatedBuffer> buffers_;
    std::vector<AllocatedImage> images_;
    std::vector<VkImageView> image_views_;
    std::vector<VkPipelineLayout> pipeline_layouts_;
    std::vector<VkDescriptorSetLayout> set_layouts_;
    std::vector<VkDescriptorPool> descriptor_pools_;
    std::vector<VkSampler> samplers_;
    std::vector<VkFence> fences_;
    std::vector<VkSemaphore> semaphores_;
    std::vector<VkCommandPool> command_pools_;
};

} // namespace vkg

#endif // VKGUIDE_VK_DELETION_H
