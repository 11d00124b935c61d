// ============================================================================
// vkguide renderer - Resource Allocator Facade
// Wraps a VmaAllocator: creates / destroys GPU buffers and images with a usage
// mask and a residency hint, and maps CPU-visible memory. Not thread-safe;
// used from the single render thread during setup, draw and teardown.
// ============================================================================
#ifndef VKGUIDE_VK_ALLOCATOR_H
#define VKGUIDE_VK_ALLOCATOR_H

#include "vk_types.h"
#include <cstddef>

namespace vkg {

// Where the memory should live.
enum class MemoryResidency : uint8_t {
    GpuOnly,   // Device-local, not mappable (final vertex buffers, textures, depth)
    CpuOnly,   // Host-visible, coherent (staging / readback)
    CpuToGpu,  // Host-visible, preferably device-local (per-frame uniforms & storage)
};

VmaMemoryUsage to_vma_usage(MemoryResidency residency);

class ResourceAllocator {
public:
    ResourceAllocator() = default;
    explicit ResourceAllocator(VmaAllocator allocator) : allocator_(allocator) {}

    // Allocate a buffer of at least 'size' bytes. Throws VulkanError on failure.
    [[nodiscard]] AllocatedBuffer create_buffer(VkDeviceSize size, VkBufferUsageFlags usage, MemoryResidency residency) const;

    // Allocate an image described by 'info'. Throws VulkanError on failure.
    [[nodiscard]] AllocatedImage create_image(const VkImageCreateInfo& info, MemoryResidency residency) const;

    // Release handle + allocation together and reset the struct. Empty input is a no-op.
    void destroy_buffer(AllocatedBuffer& buffer) const;
    void destroy_image(AllocatedImage& image) const;

    // Map / unmap a host-visible allocation.
    [[nodiscard]] void* map(const AllocatedBuffer& buffer) const;
    void unmap(const AllocatedBuffer& buffer) const;

    // map + memcpy at byte 'offset' + unmap. Memory is coherent, no flush needed.
    void write(const AllocatedBuffer& buffer, const void* data, size_t size, size_t offset = 0) const;

    [[nodiscard]] VmaAllocator handle() const { return allocator_; }

private:
    VmaAllocator allocator_{nullptr};
};

} // namespace vkg

#endif // VKGUIDE_VK_ALLOCATOR_H
