#include "vk_allocator.h"

// --- VMA implementation lives in this translation unit; silence its warnings
#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wunused-parameter"
#pragma clang diagnostic ignored "-Wunused-variable"
#pragma clang diagnostic ignored "-Wnullability-completeness"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#pragma GCC diagnostic ignored "-Wtype-limits"
#pragma GCC diagnostic ignored "-Wmaybe-uninitialized"
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#endif
#define VMA_IMPLEMENTATION
#include "vk_mem_alloc.h"
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <cstring>

namespace vkg {

VmaMemoryUsage to_vma_usage(MemoryResidency residency) {
    switch (residency) {
        case MemoryResidency::GpuOnly: return VMA_MEMORY_USAGE_GPU_ONLY;
        case MemoryResidency::CpuOnly: return VMA_MEMORY_USAGE_CPU_ONLY;
        case MemoryResidency::CpuToGpu: return VMA_MEMORY_USAGE_CPU_TO_GPU;
    }
    return VMA_MEMORY_USAGE_UNKNOWN;
}

AllocatedBuffer ResourceAllocator::create_buffer(VkDeviceSize size, VkBufferUsageFlags usage, MemoryResidency residency) const {
    const VkBufferCreateInfo bci{.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO,
        .pNext                          = nullptr,
        .flags                          = 0u,
        .size                           = size,
        .usage                          = usage,
        .sharingMode                    = VK_SHARING_MODE_EXCLUSIVE,
        .queueFamilyIndexCount          = 0u,
        .pQueueFamilyIndices            = nullptr};
    VmaAllocationCreateInfo aci{};
    aci.usage = to_vma_usage(residency);

    AllocatedBuffer out{};
    VK_CHECK(vmaCreateBuffer(allocator_, &bci, &aci, &out.buffer, &out.allocation, nullptr));
    return out;
}

AllocatedImage ResourceAllocator::create_image(const VkImageCreateInfo& info, MemoryResidency residency) const {
    VmaAllocationCreateInfo aci{};
    aci.usage = to_vma_usage(residency);
    if (residency == MemoryResidency::GpuOnly) aci.requiredFlags = static_cast<VkMemoryPropertyFlags>(VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);

    AllocatedImage out{};
    VK_CHECK(vmaCreateImage(allocator_, &info, &aci, &out.image, &out.allocation, nullptr));
    return out;
}

void ResourceAllocator::destroy_buffer(AllocatedBuffer& buffer) const {
    if (!buffer.valid()) return;
    vmaDestroyBuffer(allocator_, buffer.buffer, buffer.allocation);
    buffer = {};
}

void ResourceAllocator::destroy_image(AllocatedImage& image) const {
    if (!image.valid()) return;
    vmaDestroyImage(allocator_, image.image, image.allocation);
    image = {};
}

void* ResourceAllocator::map(const AllocatedBuffer& buffer) const {
    void* data = nullptr;
    VK_CHECK(vmaMapMemory(allocator_, buffer.allocation, &data));
    return data;
}

void ResourceAllocator::unmap(const AllocatedBuffer& buffer) const { vmaUnmapMemory(allocator_, buffer.allocation); }

void ResourceAllocator::write(const AllocatedBuffer& buffer, const void* data, size_t size, size_t offset) const {
    auto* dst = static_cast<std::byte*>(map(buffer));
    std::memcpy(dst + offset, data, size);
    unmap(buffer);
}

} // namespace vkg
