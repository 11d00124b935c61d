// ============================================================================
// vkguide renderer - Descriptor & Uniform Layout Manager
// Uniform offset arithmetic for the shared per-frame camera/scene buffer, plus
// small helpers to build descriptor set layouts, allocate sets from a single
// pool and write buffer / image bindings into them.
// ============================================================================
#ifndef VKGUIDE_VK_DESCRIPTORS_H
#define VKGUIDE_VK_DESCRIPTORS_H

#include "vk_types.h"
#include <deque>
#include <span>
#include <vector>

namespace vkg {

// Round 'size' up to a multiple of 'alignment' (a power of two). An alignment
// of 0 returns 'size' unchanged.
constexpr VkDeviceSize pad_uniform_buffer_size(VkDeviceSize size, VkDeviceSize alignment) {
    if (alignment == 0) return size;
    return (size + alignment - 1) & ~(alignment - 1);
}

// ----------------------------------------------------------------------------
// FrameUniformLayout
// One buffer holds 'frames' camera blocks followed by 'frames' scene blocks,
// each padded to the device's minUniformBufferOffsetAlignment:
//   [cam 0][cam 1]...[cam N-1][scene 0][scene 1]...[scene N-1]
// ----------------------------------------------------------------------------
struct FrameUniformLayout {
    VkDeviceSize camera_stride{0};
    VkDeviceSize scene_stride{0};
    uint32_t frames{FRAME_OVERLAP};

    static FrameUniformLayout make(VkDeviceSize camera_size, VkDeviceSize scene_size, VkDeviceSize min_alignment, uint32_t frames = FRAME_OVERLAP) {
        return FrameUniformLayout{pad_uniform_buffer_size(camera_size, min_alignment), pad_uniform_buffer_size(scene_size, min_alignment), frames};
    }

    [[nodiscard]] VkDeviceSize camera_offset(uint32_t frame) const { return camera_stride * frame; }
    [[nodiscard]] VkDeviceSize scene_base() const { return camera_stride * frames; }
    [[nodiscard]] VkDeviceSize scene_offset(uint32_t frame) const { return scene_base() + scene_stride * frame; }
    [[nodiscard]] VkDeviceSize total_size() const { return scene_base() + scene_stride * frames; }
};

// ----------------------------------------------------------------------------
// DescriptorLayoutBuilder
// ----------------------------------------------------------------------------
struct DescriptorLayoutBuilder {
    std::vector<VkDescriptorSetLayoutBinding> bindings;

    DescriptorLayoutBuilder& add_binding(uint32_t binding, VkDescriptorType type, VkShaderStageFlags stages);
    void clear() { bindings.clear(); }
    [[nodiscard]] VkDescriptorSetLayout build(VkDevice device) const;
};

// ----------------------------------------------------------------------------
// DescriptorAllocator
// Single VkDescriptorPool sized from per-type ratios. Call init_pool() once,
// then allocate() sets from it. The pool itself is released by whoever owns
// the deletion queue it is pushed to.
// ----------------------------------------------------------------------------
struct DescriptorAllocator {
    struct PoolSizeRatio {
        VkDescriptorType type;  // Descriptor type (e.g. VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER)
        float ratio;            // Descriptors of this type per set
    };
    VkDescriptorPool pool{};

    // descriptorCount = max(1, ratio * maxSets) per entry.
    static std::vector<VkDescriptorPoolSize> pool_sizes(uint32_t maxSets, std::span<const PoolSizeRatio> ratios);

    void init_pool(VkDevice device, uint32_t maxSets, std::span<const PoolSizeRatio> ratios);
    [[nodiscard]] VkDescriptorSet allocate(VkDevice device, VkDescriptorSetLayout layout) const;
};

// ----------------------------------------------------------------------------
// DescriptorWriter
// Collects writes, then applies them to one set with vkUpdateDescriptorSets.
// ----------------------------------------------------------------------------
struct DescriptorWriter {
    std::deque<VkDescriptorBufferInfo> buffer_infos;  // deque: stable addresses
    std::deque<VkDescriptorImageInfo> image_infos;
    std::vector<VkWriteDescriptorSet> writes;

    DescriptorWriter& write_buffer(uint32_t binding, VkBuffer buffer, VkDeviceSize size, VkDeviceSize offset, VkDescriptorType type);
    DescriptorWriter& write_image(uint32_t binding, VkImageView view, VkSampler sampler, VkImageLayout layout, VkDescriptorType type);
    void clear();
    void update_set(VkDevice device, VkDescriptorSet set);
};

} // namespace vkg

#endif // VKGUIDE_VK_DESCRIPTORS_H
