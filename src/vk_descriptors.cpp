#include "vk_descriptors.h"

#include <algorithm>

namespace vkg {

DescriptorLayoutBuilder& DescriptorLayoutBuilder::add_binding(uint32_t binding, VkDescriptorType type, VkShaderStageFlags stages) {
    bindings.push_back(VkDescriptorSetLayoutBinding{.binding = binding, .descriptorType = type, .descriptorCount = 1u, .stageFlags = stages, .pImmutableSamplers = nullptr});
    return *this;
}

VkDescriptorSetLayout DescriptorLayoutBuilder::build(VkDevice device) const {
    const VkDescriptorSetLayoutCreateInfo info{.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO, .pNext = nullptr, .flags = 0u, .bindingCount = static_cast<uint32_t>(bindings.size()), .pBindings = bindings.data()};
    VkDescriptorSetLayout layout{};
    VK_CHECK(vkCreateDescriptorSetLayout(device, &info, nullptr, &layout));
    return layout;
}

std::vector<VkDescriptorPoolSize> DescriptorAllocator::pool_sizes(uint32_t maxSets, std::span<const PoolSizeRatio> ratios) {
    maxSets = std::max(1u, maxSets);
    std::vector<VkDescriptorPoolSize> sizes;
    sizes.reserve(ratios.size());
    for (const auto& [type, ratio] : ratios) {
        const uint32_t count = std::max(1u, static_cast<uint32_t>(ratio * static_cast<float>(maxSets)));
        sizes.push_back(VkDescriptorPoolSize{.type = type, .descriptorCount = count});
    }
    return sizes;
}

void DescriptorAllocator::init_pool(VkDevice device, uint32_t maxSets, std::span<const PoolSizeRatio> ratios) {
    maxSets                  = std::max(1u, maxSets);
    const auto sizes         = pool_sizes(maxSets, ratios);
    const VkDescriptorPoolCreateInfo info{.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO, .pNext = nullptr, .flags = 0u, .maxSets = maxSets, .poolSizeCount = static_cast<uint32_t>(sizes.size()), .pPoolSizes = sizes.data()};
    VK_CHECK(vkCreateDescriptorPool(device, &info, nullptr, &pool));
}

VkDescriptorSet DescriptorAllocator::allocate(VkDevice device, VkDescriptorSetLayout layout) const {
    const VkDescriptorSetAllocateInfo ai{.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO, .pNext = nullptr, .descriptorPool = pool, .descriptorSetCount = 1u, .pSetLayouts = &layout};
    VkDescriptorSet ds{};
    VK_CHECK(vkAllocateDescriptorSets(device, &ai, &ds));
    return ds;
}

DescriptorWriter& DescriptorWriter::write_buffer(uint32_t binding, VkBuffer buffer, VkDeviceSize size, VkDeviceSize offset, VkDescriptorType type) {
    const VkDescriptorBufferInfo& info = buffer_infos.emplace_back(VkDescriptorBufferInfo{.buffer = buffer, .offset = offset, .range = size});
    VkWriteDescriptorSet w{};
    w.sType           = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    w.dstBinding      = binding;
    w.descriptorCount = 1u;
    w.descriptorType  = type;
    w.pBufferInfo     = &info;
    writes.push_back(w);
    return *this;
}

DescriptorWriter& DescriptorWriter::write_image(uint32_t binding, VkImageView view, VkSampler sampler, VkImageLayout layout, VkDescriptorType type) {
    const VkDescriptorImageInfo& info = image_infos.emplace_back(VkDescriptorImageInfo{.sampler = sampler, .imageView = view, .imageLayout = layout});
    VkWriteDescriptorSet w{};
    w.sType           = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    w.dstBinding      = binding;
    w.descriptorCount = 1u;
    w.descriptorType  = type;
    w.pImageInfo      = &info;
    writes.push_back(w);
    return *this;
}

void DescriptorWriter::clear() {
    buffer_infos.clear();
    image_infos.clear();
    writes.clear();
}

void DescriptorWriter::update_set(VkDevice device, VkDescriptorSet set) {
    for (auto& w : writes) w.dstSet = set;
    vkUpdateDescriptorSets(device, static_cast<uint32_t>(writes.size()), writes.data(), 0u, nullptr);
}

} // namespace vkg
