#include "vk_deletion.h"

#include <ranges>

namespace vkg {

namespace {

template <typename Handle>
void push_if_valid(std::vector<Handle>& list, Handle handle) {
    if (handle != VK_NULL_HANDLE) list.push_back(handle);
}

// Destroy newest-first, then forget.
template <typename Handle, typename Fn>
void drain(std::vector<Handle>& list, Fn&& destroy) {
    for (auto& h : std::ranges::reverse_view(list)) destroy(h);
    list.clear();
}

} // namespace

void DeletionQueue::push(const AllocatedBuffer& buffer) {
    if (buffer.valid()) buffers_.push_back(buffer);
}
void DeletionQueue::push(const AllocatedImage& image) {
    if (image.valid()) images_.push_back(image);
}
void DeletionQueue::push(VkImageView view) { push_if_valid(image_views_, view); }
void DeletionQueue::push(VkPipelineLayout layout) { push_if_valid(pipeline_layouts_, layout); }
void DeletionQueue::push(VkDescriptorSetLayout layout) { push_if_valid(set_layouts_, layout); }
void DeletionQueue::push(VkDescriptorPool pool) { push_if_valid(descriptor_pools_, pool); }
void DeletionQueue::push(VkSampler sampler) { push_if_valid(samplers_, sampler); }
void DeletionQueue::push(VkFence fence) { push_if_valid(fences_, fence); }
void DeletionQueue::push(VkSemaphore semaphore) { push_if_valid(semaphores_, semaphore); }
void DeletionQueue::push(VkCommandPool pool) { push_if_valid(command_pools_, pool); }

void DeletionQueue::flush(VkDevice device, VmaAllocator allocator) {
    const DeletionDispatch& d = dispatch_;
    drain(buffers_, [&](const AllocatedBuffer& b) { d.destroy_buffer(allocator, b.buffer, b.allocation); });
    drain(images_, [&](const AllocatedImage& i) { d.destroy_image(allocator, i.image, i.allocation); });
    drain(image_views_, [&](VkImageView h) { d.destroy_image_view(device, h, nullptr); });
    drain(pipeline_layouts_, [&](VkPipelineLayout h) { d.destroy_pipeline_layout(device, h, nullptr); });
    drain(set_layouts_, [&](VkDescriptorSetLayout h) { d.destroy_descriptor_set_layout(device, h, nullptr); });
    drain(descriptor_pools_, [&](VkDescriptorPool h) { d.destroy_descriptor_pool(device, h, nullptr); });
    drain(samplers_, [&](VkSampler h) { d.destroy_sampler(device, h, nullptr); });
    drain(fences_, [&](VkFence h) { d.destroy_fence(device, h, nullptr); });
    drain(semaphores_, [&](VkSemaphore h) { d.destroy_semaphore(device, h, nullptr); });
    drain(command_pools_, [&](VkCommandPool h) { d.destroy_command_pool(device, h, nullptr); });
}

size_t DeletionQueue::size() const {
    return buffers_.size() + images_.size() + image_views_.size() + pipeline_layouts_.size() + set_layouts_.size() + descriptor_pools_.size() + samplers_.size() + fences_.size() + semaphores_.size() + command_pools_.size();
}

} // namespace vkg
