#include "vk_upload.h"
#include "vk_context.h"
#include "vk_log.h"

#include <cstring>
#include <vulkan/vk_enum_string_helper.h>

namespace vkg {

namespace {

// Staging buffer released on scope exit, after the synchronous copy.
struct ScopedStaging {
    const ResourceAllocator& allocator;
    AllocatedBuffer buffer;

    ScopedStaging(const ResourceAllocator& a, VkDeviceSize size, VkBufferUsageFlags usage) : allocator(a), buffer(a.create_buffer(size, usage, MemoryResidency::CpuOnly)) {}
    ~ScopedStaging() { allocator.destroy_buffer(buffer); }
    ScopedStaging(const ScopedStaging&)            = delete;
    ScopedStaging& operator=(const ScopedStaging&) = delete;
};

VkImageMemoryBarrier layout_barrier(VkImage image, VkImageLayout from, VkImageLayout to, VkAccessFlags src_access, VkAccessFlags dst_access) {
    VkImageMemoryBarrier b{};
    b.sType               = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
    b.srcAccessMask       = src_access;
    b.dstAccessMask       = dst_access;
    b.oldLayout           = from;
    b.newLayout           = to;
    b.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    b.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    b.image               = image;
    b.subresourceRange    = {VK_IMAGE_ASPECT_COLOR_BIT, 0u, 1u, 0u, 1u};
    return b;
}

} // namespace

void UploadContext::init(const DeviceContext& ctx, const ResourceAllocator& allocator, uint64_t timeout_ns) {
    ctx_        = &ctx;
    allocator_  = allocator;
    timeout_ns_ = timeout_ns;

    const VkCommandPoolCreateInfo pci{.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO, .pNext = nullptr, .flags = 0u, .queueFamilyIndex = ctx.graphics_queue_family};
    VK_CHECK(vkCreateCommandPool(ctx.device, &pci, nullptr, &pool_));
    const VkCommandBufferAllocateInfo ai{.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO, .pNext = nullptr, .commandPool = pool_, .level = VK_COMMAND_BUFFER_LEVEL_PRIMARY, .commandBufferCount = 1u};
    VK_CHECK(vkAllocateCommandBuffers(ctx.device, &ai, &cmd_));
    const VkFenceCreateInfo fci{.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO, .pNext = nullptr, .flags = 0u};
    VK_CHECK(vkCreateFence(ctx.device, &fci, nullptr, &fence_));
}

void UploadContext::destroy() {
    if (ctx_ == nullptr) return;
    IF_NOT_NULL_DO_AND_SET(fence_, vkDestroyFence(ctx_->device, fence_, nullptr), VK_NULL_HANDLE);
    IF_NOT_NULL_DO_AND_SET(pool_, vkDestroyCommandPool(ctx_->device, pool_, nullptr), VK_NULL_HANDLE);
    cmd_ = VK_NULL_HANDLE;
}

void UploadContext::immediate_submit(const std::function<void(VkCommandBuffer)>& record) const {
    REQUIRE_TRUE(cmd_ != VK_NULL_HANDLE, "UploadContext used before init()");
    const VkDevice device = ctx_->device;

    const VkCommandBufferBeginInfo bi{.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO, .pNext = nullptr, .flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT, .pInheritanceInfo = nullptr};
    VK_CHECK(vkBeginCommandBuffer(cmd_, &bi));
    record(cmd_);
    VK_CHECK(vkEndCommandBuffer(cmd_));

    VkSubmitInfo si{};
    si.sType              = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    si.commandBufferCount = 1u;
    si.pCommandBuffers    = &cmd_;
    VK_CHECK(vkQueueSubmit(ctx_->graphics_queue, 1u, &si, fence_));

    ++submit_count_;

    const VkResult wait = vkWaitForFences(device, 1u, &fence_, VK_TRUE, timeout_ns_);
    if (wait != VK_SUCCESS) {
        // The copy may still be executing. Drain the queue before the caller
        // unwinds and frees the staging / destination resources it touches,
        // and leave the command buffer and fence reusable.
        log::get()->error("Upload wait failed ({}), draining the graphics queue", string_VkResult(wait));
        if (const VkResult idle = vkQueueWaitIdle(ctx_->graphics_queue); idle == VK_SUCCESS) {
            VK_CHECK(vkResetFences(device, 1u, &fence_));
            VK_CHECK(vkResetCommandPool(device, pool_, 0u));
        } else {
            log::get()->critical("vkQueueWaitIdle failed after upload timeout: {}", string_VkResult(idle));
        }
        throw VulkanError(wait, "vkWaitForFences(upload fence)");
    }
    VK_CHECK(vkResetFences(device, 1u, &fence_));
    VK_CHECK(vkResetCommandPool(device, pool_, 0u));
}

AllocatedBuffer UploadContext::upload_buffer(const void* data, size_t size, VkBufferUsageFlags usage) const {
    ScopedStaging staging(allocator_, size, VK_BUFFER_USAGE_TRANSFER_SRC_BIT);
    allocator_.write(staging.buffer, data, size);

    AllocatedBuffer dst = allocator_.create_buffer(size, usage | VK_BUFFER_USAGE_TRANSFER_DST_BIT, MemoryResidency::GpuOnly);
    try {
        immediate_submit([&](VkCommandBuffer cmd) {
            const VkBufferCopy copy{.srcOffset = 0u, .dstOffset = 0u, .size = size};
            vkCmdCopyBuffer(cmd, staging.buffer.buffer, dst.buffer, 1u, &copy);
        });
    } catch (const std::exception&) {
        allocator_.destroy_buffer(dst);
        throw;
    }
    return dst;
}

AllocatedImage UploadContext::upload_image(const CpuImage& image, VkFormat format) const {
    REQUIRE_TRUE(image.width > 0 && image.height > 0, "empty image");
    REQUIRE_TRUE(image.byte_size() == static_cast<size_t>(image.width) * image.height * 4u, "image data is not RGBA8");

    ScopedStaging staging(allocator_, image.byte_size(), VK_BUFFER_USAGE_TRANSFER_SRC_BIT);
    allocator_.write(staging.buffer, image.pixels.data(), image.byte_size());

    const VkExtent3D extent{image.width, image.height, 1u};
    const VkImageCreateInfo ici{.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO,
        .pNext                         = nullptr,
        .flags                         = 0u,
        .imageType                     = VK_IMAGE_TYPE_2D,
        .format                        = format,
        .extent                        = extent,
        .mipLevels                     = 1u,
        .arrayLayers                   = 1u,
        .samples                       = VK_SAMPLE_COUNT_1_BIT,
        .tiling                        = VK_IMAGE_TILING_OPTIMAL,
        .usage                         = VK_IMAGE_USAGE_SAMPLED_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT,
        .sharingMode                   = VK_SHARING_MODE_EXCLUSIVE,
        .queueFamilyIndexCount         = 0u,
        .pQueueFamilyIndices           = nullptr,
        .initialLayout                 = VK_IMAGE_LAYOUT_UNDEFINED};
    AllocatedImage dst = allocator_.create_image(ici, MemoryResidency::GpuOnly);

    try {
        immediate_submit([&](VkCommandBuffer cmd) {
            const VkImageMemoryBarrier to_transfer = layout_barrier(dst.image, VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 0u, VK_ACCESS_TRANSFER_WRITE_BIT);
            vkCmdPipelineBarrier(cmd, VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT, 0u, 0u, nullptr, 0u, nullptr, 1u, &to_transfer);

            VkBufferImageCopy copy{};
            copy.imageSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0u, 0u, 1u};
            copy.imageExtent      = extent;
            vkCmdCopyBufferToImage(cmd, staging.buffer.buffer, dst.image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1u, &copy);

            const VkImageMemoryBarrier to_shader = layout_barrier(dst.image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL, VK_ACCESS_TRANSFER_WRITE_BIT, VK_ACCESS_SHADER_READ_BIT);
            vkCmdPipelineBarrier(cmd, VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT, 0u, 0u, nullptr, 0u, nullptr, 1u, &to_shader);
        });
    } catch (const std::exception&) {
        allocator_.destroy_image(dst);
        throw;
    }
    log::get()->debug("Uploaded {}x{} image", image.width, image.height);
    return dst;
}

std::vector<std::byte> UploadContext::read_back_buffer(VkBuffer buffer, size_t size) const {
    ScopedStaging readback(allocator_, size, VK_BUFFER_USAGE_TRANSFER_DST_BIT);
    immediate_submit([&](VkCommandBuffer cmd) {
        const VkBufferCopy copy{.srcOffset = 0u, .dstOffset = 0u, .size = size};
        vkCmdCopyBuffer(cmd, buffer, readback.buffer.buffer, 1u, &copy);
    });

    std::vector<std::byte> out(size);
    const void* src = allocator_.map(readback.buffer);
    std::memcpy(out.data(), src, size);
    allocator_.unmap(readback.buffer);
    return out;
}

} // namespace vkg
