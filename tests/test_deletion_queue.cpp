#include "vk_deletion.h"

#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace vkg;

namespace {

// Every destroy call lands here as "<kind>:<handle value>".
std::vector<std::string> g_calls;

template <typename Handle>
Handle fake(uintptr_t v) {
    return reinterpret_cast<Handle>(v);
}

template <typename Handle>
std::string tag(const char* kind, Handle h) {
    return std::string(kind) + ":" + std::to_string(reinterpret_cast<uintptr_t>(h));
}

void count_buffer(VmaAllocator, VkBuffer b, VmaAllocation) { g_calls.push_back(tag("buffer", b)); }
void count_image(VmaAllocator, VkImage i, VmaAllocation) { g_calls.push_back(tag("image", i)); }
VKAPI_ATTR void VKAPI_CALL count_fence(VkDevice, VkFence h, const VkAllocationCallbacks*) { g_calls.push_back(tag("fence", h)); }
VKAPI_ATTR void VKAPI_CALL count_semaphore(VkDevice, VkSemaphore h, const VkAllocationCallbacks*) { g_calls.push_back(tag("semaphore", h)); }
VKAPI_ATTR void VKAPI_CALL count_view(VkDevice, VkImageView h, const VkAllocationCallbacks*) { g_calls.push_back(tag("view", h)); }
VKAPI_ATTR void VKAPI_CALL count_layout(VkDevice, VkPipelineLayout h, const VkAllocationCallbacks*) { g_calls.push_back(tag("layout", h)); }
VKAPI_ATTR void VKAPI_CALL count_command_pool(VkDevice, VkCommandPool h, const VkAllocationCallbacks*) { g_calls.push_back(tag("cmdpool", h)); }
VKAPI_ATTR void VKAPI_CALL count_sampler(VkDevice, VkSampler h, const VkAllocationCallbacks*) { g_calls.push_back(tag("sampler", h)); }

DeletionDispatch counting_dispatch() {
    DeletionDispatch d{};
    d.destroy_buffer       = count_buffer;
    d.destroy_image        = count_image;
    d.destroy_fence        = count_fence;
    d.destroy_semaphore    = count_semaphore;
    d.destroy_image_view   = count_view;
    d.destroy_pipeline_layout = count_layout;
    d.destroy_command_pool = count_command_pool;
    d.destroy_sampler      = count_sampler;
    return d;
}

class DeletionQueueTest : public ::testing::Test {
protected:
    void SetUp() override { g_calls.clear(); }
    DeletionQueue queue{counting_dispatch()};
};

} // namespace

TEST_F(DeletionQueueTest, FlushDestroysEachHandleOnce) {
    queue.push(fake<VkFence>(1));
    queue.push(fake<VkSemaphore>(2));
    queue.push(fake<VkCommandPool>(3));
    EXPECT_EQ(queue.size(), 3u);

    queue.flush(VK_NULL_HANDLE, nullptr);
    EXPECT_EQ(g_calls.size(), 3u);
    EXPECT_TRUE(queue.empty());
}

TEST_F(DeletionQueueTest, SameKindIsDestroyedNewestFirst) {
    queue.push(fake<VkFence>(1));
    queue.push(fake<VkFence>(2));
    queue.push(fake<VkFence>(3));
    queue.flush(VK_NULL_HANDLE, nullptr);
    EXPECT_EQ(g_calls, (std::vector<std::string>{"fence:3", "fence:2", "fence:1"}));
}

TEST_F(DeletionQueueTest, AllocationsGoBeforeViewsAndViewsBeforeLayouts) {
    queue.push(fake<VkSampler>(9));
    queue.push(fake<VkPipelineLayout>(5));
    queue.push(fake<VkImageView>(4));
    queue.push(AllocatedImage{fake<VkImage>(11), reinterpret_cast<VmaAllocation>(static_cast<uintptr_t>(12))});
    queue.push(AllocatedBuffer{fake<VkBuffer>(7), reinterpret_cast<VmaAllocation>(static_cast<uintptr_t>(8))});
    queue.flush(VK_NULL_HANDLE, nullptr);
    EXPECT_EQ(g_calls, (std::vector<std::string>{"buffer:7", "image:11", "view:4", "layout:5", "sampler:9"}));
}

// Pipelines and swapchain targets are owned by the objects that rebuild them.
template <typename Handle>
concept Deferrable = requires(DeletionQueue q, Handle h) { q.push(h); };
static_assert(!Deferrable<VkPipeline>);
static_assert(!Deferrable<VkFramebuffer>);
static_assert(!Deferrable<VkRenderPass>);
static_assert(!Deferrable<VkSwapchainKHR>);
static_assert(Deferrable<VkSampler>);
static_assert(Deferrable<VkImageView>);

TEST_F(DeletionQueueTest, SizeCountsEveryEngineLifetimeKind) {
    queue.push(AllocatedBuffer{fake<VkBuffer>(1), reinterpret_cast<VmaAllocation>(static_cast<uintptr_t>(2))});
    queue.push(fake<VkImageView>(3));
    queue.push(fake<VkPipelineLayout>(4));
    queue.push(fake<VkSampler>(5));
    queue.push(fake<VkFence>(6));
    queue.push(fake<VkSemaphore>(7));
    queue.push(fake<VkCommandPool>(8));
    EXPECT_EQ(queue.size(), 7u);
    queue.flush(VK_NULL_HANDLE, nullptr);
    EXPECT_EQ(g_calls.size(), 7u);
    EXPECT_TRUE(queue.empty());
}

TEST_F(DeletionQueueTest, SecondFlushIsANoOp) {
    queue.push(fake<VkSampler>(9));
    queue.flush(VK_NULL_HANDLE, nullptr);
    queue.flush(VK_NULL_HANDLE, nullptr);
    EXPECT_EQ(g_calls.size(), 1u);
}

TEST_F(DeletionQueueTest, NullHandlesAreIgnored) {
    queue.push(VkFence{VK_NULL_HANDLE});
    queue.push(AllocatedBuffer{});
    queue.push(AllocatedImage{});
    EXPECT_TRUE(queue.empty());
    queue.flush(VK_NULL_HANDLE, nullptr);
    EXPECT_TRUE(g_calls.empty());
}
