#include "vk_descriptors.h"
#include "vk_frame.h"

#include <array>
#include <gtest/gtest.h>

using namespace vkg;

TEST(PadUniformBufferSize, RoundsUpToAlignment) {
    EXPECT_EQ(pad_uniform_buffer_size(0, 256), 0u);
    EXPECT_EQ(pad_uniform_buffer_size(1, 256), 256u);
    EXPECT_EQ(pad_uniform_buffer_size(192, 256), 256u);
    EXPECT_EQ(pad_uniform_buffer_size(256, 256), 256u);
    EXPECT_EQ(pad_uniform_buffer_size(257, 64), 320u);
}

TEST(PadUniformBufferSize, ZeroAlignmentKeepsSize) {
    EXPECT_EQ(pad_uniform_buffer_size(100, 0), 100u);
}

TEST(FrameUniformLayout, CameraBlocksPrecedeSceneBlocks) {
    const auto layout = FrameUniformLayout::make(sizeof(GPUCameraData), sizeof(GPUSceneData), 256);
    EXPECT_EQ(layout.camera_stride, 256u);
    EXPECT_EQ(layout.scene_stride, 256u);
    EXPECT_EQ(layout.camera_offset(0), 0u);
    EXPECT_EQ(layout.camera_offset(1), 256u);
    EXPECT_EQ(layout.scene_offset(0), 512u);
    EXPECT_EQ(layout.scene_offset(1), 768u);
    EXPECT_EQ(layout.total_size(), 1024u);
}

TEST(FrameUniformLayout, RangesNeverOverlapAndStayAligned) {
    for (VkDeviceSize alignment : {VkDeviceSize{16}, VkDeviceSize{64}, VkDeviceSize{256}}) {
        const auto layout = FrameUniformLayout::make(sizeof(GPUCameraData), sizeof(GPUSceneData), alignment);
        std::vector<std::pair<VkDeviceSize, VkDeviceSize>> ranges;
        for (uint32_t f = 0; f < FRAME_OVERLAP; ++f) {
            ranges.emplace_back(layout.camera_offset(f), sizeof(GPUCameraData));
            ranges.emplace_back(layout.scene_offset(f), sizeof(GPUSceneData));
        }
        for (size_t i = 0; i < ranges.size(); ++i) {
            EXPECT_EQ(ranges[i].first % alignment, 0u) << "alignment " << alignment;
            EXPECT_LE(ranges[i].first + ranges[i].second, layout.total_size());
            for (size_t j = i + 1; j < ranges.size(); ++j) {
                const bool disjoint = ranges[i].first + ranges[i].second <= ranges[j].first || ranges[j].first + ranges[j].second <= ranges[i].first;
                EXPECT_TRUE(disjoint) << "ranges " << i << " and " << j << " overlap";
            }
        }
    }
}

TEST(DescriptorAllocator, PoolSizesScaleWithMaxSets) {
    const std::array<DescriptorAllocator::PoolSizeRatio, 3> ratios{{
        {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC, 1.0f},
        {VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 0.5f},
        {VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 0.5f},
    }};
    const auto sizes = DescriptorAllocator::pool_sizes(16, ratios);
    ASSERT_EQ(sizes.size(), 3u);
    EXPECT_EQ(sizes[0].type, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC);
    EXPECT_EQ(sizes[0].descriptorCount, 16u);
    EXPECT_EQ(sizes[1].descriptorCount, 8u);
    EXPECT_EQ(sizes[2].descriptorCount, 8u);
}

TEST(DescriptorAllocator, EveryTypeGetsAtLeastOneDescriptor) {
    const std::array<DescriptorAllocator::PoolSizeRatio, 1> ratios{{{VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 0.1f}}};
    const auto sizes = DescriptorAllocator::pool_sizes(2, ratios);
    ASSERT_EQ(sizes.size(), 1u);
    EXPECT_EQ(sizes[0].descriptorCount, 1u);
}

TEST(DescriptorLayoutBuilder, CollectsBindings) {
    DescriptorLayoutBuilder builder;
    builder.add_binding(0, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC, VK_SHADER_STAGE_VERTEX_BIT)
        .add_binding(1, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC, VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT);
    ASSERT_EQ(builder.bindings.size(), 2u);
    EXPECT_EQ(builder.bindings[1].binding, 1u);
    EXPECT_EQ(builder.bindings[1].descriptorCount, 1u);
    EXPECT_EQ(builder.bindings[1].stageFlags, static_cast<VkShaderStageFlags>(VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT));
    builder.clear();
    EXPECT_TRUE(builder.bindings.empty());
}

TEST(DescriptorWriter, BufferInfosKeepStableAddresses) {
    DescriptorWriter writer;
    const auto fake = reinterpret_cast<VkBuffer>(static_cast<uintptr_t>(0x10));
    for (uint32_t i = 0; i < 8; ++i) writer.write_buffer(i, fake, 64, 0, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER);
    ASSERT_EQ(writer.writes.size(), 8u);
    for (uint32_t i = 0; i < 8; ++i) {
        EXPECT_EQ(writer.writes[i].pBufferInfo, &writer.buffer_infos[i]);
        EXPECT_EQ(writer.writes[i].dstBinding, i);
    }
    writer.clear();
    EXPECT_TRUE(writer.writes.empty());
}
