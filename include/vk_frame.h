// ============================================================================
// vkguide renderer - Per-frame data
// FrameData is one in-flight slot of the draw loop. The GPU* structs mirror
// the shader-side uniform / storage declarations byte for byte.
// ============================================================================
#ifndef VKGUIDE_VK_FRAME_H
#define VKGUIDE_VK_FRAME_H

#include "vk_math.h"
#include "vk_types.h"

namespace vkg {

// set 0, binding 0 (dynamic UBO)
struct GPUCameraData {
    float4x4 view;
    float4x4 proj;
    float4x4 viewproj;
};
static_assert(sizeof(GPUCameraData) == 192);

// set 0, binding 1 (dynamic UBO)
struct GPUSceneData {
    float4 fog_color;         // w is for exponent
    float4 fog_distances;     // x for min, y for max, zw unused
    float4 ambient_color;
    float4 sunlight_direction; // w for sun power
    float4 sunlight_color;
};
static_assert(sizeof(GPUSceneData) == 80);

// set 1, binding 0 (storage buffer array, one per renderable in draw order)
struct GPUObjectData {
    float4x4 model;
};
static_assert(sizeof(GPUObjectData) == 64);

// Vertex-stage push constant block declared by tri_mesh.vert.
struct MeshPushConstants {
    float4 data;
    float4x4 render_matrix;
};
static_assert(sizeof(MeshPushConstants) == 80);

// One in-flight frame slot (FRAME_OVERLAP of them).
struct FrameData {
    VkSemaphore present_semaphore{};      // Signaled by acquire
    VkSemaphore render_semaphore{};       // Signaled by submit, waited by present
    VkFence render_fence{};               // Created signaled
    VkCommandPool command_pool{};         // Per-frame pool
    VkCommandBuffer main_command_buffer{}; // Freed with the pool
    AllocatedBuffer object_buffer{};      // GPUObjectData[max_objects]
    VkDescriptorSet object_descriptor{};  // set 1 -> object_buffer
    VkDescriptorSet global_descriptor{};  // set 0 -> shared camera/scene buffer
};

// Counters of the last recorded frame.
struct DrawStats {
    uint32_t pipeline_binds{0};
    uint32_t vertex_buffer_binds{0};
    uint32_t texture_binds{0};
    uint32_t draws{0};
    uint64_t triangles{0};
};

} // namespace vkg

#endif // VKGUIDE_VK_FRAME_H
