// ============================================================================
// vkguide renderer - Mesh & image data
// CPU-side vertex layout and its Vulkan vertex-input description, the Mesh
// record kept in the scene table, and loaders that turn OBJ / image files
// into CPU data ready for the staging upload.
// ============================================================================
#ifndef VKGUIDE_VK_MESH_H
#define VKGUIDE_VK_MESH_H

#include "vk_math.h"
#include "vk_types.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vkg {

struct VertexInputDescription {
    std::vector<VkVertexInputBindingDescription> bindings;
    std::vector<VkVertexInputAttributeDescription> attributes;
    VkPipelineVertexInputStateCreateFlags flags{0};
};

// Matches the vertex inputs of tri_mesh.vert (locations 0..3).
struct Vertex {
    float3 position;
    float3 normal;
    float3 color;
    float2 uv;

    static VertexInputDescription input_description();
};
static_assert(sizeof(Vertex) == 44);

struct Mesh {
    std::vector<Vertex> vertices;     // Kept after upload
    AllocatedBuffer vertex_buffer{};  // Created once by the upload path
    uint32_t id{0};                   // Insertion order in the scene table

    [[nodiscard]] uint32_t vertex_count() const { return static_cast<uint32_t>(vertices.size()); }
};

// Decoded RGBA8 pixels.
struct CpuImage {
    uint32_t width{0};
    uint32_t height{0};
    std::vector<std::byte> pixels; // width * height * 4 bytes

    [[nodiscard]] size_t byte_size() const { return pixels.size(); }
};

// Green triangle used by the 41x41 grid.
std::vector<Vertex> make_triangle_vertices();

// Triangulated OBJ, flattened (no index buffer). Normals double as vertex
// color. Returns nullopt (and logs) when the file cannot be parsed.
std::optional<std::vector<Vertex>> load_mesh_from_obj(const std::string& path);

// Any stb_image format, forced to 4 channels. nullopt (logged) on failure.
std::optional<CpuImage> load_image_from_file(const std::string& path);

} // namespace vkg

#endif // VKGUIDE_VK_MESH_H
