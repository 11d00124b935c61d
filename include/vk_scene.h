// ============================================================================
// vkguide renderer - Scene / Renderable Table
// Named mesh and material tables (sole owners) plus a flat list of
// (mesh, material, transform) renderables that the draw loop walks in order.
// plan_draws() decides, per renderable, which binds can be skipped because
// the previous renderable already bound the same pipeline / vertex buffer.
// ============================================================================
#ifndef VKGUIDE_VK_SCENE_H
#define VKGUIDE_VK_SCENE_H

#include "vk_math.h"
#include "vk_mesh.h"
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace vkg {

struct Material {
    VkPipeline pipeline{};
    VkPipelineLayout layout{};
    VkDescriptorSet texture_set{}; // set 2, null for untextured materials
    uint32_t id{0};                // Insertion order, used as sort key
};

struct RenderObject {
    Mesh* mesh{nullptr};          // Non-owning
    Material* material{nullptr};  // Non-owning
    float4x4 transform{};
    uint32_t id{0};               // Stable handle across sorting
};

class SceneTable {
public:
    // Create, or replace the pipeline / layout / texture of an existing entry
    // (its id is kept so the draw order does not change).
    Material& create_material(const std::string& name, VkPipeline pipeline, VkPipelineLayout layout, VkDescriptorSet texture_set = VK_NULL_HANDLE);
    [[nodiscard]] Material* get_material(const std::string& name);

    // Takes ownership of the CPU vertices. Throws if the name is taken.
    Mesh& add_mesh(const std::string& name, std::vector<Vertex> vertices);
    [[nodiscard]] Mesh* get_mesh(const std::string& name);

    // Returns the renderable's id. Throws on null mesh / material.
    uint32_t add_renderable(Mesh* mesh, Material* material, const float4x4& transform);
    [[nodiscard]] RenderObject* find_renderable(uint32_t id);
    void set_material(uint32_t renderable_id, Material* material);
    void set_mesh(uint32_t renderable_id, Mesh* mesh);

    // Stable sort by (material id, mesh id).
    void sort_for_drawing();
    [[nodiscard]] bool sorted() const { return sorted_; }

    [[nodiscard]] std::span<const RenderObject> renderables() const { return renderables_; }
    [[nodiscard]] std::unordered_map<std::string, Mesh>& meshes() { return meshes_; }
    [[nodiscard]] const std::unordered_map<std::string, Material>& materials() const { return materials_; }

    void clear();

private:
    std::unordered_map<std::string, Mesh> meshes_;
    std::unordered_map<std::string, Material> materials_;
    std::vector<RenderObject> renderables_;
    uint32_t next_renderable_id_{0};
    bool sorted_{true};
};

// ----------------------------------------------------------------------------
// Draw planning
// ----------------------------------------------------------------------------
struct DrawCommand {
    const RenderObject* object{nullptr};
    bool bind_pipeline{false};       // Pipeline + sets 0/1 (and set 2 when textured)
    bool bind_vertex_buffer{false};
    uint32_t first_instance{0};      // Index into the object storage buffer
};

struct DrawPlan {
    std::vector<DrawCommand> commands;
    uint32_t pipeline_binds{0};
    uint32_t vertex_buffer_binds{0};
    uint32_t texture_binds{0};
};

// A pipeline bind happens when the material differs from the previous
// renderable's (or for the first), a vertex-buffer bind when the mesh does.
DrawPlan plan_draws(std::span<const RenderObject> objects);

} // namespace vkg

#endif // VKGUIDE_VK_SCENE_H
