#include "vk_scene.h"

#include <algorithm>

namespace vkg {

Material& SceneTable::create_material(const std::string& name, VkPipeline pipeline, VkPipelineLayout layout, VkDescriptorSet texture_set) {
    if (auto it = materials_.find(name); it != materials_.end()) {
        it->second.pipeline    = pipeline;
        it->second.layout      = layout;
        it->second.texture_set = texture_set;
        return it->second;
    }
    const auto id = static_cast<uint32_t>(materials_.size());
    return materials_.emplace(name, Material{pipeline, layout, texture_set, id}).first->second;
}

Material* SceneTable::get_material(const std::string& name) {
    auto it = materials_.find(name);
    return it == materials_.end() ? nullptr : &it->second;
}

Mesh& SceneTable::add_mesh(const std::string& name, std::vector<Vertex> vertices) {
    REQUIRE_TRUE(!meshes_.contains(name), "duplicate mesh name '" + name + "'");
    Mesh mesh{};
    mesh.vertices = std::move(vertices);
    mesh.id       = static_cast<uint32_t>(meshes_.size());
    return meshes_.emplace(name, std::move(mesh)).first->second;
}

Mesh* SceneTable::get_mesh(const std::string& name) {
    auto it = meshes_.find(name);
    return it == meshes_.end() ? nullptr : &it->second;
}

uint32_t SceneTable::add_renderable(Mesh* mesh, Material* material, const float4x4& transform) {
    REQUIRE_TRUE(mesh != nullptr && material != nullptr, "renderable needs a mesh and a material");
    const uint32_t id = next_renderable_id_++;
    renderables_.push_back(RenderObject{mesh, material, transform, id});
    sorted_ = false;
    return id;
}

RenderObject* SceneTable::find_renderable(uint32_t id) {
    auto it = std::ranges::find(renderables_, id, &RenderObject::id);
    return it == renderables_.end() ? nullptr : &*it;
}

void SceneTable::set_material(uint32_t renderable_id, Material* material) {
    RenderObject* obj = find_renderable(renderable_id);
    REQUIRE_TRUE(obj != nullptr && material != nullptr, "unknown renderable or null material");
    if (obj->material == material) return;
    obj->material = material;
    sorted_       = false;
}

void SceneTable::set_mesh(uint32_t renderable_id, Mesh* mesh) {
    RenderObject* obj = find_renderable(renderable_id);
    REQUIRE_TRUE(obj != nullptr && mesh != nullptr, "unknown renderable or null mesh");
    if (obj->mesh == mesh) return;
    obj->mesh = mesh;
    sorted_   = false;
}

void SceneTable::sort_for_drawing() {
    std::ranges::stable_sort(renderables_, [](const RenderObject& a, const RenderObject& b) {
        if (a.material->id != b.material->id) return a.material->id < b.material->id;
        return a.mesh->id < b.mesh->id;
    });
    sorted_ = true;
}

void SceneTable::clear() {
    renderables_.clear();
    materials_.clear();
    meshes_.clear();
    next_renderable_id_ = 0;
    sorted_             = true;
}

DrawPlan plan_draws(std::span<const RenderObject> objects) {
    DrawPlan plan{};
    plan.commands.reserve(objects.size());
    const Material* last_material = nullptr;
    const Mesh* last_mesh         = nullptr;
    for (size_t i = 0; i < objects.size(); ++i) {
        const RenderObject& obj = objects[i];
        DrawCommand cmd{};
        cmd.object             = &obj;
        cmd.first_instance     = static_cast<uint32_t>(i);
        cmd.bind_pipeline      = obj.material != last_material;
        cmd.bind_vertex_buffer = obj.mesh != last_mesh;
        if (cmd.bind_pipeline) {
            ++plan.pipeline_binds;
            if (obj.material->texture_set != VK_NULL_HANDLE) ++plan.texture_binds;
        }
        if (cmd.bind_vertex_buffer) ++plan.vertex_buffer_binds;
        last_material = obj.material;
        last_mesh     = obj.mesh;
        plan.commands.push_back(cmd);
    }
    return plan;
}

} // namespace vkg
