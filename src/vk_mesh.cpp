#include "vk_mesh.h"
#include "vk_log.h"

#define TINYOBJLOADER_IMPLEMENTATION
#include <tiny_obj_loader.h>
#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <cstddef>
#include <cstring>

namespace vkg {

VertexInputDescription Vertex::input_description() {
    VertexInputDescription d{};
    d.bindings.push_back({.binding = 0u, .stride = sizeof(Vertex), .inputRate = VK_VERTEX_INPUT_RATE_VERTEX});
    d.attributes.push_back({.location = 0u, .binding = 0u, .format = VK_FORMAT_R32G32B32_SFLOAT, .offset = offsetof(Vertex, position)});
    d.attributes.push_back({.location = 1u, .binding = 0u, .format = VK_FORMAT_R32G32B32_SFLOAT, .offset = offsetof(Vertex, normal)});
    d.attributes.push_back({.location = 2u, .binding = 0u, .format = VK_FORMAT_R32G32B32_SFLOAT, .offset = offsetof(Vertex, color)});
    d.attributes.push_back({.location = 3u, .binding = 0u, .format = VK_FORMAT_R32G32_SFLOAT, .offset = offsetof(Vertex, uv)});
    return d;
}

std::vector<Vertex> make_triangle_vertices() {
    const float3 green{0.0f, 1.0f, 0.0f};
    return {
        Vertex{.position = {1.0f, 1.0f, 0.0f}, .normal = {}, .color = green, .uv = {}},
        Vertex{.position = {-1.0f, 1.0f, 0.0f}, .normal = {}, .color = green, .uv = {}},
        Vertex{.position = {0.0f, -1.0f, 0.0f}, .normal = {}, .color = green, .uv = {}},
    };
}

std::optional<std::vector<Vertex>> load_mesh_from_obj(const std::string& path) {
    tinyobj::ObjReaderConfig cfg;
    cfg.triangulate = true;

    tinyobj::ObjReader reader;
    if (!reader.ParseFromFile(path, cfg)) {
        log::get()->error("Failed to load OBJ '{}': {}", path, reader.Error());
        return std::nullopt;
    }
    if (!reader.Warning().empty()) log::get()->warn("OBJ '{}': {}", path, reader.Warning());

    const auto& attrib = reader.GetAttrib();
    std::vector<Vertex> out;
    for (const auto& shape : reader.GetShapes()) {
        size_t index_offset = 0;
        for (const auto fv : shape.mesh.num_face_vertices) {
            for (size_t v = 0; v < static_cast<size_t>(fv); ++v) {
                const tinyobj::index_t idx = shape.mesh.indices[index_offset + v];
                Vertex vert{};
                vert.position = {attrib.vertices[3 * idx.vertex_index + 0], attrib.vertices[3 * idx.vertex_index + 1], attrib.vertices[3 * idx.vertex_index + 2]};
                if (idx.normal_index >= 0) {
                    vert.normal = {attrib.normals[3 * idx.normal_index + 0], attrib.normals[3 * idx.normal_index + 1], attrib.normals[3 * idx.normal_index + 2]};
                }
                if (idx.texcoord_index >= 0) {
                    // OBJ v grows upwards, Vulkan images grow downwards
                    vert.uv = {attrib.texcoords[2 * idx.texcoord_index + 0], 1.0f - attrib.texcoords[2 * idx.texcoord_index + 1]};
                }
                vert.color = vert.normal;
                out.push_back(vert);
            }
            index_offset += static_cast<size_t>(fv);
        }
    }
    log::get()->info("Loaded mesh '{}' ({} vertices)", path, out.size());
    return out;
}

std::optional<CpuImage> load_image_from_file(const std::string& path) {
    int w = 0, h = 0, channels = 0;
    stbi_uc* data = stbi_load(path.c_str(), &w, &h, &channels, STBI_rgb_alpha);
    if (data == nullptr) {
        log::get()->error("Failed to load image '{}': {}", path, stbi_failure_reason());
        return std::nullopt;
    }
    CpuImage img{};
    img.width  = static_cast<uint32_t>(w);
    img.height = static_cast<uint32_t>(h);
    img.pixels.resize(static_cast<size_t>(w) * static_cast<size_t>(h) * 4u);
    std::memcpy(img.pixels.data(), data, img.pixels.size());
    stbi_image_free(data);
    log::get()->info("Loaded image '{}' ({}x{})", path, img.width, img.height);
    return img;
}

} // namespace vkg
