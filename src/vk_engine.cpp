// ============================================================================
// vkguide renderer - vk_engine.cpp
// Setup and teardown of the VulkanEngine: window, device context, swapchain
// targets, frame slots, descriptors, pipelines, meshes, textures, scene and
// ImGui, plus the event loop and the per-frame synchronization protocol.
// Command recording for a frame lives in vk_draw.cpp.
// ============================================================================
#include "vk_engine.h"
#include "vk_log.h"
#include "vk_ui.h"

#include <algorithm>
#include <array>
#include <filesystem>
#include <imgui.h>
#include <spdlog/fmt/fmt.h>
#include <vulkan/vk_enum_string_helper.h>

namespace vkg {

namespace {

constexpr std::array<const char*, 3> kHeroMaterials{"defaultmesh", "redtriangle", "rgbtriangle"};
constexpr std::array<const char*, 2> kHeroMeshes{"monkey", "triangle"};

} // namespace

// ============================================================================
// VulkanEngine: Ctors / Dtors / configuration
// ============================================================================
VulkanEngine::VulkanEngine() = default;

VulkanEngine::~VulkanEngine() {
    try {
        cleanup();
    } catch (const std::exception& ex) {
        log::get()->error("Engine teardown failed: {}", ex.what());
    }
}

void VulkanEngine::configure_window(int width, int height, const char* title) {
    REQUIRE_TRUE(!state_.initialized, "configure_window() must be called before init()");
    REQUIRE_TRUE(width > 0 && height > 0, "window size must be positive");
    config_.width  = width;
    config_.height = height;
    if (title != nullptr) config_.name = title;
}

void VulkanEngine::configure(const EngineConfig& config) {
    REQUIRE_TRUE(!state_.initialized, "configure() must be called before init()");
    config_ = config;
}

// ============================================================================
// VulkanEngine :: init
// ============================================================================
void VulkanEngine::init() {
    REQUIRE_TRUE(!state_.initialized, "init() called twice");
    log::init(config_);

    init_window();
    ctx_       = create_device_context(config_, window_);
    allocator_ = ResourceAllocator(ctx_.allocator);

    int pxw = 0, pxh = 0;
    REQUIRE_TRUE(SDL_GetWindowSizeInPixels(window_, &pxw, &pxh), std::string("SDL_GetWindowSizeInPixels failed: ") + SDL_GetError());
    swapchain_.init(ctx_, allocator_);
    swapchain_.create(static_cast<uint32_t>(std::max(1, pxw)), static_cast<uint32_t>(std::max(1, pxh)), config_.vsync, config_.triple_buffer);

    init_commands();
    init_sync_structures();
    upload_.init(ctx_, allocator_, config_.upload_timeout_ns);
    init_descriptors();
    init_pipelines();
    load_meshes();
    load_images();
    if (config_.load_default_scene) init_scene();
    if (config_.enable_ui) init_imgui();

    state_.initialized = true;
    state_.last_tick   = std::chrono::steady_clock::now();
    log::get()->info("Engine initialized ({} renderables)", scene_.renderables().size());
}

void VulkanEngine::init_window() {
    REQUIRE_TRUE(SDL_Init(SDL_INIT_VIDEO), std::string("SDL_Init failed: ") + SDL_GetError());
    sdl_initialized_ = true;

    SDL_WindowFlags flags = SDL_WINDOW_VULKAN | SDL_WINDOW_RESIZABLE;
    if (config_.hidden_window) flags |= SDL_WINDOW_HIDDEN;
    window_ = SDL_CreateWindow(config_.name.c_str(), config_.width, config_.height, flags);
    REQUIRE_TRUE(window_ != nullptr, std::string("SDL_CreateWindow failed: ") + SDL_GetError());
    log::get()->info("Created window {}x{}", config_.width, config_.height);
}

// ============================================================================
// Command Buffers / Synchronization
// ============================================================================
void VulkanEngine::init_commands() {
    const VkCommandPoolCreateInfo pci{.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO, .pNext = nullptr, .flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT, .queueFamilyIndex = ctx_.graphics_queue_family};
    for (auto& frame : frames_) {
        VK_CHECK(vkCreateCommandPool(ctx_.device, &pci, nullptr, &frame.command_pool));
        deletion_.push(frame.command_pool);
        const VkCommandBufferAllocateInfo ai{.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO, .pNext = nullptr, .commandPool = frame.command_pool, .level = VK_COMMAND_BUFFER_LEVEL_PRIMARY, .commandBufferCount = 1u};
        VK_CHECK(vkAllocateCommandBuffers(ctx_.device, &ai, &frame.main_command_buffer));
    }
    log::get()->info("Created {} frame command pools", FRAME_OVERLAP);
}

void VulkanEngine::init_sync_structures() {
    // Created signaled so the first wait on each slot returns immediately.
    const VkFenceCreateInfo fci{.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO, .pNext = nullptr, .flags = VK_FENCE_CREATE_SIGNALED_BIT};
    const VkSemaphoreCreateInfo sci{.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO, .pNext = nullptr, .flags = 0u};
    for (auto& frame : frames_) {
        VK_CHECK(vkCreateFence(ctx_.device, &fci, nullptr, &frame.render_fence));
        deletion_.push(frame.render_fence);
        VK_CHECK(vkCreateSemaphore(ctx_.device, &sci, nullptr, &frame.present_semaphore));
        deletion_.push(frame.present_semaphore);
        VK_CHECK(vkCreateSemaphore(ctx_.device, &sci, nullptr, &frame.render_semaphore));
        deletion_.push(frame.render_semaphore);
    }
    log::get()->info("Created frame synchronization objects");
}

// ============================================================================
// Descriptors & per-frame buffers
// ============================================================================
void VulkanEngine::init_descriptors() {
    const VkDevice device = ctx_.device;

    global_set_layout_ = DescriptorLayoutBuilder{}
                             .add_binding(0u, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC, VK_SHADER_STAGE_VERTEX_BIT)
                             .add_binding(1u, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC, VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT)
                             .build(device);
    deletion_.push(global_set_layout_);
    object_set_layout_ = DescriptorLayoutBuilder{}.add_binding(0u, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, VK_SHADER_STAGE_VERTEX_BIT).build(device);
    deletion_.push(object_set_layout_);
    texture_set_layout_ = DescriptorLayoutBuilder{}.add_binding(0u, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, VK_SHADER_STAGE_FRAGMENT_BIT).build(device);
    deletion_.push(texture_set_layout_);

    // 2 global + 2 object sets, the rest for textures.
    const std::array<DescriptorAllocator::PoolSizeRatio, 3> ratios{{
        {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC, 1.0f},
        {VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 0.5f},
        {VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 0.5f},
    }};
    descriptor_allocator_.init_pool(device, 16u, ratios);
    deletion_.push(descriptor_allocator_.pool);

    uniform_layout_         = FrameUniformLayout::make(sizeof(GPUCameraData), sizeof(GPUSceneData), ctx_.min_uniform_alignment);
    scene_parameter_buffer_ = allocator_.create_buffer(uniform_layout_.total_size(), VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT, MemoryResidency::CpuToGpu);
    deletion_.push(scene_parameter_buffer_);

    scene_parameters_.sunlight_direction = float4{0.0f, 1.0f, 0.5f, 1.0f};
    scene_parameters_.sunlight_color     = float4{1.0f, 1.0f, 1.0f, 1.0f};

    const VkDeviceSize object_bytes = sizeof(GPUObjectData) * static_cast<VkDeviceSize>(config_.max_objects);
    for (auto& frame : frames_) {
        frame.object_buffer = allocator_.create_buffer(object_bytes, VK_BUFFER_USAGE_STORAGE_BUFFER_BIT, MemoryResidency::CpuToGpu);
        deletion_.push(frame.object_buffer);

        frame.global_descriptor = descriptor_allocator_.allocate(device, global_set_layout_);
        frame.object_descriptor = descriptor_allocator_.allocate(device, object_set_layout_);

        // Dynamic offsets select the frame's block at bind time.
        DescriptorWriter writer;
        writer.write_buffer(0u, scene_parameter_buffer_.buffer, sizeof(GPUCameraData), 0u, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC)
            .write_buffer(1u, scene_parameter_buffer_.buffer, sizeof(GPUSceneData), 0u, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC)
            .update_set(device, frame.global_descriptor);
        writer.clear();
        writer.write_buffer(0u, frame.object_buffer.buffer, object_bytes, 0u, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER).update_set(device, frame.object_descriptor);
    }

    VkSamplerCreateInfo sci{};
    sci.sType        = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
    sci.magFilter    = VK_FILTER_NEAREST;
    sci.minFilter    = VK_FILTER_NEAREST;
    sci.mipmapMode   = VK_SAMPLER_MIPMAP_MODE_NEAREST;
    sci.addressModeU = VK_SAMPLER_ADDRESS_MODE_REPEAT;
    sci.addressModeV = VK_SAMPLER_ADDRESS_MODE_REPEAT;
    sci.addressModeW = VK_SAMPLER_ADDRESS_MODE_REPEAT;
    sci.maxLod       = VK_LOD_CLAMP_NONE;
    VK_CHECK(vkCreateSampler(device, &sci, nullptr, &default_sampler_));
    deletion_.push(default_sampler_);

    log::get()->info("Created descriptors (camera stride {}, scene stride {}, {} objects per frame)", uniform_layout_.camera_stride, uniform_layout_.scene_stride, config_.max_objects);
}

// ============================================================================
// Pipelines & materials
// ============================================================================
void VulkanEngine::init_pipelines() {
    pipelines_.create_layouts(ctx_.device, global_set_layout_, object_set_layout_, texture_set_layout_);
    deletion_.push(pipelines_.mesh_layout);
    deletion_.push(pipelines_.textured_layout);
    pipelines_.build(ctx_.device, swapchain_.render_pass(), swapchain_.extent(), config_.shader_dir);
    register_materials();
}

// Point every material at the current pipeline handles. Existing entries keep
// their ids, so the draw order survives a pipeline rebuild.
void VulkanEngine::register_materials() {
    scene_.create_material("defaultmesh", pipelines_.mesh, pipelines_.mesh_layout);

    auto register_optional = [&](const char* name, VkPipeline pipeline) {
        if (pipeline != VK_NULL_HANDLE) {
            scene_.create_material(name, pipeline, pipelines_.mesh_layout);
        } else if (scene_.get_material(name) != nullptr) {
            log::get()->warn("Material '{}' falls back to the lit pipeline", name);
            scene_.create_material(name, pipelines_.mesh, pipelines_.mesh_layout);
        }
    };
    register_optional("redtriangle", pipelines_.red_triangle);
    register_optional("rgbtriangle", pipelines_.rgb_triangle);

    std::vector<std::pair<std::string, VkDescriptorSet>> textured;
    for (const auto& [name, material] : scene_.materials()) {
        if (material.layout == pipelines_.textured_layout) textured.emplace_back(name, material.texture_set);
    }
    for (const auto& [name, set] : textured) scene_.create_material(name, pipelines_.textured_mesh, pipelines_.textured_layout, set);
}

// ============================================================================
// Meshes, textures, scene
// ============================================================================
Mesh& VulkanEngine::upload_mesh(const std::string& name, std::vector<Vertex> vertices) {
    REQUIRE_TRUE(!vertices.empty(), "mesh '" + name + "' has no vertices");
    Mesh& mesh         = scene_.add_mesh(name, std::move(vertices));
    mesh.vertex_buffer = upload_.upload_buffer(mesh.vertices.data(), mesh.vertices.size() * sizeof(Vertex), VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
    deletion_.push(mesh.vertex_buffer);
    log::get()->info("Uploaded mesh '{}' ({} vertices)", name, mesh.vertex_count());
    return mesh;
}

Texture& VulkanEngine::upload_texture(const std::string& name, const CpuImage& image) {
    REQUIRE_TRUE(!textures_.contains(name), "duplicate texture name '" + name + "'");
    constexpr VkFormat format = VK_FORMAT_R8G8B8A8_SRGB;

    Texture tex{};
    tex.image = upload_.upload_image(image, format);
    deletion_.push(tex.image);

    VkImageViewCreateInfo vci{};
    vci.sType            = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    vci.image            = tex.image.image;
    vci.viewType         = VK_IMAGE_VIEW_TYPE_2D;
    vci.format           = format;
    vci.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0u, 1u, 0u, 1u};
    VK_CHECK(vkCreateImageView(ctx_.device, &vci, nullptr, &tex.view));
    deletion_.push(tex.view);

    tex.descriptor = descriptor_allocator_.allocate(ctx_.device, texture_set_layout_);
    DescriptorWriter writer;
    writer.write_image(0u, tex.view, default_sampler_, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER).update_set(ctx_.device, tex.descriptor);

    log::get()->info("Uploaded texture '{}' ({}x{})", name, image.width, image.height);
    return textures_.emplace(name, tex).first->second;
}

Material& VulkanEngine::create_textured_material(const std::string& name, const std::string& texture) {
    const auto it = textures_.find(texture);
    REQUIRE_TRUE(it != textures_.end(), "unknown texture '" + texture + "'");
    return scene_.create_material(name, pipelines_.textured_mesh, pipelines_.textured_layout, it->second.descriptor);
}

void VulkanEngine::load_meshes() {
    upload_mesh("triangle", make_triangle_vertices());

    const std::filesystem::path assets(config_.asset_dir);
    auto load_optional = [&](const char* name, const char* file) {
        const std::filesystem::path path = assets / file;
        if (!std::filesystem::exists(path)) {
            log::get()->warn("Mesh asset '{}' not found, skipping '{}'", path.string(), name);
            return;
        }
        if (auto vertices = load_mesh_from_obj(path.string()); vertices && !vertices->empty()) upload_mesh(name, std::move(*vertices));
    };
    load_optional("monkey", "suzanne.obj");
    load_optional("empire", "lost_empire.obj");
}

void VulkanEngine::load_images() {
    const std::filesystem::path path = std::filesystem::path(config_.asset_dir) / "lost_empire-RGBA.png";
    if (!std::filesystem::exists(path)) {
        log::get()->warn("Texture asset '{}' not found, textured material disabled", path.string());
        return;
    }
    if (auto image = load_image_from_file(path.string())) {
        upload_texture("empire_diffuse", *image);
        create_textured_material("texturedmesh", "empire_diffuse");
    }
}

void VulkanEngine::init_scene() {
    Mesh* triangle = scene_.get_mesh("triangle");
    Mesh* monkey   = scene_.get_mesh("monkey");
    Material* lit  = scene_.get_material("defaultmesh");
    REQUIRE_TRUE(triangle != nullptr && lit != nullptr, "default scene needs the triangle mesh and the lit material");

    state_.selected_mesh = monkey != nullptr ? 0u : 1u;
    state_.hero          = scene_.add_renderable(monkey != nullptr ? monkey : triangle, lit, make_identity());

    for (int x = -20; x <= 20; ++x) {
        for (int z = -20; z <= 20; ++z) {
            const float4x4 translation = make_translation(make_float3(static_cast<float>(x), 0.0f, static_cast<float>(z)));
            const float4x4 scale       = make_scale(make_float3(0.2f, 0.2f, 0.2f));
            scene_.add_renderable(triangle, lit, mul(translation, scale));
        }
    }

    Mesh* empire           = scene_.get_mesh("empire");
    Material* textured_mat = scene_.get_material("texturedmesh");
    if (empire != nullptr && textured_mat != nullptr) scene_.add_renderable(empire, textured_mat, make_translation(make_float3(5.0f, -10.0f, 0.0f)));

    scene_.sort_for_drawing();
    log::get()->info("Built default scene with {} renderables", scene_.renderables().size());
}

void VulkanEngine::cycle_hero_material() {
    if (!state_.hero) return;
    for (size_t step = 1; step <= kHeroMaterials.size(); ++step) {
        const auto next = static_cast<uint32_t>((state_.selected_shader + step) % kHeroMaterials.size());
        if (Material* material = scene_.get_material(kHeroMaterials[next])) {
            state_.selected_shader = next;
            scene_.set_material(*state_.hero, material);
            log::get()->debug("Hero material -> {}", kHeroMaterials[next]);
            return;
        }
    }
}

void VulkanEngine::toggle_hero_mesh() {
    if (!state_.hero) return;
    const uint32_t next = state_.selected_mesh == 0u ? 1u : 0u;
    if (Mesh* mesh = scene_.get_mesh(kHeroMeshes[next])) {
        state_.selected_mesh = next;
        scene_.set_mesh(*state_.hero, mesh);
        log::get()->debug("Hero mesh -> {}", kHeroMeshes[next]);
    }
}

// ============================================================================
// ImGui Integration
// ============================================================================
void VulkanEngine::init_imgui() {
    ui_ = std::make_unique<UiSystem>();
    try {
        ui_->init(ctx_, swapchain_.render_pass(), swapchain_.min_image_count(), swapchain_.image_count());
    } catch (const std::exception&) {
        ui_.reset();
        throw;
    }

    // HUD panel (debug / stats)
    ui_->add_panel([this] {
        const ImGuiViewport* vp = ImGui::GetMainViewport();
        ImGui::SetNextWindowPos(ImVec2(vp->WorkPos.x + 12.0f, vp->WorkPos.y + 12.0f), ImGuiCond_Always);
        ImGui::SetNextWindowBgAlpha(0.32f);
        const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoNav | ImGuiWindowFlags_NoFocusOnAppearing | ImGuiWindowFlags_AlwaysAutoResize;

        if (ImGui::Begin("HUD##top-left", nullptr, flags)) {
            const ImGuiIO& io = ImGui::GetIO();
            const float fps   = io.Framerate;
            ImGui::Text("FPS: %.1f (%.2f ms)", fps, fps > 0.f ? 1000.f / fps : 0.f);

            ImGui::SeparatorText("Frame");
            ImGui::Text("Frame#:  %llu", static_cast<unsigned long long>(state_.frame_number));
            ImGui::Text("Slot:    %u / %u", current_slot(), FRAME_OVERLAP);
            ImGui::Text("Time:    %.3f s", state_.time_sec);

            ImGui::SeparatorText("Swapchain");
            ImGui::Text("Extent:  %u x %u", swapchain_.extent().width, swapchain_.extent().height);
            ImGui::Text("Images:  %u", swapchain_.image_count());
            ImGui::Text("Present: %s", string_VkPresentModeKHR(swapchain_.present_mode()));
            ImGui::Text("Rebuilds: %llu", static_cast<unsigned long long>(swapchain_.generation()));

            ImGui::SeparatorText("Draw");
            ImGui::Text("Draws:     %u", stats_.draws);
            ImGui::Text("Triangles: %llu", static_cast<unsigned long long>(stats_.triangles));
            ImGui::Text("Pipeline binds: %u", stats_.pipeline_binds);
            ImGui::Text("Vertex binds:   %u", stats_.vertex_buffer_binds);
            ImGui::Text("Texture binds:  %u", stats_.texture_binds);

            ImGui::SeparatorText("Camera");
            const float3& p = camera_.state().position;
            ImGui::Text("Pos: %.2f %.2f %.2f", p.x, p.y, p.z);
            ImGui::Text("Hero: %s / %s", kHeroMaterials[state_.selected_shader], kHeroMeshes[state_.selected_mesh]);

            ImGui::SeparatorText("Device");
            ImGui::TextUnformatted(ctx_.device_name.c_str());
            ImGui::TextUnformatted("WASD/QE move, Space shader, M mesh");
        }
        ImGui::End();
    });
}

// ============================================================================
// Swapchain recreation
// Waits for idle, rebuilds swapchain targets, then the pipelines that bake
// the extent. A zero-sized window postpones the rebuild.
// ============================================================================
void VulkanEngine::recreate_swapchain() {
    int pxw = 0, pxh = 0;
    REQUIRE_TRUE(SDL_GetWindowSizeInPixels(window_, &pxw, &pxh), std::string("SDL_GetWindowSizeInPixels failed: ") + SDL_GetError());
    if (pxw <= 0 || pxh <= 0) {
        state_.minimized = true;
        return;
    }

    swapchain_.recreate(static_cast<uint32_t>(pxw), static_cast<uint32_t>(pxh), config_.vsync, config_.triple_buffer);
    pipelines_.destroy_pipelines(ctx_.device);
    pipelines_.build(ctx_.device, swapchain_.render_pass(), swapchain_.extent(), config_.shader_dir);
    register_materials();

    if (ui_) {
        ui_->set_min_image_count(swapchain_.min_image_count());
        ui_->set_render_pass(swapchain_.render_pass());
    }
    state_.resize_requested = false;
    log::get()->info("Recreated swapchain {}x{}", swapchain_.extent().width, swapchain_.extent().height);
}

// ============================================================================
// VulkanEngine :: run
// ============================================================================
void VulkanEngine::run() {
    REQUIRE_TRUE(state_.initialized, "run() before init()");
    state_.running   = true;
    state_.last_tick = std::chrono::steady_clock::now();

    while (state_.running) {
        pump_events();
        if (!state_.running) break;
        advance_time();

        if (state_.minimized) {
            SDL_WaitEventTimeout(nullptr, 100);
            continue;
        }

        camera_.update(state_.dt_sec);
        render_frame();
        update_window_title();
    }
}

void VulkanEngine::render_frames(uint32_t count) {
    REQUIRE_TRUE(state_.initialized, "render_frames() before init()");
    for (uint32_t i = 0; i < count; ++i) {
        pump_events();
        advance_time();
        camera_.update(state_.dt_sec);
        render_frame();
    }
}

void VulkanEngine::pump_events() {
    SDL_Event e{};
    while (SDL_PollEvent(&e)) handle_event(e);
}

void VulkanEngine::handle_event(const SDL_Event& e) {
    if (ui_) ui_->process_event(e);

    switch (e.type) {
        case SDL_EVENT_QUIT:
        case SDL_EVENT_WINDOW_CLOSE_REQUESTED: state_.running = false; break;
        case SDL_EVENT_WINDOW_MINIMIZED: state_.minimized = true; break;
        case SDL_EVENT_WINDOW_RESTORED:
        case SDL_EVENT_WINDOW_MAXIMIZED: state_.minimized = false; break;
        case SDL_EVENT_WINDOW_RESIZED: state_.resize_requested = true; break;
        case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
            // Some platforms restore from minimize with only a size change.
            state_.resize_requested = true;
            state_.minimized        = e.window.data1 <= 0 || e.window.data2 <= 0;
            break;
        case SDL_EVENT_KEY_DOWN:
            if (ui_ && ui_->wants_keyboard()) break;
            if (!e.key.repeat) {
                if (e.key.scancode == SDL_SCANCODE_SPACE) cycle_hero_material();
                else if (e.key.scancode == SDL_SCANCODE_M) toggle_hero_mesh();
            }
            camera_.handle_event(e);
            break;
        case SDL_EVENT_KEY_UP: camera_.handle_event(e); break;
        default: break;
    }
}

void VulkanEngine::advance_time() {
    const auto now   = std::chrono::steady_clock::now();
    state_.dt_sec    = std::chrono::duration<double>(now - state_.last_tick).count();
    state_.time_sec += state_.dt_sec;
    state_.last_tick = now;
}

void VulkanEngine::update_window_title() {
    state_.title_accumulator += state_.dt_sec;
    if (state_.title_accumulator <= 0.1) return;
    state_.title_accumulator = 0.0;

    const double fps        = state_.dt_sec > 0.0 ? 1.0 / state_.dt_sec : 0.0;
    const std::string title = fmt::format("{} - FPS: {:6.3f}, ms: {:6.3f}", config_.name, fps, state_.dt_sec * 1000.0);
    if (!SDL_SetWindowTitle(window_, title.c_str())) log::get()->warn("SDL_SetWindowTitle failed: {}", SDL_GetError());
}

// ============================================================================
// VulkanEngine :: render_frame
// WaitPrevious -> Acquire -> Record -> Submit -> Present on the current slot.
// The slot's fence is reset only once an image has been acquired, so a
// skipped frame never leaves an unsignaled fence behind.
// ============================================================================
bool VulkanEngine::render_frame() {
    REQUIRE_TRUE(state_.initialized, "render_frame() before init()");
    if (state_.resize_requested) recreate_swapchain();
    if (state_.minimized || state_.resize_requested) {
        ++state_.frame_number;
        return false;
    }

    const VkDevice device = ctx_.device;
    FrameData& frame      = current_frame();

    // --- WaitPrevious ---
    VK_CHECK(vkWaitForFences(device, 1u, &frame.render_fence, VK_TRUE, config_.frame_timeout_ns));

    // --- Acquire ---
    uint32_t image_index = 0;
    const VkResult acq   = vkAcquireNextImageKHR(device, swapchain_.swapchain(), config_.frame_timeout_ns, frame.present_semaphore, VK_NULL_HANDLE, &image_index);
    if (acq == VK_ERROR_OUT_OF_DATE_KHR) {
        state_.resize_requested = true;
        ++state_.frame_number;
        return false;
    }
    if (acq == VK_SUBOPTIMAL_KHR) state_.resize_requested = true;
    else VK_CHECK(acq);
    VK_CHECK(vkResetFences(device, 1u, &frame.render_fence));

    // --- Record ---
    VkCommandBuffer cmd = frame.main_command_buffer;
    VK_CHECK(vkResetCommandBuffer(cmd, 0u));
    const VkCommandBufferBeginInfo bi{.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO, .pNext = nullptr, .flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT, .pInheritanceInfo = nullptr};
    VK_CHECK(vkBeginCommandBuffer(cmd, &bi));
    record_frame(cmd, frame, image_index);
    VK_CHECK(vkEndCommandBuffer(cmd));

    // --- Submit ---
    const VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    VkSubmitInfo si{};
    si.sType                = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    si.waitSemaphoreCount   = 1u;
    si.pWaitSemaphores      = &frame.present_semaphore;
    si.pWaitDstStageMask    = &wait_stage;
    si.commandBufferCount   = 1u;
    si.pCommandBuffers      = &cmd;
    si.signalSemaphoreCount = 1u;
    si.pSignalSemaphores    = &frame.render_semaphore;
    VK_CHECK(vkQueueSubmit(ctx_.graphics_queue, 1u, &si, frame.render_fence));

    // --- Present ---
    const VkSwapchainKHR swapchain = swapchain_.swapchain();
    const VkPresentInfoKHR pi{.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR, .pNext = nullptr, .waitSemaphoreCount = 1u, .pWaitSemaphores = &frame.render_semaphore, .swapchainCount = 1u, .pSwapchains = &swapchain, .pImageIndices = &image_index, .pResults = nullptr};
    const VkResult pres = vkQueuePresentKHR(ctx_.present_queue, &pi);
    if (pres == VK_ERROR_OUT_OF_DATE_KHR || pres == VK_SUBOPTIMAL_KHR) state_.resize_requested = true;
    else VK_CHECK(pres);

    ++state_.frame_number;
    return true;
}

bool VulkanEngine::frame_fence_signaled(uint32_t slot) const {
    REQUIRE_TRUE(state_.initialized, "frame_fence_signaled() before init()");
    REQUIRE_TRUE(slot < FRAME_OVERLAP, "frame slot out of range");
    const VkResult res = vkGetFenceStatus(ctx_.device, frames_[slot].render_fence);
    if (res == VK_NOT_READY) return false;
    VK_CHECK(res);
    return true;
}

// ============================================================================
// VulkanEngine :: cleanup
// Waits for device idle, shuts the UI down, releases the pipelines, flushes
// the deletion queue, then the swapchain, the device context and the window.
// ============================================================================
void VulkanEngine::cleanup() {
    if (ctx_.device != VK_NULL_HANDLE) {
        if (const VkResult res = vkDeviceWaitIdle(ctx_.device); res != VK_SUCCESS) log::get()->error("vkDeviceWaitIdle failed during cleanup: {}", string_VkResult(res));
        if (ui_) {
            ui_->shutdown();
            ui_.reset();
        }
        pipelines_.destroy_pipelines(ctx_.device);
        deletion_.flush(ctx_.device, ctx_.allocator);
        upload_.destroy();
        swapchain_.destroy();
    }
    scene_.clear();
    textures_.clear();
    for (auto& frame : frames_) frame = FrameData{};
    scene_parameter_buffer_ = AllocatedBuffer{};

    destroy_device_context(ctx_);
    IF_NOT_NULL_DO_AND_SET(window_, SDL_DestroyWindow(window_), nullptr);
    if (sdl_initialized_) {
        SDL_Quit();
        sdl_initialized_ = false;
    }
    if (state_.initialized) log::get()->info("Engine shut down after {} frames", state_.frame_number);
    state_.initialized = false;
    state_.running     = false;
}

} // namespace vkg
