#include "vk_ui.h"
#include "vk_context.h"
#include "vk_log.h"

#include "backends/imgui_impl_sdl3.h"
#include "backends/imgui_impl_vulkan.h"
#include <array>
#include <imgui.h>

namespace vkg {

bool UiSystem::init_vulkan_backend() const {
    ImGui_ImplVulkan_InitInfo init_info{};
    init_info.ApiVersion          = kVulkanApiVersion;
    init_info.Instance            = ctx_->instance;
    init_info.PhysicalDevice      = ctx_->physical;
    init_info.Device              = ctx_->device;
    init_info.QueueFamily         = ctx_->graphics_queue_family;
    init_info.Queue               = ctx_->graphics_queue;
    init_info.DescriptorPool      = pool_;
    init_info.RenderPass          = render_pass_;
    init_info.Subpass             = 0u;
    init_info.MinImageCount       = min_image_count_;
    init_info.ImageCount          = image_count_;
    init_info.MSAASamples         = VK_SAMPLE_COUNT_1_BIT;
    init_info.Allocator           = nullptr;
    init_info.CheckVkResultFn     = [](VkResult res) { VK_CHECK(res); };
    init_info.UseDynamicRendering = false;
    return ImGui_ImplVulkan_Init(&init_info);
}

void UiSystem::init(const DeviceContext& ctx, VkRenderPass render_pass, uint32_t min_image_count, uint32_t image_count) {
    REQUIRE_TRUE(ctx.window != nullptr, "UI needs a window");
    ctx_             = &ctx;
    device_          = ctx.device;
    render_pass_     = render_pass;
    min_image_count_ = min_image_count;
    image_count_     = image_count;

    std::array<VkDescriptorPoolSize, 11> pool_sizes{{
        {VK_DESCRIPTOR_TYPE_SAMPLER, 1000},
        {VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 1000},
        {VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE, 1000},
        {VK_DESCRIPTOR_TYPE_STORAGE_IMAGE, 1000},
        {VK_DESCRIPTOR_TYPE_UNIFORM_TEXEL_BUFFER, 1000},
        {VK_DESCRIPTOR_TYPE_STORAGE_TEXEL_BUFFER, 1000},
        {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 1000},
        {VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 1000},
        {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC, 1000},
        {VK_DESCRIPTOR_TYPE_STORAGE_BUFFER_DYNAMIC, 1000},
        {VK_DESCRIPTOR_TYPE_INPUT_ATTACHMENT, 1000},
    }};
    const VkDescriptorPoolCreateInfo pool_info{
        .sType         = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO,
        .pNext         = nullptr,
        .flags         = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT,
        .maxSets       = 1000u * static_cast<uint32_t>(pool_sizes.size()),
        .poolSizeCount = static_cast<uint32_t>(pool_sizes.size()),
        .pPoolSizes    = pool_sizes.data(),
    };
    VK_CHECK(vkCreateDescriptorPool(device_, &pool_info, nullptr, &pool_));

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io    = ImGui::GetIO();
    io.IniFilename = nullptr;

    ImGui::StyleColorsDark();
    ImGuiStyle& style      = ImGui::GetStyle();
    style.WindowRounding   = 0.0f;
    style.WindowBorderSize = 0.0f;
    style.FrameRounding    = 4.0f;
    style.GrabRounding     = 4.0f;

    if (!ImGui_ImplSDL3_InitForVulkan(ctx.window)) {
        ImGui::DestroyContext();
        IF_NOT_NULL_DO_AND_SET(pool_, vkDestroyDescriptorPool(device_, pool_, nullptr), VK_NULL_HANDLE);
        throw std::runtime_error("ImGui_ImplSDL3_InitForVulkan failed");
    }

    if (!init_vulkan_backend()) {
        ImGui_ImplSDL3_Shutdown();
        ImGui::DestroyContext();
        IF_NOT_NULL_DO_AND_SET(pool_, vkDestroyDescriptorPool(device_, pool_, nullptr), VK_NULL_HANDLE);
        throw std::runtime_error("ImGui_ImplVulkan_Init failed");
    }

    initialized_ = true;
    log::get()->info("Initialized ImGui overlay");
}

void UiSystem::shutdown() {
    if (!initialized_) return;
    ImGui_ImplVulkan_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();
    IF_NOT_NULL_DO_AND_SET(pool_, vkDestroyDescriptorPool(device_, pool_, nullptr), VK_NULL_HANDLE);
    panels_.clear();
    initialized_ = false;
    render_pass_ = VK_NULL_HANDLE;
}

void UiSystem::process_event(const SDL_Event& e) const {
    if (!initialized_) return;
    ImGui_ImplSDL3_ProcessEvent(&e);
}

bool UiSystem::wants_keyboard() const { return initialized_ && ImGui::GetIO().WantCaptureKeyboard; }

void UiSystem::new_frame() const {
    if (!initialized_) return;
    ImGui_ImplVulkan_NewFrame();
    ImGui_ImplSDL3_NewFrame();
    ImGui::NewFrame();
    for (const auto& panel : panels_) panel();
}

void UiSystem::render(VkCommandBuffer cmd) const {
    if (!initialized_) return;
    ImGui::Render();
    ImGui_ImplVulkan_RenderDrawData(ImGui::GetDrawData(), cmd);
}

void UiSystem::set_min_image_count(uint32_t count) {
    if (!initialized_) return;
    min_image_count_ = count;
    ImGui_ImplVulkan_SetMinImageCount(count);
}

void UiSystem::set_render_pass(VkRenderPass render_pass) {
    if (!initialized_ || render_pass == render_pass_) {
        render_pass_ = render_pass;
        return;
    }
    ImGui_ImplVulkan_Shutdown();
    render_pass_ = render_pass;
    if (!init_vulkan_backend()) {
        // Without a Vulkan backend the overlay cannot draw; tear the rest down.
        ImGui_ImplSDL3_Shutdown();
        ImGui::DestroyContext();
        IF_NOT_NULL_DO_AND_SET(pool_, vkDestroyDescriptorPool(device_, pool_, nullptr), VK_NULL_HANDLE);
        panels_.clear();
        initialized_ = false;
        throw std::runtime_error("ImGui_ImplVulkan_Init failed after render pass change");
    }
    log::get()->debug("Rebuilt ImGui Vulkan backend for new render pass");
}

} // namespace vkg
