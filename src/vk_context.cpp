#include "vk_context.h"
#include "vk_config.h"
#include "vk_log.h"

#include "VkBootstrap.h"
#include <SDL3/SDL_vulkan.h>

namespace vkg {

namespace {

void build_context(DeviceContext& ctx, const EngineConfig& config, SDL_Window* window) {
    const bool headless = window == nullptr;

    vkb::InstanceBuilder ib;
    ib.set_app_name(config.name.c_str()).set_engine_name("vkguide").require_api_version(kVulkanApiVersion).set_headless(headless);
    if (config.validation) ib.request_validation_layers(true).set_debug_callback(log::debug_callback);
    if (!headless) {
        Uint32 count              = 0;
        const char* const* names = SDL_Vulkan_GetInstanceExtensions(&count);
        REQUIRE_TRUE(names != nullptr, std::string("SDL_Vulkan_GetInstanceExtensions failed: ") + SDL_GetError());
        for (Uint32 i = 0; i < count; ++i) ib.enable_extension(names[i]);
    }
    auto inst_ret = ib.build();
    REQUIRE_TRUE(inst_ret.has_value(), "Failed to create Vulkan instance: " + inst_ret.error().message());
    vkb::Instance vkb_inst = inst_ret.value();
    ctx.instance           = vkb_inst.instance;
    ctx.debug_messenger    = vkb_inst.debug_messenger;
    log::get()->info("Created Vulkan instance (validation {})", config.validation ? "on" : "off");

    if (!headless) {
        ctx.window = window;
        REQUIRE_TRUE(SDL_Vulkan_CreateSurface(window, ctx.instance, nullptr, &ctx.surface), std::string("SDL_Vulkan_CreateSurface failed: ") + SDL_GetError());
    }

    // gl_BaseInstance in the mesh shaders needs shaderDrawParameters.
    VkPhysicalDeviceVulkan11Features f11{};
    f11.sType                = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_1_FEATURES;
    f11.shaderDrawParameters = VK_TRUE;

    vkb::PhysicalDeviceSelector selector(vkb_inst);
    selector.set_minimum_version(VK_API_VERSION_MAJOR(kVulkanApiVersion), VK_API_VERSION_MINOR(kVulkanApiVersion)).set_required_features_11(f11);
    if (headless) selector.require_present(false);
    else selector.set_surface(ctx.surface);
    auto phys_ret = selector.select();
    REQUIRE_TRUE(phys_ret.has_value(), "No suitable GPU: " + phys_ret.error().message());
    vkb::PhysicalDevice phys  = phys_ret.value();
    ctx.physical              = phys.physical_device;
    ctx.min_uniform_alignment = phys.properties.limits.minUniformBufferOffsetAlignment;
    ctx.device_name           = phys.properties.deviceName;

    auto dev_ret = vkb::DeviceBuilder(phys).build();
    REQUIRE_TRUE(dev_ret.has_value(), "Failed to create logical device: " + dev_ret.error().message());
    vkb::Device vkb_dev       = dev_ret.value();
    ctx.device                = vkb_dev.device;
    ctx.graphics_queue        = vkb_dev.get_queue(vkb::QueueType::graphics).value();
    ctx.graphics_queue_family = vkb_dev.get_queue_index(vkb::QueueType::graphics).value();
    ctx.present_queue         = ctx.graphics_queue; // Present uses graphics queue
    ctx.present_queue_family  = ctx.graphics_queue_family;
    log::get()->info("Selected GPU '{}' (min UBO alignment {})", ctx.device_name, ctx.min_uniform_alignment);

    VmaAllocatorCreateInfo ac{};
    ac.physicalDevice   = ctx.physical;
    ac.device           = ctx.device;
    ac.instance         = ctx.instance;
    ac.vulkanApiVersion = kVulkanApiVersion;
    VK_CHECK(vmaCreateAllocator(&ac, &ctx.allocator));
}

} // namespace

DeviceContext create_device_context(const EngineConfig& config, SDL_Window* window) {
    DeviceContext ctx{};
    try {
        build_context(ctx, config, window);
    } catch (const std::exception&) {
        destroy_device_context(ctx);
        throw;
    }
    return ctx;
}

void destroy_device_context(DeviceContext& ctx) {
    IF_NOT_NULL_DO_AND_SET(ctx.allocator, vmaDestroyAllocator(ctx.allocator), nullptr);
    IF_NOT_NULL_DO_AND_SET(ctx.device, vkDestroyDevice(ctx.device, nullptr), nullptr);
    IF_NOT_NULL_DO_AND_SET(ctx.surface, vkDestroySurfaceKHR(ctx.instance, ctx.surface, nullptr), nullptr);
    IF_NOT_NULL_DO_AND_SET(ctx.debug_messenger, vkb::destroy_debug_utils_messenger(ctx.instance, ctx.debug_messenger), nullptr);
    IF_NOT_NULL_DO_AND_SET(ctx.instance, vkDestroyInstance(ctx.instance, nullptr), nullptr);
    ctx.window = nullptr;
}

} // namespace vkg
