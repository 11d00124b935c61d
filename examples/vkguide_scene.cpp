#include "vk_engine.h"
#include "vk_log.h"
#include <cstdlib>
#include <exception>

int main() {
    try {
        vkg::EngineConfig config;
        config.apply_environment();

        vkg::VulkanEngine engine;
        engine.configure(config);
        engine.configure_window(1600, 900, "Vulkan Engine");
        engine.init();
        engine.run();
        engine.cleanup();
    } catch (const std::exception& e) {
        vkg::log::get()->critical("Fatal: {}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
