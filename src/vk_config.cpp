#include "vk_config.h"
#include "vk_log.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace vkg {

namespace {

const char* env_value(const char* key) {
    const char* v = std::getenv(key);
    return (v != nullptr && *v != '\0') ? v : nullptr;
}

} // namespace

bool parse_bool_flag(const std::string& text, bool& out) {
    std::string s = text;
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "on" || s == "yes") { out = true; return true; }
    if (s == "0" || s == "false" || s == "off" || s == "no") { out = false; return true; }
    return false;
}

void EngineConfig::apply_environment() {
    if (const char* v = env_value("VKG_VSYNC")) {
        if (!parse_bool_flag(v, vsync)) log::get()->warn("Ignoring VKG_VSYNC='{}' (expected a boolean)", v);
    }
    if (const char* v = env_value("VKG_VALIDATION")) {
        if (!parse_bool_flag(v, validation)) log::get()->warn("Ignoring VKG_VALIDATION='{}' (expected a boolean)", v);
    }
    if (const char* v = env_value("VKG_LOG_LEVEL")) log_level = v;
    if (const char* v = env_value("VKG_ASSET_DIR")) asset_dir = v;
    if (const char* v = env_value("VKG_SHADER_DIR")) shader_dir = v;
}

} // namespace vkg
