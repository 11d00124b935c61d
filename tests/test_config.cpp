#include "vk_config.h"
#include "vk_log.h"

#include <cstdlib>
#include <gtest/gtest.h>

using namespace vkg;

namespace {

class EnvironmentTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* key : {"VKG_VSYNC", "VKG_VALIDATION", "VKG_LOG_LEVEL", "VKG_ASSET_DIR", "VKG_SHADER_DIR"}) unsetenv(key);
    }
};

} // namespace

TEST(ParseBoolFlag, AcceptsCommonSpellings) {
    for (const char* yes : {"1", "true", "TRUE", "On", "yes"}) {
        bool v = false;
        EXPECT_TRUE(parse_bool_flag(yes, v)) << yes;
        EXPECT_TRUE(v) << yes;
    }
    for (const char* no : {"0", "false", "Off", "NO"}) {
        bool v = true;
        EXPECT_TRUE(parse_bool_flag(no, v)) << no;
        EXPECT_FALSE(v) << no;
    }
}

TEST(ParseBoolFlag, GarbageLeavesValueUntouched) {
    bool v = true;
    EXPECT_FALSE(parse_bool_flag("maybe", v));
    EXPECT_TRUE(v);
    EXPECT_FALSE(parse_bool_flag("", v));
    EXPECT_TRUE(v);
}

TEST(EngineConfig, Defaults) {
    const EngineConfig c{};
    EXPECT_EQ(c.width, 1600);
    EXPECT_EQ(c.height, 900);
    EXPECT_TRUE(c.vsync);
    EXPECT_TRUE(c.enable_ui);
    EXPECT_TRUE(c.load_default_scene);
    EXPECT_EQ(c.max_objects, 10'000u);
    EXPECT_EQ(c.frame_timeout_ns, 1'000'000'000u);
    EXPECT_EQ(c.log_level, "info");
}

TEST_F(EnvironmentTest, OverridesApplied) {
    setenv("VKG_VSYNC", "off", 1);
    setenv("VKG_VALIDATION", "1", 1);
    setenv("VKG_LOG_LEVEL", "debug", 1);
    setenv("VKG_ASSET_DIR", "/tmp/assets", 1);
    setenv("VKG_SHADER_DIR", "/tmp/spv", 1);

    EngineConfig c{};
    c.apply_environment();
    EXPECT_FALSE(c.vsync);
    EXPECT_TRUE(c.validation);
    EXPECT_EQ(c.log_level, "debug");
    EXPECT_EQ(c.asset_dir, "/tmp/assets");
    EXPECT_EQ(c.shader_dir, "/tmp/spv");
}

TEST_F(EnvironmentTest, InvalidBooleanIsIgnored) {
    setenv("VKG_VSYNC", "sometimes", 1);
    EngineConfig c{};
    c.apply_environment();
    EXPECT_TRUE(c.vsync);
}

TEST_F(EnvironmentTest, EmptyValuesAreIgnored) {
    setenv("VKG_ASSET_DIR", "", 1);
    EngineConfig c{};
    const std::string before = c.asset_dir;
    c.apply_environment();
    EXPECT_EQ(c.asset_dir, before);
}

TEST(LogLevel, NamesMapToSpdlog) {
    EXPECT_EQ(vkg::log::level_from_name("trace"), spdlog::level::trace);
    EXPECT_EQ(vkg::log::level_from_name("debug"), spdlog::level::debug);
    EXPECT_EQ(vkg::log::level_from_name("warn"), spdlog::level::warn);
    EXPECT_EQ(vkg::log::level_from_name("error"), spdlog::level::err);
    EXPECT_EQ(vkg::log::level_from_name("off"), spdlog::level::off);
    EXPECT_EQ(vkg::log::level_from_name("bogus"), spdlog::level::info);
}

TEST(LogLevel, AcceptsSpdlogShortAndLongNames) {
    EXPECT_EQ(vkg::log::level_from_name("warning"), spdlog::level::warn);
    EXPECT_EQ(vkg::log::level_from_name("err"), spdlog::level::err);
    EXPECT_EQ(vkg::log::level_from_name("critical"), spdlog::level::critical);
    EXPECT_EQ(vkg::log::level_from_name(""), spdlog::level::info);
}

TEST(LogLevel, InitAppliesConfiguredLevel) {
    EngineConfig c{};
    c.log_level = "error";
    vkg::log::init(c);
    EXPECT_EQ(vkg::log::get()->level(), spdlog::level::err);
    c.log_level = "info";
    vkg::log::init(c);
    EXPECT_EQ(vkg::log::get()->level(), spdlog::level::info);
}
