#include "vk_camera.h"
#include "vk_math.h"

#include <gtest/gtest.h>

using namespace vkg;

namespace {

void expect_matrix_near(const float4x4& a, const float4x4& b) {
    for (size_t i = 0; i < 16; ++i) EXPECT_NEAR(a.m[i], b.m[i], 1e-5f) << "element " << i;
}

} // namespace

TEST(Math, IdentityIsNeutral) {
    const float4x4 t = make_translation({1.0f, 2.0f, 3.0f});
    expect_matrix_near(mul(make_identity(), t), t);
    expect_matrix_near(mul(t, make_identity()), t);
}

TEST(Math, TranslationLivesInLastColumn) {
    const float4x4 t = make_translation({1.0f, 2.0f, 3.0f});
    EXPECT_FLOAT_EQ(t.m[12], 1.0f);
    EXPECT_FLOAT_EQ(t.m[13], 2.0f);
    EXPECT_FLOAT_EQ(t.m[14], 3.0f);
    EXPECT_FLOAT_EQ(t.m[15], 1.0f);
}

TEST(Math, TranslateAfterScale) {
    // Grid transform: scale first, then move.
    const float4x4 m = mul(make_translation({4.0f, 0.0f, -2.0f}), make_scale({0.2f, 0.2f, 0.2f}));
    EXPECT_FLOAT_EQ(m.m[0], 0.2f);
    EXPECT_FLOAT_EQ(m.m[12], 4.0f);
    EXPECT_FLOAT_EQ(m.m[14], -2.0f);
}

TEST(Math, NormalizeKeepsZero) {
    const float3 z = normalize(float3{});
    EXPECT_FLOAT_EQ(length(z), 0.0f);
    EXPECT_NEAR(length(normalize({3.0f, 4.0f, 0.0f})), 1.0f, 1e-6f);
}

TEST(Math, PerspectiveMapsNearAndFarToUnitDepth) {
    const float4x4 p = make_perspective(radians(70.0f), 16.0f / 9.0f, 0.1f, 200.0f);
    auto depth       = [&](float z) {
        const float clip_z = p.m[10] * z + p.m[14];
        const float clip_w = p.m[11] * z;
        return clip_z / clip_w;
    };
    EXPECT_NEAR(depth(-0.1f), 0.0f, 1e-4f);
    EXPECT_NEAR(depth(-200.0f), 1.0f, 1e-4f);
}

TEST(FlyCamera, ProjectionFlipsY) {
    FlyCamera cam;
    const float4x4 p = cam.proj_matrix(1.0f);
    EXPECT_LT(p.m[5], 0.0f);
}

TEST(FlyCamera, IgnoresTinyInput) {
    FlyCamera cam;
    const float3 before = cam.state().position;
    cam.set_input_axis({0.05f, 0.0f, 0.0f});
    cam.update(1.0);
    EXPECT_FLOAT_EQ(cam.state().position.x, before.x);
}

TEST(FlyCamera, MovesAtConfiguredSpeed) {
    FlyCamera cam;
    const float3 before = cam.state().position;
    cam.set_input_axis({0.0f, 0.0f, 1.0f});
    cam.update(0.5);
    EXPECT_NEAR(cam.state().position.z - before.z, 0.5f * cam.state().speed, 1e-5f);
}

TEST(FlyCamera, KeyEventsDriveInputAxis) {
    FlyCamera cam;
    SDL_Event e{};
    e.type         = SDL_EVENT_KEY_DOWN;
    e.key.scancode = SDL_SCANCODE_W;
    EXPECT_TRUE(cam.handle_event(e));
    EXPECT_FLOAT_EQ(cam.input_axis().z, 1.0f);
    e.type = SDL_EVENT_KEY_UP;
    EXPECT_TRUE(cam.handle_event(e));
    EXPECT_FLOAT_EQ(cam.input_axis().z, 0.0f);

    e.type         = SDL_EVENT_KEY_DOWN;
    e.key.scancode = SDL_SCANCODE_SPACE;
    EXPECT_FALSE(cam.handle_event(e));
}
