#ifndef VKGUIDE_VK_CAMERA_H
#define VKGUIDE_VK_CAMERA_H

#include "vk_math.h"
#include <SDL3/SDL.h>

namespace vkg {

struct CameraState {
    float3 position{0.0f, -3.0f, -10.0f}; // Applied as a plain translation of the world
    float fov_y_deg{70.0f};
    float znear{0.1f};
    float zfar{200.0f};
    float speed{5.0f};                    // World units per second
};

// Keyboard fly camera. WASD moves in x/z, Q/E in y; input is held as an axis
// vector and integrated once per frame.
class FlyCamera {
public:
    // Key down sets an axis to +-1, key up clears it. Returns true if consumed.
    bool handle_event(const SDL_Event& e);

    void set_input_axis(const float3& axis) { input_ = axis; }
    [[nodiscard]] const float3& input_axis() const { return input_; }

    // Move by normalize(input) * dt * speed when |input| > 0.1.
    void update(double dt_sec);

    [[nodiscard]] float4x4 view_matrix() const;
    // Perspective for Vulkan clip space (Y flipped, depth 0..1).
    [[nodiscard]] float4x4 proj_matrix(float aspect) const;

    void set_state(const CameraState& s) { state_ = s; }
    [[nodiscard]] const CameraState& state() const { return state_; }

private:
    CameraState state_{};
    float3 input_{};
};

} // namespace vkg

#endif // VKGUIDE_VK_CAMERA_H
