#include "vk_camera.h"

namespace vkg {

bool FlyCamera::handle_event(const SDL_Event& e) {
    if (e.type != SDL_EVENT_KEY_DOWN && e.type != SDL_EVENT_KEY_UP) return false;
    const bool down = e.type == SDL_EVENT_KEY_DOWN;
    switch (e.key.scancode) {
        case SDL_SCANCODE_W: input_.z = down ? 1.0f : 0.0f; return true;
        case SDL_SCANCODE_S: input_.z = down ? -1.0f : 0.0f; return true;
        case SDL_SCANCODE_A: input_.x = down ? 1.0f : 0.0f; return true;
        case SDL_SCANCODE_D: input_.x = down ? -1.0f : 0.0f; return true;
        case SDL_SCANCODE_E: input_.y = down ? 1.0f : 0.0f; return true;
        case SDL_SCANCODE_Q: input_.y = down ? -1.0f : 0.0f; return true;
        default: return false;
    }
}

void FlyCamera::update(double dt_sec) {
    if (dot(input_, input_) <= 0.1f * 0.1f) return;
    state_.position = state_.position + normalize(input_) * (static_cast<float>(dt_sec) * state_.speed);
}

float4x4 FlyCamera::view_matrix() const { return make_translation(state_.position); }

float4x4 FlyCamera::proj_matrix(float aspect) const {
    float4x4 p = make_perspective(radians(state_.fov_y_deg), aspect, state_.znear, state_.zfar);
    p.m[5] *= -1.0f;
    return p;
}

} // namespace vkg
